// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "curl_wrap.h"
#include <optional>
#include <zftp/open_ssl.h>
#include <zftp/extra_log.h>

using namespace zftp;


namespace
{
int curlInitLevel = 0; //support interleaving initialization calls!
}


void zftp::libcurlInit()
{
    assert(curlInitLevel >= 0);
    if (++curlInitLevel != 1) //non-atomic => require call from main thread
        return;

    openSslInit(); //OpenSSL is shared with the TLS layer of the FTP sessions

    try
    {
        ASSERT_SYSERROR(::curl_global_init(CURL_GLOBAL_NOTHING /*CURL_GLOBAL_DEFAULT = CURL_GLOBAL_SSL|CURL_GLOBAL_WIN32*/) == CURLE_OK);
    }
    catch (const SysError& e) { logExtraError(_("Error during process initialization.") + L"\n\n" + e.toString()); }
}


void zftp::libcurlTearDown()
{
    assert(curlInitLevel >= 1);
    if (--curlInitLevel != 0)
        return;

    ::curl_global_cleanup();
    openSslTearDown();
}


FtpUrl zftp::parseFtpUrl(const std::string& url) //throw SysError
{
    CURLU* urlHandle = ::curl_url();
    if (!urlHandle)
        throw SysError(formatSystemError("curl_url", formatCurlUrlCode(CURLUE_OUT_OF_MEMORY), L""));
    ZFTP_ON_SCOPE_EXIT(::curl_url_cleanup(urlHandle));

    auto throwIfError = [](CURLUcode uc, const char* functionName)
    {
        if (uc != CURLUE_OK)
            throw SysError(formatSystemError(functionName, formatCurlUrlCode(uc), utfTo<std::wstring>(::curl_url_strerror(uc))));
    };

    throwIfError(::curl_url_set(urlHandle, CURLUPART_URL, url.c_str(), CURLU_NON_SUPPORT_SCHEME), "curl_url_set(CURLUPART_URL)");

    //returns std::nullopt if the part is missing
    auto getPart = [&](CURLUPart part, CURLUcode ucMissing, unsigned int flags, const char* functionName) -> std::optional<std::string>
    {
        char* partStr = nullptr;
        const CURLUcode uc = ::curl_url_get(urlHandle, part, &partStr, flags);
        ZFTP_ON_SCOPE_EXIT(if (partStr) ::curl_free(partStr));

        if (uc == ucMissing)
            return std::nullopt;
        throwIfError(uc, functionName);
        return std::string(partStr ? partStr : "");
    };

    const std::string scheme = getPart(CURLUPART_SCHEME, CURLUE_NO_SCHEME, 0, "curl_url_get(CURLUPART_SCHEME)").value_or("");

    FtpUrl output;
    if (equalAsciiNoCase(scheme, "ftps"))
        output.useTls = true;
    else if (!equalAsciiNoCase(scheme, "ftp"))
        throw SysError(replaceCpy<std::wstring>(L"Unsupported URL scheme %x.", L"%x", L'"' + utfTo<std::wstring>(scheme) + L'"'));

    output.username = getPart(CURLUPART_USER,     CURLUE_NO_USER,     CURLU_URLDECODE, "curl_url_get(CURLUPART_USER)"    ).value_or("");
    output.password = getPart(CURLUPART_PASSWORD, CURLUE_NO_PASSWORD, CURLU_URLDECODE, "curl_url_get(CURLUPART_PASSWORD)").value_or("");

    output.server = getPart(CURLUPART_HOST, CURLUE_NO_HOST, 0, "curl_url_get(CURLUPART_HOST)").value_or("");
    if (startsWith(output.server, "[") && endsWith(output.server, "]")) //IPv6 literal
        output.server = output.server.substr(1, output.server.size() - 2);
    if (output.server.empty())
        throw SysError(_("Server name must not be empty."));

    if (const std::optional<std::string> portStr = getPart(CURLUPART_PORT, CURLUE_NO_PORT, CURLU_DEFAULT_PORT, "curl_url_get(CURLUPART_PORT)"))
        output.port = stringTo<uint16_t>(*portStr);
    if (output.port == 0)
        output.port = output.useTls ? 990 : 21;

    output.path = getPart(CURLUPART_PATH, CURLUE_LAST /*never missing*/, CURLU_URLDECODE, "curl_url_get(CURLUPART_PATH)").value_or("");
    if (output.path.empty())
        output.path = "/";

    return output;
}


std::wstring zftp::formatCurlUrlCode(CURLUcode uc)
{
    switch (uc)
    {
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_OK);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_HANDLE);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_PARTPOINTER);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_MALFORMED_INPUT);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_PORT_NUMBER);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_UNSUPPORTED_SCHEME);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_URLDECODE);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_OUT_OF_MEMORY);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_USER_NOT_ALLOWED);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_UNKNOWN_PART);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_NO_SCHEME);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_NO_USER);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_NO_PASSWORD);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_NO_OPTIONS);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_NO_HOST);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_NO_PORT);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_NO_QUERY);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_NO_FRAGMENT);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_NO_ZONEID);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_FILE_URL);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_FRAGMENT);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_HOSTNAME);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_IPV6);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_LOGIN);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_PASSWORD);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_PATH);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_QUERY);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_SCHEME);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_SLASHES);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_BAD_USER);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_LACKS_IDN);
            ZFTP_CHECK_CASE_FOR_CONSTANT(CURLUE_LAST);
    }
    return replaceCpy<std::wstring>(L"Curl URL error %x", L"%x", numberTo<std::wstring>(static_cast<int>(uc)));
}
