// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "sys_error.h"
#include <cstring> //strerror_r

using namespace zftp;


namespace
{
std::wstring formatSystemErrorCode(ErrorCode ec)
{
    switch (ec) //codes seen with sockets and local file I/O
    {
            ZFTP_CHECK_CASE_FOR_CONSTANT(EPERM);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ENOENT);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EINTR);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EIO);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EBADF);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EAGAIN);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ENOMEM);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EACCES);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EFAULT);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EBUSY);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EEXIST);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ENOTDIR);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EISDIR);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EINVAL);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ENFILE);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EMFILE);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EFBIG);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ENOSPC);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EROFS);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EPIPE);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ERANGE);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ENAMETOOLONG);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ENOTSOCK);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EDESTADDRREQ);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EMSGSIZE);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EPROTOTYPE);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ENOPROTOOPT);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EPROTONOSUPPORT);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EOPNOTSUPP);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EAFNOSUPPORT);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EADDRINUSE);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EADDRNOTAVAIL);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ENETDOWN);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ENETUNREACH);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ENETRESET);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ECONNABORTED);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ECONNRESET);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ENOBUFS);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EISCONN);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ENOTCONN);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ESHUTDOWN);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ETIMEDOUT);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ECONNREFUSED);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EHOSTDOWN);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EHOSTUNREACH);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EALREADY);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EINPROGRESS);
            ZFTP_CHECK_CASE_FOR_CONSTANT(ECANCELED);
        default:
            return replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec));
    }
}
}


std::wstring zftp::getSystemErrorDescription(ErrorCode ec) //return empty string on error
{
    const ErrorCode ecCurrent = getLastError(); //not necessarily == ec
    ZFTP_ON_SCOPE_EXIT(errno = ecCurrent);

    char buffer[256] = {};
    const char* errorMsg = ::strerror_r(ec, buffer, sizeof(buffer)); //GNU variant: may or may not use buffer

    return trimCpy(utfTo<std::wstring>(errorMsg ? errorMsg : ""));
}


std::wstring zftp::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatSystemErrorCode(ec), getSystemErrorDescription(ec));
}


std::wstring zftp::formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg)
{
    std::wstring output = trimCpy(errorCode);

    const std::wstring errorMsgFmt = trimCpy(errorMsg);
    if (!output.empty() && !errorMsgFmt.empty())
        output += L": ";

    output += errorMsgFmt;

    if (!functionName.empty())
        output += L" [" + utfTo<std::wstring>(functionName) + L']';

    return trimCpy(output);
}
