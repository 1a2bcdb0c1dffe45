// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "open_ssl.h"
#include <arpa/inet.h> //inet_pton
#include "extra_log.h"
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

using namespace zftp;


namespace
{
#ifndef OPENSSL_THREADS
    #error OpenSSL must be built with thread support
#endif

static_assert(OPENSSL_VERSION_NUMBER >= 0x30000000L, "OpenSSL version is too old!");


std::wstring formatOpenSSLError(const char* functionName, unsigned long ec)
{
    char errorBuf[256] = {}; //== buffer size used by ERR_error_string(); err.c: it seems the message uses at most ~200 bytes
    ::ERR_error_string_n(ec, errorBuf, sizeof(errorBuf)); //includes null-termination

    return formatSystemError(functionName, replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec)), utfTo<std::wstring>(errorBuf));
}


std::wstring formatLastOpenSSLError(const char* functionName)
{
    const auto ec = ::ERR_peek_last_error(); //"returns latest error code from the thread's error queue without modifying it" - unlike ERR_get_error()
    ::ERR_clear_error(); //clean up for next OpenSSL operation on this thread
    return formatOpenSSLError(functionName, ec);
}


std::wstring formatSslErrorCode(int ec)
{
    switch (ec)
    {
            ZFTP_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_NONE);
            ZFTP_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_SSL);
            ZFTP_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_WANT_READ);
            ZFTP_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_WANT_WRITE);
            ZFTP_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_WANT_X509_LOOKUP);
            ZFTP_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_SYSCALL);
            ZFTP_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_ZERO_RETURN);
            ZFTP_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_WANT_CONNECT);
            ZFTP_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_WANT_ACCEPT);
            ZFTP_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_WANT_ASYNC);
            ZFTP_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_WANT_ASYNC_JOB);
            ZFTP_CHECK_CASE_FOR_CONSTANT(SSL_ERROR_WANT_CLIENT_HELLO_CB);
        default:
            return replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec));
    }
}


std::wstring formatSslError(const char* functionName, SSL* ssl, int rc)
{
    const int sslError = ::SSL_get_error(ssl, rc);
    if (sslError == SSL_ERROR_SSL)
        return formatLastOpenSSLError(functionName);

    if (sslError == SSL_ERROR_SYSCALL && errno != 0)
    {
        ::ERR_clear_error();
        return formatSystemError(functionName, getLastError());
    }

    ::ERR_clear_error();
    return formatSystemError(functionName, formatSslErrorCode(sslError), L"");
}


bool isIpAddress(const std::string& server)
{
    unsigned char buf[sizeof(in6_addr)] = {};
    return ::inet_pton(AF_INET, server.c_str(), buf) == 1 ||
           ::inet_pton(AF_INET6, server.c_str(), buf) == 1;
}
}


void zftp::openSslInit()
{
    //official Wiki: https://wiki.openssl.org/index.php/Library_Initialization
    if (::OPENSSL_init_ssl(OPENSSL_INIT_SSL_DEFAULT | OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) != 1)
        logExtraError(_("Error during process initialization.") + L"\n\n" + formatLastOpenSSLError("OPENSSL_init_ssl"));
}


void zftp::openSslTearDown() {}
//OpenSSL 1.1.0+ deprecates all clean up functions


class TlsContext::Impl
{
public:
    Impl(SocketType socket, const std::string& server, const std::string* caCertFilePath) //throw SysError
    {
        ZFTP_ON_SCOPE_FAIL(cleanup()); //destructor call would lead to member double clean-up!!!

        ctx_ = ::SSL_CTX_new(::TLS_client_method());
        if (!ctx_)
            throw SysError(formatLastOpenSSLError("SSL_CTX_new"));

        if (::SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION) != 1)
            throw SysError(formatLastOpenSSLError("SSL_CTX_set_min_proto_version"));

        //FTP servers routinely close the data connection without close_notify: report as EOF
        ::SSL_CTX_set_options(ctx_, SSL_OP_IGNORE_UNEXPECTED_EOF);

        if (caCertFilePath)
        {
            if (::SSL_CTX_load_verify_locations(ctx_, caCertFilePath->c_str(), nullptr) != 1)
                throw SysError(formatLastOpenSSLError("SSL_CTX_load_verify_locations"));

            ::SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        }
        else
            ::SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);

        ssl_ = ::SSL_new(ctx_);
        if (!ssl_)
            throw SysError(formatLastOpenSSLError("SSL_new"));

        if (::SSL_set_fd(ssl_, socket) != 1)
            throw SysError(formatLastOpenSSLError("SSL_set_fd"));

        if (!isIpAddress(server)) //RFC 6066: "Literal IPv4 and IPv6 addresses are not permitted"
            if (::SSL_set_tlsext_host_name(ssl_, server.c_str()) != 1)
                throw SysError(formatLastOpenSSLError("SSL_set_tlsext_host_name"));

        if (caCertFilePath)
            if (::SSL_set1_host(ssl_, server.c_str()) != 1)
                throw SysError(formatLastOpenSSLError("SSL_set1_host"));

        const int rv = ::SSL_connect(ssl_); //implicit SSL_set_connect_state()
        if (rv != 1)
            throw SysError(formatSslError("SSL_connect", ssl_, rv));

        if (caCertFilePath)
        {
            const long verifyResult = ::SSL_get_verify_result(ssl_);
            if (verifyResult != X509_V_OK)
                throw SysError(formatSystemError("SSL_get_verify_result", formatX509ErrorCode(verifyResult), L""));
        }
    }

    ~Impl()
    {
        //"SSL_shutdown() must not be called if a previous fatal error has occurred on a connection"
        cleanup();
    }

    size_t tryRead(void* buffer, size_t bytesToRead) //throw SysError; may return short, only 0 means EOF!
    {
        if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
            ZFTP_CONTRACT_VIOLATION();

        size_t bytesReceived = 0;
        const int rv = ::SSL_read_ex(ssl_, buffer, bytesToRead, &bytesReceived);
        if (rv != 1)
        {
            if (::SSL_get_error(ssl_, rv) == SSL_ERROR_ZERO_RETURN) //close_notify or (with SSL_OP_IGNORE_UNEXPECTED_EOF) plain EOF
            {
                ::ERR_clear_error();
                return 0;
            }
            throw SysError(formatSslError("SSL_read_ex", ssl_, rv));
        }
        ASSERT_SYSERROR(bytesReceived > 0); //SSL_read_ex() considers EOF an error!
        ASSERT_SYSERROR(bytesReceived <= bytesToRead); //better safe than sorry
        return bytesReceived;
    }

    size_t tryWrite(const void* buffer, size_t bytesToWrite) //throw SysError; may return short! CONTRACT: bytesToWrite > 0
    {
        if (bytesToWrite == 0)
            ZFTP_CONTRACT_VIOLATION();

        size_t bytesWritten = 0;
        const int rv = ::SSL_write_ex(ssl_, buffer, bytesToWrite, &bytesWritten);
        if (rv != 1)
            throw SysError(formatSslError("SSL_write_ex", ssl_, rv));

        ASSERT_SYSERROR(bytesWritten > 0); //better safe than sorry
        ASSERT_SYSERROR(bytesWritten <= bytesToWrite); //
        return bytesWritten;
    }

    bool hasPendingData() const { return ::SSL_pending(ssl_) > 0; }

    void shutdown() //throw SysError
    {
        const int rv = ::SSL_shutdown(ssl_); //send close_notify only: don't wait for the peer's response
        if (rv < 0)
            throw SysError(formatSslError("SSL_shutdown", ssl_, rv));
    }

private:
    Impl           (const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    static std::wstring formatX509ErrorCode(long ec)
    {
        return numberTo<std::wstring>(ec) + L": " + utfTo<std::wstring>(::X509_verify_cert_error_string(ec));
    }

    void cleanup()
    {
        if (ssl_)
            ::SSL_free(ssl_);

        if (ctx_)
            ::SSL_CTX_free(ctx_);
    }

    SSL_CTX* ctx_ = nullptr;
    SSL*     ssl_ = nullptr;
};


TlsContext::TlsContext(SocketType socket, const std::string& server, const std::string* caCertFilePath) :
    pimpl_(std::make_unique<Impl>(socket, server, caCertFilePath)) {} //throw SysError

TlsContext::~TlsContext() {}

size_t TlsContext::tryRead (      void* buffer, size_t bytesToRead ) { return pimpl_->tryRead(buffer, bytesToRead); } //throw SysError
size_t TlsContext::tryWrite(const void* buffer, size_t bytesToWrite) { return pimpl_->tryWrite(buffer, bytesToWrite); } //throw SysError

bool TlsContext::hasPendingData() const { return pimpl_->hasPendingData(); }

void TlsContext::shutdown() { pimpl_->shutdown(); } //throw SysError
