// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_connection.h"
#include <sys/time.h>
#include <zftp/open_ssl.h>

using namespace zftp;
using namespace ftc;


namespace
{
class SocketConnection : public FtpConnection
{
public:
    explicit SocketConnection(std::unique_ptr<Socket>&& socket) : socket_(std::move(socket)) {}

    size_t tryRead(void* buffer, size_t bytesToRead) override //throw SysError, SysErrorTimeOut
    {
        waitForSocket(socket_->get(), false /*forWrite*/, deadline_); //throw SysError, SysErrorTimeOut
        return tryReadSocket(socket_->get(), buffer, bytesToRead); //throw SysError
    }

    size_t tryWrite(const void* buffer, size_t bytesToWrite) override //throw SysError, SysErrorTimeOut
    {
        waitForSocket(socket_->get(), true /*forWrite*/, deadline_); //throw SysError, SysErrorTimeOut
        return tryWriteSocket(socket_->get(), buffer, bytesToWrite); //throw SysError
    }

    void setDeadline(const SocketDeadline& deadline) override { deadline_ = deadline; }

    void closeSend() override { shutdownSocketSend(socket_->get()); } //throw SysError

    void abort() override { shutdownSocket(socket_->get()); }

    std::string getPeerAddress() const override { return socket_->getPeerAddress(); } //throw SysError

private:
    const std::unique_ptr<Socket> socket_;
    SocketDeadline deadline_;
};


//blocking socket: bound the TLS handshake by the dial timeout
void setHandshakeTimeout(SocketType socket, int timeoutSec) //throw SysError
{
    const timeval tv{.tv_sec = timeoutSec};
    if (::setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0)
        THROW_LAST_SYS_ERROR("setsockopt(SO_RCVTIMEO)");
    if (::setsockopt(socket, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0)
        THROW_LAST_SYS_ERROR("setsockopt(SO_SNDTIMEO)");
}


/*  handshake is deferred until first I/O:
    data channel: server starts TLS only after the transfer command was accepted, i.e. after we connected  */
class TlsConnection : public FtpConnection
{
public:
    TlsConnection(std::unique_ptr<Socket>&& socket, const std::string& serverName, const std::string& caCertFilePath, int handshakeTimeoutSec) :
        socket_(std::move(socket)),
        serverName_(serverName),
        caCertFilePath_(caCertFilePath),
        handshakeTimeoutSec_(handshakeTimeoutSec) {}

    size_t tryRead(void* buffer, size_t bytesToRead) override //throw SysError, SysErrorTimeOut
    {
        TlsContext& tls = getTls(); //throw SysError

        if (!tls.hasPendingData()) //buffered inside OpenSSL => socket may not be readable!
            waitForSocket(socket_->get(), false /*forWrite*/, deadline_); //throw SysError, SysErrorTimeOut
        return tls.tryRead(buffer, bytesToRead); //throw SysError
    }

    size_t tryWrite(const void* buffer, size_t bytesToWrite) override //throw SysError, SysErrorTimeOut
    {
        TlsContext& tls = getTls(); //throw SysError

        waitForSocket(socket_->get(), true /*forWrite*/, deadline_); //throw SysError, SysErrorTimeOut
        return tls.tryWrite(buffer, bytesToWrite); //throw SysError
    }

    void setDeadline(const SocketDeadline& deadline) override { deadline_ = deadline; }

    void closeSend() override //throw SysError
    {
        getTls().shutdown(); //throw SysError
        shutdownSocketSend(socket_->get()); //throw SysError
    }

    void abort() override { shutdownSocket(socket_->get()); }

    std::string getPeerAddress() const override { return socket_->getPeerAddress(); } //throw SysError

private:
    TlsContext& getTls() //throw SysError
    {
        if (!tls_)
        {
            setHandshakeTimeout(socket_->get(), handshakeTimeoutSec_); //throw SysError

            tls_ = std::make_unique<TlsContext>(socket_->get(), serverName_, caCertFilePath_.empty() ? nullptr : &caCertFilePath_); //throw SysError

            setHandshakeTimeout(socket_->get(), 0 /*disable: deadlines are enforced by waitForSocket()*/); //throw SysError
        }
        return *tls_;
    }

    const std::unique_ptr<Socket> socket_; //must outlive tls_
    const std::string serverName_;
    const std::string caCertFilePath_;
    const int handshakeTimeoutSec_;
    std::unique_ptr<TlsContext> tls_;
    SocketDeadline deadline_;
};
}


void ftc::writeAll(FtpConnection& conn, const void* buffer, size_t bytesToWrite) //throw SysError, SysErrorTimeOut
{
    const char*       it    = static_cast<const char*>(buffer);
    const char* const itEnd = it + bytesToWrite;
    while (it != itEnd)
        it += conn.tryWrite(it, itEnd - it); //throw SysError, SysErrorTimeOut
}


std::unique_ptr<FtpConnection> ftc::dialTcp(const std::string& server, uint16_t port, const DialerCfg& dialer,
                                            const std::function<void()>& checkInterrupt /*throw X*/) //throw SysError, SysErrorTimeOut, X
{
    auto socket = std::make_unique<Socket>(server, numberTo<std::string>(port), dialer.timeoutSec, dialer.tcpKeepAlive, checkInterrupt); //throw SysError, SysErrorTimeOut, X
    return std::make_unique<SocketConnection>(std::move(socket));
}


std::unique_ptr<FtpConnection> ftc::dialTls(const std::string& server, uint16_t port, const DialerCfg& dialer, const TlsConfig& tls,
                                            const std::function<void()>& checkInterrupt /*throw X*/) //throw SysError, SysErrorTimeOut, X
{
    auto socket = std::make_unique<Socket>(server, numberTo<std::string>(port), dialer.timeoutSec, dialer.tcpKeepAlive, checkInterrupt); //throw SysError, SysErrorTimeOut, X

    return std::make_unique<TlsConnection>(std::move(socket), !tls.serverName.empty() ? tls.serverName : server, tls.caCertFilePath, dialer.timeoutSec);
}
