// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "socket.h"
#include <fcntl.h>
#include <poll.h>
#include <netinet/in.h>
#include <netinet/tcp.h> //TCP_NODELAY

using namespace zftp;


std::wstring zftp::formatGaiErrorCode(int ec)
{
    switch (ec) //codes used on Linux
    {
            ZFTP_CHECK_CASE_FOR_CONSTANT(EAI_ADDRFAMILY);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EAI_AGAIN);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EAI_BADFLAGS);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EAI_FAIL);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EAI_FAMILY);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EAI_MEMORY);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EAI_NODATA);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EAI_NONAME);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EAI_SERVICE);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EAI_SOCKTYPE);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EAI_SYSTEM);
            ZFTP_CHECK_CASE_FOR_CONSTANT(EAI_OVERFLOW);
        default:
            return replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec));
    }
}


namespace
{
const std::chrono::milliseconds CONNECT_POLL_INTERVAL(50); //granularity for checkInterrupt()


void setSocketOption(SocketType socket, int level, int optName, int value, const char* functionName) //throw SysError
{
    if (::setsockopt(socket, level, optName, &value, sizeof(value)) != 0)
        THROW_LAST_SYS_ERROR(functionName);
}


SocketType getConnectedSocket(const addrinfo& ai, int timeoutSec, bool tcpKeepAlive, const std::function<void()>& checkInterrupt) //throw SysError, SysErrorTimeOut, X
{
    SocketType testSocket = ::socket(ai.ai_family,    //int socket_family
                                     SOCK_CLOEXEC | SOCK_NONBLOCK |
                                     ai.ai_socktype,  //int socket_type
                                     ai.ai_protocol); //int protocol
    if (testSocket == invalidSocket)
        THROW_LAST_SYS_ERROR("socket");
    ZFTP_ON_SCOPE_FAIL(closeSocket(testSocket));

    if (::connect(testSocket, ai.ai_addr, ai.ai_addrlen) != 0)
    {
        if (errno != EINPROGRESS)
            THROW_LAST_SYS_ERROR("connect");

        const auto stopTime = std::chrono::steady_clock::now() + std::chrono::seconds(timeoutSec);
        for (;;)
        {
            if (checkInterrupt)
                checkInterrupt(); //throw X

            const auto now = std::chrono::steady_clock::now();
            if (now >= stopTime)
                throw SysErrorTimeOut(formatSystemError("connect, " + utfTo<std::string>(_P("1 sec", "%x sec", timeoutSec)), ETIMEDOUT));

            const auto waitTime = std::min(std::chrono::duration_cast<std::chrono::milliseconds>(stopTime - now) + std::chrono::milliseconds(1),
                                           CONNECT_POLL_INTERVAL);

            pollfd pfd{.fd = testSocket, .events = POLLOUT};
            const int rv = ::poll(&pfd, 1, static_cast<int>(waitTime.count()));
            if (rv < 0)
            {
                if (errno == EINTR)
                    continue;
                THROW_LAST_SYS_ERROR("poll");
            }
            if (rv > 0)
                break;
        }

        int error = 0;
        socklen_t optLen = sizeof(error);
        if (::getsockopt(testSocket, SOL_SOCKET, SO_ERROR, &error, &optLen) != 0)
            THROW_LAST_SYS_ERROR("getsockopt(SO_ERROR)");

        if (error != 0)
            throw SysError(formatSystemError("connect, SO_ERROR", static_cast<ErrorCode>(error))/*== system error code, apparently!?*/);
    }

    setNonBlocking(testSocket, false); //throw SysError
    //-----------------------------------------------------------

    //disable Nagle algorithm: control channel is request/response
    setSocketOption(testSocket, IPPROTO_TCP, TCP_NODELAY, 1, "setsockopt(TCP_NODELAY)"); //throw SysError

    if (tcpKeepAlive)
        setSocketOption(testSocket, SOL_SOCKET, SO_KEEPALIVE, 1, "setsockopt(SO_KEEPALIVE)"); //throw SysError

    return testSocket;
}
}


Socket::Socket(const std::string& server, const std::string& serviceName, int timeoutSec, bool tcpKeepAlive,
               const std::function<void()>& checkInterrupt) //throw SysError, SysErrorTimeOut, X
{
    if (trimCpy(server).empty())
        throw SysError(_("Server name must not be empty."));

    const addrinfo hints
    {
        .ai_flags = AI_ADDRCONFIG, //save a AAAA lookup on machines that can't use the returned data anyhow
        .ai_socktype = SOCK_STREAM,
    };

    addrinfo* servinfo = nullptr;
    ZFTP_ON_SCOPE_EXIT(if (servinfo) ::freeaddrinfo(servinfo));

    const int rcGai = ::getaddrinfo(server.c_str(), serviceName.c_str(), &hints, &servinfo);
    if (rcGai != 0)
        THROW_LAST_SYS_ERROR_GAI(rcGai);
    if (!servinfo)
        throw SysError(formatSystemError("getaddrinfo", L"", L"Empty server info."));

    //getaddrinfo() may return multiple addresses, e.g. AF_INET6 + AF_INET: take the first that connects
    std::optional<SysError> firstError;
    for (const addrinfo* si = servinfo; si; si = si->ai_next)
        try
        {
            socket_ = getConnectedSocket(*si, timeoutSec, tcpKeepAlive, checkInterrupt); //throw SysError, SysErrorTimeOut, X; pass ownership
            return;
        }
        catch (const SysErrorTimeOut&) { throw; } //don't wait another timeoutSec for each remaining address
        catch (const SysError& e)
        {
            if (checkInterrupt) //X may derive from SysError: interruption is sticky => rethrow it as-is
                checkInterrupt(); //throw X

            if (!firstError)
                firstError = e;
        }

    throw* firstError; //list was not empty, so there must have been an error!
}


std::string Socket::getPeerAddress() const //throw SysError
{
    sockaddr_storage addr = {};
    socklen_t addrLen = sizeof(addr);
    if (::getpeername(socket_, reinterpret_cast<sockaddr*>(&addr), &addrLen) != 0)
        THROW_LAST_SYS_ERROR("getpeername");

    char host[NI_MAXHOST] = {};
    const int rcGai = ::getnameinfo(reinterpret_cast<const sockaddr*>(&addr), addrLen,
                                    host, sizeof(host), //char* host, socklen_t hostlen
                                    nullptr, 0,         //char* serv, socklen_t servlen
                                    NI_NUMERICHOST);
    if (rcGai != 0)
        THROW_LAST_SYS_ERROR_GAI(rcGai);

    return host;
}


void zftp::waitForSocket(SocketType socket, bool forWrite, const SocketDeadline& deadline) //throw SysError, SysErrorTimeOut
{
    for (;;)
    {
        int timeoutMs = -1; //infinite
        if (deadline)
        {
            const auto now = std::chrono::steady_clock::now();
            if (now >= *deadline)
                throw SysErrorTimeOut(formatSystemError(forWrite ? "send" : "recv", ETIMEDOUT));

            timeoutMs = static_cast<int>(std::chrono::ceil<std::chrono::milliseconds>(*deadline - now).count());
        }

        pollfd pfd{.fd = socket, .events = static_cast<short>(forWrite ? POLLOUT : POLLIN)};
        const int rv = ::poll(&pfd, 1, timeoutMs);
        if (rv < 0)
        {
            if (errno == EINTR)
                continue;
            THROW_LAST_SYS_ERROR("poll");
        }
        if (rv > 0) //includes POLLHUP/POLLERR: let recv()/send() report the details
            return;
    }
}


size_t zftp::tryReadSocket(SocketType socket, void* buffer, size_t bytesToRead) //throw SysError; may return short, only 0 means EOF!
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        ZFTP_CONTRACT_VIOLATION();

    ssize_t bytesReceived = 0;
    for (;;)
    {
        bytesReceived = ::recv(socket, buffer, bytesToRead, 0);
        if (bytesReceived >= 0 || errno != EINTR)
            break;
    }
    if (bytesReceived < 0)
        THROW_LAST_SYS_ERROR("recv");

    ASSERT_SYSERROR(static_cast<size_t>(bytesReceived) <= bytesToRead); //better safe than sorry

    return bytesReceived; //"zero indicates end of file"
}


size_t zftp::tryWriteSocket(SocketType socket, const void* buffer, size_t bytesToWrite) //throw SysError; may return short! CONTRACT: bytesToWrite > 0
{
    if (bytesToWrite == 0)
        ZFTP_CONTRACT_VIOLATION();

    ssize_t bytesWritten = 0;
    for (;;)
    {
        bytesWritten = ::send(socket, buffer, bytesToWrite,
                              MSG_NOSIGNAL); //peer closed connection: EPIPE instead of SIGPIPE
        if (bytesWritten >= 0 || errno != EINTR)
            break;
    }
    if (bytesWritten < 0)
        THROW_LAST_SYS_ERROR("send");

    if (bytesWritten == 0)
        throw SysError(formatSystemError("send", L"", L"Zero bytes processed."));

    ASSERT_SYSERROR(static_cast<size_t>(bytesWritten) <= bytesToWrite); //better safe than sorry

    return bytesWritten;
}


void zftp::shutdownSocketSend(SocketType socket) //throw SysError
{
    if (::shutdown(socket, SHUT_WR) != 0)
        THROW_LAST_SYS_ERROR("shutdown");
}


void zftp::shutdownSocket(SocketType socket) //noexcept
{
    //wakes up poll()/recv() on other threads: they see EOF or EPIPE; the descriptor itself stays valid until closeSocket()
    [[maybe_unused]] const int rv = ::shutdown(socket, SHUT_RDWR);
}


void zftp::setNonBlocking(SocketType socket, bool nonBlocking) //throw SysError
{
    int flags = ::fcntl(socket, F_GETFL);
    if (flags == -1)
        THROW_LAST_SYS_ERROR("fcntl(F_GETFL)");

    if (nonBlocking)
        flags |= O_NONBLOCK;
    else
        flags &= ~O_NONBLOCK;

    if (::fcntl(socket, F_SETFL, flags) != 0)
        THROW_LAST_SYS_ERROR(nonBlocking ? "fcntl(F_SETFL, O_NONBLOCK)" : "fcntl(F_SETFL, ~O_NONBLOCK)");
}
