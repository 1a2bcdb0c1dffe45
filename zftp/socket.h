// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SOCKET_H_6610384729105532018
#define SOCKET_H_6610384729105532018

#include <chrono>
#include <functional>
#include <optional>
#include "sys_error.h"
#include <unistd.h> //close
#include <sys/socket.h>
#include <netdb.h> //getaddrinfo


namespace zftp
{
#define THROW_LAST_SYS_ERROR_GAI(rcGai)                        \
    do {                                                       \
        if (rcGai == EAI_SYSTEM) /*"check errno for details"*/ \
            THROW_LAST_SYS_ERROR("getaddrinfo");               \
        \
        throw zftp::SysError(zftp::formatSystemError("getaddrinfo", zftp::formatGaiErrorCode(rcGai), zftp::utfTo<std::wstring>(::gai_strerror(rcGai)))); \
    } while (false)

std::wstring formatGaiErrorCode(int ec);

using SocketType = int;
const SocketType invalidSocket = -1;
inline void closeSocket(SocketType s) { ::close(s); }

void setNonBlocking(SocketType socket, bool value); //throw SysError

//none: wait forever
using SocketDeadline = std::optional<std::chrono::steady_clock::time_point>;


class Socket //throw SysError
{
public:
    Socket(const std::string& server, const std::string& serviceName, int timeoutSec, bool tcpKeepAlive,
           const std::function<void()>& checkInterrupt /*throw X; called periodically while connecting; may be empty*/); //throw SysError, SysErrorTimeOut, X

    explicit Socket(SocketType socket) : socket_(socket) {} //take ownership

    ~Socket() { closeSocket(socket_); }

    SocketType get() const { return socket_; }

    std::string getPeerAddress() const; //throw SysError; numeric IPv4 or IPv6 address

private:
    Socket           (const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    SocketType socket_ = invalidSocket;
};


//block until the socket is readable (or writable); throws SysErrorTimeOut after the deadline
void waitForSocket(SocketType socket, bool forWrite, const SocketDeadline& deadline); //throw SysError, SysErrorTimeOut

size_t tryReadSocket (SocketType socket,       void* buffer, size_t bytesToRead);  //throw SysError; may return short, only 0 means EOF! CONTRACT: bytesToRead > 0
size_t tryWriteSocket(SocketType socket, const void* buffer, size_t bytesToWrite); //throw SysError; may return short! CONTRACT: bytesToWrite > 0

//initiate termination of connection by sending TCP FIN package
void shutdownSocketSend(SocketType socket); //throw SysError

//context of any thread: fail pending and future I/O of other threads on this socket
void shutdownSocket(SocketType socket); //noexcept
}

#endif //SOCKET_H_6610384729105532018
