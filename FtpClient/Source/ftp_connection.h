// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_CONNECTION_H_6128840375529017714
#define FTP_CONNECTION_H_6128840375529017714

#include <cstdint>
#include <functional>
#include <memory>
#include <zftp/socket.h>


namespace ftc
{
using zftp::SocketDeadline;

//bidirectional byte stream: control channel or data channel
class FtpConnection
{
public:
    virtual ~FtpConnection() {}

    virtual size_t tryRead (      void* buffer, size_t bytesToRead ) = 0; //throw SysError, SysErrorTimeOut; may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    virtual size_t tryWrite(const void* buffer, size_t bytesToWrite) = 0; //throw SysError, SysErrorTimeOut; may return short! CONTRACT: bytesToWrite > 0

    //applies to all following tryRead()/tryWrite() calls; none: wait forever
    virtual void setDeadline(const SocketDeadline& deadline) = 0;

    //signal end of upload
    virtual void closeSend() = 0; //throw SysError

    //context of any thread: make blocked and future tryRead()/tryWrite() fail fast
    virtual void abort() = 0; //noexcept

    virtual std::string getPeerAddress() const = 0; //throw SysError; numeric IP, empty if unknown
};


void writeAll(FtpConnection& conn, const void* buffer, size_t bytesToWrite); //throw SysError, SysErrorTimeOut


struct DialerCfg
{
    int timeoutSec = 10;
    bool tcpKeepAlive = true;
};

struct TlsConfig
{
    std::string caCertFilePath; //optional: enable certificate validation
    std::string serverName;     //optional: SNI + host name check; default: server being dialed
};

//checkInterrupt: called periodically while dialing
std::unique_ptr<FtpConnection> dialTcp(const std::string& server, uint16_t port, const DialerCfg& dialer,
                                       const std::function<void()>& checkInterrupt /*throw X*/); //throw SysError, SysErrorTimeOut, X

std::unique_ptr<FtpConnection> dialTls(const std::string& server, uint16_t port, const DialerCfg& dialer, const TlsConfig& tls,
                                       const std::function<void()>& checkInterrupt /*throw X*/); //throw SysError, SysErrorTimeOut, X
}

#endif //FTP_CONNECTION_H_6128840375529017714
