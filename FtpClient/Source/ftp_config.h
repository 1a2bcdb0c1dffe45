// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_CONFIG_H_2295174068311458027
#define FTP_CONFIG_H_2295174068311458027

#include <optional>
#include <zftp/thread.h>
#include "ftp_connection.h"


namespace ftc
{
//custom dialing for control and data connections: result is used as-is (no TLS wrapping)
using ConnectFun = std::function<std::unique_ptr<FtpConnection>(const std::string& server, uint16_t port, const zftp::CancelSignal& cancel)>; //throw SysError

//receives every line read from the control channel (without line break)
using WireTraceFun = std::function<void(const std::string& line)>;


struct FtpConfig
{
    DialerCfg dialer;

    std::unique_ptr<FtpConnection> controlConnection; //optional: pre-established control connection; dialer, tls and connectFun are not used for it

    std::optional<TlsConfig> tls; //implicit TLS: control + data channels

    bool disableEpsv = false; //go straight to PASV

    /*  minutes east of UTC; interpretation of LIST time stamps (MLSD is always UTC)
        fixed offset: a server time zone with daylight saving time is off by one hour for part of the year  */
    int serverUtcOffset = 0;

    WireTraceFun wireTrace;

    ConnectFun connectFun;

    int dataTimeoutSec = 0; //renewable per chunk or line; 0: wait forever

    int serverResponseTimeoutSec = 0; //per control channel reply; 0: wait forever

    std::string clientName = "FtpClient"; //CLNT
};


struct ServerAddress
{
    std::string server;
    uint16_t port = 21;
};

//"host", "host:port", "[ipv6]", "[ipv6]:port" or a bare IPv6 literal
ServerAddress parseServerAddress(const std::string& address); //throw SysError
}

#endif //FTP_CONFIG_H_2295174068311458027
