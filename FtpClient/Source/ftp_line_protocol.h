// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_LINE_PROTOCOL_H_7741950286613304852
#define FTP_LINE_PROTOCOL_H_7741950286613304852

#include <optional>
#include "ftp_config.h"


namespace ftc
{
struct FtpReply
{
    int statusCode = 0;
    std::string message; //multi-line: lines joined by '\n', code prefix stripped
};


//split CRLF- or LF-terminated lines from a byte stream
class LineReader
{
public:
    explicit LineReader(FtpConnection& conn) : conn_(conn) {}

    //none: EOF; a final line without line break is still returned
    std::optional<std::string> readLine(); //throw SysError, SysErrorFtpFormat, SysErrorTimeOut

private:
    FtpConnection& conn_;
    std::string buf_;
    bool eof_ = false;
};


//control channel: CRLF commands, "ddd text" and "ddd-..." multi-line replies (RFC 959, section 4.2)
class FtpLineProtocol
{
public:
    FtpLineProtocol(std::unique_ptr<FtpConnection>&& conn, const WireTraceFun& wireTrace, int responseTimeoutSec) :
        conn_(std::move(conn)), reader_(*conn_), wireTrace_(wireTrace), responseTimeoutSec_(responseTimeoutSec) {}

    void sendCommand(const std::string& line); //throw SysError, SysErrorTimeOut

    FtpReply readReply(); //throw SysError, SysErrorFtpFormat, SysErrorTimeOut

    FtpConnection& connection() { return *conn_; }

private:
    FtpLineProtocol           (const FtpLineProtocol&) = delete;
    FtpLineProtocol& operator=(const FtpLineProtocol&) = delete;

    std::string readTracedLine(); //throw SysError, SysErrorFtpFormat, SysErrorTimeOut

    const std::unique_ptr<FtpConnection> conn_;
    LineReader reader_;
    const WireTraceFun wireTrace_;
    const int responseTimeoutSec_;
};


struct CodeLine
{
    int statusCode = 0;
    bool continued = false; //"ddd-"
    std::string text;
};
//none: not a "ddd<SP|->text" line
std::optional<CodeLine> parseCodeLine(const std::string& line);
}

#endif //FTP_LINE_PROTOCOL_H_7741950286613304852
