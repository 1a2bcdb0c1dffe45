// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_line_protocol.h"
#include "ftp_error.h"

using namespace zftp;
using namespace ftc;


namespace
{
const size_t MAX_LINE_LENGTH   = 64 * 1024;
const size_t READ_BLOCK_SIZE   = 4096;
}


std::optional<CodeLine> ftc::parseCodeLine(const std::string& line)
{
    if (line.size() < 4 ||
        !isDigit(line[0]) || !isDigit(line[1]) || !isDigit(line[2]) ||
        (line[3] != ' ' && line[3] != '-'))
        return std::nullopt;

    const int statusCode = stringTo<int>(std::string_view(line).substr(0, 3));
    if (statusCode < 100)
        return std::nullopt;

    return CodeLine{statusCode, line[3] == '-', line.substr(4)};
}


std::optional<std::string> LineReader::readLine() //throw SysError, SysErrorFtpFormat, SysErrorTimeOut
{
    for (size_t searchPos = 0;;)
    {
        if (const size_t pos = buf_.find('\n', searchPos);
            pos != std::string::npos)
        {
            std::string line = buf_.substr(0, pos);
            buf_.erase(0, pos + 1);

            if (endsWith(line, "\r"))
                line.pop_back();
            return line;
        }
        searchPos = buf_.size();

        if (buf_.size() > MAX_LINE_LENGTH)
            throw SysErrorFtpFormat(replaceCpy(_("Line length exceeds %x bytes."), L"%x", numberTo<std::wstring>(MAX_LINE_LENGTH)));

        if (eof_)
        {
            if (buf_.empty())
                return std::nullopt;

            if (endsWith(buf_, "\r"))
                buf_.pop_back();
            return std::exchange(buf_, std::string());
        }

        const size_t oldSize = buf_.size();
        buf_.resize(oldSize + READ_BLOCK_SIZE);
        const size_t bytesRead = conn_.tryRead(&buf_[oldSize], READ_BLOCK_SIZE); //throw SysError, SysErrorTimeOut
        buf_.resize(oldSize + bytesRead);

        if (bytesRead == 0) //end of file
            eof_ = true;
    }
}


void FtpLineProtocol::sendCommand(const std::string& line) //throw SysError, SysErrorTimeOut
{
    if (contains(line, "\r") || contains(line, "\n")) //don't let a file name smuggle a second command
        throw SysError(replaceCpy(_("Invalid character in command %x."), L"%x", L'"' + utfTo<std::wstring>(beforeFirst(line, " ", IfNotFoundReturn::all)) + L'"'));

    const std::string buf = line + "\r\n";

    conn_->setDeadline(responseTimeoutSec_ > 0 ? SocketDeadline(std::chrono::steady_clock::now() + std::chrono::seconds(responseTimeoutSec_)) : std::nullopt);
    writeAll(*conn_, buf.c_str(), buf.size()); //throw SysError, SysErrorTimeOut
}


std::string FtpLineProtocol::readTracedLine() //throw SysError, SysErrorFtpFormat, SysErrorTimeOut
{
    std::optional<std::string> line = reader_.readLine(); //throw SysError, SysErrorFtpFormat, SysErrorTimeOut
    if (!line)
        throw SysError(_("Server closed the connection unexpectedly."));

    if (wireTrace_)
        wireTrace_(*line);
    return *line;
}


FtpReply FtpLineProtocol::readReply() //throw SysError, SysErrorFtpFormat, SysErrorTimeOut
{
    conn_->setDeadline(responseTimeoutSec_ > 0 ? SocketDeadline(std::chrono::steady_clock::now() + std::chrono::seconds(responseTimeoutSec_)) : std::nullopt);

    const std::string firstLine = readTracedLine(); //throw SysError, SysErrorFtpFormat, SysErrorTimeOut

    const std::optional<CodeLine> codeLine = parseCodeLine(firstLine);
    if (!codeLine)
        throw SysErrorFtpFormat(replaceCpy(_("Invalid server response %x."), L"%x", L'"' + utfTo<std::wstring>(firstLine) + L'"'));

    FtpReply reply{codeLine->statusCode, codeLine->text};

    /*  multi-line reply: "ddd-" ... "ddd "
        - lines with the same code are stripped of the code prefix
        - anything else is part of the message as-is, e.g. FEAT's indented lines  */
    for (bool continued = codeLine->continued; continued;)
    {
        const std::string line = readTracedLine(); //throw SysError, SysErrorFtpFormat, SysErrorTimeOut

        reply.message += '\n';

        if (const std::optional<CodeLine> cl = parseCodeLine(line);
            cl && cl->statusCode == reply.statusCode)
        {
            reply.message += cl->text;
            continued = cl->continued;
        }
        else
            reply.message += line;
    }
    return reply;
}
