// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_session.h"

using namespace zftp;
using namespace ftc;


namespace
{
[[noreturn]] void throwInvalidReply(const std::string& command, const std::string& message) //throw SysErrorFtpFormat
{
    throw SysErrorFtpFormat(replaceCpy(replaceCpy(_("Invalid %x response: %y"), L"%x", utfTo<std::wstring>(command)),
                                       L"%y", L'"' + utfTo<std::wstring>(message) + L'"'));
}


//0-255, digits only
int parseByte(const std::string_view& str) //returns -1 on error
{
    const std::string_view num = trimCpy(str);
    if (num.empty() || num.size() > 3 || !std::all_of(num.begin(), num.end(), [](char c) { return isDigit(c); }))
        return -1;

    const int val = stringTo<int>(num);
    return val <= 255 ? val : -1;
}
}


uint16_t ftc::parseEpsvResponse(const std::string& message) //throw SysErrorFtpFormat
{
    //"Entering Extended Passive Mode (|||6446|)"  https://tools.ietf.org/html/rfc2428#section-3
    const size_t posStart = message.find("|||");
    const size_t posEnd   = message.rfind('|');
    if (posStart == std::string::npos || posEnd == std::string::npos || posEnd < posStart + 3)
        throwInvalidReply("EPSV", message);

    const std::string_view portStr = std::string_view(message).substr(posStart + 3, posEnd - (posStart + 3));
    if (portStr.empty() || portStr.size() > 5 || !std::all_of(portStr.begin(), portStr.end(), [](char c) { return isDigit(c); }))
        throwInvalidReply("EPSV", message);

    const int port = stringTo<int>(portStr);
    if (port <= 0 || port > 65535)
        throwInvalidReply("EPSV", message);

    return static_cast<uint16_t>(port);
}


ServerAddress ftc::parsePasvResponse(const std::string& message) //throw SysErrorFtpFormat
{
    //"Entering Passive Mode (h1,h2,h3,h4,p1,p2)"  https://tools.ietf.org/html/rfc959#section-4.1.2
    const size_t posStart = message.find('(');
    const size_t posEnd   = message.rfind(')');
    if (posStart == std::string::npos || posEnd == std::string::npos || posEnd < posStart)
        throwInvalidReply("PASV", message);

    const std::vector<std::string_view> fields = splitCpy(std::string_view(message).substr(posStart + 1, posEnd - posStart - 1), ',', SplitOnEmpty::allow);
    if (fields.size() < 6)
        throwInvalidReply("PASV", message);

    int numbers[6] = {};
    for (size_t i = 0; i < 6; ++i)
        if ((numbers[i] = parseByte(fields[i])) < 0)
            throwInvalidReply("PASV", message);

    ServerAddress addr;
    addr.server = numberTo<std::string>(numbers[0]) + '.' +
                  numberTo<std::string>(numbers[1]) + '.' +
                  numberTo<std::string>(numbers[2]) + '.' +
                  numberTo<std::string>(numbers[3]);
    addr.port = static_cast<uint16_t>(numbers[4] * 256 + numbers[5]);
    return addr;
}


ServerAddress FtpSession::getDataConnAddress(const CancelSignal& cancel) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorCancelled
{
    if (!cfg_.disableEpsv && !skipEpsv_)
        try
        {
            const FtpReply reply = execute(cancel, StatusExtendedPassiveMode, "EPSV"); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled

            return {host_, parseEpsvResponse(reply.message)}; //throw SysErrorFtpFormat
        }
        //server rejected or garbled EPSV: don't ask again for this session
        //no fallback on SysError/SysErrorTimeOut: a reply that never arrived could still show up later, and PASV would read it as its own
        catch (const SysErrorFtpProtocol&) { skipEpsv_ = true; }
        catch (const SysErrorFtpFormat&  ) { skipEpsv_ = true; }

    const FtpReply reply = execute(cancel, StatusPassiveMode, "PASV"); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled

    return parsePasvResponse(reply.message); //throw SysErrorFtpFormat
}


std::unique_ptr<FtpConnection> FtpSession::openDataConn(const CancelSignal& cancel) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
{
    const ServerAddress addr = getDataConnAddress(cancel); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
    try
    {
        return dial(addr.server, addr.port, cancel); //throw SysError, SysErrorTimeOut, SysErrorCancelled
    }
    catch (const SysErrorCancelled&) { throwCancelled(nullptr); } //control connection is unusable, too
}
