// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_config.h"
#include <algorithm>

using namespace zftp;
using namespace ftc;


namespace
{
uint16_t parsePort(const std::string& address, const std::string& portStr) //throw SysError
{
    if (portStr.empty() || portStr.size() > 5 || !std::all_of(portStr.begin(), portStr.end(), [](char c) { return isDigit(c); }))
        throw SysError(replaceCpy(_("Invalid port number in server address %x."), L"%x", L'"' + utfTo<std::wstring>(address) + L'"'));

    const int port = stringTo<int>(portStr);
    if (port <= 0 || port > 65535)
        throw SysError(replaceCpy(_("Invalid port number in server address %x."), L"%x", L'"' + utfTo<std::wstring>(address) + L'"'));

    return static_cast<uint16_t>(port);
}
}


ServerAddress ftc::parseServerAddress(const std::string& address) //throw SysError
{
    const std::string addr = trimCpy(address);
    ServerAddress out;

    if (startsWith(addr, "["))
    {
        if (!contains(addr, "]"))
            throw SysError(replaceCpy(_("Invalid server address %x."), L"%x", L'"' + utfTo<std::wstring>(address) + L'"'));

        out.server = beforeFirst(afterFirst(addr, "[", IfNotFoundReturn::none), "]", IfNotFoundReturn::none);

        const std::string rest = afterFirst(addr, "]", IfNotFoundReturn::none);
        if (!rest.empty())
        {
            if (!startsWith(rest, ":"))
                throw SysError(replaceCpy(_("Invalid server address %x."), L"%x", L'"' + utfTo<std::wstring>(address) + L'"'));

            out.port = parsePort(address, rest.substr(1)); //throw SysError
        }
    }
    else if (std::count(addr.begin(), addr.end(), ':') == 1)
    {
        out.server = beforeFirst(addr, ":", IfNotFoundReturn::none);
        out.port = parsePort(address, afterFirst(addr, ":", IfNotFoundReturn::none)); //throw SysError
    }
    else //no port or bare IPv6 literal
        out.server = addr;

    if (out.server.empty())
        throw SysError(_("Server name must not be empty."));

    return out;
}
