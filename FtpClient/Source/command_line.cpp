// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "command_line.h"

using namespace zftp;
using namespace ftc;


namespace
{
const char* optionTls         = "-tls";
const char* optionCaCert      = "-cacert";
const char* optionTimeout     = "-timeout";
const char* optionDataTimeout = "-data-timeout";
const char* optionNoEpsv      = "-no-epsv";
const char* optionUtcOffset   = "-utc-offset";
const char* optionTrace       = "-trace";


struct CommandSyntax
{
    const char* name;
    size_t minArgs;
    size_t maxArgs;
    const char* argHelp;
};

const CommandSyntax commands[] =
{
    {"ls",       0, 1, "[path]"},
    {"nlst",     0, 1, "[path]"},
    {"get",      2, 3, "<remote> <local> [offset]"},
    {"put",      2, 3, "<local> <remote> [offset]"},
    {"rm",       1, 1, "<path>"},
    {"mkdir",    1, 1, "<path>"},
    {"rmdir",    1, 1, "<path>"},
    {"rmtree",   1, 1, "<path>"},
    {"mv",       2, 2, "<from> <to>"},
    {"size",     1, 1, "<path>"},
    {"mdtm",     1, 1, "<path>"},
    {"pwd",      0, 0, ""},
    {"features", 0, 0, ""},
};


bool isHelpRequest(const std::string& arg)
{
    auto it = std::find_if(arg.begin(), arg.end(), [](char c) { return c != '/' && c != '-'; });
    if (it == arg.begin()) return false; //require at least one prefix character

    const std::string argTmp(it, arg.end());
    return equalAsciiNoCase(argTmp, "help") ||
           equalAsciiNoCase(argTmp, "h")    ||
           argTmp == "?";
}


int parseNumberArg(const std::string& option, const std::string& value, bool allowNegative) //throw CommandLineError
{
    std::string_view digits = value;
    if (allowNegative && startsWith(digits, "-"))
        digits.remove_prefix(1);

    if (digits.empty() || digits.size() > 9 || !std::all_of(digits.begin(), digits.end(), [](char c) { return isDigit(c); }))
        throw CommandLineError(replaceCpy(_("A number is expected after %x."), L"%x", utfTo<std::wstring>(option)),
                               _("Found:") + L" \"" + utfTo<std::wstring>(value) + L'"');

    return stringTo<int>(value);
}
}


CommandLine ftc::parseCommandLine(const std::vector<std::string>& args) //throw CommandLineError
{
    CommandLine cl;

    auto it = args.begin();

    auto getOptionValue = [&](const char* option) -> const std::string& //throw CommandLineError
    {
        if (++it == args.end())
            throw CommandLineError(replaceCpy(_("A value is expected after %x."), L"%x", utfTo<std::wstring>(option)));
        return *it;
    };

    //options come first: everything after the URL is positional
    for (; it != args.end(); ++it)
        if (isHelpRequest(*it))
        {
            cl.showHelp = true;
            return cl;
        }
        else if (equalAsciiNoCase(*it, optionTls))
            cl.forceTls = true;
        else if (equalAsciiNoCase(*it, optionCaCert))
            cl.caCertFilePath = getOptionValue(optionCaCert); //throw CommandLineError
        else if (equalAsciiNoCase(*it, optionTimeout))
            cl.timeoutSec = parseNumberArg(optionTimeout, getOptionValue(optionTimeout), false /*allowNegative*/); //throw CommandLineError
        else if (equalAsciiNoCase(*it, optionDataTimeout))
            cl.dataTimeoutSec = parseNumberArg(optionDataTimeout, getOptionValue(optionDataTimeout), false /*allowNegative*/); //throw CommandLineError
        else if (equalAsciiNoCase(*it, optionNoEpsv))
            cl.disableEpsv = true;
        else if (equalAsciiNoCase(*it, optionUtcOffset))
            cl.utcOffsetMin = parseNumberArg(optionUtcOffset, getOptionValue(optionUtcOffset), true /*allowNegative*/); //throw CommandLineError
        else if (equalAsciiNoCase(*it, optionTrace))
            cl.wireTrace = true;
        else if (startsWith(*it, "-"))
            throw CommandLineError(replaceCpy(_("Unknown option %x."), L"%x", utfTo<std::wstring>(*it)));
        else
            break;
    //----------------------------------------------------------------------------------------------------

    if (it == args.end())
        throw CommandLineError(_("Server URL is missing."));
    cl.url = *it++;

    if (it == args.end())
        throw CommandLineError(_("Command is missing."));

    cl.command = *it++;
    std::transform(cl.command.begin(), cl.command.end(), cl.command.begin(), [](char c) { return asciiToLower(c); });

    cl.commandArgs.assign(it, args.end());

    const auto itCmd = std::find_if(std::begin(commands), std::end(commands), [&](const CommandSyntax& cs) { return cl.command == cs.name; });
    if (itCmd == std::end(commands))
        throw CommandLineError(replaceCpy(_("Unknown command %x."), L"%x", utfTo<std::wstring>(cl.command)));

    if (cl.commandArgs.size() < itCmd->minArgs ||
        cl.commandArgs.size() > itCmd->maxArgs)
        throw CommandLineError(replaceCpy(_("Wrong number of arguments for command %x."), L"%x", utfTo<std::wstring>(cl.command)),
                               _("Syntax:") + L' ' + utfTo<std::wstring>(std::string(itCmd->name) + ' ' + itCmd->argHelp));
    return cl;
}


std::wstring ftc::getSyntaxHelp()
{
    std::wstring cmdHelp;
    for (const CommandSyntax& cs : commands)
        cmdHelp += L"    " + utfTo<std::wstring>(std::string(cs.name) + ' ' + cs.argHelp) + L'\n';

    return _("Syntax:") + L"\n\n" +
           L"ftpc [" + _("options") + L"] ftp[s]://[user[:password]@]host[:port][/dir] <command> [args]" + L"\n\n" +

           _("options:") + L'\n' +
           L"    " + utfTo<std::wstring>(optionTls)         + L"                   " + _("Use TLS for control and data connections.") + L'\n' +
           L"    " + utfTo<std::wstring>(optionCaCert)      + L" <file>         "   + _("Verify the server certificate.") + L'\n' +
           L"    " + utfTo<std::wstring>(optionTimeout)     + L" <sec>         "    + _("Connection timeout (default: 10).") + L'\n' +
           L"    " + utfTo<std::wstring>(optionDataTimeout) + L" <sec>    "         + _("Abort transfers that stall for longer than this.") + L'\n' +
           L"    " + utfTo<std::wstring>(optionNoEpsv)      + L"               "    + _("Use PASV only.") + L'\n' +
           L"    " + utfTo<std::wstring>(optionUtcOffset)   + L" <min>      "       + _("Time zone of the server's LIST time stamps.") + L'\n' +
           L"    " + utfTo<std::wstring>(optionTrace)       + L"                 "  + _("Print server replies to stderr.") + L"\n\n" +

           _("commands:") + L'\n' + cmdHelp;
}
