// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <algorithm>
#include <atomic>
#include <csignal>
#include <iostream>
#include <zftp/extra_log.h>
#include <zftp/file_io.h>
#include <zftp/time.h>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include "command_line.h"
#include "ftp_session.h"

using namespace zftp;
using namespace ftc;


namespace
{
std::atomic<bool> sigIntReceived{false}; //lock-free => safe to set from signal handler
static_assert(std::atomic<bool>::is_always_lock_free);

void onSigInt(int /*signum*/) { sigIntReceived = true; }


void notifyAppError(const std::wstring& msg)
{
    std::cerr << utfTo<std::string>(_("Error") + L": " + msg) + '\n';
}


uint64_t parseOffset(const std::string& command, const std::string& offsetStr) //throw CommandLineError
{
    if (offsetStr.empty() || offsetStr.size() > 19 || !std::all_of(offsetStr.begin(), offsetStr.end(), [](char c) { return isDigit(c); }))
        throw CommandLineError(replaceCpy(_("Invalid offset for command %x."), L"%x", utfTo<std::wstring>(command)),
                               _("Found:") + L" \"" + utfTo<std::wstring>(offsetStr) + L'"');
    return stringTo<uint64_t>(offsetStr);
}


void printListing(const std::vector<FtpEntry>& entries)
{
    for (const FtpEntry& entry : entries)
        if (entry.name != "." && entry.name != "..")
        {
            const char typeTag = [&]
            {
                switch (entry.type)
                {
                    //*INDENT-OFF*
                    case EntryType::folder: return 'd';
                    case EntryType::link:   return 'l';
                    case EntryType::file:   break;
                    //*INDENT-ON*
                }
                return '-';
            }();

            std::string sizeStr = numberTo<std::string>(entry.size);
            if (sizeStr.size() < 12)
                sizeStr.insert(0, 12 - sizeStr.size(), ' ');

            std::string line = typeTag + (' ' + sizeStr) + "  " + formatTime(formatIsoDateTimeTag, getUtcTime(entry.modTime)) + "  " + entry.name;
            if (!entry.target.empty())
                line += " -> " + entry.target;

            std::cout << line << '\n';
        }
}


void downloadFile(FtpSession& session, const CancelSignal& cancel, const std::string& remotePath, const std::string& localPath, uint64_t offset) //throw SysError, FileError
{
    FileOutputPlain fileOut(localPath, offset != 0 ? FileOutputMode::append : FileOutputMode::createNew); //throw FileError, ErrorTargetExisting

    const std::unique_ptr<FtpDataStream> stream = session.download(cancel, remotePath, offset); //throw SysError, SysErrorFtpProtocol, SysErrorCancelled

    std::vector<std::byte> buffer(FileBase::defaultBlockSize);
    for (;;)
    {
        const size_t bytesRead = stream->tryRead(buffer.data(), buffer.size()); //throw SysError, SysErrorTimeOut, SysErrorCancelled
        if (bytesRead == 0) //end of file
            break;

        for (size_t bytesWritten = 0; bytesWritten < bytesRead;)
            bytesWritten += fileOut.tryWrite(buffer.data() + bytesWritten, bytesRead - bytesWritten); //throw FileError
    }
    stream->close(); //throw SysError, SysErrorFtpProtocol, SysErrorCancelled
    fileOut.close(); //throw FileError
}


void uploadFile(FtpSession& session, const CancelSignal& cancel, const std::string& localPath, const std::string& remotePath, uint64_t offset) //throw SysError, FileError
{
    FileInputPlain fileIn(localPath, offset); //throw FileError

    session.upload(cancel, remotePath, [&](void* buffer, size_t bytesToRead)
    {
        return fileIn.tryRead(buffer, bytesToRead); //throw FileError
    }, offset); //throw SysError, SysErrorFtpProtocol, SysErrorCancelled, FileError
}


void runCommand(FtpSession& session, const CommandLine& cl, const CancelSignal& cancel) //throw SysError, FileError
{
    const std::string& cmd = cl.command;
    const std::vector<std::string>& args = cl.commandArgs; //arity is checked by parseCommandLine()

    auto optionalArg = [&](size_t i) { return i < args.size() ? args[i] : std::string(); };

    if (cmd == "ls")
        printListing(session.list(cancel, optionalArg(0)));
    else if (cmd == "nlst")
        for (const std::string& name : session.nameList(cancel, optionalArg(0)))
            std::cout << name << '\n';
    else if (cmd == "get")
        downloadFile(session, cancel, args[0], args[1], args.size() > 2 ? parseOffset(cmd, args[2]) : 0);
    else if (cmd == "put")
        uploadFile(session, cancel, args[0], args[1], args.size() > 2 ? parseOffset(cmd, args[2]) : 0);
    else if (cmd == "rm")
        session.deleteFile(cancel, args[0]);
    else if (cmd == "mkdir")
        session.makeDir(cancel, args[0]);
    else if (cmd == "rmdir")
        session.removeDir(cancel, args[0]);
    else if (cmd == "rmtree")
        session.removeDirRecursive(cancel, args[0]);
    else if (cmd == "mv")
        session.rename(cancel, args[0], args[1]);
    else if (cmd == "size")
        std::cout << session.fileSize(cancel, args[0]) << '\n';
    else if (cmd == "mdtm")
        std::cout << formatTime(formatIsoDateTimeTag, getUtcTime(session.getModificationTime(cancel, args[0]))) << " UTC\n";
    else if (cmd == "pwd")
        std::cout << session.currentDir(cancel) << '\n';
    else if (cmd == "features")
        for (const auto& [token, param] : session.getFeatures())
            std::cout << token << (param.empty() ? "" : ' ' + param) << '\n';
    else
        assert(false); //unknown commands are rejected by parseCommandLine()
}


std::string makeServerAddress(const FtpUrl& url)
{
    if (contains(url.server, ":")) //IPv6 literal
        return '[' + url.server + "]:" + numberTo<std::string>(url.port);
    return url.server + ':' + numberTo<std::string>(url.port);
}
}


int main(int argc, char* argv[])
{
    initExtraLog([](const ErrorLog& log) //nothrow! runs during global shutdown!
    {
        for (const LogEntry& entry : log)
            std::cerr << formatMessage(entry);
    });

    CommandLine cl;
    try
    {
        cl = parseCommandLine(std::vector<std::string>(argv + 1, argv + argc)); //throw CommandLineError
    }
    catch (const CommandLineError& e)
    {
        notifyAppError(e.toString() + L"\n\n" + getSyntaxHelp());
        return static_cast<int>(FtpcExitCode::syntaxError);
    }

    if (cl.showHelp)
    {
        std::cout << utfTo<std::string>(getSyntaxHelp());
        return static_cast<int>(FtpcExitCode::success);
    }

    libcurlInit();
    ZFTP_ON_SCOPE_EXIT(libcurlTearDown());

    ::signal(SIGPIPE, SIG_IGN); //OpenSSL writes to the socket without MSG_NOSIGNAL
    ::signal(SIGINT, onSigInt);

    CancelSignal cancel;

    InterruptibleThread sigIntWatch([&cancel] //declare after "cancel"
    {
        setCurrentThreadName("SIGINT watch");

        while (!sigIntReceived)
            interruptibleSleep(std::chrono::milliseconds(50)); //throw ThreadStopRequest
        cancel.cancel();
    });

    try
    {
        const FtpUrl url = parseFtpUrl(cl.url); //throw SysError

        FtpConfig cfg;
        cfg.dialer.timeoutSec = cl.timeoutSec;
        if (url.useTls || cl.forceTls)
            cfg.tls = TlsConfig{.caCertFilePath = cl.caCertFilePath};
        cfg.disableEpsv     = cl.disableEpsv;
        cfg.serverUtcOffset = cl.utcOffsetMin;
        cfg.dataTimeoutSec  = cl.dataTimeoutSec;
        if (cl.wireTrace)
            cfg.wireTrace = [](const std::string& line) { std::cerr << "< " << line << '\n'; };

        FtpSession session(makeServerAddress(url), std::move(cfg), cancel); //throw SysError, SysErrorFtpProtocol, SysErrorCancelled

        if (url.username.empty())
            session.login(cancel, "anonymous", "anonymous@"); //throw SysError, SysErrorLogin, SysErrorCancelled
        else
            session.login(cancel, url.username, url.password); //

        if (!url.path.empty() && url.path != "/")
            session.changeDir(cancel, url.path); //throw SysError, SysErrorFtpProtocol, SysErrorCancelled

        runCommand(session, cl, cancel); //throw SysError, FileError

        try
        {
            session.quit(cancel); //throw SysError
        }
        catch (const SysError& e) { logExtraError(e.toString()); } //command succeeded: don't fail now
    }
    catch (const CommandLineError& e)
    {
        notifyAppError(e.toString());
        return static_cast<int>(FtpcExitCode::syntaxError);
    }
    catch (const FileError& e)
    {
        notifyAppError(e.toString());
        return static_cast<int>(FtpcExitCode::error);
    }
    catch (const SysError& e)
    {
        notifyAppError(e.toString());
        return static_cast<int>(FtpcExitCode::error);
    }

    return static_cast<int>(FtpcExitCode::success);
}
