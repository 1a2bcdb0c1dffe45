// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_session.h"
#include <zftp/extra_log.h>

using namespace zftp;
using namespace ftc;


namespace
{
std::wstring fmtUser(const std::string& user) { return L'"' + utfTo<std::wstring>(user) + L'"'; }


SysErrorLogin makeLoginError(const std::string& user, const FtpReply& reply)
{
    const SysErrorFtpProtocol e = makeFtpProtocolError(reply.statusCode, reply.message);
    return SysErrorLogin(replaceCpy(_("Login failed for user %x."), L"%x", fmtUser(user)) + L' ' + e.toString(), e.ftpErrorCode, e.serverMessage);
}
}


FtpSession::FtpSession(const std::string& address, FtpConfig cfg, const CancelSignal& cancel) : //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
    cfg_(std::move(cfg))
{
    const ServerAddress addr = parseServerAddress(address); //throw SysError
    serverName_ = addr.server;

    std::unique_ptr<FtpConnection> conn = std::move(cfg_.controlConnection);
    if (!conn)
        conn = dial(addr.server, addr.port, cancel); //throw SysError, SysErrorTimeOut, SysErrorCancelled

    host_ = conn->getPeerAddress(); //throw SysError
    if (host_.empty()) //custom connection without peer information
        host_ = addr.server;

    ctrl_ = std::make_unique<FtpLineProtocol>(std::move(conn), cfg_.wireTrace, cfg_.serverResponseTimeoutSec);

    runCancellable(cancel, nullptr, [&] { readReply(StatusReady); }); //greeting; throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled

    discoverFeatures(cancel); //throw SysError, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
}


FtpSession::~FtpSession() {} //no QUIT: just close the connection


void FtpSession::checkUsable() const //throw SysError, SysErrorCancelled
{
    if (aborted_)
        throw SysErrorCancelled(_("The connection was closed by a cancelled operation."));
    if (!ctrl_)
        throw SysError(_("The connection is closed."));
}


void FtpSession::abortConnections(FtpConnection* dataConn) //noexcept; context of any thread
{
    aborted_ = true;
    if (ctrl_)
        ctrl_->connection().abort();
    if (dataConn)
        dataConn->abort();
}


void FtpSession::throwCancelled(FtpConnection* dataConn) //throw SysErrorCancelled
{
    abortConnections(dataConn);
    throw SysErrorCancelled(_("Operation cancelled."));
}


std::unique_ptr<FtpConnection> FtpSession::dial(const std::string& server, uint16_t port, const CancelSignal& cancel) //throw SysError, SysErrorTimeOut, SysErrorCancelled
{
    const auto checkInterrupt = [&cancel]
    {
        if (cancel.isCancelled())
            throw SysErrorCancelled(_("Operation cancelled."));
    };
    checkInterrupt(); //throw SysErrorCancelled

    if (cfg_.connectFun)
    {
        std::unique_ptr<FtpConnection> conn = cfg_.connectFun(server, port, cancel); //throw SysError
        if (!conn)
            throw SysError(replaceCpy(_("Cannot connect to %x."), L"%x", utfTo<std::wstring>(server + ':' + numberTo<std::string>(port))));
        return conn;
    }

    if (cfg_.tls)
    {
        TlsConfig tls = *cfg_.tls;
        if (tls.serverName.empty()) //data channel: verify against the server we logged into, not the PASV address
            tls.serverName = serverName_;

        return dialTls(server, port, cfg_.dialer, tls, checkInterrupt); //throw SysError, SysErrorTimeOut, SysErrorCancelled
    }

    return dialTcp(server, port, cfg_.dialer, checkInterrupt); //throw SysError, SysErrorTimeOut, SysErrorCancelled
}


FtpReply FtpSession::sendCommand(int expectedStatus, const std::string& commandLine) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut
{
    ctrl_->sendCommand(commandLine); //throw SysError, SysErrorTimeOut
    return readReply(expectedStatus); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut
}


FtpReply FtpSession::readReply(int expectedStatus) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut
{
    FtpReply reply = ctrl_->readReply(); //throw SysError, SysErrorFtpFormat, SysErrorTimeOut

    if (expectedStatus != StatusAny && reply.statusCode != expectedStatus)
        throw makeFtpProtocolError(reply.statusCode, reply.message);

    return reply;
}


FtpReply FtpSession::execute(const CancelSignal& cancel, int expectedStatus, const std::string& commandLine) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
{
    return runCancellable(cancel, nullptr, [&] { return sendCommand(expectedStatus, commandLine); });
}


void FtpSession::discoverFeatures(const CancelSignal& cancel) //throw SysError, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
{
    /*  https://tools.ietf.org/html/rfc2389#section-3.2
        211-Features:
         MDTM
         MLST type*;size*;modify*;
         UTF8
        211 End                              */
    const FtpReply reply = execute(cancel, StatusAny, "FEAT"); //throw SysError, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
    if (reply.statusCode != StatusSystem) //e.g. 500: server without extensions
        return;

    split(reply.message, '\n', [&](const std::string_view line)
    {
        if (!startsWith(line, " ")) //header and footer
            return;

        const std::string_view feature = trimCpy(line);
        if (feature.empty())
            return;

        features_[std::string(beforeFirst(feature, " ", IfNotFoundReturn::all))] = std::string(afterFirst(feature, " ", IfNotFoundReturn::none));
    });

    mlstSupported_ = features_.contains("MLST") ||
                     features_.contains("MLSD"); //non-compliant, but seen in the wild
}


void FtpSession::negotiateUtf8(const CancelSignal& cancel) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
{
    if (!features_.contains("UTF8") &&
        !features_.contains("UTF-8"))
        return;

    //some servers (e.g. Serv-U) switch to UTF-8 only after CLNT
    if (features_.contains("CLNT"))
        execute(cancel, StatusAny, "CLNT " + cfg_.clientName); //throw SysError, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled

    const FtpReply reply = execute(cancel, StatusAny, "OPTS UTF8 ON"); //throw SysError, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
    switch (reply.statusCode)
    {
        case StatusCommandOK:
        case StatusCommandNotImplemented: //"202 UTF8 mode is always enabled. No need to send this command."
        case StatusBadArguments:          //server doesn't need the option
        case StatusNotImplementedParameter:
            return;
        default:
            throw makeFtpProtocolError(reply.statusCode, reply.message);
    }
}


void FtpSession::login(const CancelSignal& cancel, const std::string& user, const std::string& password) //throw SysError, SysErrorLogin, SysErrorFtpProtocol, SysErrorCancelled
{
    runCancellable(cancel, nullptr, [&]
    {
        const FtpReply reply = sendCommand(StatusAny, "USER " + user); //throw SysError, SysErrorFtpFormat, SysErrorTimeOut
        switch (reply.statusCode)
        {
            case StatusLoggedIn: //no password required
                return;

            case StatusUserOK:
                if (const FtpReply replyPass = sendCommand(StatusAny, "PASS " + password); //throw SysError, SysErrorFtpFormat, SysErrorTimeOut
                    replyPass.statusCode != StatusLoggedIn)
                    throw makeLoginError(user, replyPass);
                return;

            default:
                throw makeLoginError(user, reply);
        }
    });

    execute(cancel, StatusCommandOK, "TYPE I"); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled

    //servers like vsftpd reject OPTS before authentication
    negotiateUtf8(cancel); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled

    if (cfg_.tls) //protect data channels, too: not supported by all servers
        for (const char* cmd : {"PBSZ 0", "PROT P"})
            try
            {
                execute(cancel, StatusCommandOK, cmd); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
            }
            catch (const SysErrorFtpProtocol& e) { logExtraError(replaceCpy(_("Command %x failed."), L"%x", utfTo<std::wstring>(cmd)) + L"\n\n" + e.toString()); }
            catch (const SysErrorFtpFormat&   e) { logExtraError(replaceCpy(_("Command %x failed."), L"%x", utfTo<std::wstring>(cmd)) + L"\n\n" + e.toString()); }
}


void FtpSession::noop(const CancelSignal& cancel)
{
    execute(cancel, StatusCommandOK, "NOOP"); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
}


void FtpSession::logout(const CancelSignal& cancel)
{
    execute(cancel, StatusReady, "REIN"); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
}


void FtpSession::quit(const CancelSignal& cancel)
{
    ZFTP_ON_SCOPE_EXIT(ctrl_.reset()); //close even if QUIT can't be sent

    runCancellable(cancel, nullptr, [&] { ctrl_->sendCommand("QUIT"); }); //throw SysError, SysErrorTimeOut, SysErrorCancelled
    //don't wait for "221": server closes the connection anyway
}
