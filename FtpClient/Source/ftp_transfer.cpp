// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_session.h"
#include <ctime>
#include <zftp/extra_log.h>

using namespace zftp;
using namespace ftc;


namespace
{
const size_t UPLOAD_BLOCK_SIZE = 64 * 1024;


std::string makeCommandLine(const std::string& command, const std::string& path)
{
    return path.empty() ? command : command + ' ' + path; //empty: current directory
}
}


namespace ftc
{
//RETR in progress: holds the data connection, keeps watching the CancelSignal until closed
class FtpResponse : public FtpDataStream
{
public:
    FtpResponse(FtpSession& session, std::unique_ptr<FtpConnection>&& dataConn, const CancelSignal& cancel) :
        session_(session),
        cancel_(cancel),
        dataConn_(std::move(dataConn)),
        watch_(std::make_unique<CancelWatch>(cancel, [&session, conn = dataConn_.get()] { session.abortConnections(conn); })) {}

    ~FtpResponse()
    {
        if (!closed_)
            try
            {
                close(); //throw SysError, SysErrorFtpProtocol, SysErrorCancelled
            }
            catch (const SysError& e) { logExtraError(_("Cannot close the download stream.") + L"\n\n" + e.toString()); }
    }

    size_t tryRead(void* buffer, size_t bytesToRead) override //throw SysError, SysErrorTimeOut, SysErrorCancelled
    {
        if (closed_)
            throw SysError(_("The download stream is already closed."));

        if (!customDeadline_)
            session_.renewDataDeadline(*dataConn_);
        try
        {
            const size_t bytesRead = dataConn_->tryRead(buffer, bytesToRead); //throw SysError, SysErrorTimeOut

            if (watch_->triggered()) //shut down socket reports EOF
                throw SysErrorCancelled(_("Operation cancelled."));
            return bytesRead;
        }
        catch (const SysError&)
        {
            if (watch_->triggered())
                throw SysErrorCancelled(_("Operation cancelled."));
            throw;
        }
    }

    void close() override //throw SysError, SysErrorFtpProtocol, SysErrorCancelled
    {
        if (closed_)
            return;
        closed_ = true;

        watch_.reset(); //stop watching *before* dataConn_ goes away
        dataConn_.reset();

        session_.runCancellable(cancel_, nullptr, [&] { session_.readReply(StatusClosingDataConnection); }); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
    }

    void setDeadline(const SocketDeadline& deadline) override
    {
        customDeadline_ = true;
        if (dataConn_)
            dataConn_->setDeadline(deadline);
    }

private:
    FtpSession& session_;
    const CancelSignal& cancel_;
    std::unique_ptr<FtpConnection> dataConn_;
    std::unique_ptr<CancelWatch> watch_; //must not outlive dataConn_
    bool customDeadline_ = false;
    bool closed_ = false;
};
}


void FtpSession::renewDataDeadline(FtpConnection& dataConn) const
{
    if (cfg_.dataTimeoutSec > 0)
        dataConn.setDeadline(std::chrono::steady_clock::now() + std::chrono::seconds(cfg_.dataTimeoutSec));
}


void FtpSession::drainTransferReply(const CancelSignal& cancel) //nothrow
{
    if (aborted_ || !ctrl_)
        return;
    try
    {
        runCancellable(cancel, nullptr, [&] { readReply(StatusAny); }); //throw SysError, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
    }
    catch (const SysError& e) { logExtraError(_("Cannot read the final reply of an aborted transfer.") + L"\n\n" + e.toString()); }
}


std::unique_ptr<FtpConnection> FtpSession::openDataCommand(const CancelSignal& cancel, uint64_t offset, const std::string& commandLine) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
{
    std::unique_ptr<FtpConnection> dataConn = openDataConn(cancel); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled

    runCancellable(cancel, dataConn.get(), [&]
    {
        if (offset != 0)
            sendCommand(StatusRequestFilePending, "REST " + numberTo<std::string>(offset)); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut

        const FtpReply reply = sendCommand(StatusAny, commandLine); //throw SysError, SysErrorFtpFormat, SysErrorTimeOut
        if (reply.statusCode != StatusAlreadyOpen &&
            reply.statusCode != StatusAboutToSend)
            throw makeFtpProtocolError(reply.statusCode, reply.message);
    });
    return dataConn; //on error: data connection is closed by unique_ptr
}


std::unique_ptr<FtpDataStream> FtpSession::download(const CancelSignal& cancel, const std::string& path, uint64_t offset) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
{
    std::unique_ptr<FtpConnection> dataConn = openDataCommand(cancel, offset, "RETR " + path); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled

    return std::make_unique<FtpResponse>(*this, std::move(dataConn), cancel);
}


int FtpSession::upload(const CancelSignal& cancel, const std::string& path,
                       const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock /*throw X*/, uint64_t offset) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled, X
{
    std::unique_ptr<FtpConnection> dataConn = openDataCommand(cancel, offset, "STOR " + path); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
    {
        ZFTP_ON_SCOPE_FAIL(dataConn.reset(); drainTransferReply(cancel));

        runCancellable(cancel, dataConn.get(), [&]
        {
            std::vector<std::byte> buffer(UPLOAD_BLOCK_SIZE);
            for (;;)
            {
                const size_t bytesRead = readBlock(buffer.data(), buffer.size()); //throw X
                if (bytesRead == 0) //end of input
                    break;

                renewDataDeadline(*dataConn);
                writeAll(*dataConn, buffer.data(), bytesRead); //throw SysError, SysErrorTimeOut
            }
            dataConn->closeSend(); //throw SysError
        });
    }
    dataConn.reset(); //server waits for the data connection to close before sending 226

    return runCancellable(cancel, nullptr, [&] { return readReply(StatusClosingDataConnection); }).statusCode; //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
}


void FtpSession::readDataLines(const CancelSignal& cancel, const std::string& commandLine,
                               const std::function<void(const std::string& line)>& onLine) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
{
    std::unique_ptr<FtpConnection> dataConn = openDataCommand(cancel, 0, commandLine); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
    {
        ZFTP_ON_SCOPE_FAIL(dataConn.reset(); drainTransferReply(cancel));

        runCancellable(cancel, dataConn.get(), [&]
        {
            LineReader reader(*dataConn);
            for (;;)
            {
                renewDataDeadline(*dataConn); //stall timeout, not a limit for the whole listing

                const std::optional<std::string> line = reader.readLine(); //throw SysError, SysErrorFtpFormat, SysErrorTimeOut
                if (!line)
                    break;

                if (cancel.isCancelled())
                    throwCancelled(dataConn.get()); //throw SysErrorCancelled

                onLine(*line);
            }
        });
    }
    dataConn.reset();

    runCancellable(cancel, nullptr, [&] { readReply(StatusClosingDataConnection); }); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
}


std::vector<FtpEntry> FtpSession::list(const CancelSignal& cancel, const std::string& path) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
{
    const time_t now = std::time(nullptr);
    const auto parseLine = mlstSupported_ ? &parseMlsdLine : &parseListLine;

    std::vector<FtpEntry> entries;
    readDataLines(cancel, makeCommandLine(mlstSupported_ ? "MLSD" : "LIST", path), [&](const std::string& line)
    {
        try
        {
            entries.push_back(parseLine(line, now, cfg_.serverUtcOffset)); //throw SysError
        }
        catch (const SysError&) {} //skip unparsable lines, e.g. "total 42"
    });
    return entries;
}


std::vector<std::string> FtpSession::nameList(const CancelSignal& cancel, const std::string& path) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
{
    std::vector<std::string> names;
    readDataLines(cancel, makeCommandLine("NLST", path), [&](const std::string& line) { names.push_back(line); });
    return names;
}
