// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_SESSION_H_9036174512287743168
#define FTP_SESSION_H_9036174512287743168

#include <map>
#include <vector>
#include "ftp_cancel.h"
#include "ftp_data_stream.h"
#include "ftp_error.h"
#include "ftp_line_protocol.h"
#include "ftp_listing.h"
#include "ftp_status.h"


namespace ftc
{
/*  one live control connection

    - NOT thread-safe: serialize all calls on one session
    - at most one data connection at a time: close a download stream before the next command
    - every call takes a CancelSignal: on cancellation the sockets are shut down, the call fails with
      SysErrorCancelled, and the session is unusable afterwards (all further calls fail)        */
class FtpSession
{
public:
    //connect, read greeting, discover features
    FtpSession(const std::string& address /*host[:port]*/, FtpConfig cfg, const zftp::CancelSignal& cancel); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
    ~FtpSession();

    //USER/PASS, TYPE I, UTF-8; with TLS: PBSZ 0 + PROT P (best effort)
    void login(const zftp::CancelSignal& cancel, const std::string& user, const std::string& password); //throw SysError, SysErrorLogin, SysErrorFtpProtocol, SysErrorCancelled

    //expectedStatus: StatusAny accepts every reply
    FtpReply execute(const zftp::CancelSignal& cancel, int expectedStatus, const std::string& commandLine); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled

    const std::map<std::string, std::string>& getFeatures() const { return features_; } //token => parameter (may be empty)
    bool supportsMlsd() const { return mlstSupported_; }
    bool isEpsvSkipped() const { return skipEpsv_; }
    const std::string& getServerHost() const { return host_; } //numeric address of the control connection's peer

    //----------------------------------------------------------------------------------
    //data channel
    ServerAddress getDataConnAddress(const zftp::CancelSignal& cancel); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorCancelled
    std::unique_ptr<FtpConnection> openDataConn(const zftp::CancelSignal& cancel); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled

    //requires preliminary reply 125 or 150; offset != 0: REST first
    std::unique_ptr<FtpConnection> openDataCommand(const zftp::CancelSignal& cancel, uint64_t offset, const std::string& commandLine); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled

    //----------------------------------------------------------------------------------
    //transfer
    //stream must not outlive session and cancel
    std::unique_ptr<FtpDataStream> download(const zftp::CancelSignal& cancel, const std::string& path, uint64_t offset = 0); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled

    //readBlock: returns 0 at end of input; returns the final status (226)
    int upload(const zftp::CancelSignal& cancel, const std::string& path,
               const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock /*throw X*/, uint64_t offset = 0); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled, X

    std::vector<FtpEntry>    list    (const zftp::CancelSignal& cancel, const std::string& path); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
    std::vector<std::string> nameList(const zftp::CancelSignal& cancel, const std::string& path); //

    //----------------------------------------------------------------------------------
    //directory operations: throw SysError, SysErrorFtpProtocol, SysErrorTimeOut, SysErrorCancelled
    void changeDir        (const zftp::CancelSignal& cancel, const std::string& path);
    void changeDirToParent(const zftp::CancelSignal& cancel);
    std::string currentDir(const zftp::CancelSignal& cancel); //throw SysErrorFtpFormat

    uint64_t fileSize          (const zftp::CancelSignal& cancel, const std::string& path); //throw SysErrorFtpFormat
    time_t getModificationTime(const zftp::CancelSignal& cancel, const std::string& path); //throw SysErrorFtpFormat

    void rename    (const zftp::CancelSignal& cancel, const std::string& pathFrom, const std::string& pathTo);
    void deleteFile(const zftp::CancelSignal& cancel, const std::string& path);
    void makeDir   (const zftp::CancelSignal& cancel, const std::string& path);
    void removeDir (const zftp::CancelSignal& cancel, const std::string& path);

    //depth-first; no rollback: first error aborts; returns status of the final RMD
    int removeDirRecursive(const zftp::CancelSignal& cancel, const std::string& path); //throw SysErrorFtpFormat

    void noop  (const zftp::CancelSignal& cancel);
    void logout(const zftp::CancelSignal& cancel); //REIN: back to "not logged in"
    void quit  (const zftp::CancelSignal& cancel); //QUIT + close: session is unusable afterwards

private:
    FtpSession           (const FtpSession&) = delete;
    FtpSession& operator=(const FtpSession&) = delete;

    friend class FtpResponse;

    //run fun() while watching cancel; dataConn: optional, aborted together with the control connection
    template <class Function>
    auto runCancellable(const zftp::CancelSignal& cancel, FtpConnection* dataConn, Function fun); //throw SysError, SysErrorCancelled, X

    void checkUsable() const; //throw SysError, SysErrorCancelled
    void abortConnections(FtpConnection* dataConn); //noexcept; context of any thread
    [[noreturn]] void throwCancelled(FtpConnection* dataConn); //throw SysErrorCancelled

    std::unique_ptr<FtpConnection> dial(const std::string& server, uint16_t port, const zftp::CancelSignal& cancel); //throw SysError, SysErrorTimeOut, SysErrorCancelled

    //without cancellation: caller is inside runCancellable()
    FtpReply sendCommand(int expectedStatus, const std::string& commandLine); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut
    FtpReply readReply  (int expectedStatus);                                 //

    void discoverFeatures(const zftp::CancelSignal& cancel); //throw SysError, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
    void negotiateUtf8   (const zftp::CancelSignal& cancel); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled

    //read data connection line by line
    void readDataLines(const zftp::CancelSignal& cancel, const std::string& commandLine,
                       const std::function<void(const std::string& line)>& onLine); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled

    void renewDataDeadline(FtpConnection& dataConn) const;

    //failed transfer: keep the control channel in sync by consuming the pending final reply
    void drainTransferReply(const zftp::CancelSignal& cancel); //nothrow; errors go to the extra log

    FtpConfig cfg_; //controlConnection is moved out after construction
    std::string serverName_; //as passed by caller: TLS server name for the data channel
    std::unique_ptr<FtpLineProtocol> ctrl_; //null after quit()
    std::string host_;

    std::map<std::string, std::string> features_;
    bool mlstSupported_ = false;
    bool skipEpsv_ = false; //sticky after the first EPSV failure

    std::atomic<bool> aborted_{false}; //set by cancel watcher thread
};


//"229 Entering Extended Passive Mode (|||6446|)"
uint16_t parseEpsvResponse(const std::string& message); //throw SysErrorFtpFormat

//"227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)"
ServerAddress parsePasvResponse(const std::string& message); //throw SysErrorFtpFormat








//######################## implementation ########################
template <class Function> inline
auto FtpSession::runCancellable(const zftp::CancelSignal& cancel, FtpConnection* dataConn, Function fun) //throw SysError, SysErrorCancelled, X
{
    checkUsable(); //throw SysError, SysErrorCancelled

    if (cancel.isCancelled())
        throwCancelled(dataConn); //throw SysErrorCancelled

    CancelWatch watch(cancel, [this, dataConn] { abortConnections(dataConn); });

    //a shut down socket may report EOF instead of an error => don't return incomplete results
    ZFTP_ON_SCOPE_SUCCESS(if (watch.triggered()) throw SysErrorCancelled(_("Operation cancelled.")));
    try
    {
        return fun(); //throw SysError, X
    }
    catch (const zftp::SysError&)
    {
        if (watch.triggered()) //socket errors are just the symptom
            throw SysErrorCancelled(_("Operation cancelled."));
        throw;
    }
}
}

#endif //FTP_SESSION_H_9036174512287743168
