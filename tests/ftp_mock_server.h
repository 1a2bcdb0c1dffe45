// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_MOCK_SERVER_H_1850273946601837245
#define FTP_MOCK_SERVER_H_1850273946601837245

#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <vector>
#include <zftp/socket.h>
#include <zftp/thread.h>


namespace ftc::test
{
/*  single-threaded FTP server on 127.0.0.1 for tests: one control connection at a time
    - in-memory file system, working directory starts at "/incoming"
    - passive mode only: EPSV (optional) and PASV
    - USER anonymous => 331, USER direct => 230, anything else => 530; PASS wrong => 530          */
class FtpMockServer
{
public:
    FtpMockServer(); //throw SysError
    ~FtpMockServer();

    uint16_t getPort() const { return port_; }
    std::string getAddress() const; //"127.0.0.1:port"

    void setEpsvEnabled   (bool enabled); //default: true
    void setMlsdEnabled   (bool enabled); //default: false => LIST
    void setStallDownloads(bool stall);   //RETR: send nothing until the client closes the data connection
    void setSilentCommand (const std::string& command); //never reply to this command, e.g. "NOOP"
    void setCannedReply   (const std::string& command, const std::string& reply); //e.g. "OPTS", "501 Option not understood."
    void setTrickleInterval(std::chrono::milliseconds interval); //pause before each listing line and each 4-byte chunk of RETR
    void setStallListings (bool stall); //LIST/MLSD/NLST: send the first line only, then wait until the client closes the data connection

    void addFolder(const std::string& path);
    void addFile  (const std::string& path, const std::string& content);
    std::optional<std::string> getFile(const std::string& path) const;
    bool folderExists(const std::string& path) const;

    std::vector<std::string> getCommands() const; //as received, in order
    std::vector<std::string> getCommandNames() const; //first word only

private:
    FtpMockServer           (const FtpMockServer&) = delete;
    FtpMockServer& operator=(const FtpMockServer&) = delete;

    void serveClient(zftp::SocketType ctrl); //throw SysError, ThreadStopRequest

    std::string resolvePath(const std::string& cwd, const std::string& path) const;
    std::vector<std::string> getChildren(const std::string& folderPath) const; //names, sorted; caller holds lock_

    uint16_t port_ = 0; //declare before listener_
    std::unique_ptr<zftp::Socket> listener_;

    mutable std::mutex lock_;
    bool epsvEnabled_ = true;
    bool mlsdEnabled_ = false;
    bool stallDownloads_ = false;
    std::string silentCommand_;
    std::map<std::string, std::string> cannedReplies_;
    std::chrono::milliseconds trickleInterval_{0};
    bool stallListings_ = false;
    std::set<std::string> folders_{"/", "/incoming"};
    std::map<std::string, std::string> files_;
    std::vector<std::string> commands_;

    zftp::InterruptibleThread worker_; //declare last: stopped before the members above go away
};
}

#endif //FTP_MOCK_SERVER_H_1850273946601837245
