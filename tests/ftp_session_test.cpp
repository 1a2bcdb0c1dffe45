// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <algorithm>
#include <chrono>
#include <cstring>
#include <limits>
#include <gtest/gtest.h>
#include <zftp/file_error.h>
#include <zftp/extra_log.h>
#include <zftp/time.h>
#include "ftp_session.h"
#include "ftp_mock_server.h"

using namespace zftp;
using namespace ftc;
using namespace ftc::test;


namespace
{
std::string readAll(FtpDataStream& stream) //throw SysError
{
    std::string data;
    char buffer[7]; //force short reads
    for (;;)
    {
        const size_t bytesRead = stream.tryRead(buffer, sizeof(buffer)); //throw SysError
        if (bytesRead == 0)
            return data;
        data.append(buffer, bytesRead);
    }
}


std::function<size_t(void* buffer, size_t bytesToRead)> makeBlockReader(const std::string& data)
{
    auto pos = std::make_shared<size_t>(0);
    return [data, pos](void* buffer, size_t bytesToRead)
    {
        const size_t bytesRead = std::min(bytesToRead, data.size() - *pos);
        std::memcpy(buffer, data.data() + *pos, bytesRead);
        *pos += bytesRead;
        return bytesRead;
    };
}


size_t countCommand(const std::vector<std::string>& names, const std::string& name)
{
    return std::count(names.begin(), names.end(), name);
}


class FtpSessionTest : public testing::Test
{
protected:
    static FtpConfig makeConfig()
    {
        FtpConfig cfg;
        cfg.dialer.timeoutSec = 5;
        cfg.serverResponseTimeoutSec = 10; //don't hang the test run
        return cfg;
    }

    std::unique_ptr<FtpSession> connect(FtpConfig cfg) //throw SysError
    {
        return std::make_unique<FtpSession>(server_.getAddress(), std::move(cfg), cancel_);
    }

    std::unique_ptr<FtpSession> connect() { return connect(makeConfig()); } //throw SysError

    std::unique_ptr<FtpSession> connectAndLogin() //throw SysError
    {
        std::unique_ptr<FtpSession> session = connect();
        session->login(cancel_, "anonymous", "anonymous@");
        return session;
    }

    FtpMockServer server_;
    CancelSignal cancel_;
};
}


TEST_F(FtpSessionTest, GreetingAndFeatures)
{
    std::vector<std::string> traced;
    FtpConfig cfg = makeConfig();
    cfg.wireTrace = [&](const std::string& line) { traced.push_back(line); };

    const std::unique_ptr<FtpSession> session = connect(std::move(cfg));

    EXPECT_EQ(server_.getCommands(), std::vector<std::string>{"FEAT"});
    EXPECT_TRUE(session->getFeatures().contains("UTF8"));
    EXPECT_TRUE(session->getFeatures().contains("SIZE"));
    EXPECT_TRUE(session->getFeatures().contains("EPSV"));
    EXPECT_FALSE(session->getFeatures().contains("Features:"));
    EXPECT_FALSE(session->supportsMlsd());
    EXPECT_EQ(session->getServerHost(), "127.0.0.1");

    ASSERT_FALSE(traced.empty());
    EXPECT_EQ(traced[0], "220 FtpClient mock server ready");
    EXPECT_EQ(traced.back(), "211 End");
}


TEST_F(FtpSessionTest, MlstFeature)
{
    server_.setMlsdEnabled(true);
    const std::unique_ptr<FtpSession> session = connect();

    EXPECT_TRUE(session->supportsMlsd());
    EXPECT_EQ(session->getFeatures().at("MLST"), "type*;size*;modify*;");
}


TEST_F(FtpSessionTest, LoginWithPassword)
{
    const std::unique_ptr<FtpSession> session = connect();
    session->login(cancel_, "anonymous", "secret");

    EXPECT_EQ(server_.getCommands(), (std::vector<std::string>{"FEAT", "USER anonymous", "PASS secret", "TYPE I", "OPTS UTF8 ON"}));
}


TEST_F(FtpSessionTest, LoginWithoutPassword)
{
    const std::unique_ptr<FtpSession> session = connect();
    session->login(cancel_, "direct", "unused");

    EXPECT_EQ(countCommand(server_.getCommandNames(), "PASS"), 0u);
    EXPECT_EQ(countCommand(server_.getCommandNames(), "TYPE"), 1u);
}


TEST_F(FtpSessionTest, LoginWrongPassword)
{
    const std::unique_ptr<FtpSession> session = connect();
    try
    {
        session->login(cancel_, "anonymous", "wrong");
        FAIL() << "expected SysErrorLogin";
    }
    catch (const SysErrorLogin& e)
    {
        EXPECT_EQ(e.ftpErrorCode, 530);
        EXPECT_EQ(e.serverMessage, "Login incorrect.");
    }
}


TEST_F(FtpSessionTest, LoginUnknownUser)
{
    const std::unique_ptr<FtpSession> session = connect();
    EXPECT_THROW(session->login(cancel_, "nobody", "x"), SysErrorLogin);
    EXPECT_EQ(countCommand(server_.getCommandNames(), "PASS"), 0u);
}


TEST_F(FtpSessionTest, ServerWithoutFeatures)
{
    server_.setCannedReply("FEAT", "500 Unknown command.");
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    EXPECT_TRUE(session->getFeatures().empty());
    EXPECT_FALSE(session->supportsMlsd());
    EXPECT_EQ(countCommand(server_.getCommandNames(), "OPTS"), 0u);
}


TEST_F(FtpSessionTest, Utf8OptionReplies)
{
    for (const char* optsReply :
         {
             "202 UTF8 mode is always enabled. No need to send this command.",
             "501 Option not understood.",
             "504 Not implemented for that parameter.",
         })
    {
        server_.setCannedReply("OPTS", optsReply);
        const std::unique_ptr<FtpSession> session = connectAndLogin();
        session->noop(cancel_);
    }

    server_.setCannedReply("OPTS", "550 Permission denied.");
    const std::unique_ptr<FtpSession> session = connect();
    try
    {
        session->login(cancel_, "anonymous", "anonymous@");
        FAIL() << "expected SysErrorFtpProtocol";
    }
    catch (const SysErrorFtpProtocol& e) { EXPECT_EQ(e.ftpErrorCode, 550); }
}


TEST_F(FtpSessionTest, DataChannelProtectionIsOptional)
{
    fetchExtraLog(); //start empty

    FtpConfig cfg = makeConfig();
    cfg.controlConnection = dialTcp("127.0.0.1", server_.getPort(), cfg.dialer, nullptr); //used as-is: no TLS handshake
    cfg.tls = TlsConfig();
    const std::unique_ptr<FtpSession> session = connect(std::move(cfg));

    session->login(cancel_, "anonymous", "anonymous@"); //mock server: "500 Unknown command." for PBSZ and PROT

    const std::vector<std::string> cmds = server_.getCommands();
    EXPECT_EQ(countCommand(cmds, "PBSZ 0"), 1u);
    EXPECT_EQ(countCommand(cmds, "PROT P"), 1u);
    EXPECT_EQ(fetchExtraLog().size(), 2u);

    session->noop(cancel_);
}


TEST_F(FtpSessionTest, Execute)
{
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    const FtpReply reply = session->execute(cancel_, StatusAny, "SITE CHMOD 644 x");
    EXPECT_EQ(reply.statusCode, 500);

    try
    {
        session->execute(cancel_, StatusCommandOK, "SITE CHMOD 644 x");
        FAIL() << "expected SysErrorFtpProtocol";
    }
    catch (const SysErrorFtpProtocol& e) { EXPECT_EQ(e.ftpErrorCode, 500); }

    EXPECT_THROW(session->execute(cancel_, StatusAny, "DELE a\r\nRMD /incoming"), SysError);
    session->noop(cancel_); //control channel still in sync
}


TEST_F(FtpSessionTest, DownloadWithEpsv)
{
    server_.addFile("/incoming/some-file", "this is some text");
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    const std::unique_ptr<FtpDataStream> stream = session->download(cancel_, "some-file");
    EXPECT_EQ(readAll(*stream), "this is some text");
    stream->close();

    const std::vector<std::string> names = server_.getCommandNames();
    EXPECT_EQ(countCommand(names, "EPSV"), 1u);
    EXPECT_EQ(countCommand(names, "PASV"), 0u);
    EXPECT_EQ(countCommand(names, "REST"), 0u);
}


TEST_F(FtpSessionTest, DownloadWithOffset)
{
    const std::unique_ptr<FtpSession> session = connectAndLogin();
    session->upload(cancel_, "some-file", makeBlockReader("Just some text"));

    const std::unique_ptr<FtpDataStream> stream = session->download(cancel_, "some-file", 5);
    EXPECT_EQ(readAll(*stream), "some text");
    stream->close();

    const std::vector<std::string> cmds = server_.getCommands();
    const auto itRest = std::find(cmds.begin(), cmds.end(), "REST 5");
    ASSERT_NE(itRest, cmds.end());
    ASSERT_NE(itRest + 1, cmds.end());
    EXPECT_EQ(itRest[1], "RETR some-file");
}


TEST_F(FtpSessionTest, DownloadCloseIsIdempotent)
{
    server_.addFile("/incoming/a", "abc");
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    const std::unique_ptr<FtpDataStream> stream = session->download(cancel_, "a");
    EXPECT_EQ(readAll(*stream), "abc");
    stream->close();
    stream->close();

    char buffer[10];
    EXPECT_THROW(stream->tryRead(buffer, sizeof(buffer)), SysError);

    session->noop(cancel_);
}


TEST_F(FtpSessionTest, DownloadMissingFile)
{
    const std::unique_ptr<FtpSession> session = connectAndLogin();
    try
    {
        session->download(cancel_, "no-such-file");
        FAIL() << "expected SysErrorFtpProtocol";
    }
    catch (const SysErrorFtpProtocol& e) { EXPECT_EQ(e.ftpErrorCode, 550); }

    session->noop(cancel_);
}


TEST_F(FtpSessionTest, EpsvFallbackIsSticky)
{
    server_.setEpsvEnabled(false);
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    EXPECT_FALSE(session->isEpsvSkipped());
    session->nameList(cancel_, "");
    EXPECT_TRUE(session->isEpsvSkipped());
    session->nameList(cancel_, "");

    const std::vector<std::string> names = server_.getCommandNames();
    EXPECT_EQ(countCommand(names, "EPSV"), 1u);
    EXPECT_EQ(countCommand(names, "PASV"), 2u);
}


TEST_F(FtpSessionTest, EpsvDisabledByConfig)
{
    FtpConfig cfg = makeConfig();
    cfg.disableEpsv = true;
    const std::unique_ptr<FtpSession> session = connect(std::move(cfg));
    session->login(cancel_, "anonymous", "anonymous@");

    EXPECT_EQ(session->getDataConnAddress(cancel_).server, "127.0.0.1");

    const std::vector<std::string> names = server_.getCommandNames();
    EXPECT_EQ(countCommand(names, "EPSV"), 0u);
    EXPECT_EQ(countCommand(names, "PASV"), 1u);
}


TEST_F(FtpSessionTest, Upload)
{
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    const std::string content(200 * 1024 + 17, 'x'); //more than one block
    EXPECT_EQ(session->upload(cancel_, "new-file", makeBlockReader(content)), 226);

    EXPECT_EQ(server_.getFile("/incoming/new-file"), content);
    EXPECT_EQ(session->fileSize(cancel_, "new-file"), content.size());
}


TEST_F(FtpSessionTest, UploadEmptyFile)
{
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    EXPECT_EQ(session->upload(cancel_, "empty", makeBlockReader("")), 226);
    EXPECT_EQ(server_.getFile("/incoming/empty"), "");
}


TEST_F(FtpSessionTest, UploadWithOffset)
{
    server_.addFile("/incoming/log.txt", "Hello");
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    session->upload(cancel_, "log.txt", makeBlockReader(" world"), 5);

    EXPECT_EQ(server_.getFile("/incoming/log.txt"), "Hello world");
    EXPECT_EQ(countCommand(server_.getCommands(), "REST 5"), 1u);
}


TEST_F(FtpSessionTest, UploadSourceFails)
{
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    bool firstBlock = true;
    auto readBlock = [&](void* buffer, size_t bytesToRead) -> size_t
    {
        if (!std::exchange(firstBlock, false))
            throw FileError(L"Cannot read file.");
        std::memset(buffer, 'a', bytesToRead);
        return bytesToRead;
    };
    EXPECT_THROW(session->upload(cancel_, "partial", readBlock), FileError);

    session->noop(cancel_); //final reply of the aborted transfer was consumed
    EXPECT_EQ(session->fileSize(cancel_, "partial"), 64u * 1024);
}


TEST_F(FtpSessionTest, ListUnixFormat)
{
    server_.addFile("/incoming/lo", "");
    server_.addFile("/incoming/data.bin", "12345");
    server_.addFolder("/incoming/sub");
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    const std::vector<FtpEntry> entries = session->list(cancel_, ""); //"total 3" is skipped
    ASSERT_EQ(entries.size(), 3u);

    EXPECT_EQ(entries[0].name, "data.bin");
    EXPECT_EQ(entries[0].type, EntryType::file);
    EXPECT_EQ(entries[0].size, 5u);

    EXPECT_EQ(entries[1].name, "lo");

    EXPECT_EQ(entries[2].name, "sub");
    EXPECT_EQ(entries[2].type, EntryType::folder);

    EXPECT_EQ(countCommand(server_.getCommands(), "LIST"), 1u); //no path argument
}


TEST_F(FtpSessionTest, ListMlsd)
{
    server_.setMlsdEnabled(true);
    server_.addFile("/incoming/readme.txt", "1234");
    server_.addFolder("/incoming/sub");
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    const std::vector<FtpEntry> entries = session->list(cancel_, "/incoming");
    ASSERT_EQ(entries.size(), 3u);

    EXPECT_EQ(entries[0].name, ".");
    EXPECT_EQ(entries[1].name, "readme.txt");
    EXPECT_EQ(entries[1].size, 4u);
    EXPECT_EQ(entries[1].modTime, utcToTimeT(parseTime("%Y%m%d%H%M%S", "20160129102900")).first);
    EXPECT_EQ(entries[2].name, "sub");
    EXPECT_EQ(entries[2].type, EntryType::folder);

    EXPECT_EQ(countCommand(server_.getCommands(), "MLSD /incoming"), 1u);
    EXPECT_EQ(countCommand(server_.getCommandNames(), "LIST"), 0u);
}


TEST_F(FtpSessionTest, NameList)
{
    server_.addFile("/incoming/b", "");
    server_.addFile("/incoming/a", "");
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    EXPECT_EQ(session->nameList(cancel_, ""), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(session->nameList(cancel_, "/"), std::vector<std::string>{"incoming"});
    EXPECT_THROW(session->nameList(cancel_, "/missing-dir"), SysErrorFtpProtocol);
}


TEST_F(FtpSessionTest, RenameThenRetrieve)
{
    server_.addFile("/incoming/old", "payload");
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    session->rename(cancel_, "old", "new");
    EXPECT_FALSE(server_.getFile("/incoming/old"));

    const std::unique_ptr<FtpDataStream> stream = session->download(cancel_, "new");
    EXPECT_EQ(readAll(*stream), "payload");
    stream->close();

    EXPECT_THROW(session->rename(cancel_, "old", "newer"), SysErrorFtpProtocol);
}


TEST_F(FtpSessionTest, FileSize)
{
    server_.addFile("/incoming/magic-file", std::string(42, 'm'));
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    EXPECT_EQ(session->fileSize(cancel_, "magic-file"), 42u);
    try
    {
        session->fileSize(cancel_, "not-found");
        FAIL() << "expected SysErrorFtpProtocol";
    }
    catch (const SysErrorFtpProtocol& e) { EXPECT_EQ(e.ftpErrorCode, 550); }
}


TEST_F(FtpSessionTest, FileSizeOutOfRange)
{
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    server_.setCannedReply("SIZE", "213 18446744073709551615");
    EXPECT_EQ(session->fileSize(cancel_, "huge"), std::numeric_limits<uint64_t>::max());

    server_.setCannedReply("SIZE", "213 18446744073709551616");
    EXPECT_THROW(session->fileSize(cancel_, "huge"), SysErrorFtpFormat);

    server_.setCannedReply("SIZE", "213 100000000000000000000");
    EXPECT_THROW(session->fileSize(cancel_, "huge"), SysErrorFtpFormat);
}


TEST_F(FtpSessionTest, ModificationTime)
{
    server_.addFile("/incoming/a", "");
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    TimeComp tc;
    tc.year   = 2016;
    tc.month  = 1;
    tc.day    = 29;
    tc.hour   = 10;
    tc.minute = 29;
    EXPECT_EQ(session->getModificationTime(cancel_, "a"), utcToTimeT(tc).first);
    EXPECT_THROW(session->getModificationTime(cancel_, "b"), SysErrorFtpProtocol);
}


TEST_F(FtpSessionTest, DirectoryOperations)
{
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    EXPECT_EQ(session->currentDir(cancel_), "/incoming");

    session->makeDir(cancel_, "new-dir");
    EXPECT_TRUE(server_.folderExists("/incoming/new-dir"));
    EXPECT_THROW(session->makeDir(cancel_, "new-dir"), SysErrorFtpProtocol);

    session->changeDir(cancel_, "new-dir");
    EXPECT_EQ(session->currentDir(cancel_), "/incoming/new-dir");

    session->changeDirToParent(cancel_);
    EXPECT_EQ(session->currentDir(cancel_), "/incoming");

    session->removeDir(cancel_, "new-dir");
    EXPECT_FALSE(server_.folderExists("/incoming/new-dir"));

    EXPECT_THROW(session->changeDir(cancel_, "missing-dir"), SysErrorFtpProtocol);
    EXPECT_THROW(session->removeDir(cancel_, "missing-dir"), SysErrorFtpProtocol);
}


TEST_F(FtpSessionTest, QuotedCurrentDir)
{
    server_.addFolder("/incoming/say \"hi\"");
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    session->changeDir(cancel_, "say \"hi\"");
    EXPECT_EQ(session->currentDir(cancel_), "/incoming/say \"hi\"");
}


TEST_F(FtpSessionTest, DeleteFile)
{
    server_.addFile("/incoming/a", "");
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    session->deleteFile(cancel_, "a");
    EXPECT_FALSE(server_.getFile("/incoming/a"));
    EXPECT_THROW(session->deleteFile(cancel_, "a"), SysErrorFtpProtocol);
}


TEST_F(FtpSessionTest, RemoveDirRecursive)
{
    server_.addFolder("/incoming/tree");
    server_.addFile  ("/incoming/tree/lo", "x");
    server_.addFolder("/incoming/tree/sub");
    server_.addFile  ("/incoming/tree/sub/deep", "y");
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    EXPECT_EQ(session->removeDirRecursive(cancel_, "tree"), 250);

    EXPECT_FALSE(server_.folderExists("/incoming/tree"));
    EXPECT_FALSE(server_.getFile("/incoming/tree/lo"));

    std::vector<std::string> cmds = server_.getCommands();
    cmds.erase(std::remove_if(cmds.begin(), cmds.end(), [](const std::string& cmd) { return cmd == "EPSV"; }), cmds.end());
    cmds.erase(cmds.begin(), std::find(cmds.begin(), cmds.end(), "CWD tree"));

    EXPECT_EQ(cmds, (std::vector<std::string>
    {
        "CWD tree",
        "PWD",
        "LIST /incoming/tree",
        "DELE lo",
        "CWD /incoming/tree/sub",
        "PWD",
        "LIST /incoming/tree/sub",
        "DELE deep",
        "CDUP",
        "RMD /incoming/tree/sub",
        "CDUP",
        "RMD /incoming/tree",
    }));
    EXPECT_EQ(session->currentDir(cancel_), "/incoming");
}


TEST_F(FtpSessionTest, RemoveDirRecursiveMissing)
{
    const std::unique_ptr<FtpSession> session = connectAndLogin();
    try
    {
        session->removeDirRecursive(cancel_, "missing-dir");
        FAIL() << "expected SysErrorFtpProtocol";
    }
    catch (const SysErrorFtpProtocol& e) { EXPECT_EQ(e.ftpErrorCode, 550); }
}


TEST_F(FtpSessionTest, NoopAndLogout)
{
    const std::unique_ptr<FtpSession> session = connectAndLogin();
    session->noop(cancel_);
    session->logout(cancel_);
    session->login(cancel_, "direct", "");

    EXPECT_EQ(countCommand(server_.getCommandNames(), "REIN"), 1u);
}


TEST_F(FtpSessionTest, CallAfterQuit)
{
    const std::unique_ptr<FtpSession> session = connectAndLogin();
    session->quit(cancel_);

    try
    {
        session->noop(cancel_);
        FAIL() << "expected SysError";
    }
    catch (const SysErrorCancelled&) { FAIL() << "session was not cancelled"; }
    catch (const SysError&) {}
}


TEST_F(FtpSessionTest, DataStallTimeout)
{
    server_.addFile("/incoming/a", "never sent");
    server_.setStallDownloads(true);

    FtpConfig cfg = makeConfig();
    cfg.dataTimeoutSec = 1;
    const std::unique_ptr<FtpSession> session = connect(std::move(cfg));
    session->login(cancel_, "anonymous", "anonymous@");

    const std::unique_ptr<FtpDataStream> stream = session->download(cancel_, "a");

    char buffer[10];
    EXPECT_THROW(stream->tryRead(buffer, sizeof(buffer)), SysErrorTimeOut);

    try
    {
        stream->close();
        FAIL() << "expected SysErrorFtpProtocol";
    }
    catch (const SysErrorFtpProtocol& e) { EXPECT_EQ(e.ftpErrorCode, 426); }

    session->noop(cancel_);
}


TEST_F(FtpSessionTest, SlowListingWithinStallTimeout)
{
    for (const char* name : {"a", "b", "c", "d", "e", "f"})
        server_.addFile(std::string("/incoming/") + name, "");
    server_.setTrickleInterval(std::chrono::milliseconds(400));

    FtpConfig cfg = makeConfig();
    cfg.dataTimeoutSec = 1;
    const std::unique_ptr<FtpSession> session = connect(std::move(cfg));
    session->login(cancel_, "anonymous", "anonymous@");

    const auto startTime = std::chrono::steady_clock::now();
    const std::vector<FtpEntry> entries = session->list(cancel_, ""); //7 lines including "total 6"

    EXPECT_GE(std::chrono::steady_clock::now() - startTime, std::chrono::seconds(2));
    ASSERT_EQ(entries.size(), 6u);
    EXPECT_EQ(entries[5].name, "f");
}


TEST_F(FtpSessionTest, SlowDownloadWithinStallTimeout)
{
    const std::string content = "0123456789abcdefghijklmn"; //6 chunks
    server_.addFile("/incoming/a", content);
    server_.setTrickleInterval(std::chrono::milliseconds(400));

    FtpConfig cfg = makeConfig();
    cfg.dataTimeoutSec = 1;
    const std::unique_ptr<FtpSession> session = connect(std::move(cfg));
    session->login(cancel_, "anonymous", "anonymous@");

    const auto startTime = std::chrono::steady_clock::now();
    const std::unique_ptr<FtpDataStream> stream = session->download(cancel_, "a");
    EXPECT_EQ(readAll(*stream), content);
    stream->close();

    EXPECT_GE(std::chrono::steady_clock::now() - startTime, std::chrono::seconds(2));
}


TEST_F(FtpSessionTest, ListingStallTimeout)
{
    server_.addFile("/incoming/a", "");
    server_.addFile("/incoming/b", "");
    server_.setStallListings(true);

    FtpConfig cfg = makeConfig();
    cfg.dataTimeoutSec = 1;
    const std::unique_ptr<FtpSession> session = connect(std::move(cfg));
    session->login(cancel_, "anonymous", "anonymous@");

    EXPECT_THROW(session->list(cancel_, ""), SysErrorTimeOut);

    session->noop(cancel_); //426 of the aborted listing was consumed
}


TEST_F(FtpSessionTest, ServerResponseTimeout)
{
    server_.setSilentCommand("NOOP");

    FtpConfig cfg = makeConfig();
    cfg.serverResponseTimeoutSec = 1;
    const std::unique_ptr<FtpSession> session = connect(std::move(cfg));

    EXPECT_THROW(session->noop(cancel_), SysErrorTimeOut);
}


TEST_F(FtpSessionTest, CancelBlockedDownload)
{
    server_.addFile("/incoming/a", "never sent");
    server_.setStallDownloads(true);
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    const std::unique_ptr<FtpDataStream> stream = session->download(cancel_, "a");
    {
        InterruptibleThread canceller([this]
        {
            interruptibleSleep(std::chrono::milliseconds(200)); //throw ThreadStopRequest
            cancel_.cancel();
        });

        EXPECT_THROW(readAll(*stream), SysErrorCancelled);
    }

    CancelSignal otherCancel;
    EXPECT_THROW(session->noop(otherCancel), SysErrorCancelled); //session is unusable
    EXPECT_THROW(stream->close(), SysErrorCancelled);
}


TEST_F(FtpSessionTest, CancelBeforeCall)
{
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    cancel_.cancel();
    EXPECT_THROW(session->noop(cancel_), SysErrorCancelled);

    CancelSignal otherCancel;
    EXPECT_THROW(session->noop(otherCancel), SysErrorCancelled);
}


TEST_F(FtpSessionTest, CancelWaitingCommand)
{
    server_.setSilentCommand("NOOP");
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    const auto startTime = std::chrono::steady_clock::now();
    {
        InterruptibleThread canceller([this]
        {
            interruptibleSleep(std::chrono::milliseconds(200)); //throw ThreadStopRequest
            cancel_.cancel();
        });

        EXPECT_THROW(session->noop(cancel_), SysErrorCancelled);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - startTime, std::chrono::seconds(1)); //not the 10s response timeout

    CancelSignal otherCancel;
    EXPECT_THROW(session->currentDir(otherCancel), SysErrorCancelled);
}


TEST_F(FtpSessionTest, CancelSlowListing)
{
    for (const char* name : {"a", "b", "c", "d", "e", "f", "g", "h", "i", "j"})
        server_.addFile(std::string("/incoming/") + name, "");
    server_.setTrickleInterval(std::chrono::milliseconds(300));
    const std::unique_ptr<FtpSession> session = connectAndLogin();

    {
        InterruptibleThread canceller([this]
        {
            interruptibleSleep(std::chrono::milliseconds(500)); //throw ThreadStopRequest
            cancel_.cancel();
        });

        EXPECT_THROW(session->list(cancel_, ""), SysErrorCancelled); //partial listing is discarded
    }

    CancelSignal otherCancel;
    EXPECT_THROW(session->noop(otherCancel), SysErrorCancelled);
}


TEST_F(FtpSessionTest, CustomConnections)
{
    int dialCount = 0;

    FtpConfig cfg = makeConfig();
    cfg.controlConnection = dialTcp("127.0.0.1", server_.getPort(), cfg.dialer, nullptr);
    cfg.connectFun = [&](const std::string& server, uint16_t port, const CancelSignal& /*cancel*/)
    {
        ++dialCount;
        return dialTcp(server, port, DialerCfg(), nullptr);
    };
    const std::unique_ptr<FtpSession> session = connect(std::move(cfg));
    session->login(cancel_, "anonymous", "anonymous@");

    session->nameList(cancel_, "");
    EXPECT_EQ(dialCount, 1); //data connection only
}
