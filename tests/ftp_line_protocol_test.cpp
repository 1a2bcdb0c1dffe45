// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <algorithm>
#include <cstring>
#include <gtest/gtest.h>
#include "ftp_error.h"
#include "ftp_line_protocol.h"

using namespace zftp;
using namespace ftc;


namespace
{
//in-memory connection: serves "input" in small chunks, records everything written
class FakeConnection : public FtpConnection
{
public:
    FakeConnection(const std::string& input, std::string& output, size_t chunkSize = 3) :
        input_(input), output_(output), chunkSize_(chunkSize) {}

    size_t tryRead(void* buffer, size_t bytesToRead) override
    {
        const size_t bytesRead = std::min({bytesToRead, chunkSize_, input_.size() - pos_});
        std::memcpy(buffer, input_.data() + pos_, bytesRead);
        pos_ += bytesRead;
        return bytesRead;
    }

    size_t tryWrite(const void* buffer, size_t bytesToWrite) override
    {
        const size_t bytesWritten = std::min(bytesToWrite, chunkSize_);
        output_.append(static_cast<const char*>(buffer), bytesWritten);
        return bytesWritten;
    }

    void setDeadline(const SocketDeadline& deadline) override { deadline_ = deadline; }
    void closeSend() override {}
    void abort() override {}
    std::string getPeerAddress() const override { return ""; }

    SocketDeadline deadline_;

private:
    const std::string input_;
    size_t pos_ = 0;
    std::string& output_;
    const size_t chunkSize_;
};


FtpLineProtocol makeProtocol(const std::string& input, std::string& output, const WireTraceFun& wireTrace = nullptr, int responseTimeoutSec = 0)
{
    return FtpLineProtocol(std::make_unique<FakeConnection>(input, output), wireTrace, responseTimeoutSec);
}
}


TEST(LineReader, CrLfAndLf)
{
    std::string output;
    FakeConnection conn("first\r\nsecond\nthird", output);
    LineReader reader(conn);

    EXPECT_EQ(reader.readLine(), "first");
    EXPECT_EQ(reader.readLine(), "second");
    EXPECT_EQ(reader.readLine(), "third"); //no trailing line break
    EXPECT_EQ(reader.readLine(), std::nullopt);
}


TEST(LineReader, EmptyLines)
{
    std::string output;
    FakeConnection conn("\r\n\r\nx\r\n", output);
    LineReader reader(conn);

    EXPECT_EQ(reader.readLine(), "");
    EXPECT_EQ(reader.readLine(), "");
    EXPECT_EQ(reader.readLine(), "x");
    EXPECT_EQ(reader.readLine(), std::nullopt);
}


TEST(LineReader, LineTooLong)
{
    std::string output;
    FakeConnection conn(std::string(70 * 1024, 'a') + "\r\n", output, 4096);
    LineReader reader(conn);

    EXPECT_THROW(reader.readLine(), SysErrorFtpFormat);
}


TEST(CodeLine, Parse)
{
    const std::optional<CodeLine> single = parseCodeLine("220 Service ready");
    ASSERT_TRUE(single);
    EXPECT_EQ(single->statusCode, 220);
    EXPECT_FALSE(single->continued);
    EXPECT_EQ(single->text, "Service ready");

    const std::optional<CodeLine> multi = parseCodeLine("211-Features:");
    ASSERT_TRUE(multi);
    EXPECT_EQ(multi->statusCode, 211);
    EXPECT_TRUE(multi->continued);

    EXPECT_TRUE(parseCodeLine("200 "));
    EXPECT_FALSE(parseCodeLine("200"));
    EXPECT_FALSE(parseCodeLine(" MLST type*;"));
    EXPECT_FALSE(parseCodeLine("2x0 nope"));
    EXPECT_FALSE(parseCodeLine("200_nope"));
    EXPECT_FALSE(parseCodeLine("099 too small"));
}


TEST(FtpLineProtocol, SingleLineReply)
{
    std::string output;
    FtpLineProtocol proto = makeProtocol("220 Service ready\r\n", output);

    const FtpReply reply = proto.readReply();
    EXPECT_EQ(reply.statusCode, 220);
    EXPECT_EQ(reply.message, "Service ready");
}


TEST(FtpLineProtocol, MultiLineReply)
{
    std::string output;
    FtpLineProtocol proto = makeProtocol("211-Features:\r\n"
                                         " MDTM\r\n"
                                         " MLST type*;size*;modify*;\r\n"
                                         "211-more\r\n"
                                         "211 End\r\n"
                                         "200 next\r\n", output);

    const FtpReply reply = proto.readReply();
    EXPECT_EQ(reply.statusCode, 211);
    EXPECT_EQ(reply.message, "Features:\n MDTM\n MLST type*;size*;modify*;\nmore\nEnd");

    EXPECT_EQ(proto.readReply().statusCode, 200); //nothing of the next reply was consumed
}


TEST(FtpLineProtocol, MultiLineReplyWithForeignCode)
{
    std::string output;
    FtpLineProtocol proto = makeProtocol("230-Welcome\r\n"
                                         "123 not the end\r\n"
                                         "230 Logged in\r\n", output);

    const FtpReply reply = proto.readReply();
    EXPECT_EQ(reply.statusCode, 230);
    EXPECT_EQ(reply.message, "Welcome\n123 not the end\nLogged in");
}


TEST(FtpLineProtocol, InvalidReply)
{
    std::string output;
    FtpLineProtocol proto = makeProtocol("hello world\r\n", output);
    EXPECT_THROW(proto.readReply(), SysErrorFtpFormat);
}


TEST(FtpLineProtocol, ConnectionClosed)
{
    std::string output;
    FtpLineProtocol proto = makeProtocol("211-Features:\r\n FEAT\r\n", output);
    try
    {
        proto.readReply();
        FAIL() << "expected SysError";
    }
    catch (const SysErrorFtpFormat&) { FAIL() << "unexpected SysErrorFtpFormat"; }
    catch (const SysError&) {}
}


TEST(FtpLineProtocol, SendCommand)
{
    std::string output;
    FtpLineProtocol proto = makeProtocol("", output);

    proto.sendCommand("USER anonymous");
    proto.sendCommand("NOOP");
    EXPECT_EQ(output, "USER anonymous\r\nNOOP\r\n");
}


TEST(FtpLineProtocol, RejectLineBreakInCommand)
{
    std::string output;
    FtpLineProtocol proto = makeProtocol("", output);

    EXPECT_THROW(proto.sendCommand("DELE a\r\nRMD /"), SysError);
    EXPECT_THROW(proto.sendCommand("DELE a\nb"), SysError);
    EXPECT_EQ(output, "");
}


TEST(FtpLineProtocol, WireTrace)
{
    std::string output;
    std::vector<std::string> traced;
    FtpLineProtocol proto = makeProtocol("220-hello\r\n220 ready\r\n", output, [&](const std::string& line) { traced.push_back(line); });

    proto.readReply();
    EXPECT_EQ(traced, (std::vector<std::string>{"220-hello", "220 ready"}));
}


TEST(FtpLineProtocol, ResponseDeadline)
{
    std::string output;
    FtpLineProtocol withTimeout = makeProtocol("200 ok\r\n", output, nullptr, 5);
    withTimeout.readReply();
    EXPECT_TRUE(static_cast<FakeConnection&>(withTimeout.connection()).deadline_);

    FtpLineProtocol noTimeout = makeProtocol("200 ok\r\n", output);
    noTimeout.readReply();
    EXPECT_FALSE(static_cast<FakeConnection&>(noTimeout.connection()).deadline_);
}
