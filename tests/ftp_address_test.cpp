// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include "ftp_session.h"

using namespace zftp;
using namespace ftc;


TEST(EpsvResponse, Parse)
{
    EXPECT_EQ(parseEpsvResponse("Entering Extended Passive Mode (|||6446|)"), 6446);
    EXPECT_EQ(parseEpsvResponse("Entering Extended Passive Mode (|||1|)"), 1);
    EXPECT_EQ(parseEpsvResponse("Entering Extended Passive Mode (|||65535|)"), 65535);
}


TEST(EpsvResponse, Invalid)
{
    EXPECT_THROW(parseEpsvResponse("Entering Extended Passive Mode"), SysErrorFtpFormat);
    EXPECT_THROW(parseEpsvResponse("Entering Extended Passive Mode (|||)"), SysErrorFtpFormat);
    EXPECT_THROW(parseEpsvResponse("Entering Extended Passive Mode (||||)"), SysErrorFtpFormat);
    EXPECT_THROW(parseEpsvResponse("Entering Extended Passive Mode (|||0|)"), SysErrorFtpFormat);
    EXPECT_THROW(parseEpsvResponse("Entering Extended Passive Mode (|||65536|)"), SysErrorFtpFormat);
    EXPECT_THROW(parseEpsvResponse("Entering Extended Passive Mode (|||64a6|)"), SysErrorFtpFormat);
}


TEST(PasvResponse, Parse)
{
    const ServerAddress addr = parsePasvResponse("Entering Passive Mode (192,168,1,2,25,46)");
    EXPECT_EQ(addr.server, "192.168.1.2");
    EXPECT_EQ(addr.port, 25 * 256 + 46);

    const ServerAddress addr2 = parsePasvResponse("=(127,0,0,1,0,21).");
    EXPECT_EQ(addr2.server, "127.0.0.1");
    EXPECT_EQ(addr2.port, 21);
}


TEST(PasvResponse, Invalid)
{
    EXPECT_THROW(parsePasvResponse("Entering Passive Mode"), SysErrorFtpFormat);
    EXPECT_THROW(parsePasvResponse("Entering Passive Mode (192,168,1,2,25)"), SysErrorFtpFormat);
    EXPECT_THROW(parsePasvResponse("Entering Passive Mode (192,168,1,256,25,46)"), SysErrorFtpFormat);
    EXPECT_THROW(parsePasvResponse("Entering Passive Mode (192,168,1,-2,25,46)"), SysErrorFtpFormat);
    EXPECT_THROW(parsePasvResponse("Entering Passive Mode (192,168,,2,25,46)"), SysErrorFtpFormat);
    EXPECT_THROW(parsePasvResponse("Entering Passive Mode )192,168,1,2,25,46("), SysErrorFtpFormat);
}


TEST(ServerAddress, HostAndPort)
{
    const ServerAddress a = parseServerAddress("ftp.example.com:2121");
    EXPECT_EQ(a.server, "ftp.example.com");
    EXPECT_EQ(a.port, 2121);

    const ServerAddress b = parseServerAddress("ftp.example.com");
    EXPECT_EQ(b.server, "ftp.example.com");
    EXPECT_EQ(b.port, 21);
}


TEST(ServerAddress, Ipv6)
{
    const ServerAddress a = parseServerAddress("[::1]:2121");
    EXPECT_EQ(a.server, "::1");
    EXPECT_EQ(a.port, 2121);

    const ServerAddress b = parseServerAddress("[fe80::1]");
    EXPECT_EQ(b.server, "fe80::1");
    EXPECT_EQ(b.port, 21);

    const ServerAddress c = parseServerAddress("fe80::1"); //bare literal: no port
    EXPECT_EQ(c.server, "fe80::1");
    EXPECT_EQ(c.port, 21);
}


TEST(ServerAddress, Invalid)
{
    EXPECT_THROW(parseServerAddress(""), SysError);
    EXPECT_THROW(parseServerAddress(":21"), SysError);
    EXPECT_THROW(parseServerAddress("host:"), SysError);
    EXPECT_THROW(parseServerAddress("host:0"), SysError);
    EXPECT_THROW(parseServerAddress("host:65536"), SysError);
    EXPECT_THROW(parseServerAddress("host:port"), SysError);
    EXPECT_THROW(parseServerAddress("[::1"), SysError);
    EXPECT_THROW(parseServerAddress("[::1]2121"), SysError);
}
