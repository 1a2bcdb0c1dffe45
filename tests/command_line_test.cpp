// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include "command_line.h"

using namespace zftp;
using namespace ftc;


TEST(CommandLine, Minimal)
{
    const CommandLine cl = parseCommandLine({"ftp://host/", "LS"});
    EXPECT_FALSE(cl.showHelp);
    EXPECT_EQ(cl.url, "ftp://host/");
    EXPECT_EQ(cl.command, "ls");
    EXPECT_TRUE(cl.commandArgs.empty());
    EXPECT_FALSE(cl.forceTls);
    EXPECT_EQ(cl.timeoutSec, 10);
    EXPECT_EQ(cl.dataTimeoutSec, 0);
}


TEST(CommandLine, Options)
{
    const CommandLine cl = parseCommandLine({"-TLS", "-cacert", "/etc/ca.pem", "-timeout", "30", "-data-timeout", "5",
                                             "-no-epsv", "-utc-offset", "-90", "-trace",
                                             "ftp://host/", "get", "remote.txt", "local.txt", "100"
                                            });
    EXPECT_TRUE(cl.forceTls);
    EXPECT_EQ(cl.caCertFilePath, "/etc/ca.pem");
    EXPECT_EQ(cl.timeoutSec, 30);
    EXPECT_EQ(cl.dataTimeoutSec, 5);
    EXPECT_TRUE(cl.disableEpsv);
    EXPECT_EQ(cl.utcOffsetMin, -90);
    EXPECT_TRUE(cl.wireTrace);
    EXPECT_EQ(cl.command, "get");
    EXPECT_EQ(cl.commandArgs, (std::vector<std::string>{"remote.txt", "local.txt", "100"}));
}


TEST(CommandLine, ArgumentsAfterCommandAreNotOptions)
{
    const CommandLine cl = parseCommandLine({"ftp://host/", "rm", "-tls"});
    EXPECT_FALSE(cl.forceTls);
    EXPECT_EQ(cl.commandArgs, std::vector<std::string>{"-tls"});
}


TEST(CommandLine, Help)
{
    EXPECT_TRUE(parseCommandLine({"-h"}).showHelp);
    EXPECT_TRUE(parseCommandLine({"--help"}).showHelp);
    EXPECT_TRUE(parseCommandLine({"/?"}).showHelp);
    EXPECT_TRUE(parseCommandLine({"-tls", "-help", "this is ignored"}).showHelp);
    EXPECT_FALSE(getSyntaxHelp().empty());
}


TEST(CommandLine, Errors)
{
    EXPECT_THROW(parseCommandLine({}), CommandLineError);
    EXPECT_THROW(parseCommandLine({"ftp://host/"}), CommandLineError);
    EXPECT_THROW(parseCommandLine({"-bogus", "ftp://host/", "ls"}), CommandLineError);
    EXPECT_THROW(parseCommandLine({"-timeout"}), CommandLineError);
    EXPECT_THROW(parseCommandLine({"-timeout", "ten", "ftp://host/", "ls"}), CommandLineError);
    EXPECT_THROW(parseCommandLine({"-timeout", "-5", "ftp://host/", "ls"}), CommandLineError);
    EXPECT_THROW(parseCommandLine({"ftp://host/", "format-disk"}), CommandLineError);
}


TEST(CommandLine, CommandArity)
{
    EXPECT_NO_THROW(parseCommandLine({"ftp://host/", "ls", "dir"}));
    EXPECT_THROW   (parseCommandLine({"ftp://host/", "ls", "dir", "other"}), CommandLineError);
    EXPECT_THROW   (parseCommandLine({"ftp://host/", "get", "remote"}), CommandLineError);
    EXPECT_NO_THROW(parseCommandLine({"ftp://host/", "mv", "a", "b"}));
    EXPECT_THROW   (parseCommandLine({"ftp://host/", "mv", "a"}), CommandLineError);
    EXPECT_THROW   (parseCommandLine({"ftp://host/", "pwd", "x"}), CommandLineError);
    EXPECT_NO_THROW(parseCommandLine({"ftp://host/", "features"}));
}
