// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef COMMAND_LINE_H_3361902857714402615
#define COMMAND_LINE_H_3361902857714402615

#include <vector>
#include <zftp/file_error.h>


namespace ftc
{
DEFINE_NEW_FILE_ERROR(CommandLineError)

enum class FtpcExitCode //as returned on process exit
{
    success = 0,
    error,
    syntaxError,
};


//ftpc [options] <ftp[s]://[user[:password]@]host[:port][/dir]> <command> [args]
struct CommandLine
{
    bool showHelp = false;

    std::string url;
    bool forceTls = false;
    std::string caCertFilePath;
    int timeoutSec     = 10;
    int dataTimeoutSec = 0;
    bool disableEpsv = false;
    int utcOffsetMin = 0;
    bool wireTrace = false;

    std::string command; //lower case
    std::vector<std::string> commandArgs;
};

CommandLine parseCommandLine(const std::vector<std::string>& args /*without program name*/); //throw CommandLineError

std::wstring getSyntaxHelp();
}

#endif //COMMAND_LINE_H_3361902857714402615
