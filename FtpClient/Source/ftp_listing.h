// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_LISTING_H_4907316628850143397
#define FTP_LISTING_H_4907316628850143397

#include <cstdint>
#include <ctime>
#include <string>
#include <zftp/sys_error.h>


namespace ftc
{
enum class EntryType
{
    file,
    folder,
    link,
};

struct FtpEntry
{
    std::string name;
    std::string target; //symlinks only, if known
    EntryType type = EntryType::file;
    uint64_t size = 0;  //files only
    time_t modTime = 0; //UTC
};


//RFC 3659 "facts": "type=file;size=4;modify=20170113063314; readme.txt"
FtpEntry parseMlsdLine(const std::string& line, time_t referenceTime, int serverUtcOffset); //throw SysError

/*  human-readable LIST:
      - Unix "ls -l" with owner + group, owner only, or neither
      - DOS/IIS "dir"
    time stamps are server-local: serverUtcOffset in minutes east of UTC
    referenceTime: "now"; resolves the missing year of recent Unix entries     */
FtpEntry parseListLine(const std::string& line, time_t referenceTime, int serverUtcOffset); //throw SysError
}

#endif //FTP_LISTING_H_4907316628850143397
