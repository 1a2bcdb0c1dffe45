// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_listing.h"
#include <functional>
#include <optional>
#include <zftp/time.h>

using namespace zftp;
using namespace ftc;


namespace
{
class FtpLineParser
{
public:
    explicit FtpLineParser(const std::string_view& line) : it_(line.begin()), itEnd_(line.end()) {}
    /**/     FtpLineParser(std::string_view&&) = delete;

    template <class Function>
    std::string_view readRange(size_t count, Function acceptChar) //throw SysError
    {
        if (static_cast<ptrdiff_t>(count) > itEnd_ - it_)
            throw SysError(L"Unexpected end of line.");

        const auto rngEnd = it_ + count;

        if (!std::all_of(it_, rngEnd, acceptChar))
            throw SysError(L"Expected char type not found.");

        return makeView(std::exchange(it_, rngEnd), rngEnd);
    }

    template <class Function> //expects non-empty range!
    std::string_view readRange(Function acceptChar) //throw SysError
    {
        auto rngEnd = std::find_if_not(it_, itEnd_, acceptChar);
        if (rngEnd == it_)
            throw SysError(L"Expected char range not found.");

        return makeView(std::exchange(it_, rngEnd), rngEnd);
    }

    char peekNextChar() const { return it_ == itEnd_ ? '\0' : *it_; }

private:
    static std::string_view makeView(std::string_view::const_iterator first, std::string_view::const_iterator last)
    {
        return std::string_view(first, last);
    }

    std::string_view::const_iterator it_;
    const std::string_view::const_iterator itEnd_;
};


//server-local time components => UTC
time_t serverTimeToUtc(const TimeComp& tc, int serverUtcOffset) //throw SysError
{
    const auto [serverLocalTime, timeValid] = utcToTimeT(tc);
    if (!timeValid)
        throw SysError(L"Modification time is invalid.");

    return serverLocalTime - static_cast<time_t>(serverUtcOffset) * 60;
}


FtpEntry makeDotEntry(const std::string_view& name) //"." and ".." are reported as folders: caller filters
{
    FtpEntry entry;
    entry.name = std::string(name);
    entry.type = EntryType::folder;
    return entry;
}


FtpEntry parseUnixLine(const std::string_view& line, time_t referenceTime, int serverUtcOffset, int ownerGroupCount) //throw SysError
{
    /*  total 4953                                                  <- not an entry
        drwxr-xr-x 1 root root    4096 Jan 10 11:58 version
        -rwxr-xr-x 1 root root    1084 Sep  2 01:17 Unit Test.vcxproj.user
        -rwxr-xr-x 1 1000  300    2217 Feb 28  2016 win32.manifest
        lrwxr-xr-x 1 root root      18 Apr 26 15:17 Projects -> /mnt/hgfs/Projects

        file type: -:file  l:symlink  d:directory  b:block device  p:named pipe  c:char device  s:socket

        no group:           dr-xr-xr-x   2 root                  512 Apr  8  1994 etc
        no owner, no group: drwxrwxrwx 1              0 Jan  1 00:00 dirname/          */
    FtpLineParser parser(line);

    const std::string_view typeTag = parser.readRange(1, [](char c) //throw SysError
    {
        return c == '-' || c == 'b' || c == 'c' || c == 'd' || c == 'l' || c == 'p' || c == 's';
    });
    //------------------------------------------------------------------------------------
    //permissions
    parser.readRange(9, [](char c) //throw SysError
    {
        return c == '-' || c == 'r' || c == 'w' || c == 'x' || c == 's' || c == 'S' || c == 't' || c == 'T';
    });
    parser.readRange(&isWhiteSpace<char>); //throw SysError
    //------------------------------------------------------------------------------------
    //hard-link count
    parser.readRange(&isDigit<char>);      //throw SysError
    parser.readRange(&isWhiteSpace<char>); //throw SysError
    //------------------------------------------------------------------------------------
    for (int i = 0; i < ownerGroupCount; ++i)
    {
        parser.readRange(std::not_fn(isWhiteSpace<char>)); //throw SysError
        parser.readRange(&isWhiteSpace<char>);             //throw SysError
    }
    //------------------------------------------------------------------------------------
    const uint64_t fileSize = stringTo<uint64_t>(parser.readRange(&isDigit<char>)); //throw SysError
    parser.readRange(&isWhiteSpace<char>);                                          //throw SysError
    //------------------------------------------------------------------------------------
    const std::string_view monthStr = parser.readRange(std::not_fn(isWhiteSpace<char>)); //throw SysError
    parser.readRange(&isWhiteSpace<char>);                                               //throw SysError

    const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    auto itMonth = std::find_if(std::begin(months), std::end(months), [&](const char* name) { return equalAsciiNoCase(name, monthStr); });
    if (itMonth == std::end(months))
        throw SysError(L"Failed to parse month name.");
    //------------------------------------------------------------------------------------
    const int day = stringTo<int>(parser.readRange(&isDigit<char>)); //throw SysError
    parser.readRange(&isWhiteSpace<char>);                           //throw SysError
    if (day < 1 || day > 31)
        throw SysError(L"Failed to parse day of month.");
    //------------------------------------------------------------------------------------
    const std::string_view timeOrYear = parser.readRange([](char c) { return c == ':' || isDigit(c); }); //throw SysError
    parser.readRange(&isWhiteSpace<char>);                                                               //throw SysError

    TimeComp timeComp;
    timeComp.month = 1 + static_cast<int>(itMonth - std::begin(months));
    timeComp.day = day;

    if (contains(timeOrYear, ":"))
    {
        const int hour   = stringTo<int>(beforeFirst(timeOrYear, ":", IfNotFoundReturn::none));
        const int minute = stringTo<int>(afterFirst (timeOrYear, ":", IfNotFoundReturn::none));
        if (hour < 0 || hour > 23 || minute < 0 || minute > 59)
            throw SysError(L"Failed to parse modification time.");

        const TimeComp tcNow = getUtcTime(referenceTime);
        if (tcNow == TimeComp())
            throw SysError(L"Failed to determine current time: " + numberTo<std::wstring>(referenceTime));

        timeComp.hour   = hour;
        timeComp.minute = minute;
        timeComp.year   = tcNow.year; //tentatively

        if (serverTimeToUtc(timeComp, serverUtcOffset) > referenceTime + 24 * 3600) //throw SysError; 1 day tolerance: time zones + DST
            --timeComp.year; //"more likely" this time is from last year
    }
    else if (timeOrYear.size() == 4)
    {
        timeComp.year = stringTo<int>(timeOrYear);

        if (timeComp.year < 1600 || timeComp.year >= 3000)
            throw SysError(L"Failed to parse modification time.");
    }
    else
        throw SysError(L"Failed to parse modification time.");

    const time_t modTime = serverTimeToUtc(timeComp, serverUtcOffset); //throw SysError
    //------------------------------------------------------------------------------------
    const std::string_view trail = parser.readRange([](char) { return true; }); //throw SysError

    FtpEntry entry;
    if (typeTag == "l")
    {
        entry.name   = beforeFirst(trail, " -> ", IfNotFoundReturn::all);
        entry.target = afterFirst (trail, " -> ", IfNotFoundReturn::none);
    }
    else
        entry.name = trail;

    if (entry.name.empty())
        throw SysError(L"Item name not available.");

    if (entry.name == "." || entry.name == "..") //sometimes returned, e.g. "ls -la"
        return makeDotEntry(entry.name);
    //------------------------------------------------------------------------------------
    if (typeTag == "d")
    {
        entry.type = EntryType::folder;
        if (endsWith(entry.name, "/")) //"ls --file-type"
            entry.name.pop_back();
    }
    else if (typeTag == "l")
        entry.type = EntryType::link;
    else
        entry.size = fileSize;

    entry.modTime = modTime;
    return entry;
}


FtpEntry parseDosLine(const std::string_view& line, time_t referenceTime, int serverUtcOffset) //throw SysError
{
    /*  10-27-15  03:46AM       <DIR>          pub
        04-08-14  03:09PM               11,399 readme.txt
        06-22-2017  04:25PM       <DIR>          test           <- IIS option "four-digit years"
        01-01-98  13:00       <DIR>          Storage Card       <- Windows CE                      */
    const TimeComp tcNow = getUtcTime(referenceTime);
    if (tcNow == TimeComp())
        throw SysError(L"Failed to determine current time: " + numberTo<std::wstring>(referenceTime));

    FtpLineParser parser(line);

    const int month = stringTo<int>(parser.readRange(2, &isDigit<char>)); //throw SysError
    parser.readRange(1, [](char c) { return c == '-' || c == '/'; });     //throw SysError
    const int day = stringTo<int>(parser.readRange(2, &isDigit<char>));   //throw SysError
    parser.readRange(1, [](char c) { return c == '-' || c == '/'; });     //throw SysError
    const std::string_view yearString = parser.readRange(&isDigit<char>); //throw SysError
    parser.readRange(&isWhiteSpace<char>);                                //throw SysError

    if (month < 1 || month > 12 || day < 1 || day > 31)
        throw SysError(L"Failed to parse modification time.");

    int year = 0;
    if (yearString.size() == 2)
    {
        year = (tcNow.year / 100) * 100 + stringTo<int>(yearString);
        if (year > tcNow.year + 1 /*local time leeway*/)
            year -= 100;
    }
    else if (yearString.size() == 4)
        year = stringTo<int>(yearString);
    else
        throw SysError(L"Failed to parse modification time.");
    //------------------------------------------------------------------------------------
    int hour = stringTo<int>(parser.readRange(2, &isDigit<char>));         //throw SysError
    parser.readRange(1, [](char c) { return c == ':'; });                  //throw SysError
    const int minute = stringTo<int>(parser.readRange(2, &isDigit<char>)); //throw SysError
    if (!isWhiteSpace(parser.peekNextChar()))
    {
        const std::string_view period = parser.readRange(2, [](char c) { return c == 'A' || c == 'P' || c == 'M'; }); //throw SysError
        if (period == "PM")
        {
            if (0 <= hour && hour < 12)
                hour += 12;
        }
        else if (hour == 12)
            hour = 0;
    }
    parser.readRange(&isWhiteSpace<char>); //throw SysError

    if (hour < 0 || hour > 23 || minute < 0 || minute > 59)
        throw SysError(L"Failed to parse modification time.");
    //------------------------------------------------------------------------------------
    TimeComp timeComp;
    timeComp.year   = year;
    timeComp.month  = month;
    timeComp.day    = day;
    timeComp.hour   = hour;
    timeComp.minute = minute;
    const time_t modTime = serverTimeToUtc(timeComp, serverUtcOffset); //throw SysError
    //------------------------------------------------------------------------------------
    const std::string_view dirTagOrSize = parser.readRange(std::not_fn(isWhiteSpace<char>)); //throw SysError
    parser.readRange(&isWhiteSpace<char>); //throw SysError

    const bool isDir = dirTagOrSize == "<DIR>";
    uint64_t fileSize = 0;
    if (!isDir)
    {
        std::string sizeStr(dirTagOrSize);
        replace(sizeStr, ",", "");
        replace(sizeStr, ".", "");
        if (sizeStr.empty() || !std::all_of(sizeStr.begin(), sizeStr.end(), &isDigit<char>))
            throw SysError(L"Failed to parse file size.");
        fileSize = stringTo<uint64_t>(sizeStr);
    }
    //------------------------------------------------------------------------------------
    const std::string_view itemName = parser.readRange([](char) { return true; }); //throw SysError

    if (itemName == "." || itemName == "..")
        return makeDotEntry(itemName);

    FtpEntry entry;
    entry.name = itemName;
    if (isDir)
        entry.type = EntryType::folder;
    entry.size    = fileSize;
    entry.modTime = modTime;
    return entry;
}
}


FtpEntry ftc::parseMlsdLine(const std::string& line, time_t /*referenceTime*/, int /*serverUtcOffset*/) //throw SysError
{
    /*  https://tools.ietf.org/html/rfc3659
        type=cdir;sizd=4096;modify=20170116230740;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c55; .
        type=pdir;sizd=4096;modify=20170116230740;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c55; ..
        type=file;size=4;modify=20170113063314;UNIX.mode=0600;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c5d; readme.txt
        type=dir;sizd=4096;modify=20170117144634;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e418a; folder

        "modify" is always UTC  */
    try
    {
        const std::string_view rawLine = line;
        FtpEntry entry;

        auto itBegin = rawLine.begin();
        if (startsWith(rawLine, " ")) //no facts at all
            ++itBegin;
        auto itBlank = std::find(itBegin, rawLine.end(), ' ');
        if (itBlank == rawLine.end())
            throw SysError(L"Item name not available.");

        const std::string_view facts = rawLine.substr(itBegin - rawLine.begin(), itBlank - itBegin);
        entry.name = rawLine.substr(itBlank + 1 - rawLine.begin());

        std::string_view typeFact;
        std::string_view fileSize;

        split(facts, ';', [&](const std::string_view fact)
        {
            if (!fact.empty())
            {
                if (startsWithAsciiNoCase(fact, "type=")) //must be case-insensitive!!!
                {
                    const std::string_view tmp = afterFirst(fact, "=", IfNotFoundReturn::none);
                    typeFact = beforeFirst(tmp, ":", IfNotFoundReturn::all);

                    //the OS.unix=slink:/target syntax is a hack and often skips the target path after the colon
                    entry.target = afterFirst(tmp, ":", IfNotFoundReturn::none);
                }
                else if (startsWithAsciiNoCase(fact, "size="))
                    fileSize = afterFirst(fact, "=", IfNotFoundReturn::none);
                else if (startsWithAsciiNoCase(fact, "modify="))
                {
                    std::string_view modifyFact = afterFirst(fact, "=", IfNotFoundReturn::none);
                    modifyFact = beforeLast(modifyFact, ".", IfNotFoundReturn::all); //truncate millisecond precision if available

                    const TimeComp tc = parseTime("%Y%m%d%H%M%S", modifyFact);
                    if (tc == TimeComp())
                        throw SysError(L"Modification time is invalid.");

                    if (const auto [modTime, timeValid] = utcToTimeT(tc);
                        timeValid)
                        entry.modTime = modTime;
                    else
                        throw SysError(L"Modification time is invalid.");
                }
            }
        });

        if (equalAsciiNoCase(typeFact, "cdir"))
            return makeDotEntry(".");
        if (equalAsciiNoCase(typeFact, "pdir"))
            return makeDotEntry("..");

        if (equalAsciiNoCase(typeFact, "dir"))
            entry.type = EntryType::folder;
        else if (equalAsciiNoCase(typeFact, "OS.unix=slink") ||
                 equalAsciiNoCase(typeFact, "OS.unix=symlink"))
            entry.type = EntryType::link;

        if (entry.type != EntryType::link)
            entry.target.clear();

        if (entry.name.empty())
            throw SysError(L"Item name not available.");

        if (entry.type == EntryType::file)
        {
            if (fileSize.empty() || !std::all_of(fileSize.begin(), fileSize.end(), &isDigit<char>))
                throw SysError(L"File size not available."); //crazy, but can be "-1"
            entry.size = stringTo<uint64_t>(fileSize);
        }
        return entry;
    }
    catch (const SysError& e)
    {
        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(line) + L") " + e.toString());
    }
}


FtpEntry ftc::parseListLine(const std::string& line, time_t referenceTime, int serverUtcOffset) //throw SysError
{
    if (!line.empty() && isDigit(line[0])) //lame test to distinguish Unix/Dos formats
        try
        {
            return parseDosLine(line, referenceTime, serverUtcOffset); //throw SysError
        }
        catch (const SysError& e)
        {
            throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(line) + L") " + e.toString());
        }

    //both owner + group, owner only, or none at all
    std::optional<SysError> firstError;

    for (int ownerGroupCount = 3; ownerGroupCount-- > 0;)
        try
        {
            return parseUnixLine(line, referenceTime, serverUtcOffset, ownerGroupCount); //throw SysError
        }
        catch (const SysError& e)
        {
            if (!firstError) //most likely the relevant one
                firstError = e;
        }

    throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(line) + L") " + firstError->toString());
}
