// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_session.h"
#include <zftp/time.h>

using namespace zftp;
using namespace ftc;


namespace
{
std::wstring fmtReply(const std::string& message) { return L'"' + utfTo<std::wstring>(message) + L'"'; }


std::string appendPath(const std::string& basePath, const std::string& name)
{
    return endsWith(basePath, "/") ? basePath + name : basePath + '/' + name; //"/" + name: no double slash
}
}


void FtpSession::changeDir(const CancelSignal& cancel, const std::string& path)
{
    execute(cancel, StatusRequestedFileActionOK, "CWD " + path); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
}


void FtpSession::changeDirToParent(const CancelSignal& cancel)
{
    execute(cancel, StatusRequestedFileActionOK, "CDUP"); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
}


std::string FtpSession::currentDir(const CancelSignal& cancel)
{
    const FtpReply reply = execute(cancel, StatusPathCreated, "PWD"); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled

    /*  https://tools.ietf.org/html/rfc959#page-63
        257 "/some/""quoted""/path" is current directory.
        => embedded double quotes are doubled        */
    const std::string& msg = reply.message;
    auto it = std::find(msg.begin(), msg.end(), '"');
    if (it == msg.end())
        throw SysErrorFtpFormat(replaceCpy(_("Unexpected PWD response: %x"), L"%x", fmtReply(msg)));

    std::string path;
    for (++it; it != msg.end(); ++it)
        if (*it == '"')
        {
            if (it + 1 == msg.end() || it[1] != '"')
                return path;
            path += '"';
            ++it;
        }
        else
            path += *it;

    throw SysErrorFtpFormat(replaceCpy(_("Unexpected PWD response: %x"), L"%x", fmtReply(msg))); //no closing quote
}


uint64_t FtpSession::fileSize(const CancelSignal& cancel, const std::string& path)
{
    const FtpReply reply = execute(cancel, StatusFile, "SIZE " + path); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled

    const std::string sizeStr = trimCpy(reply.message);
    if (sizeStr.empty() || sizeStr.size() > 20 || !std::all_of(sizeStr.begin(), sizeStr.end(), [](char c) { return isDigit(c); }) ||
        (sizeStr.size() == 20 && sizeStr > "18446744073709551615")) //UINT64_MAX
        throw SysErrorFtpFormat(replaceCpy(_("Unexpected SIZE response: %x"), L"%x", fmtReply(reply.message)));

    return stringTo<uint64_t>(sizeStr);
}


time_t FtpSession::getModificationTime(const CancelSignal& cancel, const std::string& path)
{
    const FtpReply reply = execute(cancel, StatusFile, "MDTM " + path); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled

    //https://tools.ietf.org/html/rfc3659#section-3: "YYYYMMDDHHMMSS[.sss]" in UTC
    const std::string timeStr = beforeFirst(trimCpy(reply.message), ".", IfNotFoundReturn::all); //drop fractional seconds

    const TimeComp tc = parseTime("%Y%m%d%H%M%S", timeStr);
    if (tc == TimeComp())
        throw SysErrorFtpFormat(replaceCpy(_("Unexpected MDTM response: %x"), L"%x", fmtReply(reply.message)));

    const auto [modTime, timeValid] = utcToTimeT(tc);
    if (!timeValid)
        throw SysErrorFtpFormat(replaceCpy(_("Unexpected MDTM response: %x"), L"%x", fmtReply(reply.message)));

    return modTime;
}


void FtpSession::rename(const CancelSignal& cancel, const std::string& pathFrom, const std::string& pathTo)
{
    execute(cancel, StatusRequestFilePending,     "RNFR " + pathFrom); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
    execute(cancel, StatusRequestedFileActionOK, "RNTO " + pathTo);   //
}


void FtpSession::deleteFile(const CancelSignal& cancel, const std::string& path)
{
    execute(cancel, StatusRequestedFileActionOK, "DELE " + path); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
}


void FtpSession::makeDir(const CancelSignal& cancel, const std::string& path)
{
    execute(cancel, StatusPathCreated, "MKD " + path); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
}


void FtpSession::removeDir(const CancelSignal& cancel, const std::string& path)
{
    execute(cancel, StatusRequestedFileActionOK, "RMD " + path); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled
}


int FtpSession::removeDirRecursive(const CancelSignal& cancel, const std::string& path)
{
    changeDir(cancel, path); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, SysErrorTimeOut, SysErrorCancelled

    const std::string folderPath = currentDir(cancel); //path may be relative

    for (const FtpEntry& entry : list(cancel, folderPath))
        if (entry.name != "." && entry.name != "..")
        {
            if (entry.type == EntryType::folder)
                removeDirRecursive(cancel, appendPath(folderPath, entry.name)); //returns with folderPath as working directory
            else
                deleteFile(cancel, entry.name); //symlinks, too: never follow
        }

    changeDirToParent(cancel);

    return execute(cancel, StatusRequestedFileActionOK, "RMD " + folderPath).statusCode;
}
