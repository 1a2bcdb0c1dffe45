// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_ERROR_H_3050917642208873165
#define FTP_ERROR_H_3050917642208873165

#include <zftp/sys_error.h>


namespace ftc
{
//server answered with an unexpected status code
struct SysErrorFtpProtocol : public zftp::SysError
{
    SysErrorFtpProtocol(const std::wstring& msg, int ftpError, const std::string& serverMsg) : SysError(msg), ftpErrorCode(ftpError), serverMessage(serverMsg) {}

    int ftpErrorCode;
    std::string serverMessage;
};

//USER/PASS refused
struct SysErrorLogin : public SysErrorFtpProtocol
{
    using SysErrorFtpProtocol::SysErrorFtpProtocol;
};

//reply text could not be parsed: PASV, EPSV, PWD, SIZE, MDTM, malformed reply line
DEFINE_NEW_SYS_ERROR(SysErrorFtpFormat)

//operation aborted by CancelSignal: session is unusable afterwards
DEFINE_NEW_SYS_ERROR(SysErrorCancelled)


SysErrorFtpProtocol makeFtpProtocolError(int statusCode, const std::string& serverMsg);
}

#endif //FTP_ERROR_H_3050917642208873165
