// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_STATUS_H_8815203364791057712
#define FTP_STATUS_H_8815203364791057712

#include <string>


namespace ftc
{
//reply codes: https://tools.ietf.org/html/rfc959#section-4.2
const int StatusAny                     = -1; //execute(): accept any reply

//positive preliminary
const int StatusAlreadyOpen             = 125;
const int StatusAboutToSend             = 150;

//positive completion
const int StatusCommandOK               = 200;
const int StatusCommandNotImplemented   = 202;
const int StatusSystem                  = 211;
const int StatusFile                    = 213;
const int StatusReady                   = 220;
const int StatusClosing                 = 221;
const int StatusClosingDataConnection   = 226;
const int StatusPassiveMode             = 227;
const int StatusExtendedPassiveMode     = 229;
const int StatusLoggedIn                = 230;
const int StatusRequestedFileActionOK   = 250;
const int StatusPathCreated             = 257;

//positive intermediate
const int StatusUserOK                  = 331;
const int StatusRequestFilePending      = 350;

//negative
const int StatusNotAvailable            = 421;
const int StatusBadArguments            = 501;
const int StatusNotImplemented          = 502;
const int StatusNotImplementedParameter = 504;
const int StatusNotLoggedIn             = 530;
const int StatusFileUnavailable         = 550;


std::wstring formatFtpStatus(int sc);
}

#endif //FTP_STATUS_H_8815203364791057712
