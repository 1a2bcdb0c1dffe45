// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_DATA_STREAM_H_5590421876320417653
#define FTP_DATA_STREAM_H_5590421876320417653

#include <zftp/socket.h>


namespace ftc
{
//incoming transfer, e.g. RETR
class FtpDataStream
{
public:
    virtual ~FtpDataStream() {} //closes the stream if needed, errors go to the extra log

    virtual size_t tryRead(void* buffer, size_t bytesToRead) = 0; //throw SysError, SysErrorTimeOut, SysErrorCancelled; may return short, only 0 means EOF! CONTRACT: bytesToRead > 0

    //first call: close data connection, then read the transfer's final reply from the control channel
    //later calls: no-op
    virtual void close() = 0; //throw SysError, SysErrorFtpProtocol, SysErrorCancelled

    //replaces the per-chunk stall timeout; none: wait forever
    virtual void setDeadline(const zftp::SocketDeadline& deadline) = 0;
};
}

#endif //FTP_DATA_STREAM_H_5590421876320417653
