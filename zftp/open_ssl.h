// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef OPEN_SSL_H_0387219647752310486
#define OPEN_SSL_H_0387219647752310486

#include <memory>
#include "socket.h"


namespace zftp
{
//init OpenSSL before use!
void openSslInit();
void openSslTearDown();


//TLS client session running on top of a connected, blocking socket (socket is NOT owned)
class TlsContext
{
public:
    TlsContext(SocketType socket, const std::string& server /*SNI + host name check*/,
               const std::string* caCertFilePath /*optional: enable certificate validation*/); //throw SysError
    ~TlsContext();

    size_t tryRead (      void* buffer, size_t bytesToRead ); //throw SysError; may return short, only 0 means EOF!
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw SysError; may return short! CONTRACT: bytesToWrite > 0

    //decrypted bytes buffered inside OpenSSL: don't wait for the socket before reading them
    bool hasPendingData() const;

    void shutdown(); //throw SysError; send close_notify

private:
    TlsContext           (const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    class Impl;
    const std::unique_ptr<Impl> pimpl_;
};
}

#endif //OPEN_SSL_H_0387219647752310486
