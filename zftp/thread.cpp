// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "thread.h"
#include <sys/prctl.h>

using namespace zftp;


void zftp::setCurrentThreadName(const std::string& threadName)
{
    //"The name can be up to 16 bytes long, including the terminating null byte."
    ::prctl(PR_SET_NAME, threadName.substr(0, 15).c_str(), 0, 0, 0);
}
