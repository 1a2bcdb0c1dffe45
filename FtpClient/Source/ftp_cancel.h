// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_CANCEL_H_1183650274991068340
#define FTP_CANCEL_H_1183650274991068340

#include <functional>
#include <zftp/thread.h>


namespace ftc
{
/*  race a blocking operation against a CancelSignal:
      - onCancel runs on the watcher thread: must be thread-safe and nothrow, e.g. shutdown of the blocked sockets
      - watcher is stopped and joined on destruction => never outlives the operation    */
class CancelWatch
{
public:
    CancelWatch(const zftp::CancelSignal& cancel, const std::function<void()>& onCancel) :
        watcher_([this, &cancel, onCancel]
    {
        zftp::setCurrentThreadName("FTP cancel watch");

        cancel.waitForCancel(); //throw ThreadStopRequest
        triggered_ = true;
        onCancel();
    }) {}

    bool triggered() const { return triggered_; }

private:
    CancelWatch           (const CancelWatch&) = delete;
    CancelWatch& operator=(const CancelWatch&) = delete;

    std::atomic<bool> triggered_{false};
    zftp::InterruptibleThread watcher_; //declare last: thread accesses triggered_
};
}

#endif //FTP_CANCEL_H_1183650274991068340
