// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef EXTRA_LOG_H_8840235571960318442
#define EXTRA_LOG_H_8840235571960318442

#include <functional>
#include <utility>
#include "error_log.h"
#include "thread.h"

/*  log errors in "exceptional situations" when no other means are available, e.g.
    - while an exception is in flight
    - cleanup errors in destructors
    - best-effort protocol steps whose failure is not fatal          */

namespace zftp
{
namespace impl
{
class ExtraLog
{
public:
    ~ExtraLog()
    {
        if (!log_.empty() && reportOutstandingLog_)
            reportOutstandingLog_(log_);
    }

    void init(const std::function<void(const ErrorLog& log)>& reportOutstandingLog)
    {
        assert(!reportOutstandingLog_);
        reportOutstandingLog_ = reportOutstandingLog;
    }


    ErrorLog fetchLog() { return std::exchange(log_, ErrorLog()); }

    void logError(const std::wstring& msg) { logMsg(log_, msg, MessageType::MSG_TYPE_ERROR); } //nothrow!

private:
    ErrorLog log_;
    std::function<void(const ErrorLog& log)> reportOutstandingLog_;
};


template <class Function>
void accessExtraLog(Function fun)
{
    static Protected<ExtraLog> globalExtraLog; //thread-safe init; destroyed during global shutdown
    globalExtraLog.access([&](ExtraLog& log) { fun(log); });
}
}


inline
void initExtraLog(const std::function<void(const ErrorLog& log)>& reportOutstandingLog /*nothrow! runs during global shutdown!*/)
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.init(reportOutstandingLog); });
}


inline
ErrorLog fetchExtraLog()
{
    ErrorLog output;
    impl::accessExtraLog([&](impl::ExtraLog& el) { output = el.fetchLog(); });
    return output;
}


inline
void logExtraError(const std::wstring& msg) //nothrow!
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.logError(msg); });
}
}

#endif //EXTRA_LOG_H_8840235571960318442
