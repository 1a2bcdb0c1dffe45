// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_2906157384263911457
#define SCOPE_GUARD_H_2906157384263911457

#include <cassert>
#include <exception> //std::uncaught_exceptions
#include <type_traits>
#include <utility>


namespace zftp
{
/*  Scope Guard

        auto guardSock = zftp::makeGuard<ScopeGuardRunMode::onFail>([&] { closeSocket(sock); });
            ...
        guardSock.dismiss();

    Scope Exit:
        ZFTP_ON_SCOPE_EXIT   (CleanUp());
        ZFTP_ON_SCOPE_FAIL   (UndoTemporaryWork());
        ZFTP_ON_SCOPE_SUCCESS(NotifySuccess());                    */

enum class ScopeGuardRunMode
{
    onExit,
    onSuccess,
    onFail
};


template <typename F> inline
void runScopeGuardDestructor(F& fun, bool failed, std::integral_constant<ScopeGuardRunMode, ScopeGuardRunMode::onExit>)
{
    if (!failed)
        fun(); //throw X
    else
        try { fun(); }
        catch (...) { assert(false); }
}


template <typename F> inline
void runScopeGuardDestructor(F& fun, bool failed, std::integral_constant<ScopeGuardRunMode, ScopeGuardRunMode::onSuccess>)
{
    if (!failed)
        fun(); //throw X
}


template <typename F> inline
void runScopeGuardDestructor(F& fun, bool failed, std::integral_constant<ScopeGuardRunMode, ScopeGuardRunMode::onFail>) noexcept
{
    if (failed)
        try { fun(); }
        catch (...) { assert(false); }
}


template <ScopeGuardRunMode runMode, typename F>
class ScopeGuard
{
public:
    explicit ScopeGuard(const F&  fun) : fun_(fun) {}
    explicit ScopeGuard(      F&& fun) : fun_(std::move(fun)) {}

    ScopeGuard(ScopeGuard&& tmp) :
        fun_(std::move(tmp.fun_)),
        exceptionCount_(tmp.exceptionCount_),
        dismissed_(tmp.dismissed_) { tmp.dismissed_ = true; }

    ~ScopeGuard() noexcept(runMode == ScopeGuardRunMode::onFail)
    {
        if (!dismissed_)
        {
            const bool failed = std::uncaught_exceptions() > exceptionCount_;
            runScopeGuardDestructor(fun_, failed, std::integral_constant<ScopeGuardRunMode, runMode>());
        }
    }

    void dismiss() { dismissed_ = true; }

private:
    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    const F fun_;
    const int exceptionCount_ = std::uncaught_exceptions();
    bool dismissed_ = false;
};


template <ScopeGuardRunMode runMode, class F> inline
auto makeGuard(F&& fun) { return ScopeGuard<runMode, std::decay_t<F>>(std::forward<F>(fun)); }
}

#define ZFTP_CONCAT_SUB(X, Y) X ## Y
#define ZFTP_CONCAT(X, Y) ZFTP_CONCAT_SUB(X, Y)

#define ZFTP_CHECK_CASE_FOR_CONSTANT(X) case X: return ZFTP_CHECK_CASE_FOR_CONSTANT_IMPL(#X)
#define ZFTP_CHECK_CASE_FOR_CONSTANT_IMPL(X) L ## X


#define ZFTP_ON_SCOPE_EXIT(X)    [[maybe_unused]] auto ZFTP_CONCAT(scopeGuard, __LINE__) = zftp::makeGuard<zftp::ScopeGuardRunMode::onExit   >([&]{ X; });
#define ZFTP_ON_SCOPE_FAIL(X)    [[maybe_unused]] auto ZFTP_CONCAT(scopeGuard, __LINE__) = zftp::makeGuard<zftp::ScopeGuardRunMode::onFail   >([&]{ X; });
#define ZFTP_ON_SCOPE_SUCCESS(X) [[maybe_unused]] auto ZFTP_CONCAT(scopeGuard, __LINE__) = zftp::makeGuard<zftp::ScopeGuardRunMode::onSuccess>([&]{ X; });

#endif //SCOPE_GUARD_H_2906157384263911457
