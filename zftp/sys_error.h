// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SYS_ERROR_H_1902648370125563092
#define SYS_ERROR_H_1902648370125563092

#include <cerrno>
#include <stdexcept>
#include "scope_guard.h" //
#include "i18n.h"        //not used by this header, but the "rest of the world" needs it!
#include "utf.h"         //


namespace zftp
{
//evaluate errno and assemble specific error message
using ErrorCode = int;

ErrorCode getLastError();

std::wstring formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg);
std::wstring formatSystemError(const std::string& functionName, ErrorCode ec);


//low-level exception class giving (non-translated) detail information only
class SysError
{
public:
    explicit SysError(const std::wstring& msg) : msg_(msg) {}
    virtual ~SysError() {}
    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};

#define DEFINE_NEW_SYS_ERROR(X) struct X : public zftp::SysError { X(const std::wstring& msg) : SysError(msg) {} };

//deadline exceeded: connect, read, write
DEFINE_NEW_SYS_ERROR(SysErrorTimeOut)


//better leave it as a macro: errno must be evaluated before any other system call
#define THROW_LAST_SYS_ERROR(functionName)                           \
    do { const zftp::ErrorCode ecInternal = zftp::getLastError(); throw zftp::SysError(zftp::formatSystemError(functionName, ecInternal)); } while (false)


/* Example: ASSERT_SYSERROR(expr);

    Equivalent to:
        if (!expr)
            throw zftp::SysError(L"Assertion failed: \"expr\"");            */
#define ASSERT_SYSERROR(expr) ASSERT_SYSERROR_IMPL(expr, #expr) //throw SysError


//caller broke a documented precondition
#define ZFTP_CONTRACT_VIOLATION() throw std::logic_error(std::string(__FILE__) + '[' + zftp::numberTo<std::string>(__LINE__) + "] Contract violation!")



//######################## implementation ########################
inline
ErrorCode getLastError()
{
    return errno; //don't use "::" prefix, errno is a macro!
}


std::wstring getSystemErrorDescription(ErrorCode ec); //return empty string on error


namespace impl
{
inline bool validateBool(bool  b) { return b; }
inline bool validateBool(void* b) { return b; }
bool validateBool(int) = delete; //catch unintended bool conversions
}
#define ASSERT_SYSERROR_IMPL(expr, exprStr) \
    { if (!zftp::impl::validateBool(expr))        \
            throw zftp::SysError(L"Assertion failed: \"" L ## exprStr L"\""); }
}

#endif //SYS_ERROR_H_1902648370125563092
