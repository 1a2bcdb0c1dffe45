// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef I18N_H_4471923058813265
#define I18N_H_4471923058813265

#include <cstdint>
#include <cstdlib>
#include "string_tools.h"

//user-visible text: marked for translation, source language only
#define ZFTP_TRANS_CONCAT_SUB(X, Y) X ## Y
#define _(s)        zftp::translate(ZFTP_TRANS_CONCAT_SUB(L, s))
#define _P(s, p, n) zftp::translate(ZFTP_TRANS_CONCAT_SUB(L, s), ZFTP_TRANS_CONCAT_SUB(L, p), n)
//source text is required to use %x as number placeholder


namespace zftp
{
inline
std::wstring translate(const std::wstring& text) { return text; }


//plural forms: "%x sec" => "1 sec", "10 sec"
template <class T> inline
std::wstring translate(const std::wstring& singular, const std::wstring& plural, T n)
{
    static_assert(sizeof(n) <= sizeof(int64_t));
    const auto n64 = static_cast<int64_t>(n);
    assert(contains(plural, L"%x"));

    return replaceCpy(std::abs(n64) == 1 ? singular : plural, L"%x", numberTo<std::wstring>(n64));
}
}

#endif //I18N_H_4471923058813265
