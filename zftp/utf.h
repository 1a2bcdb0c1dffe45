// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef UTF_H_7730915526498214063
#define UTF_H_7730915526498214063

#include <cstdint>
#include "string_tools.h"


namespace zftp
{
//UTF-8 (char) <-> UTF-32 (wchar_t): server text arrives as UTF-8, error messages are std::wstring
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);




//----------------------- implementation ----------------------------------
namespace impl
{
using CodePoint = uint32_t;
using Char8     = uint8_t;

const CodePoint LEAD_SURROGATE      = 0xd800;
const CodePoint TRAIL_SURROGATE_MAX = 0xdfff;
const CodePoint REPLACEMENT_CHAR    = 0xfffd;
const CodePoint CODE_POINT_MAX      = 0x10ffff;

static_assert(sizeof(wchar_t) == sizeof(CodePoint));


template <class Function> inline
void codePointToUtf8(CodePoint cp, Function writeOutput) //"writeOutput" is a unary function taking a Char8
{
    //https://en.wikipedia.org/wiki/UTF-8
    if (cp < 0x80)
        writeOutput(static_cast<Char8>(cp));
    else if (cp < 0x800)
    {
        writeOutput(static_cast<Char8>((cp >> 6  ) | 0xc0));
        writeOutput(static_cast<Char8>((cp & 0x3f) | 0x80));
    }
    else if (cp < 0x10000)
    {
        if (LEAD_SURROGATE <= cp && cp <= TRAIL_SURROGATE_MAX) //not a valid code point
            return codePointToUtf8(REPLACEMENT_CHAR, writeOutput);

        writeOutput(static_cast<Char8>(( cp >> 12       ) | 0xe0));
        writeOutput(static_cast<Char8>(((cp >> 6) & 0x3f) | 0x80));
        writeOutput(static_cast<Char8>(( cp & 0x3f      ) | 0x80));
    }
    else if (cp <= CODE_POINT_MAX)
    {
        writeOutput(static_cast<Char8>(( cp >> 18        ) | 0xf0));
        writeOutput(static_cast<Char8>(((cp >> 12) & 0x3f) | 0x80));
        writeOutput(static_cast<Char8>(((cp >> 6)  & 0x3f) | 0x80));
        writeOutput(static_cast<Char8>(( cp & 0x3f       ) | 0x80));
    }
    else
        codePointToUtf8(REPLACEMENT_CHAR, writeOutput);
}


inline
size_t getUtf8Len(Char8 ch) //ch must be first code unit! returns 0 on error!
{
    if (ch < 0x80)
        return 1;
    if (ch >> 5 == 0x6)
        return 2;
    if (ch >> 4 == 0xe)
        return 3;
    if (ch >> 3 == 0x1e)
        return 4;
    return 0; //innermost (trail) code unit or invalid
}


//"onCodePoint" is a unary function taking a CodePoint; encoding errors yield REPLACEMENT_CHAR
template <class Function> inline
void utf8ToCodePoint(std::string_view str, Function onCodePoint)
{
    for (auto it = str.begin(); it != str.end(); )
    {
        const Char8 ch = static_cast<Char8>(*it++);
        const size_t len = getUtf8Len(ch);
        if (len == 0)
        {
            onCodePoint(REPLACEMENT_CHAR);
            continue;
        }
        CodePoint cp = len == 1 ? ch : (ch & (0xff >> (len + 1)));

        size_t i = 1;
        for (; i < len && it != str.end() && (static_cast<Char8>(*it) >> 6) == 0x2; ++i)
            cp = (cp << 6) + (static_cast<Char8>(*it++) & 0x3f);

        if (i < len || cp > CODE_POINT_MAX || (LEAD_SURROGATE <= cp && cp <= TRAIL_SURROGATE_MAX))
            onCodePoint(REPLACEMENT_CHAR);
        else
            onCodePoint(cp);
    }
}


inline
std::wstring utf8ToWide(std::string_view str)
{
    std::wstring output;
    output.reserve(str.size());
    utf8ToCodePoint(str, [&](CodePoint cp) { output += static_cast<wchar_t>(cp); });
    return output;
}


inline
std::string wideToUtf8(std::wstring_view str)
{
    std::string output;
    output.reserve(str.size());
    for (const wchar_t c : str)
        codePointToUtf8(static_cast<CodePoint>(c), [&](Char8 ch) { output += static_cast<char>(ch); });
    return output;
}
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    using SourceChar = impl::StrChar<SourceString>;
    using TargetChar = typename TargetString::value_type;
    const auto strV = impl::strView(str);

    if constexpr (std::is_same_v<SourceChar, TargetChar>)
        return TargetString(strV);
    else if constexpr (std::is_same_v<SourceChar, char>)
        return TargetString(impl::utf8ToWide(strV));
    else
        return TargetString(impl::wideToUtf8(strV));
}
}

#endif //UTF_H_7730915526498214063
