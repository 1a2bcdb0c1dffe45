// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_5812733690154283
#define STRING_TOOLS_H_5812733690154283

#include <cassert>
#include <charconv>
#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <type_traits>


//non-member helpers for std::basic_string, std::basic_string_view and char/wchar_t arrays
namespace zftp
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only!
template <class Char> Char asciiToLower(Char c);

//S and T: strings or char/wchar_t arrays
template <class S, class T> bool contains  (const S& str, const T& term);
template <class S, class T> bool startsWith(const S& str, const T& prefix);
template <class S, class T> bool endsWith  (const S& str, const T& postfix);

template <class S, class T> bool startsWithAsciiNoCase(const S& str, const T& prefix);
template <class S, class T> bool equalAsciiNoCase     (const S& lhs, const T& rhs);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeLast (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S afterFirst (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class S, class Char, class Function> void split(const S& str, Char delimiter, Function onStringPart);
template <class S, class Char> [[nodiscard]] std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe);

template <class S> [[nodiscard]] S trimCpy(const S& str);

template <class S, class T, class U> [[nodiscard]] S replaceCpy(S  str, const T& oldTerm, const U& newTerm);
template <class S, class T, class U>            void replace   (S& str, const T& oldTerm, const U& newTerm);

template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str); //parse failure: 0






//---------------------- implementation ----------------------
namespace impl
{
template <class Char> inline std::basic_string_view<Char> strView(const std::basic_string<Char>&      str) { return str; }
template <class Char> inline std::basic_string_view<Char> strView(const std::basic_string_view<Char>& str) { return str; }
template <class Char> inline std::basic_string_view<Char> strView(const Char* str) { return str; }

template <class S> using StrChar = typename decltype(strView(std::declval<const S&>()))::value_type;
}


template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    assert(c != 0); //std C++ does not consider 0 as white space
    return c == static_cast<Char>(' ') || (static_cast<Char>('\t') <= c && c <= static_cast<Char>('\r'));
}


template <class Char> inline
bool isDigit(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return static_cast<Char>('0') <= c && c <= static_cast<Char>('9');
}


template <class Char> inline
Char asciiToLower(Char c)
{
    if (static_cast<Char>('A') <= c && c <= static_cast<Char>('Z'))
        return static_cast<Char>(c - static_cast<Char>('A') + static_cast<Char>('a'));
    return c;
}


template <class S, class T> inline
bool contains(const S& str, const T& term)
{
    return impl::strView(str).find(impl::strView(term)) != std::basic_string_view<impl::StrChar<S>>::npos;
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix)
{
    const auto strV = impl::strView(str);
    const auto preV = impl::strView(prefix);
    return strV.size() >= preV.size() && strV.substr(0, preV.size()) == preV;
}


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix)
{
    const auto strV  = impl::strView(str);
    const auto postV = impl::strView(postfix);
    return strV.size() >= postV.size() && strV.substr(strV.size() - postV.size()) == postV;
}


template <class S, class T> inline
bool equalAsciiNoCase(const S& lhs, const T& rhs)
{
    const auto lhsV = impl::strView(lhs);
    const auto rhsV = impl::strView(rhs);
    return std::equal(lhsV.begin(), lhsV.end(), rhsV.begin(), rhsV.end(),
                      [](auto a, auto b) { return asciiToLower(a) == asciiToLower(b); });
}


template <class S, class T> inline
bool startsWithAsciiNoCase(const S& str, const T& prefix)
{
    const auto strV = impl::strView(str);
    const auto preV = impl::strView(prefix);
    return strV.size() >= preV.size() && equalAsciiNoCase(strV.substr(0, preV.size()), preV);
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strV  = impl::strView(str);
    const auto termV = impl::strView(term);
    assert(!termV.empty());

    const size_t pos = strV.rfind(termV);
    if (pos == strV.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strV.substr(pos + termV.size()));
}


template <class S, class T> inline
S beforeLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strV  = impl::strView(str);
    const auto termV = impl::strView(term);
    assert(!termV.empty());

    const size_t pos = strV.rfind(termV);
    if (pos == strV.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strV.substr(0, pos));
}


template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strV  = impl::strView(str);
    const auto termV = impl::strView(term);
    assert(!termV.empty());

    const size_t pos = strV.find(termV);
    if (pos == strV.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strV.substr(pos + termV.size()));
}


template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strV  = impl::strView(str);
    const auto termV = impl::strView(term);
    assert(!termV.empty());

    const size_t pos = strV.find(termV);
    if (pos == strV.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strV.substr(0, pos));
}


template <class S, class Char, class Function> inline
void split(const S& str, Char delimiter, Function onStringPart)
{
    const auto strV = impl::strView(str);
    for (size_t pos = 0;;)
    {
        const size_t posEnd = strV.find(delimiter, pos);
        if (posEnd == strV.npos)
        {
            onStringPart(strV.substr(pos));
            return;
        }
        onStringPart(strV.substr(pos, posEnd - pos));
        pos = posEnd + 1;
    }
}


template <class S, class Char> inline
std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe)
{
    std::vector<S> output;
    split(str, delimiter, [&](auto part)
    {
        if (!part.empty() || soe == SplitOnEmpty::allow)
            output.emplace_back(part);
    });
    return output;
}


template <class S> inline
S trimCpy(const S& str)
{
    auto strV = impl::strView(str);

    while (!strV.empty() && isWhiteSpace(strV.front()))
        strV.remove_prefix(1);
    while (!strV.empty() && isWhiteSpace(strV.back()))
        strV.remove_suffix(1);

    return S(strV);
}


template <class S, class T, class U> inline
void replace(S& str, const T& oldTerm, const U& newTerm)
{
    const auto oldV = impl::strView(oldTerm);
    const auto newV = impl::strView(newTerm);
    assert(!oldV.empty());

    for (size_t pos = str.find(oldV); pos != S::npos; pos = str.find(oldV, pos + newV.size()))
        str.replace(pos, oldV.size(), newV);
}


template <class S, class T, class U> inline
S replaceCpy(S str, const T& oldTerm, const U& newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_integral_v<Num>);

    char buffer[64] = {};
    const std::to_chars_result rv = std::to_chars(std::begin(buffer), std::end(buffer), number);
    assert(rv.ec == std::errc());

    return S(std::begin(buffer), rv.ptr); //digits are ASCII => valid for char and wchar_t
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    static_assert(std::is_integral_v<Num>);

    std::string digits; //from_chars() does not support wchar_t
    for (const auto c : impl::strView(str))
        digits += static_cast<char>(c);

    const char* first = digits.data();
    const char* last  = digits.data() + digits.size();

    while (first != last && isWhiteSpace(*first))
        ++first;
    if (first != last && *first == '+')
        ++first;

    Num number = 0;
    const std::from_chars_result rv = std::from_chars(first, last, number);
    if (rv.ec != std::errc())
        return 0;
    return number;
}
}

#endif //STRING_TOOLS_H_5812733690154283
