// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef STRING_TOOLS_H_5723047125493867
#define STRING_TOOLS_H_5723047125493867

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <cwchar>
#include "utf.h"


//string helpers working on std::basic_string/std::basic_string_view of char and wchar_t
namespace psync
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only
template <class Char> bool isAsciiAlpha(Char c);
template <class Char> Char asciiToLower(Char c);

template <class S, class T> bool contains  (const S& str, const T& term);
template <class S, class T> bool startsWith(const S& str, const T& prefix);
template <class S, class T> bool endsWith  (const S& str, const T& postfix);

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
template <class S, class Char> [[nodiscard]] std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe);

template <class S> [[nodiscard]] S trimCpy(const S& str);

template <class S, class T, class U> [[nodiscard]] S replaceCpy(S  str, const T& oldTerm, const U& newTerm);
template <class S, class T, class U>            void replace   (S& str, const T& oldTerm, const U& newTerm);

//convert number to string and back; stringTo() returns 0 on error
template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str);

std::pair<char, char> hexify(unsigned char c, bool upperCase = true);
std::string formatAsHexString(std::string_view blob); //lower-case hex








//######################## implementation ########################
template <class Char> inline
bool isWhiteSpace(Char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}


template <class Char> inline
bool isDigit(Char c) { return static_cast<Char>('0') <= c && c <= static_cast<Char>('9'); }


template <class Char> inline
bool isAsciiAlpha(Char c)
{
    return (static_cast<Char>('A') <= c && c <= static_cast<Char>('Z')) ||
           (static_cast<Char>('a') <= c && c <= static_cast<Char>('z'));
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
    return impl::makeView(str).find(impl::makeView(term)) != std::string_view::npos;
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix)
{
    const auto s = impl::makeView(str);
    const auto p = impl::makeView(prefix);
    return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix)
{
    const auto s = impl::makeView(str);
    const auto p = impl::makeView(postfix);
    return s.size() >= p.size() && s.compare(s.size() - p.size(), p.size(), p) == 0;
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto t = impl::makeView(term);
    const size_t pos = impl::makeView(str).rfind(t);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(str.begin() + pos + t.size(), str.end());
}


template <class S, class T> inline
S beforeLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const size_t pos = impl::makeView(str).rfind(impl::makeView(term));
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(str.begin(), str.begin() + pos);
}


template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto t = impl::makeView(term);
    const size_t pos = impl::makeView(str).find(t);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(str.begin() + pos + t.size(), str.end());
}


template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const size_t pos = impl::makeView(str).find(impl::makeView(term));
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(str.begin(), str.begin() + pos);
}


template <class S, class Char> inline
std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe)
{
    std::vector<S> output;
    for (auto it = str.begin();;)
    {
        const auto itDelim = std::find(it, str.end(), delimiter);
        if (itDelim != it || soe == SplitOnEmpty::allow)
            output.emplace_back(it, itDelim);

        if (itDelim == str.end())
            return output;
        it = itDelim + 1;
    }
}


template <class S> inline
S trimCpy(const S& str)
{
    auto itFirst = std::find_if_not(str.begin(), str.end(), [](auto c) { return isWhiteSpace(c); });
    auto itLast  = std::find_if_not(str.rbegin(), str.rend(), [](auto c) { return isWhiteSpace(c); }).base();
    if (itFirst >= itLast)
        return S();
    return S(itFirst, itLast);
}


template <class S, class T, class U> inline
void replace(S& str, const T& oldTerm, const U& newTerm)
{
    const auto oldView = impl::makeView(oldTerm);
    const auto newView = impl::makeView(newTerm);
    if (oldView.empty())
        return;

    for (size_t pos = str.find(oldView); pos != S::npos; pos = str.find(oldView, pos + newView.size()))
        str.replace(pos, oldView.size(), newView);
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
    static_assert(std::is_arithmetic_v<Num>);

    char buffer[64] = {};
    const std::to_chars_result rv = std::to_chars(std::begin(buffer), std::end(buffer), number);
    if (rv.ec != std::errc())
        return S();
    return S(buffer, rv.ptr); //ASCII only => valid for char and wchar_t strings
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    static_assert(std::is_arithmetic_v<Num>);

    std::string ascii;
    for (const auto c : impl::makeView(str))
        ascii += static_cast<char>(c);

    const std::string trimmed = trimCpy(ascii);
    const char* first = trimmed.c_str();
    if (*first == '+')
        ++first;

    Num number = 0;
    const std::from_chars_result rv = std::from_chars(first, trimmed.c_str() + trimmed.size(), number);
    if (rv.ec != std::errc())
        return 0;
    return number;
}


inline
std::pair<char, char> hexify(unsigned char c, bool upperCase)
{
    auto hexifyDigit = [upperCase](int num) -> char
    {
        if (num <= 9)
            return static_cast<char>('0' + num);
        return static_cast<char>((upperCase ? 'A' : 'a') + (num - 10));
    };
    return {hexifyDigit(c / 16), hexifyDigit(c % 16)};
}


inline
std::string formatAsHexString(std::string_view blob)
{
    std::string output;
    output.reserve(blob.size() * 2);
    for (const char c : blob)
    {
        const auto [high, low] = hexify(static_cast<unsigned char>(c), false /*upperCase*/);
        output += high;
        output += low;
    }
    return output;
}
}

#endif //STRING_TOOLS_H_5723047125493867
