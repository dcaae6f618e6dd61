// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef UTF_H_2095382146082307
#define UTF_H_2095382146082307

#include <string>
#include <string_view>
#include <type_traits>


namespace psync
{
//convert between UTF-8 (std::string) and UTF-32 (std::wstring on Linux); invalid input is replaced by U+FFFD
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);

//count Unicode code points of an UTF-8 string
size_t unicodeLength(std::string_view utf8);








//######################## implementation ########################
namespace impl
{
template <class Char> inline std::basic_string_view<Char> makeView(const std::basic_string<Char>& str) { return str; }
template <class Char> inline std::basic_string_view<Char> makeView(std::basic_string_view<Char>   str) { return str; }
template <class Char> inline std::basic_string_view<Char> makeView(const Char* str) { return str; }
template <class Char> requires std::is_integral_v<Char>
inline std::basic_string_view<Char> makeView(const Char& c) { return {&c, 1}; }


const char32_t REPLACEMENT_CHAR = 0xfffd;


inline
void appendUtf8(std::string& out, char32_t cp)
{
    if (cp < 0x80)
        out += static_cast<char>(cp);
    else if (cp < 0x800)
    {
        out += static_cast<char>(0xc0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else if (cp < 0x10000)
    {
        out += static_cast<char>(0xe0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else if (cp < 0x110000)
    {
        out += static_cast<char>(0xf0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else
        appendUtf8(out, REPLACEMENT_CHAR);
}


template <class Function> inline
void decodeUtf8(std::string_view str, Function onCodePoint)
{
    for (auto it = str.begin(); it != str.end(); )
    {
        const auto lead = static_cast<unsigned char>(*it++);

        size_t trailCount = 0;
        char32_t cp = 0;
        if (lead < 0x80)
        {
            onCodePoint(static_cast<char32_t>(lead));
            continue;
        }
        else if ((lead & 0xe0) == 0xc0) { trailCount = 1; cp = lead & 0x1f; }
        else if ((lead & 0xf0) == 0xe0) { trailCount = 2; cp = lead & 0x0f; }
        else if ((lead & 0xf8) == 0xf0) { trailCount = 3; cp = lead & 0x07; }
        else
        {
            onCodePoint(REPLACEMENT_CHAR);
            continue;
        }

        bool valid = true;
        for (size_t i = 0; i < trailCount; ++i)
        {
            if (it == str.end() || (static_cast<unsigned char>(*it) & 0xc0) != 0x80)
            {
                valid = false;
                break;
            }
            cp = (cp << 6) | (static_cast<unsigned char>(*it++) & 0x3f);
        }
        onCodePoint(valid && cp < 0x110000 ? cp : REPLACEMENT_CHAR);
    }
}


inline std::string  toUtf8(std::string_view  str) { return std::string(str); }
inline std::string  toUtf8(std::wstring_view str)
{
    std::string output;
    output.reserve(str.size());
    for (const wchar_t c : str)
        appendUtf8(output, static_cast<char32_t>(c));
    return output;
}

inline std::wstring toWide(std::wstring_view str) { return std::wstring(str); }
inline std::wstring toWide(std::string_view   str)
{
    std::wstring output;
    output.reserve(str.size());
    decodeUtf8(str, [&](char32_t cp) { output += static_cast<wchar_t>(cp); });
    return output;
}

template <class T> inline std::string  toUtf8(const T& str) { return toUtf8(makeView(str)); }
template <class T> inline std::wstring toWide(const T& str) { return toWide(makeView(str)); }
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    if constexpr (std::is_same_v<TargetString, std::wstring>)
        return impl::toWide(str);
    else
    {
        static_assert(std::is_same_v<TargetString, std::string>);
        return impl::toUtf8(str);
    }
}


inline
size_t unicodeLength(std::string_view utf8)
{
    size_t len = 0;
    impl::decodeUtf8(utf8, [&](char32_t) { ++len; });
    return len;
}
}

#endif //UTF_H_2095382146082307
