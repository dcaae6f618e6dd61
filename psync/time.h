// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef TIME_H_6201483967420938
#define TIME_H_6201483967420938

#include <ctime>
#include <optional>
#include "string_tools.h"
#include "zstring.h"


namespace psync
{
struct TimeComp //replaces std::tm and SYSTEMTIME
{
    int year   = 0; // -
    int month  = 0; //1-12
    int day    = 0; //1-31
    int hour   = 0; //0-23
    int minute = 0; //0-59
    int second = 0; //0-60 (including leap second)

    bool operator==(const TimeComp&) const = default;
};

TimeComp getUtcTime(time_t utc); //convert time_t (UTC) to UTC time components, returns TimeComp() on error
std::pair<time_t, bool /*success*/> utcToTimeT(const TimeComp& tc); //convert UTC time components to time_t (UTC)

TimeComp getLocalTime(time_t utc = std::time(nullptr)); //returns TimeComp() on error

//format as specified by "std::strftime", returns empty string on error
Zstring formatTime(const Zchar* format, const TimeComp& tc);

const Zchar* const formatIsoDateTag     = Zstr("%Y-%m-%d");          //e.g. 2001-08-23
const Zchar* const formatIsoTimeTag     = Zstr("%H:%M:%S");          //e.g. 14:55:02
const Zchar* const formatIsoDateTimeTag = Zstr("%Y-%m-%d %H:%M:%S"); //e.g. 2001-08-23 14:55:02

//RFC 3339 timestamps as exchanged with the sync server: "2024-01-02T00:00:00Z"
std::string formatRfc3339(time_t utc);

//accepts fractional seconds and "Z" or "+hh:mm"/"-hh:mm" offsets; returns none if not parsable
std::optional<time_t> parseRfc3339(std::string_view str);








//############################ implementation ##############################
namespace impl
{
inline
std::tm toClibTimeComponents(const TimeComp& tc)
{
    std::tm ctc{};
    ctc.tm_year  = tc.year - 1900; //years since 1900
    ctc.tm_mon   = tc.month - 1;   //0-11
    ctc.tm_mday  = tc.day;         //1-31
    ctc.tm_hour  = tc.hour;        //0-23
    ctc.tm_min   = tc.minute;      //0-59
    ctc.tm_sec   = tc.second;      //0-60 (including leap second)
    ctc.tm_isdst = -1;             //> 0 if DST is active, == 0 if DST is not active, < 0 if the information is not available
    return ctc;
}


inline
TimeComp toTimeComponents(const std::tm& ctc)
{
    TimeComp tc;
    tc.year   = ctc.tm_year + 1900;
    tc.month  = ctc.tm_mon + 1;
    tc.day    = ctc.tm_mday;
    tc.hour   = ctc.tm_hour;
    tc.minute = ctc.tm_min;
    tc.second = ctc.tm_sec;
    return tc;
}


inline
bool isValid(const TimeComp& tc)
{
    return 1 <= tc.month  && tc.month  <= 12 &&
           1 <= tc.day    && tc.day    <= 31 &&
           0 <= tc.hour   && tc.hour   <= 23 &&
           0 <= tc.minute && tc.minute <= 59 &&
           0 <= tc.second && tc.second <= 60;
}


//parse fixed-width number; return -1 on error
inline
int parseDigits(std::string_view str, size_t pos, size_t count)
{
    if (pos + count > str.size())
        return -1;

    int num = 0;
    for (size_t i = pos; i < pos + count; ++i)
    {
        if (!isDigit(str[i]))
            return -1;
        num = num * 10 + (str[i] - '0');
    }
    return num;
}
}


inline
TimeComp getUtcTime(time_t utc)
{
    std::tm ctc{};
    if (!::gmtime_r(&utc, &ctc))
        return TimeComp();
    return impl::toTimeComponents(ctc);
}


inline
std::pair<time_t, bool /*success*/> utcToTimeT(const TimeComp& tc)
{
    if (!impl::isValid(tc))
        return {};

    std::tm ctc = impl::toClibTimeComponents(tc);
    ctc.tm_isdst = 0;

    const time_t utc = ::timegm(&ctc);
    if (utc == -1 && !(tc == TimeComp{1969, 12, 31, 23, 59, 59}))
        return {};
    return {utc, true};
}


inline
TimeComp getLocalTime(time_t utc)
{
    std::tm ctc{};
    if (!::localtime_r(&utc, &ctc))
        return TimeComp();
    return impl::toTimeComponents(ctc);
}


inline
Zstring formatTime(const Zchar* format, const TimeComp& tc)
{
    if (tc == TimeComp()) //failure code from getLocalTime()
        return Zstring();

    std::tm ctc = impl::toClibTimeComponents(tc);
    std::mktime(&ctc); //fill in tm_wday and tm_yday for %a etc.

    Zchar buffer[256] = {};
    const size_t charsWritten = std::strftime(buffer, std::size(buffer), format, &ctc);
    return Zstring(buffer, charsWritten);
}


inline
std::string formatRfc3339(time_t utc)
{
    const TimeComp tc = getUtcTime(utc);
    if (tc == TimeComp())
        return std::string();

    return formatTime(Zstr("%Y-%m-%dT%H:%M:%SZ"), tc);
}


inline
std::optional<time_t> parseRfc3339(std::string_view str)
{
    //2024-01-02T03:04:05[.123456](Z|+01:00)
    using namespace impl;
    TimeComp tc;
    tc.year   = parseDigits(str,  0, 4);
    tc.month  = parseDigits(str,  5, 2);
    tc.day    = parseDigits(str,  8, 2);
    tc.hour   = parseDigits(str, 11, 2);
    tc.minute = parseDigits(str, 14, 2);
    tc.second = parseDigits(str, 17, 2);

    if (str.size() < 20 ||
        str[4] != '-' || str[7] != '-' || str[13] != ':' || str[16] != ':' ||
        (str[10] != 'T' && str[10] != 't' && str[10] != ' ') ||
        tc.year < 0 || tc.month < 0 || tc.day < 0 || tc.hour < 0 || tc.minute < 0 || tc.second < 0)
        return std::nullopt;

    size_t pos = 19;
    if (str[pos] == '.') //fractional seconds: ignore
    {
        ++pos;
        const size_t fracBegin = pos;
        while (pos < str.size() && isDigit(str[pos]))
            ++pos;
        if (pos == fracBegin)
            return std::nullopt;
    }

    if (pos >= str.size())
        return std::nullopt;

    int offsetSec = 0;
    if (str[pos] == 'Z' || str[pos] == 'z')
        ++pos;
    else if (str[pos] == '+' || str[pos] == '-')
    {
        const int offHour = parseDigits(str, pos + 1, 2);
        const int offMin  = parseDigits(str, pos + 4, 2);
        if (offHour < 0 || offMin < 0 || str[pos + 3] != ':')
            return std::nullopt;

        offsetSec = (offHour * 3600 + offMin * 60) * (str[pos] == '-' ? -1 : 1);
        pos += 6;
    }
    else
        return std::nullopt;

    if (pos != str.size())
        return std::nullopt;

    const auto [utc, success] = utcToTimeT(tc);
    if (!success)
        return std::nullopt;

    return utc - offsetSec;
}
}

#endif //TIME_H_6201483967420938
