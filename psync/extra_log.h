// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef EXTRA_LOG_H_8720439165820743
#define EXTRA_LOG_H_8720439165820743

#include <functional>
#include <mutex>
#include "error_log.h"

/*  log errors in "exceptional situations" when no other means are available, e.g.
    - while an exception is in flight
    - cleanup errors
    - library initialization                                */

namespace psync
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
        std::lock_guard dummy(lock_);
        reportOutstandingLog_ = reportOutstandingLog;
    }

    ErrorLog fetchLog()
    {
        std::lock_guard dummy(lock_);
        return std::exchange(log_, ErrorLog());
    }

    void logError(const std::wstring& msg) //nothrow!
    {
        std::lock_guard dummy(lock_);
        logMsg(log_, msg, MSG_TYPE_ERROR);
    }

private:
    std::mutex lock_;
    ErrorLog log_;
    std::function<void(const ErrorLog& log)> reportOutstandingLog_;
};


inline ExtraLog& getExtraLog()
{
    static ExtraLog inst;
    return inst;
}
}


inline
void initExtraLog(const std::function<void(const ErrorLog& log)>& reportOutstandingLog /*nothrow! runs during global shutdown!*/)
{
    impl::getExtraLog().init(reportOutstandingLog);
}


inline
void logExtraError(const std::wstring& msg) //nothrow!
{
    impl::getExtraLog().logError(msg);
}


inline
ErrorLog fetchExtraLog()
{
    return impl::getExtraLog().fetchLog();
}
}

#endif //EXTRA_LOG_H_8720439165820743
