// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef STATUS_HANDLER_IMPL_H_1938204756183047
#define STATUS_HANDLER_IMPL_H_1938204756183047

#include <psync/file_error.h>
#include <psync/thread.h>
#include "process_callback.h"


namespace psync
{
class AsyncCallback //actor pattern
{
public:
    AsyncCallback() {}

    //non-blocking: context of worker thread
    void updateDataProcessed(int itemsDelta, int64_t bytesDelta) //noexcept!
    {
        itemsDeltaProcessed_ += itemsDelta;
        bytesDeltaProcessed_ += bytesDelta;
    }
    void updateDataTotal(int itemsDelta, int64_t bytesDelta) //noexcept!
    {
        itemsDeltaTotal_ += itemsDelta;
        bytesDeltaTotal_ += bytesDelta;
    }

    //context of worker thread
    void updateStatus(std::wstring&& msg) //throw ThreadStopRequest
    {
        {
            std::lock_guard dummy(lockCurrentStatus_);
            currentStatus_ = std::move(msg);
        }
        interruptionPoint(); //throw ThreadStopRequest
    }

    //blocking call: context of worker thread
    void logMessage(const std::wstring& msg, PhaseCallback::MsgType type) //throw ThreadStopRequest
    {
        {
            std::unique_lock dummy(lockRequest_);
            interruptibleWait(conditionReadyForNewRequest_, dummy, [this] { return !logMsgRequest_; }); //throw ThreadStopRequest

            logMsgRequest_ = LogMsgRequest{msg, type};
        }
        conditionNewRequest_.notify_all();
    }

    //context of pass thread
    void waitUntilDone(std::chrono::milliseconds cbInterval, PhaseCallback& cb) //throw X
    {
        for (;;)
        {
            const std::chrono::steady_clock::time_point callbackTime = std::chrono::steady_clock::now() + cbInterval;

            for (std::unique_lock dummy(lockRequest_);;) //process all log messages without delay
            {
                const bool rv = conditionNewRequest_.wait_until(dummy, callbackTime, [this] { return logMsgRequest_ || finishNowRequest_; });
                if (!rv) //time-out + condition not met
                    break;

                if (logMsgRequest_)
                {
                    const LogMsgRequest request = std::exchange(logMsgRequest_, std::nullopt).value();
                    conditionReadyForNewRequest_.notify_all();

                    dummy.unlock(); //call back outside of mutex scope:
                    cb.logMessage(request.msg, request.type); //throw X
                    dummy.lock();
                }
                if (finishNowRequest_ && !logMsgRequest_)
                {
                    dummy.unlock(); //call member functions outside of mutex scope:
                    reportStats(cb); //one last call for accurate stat-reporting!
                    return;
                }
            }

            //call back outside of mutex scope:
            reportStats(cb);
            cb.updateStatus(getCurrentStatus()); //throw X
        }
    }

    //context of worker thread
    void notifyAllDone() //noexcept
    {
        {
            std::lock_guard dummy(lockRequest_);
            assert(!finishNowRequest_);
            finishNowRequest_ = true;
        }
        conditionNewRequest_.notify_all();
    }

private:
    AsyncCallback           (const AsyncCallback&) = delete;
    AsyncCallback& operator=(const AsyncCallback&) = delete;

    //context of pass thread
    void reportStats(PhaseCallback& cb)
    {
        const std::pair<int, int64_t> deltaProcessed(itemsDeltaProcessed_, bytesDeltaProcessed_);
        if (deltaProcessed.first != 0 || deltaProcessed.second != 0)
        {
            updateDataProcessed   (-deltaProcessed.first, -deltaProcessed.second); //careful with these atomics: don't just set to 0
            cb.updateDataProcessed( deltaProcessed.first,  deltaProcessed.second); //noexcept!
        }
        const std::pair<int, int64_t> deltaTotal(itemsDeltaTotal_, bytesDeltaTotal_);
        if (deltaTotal.first != 0 || deltaTotal.second != 0)
        {
            updateDataTotal   (-deltaTotal.first, -deltaTotal.second);
            cb.updateDataTotal( deltaTotal.first,  deltaTotal.second); //noexcept!
        }
    }

    std::wstring getCurrentStatus()
    {
        std::lock_guard dummy(lockCurrentStatus_);
        return currentStatus_;
    }

    struct LogMsgRequest
    {
        std::wstring msg;
        PhaseCallback::MsgType type = PhaseCallback::MsgType::error;
    };

    //---- pass thread <-> worker communication channel ----
    std::mutex lockRequest_;
    std::condition_variable conditionReadyForNewRequest_;
    std::condition_variable conditionNewRequest_;
    std::optional<LogMsgRequest> logMsgRequest_;
    bool finishNowRequest_ = false;

    //---- status updates ----
    std::mutex lockCurrentStatus_; //different lock for status updates so that we're not blocked by other threads logging
    std::wstring currentStatus_;

    //---- status updates II (lock-free) ----
    std::atomic<int>     itemsDeltaProcessed_{0}; //
    std::atomic<int64_t> bytesDeltaProcessed_{0}; //std:atomic is uninitialized by default!
    std::atomic<int>     itemsDeltaTotal_    {0}; //
    std::atomic<int64_t> bytesDeltaTotal_    {0}; //
};

//=====================================================================================================================

using ParallelWorkItem = std::function<void(AsyncCallback& acb)> /*throw ThreadStopRequest*/;

//run all work items on at most "threadCount" worker threads; callback runs on the calling thread only
inline
void massParallelExecute(const std::vector<ParallelWorkItem>& workload,
                         size_t threadCount,
                         const Zstring& threadGroupName,
                         PhaseCallback& callback /*throw X*/) //throw X
{
    if (workload.empty())
        return; //[!] otherwise AsyncCallback::notifyAllDone() is never called!

    AsyncCallback acb; //manage life time: enclose ThreadGroup's!!!

    //---------------------------------------------------------------------------------------------------------
    ThreadGroup<std::function<void()>> threadGroup(std::max<size_t>(threadCount, 1), threadGroupName); //worker threads live here...
    //---------------------------------------------------------------------------------------------------------

    for (const ParallelWorkItem& task : workload)
        threadGroup.run([&acb, &task]
    {
        task(acb); //throw ThreadStopRequest
    });

    threadGroup.notifyWhenDone([&acb] /*noexcept! runs on worker thread!*/
    {
        acb.notifyAllDone(); //noexcept
    });

    acb.waitUntilDone(UI_UPDATE_INTERVAL / 2 /*every ~50 ms*/, callback); //throw X
}
}

#endif //STATUS_HANDLER_IMPL_H_1938204756183047
