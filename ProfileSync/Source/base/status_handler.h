// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef STATUS_HANDLER_H_7520938416270385
#define STATUS_HANDLER_H_7520938416270385

#include <atomic>
#include <cassert>
#include <optional>
#include <psync/i18n.h>
#include "process_callback.h"


namespace psync
{
//Exception class used to abort a sync pass
class AbortProcess {};


struct ProgressStats
{
    int     items = 0;
    int64_t bytes = 0;

    bool operator==(const ProgressStats&) const = default;
};


//partial callback implementation with common functionality: statistics, throttling, abort
class StatusHandler : public ProcessCallback
{
public:
    //implement parts of ProcessCallback
    void initNewPhase(int itemsTotal, int64_t bytesTotal, ProcessPhase phase) override //(throw X)
    {
        assert((itemsTotal < 0) == (bytesTotal < 0));
        currentPhase_ = phase;
        statsCurrent_ = {};
        statsTotal_ = { itemsTotal, bytesTotal };
        lastUiUpdate_ = std::chrono::steady_clock::time_point();
    }

    void updateDataProcessed(int itemsDelta, int64_t bytesDelta) override { updateData(statsCurrent_, itemsDelta, bytesDelta); } //note: these methods MUST NOT throw in order
    void updateDataTotal    (int itemsDelta, int64_t bytesDelta) override { updateData(statsTotal_,   itemsDelta, bytesDelta); } //to allow usage within destructors!

    void requestUiUpdate(bool force) final //throw AbortProcess
    {
        const auto now = std::chrono::steady_clock::now();
        if (force || now >= lastUiUpdate_ + UI_UPDATE_INTERVAL)
        {
            lastUiUpdate_ = now;
            forceUiUpdateNoThrow();
        }

        //triggered by userRequestAbort() from any thread
        if (abortRequested_)
            throw AbortProcess();
    }

    virtual void forceUiUpdateNoThrow() = 0; //noexcept

    void updateStatus(const std::wstring& msg) final //throw AbortProcess
    {
        statusText_ = msg; //update *before* running operations that can throw
        requestUiUpdate(false /*force*/); //throw AbortProcess
    }

    //context of any thread: does NOT abort immediately, but at the next requestUiUpdate()
    void userRequestAbort() { abortRequested_ = true; }

    bool abortRequested() const { return abortRequested_; }

    ProcessPhase currentPhase() const { return currentPhase_; }

    ProgressStats getStatsCurrent() const { return statsCurrent_; }
    ProgressStats getStatsTotal  () const { return statsTotal_; }

    const std::wstring& currentStatusText() const { return statusText_; }

private:
    void updateData(ProgressStats& stats, int itemsDelta, int64_t bytesDelta)
    {
        assert(stats.items >= 0);
        assert(stats.bytes >= 0);
        stats.items += itemsDelta;
        stats.bytes += bytesDelta;
    }

    ProcessPhase currentPhase_ = ProcessPhase::none;
    ProgressStats statsCurrent_;
    ProgressStats statsTotal_ { -1, -1 };
    std::wstring statusText_;
    std::chrono::steady_clock::time_point lastUiUpdate_;

    std::atomic<bool> abortRequested_{false};
};
}

#endif //STATUS_HANDLER_H_7520938416270385
