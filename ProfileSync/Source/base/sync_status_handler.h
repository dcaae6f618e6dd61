// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SYNC_STATUS_HANDLER_H_6014937285160392
#define SYNC_STATUS_HANDLER_H_6014937285160392

#include <psync/error_log.h>
#include "status_handler.h"
#include "sync_events.h"


namespace psync
{
//collects the log of one sync pass and forwards status and progress to the event sink
class SyncStatusHandler : public StatusHandler
{
public:
    SyncStatusHandler(const std::string& profileId, SyncEventSink* eventSink /*optional*/) :
        profileId_(profileId), eventSink_(eventSink) {}

    void initNewPhase(int itemsTotal, int64_t bytesTotal, ProcessPhase phase) override; //
    void logMessage(const std::wstring& msg, MsgType type) override; //throw AbortProcess
    void reportSyncStatus(SyncStatus status, const std::wstring& errorMsg) override; //

    void forceUiUpdateNoThrow() override;

    //pass failed or was cancelled: log + "error" status; does not check for abort
    void reportFinalError(const std::wstring& errorMsg); //noexcept

    const std::string& getProfileId() const { return profileId_; }
    const ErrorLog& getErrorLog() const { return errorLog_; }
    std::optional<SyncStatus> getFinalStatus() const { return lastStatus_; }

private:
    const std::string profileId_;
    SyncEventSink* const eventSink_;

    ErrorLog errorLog_;
    std::optional<SyncStatus> lastStatus_;
    ProgressStats lastReportedStats_{-1, -1};
};
}

#endif //SYNC_STATUS_HANDLER_H_6014937285160392
