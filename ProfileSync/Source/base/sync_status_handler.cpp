// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "sync_status_handler.h"

using namespace psync;


void SyncStatusHandler::initNewPhase(int itemsTotal, int64_t bytesTotal, ProcessPhase phase)
{
    StatusHandler::initNewPhase(itemsTotal, bytesTotal, phase);
    lastReportedStats_ = {-1, -1};
}


void SyncStatusHandler::logMessage(const std::wstring& msg, MsgType type) //throw AbortProcess
{
    logMsg(errorLog_, msg, [&]
    {
        switch (type)
        {
            //*INDENT-OFF*
            case MsgType::info:    return MSG_TYPE_INFO;
            case MsgType::warning: return MSG_TYPE_WARNING;
            case MsgType::error:   return MSG_TYPE_ERROR;
            //*INDENT-ON*
        }
        assert(false);
        return MSG_TYPE_ERROR;
    }());

    requestUiUpdate(false /*force*/); //throw AbortProcess
}


void SyncStatusHandler::reportSyncStatus(SyncStatus status, const std::wstring& errorMsg)
{
    lastStatus_ = status;

    if (eventSink_)
        eventSink_->onSyncStatus({profileId_, status, errorMsg});
}


void SyncStatusHandler::forceUiUpdateNoThrow()
{
    const ProcessPhase phase = currentPhase();
    if (phase != ProcessPhase::upload &&
        phase != ProcessPhase::download)
        return;

    const ProgressStats statsCurrent = getStatsCurrent();
    if (statsCurrent.items == lastReportedStats_.items) //progress is reported per completed file
        return;
    lastReportedStats_ = statsCurrent;

    if (eventSink_)
        eventSink_->onSyncProgress({profileId_, phase, statsCurrent.items, getStatsTotal().items});
}


void SyncStatusHandler::reportFinalError(const std::wstring& errorMsg)
{
    logMsg(errorLog_, errorMsg, MSG_TYPE_ERROR);
    reportSyncStatus(SyncStatus::error, errorMsg);
}
