// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SYNC_EVENTS_H_2759104836201573
#define SYNC_EVENTS_H_2759104836201573

#include <cassert>
#include "process_callback.h"


namespace psync
{
struct SyncStatusEvent
{
    std::string profileId;
    SyncStatus status = SyncStatus::syncing;
    std::wstring errorMsg; //optional
};

struct SyncProgressEvent
{
    std::string profileId;
    ProcessPhase phase = ProcessPhase::upload; //upload or download
    int done  = 0;
    int total = 0;
};


//receives notifications of all sync passes
//THREAD-SAFETY: called from the profile queue worker threads
struct SyncEventSink
{
    virtual ~SyncEventSink() {}

    virtual void onSyncStatus  (const SyncStatusEvent&   event) = 0; //noexcept
    virtual void onSyncProgress(const SyncProgressEvent& event) = 0; //
};


inline
const char* getSyncStatusLabel(SyncStatus status)
{
    switch (status)
    {
        case SyncStatus::syncing:
            return "syncing";
        case SyncStatus::synced:
            return "synced";
        case SyncStatus::error:
            return "error";
        case SyncStatus::disabled:
            return "disabled";
        case SyncStatus::waiting:
            return "waiting";
    }
    assert(false);
    return "error";
}


inline
const char* getPhaseLabel(ProcessPhase phase)
{
    switch (phase)
    {
        case ProcessPhase::none:
            return "none";
        case ProcessPhase::scan:
            return "scan";
        case ProcessPhase::upload:
            return "upload";
        case ProcessPhase::download:
            return "download";
    }
    assert(false);
    return "none";
}
}

#endif //SYNC_EVENTS_H_2759104836201573
