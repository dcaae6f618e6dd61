// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef PROCESS_CALLBACK_H_6204918375302841
#define PROCESS_CALLBACK_H_6204918375302841

#include <string>
#include <cstdint>
#include <chrono>


namespace psync
{
struct PhaseCallback
{
    virtual ~PhaseCallback() {}

    //note: this one must NOT throw in order to properly allow undoing setting of statistics!
    //it is in general paired with a call to requestUiUpdate() to compensate!
    virtual void updateDataProcessed(int itemsDelta, int64_t bytesDelta) = 0; //noexcept!
    virtual void updateDataTotal    (int itemsDelta, int64_t bytesDelta) = 0; //

    //opportunity to abort must be implemented in a frequently-executed method like requestUiUpdate()
    virtual void requestUiUpdate(bool force = false) = 0; //throw X

    //UI info only, should *not* be logged
    virtual void updateStatus(const std::wstring& msg) = 0; //throw X

    enum class MsgType
    {
        info,
        warning,
        error,
    };
    //log only; must *not* call updateStatus()!
    virtual void logMessage(const std::wstring& msg, MsgType type) = 0; //throw X
};


//progress events are not emitted more often than this
constexpr std::chrono::milliseconds UI_UPDATE_INTERVAL(100);


enum class ProcessPhase
{
    none, //initial status
    scan,
    upload,
    download,
};

enum class SyncStatus
{
    syncing,
    synced,
    error,
    disabled,
    waiting,
};

//report status during a profile or entity sync pass
struct ProcessCallback : public PhaseCallback
{
    //informs about the amount of data that will be processed in the next phase
    virtual void initNewPhase(int itemsTotal, int64_t bytesTotal, ProcessPhase phaseId) = 0; //throw X

    virtual void reportSyncStatus(SyncStatus status, const std::wstring& errorMsg /*optional*/) = 0; //throw X
};
}

#endif //PROCESS_CALLBACK_H_6204918375302841
