// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SYNC_CONTEXT_H_1470385926410738
#define SYNC_CONTEXT_H_1470385926410738

#include <map>
#include <set>
#include <psync/thread.h>
#include "config.h"
#include "sync_engine.h"


namespace psync
{
class SyncStatusHandler;

/*  Application-session state: object store, local stores and one queue worker per profile

    - sync requests for the same profile are coalesced while pending and never run concurrently
    - different profiles sync in parallel
    - a profile in use by the browser is not synced: "waiting" until markProfileStopped()   */
class SyncContext
{
public:
    SyncContext(const SyncConfig& cfg, SyncEventSink* eventSink /*optional*/); //throw FileError
    SyncContext(const SyncConfig& cfg, std::unique_ptr<ObjectStore>&& store, SyncEventSink* eventSink /*optional*/);
    ~SyncContext();

    //non-blocking: pass runs on the profile's queue worker
    void requestProfileSync(const std::string& profileId); //throw FileError, ErrorInvalidData

    void markProfileRunning(const std::string& profileId);
    void markProfileStopped(const std::string& profileId); //runs deferred sync request, if any

    //abort active pass and drop pending request: returns false if there was nothing to cancel
    bool cancelProfileSync(const std::string& profileId);

    bool isProfileSyncActive(const std::string& profileId);

    //block until all queues are empty (shutdown, tests)
    void waitUntilIdle();

    std::vector<std::string> checkForMissingSyncedProfiles(PhaseCallback& callback); //throw ErrorTransfer, X
    int checkForMissingSyncedEntities(PhaseCallback& callback); //throw ErrorTransfer, X

    //cancel and wait for the profile's pass, then delete it remotely; sync requests during deletion are dropped
    DeletePrefixResult deleteProfile(const std::string& profileId); //throw FileError
    DeleteResult deleteEntity(EntityKind kind, const std::string& entityId); //throw FileError

    EntitySyncResult syncEntity(EntityKind kind, const std::string& entityId, PhaseCallback& callback); //throw FileError, X

    const SyncConfig& getConfig() const { return cfg_; }
    const SyncEnvironment& getEnvironment() const { return env_; }

private:
    SyncContext           (const SyncContext&) = delete;
    SyncContext& operator=(const SyncContext&) = delete;

    struct ProfileSyncQueue
    {
        bool syncPending = false;
        bool syncActive  = false;
        SyncStatusHandler* activeHandler = nullptr; //valid while syncActive
        std::condition_variable conditionNewRequest;
        InterruptibleThread worker;
    };

    ProfileSyncQueue& getQueue(const std::string& profileId); //context: lock_ held!
    void runProfileQueue(const std::string& profileId, ProfileSyncQueue& queue); //throw ThreadStopRequest
    void runSyncPass(const std::string& profileId, ProfileSyncQueue& queue); //throw ThreadStopRequest
    void emitStatus(const std::string& profileId, SyncStatus status, const std::wstring& errorMsg);

    const SyncConfig cfg_;
    SyncEventSink* const eventSink_;

    const std::unique_ptr<ObjectStore> store_;
    LocalProfileStore profileStore_;
    LocalEntityStore entityStore_;
    const SyncEnvironment env_;

    std::mutex lock_;
    std::condition_variable conditionIdle_;
    std::set<std::string> runningProfiles_; //used by browser
    std::set<std::string> deferredProfiles_; //sync requested while running
    std::set<std::string> deletingProfiles_;
    std::map<std::string, std::unique_ptr<ProfileSyncQueue>> queues_; //workers reference all of the above => destroy first
};
}

#endif //SYNC_CONTEXT_H_1470385926410738
