// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "sync_context.h"
#include <psync/extra_log.h>
#include "../afs/object_store_http.h"
#include "log_file.h"
#include "sync_status_handler.h"

using namespace psync;


namespace
{
std::unique_ptr<ObjectStore> createHttpObjectStore(const SyncConfig& cfg) //throw FileError
{
    try
    {
        return std::make_unique<HttpObjectStore>(HttpStoreAccess
        {
            .serverUrl      = cfg.serverUrl,
            .token          = cfg.token,
            .caCertFilePath = cfg.caCertFilePath,
            .timeoutSec     = cfg.timeoutSec,
        }); //throw SysError
    }
    catch (const SysError& e)
    {
        throw FileError(replaceCpy(_("Cannot connect to sync server %x."), L"%x", fmtPath(cfg.serverUrl)), e.toString());
    }
}
}


SyncContext::SyncContext(const SyncConfig& cfg, SyncEventSink* eventSink) : //throw FileError
    SyncContext(cfg, createHttpObjectStore(cfg), eventSink) {}


SyncContext::SyncContext(const SyncConfig& cfg, std::unique_ptr<ObjectStore>&& store, SyncEventSink* eventSink) :
    cfg_(cfg),
    eventSink_(eventSink),
    store_(std::move(store)),
    profileStore_(cfg.profilesFolder),
    entityStore_(cfg.entitiesFolder),
    env_
{
    .store           = *store_,
    .profileStore    = profileStore_,
    .entityStore     = entityStore_,
    .excludePatterns = getExcludePatterns(cfg),
    .transferThreads = cfg.transferThreads,
}
{
    if (!store_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


SyncContext::~SyncContext()
{
    {
        std::lock_guard dummy(lock_);
        for (auto& [profileId, queue] : queues_)
        {
            queue->worker.requestStop(); //stop *all* at the same time before joining one by one
            if (queue->activeHandler)
                queue->activeHandler->userRequestAbort(); //file transfers are not interrupted by ThreadStopRequest alone
        }
    }
    queues_.clear(); //join
}


SyncContext::ProfileSyncQueue& SyncContext::getQueue(const std::string& profileId) //context: lock_ held!
{
    std::unique_ptr<ProfileSyncQueue>& queue = queues_[profileId];
    if (!queue)
    {
        queue = std::make_unique<ProfileSyncQueue>();
        queue->worker = InterruptibleThread([this, profileId, &q = *queue]
        {
            setCurrentThreadName(Zstr("Sync: ") + utfTo<Zstring>(profileId));
            runProfileQueue(profileId, q); //throw ThreadStopRequest
        });
    }
    return *queue;
}


void SyncContext::emitStatus(const std::string& profileId, SyncStatus status, const std::wstring& errorMsg)
{
    if (eventSink_)
        eventSink_->onSyncStatus({profileId, status, errorMsg});
}


void SyncContext::requestProfileSync(const std::string& profileId) //throw FileError, ErrorInvalidData
{
    checkObjectId(profileId); //throw ErrorInvalidData

    const std::optional<ProfileRecord> profile = profileStore_.loadProfile(profileId); //throw FileError, ErrorSerialization, ErrorInvalidData
    if (!profile)
        throw FileError(replaceCpy(_("Profile %x does not exist."), L"%x", fmtPath(profileId)));

    if (profile->syncMode == SyncMode::disabled)
        return emitStatus(profileId, SyncStatus::disabled, std::wstring());

    {
        std::unique_lock dummy(lock_);
        if (deletingProfiles_.contains(profileId))
            return;

        if (runningProfiles_.contains(profileId))
        {
            deferredProfiles_.insert(profileId);
            dummy.unlock();
            return emitStatus(profileId, SyncStatus::waiting, std::wstring());
        }

        ProfileSyncQueue& queue = getQueue(profileId);
        queue.syncPending = true; //coalesce with request that is already pending
        queue.conditionNewRequest.notify_all();
    }
}


void SyncContext::markProfileRunning(const std::string& profileId)
{
    std::lock_guard dummy(lock_);
    runningProfiles_.insert(profileId);
}


void SyncContext::markProfileStopped(const std::string& profileId)
{
    std::lock_guard dummy(lock_);
    runningProfiles_.erase(profileId);

    if (deferredProfiles_.erase(profileId) != 0 &&
        !deletingProfiles_.contains(profileId))
    {
        ProfileSyncQueue& queue = getQueue(profileId);
        queue.syncPending = true;
        queue.conditionNewRequest.notify_all();
    }
}


bool SyncContext::cancelProfileSync(const std::string& profileId)
{
    bool cancelled = false;
    {
        std::lock_guard dummy(lock_);
        if (deferredProfiles_.erase(profileId) != 0)
            cancelled = true;

        if (auto it = queues_.find(profileId);
            it != queues_.end())
        {
            ProfileSyncQueue& queue = *it->second;
            if (queue.syncPending)
            {
                queue.syncPending = false;
                cancelled = true;
            }
            if (queue.activeHandler)
            {
                queue.activeHandler->userRequestAbort(); //pass ends with AbortProcess at the next requestUiUpdate()
                cancelled = true;
            }
        }
    }
    conditionIdle_.notify_all();
    return cancelled;
}


bool SyncContext::isProfileSyncActive(const std::string& profileId)
{
    std::lock_guard dummy(lock_);
    if (auto it = queues_.find(profileId);
        it != queues_.end())
        return it->second->syncPending || it->second->syncActive;
    return false;
}


void SyncContext::waitUntilIdle()
{
    std::unique_lock dummy(lock_);
    conditionIdle_.wait(dummy, [this]
    {
        for (const auto& [profileId, queue] : queues_)
            if (queue->syncPending || queue->syncActive)
                return false;
        return true;
    });
}


void SyncContext::runProfileQueue(const std::string& profileId, ProfileSyncQueue& queue) //throw ThreadStopRequest
{
    for (;;)
    {
        {
            std::unique_lock dummy(lock_);
            interruptibleWait(queue.conditionNewRequest, dummy, [&queue] { return queue.syncPending; }); //throw ThreadStopRequest
            queue.syncPending = false;

            if (runningProfiles_.contains(profileId)) //browser was started after the request was queued
            {
                deferredProfiles_.insert(profileId);
                dummy.unlock();
                emitStatus(profileId, SyncStatus::waiting, std::wstring());
                conditionIdle_.notify_all();
                continue;
            }
            queue.syncActive = true;
        }

        runSyncPass(profileId, queue); //throw ThreadStopRequest

        {
            std::lock_guard dummy(lock_);
            queue.syncActive = false;
        }
        conditionIdle_.notify_all();
    }
}


void SyncContext::runSyncPass(const std::string& profileId, ProfileSyncQueue& queue) //throw ThreadStopRequest
{
    const time_t startTime = std::time(nullptr);
    const auto startTimeSteady = std::chrono::steady_clock::now();

    SyncStatusHandler statusHandler(profileId, eventSink_);
    {
        std::lock_guard dummy(lock_);
        queue.activeHandler = &statusHandler;
    }
    PSYNC_ON_SCOPE_EXIT(std::lock_guard dummy(lock_); queue.activeHandler = nullptr);

    try
    {
        const std::optional<ProfileRecord> profile = profileStore_.loadProfile(profileId); //throw FileError, ErrorSerialization, ErrorInvalidData
        if (!profile)
            throw FileError(replaceCpy(_("Profile %x does not exist."), L"%x", fmtPath(profileId)));

        syncProfile(*profile, env_, statusHandler); //throw FileError, AbortProcess
    }
    catch (const FileError& e) { statusHandler.reportFinalError(e.toString()); }
    catch (AbortProcess&) { statusHandler.reportFinalError(_("Synchronization cancelled.")); }

    if (!cfg_.logFolder.empty() &&
        statusHandler.getFinalStatus() != SyncStatus::disabled)
        try
        {
            const SyncSummary summary
            {
                .profileId = profileId,
                .result    = statusHandler.getFinalStatus().value_or(SyncStatus::error),
                .startTime = startTime,
                .totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTimeSteady),
            };
            saveLogFile(cfg_.logFolder, summary, statusHandler.getErrorLog(), cfg_.logfilesMaxAgeDays); //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); }
}


std::vector<std::string> SyncContext::checkForMissingSyncedProfiles(PhaseCallback& callback) //throw ErrorTransfer, X
{
    return psync::checkForMissingSyncedProfiles(env_, eventSink_, callback); //throw ErrorTransfer, X
}


int SyncContext::checkForMissingSyncedEntities(PhaseCallback& callback) //throw ErrorTransfer, X
{
    return psync::checkForMissingSyncedEntities(env_, callback); //throw ErrorTransfer, X
}


DeletePrefixResult SyncContext::deleteProfile(const std::string& profileId) //throw FileError
{
    checkObjectId(profileId); //throw ErrorInvalidData

    std::unique_ptr<ProfileSyncQueue> queueOld;
    {
        std::lock_guard dummy(lock_);
        deletingProfiles_.insert(profileId);
    }
    PSYNC_ON_SCOPE_EXIT(std::lock_guard dummy(lock_); deletingProfiles_.erase(profileId));

    cancelProfileSync(profileId);
    {
        //a pass beyond its last cancellation point may still upload metadata and manifest: wait until it is done
        std::unique_lock dummy(lock_);
        conditionIdle_.wait(dummy, [&]
        {
            auto it = queues_.find(profileId);
            return it == queues_.end() || (!it->second->syncPending && !it->second->syncActive);
        });

        if (auto it = queues_.find(profileId);
            it != queues_.end())
        {
            queueOld = std::move(it->second);
            queues_.erase(it);
        }
    }
    queueOld.reset(); //join worker *without* holding lock_

    return psync::deleteProfile(profileId, env_); //throw FileError
}


DeleteResult SyncContext::deleteEntity(EntityKind kind, const std::string& entityId) //throw FileError
{
    return psync::deleteEntity(kind, entityId, env_); //throw FileError
}


EntitySyncResult SyncContext::syncEntity(EntityKind kind, const std::string& entityId, PhaseCallback& callback) //throw FileError, X
{
    return psync::syncEntity(kind, entityId, env_, callback); //throw FileError, X
}
