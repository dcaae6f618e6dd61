// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SYNC_ENGINE_H_4820619375046128
#define SYNC_ENGINE_H_4820619375046128

#include "local_store.h"
#include "manifest_diff.h"
#include "sync_events.h"
#include "transfer.h"


namespace psync
{
struct SyncEnvironment
{
    ObjectStore& store;
    LocalProfileStore& profileStore;
    LocalEntityStore& entityStore;
    std::vector<Zstring> excludePatterns = getDefaultExcludePatterns();
    size_t transferThreads = DEFAULT_TRANSFER_THREADS;
};

//<data folder>/.psync/cache.json
Zstring getHashCacheFilePath(const Zstring& dataFolderPath);


/*  One sync pass for a profile:
        1. ensure the local data folder exists
        2. load hash cache, generate local manifest, save hash cache
        3. fetch remote manifest (if any)
        4. compute diff: nothing to do => "synced"
        5. upload, then download files
        6. delete local, then remote files
        7. upload sanitized profile metadata
        8. upload manifest: commit point
        9. sync associated proxy, group and VPN

    Any failure before step 8 leaves the remote manifest untouched; failed file
    transfers are logged, and fail the pass after step 6.

    PRECONDITION: no other pass for the same profile is running (see SyncContext)  */
void syncProfile(const ProfileRecord& profile, const SyncEnvironment& env, ProcessCallback& callback); //throw FileError, X

//download a profile that exists remotely but not locally; false if nothing to do
bool downloadProfileIfMissing(const std::string& profileId, const SyncEnvironment& env, ProcessCallback& callback); //throw FileError, X

//ids of all profiles with a remote manifest
std::vector<std::string> listRemoteProfileIds(ObjectStore& store); //throw ErrorTransfer

//download all remote-only profiles: returns ids of downloaded profiles; per-profile failures are logged and skipped
std::vector<std::string> checkForMissingSyncedProfiles(const SyncEnvironment& env,
                                                       SyncEventSink* eventSink /*optional*/,
                                                       PhaseCallback& callback); //throw ErrorTransfer, X

//download remote-only proxies, groups and VPNs unless deleted intentionally (tombstone exists): returns number of downloaded entities
int checkForMissingSyncedEntities(const SyncEnvironment& env, PhaseCallback& callback); //throw ErrorTransfer, X

DeletePrefixResult deleteProfile(const std::string& profileId, const SyncEnvironment& env); //throw FileError
DeleteResult deleteEntity(EntityKind kind, const std::string& entityId, const SyncEnvironment& env); //throw FileError


enum class EntitySyncResult
{
    inSync,
    uploaded,
    downloaded,
};

//single-object last-writer-wins: local "last_sync" vs. remote modification time
EntitySyncResult syncEntity(EntityKind kind, const std::string& entityId, const SyncEnvironment& env, PhaseCallback& callback); //throw FileError, X

//----------------------------------------------------------------------------------------------

std::optional<SyncManifest> downloadManifest(ObjectStore& store, const std::string& profileId); //throw ErrorTransfer, ErrorSerialization
}

#endif //SYNC_ENGINE_H_4820619375046128
