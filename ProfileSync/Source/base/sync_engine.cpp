// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "sync_engine.h"
#include <set>
#include <unordered_set>
#include <psync/file_access.h>
#include <psync/time.h>
#include "object_keys.h"
#include "sync_status_handler.h"

using namespace psync;


namespace
{
const char CONTENT_TYPE_JSON[] = "application/json";


void uploadObject(ObjectStore& store, const std::string& key, const std::string& bytes) //throw SysError
{
    const PresignedUrl pu = store.presignUpload(key, CONTENT_TYPE_JSON); //throw SysError
    store.uploadBytes(pu.url, bytes, CONTENT_TYPE_JSON); //throw SysError
}


std::string downloadObject(ObjectStore& store, const std::string& key) //throw SysError
{
    const PresignedUrl pu = store.presignDownload(key); //throw SysError
    return store.downloadBytes(pu.url); //throw SysError
}


void uploadProfileMetadata(ObjectStore& store, const ProfileRecord& profile) //throw ErrorTransfer
{
    try
    {
        uploadObject(store, getProfileMetadataKey(profile.id), serializeProfileRecord(sanitizeProfileRecord(profile))); //throw SysError
    }
    catch (const SysError& e)
    {
        throw ErrorTransfer(replaceCpy(_("Cannot upload metadata of profile %x."), L"%x", fmtPath(profile.id)), e.toString());
    }
}


void uploadManifest(ObjectStore& store, const SyncManifest& manifest) //throw ErrorTransfer
{
    try
    {
        uploadObject(store, getManifestKey(manifest.profileId), serializeManifest(manifest)); //throw SysError
    }
    catch (const SysError& e)
    {
        throw ErrorTransfer(replaceCpy(_("Cannot upload manifest of profile %x."), L"%x", fmtPath(manifest.profileId)), e.toString());
    }
}


std::wstring getDirectionLabel(SyncDirection dir)
{
    switch (dir)
    {
        case SyncDirection::localToRemote:
            return _("local data is newer");
        case SyncDirection::remoteToLocal:
            return _("remote data is newer");
    }
    assert(false);
    return std::wstring();
}


std::wstring getEntityDisplayName(EntityKind kind, const std::string& entityId)
{
    return getEntityKindLabel(kind) + L' ' + fmtPath(entityId);
}


void uploadEntity(EntityKind kind, const std::string& entityId, const JsonValue& localEntity, const SyncEnvironment& env) //throw FileError
{
    JsonValue entity = localEntity;
    setEntityLastSync(entity, std::time(nullptr));

    try
    {
        uploadObject(env.store, getEntityKey(kind, entityId), serializeJson(entity)); //throw SysError
    }
    catch (const SysError& e)
    {
        throw ErrorTransfer(replaceCpy(_("Cannot upload %x."), L"%x", getEntityDisplayName(kind, entityId)), e.toString());
    }

    env.entityStore.saveEntity(kind, entityId, entity); //throw FileError
}


void downloadEntity(EntityKind kind, const std::string& entityId, const SyncEnvironment& env) //throw FileError
{
    std::string stream;
    try
    {
        stream = downloadObject(env.store, getEntityKey(kind, entityId)); //throw SysError
    }
    catch (const SysError& e)
    {
        throw ErrorTransfer(replaceCpy(_("Cannot download %x."), L"%x", getEntityDisplayName(kind, entityId)), e.toString());
    }

    JsonValue entity;
    try
    {
        entity = parseJson(stream); //throw JsonParsingError
    }
    catch (const JsonParsingError& e)
    {
        throw ErrorSerialization(replaceCpy(_("Cannot download %x."), L"%x", getEntityDisplayName(kind, entityId)), formatJsonParsingError(e));
    }
    if (entity.type != JsonValue::Type::object)
        throw ErrorSerialization(replaceCpy(_("Cannot download %x."), L"%x", getEntityDisplayName(kind, entityId)), L"JSON object expected.");

    setEntityLastSync(entity, std::time(nullptr));
    env.entityStore.saveEntity(kind, entityId, entity); //throw FileError
}


std::vector<std::pair<EntityKind, std::string>> getAssociatedEntities(const ProfileRecord& profile)
{
    std::vector<std::pair<EntityKind, std::string>> entities;
    if (profile.proxyId) entities.emplace_back(EntityKind::proxy, *profile.proxyId);
    if (profile.groupId) entities.emplace_back(EntityKind::group, *profile.groupId);
    if (profile.vpnId  ) entities.emplace_back(EntityKind::vpn,   *profile.vpnId);
    return entities;
}


//seed the hash cache of a freshly downloaded profile: mtimes were restored from the manifest
void saveHashCacheFromManifest(const SyncManifest& manifest, const Zstring& dataFolderPath, PhaseCallback& callback) //throw X
{
    HashCache cache;
    for (const ManifestFileEntry& file : manifest.files)
        cache.insert(utfTo<Zstring>(file.path), file.size, static_cast<time_t>(file.mtime), file.hash);

    try
    {
        saveHashCache(cache, getHashCacheFilePath(dataFolderPath)); //throw FileError
    }
    catch (const FileError& e) { callback.logMessage(e.toString(), PhaseCallback::MsgType::warning); } //throw X
}
}


Zstring psync::getHashCacheFilePath(const Zstring& dataFolderPath)
{
    return appendPath(appendPath(dataFolderPath, SYNC_BOOKKEEPING_FOLDER), Zstr("cache.json"));
}


std::optional<SyncManifest> psync::downloadManifest(ObjectStore& store, const std::string& profileId) //throw ErrorTransfer, ErrorSerialization
{
    const std::string key = getManifestKey(profileId);

    std::string stream;
    try
    {
        if (!store.stat(key).exists) //throw SysError
            return std::nullopt;

        stream = downloadObject(store, key); //throw SysError
    }
    catch (const SysError& e)
    {
        throw ErrorTransfer(replaceCpy(_("Cannot download manifest of profile %x."), L"%x", fmtPath(profileId)), e.toString());
    }

    try
    {
        SyncManifest manifest = parseManifest(stream); //throw SysError
        if (manifest.profileId != profileId)
            throw SysError(replaceCpy<std::wstring>(L"Profile id mismatch: \"%x\"", L"%x", utfTo<std::wstring>(manifest.profileId)));
        return manifest;
    }
    catch (const SysError& e)
    {
        throw ErrorSerialization(replaceCpy(_("Cannot read manifest of profile %x."), L"%x", fmtPath(profileId)), e.toString());
    }
}


void psync::syncProfile(const ProfileRecord& profile, const SyncEnvironment& env, ProcessCallback& callback) //throw FileError, X
{
    checkObjectId(profile.id); //throw ErrorInvalidData

    if (profile.syncMode == SyncMode::disabled)
    {
        callback.logMessage(replaceCpy(_("Sync is disabled for profile %x."), L"%x", fmtPath(profile.id)), PhaseCallback::MsgType::info); //throw X
        callback.reportSyncStatus(SyncStatus::disabled, std::wstring()); //throw X
        return;
    }

    callback.reportSyncStatus(SyncStatus::syncing, std::wstring()); //throw X
    callback.logMessage(replaceCpy(_("Starting sync of profile %x."), L"%x", fmtPath(profile.id)), PhaseCallback::MsgType::info); //throw X

    //------------------------ 1. local data folder ------------------------
    const Zstring dataFolderPath = env.profileStore.getProfileDataFolder(profile.id); //throw ErrorInvalidData
    createDirectoryIfMissingRecursion(dataFolderPath); //throw FileError

    //------------------------ 2. local manifest ------------------------
    const ExcludeFilter filter(env.excludePatterns); //throw ErrorInvalidData
    const Zstring cacheFilePath = getHashCacheFilePath(dataFolderPath);

    std::wstring cacheLoadError;
    HashCache cache = loadHashCache(cacheFilePath, [&](const std::wstring& msg) { cacheLoadError = msg; }); //noexcept
    if (!cacheLoadError.empty())
        callback.logMessage(cacheLoadError, PhaseCallback::MsgType::info); //throw X

    callback.initNewPhase(-1, -1, ProcessPhase::scan); //throw X
    const SyncManifest localManifest = generateManifest(profile.id, dataFolderPath, filter, cache,
    [&](const std::wstring& statusMsg) { callback.updateStatus(statusMsg); }); //throw FileError, X

    {
        std::unordered_set<Zstring> manifestPaths;
        for (const ManifestFileEntry& file : localManifest.files)
            manifestPaths.insert(utfTo<Zstring>(file.path));
        cache.retainOnly([&](const Zstring& relPath) { return manifestPaths.contains(relPath); });
    }
    try
    {
        saveHashCache(cache, cacheFilePath); //throw FileError
    }
    catch (const FileError& e) { callback.logMessage(e.toString(), PhaseCallback::MsgType::warning); } //throw X: cache is not authoritative

    callback.logMessage(replaceCpy(_P("Local manifest: 1 file", "Local manifest: %x files", localManifest.files.size()) + L", " + _("updated %y"),
                                   L"%y", utfTo<std::wstring>(localManifest.updatedAt)), PhaseCallback::MsgType::info); //throw X

    //------------------------ 3. remote manifest ------------------------
    callback.updateStatus(_("Downloading remote manifest...")); //throw X
    const std::optional<SyncManifest> remoteManifest = downloadManifest(env.store, profile.id); //throw ErrorTransfer, ErrorSerialization

    //------------------------ 4. diff ------------------------
    const ManifestDiff diff = computeDiff(localManifest, remoteManifest ? &*remoteManifest : nullptr);
    if (diff.empty())
    {
        callback.logMessage(replaceCpy(_("Profile %x is already in sync."), L"%x", fmtPath(profile.id)), PhaseCallback::MsgType::info); //throw X
        callback.reportSyncStatus(SyncStatus::synced, std::wstring()); //throw X
        return;
    }

    std::wstring changesMsg = _("Changes (%x): upload %a, download %b, delete local %c, delete remote %d");
    replace(changesMsg, L"%x", remoteManifest ? getDirectionLabel(diff.direction) : _("first sync"));
    replace(changesMsg, L"%a", numberTo<std::wstring>(diff.filesToUpload      .size()));
    replace(changesMsg, L"%b", numberTo<std::wstring>(diff.filesToDownload    .size()));
    replace(changesMsg, L"%c", numberTo<std::wstring>(diff.filesToDeleteLocal .size()));
    replace(changesMsg, L"%d", numberTo<std::wstring>(diff.filesToDeleteRemote.size()));
    callback.logMessage(changesMsg, PhaseCallback::MsgType::info); //throw X

    //------------------------ 5. transfer ------------------------
    int failedCount = 0;
    failedCount += uploadProfileFiles  (env.store, profile.id, dataFolderPath, diff.filesToUpload,   env.transferThreads, callback); //throw ErrorTransfer, X
    failedCount += downloadProfileFiles(env.store, profile.id, dataFolderPath, diff.filesToDownload, env.transferThreads, callback); //throw ErrorTransfer, X

    //------------------------ 6. deletions ------------------------
    failedCount += deleteLocalFiles (dataFolderPath,        diff.filesToDeleteLocal,  callback); //throw X
    failedCount += deleteRemoteFiles(env.store, profile.id, diff.filesToDeleteRemote, callback); //throw X

    if (failedCount > 0) //keep the previous remote manifest: next pass redoes the diff
        throw ErrorTransfer(replaceCpy(_("Cannot sync profile %x."), L"%x", fmtPath(profile.id)),
                            _P("1 file could not be transferred.", "%x files could not be transferred.", failedCount));

    //------------------------ 7. metadata ------------------------
    callback.updateStatus(_("Uploading profile metadata...")); //throw X
    uploadProfileMetadata(env.store, profile); //throw ErrorTransfer

    //------------------------ 8. manifest: commit ------------------------
    callback.updateStatus(_("Uploading manifest...")); //throw X
    if (diff.direction == SyncDirection::localToRemote)
        uploadManifest(env.store, localManifest); //throw ErrorTransfer
    else
    {
        //local data now mirrors the remote manifest, including modification times
        SyncManifest publishedManifest = *remoteManifest;
        publishedManifest.generatedAt = localManifest.generatedAt;
        uploadManifest(env.store, publishedManifest); //throw ErrorTransfer
    }

    //------------------------ 9. associated entities ------------------------
    for (const auto& [kind, entityId] : getAssociatedEntities(profile))
        try
        {
            syncEntity(kind, entityId, env, callback); //throw FileError, X
        }
        catch (const FileError& e) { callback.logMessage(e.toString(), PhaseCallback::MsgType::warning); } //throw X

    //the record on disk may have changed in the meantime (e.g. process id)
    try
    {
        ProfileRecord updatedProfile = env.profileStore.loadProfile(profile.id).value_or(profile); //throw FileError, ErrorSerialization, ErrorInvalidData
        updatedProfile.lastSync = std::time(nullptr);
        env.profileStore.saveProfile(updatedProfile); //throw FileError, ErrorInvalidData
    }
    catch (const FileError& e) { callback.logMessage(e.toString(), PhaseCallback::MsgType::warning); } //throw X

    callback.logMessage(replaceCpy(_("Profile %x synced successfully."), L"%x", fmtPath(profile.id)), PhaseCallback::MsgType::info); //throw X
    callback.reportSyncStatus(SyncStatus::synced, std::wstring()); //throw X
}


bool psync::downloadProfileIfMissing(const std::string& profileId, const SyncEnvironment& env, ProcessCallback& callback) //throw FileError, X
{
    checkObjectId(profileId); //throw ErrorInvalidData

    if (env.profileStore.profileExists(profileId)) //throw FileError, ErrorInvalidData
        return false;

    const std::optional<SyncManifest> manifest = downloadManifest(env.store, profileId); //throw ErrorTransfer, ErrorSerialization
    if (!manifest)
        return false;

    const std::string metadataKey = getProfileMetadataKey(profileId);
    std::string metadataStream;
    try
    {
        if (!env.store.stat(metadataKey).exists) //throw SysError
        {
            callback.logMessage(replaceCpy(_("Profile %x has no remote metadata."), L"%x", fmtPath(profileId)), PhaseCallback::MsgType::warning); //throw X
            return false;
        }
        metadataStream = downloadObject(env.store, metadataKey); //throw SysError
    }
    catch (const SysError& e)
    {
        throw ErrorTransfer(replaceCpy(_("Cannot download metadata of profile %x."), L"%x", fmtPath(profileId)), e.toString());
    }

    ProfileRecord profile;
    try
    {
        profile = parseProfileRecord(metadataStream); //throw SysError
        if (profile.id != profileId)
            throw SysError(replaceCpy<std::wstring>(L"Profile id mismatch: \"%x\"", L"%x", utfTo<std::wstring>(profile.id)));
    }
    catch (const SysError& e)
    {
        throw ErrorSerialization(replaceCpy(_("Cannot read metadata of profile %x."), L"%x", fmtPath(profileId)), e.toString());
    }

    callback.reportSyncStatus(SyncStatus::syncing, std::wstring()); //throw X
    callback.logMessage(replaceCpy(_("Downloading missing profile %x."), L"%x", fmtPath(profileId)), PhaseCallback::MsgType::info); //throw X

    const Zstring dataFolderPath = env.profileStore.getProfileDataFolder(profileId); //throw ErrorInvalidData
    createDirectoryIfMissingRecursion(dataFolderPath); //throw FileError

    const int failedCount = downloadProfileFiles(env.store, profileId, dataFolderPath, manifest->files, env.transferThreads, callback); //throw ErrorTransfer, X
    if (failedCount > 0) //no local record yet => retried next time
        throw ErrorTransfer(replaceCpy(_("Cannot download profile %x."), L"%x", fmtPath(profileId)),
                            _P("1 file could not be transferred.", "%x files could not be transferred.", failedCount));

    saveHashCacheFromManifest(*manifest, dataFolderPath, callback); //throw X

    //record last: its presence marks the profile as complete
    profile = sanitizeProfileRecord(profile);
    if (profile.syncMode == SyncMode::disabled)
        profile.syncMode = SyncMode::regular;
    profile.lastSync = std::time(nullptr);
    env.profileStore.saveProfile(profile); //throw FileError, ErrorInvalidData

    callback.logMessage(replaceCpy(_("Profile %x downloaded successfully."), L"%x", fmtPath(profileId)), PhaseCallback::MsgType::info); //throw X
    callback.reportSyncStatus(SyncStatus::synced, std::wstring()); //throw X
    return true;
}


std::vector<std::string> psync::listRemoteProfileIds(ObjectStore& store) //throw ErrorTransfer
{
    std::vector<ObjectInfo> objects;
    try
    {
        objects = store.list(getProfilesKeyPrefix()); //throw SysError
    }
    catch (const SysError& e)
    {
        throw ErrorTransfer(_("Cannot list remote profiles."), e.toString());
    }

    std::set<std::string> profileIds; //sorted + unique
    for (const ObjectInfo& obj : objects)
    {
        //"profiles/<id>/manifest.json"
        const std::string relKey = afterFirst(obj.key, getProfilesKeyPrefix(), IfNotFoundReturn::none);
        const std::string profileId = beforeFirst(relKey, '/', IfNotFoundReturn::none);

        if (isValidObjectId(profileId) && obj.key == getManifestKey(profileId))
            profileIds.insert(profileId);
    }
    return {profileIds.begin(), profileIds.end()};
}


std::vector<std::string> psync::checkForMissingSyncedProfiles(const SyncEnvironment& env, SyncEventSink* eventSink, PhaseCallback& callback) //throw ErrorTransfer, X
{
    std::vector<std::string> downloadedIds;

    for (const std::string& profileId : listRemoteProfileIds(env.store)) //throw ErrorTransfer
    {
        callback.requestUiUpdate(); //throw X

        SyncStatusHandler statusHandler(profileId, eventSink);
        try
        {
            if (downloadProfileIfMissing(profileId, env, statusHandler)) //throw FileError, AbortProcess
                downloadedIds.push_back(profileId);
        }
        catch (const FileError& e)
        {
            statusHandler.reportSyncStatus(SyncStatus::error, e.toString());
            callback.logMessage(e.toString(), PhaseCallback::MsgType::warning); //throw X
        }

        for (const LogEntry& entry : statusHandler.getErrorLog())
            if (entry.type == MSG_TYPE_WARNING) //failures were already logged above
                callback.logMessage(utfTo<std::wstring>(entry.message), PhaseCallback::MsgType::warning); //throw X
    }
    return downloadedIds;
}


int psync::checkForMissingSyncedEntities(const SyncEnvironment& env, PhaseCallback& callback) //throw ErrorTransfer, X
{
    int downloadCount = 0;

    for (const EntityKind kind : ENTITY_KINDS)
    {
        const std::string keyPrefix = getEntityKeyPrefix(kind);

        std::vector<ObjectInfo> objects;
        try
        {
            objects = env.store.list(keyPrefix); //throw SysError
        }
        catch (const SysError& e)
        {
            throw ErrorTransfer(replaceCpy(_("Cannot list remote objects of type %x."), L"%x", getEntityKindLabel(kind)), e.toString());
        }

        for (const ObjectInfo& obj : objects)
        {
            if (!endsWith(obj.key, ".json"))
                continue;
            const std::string entityId = beforeLast(afterFirst(obj.key, keyPrefix, IfNotFoundReturn::none), ".json", IfNotFoundReturn::none);
            if (!isValidObjectId(entityId))
                continue;

            callback.requestUiUpdate(); //throw X
            try
            {
                std::lock_guard dummy(env.entityStore.refSyncLock());

                if (env.entityStore.loadEntity(kind, entityId)) //throw FileError, ErrorSerialization, ErrorInvalidData
                    continue;

                try
                {
                    if (env.store.stat(getEntityTombstoneKey(kind, entityId)).exists) //throw SysError
                        continue; //deleted intentionally on another device
                }
                catch (const SysError& e)
                {
                    throw ErrorTransfer(replaceCpy(_("Cannot download %x."), L"%x", getEntityDisplayName(kind, entityId)), e.toString());
                }

                downloadEntity(kind, entityId, env); //throw FileError
                ++downloadCount;
                callback.logMessage(replaceCpy(_("Downloaded missing %x."), L"%x", getEntityDisplayName(kind, entityId)), PhaseCallback::MsgType::info); //throw X
            }
            catch (const FileError& e) { callback.logMessage(e.toString(), PhaseCallback::MsgType::warning); } //throw X
        }
    }
    return downloadCount;
}


DeletePrefixResult psync::deleteProfile(const std::string& profileId, const SyncEnvironment& env) //throw FileError
{
    checkObjectId(profileId); //throw ErrorInvalidData
    try
    {
        return env.store.deletePrefix(getProfileKeyPrefix(profileId), getProfileTombstoneKey(profileId)); //throw SysError
    }
    catch (const SysError& e)
    {
        throw ErrorTransfer(replaceCpy(_("Cannot delete remote profile %x."), L"%x", fmtPath(profileId)), e.toString());
    }
}


DeleteResult psync::deleteEntity(EntityKind kind, const std::string& entityId, const SyncEnvironment& env) //throw FileError
{
    checkObjectId(entityId); //throw ErrorInvalidData
    try
    {
        return env.store.deleteObject(getEntityKey(kind, entityId), getEntityTombstoneKey(kind, entityId)); //throw SysError
    }
    catch (const SysError& e)
    {
        throw ErrorTransfer(replaceCpy(_("Cannot delete %x."), L"%x", getEntityDisplayName(kind, entityId)), e.toString());
    }
}


EntitySyncResult psync::syncEntity(EntityKind kind, const std::string& entityId, const SyncEnvironment& env, PhaseCallback& callback) //throw FileError, X
{
    checkObjectId(entityId); //throw ErrorInvalidData
    callback.updateStatus(replaceCpy(_("Synchronizing %x"), L"%x", getEntityDisplayName(kind, entityId))); //throw X

    std::lock_guard dummy(env.entityStore.refSyncLock());

    const std::optional<JsonValue> localEntity = env.entityStore.loadEntity(kind, entityId); //throw FileError, ErrorSerialization, ErrorInvalidData

    ObjectStat remoteStat;
    try
    {
        remoteStat = env.store.stat(getEntityKey(kind, entityId)); //throw SysError
    }
    catch (const SysError& e)
    {
        throw ErrorTransfer(replaceCpy(_("Cannot synchronize %x."), L"%x", getEntityDisplayName(kind, entityId)), e.toString());
    }

    EntitySyncResult result = EntitySyncResult::inSync;

    if (localEntity && remoteStat.exists)
    {
        const int64_t localTime = getEntityLastSync(*localEntity).value_or(0);
        //unknown remote time: assume it was just written
        const std::optional<time_t> remoteTimeParsed = remoteStat.lastModified ? parseRfc3339(*remoteStat.lastModified) : std::nullopt;
        const int64_t remoteTime = remoteTimeParsed ? *remoteTimeParsed : std::time(nullptr);

        if (remoteTime > localTime)
            result = EntitySyncResult::downloaded;
        else if (localTime > remoteTime)
            result = EntitySyncResult::uploaded;
    }
    else if (localEntity)
        result = EntitySyncResult::uploaded;
    else if (remoteStat.exists)
        result = EntitySyncResult::downloaded;

    switch (result)
    {
        case EntitySyncResult::inSync:
            break;
        case EntitySyncResult::uploaded:
            uploadEntity(kind, entityId, *localEntity, env); //throw FileError
            callback.logMessage(replaceCpy(_("Uploaded %x."), L"%x", getEntityDisplayName(kind, entityId)), PhaseCallback::MsgType::info); //throw X
            break;
        case EntitySyncResult::downloaded:
            downloadEntity(kind, entityId, env); //throw FileError
            callback.logMessage(replaceCpy(_("Downloaded %x."), L"%x", getEntityDisplayName(kind, entityId)), PhaseCallback::MsgType::info); //throw X
            break;
    }
    return result;
}
