// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <atomic>
#include <psync/open_ssl.h>
#include <psync/scope_guard.h>
#include <afs/memory_object_store.h>
#include <base/object_keys.h>
#include <base/sync_engine.h>
#include <base/sync_status_handler.h>
#include <testutil/testutil_assert.h>
#include <testutil/testutil_psync.h>

using namespace psync;


namespace
{
const std::string PROFILE_ID = "profile-1";


//one device: local profile and entity folders
struct Device
{
    Device(const TestFolder& root, const Zstring& deviceName, MemoryObjectStore& store) :
        profileStore(appendPath(root / deviceName, Zstr("profiles"))),
        entityStore (appendPath(root / deviceName, Zstr("entities"))),
        env{ store, profileStore, entityStore } {}

    Zstring dataFolder() const { return profileStore.getProfileDataFolder(PROFILE_ID); }

    void createProfile(SyncMode syncMode)
    {
        ProfileRecord profile;
        profile.id         = PROFILE_ID;
        profile.name       = "Work";
        profile.syncMode   = syncMode;
        profile.processId  = 4711;
        profile.lastLaunch = 1704067200;
        profile.otherFields.emplace("browser", JsonValue("chromium"));
        profileStore.saveProfile(profile);
    }

    ProfileRecord loadProfile() const { return profileStore.loadProfile(PROFILE_ID).value(); }

    LocalProfileStore profileStore;
    LocalEntityStore entityStore;
    SyncEnvironment env;
};


std::optional<SyncManifest> getRemoteManifest(MemoryObjectStore& store)
{
    if (const std::optional<MemoryObjectStore::Object> obj = store.getObject(getManifestKey(PROFILE_ID)))
        return parseManifest(obj->bytes);
    return std::nullopt;
}


std::optional<std::string> getRemoteFile(MemoryObjectStore& store, const std::string& relPath)
{
    if (const std::optional<MemoryObjectStore::Object> obj = store.getObject(getProfileFileKey(PROFILE_ID, relPath)))
        return obj->bytes;
    return std::nullopt;
}


void testFirstSync()
{
    TestFolder tmp("first_sync");
    MemoryObjectStore store;
    RecordingEventSink sink;

    Device dev(tmp, Zstr("A"), store);
    dev.createProfile(SyncMode::regular);
    writeTestFile(dev.dataFolder(), Zstr("Default/Cookies"), "cookies", testTime("2024-01-01T00:00:00Z"));
    writeTestFile(dev.dataFolder(), Zstr("Local State"), "{}", testTime("2024-01-02T00:00:00Z"));
    writeTestFile(dev.dataFolder(), Zstr("Default/Cache/data_0"), "volatile");

    SyncStatusHandler statusHandler(PROFILE_ID, &sink);
    syncProfile(dev.loadProfile(), dev.env, statusHandler);

    ASSERT(statusHandler.getFinalStatus() == SyncStatus::synced);
    ASSERT(sink.getStatusSequence(PROFILE_ID) == std::vector<SyncStatus>({ SyncStatus::syncing, SyncStatus::synced }));
    ASSERT(getStats(statusHandler.getErrorLog()).warning == 0);

    ASSERT(getRemoteFile(store, "Default/Cookies") == "cookies");
    ASSERT(getRemoteFile(store, "Local State") == "{}");
    ASSERT(!getRemoteFile(store, "Default/Cache/data_0")); //excluded

    const std::optional<SyncManifest> manifest = getRemoteManifest(store);
    ASSERT(manifest && manifest->files.size() == 2);
    ASSERT(manifest && manifest->updatedAt == "2024-01-02T00:00:00Z");

    //sanitized metadata
    const std::optional<MemoryObjectStore::Object> metadata = store.getObject(getProfileMetadataKey(PROFILE_ID));
    ASSERT(metadata);
    if (metadata)
    {
        const ProfileRecord remoteProfile = parseProfileRecord(metadata->bytes);
        ASSERT(remoteProfile.id == PROFILE_ID);
        ASSERT(remoteProfile.name == "Work");
        ASSERT(!remoteProfile.processId);
        ASSERT(!remoteProfile.lastLaunch);
        ASSERT(remoteProfile.otherFields.contains("browser"));
    }

    ASSERT(dev.loadProfile().lastSync.has_value());
    ASSERT(dev.loadProfile().processId == 4711); //volatile fields stay local
    ASSERT(itemExists(getHashCacheFilePath(dev.dataFolder())));

    //final progress event reports all files
    const std::vector<SyncProgressEvent> progress = sink.getProgressEvents();
    ASSERT(!progress.empty());
    if (!progress.empty())
    {
        ASSERT(progress.back().phase == ProcessPhase::upload);
        ASSERT(progress.back().done  == 2);
        ASSERT(progress.back().total == 2);
    }
}


void testIdempotence()
{
    TestFolder tmp("idempotence");
    MemoryObjectStore store;

    Device dev(tmp, Zstr("A"), store);
    dev.createProfile(SyncMode::regular);
    writeTestFile(dev.dataFolder(), Zstr("a"), "alpha", testTime("2024-01-01T00:00:00Z"));
    writeTestFile(dev.dataFolder(), Zstr("sub/b"), "beta", testTime("2024-01-01T00:00:00Z"));

    SyncStatusHandler firstPass(PROFILE_ID, nullptr);
    syncProfile(dev.loadProfile(), dev.env, firstPass);
    ASSERT(firstPass.getFinalStatus() == SyncStatus::synced);

    const uint64_t hashCountBefore = getHashComputationCount();
    store.resetRequestStats();

    SyncStatusHandler secondPass(PROFILE_ID, nullptr);
    syncProfile(dev.loadProfile(), dev.env, secondPass);
    ASSERT(secondPass.getFinalStatus() == SyncStatus::synced);

    const MemoryObjectStore::RequestStats stats = store.getRequestStats();
    ASSERT(stats.uploads == 0);
    ASSERT(stats.deletes == 0);
    ASSERT(stats.downloads == 1); //remote manifest only
    ASSERT(getHashComputationCount() == hashCountBefore); //hash cache was persisted
}


void testRemoteNewer()
{
    TestFolder tmp("remote_newer");
    MemoryObjectStore store;

    //device A publishes newer data
    Device devA(tmp, Zstr("A"), store);
    devA.createProfile(SyncMode::regular);
    writeTestFile(devA.dataFolder(), Zstr("Default/Bookmarks"), "bookmarks v2", testTime("2024-01-02T00:00:00Z"));
    writeTestFile(devA.dataFolder(), Zstr("Default/History"),   "history",      testTime("2024-01-02T00:00:00Z"));
    {
        SyncStatusHandler statusHandler(PROFILE_ID, nullptr);
        syncProfile(devA.loadProfile(), devA.env, statusHandler);
        ASSERT(statusHandler.getFinalStatus() == SyncStatus::synced);
    }
    const std::optional<SyncManifest> manifestBefore = getRemoteManifest(store);

    //device B has older local data
    Device devB(tmp, Zstr("B"), store);
    devB.createProfile(SyncMode::regular);
    writeTestFile(devB.dataFolder(), Zstr("Default/Bookmarks"), "bookmarks v1", testTime("2024-01-01T00:00:00Z"));
    writeTestFile(devB.dataFolder(), Zstr("Default/Stale"),     "stale",        testTime("2024-01-01T00:00:00Z"));

    RecordingEventSink sink;
    SyncStatusHandler statusHandler(PROFILE_ID, &sink);
    syncProfile(devB.loadProfile(), devB.env, statusHandler);
    ASSERT(statusHandler.getFinalStatus() == SyncStatus::synced);

    ASSERT(readTestFile(devB.dataFolder(), Zstr("Default/Bookmarks")) == "bookmarks v2");
    ASSERT(readTestFile(devB.dataFolder(), Zstr("Default/History")) == "history");
    ASSERT(!itemExists(devB.dataFolder() + Zstr("/Default/Stale")));

    //modification times restored
    const std::optional<FileDetails> details = getFileDetailsIfExists(devB.dataFolder() + Zstr("/Default/Bookmarks"));
    ASSERT(details && details->modTime == testTime("2024-01-02T00:00:00Z"));

    //no data uploaded from B; manifest file list unchanged
    ASSERT(getRemoteFile(store, "Default/Bookmarks") == "bookmarks v2");
    ASSERT(!getRemoteFile(store, "Default/Stale"));
    const std::optional<SyncManifest> manifestAfter = getRemoteManifest(store);
    ASSERT(manifestBefore && manifestAfter && manifestAfter->files == manifestBefore->files);
    ASSERT(manifestAfter && manifestAfter->updatedAt == "2024-01-02T00:00:00Z");

    bool downloadProgressSeen = false;
    for (const SyncProgressEvent& event : sink.getProgressEvents())
        if (event.phase == ProcessPhase::download && event.done == 2 && event.total == 2)
            downloadProgressSeen = true;
    ASSERT(downloadProgressSeen);

    //converged: nothing left to do on either device
    store.resetRequestStats();
    SyncStatusHandler passB(PROFILE_ID, nullptr);
    syncProfile(devB.loadProfile(), devB.env, passB);
    SyncStatusHandler passA(PROFILE_ID, nullptr);
    syncProfile(devA.loadProfile(), devA.env, passA);
    ASSERT(store.getRequestStats().uploads == 0);
}


void testLocalDeletion()
{
    TestFolder tmp("local_deletion");
    MemoryObjectStore store;

    Device dev(tmp, Zstr("A"), store);
    dev.createProfile(SyncMode::regular);
    writeTestFile(dev.dataFolder(), Zstr("keep"),   "keep",   testTime("2024-01-01T00:00:00Z"));
    writeTestFile(dev.dataFolder(), Zstr("remove"), "remove", testTime("2024-01-01T00:00:00Z"));
    {
        SyncStatusHandler statusHandler(PROFILE_ID, nullptr);
        syncProfile(dev.loadProfile(), dev.env, statusHandler);
    }
    ASSERT(getRemoteFile(store, "remove"));

    removeFilePlain(appendPath(dev.dataFolder(), Zstr("remove")));
    writeTestFile(dev.dataFolder(), Zstr("keep"), "kept!", testTime("2024-01-03T00:00:00Z"));

    SyncStatusHandler statusHandler(PROFILE_ID, nullptr);
    syncProfile(dev.loadProfile(), dev.env, statusHandler);
    ASSERT(statusHandler.getFinalStatus() == SyncStatus::synced);

    ASSERT(!getRemoteFile(store, "remove"));
    ASSERT(getRemoteFile(store, "keep") == "kept!");
    ASSERT(!store.getObject(getTombstoneKey("profiles", PROFILE_ID))); //file deletions leave no tombstone

    const std::optional<SyncManifest> manifest = getRemoteManifest(store);
    ASSERT(manifest && manifest->files.size() == 1 && manifest->updatedAt == "2024-01-03T00:00:00Z");
}


void testFailedTransferKeepsManifest()
{
    TestFolder tmp("failed_transfer");
    MemoryObjectStore store;

    Device dev(tmp, Zstr("A"), store);
    dev.createProfile(SyncMode::regular);
    writeTestFile(dev.dataFolder(), Zstr("a"), "a1", testTime("2024-01-01T00:00:00Z"));
    writeTestFile(dev.dataFolder(), Zstr("b"), "b1", testTime("2024-01-01T00:00:00Z"));

    //bootstrap fails: no manifest published
    store.setFailingKey(getProfileFileKey(PROFILE_ID, "b"), true);
    {
        SyncStatusHandler statusHandler(PROFILE_ID, nullptr);
        ASSERT_THROWS(syncProfile(dev.loadProfile(), dev.env, statusHandler), ErrorTransfer);
        ASSERT(getStats(statusHandler.getErrorLog()).warning == 1);
        ASSERT(statusHandler.getStatsCurrent().items == 2); //failed file counts as processed
    }
    ASSERT(!getRemoteManifest(store));
    ASSERT(getRemoteFile(store, "a") == "a1");
    ASSERT(!store.getObject(getProfileMetadataKey(PROFILE_ID)));

    store.setFailingKey(getProfileFileKey(PROFILE_ID, "b"), false);
    {
        SyncStatusHandler statusHandler(PROFILE_ID, nullptr);
        syncProfile(dev.loadProfile(), dev.env, statusHandler);
        ASSERT(statusHandler.getFinalStatus() == SyncStatus::synced);
    }
    const std::string manifestBefore = store.getObject(getManifestKey(PROFILE_ID)).value().bytes;

    //later pass fails: previous manifest stays in place
    writeTestFile(dev.dataFolder(), Zstr("a"), "a2", testTime("2024-01-02T00:00:00Z"));
    writeTestFile(dev.dataFolder(), Zstr("c"), "c1", testTime("2024-01-02T00:00:00Z"));
    store.setFailingKey(getProfileFileKey(PROFILE_ID, "c"), true);
    {
        SyncStatusHandler statusHandler(PROFILE_ID, nullptr);
        ASSERT_THROWS(syncProfile(dev.loadProfile(), dev.env, statusHandler), ErrorTransfer);
    }
    ASSERT(store.getObject(getManifestKey(PROFILE_ID)).value().bytes == manifestBefore);
}


void testDisabledProfile()
{
    TestFolder tmp("disabled");
    MemoryObjectStore store;
    RecordingEventSink sink;

    Device dev(tmp, Zstr("A"), store);
    dev.createProfile(SyncMode::disabled);
    writeTestFile(dev.dataFolder(), Zstr("a"), "a");

    SyncStatusHandler statusHandler(PROFILE_ID, &sink);
    syncProfile(dev.loadProfile(), dev.env, statusHandler);

    ASSERT(sink.getStatusSequence(PROFILE_ID) == std::vector<SyncStatus>({ SyncStatus::disabled }));
    const MemoryObjectStore::RequestStats stats = store.getRequestStats();
    ASSERT(stats.statCalls == 0 && stats.uploads == 0 && stats.downloads == 0);
}


void testDownloadMissingProfile()
{
    TestFolder tmp("download_missing");
    MemoryObjectStore store;

    Device devA(tmp, Zstr("A"), store);
    devA.createProfile(SyncMode::regular);
    writeTestFile(devA.dataFolder(), Zstr("Default/Preferences"), "prefs", testTime("2024-01-01T00:00:00Z"));
    {
        SyncStatusHandler statusHandler(PROFILE_ID, nullptr);
        syncProfile(devA.loadProfile(), devA.env, statusHandler);
    }
    ASSERT(listRemoteProfileIds(store) == std::vector<std::string>({ PROFILE_ID }));

    Device devB(tmp, Zstr("B"), store);
    {
        SyncStatusHandler statusHandler(PROFILE_ID, nullptr);
        ASSERT(downloadProfileIfMissing(PROFILE_ID, devB.env, statusHandler));
        ASSERT(statusHandler.getFinalStatus() == SyncStatus::synced);
    }
    ASSERT(readTestFile(devB.dataFolder(), Zstr("Default/Preferences")) == "prefs");

    const ProfileRecord profileB = devB.loadProfile();
    ASSERT(profileB.name == "Work");
    ASSERT(profileB.syncMode == SyncMode::regular);
    ASSERT(profileB.lastSync.has_value());
    ASSERT(!profileB.processId);

    //already present
    {
        SyncStatusHandler statusHandler(PROFILE_ID, nullptr);
        ASSERT(!downloadProfileIfMissing(PROFILE_ID, devB.env, statusHandler));
    }

    //downloaded profile is in sync without rehashing
    {
        const uint64_t hashCountBefore = getHashComputationCount();
        store.resetRequestStats();
        SyncStatusHandler statusHandler(PROFILE_ID, nullptr);
        syncProfile(devB.loadProfile(), devB.env, statusHandler);
        ASSERT(store.getRequestStats().uploads == 0);
        ASSERT(getHashComputationCount() == hashCountBefore);
    }

    //third device discovers all remote-only profiles
    Device devC(tmp, Zstr("C"), store);
    RecordingEventSink sink;
    SyncStatusHandler outerHandler("", nullptr);
    ASSERT(checkForMissingSyncedProfiles(devC.env, &sink, outerHandler) == std::vector<std::string>({ PROFILE_ID }));
    ASSERT(sink.getLastStatus(PROFILE_ID) == SyncStatus::synced);
    ASSERT(devC.profileStore.profileExists(PROFILE_ID));
}


void testDeleteProfile()
{
    TestFolder tmp("delete_profile");
    MemoryObjectStore store;

    Device dev(tmp, Zstr("A"), store);
    dev.createProfile(SyncMode::regular);
    writeTestFile(dev.dataFolder(), Zstr("a"), "a");
    {
        SyncStatusHandler statusHandler(PROFILE_ID, nullptr);
        syncProfile(dev.loadProfile(), dev.env, statusHandler);
    }

    const DeletePrefixResult result = deleteProfile(PROFILE_ID, dev.env);
    ASSERT(result.deletedCount == 3); //file + metadata + manifest
    ASSERT(result.tombstoneCreated);
    ASSERT(store.getObject(getProfileTombstoneKey(PROFILE_ID)));
    ASSERT(listRemoteProfileIds(store).empty());

    ASSERT_THROWS(deleteProfile("../evil", dev.env), ErrorInvalidData);
}


//records the peak number of simultaneous file transfers
class ConcurrencyTrackingStore : public MemoryObjectStore
{
public:
    void uploadStream(const std::string& url, const std::string& contentType, uint64_t streamSize,
                      const std::function<size_t(std::span<char> buf)>& readBlock) override
    {
        enterTransfer();
        PSYNC_ON_SCOPE_EXIT(--activeTransfers_);
        MemoryObjectStore::uploadStream(url, contentType, streamSize, readBlock);
    }

    void downloadStream(const std::string& url, const std::function<void(std::span<const char> buf)>& writeBlock) override
    {
        enterTransfer();
        PSYNC_ON_SCOPE_EXIT(--activeTransfers_);
        MemoryObjectStore::downloadStream(url, writeBlock);
    }

    size_t getPeakTransfers() const { return peakTransfers_; }
    void resetPeakTransfers() { peakTransfers_ = 0; }

private:
    void enterTransfer()
    {
        const size_t active = ++activeTransfers_;

        size_t peak = peakTransfers_;
        while (active > peak && !peakTransfers_.compare_exchange_weak(peak, active))
            ;
        //stay in flight long enough for other workers to overlap
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    std::atomic<size_t> activeTransfers_{0};
    std::atomic<size_t> peakTransfers_{0};
};


void testTransferConcurrencyBound()
{
    TestFolder tmp("concurrency_bound");
    ConcurrencyTrackingStore store;
    const int fileCount = 24;

    Device devA(tmp, Zstr("A"), store);
    devA.env.transferThreads = 3;
    devA.createProfile(SyncMode::regular);
    for (int i = 0; i < fileCount; ++i)
        writeTestFile(devA.dataFolder(), Zstr("Default/IndexedDB/file_") + numberTo<Zstring>(i), "content " + numberTo<std::string>(i));
    {
        SyncStatusHandler statusHandler(PROFILE_ID, nullptr);
        syncProfile(devA.loadProfile(), devA.env, statusHandler);
        ASSERT(statusHandler.getFinalStatus() == SyncStatus::synced);
    }
    ASSERT(getRemoteManifest(store) && getRemoteManifest(store)->files.size() == static_cast<size_t>(fileCount));
    ASSERT(store.getPeakTransfers() <= 3);
    ASSERT(store.getPeakTransfers() >= 2);

    store.resetPeakTransfers();
    Device devB(tmp, Zstr("B"), store);
    devB.env.transferThreads = 2;
    {
        SyncStatusHandler statusHandler(PROFILE_ID, nullptr);
        ASSERT(downloadProfileIfMissing(PROFILE_ID, devB.env, statusHandler));
    }
    ASSERT(store.getPeakTransfers() == 2);
    ASSERT(readTestFile(devB.dataFolder(), Zstr("Default/IndexedDB/file_7")) == "content 7");
}


void testUntrustedPaths()
{
    ASSERT(getLocalFilePath(Zstr("/data"), "Default/Cookies") == Zstr("/data/Default/Cookies"));
    ASSERT_THROWS(getLocalFilePath(Zstr("/data"), "../outside"), ErrorInvalidData);
    ASSERT_THROWS(getLocalFilePath(Zstr("/data"), "a/../../outside"), ErrorInvalidData);
    ASSERT_THROWS(getLocalFilePath(Zstr("/data"), "/etc/passwd"), ErrorInvalidData);
    ASSERT_THROWS(getLocalFilePath(Zstr("/data"), "a//b"), ErrorInvalidData);
    ASSERT_THROWS(getLocalFilePath(Zstr("/data"), ""), ErrorInvalidData);
}
}


int main(int argc, char* argv[])
{
    openSslInit();

    try
    {
        testFirstSync();
        testIdempotence();
        testRemoteNewer();
        testLocalDeletion();
        testFailedTransferKeepsManifest();
        testDisabledProfile();
        testDownloadMissingProfile();
        testDeleteProfile();
        testTransferConcurrencyBound();
        testUntrustedPaths();
    }
    catch (const FileError& e)
    {
        std::cout << "Unexpected error: " << utfTo<std::string>(e.toString()) << std::endl;
        ++ASSERT_COUNT;
    }

    return ASSERT_COUNT;
}
