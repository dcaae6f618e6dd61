// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <psync/file_traverser.h>
#include <psync/open_ssl.h>
#include <afs/memory_object_store.h>
#include <base/object_keys.h>
#include <base/sync_context.h>
#include <base/sync_status_handler.h>
#include <testutil/testutil_assert.h>
#include <testutil/testutil_psync.h>

using namespace psync;


namespace
{
struct ContextTestEnv
{
    explicit ContextTestEnv(const char* testName, std::unique_ptr<MemoryObjectStore> memStore = std::make_unique<MemoryObjectStore>()) : tmp(testName)
    {
        cfg.profilesFolder = tmp / Zstr("profiles");
        cfg.entitiesFolder = tmp / Zstr("entities");
        cfg.logFolder      = tmp / Zstr("logs");
        cfg.transferThreads = 2;

        store = memStore.get();
        context = std::make_unique<SyncContext>(cfg, std::move(memStore), &sink);
    }

    void createProfile(const std::string& profileId, SyncMode syncMode)
    {
        ProfileRecord profile;
        profile.id       = profileId;
        profile.syncMode = syncMode;
        context->getEnvironment().profileStore.saveProfile(profile);

        writeTestFile(context->getEnvironment().profileStore.getProfileDataFolder(profileId), Zstr("Default/Preferences"), "{\"id\": \"" + profileId + "\"}");
    }

    TestFolder tmp;
    SyncConfig cfg;
    RecordingEventSink sink;
    MemoryObjectStore* store = nullptr; //owned by context
    std::unique_ptr<SyncContext> context;
};


//holds manifest uploads until released: simulates a pass that is beyond its last cancellation point
class GatedObjectStore : public MemoryObjectStore
{
public:
    void uploadBytes(const std::string& url, const std::string_view bytes, const std::string& contentType) override
    {
        if (endsWith(url, "/manifest.json"))
        {
            std::unique_lock dummy(lockGate_);
            gateReached_ = true;
            conditionGate_.notify_all();
            conditionGate_.wait(dummy, [this] { return gateOpen_; });
        }
        MemoryObjectStore::uploadBytes(url, bytes, contentType);
    }

    bool waitUntilGateReached(std::chrono::seconds timeout)
    {
        std::unique_lock dummy(lockGate_);
        return conditionGate_.wait_for(dummy, timeout, [this] { return gateReached_; });
    }

    void openGate()
    {
        {
            std::lock_guard dummy(lockGate_);
            gateOpen_ = true;
        }
        conditionGate_.notify_all();
    }

private:
    std::mutex lockGate_;
    std::condition_variable conditionGate_;
    bool gateReached_ = false;
    bool gateOpen_ = false;
};


size_t countLogFiles(const Zstring& logFolder)
{
    size_t count = 0;
    if (itemExists(logFolder))
        traverseFolder(logFolder, [&](const FileInfo& fi) { if (endsWith(fi.itemName, Zstr(".log"))) ++count; }, nullptr, nullptr);
    return count;
}


void testRequestSync()
{
    ContextTestEnv te("context_request");
    te.createProfile("p1", SyncMode::regular);

    te.context->requestProfileSync("p1");
    te.context->waitUntilIdle();

    ASSERT(te.sink.getStatusSequence("p1") == std::vector<SyncStatus>({ SyncStatus::syncing, SyncStatus::synced }));
    ASSERT(te.store->getObject(getManifestKey("p1")));
    ASSERT(!te.context->isProfileSyncActive("p1"));
    ASSERT(countLogFiles(te.cfg.logFolder) == 1);
}


void testRejectedRequests()
{
    ContextTestEnv te("context_rejected");
    te.createProfile("off", SyncMode::disabled);

    te.context->requestProfileSync("off");
    te.context->waitUntilIdle();
    ASSERT(te.sink.getStatusSequence("off") == std::vector<SyncStatus>({ SyncStatus::disabled }));
    ASSERT(!te.store->getObject(getManifestKey("off")));

    ASSERT_THROWS(te.context->requestProfileSync("unknown"), FileError);
    ASSERT_THROWS(te.context->requestProfileSync("../x"), ErrorInvalidData);
    ASSERT_THROWS(te.context->requestProfileSync(""), ErrorInvalidData);

    ASSERT(!te.context->cancelProfileSync("off")); //nothing to cancel
}


void testRunningProfileIsDeferred()
{
    ContextTestEnv te("context_running");
    te.createProfile("p1", SyncMode::regular);

    te.context->markProfileRunning("p1");
    te.context->requestProfileSync("p1");
    te.context->waitUntilIdle();

    ASSERT(te.sink.getStatusSequence("p1") == std::vector<SyncStatus>({ SyncStatus::waiting }));
    ASSERT(!te.store->getObject(getManifestKey("p1")));

    te.context->markProfileStopped("p1"); //deferred request runs now
    ASSERT(te.sink.waitForStatus("p1", SyncStatus::synced));
    te.context->waitUntilIdle();

    ASSERT(te.sink.getStatusSequence("p1") == std::vector<SyncStatus>({ SyncStatus::waiting, SyncStatus::syncing, SyncStatus::synced }));
    ASSERT(te.store->getObject(getManifestKey("p1")));
}


void testCancelDeferred()
{
    ContextTestEnv te("context_cancel_deferred");
    te.createProfile("p1", SyncMode::regular);

    te.context->markProfileRunning("p1");
    te.context->requestProfileSync("p1");
    ASSERT(te.context->cancelProfileSync("p1"));

    te.context->markProfileStopped("p1");
    te.context->waitUntilIdle();

    ASSERT(te.sink.getStatusSequence("p1") == std::vector<SyncStatus>({ SyncStatus::waiting }));
    ASSERT(!te.store->getObject(getManifestKey("p1")));
}


void testNoConcurrentPasses()
{
    ContextTestEnv te("context_serialized");
    te.createProfile("p1", SyncMode::regular);
    te.createProfile("p2", SyncMode::regular);

    for (int i = 0; i < 5; ++i)
    {
        te.context->requestProfileSync("p1");
        te.context->requestProfileSync("p2");
    }
    te.context->waitUntilIdle();

    for (const std::string profileId : { "p1", "p2" })
    {
        const std::vector<SyncStatus> sequence = te.sink.getStatusSequence(profileId);

        //coalesced: at most one pass per request, at least one in total
        ASSERT(sequence.size() >= 2 && sequence.size() <= 10);
        ASSERT(sequence.size() % 2 == 0);

        //never overlapping: strictly alternating
        for (size_t i = 0; i < sequence.size(); ++i)
            ASSERT(sequence[i] == (i % 2 == 0 ? SyncStatus::syncing : SyncStatus::synced));

        ASSERT(te.store->getObject(getManifestKey(profileId)));
    }
}


void testCancelledPassKeepsRemoteState()
{
    ContextTestEnv te("context_abort");
    te.createProfile("p1", SyncMode::regular);
    const SyncEnvironment& env = te.context->getEnvironment();

    RecordingEventSink sink;
    SyncStatusHandler statusHandler("p1", &sink);
    statusHandler.userRequestAbort();

    bool aborted = false;
    try
    {
        syncProfile(env.profileStore.loadProfile("p1").value(), env, statusHandler);
    }
    catch (AbortProcess&) { aborted = true; }

    ASSERT(aborted);
    ASSERT(!te.store->getObject(getManifestKey("p1")));
    ASSERT(te.store->getKeys().empty());
}


void testDeleteWaitsForActivePass()
{
    auto gatedStore = std::make_unique<GatedObjectStore>();
    GatedObjectStore& gate = *gatedStore;
    ContextTestEnv te("context_delete_active", std::move(gatedStore));
    te.createProfile("p1", SyncMode::regular);

    te.context->requestProfileSync("p1");
    ASSERT(gate.waitUntilGateReached(std::chrono::seconds(10)));

    std::atomic<bool> deleteDone{false};
    DeletePrefixResult result;
    std::wstring deleteError;
    std::thread deleter([&]
    {
        try
        {
            result = te.context->deleteProfile("p1");
        }
        catch (const FileError& e) { deleteError = e.toString(); }
        deleteDone = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    ASSERT(!deleteDone); //pass is still uploading its manifest

    gate.openGate();
    deleter.join();

    ASSERT(deleteError.empty());
    ASSERT(result.tombstoneCreated);
    ASSERT(!te.store->getObject(getManifestKey("p1")));
    ASSERT(!te.store->getObject(getProfileMetadataKey("p1")));
    ASSERT(te.store->getKeys() == std::vector<std::string>({ getProfileTombstoneKey("p1") }));
    ASSERT(!te.context->isProfileSyncActive("p1"));
}


void testContextWrappers()
{
    ContextTestEnv te("context_wrappers");
    te.createProfile("p1", SyncMode::regular);

    te.context->requestProfileSync("p1");
    te.context->waitUntilIdle();

    SyncStatusHandler callback("", nullptr);
    ASSERT(te.context->checkForMissingSyncedProfiles(callback).empty()); //exists locally
    ASSERT(te.context->checkForMissingSyncedEntities(callback) == 0);

    const DeletePrefixResult result = te.context->deleteProfile("p1");
    ASSERT(result.deletedCount > 0 && result.tombstoneCreated);
    ASSERT(!te.store->getObject(getManifestKey("p1")));

    //the profile's queue was dropped: a new request starts a new one
    te.sink.clear();
    te.context->requestProfileSync("p1");
    te.context->waitUntilIdle();
    ASSERT(te.sink.getStatusSequence("p1") == std::vector<SyncStatus>({ SyncStatus::syncing, SyncStatus::synced }));
    ASSERT(te.store->getObject(getManifestKey("p1")));
}
}


int main(int argc, char* argv[])
{
    openSslInit();

    try
    {
        testRequestSync();
        testRejectedRequests();
        testRunningProfileIsDeferred();
        testCancelDeferred();
        testNoConcurrentPasses();
        testCancelledPassKeepsRemoteState();
        testDeleteWaitsForActivePass();
        testContextWrappers();
    }
    catch (const FileError& e)
    {
        std::cout << "Unexpected error: " << utfTo<std::string>(e.toString()) << std::endl;
        ++ASSERT_COUNT;
    }

    return ASSERT_COUNT;
}
