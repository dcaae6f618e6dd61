// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <psync/open_ssl.h>
#include <afs/memory_object_store.h>
#include <base/object_keys.h>
#include <base/sync_engine.h>
#include <base/sync_status_handler.h>
#include <testutil/testutil_assert.h>
#include <testutil/testutil_psync.h>

using namespace psync;


namespace
{
JsonValue makeProxy(const std::string& host, std::optional<int64_t> lastSync)
{
    JsonValue proxy(JsonValue::Type::object);
    proxy.objectVal.emplace("host", JsonValue(host));
    proxy.objectVal.emplace("port", JsonValue(8080));
    if (lastSync)
        setEntityLastSync(proxy, *lastSync);
    return proxy;
}


struct EntityTestEnv
{
    explicit EntityTestEnv(const char* testName) :
        tmp(testName),
        profileStore(tmp / Zstr("profiles")),
        entityStore (tmp / Zstr("entities")),
        env{ store, profileStore, entityStore } {}

    TestFolder tmp;
    MemoryObjectStore store;
    LocalProfileStore profileStore;
    LocalEntityStore entityStore;
    SyncEnvironment env;
    SyncStatusHandler callback{"", nullptr};
};


void testLocalOnly()
{
    EntityTestEnv te("entity_local_only");
    te.entityStore.saveEntity(EntityKind::proxy, "px1", makeProxy("10.0.0.1", std::nullopt));

    const time_t startTime = std::time(nullptr);
    ASSERT(syncEntity(EntityKind::proxy, "px1", te.env, te.callback) == EntitySyncResult::uploaded);

    const std::optional<MemoryObjectStore::Object> remote = te.store.getObject("proxies/px1.json");
    ASSERT(remote);
    if (remote)
    {
        const JsonValue remoteProxy = parseJson(remote->bytes);
        ASSERT(getPrimitiveFromJsonObject(remoteProxy, "host") == "10.0.0.1");
        ASSERT(getEntityLastSync(remoteProxy).value_or(0) >= startTime);
    }

    //local copy carries the same stamp
    const std::optional<JsonValue> local = te.entityStore.loadEntity(EntityKind::proxy, "px1");
    ASSERT(local && getEntityLastSync(*local).value_or(0) >= startTime);
}


void testRemoteOnly()
{
    EntityTestEnv te("entity_remote_only");
    te.store.putObject("groups/g1.json", serializeJson(makeProxy("group", 1704067200)), testTime("2024-01-01T00:00:00Z"));

    ASSERT(syncEntity(EntityKind::group, "g1", te.env, te.callback) == EntitySyncResult::downloaded);

    const std::optional<JsonValue> local = te.entityStore.loadEntity(EntityKind::group, "g1");
    ASSERT(local && getPrimitiveFromJsonObject(*local, "host") == "group");
    ASSERT(local && getEntityLastSync(*local).value_or(0) > 1704067200);

    //neither side: nothing to do
    ASSERT(syncEntity(EntityKind::vpn, "none", te.env, te.callback) == EntitySyncResult::inSync);
    ASSERT(!te.entityStore.loadEntity(EntityKind::vpn, "none"));
}


void testLastWriterWins()
{
    EntityTestEnv te("entity_lww");
    const time_t remoteTime = testTime("2024-01-02T00:00:00Z");

    //remote newer
    te.entityStore.saveEntity(EntityKind::vpn, "v1", makeProxy("old", testTime("2024-01-01T00:00:00Z")));
    te.store.putObject("vpns/v1.json", serializeJson(makeProxy("new", remoteTime)), remoteTime);
    ASSERT(syncEntity(EntityKind::vpn, "v1", te.env, te.callback) == EntitySyncResult::downloaded);
    ASSERT(getPrimitiveFromJsonObject(te.entityStore.loadEntity(EntityKind::vpn, "v1").value(), "host") == "new");

    //local newer
    te.entityStore.saveEntity(EntityKind::vpn, "v2", makeProxy("local", testTime("2024-01-03T00:00:00Z")));
    te.store.putObject("vpns/v2.json", serializeJson(makeProxy("remote", remoteTime)), remoteTime);
    ASSERT(syncEntity(EntityKind::vpn, "v2", te.env, te.callback) == EntitySyncResult::uploaded);
    ASSERT(getPrimitiveFromJsonObject(parseJson(te.store.getObject("vpns/v2.json").value().bytes), "host") == "local");

    //same time: in sync
    te.entityStore.saveEntity(EntityKind::vpn, "v3", makeProxy("same", remoteTime));
    te.store.putObject("vpns/v3.json", serializeJson(makeProxy("same", remoteTime)), remoteTime);
    te.store.resetRequestStats();
    ASSERT(syncEntity(EntityKind::vpn, "v3", te.env, te.callback) == EntitySyncResult::inSync);
    ASSERT(te.store.getRequestStats().uploads == 0 && te.store.getRequestStats().downloads == 0);

    //local without timestamp loses against any remote version
    te.entityStore.saveEntity(EntityKind::vpn, "v4", makeProxy("unstamped", std::nullopt));
    te.store.putObject("vpns/v4.json", serializeJson(makeProxy("remote", remoteTime)), remoteTime);
    ASSERT(syncEntity(EntityKind::vpn, "v4", te.env, te.callback) == EntitySyncResult::downloaded);

    ASSERT_THROWS(syncEntity(EntityKind::vpn, "bad/id", te.env, te.callback), ErrorInvalidData);
}


void testMissingEntities()
{
    EntityTestEnv te("entity_missing");
    te.store.putObject("proxies/p1.json", serializeJson(makeProxy("one", 1)), testTime("2024-01-01T00:00:00Z"));
    te.store.putObject("proxies/p2.json", serializeJson(makeProxy("two", 1)), testTime("2024-01-01T00:00:00Z"));
    te.store.putObject("proxies/p3.json", serializeJson(makeProxy("three", 1)), testTime("2024-01-01T00:00:00Z"));
    te.store.putObject("groups/g1.json",  serializeJson(makeProxy("group", 1)), testTime("2024-01-01T00:00:00Z"));
    te.store.putObject(getEntityTombstoneKey(EntityKind::proxy, "p2"), "{}", testTime("2024-01-01T00:00:00Z"));

    te.entityStore.saveEntity(EntityKind::proxy, "p3", makeProxy("local three", 5));

    ASSERT(checkForMissingSyncedEntities(te.env, te.callback) == 2); //p1 + g1

    ASSERT(te.entityStore.loadEntity(EntityKind::proxy, "p1"));
    ASSERT(!te.entityStore.loadEntity(EntityKind::proxy, "p2")); //deleted intentionally
    ASSERT(getPrimitiveFromJsonObject(te.entityStore.loadEntity(EntityKind::proxy, "p3").value(), "host") == "local three");
    ASSERT(te.entityStore.loadEntity(EntityKind::group, "g1"));

    ASSERT(checkForMissingSyncedEntities(te.env, te.callback) == 0);
}


void testDeleteEntity()
{
    EntityTestEnv te("entity_delete");
    te.store.putObject("groups/g1.json", "{}", testTime("2024-01-01T00:00:00Z"));

    const DeleteResult result = deleteEntity(EntityKind::group, "g1", te.env);
    ASSERT(result.deleted && result.tombstoneCreated);
    ASSERT(!te.store.getObject("groups/g1.json"));
    ASSERT(te.store.getObject("tombstones/groups/g1.json"));

    //remote-only scan does not resurrect it
    ASSERT(checkForMissingSyncedEntities(te.env, te.callback) == 0);
}


void testProfileWithEntities()
{
    EntityTestEnv te("entity_profile");

    ProfileRecord profile;
    profile.id       = "p1";
    profile.syncMode = SyncMode::regular;
    profile.proxyId  = "px1";
    profile.groupId  = "missing-group";
    te.profileStore.saveProfile(profile);
    writeTestFile(te.profileStore.getProfileDataFolder("p1"), Zstr("Preferences"), "{}");

    te.entityStore.saveEntity(EntityKind::proxy, "px1", makeProxy("10.0.0.2", std::nullopt));

    SyncStatusHandler statusHandler("p1", nullptr);
    syncProfile(profile, te.env, statusHandler);

    ASSERT(statusHandler.getFinalStatus() == SyncStatus::synced);
    ASSERT(te.store.getObject("proxies/px1.json"));
    ASSERT(!te.store.getObject("groups/missing-group.json"));
    ASSERT(te.profileStore.loadProfile("p1").value().lastSync.has_value());
}
}


int main(int argc, char* argv[])
{
    openSslInit();

    try
    {
        testLocalOnly();
        testRemoteOnly();
        testLastWriterWins();
        testMissingEntities();
        testDeleteEntity();
        testProfileWithEntities();
    }
    catch (const FileError& e)
    {
        std::cout << "Unexpected error: " << utfTo<std::string>(e.toString()) << std::endl;
        ++ASSERT_COUNT;
    }

    return ASSERT_COUNT;
}
