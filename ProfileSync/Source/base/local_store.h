// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef LOCAL_STORE_H_9130572846017362
#define LOCAL_STORE_H_9130572846017362

#include <map>
#include <mutex>
#include <optional>
#include <psync/file_error.h>
#include <psync/json.h>


namespace psync
{
//profile and entity ids: 1-128 characters of [A-Za-z0-9_-]
bool isValidObjectId(const std::string& id);
void checkObjectId(const std::string& id); //throw ErrorInvalidData


enum class SyncMode
{
    disabled,
    regular,
};

struct ProfileRecord
{
    std::string id;
    std::string name;
    std::optional<std::string> proxyId;
    std::optional<std::string> groupId;
    std::optional<std::string> vpnId;
    SyncMode syncMode = SyncMode::disabled;
    std::optional<int64_t> lastSync;   //unix seconds
    std::optional<int64_t> processId;  //volatile: only meaningful on this device
    std::optional<int64_t> lastLaunch; //
    std::map<std::string, JsonValue> otherFields; //browser, version, tags, ... preserved as-is
};

std::string serializeProfileRecord(const ProfileRecord& profile); //noexcept
ProfileRecord parseProfileRecord(const std::string& stream); //throw SysError

//strip volatile fields before upload
ProfileRecord sanitizeProfileRecord(ProfileRecord profile);

//------------------------------------------------------------------------------------------

/*  <profilesFolder>/<id>/metadata.json    profile record
    <profilesFolder>/<id>/profile/          synced browser data         */
class LocalProfileStore
{
public:
    explicit LocalProfileStore(const Zstring& profilesFolder) : profilesFolder_(profilesFolder) {}

    std::vector<std::string> listProfileIds() const; //throw FileError

    bool profileExists(const std::string& profileId) const; //throw FileError, ErrorInvalidData

    std::optional<ProfileRecord> loadProfile(const std::string& profileId) const; //throw FileError, ErrorSerialization, ErrorInvalidData

    void saveProfile(const ProfileRecord& profile) const; //throw FileError, ErrorInvalidData

    Zstring getProfileFolder    (const std::string& profileId) const; //throw ErrorInvalidData
    Zstring getProfileDataFolder(const std::string& profileId) const; //
    Zstring getMetadataFilePath (const std::string& profileId) const; //

private:
    const Zstring profilesFolder_;
};

//------------------------------------------------------------------------------------------

//independent objects that travel with a profile
enum class EntityKind
{
    proxy,
    group,
    vpn,
};

const EntityKind ENTITY_KINDS[] = { EntityKind::proxy, EntityKind::group, EntityKind::vpn };

//"proxies", "groups", "vpns": both local folder name and remote key prefix
std::string getEntityKindFolder(EntityKind kind);
std::wstring getEntityKindLabel(EntityKind kind);

std::optional<int64_t> getEntityLastSync(const JsonValue& entity);
void setEntityLastSync(JsonValue& entity, int64_t lastSync);


//<entitiesFolder>/<proxies|groups|vpns>/<id>.json
class LocalEntityStore
{
public:
    explicit LocalEntityStore(const Zstring& entitiesFolder) : entitiesFolder_(entitiesFolder) {}

    std::vector<std::string> listEntityIds(EntityKind kind) const; //throw FileError

    std::optional<JsonValue> loadEntity(EntityKind kind, const std::string& entityId) const; //throw FileError, ErrorSerialization, ErrorInvalidData

    void saveEntity(EntityKind kind, const std::string& entityId, const JsonValue& entity) const; //throw FileError, ErrorInvalidData

    Zstring getEntityFilePath(EntityKind kind, const std::string& entityId) const; //throw ErrorInvalidData

    //entities are shared between profiles: serialize read-modify-write cycles
    std::mutex& refSyncLock() { return syncLock_; }

private:
    const Zstring entitiesFolder_;
    std::mutex syncLock_;
};
}

#endif //LOCAL_STORE_H_9130572846017362
