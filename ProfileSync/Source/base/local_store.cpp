// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "local_store.h"
#include <algorithm>
#include <cassert>
#include <psync/file_access.h>
#include <psync/file_io.h>
#include <psync/file_traverser.h>

using namespace psync;


namespace
{
const size_t OBJECT_ID_MAX_LENGTH = 128;

const Zchar PROFILE_METADATA_FILE_NAME[] = Zstr("metadata.json");
const Zchar PROFILE_DATA_FOLDER_NAME []  = Zstr("profile");


std::optional<std::string> getOptionalString(const JsonValue& jval, const std::string& name)
{
    if (const JsonValue* child = getChildFromJsonObject(jval, name))
        if (child->type == JsonValue::Type::string)
            return child->primVal;
    return std::nullopt;
}


void setOptionalString(JsonValue& jval, const std::string& name, const std::optional<std::string>& value)
{
    jval.objectVal[name] = value ? JsonValue(*value) : JsonValue();
}


void setOptionalNumber(JsonValue& jval, const std::string& name, const std::optional<int64_t>& value)
{
    jval.objectVal[name] = value ? JsonValue(*value) : JsonValue();
}


JsonValue parseJsonObject(const std::string& stream) //throw SysError
{
    JsonValue jval;
    try
    {
        jval = parseJson(stream); //throw JsonParsingError
    }
    catch (const JsonParsingError& e)
    {
        throw SysError(formatJsonParsingError(e));
    }
    if (jval.type != JsonValue::Type::object)
        throw SysError(L"JSON object expected.");
    return jval;
}


std::optional<std::string> readFileIfExists(const Zstring& filePath) //throw FileError
{
    if (!getItemTypeIfExists(filePath)) //throw FileError
        return std::nullopt;
    return getFileContent(filePath, nullptr /*notifyUnbufferedIO*/); //throw FileError
}
}


bool psync::isValidObjectId(const std::string& id)
{
    return !id.empty() && id.size() <= OBJECT_ID_MAX_LENGTH &&
           std::all_of(id.begin(), id.end(), [](char c) { return isAsciiAlpha(c) || isDigit(c) || c == '_' || c == '-'; });
}


void psync::checkObjectId(const std::string& id) //throw ErrorInvalidData
{
    if (!isValidObjectId(id))
        throw ErrorInvalidData(replaceCpy(_("Invalid identifier %x."), L"%x", fmtPath(utfTo<std::wstring>(id))));
}

//------------------------------------------------------------------------------------------

std::string psync::serializeProfileRecord(const ProfileRecord& profile) //noexcept
{
    JsonValue jrecord(JsonValue::Type::object);
    jrecord.objectVal = profile.otherFields;

    jrecord.objectVal["id"  ] = JsonValue(profile.id);
    jrecord.objectVal["name"] = JsonValue(profile.name);
    setOptionalString(jrecord, "proxy_id", profile.proxyId);
    setOptionalString(jrecord, "group_id", profile.groupId);
    setOptionalString(jrecord, "vpn_id",   profile.vpnId);
    jrecord.objectVal["sync_mode"] = JsonValue(profile.syncMode == SyncMode::regular ? "Regular" : "Disabled");
    setOptionalNumber(jrecord, "last_sync",   profile.lastSync);
    setOptionalNumber(jrecord, "process_id",  profile.processId);
    setOptionalNumber(jrecord, "last_launch", profile.lastLaunch);

    return serializeJson(jrecord);
}


ProfileRecord psync::parseProfileRecord(const std::string& stream) //throw SysError
{
    JsonValue jrecord = parseJsonObject(stream); //throw SysError

    ProfileRecord profile;
    const std::optional<std::string> id = getOptionalString(jrecord, "id");
    if (!id)
        throw SysError(L"Missing field \"id\".");
    profile.id = *id;

    profile.name    = getOptionalString(jrecord, "name").value_or("");
    profile.proxyId = getOptionalString(jrecord, "proxy_id");
    profile.groupId = getOptionalString(jrecord, "group_id");
    profile.vpnId   = getOptionalString(jrecord, "vpn_id");

    if (const std::optional<std::string> syncMode = getOptionalString(jrecord, "sync_mode"))
    {
        if (*syncMode == "Regular")
            profile.syncMode = SyncMode::regular;
        else if (*syncMode == "Disabled")
            profile.syncMode = SyncMode::disabled;
        else
            throw SysError(replaceCpy<std::wstring>(L"Unknown sync mode \"%x\".", L"%x", utfTo<std::wstring>(*syncMode)));
    }
    else //older records: boolean flag
        profile.syncMode = getBoolFromJsonObject(jrecord, "sync_enabled").value_or(false) ? SyncMode::regular : SyncMode::disabled;

    profile.lastSync   = getNumberFromJsonObject<int64_t>(jrecord, "last_sync");
    profile.processId  = getNumberFromJsonObject<int64_t>(jrecord, "process_id");
    profile.lastLaunch = getNumberFromJsonObject<int64_t>(jrecord, "last_launch");

    for (const char* knownField : {"id", "name", "proxy_id", "group_id", "vpn_id", "sync_mode", "sync_enabled", "last_sync", "process_id", "last_launch"})
        jrecord.objectVal.erase(knownField);
    profile.otherFields = std::move(jrecord.objectVal);

    return profile;
}


ProfileRecord psync::sanitizeProfileRecord(ProfileRecord profile)
{
    profile.processId  = std::nullopt;
    profile.lastLaunch = std::nullopt;
    return profile;
}

//------------------------------------------------------------------------------------------

Zstring LocalProfileStore::getProfileFolder(const std::string& profileId) const //throw ErrorInvalidData
{
    checkObjectId(profileId); //throw ErrorInvalidData
    return appendPath(profilesFolder_, utfTo<Zstring>(profileId));
}


Zstring LocalProfileStore::getProfileDataFolder(const std::string& profileId) const //throw ErrorInvalidData
{
    return appendPath(getProfileFolder(profileId), PROFILE_DATA_FOLDER_NAME); //throw ErrorInvalidData
}


Zstring LocalProfileStore::getMetadataFilePath(const std::string& profileId) const //throw ErrorInvalidData
{
    return appendPath(getProfileFolder(profileId), PROFILE_METADATA_FILE_NAME); //throw ErrorInvalidData
}


std::vector<std::string> LocalProfileStore::listProfileIds() const //throw FileError
{
    std::vector<std::string> profileIds;

    if (getItemTypeIfExists(profilesFolder_) != ItemType::folder) //throw FileError
        return profileIds;

    traverseFolder(profilesFolder_, nullptr /*onFile*/, [&](const FolderInfo& fi)
    {
        const std::string folderName = utfTo<std::string>(fi.itemName);
        if (isValidObjectId(folderName) &&
            getItemTypeIfExists(appendPath(fi.fullPath, PROFILE_METADATA_FILE_NAME)) == ItemType::file) //throw FileError
            profileIds.push_back(folderName);
    }, nullptr /*onSymlink*/); //throw FileError

    std::sort(profileIds.begin(), profileIds.end());
    return profileIds;
}


bool LocalProfileStore::profileExists(const std::string& profileId) const //throw FileError, ErrorInvalidData
{
    return getItemTypeIfExists(getMetadataFilePath(profileId)) == ItemType::file; //throw FileError, ErrorInvalidData
}


std::optional<ProfileRecord> LocalProfileStore::loadProfile(const std::string& profileId) const //throw FileError, ErrorSerialization, ErrorInvalidData
{
    const Zstring filePath = getMetadataFilePath(profileId); //throw ErrorInvalidData

    const std::optional<std::string> stream = readFileIfExists(filePath); //throw FileError
    if (!stream)
        return std::nullopt;

    try
    {
        ProfileRecord profile = parseProfileRecord(*stream); //throw SysError
        if (profile.id != profileId)
            throw SysError(replaceCpy<std::wstring>(L"Profile id mismatch: \"%x\"", L"%x", utfTo<std::wstring>(profile.id)));
        return profile;
    }
    catch (const SysError& e)
    {
        throw ErrorSerialization(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)), e.toString());
    }
}


void LocalProfileStore::saveProfile(const ProfileRecord& profile) const //throw FileError, ErrorInvalidData
{
    const Zstring filePath = getMetadataFilePath(profile.id); //throw ErrorInvalidData

    createDirectoryIfMissingRecursion(getProfileFolder(profile.id)); //throw FileError
    setFileContent(filePath, serializeProfileRecord(profile), nullptr /*notifyUnbufferedIO*/); //throw FileError
}

//------------------------------------------------------------------------------------------

std::string psync::getEntityKindFolder(EntityKind kind)
{
    switch (kind)
    {
        case EntityKind::proxy:
            return "proxies";
        case EntityKind::group:
            return "groups";
        case EntityKind::vpn:
            return "vpns";
    }
    assert(false);
    return "proxies";
}


std::wstring psync::getEntityKindLabel(EntityKind kind)
{
    switch (kind)
    {
        case EntityKind::proxy:
            return _("Proxy");
        case EntityKind::group:
            return _("Group");
        case EntityKind::vpn:
            return _("VPN");
    }
    assert(false);
    return std::wstring();
}


std::optional<int64_t> psync::getEntityLastSync(const JsonValue& entity)
{
    return getNumberFromJsonObject<int64_t>(entity, "last_sync");
}


void psync::setEntityLastSync(JsonValue& entity, int64_t lastSync)
{
    entity.objectVal["last_sync"] = JsonValue(lastSync);
}


Zstring LocalEntityStore::getEntityFilePath(EntityKind kind, const std::string& entityId) const //throw ErrorInvalidData
{
    checkObjectId(entityId); //throw ErrorInvalidData
    return appendPath(appendPath(entitiesFolder_, utfTo<Zstring>(getEntityKindFolder(kind))), utfTo<Zstring>(entityId + ".json"));
}


std::vector<std::string> LocalEntityStore::listEntityIds(EntityKind kind) const //throw FileError
{
    std::vector<std::string> entityIds;

    const Zstring folderPath = appendPath(entitiesFolder_, utfTo<Zstring>(getEntityKindFolder(kind)));
    if (getItemTypeIfExists(folderPath) != ItemType::folder) //throw FileError
        return entityIds;

    traverseFolder(folderPath, [&](const FileInfo& fi)
    {
        if (endsWith(fi.itemName, Zstr(".json")))
            if (const std::string entityId = utfTo<std::string>(beforeLast(fi.itemName, Zstr(".json"), IfNotFoundReturn::none));
                isValidObjectId(entityId))
                entityIds.push_back(entityId);
    }, nullptr /*onFolder*/, nullptr /*onSymlink*/); //throw FileError

    std::sort(entityIds.begin(), entityIds.end());
    return entityIds;
}


std::optional<JsonValue> LocalEntityStore::loadEntity(EntityKind kind, const std::string& entityId) const //throw FileError, ErrorSerialization, ErrorInvalidData
{
    const Zstring filePath = getEntityFilePath(kind, entityId); //throw ErrorInvalidData

    const std::optional<std::string> stream = readFileIfExists(filePath); //throw FileError
    if (!stream)
        return std::nullopt;

    try
    {
        return parseJsonObject(*stream); //throw SysError
    }
    catch (const SysError& e)
    {
        throw ErrorSerialization(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)), e.toString());
    }
}


void LocalEntityStore::saveEntity(EntityKind kind, const std::string& entityId, const JsonValue& entity) const //throw FileError, ErrorInvalidData
{
    const Zstring filePath = getEntityFilePath(kind, entityId); //throw ErrorInvalidData

    createDirectoryIfMissingRecursion(getParentFolderPath(filePath)); //throw FileError
    setFileContent(filePath, serializeJson(entity), nullptr /*notifyUnbufferedIO*/); //throw FileError
}
