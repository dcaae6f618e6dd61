// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "manifest.h"
#include <atomic>
#include <psync/file_traverser.h>
#include <psync/open_ssl.h>
#include <psync/json.h>
#include <psync/time.h>

using namespace psync;


namespace
{
std::atomic<uint64_t> hashComputationCount{0};


JsonValue toJson(const ManifestFileEntry& entry)
{
    JsonValue jentry(JsonValue::Type::object);
    jentry.objectVal.emplace("path",  entry.path);
    jentry.objectVal.emplace("size",  entry.size);
    jentry.objectVal.emplace("mtime", entry.mtime);
    jentry.objectVal.emplace("hash",  entry.hash);
    return jentry;
}


ManifestFileEntry fromJson(const JsonValue& jentry) //throw SysError
{
    const std::optional<std::string> path  = getPrimitiveFromJsonObject(jentry, "path");
    const std::optional<uint64_t>    size  = getNumberFromJsonObject<uint64_t>(jentry, "size");
    const std::optional<int64_t>     mtime = getNumberFromJsonObject<int64_t >(jentry, "mtime");
    const std::optional<std::string> hash  = getPrimitiveFromJsonObject(jentry, "hash");

    if (!path || path->empty() || startsWith(*path, '/'))
        throw SysError(L"Manifest file entry without valid \"path\".");
    if (!size || !mtime || !hash)
        throw SysError(replaceCpy<std::wstring>(L"Incomplete manifest file entry for %x.", L"%x", utfTo<std::wstring>(*path)));

    return {*path, *size, *mtime, *hash};
}
}


std::string psync::serializeManifest(const SyncManifest& manifest) //noexcept
{
    std::vector<JsonValue> jexcludes;
    for (const Zstring& glob : manifest.excludeGlobs)
        jexcludes.emplace_back(utfTo<std::string>(glob));

    std::vector<JsonValue> jfiles;
    for (const ManifestFileEntry& entry : manifest.files)
        jfiles.push_back(toJson(entry));

    JsonValue jsonRoot(JsonValue::Type::object);
    jsonRoot.objectVal.emplace("version",      manifest.version);
    jsonRoot.objectVal.emplace("profileId",    manifest.profileId);
    jsonRoot.objectVal.emplace("generatedAt",  manifest.generatedAt);
    jsonRoot.objectVal.emplace("updatedAt",    manifest.updatedAt);
    jsonRoot.objectVal.emplace("excludeGlobs", std::move(jexcludes));
    jsonRoot.objectVal.emplace("files",        std::move(jfiles));

    return serializeJson(jsonRoot);
}


SyncManifest psync::parseManifest(const std::string& stream) //throw SysError
{
    JsonValue jsonRoot;
    try
    {
        jsonRoot = parseJson(stream); //throw JsonParsingError
    }
    catch (const JsonParsingError& e) { throw SysError(formatJsonParsingError(e)); }

    if (jsonRoot.type != JsonValue::Type::object)
        throw SysError(L"Manifest is not a JSON object.");

    SyncManifest manifest;

    if (const std::optional<int> version = getNumberFromJsonObject<int>(jsonRoot, "version"))
        manifest.version = *version;
    else
        throw SysError(L"Manifest without \"version\".");

    if (manifest.version != MANIFEST_FORMAT_VERSION)
        throw SysError(replaceCpy<std::wstring>(L"Unsupported manifest version %x.", L"%x", numberTo<std::wstring>(manifest.version)));

    manifest.profileId   = getPrimitiveFromJsonObject(jsonRoot, "profileId"  ).value_or("");
    manifest.generatedAt = getPrimitiveFromJsonObject(jsonRoot, "generatedAt").value_or("");
    manifest.updatedAt   = getPrimitiveFromJsonObject(jsonRoot, "updatedAt"  ).value_or(""); //unparsable time is handled by diff

    if (const JsonValue* jexcludes = getChildFromJsonObject(jsonRoot, "excludeGlobs"))
        if (jexcludes->type == JsonValue::Type::array)
            for (const JsonValue& jglob : jexcludes->arrayVal)
                if (jglob.type == JsonValue::Type::string)
                    manifest.excludeGlobs.push_back(utfTo<Zstring>(jglob.primVal));

    const JsonValue* jfiles = getChildFromJsonObject(jsonRoot, "files");
    if (!jfiles || jfiles->type != JsonValue::Type::array)
        throw SysError(L"Manifest without \"files\" array.");

    for (const JsonValue& jentry : jfiles->arrayVal)
        manifest.files.push_back(fromJson(jentry)); //throw SysError

    //don't trust the remote side
    std::sort(manifest.files.begin(), manifest.files.end(), [](const ManifestFileEntry& lhs, const ManifestFileEntry& rhs) { return lhs.path < rhs.path; });
    return manifest;
}

//-------------------------------------------------------------------------------------------

uint64_t psync::getHashComputationCount() { return hashComputationCount; }


namespace
{
void scanFolderRecursive(const Zstring& folderPath, const Zstring& relFolderPath, const ExcludeFilter& filter, std::vector<Zstring>& relFilePaths) //throw FileError
{
    std::vector<std::pair<Zstring /*fullPath*/, Zstring /*relPath*/>> subFolders;

    traverseFolder(folderPath,
                   [&](const FileInfo& fi)
    {
        const Zstring relPath = appendPath(relFolderPath, fi.itemName);
        if (!filter.isExcludedFile(relPath))
            relFilePaths.push_back(relPath);
    },
    [&](const FolderInfo& fi)
    {
        const Zstring relPath = appendPath(relFolderPath, fi.itemName);
        if (!filter.isExcludedFolder(relPath))
            subFolders.emplace_back(fi.fullPath, relPath);
    },
    nullptr /*onSymlink: not synced*/); //throw FileError

    for (const auto& [fullPath, relPath] : subFolders)
        try
        {
            scanFolderRecursive(fullPath, relPath, filter, relFilePaths); //throw FileError
        }
        catch (FileError&)
        {
            if (!itemExists(fullPath)) //throw FileError
                continue; //folder deleted while scanning, e.g. by a running browser
            throw;
        }
}
}


std::vector<Zstring> psync::scanProfileFolder(const Zstring& rootPath, const ExcludeFilter& filter) //throw FileError
{
    std::vector<Zstring> relFilePaths;

    if (getItemTypeIfExists(rootPath) != ItemType::folder) //throw FileError
        return relFilePaths; //not yet created => nothing to sync

    scanFolderRecursive(rootPath, Zstring(), filter, relFilePaths); //throw FileError
    return relFilePaths;
}


SyncManifest psync::buildManifest(const std::string& profileId,
                                  const Zstring& rootPath,
                                  const std::vector<Zstring>& relFilePaths,
                                  const std::vector<Zstring>& excludeGlobs,
                                  HashCache& cache,
                                  const std::function<void(const std::wstring& statusMsg)>& notifyStatus /*throw X*/) //throw FileError, X
{
    const time_t now = std::time(nullptr);

    SyncManifest manifest;
    manifest.profileId    = profileId;
    manifest.generatedAt  = formatRfc3339(now);
    manifest.excludeGlobs = excludeGlobs;

    int64_t maxMtime = 0;

    for (const Zstring& relPath : relFilePaths)
    {
        const Zstring filePath = appendPath(rootPath, relPath);

        const std::optional<FileDetails> details = getFileDetailsIfExists(filePath); //throw FileError
        if (!details)
            continue; //disappeared after directory listing

        std::string hash;
        if (std::optional<std::string> cachedHash = cache.get(relPath, details->fileSize, details->modTime))
            hash = std::move(*cachedHash);
        else
        {
            if (notifyStatus)
                notifyStatus(replaceCpy(_("Computing hash of %x"), L"%x", fmtPath(relPath))); //throw X
            try
            {
                hash = hashFileSha256(filePath, nullptr /*notifyUnbufferedIO*/); //throw FileError
                ++hashComputationCount;
            }
            catch (FileError&)
            {
                if (!itemExists(filePath)) //throw FileError
                    continue; //disappeared while hashing
                throw;
            }
            cache.insert(relPath, details->fileSize, details->modTime, hash);
        }

        maxMtime = std::max<int64_t>(maxMtime, details->modTime);
        manifest.files.push_back({utfTo<std::string>(relPath), details->fileSize, details->modTime, hash});
    }

    std::sort(manifest.files.begin(), manifest.files.end(), [](const ManifestFileEntry& lhs, const ManifestFileEntry& rhs) { return lhs.path < rhs.path; });

    //no files: oldest possible time, so that an empty replica never outranks populated remote data
    manifest.updatedAt = formatRfc3339(maxMtime);
    return manifest;
}


SyncManifest psync::generateManifest(const std::string& profileId,
                                     const Zstring& rootPath,
                                     const ExcludeFilter& filter,
                                     HashCache& cache,
                                     const std::function<void(const std::wstring& statusMsg)>& notifyStatus /*throw X*/) //throw FileError, X
{
    const std::vector<Zstring> relFilePaths = scanProfileFolder(rootPath, filter); //throw FileError

    return buildManifest(profileId, rootPath, relFilePaths, filter.getPatterns(), cache, notifyStatus); //throw FileError, X
}
