// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "hash_cache.h"
#include <psync/file_io.h>
#include <psync/json.h>

using namespace psync;


std::optional<std::string> HashCache::get(const Zstring& relPath, uint64_t size, time_t mtime) const
{
    auto it = entries_.find(relPath);
    if (it != entries_.end())
        if (it->second.size  == size &&
            it->second.mtime == mtime)
            return it->second.hash;
    return std::nullopt;
}


void HashCache::insert(const Zstring& relPath, uint64_t size, time_t mtime, const std::string& hash)
{
    entries_.insert_or_assign(relPath, HashCacheEntry{size, mtime, hash});
}


void HashCache::retainOnly(const std::function<bool(const Zstring& relPath)>& stillExists)
{
    std::erase_if(entries_, [&](const auto& item) { return !stillExists(item.first); });
}

//-------------------------------------------------------------------------------------------

namespace
{
HashCache parseHashCache(const std::string& stream) //throw SysError
{
    JsonValue jsonRoot;
    try
    {
        jsonRoot = parseJson(stream); //throw JsonParsingError
    }
    catch (const JsonParsingError& e)
    {
        throw SysError(formatJsonParsingError(e));
    }

    const JsonValue* entries = getChildFromJsonObject(jsonRoot, "entries");
    if (!entries || entries->type != JsonValue::Type::object)
        throw SysError(L"Missing \"entries\" object.");

    HashCache cache;
    for (const auto& [relPath, jentry] : entries->objectVal)
    {
        const std::optional<uint64_t>    size  = getNumberFromJsonObject<uint64_t>(jentry, "size");
        const std::optional<int64_t>     mtime = getNumberFromJsonObject<int64_t >(jentry, "mtime");
        const std::optional<std::string> hash  = getPrimitiveFromJsonObject      (jentry, "hash");

        if (!size || !mtime || !hash || hash->empty())
            throw SysError(replaceCpy<std::wstring>(L"Invalid cache entry for %x.", L"%x", utfTo<std::wstring>(relPath)));

        cache.insert(relPath, *size, static_cast<time_t>(*mtime), *hash);
    }
    return cache;
}
}


HashCache psync::loadHashCache(const Zstring& filePath, const std::function<void(const std::wstring& msg)>& onLoadFailure) //noexcept
{
    try
    {
        if (!itemExists(filePath)) //throw FileError
            return HashCache(); //first run

        const std::string stream = getFileContent(filePath, nullptr /*notifyUnbufferedIO*/); //throw FileError
        try
        {
            return parseHashCache(stream); //throw SysError
        }
        catch (const SysError& e)
        {
            throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)), e.toString());
        }
    }
    catch (const FileError& e)
    {
        if (onLoadFailure)
            onLoadFailure(e.toString());
        return HashCache();
    }
}


void psync::saveHashCache(const HashCache& cache, const Zstring& filePath) //throw FileError
{
    JsonValue jentries(JsonValue::Type::object);

    for (const auto& [relPath, entry] : cache.refEntries())
    {
        JsonValue jentry(JsonValue::Type::object);
        jentry.objectVal.emplace("size",  entry.size);
        jentry.objectVal.emplace("mtime", static_cast<int64_t>(entry.mtime));
        jentry.objectVal.emplace("hash",  entry.hash);

        jentries.objectVal.emplace(relPath, std::move(jentry));
    }

    JsonValue jsonRoot(JsonValue::Type::object);
    jsonRoot.objectVal.emplace("entries", std::move(jentries));

    createDirectoryIfMissingRecursion(getParentFolderPath(filePath)); //throw FileError

    setFileContent(filePath, serializeJson(jsonRoot), nullptr /*notifyUnbufferedIO*/); //throw FileError
}
