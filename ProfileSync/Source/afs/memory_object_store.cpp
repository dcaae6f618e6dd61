// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "memory_object_store.h"
#include <psync/time.h>

using namespace psync;


namespace
{
const char URL_SCHEME[] = "mem://";

std::string makeUrl(const char* verb, const std::string& key) { return URL_SCHEME + std::string(verb) + '/' + key; }


std::string makeTombstone(const std::string& deletedKey)
{
    return "{\"deletedKey\": \"" + deletedKey + "\", \"deletedAt\": \"" + formatRfc3339(std::time(nullptr)) + "\"}";
}
}


//context: lockStore_ held
std::string MemoryObjectStore::resolveUrl(const std::string& url, const char* verb) const //throw SysError
{
    const std::string urlPrefix = URL_SCHEME + std::string(verb) + '/';
    if (!startsWith(url, urlPrefix))
        throw SysError(replaceCpy<std::wstring>(L"Invalid URL: %x", L"%x", utfTo<std::wstring>(url)));

    const std::string key = url.substr(urlPrefix.size());
    if (failingKeys_.contains(key))
        throw SysError(replaceCpy<std::wstring>(L"Simulated network failure for %x", L"%x", utfTo<std::wstring>(key)));
    return key;
}


ObjectStat MemoryObjectStore::stat(const std::string& key)
{
    std::lock_guard dummy(lockStore_);
    ++stats_.statCalls;

    auto it = objects_.find(key);
    if (it == objects_.end())
        return {};
    return {true, formatRfc3339(it->second.lastModified), it->second.bytes.size()};
}


PresignedUrl MemoryObjectStore::presignUpload(const std::string& key, const std::string& contentType)
{
    std::lock_guard dummy(lockStore_);
    ++stats_.presignCalls;
    return {key, makeUrl("put", key), formatRfc3339(std::time(nullptr) + 3600)};
}


std::vector<PresignedUrl> MemoryObjectStore::presignUploadBatch(const std::vector<std::pair<std::string, std::string>>& items)
{
    std::lock_guard dummy(lockStore_);
    ++stats_.presignCalls;

    std::vector<PresignedUrl> urls;
    for (const auto& [key, contentType] : items)
        urls.push_back({key, makeUrl("put", key), formatRfc3339(std::time(nullptr) + 3600)});
    return urls;
}


PresignedUrl MemoryObjectStore::presignDownload(const std::string& key) //throw SysError
{
    std::lock_guard dummy(lockStore_);
    ++stats_.presignCalls;

    if (!objects_.contains(key))
        throw SysError(replaceCpy<std::wstring>(L"Object not found: %x", L"%x", utfTo<std::wstring>(key)));
    return {key, makeUrl("get", key), formatRfc3339(std::time(nullptr) + 3600)};
}


std::vector<PresignedUrl> MemoryObjectStore::presignDownloadBatch(const std::vector<std::string>& keys) //throw SysError
{
    std::lock_guard dummy(lockStore_);
    ++stats_.presignCalls;

    std::vector<PresignedUrl> urls;
    for (const std::string& key : keys)
    {
        if (!objects_.contains(key))
            throw SysError(replaceCpy<std::wstring>(L"Object not found: %x", L"%x", utfTo<std::wstring>(key)));
        urls.push_back({key, makeUrl("get", key), formatRfc3339(std::time(nullptr) + 3600)});
    }
    return urls;
}


void MemoryObjectStore::uploadBytes(const std::string& url, const std::string_view bytes, const std::string& contentType) //throw SysError
{
    std::lock_guard dummy(lockStore_);
    ++stats_.uploads;

    const std::string key = resolveUrl(url, "put"); //throw SysError
    objects_[key] = {std::string(bytes), contentType, std::time(nullptr)};
}


std::string MemoryObjectStore::downloadBytes(const std::string& url) //throw SysError
{
    std::lock_guard dummy(lockStore_);
    ++stats_.downloads;

    const std::string key = resolveUrl(url, "get"); //throw SysError
    auto it = objects_.find(key);
    if (it == objects_.end())
        throw SysError(replaceCpy<std::wstring>(L"Object not found: %x", L"%x", utfTo<std::wstring>(key)));
    return it->second.bytes;
}


void MemoryObjectStore::uploadStream(const std::string& url, const std::string& contentType, uint64_t streamSize, //throw SysError, X
                                     const std::function<size_t(std::span<char> buf)>& readBlock /*throw X*/)
{
    {
        std::lock_guard dummy(lockStore_);
        resolveUrl(url, "put"); //throw SysError: fail early
    }

    //run callback outside the lock
    std::string bytes;
    std::vector<char> buf(64 * 1024);
    for (;;)
    {
        const size_t bytesRead = readBlock(buf); //throw X
        bytes.append(buf.data(), bytesRead);
        if (bytesRead < buf.size())
            break;
    }
    if (bytes.size() != streamSize)
        throw SysError(replaceCpy(replaceCpy<std::wstring>(L"Unexpected stream size: %x bytes instead of %y.",
                                                           L"%x", numberTo<std::wstring>(bytes.size())),
                                  L"%y", numberTo<std::wstring>(streamSize)));

    uploadBytes(url, bytes, contentType); //throw SysError
}


void MemoryObjectStore::downloadStream(const std::string& url, const std::function<void(std::span<const char> buf)>& writeBlock /*throw X*/) //throw SysError, X
{
    const std::string bytes = downloadBytes(url); //throw SysError

    //feed in chunks to exercise interruption points
    for (size_t pos = 0; pos < bytes.size(); pos += 64 * 1024)
        writeBlock(std::span<const char>(bytes.data() + pos, std::min<size_t>(64 * 1024, bytes.size() - pos))); //throw X
}


DeleteResult MemoryObjectStore::deleteObject(const std::string& key, const std::optional<std::string>& tombstoneKey)
{
    std::lock_guard dummy(lockStore_);
    ++stats_.deletes;

    DeleteResult result;
    result.deleted = objects_.erase(key) > 0;
    if (tombstoneKey)
    {
        objects_[*tombstoneKey] = {makeTombstone(key), "application/json", std::time(nullptr)};
        result.tombstoneCreated = true;
    }
    return result;
}


DeletePrefixResult MemoryObjectStore::deletePrefix(const std::string& prefix, const std::optional<std::string>& tombstoneKey)
{
    std::lock_guard dummy(lockStore_);
    ++stats_.deletes;

    DeletePrefixResult result;
    for (auto it = objects_.lower_bound(prefix); it != objects_.end() && startsWith(it->first, prefix);)
    {
        it = objects_.erase(it);
        ++result.deletedCount;
    }
    if (tombstoneKey)
    {
        objects_[*tombstoneKey] = {makeTombstone(prefix), "application/json", std::time(nullptr)};
        result.tombstoneCreated = true;
    }
    return result;
}


std::vector<ObjectInfo> MemoryObjectStore::list(const std::string& prefix)
{
    std::lock_guard dummy(lockStore_);
    ++stats_.listCalls;

    std::vector<ObjectInfo> objects;
    for (auto it = objects_.lower_bound(prefix); it != objects_.end() && startsWith(it->first, prefix); ++it)
        objects.push_back({it->first, formatRfc3339(it->second.lastModified), it->second.bytes.size()});
    return objects;
}


std::optional<MemoryObjectStore::Object> MemoryObjectStore::getObject(const std::string& key) const
{
    std::lock_guard dummy(lockStore_);
    auto it = objects_.find(key);
    if (it == objects_.end())
        return std::nullopt;
    return it->second;
}


void MemoryObjectStore::putObject(const std::string& key, const std::string& bytes, time_t lastModified)
{
    std::lock_guard dummy(lockStore_);
    objects_[key] = {bytes, "application/octet-stream", lastModified};
}


void MemoryObjectStore::setLastModified(const std::string& key, time_t lastModified)
{
    std::lock_guard dummy(lockStore_);
    if (auto it = objects_.find(key); it != objects_.end())
        it->second.lastModified = lastModified;
}


std::vector<std::string> MemoryObjectStore::getKeys() const
{
    std::lock_guard dummy(lockStore_);
    std::vector<std::string> keys;
    for (const auto& [key, obj] : objects_)
        keys.push_back(key);
    return keys;
}


void MemoryObjectStore::setFailingKey(const std::string& key, bool fail)
{
    std::lock_guard dummy(lockStore_);
    if (fail)
        failingKeys_.insert(key);
    else
        failingKeys_.erase(key);
}


MemoryObjectStore::RequestStats MemoryObjectStore::getRequestStats() const
{
    std::lock_guard dummy(lockStore_);
    return stats_;
}


void MemoryObjectStore::resetRequestStats()
{
    std::lock_guard dummy(lockStore_);
    stats_ = {};
}
