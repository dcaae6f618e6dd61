// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef HASH_CACHE_H_2047381956203847
#define HASH_CACHE_H_2047381956203847

#include <functional>
#include <optional>
#include <unordered_map>
#include <psync/file_error.h>


namespace psync
{
struct HashCacheEntry
{
    uint64_t size = 0;
    time_t mtime = 0;
    std::string hash;
};

/*  non-authoritative index: relative path -> (size, mtime, content hash)
    - a hash is reused only if size *and* mtime match exactly
    - losing the cache costs time, never correctness                        */
class HashCache
{
public:
    std::optional<std::string> get(const Zstring& relPath, uint64_t size, time_t mtime) const;

    void insert(const Zstring& relPath, uint64_t size, time_t mtime, const std::string& hash); //overwrites existing entry

    //drop entries for files that no longer exist, so the cache does not grow unbounded
    void retainOnly(const std::function<bool(const Zstring& relPath)>& stillExists);

    size_t size() const { return entries_.size(); }

    const std::unordered_map<Zstring, HashCacheEntry>& refEntries() const { return entries_; }

private:
    std::unordered_map<Zstring, HashCacheEntry> entries_;
};


//never fails: a missing or corrupt cache file yields an empty cache
HashCache loadHashCache(const Zstring& filePath, const std::function<void(const std::wstring& msg)>& onLoadFailure /*optional*/); //noexcept

//creates parent folders as needed; transactional
void saveHashCache(const HashCache& cache, const Zstring& filePath); //throw FileError
}

#endif //HASH_CACHE_H_2047381956203847
