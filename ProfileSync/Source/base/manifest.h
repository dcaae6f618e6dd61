// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef MANIFEST_H_5610384729105637
#define MANIFEST_H_5610384729105637

#include <functional>
#include "hash_cache.h"
#include "exclude_filter.h"


namespace psync
{
const int MANIFEST_FORMAT_VERSION = 1;

struct ManifestFileEntry
{
    std::string path; //relative, '/'-separated; identity
    uint64_t size = 0;
    int64_t mtime = 0; //unix seconds
    std::string hash; //lower-case hex SHA-256; equality for diffing

    bool operator==(const ManifestFileEntry&) const = default;
};


struct SyncManifest
{
    int version = MANIFEST_FORMAT_VERSION;
    std::string profileId;
    std::string generatedAt; //RFC 3339
    std::string updatedAt;   //RFC 3339: max mtime of all files
    std::vector<Zstring> excludeGlobs;
    std::vector<ManifestFileEntry> files; //sorted by path
};

std::string serializeManifest(const SyncManifest& manifest); //noexcept
SyncManifest parseManifest(const std::string& stream); //throw SysError

//-------------------------------------------------------------------------------------------

//number of files hashed since process start (cache misses)
uint64_t getHashComputationCount();

//relative paths of all files passing the filter, unsorted; missing root folder yields empty list
std::vector<Zstring> scanProfileFolder(const Zstring& rootPath, const ExcludeFilter& filter); //throw FileError

//stat + hash each file; files that disappeared in the meantime are skipped
SyncManifest buildManifest(const std::string& profileId,
                           const Zstring& rootPath,
                           const std::vector<Zstring>& relFilePaths,
                           const std::vector<Zstring>& excludeGlobs,
                           HashCache& cache,
                           const std::function<void(const std::wstring& statusMsg)>& notifyStatus /*throw X; optional*/); //throw FileError, X

SyncManifest generateManifest(const std::string& profileId,
                              const Zstring& rootPath,
                              const ExcludeFilter& filter,
                              HashCache& cache,
                              const std::function<void(const std::wstring& statusMsg)>& notifyStatus /*throw X; optional*/); //throw FileError, X
}

#endif //MANIFEST_H_5610384729105637
