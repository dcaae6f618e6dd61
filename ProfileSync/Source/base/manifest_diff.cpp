// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "manifest_diff.h"
#include <unordered_map>
#include <psync/time.h>

using namespace psync;


SyncDirection psync::getSyncDirection(const SyncManifest& local, const SyncManifest& remote)
{
    const std::optional<time_t> localTime  = parseRfc3339(local .updatedAt);
    const std::optional<time_t> remoteTime = parseRfc3339(remote.updatedAt);

    if (localTime && remoteTime && *remoteTime > *localTime)
        return SyncDirection::remoteToLocal;

    //ties and unparsable timestamps: favor not discarding local edits
    return SyncDirection::localToRemote;
}


namespace
{
std::unordered_map<std::string_view, const ManifestFileEntry*> mapByPath(const std::vector<ManifestFileEntry>& files)
{
    std::unordered_map<std::string_view, const ManifestFileEntry*> output;
    for (const ManifestFileEntry& entry : files)
        output.emplace(entry.path, &entry);
    return output;
}
}


ManifestDiff psync::computeDiff(const SyncManifest& local, const SyncManifest* remote)
{
    ManifestDiff diff;

    if (!remote) //bootstrap: nothing published yet
    {
        diff.filesToUpload = local.files;
        return diff;
    }

    diff.direction = getSyncDirection(local, *remote);

    const std::vector<ManifestFileEntry>& srcFiles = diff.direction == SyncDirection::localToRemote ? local.files : remote->files;
    const std::vector<ManifestFileEntry>& trgFiles = diff.direction == SyncDirection::localToRemote ? remote->files : local.files;

    std::vector<ManifestFileEntry>& filesToCopy   = diff.direction == SyncDirection::localToRemote ? diff.filesToUpload       : diff.filesToDownload;
    std::vector<std::string>&       filesToDelete = diff.direction == SyncDirection::localToRemote ? diff.filesToDeleteRemote : diff.filesToDeleteLocal;

    const auto srcByPath = mapByPath(srcFiles);
    const auto trgByPath = mapByPath(trgFiles);

    //iterate over sorted lists => sorted output
    for (const ManifestFileEntry& srcEntry : srcFiles)
    {
        auto it = trgByPath.find(srcEntry.path);
        if (it == trgByPath.end() || it->second->hash != srcEntry.hash)
            filesToCopy.push_back(srcEntry);
    }

    for (const ManifestFileEntry& trgEntry : trgFiles)
        if (!srcByPath.contains(trgEntry.path))
            filesToDelete.push_back(trgEntry.path);

    return diff;
}
