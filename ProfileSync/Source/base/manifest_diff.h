// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef MANIFEST_DIFF_H_3817206493725164
#define MANIFEST_DIFF_H_3817206493725164

#include "manifest.h"


namespace psync
{
enum class SyncDirection
{
    localToRemote,
    remoteToLocal,
};

struct ManifestDiff
{
    SyncDirection direction = SyncDirection::localToRemote;

    std::vector<ManifestFileEntry> filesToUpload;
    std::vector<ManifestFileEntry> filesToDownload;
    std::vector<std::string> filesToDeleteLocal;  //relative paths
    std::vector<std::string> filesToDeleteRemote; //

    bool empty() const
    {
        return filesToUpload      .empty() &&
               filesToDownload    .empty() &&
               filesToDeleteLocal .empty() &&
               filesToDeleteRemote.empty();
    }
};

/*  whole-manifest last-writer-wins:
    - no remote manifest: upload everything
    - local "updatedAt" newer or equal, or any timestamp unparsable: local is authoritative
    - remote "updatedAt" strictly newer: remote is authoritative                           */
SyncDirection getSyncDirection(const SyncManifest& local, const SyncManifest& remote);

ManifestDiff computeDiff(const SyncManifest& local, const SyncManifest* remote /*optional*/);
}

#endif //MANIFEST_DIFF_H_3817206493725164
