// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <base/manifest_diff.h>
#include <testutil/testutil_assert.h>

using namespace psync;


namespace
{
SyncManifest makeManifest(const std::string& updatedAt, const std::vector<ManifestFileEntry>& files)
{
    SyncManifest manifest;
    manifest.profileId   = "p1";
    manifest.generatedAt = updatedAt;
    manifest.updatedAt   = updatedAt;
    manifest.files       = files;
    return manifest;
}


std::vector<std::string> getPaths(const std::vector<ManifestFileEntry>& files)
{
    std::vector<std::string> paths;
    for (const ManifestFileEntry& file : files)
        paths.push_back(file.path);
    return paths;
}


void testBootstrap()
{
    const SyncManifest local = makeManifest("2024-01-01T00:00:00Z",
    {
        { "a", 1, 1704067200, "h1" },
        { "b", 2, 1704067200, "h2" },
    });

    const ManifestDiff diff = computeDiff(local, nullptr);
    ASSERT(diff.direction == SyncDirection::localToRemote);
    ASSERT(getPaths(diff.filesToUpload) == std::vector<std::string>({ "a", "b" }));
    ASSERT(diff.filesToDownload    .empty());
    ASSERT(diff.filesToDeleteLocal .empty());
    ASSERT(diff.filesToDeleteRemote.empty());

    ASSERT(computeDiff(makeManifest("1970-01-01T00:00:00Z", {}), nullptr).empty());
}


void testRemoteNewer()
{
    const SyncManifest local = makeManifest("2024-01-01T00:00:00Z",
    {
        { "a", 1, 1704067200, "h1" },
        { "b", 1, 1704067200, "h2" },
        { "c", 1, 1704067200, "h3" },
    });
    const SyncManifest remote = makeManifest("2024-01-02T00:00:00Z",
    {
        { "a", 1, 1704153600, "h1" },  //same content
        { "b", 1, 1704153600, "h2x" }, //changed
        { "d", 1, 1704153600, "h4" },  //new
    });

    const ManifestDiff diff = computeDiff(local, &remote);
    ASSERT(diff.direction == SyncDirection::remoteToLocal);
    ASSERT(getPaths(diff.filesToDownload) == std::vector<std::string>({ "b", "d" }));
    ASSERT(diff.filesToDeleteLocal == std::vector<std::string>({ "c" }));
    ASSERT(diff.filesToUpload      .empty());
    ASSERT(diff.filesToDeleteRemote.empty());
}


void testLocalNewer()
{
    const SyncManifest local = makeManifest("2024-01-03T00:00:00Z",
    {
        { "a", 1, 1704067200, "h1" },
        { "e", 1, 1704240000, "h5" },
    });
    const SyncManifest remote = makeManifest("2024-01-02T00:00:00Z",
    {
        { "a", 1, 1704067200, "h1" },
        { "z", 1, 1704153600, "h9" },
    });

    const ManifestDiff diff = computeDiff(local, &remote);
    ASSERT(diff.direction == SyncDirection::localToRemote);
    ASSERT(getPaths(diff.filesToUpload) == std::vector<std::string>({ "e" }));
    ASSERT(diff.filesToDeleteRemote == std::vector<std::string>({ "z" }));
    ASSERT(diff.filesToDownload   .empty());
    ASSERT(diff.filesToDeleteLocal.empty());
}


void testChangedNewAndDeleted()
{
    const SyncManifest local = makeManifest("2024-01-02T00:00:00Z",
    {
        { "changed.txt",   1, 1704153600, "B2" },
        { "new_file.txt",  1, 1704153600, "C"  },
        { "unchanged.txt", 1, 1704067200, "A"  },
    });
    const SyncManifest remote = makeManifest("2024-01-01T00:00:00Z",
    {
        { "changed.txt",   1, 1704067200, "B1" },
        { "deleted.txt",   1, 1704067200, "D"  },
        { "unchanged.txt", 1, 1704067200, "A"  },
    });

    const ManifestDiff diff = computeDiff(local, &remote);
    ASSERT(diff.direction == SyncDirection::localToRemote);
    ASSERT(getPaths(diff.filesToUpload) == std::vector<std::string>({ "changed.txt", "new_file.txt" }));
    ASSERT(diff.filesToDownload    .empty());
    ASSERT(diff.filesToDeleteLocal .empty());
    ASSERT(diff.filesToDeleteRemote == std::vector<std::string>({ "deleted.txt" }));
}


void testTieBreak()
{
    const SyncManifest local  = makeManifest("2024-01-02T00:00:00Z", { { "a", 1, 1704153600, "local" } });
    const SyncManifest remote = makeManifest("2024-01-02T00:00:00Z", { { "a", 1, 1704153600, "remote" } });

    ASSERT(getSyncDirection(local, remote) == SyncDirection::localToRemote);

    const ManifestDiff diff = computeDiff(local, &remote);
    ASSERT(getPaths(diff.filesToUpload) == std::vector<std::string>({ "a" }));

    //unparsable time on either side: local wins
    ASSERT(getSyncDirection(makeManifest("garbage", {}), makeManifest("2024-01-02T00:00:00Z", {})) == SyncDirection::localToRemote);
    ASSERT(getSyncDirection(makeManifest("2024-01-01T00:00:00Z", {}), makeManifest("", {})) == SyncDirection::localToRemote);

    //equivalent instants in different time zones
    ASSERT(getSyncDirection(makeManifest("2024-01-02T01:00:00+01:00", {}), makeManifest("2024-01-02T00:00:00Z", {})) == SyncDirection::localToRemote);
    ASSERT(getSyncDirection(makeManifest("2024-01-02T00:00:00+01:00", {}), makeManifest("2024-01-02T00:00:00Z", {})) == SyncDirection::remoteToLocal);
}


void testIdentical()
{
    const SyncManifest local  = makeManifest("2024-01-01T00:00:00Z", { { "a", 1, 1704067200, "h1" } });
    SyncManifest remote = local;
    remote.generatedAt = "2024-05-01T00:00:00Z"; //not relevant for the diff

    ASSERT(computeDiff(local, &remote).empty());
}
}


int main(int argc, char* argv[])
{
    testBootstrap();
    testRemoteNewer();
    testLocalNewer();
    testChangedNewAndDeleted();
    testTieBreak();
    testIdentical();

    return ASSERT_COUNT;
}
