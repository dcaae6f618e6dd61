// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <algorithm>
#include <psync/open_ssl.h>
#include <base/manifest.h>
#include <testutil/testutil_assert.h>
#include <testutil/testutil_psync.h>

using namespace psync;


namespace
{
std::vector<std::string> getPaths(const SyncManifest& manifest)
{
    std::vector<std::string> paths;
    for (const ManifestFileEntry& file : manifest.files)
        paths.push_back(file.path);
    return paths;
}


void testExcludeFilter()
{
    const ExcludeFilter filter(getDefaultExcludePatterns());

    ASSERT(filter.isExcludedFile(Zstr("Cache/data_0")));
    ASSERT(filter.isExcludedFile(Zstr("Default/Cache/data_0"))); //any depth
    ASSERT(filter.isExcludedFile(Zstr("Default/Code Cache/js/index")));
    ASSERT(filter.isExcludedFile(Zstr("debug.log")));
    ASSERT(filter.isExcludedFile(Zstr("Default/Local Storage/leveldb/000003.log")));
    ASSERT(filter.isExcludedFile(Zstr("Default/LOCK")));
    ASSERT(filter.isExcludedFile(Zstr("Default/Preferences.tmp")));
    ASSERT(filter.isExcludedFile(Zstr(".psync/cache.json")));
    ASSERT(filter.isExcludedFile(Zstr(".donut-sync/cache.json")));

    ASSERT(!filter.isExcludedFile(Zstr("Default/Cookies")));
    ASSERT(!filter.isExcludedFile(Zstr("Default/Preferences")));
    ASSERT(!filter.isExcludedFile(Zstr("Default/LOCKED")));
    ASSERT(!filter.isExcludedFile(Zstr("MyCache/data_0")));
    ASSERT(!filter.isExcludedFile(Zstr("changelog.txt")));

    ASSERT(filter.isExcludedFolder(Zstr("Cache")));
    ASSERT(filter.isExcludedFolder(Zstr("Default/GPUCache")));
    ASSERT(!filter.isExcludedFolder(Zstr("Default")));

    const ExcludeFilter filterQ(std::vector<Zstring>{ Zstr("data_?") });
    ASSERT(filterQ.isExcludedFile(Zstr("x/data_1")));
    ASSERT(!filterQ.isExcludedFile(Zstr("x/data_12")));

    ASSERT_THROWS(ExcludeFilter(std::vector<Zstring>{ Zstr("") }), ErrorInvalidData);
    ASSERT_THROWS(ExcludeFilter(std::vector<Zstring>{ Zstr("/absolute/**") }), ErrorInvalidData);
}


void testScanExcludes()
{
    TestFolder tmp("scan");
    writeTestFile(tmp.path(), Zstr("Default/Cookies"), "cookies");
    writeTestFile(tmp.path(), Zstr("Default/Preferences"), "{}");
    writeTestFile(tmp.path(), Zstr("Default/Cache/data_0"), "cached");
    writeTestFile(tmp.path(), Zstr("Default/chrome_debug.log"), "log");
    writeTestFile(tmp.path(), Zstr("Default/Code Cache/js/index"), "code");
    writeTestFile(tmp.path(), Zstr("Default/Code Cache/wasm/index-dir/the-real-index"), "code");
    writeTestFile(tmp.path(), Zstr("Default/Cookies-journal.tmp"), "tmp");
    writeTestFile(tmp.path(), Zstr("download.tmp"), "tmp");
    writeTestFile(tmp.path(), Zstr(".psync/cache.json"), "{}");
    writeTestFile(tmp.path(), Zstr(".donut-sync/cache.json"), "{}");

    HashCache cache;
    const SyncManifest manifest = generateManifest("p1", tmp.path(), ExcludeFilter(getDefaultExcludePatterns()), cache, nullptr);

    ASSERT(getPaths(manifest) == std::vector<std::string>({ "Default/Cookies", "Default/Preferences" })); //sorted
    ASSERT(manifest.profileId == "p1");
    ASSERT(manifest.version == MANIFEST_FORMAT_VERSION);
    ASSERT(manifest.excludeGlobs == getDefaultExcludePatterns());
    ASSERT(manifest.files[0].size == 7);
    ASSERT(manifest.files[0].hash == hashBytesSha256("cookies"));
}


void testMissingRootFolder()
{
    TestFolder tmp("missing_root");

    HashCache cache;
    const SyncManifest manifest = generateManifest("p1", tmp / Zstr("does not exist"), ExcludeFilter(std::vector<Zstring>()), cache, nullptr);
    ASSERT(manifest.files.empty());
    ASSERT(manifest.updatedAt == "1970-01-01T00:00:00Z");
}


void testUpdatedAt()
{
    TestFolder tmp("updated_at");
    writeTestFile(tmp.path(), Zstr("a"), "1", testTime("2024-01-01T00:00:00Z"));
    writeTestFile(tmp.path(), Zstr("b/c"), "2", testTime("2024-03-05T10:20:30Z"));

    HashCache cache;
    const SyncManifest manifest = generateManifest("p1", tmp.path(), ExcludeFilter(std::vector<Zstring>()), cache, nullptr);
    ASSERT(manifest.updatedAt == "2024-03-05T10:20:30Z");
    ASSERT(manifest.files.size() == 2);
    ASSERT(manifest.files[1].path == "b/c");
    ASSERT(manifest.files[1].mtime == testTime("2024-03-05T10:20:30Z"));
}


void testHashCacheReuse()
{
    TestFolder tmp("hash_cache");
    const Zstring dataPath = tmp / Zstr("data"); //cache file lives outside of the scanned folder
    writeTestFile(dataPath, Zstr("a.txt"), "alpha", testTime("2024-01-01T00:00:00Z"));
    writeTestFile(dataPath, Zstr("b.txt"), "beta",  testTime("2024-01-01T00:00:00Z"));

    const ExcludeFilter filter(std::vector<Zstring>{});
    HashCache cache;

    const uint64_t countBefore = getHashComputationCount();
    const SyncManifest first = generateManifest("p1", dataPath, filter, cache, nullptr);
    ASSERT(getHashComputationCount() == countBefore + 2);
    ASSERT(cache.size() == 2);

    //unchanged files: no hashing at all
    const SyncManifest second = generateManifest("p1", dataPath, filter, cache, nullptr);
    ASSERT(getHashComputationCount() == countBefore + 2);
    ASSERT(second.files == first.files);

    //same size, different mtime: rehash
    writeTestFile(dataPath, Zstr("a.txt"), "ALPHA", testTime("2024-01-02T00:00:00Z"));
    const SyncManifest third = generateManifest("p1", dataPath, filter, cache, nullptr);
    ASSERT(getHashComputationCount() == countBefore + 3);
    ASSERT(third.files[0].hash == hashBytesSha256("ALPHA"));

    //persisted cache survives a restart
    const Zstring cacheFilePath = tmp / Zstr("cache/cache.json");
    saveHashCache(cache, cacheFilePath);

    std::wstring loadError;
    HashCache reloaded = loadHashCache(cacheFilePath, [&](const std::wstring& msg) { loadError = msg; });
    ASSERT(loadError.empty());
    ASSERT(reloaded.size() == 2);
    ASSERT(reloaded.get(Zstr("a.txt"), 5, testTime("2024-01-02T00:00:00Z")) == hashBytesSha256("ALPHA"));
    ASSERT(!reloaded.get(Zstr("a.txt"), 5, testTime("2024-01-01T00:00:00Z")));
    ASSERT(!reloaded.get(Zstr("a.txt"), 6, testTime("2024-01-02T00:00:00Z")));

    generateManifest("p1", dataPath, filter, reloaded, nullptr);
    ASSERT(getHashComputationCount() == countBefore + 3);

    reloaded.retainOnly([](const Zstring& relPath) { return relPath == Zstr("b.txt"); });
    ASSERT(reloaded.size() == 1);
}


void testCorruptHashCache()
{
    TestFolder tmp("corrupt_cache");
    writeTestFile(tmp.path(), Zstr("cache.json"), "{ this is not json");

    std::wstring loadError;
    const HashCache cache = loadHashCache(tmp / Zstr("cache.json"), [&](const std::wstring& msg) { loadError = msg; });
    ASSERT(cache.size() == 0);
    ASSERT(!loadError.empty());

    //first run: no error
    loadError.clear();
    loadHashCache(tmp / Zstr("missing.json"), [&](const std::wstring& msg) { loadError = msg; });
    ASSERT(loadError.empty());
}


void testDisappearingFile()
{
    TestFolder tmp("disappearing");
    writeTestFile(tmp.path(), Zstr("kept"),    "1");
    writeTestFile(tmp.path(), Zstr("removed"), "2");

    const std::vector<Zstring> relPaths = scanProfileFolder(tmp.path(), ExcludeFilter(std::vector<Zstring>()));
    ASSERT(relPaths.size() == 2);

    removeFilePlain(tmp / Zstr("removed")); //deleted between listing and hashing

    HashCache cache;
    const SyncManifest manifest = buildManifest("p1", tmp.path(), relPaths, {}, cache, nullptr);
    ASSERT(getPaths(manifest) == std::vector<std::string>({ "kept" }));
}


void testSerialization()
{
    SyncManifest manifest;
    manifest.profileId   = "p1";
    manifest.generatedAt = "2024-01-03T00:00:00Z";
    manifest.updatedAt   = "2024-01-02T00:00:00Z";
    manifest.excludeGlobs = { Zstr("Cache/**") };
    manifest.files.push_back({ "Default/Cookies", 7, 1704153600, hashBytesSha256("cookies") });
    manifest.files.push_back({ "Local State", 2, 1704067200, hashBytesSha256("{}") });

    const std::string stream = serializeManifest(manifest);
    ASSERT(contains(stream, "\"profileId\""));
    ASSERT(contains(stream, "\"updatedAt\""));

    const SyncManifest parsed = parseManifest(stream);
    ASSERT(parsed.profileId   == manifest.profileId);
    ASSERT(parsed.generatedAt == manifest.generatedAt);
    ASSERT(parsed.updatedAt   == manifest.updatedAt);
    ASSERT(parsed.excludeGlobs == manifest.excludeGlobs);
    ASSERT(parsed.files == manifest.files);

    ASSERT_THROWS(parseManifest("[]"), SysError);
    ASSERT_THROWS(parseManifest("{\"profileId\": \"p1\"}"), SysError);
    ASSERT_THROWS(parseManifest("{ broken"), SysError);
}
}


int main(int argc, char* argv[])
{
    openSslInit();

    testExcludeFilter();
    testScanExcludes();
    testMissingRootFolder();
    testUpdatedAt();
    testHashCacheReuse();
    testCorruptHashCache();
    testDisappearingFile();
    testSerialization();

    return ASSERT_COUNT;
}
