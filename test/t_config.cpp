// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <psync/file_traverser.h>
#include <base/config.h>
#include <base/exclude_filter.h>
#include <base/log_file.h>
#include <testutil/testutil_assert.h>
#include <testutil/testutil_psync.h>

using namespace psync;


namespace
{
void testDefaults()
{
    TestFolder tmp("config_defaults");
    writeTestFile(tmp.path(), Zstr("config.json"), R"({ "serverUrl": "https://sync.example.com", "someFutureKey": [1, 2, 3] })");

    const auto [cfg, warningMsg] = readConfig(tmp / Zstr("config.json"));
    ASSERT(warningMsg.empty());
    ASSERT(cfg.serverUrl == "https://sync.example.com");
    ASSERT(cfg.token.empty());
    ASSERT(cfg.transferThreads == 8);
    ASSERT(cfg.timeoutSec == 20);
    ASSERT(cfg.logfilesMaxAgeDays == 14);
    ASSERT(cfg.extraExcludePatterns.empty());
    ASSERT(getExcludePatterns(cfg) == getDefaultExcludePatterns());
}


void testWriteRead()
{
    TestFolder tmp("config_write_read");

    SyncConfig cfg;
    cfg.serverUrl       = "https://sync.example.com/api";
    cfg.token           = "secret-token";
    cfg.caCertFilePath  = Zstr("/etc/ssl/certs/ca-certificates.crt");
    cfg.transferThreads = 4;
    cfg.timeoutSec      = 60;
    cfg.profilesFolder  = Zstr("/home/user/.local/share/app/profiles");
    cfg.entitiesFolder  = Zstr("/home/user/.local/share/app/entities");
    cfg.logFolder       = Zstr("/home/user/.local/share/app/logs");
    cfg.logfilesMaxAgeDays = 0;
    cfg.extraExcludePatterns = { Zstr("Default/Sessions/**"), Zstr("*.bak") };

    const Zstring filePath = tmp / Zstr("sub/folder/config.json"); //parent folders created
    writeConfig(cfg, filePath);

    const auto [cfg2, warningMsg] = readConfig(filePath);
    ASSERT(warningMsg.empty());
    ASSERT(cfg2 == cfg);

    const std::vector<Zstring> patterns = getExcludePatterns(cfg2);
    ASSERT(patterns.size() == getDefaultExcludePatterns().size() + 2);
    ASSERT(patterns.back() == Zstr("*.bak"));
}


void testInvalidValues()
{
    TestFolder tmp("config_invalid");
    writeTestFile(tmp.path(), Zstr("config.json"), R"({ "transferThreads": 0, "timeoutSec": "soon", "token": "t" })");

    const auto [cfg, warningMsg] = readConfig(tmp / Zstr("config.json"));
    ASSERT(!warningMsg.empty());
    ASSERT(contains(warningMsg, L"transferThreads"));
    ASSERT(contains(warningMsg, L"timeoutSec"));
    ASSERT(cfg.transferThreads == 8);
    ASSERT(cfg.timeoutSec == 20);
    ASSERT(cfg.token == "t");
}


void testMalformed()
{
    TestFolder tmp("config_malformed");
    writeTestFile(tmp.path(), Zstr("broken.json"), "{ \"serverUrl\": ");
    writeTestFile(tmp.path(), Zstr("array.json"), "[]");
    writeTestFile(tmp.path(), Zstr("other.json"), R"({ "configType": "SomethingElse" })");

    ASSERT_THROWS(readConfig(tmp / Zstr("broken.json")), ErrorSerialization);
    ASSERT_THROWS(readConfig(tmp / Zstr("array.json")),  ErrorSerialization);
    ASSERT_THROWS(readConfig(tmp / Zstr("other.json")),  ErrorSerialization);
    ASSERT_THROWS(readConfig(tmp / Zstr("missing.json")), FileError);
}


void testLogFile()
{
    TestFolder tmp("log_file");
    const Zstring logFolder = tmp / Zstr("logs");

    ErrorLog log;
    logMsg(log, L"Starting sync", MSG_TYPE_INFO);
    logMsg(log, L"Cannot upload file \"a\".", MSG_TYPE_WARNING);
    logMsg(log, L"Cannot sync profile \"p1\".", MSG_TYPE_ERROR);

    const SyncSummary summary
    {
        .profileId = "p1",
        .result    = SyncStatus::error,
        .startTime = std::time(nullptr),
        .totalTime = std::chrono::milliseconds(2500),
    };

    //stale log file to be cleaned up + unrelated file that stays
    writeTestFile(logFolder, Zstr("p1 2020-01-01 000000.log"), "old", testTime("2020-01-01T00:00:00Z"));
    writeTestFile(logFolder, Zstr("notes.txt"), "keep", testTime("2020-01-01T00:00:00Z"));

    const Zstring logFilePath = saveLogFile(logFolder, summary, log, 14);

    ASSERT(startsWith(getItemName(logFilePath), "p1 "));
    ASSERT(endsWith(logFilePath, Zstr(" [error].log")));

    const std::string content = getFileContent(logFilePath, nullptr);
    ASSERT(startsWith(content, "p1 "));
    ASSERT(contains(content, "Errors: 1"));
    ASSERT(contains(content, "Warnings: 1"));
    ASSERT(contains(content, "Starting sync"));
    ASSERT(contains(content, "Cannot upload file \"a\"."));

    std::vector<Zstring> fileNames;
    traverseFolder(logFolder, [&](const FileInfo& fi) { fileNames.push_back(fi.itemName); }, nullptr, nullptr);
    ASSERT(fileNames.size() == 2);
    ASSERT(!itemExists(appendPath(logFolder, Zstr("p1 2020-01-01 000000.log"))));
    ASSERT(itemExists(appendPath(logFolder, Zstr("notes.txt"))));

    //successful pass: no result tag
    SyncSummary summaryOk = summary;
    summaryOk.result = SyncStatus::synced;
    ASSERT(!contains(generateLogFileName(summaryOk), Zstr("[")));
}
}


int main(int argc, char* argv[])
{
    try
    {
        testDefaults();
        testWriteRead();
        testInvalidValues();
        testMalformed();
        testLogFile();
    }
    catch (const FileError& e)
    {
        std::cout << "Unexpected error: " << utfTo<std::string>(e.toString()) << std::endl;
        ++ASSERT_COUNT;
    }

    return ASSERT_COUNT;
}
