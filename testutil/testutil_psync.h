// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef TESTUTIL_PSYNC_H_7305182946031857
#define TESTUTIL_PSYNC_H_7305182946031857

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <thread>
#include <unistd.h>
#include <psync/file_access.h>
#include <psync/file_io.h>
#include <psync/time.h>
#include <base/sync_events.h>

//============================================================================
//                         ProfileSync Test Helpers
//============================================================================

//unique folder below the system temp folder, removed on destruction
class TestFolder
{
public:
    explicit TestFolder(const char* testName)
    {
        static std::atomic<int> folderCount{0};
        path_ = psync::appendPath(psync::getTempFolderPath(), Zstr("psync_") + Zstring(testName) + Zstr('_') +
                                  psync::numberTo<Zstring>(::getpid()) + Zstr('_') + psync::numberTo<Zstring>(++folderCount));
        removeIfExists();
        psync::createDirectoryIfMissingRecursion(path_);
    }

    ~TestFolder()
    {
        try { removeIfExists(); }
        catch (const psync::FileError& e) { std::cout << psync::utfTo<std::string>(e.toString()) << std::endl; }
    }

    const Zstring& path() const { return path_; }

    Zstring operator/(const Zstring& relPath) const { return psync::appendPath(path_, relPath); }

private:
    TestFolder           (const TestFolder&) = delete;
    TestFolder& operator=(const TestFolder&) = delete;

    void removeIfExists()
    {
        if (psync::itemExists(path_))
            psync::removeDirectoryPlainRecursion(path_);
    }

    Zstring path_;
};


inline void writeTestFile(const Zstring& rootPath, const Zstring& relPath, const std::string& content, time_t modTime = 0)
{
    const Zstring filePath = psync::appendPath(rootPath, relPath);
    psync::createDirectoryIfMissingRecursion(psync::getParentFolderPath(filePath));
    psync::setFileContent(filePath, content, nullptr);
    if (modTime != 0)
        psync::setFileTime(filePath, modTime);
}


inline std::string readTestFile(const Zstring& rootPath, const Zstring& relPath)
{
    return psync::getFileContent(psync::appendPath(rootPath, relPath), nullptr);
}


//"2024-01-01T00:00:00Z" -> time_t
inline time_t testTime(const char* rfc3339)
{
    return psync::parseRfc3339(rfc3339).value_or(0);
}


//collects events from all sync passes
class RecordingEventSink : public psync::SyncEventSink
{
public:
    void onSyncStatus(const psync::SyncStatusEvent& event) override
    {
        std::lock_guard dummy(lock_);
        statusEvents_.push_back(event);
    }

    void onSyncProgress(const psync::SyncProgressEvent& event) override
    {
        std::lock_guard dummy(lock_);
        progressEvents_.push_back(event);
    }

    std::vector<psync::SyncStatusEvent> getStatusEvents()
    {
        std::lock_guard dummy(lock_);
        return statusEvents_;
    }

    std::vector<psync::SyncProgressEvent> getProgressEvents()
    {
        std::lock_guard dummy(lock_);
        return progressEvents_;
    }

    std::vector<psync::SyncStatus> getStatusSequence(const std::string& profileId)
    {
        std::vector<psync::SyncStatus> sequence;
        for (const psync::SyncStatusEvent& event : getStatusEvents())
            if (event.profileId == profileId)
                sequence.push_back(event.status);
        return sequence;
    }

    std::optional<psync::SyncStatus> getLastStatus(const std::string& profileId)
    {
        const std::vector<psync::SyncStatus> sequence = getStatusSequence(profileId);
        if (sequence.empty())
            return std::nullopt;
        return sequence.back();
    }

    //poll: event sink is called from worker threads
    bool waitForStatus(const std::string& profileId, psync::SyncStatus status, std::chrono::seconds timeout = std::chrono::seconds(10))
    {
        const auto stopTime = std::chrono::steady_clock::now() + timeout;
        do
        {
            for (psync::SyncStatus s : getStatusSequence(profileId))
                if (s == status)
                    return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        while (std::chrono::steady_clock::now() < stopTime);
        return false;
    }

    void clear()
    {
        std::lock_guard dummy(lock_);
        statusEvents_  .clear();
        progressEvents_.clear();
    }

private:
    std::mutex lock_;
    std::vector<psync::SyncStatusEvent>   statusEvents_;
    std::vector<psync::SyncProgressEvent> progressEvents_;
};

#endif //TESTUTIL_PSYNC_H_7305182946031857
