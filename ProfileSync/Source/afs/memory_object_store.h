// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef MEMORY_OBJECT_STORE_H_5172093846152037
#define MEMORY_OBJECT_STORE_H_5172093846152037

#include <map>
#include <mutex>
#include <set>
#include "object_store.h"


namespace psync
{
//in-process object store, e.g. for tests; signed URLs have the form "mem://<get|put>/<key>"
class MemoryObjectStore : public ObjectStore
{
public:
    MemoryObjectStore() {}

    ObjectStat stat(const std::string& key) override;

    PresignedUrl presignUpload(const std::string& key, const std::string& contentType) override;
    std::vector<PresignedUrl> presignUploadBatch(const std::vector<std::pair<std::string, std::string>>& items) override;

    PresignedUrl presignDownload(const std::string& key) override; //throw SysError
    std::vector<PresignedUrl> presignDownloadBatch(const std::vector<std::string>& keys) override; //throw SysError

    void uploadBytes(const std::string& url, const std::string_view bytes, const std::string& contentType) override; //throw SysError
    std::string downloadBytes(const std::string& url) override; //throw SysError

    void uploadStream(const std::string& url, const std::string& contentType, uint64_t streamSize,
                      const std::function<size_t(std::span<char> buf)>& readBlock /*throw X*/) override; //throw SysError, X
    void downloadStream(const std::string& url, const std::function<void(std::span<const char> buf)>& writeBlock /*throw X*/) override; //throw SysError, X

    DeleteResult deleteObject(const std::string& key, const std::optional<std::string>& tombstoneKey) override;
    DeletePrefixResult deletePrefix(const std::string& prefix, const std::optional<std::string>& tombstoneKey) override;

    std::vector<ObjectInfo> list(const std::string& prefix) override;

    //------------------------- direct access -------------------------
    struct Object
    {
        std::string bytes;
        std::string contentType;
        time_t lastModified = 0;
    };
    std::optional<Object> getObject(const std::string& key) const;
    void putObject(const std::string& key, const std::string& bytes, time_t lastModified);
    void setLastModified(const std::string& key, time_t lastModified);
    std::vector<std::string> getKeys() const;

    //simulate network failure for uploads/downloads of a specific key
    void setFailingKey(const std::string& key, bool fail);

    struct RequestStats
    {
        int statCalls    = 0;
        int presignCalls = 0; //single and batch requests
        int uploads      = 0;
        int downloads    = 0;
        int deletes      = 0;
        int listCalls    = 0;
    };
    RequestStats getRequestStats() const;
    void resetRequestStats();

private:
    MemoryObjectStore           (const MemoryObjectStore&) = delete;
    MemoryObjectStore& operator=(const MemoryObjectStore&) = delete;

    std::string resolveUrl(const std::string& url, const char* verb) const; //throw SysError

    mutable std::mutex lockStore_;
    std::map<std::string, Object> objects_;
    std::set<std::string> failingKeys_;
    RequestStats stats_;
};
}

#endif //MEMORY_OBJECT_STORE_H_5172093846152037
