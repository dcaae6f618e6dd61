// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef OBJECT_STORE_HTTP_H_8362017495318260
#define OBJECT_STORE_HTTP_H_8362017495318260

#include <memory>
#include "object_store.h"


namespace psync
{
struct HttpStoreAccess
{
    std::string serverUrl; //e.g. "https://sync.example.com" or "https://example.com/api"
    std::string token;     //bearer token
    Zstring caCertFilePath; //optional; empty: peer is not verified
    int timeoutSec = 20;
};


//sync server REST API: POST <serverUrl>/v1/objects/<operation> + signed URLs for object data
class HttpObjectStore : public ObjectStore
{
public:
    explicit HttpObjectStore(const HttpStoreAccess& access); //throw SysError
    ~HttpObjectStore();

    ObjectStat stat(const std::string& key) override; //throw SysError

    PresignedUrl presignUpload(const std::string& key, const std::string& contentType) override; //throw SysError
    std::vector<PresignedUrl> presignUploadBatch(const std::vector<std::pair<std::string, std::string>>& items) override; //throw SysError

    PresignedUrl presignDownload(const std::string& key) override; //throw SysError
    std::vector<PresignedUrl> presignDownloadBatch(const std::vector<std::string>& keys) override; //throw SysError

    void uploadBytes(const std::string& url, const std::string_view bytes, const std::string& contentType) override; //throw SysError
    std::string downloadBytes(const std::string& url) override; //throw SysError

    void uploadStream(const std::string& url, const std::string& contentType, uint64_t streamSize,
                      const std::function<size_t(std::span<char> buf)>& readBlock /*throw X*/) override; //throw SysError, X
    void downloadStream(const std::string& url, const std::function<void(std::span<const char> buf)>& writeBlock /*throw X*/) override; //throw SysError, X

    DeleteResult deleteObject(const std::string& key, const std::optional<std::string>& tombstoneKey) override; //throw SysError
    DeletePrefixResult deletePrefix(const std::string& prefix, const std::optional<std::string>& tombstoneKey) override; //throw SysError

    std::vector<ObjectInfo> list(const std::string& prefix) override; //throw SysError

private:
    HttpObjectStore           (const HttpObjectStore&) = delete;
    HttpObjectStore& operator=(const HttpObjectStore&) = delete;

    class Impl;
    const std::unique_ptr<Impl> pimpl_;
};


//"https://host:8443/path?query" -> {"https://host:8443", "/path?query"}
std::pair<std::string /*serverPrefix*/, std::string /*serverRelPath*/> splitUrl(const std::string& url); //throw SysError
}

#endif //OBJECT_STORE_HTTP_H_8362017495318260
