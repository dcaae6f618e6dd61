// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef OBJECT_STORE_H_4096218375026194
#define OBJECT_STORE_H_4096218375026194

#include <optional>
#include <span>
#include <vector>
#include <psync/file_error.h>
#include <psync/file_io.h>


namespace psync
{
/*  Remote object store: flat key space, '/'-separated keys without leading slash

    Key layout:
        profiles/<profileId>/manifest.json
        profiles/<profileId>/metadata.json
        profiles/<profileId>/files/<relative path>
        <proxies|groups|vpns>/<id>.json
        tombstones/<kind>/<id>.json                                       */

struct ObjectStat
{
    bool exists = false;
    std::optional<std::string> lastModified; //RFC 3339
    std::optional<uint64_t> size;
};

struct PresignedUrl
{
    std::string key;
    std::string url;
    std::string expiresAt; //RFC 3339; optional
};

struct ObjectInfo
{
    std::string key;
    std::string lastModified; //RFC 3339; optional
    uint64_t size = 0;
};

struct DeleteResult
{
    bool deleted = false;
    bool tombstoneCreated = false;
};

struct DeletePrefixResult
{
    uint64_t deletedCount = 0;
    bool tombstoneCreated = false;
};

//THREAD-SAFETY: all member functions may be called from multiple worker threads
struct ObjectStore
{
    virtual ~ObjectStore() {}

    virtual ObjectStat stat(const std::string& key) = 0; //throw SysError

    virtual PresignedUrl presignUpload(const std::string& key, const std::string& contentType) = 0; //throw SysError
    virtual std::vector<PresignedUrl> presignUploadBatch(const std::vector<std::pair<std::string /*key*/, std::string /*contentType*/>>& items) = 0; //throw SysError

    virtual PresignedUrl presignDownload(const std::string& key) = 0; //throw SysError
    virtual std::vector<PresignedUrl> presignDownloadBatch(const std::vector<std::string>& keys) = 0; //throw SysError

    virtual void uploadBytes(const std::string& url, const std::string_view bytes, const std::string& contentType) = 0; //throw SysError
    virtual std::string downloadBytes(const std::string& url) = 0; //throw SysError

    //readBlock: fill buffer completely unless end of stream; total must equal "streamSize"
    virtual void uploadStream(const std::string& url, const std::string& contentType, uint64_t streamSize,
                              const std::function<size_t(std::span<char> buf)>& readBlock /*throw X*/) = 0; //throw SysError, X

    virtual void downloadStream(const std::string& url, const std::function<void(std::span<const char> buf)>& writeBlock /*throw X*/) = 0; //throw SysError, X

    virtual DeleteResult deleteObject(const std::string& key, const std::optional<std::string>& tombstoneKey) = 0; //throw SysError
    virtual DeletePrefixResult deletePrefix(const std::string& prefix, const std::optional<std::string>& tombstoneKey) = 0; //throw SysError

    //complete listing (all pages)
    virtual std::vector<ObjectInfo> list(const std::string& prefix) = 0; //throw SysError
};

//------------------------------------------------------------------------------------------------

std::string guessContentType(const Zstring& filePath);

//stream local file to a signed URL
void uploadFile(ObjectStore& store, const std::string& url, const Zstring& filePath, const std::string& contentType,
                const IoCallback& notifyUnbufferedIO /*throw X*/); //throw FileError, ErrorTransfer, X

//stream signed URL to local file: parent folders are created as needed, target is replaced transactionally
void downloadFile(ObjectStore& store, const std::string& url, const Zstring& filePath,
                  const IoCallback& notifyUnbufferedIO /*throw X*/); //throw FileError, ErrorTransfer, X
}

#endif //OBJECT_STORE_H_4096218375026194
