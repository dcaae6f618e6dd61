// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "transfer.h"
#include <unordered_map>
#include <psync/file_access.h>
#include "object_keys.h"
#include "status_handler_impl.h"

using namespace psync;


namespace
{
using UrlByKey = std::unordered_map<std::string, std::string>;

UrlByKey toUrlMap(const std::vector<PresignedUrl>& urls)
{
    UrlByKey urlByKey;
    for (const PresignedUrl& pu : urls)
        urlByKey.emplace(pu.key, pu.url);
    return urlByKey;
}


int64_t getTotalBytes(const std::vector<ManifestFileEntry>& files)
{
    int64_t bytesTotal = 0;
    for (const ManifestFileEntry& file : files)
        bytesTotal += static_cast<int64_t>(file.size);
    return bytesTotal;
}


enum class TransferDirection
{
    upload,
    download,
};

int transferProfileFiles(TransferDirection direction,
                         ObjectStore& store,
                         const std::string& profileId,
                         const Zstring& dataFolderPath,
                         const std::vector<ManifestFileEntry>& files,
                         size_t transferThreads,
                         ProcessCallback& callback) //throw ErrorTransfer, X
{
    if (files.empty())
        return 0;

    const bool upload = direction == TransferDirection::upload;

    callback.initNewPhase(static_cast<int>(files.size()), getTotalBytes(files), upload ? ProcessPhase::upload : ProcessPhase::download); //throw X
    callback.logMessage(upload ?
                        _P("Uploading 1 file...",   "Uploading %x files...",   files.size()) :
                        _P("Downloading 1 file...", "Downloading %x files...", files.size()), PhaseCallback::MsgType::info); //throw X

    //one network round-trip for all signed URLs
    UrlByKey urlByKey;
    try
    {
        if (upload)
        {
            std::vector<std::pair<std::string, std::string>> items;
            for (const ManifestFileEntry& file : files)
                items.emplace_back(getProfileFileKey(profileId, file.path), guessContentType(utfTo<Zstring>(file.path)));

            urlByKey = toUrlMap(store.presignUploadBatch(items)); //throw SysError
        }
        else
        {
            std::vector<std::string> keys;
            for (const ManifestFileEntry& file : files)
                keys.push_back(getProfileFileKey(profileId, file.path));

            urlByKey = toUrlMap(store.presignDownloadBatch(keys)); //throw SysError
        }
    }
    catch (const SysError& e)
    {
        throw ErrorTransfer(replaceCpy(_("Cannot request signed URLs for profile %x."), L"%x", fmtPath(profileId)), e.toString());
    }

    std::atomic<int> failedCount{0};

    std::vector<ParallelWorkItem> workload;
    for (const ManifestFileEntry& file : files)
        workload.push_back([&, &file = file](AsyncCallback& acb) //throw ThreadStopRequest
    {
        acb.updateStatus(replaceCpy(upload ? _("Uploading file %x") : _("Downloading file %x"), L"%x", fmtPath(file.path))); //throw ThreadStopRequest

        const IoCallback notifyIo = [&](int64_t bytesDelta)
        {
            acb.updateDataProcessed(0, bytesDelta);
            interruptionPoint(); //throw ThreadStopRequest
        };

        try
        {
            const Zstring filePath = getLocalFilePath(dataFolderPath, file.path); //throw ErrorInvalidData
            const std::string key = getProfileFileKey(profileId, file.path);

            auto it = urlByKey.find(key);
            if (it == urlByKey.end())
                throw ErrorTransfer(replaceCpy(upload ? _("Cannot upload file %x.") : _("Cannot download file %x."), L"%x", fmtPath(filePath)),
                                    replaceCpy<std::wstring>(L"No signed URL for key %x.", L"%x", utfTo<std::wstring>(key)));
            const std::string& url = it->second;

            if (upload)
                uploadFile(store, url, filePath, guessContentType(filePath), notifyIo); //throw FileError, ErrorTransfer, ThreadStopRequest
            else
            {
                downloadFile(store, url, filePath, notifyIo); //throw FileError, ErrorTransfer, ThreadStopRequest

                //hash cache is keyed by (size, mtime): keep the next scan cheap and the manifest unchanged
                setFileTime(filePath, static_cast<time_t>(file.mtime)); //throw FileError
            }
        }
        catch (const FileError& e)
        {
            ++failedCount;
            acb.logMessage(e.toString(), PhaseCallback::MsgType::warning); //throw ThreadStopRequest
        }
        acb.updateDataProcessed(1, 0); //failed files count as processed, too
    });

    massParallelExecute(workload, transferThreads,
                        Zstr("Transfer[") + utfTo<Zstring>(profileId) + Zstr(']'),
                        callback); //throw X

    callback.requestUiUpdate(true /*force*/); //throw X: final progress event

    return failedCount;
}
}


Zstring psync::getLocalFilePath(const Zstring& dataFolderPath, const std::string& relPath) //throw ErrorInvalidData
{
    const Zstring relPathNative = utfTo<Zstring>(relPath);

    const auto isInvalidComponent = [](const Zstring& comp) { return comp.empty() || comp == Zstr(".") || comp == Zstr(".."); };

    const std::vector<Zstring> components = splitCpy(relPathNative, FILE_NAME_SEPARATOR, SplitOnEmpty::allow);
    if (std::any_of(components.begin(), components.end(), isInvalidComponent) ||
        contains(relPathNative, Zstr('\0')))
        throw ErrorInvalidData(replaceCpy(_("Invalid relative path %x."), L"%x", fmtPath(relPathNative)));

    return appendPath(dataFolderPath, relPathNative);
}


int psync::uploadProfileFiles(ObjectStore& store, const std::string& profileId, const Zstring& dataFolderPath,
                              const std::vector<ManifestFileEntry>& files, size_t transferThreads, ProcessCallback& callback) //throw ErrorTransfer, X
{
    return transferProfileFiles(TransferDirection::upload, store, profileId, dataFolderPath, files, transferThreads, callback); //throw ErrorTransfer, X
}


int psync::downloadProfileFiles(ObjectStore& store, const std::string& profileId, const Zstring& dataFolderPath,
                                const std::vector<ManifestFileEntry>& files, size_t transferThreads, ProcessCallback& callback) //throw ErrorTransfer, X
{
    return transferProfileFiles(TransferDirection::download, store, profileId, dataFolderPath, files, transferThreads, callback); //throw ErrorTransfer, X
}


int psync::deleteLocalFiles(const Zstring& dataFolderPath, const std::vector<std::string>& relPaths, PhaseCallback& callback) //throw X
{
    int failedCount = 0;
    for (const std::string& relPath : relPaths)
    {
        callback.updateStatus(replaceCpy(_("Deleting file %x"), L"%x", fmtPath(relPath))); //throw X
        try
        {
            removeFileIfExists(getLocalFilePath(dataFolderPath, relPath)); //throw FileError, ErrorInvalidData
        }
        catch (const FileError& e)
        {
            ++failedCount;
            callback.logMessage(e.toString(), PhaseCallback::MsgType::warning); //throw X
        }
    }
    return failedCount;
}


int psync::deleteRemoteFiles(ObjectStore& store, const std::string& profileId, const std::vector<std::string>& relPaths, PhaseCallback& callback) //throw X
{
    int failedCount = 0;
    for (const std::string& relPath : relPaths)
    {
        callback.updateStatus(replaceCpy(_("Deleting remote file %x"), L"%x", fmtPath(relPath))); //throw X
        try
        {
            store.deleteObject(getProfileFileKey(profileId, relPath), std::nullopt /*tombstoneKey*/); //throw SysError
        }
        catch (const SysError& e)
        {
            ++failedCount;
            callback.logMessage(replaceCpy(_("Cannot delete remote file %x."), L"%x", fmtPath(relPath)) + L"\n\n" + e.toString(), PhaseCallback::MsgType::warning); //throw X
        }
    }
    return failedCount;
}
