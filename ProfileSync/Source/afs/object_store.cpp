// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "object_store.h"
#include <psync/file_access.h>
#include <psync/extra_log.h>

using namespace psync;


std::string psync::guessContentType(const Zstring& filePath)
{
    Zstring ext = afterLast(getItemName(filePath), Zstr('.'), IfNotFoundReturn::none);
    for (Zchar& c : ext)
        c = asciiToLower(c);

    if (ext == Zstr("json")) return "application/json";
    if (ext == Zstr("txt" )) return "text/plain";
    if (ext == Zstr("html") ||
        ext == Zstr("htm" )) return "text/html";
    if (ext == Zstr("js"  )) return "application/javascript";
    if (ext == Zstr("css" )) return "text/css";
    if (ext == Zstr("png" )) return "image/png";
    if (ext == Zstr("jpg" ) ||
        ext == Zstr("jpeg")) return "image/jpeg";
    //sqlite, db, ldb, ...
    return "application/octet-stream";
}


void psync::uploadFile(ObjectStore& store, const std::string& url, const Zstring& filePath, const std::string& contentType,
                       const IoCallback& notifyUnbufferedIO /*throw X*/) //throw FileError, ErrorTransfer, X
{
    const std::optional<FileDetails> details = getFileDetailsIfExists(filePath); //throw FileError
    if (!details)
        throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)), L"File not found.");

    FileInputPlain fileIn(filePath); //throw FileError

    uint64_t bytesRemaining = details->fileSize;
    try
    {
        store.uploadStream(url, contentType, details->fileSize, [&](std::span<char> buf) //throw SysError, FileError, X
        {
            size_t bytesRead = 0;
            while (bytesRead < buf.size() && bytesRemaining > 0)
            {
                const size_t bytesToRead = static_cast<size_t>(std::min<uint64_t>(buf.size() - bytesRead, bytesRemaining));
                const size_t bytesReadNow = fileIn.tryRead(buf.data() + bytesRead, bytesToRead); //throw FileError
                if (bytesReadNow == 0) //file shrunk in the meantime
                    throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)), L"Unexpected end of stream.");

                bytesRead      += bytesReadNow;
                bytesRemaining -= bytesReadNow;
                if (notifyUnbufferedIO) notifyUnbufferedIO(bytesReadNow); //throw X
            }
            return bytesRead;
        });
    }
    catch (const SysError& e)
    {
        throw ErrorTransfer(replaceCpy(_("Cannot upload file %x."), L"%x", fmtPath(filePath)), e.toString());
    }
}


void psync::downloadFile(ObjectStore& store, const std::string& url, const Zstring& filePath,
                         const IoCallback& notifyUnbufferedIO /*throw X*/) //throw FileError, ErrorTransfer, X
{
    if (const Zstring parentPath = getParentFolderPath(filePath);
        !parentPath.empty())
        createDirectoryIfMissingRecursion(parentPath); //throw FileError

    const Zstring tmpFilePath = getPathWithTempName(filePath);
    {
        FileOutputPlain tmpFile(tmpFilePath); //throw FileError, (ErrorTargetExisting)
        //incomplete file is deleted by ~FileOutputPlain()
        try
        {
            store.downloadStream(url, [&](std::span<const char> buf) //throw SysError, FileError, X
            {
                writeAll(tmpFile, buf.data(), buf.size()); //throw FileError
                if (notifyUnbufferedIO) notifyUnbufferedIO(buf.size()); //throw X
            });
        }
        catch (const SysError& e)
        {
            throw ErrorTransfer(replaceCpy(_("Cannot download file %x."), L"%x", fmtPath(filePath)), e.toString());
        }
        tmpFile.close(); //throw FileError
    }
    //take over ownership:
    PSYNC_ON_SCOPE_FAIL( try { removeFilePlain(tmpFilePath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    moveAndRenameItem(tmpFilePath, filePath, true /*replaceExisting*/); //throw FileError
}
