// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "file_access.h"
#include "file_traverser.h"
#include <cstdlib>
#include <sys/stat.h>
#include <fcntl.h>  //AT_SYMLINK_NOFOLLOW
#include <unistd.h>
#include <stdio.h>  //rename

using namespace psync;


std::optional<ItemType> psync::getItemTypeIfExists(const Zstring& itemPath) //throw FileError
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
    {
        const ErrorCode ec = getLastError();
        if (ec == ENOENT || ec == ENOTDIR) //a parent folder may have been replaced by a file
            return std::nullopt;

        throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), formatSystemError("lstat", ec));
    }

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}


std::optional<FileDetails> psync::getFileDetailsIfExists(const Zstring& filePath) //throw FileError
{
    struct stat fileInfo = {};
    if (::lstat(filePath.c_str(), &fileInfo) != 0)
    {
        const ErrorCode ec = getLastError();
        if (ec == ENOENT || ec == ENOTDIR)
            return std::nullopt;

        throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(filePath)), formatSystemError("lstat", ec));
    }

    return FileDetails{static_cast<uint64_t>(fileInfo.st_size), fileInfo.st_mtime};
}


void psync::setFileTime(const Zstring& filePath, time_t modTime) //throw FileError
{
    struct timespec newTimes[2] = {};
    newTimes[0].tv_sec  = ::time(nullptr); //access time
    newTimes[1].tv_sec  = modTime;         //modification time

    if (::utimensat(AT_FDCWD, filePath.c_str(), newTimes, AT_SYMLINK_NOFOLLOW) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write modification time of %x."), L"%x", fmtPath(filePath)), "utimensat");
}


Zstring psync::getTempFolderPath() //throw FileError
{
    if (const char* tempPath = ::getenv("TMPDIR"))
        if (tempPath[0] != 0)
            return tempPath;
    //TMPDIR is not set on all distributions
    return "/tmp";
}


void psync::removeFilePlain(const Zstring& filePath) //throw FileError
{
    if (::unlink(filePath.c_str()) != 0)
    {
        const ErrorCode ec = getLastError(); //copy before directly/indirectly making other system calls!
        throw FileError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), formatSystemError("unlink", ec));
    }
}


bool psync::removeFileIfExists(const Zstring& filePath) //throw FileError
{
    if (::unlink(filePath.c_str()) != 0)
    {
        const ErrorCode ec = getLastError();
        if (ec == ENOENT || ec == ENOTDIR) //already gone
            return false;

        throw FileError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), formatSystemError("unlink", ec));
    }
    return true;
}


void psync::removeDirectoryPlainRecursion(const Zstring& dirPath) //throw FileError
{
    std::vector<Zstring> filePaths;
    std::vector<Zstring> folderPaths;

    traverseFolder(dirPath,
    [&](const FileInfo&    fi) { filePaths  .push_back(fi.fullPath); },
    [&](const FolderInfo&  fi) { folderPaths.push_back(fi.fullPath); },
    [&](const SymlinkInfo& si) { filePaths  .push_back(si.fullPath); }); //throw FileError

    for (const Zstring& filePath : filePaths)
        removeFilePlain(filePath); //throw FileError

    for (const Zstring& folderPath : folderPaths)
        removeDirectoryPlainRecursion(folderPath); //throw FileError

    if (::rmdir(dirPath.c_str()) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(dirPath)), "rmdir");
}


void psync::moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting) //throw FileError, ErrorTargetExisting
{
    auto getErrorMsg = [&]
    {
        return replaceCpy(replaceCpy(_("Cannot move file %x to %y."), L"%x", L'\n' + fmtPath(pathFrom)), L"%y", L'\n' + fmtPath(pathTo));
    };

    if (!replaceExisting)
    {
        //check explicitly: rename() would silently overwrite; this is not atomic!
        if (itemExists(pathTo)) //throw FileError
            throw ErrorTargetExisting(getErrorMsg(), formatSystemError("rename", EEXIST));
    }

    //rename() replaces an existing file atomically
    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0)
        THROW_LAST_FILE_ERROR(getErrorMsg(), "rename");
}


void psync::createDirectory(const Zstring& dirPath) //throw FileError, ErrorTargetExisting
{
    const mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO; //0777 => consider umask!

    if (::mkdir(dirPath.c_str(), mode) != 0)
    {
        const ErrorCode ec = getLastError();
        const std::wstring errorMsg = replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath));
        const std::wstring errorDescr = formatSystemError("mkdir", ec);

        if (ec == EEXIST)
            throw ErrorTargetExisting(errorMsg, errorDescr);
        throw FileError(errorMsg, errorDescr);
    }
}


void psync::createDirectoryIfMissingRecursion(const Zstring& dirPath) //throw FileError
{
    if (dirPath.empty() || dirPath == Zstring(1, FILE_NAME_SEPARATOR))
        return;

    try
    {
        createDirectory(dirPath); //throw FileError, ErrorTargetExisting
    }
    catch (ErrorTargetExisting&)
    {
        //folder (or a file with that name) exists already: the caller will find out soon enough
        if (getItemTypeIfExists(dirPath) == ItemType::file) //throw FileError
            throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)),
                            replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(dirPath))));
    }
    catch (FileError&)
    {
        //most likely the parent is missing: create it, then retry
        const Zstring parentPath = getParentFolderPath(dirPath);
        if (parentPath.empty() || parentPath == dirPath || itemExists(parentPath)) //throw FileError
            throw;

        createDirectoryIfMissingRecursion(parentPath); //throw FileError

        try
        {
            createDirectory(dirPath); //throw FileError, ErrorTargetExisting
        }
        catch (ErrorTargetExisting&) {} //created concurrently by another thread
    }
}
