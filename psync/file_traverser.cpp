// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "file_traverser.h"
#include <sys/stat.h>
#include <dirent.h>

using namespace psync;


void psync::traverseFolder(const Zstring& dirPath,
                           const std::function<void(const FileInfo&    fi)>& onFile,
                           const std::function<void(const FolderInfo&  fi)>& onFolder,
                           const std::function<void(const SymlinkInfo& si)>& onSymlink) //throw FileError
{
    DIR* folder = ::opendir(dirPath.c_str()); //directory must NOT end with path separator, except "/"
    if (!folder)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot open directory %x."), L"%x", fmtPath(dirPath)), "opendir");
    PSYNC_ON_SCOPE_EXIT(::closedir(folder)); //never close nullptr handles! -> crash

    for (;;)
    {
        errno = 0;
        const dirent* dirEntry = ::readdir(folder);
        if (!dirEntry)
        {
            if (errno == 0) //errno left unchanged => no more items
                return;

            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(dirPath)), "readdir");
        }

        //don't return "." and ".."
        const char* itemNameRaw = dirEntry->d_name;

        if (itemNameRaw[0] == '.' &&
            (itemNameRaw[1] == 0 || (itemNameRaw[1] == '.' && itemNameRaw[2] == 0)))
            continue;

        const Zstring itemName = itemNameRaw;
        const Zstring itemPath = appendPath(dirPath, itemName);

        struct stat statData = {};
        if (::lstat(itemPath.c_str(), &statData) != 0) //lstat() does not resolve symlinks
        {
            if (errno == ENOENT) //deleted after readdir(), e.g. temp files of a running browser
                continue;

            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), "lstat");
        }

        if (S_ISLNK(statData.st_mode)) //on Linux there is no distinction between file and directory symlinks!
        {
            if (onSymlink)
                onSymlink({itemName, itemPath, statData.st_mtime});
        }
        else if (S_ISDIR(statData.st_mode)) //a directory
        {
            if (onFolder)
                onFolder({itemName, itemPath});
        }
        else if (S_ISREG(statData.st_mode))
        {
            if (onFile)
                onFile({itemName, itemPath, static_cast<uint64_t>(statData.st_size), statData.st_mtime});
        }
        //ignore pipes, sockets and devices: an open() on a pipe would block
    }
}
