// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FILE_TRAVERSER_H_2950318437625409
#define FILE_TRAVERSER_H_2950318437625409

#include <functional>
#include "file_error.h"


namespace psync
{
struct FileInfo
{
    Zstring itemName;
    Zstring fullPath;
    uint64_t fileSize = 0; //[bytes]
    time_t modTime = 0; //number of seconds since Jan. 1st 1970 GMT
};

struct FolderInfo
{
    Zstring itemName;
    Zstring fullPath;
};

struct SymlinkInfo
{
    Zstring itemName;
    Zstring fullPath;
    time_t modTime = 0;
};

//- non-recursive
//- items deleted while traversing are skipped
void traverseFolder(const Zstring& dirPath,
                    const std::function<void(const FileInfo&    fi)>& onFile,   /*optional*/
                    const std::function<void(const FolderInfo&  fi)>& onFolder, /*optional*/
                    const std::function<void(const SymlinkInfo& si)>& onSymlink /*optional*/); //throw FileError
}

#endif //FILE_TRAVERSER_H_2950318437625409
