// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FILE_ACCESS_H_6042873915732890
#define FILE_ACCESS_H_6042873915732890

#include <functional>
#include <optional>
#include "file_error.h"


namespace psync
{

enum class ItemType
{
    file,
    folder,
    symlink,
};
//(hopefully) fast: does not distinguish between error/not existing
std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath); //throw FileError

inline bool itemExists(const Zstring& itemPath) { return static_cast<bool>(getItemTypeIfExists(itemPath)); } //throw FileError


struct FileDetails
{
    uint64_t fileSize = 0;
    time_t modTime = 0; //number of seconds since Jan. 1st 1970 GMT
};
//does not follow symlinks; returns none if item does not exist (anymore)
std::optional<FileDetails> getFileDetailsIfExists(const Zstring& filePath); //throw FileError

void setFileTime(const Zstring& filePath, time_t modTime); //throw FileError

Zstring getTempFolderPath(); //throw FileError

void removeFilePlain(const Zstring& filePath); //throw FileError; ERROR if not existing
bool removeFileIfExists(const Zstring& filePath); //throw FileError; return false if already gone
void removeDirectoryPlainRecursion(const Zstring& dirPath); //throw FileError; ERROR if not existing

void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting); //throw FileError, ErrorTargetExisting

void createDirectory(const Zstring& dirPath); //throw FileError, ErrorTargetExisting

//creates parent directories recursively if not existing
void createDirectoryIfMissingRecursion(const Zstring& dirPath); //throw FileError
}

#endif //FILE_ACCESS_H_6042873915732890
