// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef EXCLUDE_FILTER_H_8301927465103829
#define EXCLUDE_FILTER_H_8301927465103829

#include <vector>
#include <psync/file_error.h>


namespace psync
{
//folder inside each profile data folder holding the sync bookkeeping (hash cache)
const Zchar SYNC_BOOKKEEPING_FOLDER[] = Zstr(".psync");
//bookkeeping folder written by Donut Browser's own sync: never upload when a profile is carried over
const Zchar LEGACY_BOOKKEEPING_FOLDER[] = Zstr(".donut-sync");

//volatile browser files that are never synced
std::vector<Zstring> getDefaultExcludePatterns();


/*  Glob semantics:
        *   any sequence of characters, including '/'
        ?   a single character except '/'
        **  same as *
    A pattern matches a relative path if it matches the full path or any
    trailing part of it starting at a folder boundary:
        "Cache/**" matches "Cache/data_0" and "Default/Cache/data_0"
        "*.log"    matches "debug.log" and "Default/Local Storage/000003.log"    */
class ExcludeFilter
{
public:
    explicit ExcludeFilter(const std::vector<Zstring>& patterns); //throw ErrorInvalidData

    bool isExcludedFile(const Zstring& relFilePath) const;

    //"true" if *all* items inside the folder are excluded => no need to traverse
    bool isExcludedFolder(const Zstring& relFolderPath) const;

    const std::vector<Zstring>& getPatterns() const { return patterns_; }

private:
    std::vector<Zstring> patterns_;
    std::vector<Zstring> folderMasks_; //patterns ending with "/**", trailing part removed
};
}

#endif //EXCLUDE_FILTER_H_8301927465103829
