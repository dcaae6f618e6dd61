// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef ZSTRING_H_8432096735148730
#define ZSTRING_H_8432096735148730

#include <stdexcept> //not used by this header, but the "rest of the world" needs it!
#include "utf.h"     //


//native file path string type
using Zchar = char;
#define Zstr(x) x
const Zchar FILE_NAME_SEPARATOR = '/';

using Zstring     = std::basic_string<Zchar>;
using ZstringView = std::basic_string_view<Zchar>;


namespace psync
{
//join native path and relative path; caller guarantees relPath contains no leading separator
Zstring appendPath(const Zstring& basePath, const Zstring& relPath);

//"/a/b/c" -> "/a/b"; return empty if there is no parent
Zstring getParentFolderPath(const Zstring& itemPath);

//"/a/b/c" -> "c"
Zstring getItemName(const Zstring& itemPath);









//######################## implementation ########################
inline
Zstring appendPath(const Zstring& basePath, const Zstring& relPath)
{
    if (relPath.empty())
        return basePath;
    if (basePath.empty())
        return relPath;

    if (basePath.back() == FILE_NAME_SEPARATOR)
        return basePath + relPath;
    return basePath + FILE_NAME_SEPARATOR + relPath;
}


inline
Zstring getParentFolderPath(const Zstring& itemPath)
{
    const size_t pos = itemPath.rfind(FILE_NAME_SEPARATOR);
    if (pos == Zstring::npos)
        return Zstring();
    if (pos == 0) //"/item"
        return itemPath.size() > 1 ? Zstring(1, FILE_NAME_SEPARATOR) : Zstring();
    return itemPath.substr(0, pos);
}


inline
Zstring getItemName(const Zstring& itemPath)
{
    const size_t pos = itemPath.rfind(FILE_NAME_SEPARATOR);
    return pos == Zstring::npos ? itemPath : itemPath.substr(pos + 1);
}
}

#endif //ZSTRING_H_8432096735148730
