// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "exclude_filter.h"

using namespace psync;


std::vector<Zstring> psync::getDefaultExcludePatterns()
{
    return
    {
        Zstr("Cache/**"),
        Zstr("Code Cache/**"),
        Zstr("GPUCache/**"),
        Zstr("GrShaderCache/**"),
        Zstr("ShaderCache/**"),
        Zstr("Service Worker/CacheStorage/**"),
        Zstr("Crashpad/**"),
        Zstr("Crash Reports/**"),
        Zstr("BrowserMetrics/**"),
        Zstr("blob_storage/**"),
        Zstr("*.log"),
        Zstr("*.tmp"),
        Zstr("LOG"),
        Zstr("LOG.old"),
        Zstr("LOCK"),
        Zstring(SYNC_BOOKKEEPING_FOLDER) + Zstr("/**"),
        Zstring(LEGACY_BOOKKEEPING_FOLDER) + Zstr("/**"),
    };
}


namespace
{
//"true" if the *full* path matches the mask
bool matchesMask(const Zchar* path, const Zchar* const pathEnd, const Zchar* mask /*0-terminated*/)
{
    for (;; ++mask, ++path)
    {
        Zchar m = *mask;
        switch (m)
        {
            case 0:
                return path == pathEnd;

            case Zstr('?'): //should not match FILE_NAME_SEPARATOR
                if (path == pathEnd || *path == FILE_NAME_SEPARATOR)
                    return false;
                break;

            case Zstr('*'):
                do //advance mask to next non-* char
                {
                    m = *++mask;
                }
                while (m == Zstr('*'));

                if (m == 0) //mask ends with '*':
                    return true;

                for (;; ++path) //try all possible lengths for '*'
                {
                    if (matchesMask(path, pathEnd, mask))
                        return true;
                    if (path == pathEnd)
                        return false;
                }

            default:
                if (path == pathEnd || *path != m)
                    return false;
        }
    }
}


//match full path or any trailing part starting at a folder boundary
bool matchesAnyDepth(const ZstringView relPath, const Zstring& mask)
{
    for (size_t pos = 0;;)
    {
        if (matchesMask(relPath.data() + pos, relPath.data() + relPath.size(), mask.c_str()))
            return true;

        pos = relPath.find(FILE_NAME_SEPARATOR, pos);
        if (pos == ZstringView::npos)
            return false;
        ++pos;
    }
}
}


ExcludeFilter::ExcludeFilter(const std::vector<Zstring>& patterns) : patterns_(patterns) //throw ErrorInvalidData
{
    for (const Zstring& pattern : patterns_)
    {
        if (trimCpy(pattern).empty() ||
            startsWith(pattern, FILE_NAME_SEPARATOR) ||
            contains(pattern, Zstr('\\')))
            throw ErrorInvalidData(replaceCpy(_("Invalid exclude pattern %x."), L"%x", fmtPath(pattern)));

        if (endsWith(pattern, Zstr("/**")))
        {
            const Zstring folderMask = beforeLast(pattern, Zstr("/**"), IfNotFoundReturn::none);
            if (!folderMask.empty())
                folderMasks_.push_back(folderMask);
        }
    }
}


bool ExcludeFilter::isExcludedFile(const Zstring& relFilePath) const
{
    assert(!startsWith(relFilePath, FILE_NAME_SEPARATOR));

    return std::any_of(patterns_.begin(), patterns_.end(), [&](const Zstring& mask) { return matchesAnyDepth(relFilePath, mask); });
}


bool ExcludeFilter::isExcludedFolder(const Zstring& relFolderPath) const
{
    assert(!startsWith(relFolderPath, FILE_NAME_SEPARATOR));

    return std::any_of(folderMasks_.begin(), folderMasks_.end(), [&](const Zstring& mask) { return matchesAnyDepth(relFolderPath, mask); });
}
