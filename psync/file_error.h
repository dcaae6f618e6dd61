// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FILE_ERROR_H_4713690281764025
#define FILE_ERROR_H_4713690281764025

#include "sys_error.h" //we'll need this later anyway!


namespace psync
{
class FileError //high-level exception class giving detailed context information for end users
{
public:
    explicit FileError(const std::wstring& msg) : msg_(msg) {}
    FileError(const std::wstring& msg, const std::wstring& details) : msg_(msg + L"\n\n" + details) {}
    virtual ~FileError() {}

    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};

#define DEFINE_NEW_FILE_ERROR(X) struct X : public psync::FileError { X(const std::wstring& msg) : FileError(msg) {} X(const std::wstring& msg, const std::wstring& descr) : FileError(msg, descr) {} };

DEFINE_NEW_FILE_ERROR(ErrorTargetExisting)
DEFINE_NEW_FILE_ERROR(ErrorSerialization) //malformed manifest, cache, config or entity data
DEFINE_NEW_FILE_ERROR(ErrorInvalidData)   //malformed glob pattern, object id, missing field
DEFINE_NEW_FILE_ERROR(ErrorTransfer)      //object store or network failure


#define THROW_LAST_FILE_ERROR(msg, functionName)                           \
    do { const psync::ErrorCode ecInternal = psync::getLastError(); throw psync::FileError(msg, psync::formatSystemError(functionName, ecInternal)); } while (false)

//----------- facilitate usage of std::wstring for error messages --------------------

inline std::wstring fmtPath(const std::wstring& displayPath) { return L'"' + displayPath + L'"'; }
inline std::wstring fmtPath(const Zstring& displayPath) { return fmtPath(utfTo<std::wstring>(displayPath)); }
inline std::wstring fmtPath(const wchar_t* displayPath) { return fmtPath(std::wstring(displayPath)); } //resolve overload ambiguity
}

#endif //FILE_ERROR_H_4713690281764025
