// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "sys_error.h"
#include <cstring>

using namespace psync;


namespace
{
std::wstring formatSystemErrorCode(ErrorCode ec)
{
    switch (ec) //codes we actually run into on file system and socket access
    {
            PSYNC_CHECK_CASE_FOR_CONSTANT(EPERM);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ENOENT);
            PSYNC_CHECK_CASE_FOR_CONSTANT(EINTR);
            PSYNC_CHECK_CASE_FOR_CONSTANT(EIO);
            PSYNC_CHECK_CASE_FOR_CONSTANT(EBADF);
            PSYNC_CHECK_CASE_FOR_CONSTANT(EAGAIN);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ENOMEM);
            PSYNC_CHECK_CASE_FOR_CONSTANT(EACCES);
            PSYNC_CHECK_CASE_FOR_CONSTANT(EBUSY);
            PSYNC_CHECK_CASE_FOR_CONSTANT(EEXIST);
            PSYNC_CHECK_CASE_FOR_CONSTANT(EXDEV);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ENOTDIR);
            PSYNC_CHECK_CASE_FOR_CONSTANT(EISDIR);
            PSYNC_CHECK_CASE_FOR_CONSTANT(EINVAL);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ENFILE);
            PSYNC_CHECK_CASE_FOR_CONSTANT(EMFILE);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ETXTBSY);
            PSYNC_CHECK_CASE_FOR_CONSTANT(EFBIG);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ENOSPC);
            PSYNC_CHECK_CASE_FOR_CONSTANT(EROFS);
            PSYNC_CHECK_CASE_FOR_CONSTANT(EPIPE);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ENAMETOOLONG);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ENOLCK);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ENOSYS);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ENOTEMPTY);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ELOOP);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ENODATA);
            PSYNC_CHECK_CASE_FOR_CONSTANT(EOVERFLOW);
            PSYNC_CHECK_CASE_FOR_CONSTANT(EILSEQ);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ENOTSUP);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ECONNABORTED);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ECONNRESET);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ECONNREFUSED);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ETIMEDOUT);
            PSYNC_CHECK_CASE_FOR_CONSTANT(EHOSTUNREACH);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ENETUNREACH);
            PSYNC_CHECK_CASE_FOR_CONSTANT(EDQUOT);
            PSYNC_CHECK_CASE_FOR_CONSTANT(ESTALE);

        default:
            return replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec));
    }
}
}


std::wstring psync::getSystemErrorDescription(ErrorCode ec) //return empty string on error
{
    const ErrorCode currentError = getLastError(); //not necessarily == ec
    PSYNC_ON_SCOPE_EXIT(errno = currentError);

    char buffer[1024] = {};
    //GNU strerror_r() may return a pointer to a static string instead of filling the buffer
    const char* msg = ::strerror_r(ec, buffer, sizeof(buffer));
    return msg ? utfTo<std::wstring>(msg) : std::wstring();
}


std::wstring psync::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatSystemErrorCode(ec), getSystemErrorDescription(ec));
}


std::wstring psync::formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg)
{
    std::wstring output = trimCpy(errorCode);

    const std::wstring errorMsgFmt = trimCpy(errorMsg);
    if (!output.empty() && !errorMsgFmt.empty())
        output += L": ";

    output += errorMsgFmt;

    output += L" [" + utfTo<std::wstring>(functionName) + L']';

    return output;
}
