// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SYS_ERROR_H_1360829472169340
#define SYS_ERROR_H_1360829472169340

#include <cerrno>
#include "scope_guard.h" //
#include "i18n.h"        //not used by this header, but the "rest of the world" needs it!
#include "zstring.h"     //


namespace psync
{
//evaluate errno and assemble specific error message
using ErrorCode = int;
ErrorCode getLastError();

std::wstring formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg);
std::wstring formatSystemError(const std::string& functionName, ErrorCode ec);


//low-level exception class giving (non-translated) detail information only
class SysError
{
public:
    explicit SysError(const std::wstring& msg) : msg_(msg) {}
    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};

#define DEFINE_NEW_SYS_ERROR(X) struct X : public psync::SysError { X(const std::wstring& msg) : SysError(msg) {} };


//macro: errno must be read before any other call can overwrite it
#define THROW_LAST_SYS_ERROR(functionName)                           \
    do { const psync::ErrorCode ecInternal = psync::getLastError(); throw psync::SysError(psync::formatSystemError(functionName, ecInternal)); } while (false)


/* Example: ASSERT_SYSERROR(expr);

    Equivalent to:
        if (!expr)
            throw psync::SysError(L"Assertion failed: \"expr\"");            */
#define ASSERT_SYSERROR(expr) ASSERT_SYSERROR_IMPL(expr, #expr) //throw SysError








//######################## implementation ########################
inline
ErrorCode getLastError()
{
    return errno; //don't use "::" prefix, errno is a macro!
}

std::wstring getSystemErrorDescription(ErrorCode ec); //return empty string on error


namespace impl
{
inline bool validateBool(bool  b) { return b; }
inline bool validateBool(void* b) { return b; }
bool validateBool(int) = delete; //catch unintended bool conversions
}

#define ASSERT_SYSERROR_IMPL(expr, exprStr) \
    { if (!psync::impl::validateBool(expr))        \
            throw psync::SysError(L"Assertion failed: \"" L ## exprStr L"\""); }
}

#endif //SYS_ERROR_H_1360829472169340
