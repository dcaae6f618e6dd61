// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "open_ssl.h"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include "extra_log.h"

using namespace psync;


namespace
{
#ifndef OPENSSL_THREADS
    #error OpenSSL must be built with thread support!
#endif

static_assert(OPENSSL_VERSION_NUMBER >= 0x30000000L, "OpenSSL version is too old!");


std::wstring formatOpenSSLError(const char* functionName, unsigned long ec)
{
    char errorBuf[256] = {}; //== buffer size used by ERR_error_string()
    ::ERR_error_string_n(ec, errorBuf, sizeof(errorBuf)); //includes null-termination

    return formatSystemError(functionName, replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec)), utfTo<std::wstring>(errorBuf));
}


std::wstring formatLastOpenSSLError(const char* functionName)
{
    const auto ec = ::ERR_peek_last_error(); //"returns latest error code from the thread's error queue without modifying it"
    ::ERR_clear_error(); //clean up for next OpenSSL operation on this thread
    return formatOpenSSLError(functionName, ec);
}
}


void psync::openSslInit()
{
    //explicitly init OpenSSL on main thread: https://www.openssl.org/docs/manmaster/man3/OPENSSL_init_ssl.html
    if (::OPENSSL_init_ssl(OPENSSL_INIT_SSL_DEFAULT | OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) != 1)
        logExtraError(_("Error during process initialization.") + L"\n\n" + formatLastOpenSSLError("OPENSSL_init_ssl"));
}


void psync::openSslTearDown() {}
//OpenSSL 1.1.0+ deprecates all clean up functions
namespace
{
struct OpenSslThreadCleanUp
{
    ~OpenSslThreadCleanUp()
    {
        ::OPENSSL_thread_stop();
    }
};
thread_local OpenSslThreadCleanUp tearDownOpenSslThreadData;
}

//================================================================================

Sha256Hasher::Sha256Hasher() //throw SysError
{
    EVP_MD_CTX* mdctx = ::EVP_MD_CTX_new();
    if (!mdctx)
        throw SysError(formatSystemError("EVP_MD_CTX_new", L"", L"Unexpected failure."));
    ctx_ = std::shared_ptr<EVP_MD_CTX>(mdctx, ::EVP_MD_CTX_free);

    if (::EVP_DigestInit_ex(ctx_.get(),    //EVP_MD_CTX* ctx
                            ::EVP_sha256(), //const EVP_MD* type
                            nullptr) != 1)  //ENGINE* impl
        throw SysError(formatLastOpenSSLError("EVP_DigestInit_ex"));
}


void Sha256Hasher::update(const void* buffer, size_t bytes) //throw SysError
{
    if (::EVP_DigestUpdate(ctx_.get(), //EVP_MD_CTX* ctx
                           buffer,     //const void* d
                           bytes) != 1) //size_t cnt
        throw SysError(formatLastOpenSSLError("EVP_DigestUpdate"));
}


std::string Sha256Hasher::finalize() //throw SysError
{
    std::string digest(EVP_MAX_MD_SIZE, '\0');
    unsigned int digestLen = 0;

    if (::EVP_DigestFinal_ex(ctx_.get(),                                       //EVP_MD_CTX* ctx
                             reinterpret_cast<unsigned char*>(digest.data()), //unsigned char* md
                             &digestLen) != 1)                                //unsigned int* s
        throw SysError(formatLastOpenSSLError("EVP_DigestFinal_ex"));

    digest.resize(digestLen);
    return digest;
}


std::string psync::hashFileSha256(const Zstring& filePath, const IoCallback& notifyUnbufferedIO /*throw X*/) //throw FileError, X
{
    try
    {
        Sha256Hasher hasher; //throw SysError
        FileInputPlain fileIn(filePath); //throw FileError

        std::vector<char> buffer(FileBase::defaultBlockSize);
        for (;;)
        {
            const size_t bytesRead = fileIn.tryRead(buffer.data(), buffer.size()); //throw FileError; may return short, only 0 means EOF!
            if (bytesRead == 0)
                break;

            hasher.update(buffer.data(), bytesRead); //throw SysError
            if (notifyUnbufferedIO) notifyUnbufferedIO(bytesRead); //throw X
        }
        return formatAsHexString(hasher.finalize()); //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}


std::string psync::hashBytesSha256(std::string_view bytes) //throw SysError
{
    Sha256Hasher hasher; //throw SysError
    hasher.update(bytes.data(), bytes.size()); //throw SysError
    return formatAsHexString(hasher.finalize()); //throw SysError
}
