// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef OPEN_SSL_H_7391046258301749
#define OPEN_SSL_H_7391046258301749

#include <memory>
#include "file_io.h"

struct evp_md_ctx_st; //EVP_MD_CTX


namespace psync
{
//init OpenSSL before use!
void openSslInit();
void openSslTearDown();


//incremental SHA-256
class Sha256Hasher
{
public:
    Sha256Hasher(); //throw SysError

    void update(const void* buffer, size_t bytes); //throw SysError
    std::string finalize(); //throw SysError; returns raw 32-byte digest

private:
    std::shared_ptr<evp_md_ctx_st> ctx_;
};


//stream file contents through SHA-256: lower-case hex digest
std::string hashFileSha256(const Zstring& filePath, const IoCallback& notifyUnbufferedIO /*throw X*/); //throw FileError, X

//SHA-256 of a memory buffer: lower-case hex digest
std::string hashBytesSha256(std::string_view bytes); //throw SysError
}

#endif //OPEN_SSL_H_7391046258301749
