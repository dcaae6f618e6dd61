// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FILE_IO_H_5830917264518392
#define FILE_IO_H_5830917264518392

#include "file_access.h"


namespace psync
{
//notify about bytes read/written; may throw to abort the stream
using IoCallback = std::function<void(int64_t bytesDelta)>; //throw X

/*  OS-buffered file I/O:
    - sequential read/write accesses
    - better error reporting
    - follows symlinks                     */
class FileBase
{
public:
    using FileHandle = int;
    static const int invalidFileHandle = -1;

    FileHandle getHandle() { return hFile_; }

    const Zstring& getFilePath() const { return filePath_; }

    static constexpr size_t defaultBlockSize = 128 * 1024;

    void close(); //throw FileError -> good place to catch errors when closing stream, otherwise called in ~FileBase()!

protected:
    FileBase(FileHandle handle, const Zstring& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

private:
    FileBase           (const FileBase&) = delete;
    FileBase& operator=(const FileBase&) = delete;

    FileHandle hFile_ = invalidFileHandle;
    const Zstring filePath_;
};

//-----------------------------------------------------------------------------------------------

class FileInputPlain : public FileBase
{
public:
    explicit FileInputPlain(const Zstring& filePath); //throw FileError

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError
};


class FileOutputPlain : public FileBase
{
public:
    explicit FileOutputPlain(const Zstring& filePath); //throw FileError, ErrorTargetExisting
    ~FileOutputPlain();

    //may return short! CONTRACT: bytesToWrite > 0
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw FileError

    //close() when done, or else file is considered incomplete and will be deleted!
};

//-----------------------------------------------------------------------------------------------

//write complete buffer, retrying on short writes
void writeAll(FileOutputPlain& fileOut, const void* buffer, size_t bytesToWrite); //throw FileError

//generate (hopefully) unique file name in the same folder
Zstring getPathWithTempName(const Zstring& filePath);

[[nodiscard]] std::string getFileContent(const Zstring& filePath, const IoCallback& notifyUnbufferedIO /*throw X*/); //throw FileError, X

//overwrites if existing + transactional! :)
void setFileContent(const Zstring& filePath, const std::string_view bytes, const IoCallback& notifyUnbufferedIO /*throw X*/); //throw FileError, X
}

#endif //FILE_IO_H_5830917264518392
