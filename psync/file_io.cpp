// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "file_io.h"
#include <random>
#include <sys/stat.h>
#include <fcntl.h>  //open
#include <unistd.h> //close, read, write
#include "extra_log.h"

using namespace psync;


FileBase::~FileBase()
{
    if (hFile_ != invalidFileHandle)
        try
        {
            close(); //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); }
}


void FileBase::close() //throw FileError
{
    try
    {
        if (hFile_ == invalidFileHandle)
            throw SysError(L"Contract error: close() called more than once.");
        if (::close(hFile_) != 0)
            THROW_LAST_SYS_ERROR("close");
        hFile_ = invalidFileHandle; //do NOT set on error! => ~FileOutputPlain() still wants to (try to) delete the file!
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

namespace
{
FileBase::FileHandle openHandleForRead(const Zstring& filePath) //throw FileError
{
    try
    {
        //caveat: check for file types that block during open(): character device, block device, named pipe
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0) //follows symlinks
            THROW_LAST_SYS_ERROR("stat");

        if (!S_ISREG(fileInfo.st_mode) &&
            !S_ISDIR(fileInfo.st_mode)) //open() will fail with "EISDIR: Is a directory" => nice
            throw SysError(_("Unsupported item type.") + L" [0" + numberTo<std::wstring>(fileInfo.st_mode & S_IFMT) + L']');

        const int fdFile = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
        if (fdFile == -1) //don't check "< 0" -> docu seems to allow "-2" to be a valid file handle
            THROW_LAST_SYS_ERROR("open");
        return fdFile; //pass ownership
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot open file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}
}


FileInputPlain::FileInputPlain(const Zstring& filePath) :
    FileBase(openHandleForRead(filePath), filePath) //throw FileError
{
    //optimize read-ahead on input file:
    if (::posix_fadvise(getHandle(), 0 /*offset*/, 0 /*len*/, POSIX_FADV_SEQUENTIAL) != 0) //"len == 0" means "end of the file"
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)), "posix_fadvise(POSIX_FADV_SEQUENTIAL)");
}


size_t FileInputPlain::tryRead(void* buffer, size_t bytesToRead) //throw FileError
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesRead = 0;
        do
        {
            bytesRead = ::read(getHandle(), buffer, bytesToRead);
        }
        while (bytesRead < 0 && errno == EINTR); //if ::read is interrupted (EINTR) right in the middle, it will return successfully with "bytesRead < bytesToRead"

        if (bytesRead < 0)
            THROW_LAST_SYS_ERROR("read");

        ASSERT_SYSERROR(static_cast<size_t>(bytesRead) <= bytesToRead);
        return bytesRead; //"zero indicates end of file"
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

namespace
{
FileBase::FileHandle openHandleForWrite(const Zstring& filePath) //throw FileError, ErrorTargetExisting
{
    try
    {
        const mode_t lockFileMode = S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH; //0666 => umask will be applied implicitly!

        const int fdFile = ::open(filePath.c_str(), //const char* pathname
                                  O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, //int flags
                                  lockFileMode);    //mode_t mode
        if (fdFile == -1)
        {
            const int ec = errno; //copy before making other system calls!
            if (ec == EEXIST)
                throw ErrorTargetExisting(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath)), formatSystemError("open", ec));

            THROW_LAST_SYS_ERROR("open");
        }
        return fdFile; //pass ownership
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}
}


FileOutputPlain::FileOutputPlain(const Zstring& filePath) :
    FileBase(openHandleForWrite(filePath), filePath) {} //throw FileError, ErrorTargetExisting


FileOutputPlain::~FileOutputPlain()
{
    if (getHandle() != invalidFileHandle) //not finalized => clean up garbage
        try
        {
            if (::unlink(getFilePath().c_str()) != 0)
                THROW_LAST_SYS_ERROR("unlink");
        }
        catch (const SysError& e)
        {
            logExtraError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(getFilePath())) + L"\n\n" + e.toString());
        }
}


size_t FileOutputPlain::tryWrite(const void* buffer, size_t bytesToWrite) //throw FileError
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesWritten = 0;
        do
        {
            bytesWritten = ::write(getHandle(), buffer, bytesToWrite);
        }
        while (bytesWritten < 0 && errno == EINTR);

        if (bytesWritten <= 0)
        {
            if (bytesWritten == 0) //comment in safe-read.c suggests to treat this as an error due to buggy drivers
                errno = ENOSPC;

            THROW_LAST_SYS_ERROR("write");
        }

        ASSERT_SYSERROR(static_cast<size_t>(bytesWritten) <= bytesToWrite);
        return bytesWritten;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

void psync::writeAll(FileOutputPlain& fileOut, const void* buffer, size_t bytesToWrite) //throw FileError
{
    const char* it = static_cast<const char*>(buffer);
    while (bytesToWrite > 0)
    {
        const size_t bytesWritten = fileOut.tryWrite(it, bytesToWrite); //throw FileError
        it           += bytesWritten;
        bytesToWrite -= bytesWritten;
    }
}


Zstring psync::getPathWithTempName(const Zstring& filePath)
{
    thread_local std::mt19937 rng(std::random_device{}());
    const unsigned int shortId = std::uniform_int_distribution<unsigned int>(0, 0xffff)(rng);

    const char hexDigits[] = "0123456789abcdef";
    Zstring suffix;
    for (int i = 3; i >= 0; --i)
        suffix += hexDigits[(shortId >> (4 * i)) & 0xf];

    return filePath + Zstr('.') + suffix + Zstr(".tmp");
}


std::string psync::getFileContent(const Zstring& filePath, const IoCallback& notifyUnbufferedIO /*throw X*/) //throw FileError, X
{
    FileInputPlain fileIn(filePath); //throw FileError

    std::string content;
    for (;;)
    {
        const size_t oldSize = content.size();
        content.resize(oldSize + FileBase::defaultBlockSize); //zero-initializes :(

        const size_t bytesRead = fileIn.tryRead(&content[oldSize], FileBase::defaultBlockSize); //throw FileError; may return short, only 0 means EOF!
        content.resize(oldSize + bytesRead);

        if (notifyUnbufferedIO) notifyUnbufferedIO(bytesRead); //throw X!

        if (bytesRead == 0) //end of file
            return content;
    }
}


void psync::setFileContent(const Zstring& filePath, const std::string_view byteStream, const IoCallback& notifyUnbufferedIO /*throw X*/) //throw FileError, X
{
    const Zstring tmpFilePath = getPathWithTempName(filePath);
    {
        FileOutputPlain tmpFile(tmpFilePath); //throw FileError, (ErrorTargetExisting)

        for (size_t pos = 0; pos < byteStream.size(); )
        {
            const size_t bytesWritten = tmpFile.tryWrite(byteStream.data() + pos, std::min(byteStream.size() - pos, FileBase::defaultBlockSize)); //throw FileError
            pos += bytesWritten;
            if (notifyUnbufferedIO) notifyUnbufferedIO(bytesWritten); //throw X!
        }
        tmpFile.close(); //throw FileError
    }
    //take over ownership:
    PSYNC_ON_SCOPE_FAIL( try { removeFilePlain(tmpFilePath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    //operation finished: move temp file transactionally
    moveAndRenameItem(tmpFilePath, filePath, true /*replaceExisting*/); //throw FileError
}
