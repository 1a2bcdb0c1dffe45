// *****************************************************************************
// * This file is part of the FtpClient project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_IO_H_1187730542619904823
#define FILE_IO_H_1187730542619904823

#include <cstdint>
#include "file_error.h"


namespace zftp
{
/*  OS-buffered local file I/O:
    - sequential read/write accesses
    - better error reporting
    - follows symlinks                     */
class FileBase
{
public:
    using FileHandle = int;
    static const int invalidFileHandle = -1;

    FileHandle getHandle() { return hFile_; }

    const std::string& getFilePath() const { return filePath_; }

    static constexpr size_t defaultBlockSize = 256 * 1024;

    void close(); //throw FileError -> good place to catch errors when closing stream, otherwise called in ~FileBase()!

protected:
    FileBase(FileHandle handle, const std::string& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

private:
    FileBase           (const FileBase&) = delete;
    FileBase& operator=(const FileBase&) = delete;

    FileHandle hFile_ = invalidFileHandle;
    const std::string filePath_;
};

//-----------------------------------------------------------------------------------------------

class FileInputPlain : public FileBase
{
public:
    FileInputPlain(const std::string& filePath, uint64_t startOffset = 0); //throw FileError

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError
};


enum class FileOutputMode
{
    createNew,
    append, //resume a partial download
};

class FileOutputPlain : public FileBase
{
public:
    FileOutputPlain(const std::string& filePath, FileOutputMode mode); //throw FileError, ErrorTargetExisting
    ~FileOutputPlain();

    //may return short! CONTRACT: bytesToWrite > 0
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw FileError

    //close() when done, or else a newly created file is considered incomplete and will be deleted!

private:
    const FileOutputMode mode_;
};
}

#endif //FILE_IO_H_1187730542619904823
