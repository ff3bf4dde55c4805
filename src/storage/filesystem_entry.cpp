#include "vblobs/storage/filesystem_entry.hpp"
#include "vblobs/utils/tools.hpp"
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace vblobs {
namespace storage {

namespace {

Result<std::chrono::system_clock::time_point> lastWriteTime(const std::string& path,
                                                             const fs::path& fullPath) {
    std::error_code ec;
    auto fileTime = fs::last_write_time(fullPath, ec);
    if (ec) {
        ErrorCode code = ec == std::errc::no_such_file_or_directory
            ? ErrorCode::NotFound : ErrorCode::InvalidOperation;
        return Error(code, "Cannot read modification time of " + path, ec.message());
    }
    return utils::FileTimeToSystemTime(fileTime);
}

Result<std::unique_ptr<std::iostream>> openReadWrite(const std::string& path,
                                                     const fs::path& fullPath,
                                                     std::ios::openmode extra) {
    std::error_code ec;
    if (!fs::is_regular_file(fullPath, ec)) {
        return Error(ErrorCode::NotFound, "File " + path + " does not exist");
    }
    auto stream = std::make_unique<std::fstream>(
        fullPath, std::ios::in | std::ios::out | std::ios::binary | extra);
    if (!stream->is_open()) {
        return Error(ErrorCode::InvalidOperation, "Cannot open file " + path + " for writing");
    }
    return Result<std::unique_ptr<std::iostream>>(std::move(stream));
}

} // namespace

FileSystemFile::FileSystemFile(const std::string& path, const fs::path& fullPath)
    : path_(path), fullPath_(fullPath) {}

std::string FileSystemFile::GetPath() const {
    return path_;
}

std::string FileSystemFile::GetName() const {
    return fullPath_.filename().string();
}

Result<uintmax_t> FileSystemFile::GetSize() const {
    std::error_code ec;
    uintmax_t size = fs::file_size(fullPath_, ec);
    if (ec) {
        ErrorCode code = ec == std::errc::no_such_file_or_directory
            ? ErrorCode::NotFound : ErrorCode::InvalidOperation;
        return Error(code, "Cannot read size of " + path_, ec.message());
    }
    return size;
}

Result<std::chrono::system_clock::time_point> FileSystemFile::GetLastUpdated() const {
    return lastWriteTime(path_, fullPath_);
}

std::string FileSystemFile::GetFileType() const {
    return fullPath_.extension().string();
}

Result<std::unique_ptr<std::istream>> FileSystemFile::OpenRead() const {
    std::error_code ec;
    if (!fs::is_regular_file(fullPath_, ec)) {
        return Error(ErrorCode::NotFound, "File " + path_ + " does not exist");
    }
    auto stream = std::make_unique<std::ifstream>(fullPath_, std::ios::in | std::ios::binary);
    if (!stream->is_open()) {
        return Error(ErrorCode::InvalidOperation, "Cannot open file " + path_ + " for reading");
    }
    return Result<std::unique_ptr<std::istream>>(std::move(stream));
}

Result<std::unique_ptr<std::iostream>> FileSystemFile::OpenWrite() const {
    return openReadWrite(path_, fullPath_, std::ios::openmode());
}

Result<std::unique_ptr<std::iostream>> FileSystemFile::CreateFile() const {
    return openReadWrite(path_, fullPath_, std::ios::trunc);
}

FileSystemFolder::FileSystemFolder(const std::string& path,
                                   const fs::path& fullPath,
                                   const fs::path& rootPath)
    : path_(path), fullPath_(fullPath), rootPath_(rootPath) {}

std::string FileSystemFolder::GetPath() const {
    return path_;
}

std::string FileSystemFolder::GetName() const {
    return fullPath_.filename().string();
}

Result<std::chrono::system_clock::time_point> FileSystemFolder::GetLastUpdated() const {
    return lastWriteTime(path_, fullPath_);
}

Result<uintmax_t> FileSystemFolder::GetSize() const {
    std::error_code ec;
    if (!fs::is_directory(fullPath_, ec)) {
        return Error(ErrorCode::NotFound, "Directory " + path_ + " does not exist");
    }

    uintmax_t total = 0;
    fs::recursive_directory_iterator it(fullPath_, ec);
    if (ec) {
        return Error(ErrorCode::InvalidOperation, "Cannot enumerate directory " + path_, ec.message());
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return Error(ErrorCode::InvalidOperation, "Cannot enumerate directory " + path_, ec.message());
        }
        std::error_code entryEc;
        // 符号链接不计入, 其目标可能位于根目录之外
        if (it->is_symlink(entryEc)) {
            continue;
        }
        if (it->is_regular_file(entryEc)) {
            uintmax_t size = it->file_size(entryEc);
            // 统计期间被删除的文件忽略不计
            if (!entryEc) {
                total += size;
            }
        }
    }
    if (ec) {
        return Error(ErrorCode::InvalidOperation, "Cannot enumerate directory " + path_, ec.message());
    }
    return total;
}

Result<std::shared_ptr<StorageFolder>> FileSystemFolder::GetParent() const {
    if (fullPath_ == rootPath_ || !fullPath_.has_relative_path()) {
        return Error(ErrorCode::NoParent,
                     "Directory " + GetName() + " does not have a parent directory");
    }

    fs::path parentFull = fullPath_.parent_path();
    std::string parentPath = parentFull.lexically_relative(rootPath_).generic_string();
    if (parentPath == ".") {
        parentPath = "";
    }
    return Result<std::shared_ptr<StorageFolder>>(
        std::make_shared<FileSystemFolder>(parentPath, parentFull, rootPath_));
}

} // namespace storage
} // namespace vblobs
