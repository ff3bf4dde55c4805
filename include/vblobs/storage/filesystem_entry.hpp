#pragma once

#include <filesystem>
#include "vblobs/storage/entry.hpp"

namespace vblobs {
namespace storage {

// 本地文件系统中的文件
class FileSystemFile : public StorageFile {
public:
    FileSystemFile(const std::string& path, const std::filesystem::path& fullPath);

    std::string GetPath() const override;
    std::string GetName() const override;
    Result<uintmax_t> GetSize() const override;
    Result<std::chrono::system_clock::time_point> GetLastUpdated() const override;
    std::string GetFileType() const override;

    Result<std::unique_ptr<std::istream>> OpenRead() const override;
    Result<std::unique_ptr<std::iostream>> OpenWrite() const override;
    Result<std::unique_ptr<std::iostream>> CreateFile() const override;

private:
    std::string path_;
    std::filesystem::path fullPath_;
};

// 本地文件系统中的目录
class FileSystemFolder : public StorageFolder {
public:
    // rootPath为存储根目录的规范化路径, fullPath等于rootPath时没有父目录
    FileSystemFolder(const std::string& path,
                     const std::filesystem::path& fullPath,
                     const std::filesystem::path& rootPath);

    std::string GetPath() const override;
    std::string GetName() const override;
    Result<std::chrono::system_clock::time_point> GetLastUpdated() const override;
    Result<uintmax_t> GetSize() const override;
    Result<std::shared_ptr<StorageFolder>> GetParent() const override;

private:
    std::string path_;
    std::filesystem::path fullPath_;
    std::filesystem::path rootPath_;
};

} // namespace storage
} // namespace vblobs
