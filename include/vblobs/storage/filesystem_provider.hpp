#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include "vblobs/storage/storage_provider.hpp"
#include "vblobs/storage/filesystem_entry.hpp"

namespace vblobs {
namespace storage {

// 以本地目录为根的存储实现
class FileSystemStorageProvider : public StorageProvider {
public:
    explicit FileSystemStorageProvider(const std::string& rootPath);

    // 检查根目录是否存在, createIfMissing为true时自动创建
    static Result<std::shared_ptr<FileSystemStorageProvider>> Open(const std::string& rootPath,
                                                                   bool createIfMissing = false);

    Result<StorageFilePtr> GetFile(const std::string& path) override;
    Result<std::vector<StorageFilePtr>> ListFiles(const std::string& path) override;
    Result<std::vector<StorageFolderPtr>> ListFolders(const std::string& path) override;
    Error CreateFolder(const std::string& path) override;
    Error DeleteFolder(const std::string& path) override;
    Error RenameFolder(const std::string& oldPath, const std::string& newPath) override;
    Error DeleteFile(const std::string& path) override;
    Error RenameFile(const std::string& oldPath, const std::string& newPath) override;
    Result<StorageFilePtr> CreateFile(const std::string& path) override;
    Error SaveStream(const std::string& path, std::istream& input) override;
    bool FileExists(const std::string& path) override;
    std::string Location() const override;

private:
    // 将相对路径映射到根目录下
    Result<std::filesystem::path> mapStorage(const std::string& path) const;

    // 根目录的规范化路径, 用于构造目录条目
    std::filesystem::path canonicalRoot() const;

    std::filesystem::path root_;
};

} // namespace storage
} // namespace vblobs
