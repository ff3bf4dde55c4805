#pragma once

#include <chrono>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "vblobs/types.hpp"
#include "vblobs/storage/entry.hpp"

namespace vblobs {
namespace storage {

using StorageFilePtr = std::shared_ptr<StorageFile>;
using StorageFolderPtr = std::shared_ptr<StorageFolder>;

// 存储后端接口。
// 所有路径均为相对于存储根目录的路径, 以'/'分隔, 空字符串表示根目录。
// 严格操作通过 Error/Result 返回错误; Try 系列操作吞掉所有错误, 只返回 bool。
class StorageProvider {
public:
    virtual ~StorageProvider() = default;

    // 获取文件, 不存在时返回 NotFound
    virtual Result<StorageFilePtr> GetFile(const std::string& path) = 0;

    // 列出目录下的文件, 目录不存在时返回空列表
    virtual Result<std::vector<StorageFilePtr>> ListFiles(const std::string& path) = 0;

    // 列出目录下的子目录。目录不存在时会先创建该目录
    virtual Result<std::vector<StorageFolderPtr>> ListFolders(const std::string& path) = 0;

    // 创建目录, 已存在时返回 AlreadyExists
    virtual Error CreateFolder(const std::string& path) = 0;

    // 递归删除目录, 不存在时返回 NotFound
    virtual Error DeleteFolder(const std::string& path) = 0;

    virtual Error RenameFolder(const std::string& oldPath, const std::string& newPath) = 0;

    // 删除文件, 不存在时返回 NotFound
    virtual Error DeleteFile(const std::string& path) = 0;

    virtual Error RenameFile(const std::string& oldPath, const std::string& newPath) = 0;

    // 创建空文件(按需创建父目录), 已存在时返回 AlreadyExists
    virtual Result<StorageFilePtr> CreateFile(const std::string& path) = 0;

    // 创建文件并写入输入流的全部内容。输入流由调用方持有, 不会被关闭
    virtual Error SaveStream(const std::string& path, std::istream& input) = 0;

    // 文件是否存在, 任何错误都视为不存在
    virtual bool FileExists(const std::string& path) = 0;

    // 存储位置描述
    virtual std::string Location() const = 0;

    // 创建目录, 失败(包括目录已存在)时返回false
    bool TryCreateFolder(const std::string& path);

    // 保存输入流, 失败时返回false
    bool TrySaveStream(const std::string& path, std::istream& input);

    // 删除已有文件后重新创建空文件
    Result<StorageFilePtr> CreateOrReplaceFile(const std::string& path);

    // 共享访问链接的默认过期时间, 文件系统实现不使用
    std::optional<std::chrono::system_clock::time_point> DefaultSharedAccessExpiration() const {
        return defaultSharedAccessExpiration_;
    }
    void SetDefaultSharedAccessExpiration(std::optional<std::chrono::system_clock::time_point> expiration) {
        defaultSharedAccessExpiration_ = expiration;
    }

private:
    std::optional<std::chrono::system_clock::time_point> defaultSharedAccessExpiration_;
};

} // namespace storage
} // namespace vblobs
