#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include "vblobs/types.hpp"

namespace vblobs {
namespace storage {

// 存储中的文件, 只读视图。每次查询都重新读取底层状态
class StorageFile {
public:
    virtual ~StorageFile() = default;

    // 相对于存储根目录的路径, 使用'/'分隔
    virtual std::string GetPath() const = 0;
    virtual std::string GetName() const = 0;
    virtual Result<uintmax_t> GetSize() const = 0;
    virtual Result<std::chrono::system_clock::time_point> GetLastUpdated() const = 0;

    // 扩展名(包含'.'), 没有扩展名时为空
    virtual std::string GetFileType() const = 0;

    // 只读打开
    virtual Result<std::unique_ptr<std::istream>> OpenRead() const = 0;
    // 读写打开, 保留原有内容
    virtual Result<std::unique_ptr<std::iostream>> OpenWrite() const = 0;
    // 读写打开并清空内容
    virtual Result<std::unique_ptr<std::iostream>> CreateFile() const = 0;
};

// 存储中的目录, 只读视图
class StorageFolder {
public:
    virtual ~StorageFolder() = default;

    virtual std::string GetPath() const = 0;
    virtual std::string GetName() const = 0;
    virtual Result<std::chrono::system_clock::time_point> GetLastUpdated() const = 0;

    // 递归统计目录下所有文件的大小
    virtual Result<uintmax_t> GetSize() const = 0;

    // 根目录返回 NoParent
    virtual Result<std::shared_ptr<StorageFolder>> GetParent() const = 0;
};

} // namespace storage
} // namespace vblobs
