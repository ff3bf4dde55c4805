#pragma once

#include <filesystem>
#include <string>
#include "vblobs/types.hpp"

namespace vblobs {
namespace storage {

// 将调用方使用的'/'分隔符转换为本机分隔符
std::string FixPath(const std::string& path);

// 拼接调用方格式的相对路径, parent为空时返回name
std::string JoinRelative(const std::string& parent, const std::string& name);

// 逐个路径组件比较, candidate位于root之内(或等于root)时返回true
bool IsWithinRoot(const std::filesystem::path& root, const std::filesystem::path& candidate);

// 将相对路径解析为根目录下的绝对路径。
// 空路径表示根目录本身。解析结果经过规范化(处理 . 和 .. 以及符号链接),
// 越出根目录的路径(包括 .. 、绝对路径、盘符前缀)一律返回 InvalidPath,
// 不做任何截断或修正。本函数不修改文件系统。
Result<std::filesystem::path> ResolvePath(const std::filesystem::path& root,
                                          const std::string& relativePath);

} // namespace storage
} // namespace vblobs
