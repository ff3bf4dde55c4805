#pragma once
#include <chrono>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include "vblobs/types.hpp"

namespace vblobs {
namespace utils {

// 计算数据的SHA-256哈希
Result<std::vector<uint8_t>> CalculateSHA256Hash(const std::vector<uint8_t>& data);

// 分块读取流并计算SHA-256哈希, 内存占用不超过COPY_BUFFER_SIZE
Result<std::vector<uint8_t>> CalculateStreamSHA256(std::istream& input);

// 将字节数组转换为十六进制字符串
std::string HexEncode(const std::vector<uint8_t>& data);

// 文件时间转换为系统时间
std::chrono::system_clock::time_point FileTimeToSystemTime(std::filesystem::file_time_type fileTime);

// 本地时间格式化, 形如 2024-01-31 08:00:00
std::string FormatTime(std::chrono::system_clock::time_point tp);

} // namespace utils
} // namespace vblobs
