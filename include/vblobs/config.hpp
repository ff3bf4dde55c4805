#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "vblobs/types.hpp"
#include "vblobs/utils/logger.hpp"

namespace vblobs {

using json = nlohmann::json;

// 存储配置
struct Config {
    std::string root;                 // 存储根目录
    bool createRoot = false;          // 根目录不存在时是否创建
    std::optional<std::chrono::system_clock::time_point> defaultSharedAccessExpiration;
    utils::LoggingConfig logging;
};

// 从JSON对象解析配置, 未知字段忽略
Result<Config> ParseConfig(const json& j);

// 读取并解析JSON配置文件
Result<Config> LoadConfig(const std::string& configFile);

} // namespace vblobs
