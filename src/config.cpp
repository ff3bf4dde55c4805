#include "vblobs/config.hpp"
#include <chrono>
#include <cstdint>
#include <fstream>

namespace vblobs {

namespace {

Error fieldError(const std::string& field, const std::string& expected) {
    return Error(ErrorCode::InvalidOperation,
                 "Invalid configuration field '" + field + "': expected " + expected);
}

// 读取可选的字符串字段, 字段类型错误时返回错误
Error readString(const json& obj, const std::string& key, const std::string& field, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return Error();
    }
    if (!it->is_string()) {
        return fieldError(field, "string");
    }
    out = it->get<std::string>();
    return Error();
}

} // namespace

Result<Config> ParseConfig(const json& j) {
    if (!j.is_object()) {
        return Error(ErrorCode::InvalidOperation, "Configuration must be a JSON object");
    }

    Config config;

    Error err = readString(j, "root", "root", config.root);
    if (err.hasError()) return err;

    auto createRoot = j.find("create_root");
    if (createRoot != j.end() && !createRoot->is_null()) {
        if (!createRoot->is_boolean()) {
            return fieldError("create_root", "boolean");
        }
        config.createRoot = createRoot->get<bool>();
    }

    auto expiration = j.find("default_shared_access_expiration");
    if (expiration != j.end() && !expiration->is_null()) {
        if (!expiration->is_number_integer()) {
            return fieldError("default_shared_access_expiration", "integer unix seconds");
        }
        // 超出system_clock可表示范围的秒数在换算时会溢出
        using std::chrono::duration_cast;
        using std::chrono::seconds;
        using std::chrono::system_clock;
        const int64_t maxSeconds = duration_cast<seconds>(system_clock::duration::max()).count();
        const int64_t minSeconds = duration_cast<seconds>(system_clock::duration::min()).count();
        if (expiration->is_number_unsigned() &&
            expiration->get<uint64_t>() > static_cast<uint64_t>(maxSeconds)) {
            return fieldError("default_shared_access_expiration", "unix seconds within clock range");
        }
        int64_t value = expiration->get<int64_t>();
        if (value > maxSeconds || value < minSeconds) {
            return fieldError("default_shared_access_expiration", "unix seconds within clock range");
        }
        config.defaultSharedAccessExpiration =
            system_clock::time_point(duration_cast<system_clock::duration>(seconds(value)));
    }

    auto logging = j.find("logging");
    if (logging != j.end() && !logging->is_null()) {
        if (!logging->is_object()) {
            return fieldError("logging", "object");
        }
        err = readString(*logging, "level", "logging.level", config.logging.level);
        if (err.hasError()) return err;
        err = readString(*logging, "format", "logging.format", config.logging.format);
        if (err.hasError()) return err;
        err = readString(*logging, "output", "logging.output", config.logging.output);
        if (err.hasError()) return err;
        err = readString(*logging, "file", "logging.file", config.logging.file);
        if (err.hasError()) return err;
    }

    return config;
}

Result<Config> LoadConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        return Error(ErrorCode::InvalidOperation, "Cannot open configuration file: " + configFile);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        return Error(ErrorCode::InvalidOperation, "Malformed configuration file: " + configFile, e.what());
    }
    return ParseConfig(j);
}

} // namespace vblobs
