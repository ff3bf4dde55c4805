#include "vblobs/storage/path_resolver.hpp"
#include "vblobs/utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace vblobs {
namespace storage {

namespace {

// Windows和macOS默认文件系统不区分大小写
#if defined(_WIN32) || defined(__APPLE__)
const bool kCaseInsensitivePaths = true;
#else
const bool kCaseInsensitivePaths = false;
#endif

bool componentEquals(const fs::path& a, const fs::path& b) {
    if (!kCaseInsensitivePaths) {
        return a == b;
    }
    const auto& sa = a.native();
    const auto& sb = b.native();
    if (sa.size() != sb.size()) {
        return false;
    }
    return std::equal(sa.begin(), sa.end(), sb.begin(), [](auto ca, auto cb) {
        return std::tolower(static_cast<int>(ca)) == std::tolower(static_cast<int>(cb));
    });
}

Result<fs::path> canonicalize(const fs::path& p) {
    std::error_code ec;
    fs::path absolute = fs::absolute(p, ec);
    if (ec) {
        return Error(ErrorCode::InvalidPath, "Invalid path", ec.message());
    }
    fs::path canonical = fs::weakly_canonical(absolute, ec);
    if (ec) {
        return Error(ErrorCode::InvalidPath, "Invalid path", ec.message());
    }
    canonical = canonical.lexically_normal();
    // 去掉末尾分隔符, 保证 "a/" 与 "a" 解析结果相同
    if (!canonical.has_filename() && canonical.has_relative_path()) {
        canonical = canonical.parent_path();
    }
    return canonical;
}

Error rejectPath(const std::string& relativePath, const std::string& reason) {
    utils::GetLogger().Warn("Rejected path outside storage root",
        utils::LogContext().With("path", relativePath).With("reason", reason));
    return Error(ErrorCode::InvalidPath, "Invalid path: " + relativePath, reason);
}

} // namespace

std::string FixPath(const std::string& path) {
    if (path.empty()) {
        return "";
    }
    std::string fixed = path;
    const char separator = static_cast<char>(fs::path::preferred_separator);
    if (separator != '/') {
        std::replace(fixed.begin(), fixed.end(), '/', separator);
    }
    return fixed;
}

std::string JoinRelative(const std::string& parent, const std::string& name) {
    if (parent.empty()) {
        return name;
    }
    std::string joined = parent;
    while (!joined.empty() && joined.back() == '/') {
        joined.pop_back();
    }
    if (joined.empty()) {
        return name;
    }
    return joined + "/" + name;
}

bool IsWithinRoot(const fs::path& root, const fs::path& candidate) {
    auto candidateIt = candidate.begin();
    for (auto rootIt = root.begin(); rootIt != root.end(); ++rootIt) {
        // 末尾分隔符产生的空组件不参与比较
        if (rootIt->empty()) {
            continue;
        }
        if (candidateIt == candidate.end() || !componentEquals(*rootIt, *candidateIt)) {
            return false;
        }
        ++candidateIt;
    }
    return true;
}

Result<fs::path> ResolvePath(const fs::path& root, const std::string& relativePath) {
    if (relativePath.find('\0') != std::string::npos) {
        return rejectPath(relativePath, "embedded NUL character");
    }

    fs::path candidate = relativePath.empty() ? root : root / fs::path(FixPath(relativePath));

    try {
        auto canonicalRoot = canonicalize(root);
        if (!canonicalRoot.ok()) {
            return rejectPath(relativePath, canonicalRoot.error().cause());
        }
        auto canonicalCandidate = canonicalize(candidate);
        if (!canonicalCandidate.ok()) {
            return rejectPath(relativePath, canonicalCandidate.error().cause());
        }
        if (!IsWithinRoot(canonicalRoot.value(), canonicalCandidate.value())) {
            return rejectPath(relativePath, "resolves outside storage root");
        }
        return canonicalCandidate.value();
    } catch (const std::exception& e) {
        return rejectPath(relativePath, e.what());
    }
}

} // namespace storage
} // namespace vblobs
