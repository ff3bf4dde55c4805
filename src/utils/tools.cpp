#include "vblobs/utils/tools.hpp"
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>

namespace vblobs {
namespace utils {

namespace {

struct MDContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MDContextPtr = std::unique_ptr<EVP_MD_CTX, MDContextDeleter>;

Result<MDContextPtr> newSHA256Context() {
    MDContextPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Error("Failed to create digest context");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Error("Failed to initialize SHA-256 digest");
    }
    return Result<MDContextPtr>(std::move(ctx));
}

Result<std::vector<uint8_t>> finishDigest(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        return Error("Failed to finalize SHA-256 digest");
    }
    return std::vector<uint8_t>(hash, hash + hashLen);
}

} // namespace

Result<std::vector<uint8_t>> CalculateSHA256Hash(const std::vector<uint8_t>& data) {
    auto ctxResult = newSHA256Context();
    if (!ctxResult.ok()) {
        return ctxResult.error();
    }
    const auto& ctx = ctxResult.value();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return Error("Failed to update SHA-256 digest");
    }
    return finishDigest(ctx.get());
}

Result<std::vector<uint8_t>> CalculateStreamSHA256(std::istream& input) {
    auto ctxResult = newSHA256Context();
    if (!ctxResult.ok()) {
        return ctxResult.error();
    }
    const auto& ctx = ctxResult.value();

    std::vector<char> buffer(COPY_BUFFER_SIZE);
    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize length = input.gcount();
        if (length <= 0) {
            break;
        }
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(length)) != 1) {
            return Error("Failed to update SHA-256 digest");
        }
    }
    if (input.bad()) {
        return Error("Failed to read input stream");
    }
    return finishDigest(ctx.get());
}

std::string HexEncode(const std::vector<uint8_t>& data) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (uint8_t byte : data) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

std::chrono::system_clock::time_point FileTimeToSystemTime(std::filesystem::file_time_type fileTime) {
    // C++17没有clock_cast, 借助两个时钟的当前时刻换算
    using namespace std::chrono;
    auto fileNow = std::filesystem::file_time_type::clock::now();
    auto sysNow = system_clock::now();
    return sysNow + duration_cast<system_clock::duration>(fileTime - fileNow);
}

std::string FormatTime(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace utils
} // namespace vblobs
