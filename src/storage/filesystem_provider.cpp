#include "vblobs/storage/filesystem_provider.hpp"
#include "vblobs/storage/path_resolver.hpp"
#include "vblobs/utils/logger.hpp"
#include <algorithm>
#include <fstream>
#include <ios>
#include <system_error>

namespace fs = std::filesystem;

namespace vblobs {
namespace storage {

namespace {

// 底层I/O失败统一包装为 InvalidOperation, 保留原始原因
Error ioError(const std::string& operation, const std::string& path, const std::string& cause) {
    utils::GetLogger().Error(operation + " failed",
        utils::LogContext().With("path", path).With("cause", cause));
    return Error(ErrorCode::InvalidOperation, operation + " failed for " + path, cause);
}

template<typename EntryPtr>
void sortByName(std::vector<EntryPtr>& entries) {
    std::sort(entries.begin(), entries.end(), [](const EntryPtr& a, const EntryPtr& b) {
        return a->GetName() < b->GetName();
    });
}

} // namespace

FileSystemStorageProvider::FileSystemStorageProvider(const std::string& rootPath) {
    std::error_code ec;
    root_ = fs::absolute(rootPath, ec);
    if (ec) {
        root_ = rootPath;
    }
    utils::GetLogger().Debug("Initialized filesystem storage", utils::LogContext().With("root", root_.string()));
}

Result<std::shared_ptr<FileSystemStorageProvider>> FileSystemStorageProvider::Open(
    const std::string& rootPath, bool createIfMissing) {
    if (rootPath.empty()) {
        return Error(ErrorCode::InvalidPath, "Storage root path is empty");
    }

    std::error_code ec;
    if (!fs::exists(rootPath, ec)) {
        if (ec) {
            return Error(ErrorCode::InvalidOperation, "Cannot access storage root " + rootPath, ec.message());
        }
        if (!createIfMissing) {
            return Error(ErrorCode::NotFound, "Storage root " + rootPath + " does not exist");
        }
        fs::create_directories(rootPath, ec);
        if (ec) {
            return Error(ErrorCode::InvalidOperation, "Cannot create storage root " + rootPath, ec.message());
        }
        utils::GetLogger().Info("Created storage root", utils::LogContext().With("root", rootPath));
    } else if (!fs::is_directory(rootPath, ec)) {
        return Error(ErrorCode::InvalidOperation, "Storage root " + rootPath + " is not a directory");
    }

    return std::make_shared<FileSystemStorageProvider>(rootPath);
}

Result<fs::path> FileSystemStorageProvider::mapStorage(const std::string& path) const {
    return ResolvePath(root_, path);
}

fs::path FileSystemStorageProvider::canonicalRoot() const {
    auto mapped = mapStorage("");
    return mapped.ok() ? mapped.value() : root_.lexically_normal();
}

Result<StorageFilePtr> FileSystemStorageProvider::GetFile(const std::string& path) {
    auto mapped = mapStorage(path);
    if (!mapped.ok()) {
        return mapped.error();
    }

    std::error_code ec;
    if (!fs::is_regular_file(mapped.value(), ec)) {
        return Error(ErrorCode::NotFound, "File " + path + " does not exist");
    }
    return StorageFilePtr(std::make_shared<FileSystemFile>(path, mapped.value()));
}

Result<std::vector<StorageFilePtr>> FileSystemStorageProvider::ListFiles(const std::string& path) {
    auto mapped = mapStorage(path);
    if (!mapped.ok()) {
        return mapped.error();
    }

    std::vector<StorageFilePtr> files;
    std::error_code ec;
    if (!fs::is_directory(mapped.value(), ec)) {
        return files;
    }

    fs::directory_iterator it(mapped.value(), ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        // 子项逐个重新解析, 指向根目录之外的符号链接直接跳过
        std::string relative = JoinRelative(path, it->path().filename().string());
        auto child = mapStorage(relative);
        if (!child.ok()) {
            continue;
        }
        std::error_code entryEc;
        if (fs::is_regular_file(child.value(), entryEc)) {
            files.push_back(std::make_shared<FileSystemFile>(relative, child.value()));
        }
    }
    if (ec) {
        return ioError("ListFiles", path, ec.message());
    }

    sortByName(files);
    return files;
}

Result<std::vector<StorageFolderPtr>> FileSystemStorageProvider::ListFolders(const std::string& path) {
    auto mapped = mapStorage(path);
    if (!mapped.ok()) {
        return mapped.error();
    }
    const fs::path& fullPath = mapped.value();

    std::error_code ec;
    if (!fs::is_directory(fullPath, ec)) {
        // 目录不存在时创建, 与查询语义不符但需保持兼容
        if (fs::exists(fullPath, ec)) {
            return ioError("ListFolders", path, "The folder could not be created: path is not a directory");
        }
        fs::create_directories(fullPath, ec);
        if (ec) {
            return ioError("ListFolders", path, "The folder could not be created: " + ec.message());
        }
        utils::GetLogger().Debug("Created folder while listing", utils::LogContext().With("path", path));
    }

    fs::path root = canonicalRoot();
    std::vector<StorageFolderPtr> folders;
    fs::directory_iterator it(fullPath, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::string relative = JoinRelative(path, it->path().filename().string());
        auto child = mapStorage(relative);
        if (!child.ok()) {
            continue;
        }
        std::error_code entryEc;
        if (fs::is_directory(child.value(), entryEc)) {
            folders.push_back(std::make_shared<FileSystemFolder>(relative, child.value(), root));
        }
    }
    if (ec) {
        return ioError("ListFolders", path, ec.message());
    }

    sortByName(folders);
    return folders;
}

Error FileSystemStorageProvider::CreateFolder(const std::string& path) {
    auto mapped = mapStorage(path);
    if (!mapped.ok()) {
        return mapped.error();
    }

    std::error_code ec;
    if (fs::is_directory(mapped.value(), ec)) {
        return Error(ErrorCode::AlreadyExists, "Directory " + path + " already exists");
    }

    fs::create_directories(mapped.value(), ec);
    if (ec) {
        return ioError("CreateFolder", path, ec.message());
    }
    utils::GetLogger().Debug("Created folder", utils::LogContext().With("path", path));
    return Error();
}

Error FileSystemStorageProvider::DeleteFolder(const std::string& path) {
    auto mapped = mapStorage(path);
    if (!mapped.ok()) {
        return mapped.error();
    }

    std::error_code ec;
    if (!fs::is_directory(mapped.value(), ec)) {
        return Error(ErrorCode::NotFound, "Directory " + path + " does not exist");
    }
    if (mapped.value() == canonicalRoot()) {
        return Error(ErrorCode::InvalidOperation, "Cannot delete the storage root");
    }

    fs::remove_all(mapped.value(), ec);
    if (ec) {
        return ioError("DeleteFolder", path, ec.message());
    }
    utils::GetLogger().Debug("Deleted folder", utils::LogContext().With("path", path));
    return Error();
}

Error FileSystemStorageProvider::RenameFolder(const std::string& oldPath, const std::string& newPath) {
    auto source = mapStorage(oldPath);
    if (!source.ok()) {
        return source.error();
    }
    auto target = mapStorage(newPath);
    if (!target.ok()) {
        return target.error();
    }

    std::error_code ec;
    if (!fs::is_directory(source.value(), ec)) {
        return Error(ErrorCode::NotFound, "Directory " + oldPath + " does not exist");
    }
    if (fs::exists(target.value(), ec)) {
        return Error(ErrorCode::AlreadyExists, "Directory " + newPath + " already exists");
    }
    if (source.value() == canonicalRoot()) {
        return Error(ErrorCode::InvalidOperation, "Cannot move the storage root");
    }

    fs::rename(source.value(), target.value(), ec);
    if (ec) {
        return ioError("RenameFolder", oldPath + " -> " + newPath, ec.message());
    }
    utils::GetLogger().Debug("Renamed folder",
        utils::LogContext().With("from", oldPath).With("to", newPath));
    return Error();
}

Error FileSystemStorageProvider::DeleteFile(const std::string& path) {
    auto mapped = mapStorage(path);
    if (!mapped.ok()) {
        return mapped.error();
    }

    std::error_code ec;
    if (!fs::is_regular_file(mapped.value(), ec)) {
        return Error(ErrorCode::NotFound, "File " + path + " does not exist");
    }

    fs::remove(mapped.value(), ec);
    if (ec) {
        return ioError("DeleteFile", path, ec.message());
    }
    utils::GetLogger().Debug("Deleted file", utils::LogContext().With("path", path));
    return Error();
}

Error FileSystemStorageProvider::RenameFile(const std::string& oldPath, const std::string& newPath) {
    auto source = mapStorage(oldPath);
    if (!source.ok()) {
        return source.error();
    }
    auto target = mapStorage(newPath);
    if (!target.ok()) {
        return target.error();
    }

    std::error_code ec;
    if (!fs::is_regular_file(source.value(), ec)) {
        return Error(ErrorCode::NotFound, "File " + oldPath + " does not exist");
    }
    if (fs::exists(target.value(), ec)) {
        return Error(ErrorCode::AlreadyExists, "File " + newPath + " already exists");
    }

    fs::rename(source.value(), target.value(), ec);
    if (ec) {
        return ioError("RenameFile", oldPath + " -> " + newPath, ec.message());
    }
    utils::GetLogger().Debug("Renamed file",
        utils::LogContext().With("from", oldPath).With("to", newPath));
    return Error();
}

Result<StorageFilePtr> FileSystemStorageProvider::CreateFile(const std::string& path) {
    auto mapped = mapStorage(path);
    if (!mapped.ok()) {
        return mapped.error();
    }
    const fs::path& fullPath = mapped.value();

    std::error_code ec;
    if (fs::is_regular_file(fullPath, ec)) {
        return Error(ErrorCode::AlreadyExists, "File " + fullPath.filename().string() + " already exists");
    }

    // 确保父目录存在
    fs::path parent = fullPath.parent_path();
    if (!parent.empty() && !fs::is_directory(parent, ec)) {
        fs::create_directories(parent, ec);
        if (ec) {
            return ioError("CreateFile", path, ec.message());
        }
    }

    std::ofstream file(fullPath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return ioError("CreateFile", path, "cannot open file for writing");
    }
    file.close();

    utils::GetLogger().Debug("Created file", utils::LogContext().With("path", path));
    return StorageFilePtr(std::make_shared<FileSystemFile>(path, fullPath));
}

Error FileSystemStorageProvider::SaveStream(const std::string& path, std::istream& input) {
    auto created = CreateFile(path);
    if (!created.ok()) {
        return created.error();
    }

    auto opened = created.value()->OpenWrite();
    if (!opened.ok()) {
        return opened.error();
    }
    const auto& output = opened.value();

    std::vector<char> buffer(COPY_BUFFER_SIZE);
    uintmax_t total = 0;
    // 输入流开启异常掩码时, 读取失败以 ios_base::failure 抛出
    try {
        while (input) {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize length = input.gcount();
            if (length <= 0) {
                break;
            }
            output->write(buffer.data(), length);
            if (!*output) {
                return ioError("SaveStream", path, "write to file failed");
            }
            total += static_cast<uintmax_t>(length);
        }
    } catch (const std::ios_base::failure& e) {
        return ioError("SaveStream", path, std::string("read from input stream failed: ") + e.what());
    }
    if (input.bad()) {
        return ioError("SaveStream", path, "read from input stream failed");
    }

    output->flush();
    if (!*output) {
        return ioError("SaveStream", path, "flush to file failed");
    }

    utils::GetLogger().Debug("Saved stream",
        utils::LogContext().With("path", path).With("bytes", std::to_string(total)));
    return Error();
}

bool FileSystemStorageProvider::FileExists(const std::string& path) {
    try {
        auto mapped = mapStorage(path);
        if (!mapped.ok()) {
            return false;
        }
        std::error_code ec;
        return fs::is_regular_file(mapped.value(), ec);
    } catch (const std::exception& e) {
        utils::GetLogger().Debug("FileExists failed",
            utils::LogContext().With("path", path).With("exception", e.what()));
        return false;
    }
}

std::string FileSystemStorageProvider::Location() const {
    return root_.string();
}

} // namespace storage
} // namespace vblobs
