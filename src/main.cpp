#include <iostream>
#include <fstream>
#include <iomanip>
#include <CLI/CLI.hpp>
#include "vblobs/config.hpp"
#include "vblobs/storage/filesystem_provider.hpp"
#include "vblobs/utils/logger.hpp"
#include "vblobs/utils/tools.hpp"

using namespace vblobs;

namespace {

// 打印文件列表, 形如: <size> <mtime> <path>
void printFiles(const std::vector<storage::StorageFilePtr>& files) {
    for (const auto& file : files) {
        auto size = file->GetSize();
        auto updated = file->GetLastUpdated();
        std::cout << std::right << std::setw(12) << (size.ok() ? std::to_string(size.value()) : "?")
                  << "  " << (updated.ok() ? utils::FormatTime(updated.value()) : "-")
                  << "  " << file->GetPath() << std::endl;
    }
}

void printFolders(const std::vector<storage::StorageFolderPtr>& folders) {
    for (const auto& folder : folders) {
        auto updated = folder->GetLastUpdated();
        std::cout << std::right << std::setw(12) << "<dir>"
                  << "  " << (updated.ok() ? utils::FormatTime(updated.value()) : "-")
                  << "  " << folder->GetPath() << "/" << std::endl;
    }
}

// 命令执行失败时记录日志并返回退出码
int report(const std::string& command, const Error& err) {
    if (err.ok()) {
        return 0;
    }
    utils::GetLogger().Error(command + " failed", utils::LogContext()
        .With("code", ErrorCodeToString(err.code()))
        .With("error", err.what())
        .With("cause", err.cause()));
    return 1;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"vblobs - manage files and folders inside a storage root"};
    app.require_subcommand(1);

    // 全局选项
    std::string configFile;
    std::string rootDir;
    bool createRoot = false;
    bool debug = false;
    std::string logLevel;
    std::string logFormat;

    app.add_option("-c,--config", configFile, "Configuration file path");
    app.add_option("-r,--root", rootDir, "Storage root directory");
    app.add_flag("--create-root", createRoot, "Create the storage root if it does not exist");
    app.add_flag("-D,--debug", debug, "Enable debug output");
    app.add_option("--log-level", logLevel, "Log level: debug, info, warn, error");
    app.add_option("--log-format", logFormat, "Log format: json, text");

    std::string path;
    std::string target;
    std::string fromFile;

    auto ls = app.add_subcommand("ls", "List folders and files of a folder");
    ls->add_option("path", path, "Relative folder path");
    auto files = app.add_subcommand("files", "List files of a folder");
    files->add_option("path", path, "Relative folder path");
    auto folders = app.add_subcommand("folders", "List sub folders (creates the folder if absent)");
    folders->add_option("path", path, "Relative folder path");
    auto stat = app.add_subcommand("stat", "Show file or folder details");
    stat->add_option("path", path, "Relative path")->required();
    auto mkdir = app.add_subcommand("mkdir", "Create a folder");
    mkdir->add_option("path", path, "Relative folder path")->required();
    auto rmdir = app.add_subcommand("rmdir", "Delete a folder recursively");
    rmdir->add_option("path", path, "Relative folder path")->required();
    auto mvdir = app.add_subcommand("mvdir", "Rename a folder");
    mvdir->add_option("from", path, "Existing folder")->required();
    mvdir->add_option("to", target, "New folder")->required();
    auto touch = app.add_subcommand("touch", "Create an empty file");
    touch->add_option("path", path, "Relative file path")->required();
    auto replace = app.add_subcommand("replace", "Create an empty file, replacing an existing one");
    replace->add_option("path", path, "Relative file path")->required();
    auto rm = app.add_subcommand("rm", "Delete a file");
    rm->add_option("path", path, "Relative file path")->required();
    auto mv = app.add_subcommand("mv", "Rename a file");
    mv->add_option("from", path, "Existing file")->required();
    mv->add_option("to", target, "New file")->required();
    auto put = app.add_subcommand("put", "Save a local file or stdin into a new file");
    put->add_option("path", path, "Relative file path")->required();
    put->add_option("--from", fromFile, "Local file to read (default: stdin)");
    auto cat = app.add_subcommand("cat", "Write file content to stdout");
    cat->add_option("path", path, "Relative file path")->required();
    auto exists = app.add_subcommand("exists", "Exit with 0 if the file exists, 1 otherwise");
    exists->add_option("path", path, "Relative file path")->required();
    auto digest = app.add_subcommand("digest", "Print the SHA-256 digest of a file");
    digest->add_option("path", path, "Relative file path")->required();

    CLI11_PARSE(app, argc, argv);

    // 1. 加载配置, 命令行参数优先
    Config config;
    if (!configFile.empty()) {
        auto loaded = LoadConfig(configFile);
        if (!loaded.ok()) {
            utils::GetLogger().Error("Error loading configuration: " + loaded.error().what(),
                utils::LogContext().With("cause", loaded.error().cause()));
            return 1;
        }
        config = loaded.value();
    }
    if (!rootDir.empty()) config.root = rootDir;
    if (createRoot) config.createRoot = true;
    if (!logLevel.empty()) config.logging.level = logLevel;
    if (!logFormat.empty()) config.logging.format = logFormat;
    if (debug) config.logging.level = "debug";

    utils::GetLogger().Initialize(config.logging);

    if (config.root.empty()) {
        utils::GetLogger().Error("No storage root configured, use --root or a configuration file");
        return 1;
    }

    // 2. 打开存储
    auto opened = storage::FileSystemStorageProvider::Open(config.root, config.createRoot);
    if (!opened.ok()) {
        return report("open", opened.error());
    }
    auto provider = opened.value();
    provider->SetDefaultSharedAccessExpiration(config.defaultSharedAccessExpiration);
    utils::GetLogger().Debug("Using storage root", utils::LogContext().With("root", provider->Location()));

    // 3. 执行子命令
    try {
        if (ls->parsed()) {
            auto folderList = provider->ListFolders(path);
            if (!folderList.ok()) return report("ls", folderList.error());
            auto fileList = provider->ListFiles(path);
            if (!fileList.ok()) return report("ls", fileList.error());
            printFolders(folderList.value());
            printFiles(fileList.value());
        } else if (files->parsed()) {
            auto fileList = provider->ListFiles(path);
            if (!fileList.ok()) return report("files", fileList.error());
            printFiles(fileList.value());
        } else if (folders->parsed()) {
            auto folderList = provider->ListFolders(path);
            if (!folderList.ok()) return report("folders", folderList.error());
            printFolders(folderList.value());
        } else if (stat->parsed()) {
            auto file = provider->GetFile(path);
            if (!file.ok()) return report("stat", file.error());
            auto size = file.value()->GetSize();
            if (!size.ok()) return report("stat", size.error());
            auto updated = file.value()->GetLastUpdated();
            if (!updated.ok()) return report("stat", updated.error());
            std::cout << "Path:     " << file.value()->GetPath() << std::endl
                      << "Name:     " << file.value()->GetName() << std::endl
                      << "Type:     " << file.value()->GetFileType() << std::endl
                      << "Size:     " << size.value() << std::endl
                      << "Modified: " << utils::FormatTime(updated.value()) << std::endl;
        } else if (mkdir->parsed()) {
            return report("mkdir", provider->CreateFolder(path));
        } else if (rmdir->parsed()) {
            return report("rmdir", provider->DeleteFolder(path));
        } else if (mvdir->parsed()) {
            return report("mvdir", provider->RenameFolder(path, target));
        } else if (touch->parsed()) {
            auto file = provider->CreateFile(path);
            if (!file.ok()) return report("touch", file.error());
        } else if (replace->parsed()) {
            auto file = provider->CreateOrReplaceFile(path);
            if (!file.ok()) return report("replace", file.error());
        } else if (rm->parsed()) {
            return report("rm", provider->DeleteFile(path));
        } else if (mv->parsed()) {
            return report("mv", provider->RenameFile(path, target));
        } else if (put->parsed()) {
            if (fromFile.empty()) {
                return report("put", provider->SaveStream(path, std::cin));
            }
            std::ifstream input(fromFile, std::ios::binary);
            if (!input.is_open()) {
                return report("put", Error(ErrorCode::NotFound, "Cannot open local file " + fromFile));
            }
            return report("put", provider->SaveStream(path, input));
        } else if (cat->parsed()) {
            auto file = provider->GetFile(path);
            if (!file.ok()) return report("cat", file.error());
            auto stream = file.value()->OpenRead();
            if (!stream.ok()) return report("cat", stream.error());
            std::cout << stream.value()->rdbuf();
            std::cout.flush();
        } else if (exists->parsed()) {
            return provider->FileExists(path) ? 0 : 1;
        } else if (digest->parsed()) {
            auto file = provider->GetFile(path);
            if (!file.ok()) return report("digest", file.error());
            auto stream = file.value()->OpenRead();
            if (!stream.ok()) return report("digest", stream.error());
            auto hash = utils::CalculateStreamSHA256(*stream.value());
            if (!hash.ok()) return report("digest", hash.error());
            std::cout << utils::HexEncode(hash.value()) << "  " << path << std::endl;
        }
    } catch (const std::exception& e) {
        utils::GetLogger().Error("Unexpected error", utils::LogContext().With("error", e.what()));
        return 1;
    }

    return 0;
}
