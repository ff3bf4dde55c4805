#include "vblobs/storage/storage_provider.hpp"
#include "vblobs/utils/logger.hpp"

namespace vblobs {
namespace storage {

bool StorageProvider::TryCreateFolder(const std::string& path) {
    try {
        Error err = CreateFolder(path);
        if (err.hasError()) {
            utils::GetLogger().Debug("TryCreateFolder failed",
                utils::LogContext().With("path", path).With("error", err.describe()));
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        utils::GetLogger().Debug("TryCreateFolder failed",
            utils::LogContext().With("path", path).With("exception", e.what()));
        return false;
    }
}

bool StorageProvider::TrySaveStream(const std::string& path, std::istream& input) {
    try {
        Error err = SaveStream(path, input);
        if (err.hasError()) {
            utils::GetLogger().Debug("TrySaveStream failed",
                utils::LogContext().With("path", path).With("error", err.describe()));
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        utils::GetLogger().Debug("TrySaveStream failed",
            utils::LogContext().With("path", path).With("exception", e.what()));
        return false;
    }
}

Result<StorageFilePtr> StorageProvider::CreateOrReplaceFile(const std::string& path) {
    if (FileExists(path)) {
        Error err = DeleteFile(path);
        if (err.hasError()) {
            return err;
        }
    }
    return CreateFile(path);
}

} // namespace storage
} // namespace vblobs
