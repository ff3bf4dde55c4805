#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <random>
#include <sstream>
#include <streambuf>
#include <system_error>
#include "vblobs/storage/filesystem_provider.hpp"
#include "vblobs/utils/tools.hpp"
#include "test_helpers.hpp"

using namespace vblobs;
using namespace vblobs::storage;
namespace fs = std::filesystem;

namespace {

std::vector<std::string> names(const std::vector<StorageFilePtr>& files) {
    std::vector<std::string> out;
    for (const auto& f : files) out.push_back(f->GetPath());
    return out;
}

std::vector<std::string> names(const std::vector<StorageFolderPtr>& folders) {
    std::vector<std::string> out;
    for (const auto& f : folders) out.push_back(f->GetPath());
    return out;
}

// 输入流先提供available个字节, 之后读取失败
class FailingBuffer : public std::streambuf {
public:
    explicit FailingBuffer(std::size_t available = 0) : data_(available, 'x') {
        setg(&data_[0], &data_[0], &data_[0] + data_.size());
    }

protected:
    int_type underflow() override { throw std::ios_base::failure("device error"); }

private:
    std::string data_;
};

} // namespace

TEST_CASE("FileSystemStorageProvider - Open", "[provider]") {
    test::TempRoot root;

    SECTION("Existing root") {
        auto provider = FileSystemStorageProvider::Open(root.str());
        REQUIRE(provider.ok());
        REQUIRE(provider.value()->Location() == fs::absolute(root.path()).string());
    }

    SECTION("Missing root") {
        auto provider = FileSystemStorageProvider::Open((root.path() / "missing").string());
        REQUIRE_FALSE(provider.ok());
        REQUIRE(provider.error().is(ErrorCode::NotFound));
    }

    SECTION("Missing root created on request") {
        auto provider = FileSystemStorageProvider::Open((root.path() / "created").string(), true);
        REQUIRE(provider.ok());
        REQUIRE(fs::is_directory(root.path() / "created"));
    }

    SECTION("Root that is a file") {
        test::writeFile(root.path() / "plain", "x");
        auto provider = FileSystemStorageProvider::Open((root.path() / "plain").string());
        REQUIRE_FALSE(provider.ok());
        REQUIRE(provider.error().is(ErrorCode::InvalidOperation));
    }

    SECTION("Empty root") {
        auto provider = FileSystemStorageProvider::Open("");
        REQUIRE_FALSE(provider.ok());
        REQUIRE(provider.error().is(ErrorCode::InvalidPath));
    }
}

TEST_CASE("FileSystemStorageProvider - folders", "[provider][folders]") {
    test::TempRoot root;
    FileSystemStorageProvider provider(root.str());

    SECTION("Create, list and delete a nested folder") {
        REQUIRE(provider.CreateFolder("a/b").ok());
        REQUIRE(fs::is_directory(root.path() / "a" / "b"));

        auto folders = provider.ListFolders("a");
        REQUIRE(folders.ok());
        REQUIRE(folders.value().size() == 1);
        REQUIRE(folders.value()[0]->GetName() == "b");
        REQUIRE(folders.value()[0]->GetPath() == "a/b");

        REQUIRE(provider.DeleteFolder("a").ok());
        REQUIRE_FALSE(fs::exists(root.path() / "a"));

        // 列出不存在的目录会重新创建该目录
        auto again = provider.ListFolders("a");
        REQUIRE(again.ok());
        REQUIRE(again.value().empty());
        REQUIRE(fs::is_directory(root.path() / "a"));
    }

    SECTION("Create folder twice") {
        REQUIRE(provider.CreateFolder("dup").ok());
        auto err = provider.CreateFolder("dup");
        REQUIRE(err.is(ErrorCode::AlreadyExists));
    }

    SECTION("Delete missing folder") {
        REQUIRE(provider.DeleteFolder("nope").is(ErrorCode::NotFound));
    }

    SECTION("Deleting the root is refused") {
        auto err = provider.DeleteFolder("");
        REQUIRE(err.is(ErrorCode::InvalidOperation));
        REQUIRE(fs::is_directory(root.path()));
    }

    SECTION("Rename folder") {
        REQUIRE(provider.CreateFolder("old/inner").ok());
        REQUIRE(provider.RenameFolder("old", "new").ok());
        REQUIRE(fs::is_directory(root.path() / "new" / "inner"));
        REQUIRE_FALSE(fs::exists(root.path() / "old"));
    }

    SECTION("Rename folder errors") {
        REQUIRE(provider.RenameFolder("missing", "x").is(ErrorCode::NotFound));
        REQUIRE(provider.CreateFolder("one").ok());
        REQUIRE(provider.CreateFolder("two").ok());
        REQUIRE(provider.RenameFolder("one", "two").is(ErrorCode::AlreadyExists));
        REQUIRE(fs::is_directory(root.path() / "one"));
        REQUIRE(provider.RenameFolder("one", "../outside").is(ErrorCode::InvalidPath));
        REQUIRE(fs::is_directory(root.path() / "one"));
    }

    SECTION("List folders only returns directories, sorted") {
        REQUIRE(provider.CreateFolder("p/zeta").ok());
        REQUIRE(provider.CreateFolder("p/alpha").ok());
        test::writeFile(root.path() / "p" / "file.txt", "data");

        auto first = provider.ListFolders("p");
        auto second = provider.ListFolders("p");
        REQUIRE(first.ok());
        REQUIRE(second.ok());
        REQUIRE(names(first.value()) == std::vector<std::string>{"p/alpha", "p/zeta"});
        REQUIRE(names(first.value()) == names(second.value()));
    }

    SECTION("List folders on a file path fails") {
        test::writeFile(root.path() / "blocker", "x");
        auto folders = provider.ListFolders("blocker");
        REQUIRE_FALSE(folders.ok());
        REQUIRE(folders.error().is(ErrorCode::InvalidOperation));
    }

    SECTION("TryCreateFolder") {
        REQUIRE(provider.TryCreateFolder("fresh"));
        REQUIRE_FALSE(provider.TryCreateFolder("fresh"));
        REQUIRE_FALSE(provider.TryCreateFolder("../../etc"));
        REQUIRE_FALSE(provider.TryCreateFolder("../escaped"));
        REQUIRE_FALSE(fs::exists(root.path().parent_path() / "escaped"));
    }
}

TEST_CASE("FileSystemStorageProvider - files", "[provider][files]") {
    test::TempRoot root;
    FileSystemStorageProvider provider(root.str());

    SECTION("Create then exists then delete") {
        auto file = provider.CreateFile("docs/readme.md");
        REQUIRE(file.ok());
        REQUIRE(file.value()->GetPath() == "docs/readme.md");
        REQUIRE(file.value()->GetName() == "readme.md");
        REQUIRE(file.value()->GetSize().value() == 0);
        REQUIRE(provider.FileExists("docs/readme.md"));

        REQUIRE(provider.DeleteFile("docs/readme.md").ok());
        REQUIRE_FALSE(provider.FileExists("docs/readme.md"));
    }

    SECTION("Create existing file fails") {
        REQUIRE(provider.CreateFile("a.txt").ok());
        auto again = provider.CreateFile("a.txt");
        REQUIRE_FALSE(again.ok());
        REQUIRE(again.error().is(ErrorCode::AlreadyExists));
    }

    SECTION("Get file") {
        test::writeFile(root.path() / "x" / "y.bin", "12345");
        auto file = provider.GetFile("x/y.bin");
        REQUIRE(file.ok());
        REQUIRE(file.value()->GetSize().value() == 5);
        REQUIRE(file.value()->GetFileType() == ".bin");

        auto missing = provider.GetFile("x/none.bin");
        REQUIRE(missing.error().is(ErrorCode::NotFound));

        // 目录不是文件
        REQUIRE(provider.GetFile("x").error().is(ErrorCode::NotFound));
    }

    SECTION("List files") {
        test::writeFile(root.path() / "d" / "b.txt", "b");
        test::writeFile(root.path() / "d" / "a.txt", "a");
        fs::create_directories(root.path() / "d" / "sub");

        auto files = provider.ListFiles("d");
        REQUIRE(files.ok());
        REQUIRE(names(files.value()) == std::vector<std::string>{"d/a.txt", "d/b.txt"});

        auto rootFiles = provider.ListFiles("");
        REQUIRE(rootFiles.ok());
        REQUIRE(rootFiles.value().empty());

        auto missing = provider.ListFiles("absent");
        REQUIRE(missing.ok());
        REQUIRE(missing.value().empty());
        REQUIRE_FALSE(fs::exists(root.path() / "absent"));
    }

    SECTION("Rename file") {
        test::writeFile(root.path() / "a", "content-a");
        REQUIRE(provider.RenameFile("a", "b").ok());
        REQUIRE(test::readFile(root.path() / "b") == "content-a");
        REQUIRE_FALSE(provider.FileExists("a"));
    }

    SECTION("Rename onto an existing file leaves both unchanged") {
        test::writeFile(root.path() / "a", "content-a");
        test::writeFile(root.path() / "b", "content-b");
        auto err = provider.RenameFile("a", "b");
        REQUIRE(err.is(ErrorCode::AlreadyExists));
        REQUIRE(test::readFile(root.path() / "a") == "content-a");
        REQUIRE(test::readFile(root.path() / "b") == "content-b");
    }

    SECTION("Rename missing file") {
        REQUIRE(provider.RenameFile("ghost", "b").is(ErrorCode::NotFound));
    }

    SECTION("Delete missing file") {
        REQUIRE(provider.DeleteFile("ghost").is(ErrorCode::NotFound));
    }

    SECTION("CreateOrReplaceFile truncates existing content") {
        test::writeFile(root.path() / "r.txt", "old content");
        auto file = provider.CreateOrReplaceFile("r.txt");
        REQUIRE(file.ok());
        REQUIRE(fs::file_size(root.path() / "r.txt") == 0);

        auto fresh = provider.CreateOrReplaceFile("new/r.txt");
        REQUIRE(fresh.ok());
        REQUIRE(provider.FileExists("new/r.txt"));
    }

    SECTION("FileExists never fails") {
        REQUIRE_FALSE(provider.FileExists("../../etc/passwd"));
        REQUIRE_FALSE(provider.FileExists(""));
        REQUIRE_FALSE(provider.FileExists(std::string("a") + '\0'));
    }

    SECTION("Traversal attempts are rejected without side effects") {
        REQUIRE(provider.CreateFile("../evil.txt").error().is(ErrorCode::InvalidPath));
        REQUIRE_FALSE(fs::exists(root.path().parent_path() / "evil.txt"));
        REQUIRE(provider.CreateFolder("a/../../evil").is(ErrorCode::InvalidPath));
        REQUIRE(provider.DeleteFile("../x").is(ErrorCode::InvalidPath));
        REQUIRE(provider.DeleteFolder("..").is(ErrorCode::InvalidPath));
        REQUIRE(provider.ListFiles("../").error().is(ErrorCode::InvalidPath));
        REQUIRE(provider.ListFolders("../new").error().is(ErrorCode::InvalidPath));
        REQUIRE(provider.GetFile("/etc/hosts").error().is(ErrorCode::InvalidPath));
        REQUIRE_FALSE(fs::exists(root.path().parent_path() / "new"));
    }
}

TEST_CASE("FileSystemStorageProvider - save stream", "[provider][stream]") {
    test::TempRoot root;
    FileSystemStorageProvider provider(root.str());

    SECTION("Payload larger than the copy buffer is stored byte for byte") {
        std::mt19937 gen(42);
        std::uniform_int_distribution<int> dist(0, 255);
        std::vector<uint8_t> payload(1024 * 1024 + 17);
        std::generate(payload.begin(), payload.end(), [&]() { return static_cast<uint8_t>(dist(gen)); });
        REQUIRE(payload.size() > COPY_BUFFER_SIZE);

        std::istringstream input(std::string(payload.begin(), payload.end()));
        REQUIRE(provider.SaveStream("blobs/big.bin", input).ok());

        auto file = provider.GetFile("blobs/big.bin");
        REQUIRE(file.ok());
        REQUIRE(file.value()->GetSize().value() == payload.size());

        auto stream = file.value()->OpenRead();
        REQUIRE(stream.ok());
        auto stored = utils::CalculateStreamSHA256(*stream.value());
        auto expected = utils::CalculateSHA256Hash(payload);
        REQUIRE(stored.ok());
        REQUIRE(expected.ok());
        REQUIRE(stored.value() == expected.value());
    }

    SECTION("Empty stream creates an empty file") {
        std::istringstream input("");
        REQUIRE(provider.SaveStream("empty.bin", input).ok());
        REQUIRE(fs::file_size(root.path() / "empty.bin") == 0);
    }

    SECTION("Saving onto an existing file fails") {
        test::writeFile(root.path() / "taken.txt", "keep me");
        std::istringstream input("other");
        auto err = provider.SaveStream("taken.txt", input);
        REQUIRE(err.is(ErrorCode::AlreadyExists));
        REQUIRE(test::readFile(root.path() / "taken.txt") == "keep me");
        // 输入流未被读取
        REQUIRE(input.tellg() == 0);
    }

    SECTION("TrySaveStream swallows every error") {
        std::istringstream ok("hello");
        REQUIRE(provider.TrySaveStream("greeting.txt", ok));
        REQUIRE(test::readFile(root.path() / "greeting.txt") == "hello");

        std::istringstream again("hello");
        REQUIRE_FALSE(provider.TrySaveStream("greeting.txt", again));

        std::istringstream escape("x");
        REQUIRE_FALSE(provider.TrySaveStream("../escape.txt", escape));
        REQUIRE_FALSE(fs::exists(root.path().parent_path() / "escape.txt"));
    }

    SECTION("Read failure in the middle of a copy") {
        FailingBuffer buffer;
        std::istream input(&buffer);
        input.exceptions(std::ios::badbit);
        REQUIRE_FALSE(provider.TrySaveStream("broken.bin", input));
    }

    SECTION("Read failure after the first chunk is returned as an error") {
        FailingBuffer buffer(COPY_BUFFER_SIZE + 1808);
        std::istream input(&buffer);
        input.exceptions(std::ios::badbit);
        Error err;
        REQUIRE_NOTHROW(err = provider.SaveStream("partial.bin", input));
        REQUIRE(err.is(ErrorCode::InvalidOperation));
        REQUIRE(err.cause().find("read from input stream failed") != std::string::npos);
    }

    SECTION("Read failure without an exception mask") {
        FailingBuffer buffer(COPY_BUFFER_SIZE + 1808);
        std::istream input(&buffer);
        Error err = provider.SaveStream("partial.bin", input);
        REQUIRE(err.is(ErrorCode::InvalidOperation));
    }
}

TEST_CASE("FileSystemStorageProvider - symlinks leading outside the root", "[provider][symlink]") {
    test::TempRoot root;
    test::TempRoot outside("vblobs_outside");
    FileSystemStorageProvider provider(root.str());

    test::writeFile(outside.path() / "secret.txt", "top secret payload");
    test::writeFile(root.path() / "plain.txt", "abc");
    test::writeFile(root.path() / "docs" / "a.txt", "123");

    std::error_code ec;
    fs::create_symlink(outside.path() / "secret.txt", root.path() / "leak.txt", ec);
    REQUIRE_FALSE(ec);
    fs::create_directory_symlink(outside.path(), root.path() / "elsewhere", ec);
    REQUIRE_FALSE(ec);
    fs::create_symlink(outside.path() / "secret.txt", root.path() / "docs" / "leak.txt", ec);
    REQUIRE_FALSE(ec);

    SECTION("Listings skip them") {
        auto files = provider.ListFiles("");
        REQUIRE(files.ok());
        REQUIRE(names(files.value()) == std::vector<std::string>{"plain.txt"});

        auto docs = provider.ListFiles("docs");
        REQUIRE(docs.ok());
        REQUIRE(names(docs.value()) == std::vector<std::string>{"docs/a.txt"});

        auto folders = provider.ListFolders("");
        REQUIRE(folders.ok());
        REQUIRE(names(folders.value()) == std::vector<std::string>{"docs"});
    }

    SECTION("Direct access is rejected") {
        REQUIRE(provider.GetFile("leak.txt").error().is(ErrorCode::InvalidPath));
        REQUIRE(provider.ListFiles("elsewhere").error().is(ErrorCode::InvalidPath));
        REQUIRE_FALSE(provider.FileExists("leak.txt"));
    }

    SECTION("Folder size does not count their targets") {
        auto folders = provider.ListFolders("");
        REQUIRE(folders.ok());
        REQUIRE(folders.value().size() == 1);
        REQUIRE(folders.value()[0]->GetSize().value() == 3);
    }
}

TEST_CASE("FileSystemStorageProvider - shared access expiration", "[provider]") {
    test::TempRoot root;
    FileSystemStorageProvider provider(root.str());

    REQUIRE_FALSE(provider.DefaultSharedAccessExpiration().has_value());
    auto when = std::chrono::system_clock::now() + std::chrono::hours(24);
    provider.SetDefaultSharedAccessExpiration(when);
    REQUIRE(provider.DefaultSharedAccessExpiration() == when);
    provider.SetDefaultSharedAccessExpiration(std::nullopt);
    REQUIRE_FALSE(provider.DefaultSharedAccessExpiration().has_value());
}
