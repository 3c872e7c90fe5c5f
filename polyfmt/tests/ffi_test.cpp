//! # Foreign Bridge Unit Tests
//!
//! Artifact lookup and zstd decompression, the CRC32C cache key, and calls
//! through the C ABI into the fixture library built next to the tests.

#include "common/crc32c.hpp"
#include "ffi/foreign_bridge.hpp"
#include "ffi/library_loader.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <thread>
#include <zstd.h>

using namespace polyfmt;
using namespace polyfmt::ffi;
using polyfmt::backend::ErrorKind;
using polyfmt::registry::CapabilityRegistry;
using polyfmt::registry::FileType;
using polyfmt::test::ScopedLogCapture;
using polyfmt::test::TempDir;

namespace {

const fs::path FIXTURE_DIR = POLYFMT_TEST_BACKEND_DIR;

auto compress(std::string_view text) -> std::string {
    std::string out(ZSTD_compressBound(text.size()), '\0');
    size_t written = ZSTD_compress(out.data(), out.size(), text.data(), text.size(), 3);
    EXPECT_FALSE(ZSTD_isError(written));
    out.resize(written);
    return out;
}

auto as_bytes(std::string_view text) -> std::vector<char> {
    return std::vector<char>(text.begin(), text.end());
}

} // namespace

// ============================================================================
// CRC32C
// ============================================================================

class Crc32cTest : public ::testing::Test {};

TEST_F(Crc32cTest, KnownVector) {
    EXPECT_EQ(crc32c("123456789"), 0xE3069283u);
    EXPECT_EQ(crc32c(""), 0u);
}

TEST_F(Crc32cTest, HexKeyCarriesLength) {
    std::string key = crc32c_hex("abc", 3);
    ASSERT_EQ(key.size(), 16u);
    EXPECT_EQ(key.substr(8), "00000003");
    EXPECT_NE(crc32c_hex("abd", 3), key);
}

TEST_F(Crc32cTest, FileHash) {
    TempDir dir("polyfmt_crc");
    auto path = dir.write("data.bin", "123456789");
    EXPECT_EQ(crc32c_file(path.string()), crc32c_hex("123456789", 9));
    EXPECT_EQ(crc32c_file((dir.path() / "missing").string()), "");
}

// ============================================================================
// Files and Decompression
// ============================================================================

class LibraryLoaderTest : public ::testing::Test {};

TEST_F(LibraryLoaderTest, ReadFileBytes) {
    TempDir dir("polyfmt_loader");
    auto path = dir.write("blob", std::string_view("a\0b", 3));

    auto bytes = read_file_bytes(path);
    ASSERT_TRUE(is_ok(bytes));
    EXPECT_EQ(unwrap(bytes), as_bytes(std::string_view("a\0b", 3)));
    EXPECT_TRUE(is_err(read_file_bytes(dir.path() / "missing")));
}

TEST_F(LibraryLoaderTest, DecompressZstd) {
    std::string payload(10000, 'x');
    payload += "tail";
    auto result = decompress_zstd(as_bytes(compress(payload)));
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
    EXPECT_EQ(std::string(unwrap(result).begin(), unwrap(result).end()), payload);
}

TEST_F(LibraryLoaderTest, DecompressRejectsGarbage) {
    auto result = decompress_zstd(as_bytes("definitely not zstd"));
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("zstd"), std::string::npos);
}

TEST_F(LibraryLoaderTest, SearchOrder) {
    setenv(BACKEND_DIR_ENV, "/opt/polyfmt-env", 1);
    auto dirs = backend_search_dirs({"/first", "/second"});
    unsetenv(BACKEND_DIR_ENV);

    ASSERT_GE(dirs.size(), 5u);
    EXPECT_EQ(dirs[0], fs::path("/first"));
    EXPECT_EQ(dirs[1], fs::path("/second"));
    EXPECT_EQ(dirs[2], fs::path("/opt/polyfmt-env"));
    EXPECT_EQ(dirs[3], exe_dir() / "backends");
}

TEST_F(LibraryLoaderTest, MissingLibraryListsSearchedPaths) {
    TempDir dir("polyfmt_loader");
    LibraryLoader loader({dir.path()});
    auto result = loader.load("nope");
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("libnope.so"), std::string::npos);
    EXPECT_NE(unwrap_err(result).find(dir.path().string()), std::string::npos);
}

TEST_F(LibraryLoaderTest, LoadsFixtureOnce) {
    LibraryLoader loader({FIXTURE_DIR});
    auto first = loader.load("goffi");
    ASSERT_TRUE(is_ok(first)) << unwrap_err(first);
    auto second = loader.load("goffi");
    ASSERT_TRUE(is_ok(second));
    EXPECT_EQ(unwrap(first), unwrap(second));

    EXPECT_NE(LibraryLoader::symbol(unwrap(first), "FormatShell"), nullptr);
    EXPECT_EQ(LibraryLoader::symbol(unwrap(first), "FormatCobol"), nullptr);
}

TEST_F(LibraryLoaderTest, CompressedLibraryIsCached) {
    auto raw = read_file_bytes(FIXTURE_DIR / "libgoffi.so");
    ASSERT_TRUE(is_ok(raw));
    TempDir dir("polyfmt_loader");
    dir.write("libzgoffi.so.zst",
              compress(std::string_view(unwrap(raw).data(), unwrap(raw).size())));

    LibraryLoader loader({dir.path()});
    auto handle = loader.load("zgoffi");
    ASSERT_TRUE(is_ok(handle)) << unwrap_err(handle);
    EXPECT_NE(LibraryLoader::symbol(unwrap(handle), "FreeString"), nullptr);

    fs::path cached = loader.cache_dir() / "libzgoffi.so";
    fs::path hash = cached;
    hash += ".hash";
    EXPECT_TRUE(fs::exists(cached));
    EXPECT_TRUE(fs::exists(hash));
}

// ============================================================================
// Foreign Bridge
// ============================================================================

class ForeignBridgeTest : public ::testing::Test {
protected:
    using LiveBuffersFn = long (*)();

    void SetUp() override {
        auto handle = fixture_loader_.load("goffi");
        ASSERT_TRUE(is_ok(handle)) << unwrap_err(handle);
        live_buffers_ = reinterpret_cast<LiveBuffersFn>(
            LibraryLoader::symbol(unwrap(handle), "FixtureLiveBuffers"));
        ASSERT_NE(live_buffers_, nullptr);
        baseline_ = live_buffers_();
    }

    auto entry_for(FileType type) const -> registry::CapabilityEntry {
        return *CapabilityRegistry::global().lookup(type);
    }

    auto native_for(const registry::CapabilityEntry& entry) const -> config::NativeConfig {
        return config::translate(config, entry);
    }

    config::FormatConfig config;
    LibraryLoader fixture_loader_{std::vector<fs::path>{FIXTURE_DIR}};
    LiveBuffersFn live_buffers_ = nullptr;
    long baseline_ = 0;
};

TEST_F(ForeignBridgeTest, FormatsShellWithTabs) {
    ForeignBridge bridge({FIXTURE_DIR});
    auto entry = entry_for(FileType::Shell);

    auto result = bridge.format(entry, "echo hi   \nif true; then\n\techo x\nfi\n",
                                native_for(entry));
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_EQ(unwrap(result), "echo hi\nif true; then\n\techo x\nfi\n");
    EXPECT_EQ(live_buffers_(), baseline_);
}

TEST_F(ForeignBridgeTest, ShellIndentFollowsConfig) {
    ForeignBridge bridge({FIXTURE_DIR});
    auto entry = entry_for(FileType::Shell);
    config.indent_style = config::IndentStyle::Spaces;
    config.indent_width = 2;

    auto result = bridge.format(entry, "if true; then\n\t\techo x\nfi\n", native_for(entry));
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), "if true; then\n    echo x\nfi\n");
}

TEST_F(ForeignBridgeTest, FixedStyleIgnoresIndent) {
    ForeignBridge bridge({FIXTURE_DIR});
    auto entry = entry_for(FileType::Go);
    config.indent_style = config::IndentStyle::Spaces;

    auto result = bridge.format(entry, "func main() {\n\tx := 1  \n}\n", native_for(entry));
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), "func main() {\n\tx := 1\n}\n");
}

TEST_F(ForeignBridgeTest, InvalidInputComesBackUnchanged) {
    ForeignBridge bridge({FIXTURE_DIR});
    auto entry = entry_for(FileType::Shell);
    const std::string source = "echo 'unterminated   \n";

    auto result = bridge.format(entry, source, native_for(entry));
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), source);
    EXPECT_EQ(live_buffers_(), baseline_);
}

TEST_F(ForeignBridgeTest, NullResultIsContractViolation) {
    ForeignBridge bridge({FIXTURE_DIR});
    auto entry = entry_for(FileType::Proto);

    auto result = bridge.format(entry, "#!null-result\n", native_for(entry));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ContractViolation);
    EXPECT_NE(unwrap_err(result).message.find("FormatProto"), std::string::npos);
}

TEST_F(ForeignBridgeTest, EmptyInput) {
    ForeignBridge bridge({FIXTURE_DIR});
    auto entry = entry_for(FileType::Go);
    auto result = bridge.format(entry, "", native_for(entry));
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), "");
}

TEST_F(ForeignBridgeTest, BatchMatchesSingleCalls) {
    ForeignBridge bridge({FIXTURE_DIR});
    auto entry = entry_for(FileType::Shell);
    auto native = native_for(entry);
    std::vector<std::string_view> texts = {
        "echo a  \n",
        "if x; then\n\ty\nfi   \n",
        "echo \"open\n",
        "",
    };

    auto batch = bridge.format_batch(entry, texts, native);
    ASSERT_TRUE(is_ok(batch));
    const auto& results = unwrap(batch);
    ASSERT_EQ(results.size(), texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        auto single = bridge.format(entry, texts[i], native);
        ASSERT_TRUE(is_ok(single));
        ASSERT_TRUE(is_ok(results[i]));
        EXPECT_EQ(unwrap(results[i]), unwrap(single)) << "element " << i;
    }
    EXPECT_EQ(live_buffers_(), baseline_);
}

TEST_F(ForeignBridgeTest, BatchNullElementFailsAlone) {
    ForeignBridge bridge({FIXTURE_DIR});
    auto entry = entry_for(FileType::Go);
    std::vector<std::string_view> texts = {"package a  \n", "#!null-result", "package b\n"};

    auto batch = bridge.format_batch(entry, texts, native_for(entry));
    ASSERT_TRUE(is_ok(batch));
    const auto& results = unwrap(batch);
    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(is_ok(results[0]));
    ASSERT_TRUE(is_err(results[1]));
    EXPECT_EQ(unwrap_err(results[1]).kind, ErrorKind::ContractViolation);
    EXPECT_TRUE(is_ok(results[2]));
    EXPECT_EQ(live_buffers_(), baseline_);
}

TEST_F(ForeignBridgeTest, EmptyBatch) {
    ForeignBridge bridge({FIXTURE_DIR});
    auto entry = entry_for(FileType::Go);
    auto batch = bridge.format_batch(entry, {}, native_for(entry));
    ASSERT_TRUE(is_ok(batch));
    EXPECT_TRUE(unwrap(batch).empty());
}

TEST_F(ForeignBridgeTest, ConcurrentCallsReleaseEverything) {
    ForeignBridge bridge({FIXTURE_DIR});
    auto entry = entry_for(FileType::Shell);
    auto native = native_for(entry);

    std::vector<std::thread> workers;
    std::atomic<int> failures{0};
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                auto result = bridge.format(entry, "echo x \n", native);
                if (is_err(result) || unwrap(result) != "echo x\n") {
                    failures++;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(live_buffers_(), baseline_);
}

TEST_F(ForeignBridgeTest, MissingLibraryIsUnavailableAndWarnsOnce) {
    ScopedLogCapture capture;
    TempDir empty("polyfmt_bridge");
    unsetenv(BACKEND_DIR_ENV);
    ForeignBridge bridge({empty.path()});
    auto entry = entry_for(FileType::Shell);

    EXPECT_FALSE(bridge.is_available("goffi"));
    for (int i = 0; i < 3; ++i) {
        auto result = bridge.format(entry, "echo hi\n", native_for(entry));
        ASSERT_TRUE(is_err(result));
        EXPECT_EQ(unwrap_err(result).kind, ErrorKind::BackendUnavailable);
    }
    EXPECT_EQ(capture.sink().count(log::LogLevel::Warn, "ffi", "goffi"), 1u);
}
