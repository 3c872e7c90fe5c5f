//! # Registry Unit Tests
//!
//! File type detection and the capability routing table.

#include "registry/capability.hpp"
#include "registry/file_type.hpp"

#include <gtest/gtest.h>
#include <set>

using namespace polyfmt::registry;
using polyfmt::config::FormatOption;

// ============================================================================
// File Type Detection
// ============================================================================

class FileTypeTest : public ::testing::Test {};

TEST_F(FileTypeTest, ScriptExtensions) {
    EXPECT_EQ(detect_file_type("src/app.js"), FileType::JavaScript);
    EXPECT_EQ(detect_file_type("src/app.mjs"), FileType::JavaScript);
    EXPECT_EQ(detect_file_type("src/app.ts"), FileType::TypeScript);
    EXPECT_EQ(detect_file_type("view.jsx"), FileType::Jsx);
    EXPECT_EQ(detect_file_type("view.tsx"), FileType::Tsx);
}

TEST_F(FileTypeTest, ForeignAndSandboxExtensions) {
    EXPECT_EQ(detect_file_type("build.sh"), FileType::Shell);
    EXPECT_EQ(detect_file_type("deploy.zsh"), FileType::Shell);
    EXPECT_EQ(detect_file_type("main.go"), FileType::Go);
    EXPECT_EQ(detect_file_type("api/v1/service.proto"), FileType::Proto);
    EXPECT_EQ(detect_file_type("lib.c"), FileType::C);
    EXPECT_EQ(detect_file_type("lib.h"), FileType::C);
    EXPECT_EQ(detect_file_type("lib.cpp"), FileType::Cpp);
    EXPECT_EQ(detect_file_type("lib.hpp"), FileType::Cpp);
    EXPECT_EQ(detect_file_type("Program.cs"), FileType::CSharp);
    EXPECT_EQ(detect_file_type("View.m"), FileType::ObjectiveC);
    EXPECT_EQ(detect_file_type("Main.java"), FileType::Java);
}

TEST_F(FileTypeTest, SpecialFileNames) {
    EXPECT_EQ(detect_file_type("docker/Dockerfile"), FileType::Dockerfile);
    EXPECT_EQ(detect_file_type("Rakefile"), FileType::Ruby);
    EXPECT_EQ(detect_file_type("app.dockerfile"), FileType::Dockerfile);
}

TEST_F(FileTypeTest, UnrecognizedPaths) {
    EXPECT_EQ(detect_file_type("README"), FileType::Unknown);
    EXPECT_EQ(detect_file_type(".bashrc"), FileType::Unknown);
    EXPECT_EQ(detect_file_type("archive.tar.xyz"), FileType::Unknown);
    EXPECT_EQ(detect_file_type("trailing."), FileType::Unknown);
    EXPECT_EQ(detect_file_type(""), FileType::Unknown);
}

TEST_F(FileTypeTest, DirectoryDotsDoNotCount) {
    EXPECT_EQ(detect_file_type("dir.js/Makefile"), FileType::Unknown);
    EXPECT_EQ(detect_file_type("v1.2/config.json"), FileType::Json);
}

TEST_F(FileTypeTest, NamesAreDistinct) {
    std::set<std::string_view> names;
    for (size_t i = 0; i < FILE_TYPE_COUNT; ++i) {
        names.insert(file_type_name(static_cast<FileType>(i)));
    }
    EXPECT_EQ(names.size(), FILE_TYPE_COUNT);
}

// ============================================================================
// Capability Registry
// ============================================================================

class CapabilityTest : public ::testing::Test {
protected:
    CapabilityRegistry registry;
};

TEST_F(CapabilityTest, NoFileTypeIsRoutedTwice) {
    std::set<FileType> seen;
    for (const CapabilityEntry& entry : registry.entries()) {
        EXPECT_TRUE(seen.insert(entry.file_type).second) << file_type_name(entry.file_type);
    }
    EXPECT_EQ(seen.size(), registry.entries().size());
}

TEST_F(CapabilityTest, ScriptTypesRouteInProcess) {
    for (FileType type :
         {FileType::JavaScript, FileType::TypeScript, FileType::Jsx, FileType::Tsx}) {
        auto entry = registry.lookup(type);
        ASSERT_TRUE(entry.has_value());
        EXPECT_EQ(entry->backend, BackendId::Script);
        EXPECT_EQ(entry->kind, BackendKind::InProcess);
        EXPECT_TRUE(entry->supported.contains(FormatOption::QuoteStyle));
        EXPECT_FALSE(entry->supported.contains(FormatOption::LineWidth));
    }
}

TEST_F(CapabilityTest, JsonTypesRouteInProcess) {
    auto json = registry.lookup(FileType::Json);
    auto jsonc = registry.lookup(FileType::Jsonc);
    ASSERT_TRUE(json.has_value());
    ASSERT_TRUE(jsonc.has_value());
    EXPECT_EQ(json->backend, BackendId::Json);
    EXPECT_EQ(jsonc->backend, BackendId::Json);
    EXPECT_TRUE(json->supported.contains(FormatOption::IndentWidth));
    EXPECT_FALSE(json->supported.contains(FormatOption::TrailingComma));
}

TEST_F(CapabilityTest, ForeignEntriesNameTheirSymbols) {
    auto shell = registry.lookup(FileType::Shell);
    ASSERT_TRUE(shell.has_value());
    EXPECT_EQ(shell->kind, BackendKind::Foreign);
    EXPECT_EQ(shell->artifact, "goffi");
    EXPECT_EQ(shell->format_symbol, "FormatShell");
    EXPECT_EQ(shell->batch_symbol, "FormatShellBatch");
    EXPECT_EQ(shell->supported.size(), 2u);

    auto go = registry.lookup(FileType::Go);
    ASSERT_TRUE(go.has_value());
    EXPECT_EQ(go->format_symbol, "FormatGo");
    EXPECT_TRUE(go->supported.empty());

    auto proto = registry.lookup(FileType::Proto);
    ASSERT_TRUE(proto.has_value());
    EXPECT_EQ(proto->batch_symbol, "FormatProtoBatch");
}

TEST_F(CapabilityTest, CFamilyRoutesToSandbox) {
    for (FileType type : {FileType::C, FileType::Cpp, FileType::CSharp, FileType::ObjectiveC,
                          FileType::Java}) {
        auto entry = registry.lookup(type);
        ASSERT_TRUE(entry.has_value());
        EXPECT_EQ(entry->backend, BackendId::ClangFormat);
        EXPECT_EQ(entry->kind, BackendKind::Sandbox);
        EXPECT_EQ(entry->artifact, "clang-format");
        EXPECT_TRUE(entry->supported.contains(FormatOption::LineWidth));
        EXPECT_TRUE(entry->supported.contains(FormatOption::BraceStyle));
    }
}

TEST_F(CapabilityTest, UnsupportedTypesHaveNoEntry) {
    EXPECT_FALSE(registry.lookup(FileType::Unknown).has_value());
    EXPECT_FALSE(registry.lookup(FileType::Css).has_value());
    EXPECT_FALSE(registry.lookup(FileType::Rust).has_value());
    EXPECT_FALSE(registry.lookup(FileType::Dockerfile).has_value());
}

TEST_F(CapabilityTest, GlobalMatchesFreshRegistry) {
    const CapabilityRegistry& global = CapabilityRegistry::global();
    EXPECT_EQ(global.entries().size(), registry.entries().size());
    EXPECT_EQ(&CapabilityRegistry::global(), &global);
}

TEST_F(CapabilityTest, DisplayNames) {
    EXPECT_EQ(CapabilityRegistry::backend_name(BackendId::Goffi), "goffi");
    EXPECT_EQ(CapabilityRegistry::backend_name(BackendId::ClangFormat), "clang-format");
    EXPECT_EQ(CapabilityRegistry::kind_name(BackendKind::Sandbox), "sandbox");
}
