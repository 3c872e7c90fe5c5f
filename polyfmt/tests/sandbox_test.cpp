//! # Sandbox Host Unit Tests
//!
//! Drives the protocol fixture module through the instance pool: style
//! caching, status codes, trap recovery and buffer accounting.

#include "sandbox/sandbox_host.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace polyfmt;
using namespace polyfmt::sandbox;
using polyfmt::backend::ErrorKind;
using polyfmt::test::ScopedLogCapture;
using polyfmt::test::TempDir;

namespace {

const fs::path FIXTURE_DIR = POLYFMT_TEST_BACKEND_DIR;
constexpr const char* MODULE = "clang-format";
const std::string LLVM_STYLE = "{BasedOnStyle: LLVM}";
const std::string GOOGLE_STYLE = "{BasedOnStyle: Google}";

} // namespace

class SandboxHostTest : public ::testing::Test {
protected:
    SandboxHost host{MODULE, 1, {FIXTURE_DIR}};
};

TEST_F(SandboxHostTest, LoadsTextModule) {
    auto bytes = load_module_bytes(MODULE, {FIXTURE_DIR});
    ASSERT_TRUE(is_ok(bytes)) << unwrap_err(bytes);
    const auto& wasm = unwrap(bytes);
    ASSERT_GE(wasm.size(), 4u);
    EXPECT_EQ(wasm[0], 0x00);
    EXPECT_EQ(wasm[1], 'a');
    EXPECT_EQ(wasm[2], 's');
    EXPECT_EQ(wasm[3], 'm');
}

TEST_F(SandboxHostTest, FormatsText) {
    ASSERT_TRUE(host.is_available());
    auto result = host.format("int x;  \nint y;\t\n", "a.cpp", LLVM_STYLE);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_EQ(unwrap(result), "int x;\nint y;\n");

    SandboxStats stats = host.stats();
    EXPECT_EQ(stats.instantiations, 1u);
    EXPECT_EQ(stats.style_writes, 1u);
    EXPECT_EQ(stats.traps, 0u);
}

TEST_F(SandboxHostTest, UnchangedStatusReturnsInput) {
    const std::string source = "int main() {}\n";
    auto result = host.format(source, "main.c", LLVM_STYLE);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), source);
}

TEST_F(SandboxHostTest, StyleWrittenOncePerChange) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(is_ok(host.format("a;  \n", "a.c", LLVM_STYLE)));
    }
    EXPECT_EQ(host.stats().style_writes, 1u);

    ASSERT_TRUE(is_ok(host.format("a;  \n", "a.c", GOOGLE_STYLE)));
    EXPECT_EQ(host.stats().style_writes, 2u);
    EXPECT_EQ(host.stats().instantiations, 1u);
}

TEST_F(SandboxHostTest, EveryAllocationIsFreed) {
    ASSERT_TRUE(is_ok(host.format("x  \n", "x.c", LLVM_STYLE)));
    ASSERT_TRUE(is_ok(host.format("x\n", "x.c", LLVM_STYLE)));
    ASSERT_TRUE(is_err(host.format("?broken", "x.c", LLVM_STYLE)));
    ASSERT_TRUE(is_ok(host.format("", "", LLVM_STYLE)));

    SandboxStats stats = host.stats();
    EXPECT_GT(stats.allocs, 0u);
    EXPECT_EQ(stats.allocs, stats.frees);
}

TEST_F(SandboxHostTest, ModuleErrorIsParseFailure) {
    auto result = host.format("?not c", "a.c", LLVM_STYLE);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ParseFailure);
    EXPECT_EQ(unwrap_err(result).message, "invalid syntax");
    EXPECT_EQ(host.live_instances(), 1u);
}

TEST_F(SandboxHostTest, TrapDiscardsInstance) {
    auto trapped = host.format("!boom", "a.c", LLVM_STYLE);
    ASSERT_TRUE(is_err(trapped));
    EXPECT_EQ(unwrap_err(trapped).kind, ErrorKind::SandboxTrap);
    EXPECT_EQ(host.stats().traps, 1u);
    EXPECT_EQ(host.live_instances(), 0u);

    auto recovered = host.format("int x; \n", "a.c", LLVM_STYLE);
    ASSERT_TRUE(is_ok(recovered)) << unwrap_err(recovered).to_string();
    EXPECT_EQ(unwrap(recovered), "int x;\n");

    SandboxStats stats = host.stats();
    EXPECT_EQ(stats.instantiations, 2u);
    EXPECT_EQ(stats.style_writes, 2u);
}

TEST_F(SandboxHostTest, RejectedStyleIsContractViolation) {
    auto result = host.format("x\n", "x.c", "");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ContractViolation);

    ASSERT_TRUE(is_ok(host.format("x\n", "x.c", LLVM_STYLE)));
}

TEST_F(SandboxHostTest, PoolBoundsInstances) {
    SandboxHost pooled(MODULE, 2, {FIXTURE_DIR});
    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 25; ++i) {
                auto result = pooled.format("int a;  \n", "a.c", LLVM_STYLE);
                if (is_err(result) || unwrap(result) != "int a;\n") {
                    failures++;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_LE(pooled.stats().instantiations, 2u);
    EXPECT_LE(pooled.live_instances(), 2u);
    EXPECT_EQ(pooled.stats().allocs, pooled.stats().frees);
}

TEST_F(SandboxHostTest, MissingModuleIsUnavailable) {
    ScopedLogCapture capture;
    TempDir empty("polyfmt_sandbox");
    SandboxHost missing("no-such-module", 1, {empty.path()});

    EXPECT_FALSE(missing.is_available());
    for (int i = 0; i < 2; ++i) {
        auto result = missing.format("x", "x.c", LLVM_STYLE);
        ASSERT_TRUE(is_err(result));
        EXPECT_EQ(unwrap_err(result).kind, ErrorKind::BackendUnavailable);
    }
    EXPECT_EQ(capture.sink().count(log::LogLevel::Warn, "sandbox", "no-such-module"), 1u);
}

// ============================================================================
// Modules That Cannot Be Instantiated
// ============================================================================

class UninstantiableModuleTest : public ::testing::TestWithParam<const char*> {};

TEST_P(UninstantiableModuleTest, RetiresAfterOneWarning) {
    ScopedLogCapture capture;
    SandboxHost broken(GetParam(), 2, {FIXTURE_DIR});

    for (int i = 0; i < 3; ++i) {
        auto result = broken.format("int x;  \n", "x.c", LLVM_STYLE);
        ASSERT_TRUE(is_err(result));
        EXPECT_EQ(unwrap_err(result).kind, ErrorKind::BackendUnavailable)
            << unwrap_err(result).to_string();
        EXPECT_EQ(unwrap_err(result).message.rfind(std::string(GetParam()) + ": ", 0), 0u);
    }

    EXPECT_FALSE(broken.is_available());
    EXPECT_EQ(broken.stats().instantiations, 0u);
    EXPECT_EQ(broken.live_instances(), 0u);
    EXPECT_EQ(capture.sink().count(log::LogLevel::Warn, "sandbox", GetParam()), 1u);
}

TEST_P(UninstantiableModuleTest, ConcurrentCallersAllSeeUnavailable) {
    ScopedLogCapture capture;
    SandboxHost broken(GetParam(), 2, {FIXTURE_DIR});
    std::atomic<int> unavailable{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 10; ++i) {
                auto result = broken.format("a;\n", "a.c", LLVM_STYLE);
                if (is_err(result) && unwrap_err(result).kind == ErrorKind::BackendUnavailable) {
                    unavailable++;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(unavailable.load(), 40);
    EXPECT_EQ(broken.live_instances(), 0u);
    EXPECT_EQ(capture.sink().count(log::LogLevel::Warn, "sandbox", GetParam()), 1u);
}

INSTANTIATE_TEST_SUITE_P(BrokenModules, UninstantiableModuleTest,
                         ::testing::Values("missing-export", "unresolved-import", "init-trap"));

TEST_F(SandboxHostTest, StateNames) {
    EXPECT_EQ(instance_state_name(InstanceState::Ready), "ready");
    EXPECT_EQ(instance_state_name(InstanceState::Poisoned), "poisoned");
}
