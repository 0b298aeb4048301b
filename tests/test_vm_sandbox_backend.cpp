#include <gtest/gtest.h>
#include "execution/CommandSandboxRuntime.hpp"
#include "execution/VmSandboxBackend.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <unistd.h>

using namespace code_interpreter;
namespace fs = std::filesystem;

namespace {

// Prints straight to fd 1, the way an in-process VM runtime does.
class PrintingRuntime : public ISandboxRuntime {
public:
    explicit PrintingRuntime(std::string text, bool success = true, std::optional<std::string> error = std::nullopt)
        : text_(std::move(text)), success_(success), error_(std::move(error)) {}

    SandboxRunResult run(const std::string& file_path) override {
        last_path = file_path;
        std::ifstream in(file_path);
        std::ostringstream ss;
        ss << in.rdbuf();
        last_source = ss.str();
        file_existed = fs::exists(file_path);

        if (!text_.empty()) {
            ssize_t n = ::write(STDOUT_FILENO, text_.data(), text_.size());
            (void)n;
        }
        return {success_, error_, std::nullopt};
    }

    std::string last_path;
    std::string last_source;
    bool file_existed = false;

private:
    std::string text_;
    bool success_;
    std::optional<std::string> error_;
};

class ThrowingRuntime : public ISandboxRuntime {
public:
    SandboxRunResult run(const std::string&) override {
        throw std::runtime_error("guest crashed");
    }
};

class ReturningRuntime : public ISandboxRuntime {
public:
    SandboxRunResult run(const std::string&) override {
        return {true, std::nullopt, std::string("  returned value\n")};
    }
};

}

class VmSandboxBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("ci_vm_backend_test_" + std::to_string(::getpid()));
        fs::remove_all(root_);
        config_ = VmSandboxBackendConfig{(root_ / "logs").string(), (root_ / "tmp").string(), Language::JAVASCRIPT};
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    bool workloads_empty() const {
        fs::path dir = root_ / "tmp" / VmSandboxBackend::kWorkloadSubdir;
        return !fs::exists(dir) || fs::is_empty(dir);
    }

    ExecutionRequest js(const std::string& src) { return ExecutionRequest{src, Language::JAVASCRIPT, 0}; }

    fs::path root_;
    VmSandboxBackendConfig config_;
};

TEST_F(VmSandboxBackendTest, CapturesMultiLineOutputAndCleansUp) {
    VmSandboxBackend backend(config_);
    PrintingRuntime runtime("line one\nline two\nline three\n");

    auto r = backend.run(js("console.log('x')"), runtime);

    EXPECT_TRUE(r.succeeded);
    EXPECT_EQ(r.user_text(), "line one\nline two\nline three");
    EXPECT_TRUE(runtime.file_existed);
    EXPECT_EQ(runtime.last_source, "console.log('x')");
    EXPECT_EQ(fs::path(runtime.last_path).extension(), ".js");
    EXPECT_FALSE(fs::exists(runtime.last_path));
    EXPECT_TRUE(workloads_empty());
}

TEST_F(VmSandboxBackendTest, SequentialRunsDoNotBleed) {
    VmSandboxBackend backend(config_);
    PrintingRuntime first("alpha\n");
    PrintingRuntime second("beta\n");

    EXPECT_EQ(backend.run(js("a"), first).user_text(), "alpha");
    EXPECT_EQ(backend.run(js("b"), second).user_text(), "beta");
    EXPECT_NE(first.last_path, second.last_path);
}

TEST_F(VmSandboxBackendTest, FailureWithoutDetailReportsUnknownError) {
    VmSandboxBackend backend(config_);
    PrintingRuntime runtime("", false);

    auto r = backend.run(js("x"), runtime);
    EXPECT_FALSE(r.succeeded);
    EXPECT_EQ(r.user_text(), "Execution failed: Unknown error");
}

TEST_F(VmSandboxBackendTest, FailureCarriesRuntimeError) {
    VmSandboxBackend backend(config_);
    PrintingRuntime runtime("partial\n", false, std::string("ReferenceError: y is not defined"));

    auto r = backend.run(js("y"), runtime);
    EXPECT_EQ(r.user_text(), "Execution failed: ReferenceError: y is not defined");
    EXPECT_TRUE(workloads_empty());
}

TEST_F(VmSandboxBackendTest, SilentSuccess) {
    VmSandboxBackend backend(config_);
    PrintingRuntime runtime("  \n");

    EXPECT_EQ(backend.run(js("let x = 1"), runtime).user_text(), "Execution completed successfully.");
}

TEST_F(VmSandboxBackendTest, FallsBackToReturnedOutput) {
    VmSandboxBackend backend(config_);
    ReturningRuntime runtime;

    EXPECT_EQ(backend.run(js("1"), runtime).user_text(), "returned value");
}

TEST_F(VmSandboxBackendTest, ThrowingRuntimeStillRemovesWorkload) {
    VmSandboxBackend backend(config_);
    ThrowingRuntime runtime;

    EXPECT_THROW(backend.run(js("boom"), runtime), std::runtime_error);
    EXPECT_TRUE(workloads_empty());
    EXPECT_TRUE(fs::is_empty(root_ / "tmp" / "capture"));
}

TEST_F(VmSandboxBackendTest, WorkloadExtensionFollowsLanguage) {
    VmSandboxBackend backend(config_);
    PrintingRuntime runtime("ok\n");

    backend.run(ExecutionRequest{"int main(){}", Language::CPP, 0}, runtime);
    EXPECT_EQ(fs::path(runtime.last_path).extension(), ".cpp");
}

TEST_F(VmSandboxBackendTest, RequiresScratchDirectory) {
    EXPECT_THROW(VmSandboxBackend(VmSandboxBackendConfig{"", "", Language::PYTHON}), std::invalid_argument);
}

// --- CommandSandboxRuntime ---

TEST_F(VmSandboxBackendTest, CommandRuntimeRunsNode) {
    if (::access("/usr/bin/node", X_OK) != 0) GTEST_SKIP() << "/usr/bin/node not available";

    VmSandboxBackend backend(config_);
    CommandSandboxRuntime runtime(SandboxOptions{config_.log_directory, (root_ / "tmp" / "runtime").string()});

    auto r = backend.run(js("console.log(2 + 2)"), runtime);
    EXPECT_TRUE(r.succeeded);
    EXPECT_EQ(r.user_text(), "4");
    EXPECT_TRUE(fs::exists(root_ / "logs" / "sandbox.log"));
}

TEST_F(VmSandboxBackendTest, CommandRuntimeReportsScriptErrors) {
    if (::access("/usr/bin/python3", X_OK) != 0) GTEST_SKIP() << "/usr/bin/python3 not available";

    VmSandboxBackend backend(config_);
    CommandSandboxRuntime runtime(SandboxOptions{"", (root_ / "tmp" / "runtime").string()});

    auto r = backend.run(ExecutionRequest{"print('before')\nraise KeyError('k')", Language::PYTHON, 0}, runtime);
    EXPECT_FALSE(r.succeeded);
    EXPECT_EQ(r.user_text().rfind("Execution failed: ", 0), 0u);
    EXPECT_NE(r.user_text().find("KeyError"), std::string::npos);
}

TEST_F(VmSandboxBackendTest, CommandRuntimeCachesAndClearsCompiledArtifacts) {
    if (::access("/usr/bin/cc", X_OK) != 0) GTEST_SKIP() << "/usr/bin/cc not available";

    fs::path runtime_dir = root_ / "tmp" / "runtime";
    VmSandboxBackend backend(config_);
    CommandSandboxRuntime runtime(SandboxOptions{"", runtime_dir.string()});

    const std::string src = "#include <stdio.h>\nint main(void){ printf(\"%d\\n\", 6*7); return 0; }\n";
    EXPECT_EQ(backend.run(ExecutionRequest{src, Language::C, 0}, runtime).user_text(), "42");
    EXPECT_EQ(backend.run(ExecutionRequest{src, Language::C, 0}, runtime).user_text(), "42");

    EXPECT_EQ(runtime.clear_cache(), "Sandbox cache cleared (1 compiled artifacts removed).");
    EXPECT_EQ(runtime.clear_cache(), "Sandbox cache cleared (0 compiled artifacts removed).");
}

TEST_F(VmSandboxBackendTest, CommandRuntimeReusesBinaryOnlyForIdenticalSource) {
    if (::access("/usr/bin/cc", X_OK) != 0) GTEST_SKIP() << "/usr/bin/cc not available";
    if (::access("/bin/sh", X_OK) != 0) GTEST_SKIP() << "/bin/sh not available";

    fs::path runtime_dir = root_ / "tmp" / "runtime";
    VmSandboxBackend backend(config_);
    CommandSandboxRuntime runtime(SandboxOptions{"", runtime_dir.string()});

    const std::string src = "#include <stdio.h>\nint main(void){ printf(\"%d\\n\", 6*7); return 0; }\n";
    ASSERT_EQ(backend.run(ExecutionRequest{src, Language::C, 0}, runtime).user_text(), "42");

    fs::path binary, recorded;
    for (const auto& entry : fs::directory_iterator(runtime_dir)) {
        if (entry.path().extension() == ".bin") binary = entry.path();
        if (entry.path().extension() == ".src") recorded = entry.path();
    }
    ASSERT_FALSE(binary.empty());
    ASSERT_FALSE(recorded.empty());
    EXPECT_EQ(binary.stem(), recorded.stem());

    // Swap the cached binary for a marker script: a hit must run it as is.
    {
        std::ofstream out(binary, std::ios::binary | std::ios::trunc);
        out << "#!/bin/sh\necho stale\n";
    }
    fs::permissions(binary, fs::perms::owner_all);
    EXPECT_EQ(backend.run(ExecutionRequest{src, Language::C, 0}, runtime).user_text(), "stale");

    // Same name, different recorded source: treated as a miss and rebuilt.
    {
        std::ofstream out(recorded, std::ios::binary | std::ios::trunc);
        out << ".cint main(void){ return 1; }\n";
    }
    EXPECT_EQ(backend.run(ExecutionRequest{src, Language::C, 0}, runtime).user_text(), "42");
}

TEST_F(VmSandboxBackendTest, CommandRuntimeKillsEndlessScript) {
    if (::access("/usr/bin/python3", X_OK) != 0) GTEST_SKIP() << "/usr/bin/python3 not available";

    CommandSandboxConfig cfg;
    cfg.run_timeout = std::chrono::seconds(1);
    VmSandboxBackend backend(config_);
    CommandSandboxRuntime runtime(SandboxOptions{"", (root_ / "tmp" / "runtime").string()}, cfg);

    auto start = std::chrono::steady_clock::now();
    auto r = backend.run(ExecutionRequest{"while True:\n    pass\n", Language::PYTHON, 0}, runtime);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(r.succeeded);
    EXPECT_EQ(r.user_text(), "Execution failed: Execution timed out after 1s");
    EXPECT_LT(elapsed, std::chrono::seconds(8));
    EXPECT_TRUE(workloads_empty());
}

TEST_F(VmSandboxBackendTest, CommandRuntimeKillsEndlessNodeLoop) {
    if (::access("/usr/bin/node", X_OK) != 0) GTEST_SKIP() << "/usr/bin/node not available";

    CommandSandboxConfig cfg;
    cfg.run_timeout = std::chrono::seconds(1);
    VmSandboxBackend backend(config_);
    CommandSandboxRuntime runtime(SandboxOptions{"", (root_ / "tmp" / "runtime").string()}, cfg);

    auto r = backend.run(js("while(true){}"), runtime);
    EXPECT_FALSE(r.succeeded);
    EXPECT_EQ(r.user_text(), "Execution failed: Execution timed out after 1s");
    EXPECT_TRUE(workloads_empty());
}

TEST(CommandSandboxRuntimeTest, RejectsMissingLauncher) {
    CommandSandboxConfig cfg;
    cfg.launcher = {"/nonexistent/vm-launcher"};
    auto dir = fs::temp_directory_path() / ("ci_launcher_test_" + std::to_string(::getpid()));

    EXPECT_THROW(CommandSandboxRuntime(SandboxOptions{"", dir.string()}, cfg), std::runtime_error);
    EXPECT_FALSE(sandbox_runtime_available(cfg, Language::PYTHON));

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST(CommandSandboxRuntimeTest, UnknownInterpreterMakesLanguageUnavailable) {
    CommandSandboxConfig cfg;
    cfg.interpreters[".js"] = "/nonexistent/node";
    EXPECT_FALSE(sandbox_runtime_available(cfg, Language::JAVASCRIPT));
}
