#include <filesystem>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "runner/registry.hpp"
#include "task/task.hpp"

using namespace std;
using namespace std::filesystem;
using namespace engine;

static const char *APLUSB_CPP = R"(
#include <iostream>
int main() {
    long long a, b;
    std::cin >> a >> b;
    std::cout << a + b << std::endl;
})";

static const char *APLUSB_C = R"(
#include <stdio.h>
int main() {
    long long a, b;
    scanf("%lld%lld", &a, &b);
    printf("%lld\n", a + b);
    return 0;
})";

static const char *APLUSB_PYTHON = R"(
a, b = map(int, input().split())
print(a + b)
)";

class RunnerTest : public ::testing::Test {
protected:
    path workdir;

    void SetUp() override {
        workdir = temp_directory_path() / ("runner-test-" + generate_task_id());
        create_directories(workdir);
    }

    void TearDown() override {
        remove_all(workdir);
    }

    string run_aplusb(const string &language, const string &source, const string &input) {
        runner_uptr r = make_runner(language, source, chrono::seconds(5));
        path source_path = workdir / ("code." + source_extension(language));
        path artifact_path = workdir / "binary";
        r->initialize(source_path);
        EXPECT_TRUE(exists(source_path));
        r->compile(source_path, artifact_path);
        EXPECT_TRUE(exists(artifact_path));
        auto result = r->execute(artifact_path, input);
        r->cleanup(source_path, artifact_path);
        EXPECT_FALSE(exists(source_path));
        EXPECT_FALSE(exists(artifact_path));
        if (!is_success(result)) return "error: " + get<execution_error>(result).message;
        return get<execution_output>(result).stdout_text;
    }
};

TEST_F(RunnerTest, CppTest) {
    EXPECT_EQ(run_aplusb("cpp", APLUSB_CPP, "2 3"), "5\n");
}

TEST_F(RunnerTest, CTest) {
    EXPECT_EQ(run_aplusb("c", APLUSB_C, "10 20"), "30\n");
}

TEST_F(RunnerTest, Python3Test) {
    EXPECT_EQ(run_aplusb("python3", APLUSB_PYTHON, "1 2\n"), "3\n");
}

TEST_F(RunnerTest, CompilationErrorCarriesCompilerLog) {
    runner_uptr r = make_runner("cpp", "int main() { return }", chrono::seconds(5));
    path source_path = workdir / "code.cpp", artifact_path = workdir / "binary";
    r->initialize(source_path);
    try {
        r->compile(source_path, artifact_path);
        FAIL() << "compilation should fail";
    } catch (compilation_error &ex) {
        EXPECT_NE(ex.error_log.find("error"), string::npos) << ex.error_log;
    }
    EXPECT_FALSE(exists(artifact_path));
    r->cleanup(source_path, artifact_path);
    EXPECT_FALSE(exists(source_path));
}

TEST_F(RunnerTest, PythonSyntaxError) {
    runner_uptr r = make_runner("python3", "def f(:\n    pass\n", chrono::seconds(5));
    path source_path = workdir / "code.py", artifact_path = workdir / "binary";
    r->initialize(source_path);
    try {
        r->compile(source_path, artifact_path);
        FAIL() << "syntax check should fail";
    } catch (compilation_error &ex) {
        EXPECT_NE(ex.error_log.find("SyntaxError"), string::npos) << ex.error_log;
    }
    EXPECT_FALSE(exists(artifact_path));
}

TEST_F(RunnerTest, PythonCompileTimeSyntaxError) {
    // ast.parse 接受这些代码，但 CPython 编译时会报 SyntaxError
    for (const char *source : {"return 5\n", "break\n", "def f():\n    nonlocal x\n"}) {
        runner_uptr r = make_runner("python3", source, chrono::seconds(5));
        path source_path = workdir / "code.py", artifact_path = workdir / "binary";
        r->initialize(source_path);
        try {
            r->compile(source_path, artifact_path);
            ADD_FAILURE() << "syntax check should fail for " << source;
        } catch (compilation_error &ex) {
            EXPECT_NE(ex.error_log.find("SyntaxError"), string::npos) << ex.error_log;
        }
        EXPECT_FALSE(exists(artifact_path));
        r->cleanup(source_path, artifact_path);
    }
}

TEST_F(RunnerTest, CleanupIsIdempotent) {
    runner_uptr r = make_runner("cpp", APLUSB_CPP, chrono::seconds(5));
    path source_path = workdir / "code.cpp", artifact_path = workdir / "binary";
    r->initialize(source_path);
    r->cleanup(source_path, artifact_path);
    EXPECT_FALSE(exists(source_path));
    EXPECT_NO_THROW(r->cleanup(source_path, artifact_path));
}

TEST_F(RunnerTest, InitializeIntoMissingDirectory) {
    runner_uptr r = make_runner("cpp", APLUSB_CPP, chrono::seconds(5));
    EXPECT_THROW(r->initialize(workdir / "missing" / "code.cpp"), io_error);
}

TEST_F(RunnerTest, UnsupportedLanguage) {
    EXPECT_THROW(make_runner("brainfuck", "+++", chrono::seconds(5)), configuration_error);
    EXPECT_THROW(source_extension("brainfuck"), configuration_error);
    EXPECT_FALSE(is_supported_language("brainfuck"));
}

TEST_F(RunnerTest, SupportedLanguages) {
    EXPECT_EQ(supported_languages(), vector<string>({"c", "cpp", "python3"}));
    EXPECT_EQ(source_extension("cpp"), "cpp");
    EXPECT_EQ(source_extension("python3"), "py");
}
