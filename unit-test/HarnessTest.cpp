#include "gtest/gtest.h"
#include "judge/harness.hpp"

using namespace std;
using namespace grader;

TEST(HarnessTest, SplicesCandidateCodeVerbatim) {
    sandbox_config config;
    string code = "def solution(s):\n    return s[::-1]\n";
    string harness = build_harness(code, "abc", config);
    EXPECT_NE(string::npos, harness.find(code));
}

TEST(HarnessTest, InstallsMemoryLimitBeforeCandidateCode) {
    sandbox_config config;
    config.memory_limit_mb = 64;
    string harness = build_harness("def solution(x):\n    return x\n", 1, config);
    auto limit = harness.find("memory_limit = 64 * 1024 * 1024");
    auto rlimit = harness.find("resource.RLIMIT_AS");
    auto code = harness.find("def solution(x)");
    ASSERT_NE(string::npos, limit);
    ASSERT_NE(string::npos, rlimit);
    ASSERT_NE(string::npos, code);
    EXPECT_LT(rlimit, code);
}

TEST(HarnessTest, SerializesInputAsPythonLiteral) {
    sandbox_config config;
    string harness = build_harness("", value::parse(R"({"nums": [1, 2], "target": 3, "ok": true})"), config);
    EXPECT_NE(string::npos, harness.find("test_input = {'nums': [1, 2], 'target': 3, 'ok': True}"));

    harness = build_harness("", "it's", config);
    EXPECT_NE(string::npos, harness.find("test_input = \"it's\""));
}

TEST(HarnessTest, ReportsOutcomesWithExitCodes) {
    sandbox_config config;
    string harness = build_harness("", 5, config);
    EXPECT_NE(string::npos, harness.find("result = solution(test_input)"));
    EXPECT_NE(string::npos, harness.find("print(json.dumps({\"result\": result}))"));
    EXPECT_NE(string::npos, harness.find("except MemoryError:"));
    EXPECT_NE(string::npos, harness.find("{\"error\": \"Memory limit exceeded\"}"));
    EXPECT_NE(string::npos, harness.find("sys.exit(2)"));
    EXPECT_NE(string::npos, harness.find("sys.exit(1)"));
    EXPECT_NE(string::npos, harness.find("type(e).__name__"));
}

TEST(HarnessTest, RequiresEntryPoint) {
    sandbox_config config;
    string harness = build_harness("", 5, config);
    EXPECT_NE(string::npos, harness.find("entry point 'solution' is not defined"));
}
