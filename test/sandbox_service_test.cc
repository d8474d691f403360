#include "log_capture.h"
#include "isolate/environment.h"
#include "module/output_collector.h"
#include "module/sandbox_service.h"
#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <stdexcept>
#include <vector>

namespace codejail {
namespace {

using namespace std::chrono_literals;

class SandboxServiceTest : public ::testing::Test {
	protected:
		void SetUp() override {
			options.logger = capture.logger;
			options.default_timeout_ms = 5000;
		}

		auto Run(const std::string& code, const CapabilityMap& capabilities = {}, uint32_t timeout_ms = 0) -> SandboxResult {
			SandboxService service{options};
			return service.Run(code, capabilities, timeout_ms);
		}

		static auto Double() -> CapabilityHandle {
			return CapabilityHandle::FromFunction("double", [](const ValueList& arguments) {
				return Value{arguments.at(0).GetNumber() * 2};
			});
		}

		LogCapture capture;
		SandboxOptions options;
};

TEST_F(SandboxServiceTest, ReturnsFinalAnswer) {
	auto result = Run("finalAnswer('done');");
	EXPECT_TRUE(result.Succeeded());
	EXPECT_FALSE(result.error);
	EXPECT_FALSE(result.error_kind);
	ASSERT_TRUE(result.final_answer);
	EXPECT_EQ(*result.final_answer, "done");
}

TEST_F(SandboxServiceTest, NoAnswerIsNotAnError) {
	auto result = Run("const x = 1 + 1;");
	EXPECT_TRUE(result.Succeeded());
	EXPECT_FALSE(result.final_answer);
}

TEST_F(SandboxServiceTest, FinalAnswerIsWrittenOnce) {
	auto result = Run("finalAnswer('one');\nfinalAnswer('two');\nfinalAnswer('three');\nfinalAnswer('four');");
	ASSERT_TRUE(result.final_answer);
	EXPECT_EQ(*result.final_answer, "one");
	EXPECT_EQ(capture.Count(spdlog::level::warn, OutputCollector::kDuplicateFinalAnswer), 3U);
}

TEST_F(SandboxServiceTest, FinalAnswerSerializesObjects) {
	auto result = Run("finalAnswer({ items: [1, 2], label: 'x' });");
	ASSERT_TRUE(result.final_answer);
	EXPECT_EQ(*result.final_answer, R"({"items":[1,2],"label":"x"})");
}

TEST_F(SandboxServiceTest, ConsoleJoinsArgumentsWithSpaces) {
	auto result = Run(
		"console.log('a', 1, 'b');\n"
		"console.info('info');\n"
		"console.error('bad', true);\n"
		"console.warn('careful');\n");
	EXPECT_TRUE(result.Succeeded());
	EXPECT_EQ(result.stdout_lines, (std::vector<std::string>{"a 1 b", "info"}));
	EXPECT_EQ(result.stderr_lines, (std::vector<std::string>{"bad true", "careful"}));
}

TEST_F(SandboxServiceTest, OutputIsBounded) {
	options.max_output_lines = 2;
	auto result = Run("for (let ii = 0; ii < 100; ++ii) console.log(ii);");
	EXPECT_EQ(result.stdout_lines, (std::vector<std::string>{"0", "1", OutputCollector::kTruncatedMarker}));
}

TEST_F(SandboxServiceTest, ThrowDiscardsFinalAnswer) {
	auto result = Run("console.log('before');\nfinalAnswer('early');\nthrow new Error('x');");
	ASSERT_TRUE(result.error);
	EXPECT_EQ(result.error_kind, ErrorKind::RuntimeError);
	EXPECT_NE(result.error->find("x"), std::string::npos);
	EXPECT_FALSE(result.final_answer);
	EXPECT_FALSE(result.Succeeded());
	// Output produced before the failure is kept
	EXPECT_EQ(result.stdout_lines, (std::vector<std::string>{"before"}));
	EXPECT_EQ(capture.Count(spdlog::level::err, "sandbox_run failed"), 1U);
}

TEST_F(SandboxServiceTest, SyntaxErrorIsCompileError) {
	auto result = Run("finalAnswer(");
	ASSERT_TRUE(result.error);
	EXPECT_EQ(result.error_kind, ErrorKind::CompileError);
	EXPECT_NE(result.error->find("[<sandbox>:"), std::string::npos) << *result.error;
}

TEST_F(SandboxServiceTest, InfiniteLoopTimesOutAndServiceRecovers) {
	SandboxService service{options};
	auto start = std::chrono::steady_clock::now();
	auto result = service.Run("while (true) {}", {}, 200);
	auto elapsed = std::chrono::steady_clock::now() - start;
	ASSERT_TRUE(result.error);
	EXPECT_EQ(result.error_kind, ErrorKind::TimeoutError);
	EXPECT_FALSE(result.final_answer);
	EXPECT_GE(elapsed, 200ms);
	EXPECT_LT(elapsed, 2s);

	auto next = service.Run("finalAnswer('recovered');", {});
	EXPECT_TRUE(next.Succeeded());
	EXPECT_EQ(next.final_answer.value_or(""), "recovered");
}

TEST_F(SandboxServiceTest, BudgetCapsRequestedTimeout) {
	options.total_timeout_ms = 150;
	SandboxService service{options};
	auto start = std::chrono::steady_clock::now();
	auto result = service.Run("while (true) {}", {}, 60000);
	EXPECT_EQ(result.error_kind, ErrorKind::TimeoutError);
	EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST_F(SandboxServiceTest, CallsCapability) {
	auto result = Run("const x = await double(21);\nfinalAnswer(x);", {{"double", Double()}});
	EXPECT_TRUE(result.Succeeded());
	ASSERT_TRUE(result.final_answer);
	EXPECT_EQ(*result.final_answer, "42");
}

TEST_F(SandboxServiceTest, OnlyOfferedCapabilitiesAreVisible) {
	auto result = Run(
		"finalAnswer([typeof double, typeof require, typeof process, typeof global, typeof console].join(' '));");
	ASSERT_TRUE(result.final_answer);
	EXPECT_EQ(*result.final_answer, "undefined undefined undefined object object");
}

TEST_F(SandboxServiceTest, SandboxBindingsCantBeReplaced) {
	auto result = Run("console = null;\nfinalAnswer = null;\nconsole.log('still here');\nfinalAnswer('ok');");
	EXPECT_TRUE(result.Succeeded());
	EXPECT_EQ(result.stdout_lines, (std::vector<std::string>{"still here"}));
	EXPECT_EQ(result.final_answer.value_or(""), "ok");
}

TEST_F(SandboxServiceTest, ReservedCapabilityNameFailsTheBridge) {
	auto result = Run("finalAnswer('never');", {{"console", CapabilityHandle::FromFunction("console", [](const ValueList& /*arguments*/) {
		return Value{};
	})}});
	EXPECT_EQ(result.error_kind, ErrorKind::BridgeInstallError);
	EXPECT_FALSE(result.final_answer);
}

TEST_F(SandboxServiceTest, MemoryLimitIsResourceError) {
	options.memory_limit_mb = 16;
	auto result = Run("const hoard = [];\nwhile (true) hoard.push(new Array(100000).fill(Math.random()));", {}, 20000);
	ASSERT_TRUE(result.error);
	EXPECT_EQ(result.error_kind, ErrorKind::ResourceError);
}

TEST_F(SandboxServiceTest, ConcurrentRunsAreIsolated) {
	SandboxService service{options};
	std::vector<std::future<SandboxResult>> runs;
	for (int ii = 0; ii < 8; ++ii) {
		std::string code =
			"const before = typeof leaked;\n"
			"globalThis.leaked = " + std::to_string(ii) + ";\n"
			"Object.prototype.polluted = true;\n"
			"const doubled = typeof double === 'function' ? await double(leaked) : null;\n"
			"finalAnswer({ before, leaked, doubled });";
		CapabilityMap capabilities;
		if (ii % 2 == 0) {
			capabilities.emplace("double", Double());
		}
		runs.push_back(service.RunAsync(code, capabilities));
	}
	for (int ii = 0; ii < 8; ++ii) {
		auto result = runs[ii].get();
		ASSERT_TRUE(result.Succeeded()) << *result.error;
		std::string doubled = ii % 2 == 0 ? std::to_string(ii * 2) : "null";
		EXPECT_EQ(result.final_answer.value_or(""),
			R"({"before":"undefined","leaked":)" + std::to_string(ii) + R"(,"doubled":)" + doubled + "}");
	}
	auto clean = service.Run("finalAnswer(String({}.polluted));", {});
	EXPECT_EQ(clean.final_answer.value_or(""), "undefined");
}

TEST_F(SandboxServiceTest, RunsDontLeakIsolates) {
	size_t before = IsolateEnvironment::LiveCount();
	SandboxService service{options};
	const char* scripts[] = {
		"finalAnswer(await double(1));",
		"throw new Error('boom');",
		"while (true) {}",
		"await double(Symbol());",
		"await new Promise(() => {});",
		"syntax error here",
	};
	for (int round = 0; round < 3; ++round) {
		for (const char* code : scripts) {
			service.Run(code, {{"double", Double()}}, 100);
		}
	}
	EXPECT_EQ(IsolateEnvironment::LiveCount(), before);
}

TEST_F(SandboxServiceTest, GetterOnThrownValueCantOutliveDeadline) {
	auto start = std::chrono::steady_clock::now();
	auto result = Run("throw { get message() { for (;;) {} } };", {}, 200);
	EXPECT_EQ(result.error_kind, ErrorKind::TimeoutError);
	EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST_F(SandboxServiceTest, IsolateLifecycleUsesConfiguredLogger) {
	options.memory_limit_mb = 64;
	auto result = Run("finalAnswer('logged');");
	EXPECT_TRUE(result.Succeeded());
	EXPECT_EQ(capture.Count(spdlog::level::debug, "isolate created with 64 MB limit"), 1U);
	EXPECT_EQ(capture.Count(spdlog::level::debug, "isolate disposed"), 1U);
}

TEST(SandboxOptionsTest, RejectsInvalidOptions) {
	SandboxOptions options;
	options.memory_limit_mb = 4;
	EXPECT_THROW(SandboxService{options}, std::invalid_argument);
	options = {};
	options.worker_threads = 0;
	EXPECT_THROW(SandboxService{options}, std::invalid_argument);
	options = {};
	options.default_timeout_ms = 0;
	EXPECT_THROW(options.Validate(), std::invalid_argument);
}

TEST(RunBudgetTest, PicksSmallestTimeoutWhichIsSet) {
	RunBudget budget;
	EXPECT_EQ(budget.EffectiveTimeoutMs(0, 30000), 30000U);
	EXPECT_EQ(budget.EffectiveTimeoutMs(1000, 30000), 1000U);
	budget.step_timeout_ms = 500;
	EXPECT_EQ(budget.EffectiveTimeoutMs(1000, 30000), 500U);
	EXPECT_EQ(budget.EffectiveTimeoutMs(0, 30000), 500U);
	budget.total_timeout_ms = 200;
	EXPECT_EQ(budget.EffectiveTimeoutMs(1000, 30000), 200U);
}

} // anonymous namespace
} // namespace codejail
