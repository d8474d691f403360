#include "log_capture.h"
#include "lib/timer.h"
#include "module/sandbox_service.h"
#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

namespace codejail {
namespace {

class CapabilityTest : public ::testing::Test {
	protected:
		auto Service() -> SandboxService {
			SandboxOptions options;
			options.logger = capture.logger;
			options.default_timeout_ms = 5000;
			return SandboxService{options};
		}

		auto Answer(const SandboxResult& result) -> std::string {
			EXPECT_FALSE(result.error) << *result.error;
			return result.final_answer.value_or("<no answer>");
		}

		LogCapture capture;
};

TEST_F(CapabilityTest, CopiesArgumentsAndResults) {
	auto echo = CapabilityHandle::FromFunction("echo", [](const ValueList& arguments) {
		return Value{arguments};
	});
	auto result = Service().Run(
		"const echoed = await echo(1, 'two', { three: [3, null, true] }, undefined);\n"
		"finalAnswer(echoed);",
		{{"echo", echo}});
	EXPECT_EQ(Answer(result), R"([1,"two",{"three":[3,null,true]},null])");
}

TEST_F(CapabilityTest, HostFunctionsRunOffTheIsolateThread) {
	auto isolate_thread = std::this_thread::get_id();
	std::atomic<bool> ran_on_isolate_thread{true};
	auto where = CapabilityHandle::FromFunction("where", [&](const ValueList& /*arguments*/) {
		ran_on_isolate_thread = std::this_thread::get_id() == isolate_thread;
		return Value{"ok"};
	});
	auto result = Service().Run("finalAnswer(await where());", {{"where", where}});
	EXPECT_EQ(Answer(result), "ok");
	EXPECT_FALSE(ran_on_isolate_thread);
}

TEST_F(CapabilityTest, RejectionIsCatchableToolInvocationError) {
	auto failing = CapabilityHandle::FromFunction("failing", [](const ValueList& /*arguments*/) -> Value {
		throw ToolInvocationError{"upstream unavailable"};
	});
	auto result = Service().Run(
		"try {\n"
		"\tawait failing();\n"
		"} catch (error) {\n"
		"\tfinalAnswer(`${error instanceof Error} ${error.name}: ${error.message}`);\n"
		"}",
		{{"failing", failing}});
	EXPECT_EQ(Answer(result), "true ToolInvocationError: upstream unavailable");
}

TEST_F(CapabilityTest, UncaughtRejectionIsRuntimeError) {
	CapabilityHandle failing{"failing", [](ValueList /*arguments*/, CapabilityPromise promise) {
		promise.Reject("no such record");
	}};
	auto result = Service().Run("await failing();\nfinalAnswer('unreachable');", {{"failing", failing}});
	ASSERT_TRUE(result.error);
	EXPECT_EQ(result.error_kind, ErrorKind::RuntimeError);
	EXPECT_EQ(*result.error, "ToolInvocationError: no such record");
	EXPECT_FALSE(result.final_answer);
}

TEST_F(CapabilityTest, ThrowingInvokerRejects) {
	CapabilityHandle broken{"broken", [](ValueList /*arguments*/, CapabilityPromise /*promise*/) {
		throw std::runtime_error{"invoker blew up"};
	}};
	auto result = Service().Run(
		"finalAnswer(await broken().catch(error => error.message));",
		{{"broken", broken}});
	EXPECT_EQ(Answer(result), "invoker blew up");
}

TEST_F(CapabilityTest, FirstSettleWins) {
	CapabilityHandle fickle{"fickle", [](ValueList /*arguments*/, CapabilityPromise promise) {
		promise.Resolve(Value{"first"});
		EXPECT_TRUE(promise.IsSettled());
		promise.Reject("second");
		promise.Resolve(Value{"third"});
	}};
	auto result = Service().Run("finalAnswer(await fickle());", {{"fickle", fickle}});
	EXPECT_EQ(Answer(result), "first");
}

TEST_F(CapabilityTest, SettlesFromOtherThreadsInParallel) {
	CapabilityHandle sleep{"sleep", [](ValueList arguments, CapabilityPromise promise) {
		auto ms = static_cast<uint32_t>(arguments.at(0).GetNumber());
		timer_t::wait_detached(ms, [promise, arguments]() {
			promise.Resolve(arguments.at(1));
		});
	}};
	auto start = std::chrono::steady_clock::now();
	auto result = Service().Run(
		"const order = [];\n"
		"await Promise.all([\n"
		"\tsleep(150, 'slow').then(value => order.push(value)),\n"
		"\tsleep(50, 'fast').then(value => order.push(value)),\n"
		"]);\n"
		"finalAnswer(order.join(','));",
		{{"sleep", sleep}});
	EXPECT_EQ(Answer(result), "fast,slow");
	EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds{1000});
}

TEST_F(CapabilityTest, UncloneableArgumentThrowsTypeErrorInSandbox) {
	std::atomic<bool> called{false};
	auto echo = CapabilityHandle::FromFunction("echo", [&](const ValueList& arguments) {
		called = true;
		return Value{arguments};
	});
	auto result = Service().Run(
		"try {\n"
		"\tawait echo({ callback() {} });\n"
		"} catch (error) {\n"
		"\tfinalAnswer(`${error.name}: ${error.message}`);\n"
		"}",
		{{"echo", echo}});
	EXPECT_EQ(Answer(result), "TypeError: Function could not be cloned");
	EXPECT_FALSE(called);
}

TEST_F(CapabilityTest, PendingCallRunsIntoTimeout) {
	std::mutex mutex;
	std::vector<CapabilityPromise> parked;
	CapabilityHandle forever{"forever", [&](ValueList /*arguments*/, CapabilityPromise promise) {
		std::lock_guard<std::mutex> lock{mutex};
		parked.push_back(std::move(promise));
	}};
	auto result = Service().Run("await forever();", {{"forever", forever}}, 200);
	ASSERT_TRUE(result.error);
	EXPECT_EQ(result.error_kind, ErrorKind::TimeoutError);

	// Settling once the sandbox is gone is harmless
	std::lock_guard<std::mutex> lock{mutex};
	ASSERT_EQ(parked.size(), 1U);
	parked[0].Resolve(Value{"too late"});
	EXPECT_TRUE(parked[0].IsSettled());
	EXPECT_EQ(capture.Count(spdlog::level::debug, "settled after its sandbox was disposed"), 1U);
}

TEST_F(CapabilityTest, ShimsCantBeReplaced) {
	auto echo = CapabilityHandle::FromFunction("echo", [](const ValueList& arguments) {
		return arguments.at(0);
	});
	auto result = Service().Run(
		"echo = () => 'hijacked';\n"
		"const descriptor = Object.getOwnPropertyDescriptor(globalThis, 'echo');\n"
		"finalAnswer([await echo('original'), descriptor.writable, descriptor.configurable]);",
		{{"echo", echo}});
	EXPECT_EQ(Answer(result), R"(["original",false,false])");
}

TEST_F(CapabilityTest, BadNamesFailTheBridge) {
	auto echo = CapabilityHandle::FromFunction("Math", [](const ValueList& /*arguments*/) { return Value{}; });
	auto result = Service().Run("finalAnswer('never');", {{"Math", echo}});
	ASSERT_TRUE(result.error);
	EXPECT_EQ(result.error_kind, ErrorKind::BridgeInstallError);
	EXPECT_FALSE(result.final_answer);
}

TEST_F(CapabilityTest, OutputKeepsOrderAcrossAwaits) {
	CapabilityHandle sleep{"sleep", [](ValueList arguments, CapabilityPromise promise) {
		auto ms = static_cast<uint32_t>(arguments.at(0).GetNumber());
		timer_t::wait_detached(ms, [promise, arguments]() {
			promise.Resolve(arguments.at(1));
		});
	}};
	auto result = Service().Run(
		"console.log('a');\n"
		"console.error('before');\n"
		"const slept = await sleep(50, 'x');\n"
		"console.log('b', slept);\n"
		"console.error('c');\n"
		"await sleep(10, 'y');\n"
		"console.log('d');",
		{{"sleep", sleep}});
	EXPECT_TRUE(result.Succeeded());
	EXPECT_EQ(result.stdout_lines, (std::vector<std::string>{"a", "b x", "d"}));
	EXPECT_EQ(result.stderr_lines, (std::vector<std::string>{"before", "c"}));
}

TEST_F(CapabilityTest, OversizedArgumentIsRangeErrorInSandbox) {
	std::atomic<bool> called{false};
	auto echo = CapabilityHandle::FromFunction("echo", [&](const ValueList& arguments) {
		called = true;
		return Value{arguments};
	});
	auto result = Service().Run(
		"finalAnswer(await echo(new Array(1e8)).catch(error => `${error.name}: ${error.message}`));",
		{{"echo", echo}});
	EXPECT_EQ(Answer(result), "RangeError: Value is too large to be copied out of the isolate");
	EXPECT_FALSE(called);
}

TEST_F(CapabilityTest, NonStandardExceptionsReject) {
	CapabilityHandle invoker_throws{"invokerThrows", [](ValueList /*arguments*/, CapabilityPromise /*promise*/) {
		throw 42;
	}};
	auto function_throws = CapabilityHandle::FromFunction("functionThrows", [](const ValueList& /*arguments*/) -> Value {
		throw "not an exception object";
	});
	auto result = Service().Run(
		"const messages = [];\n"
		"for (const fn of [invokerThrows, functionThrows]) {\n"
		"\tmessages.push(await fn().catch(error => error.message));\n"
		"}\n"
		"finalAnswer(messages.join('|'));",
		{{"invokerThrows", invoker_throws}, {"functionThrows", function_throws}});
	EXPECT_EQ(Answer(result),
		"Capability 'invokerThrows' failed with an unknown exception|"
		"Capability 'functionThrows' failed with an unknown exception");
}

} // anonymous namespace
} // namespace codejail
