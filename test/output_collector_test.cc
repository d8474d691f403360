#include "isolate_fixture.h"
#include "log_capture.h"
#include "module/output_collector.h"

namespace codejail {
namespace {

using Stream = OutputCollector::Stream;

TEST(OutputCollectorTest, KeepsStreamsApart) {
	LogCapture capture;
	OutputCollector output{10, 1024, capture.logger};
	output.Append(Stream::Stdout, "out");
	output.Append(Stream::Stderr, "err");
	output.Append(Stream::Stdout, "");
	EXPECT_EQ(output.GetStdout(), (std::vector<std::string>{"out", ""}));
	EXPECT_EQ(output.GetStderr(), (std::vector<std::string>{"err"}));
}

TEST(OutputCollectorTest, TruncatesByLineCount) {
	LogCapture capture;
	OutputCollector output{3, 1024, capture.logger};
	for (int ii = 0; ii < 10; ++ii) {
		output.Append(Stream::Stdout, std::to_string(ii));
	}
	EXPECT_EQ(output.GetStdout(), (std::vector<std::string>{"0", "1", "2", OutputCollector::kTruncatedMarker}));
	// The other stream has its own budget
	output.Append(Stream::Stderr, "still here");
	EXPECT_EQ(output.GetStderr(), (std::vector<std::string>{"still here"}));
}

TEST(OutputCollectorTest, TruncatesByByteCount) {
	LogCapture capture;
	OutputCollector output{100, 10, capture.logger};
	output.Append(Stream::Stderr, "12345");
	output.Append(Stream::Stderr, "67890");
	output.Append(Stream::Stderr, "x");
	output.Append(Stream::Stderr, "y");
	EXPECT_EQ(output.GetStderr(), (std::vector<std::string>{"12345", "67890", OutputCollector::kTruncatedMarker}));
}

TEST(OutputCollectorTest, FirstFinalAnswerWins) {
	LogCapture capture;
	OutputCollector output{10, 1024, capture.logger};
	EXPECT_FALSE(output.GetFinalAnswer());
	output.SetFinalAnswer("first");
	output.SetFinalAnswer("second");
	output.SetFinalAnswer("third");
	ASSERT_TRUE(output.GetFinalAnswer());
	EXPECT_EQ(*output.GetFinalAnswer(), "first");
	EXPECT_EQ(capture.Count(spdlog::level::warn, OutputCollector::kDuplicateFinalAnswer), 2U);
}

using OutputCoercionTest = IsolateTest;

TEST_F(OutputCoercionTest, CoercesLikeString) {
	WithContext([](v8::Local<v8::Context> /*context*/) {
		EXPECT_EQ(OutputCollector::Coerce(Eval("1.5")), "1.5");
		EXPECT_EQ(OutputCollector::Coerce(Eval("null")), "null");
		EXPECT_EQ(OutputCollector::Coerce(Eval("undefined")), "undefined");
		EXPECT_EQ(OutputCollector::Coerce(Eval("[1, [2, 3]]")), "1,2,3");
		EXPECT_EQ(OutputCollector::Coerce(Eval("({ a: 1 })")), "[object Object]");
		EXPECT_EQ(OutputCollector::Coerce(Eval("Symbol('tag')")), "Symbol(tag)");
		EXPECT_EQ(OutputCollector::Coerce(Eval("({ toString() { throw new Error('no'); } })")), "[object Object]");
	});
}

TEST_F(OutputCoercionTest, FinalAnswerUsesJsonForObjects) {
	WithContext([](v8::Local<v8::Context> /*context*/) {
		EXPECT_EQ(OutputCollector::CoerceFinalAnswer(Eval("'as is'")), "as is");
		EXPECT_EQ(OutputCollector::CoerceFinalAnswer(Eval("42")), "42");
		EXPECT_EQ(OutputCollector::CoerceFinalAnswer(Eval("({ a: [1, 'b'] })")), R"({"a":[1,"b"]})");
		EXPECT_EQ(OutputCollector::CoerceFinalAnswer(Eval("[1, 2]")), "[1,2]");
		EXPECT_EQ(OutputCollector::CoerceFinalAnswer(Eval("const a = {}; a.a = a; a")), "[object Object]");
		EXPECT_EQ(OutputCollector::CoerceFinalAnswer(Eval("({ toJSON() {} })")), "[object Object]");
	});
}

TEST_F(OutputCoercionTest, NativesWriteToCollector) {
	LogCapture capture;
	OutputCollector output{10, 1024, capture.logger};
	WithContext([&](v8::Local<v8::Context> context) {
		v8::Local<v8::Object> natives = v8::Object::New(v8::Isolate::GetCurrent());
		output.InstallNatives(context, natives);
		Unmaybe(context->Global()->Set(context, v8_string("natives"), natives));
		Eval("natives.log('a', 1, 'b'); natives.error('oops', { x: 1 }); natives.finalAnswer({ done: true });");
	});
	EXPECT_EQ(output.GetStdout(), (std::vector<std::string>{"a 1 b"}));
	EXPECT_EQ(output.GetStderr(), (std::vector<std::string>{"oops [object Object]"}));
	ASSERT_TRUE(output.GetFinalAnswer());
	EXPECT_EQ(*output.GetFinalAnswer(), R"({"done":true})");
}

} // anonymous namespace
} // namespace codejail
