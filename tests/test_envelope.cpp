// cppcheck-suppress-file missingIncludeSystem
#include <gtest/gtest.h>

#include <cerrno>
#include <regex>
#include <stdexcept>
#include <string>

#include "envelope.hpp"
#include "result.hpp"
#include "test_support.hpp"
#include "utils.hpp"

namespace hostscope {
namespace {

TEST(EnvelopeTest, SuccessCarriesDataAndNoError)
{
    const Envelope env = make_success("TCP_SOCKETS_V4", "{\"total\":0}");
    const std::string json = to_json(env);

    std::string status;
    ASSERT_TRUE(extract_json_string(json, "status", status));
    EXPECT_EQ(status, "SUCCESS");

    std::string raw;
    ASSERT_TRUE(find_json_member(json, "data", raw));
    EXPECT_EQ(raw, "{\"total\":0}");
    EXPECT_FALSE(find_json_member(json, "error", raw));

    ASSERT_TRUE(find_json_member(json, "metadata", raw));
    std::string task_type;
    std::string subtype;
    ASSERT_TRUE(extract_json_string(raw, "task_type", task_type));
    ASSERT_TRUE(extract_json_string(raw, "subtype", subtype));
    EXPECT_EQ(task_type, "STATE");
    EXPECT_EQ(subtype, "TCP_SOCKETS_V4");
}

TEST(EnvelopeTest, FailureCarriesErrorAndNoData)
{
    const Envelope env = make_failure("KALLSYMS", ErrorCode::IoFailure, "missing");
    const std::string json = to_json(env);

    std::string raw;
    EXPECT_FALSE(find_json_member(json, "data", raw));
    ASSERT_TRUE(find_json_member(json, "error", raw));

    uint64_t code = 0;
    std::string message;
    ASSERT_TRUE(extract_json_uint64(raw, "code", code));
    ASSERT_TRUE(extract_json_string(raw, "message", message));
    EXPECT_EQ(code, 1002u);
    EXPECT_EQ(message, "missing");

    std::string status;
    ASSERT_TRUE(extract_json_string(json, "status", status));
    EXPECT_EQ(status, "FAILURE");
}

TEST(EnvelopeTest, EmptyDataBecomesEmptyObject)
{
    const Envelope env = make_success("X", "");
    EXPECT_EQ(env.data_json, "{}");
}

TEST(EnvelopeTest, FailureFromErrorIncludesContext)
{
    const Envelope env = make_failure("X", Error(ErrorCode::ToolNotAvailable, "bpftool missing", "PATH"));
    EXPECT_EQ(env.error_code, ErrorCode::ToolNotAvailable);
    EXPECT_EQ(env.error_message, "bpftool missing: PATH");
}

TEST(EnvelopeTest, TimestampIsIsoUtcWithMicroseconds)
{
    const Envelope env = make_success("X", "{}");
    static const std::regex kIso(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6}Z$)");
    EXPECT_TRUE(std::regex_match(env.timestamp, kIso)) << env.timestamp;
}

TEST(EnvelopeTest, MessageIsEscaped)
{
    const Envelope env = make_failure("X", ErrorCode::ExecutionFailure, "bad \"quote\"\n");
    std::string raw;
    ASSERT_TRUE(find_json_member(to_json(env), "error", raw));
    std::string message;
    ASSERT_TRUE(extract_json_string(raw, "message", message));
    EXPECT_EQ(message, "bad \"quote\"\n");
}

TEST(EnvelopeTest, GuardedSnapshotConvertsExceptions)
{
    const Envelope env = guarded_snapshot("PROCESSES", []() -> Envelope { throw std::runtime_error("boom"); });
    EXPECT_FALSE(env.ok());
    EXPECT_EQ(env.subtype, "PROCESSES");
    EXPECT_EQ(env.error_code, ErrorCode::ExecutionFailure);
    EXPECT_NE(env.error_message.find("boom"), std::string::npos);
}

TEST(EnvelopeTest, GuardedSnapshotMapsBadAlloc)
{
    const Envelope env = guarded_snapshot("PROCESSES", []() -> Envelope { throw std::bad_alloc(); });
    EXPECT_EQ(env.error_code, ErrorCode::MemoryAllocationFailure);
}

TEST(EnvelopeTest, GuardedSnapshotCatchesNonStandardExceptions)
{
    const Envelope env = guarded_snapshot("THREADS", []() -> Envelope { throw 42; });
    EXPECT_FALSE(env.ok());
    EXPECT_EQ(env.subtype, "THREADS");
    EXPECT_EQ(env.error_code, ErrorCode::ExecutionFailure);
    EXPECT_NE(env.error_message.find("Unknown exception"), std::string::npos);
}

TEST(JsonEscapeTest, KeepsWellFormedUtf8)
{
    EXPECT_EQ(json_escape("caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x90\xa7"), "caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x90\xa7");
}

TEST(JsonEscapeTest, ReplacesEachInvalidByte)
{
    EXPECT_EQ(json_escape("bad\xff\xfename"), "bad\\ufffd\\ufffdname");
    // Truncated sequence, overlong '/', UTF-16 surrogate, above U+10FFFF.
    EXPECT_EQ(json_escape("a\xc3"), "a\\ufffd");
    EXPECT_EQ(json_escape("\xc0\xaf"), "\\ufffd\\ufffd");
    EXPECT_EQ(json_escape("\xed\xa0\x80"), "\\ufffd\\ufffd\\ufffd");
    EXPECT_EQ(json_escape("\xf4\x90\x80\x80"), "\\ufffd\\ufffd\\ufffd\\ufffd");
}

TEST(JsonEscapeTest, EnvelopeWithRawKernelBytesIsValidJson)
{
    const std::string comm = std::string("worker\xff\x01") + "\xc3\xa9\"";
    const std::string data = "{\"name\":" + json_quote(comm) + "}";
    const std::string json = to_json(make_success("PROCESSES", data));
    std::string error;
    EXPECT_TRUE(testing_support::is_valid_json(json, error)) << error << ": " << json;

    const std::string failure = to_json(make_failure("PROCESSES", ErrorCode::IoFailure, "cannot read " + comm));
    EXPECT_TRUE(testing_support::is_valid_json(failure, error)) << error;
}

TEST(ErrorCodeTest, WireValuesAreStable)
{
    EXPECT_EQ(static_cast<int>(ErrorCode::MemoryAllocationFailure), 0);
    EXPECT_EQ(static_cast<int>(ErrorCode::InvalidArguments), 1);
    EXPECT_EQ(static_cast<int>(ErrorCode::VmiOpFailure), 2);
    EXPECT_EQ(static_cast<int>(ErrorCode::ToolNotAvailable), 1000);
    EXPECT_EQ(static_cast<int>(ErrorCode::ExecutionFailure), 1001);
    EXPECT_EQ(static_cast<int>(ErrorCode::IoFailure), 1002);
}

TEST(ErrorCodeTest, SystemErrorsMapOntoTaxonomy)
{
    EXPECT_EQ(Error::system(ENOENT, "x").code(), ErrorCode::IoFailure);
    EXPECT_EQ(Error::system(EACCES, "x").code(), ErrorCode::IoFailure);
    EXPECT_EQ(Error::system(EPERM, "x").code(), ErrorCode::IoFailure);
    EXPECT_EQ(Error::system(ENOMEM, "x").code(), ErrorCode::MemoryAllocationFailure);
    EXPECT_EQ(Error::system(EINVAL, "x").code(), ErrorCode::ExecutionFailure);
}

TEST(ResultTest, TryPropagatesError)
{
    auto inner = []() -> Result<void> { return Error(ErrorCode::InvalidArguments, "nope"); };
    auto outer = [&]() -> Result<int> {
        TRY(inner());
        return 1;
    };
    auto r = outer();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code(), ErrorCode::InvalidArguments);
}

} // namespace
} // namespace hostscope
