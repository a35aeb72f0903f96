#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "analysis/PatternNormalizer.hpp"

using Triage::Analysis::MaskingLevel;
using Triage::Analysis::PatternNormalizer;

namespace
{
    std::string present(const std::string &line)
    {
        return PatternNormalizer::normalize(line, MaskingLevel::Presentation);
    }

    std::string recur(const std::string &line)
    {
        return PatternNormalizer::normalize(line, MaskingLevel::Recurrence);
    }
}

// ---------- Presentation ----------

TEST(PresentationNormalize, CompressesLongPathToFileAndLine)
{
    EXPECT_EQ(present("/var/lib/jenkins/workspace/pipeline-123/src/test/java/com/app/AuthTest.java:45 - failed"),
              ".../AuthTest.java:45 - failed");
}

TEST(PresentationNormalize, MasksLongHash)
{
    EXPECT_EQ(present("Container abc123def456789 failed to start"), "Container <HASH> failed to start");
}

TEST(PresentationNormalize, MasksUuid)
{
    EXPECT_EQ(present("Request 550e8400-e29b-41d4-a716-446655440000 failed"), "Request <UUID> failed");
}

TEST(PresentationNormalize, MasksHexAddress)
{
    EXPECT_EQ(present("Pointer at 0x7fff5fbff8c0 is nil"), "Pointer at <HEX> is nil");
}

TEST(PresentationNormalize, HexRuleWinsOverHashForShortHexLiteral)
{
    EXPECT_EQ(present("Error code 0x1234 returned"), "Error code <HEX> returned");
}

TEST(PresentationNormalize, KeepsPlainNumbers)
{
    EXPECT_EQ(present("Error code 42 on line 100"), "Error code 42 on line 100");
    EXPECT_EQ(present("Error at main.go:42"), "Error at main.go:42");
}

TEST(PresentationNormalize, CollapsesWhitespace)
{
    EXPECT_EQ(present("Error    in     module"), "Error in module");
    EXPECT_EQ(present("  \tpadded line \t "), "padded line");
}

TEST(PresentationNormalize, CombinedTransforms)
{
    EXPECT_EQ(present("2024-05-21T10:00:05Z /var/lib/long/path/to/file.go:42 - Container abc123def456789 crashed"),
              ".../file.go:42 - Container <HASH> crashed");
}

TEST(PresentationNormalize, StripsLeadingTimestampVariants)
{
    EXPECT_EQ(present("2024-05-21T10:00:05.123Z Connection failed"), "Connection failed");
    EXPECT_EQ(present("2024-05-21 10:00:05,123 Connection failed"), "Connection failed");
    EXPECT_EQ(present("2024-05-21T10:00:05+00:00 Connection failed"), "Connection failed");
}

TEST(PresentationNormalize, StripsTimestampBeforeLevelTag)
{
    const auto out = PatternNormalizer::normalizeLines({ "2024-05-21T10:00:05.123Z [ERROR] Connection failed" },
                                                       MaskingLevel::Presentation);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], "[ERROR] Connection failed");
}

TEST(PresentationNormalize, KeepsMidLineTimestamp)
{
    const std::string line = "Deadline 2024-05-21T10:00:05Z exceeded";
    EXPECT_EQ(present(line), line);
}

TEST(PresentationNormalize, LeadingWindowMeasuredAfterWhitespaceCollapse)
{
    // Offset 5 in the raw line, 4 once the double space collapses.
    const std::string line = "abc  2024-05-21T10:00:05Z msg";
    EXPECT_EQ(present(line), "msg");
    EXPECT_EQ(present(present(line)), present(line));

    EXPECT_EQ(present("abcde 2024-05-21T10:00:05Z msg"), "abcde 2024-05-21T10:00:05Z msg");
}

TEST(PresentationNormalize, EmptyInput)
{
    EXPECT_EQ(present(""), "");
    EXPECT_EQ(present("   "), "");
}

TEST(PresentationNormalize, IsIdempotent)
{
    const std::vector<std::string> lines {
        "2024-05-21T10:00:05Z /var/lib/long/path/to/file.go:42 - Container abc123def456789 crashed",
        "2024-05-21T10:00:05Z 2024-05-21T10:00:06Z stacked timestamps",
        "a      2024-05-21T10:00:05Z wide gap before timestamp",
        "Request 550e8400-e29b-41d4-a716-446655440000 at 0xdeadbeef",
        "/opt/build/cache/deadbeefdeadbeef00/output/abcdef0123456789.log:7 missing",
        "plain message with   spaces",
    };

    for (const auto &line : lines)
    {
        const std::string once = present(line);
        EXPECT_EQ(present(once), once) << "input: " << line;
    }
}

// ---------- Recurrence ----------

TEST(RecurrenceNormalize, MasksTimestampAnywhere)
{
    EXPECT_EQ(recur("2024-05-21T10:00:05Z Connection failed"), "[TIMESTAMP] Connection failed");
    EXPECT_EQ(recur("retry at 2024-05-21 10:00:05 failed"), "retry at [TIMESTAMP] failed");
}

TEST(RecurrenceNormalize, MasksPath)
{
    EXPECT_EQ(recur("/var/lib/jenkins/workspace/src/main.go:42 - error"), "[PATH] - error");
}

TEST(RecurrenceNormalize, MasksNumbers)
{
    EXPECT_EQ(recur("Error code 42 on line 100"), "Error code [NUM] on line [NUM]");
    EXPECT_EQ(recur("Error at main.go:42"), "Error at main.go:[NUM]");
}

TEST(RecurrenceNormalize, MasksUuidHexAndHash)
{
    EXPECT_EQ(recur("Request 550e8400-e29b-41d4-a716-446655440000 failed"), "Request [UUID] failed");
    EXPECT_EQ(recur("Pointer at 0x7fff5fbff8c0 is nil"), "Pointer at [HEX] is nil");
    EXPECT_EQ(recur("Error code 0x1234 returned"), "Error code [HEX] returned");
    EXPECT_EQ(recur("Container abc123def456789 failed"), "Container <HASH> failed");
}

TEST(RecurrenceNormalize, CombinedTransforms)
{
    EXPECT_EQ(recur("2024-05-21T10:00:05Z Error on line 42: /var/lib/path/file.go"),
              "[TIMESTAMP] Error on line [NUM]: [PATH]");
}

TEST(RecurrenceNormalize, GroupsVariantsOfTheSameError)
{
    EXPECT_EQ(recur("2024-05-21T10:00:05Z Timeout after 30 s in /srv/app/a/b/handler.go:17"),
              recur("2024-06-01T23:59:59Z Timeout after 45 s in /srv/app/c/d/handler.go:99"));
}

// ---------- Blocks of lines ----------

TEST(NormalizeLines, RemovesCommonPrefix)
{
    const std::vector<std::string> lines {
        "2024-05-21T10:00:01.000Z [INFO] [com.mycompany.runner.Executor] Starting test",
        "2024-05-21T10:00:02.000Z [INFO] [com.mycompany.runner.Executor] Running test",
        "2024-05-21T10:00:03.000Z [INFO] [com.mycompany.runner.Executor] Test failed",
    };

    const auto out = PatternNormalizer::normalizeLines(lines, MaskingLevel::Presentation);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0], "... Starting test");
    EXPECT_EQ(out[1], "... Running test");
    EXPECT_EQ(out[2], "... Test failed");
}

TEST(NormalizeLines, LongStructuredLoggerPrefix)
{
    const std::string prefix = "worker-pool-7 [org.example.integration.runner.PipelineStage] ";
    ASSERT_GE(prefix.size(), 60u);

    const std::vector<std::string> lines { prefix + "alpha", prefix + "beta", prefix + "gamma" };
    const auto out = PatternNormalizer::normalizeLines(lines, MaskingLevel::Presentation);
    EXPECT_EQ(out, (std::vector<std::string>{ "... alpha", "... beta", "... gamma" }));
}

TEST(NormalizeLines, ShortPrefixIsKept)
{
    const std::vector<std::string> lines { "[INFO] Start", "[INFO] Stop" };
    EXPECT_EQ(PatternNormalizer::normalizeLines(lines, MaskingLevel::Presentation), lines);

    const std::vector<std::string> tenShared { "0123456789 first line", "0123456789 other line" };
    EXPECT_EQ(PatternNormalizer::normalizeLines(tenShared, MaskingLevel::Presentation), tenShared);
}

TEST(NormalizeLines, RecurrenceModeSkipsPrefixElision)
{
    const std::vector<std::string> lines {
        "[INFO] [com.mycompany.runner.Executor] Starting test",
        "[INFO] [com.mycompany.runner.Executor] Running test",
    };
    const auto out = PatternNormalizer::normalizeLines(lines, MaskingLevel::Recurrence);
    EXPECT_EQ(out, lines);
}

TEST(NormalizeLines, EmptyAndSingle)
{
    EXPECT_TRUE(PatternNormalizer::normalizeLines({}, MaskingLevel::Presentation).empty());

    const auto single = PatternNormalizer::normalizeLines(
        { "2024-05-21T10:00:01Z [INFO] [com.mycompany.runner.Executor] only line" },
        MaskingLevel::Presentation);
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0], "[INFO] [com.mycompany.runner.Executor] only line");
}

TEST(FindCommonPrefix, FindsSharedPrefix)
{
    const std::vector<std::string> lines {
        "[INFO] [com.mycompany.runner.Executor] Starting test",
        "[INFO] [com.mycompany.runner.Executor] Running test",
        "[INFO] [com.mycompany.runner.Executor] Test failed",
    };
    EXPECT_EQ(PatternNormalizer::findCommonPrefix(lines), "[INFO] [com.mycompany.runner.Executor] ");
}

TEST(FindCommonPrefix, BelowMinimumIsEmpty)
{
    EXPECT_EQ(PatternNormalizer::findCommonPrefix({ "[INFO] Start", "[INFO] Stop" }), "");
    EXPECT_EQ(PatternNormalizer::findCommonPrefix({ "only one line that is long enough" }), "");
    EXPECT_EQ(PatternNormalizer::findCommonPrefix({ "abc", "" }), "");
}

TEST(PatternNormalizerThreads, ConcurrentCallsAgree)
{
    const std::string line = "2024-05-21T10:00:05Z /var/lib/long/path/to/file.go:42 - Container abc123def456789 crashed";
    const std::string expected = present(line);

    std::vector<std::thread> workers;
    std::vector<int> mismatches(4, 0);
    for (int t = 0; t < 4; ++t)
    {
        workers.emplace_back([&, t]()
        {
            for (int i = 0; i < 200; ++i)
            {
                if (present(line) != expected)
                    ++mismatches[static_cast<std::size_t>(t)];
            }
        });
    }
    for (auto &w : workers)
        w.join();

    for (int m : mismatches)
        EXPECT_EQ(m, 0);
}
