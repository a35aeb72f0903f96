#include <gtest/gtest.h>

#include <string>

#include "core/TieredResult.hpp"
#include "report/ManifestBuilder.hpp"
#include "test_support.hpp"

using Triage::Report::ManifestBuilder;

namespace
{
    core::ClassifiedFinding classified(const std::string &id, const std::string &message, core::Tier tier)
    {
        core::ClassifiedFinding f;
        f.id         = id;
        f.message    = message;
        f.severity   = "ERROR";
        f.confidence = 0.8;
        f.jobName    = "build-linux";
        f.jobOutcome = core::JobOutcome::Failed;
        f.tier       = tier;
        return f;
    }

    core::TieredResult sampleResult()
    {
        core::TieredResult result;
        result.build.url             = "https://ci.example.com/builds/42";
        result.build.status          = "failed";
        result.build.failedJobs      = { "build-linux" };
        result.build.passedJobsCount = 3;
        result.build.timestamp       = "2024-05-21T10:00:00Z";
        return result;
    }
}

class ManifestBuilderTest : public TriageTest::QuietLogTest
{
protected:
    ManifestBuilder builder;
};

TEST_F(ManifestBuilderTest, PreservesRequestAndBuild)
{
    const auto result = sampleResult();
    const auto manifest = builder.build("req-123", result);

    EXPECT_EQ(manifest.requestId, "req-123");
    EXPECT_EQ(manifest.build.url, result.build.url);
    EXPECT_EQ(manifest.build.status, "failed");
    EXPECT_EQ(manifest.build.failedJobs, result.build.failedJobs);
    EXPECT_EQ(manifest.build.passedJobsCount, 3);
    EXPECT_EQ(manifest.build.timestamp, result.build.timestamp);
    EXPECT_TRUE(manifest.tier1Findings.empty());
    EXPECT_TRUE(manifest.otherFindings.empty());
}

TEST_F(ManifestBuilderTest, TierOneMessagesAreNormalizedButNotTruncated)
{
    auto result = sampleResult();
    const std::string longMessage =
        "2024-05-21T10:00:05Z /var/lib/jenkins/workspace/project/src/test/Suite.java:88 - assertion failed: "
        + std::string(150, 'x');
    result.tier1.push_back(classified("t1", longMessage, core::Tier::UniqueFailure));

    const auto manifest = builder.build("req-1", result);
    ASSERT_EQ(manifest.tier1Findings.size(), 1u);

    const std::string &message = manifest.tier1Findings[0].message;
    EXPECT_GT(message.size(), 100u);
    EXPECT_EQ(message.rfind(".../Suite.java:88 - assertion failed: ", 0), 0u);
    EXPECT_EQ(message.find("..."), 0u);
    EXPECT_EQ(message.substr(message.size() - 3), "xxx");
}

TEST_F(ManifestBuilderTest, TierOneContextIsNormalized)
{
    auto result = sampleResult();
    auto f = classified("t1", "boom", core::Tier::UniqueFailure);
    f.preContext = {
        "2024-05-21T10:00:01.000Z [INFO] [com.mycompany.runner.Executor] Starting test",
        "2024-05-21T10:00:02.000Z [INFO] [com.mycompany.runner.Executor] Running test",
    };
    f.postContext = { "Container abc123def456789 exited" };
    result.tier1.push_back(f);

    const auto manifest = builder.build("req-1", result);
    ASSERT_EQ(manifest.tier1Findings.size(), 1u);
    EXPECT_EQ(manifest.tier1Findings[0].preContext,
              (std::vector<std::string>{ "... Starting test", "... Running test" }));
    EXPECT_EQ(manifest.tier1Findings[0].postContext,
              (std::vector<std::string>{ "Container <HASH> exited" }));
}

TEST_F(ManifestBuilderTest, SummariesForOtherTiers)
{
    auto result = sampleResult();
    result.tier1.push_back(classified("t1", "unique", core::Tier::UniqueFailure));
    result.tier3.push_back(classified("t3", "noise", core::Tier::CommonNoise));

    const auto manifest = builder.build("req-1", result);
    ASSERT_EQ(manifest.otherFindings.size(), 1u);

    const auto &summary = manifest.otherFindings[0];
    EXPECT_EQ(summary.id, "t3");
    EXPECT_EQ(summary.tier, core::Tier::CommonNoise);
    EXPECT_EQ(summary.message, "noise");
    EXPECT_EQ(summary.severity, "ERROR");
    EXPECT_DOUBLE_EQ(summary.confidence, 0.8);
    EXPECT_EQ(summary.jobName, "build-linux");
}

TEST_F(ManifestBuilderTest, SummaryTruncation)
{
    auto result = sampleResult();
    result.tier3.push_back(classified("exact", std::string(100, 'a'), core::Tier::CommonNoise));
    result.tier3.push_back(classified("long", std::string(250, 'b'), core::Tier::CommonNoise));
    result.tier3.push_back(classified("short", "short", core::Tier::CommonNoise));

    const auto manifest = builder.build("req-1", result);
    ASSERT_EQ(manifest.otherFindings.size(), 3u);

    EXPECT_EQ(manifest.otherFindings[0].message, std::string(100, 'a'));

    const std::string &truncated = manifest.otherFindings[1].message;
    EXPECT_EQ(truncated.size(), 100u);
    EXPECT_EQ(truncated, std::string(97, 'b') + "...");

    EXPECT_EQ(manifest.otherFindings[2].message, "short");
}

TEST_F(ManifestBuilderTest, SummaryTruncationKeepsUtf8Intact)
{
    // Four two-byte characters; the 97-byte cut lands inside the second one.
    std::string message(96, 'a');
    for (int i = 0; i < 4; ++i)
        message += "\xC3\xA9";

    auto result = sampleResult();
    result.tier3.push_back(classified("accents", message, core::Tier::CommonNoise));

    const auto manifest = builder.build("req-1", result);
    ASSERT_EQ(manifest.otherFindings.size(), 1u);

    const std::string &truncated = manifest.otherFindings[0].message;
    EXPECT_EQ(truncated, std::string(96, 'a') + "...");
    EXPECT_LE(truncated.size(), 100u);
}

TEST_F(ManifestBuilderTest, TierTwoSummariesPrecedeTierThree)
{
    auto result = sampleResult();
    result.tier3.push_back(classified("noise", "noise", core::Tier::CommonNoise));
    result.tier2.push_back(classified("spike", "spike", core::Tier::FrequencySpike));

    const auto manifest = builder.build("req-1", result);
    ASSERT_EQ(manifest.otherFindings.size(), 2u);
    EXPECT_EQ(manifest.otherFindings[0].id, "spike");
    EXPECT_EQ(manifest.otherFindings[1].id, "noise");
}

TEST_F(ManifestBuilderTest, CustomSummaryLimit)
{
    const ManifestBuilder shortBuilder(10);
    auto result = sampleResult();
    result.tier3.push_back(classified("t3", "0123456789abcdef", core::Tier::CommonNoise));

    const auto manifest = shortBuilder.build("req-1", result);
    ASSERT_EQ(manifest.otherFindings.size(), 1u);
    EXPECT_EQ(manifest.otherFindings[0].message, "0123456...");
}

TEST_F(ManifestBuilderTest, InputIsNotModified)
{
    auto result = sampleResult();
    result.tier1.push_back(classified("t1", "2024-05-21T10:00:05Z Container abc123def456789 crashed",
                                      core::Tier::UniqueFailure));
    const auto before = result.tier1[0].message;

    builder.build("req-1", result);
    EXPECT_EQ(result.tier1[0].message, before);
}
