#include <gtest/gtest.h>

#include <optional>
#include <vector>

#include "AnalysisErrors.hh"
#include "NormalisationService.hh"

using trigeff::DatasetSummary;
using trigeff::NormalisationResult;
using trigeff::NormalisationService;
using trigeff::RunMetadata;

TEST(NormalisationService, SummariseAddsRuns)
{
    const std::vector<RunMetadata> runs = {{1000, 950.0}, {500, -20.0}, {0, 0.0}};
    const DatasetSummary s = NormalisationService::summarise(runs);

    EXPECT_EQ(s.total_gen_event_count, 1500);
    EXPECT_DOUBLE_EQ(s.total_gen_sumw, 930.0);
    EXPECT_EQ(s.n_runs, 3);
}

TEST(NormalisationService, NegativeSumwIsPreserved)
{
    const DatasetSummary s = NormalisationService::summarise({{10, -4.5}});
    const NormalisationResult r = NormalisationService::normalise(s, 10, std::nullopt);

    EXPECT_DOUBLE_EQ(r.sumw, -4.5);
}

TEST(NormalisationService, NoCapLeavesSumUnchanged)
{
    const DatasetSummary s = NormalisationService::summarise({{1000, 950.0}});
    const NormalisationResult r = NormalisationService::normalise(s, 1000, std::nullopt);

    EXPECT_DOUBLE_EQ(r.sumw, 950.0);
    EXPECT_EQ(r.effective_entries, 1000);
    EXPECT_FALSE(r.scaled);
}

TEST(NormalisationService, CapAboveEntriesLeavesSumUnchanged)
{
    const DatasetSummary s = NormalisationService::summarise({{1000, 950.0}});

    EXPECT_DOUBLE_EQ(NormalisationService::normalise(s, 1000, 1000LL).sumw, 950.0);
    EXPECT_DOUBLE_EQ(NormalisationService::normalise(s, 1000, 5000LL).sumw, 950.0);
    EXPECT_FALSE(NormalisationService::normalise(s, 1000, 5000LL).scaled);
}

TEST(NormalisationService, CapBelowEntriesScalesDown)
{
    const DatasetSummary s = NormalisationService::summarise({{1000, 950.0}});
    const NormalisationResult r = NormalisationService::normalise(s, 1000, 500LL);

    EXPECT_DOUBLE_EQ(r.sumw, 475.0);
    EXPECT_EQ(r.effective_entries, 500);
    EXPECT_TRUE(r.scaled);
}

TEST(NormalisationService, ScalingIsIdempotent)
{
    const DatasetSummary s = NormalisationService::summarise({{7000, 6321.25}, {3000, 2011.5}});
    const NormalisationResult first = NormalisationService::normalise(s, 9731, 1234LL);

    DatasetSummary rescaled = s;
    rescaled.total_gen_sumw = first.sumw;
    const NormalisationResult second =
        NormalisationService::normalise(rescaled, first.effective_entries, first.effective_entries);

    EXPECT_EQ(second.sumw, first.sumw);
    EXPECT_EQ(second.effective_entries, first.effective_entries);
    EXPECT_FALSE(second.scaled);
}

TEST(NormalisationService, CapWithoutEntriesThrows)
{
    const DatasetSummary s = NormalisationService::summarise({{1000, 950.0}});

    EXPECT_THROW(NormalisationService::normalise(s, 0, 500LL), trigeff::ConfigurationError);
    EXPECT_THROW(NormalisationService::normalise(s, 1000, 0LL), trigeff::ConfigurationError);
    EXPECT_THROW(NormalisationService::normalise(s, 1000, -5LL), trigeff::ConfigurationError);
    EXPECT_NO_THROW(NormalisationService::normalise(s, 0, std::nullopt));
}
