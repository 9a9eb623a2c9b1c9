#include <gtest/gtest.h>

#include <TFile.h>
#include <TTree.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "AnalysisErrors.hh"
#include "EfficiencyAnalysis.hh"
#include "EventTreeSource.hh"
#include "RunSummaryIO.hh"

using trigeff::EventRecord;
using trigeff::EventTreeConfig;
using trigeff::EventTreeSource;
using trigeff::RunMetadata;
using trigeff::RunSummaryIO;
using trigeff::RunTreeConfig;
using trigeff::TriggerSet;

namespace
{

class EventTreeSourceTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        dir = std::filesystem::temp_directory_path() /
              ("trigeff_test_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(dir);
        path = (dir / "nano.root").string();
        write_file(path);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    // Same content as the five record scenario, with two runs.
    static void write_file(const std::string &out)
    {
        std::unique_ptr<TFile> f(TFile::Open(out.c_str(), "RECREATE"));
        ASSERT_TRUE(f && !f->IsZombie());

        // Both trees are owned by the file and deleted on Close.
        auto *events = new TTree("Events", "Events");
        Bool_t a = false;
        Bool_t b = false;
        Int_t reference = 0;
        Float_t weight = 0.f;
        Float_t soft = 0.f;
        events->Branch("HLT_A", &a, "HLT_A/O");
        events->Branch("HLT_B", &b, "HLT_B/O");
        events->Branch("HLT_passZZ4l", &reference, "HLT_passZZ4l/I");
        events->Branch("overallEventWeight", &weight, "overallEventWeight/F");
        events->Branch("HLT_Soft", &soft, "HLT_Soft/F");

        const bool as[] = {true, false, false, true, false};
        const bool bs[] = {false, false, false, true, false};
        const int refs[] = {1, 1, 1, 0, 1};
        const float ws[] = {1.f, 2.f, 1.f, 5.f, 3.f};
        const float softs[] = {0.f, 0.5f, 0.f, 0.f, 0.25f};
        for (int i = 0; i < 5; ++i)
        {
            a = as[i];
            b = bs[i];
            reference = refs[i];
            weight = ws[i];
            soft = softs[i];
            events->Fill();
        }

        auto *runs = new TTree("Runs", "Runs");
        Long64_t count = 0;
        Double_t sumw = 0.0;
        runs->Branch("genEventCount", &count, "genEventCount/L");
        runs->Branch("genEventSumw", &sumw, "genEventSumw/D");
        count = 3;
        sumw = 7.5;
        runs->Fill();
        count = 2;
        sumw = 4.5;
        runs->Fill();

        f->Write();
        f->Close();
    }

    std::filesystem::path dir;
    std::string path;
    const TriggerSet triggers{std::vector<std::string>{"HLT_A", "HLT_B"}};
};

EventTreeConfig tree_config()
{
    EventTreeConfig cfg;
    cfg.tree_name = "Events";
    cfg.reference_flag = "HLT_passZZ4l";
    cfg.weight_branch = "overallEventWeight";
    return cfg;
}

}

TEST_F(EventTreeSourceTest, ReadsFlagsAndWeights)
{
    EventTreeSource source({path}, triggers, tree_config());
    EXPECT_EQ(source.entries(), 5);

    std::vector<EventRecord> records;
    EventRecord record;
    while (source.next(record))
    {
        records.push_back(record);
    }

    ASSERT_EQ(records.size(), 5u);
    EXPECT_TRUE(records[0].fired("HLT_A"));
    EXPECT_FALSE(records[0].fired("HLT_B"));
    EXPECT_EQ(records[3].flag("HLT_passZZ4l"), 0.0);
    EXPECT_TRUE(records[3].fired("HLT_B"));
    EXPECT_DOUBLE_EQ(records[4].weight(), 3.0);
}

TEST_F(EventTreeSourceTest, FloatFlagBelowOneCountsAsFired)
{
    const TriggerSet soft_only({"HLT_Soft"});
    EventTreeSource source({path}, soft_only, tree_config());

    std::vector<bool> fired;
    EventRecord record;
    while (source.next(record))
    {
        fired.push_back(record.fired("HLT_Soft"));
    }

    const std::vector<bool> expected = {false, true, false, false, true};
    EXPECT_EQ(fired, expected);
}

TEST_F(EventTreeSourceTest, EntryRangeSelectsChunk)
{
    EventTreeSource source({path}, triggers, tree_config(), 1, 3);

    EventRecord record;
    int n = 0;
    while (source.next(record))
    {
        ++n;
    }
    EXPECT_EQ(n, 2);
    EXPECT_EQ(source.entries(), 5);
}

TEST_F(EventTreeSourceTest, MissingBranchIsMissingField)
{
    const TriggerSet with_missing({"HLT_A", "HLT_DoesNotExist"});
    EXPECT_THROW(EventTreeSource({path}, with_missing, tree_config()), trigeff::MissingFieldError);

    EventTreeConfig cfg = tree_config();
    cfg.weight_branch = "genWeight";
    EXPECT_THROW(EventTreeSource({path}, triggers, cfg), trigeff::MissingFieldError);
}

TEST_F(EventTreeSourceTest, MissingFileIsConfigurationError)
{
    EXPECT_THROW(EventTreeSource({(dir / "absent.root").string()}, triggers, tree_config()),
                 trigeff::ConfigurationError);
}

TEST_F(EventTreeSourceTest, RunSummaryReadsEveryRun)
{
    const std::vector<RunMetadata> runs = RunSummaryIO::read({path}, RunTreeConfig{});

    ASSERT_EQ(runs.size(), 2u);
    EXPECT_EQ(runs[0].gen_event_count, 3);
    EXPECT_DOUBLE_EQ(runs[1].gen_event_sumw, 4.5);

    RunTreeConfig bad;
    bad.sumw_branch = "genEventSumw2";
    EXPECT_THROW(RunSummaryIO::read({path}, bad), trigeff::MissingFieldError);
}

TEST_F(EventTreeSourceTest, FullAnalysisOverFile)
{
    EventTreeSource source({path}, triggers, tree_config());
    const std::vector<RunMetadata> runs = RunSummaryIO::read({path}, RunTreeConfig{});

    trigeff::AnalysisOptions options;
    options.reference_flag = "HLT_passZZ4l";
    const trigeff::AnalysisResult r = trigeff::EfficiencyAnalysis::run(source, triggers, runs, std::nullopt, options);

    EXPECT_EQ(r.selection.total_seen, 5);
    EXPECT_EQ(r.selection.total_passed, 1);
    EXPECT_DOUBLE_EQ(r.selection.weighted_passed, 1.0);
    EXPECT_DOUBLE_EQ(r.normalisation.sumw, 12.0);
    ASSERT_TRUE(r.normalised_efficiency.ok());
    EXPECT_DOUBLE_EQ(r.normalised_efficiency.result->point, 1.0 / 12.0);
}
