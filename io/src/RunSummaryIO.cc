/* -- C++ -- */
/**
 *  @file  io/src/RunSummaryIO.cc
 *
 *  @brief Implementation for runs tree scanning.
 */

#include "RunSummaryIO.hh"

#include <TChain.h>
#include <TFile.h>
#include <TLeaf.h>
#include <TTree.h>

#include <memory>

#include "AnalysisErrors.hh"

namespace trigeff
{

std::vector<RunMetadata> RunSummaryIO::read(const std::vector<std::string> &files,
                                            const RunTreeConfig &config)
{
    if (files.empty())
    {
        throw ConfigurationError("Run summary requires at least one input file.");
    }

    bool found = false;
    for (const auto &f : files)
    {
        std::unique_ptr<TFile> file(TFile::Open(f.c_str(), "READ"));
        if (!file || file->IsZombie())
        {
            throw ConfigurationError("Failed to open input ROOT file: " + f);
        }
        if (dynamic_cast<TTree *>(file->Get(config.tree_name.c_str())))
        {
            found = true;
        }
    }
    if (!found)
    {
        throw ConfigurationError("No input files contained a '" + config.tree_name + "' tree.");
    }

    TChain chain(config.tree_name.c_str());
    for (const auto &f : files)
    {
        chain.Add(f.c_str());
    }

    if (!chain.GetBranch(config.count_branch.c_str()))
    {
        throw MissingFieldError(config.count_branch, config.tree_name + " tree");
    }
    if (!chain.GetBranch(config.sumw_branch.c_str()))
    {
        throw MissingFieldError(config.sumw_branch, config.tree_name + " tree");
    }

    // NanoAOD stores genEventCount as Long64_t and genEventSumw as Double_t.
    Long64_t count = 0;
    Double_t sumw = 0.0;
    chain.SetBranchAddress(config.count_branch.c_str(), &count);
    chain.SetBranchAddress(config.sumw_branch.c_str(), &sumw);

    const Long64_t n = chain.GetEntries();
    std::vector<RunMetadata> out;
    out.reserve(static_cast<size_t>(n));

    for (Long64_t i = 0; i < n; ++i)
    {
        if (chain.GetEntry(i) <= 0)
        {
            throw ConfigurationError("Failed to read entry " + std::to_string(i) +
                                     " from tree '" + config.tree_name + "'");
        }
        out.push_back(RunMetadata{static_cast<long long>(count), static_cast<double>(sumw)});
    }

    chain.ResetBranchAddresses();
    return out;
}

} // namespace trigeff
