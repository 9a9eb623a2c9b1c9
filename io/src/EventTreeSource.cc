/* -- C++ -- */
/**
 *  @file  io/src/EventTreeSource.cc
 *
 *  @brief Implementation for the ROOT events tree source.
 */

#include "EventTreeSource.hh"

#include <TBranch.h>
#include <TFile.h>
#include <TTree.h>

#include <algorithm>
#include <utility>

#include "AnalysisErrors.hh"

namespace trigeff
{

EventTreeSource::EventTreeSource(const std::vector<std::string> &files,
                                 const TriggerSet &triggers,
                                 EventTreeConfig config,
                                 long long first,
                                 long long last)
    : m_config(std::move(config))
{
    if (files.empty())
    {
        throw ConfigurationError("Event source requires at least one input file.");
    }
    if (triggers.empty())
    {
        throw ConfigurationError("Event source requires a non-empty trigger set.");
    }

    for (const auto &f : files)
    {
        std::unique_ptr<TFile> file(TFile::Open(f.c_str(), "READ"));
        if (!file || file->IsZombie())
        {
            throw ConfigurationError("Failed to open input ROOT file: " + f);
        }
        if (!dynamic_cast<TTree *>(file->Get(m_config.tree_name.c_str())))
        {
            throw ConfigurationError("Tree '" + m_config.tree_name + "' not found in " + f);
        }
    }

    m_chain = std::make_unique<TChain>(m_config.tree_name.c_str());
    for (const auto &f : files)
    {
        m_chain->Add(f.c_str());
    }

    for (const auto &name : triggers)
    {
        m_flags.push_back(Field{name, nullptr});
    }
    if (!triggers.contains(m_config.reference_flag))
    {
        m_flags.push_back(Field{m_config.reference_flag, nullptr});
    }
    m_weight.name = m_config.weight_branch;

    m_entries = static_cast<long long>(m_chain->GetEntries());
    m_first = std::max(0LL, first);
    m_last = (last < 0) ? m_entries : std::min(last, m_entries);
    if (m_first > m_last)
    {
        m_first = m_last;
    }
    m_cursor = m_first;

    if (m_cursor < m_last)
    {
        m_chain->LoadTree(m_cursor);
        bind_leaves();
    }
}

void EventTreeSource::bind_leaves()
{
    TTree *tree = m_chain->GetTree();
    const std::string where = (tree && tree->GetCurrentFile())
                                  ? std::string(tree->GetCurrentFile()->GetName())
                                  : m_config.tree_name;

    auto bind = [tree, &where](Field &field)
    {
        field.leaf = tree ? tree->GetLeaf(field.name.c_str()) : nullptr;
        if (!field.leaf)
        {
            throw MissingFieldError(field.name, where);
        }
    };

    for (auto &field : m_flags)
    {
        bind(field);
    }
    bind(m_weight);

    m_tree_number = m_chain->GetTreeNumber();
}

bool EventTreeSource::next(EventRecord &record)
{
    if (m_cursor >= m_last)
    {
        return false;
    }

    const Long64_t local = m_chain->LoadTree(m_cursor);
    if (local < 0)
    {
        throw ConfigurationError("Failed to load entry " + std::to_string(m_cursor) +
                                 " from tree '" + m_config.tree_name + "'");
    }
    if (m_chain->GetTreeNumber() != m_tree_number)
    {
        bind_leaves();
    }

    EventRecord::FlagMap flags;
    for (const auto &field : m_flags)
    {
        field.leaf->GetBranch()->GetEntry(local);
        flags.emplace(field.name, field.leaf->GetValue());
    }
    m_weight.leaf->GetBranch()->GetEntry(local);
    const double weight = m_weight.leaf->GetValue();

    record = EventRecord(std::move(flags), weight);
    ++m_cursor;
    return true;
}

} // namespace trigeff
