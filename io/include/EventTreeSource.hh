/* -- C++ -- */
/**
 *  @file  io/include/EventTreeSource.hh
 *
 *  @brief Event source reading trigger flags and weights from a ROOT tree.
 */

#ifndef TRIGEFF_IO_EVENT_TREE_SOURCE_H
#define TRIGEFF_IO_EVENT_TREE_SOURCE_H

#include <TChain.h>
#include <TLeaf.h>

#include <memory>
#include <string>
#include <vector>

#include "EventSource.hh"
#include "TriggerSet.hh"

namespace trigeff
{

struct EventTreeConfig
{
    std::string tree_name = "Events";
    std::string reference_flag = "HLT_passZZ4l";
    std::string weight_branch = "overallEventWeight";
};

/**
 *  \brief Streams EventRecords from the events tree of one or more files.
 *
 *  Only the configured trigger, reference and weight branches are read.
 *  An optional entry range [first, last) restricts the scan to one chunk of
 *  the chain; last < 0 means the end of the chain.
 */
class EventTreeSource final : public EventSource
{
  public:
    EventTreeSource(const std::vector<std::string> &files,
                    const TriggerSet &triggers,
                    EventTreeConfig config,
                    long long first = 0,
                    long long last = -1);

    EventTreeSource(const EventTreeSource &) = delete;
    EventTreeSource &operator=(const EventTreeSource &) = delete;

    bool next(EventRecord &record) override;
    long long entries() const override { return m_entries; }

    long long first_entry() const noexcept { return m_first; }
    long long last_entry() const noexcept { return m_last; }

  private:
    struct Field
    {
        std::string name;
        TLeaf *leaf = nullptr;
    };

    void bind_leaves();

    std::unique_ptr<TChain> m_chain;
    EventTreeConfig m_config;
    std::vector<Field> m_flags;
    Field m_weight;

    long long m_entries = 0;
    long long m_first = 0;
    long long m_last = 0;
    long long m_cursor = 0;
    int m_tree_number = -1;
};

} // namespace trigeff

#endif // TRIGEFF_IO_EVENT_TREE_SOURCE_H
