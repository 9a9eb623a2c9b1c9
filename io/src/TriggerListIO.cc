/* -- C++ -- */
/**
 *  @file  io/src/TriggerListIO.cc
 *
 *  @brief Implementation for trigger list reading.
 */

#include "TriggerListIO.hh"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

#include "AnalysisErrors.hh"

namespace trigeff
{

TriggerSet TriggerListIO::read(const std::string &path)
{
    std::ifstream fin(path);
    if (!fin)
    {
        throw ConfigurationError("Failed to open trigger list: " + path +
                                 " (errno=" + std::to_string(errno) + " " + std::strerror(errno) + ")");
    }
    return read(fin, path);
}

TriggerSet TriggerListIO::read(std::istream &in, const std::string &source_name)
{
    std::vector<std::string> names;
    std::string line;
    while (std::getline(in, line))
    {
        const auto pos = line.find_first_not_of(" \t\r");
        if (pos == std::string::npos || line[pos] == '#')
        {
            continue;
        }
        names.push_back(line);
    }

    if (names.empty())
    {
        throw ConfigurationError("The trigger list is empty or contains only whitespace: " + source_name);
    }
    return TriggerSet(names);
}

} // namespace trigeff
