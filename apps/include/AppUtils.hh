/* -- C++ -- */
/**
 *  @file  apps/include/AppUtils.hh
 *
 *  @brief Shared helpers for command-line drivers: argument handling,
 *         guarded execution, input list resolution and progress reporting.
 */
#ifndef TRIGEFF_APPS_APP_UTILS_H
#define TRIGEFF_APPS_APP_UTILS_H

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <functional>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "AppLog.hh"

namespace trigeff
{

namespace app
{

inline std::string trim(std::string s)
{
    auto notspace = [](unsigned char c)
    {
        return std::isspace(c) == 0;
    };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notspace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notspace).base(), s.end());
    return s;
}

inline std::vector<std::string> collect_args(int argc, char **argv, int start_index = 1)
{
    std::vector<std::string> args;
    if (argc <= start_index)
    {
        return args;
    }
    args.reserve(static_cast<size_t>(argc - start_index));
    for (int i = start_index; i < argc; ++i)
    {
        args.emplace_back(argv[i]);
    }
    return args;
}

inline bool ends_with(const std::string &s, const std::string &suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline long long parse_count(const std::string &text, const std::string &what)
{
    const std::string value = trim(text);
    if (value.empty())
    {
        throw std::runtime_error("Empty value for " + what);
    }
    char *end = nullptr;
    errno = 0;
    const long long out = std::strtoll(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0')
    {
        throw std::runtime_error("Invalid integer for " + what + ": " + value);
    }
    return out;
}

inline int run_guarded(const std::string &log_prefix, const std::function<int()> &func)
{
    try
    {
        return func();
    }
    catch (const std::exception &e)
    {
        trigeff::app::log::log_error(log_prefix, std::string("fatal_error=") + e.what());
        return 1;
    }
}

inline std::vector<std::string> read_paths(const std::string &filelist_path)
{
    std::ifstream fin(filelist_path);
    if (!fin)
    {
        throw std::runtime_error("Failed to open filelist: " + filelist_path +
                                 " (errno=" + std::to_string(errno) + " " + std::strerror(errno) + ")");
    }
    std::vector<std::string> files;
    std::string line;
    while (std::getline(fin, line))
    {
        line = trim(line);
        if (line.empty() || line[0] == '#')
        {
            continue;
        }
        files.push_back(line);
    }
    if (files.empty())
    {
        throw std::runtime_error("Filelist is empty: " + filelist_path);
    }
    return files;
}

/// A single .root path, or a file list naming one input per line.
inline std::vector<std::string> resolve_inputs(const std::string &input)
{
    if (ends_with(input, ".root"))
    {
        return {input};
    }
    return read_paths(input);
}

class StatusMonitor
{
public:
    StatusMonitor(const std::string &log_prefix,
                  const std::string &message,
                  const std::chrono::seconds interval = std::chrono::minutes(1))
        : log_prefix_(log_prefix),
          message_(message),
          interval_(interval),
          start_time_(std::chrono::steady_clock::now()),
          worker_(&StatusMonitor::run_loop, this)
    {
    }

    ~StatusMonitor()
    {
        stop();
    }

    StatusMonitor(const StatusMonitor &) = delete;
    StatusMonitor &operator=(const StatusMonitor &) = delete;

    void stop()
    {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            done_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

private:
    void run_loop()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!done_)
        {
            if (cv_.wait_for(lock, interval_, [this]() { return done_; }))
            {
                break;
            }
            const auto elapsed = std::chrono::steady_clock::now() - start_time_;
            std::ostringstream out;
            out << message_
                << " elapsed=" << std::chrono::duration_cast<std::chrono::seconds>(elapsed).count() << "s";
            trigeff::app::log::log_info(log_prefix_, out.str());
        }
    }

    std::string log_prefix_;
    std::string message_;
    std::chrono::seconds interval_;
    std::chrono::steady_clock::time_point start_time_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
    std::thread worker_;
};

} // namespace app

} // namespace trigeff

#endif // TRIGEFF_APPS_APP_UTILS_H
