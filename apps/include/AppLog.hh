/* -- C++ -- */
/**
 *  @file  apps/include/AppLog.hh
 *
 *  @brief Levelled stderr logging for command-line drivers.
 *
 *  Lines read "[prefix] LEVEL key=value ...". Colour is used only when
 *  stderr is a terminal and neither NO_COLOR nor TRIGEFF_NO_COLOUR is set.
 */

#ifndef TRIGEFF_APPS_APPLOG_H
#define TRIGEFF_APPS_APPLOG_H

#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include <unistd.h>

namespace trigeff
{

namespace app
{

namespace log
{

enum class Level
{
    kInfo,
    kSuccess,
    kWarn,
    kError
};

struct LevelStyle
{
    const char *label;
    const char *colour;
};

inline LevelStyle level_style(const Level level)
{
    switch (level)
    {
    case Level::kSuccess:
        return {"DONE", "\033[1;32m"};
    case Level::kWarn:
        return {"WARN", "\033[1;33m"};
    case Level::kError:
        return {"ERROR", "\033[1;31m"};
    case Level::kInfo:
    default:
        return {"INFO", "\033[1;36m"};
    }
}

inline bool use_colour()
{
    static const bool enabled = []()
    {
        if (std::getenv("NO_COLOR") != nullptr ||
            std::getenv("TRIGEFF_NO_COLOUR") != nullptr)
        {
            return false;
        }
        return ::isatty(::fileno(stderr)) != 0;
    }();
    return enabled;
}

inline std::string decorate(const std::string &text, const char *colour)
{
    if (!use_colour())
    {
        return text;
    }
    return std::string(colour) + text + "\033[0m";
}

inline std::string format_count(const long long count)
{
    std::ostringstream out;
    if (count >= 1000000)
    {
        out << std::fixed << std::setprecision(1)
            << (static_cast<double>(count) / 1000000.0) << "M";
    }
    else if (count >= 1000)
    {
        out << std::fixed << std::setprecision(1)
            << (static_cast<double>(count) / 1000.0) << "k";
    }
    else
    {
        out << count;
    }
    return out.str();
}

inline std::string format_fixed(const double value, const int precision = 4)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}

inline void log_line(const std::string &log_prefix,
                     const Level level,
                     const std::string &message)
{
    const LevelStyle style = level_style(level);
    std::ostringstream out;
    out << decorate("[" + log_prefix + "]", "\033[1;34m") << " "
        << decorate(style.label, style.colour) << " "
        << message;
    std::cerr << out.str() << "\n";
}

inline void log_info(const std::string &log_prefix, const std::string &message)
{
    log_line(log_prefix, Level::kInfo, message);
}

inline void log_success(const std::string &log_prefix, const std::string &message)
{
    log_line(log_prefix, Level::kSuccess, message);
}

inline void log_warning(const std::string &log_prefix, const std::string &message)
{
    log_line(log_prefix, Level::kWarn, message);
}

inline void log_error(const std::string &log_prefix, const std::string &message)
{
    log_line(log_prefix, Level::kError, message);
}

} // namespace log

} // namespace app

} // namespace trigeff

#endif // TRIGEFF_APPS_APPLOG_H
