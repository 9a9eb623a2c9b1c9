/* -- C++ -- */
/**
 *  @file  io/include/AnalysisErrors.hh
 *
 *  @brief Exception types raised by the efficiency analysis.
 */

#ifndef TRIGEFF_IO_ANALYSIS_ERRORS_H
#define TRIGEFF_IO_ANALYSIS_ERRORS_H

#include <stdexcept>
#include <string>

namespace trigeff
{

/** \brief Invalid or empty analysis configuration (trigger list, entry caps). */
class ConfigurationError : public std::runtime_error
{
  public:
    explicit ConfigurationError(const std::string &what) : std::runtime_error(what) {}
};

/** \brief A named field was requested from a record or tree that does not carry it. */
class MissingFieldError : public std::runtime_error
{
  public:
    explicit MissingFieldError(const std::string &field)
        : std::runtime_error("Missing field: " + field), m_field(field)
    {
    }

    MissingFieldError(const std::string &field, const std::string &context)
        : std::runtime_error("Missing field: " + field + " (" + context + ")"), m_field(field)
    {
    }

    const std::string &field() const noexcept { return m_field; }

  private:
    std::string m_field;
};

/** \brief Efficiency requested with a zero denominator. */
class DivisionByZeroError : public std::domain_error
{
  public:
    explicit DivisionByZeroError(const std::string &what) : std::domain_error(what) {}
};

} // namespace trigeff

#endif // TRIGEFF_IO_ANALYSIS_ERRORS_H
