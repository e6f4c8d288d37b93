#ifndef __SENSITIVITY_EXCEPTION_H
#define __SENSITIVITY_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace qmc_sensitivity
{
  // Base class for every error raised by the sensitivity analysis code
  class SensitivityAnalysisException : public std::runtime_error
  {
  public:
    explicit SensitivityAnalysisException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~SensitivityAnalysisException() = default;
  };

  /**
   * @brief Invalid analysis settings: alpha outside (0,1), non-positive
   * bootstrap count, missing sampler or QoI configuration.
   */
  class ConfigError : public SensitivityAnalysisException
  {
  public:
    explicit ConfigError(const std::string& msg)
      : SensitivityAnalysisException(msg) {}
  };

  /**
   * @brief Empty or malformed sample tables, run-index gaps and
   * out-of-range output indices.
   */
  class InputError : public SensitivityAnalysisException
  {
  public:
    explicit InputError(const std::string& msg)
      : SensitivityAnalysisException(msg) {}
  };

  /**
   * @brief Sample counts that do not fit the Saltelli block layout, or
   * evaluation results whose lengths disagree.
   */
  class ShapeError : public SensitivityAnalysisException
  {
  public:
    explicit ShapeError(const std::string& msg)
      : SensitivityAnalysisException(msg) {}
  };

} // namespace qmc_sensitivity

#endif // __SENSITIVITY_EXCEPTION_H
