#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace gantry {

/**
 * @brief Base class of every error raised by the orchestrator
 */
class error : public std::runtime_error {
public:
  explicit error(const std::string &message) : std::runtime_error(message)
  {
  }
};

/**
 * @brief The pipeline file is malformed, fails schema validation or names an unknown task
 */
class pipeline_error : public error {
public:
  explicit pipeline_error(const std::string &message) : error(message)
  {
  }
};

/**
 * @brief A property required for substitution is not bound and has no default
 */
class missing_property_error : public error {
public:
  missing_property_error(const std::string &property, const std::string &detail)
      : error("Missing property '" + property + "': " + detail), property_name(property)
  {
  }

  const std::string &property() const
  {
    return property_name;
  }

private:
  std::string property_name;
};

/**
 * @brief A predicate referenced a platform fact that is unknown or unavailable
 */
class condition_evaluation_error : public error {
public:
  explicit condition_evaluation_error(const std::string &message) : error(message)
  {
  }
};

/**
 * @brief An external tool could not be started, exited with a non-zero status, timed out or was cancelled
 */
class subprocess_failure : public error {
public:
  enum class reason { EXIT_STATUS, LAUNCH_FAILED, TIMED_OUT, CANCELLED };

  subprocess_failure(const std::string &command, int exit_code, const std::string &output, reason cause = reason::EXIT_STATUS)
      : error(describe(command, exit_code, cause)), command_line(command), captured_output(output), status(exit_code), failure_reason(cause)
  {
  }

  const std::string &command() const
  {
    return command_line;
  }
  const std::string &output() const
  {
    return captured_output;
  }
  int exit_code() const
  {
    return status;
  }
  reason cause() const
  {
    return failure_reason;
  }

private:
  static std::string describe(const std::string &command, int exit_code, reason cause)
  {
    switch (cause) {
      case reason::LAUNCH_FAILED:
        return "Failed to start '" + command + "'";
      case reason::TIMED_OUT:
        return "'" + command + "' timed out and was terminated";
      case reason::CANCELLED:
        return "'" + command + "' was cancelled";
      default:
        return "'" + command + "' returned " + std::to_string(exit_code);
    }
  }

  std::string command_line;
  std::string captured_output;
  int status;
  reason failure_reason;
};

/**
 * @brief The task graph contains a cycle. Raised by validation before anything runs.
 */
class cyclic_dependency_error : public error {
public:
  explicit cyclic_dependency_error(const std::vector<std::string> &cycle_path) : error("Cyclic dependency: " + join(cycle_path)), path(cycle_path)
  {
  }

  const std::vector<std::string> &cycle() const
  {
    return path;
  }

private:
  static std::string join(const std::vector<std::string> &items)
  {
    std::string text;
    for (const auto &i: items) {
      if (!text.empty())
        text += " -> ";
      text += i;
    }
    return text;
  }

  std::vector<std::string> path;
};

/**
 * @brief One or more test suites reported failing or erroring cases
 */
class aggregate_test_failure : public error {
public:
  aggregate_test_failure(const std::string &message, const std::vector<std::string> &failing_cases) : error(message), cases(failing_cases)
  {
  }

  const std::vector<std::string> &failing_cases() const
  {
    return cases;
  }

private:
  std::vector<std::string> cases;
};

} // namespace gantry
