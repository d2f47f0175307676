#include "utilities.hpp"
#include "gantry_errors.hpp"
#include "subprocess.hpp"
#include <array>
#include <cctype>
#include <condition_variable>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <mutex>
#include <thread>
#include <signal.h>
#include <sys/types.h>

namespace gantry {

using namespace std::chrono_literals;

std::string describe_command(const process_invocation &invocation)
{
  std::string text = invocation.executable;
  for (const auto &a: invocation.arguments) {
    if (a.empty() || a.find_first_of(" \t\"'") != std::string::npos)
      text += " \"" + a + "\"";
    else
      text += " " + a;
  }
  return text;
}

process_result run_process(const process_invocation &invocation, const std::atomic<bool> *cancel)
{
  const auto command_text = describe_command(invocation);
  spdlog::info("{}", command_text);
  if (!invocation.working_directory.empty())
    spdlog::debug("Working directory: {}", invocation.working_directory.generic_string());
  for (const auto &[key, value]: invocation.environment)
    spdlog::debug("Environment: {}={}", key, value);

  std::vector<std::string> command_line{ invocation.executable };
  command_line.insert(command_line.end(), invocation.arguments.begin(), invocation.arguments.end());

  std::unique_ptr<subprocess::Popen> process;
  try {
    process = std::make_unique<subprocess::Popen>(command_line,
                                                  subprocess::output{ subprocess::PIPE },
                                                  subprocess::error{ subprocess::STDOUT },
                                                  subprocess::cwd{ invocation.working_directory.string() },
                                                  subprocess::environment{ std::map<std::string, std::string>(invocation.environment) },
                                                  subprocess::session_leader{ true });
  } catch (const std::exception &e) {
    spdlog::error("Exception while executing: {}\n{}", command_text, e.what());
    throw subprocess_failure(command_text, -1, e.what(), subprocess_failure::reason::LAUNCH_FAILED);
  }

  process_result result;
  std::mutex watchdog_mutex;
  std::condition_variable watchdog_signal;
  bool finished = false;
  std::atomic<bool> timed_out{ false };
  std::atomic<bool> cancelled{ false };

  // The child leads its own process group. Killing the group also stops the programs it started,
  // which would otherwise keep the output pipe open. The child is not reaped until wait() below,
  // so the group id stays valid while the watchdog runs.
  const pid_t process_group = process->pid();
  auto kill_process_group   = [process_group]() {
    if (::kill(-process_group, SIGKILL) != 0)
      spdlog::warn("Failed to kill process group {}: {}", process_group, std::strerror(errno));
  };

  std::thread watchdog([&]() {
    const auto start = std::chrono::steady_clock::now();
    std::unique_lock<std::mutex> lock(watchdog_mutex);
    while (!finished) {
      if (cancel != nullptr && cancel->load()) {
        cancelled = true;
        kill_process_group();
        return;
      }
      if (invocation.timeout && std::chrono::steady_clock::now() - start >= *invocation.timeout) {
        timed_out = true;
        kill_process_group();
        return;
      }
      watchdog_signal.wait_for(lock, 50ms);
    }
  });

  FILE *output = process->output();
  if (output != nullptr) {
    std::array<char, 512> buffer;
    std::string line;
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), output) != nullptr) {
      result.output.append(buffer.data());
      line.append(buffer.data());
      if (!line.empty() && line.back() == '\n') {
        line.pop_back();
        spdlog::debug("  {}", line);
        line.clear();
      }
    }
    if (!line.empty())
      spdlog::debug("  {}", line);
  }

  {
    std::lock_guard<std::mutex> lock(watchdog_mutex);
    finished = true;
  }
  watchdog_signal.notify_all();
  watchdog.join();

  result.exit_code = process->wait();
  result.timed_out = timed_out;
  result.cancelled = cancelled;
  return result;
}

void download_resource(const std::string &url, const fs::path &destination, const std::atomic<bool> *cancel)
{
  if (destination.has_parent_path())
    fs::create_directories(destination.parent_path());

  auto partial = destination;
  partial += ".part";

  process_invocation curl;
  curl.executable = "curl";
  curl.arguments  = { "--fail", "--location", "--silent", "--show-error", "--output", partial.string(), url };

  const auto result = run_process(curl, cancel);
  if (result.exit_code != 0 || result.timed_out || result.cancelled) {
    std::error_code ec;
    fs::remove(partial, ec);
    throw subprocess_failure(describe_command(curl),
                             result.exit_code,
                             result.output,
                             result.cancelled ? subprocess_failure::reason::CANCELLED : subprocess_failure::reason::EXIT_STATUS);
  }
  fs::rename(partial, destination);
}

fs::path resolve_path(const fs::path &base_directory, const fs::path &path)
{
  if (path.empty() || path.is_absolute() || base_directory.empty())
    return path;
  return base_directory / path;
}

std::shared_ptr<spdlog::logger> console()
{
  auto logger = spdlog::get("console");
  return logger ? logger : spdlog::default_logger();
}

std::string sanitize_filename(const std::string &name)
{
  std::string sanitized;
  for (const char c: name) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.')
      sanitized += c;
    else
      sanitized += '_';
  }
  return sanitized.empty() ? std::string{ "unnamed" } : sanitized;
}

std::string scalar_to_string(const nlohmann::json &value)
{
  if (value.is_string())
    return value.get<std::string>();
  if (value.is_null())
    return "";
  return value.dump();
}

std::optional<double> to_number(const nlohmann::json &value)
{
  if (value.is_number())
    return value.get<double>();
  if (!value.is_string())
    return std::nullopt;

  const auto &text    = value.get_ref<const std::string &>();
  char *end           = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (text.empty() || end != text.c_str() + text.size() || text.find_first_of("0123456789") == std::string::npos)
    return std::nullopt;
  return number;
}

} // namespace gantry
