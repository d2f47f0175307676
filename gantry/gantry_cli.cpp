#include "gantry.hpp"
#include "gantry_errors.hpp"
#include "gantry_workspace.hpp"
#include "gantry_project.hpp"
#include "gantry_cli_actions.hpp"
#include "task_engine.hpp"
#include "utilities.hpp"
#include "cxxopts.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "semver/semver.hpp"
#include <indicators/progress_bar.hpp>
#include <indicators/cursor_control.hpp>
#include <algorithm>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <unistd.h>

using namespace indicators;

struct progress_bar_task_ui : gantry::task_engine_ui {
  std::unique_ptr<ProgressBar> bar;
  size_t total_count   = 0;
  size_t current_count = 0;

  void init(gantry::task_engine &task_engine, size_t task_count) override
  {
    total_count = task_count;
    bar         = std::make_unique<ProgressBar>(option::BarWidth{ 40 }, option::ShowPercentage{ true }, option::PrefixText{ "Building " }, option::MaxProgress{ std::max<size_t>(task_count, 1) });
    show_console_cursor(false);
  };

  void task_started(gantry::task_engine &task_engine, const gantry::task_record &record) override
  {
    if (!bar->is_completed())
      bar->set_option(option::PostfixText{ record.key });
  };

  void task_finished(gantry::task_engine &task_engine, const gantry::task_record &record) override
  {
    // Calls with bindings are not known up front
    if (++current_count > total_count) {
      total_count = current_count;
      bar->set_option(option::MaxProgress{ total_count });
    }
    if (record.state == gantry::task_state::FAILED && record.fail_on_error)
      bar->set_option(option::ForegroundColor{ Color::red });
    if (!bar->is_completed())
      bar->set_progress(std::min(current_count, total_count));
  };

  void finish(gantry::task_engine &task_engine) override
  {
    if (!bar->is_completed()) {
      bar->set_option(option::PostfixText{ std::to_string(current_count) + "/" + std::to_string(total_count) });
      bar->mark_as_completed();
    }
    show_console_cursor(true);
  };
};

static const semver::version gantry_version{
#include "gantry_version.h"
};

static gantry::task_engine *active_engine = nullptr;

static void handle_interrupt(int)
{
  if (active_engine != nullptr)
    active_engine->cancel();
}

static std::optional<spdlog::level::level_enum> parse_log_level(const std::string &name)
{
  if (name.empty())
    return std::nullopt;
  const auto level = spdlog::level::from_str(name == "warning" ? "warn" : name);
  if (level == spdlog::level::off && name != "off")
    return std::nullopt;
  return level;
}

int main(int argc, char **argv)
{
  auto gantry_start_time = std::chrono::steady_clock::now();

  // Setup logging
  std::error_code error_code;
  fs::remove(gantry::default_log_filename, error_code);

  auto console = spdlog::stdout_color_mt("console");
  console->set_pattern("%v");

  auto console_error = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_error->set_level(spdlog::level::warn);
  console_error->set_pattern("[%^%l%$]: %v");
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_log;
  try {
    file_log = std::make_shared<spdlog::sinks::basic_file_sink_mt>(gantry::default_log_filename, true);
  } catch (const spdlog::spdlog_ex &) {
    try {
      auto time = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
      file_log  = std::make_shared<spdlog::sinks::basic_file_sink_mt>("gantry-" + std::to_string(time) + ".log", true);
    } catch (const spdlog::spdlog_ex &e) {
      std::cerr << "Cannot open " << gantry::default_log_filename << ": " << e.what() << "\n";
      return -1;
    }
  }
  file_log->set_level(spdlog::level::trace);

  auto gantrylog = std::make_shared<spdlog::logger>("gantrylog", spdlog::sinks_init_list{ console_error, file_log });
  gantrylog->set_level(spdlog::level::trace);
  spdlog::set_default_logger(gantrylog);

  cxxopts::Options options("gantry", "Gantry task-graph build orchestrator. Ver " + gantry_version.str());
  options.positional_help("[task...]");
  // clang-format off
  options.add_options()("h,help", "Print usage")
                       ("f,file", "Pipeline file", cxxopts::value<std::string>()->default_value(gantry::default_pipeline_filename))
                       ("D,define", "Set a property, name=value", cxxopts::value<std::vector<std::string>>())
                       ("k,keep-going", "Continue with unrelated tasks after a failure", cxxopts::value<bool>()->default_value("false"))
                       ("t,timeout", "Default timeout in seconds for each external process", cxxopts::value<double>())
                       ("os", "Override the detected OS family", cxxopts::value<std::string>())
                       ("arch", "Override the detected architecture", cxxopts::value<std::string>())
                       ("l,list", "List tasks and their descriptions")
                       ("validate", "Load and validate the pipeline without running anything")
                       ("check-results", "Check test result documents and report failing cases", cxxopts::value<std::vector<std::string>>())
                       ("results-dir", "Directory for condensed failure reports", cxxopts::value<std::string>())
                       ("v,verbose", "Log progress to the console")
                       ("no-progress", "Do not show a progress bar")
                       ("version", "Print the version")
                       ("tasks", "Tasks to run", cxxopts::value<std::vector<std::string>>());
  // clang-format on
  options.parse_positional({ "tasks" });

  std::optional<cxxopts::ParseResult> parsed;
  try {
    parsed.emplace(options.parse(argc, argv));
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    std::cout << options.help() << std::endl;
    return -1;
  }
  const auto &result = *parsed;

  if (result.count("help")) {
    std::cout << options.help() << std::endl;
    return 0;
  }
  if (result.count("version")) {
    std::cout << gantry_version.str() << std::endl;
    return 0;
  }

  // Create a workspace
  gantry::workspace workspace;
  if (auto status = workspace.init(fs::current_path()); !status) {
    spdlog::error("Failed to initialize workspace: {}", status.error().message());
    return -1;
  }

  if (auto level = parse_log_level(workspace.settings.log_level))
    console_error->set_level(*level);
  if (result.count("verbose"))
    console_error->set_level(spdlog::level::info);

  for (const auto &[name, handler]: gantry::cli_actions)
    if (result.count(name))
      return handler(workspace, result);

  std::unique_ptr<gantry::project> project;
  std::vector<std::string> entries;
  try {
    project = gantry::load_project(workspace, result);
    project->resolve_properties();
    entries = project->entry_tasks(result.count("tasks") ? result["tasks"].as<std::vector<std::string>>() : std::vector<std::string>{});
    project->resolve_tasks(entries);
  } catch (const gantry::error &e) {
    spdlog::error("{}", e.what());
    return -1;
  }

  gantry::task_engine::options engine_options;
  engine_options.fail_fast       = !(result["keep-going"].as<bool>() || workspace.settings.keep_going);
  engine_options.default_timeout = workspace.settings.timeout;
  if (result.count("timeout") && result["timeout"].as<double>() > 0)
    engine_options.default_timeout = std::chrono::milliseconds(static_cast<long long>(result["timeout"].as<double>() * 1000));

  gantry::task_engine task_engine(*project, engine_options);
  active_engine = &task_engine;
  std::signal(SIGINT, handle_interrupt);
  std::signal(SIGTERM, handle_interrupt);

  const bool show_progress = workspace.settings.progress && !result.count("no-progress") && !result.count("verbose") && isatty(STDOUT_FILENO);
  progress_bar_task_ui progress_bar_ui;

  bool succeeded = false;
  try {
    succeeded = task_engine.run(entries, show_progress ? &progress_bar_ui : nullptr);
  } catch (const gantry::error &e) {
    spdlog::error("Running task engine failed: {}", e.what());
  }

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  active_engine = nullptr;

  if (const auto *failure = task_engine.first_failure()) {
    spdlog::error("Task '{}' failed: {}", failure->key, failure->error);
    if (!failure->output.empty())
      std::cerr << failure->output << (failure->output.back() == '\n' ? "" : "\n");
  }

  auto gantry_end_time = std::chrono::steady_clock::now();
  console->info("{} in {} milliseconds",
                task_engine.is_cancelled() ? "Cancelled" : (succeeded ? "Complete" : "Failed"),
                std::chrono::duration_cast<std::chrono::milliseconds>(gantry_end_time - gantry_start_time).count());

  spdlog::shutdown();
  show_console_cursor(true);

  if (task_engine.is_cancelled())
    return 130;
  return succeeded ? 0 : -1;
}
