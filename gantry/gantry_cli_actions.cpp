#include "gantry_cli_actions.hpp"
#include "gantry_errors.hpp"
#include "result_aggregator.hpp"
#include "utilities.hpp"
#include <algorithm>
#include <iostream>

namespace gantry {

std::unique_ptr<project> load_project(workspace &workspace, const cxxopts::ParseResult &result)
{
  const fs::path pipeline_path = result["file"].as<std::string>();
  auto host                    = platform::detect();

  if (result.count("os")) {
    const auto family = platform::canonical_os_family(result["os"].as<std::string>());
    if (!family || *family == "unix")
      throw error("Unknown OS family '" + result["os"].as<std::string>() + "'");
    host.os_family = *family;
  }
  if (result.count("arch")) {
    const auto arch = platform::canonical_arch(result["arch"].as<std::string>());
    if (!arch)
      throw error("Unknown architecture '" + result["arch"].as<std::string>() + "'");
    host.os_arch = *arch;
  }
  spdlog::debug("Platform: {}", host.tag());

  auto new_project = std::make_unique<project>(pipeline::load(resolve_path(workspace.workspace_path, pipeline_path)), workspace, host);

  if (result.count("define")) {
    for (const auto &definition: result["define"].as<std::vector<std::string>>()) {
      const auto separator = definition.find('=');
      if (separator == 0 || definition.empty())
        throw error("Invalid property definition '" + definition + "'");
      if (separator == std::string::npos)
        new_project->add_override(definition, "");
      else
        new_project->add_override(definition.substr(0, separator), definition.substr(separator + 1));
    }
  }
  return new_project;
}

int list_action(workspace &workspace, const cxxopts::ParseResult &result)
{
  try {
    auto project = load_project(workspace, result);
    auto &graph  = project->pipeline.graph;
    graph.resolve_aliases(project->host);

    std::cout << project->pipeline.name;
    if (!project->pipeline.description.empty())
      std::cout << ": " << project->pipeline.description;
    std::cout << "\n\n";

    size_t width = 0;
    for (const auto &name: graph.task_names())
      width = std::max(width, name.size());

    for (const auto &name: graph.task_names()) {
      const std::string marker = (name == project->pipeline.default_task) ? "* " : "  ";
      std::cout << marker << name << std::string(width - name.size() + 2, ' ');
      if (graph.is_alias(name)) {
        const auto target = graph.resolve(name);
        std::cout << "-> " << (target.empty() ? std::string{ "(nothing on " + project->host.tag() + ")" } : target);
      } else {
        std::cout << graph.find(name)->description;
      }
      std::cout << "\n";
    }
    std::cout << "\n* default task\n";
  } catch (const error &e) {
    spdlog::error("{}", e.what());
    return -1;
  }
  return 0;
}

int validate_action(workspace &workspace, const cxxopts::ParseResult &result)
{
  try {
    auto project = load_project(workspace, result);
    project->resolve_properties();
    const auto tasks = result.count("tasks") ? result["tasks"].as<std::vector<std::string>>() : std::vector<std::string>{};
    project->resolve_tasks(project->entry_tasks(tasks));

    auto log = console();
    log->info("'{}' is valid: {} tasks, {} aliases", project->pipeline.file_path.generic_string(), project->pipeline.graph.tasks().size(), project->pipeline.graph.aliases().size());
    if (result.count("verbose")) {
      project->properties.for_each([&log](const std::string &name, const std::string &value) {
        log->info("  {} = {}", name, value);
      });
    }
  } catch (const error &e) {
    spdlog::error("{}", e.what());
    return -1;
  }
  return 0;
}

int check_results_action(workspace &workspace, const cxxopts::ParseResult &result)
{
  std::vector<fs::path> paths;
  for (const auto &path: result["check-results"].as<std::vector<std::string>>())
    paths.push_back(resolve_path(workspace.workspace_path, path));

  const auto outcome = check_all_suites(paths);
  for (const auto &missing: outcome.missing)
    spdlog::warn("No results at {}", missing.generic_string());

  if (result.count("results-dir")) {
    const auto directory = resolve_path(workspace.workspace_path, result["results-dir"].as<std::string>());
    for (const auto &report: outcome.reports) {
      if (!report.results_found)
        continue;
      auto written = write_failure_report(report, directory);
      if (!written) {
        spdlog::error("Failed to write failure report for '{}': {}", report.suite, written.error().message());
        return -1;
      }
    }
  }

  if (outcome.failed()) {
    console()->error("{}", outcome.message);
    return -1;
  }
  console()->info("{}", outcome.message);
  return 0;
}

} // namespace gantry
