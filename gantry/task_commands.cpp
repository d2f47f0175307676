#include "task_commands.hpp"
#include "artifact_stager.hpp"
#include "gantry.hpp"
#include "gantry_errors.hpp"
#include "result_aggregator.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"

namespace gantry {

static std::string required_string(const nlohmann::json &node, const std::string &key, const std::string &command)
{
  if (!node.is_object() || !node.contains(key) || node[key].is_null())
    throw pipeline_error("'" + command + "' requires '" + key + "'");
  return scalar_to_string(node[key]);
}

static fs::path results_directory(const nlohmann::json &node, command_context &context)
{
  if (node.is_object() && node.contains("report_dir"))
    return context.project.resolve_path(context.project.render(scalar_to_string(node["report_dir"])));
  if (!context.project.workspace.settings.results_directory.empty())
    return context.project.resolve_path(context.project.workspace.settings.results_directory);
  return context.project.resolve_path(default_results_directory);
}

static std::string exec_command(const nlohmann::json &node, command_context &context)
{
  auto &project = context.project;
  process_invocation invocation;
  bool fail_on_error = true;

  // Every visible property, call bindings included, is the environment baseline
  invocation.environment = project.properties.visible_bindings();

  if (node.is_string()) {
#if defined(_WIN64) || defined(_WIN32) || defined(__CYGWIN__)
    invocation.executable = "cmd";
    invocation.arguments  = { "/c", project.render(node.get<std::string>()) };
#else
    invocation.executable = "/bin/sh";
    invocation.arguments  = { "-c", project.render(node.get<std::string>()) };
#endif
    invocation.working_directory = project.pipeline.base_directory;
  } else if (node.is_object()) {
    fs::path executable = project.render(required_string(node, "executable", "exec"));
    if (executable.has_parent_path() && executable.is_relative())
      executable = project.resolve_path(executable);
    invocation.executable = executable.string();

    if (node.contains("args"))
      invocation.arguments = project.render_list(node["args"]);

    invocation.working_directory = project.pipeline.base_directory;
    if (node.contains("dir"))
      invocation.working_directory = project.resolve_path(project.render(scalar_to_string(node["dir"])));

    if (node.contains("env")) {
      if (!node["env"].is_object())
        throw pipeline_error("'env' of 'exec' must be a map");
      for (const auto &[key, value]: node["env"].items())
        invocation.environment[key] = project.render(scalar_to_string(value));
    }

    if (node.contains("timeout")) {
      const auto seconds = to_number(node["timeout"]);
      if (!seconds || *seconds <= 0)
        throw pipeline_error("'timeout' of 'exec' must be a positive number of seconds but got " + node["timeout"].dump());
      invocation.timeout = std::chrono::milliseconds(static_cast<long long>(*seconds * 1000));
    }
    fail_on_error = node.value("failonerror", true);
  } else {
    throw pipeline_error("'exec' expects a command line or a map but got " + node.dump());
  }

  if (!invocation.timeout)
    invocation.timeout = context.engine.engine_options.default_timeout;

  const auto result       = run_process(invocation, context.engine.cancel_flag());
  const auto command_text = describe_command(invocation);
  if (result.cancelled)
    throw subprocess_failure(command_text, result.exit_code, result.output, subprocess_failure::reason::CANCELLED);
  if (result.timed_out)
    throw subprocess_failure(command_text, result.exit_code, result.output, subprocess_failure::reason::TIMED_OUT);
  if (result.exit_code != 0) {
    if (!fail_on_error) {
      spdlog::warn("{} returned {}, ignored", command_text, result.exit_code);
      return result.output;
    }
    throw subprocess_failure(command_text, result.exit_code, result.output);
  }
  return result.output;
}

static std::string call_command(const nlohmann::json &node, command_context &context)
{
  std::string target;
  nlohmann::json with;
  if (node.is_string()) {
    target = node.get<std::string>();
  } else {
    target = required_string(node, "task", "call");
    with   = node.value("with", nlohmann::json{});
  }

  auto invoke = [&](const nlohmann::json &bindings_node) {
    property_store::binding_map bindings;
    if (bindings_node.is_object()) {
      // Bindings are rendered in the caller's scope
      for (const auto &[name, value]: bindings_node.items())
        bindings[name] = context.project.render(scalar_to_string(value));
    } else if (!bindings_node.is_null()) {
      throw pipeline_error("'with' of a call to '" + target + "' must be a map or a list of maps");
    }

    const auto &result = context.engine.call_task(target, bindings);
    if (result.state == task_state::PENDING)
      throw error("Call to '" + result.key + "' did not run");
    if (!result.satisfies_dependents())
      throw error("Called task '" + result.key + "' failed: " + result.error);
  };

  if (with.is_array())
    for (const auto &bindings_node: with)
      invoke(bindings_node);
  else
    invoke(with);
  return "";
}

static std::string fetch_command(const nlohmann::json &node, command_context &context)
{
  const auto url         = context.project.render(required_string(node, "url", "fetch"));
  const auto destination = context.project.resolve_path(context.project.render(required_string(node, "destination", "fetch")));

  const bool fetched = ensure_present(destination, [&]() {
    download_resource(url, destination, context.engine.cancel_flag());
  });
  return fetched ? "Fetched " + destination.generic_string() : "";
}

static std::string stage_command(const nlohmann::json &node, command_context &context)
{
  if (!node.is_object() || !node.contains("outputs"))
    throw pipeline_error("'stage' requires 'outputs'");
  const auto outputs     = context.project.render_list(node["outputs"]);
  const auto destination = context.project.render(required_string(node, "destination", "stage"));

  const auto staged = stage(outputs, destination, context.project.pipeline.base_directory);
  return "Staged " + std::to_string(staged.size()) + " artifact(s) into " + destination;
}

static std::string copy_command(const nlohmann::json &node, command_context &context)
{
  if (!node.is_object() || !node.contains("from"))
    throw pipeline_error("'copy' requires 'from'");
  const auto destination = context.project.resolve_path(context.project.render(required_string(node, "to", "copy")));

  std::vector<fs::path> sources;
  for (const auto &pattern: context.project.render_list(node["from"])) {
    auto matches = expand_pattern(context.project.pipeline.base_directory, pattern);
    if (matches.empty())
      throw error("'" + pattern + "' does not exist");
    sources.insert(sources.end(), matches.begin(), matches.end());
  }

  std::error_code ec;
  const bool into_directory = sources.size() > 1 || !destination.has_filename() || fs::is_directory(destination, ec);
  try {
    if (into_directory)
      fs::create_directories(destination);
    else if (destination.has_parent_path())
      fs::create_directories(destination.parent_path());

    for (const auto &source: sources) {
      const auto target = into_directory ? destination / source.filename() : destination;
      spdlog::info("Copying {} -> {}", source.generic_string(), target.generic_string());
      fs::copy(source, target, fs::copy_options::recursive | fs::copy_options::overwrite_existing);
    }
  } catch (const fs::filesystem_error &e) {
    throw error(std::string{ "Copy failed: " } + e.what());
  }
  return "";
}

static std::string delete_command(const nlohmann::json &node, command_context &context)
{
  const auto removed = remove_paths(context.project.render_list(node), context.project.pipeline.base_directory);
  return removed > 0 ? "Deleted " + std::to_string(removed) + " item(s)" : "";
}

static std::string mkdir_command(const nlohmann::json &node, command_context &context)
{
  for (const auto &path: context.project.render_list(node)) {
    std::error_code ec;
    fs::create_directories(context.project.resolve_path(path), ec);
    if (ec)
      throw error("Failed to create '" + path + "': " + ec.message());
  }
  return "";
}

static std::string echo_command(const nlohmann::json &node, command_context &context)
{
  const auto text = context.project.render(scalar_to_string(node));
  console()->info("{}", text);
  return text;
}

static std::vector<fs::path> result_paths(const nlohmann::json &node, command_context &context, const std::string &command)
{
  if (!node.is_object() || !node.contains("results"))
    throw pipeline_error("'" + command + "' requires 'results'");
  std::vector<fs::path> paths;
  for (const auto &path: context.project.render_list(node["results"]))
    paths.push_back(context.project.resolve_path(path));
  return paths;
}

static void write_reports(const std::vector<failure_report> &reports, const fs::path &directory)
{
  for (const auto &report: reports) {
    if (!report.results_found)
      continue;
    auto written = write_failure_report(report, directory);
    if (!written)
      throw error("Failed to write failure report for '" + report.suite + "': " + written.error().message());
    spdlog::info("Wrote {}", written->generic_string());
  }
}

static std::string condense_command(const nlohmann::json &node, command_context &context)
{
  const auto paths     = result_paths(node, context, "condense");
  const auto directory = results_directory(node, context);

  std::vector<failure_report> reports;
  std::string summary;
  for (const auto &path: paths) {
    reports.push_back(condense(path));
    const auto &report = reports.back();
    if (!summary.empty())
      summary += "\n";
    if (report.results_found)
      summary += report.suite + ": " + std::to_string(report.failures.size()) + " of " + std::to_string(report.total_cases) + " failing";
    else
      summary += report.suite + ": no results";
  }
  write_reports(reports, directory);
  return summary;
}

static std::string check_results_command(const nlohmann::json &node, command_context &context)
{
  const auto paths   = result_paths(node, context, "check_results");
  const auto outcome = check_all_suites(paths);

  if (node.contains("report_dir"))
    write_reports(outcome.reports, results_directory(node, context));

  for (const auto &missing: outcome.missing)
    spdlog::warn("No results at {}", missing.generic_string());

  if (outcome.failed()) {
    std::vector<std::string> failing_cases;
    for (const auto &f: outcome.failures)
      failing_cases.push_back(f.qualified_name());
    console()->error("{}", outcome.message);
    throw aggregate_test_failure(outcome.message, failing_cases);
  }
  return outcome.message;
}

static std::string fail_command(const nlohmann::json &node, command_context &context)
{
  if (node.is_string())
    throw error(context.project.render(node.get<std::string>()));

  const auto message = required_string(node, "message", "fail");
  if (node.contains("if") && !context.project.properties.contains(node["if"].get<std::string>()))
    return "";
  if (node.contains("unless") && context.project.properties.contains(node["unless"].get<std::string>()))
    return "";
  if (node.contains("when") && !context.project.evaluate(condition::parse(node["when"])))
    return "";
  throw error(context.project.render(message));
}

const std::map<const std::string, const task_command> task_commands = {
  { "exec", exec_command },     { "call", call_command },   { "fetch", fetch_command },       { "stage", stage_command },
  { "copy", copy_command },     { "delete", delete_command }, { "mkdir", mkdir_command },     { "echo", echo_command },
  { "condense", condense_command }, { "check_results", check_results_command }, { "fail", fail_command },
};

} // namespace gantry
