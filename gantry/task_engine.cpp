#include "task_engine.hpp"
#include "task_commands.hpp"
#include "gantry_errors.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>

namespace gantry {

const char *to_string(task_state state)
{
  switch (state) {
    case task_state::PENDING:
      return "pending";
    case task_state::RUNNING:
      return "running";
    case task_state::SUCCEEDED:
      return "succeeded";
    case task_state::FAILED:
      return "failed";
    case task_state::SKIPPED:
      return "skipped";
  }
  return "unknown";
}

task_engine::task_engine(gantry::project &project, options engine_options) : project(project), engine_options(engine_options)
{
}

task_engine::task_engine(gantry::project &project) : task_engine(project, options{})
{
}

std::string task_engine::plain_key(const std::string &name) const
{
  const auto concrete = project.pipeline.graph.resolve(name);
  return concrete.empty() ? name : concrete;
}

bool task_engine::run(const std::vector<std::string> &targets, task_engine_ui *ui)
{
  this->ui = ui;

  // Every reachable task starts Pending so tasks that never run are still reported. Calls with
  // bindings get their records when they run.
  const auto reachable = project.pipeline.graph.unscoped_reachable(targets);
  for (const auto &name: reachable) {
    auto [record, inserted] = task_records.try_emplace(name);
    if (inserted) {
      record->second.key           = name;
      record->second.task_name     = name;
      record->second.fail_on_error = project.pipeline.graph.find(name)->fail_on_error;
    }
  }

  if (ui)
    ui->init(*this, reachable.size());

  bool targets_completed = true;
  for (const auto &target: targets) {
    if (abort_build || cancelled)
      break;
    console()->info("Running '{}'", target);
    const auto &result = run_task(target);
    if (!result.satisfies_dependents())
      targets_completed = false;
  }

  if (ui)
    ui->finish(*this);
  this->ui = nullptr;

  log_summary();
  return targets_completed && !build_failed() && !cancelled;
}

const task_record &task_engine::run_task(const std::string &name)
{
  const auto key = plain_key(name);
  execute(key, name);
  return task_records.at(key);
}

const task_record &task_engine::call_task(const std::string &name, const property_store::binding_map &bindings)
{
  if (bindings.empty())
    return run_task(name);

  std::string key = plain_key(name) + "(";
  for (auto i = bindings.begin(); i != bindings.end(); ++i) {
    if (i != bindings.begin())
      key += ",";
    key += i->first + "=" + i->second;
  }
  key += ")";

  property_store::scope call_scope(project.properties, bindings);
  execute(key, name);
  return task_records.at(key);
}

bool task_engine::guard_holds(const task &t)
{
  if (!t.if_property.empty() && !project.properties.contains(t.if_property)) {
    spdlog::info("{}: skipped, '{}' is not set", t.name, t.if_property);
    return false;
  }
  if (!t.unless_property.empty() && project.properties.contains(t.unless_property)) {
    spdlog::info("{}: skipped, '{}' is set", t.name, t.unless_property);
    return false;
  }
  if (t.when && !project.evaluate(*t.when)) {
    spdlog::info("{}: skipped, {} does not hold", t.name, t.when->describe());
    return false;
  }
  return true;
}

void task_engine::finish_task(task_record &record, task_state state)
{
  record.state = state;
  completion_order.push_back(record.key);

  if (state == task_state::FAILED) {
    if (first_failed_key.empty() && record.fail_on_error)
      first_failed_key = record.key;
    if (record.fail_on_error) {
      spdlog::error("{}: FAILED: {}", record.key, record.error);
      if (engine_options.fail_fast && !abort_build) {
        spdlog::error("Aborting build");
        abort_build = true;
      }
    } else {
      spdlog::warn("{}: failed, continuing: {}", record.key, record.error);
    }
  } else {
    spdlog::info("{}: {}", record.key, to_string(state));
  }

  if (ui)
    ui->task_finished(*this, record);
}

task_state task_engine::execute(const std::string &key, const std::string &name)
{
  const auto concrete = project.pipeline.graph.resolve(name);

  auto [entry, inserted] = task_records.try_emplace(key);
  task_record &record    = entry->second;
  if (inserted) {
    record.key       = key;
    record.task_name = concrete.empty() ? name : concrete;
  }

  if (record.is_terminal())
    return record.state;

  if (record.state == task_state::RUNNING) {
    std::vector<std::string> cycle(std::find(active_keys.begin(), active_keys.end(), key), active_keys.end());
    cycle.push_back(key);
    throw cyclic_dependency_error(cycle);
  }

  if (abort_build || cancelled)
    return task_state::PENDING;

  // An alias with no variant for this platform
  if (concrete.empty()) {
    record.fail_on_error = false;
    spdlog::info("{}: no variant for {}", key, project.host.tag());
    finish_task(record, task_state::SKIPPED);
    return record.state;
  }

  const task &t        = *project.pipeline.graph.find(concrete);
  record.fail_on_error = t.fail_on_error;
  record.state         = task_state::RUNNING;
  active_keys.push_back(key);
  if (ui)
    ui->task_started(*this, record);

  auto leave = [&](task_state state) {
    active_keys.pop_back();
    if (state == task_state::PENDING)
      record.state = task_state::PENDING;
    else
      finish_task(record, state);
    return state;
  };

  try {
    if (!guard_holds(t))
      return leave(task_state::SKIPPED);
  } catch (const error &e) {
    record.error = e.what();
    return leave(task_state::FAILED);
  }

  for (const auto &dependency: t.dependencies) {
    task_state dependency_state;
    try {
      dependency_state = execute(plain_key(dependency), dependency);
    } catch (const error &e) {
      record.error = e.what();
      return leave(task_state::FAILED);
    }

    if (dependency_state == task_state::PENDING)
      return leave(task_state::PENDING);

    const auto &dependency_record = task_records.at(plain_key(dependency));
    if (!dependency_record.satisfies_dependents()) {
      record.error = "dependency '" + dependency + "' failed";
      return leave(task_state::FAILED);
    }
  }

  if (abort_build || cancelled)
    return leave(task_state::PENDING);

  const auto start = std::chrono::steady_clock::now();
  spdlog::info("{}: started", key);
  bool body_succeeded = false;
  try {
    run_body(t, record);
    body_succeeded = true;
  } catch (const subprocess_failure &e) {
    record.error = e.what();
    record.output += e.output();
    if (!e.output().empty())
      spdlog::error("{} output:\n{}", key, e.output());
  } catch (const error &e) {
    record.error = e.what();
  } catch (const std::exception &e) {
    record.error = std::string{ "unexpected error: " } + e.what();
  }
  record.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

  return leave(body_succeeded ? task_state::SUCCEEDED : task_state::FAILED);
}

void task_engine::run_body(const task &t, task_record &record)
{
  command_context context{ *this, project, t, record };

  for (const auto &action: t.process) {
    if (cancelled)
      throw error("Build cancelled");

    const auto command = action.begin();
    auto handler       = task_commands.find(command.key());
    if (handler == task_commands.end())
      throw pipeline_error("Unknown command '" + command.key() + "' in task '" + t.name + "'");

    spdlog::debug("{}: {}", record.key, command.key());
    auto output = handler->second(command.value(), context);
    if (!output.empty()) {
      if (!record.output.empty() && record.output.back() != '\n')
        record.output += '\n';
      record.output += output;
    }
  }
}

bool task_engine::build_failed() const
{
  return std::any_of(task_records.begin(), task_records.end(), [](const auto &r) {
    return r.second.state == task_state::FAILED && r.second.fail_on_error;
  });
}

const task_record *task_engine::record(const std::string &key) const
{
  auto i = task_records.find(key);
  if (i == task_records.end())
    return nullptr;
  return &i->second;
}

const task_record *task_engine::first_failure() const
{
  return first_failed_key.empty() ? nullptr : record(first_failed_key);
}

std::vector<const task_record *> task_engine::records() const
{
  std::vector<const task_record *> result;
  for (const auto &key: completion_order)
    result.push_back(&task_records.at(key));
  for (const auto &[key, r]: task_records)
    if (!r.is_terminal())
      result.push_back(&r);
  return result;
}

size_t task_engine::count(task_state state) const
{
  return static_cast<size_t>(std::count_if(task_records.begin(), task_records.end(), [state](const auto &r) {
    return r.second.state == state;
  }));
}

void task_engine::log_summary() const
{
  auto log = console();
  for (const auto *r: records()) {
    if (r->state == task_state::FAILED)
      log->error("  {:<32} {:<10} {:>8}ms  {}", r->key, to_string(r->state), r->duration.count(), r->error);
    else
      log->info("  {:<32} {:<10} {:>8}ms", r->key, to_string(r->state), r->duration.count());
  }
  log->info("{} succeeded, {} failed, {} skipped, {} pending",
            count(task_state::SUCCEEDED),
            count(task_state::FAILED),
            count(task_state::SKIPPED),
            count(task_state::PENDING));
}

} // namespace gantry
