#pragma once

#include "gantry_project.hpp"
#include "property_store.hpp"
#include "task_graph.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gantry {

enum class task_state { PENDING, RUNNING, SUCCEEDED, FAILED, SKIPPED };

const char *to_string(task_state state);

/**
 * @brief Outcome of one task execution
 *
 * `key` is the task name, or for a call with scoped bindings the task name followed by the
 * bindings, e.g. `test-suite(suite=core)`.
 */
struct task_record {
  std::string key;
  std::string task_name;
  task_state state   = task_state::PENDING;
  bool fail_on_error = true;
  std::string error;
  std::string output;
  std::chrono::milliseconds duration{ 0 };

  bool is_terminal() const
  {
    return state == task_state::SUCCEEDED || state == task_state::FAILED || state == task_state::SKIPPED;
  }

  /** @brief Succeeded, Skipped or a failure the task opted out of */
  bool satisfies_dependents() const
  {
    return state == task_state::SUCCEEDED || state == task_state::SKIPPED || (state == task_state::FAILED && !fail_on_error);
  }
};

class task_engine;

struct task_engine_ui {
  virtual ~task_engine_ui() = default;

  virtual void init(task_engine &engine, size_t task_count) {};
  virtual void task_started(task_engine &engine, const task_record &record) {};
  virtual void task_finished(task_engine &engine, const task_record &record) {};
  virtual void finish(task_engine &engine) {};
};

/**
 * @brief Memoized, strictly sequential task executor
 *
 * Every task runs at most once per build. A call with scoped bindings runs once per distinct
 * set of bindings.
 */
class task_engine {
public:
  struct options {
    bool fail_fast = true;
    std::optional<std::chrono::milliseconds> default_timeout;
  };

  task_engine(gantry::project &project, options engine_options);
  explicit task_engine(gantry::project &project);

  /**
   * @brief Run each target in order
   * @return true if no task failed that was required to succeed and the build was not cancelled
   */
  bool run(const std::vector<std::string> &targets, task_engine_ui *ui = nullptr);

  const task_record &run_task(const std::string &name);
  const task_record &call_task(const std::string &name, const property_store::binding_map &bindings);

  /** @brief Request cancellation. Safe to call from a signal handler. */
  void cancel()
  {
    cancelled = true;
  }
  bool is_cancelled() const
  {
    return cancelled;
  }
  const std::atomic<bool> *cancel_flag() const
  {
    return &cancelled;
  }

  bool build_failed() const;
  const task_record *record(const std::string &key) const;
  const task_record *first_failure() const;

  /** @brief Every record, terminal ones in completion order followed by the ones still pending */
  std::vector<const task_record *> records() const;
  size_t count(task_state state) const;
  void log_summary() const;

  gantry::project &project;
  options engine_options;
  std::atomic<bool> abort_build{ false };

private:
  task_state execute(const std::string &key, const std::string &name);
  bool guard_holds(const task &t);
  void run_body(const task &t, task_record &record);
  void finish_task(task_record &record, task_state state);
  std::string plain_key(const std::string &name) const;

  std::map<std::string, task_record> task_records;
  std::vector<std::string> completion_order;
  std::vector<std::string> active_keys;
  std::string first_failed_key;
  std::atomic<bool> cancelled{ false };
  task_engine_ui *ui = nullptr;
};

} // namespace gantry
