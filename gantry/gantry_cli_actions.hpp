#pragma once

#include "gantry.hpp"
#include "gantry_workspace.hpp"
#include "gantry_project.hpp"
#include "cxxopts.hpp"
#include "spdlog/spdlog.h"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace gantry {

using action_handler = std::function<int(gantry::workspace &, const cxxopts::ParseResult &)>;

int list_action(workspace &workspace, const cxxopts::ParseResult &result);
int validate_action(workspace &workspace, const cxxopts::ParseResult &result);
int check_results_action(workspace &workspace, const cxxopts::ParseResult &result);

// Options that replace running the build
// clang-format off
const std::unordered_map<std::string, action_handler> cli_actions = {
  { "list", list_action },
  { "validate", validate_action },
  { "check-results", check_results_action }
};
// clang-format on

/**
 * @brief Load the pipeline named by `--file` and apply `--os`, `--arch` and `--define`
 *
 * Properties are not resolved yet.
 *
 * @throw error if the pipeline cannot be loaded or an option is invalid
 */
std::unique_ptr<project> load_project(workspace &workspace, const cxxopts::ParseResult &result);

} // namespace gantry
