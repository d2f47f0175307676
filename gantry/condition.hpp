#pragma once

#include "platform.hpp"
#include "property_store.hpp"
#include "nlohmann/json.hpp"
#include <inja/inja.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace gantry {

/**
 * @brief Parsed boolean predicate
 *
 * Pipeline syntax:
 *   { all: [ ... ] }  { any: [ ... ] }  { not: { ... } }
 *   { os: macos }  { arch: arm64 }  { file_exists: path }
 *   { isset: property }  { equals: [ a, b ] }
 * A map with several keys and a plain sequence are both treated as 'all'.
 */
struct condition {
  enum class kind { ALWAYS, ALL, ANY, NOT, OS_FAMILY, OS_ARCH, FILE_EXISTS, IS_SET, EQUALS };

  kind type = kind::ALWAYS;
  std::string argument;
  std::string second_argument;
  std::vector<condition> children;

  /** @throw pipeline_error if the node is not a valid condition */
  static condition parse(const nlohmann::json &node);

  std::string describe() const;
};

/**
 * @brief Evaluate conditions against the host and the filesystem
 *
 * Nothing is cached: the filesystem is queried on every evaluation.
 */
class condition_evaluator {
public:
  condition_evaluator(const platform &host, const property_store &store, inja::Environment &env, const std::filesystem::path &base_directory);

  /** @throw condition_evaluation_error if a platform fact is unknown or unavailable */
  bool evaluate(const condition &predicate) const;

private:
  const platform &host;
  const property_store &store;
  inja::Environment &env;
  std::filesystem::path base_directory;
};

} // namespace gantry
