#pragma once

#include "property_store.hpp"
#include <inja/inja.hpp>
#include <string>
#include <vector>

namespace gantry {

/**
 * @brief Substitute properties into a template string
 *
 * Properties are addressed with inja expressions, e.g. `{{ python.executable }}`. A property
 * may be given a fallback with `{{ default(name, "value") }}`.
 *
 * @throw missing_property_error if a referenced property is not bound and has no default
 * @throw pipeline_error if the template is malformed
 */
std::string render_properties(inja::Environment &env, const std::string &input, const property_store &store);

/** @brief Render every string in a JSON string or array of strings */
std::vector<std::string> render_list(inja::Environment &env, const nlohmann::json &node, const property_store &store);

void add_common_template_commands(inja::Environment &env);

} // namespace gantry
