#include "gantry_schema.hpp"
#include "gantry.hpp"
#include "spdlog/spdlog.h"

namespace gantry {

class custom_error_handler : public nlohmann::json_schema::basic_error_handler {
public:
  std::string source;
  void error(const nlohmann::json::json_pointer &ptr, const nlohmann::json &instance, const std::string &message) override
  {
    nlohmann::json_schema::basic_error_handler::error(ptr, instance, message);
    spdlog::error("Validation error in '{}': {} - {} : - {}", source, ptr.to_string(), instance.dump(3), message);
  }
};

gantry_schema_validator::gantry_schema_validator()
    : pipeline_validator(nullptr, nlohmann::json_schema::default_string_format_check), config_validator(nullptr, nlohmann::json_schema::default_string_format_check)
{
  // The schemas are written in YAML but are straight JSON once converted
  pipeline_schema = YAML::Load(pipeline_schema_yaml).as<nlohmann::json>();
  config_schema   = YAML::Load(config_schema_yaml).as<nlohmann::json>();
  pipeline_validator.set_root_schema(pipeline_schema);
  config_validator.set_root_schema(config_schema);
}

bool gantry_schema_validator::validate_pipeline(const nlohmann::json &document, const std::string &source)
{
  custom_error_handler err;
  err.source = source;
  pipeline_validator.validate(document, err);
  return !err;
}

bool gantry_schema_validator::validate_config(const nlohmann::json &document, const std::string &source)
{
  custom_error_handler err;
  err.source = source;
  config_validator.validate(document, err);
  return !err;
}

} // namespace gantry
