#pragma once

#include "nlohmann/json.hpp"
#include <nlohmann/json-schema.hpp>
#include <string>

namespace gantry {

/**
 * @brief Validates pipeline and workspace configuration documents against embedded schemas
 */
class gantry_schema_validator {
  nlohmann::json pipeline_schema;
  nlohmann::json config_schema;
  nlohmann::json_schema::json_validator pipeline_validator;
  nlohmann::json_schema::json_validator config_validator;

  // clang-format off
  const std::string pipeline_schema_yaml = R"(
  title: Gantry pipeline
  type: object
  additionalProperties: false
  properties:
    name:
      description: Pipeline name
      type: string

    default:
      description: Entry task used when none is given on the command line
      type: string

    description:
      type: string

    properties:
      description: Property definitions, resolved in order
      type: [array, "null"]
      items:
        type: object
        required:
          - name
        additionalProperties: false
        properties:
          name:
            type: string
            pattern: "^[A-Za-z_][A-Za-z0-9_.-]*$"
          value:
            type: [string, number, boolean]
          env:
            type: string
          default:
            type: [string, number, boolean]
          if: {}
          select:
            type: array
            minItems: 1
            items:
              type: object
              additionalProperties: false
              required:
                - when
                - value
              properties:
                when: {}
                value:
                  type: [string, number, boolean]
        oneOf:
          - required: [value]
            not:
              anyOf:
                - required: [env]
                - required: [select]
          - required: [env]
            not:
              anyOf:
                - required: [value]
                - required: [select]
                - required: [if]
          - required: [select]
            not:
              anyOf:
                - required: [value]
                - required: [env]
                - required: [if]

    tasks:
      type: object
      description: Named tasks
      propertyNames:
        pattern: "^[A-Za-z0-9_.:-]+$"
      patternProperties:
        '.*':
          type: [object, "null"]
          additionalProperties: false
          properties:
            description:
              type: string
            depends:
              type: [array, string]
              items:
                type: string
            if:
              type: string
            unless:
              type: string
            when: {}
            failonerror:
              type: boolean
            process:
              type: array
              items:
                type: object
                minProperties: 1
                maxProperties: 1
                propertyNames:
                  enum: [exec, call, fetch, stage, copy, delete, mkdir, echo, condense, check_results, fail]

    aliases:
      type: object
      description: Platform specific task delegation
      patternProperties:
        '.*':
          type: object
          minProperties: 1
          patternProperties:
            '.*':
              type: string

  required:
    - tasks
  )";

  const std::string config_schema_yaml = R"(
  title: Gantry workspace configuration
  type: [object, "null"]
  additionalProperties: false
  properties:
    properties:
      type: [object, "null"]
      patternProperties:
        '.*':
          type: [string, number, boolean]
    settings:
      type: [object, "null"]
      additionalProperties: false
      properties:
        keep_going:
          type: boolean
        timeout:
          type: [number, string]
          minimum: 0
          pattern: "^[0-9]*[.]?[0-9]+$"
        progress:
          type: boolean
        log_level:
          type: string
          enum: [trace, debug, info, warn, warning, error, critical, off]
        results_dir:
          type: string
  )";
  // clang-format on

public:
  static gantry_schema_validator &get()
  {
    static gantry_schema_validator the_validator;
    return the_validator;
  }

private:
  gantry_schema_validator();

public:
  gantry_schema_validator(gantry_schema_validator const &) = delete;
  void operator=(gantry_schema_validator const &)          = delete;

  /** @return true if `document` is a valid pipeline. Each violation is logged against `source`. */
  bool validate_pipeline(const nlohmann::json &document, const std::string &source);
  bool validate_config(const nlohmann::json &document, const std::string &source);
};

} // namespace gantry
