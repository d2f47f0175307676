#pragma once

#include "nlohmann/json.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gantry {

/**
 * @brief Build-wide name/value configuration
 *
 * Properties are written during the resolution phase and the store is then sealed. Task calls
 * may push read-only overlays of scoped bindings which shadow the base values until the owning
 * scope is destroyed.
 */
class property_store {
public:
  using binding_map = std::map<std::string, std::string>;

  /**
   * @brief RAII overlay of call-scoped bindings
   *
   * The bindings are visible from construction until destruction, including when the call chain
   * unwinds with an exception.
   */
  class scope {
  public:
    scope(property_store &store, const binding_map &bindings);
    ~scope();

    scope(const scope &)            = delete;
    scope &operator=(const scope &) = delete;

  private:
    property_store &store;
    size_t depth;
  };

  /** @brief Unconditional write, overwriting any previous value */
  void set(const std::string &name, const std::string &value);

  /**
   * @brief Write only if the property is not bound yet
   * @return true if the value was written
   */
  bool set_if_absent(const std::string &name, const std::string &value);

  /**
   * @brief Copy a process environment variable into the store
   * @return true if the environment variable exists and was copied
   */
  bool set_from_environment(const std::string &name, const std::string &environment_key);

  std::optional<std::string> get(const std::string &name) const;
  bool contains(const std::string &name) const;

  /** @brief End of the resolution phase. Any later write is an error. */
  void seal();
  bool is_sealed() const
  {
    return sealed;
  }

  /** @brief Visit every visible binding in name order. Overlays shadow base values. */
  void for_each(const std::function<void(const std::string &, const std::string &)> &visitor) const;

  /** @brief Visible bindings as nested JSON. Dotted names become nested objects. */
  nlohmann::json as_json() const;

  binding_map visible_bindings() const;

  /**
   * @brief Find two visible names where one is a dotted prefix of the other, e.g. `x` and `x.y`
   * @return The shorter and the longer name
   */
  std::optional<std::pair<std::string, std::string>> name_clash() const;
  size_t scope_depth() const
  {
    return overlays.size();
  }

private:
  void check_writable(const std::string &name) const;

  binding_map properties;
  std::vector<binding_map> overlays;
  bool sealed = false;
  mutable int active_visitors = 0;
};

} // namespace gantry
