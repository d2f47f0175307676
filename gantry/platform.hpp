#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace gantry {

/**
 * @brief Host facts used by conditions and alias selection
 *
 * Names are canonical: os_family is one of windows, macos, linux, freebsd and os_arch one of
 * x86_64, x86, arm64, arm. An empty string means the fact could not be determined.
 */
struct platform {
  std::string os_family;
  std::string os_arch;

  static platform detect();

  static std::optional<std::string> canonical_os_family(std::string_view name);
  static std::optional<std::string> canonical_arch(std::string_view name);

  /**
   * @param family Canonical family name. "unix" matches any of linux, macos and freebsd.
   */
  bool is_family(const std::string &family) const;
  bool is_unix() const;

  /** @brief os-arch tag, e.g. macos-arm64 */
  std::string tag() const;
};

} // namespace gantry
