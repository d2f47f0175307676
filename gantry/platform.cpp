#include "platform.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#if !defined(_WIN32)
#include <sys/utsname.h>
#endif

namespace gantry {

static std::string to_lower(std::string_view text)
{
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lower;
}

std::optional<std::string> platform::canonical_os_family(std::string_view name)
{
  static const std::map<std::string, std::string> families = {
    // clang-format off
    { "windows", "windows" },
    { "win32", "windows" },
    { "macos", "macos" },
    { "mac", "macos" },
    { "darwin", "macos" },
    { "osx", "macos" },
    { "linux", "linux" },
    { "freebsd", "freebsd" },
    { "unix", "unix" }
    // clang-format on
  };
  auto i = families.find(to_lower(name));
  if (i == families.end())
    return std::nullopt;
  return i->second;
}

std::optional<std::string> platform::canonical_arch(std::string_view name)
{
  static const std::map<std::string, std::string> architectures = {
    // clang-format off
    { "x86_64", "x86_64" },
    { "amd64", "x86_64" },
    { "x64", "x86_64" },
    { "x86", "x86" },
    { "i386", "x86" },
    { "i686", "x86" },
    { "arm64", "arm64" },
    { "aarch64", "arm64" },
    { "arm", "arm" },
    { "armv7l", "arm" }
    // clang-format on
  };
  auto i = architectures.find(to_lower(name));
  if (i == architectures.end())
    return std::nullopt;
  return i->second;
}

platform platform::detect()
{
  platform host;
#if defined(_WIN64) || defined(_WIN32) || defined(__CYGWIN__)
  host.os_family = "windows";
#elif defined(__APPLE__)
  host.os_family = "macos";
#elif defined(__linux__)
  host.os_family = "linux";
#elif defined(__FreeBSD__)
  host.os_family = "freebsd";
#endif

#if !defined(_WIN32)
  struct utsname name;
  if (uname(&name) == 0) {
    if (auto arch = canonical_arch(name.machine))
      host.os_arch = *arch;
  }
#endif
  if (host.os_arch.empty()) {
#if defined(__x86_64__) || defined(_M_X64)
    host.os_arch = "x86_64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    host.os_arch = "arm64";
#elif defined(__i386__) || defined(_M_IX86)
    host.os_arch = "x86";
#elif defined(__arm__) || defined(_M_ARM)
    host.os_arch = "arm";
#endif
  }
  return host;
}

bool platform::is_unix() const
{
  return os_family == "linux" || os_family == "macos" || os_family == "freebsd";
}

bool platform::is_family(const std::string &family) const
{
  if (family == "unix")
    return is_unix();
  return os_family == family;
}

std::string platform::tag() const
{
  return os_family + "-" + os_arch;
}

} // namespace gantry
