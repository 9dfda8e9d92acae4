#include "osc-utils/src/PathUtils.hpp"

#include <cstdint>
#include <stdexcept>
#include <system_error>
#include <vector>

#if defined(__APPLE__)
#include <mach-o/dyld.h>
#elif !defined(__linux__)
#error "executableDirectory() supports Linux and macOS only"
#endif

namespace osc_utils
{

namespace
{

std::filesystem::path executablePath()
{
#if defined(__APPLE__)
  uint32_t size = 0;
  _NSGetExecutablePath(nullptr, &size);  // Reports the required size
  std::vector<char> buffer(size + 1, '\0');
  if (_NSGetExecutablePath(buffer.data(), &size) != 0)
  {
    throw std::runtime_error("Cannot determine executable path");
  }
  std::error_code ec;
  auto resolved = std::filesystem::weakly_canonical(buffer.data(), ec);
#else
  std::error_code ec;
  auto resolved = std::filesystem::read_symlink("/proc/self/exe", ec);
#endif

  if (ec)
  {
    throw std::runtime_error("Cannot determine executable path: " +
                             ec.message());
  }
  return resolved;
}

}  // namespace

std::filesystem::path executableDirectory()
{
  return executablePath().parent_path();
}

std::filesystem::path absolutePath(const std::string& relativePath)
{
  // absolute() rather than canonical(): the data directory may not exist yet
  return std::filesystem::absolute(executableDirectory() / relativePath)
    .lexically_normal();
}

}  // namespace osc_utils
