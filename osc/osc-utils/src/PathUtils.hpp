#ifndef OSC_UTILS_PATH_UTILS_HPP
#define OSC_UTILS_PATH_UTILS_HPP

#include <filesystem>
#include <string>

namespace osc_utils
{

/**
 * Convert a string path to an absolute filesystem path relative to the
 * directory containing the current executable.
 *
 * @param relativePath The path string relative to the executable directory
 * @return An absolute, lexically normalized filesystem path (the path does
 *         not need to exist)
 * @throws std::runtime_error if the executable location cannot be determined
 *
 * Example:
 *   If executable is at: /opt/orbit-scale/bin/orbit_scale
 *   And relativePath is: "../data"
 *   Returns: /opt/orbit-scale/data
 */
std::filesystem::path absolutePath(const std::string& relativePath);

/**
 * @brief Directory containing the running executable
 * @throws std::runtime_error if the executable location cannot be determined
 */
std::filesystem::path executableDirectory();

}  // namespace osc_utils

#endif  // OSC_UTILS_PATH_UTILS_HPP
