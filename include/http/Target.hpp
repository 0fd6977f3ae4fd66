#pragma once

#include <string>

namespace greeting::http {

/**
 * @brief Путь из request-target вида "/path?query#fragment"
 *
 * Query string и fragment отбрасываются, пустой путь превращается в "/".
 */
std::string targetPath(const std::string& target);

} // namespace greeting::http
