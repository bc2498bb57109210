/**
 * @file uuid.hpp
 * @brief Random identifiers for streaming-pull client ids.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/utils/export.hpp"

#include <string>

namespace psgui {
namespace utils {

/**
 * @brief Generate an RFC 4122 version 4 UUID, lowercase hex.
 *
 * Thread-safe; each thread owns its generator.
 * Format: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
 */
PSGUI_UTILS_API std::string generateUuid();

/**
 * @brief True if @p text has the 8-4-4-4-12 hex layout.
 */
PSGUI_UTILS_API bool isUuid(const std::string& text);

}  // namespace utils
}  // namespace psgui
