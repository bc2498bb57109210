/**
 * @file export.hpp
 * @brief PSGUI_UTILS_API for symbols of the psgui_utils library.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/visibility.hpp"

#if defined(PSGUI_UTILS_BUILD)
    #define PSGUI_UTILS_API PSGUI_SYMBOL_EXPORT
#else
    #define PSGUI_UTILS_API PSGUI_SYMBOL_IMPORT
#endif
