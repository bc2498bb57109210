/**
 * @file export.hpp
 * @brief PSGUI_SANDBOX_API for symbols of the psgui_sandbox library.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/visibility.hpp"

#if defined(PSGUI_SANDBOX_BUILD)
    #define PSGUI_SANDBOX_API PSGUI_SYMBOL_EXPORT
#else
    #define PSGUI_SANDBOX_API PSGUI_SYMBOL_IMPORT
#endif
