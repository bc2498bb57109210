/**
 * @file export.hpp
 * @brief PSGUI_CORE_API for symbols of the psgui_core library.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/visibility.hpp"

#if defined(PSGUI_CORE_BUILD)
    #define PSGUI_CORE_API PSGUI_SYMBOL_EXPORT
#else
    #define PSGUI_CORE_API PSGUI_SYMBOL_IMPORT
#endif
