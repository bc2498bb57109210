/**
 * @file export.hpp
 * @brief PSGUI_APP_API for symbols of the psgui_app library.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/visibility.hpp"

#if defined(PSGUI_APP_BUILD)
    #define PSGUI_APP_API PSGUI_SYMBOL_EXPORT
#else
    #define PSGUI_APP_API PSGUI_SYMBOL_IMPORT
#endif
