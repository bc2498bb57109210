/**
 * @file export.hpp
 * @brief PSGUI_NET_API for symbols of the psgui_net library.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/visibility.hpp"

#if defined(PSGUI_NET_BUILD)
    #define PSGUI_NET_API PSGUI_SYMBOL_EXPORT
#else
    #define PSGUI_NET_API PSGUI_SYMBOL_IMPORT
#endif
