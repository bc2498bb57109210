/**
 * @file export.hpp
 * @brief PSGUI_SERVICES_API for symbols of the psgui_services library.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#include "psgui/visibility.hpp"

#if defined(PSGUI_SERVICES_BUILD)
    #define PSGUI_SERVICES_API PSGUI_SYMBOL_EXPORT
#else
    #define PSGUI_SERVICES_API PSGUI_SYMBOL_IMPORT
#endif
