/**
 * @file visibility.hpp
 * @brief Shared building blocks for the per-library PSGUI_<AREA>_API macros.
 *
 * Static builds define PSGUI_STATIC and every API macro expands to nothing.
 *
 * @copyright Copyright (c) 2025 psgui Contributors
 * @license MIT License
 */

#pragma once

#if defined(PSGUI_STATIC)
    #define PSGUI_SYMBOL_EXPORT
    #define PSGUI_SYMBOL_IMPORT
#elif defined(_WIN32)
    #define PSGUI_SYMBOL_EXPORT __declspec(dllexport)
    #define PSGUI_SYMBOL_IMPORT __declspec(dllimport)
#elif defined(__GNUC__) || defined(__clang__)
    #define PSGUI_SYMBOL_EXPORT __attribute__((visibility("default")))
    #define PSGUI_SYMBOL_IMPORT
#else
    #define PSGUI_SYMBOL_EXPORT
    #define PSGUI_SYMBOL_IMPORT
#endif
