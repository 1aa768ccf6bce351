// =====================================================================
//  src/liblasercam/lasercam/core.h — Library initialization and export macros
// =====================================================================
//
//  Part of liblasercam.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LASERCAM_CORE_H
#define LASERCAM_CORE_H

// ---- Export macro ----------------------------------------------------
//
// When building liblasercam as a shared library, LASERCAM_SHARED and
// LASERCAM_BUILDING are defined.  Consumers linking against the shared
// library only see LASERCAM_SHARED (set as a PUBLIC compile definition).

#if defined(LASERCAM_SHARED)
  #if defined(LASERCAM_BUILDING)
    #if defined(_WIN32)
      #define LASERCAM_EXPORT __declspec(dllexport)
    #else
      #define LASERCAM_EXPORT __attribute__((visibility("default")))
    #endif
  #else
    #if defined(_WIN32)
      #define LASERCAM_EXPORT __declspec(dllimport)
    #else
      #define LASERCAM_EXPORT
    #endif
  #endif
#else
  #define LASERCAM_EXPORT
#endif

namespace lasercam {

/// Library version string (e.g., "0.3.0").
LASERCAM_EXPORT const char* version();

/// Initialize library-wide state (logging filter rules).
/// Call once at application startup before using other functions.
/// Returns true on success.
LASERCAM_EXPORT bool initialize();

/// Shut down the library and release resources.
/// Call once at application exit.
LASERCAM_EXPORT void shutdown();

}  // namespace lasercam

#endif  // LASERCAM_CORE_H
