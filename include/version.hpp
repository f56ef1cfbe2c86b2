#ifndef DEPLOYHOOK_VERSION_HPP
#define DEPLOYHOOK_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                     */
#define DEPLOYHOOK_VERSION_MAJOR 1
#define DEPLOYHOOK_VERSION_MINOR 0
#define DEPLOYHOOK_VERSION_PATCH 0

/*
 * Release tag injected by the CI workflow.
 * Example format: "2026.10.19-1".
 */
#define DEPLOYHOOK_VERSION_STR "1.0.0"
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* DEPLOYHOOK_VERSION = DEPLOYHOOK_VERSION_STR;

#endif /* DEPLOYHOOK_VERSION_HPP */
