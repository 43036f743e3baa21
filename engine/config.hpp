// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================
#ifndef CONFIG_H
#define CONFIG_H

/* This file contains platform, compiler and general macros and defines,
 * etc.
 */

// ==========================================================================
// Platform
// ==========================================================================

#if defined(__APPLE__) || defined(__MACH__)
#  define FC_OSX
#endif

#if defined( WIN32 ) || defined( _WIN32 ) || defined( __WIN32 )
#  define FC_WINDOWS
#  define WIN32_LEAN_AND_MEAN
#  define VC_EXTRALEAN
#  define NOMINMAX
#  ifndef _CRT_SECURE_NO_WARNINGS
#    define _CRT_SECURE_NO_WARNINGS
#  endif
#endif

#if defined(__linux) || defined(__linux__) || defined(linux)
#  define FC_LINUX
#endif

// ==========================================================================
// Compiler Definitions
// ==========================================================================

#if defined( __GNUC__ ) && !defined( __clang__ ) // Do NOT define FC_GCC for Clang
#  define FC_GCC ( __GNUC__ * 10000 + __GNUC_MINOR__ * 100 + __GNUC_PATCHLEVEL__ )
#endif
#if defined( __clang__ )
#  define FC_CLANG ( __clang_major__ * 10000 + __clang_minor__ * 100 + __clang_patchlevel__ )
#endif
#if defined( _MSC_VER )
#  define FC_VS _MSC_VER
#endif

// ==========================================================================
// Compiler Minimal Limits
// ==========================================================================

// gcc7 / clang 5 / MSVS 19.14 are the first releases with (~full) C++17 support
#if defined( FC_CLANG ) && FC_CLANG < 50000
#  error "clang++ below version 5 not supported"
#endif
#if defined( FC_GCC ) && FC_GCC < 70000
#  error "g++ below version 7 not supported"
#endif
#if defined( FC_VS ) && FC_VS < 1914
#  error "Visual Studio 2017 below version 15.7 not supported"
#endif

// ==========================================================================
// General Macros/Defines
// ==========================================================================

#ifndef __has_cpp_attribute
#  define __has_cpp_attribute(x) 0
#endif

#if __cplusplus > 201402L && __has_cpp_attribute(fallthrough)
#  define FC_FALLTHROUGH [[fallthrough]]
#elif __has_cpp_attribute(gnu::fallthrough)
#  define FC_FALLTHROUGH [[gnu::fallthrough]]
#else
#  define FC_FALLTHROUGH
#endif

// ==========================================================================
// Threading
// ==========================================================================

#if defined( FC_NO_THREADING )
constexpr bool FC_NO_THREADING_ON = true;
#else
constexpr bool FC_NO_THREADING_ON = false;
#endif

// ==========================================================================
// Floating Point
// ==========================================================================

/**
 * Tolerance used when comparing simulated times and resources that were
 * produced by floating point arithmetic.
 */
constexpr double FC_EPSILON = 1e-9;

// ==========================================================================
// Feralcraft related value definitions
// ==========================================================================

#define FC_MAJOR_VERSION "340"
#define FC_MINOR_VERSION "03"
#define FC_VERSION ( FC_MAJOR_VERSION "-" FC_MINOR_VERSION )

constexpr int MAX_COMBO_POINTS = 5;
constexpr int MAX_LACERATE_STACKS = 5;

#endif // CONFIG_H
