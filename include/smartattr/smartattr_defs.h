/*
 * smartattr_defs.h - libsmartattr internal defines
 *
 * Home page of code is: https://www.smartmontools.org
 *
 * Copyright (C) 2025 Christian Franke
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SMARTATTR_DEFS_H
#define SMARTATTR_DEFS_H

#include <smartattr/smartattr_config.h>

#include <type_traits>

// Enable format check of printf()-like functions
#ifndef __GNUC__
#define SMARTATTR_FORMAT_PRINTF(x, y)  /**/
#elif defined(__MINGW32__) && !defined(__clang__) && __USE_MINGW_ANSI_STDIO
// Check format of __mingw_*printf() instead of MSVCRT.DLL:*printf()
#define SMARTATTR_FORMAT_PRINTF(x, y)  __attribute__((format (gnu_printf, x, y)))
#else
#define SMARTATTR_FORMAT_PRINTF(x, y)  __attribute__((format (printf, x, y)))
#endif

// Add __attribute__((packed)) if compiler supports it
// because some older gcc versions ignore #pragma pack()
#ifdef SMARTATTR_HAVE_ATTR_PACKED
#define SMARTATTR_ATTR_PACKED __attribute__((packed))
#else
#define SMARTATTR_ATTR_PACKED /**/
#endif

// Static assert macros
// Don't use single argument 'static_assert(x)' because it requires C++17
#define SMARTATTR_STATIC_ASSERT(x) static_assert((x), #x)
// Ensure portable data structure size
#define SMARTATTR_ASSERT_SIZEOF(t, n) \
  SMARTATTR_STATIC_ASSERT(std::is_standard_layout<t>::value && sizeof(t) == (n))

#endif // SMARTATTR_DEFS_H
