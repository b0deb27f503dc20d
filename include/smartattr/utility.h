/*
 * utility.h
 *
 * Home page of code is: https://www.smartmontools.org
 *
 * Copyright (C) 2002-11 Bruce Allen
 * Copyright (C) 2008-25 Christian Franke
 * Copyright (C) 2000 Michael Cornwell <cornwell@acm.org>
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SMARTATTR_UTILITY_H
#define SMARTATTR_UTILITY_H

#include <smartattr/smartattr_defs.h>

#include <float.h> // *DBL_MANT_DIG
#include <stdarg.h>
#include <stdint.h>
#include <stdio.h>
#include <string.h>
#include <string>

#include <sys/types.h> // for regex.h (according to POSIX)
#include <regex.h>

namespace smartattr {

// Make version information string
std::string format_version_info(const char * prog_name, bool full = false);

// return (v)sprintf() formatted std::string
std::string strprintf(const char * fmt, ...)
    SMARTATTR_FORMAT_PRINTF(1, 2);
std::string vstrprintf(const char * fmt, va_list ap);

// Return true if STR starts with PREFIX
inline bool str_starts_with(const char * str, const char * prefix)
  { return !strncmp(str, prefix, strlen(prefix)); }

inline bool str_starts_with(const std::string & str, const char * prefix)
  { return !strncmp(str.c_str(), prefix, strlen(prefix)); }

// Message levels for lib_printf()
enum lib_msg_level
{
  LIBMSG_ERROR,
  LIBMSG_WARNING,
  LIBMSG_INFO,
  LIBMSG_DEBUG
};

// Print library messages?
// 0: errors and warnings only, 1: also info, 2: also debug
extern unsigned char lib_debugmode;

/// Class to register an application specific message handler.
class lib_msg_hook
{
public:
  lib_msg_hook() = default;
  virtual ~lib_msg_hook() = default;
  lib_msg_hook(const lib_msg_hook &) = delete;
  void operator=(const lib_msg_hook &) = delete;

  /// Get the current hook.
  static lib_msg_hook & get();

  /// Set the hook.
  static void set(lib_msg_hook & hook);

  /// Reset to default hook.
  static void reset();

  /// Handle a message from the library.  The message has no trailing newline.
  /// The default implementation prints the message to stderr.
  virtual void on_message(lib_msg_level level, const char * msg);
};

// Format a message and pass it to the current lib_msg_hook.
// Messages above the level enabled by lib_debugmode are dropped.
void lib_printf(lib_msg_level level, const char * fmt, ...)
    SMARTATTR_FORMAT_PRINTF(2, 3);

// Runtime check of build configuration, throws on error.
void check_config();

// returns true if any of the n bytes are nonzero, else zero.
bool nonempty(const void * data, int size);

// Format integer with thousands separator
const char * format_with_thousands_sep(char * str, int strsize, uint64_t val,
                                       const char * thousands_sep = 0);

// Format capacity with SI prefixes
const char * format_capacity(char * str, int strsize, uint64_t val,
                             const char * decimal_point = 0);

// Return #bits precision provided by uint128_hilo_to_str().
inline int uint128_to_str_precision_bits()
{
#if defined(SMARTATTR_HAVE___INT128)
  return 128;
#elif defined(SMARTATTR_HAVE_LONG_DOUBLE_WIDER_PRINTF)
  return LDBL_MANT_DIG;
#else
  return DBL_MANT_DIG;
#endif
}

// Convert 128-bit unsigned integer provided as two 64-bit halves to a string.
const char * uint128_hilo_to_str(char * str, int strsize, uint64_t value_hi, uint64_t value_lo);

// Version for fixed size buffers.
template <size_t SIZE>
inline const char * uint128_hilo_to_str(char (& str)[SIZE], uint64_t value_hi, uint64_t value_lo)
  { return uint128_hilo_to_str(str, (int)SIZE, value_hi, value_lo); }

/// Wrapper class for FILE *.
class stdio_file
{
public:
  explicit stdio_file(FILE * f = nullptr, bool owner = false)
    : m_file(f), m_owner(owner) { }

  stdio_file(const char * name, const char * mode)
    : m_file(fopen(name, mode)), m_owner(true) { }

  ~stdio_file()
    {
      if (m_file && m_owner)
        fclose(m_file);
    }

  stdio_file(const stdio_file &) = delete;
  void operator=(const stdio_file &) = delete;

  bool open(const char * name, const char * mode)
    {
      if (m_file && m_owner)
        fclose(m_file);
      m_file = fopen(name, mode);
      m_owner = true;
      return !!m_file;
    }

  bool close()
    {
      if (!m_file)
        return true;
      bool ok = !ferror(m_file);
      if (fclose(m_file))
        ok = false;
      m_file = nullptr;
      return ok;
    }

  operator FILE * ()
    { return m_file; }

  bool operator!() const
    { return !m_file; }

private:
  FILE * m_file;
  bool m_owner;
};

/// Wrapper class for POSIX regex(3) with extended syntax.
/// Supports copy & assignment and is compatible with STL containers.
class regular_expression
{
public:
  regular_expression();

  ~regular_expression();

  regular_expression(const regular_expression & x);

  regular_expression & operator=(const regular_expression & x);

  /// Construct with pattern, throw on error.
  explicit regular_expression(const char * pattern);

  /// Set and compile new pattern, return false on error.
  bool compile(const char * pattern);

  // Get pattern from last compile().
  const char * get_pattern() const
    { return m_pattern.c_str(); }

  /// Get error message from last compile().
  const char * get_errmsg() const
    { return m_errmsg.c_str(); }

  // Return true if pattern is not set or bad.
  bool empty() const
    { return (m_pattern.empty() || !m_errmsg.empty()); }

  typedef regmatch_t match_range;

  /// Return true if substring matches pattern, fill match_range array.
  bool execute(const char * str, unsigned nmatch = 0, match_range * pmatch = nullptr) const;

private:
  std::string m_pattern;
  std::string m_errmsg;

  regex_t m_regex_buf;
  void free_buf();
  void copy_buf(const regular_expression & x);

  bool compile();
};

} // namespace smartattr

#endif // SMARTATTR_UTILITY_H
