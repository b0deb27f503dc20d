/*
 * utility.cpp
 *
 * Home page of code is: https://www.smartmontools.org
 *
 * Copyright (C) 2002-12 Bruce Allen
 * Copyright (C) 2008-25 Christian Franke
 * Copyright (C) 2000 Michael Cornwell <cornwell@acm.org>
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <smartattr/utility.h>
#include <smartattr/byteorder.h>

#include <inttypes.h>
#include <stdlib.h>

#include <stdexcept>
#include <vector>

namespace smartattr {

// Make version information string
std::string format_version_info(const char * prog_name, bool full /*= false*/)
{
  std::string info = strprintf(
    "%s " SMARTATTR_VERSION " " SMARTATTR_RELEASE_DATE " [%s] " SMARTATTR_BUILD_INFO "\n"
    "Copyright (C) 2002-25, Bruce Allen, Christian Franke, www.smartmontools.org\n",
    prog_name, SMARTATTR_BUILD_HOST
  );
  if (!full)
    return info;

  info += strprintf(
    "\n"
    "%s comes with ABSOLUTELY NO WARRANTY. This is free\n"
    "software, and you are welcome to redistribute it under\n"
    "the terms of the GNU General Public License; either\n"
    "version 2, or (at your option) any later version.\n"
    "See https://www.gnu.org for further details.\n"
    "\n",
    prog_name
  );
  info +=
    "smartattr release " SMARTATTR_VERSION " dated " SMARTATTR_RELEASE_DATE "\n"
    "smartattr build host: " SMARTATTR_BUILD_HOST "\n"
    "smartattr drive database directory: " SMARTATTR_DRIVEDBDIR "\n";

  return info;
}

/////////////////////////////////////////////////////////////////////////////
// Library messages

unsigned char lib_debugmode = 0;

static lib_msg_hook default_msg_hook;
static lib_msg_hook * current_msg_hook = &default_msg_hook;

lib_msg_hook & lib_msg_hook::get()
{
  return *current_msg_hook;
}

void lib_msg_hook::set(lib_msg_hook & hook)
{
  current_msg_hook = &hook;
}

void lib_msg_hook::reset()
{
  current_msg_hook = &default_msg_hook;
}

void lib_msg_hook::on_message(lib_msg_level level, const char * msg)
{
  const char * prefix;
  switch (level) {
    case LIBMSG_ERROR:   prefix = "Error: "; break;
    case LIBMSG_WARNING: prefix = "Warning: "; break;
    default:             prefix = ""; break;
  }
  fprintf(stderr, "%s%s\n", prefix, msg);
}

void lib_printf(lib_msg_level level, const char * fmt, ...)
{
  if (   (level == LIBMSG_INFO  && lib_debugmode < 1)
      || (level == LIBMSG_DEBUG && lib_debugmode < 2))
    return;

  va_list ap; va_start(ap, fmt);
  std::string msg = vstrprintf(fmt, ap);
  va_end(ap);
  lib_msg_hook::get().on_message(level, msg.c_str());
}

/////////////////////////////////////////////////////////////////////////////

// Runtime check of byte ordering, throws if different from host_byte_order().
static void check_endianness()
{
  union {
    // Force compile error if int type is not 32bit.
    unsigned char c[sizeof(unsigned) == 4 ? 4 : -1];
    unsigned i;
  } x = {{1,2,3,4}};

  int big = -1;
  switch (x.i) {
    case 0x01020304: big = 1; break;
    case 0x04030201: big = 0; break;
  }

  if (big != (host_byte_order() == BYTEORDER_BE ? 1 : 0))
    throw std::logic_error("CPU endianness does not match compile time test");
}

// Truncation is intended here
#if defined(__GNUC__) && !defined(__clang__) && __GNUC__ >= 7
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-truncation"
#endif

static void check_snprintf()
{
  char buf[] =              "ABCDEFGHI";
  int n1 = snprintf(buf, 8, "123456789");
  int n2 = snprintf(buf, 0, "X");
  if (!(!strcmp(buf, "1234567") && n1 == 9 && n2 == 1))
    throw std::logic_error("Function snprintf() does not conform to C99");
}

#if defined(__GNUC__) && !defined(__clang__) && __GNUC__ >= 7
#pragma GCC diagnostic pop
#endif

// Runtime check of build configuration, throws on error.
void check_config()
{
  check_endianness();
  check_snprintf();
}

/////////////////////////////////////////////////////////////////////////////
// Wrapper class for regex(3)

// Check regular expression for non-portable features.
//
// POSIX extended regular expressions interpret unmatched ')' ordinary:
// "The close-parenthesis shall be considered special in this context
//  only if matched with a preceding open-parenthesis."
//
// GNU libc and BSD libc support unmatched ')', Cygwin reports an error.
//
// POSIX extended regular expressions do not define empty subexpressions:
// "A vertical-line appearing first or last in an ERE, or immediately following
//  a vertical-line or a left-parenthesis, or immediately preceding a
//  right-parenthesis, produces undefined results."
//
// GNU libc and Cygwin support empty subexpressions, BSD libc reports an error.
//
static const char * check_regex(const char * pattern)
{
  int level = 0;
  char c;

  for (int i = 0; (c = pattern[i]); i++) {
    // Skip "\x"
    if (c == '\\') {
      if (!pattern[++i])
        break;
      continue;
    }

    // Skip "[...]"
    if (c == '[') {
      if (pattern[++i] == '^')
        i++;
      if (!pattern[i++])
        break;
      while ((c = pattern[i]) && c != ']')
        i++;
      if (!c)
        break;
      continue;
    }

    // Check "(...)" nesting
    if (c == '(')
      level++;
    else if (c == ')' && --level < 0)
      return "Unmatched ')'";

    // Check for leading/trailing '|' or "||", "|)", "|$", "(|", "^|"
    char c1;
    if (   (c == '|' && (   i == 0 || !(c1 = pattern[i+1])
                          || c1 == '|' || c1 == ')' || c1 == '$'))
        || ((c == '(' || c == '^') && pattern[i+1] == '|')       )
      return "Empty '|' subexpression";
  }

  return nullptr;
}

regular_expression::regular_expression()
{
  memset(&m_regex_buf, 0, sizeof(m_regex_buf));
}

regular_expression::regular_expression(const char * pattern)
{
  memset(&m_regex_buf, 0, sizeof(m_regex_buf));
  if (!compile(pattern))
    throw std::runtime_error(strprintf(
      "error in regular expression \"%s\": %s",
      m_pattern.c_str(), m_errmsg.c_str()));
}

regular_expression::~regular_expression()
{
  free_buf();
}

regular_expression::regular_expression(const regular_expression & x)
: m_pattern(x.m_pattern),
  m_errmsg(x.m_errmsg)
{
  memset(&m_regex_buf, 0, sizeof(m_regex_buf));
  copy_buf(x);
}

regular_expression & regular_expression::operator=(const regular_expression & x)
{
  if (this == &x)
    return *this;
  m_pattern = x.m_pattern;
  m_errmsg = x.m_errmsg;
  free_buf();
  copy_buf(x);
  return *this;
}

void regular_expression::free_buf()
{
  if (nonempty(&m_regex_buf, sizeof(m_regex_buf))) {
    regfree(&m_regex_buf);
    memset(&m_regex_buf, 0, sizeof(m_regex_buf));
  }
}

void regular_expression::copy_buf(const regular_expression & x)
{
  if (nonempty(&x.m_regex_buf, sizeof(x.m_regex_buf))) {
    // There is no POSIX compiled-regex-copy command.
    if (!compile())
      throw std::runtime_error(strprintf(
        "Unable to recompile regular expression \"%s\": %s",
        m_pattern.c_str(), m_errmsg.c_str()));
  }
}

bool regular_expression::compile(const char * pattern)
{
  free_buf();
  m_pattern = pattern;
  return compile();
}

bool regular_expression::compile()
{
  int errcode = regcomp(&m_regex_buf, m_pattern.c_str(), REG_EXTENDED);
  if (errcode) {
    char errmsg[512];
    regerror(errcode, &m_regex_buf, errmsg, sizeof(errmsg));
    m_errmsg = errmsg;
    free_buf();
    return false;
  }

  const char * errmsg = check_regex(m_pattern.c_str());
  if (errmsg) {
    m_errmsg = errmsg;
    free_buf();
    return false;
  }

  m_errmsg.clear();
  return true;
}

bool regular_expression::execute(const char * str, unsigned nmatch,
                                 match_range * pmatch) const
{
  if (empty())
    return false;
  return !regexec(&m_regex_buf, str, nmatch, pmatch, 0);
}

/////////////////////////////////////////////////////////////////////////////

// Returns true if region of memory contains non-zero entries
bool nonempty(const void * data, int size)
{
  for (int i = 0; i < size; i++)
    if (((const unsigned char *)data)[i])
      return true;
  return false;
}

// Format integer with thousands separator
const char * format_with_thousands_sep(char * str, int strsize, uint64_t val,
                                       const char * thousands_sep /* = 0 */)
{
  if (!thousands_sep)
    thousands_sep = ",";

  char num[64];
  snprintf(num, sizeof(num), "%" PRIu64, val);
  int numlen = strlen(num);

  int i = 0, j = 0;
  do
    str[j++] = num[i++];
  while (i < numlen && (numlen - i) % 3 != 0 && j < strsize-1);
  str[j] = 0;

  while (i < numlen && j < strsize-1) {
    j += snprintf(str+j, strsize-j, "%s%.3s", thousands_sep, num+i);
    i += 3;
  }

  return str;
}

// Format capacity with SI prefixes
const char * format_capacity(char * str, int strsize, uint64_t val,
                             const char * decimal_point /* = 0 */)
{
  if (!decimal_point)
    decimal_point = ".";

  const unsigned factor = 1000; // 1024 for KiB,MiB,...
  static const char prefixes[] = " KMGTP";

  // Find d with val in [d, d*factor)
  unsigned i = 0;
  uint64_t d = 1;
  for (uint64_t d2 = d * factor; val >= d2; d2 *= factor) {
    d = d2;
    if (++i >= sizeof(prefixes)-2)
      break;
  }

  // Print 3 digits
  uint64_t n = val / d;
  if (i == 0)
    snprintf(str, strsize, "%u B", (unsigned)n);
  else if (n >= 100) // "123 xB"
    snprintf(str, strsize, "%" PRIu64 " %cB", n, prefixes[i]);
  else if (n >= 10)  // "12.3 xB"
    snprintf(str, strsize, "%" PRIu64 "%s%u %cB", n, decimal_point,
        (unsigned)(((val % d) * 10) / d), prefixes[i]);
  else               // "1.23 xB"
    snprintf(str, strsize, "%" PRIu64 "%s%02u %cB", n, decimal_point,
        (unsigned)(((val % d) * 100) / d), prefixes[i]);

  return str;
}

// Convert 128-bit unsigned integer provided as two 64-bit halves to a string.
const char * uint128_hilo_to_str(char * str, int strsize, uint64_t value_hi, uint64_t value_lo)
{
#if defined(SMARTATTR_HAVE___INT128)
  unsigned __int128 value = ((unsigned __int128)value_hi << 64) | value_lo;
  char buf[40 + 1];
  int i = sizeof(buf) - 1;
  buf[i] = 0;
  do {
    buf[--i] = '0' + (int)(value % 10);
    value /= 10;
  } while (value && i > 0);
  snprintf(str, strsize, "%s", buf + i);
#elif defined(SMARTATTR_HAVE_LONG_DOUBLE_WIDER_PRINTF)
  snprintf(str, strsize, "%.0Lf", value_hi * (0xffffffffffffffffULL + 1.0L) + value_lo);
#else
  snprintf(str, strsize, "%.0f", value_hi * (0xffffffffffffffffULL + 1.0) + value_lo);
#endif
  return str;
}

// return (v)sprintf() formatted std::string

std::string vstrprintf(const char * fmt, va_list ap)
{
  char buf[512];
  va_list ap2; va_copy(ap2, ap);
  int n = vsnprintf(buf, sizeof(buf), fmt, ap);
  if (n < 0) {
    va_end(ap2);
    return std::string();
  }
  if (n < (int)sizeof(buf)) {
    va_end(ap2);
    return std::string(buf, n);
  }

  // Output truncated, retry with exact size
  std::vector<char> big(n + 1);
  vsnprintf(big.data(), big.size(), fmt, ap2);
  va_end(ap2);
  return std::string(big.data(), n);
}

std::string strprintf(const char * fmt, ...)
{
  va_list ap; va_start(ap, fmt);
  std::string str = vstrprintf(fmt, ap);
  va_end(ap);
  return str;
}

} // namespace smartattr
