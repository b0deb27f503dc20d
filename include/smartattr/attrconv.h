/*
 * attrconv.h - SMART attribute raw value decoding and formatting
 *
 * Home page of code is: https://www.smartmontools.org
 *
 * Copyright (C) 2002-2011 Bruce Allen
 * Copyright (C) 2008-2025 Christian Franke
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SMARTATTR_ATTRCONV_H
#define SMARTATTR_ATTRCONV_H

#include <smartattr/ata.h>

#include <stdint.h>
#include <string>

namespace smartattr {

// Raw attribute value print formats
enum ata_attr_raw_format
{
  RAWFMT_UNKNOWN, // Name not in table, prints "?"
  RAWFMT_RAW8,
  RAWFMT_RAW16,
  RAWFMT_RAW48,
  RAWFMT_HEX48,
  RAWFMT_RAW56,
  RAWFMT_HEX56,
  RAWFMT_RAW64,
  RAWFMT_HEX64,
  RAWFMT_RAW16_OPT_RAW16,
  RAWFMT_RAW16_OPT_AVG16,
  RAWFMT_RAW24_OPT_RAW8,
  RAWFMT_RAW24_DIV_RAW24,
  RAWFMT_RAW24_DIV_RAW32,
  RAWFMT_SEC2HOUR,
  RAWFMT_MIN2HOUR,
  RAWFMT_HALFMIN2HOUR,
  RAWFMT_MSEC24_HOUR32,
  RAWFMT_TEMPMINMAX,
  RAWFMT_TEMP10X,
};

// Attribute flags
enum {
  ATTRFLAG_NO_NORMVAL  = 0x02, // Normalized value not valid
  ATTRFLAG_NO_WORSTVAL = 0x04, // Worst value not valid
};

// Get name of raw format, nullptr for RAWFMT_UNKNOWN.
const char * ata_get_raw_format_name(ata_attr_raw_format format);

// Get default byte order string for raw format.
const char * ata_get_default_byteorder(ata_attr_raw_format format);

/// Raw value conversion rule: print format with optional byte order.
/// Rules not found in the format table are kept with their original name.
class ata_raw_format
{
public:
  ata_raw_format()
    : m_format(RAWFMT_UNKNOWN)
    { m_byteorder[0] = 0; }

  explicit ata_raw_format(ata_attr_raw_format format)
    : m_format(format)
    { m_byteorder[0] = 0; }

  /// Parse "FORMAT[:BYTEORDER]".  BYTEORDER consists of up to 8 chars
  /// [012345rvwz].  Never fails: an invalid or unknown string results
  /// in a RAWFMT_UNKNOWN rule which keeps the string.
  static ata_raw_format parse(const char * str);

  ata_attr_raw_format format() const
    { return m_format; }

  /// Return true if format was found in table.
  bool is_known() const
    { return (m_format != RAWFMT_UNKNOWN); }

  /// Return true if this is the zero-value rule.
  bool empty() const
    { return (m_format == RAWFMT_UNKNOWN && m_unknown.empty()); }

  /// Byte order string, default byte order of format if not specified.
  const char * get_byteorder() const;

  /// Return true if byte order was specified explicitly.
  bool has_byteorder() const
    { return !!m_byteorder[0]; }

  /// Get ATTRFLAG_NO_* flags implied by the byte order.
  unsigned get_flags() const;

  /// Name as used in drive database, original string if unknown.
  std::string str() const;

private:
  ata_attr_raw_format m_format;
  char m_byteorder[8+1]; // String [012345rvwz] to define byte order
  std::string m_unknown; // Original string if RAWFMT_UNKNOWN
};

// Get attribute raw value.
uint64_t ata_get_attr_raw_value(const ata_smart_attribute & attr,
                                const ata_raw_format & conv);

// Format attribute raw value.
std::string ata_format_attr_raw_value(uint64_t rawvalue,
                                      const ata_raw_format & conv);

// Version with rule given as string.
std::string ata_format_attr_raw_value(uint64_t rawvalue, const char * conv);

// Get and format attribute raw value.
std::string ata_format_attr_raw_value(const ata_smart_attribute & attr,
                                      const ata_raw_format & conv);

// Return a multiline string containing a list of valid arguments for
// ata_raw_format::parse().
std::string create_raw_format_arg_list();

} // namespace smartattr

#endif // SMARTATTR_ATTRCONV_H
