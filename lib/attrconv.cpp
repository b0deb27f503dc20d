/*
 * attrconv.cpp
 *
 * Home page of code is: https://www.smartmontools.org
 *
 * Copyright (C) 2002-11 Bruce Allen
 * Copyright (C) 2008-25 Christian Franke
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#define __STDC_FORMAT_MACROS 1 // enable PRI* for C++

#include <smartattr/attrconv.h>
#include <smartattr/utility.h>

#include <inttypes.h>
#include <stdio.h>
#include <string.h>

namespace smartattr {

// Table of raw print format names
struct format_name_entry
{
  const char * name;
  ata_attr_raw_format format;
};

const format_name_entry format_names[] = {
  {"raw8"           , RAWFMT_RAW8},
  {"raw16"          , RAWFMT_RAW16},
  {"raw48"          , RAWFMT_RAW48},
  {"hex48"          , RAWFMT_HEX48},
  {"raw56"          , RAWFMT_RAW56},
  {"hex56"          , RAWFMT_HEX56},
  {"raw64"          , RAWFMT_RAW64},
  {"hex64"          , RAWFMT_HEX64},
  {"raw16(raw16)"   , RAWFMT_RAW16_OPT_RAW16},
  {"raw16(avg16)"   , RAWFMT_RAW16_OPT_AVG16},
  {"raw24(raw8)"    , RAWFMT_RAW24_OPT_RAW8},
  {"raw24/raw24"    , RAWFMT_RAW24_DIV_RAW24},
  {"raw24/raw32"    , RAWFMT_RAW24_DIV_RAW32},
  {"sec2hour"       , RAWFMT_SEC2HOUR},
  {"min2hour"       , RAWFMT_MIN2HOUR},
  {"halfmin2hour"   , RAWFMT_HALFMIN2HOUR},
  {"msec24hour32"   , RAWFMT_MSEC24_HOUR32},
  {"tempminmax"     , RAWFMT_TEMPMINMAX},
  {"temp10x"        , RAWFMT_TEMP10X},
};

const unsigned num_format_names = sizeof(format_names)/sizeof(format_names[0]);

const char * ata_get_raw_format_name(ata_attr_raw_format format)
{
  for (unsigned i = 0; i < num_format_names; i++) {
    if (format_names[i].format == format)
      return format_names[i].name;
  }
  return nullptr;
}

const char * ata_get_default_byteorder(ata_attr_raw_format format)
{
  switch (format) {
    case RAWFMT_RAW64:
    case RAWFMT_HEX64:
      return "543210wv";
    case RAWFMT_RAW56:
    case RAWFMT_HEX56:
    case RAWFMT_RAW24_DIV_RAW32:
    case RAWFMT_MSEC24_HOUR32:
      return "r543210";
    default:
      return "543210";
  }
}

ata_raw_format ata_raw_format::parse(const char * str)
{
  ata_raw_format conv;

  // Split "format[:byteorder]"
  const char * colon = strchr(str, ':');
  std::string fmtname(str, (colon ? (size_t)(colon - str) : strlen(str)));
  char byteorder[8+1] = "";
  if (colon) {
    int n = -1;
    if (!(   sscanf(colon + 1, "%8[012345rvwz]%n", byteorder, &n) == 1
          && n == (int)strlen(colon + 1))) {
      conv.m_unknown = str;
      return conv;
    }
  }

  // Find format name
  for (unsigned i = 0; i < num_format_names; i++) {
    if (fmtname == format_names[i].name) {
      conv.m_format = format_names[i].format;
      snprintf(conv.m_byteorder, sizeof(conv.m_byteorder), "%s", byteorder);
      return conv;
    }
  }

  // Not found
  conv.m_unknown = str;
  return conv;
}

const char * ata_raw_format::get_byteorder() const
{
  if (m_byteorder[0])
    return m_byteorder;
  return ata_get_default_byteorder(m_format);
}

unsigned ata_raw_format::get_flags() const
{
  unsigned flags = 0;
  if (m_byteorder[0]) {
    if (strchr(m_byteorder, 'v'))
      flags |= (ATTRFLAG_NO_NORMVAL|ATTRFLAG_NO_WORSTVAL);
    if (strchr(m_byteorder, 'w'))
      flags |= ATTRFLAG_NO_WORSTVAL;
  }
  // 64-bit formats use the normalized and worst value bytes.
  else if (m_format == RAWFMT_RAW64 || m_format == RAWFMT_HEX64)
    flags |= (ATTRFLAG_NO_NORMVAL|ATTRFLAG_NO_WORSTVAL);
  return flags;
}

std::string ata_raw_format::str() const
{
  if (m_format == RAWFMT_UNKNOWN)
    return m_unknown;
  std::string s = ata_get_raw_format_name(m_format);
  if (m_byteorder[0]) {
    s += ':'; s += m_byteorder;
  }
  return s;
}

// Get attribute raw value.
uint64_t ata_get_attr_raw_value(const ata_smart_attribute & attr,
                                const ata_raw_format & conv)
{
  const char * byteorder = conv.get_byteorder();

  // Build 64-bit value from selected bytes
  uint64_t rawvalue = 0;
  for (int i = 0; byteorder[i]; i++) {
    unsigned char b;
    switch (byteorder[i]) {
      case '0': b = attr.raw[0];  break;
      case '1': b = attr.raw[1];  break;
      case '2': b = attr.raw[2];  break;
      case '3': b = attr.raw[3];  break;
      case '4': b = attr.raw[4];  break;
      case '5': b = attr.raw[5];  break;
      case 'r': b = attr.reserv;  break;
      case 'v': b = attr.current; break;
      case 'w': b = attr.worst;   break;
      default : b = 0;            break;
    }
    rawvalue <<= 8; rawvalue |= b;
  }

  return rawvalue;
}

// Helper functions for RAWFMT_TEMPMINMAX
static inline int check_temp_word(unsigned word)
{
  if (word <= 0x7f)
    return 0x11; // >= 0, signed byte or word
  if (word <= 0xff)
    return 0x01; // < 0, signed byte
  if (0xff80 <= word)
    return 0x10; // < 0, signed word
  return 0x00;
}

static bool check_temp_range(int t, unsigned char ut1, unsigned char ut2,
                             int & lo, int & hi)
{
  int t1 = (signed char)ut1, t2 = (signed char)ut2;
  if (t1 > t2) {
    int tx = t1; t1 = t2; t2 = tx;
  }

  if (   -60 <= t1 && t1 <= t && t <= t2 && t2 <= 120
      && !(t1 == -1 && t2 <= 0)                      ) {
    lo = t1; hi = t2;
    return true;
  }
  return false;
}

// Format temperature with optional min/max values
static std::string format_tempminmax(const unsigned char (& raw)[6],
                                     const unsigned (& word)[3])
{
  // Search for possible min/max values
  // [5][4][3][2][1][0] raw[]
  // [ 2 ] [ 1 ] [ 0 ]  word[]
  // xx HH xx LL xx TT (Hitachi/HGST)
  // xx LL xx HH xx TT (Kingston SSDs)
  // 00 00 HH LL xx TT (Maxtor, Samsung, Seagate, Toshiba)
  // 00 00 00 HH LL TT (WDC)
  // CC CC HH LL xx TT (WDC, CCCC=over temperature count)
  // (xx = 00/ff, possibly sign extension of lower byte)

  int t = (signed char)raw[0];
  int lo = 0, hi = 0;

  int tformat;
  int ctw0 = check_temp_word(word[0]);
  if (!word[2]) {
    if (!word[1] && ctw0)
      // 00 00 00 00 xx TT
      tformat = 0;
    else if (ctw0 && check_temp_range(t, raw[2], raw[3], lo, hi))
      // 00 00 HL LH xx TT
      tformat = 1;
    else if (!raw[3] && check_temp_range(t, raw[1], raw[2], lo, hi))
      // 00 00 00 HL LH TT
      tformat = 2;
    else
      tformat = -1;
  }
  else if (ctw0) {
    if (   (ctw0 & check_temp_word(word[1]) & check_temp_word(word[2])) != 0x00
        && check_temp_range(t, raw[2], raw[4], lo, hi)                         )
      // xx HL xx LH xx TT
      tformat = 3;
    else if (   word[2] < 0x7fff
             && check_temp_range(t, raw[2], raw[3], lo, hi)
             && hi >= 40                                   )
      // CC CC HL LH xx TT
      tformat = 4;
    else
      tformat = -2;
  }
  else
    tformat = -3;

  switch (tformat) {
    case 0:
      return strprintf("%d", t);
    case 1: case 2: case 3:
      return strprintf("%d (Min/Max %d/%d)", t, lo, hi);
    case 4:
      return strprintf("%d (Min/Max %d/%d #%d)", t, lo, hi, word[2]);
    default:
      return strprintf("%d (%d %d %d %d %d)", raw[0], raw[5], raw[4], raw[3], raw[2], raw[1]);
  }
}

// Format attribute raw value.
std::string ata_format_attr_raw_value(uint64_t rawvalue,
                                      const ata_raw_format & conv)
{
  // Split into bytes and words
  unsigned char raw[6];
  raw[0] = (unsigned char) rawvalue;
  raw[1] = (unsigned char)(rawvalue >>  8);
  raw[2] = (unsigned char)(rawvalue >> 16);
  raw[3] = (unsigned char)(rawvalue >> 24);
  raw[4] = (unsigned char)(rawvalue >> 32);
  raw[5] = (unsigned char)(rawvalue >> 40);
  unsigned word[3];
  word[0] = raw[0] | (raw[1] << 8);
  word[1] = raw[2] | (raw[3] << 8);
  word[2] = raw[4] | (raw[5] << 8);

  // Print
  std::string s;
  switch (conv.format()) {
  case RAWFMT_RAW8:
    s = strprintf("%d %d %d %d %d %d",
      raw[5], raw[4], raw[3], raw[2], raw[1], raw[0]);
    break;

  case RAWFMT_RAW16:
    s = strprintf("%u %u %u", word[2], word[1], word[0]);
    break;

  case RAWFMT_RAW48:
  case RAWFMT_RAW56:
  case RAWFMT_RAW64:
    s = strprintf("%" PRIu64, rawvalue);
    break;

  case RAWFMT_HEX48:
    s = strprintf("0x%012" PRIx64, rawvalue);
    break;

  case RAWFMT_HEX56:
    s = strprintf("0x%014" PRIx64, rawvalue);
    break;

  case RAWFMT_HEX64:
    s = strprintf("0x%016" PRIx64, rawvalue);
    break;

  case RAWFMT_RAW16_OPT_RAW16:
    s = strprintf("%u", word[0]);
    if (word[1] || word[2])
      s += strprintf(" (%u %u)", word[2], word[1]);
    break;

  case RAWFMT_RAW16_OPT_AVG16:
    s = strprintf("%u", word[0]);
    if (word[1])
      s += strprintf(" (Average %u)", word[1]);
    break;

  case RAWFMT_RAW24_OPT_RAW8:
    s = strprintf("%u", (unsigned)(rawvalue & 0x00ffffffULL));
    if (raw[3] || raw[4] || raw[5])
      s += strprintf(" (%d %d %d)", raw[5], raw[4], raw[3]);
    break;

  case RAWFMT_RAW24_DIV_RAW24:
    s = strprintf("%u/%u",
      (unsigned)(rawvalue >> 24), (unsigned)(rawvalue & 0x00ffffffULL));
    break;

  case RAWFMT_RAW24_DIV_RAW32:
    s = strprintf("%u/%u",
      (unsigned)(rawvalue >> 32), (unsigned)(rawvalue & 0xffffffffULL));
    break;

  case RAWFMT_MIN2HOUR:
    {
      // minutes
      uint64_t temp = word[0] + ((uint64_t)word[1] << 16);
      uint64_t tmp1 = temp / 60;
      uint64_t tmp2 = temp % 60;
      s = strprintf("%" PRIu64 "h+%02" PRIu64 "m", tmp1, tmp2);
      if (word[2])
        s += strprintf(" (%u)", word[2]);
    }
    break;

  case RAWFMT_SEC2HOUR:
    {
      // seconds
      uint64_t hours = rawvalue / 3600;
      uint64_t minutes = (rawvalue - 3600 * hours) / 60;
      uint64_t seconds = rawvalue % 60;
      s = strprintf("%" PRIu64 "h+%02" PRIu64 "m+%02" PRIu64 "s", hours, minutes, seconds);
    }
    break;

  case RAWFMT_HALFMIN2HOUR:
    {
      // 30-second counter
      uint64_t hours = rawvalue / 120;
      uint64_t minutes = (rawvalue - 120 * hours) / 2;
      s = strprintf("%" PRIu64 "h+%02" PRIu64 "m", hours, minutes);
    }
    break;

  case RAWFMT_MSEC24_HOUR32:
    {
      // hours + milliseconds
      unsigned hours = (unsigned)(rawvalue & 0xffffffffULL);
      unsigned milliseconds = (unsigned)(rawvalue >> 32);
      unsigned seconds = milliseconds / 1000;
      s = strprintf("%uh+%02um+%02u.%03us",
        hours, seconds / 60, seconds % 60, milliseconds % 1000);
    }
    break;

  case RAWFMT_TEMPMINMAX:
    s = format_tempminmax(raw, word);
    break;

  case RAWFMT_TEMP10X:
    // ten times temperature in Celsius
    s = strprintf("%d.%d", word[0]/10, word[0]%10);
    break;

  case RAWFMT_UNKNOWN:
    s = "?";
    break;
  }

  return s;
}

std::string ata_format_attr_raw_value(uint64_t rawvalue, const char * conv)
{
  return ata_format_attr_raw_value(rawvalue, ata_raw_format::parse(conv));
}

std::string ata_format_attr_raw_value(const ata_smart_attribute & attr,
                                      const ata_raw_format & conv)
{
  return ata_format_attr_raw_value(ata_get_attr_raw_value(attr, conv), conv);
}

std::string create_raw_format_arg_list()
{
  std::string s;
  for (unsigned i = 0; i < num_format_names; i++)
    s += strprintf("%s\tID,%s[:012345rvwz][,ATTR_NAME]",
      (i>0 ? "\n" : ""), format_names[i].name);
  return s;
}

} // namespace smartattr
