/*
 * atasmart.cpp
 *
 * Home page of code is: https://www.smartmontools.org
 *
 * Copyright (C) 1999-2000 Michael Cornwell <cornwell@acm.org>
 * Copyright (C) 2002-2011 Bruce Allen
 * Copyright (C) 2008-2025 Christian Franke
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <smartattr/atasmart.h>
#include <smartattr/utility.h>

#include <ctype.h>
#include <string.h>

namespace smartattr {

static lib_ata_hook default_ata_hook;
static lib_ata_hook * current_ata_hook = &default_ata_hook;

lib_ata_hook & lib_ata_hook::get()
{
  return *current_ata_hook;
}

void lib_ata_hook::set(lib_ata_hook & hook)
{
  current_ata_hook = &hook;
}

void lib_ata_hook::reset()
{
  current_ata_hook = &default_ata_hook;
}

void lib_ata_hook::on_checksum_error(const char * datatype)
{
  lib_printf(LIBMSG_WARNING, "checksum error in %s", datatype);
}

unsigned char ata_smart_checksum(const void * data)
{
  unsigned char sum = 0;
  for (int i = 0; i < ATA_SECTOR_SIZE; i++)
    sum += ((const unsigned char *)data)[i];
  return sum;
}

// Swap bytes of 16-bit field at address P.
static inline void swap2(void * p)
{
  unsigned char * b = (unsigned char *)p;
  unsigned char tmp = b[0]; b[0] = b[1]; b[1] = tmp;
}

bool ata_read_smart_values(const void * buf, size_t size, ata_smart_values & values,
                           byte_order order /* = host_byte_order() */)
{
  if (size < ATA_SMART_VALUES_MIN_SIZE) {
    lib_printf(LIBMSG_ERROR, "SMART READ DATA buffer too short: %u bytes, %u expected",
               (unsigned)size, (unsigned)ATA_SMART_VALUES_MIN_SIZE);
    return false;
  }

  unsigned n = (size < sizeof(values) ? (unsigned)size : (unsigned)sizeof(values));
  memcpy(&values, buf, n);
  if (n < sizeof(values))
    memset((unsigned char *)&values + n, 0, sizeof(values) - n);
  else if (ata_smart_checksum(&values))
    lib_ata_hook::get().on_checksum_error("SMART Attribute Data Structure");

  if (order != host_byte_order()) {
    lib_printf(LIBMSG_DEBUG, "SMART READ DATA: converting %s fields to %s",
               byte_order_name(order), byte_order_name(host_byte_order()));
    swap2(&values.revnumber);
    for (int i = 0; i < NUMBER_ATA_SMART_ATTRIBUTES; i++)
      swap2(&values.vendor_attributes[i].flags);
    swap2(&values.total_time_to_complete_off_line);
    swap2(&values.smart_capability);
    swap2(&values.extend_test_completion_time_w);
  }

  return true;
}

int ata_count_smart_attributes(const ata_smart_values & values)
{
  int i;
  for (i = 0; i < NUMBER_ATA_SMART_ATTRIBUTES; i++) {
    if (!values.vendor_attributes[i].id)
      break;
  }
  return i;
}

bool ata_read_identity(const void * buf, size_t size, ata_identify_device & id)
{
  if (size < sizeof(id)) {
    lib_printf(LIBMSG_ERROR, "IDENTIFY DEVICE buffer too short: %u bytes, %u expected",
               (unsigned)size, (unsigned)sizeof(id));
    return false;
  }
  memcpy(&id, buf, sizeof(id));
  // IDENTIFY words are little endian
  if (host_byte_order() != BYTEORDER_LE) {
    swap2(&id.major_rev_num);
    swap2(&id.minor_rev_num);
  }
  return true;
}

static int find_msb(unsigned short word)
{
  for (int bit = 15; bit >= 0; bit--)
    if (word & (1 << bit))
      return bit;
  return -1;
}

static const char * get_ata_major_version(unsigned short major_rev_num)
{
  switch (find_msb(major_rev_num)) {
    case 11: return "ACS-4";
    case 10: return "ACS-3";
    case  9: return "ACS-2";
    case  8: return "ATA8-ACS";
    case  7: return "ATA/ATAPI-7";
    case  6: return "ATA/ATAPI-6";
    case  5: return "ATA/ATAPI-5";
    case  4: return "ATA/ATAPI-4";
    case  3: return "ATA-3";
    case  2: return "ATA-2";
    case  1: return "ATA-1";
    default: return nullptr;
  }
}

// Table 10 of X3T13/2008D (ATA-3) Revision 7b, January 27, 1997
// Table 28 of T13/1410D (ATA/ATAPI-6) Revision 3b, February 26, 2002
// Table 31 of T13/1699-D (ATA8-ACS) Revision 6a, September 6, 2008
// Table 46 of T13/BSR INCITS 529 (ACS-4) Revision 08, April 28, 2015
static const char * get_ata_minor_version(unsigned short minor_rev_num)
{
  switch (minor_rev_num) {
    case 0x0001: return "ATA-1 X3T9.2/781D prior to revision 4";
    case 0x0002: return "ATA-1 published, ANSI X3.221-1994";
    case 0x0003: return "ATA-1 X3T9.2/781D revision 4";
    case 0x0004: return "ATA-2 published, ANSI X3.279-1996";
    case 0x0005: return "ATA-2 X3T10/948D prior to revision 2k";
    case 0x0006: return "ATA-3 X3T10/2008D revision 1";
    case 0x0007: return "ATA-2 X3T10/948D revision 2k";
    case 0x0008: return "ATA-3 X3T10/2008D revision 0";
    case 0x0009: return "ATA-2 X3T10/948D revision 3";
    case 0x000a: return "ATA-3 published, ANSI X3.298-1997";
    case 0x000b: return "ATA-3 X3T10/2008D revision 6"; // 1st ATA-3 revision with SMART
    case 0x000c: return "ATA-3 X3T13/2008D revision 7 and 7a";
    case 0x000d: return "ATA/ATAPI-4 X3T13/1153D revision 6";
    case 0x000e: return "ATA/ATAPI-4 T13/1153D revision 13";
    case 0x000f: return "ATA/ATAPI-4 X3T13/1153D revision 7";
    case 0x0010: return "ATA/ATAPI-4 T13/1153D revision 18";
    case 0x0011: return "ATA/ATAPI-4 T13/1153D revision 15";
    case 0x0012: return "ATA/ATAPI-4 published, ANSI NCITS 317-1998";
    case 0x0013: return "ATA/ATAPI-5 T13/1321D revision 3";
    case 0x0014: return "ATA/ATAPI-4 T13/1153D revision 14";
    case 0x0015: return "ATA/ATAPI-5 T13/1321D revision 1";
    case 0x0016: return "ATA/ATAPI-5 published, ANSI NCITS 340-2000";
    case 0x0017: return "ATA/ATAPI-4 T13/1153D revision 17";
    case 0x0018: return "ATA/ATAPI-6 T13/1410D revision 0";
    case 0x0019: return "ATA/ATAPI-6 T13/1410D revision 3a";
    case 0x001a: return "ATA/ATAPI-7 T13/1532D revision 1";
    case 0x001b: return "ATA/ATAPI-6 T13/1410D revision 2";
    case 0x001c: return "ATA/ATAPI-6 T13/1410D revision 1";
    case 0x001d: return "ATA/ATAPI-7 published, ANSI INCITS 397-2005";
    case 0x001e: return "ATA/ATAPI-7 T13/1532D revision 0";
    case 0x001f: return "ACS-3 T13/2161-D revision 3b";

    case 0x0021: return "ATA/ATAPI-7 T13/1532D revision 4a";
    case 0x0022: return "ATA/ATAPI-6 published, ANSI INCITS 361-2002";

    case 0x0027: return "ATA8-ACS T13/1699-D revision 3c";
    case 0x0028: return "ATA8-ACS T13/1699-D revision 6";
    case 0x0029: return "ATA8-ACS T13/1699-D revision 4";

    case 0x0031: return "ACS-2 T13/2015-D revision 2";

    case 0x0033: return "ATA8-ACS T13/1699-D revision 3e";

    case 0x0039: return "ATA8-ACS T13/1699-D revision 4c";

    case 0x0042: return "ATA8-ACS T13/1699-D revision 3f";

    case 0x0052: return "ATA8-ACS T13/1699-D revision 3b";

    case 0x005e: return "ACS-4 T13/BSR INCITS 529 revision 5";

    case 0x006d: return "ACS-3 T13/2161-D revision 5";

    case 0x0082: return "ACS-2 published, ANSI INCITS 482-2012";

    case 0x0107: return "ATA8-ACS T13/1699-D revision 2d";

    case 0x010a: return "ACS-3 published, ANSI INCITS 522-2014";

    case 0x0110: return "ACS-2 T13/2015-D revision 3";

    case 0x011b: return "ACS-3 T13/2161-D revision 4";

    default:     return nullptr;
  }
}

std::string ata_format_version(const ata_identify_device & id)
{
  std::string ataver;
  if (   (id.major_rev_num != 0x0000 && id.major_rev_num != 0xffff)
      || (id.minor_rev_num != 0x0000 && id.minor_rev_num != 0xffff)) {
    const char * majorver = get_ata_major_version(id.major_rev_num);
    const char * minorver = get_ata_minor_version(id.minor_rev_num);

    if (majorver && minorver && str_starts_with(minorver, majorver)) {
      // Major and minor strings match, print minor string only
      ataver = minorver;
    }
    else {
      if (majorver)
        ataver = majorver;
      else
        ataver = strprintf("Unknown(0x%04x)", id.major_rev_num);

      if (minorver)
        ataver += strprintf(", %s", minorver);
      else if (id.minor_rev_num != 0x0000 && id.minor_rev_num != 0xffff)
        ataver += strprintf(" (unknown minor revision code: 0x%04x)", id.minor_rev_num);
      else
        ataver += " (minor revision not indicated)";
    }
  }
  return ataver;
}

std::string ata_get_id_string(const unsigned char * in, int n, bool trim)
{
  // Copies n bytes (or n-1 if n is odd), but swaps adjacents bytes.
  std::string s;
  for (int i = 0; i + 1 < n; i += 2) {
    s += (char)in[i+1];
    s += (char)in[i];
  }

  // String ends at the first null char
  size_t len = strnlen(s.c_str(), s.size());
  s.resize(len);

  if (trim) {
    size_t first = 0;
    while (first < s.size() && isspace((unsigned char)s[first]))
      first++;
    size_t last = s.size();
    while (last > first && isspace((unsigned char)s[last-1]))
      last--;
    s = s.substr(first, last - first);
  }
  return s;
}

void ata_format_id_string(char * out, const unsigned char * in, int n)
{
  n = (n > 64 ? 64 : n);
  std::string s = ata_get_id_string(in, n, true);
  memcpy(out, s.c_str(), s.size() + 1);
}

} // namespace smartattr
