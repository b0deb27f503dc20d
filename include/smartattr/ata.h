/*
 * ata.h - ATA SMART data structures
 *
 * Home page of code is: https://www.smartmontools.org
 *
 * Copyright (C) 1999-2000 Michael Cornwell <cornwell@acm.org>
 * Copyright (C) 2002-2011 Bruce Allen
 * Copyright (C) 2008-2025 Christian Franke
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SMARTATTR_ATA_H
#define SMARTATTR_ATA_H

#include <smartattr/smartattr_defs.h>

#include <stdint.h>

namespace smartattr {

// Maximum allowed number of SMART Attributes
#define NUMBER_ATA_SMART_ATTRIBUTES     30

// Size of all ATA data structures read by SMART and IDENTIFY commands
#define ATA_SECTOR_SIZE                 512

// Minimum size of SMART READ DATA buffer: revision + attribute table
#define ATA_SMART_VALUES_MIN_SIZE       (2 + NUMBER_ATA_SMART_ATTRIBUTES * 12)

// Needed parts of the ATA DRIVE IDENTIFY Structure. Those labeled
// word* are NOT used.
#pragma pack(1)
struct ata_identify_device {
  unsigned short words000_009[10];
  unsigned char  serial_no[20];
  unsigned short words020_022[3];
  unsigned char  fw_rev[8];
  unsigned char  model[40];
  unsigned short words047_079[33];
  unsigned short major_rev_num;
  unsigned short minor_rev_num;
  unsigned short words082_255[174];
} SMARTATTR_ATTR_PACKED;
#pragma pack()
SMARTATTR_ASSERT_SIZEOF(ata_identify_device, 512);

/* ata_smart_attribute is the vendor specific attribute of SFF-8035i */
#pragma pack(1)
struct ata_smart_attribute {
  unsigned char id;
  // meaning of flag bits: see MACROS just below
  // WARNING: MISALIGNED!
  unsigned short flags;
  unsigned char current;
  unsigned char worst;
  unsigned char raw[6];
  unsigned char reserv;
} SMARTATTR_ATTR_PACKED;
#pragma pack()
SMARTATTR_ASSERT_SIZEOF(ata_smart_attribute, 12);

// MACROS to interpret the flags bits in the previous structure.

// 0: Prefailure bit
// If set, a value at or below the threshold predicts imminent failure,
// otherwise it indicates end of design life (old age).
#define ATTRIBUTE_FLAGS_PREFAILURE(x) ((x) & 0x01)

// 1: Online bit
// If set, the value is updated during normal operation,
// otherwise only during off-line data collection.
#define ATTRIBUTE_FLAGS_ONLINE(x) ((x) & 0x02)

// The following are (probably) IBM's, Maxtors and  Quantum's definitions for the
// vendor-specific bits:
// 2: Performance type bit
#define ATTRIBUTE_FLAGS_PERFORMANCE(x) ((x) & 0x04)

// 3: Errorrate type bit
#define ATTRIBUTE_FLAGS_ERRORRATE(x) ((x) & 0x08)

// 4: Eventcount bit
#define ATTRIBUTE_FLAGS_EVENTCOUNT(x) ((x) & 0x10)

// 5: Selfpereserving bit
#define ATTRIBUTE_FLAGS_SELFPRESERVING(x) ((x) & 0x20)

// 6-15: Reserved for future use
#define ATTRIBUTE_FLAGS_OTHER(x) ((x) & 0xffc0)

// Format of data returned by SMART READ DATA
// Table 62 of T13/1699-D (ATA8-ACS) Revision 6a, September 2008
#pragma pack(1)
struct ata_smart_values {
  unsigned short int revnumber;
  struct ata_smart_attribute vendor_attributes [NUMBER_ATA_SMART_ATTRIBUTES];
  unsigned char offline_data_collection_status;
  unsigned char self_test_exec_status;  //IBM # segments for offline collection
  unsigned short int total_time_to_complete_off_line; // IBM different
  unsigned char vendor_specific_366; // Maxtor & IBM current segment pointer
  unsigned char offline_data_collection_capability;
  unsigned short int smart_capability;
  unsigned char errorlog_capability;
  unsigned char vendor_specific_371;  // Maxtor, IBM: self-test failure checkpoint
  unsigned char short_test_completion_time;
  unsigned char extend_test_completion_time_b; // If 0xff, use 16-bit value below
  unsigned char conveyance_test_completion_time;
  unsigned short extend_test_completion_time_w; // e04130r2, added to T13/1699-D Revision 1c, April 2005
  unsigned char reserved_377_385[9];
  unsigned char vendor_specific_386_510[125]; // Maxtor bytes 508-509 Attribute/Threshold Revision #
  unsigned char chksum;
} SMARTATTR_ATTR_PACKED;
#pragma pack()
SMARTATTR_ASSERT_SIZEOF(ata_smart_values, 512);

} // namespace smartattr

#endif // SMARTATTR_ATA_H
