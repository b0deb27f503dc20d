/*
 * atasmart.h - ATA SMART READ DATA and IDENTIFY buffer decoding
 *
 * Home page of code is: https://www.smartmontools.org
 *
 * Copyright (C) 1999-2000 Michael Cornwell <cornwell@acm.org>
 * Copyright (C) 2002-2011 Bruce Allen
 * Copyright (C) 2008-2025 Christian Franke
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SMARTATTR_ATASMART_H
#define SMARTATTR_ATASMART_H

#include <smartattr/ata.h>
#include <smartattr/byteorder.h>

#include <stddef.h>
#include <string>

namespace smartattr {

/// Class to register an application specific checksum error handler.
class lib_ata_hook
{
public:
  lib_ata_hook() = default;
  virtual ~lib_ata_hook() = default;
  lib_ata_hook(const lib_ata_hook &) = delete;
  void operator=(const lib_ata_hook &) = delete;

  /// Get the current hook.
  static lib_ata_hook & get();

  /// Set the hook.
  static void set(lib_ata_hook & hook);

  /// Reset to default hook.
  static void reset();

  /// Handle an incorrect checksum in an ATA structure: Do nothing, print a
  /// message, or print a message and throw.  The parameter describes the ATA
  /// data structure.
  /// The default implementation prints a warning via lib_printf().
  virtual void on_checksum_error(const char * datatype);
};

// This function computes the checksum of a single disk sector (512
// bytes).  Returns zero if checksum is OK, nonzero if the checksum is
// incorrect.
unsigned char ata_smart_checksum(const void * data);

// Decode a SMART READ DATA buffer with multi-byte fields in byte order ORDER.
// At least ATA_SMART_VALUES_MIN_SIZE bytes are required, missing trailing
// bytes are set to zero.  The checksum is verified if a full sector is
// provided.  Returns false if the buffer is too short.
bool ata_read_smart_values(const void * buf, size_t size, ata_smart_values & values,
                           byte_order order = host_byte_order());

// Number of populated attributes, the table ends at the first zero id.
int ata_count_smart_attributes(const ata_smart_values & values);

// Decode a 512 byte IDENTIFY DEVICE buffer, return false if too short.
// The version words are converted to host byte order.
bool ata_read_identity(const void * buf, size_t size, ata_identify_device & id);

// Format ATA major and minor version from IDENTIFY words 80 and 81.
// Returns an empty string if no version is indicated.
std::string ata_format_version(const ata_identify_device & id);

// Get string from ata_identify_device, swap adjacent bytes.
// Leading and trailing blanks are removed if TRIM is set.
std::string ata_get_id_string(const unsigned char * in, int n, bool trim);

// Convenience function for formatting strings from ata_identify_device.
void ata_format_id_string(char * out, const unsigned char * in, int n);

} // namespace smartattr

#endif // SMARTATTR_ATASMART_H
