/*
 * ataprint.h
 *
 * Home page of code is: https://www.smartmontools.org
 *
 * Copyright (C) 2002-09 Bruce Allen
 * Copyright (C) 2008-25 Christian Franke
 * Copyright (C) 1999-2000 Michael Cornwell <cornwell@acm.org>
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SMARTATTR_ATAPRINT_H
#define SMARTATTR_ATAPRINT_H

#include <smartattr/ata.h>
#include <smartattr/knowndrives.h>

#include <stdarg.h>
#include <stdio.h>
#include <string>

namespace smartattr {

/// Destination of report output.
class report_sink
{
public:
  report_sink() = default;
  virtual ~report_sink() = default;
  report_sink(const report_sink &) = delete;
  void operator=(const report_sink &) = delete;

  /// Write LEN chars of STR.
  virtual void write(const char * str, size_t len) = 0;

  /// Write null terminated string.
  void puts(const char * str);

  /// Write printf() formatted string.
  void print(const char * fmt, ...)
    SMARTATTR_FORMAT_PRINTF(2, 3);
};

/// Report sink writing to a stdio stream.
class stdio_report_sink : public report_sink
{
public:
  explicit stdio_report_sink(FILE * f)
    : m_file(f) { }

  virtual void write(const char * str, size_t len);

private:
  FILE * m_file;
};

/// Report sink collecting output in memory.
class string_report_sink : public report_sink
{
public:
  virtual void write(const char * str, size_t len)
    { m_str.append(str, len); }

  const std::string & str() const
    { return m_str; }

  void clear()
    { m_str.clear(); }

private:
  std::string m_str;
};

// Attribute table output formats
enum {
  ATA_PRINT_BRIEF   = 0x01, // Flags as letters
  ATA_PRINT_HEX_ID  = 0x02, // Attribute id in hex
  ATA_PRINT_HEX_VAL = 0x04, // Normalized values in hex
};

// Print drive identity and database info.
// ID may be nullptr if IDENTIFY data is not available.
void ata_print_drive_info(report_sink & out, const ata_identify_device * id,
                          const std::string & model, const drive_model & dbentry,
                          bool matched);

// Print one line per populated attribute, return number of lines.
int ata_print_smart_attributes(report_sink & out, const ata_smart_values & values,
                               const drive_model & dbentry, unsigned char format = 0);

} // namespace smartattr

#endif // SMARTATTR_ATAPRINT_H
