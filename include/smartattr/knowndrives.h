/*
 * knowndrives.h
 *
 * Home page of code is: https://www.smartmontools.org
 *
 * Copyright (C) 2003-11 Philip Williams, Bruce Allen
 * Copyright (C) 2008-25 Christian Franke
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SMARTATTR_KNOWNDRIVES_H
#define SMARTATTR_KNOWNDRIVES_H

#include <smartattr/attrconv.h>
#include <smartattr/utility.h> // regular_expression

#include <map>
#include <string>
#include <vector>

namespace smartattr {

class report_sink;

// Structure to store drive database entries, see drivedb.h for a description.
struct drive_settings {
  const char * modelfamily;
  const char * modelregexp;
  const char * firmwareregexp;
  const char * warningmsg;
  const char * presets;
};

/// Conversion rule and display name of one attribute.
struct ata_attr_conv
{
  ata_raw_format conv; // Zero-value if not preset
  std::string name;    // Empty if not preset
};

/// Attribute presets of a drive model, key is the decimal attribute id.
typedef std::map<std::string, ata_attr_conv> ata_attr_preset_map;

/// Decoded drive database entry.
struct drive_model
{
  std::string family;
  regular_expression model_regex;    // Matched against the untrimmed model string
  regular_expression firmware_regex; // Not used for lookup, may be empty
  std::string warning;
  ata_attr_preset_map presets;
  std::string usb_type;              // '-d' option of USB entries

  /// Return true if MODEL matches the model regex (substring search).
  bool match_model(const char * model) const;

  /// Get preset for attribute ID, zero-value rule if none.
  const ata_attr_conv & get_preset(unsigned char id) const;
};

/// Drive database.  Filled once by the functions below, then used read-only.
class drive_database
{
public:
  drive_database()
    : m_custom_size(0) { }

  /// Get total number of entries.
  unsigned size() const
    { return m_entries.size(); }

  /// Get number of entries read from files.
  unsigned custom_size() const
    { return m_custom_size; }

  /// Array access.
  const drive_model & operator[](unsigned i) const
    { return m_entries[i]; }

  /// Append new entry.  CUSTOM is set for entries read from a file.
  void push_back(const drive_model & entry, bool custom);

private:
  std::vector<drive_model> m_entries;
  unsigned m_custom_size;
};

// Return true if modelfamily string describes entry for USB ID
inline bool is_usb_modelfamily(const std::string & modelfamily)
  { return str_starts_with(modelfamily, "USB:"); }

// Return true if modelfamily string denotes a placeholder entry
inline bool is_placeholder_modelfamily(const std::string & modelfamily)
  { return str_starts_with(modelfamily, "$"); }

// Family name of entry with baseline presets
#define DRIVEDB_DEFAULT_FAMILY "DEFAULT"

// Parse vendor attribute def "ID,FORMAT[:BYTEORDER][,NAME]" into PRESETS.
// Unknown format names are kept as RAWFMT_UNKNOWN rules.
// KEY is set to the map key of the new entry.
// Return false on syntax error.
bool parse_attribute_def(const char * opt, ata_attr_preset_map & presets,
                         std::string * key = nullptr);

// Return a multiline string containing a list of valid arguments for
// parse_attribute_def().
std::string create_vendor_attribute_arg_list();

// Convert database entry to drive_model, print messages prefixed with
// LOCATION on errors.  Return false on error.
bool convert_drive_settings(const drive_settings & src, drive_model & dest,
                            const char * location);

// Look up drive MODEL in database.  Returns the first matching entry
// merged with the DEFAULT presets, or the DEFAULT entry if none matches.
// MATCHED is set if an entry other than DEFAULT was found.
drive_model lookup_drive(const drive_database & db, const std::string & model,
                         bool * matched = nullptr);

// Read drive database from file and append entries.
bool read_drive_database(const char * path, drive_database & db);

// Append builtin table from drivedb.h.
void add_builtin_drive_database(drive_database & db);

// Init drive database.  PATH == nullptr: installed database file if
// present, builtin table otherwise.  "+FILE": FILE then builtin table,
// "FILE": FILE only.
bool init_drive_database(drive_database & db, const char * path);

// Get path of installed database file
const char * get_drivedb_path_default();

// Shows one database entry, returns #errors.
int show_one_preset(report_sink & out, const drive_model & entry);

// Shows all presets for drives in database.
// Returns #syntax errors.
int show_all_presets(report_sink & out, const drive_database & db);

// Shows all matching presets for a drive in database.
// Returns # matching entries.
int show_matching_presets(report_sink & out, const drive_database & db,
                          const std::string & model);

} // namespace smartattr

#endif // SMARTATTR_KNOWNDRIVES_H
