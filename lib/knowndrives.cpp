/*
 * knowndrives.cpp
 *
 * Home page of code is: https://www.smartmontools.org
 *
 * Copyright (C) 2003-11 Philip Williams, Bruce Allen
 * Copyright (C) 2008-25 Christian Franke
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <smartattr/knowndrives.h>
#include <smartattr/ataprint.h> // report_sink

#include <stdio.h>
#include <string.h>
#include <unistd.h> // access()

#include <stdexcept>

namespace smartattr {

#define TABLEPRINTWIDTH 19

// Builtin table of known drives.
// Used as a default if not read from SMARTATTR_DRIVEDBDIR "/drivedb.h"
// or any other file specified by '-B' option.
// The drive_settings structure is described in drivedb.h.
const drive_settings builtin_knowndrives[] = {
#include "drivedb.h"
};

/////////////////////////////////////////////////////////////////////////////

bool drive_model::match_model(const char * model) const
{
  return model_regex.execute(model);
}

const ata_attr_conv & drive_model::get_preset(unsigned char id) const
{
  static const ata_attr_conv no_preset;
  ata_attr_preset_map::const_iterator it = presets.find(strprintf("%d", id));
  return (it != presets.end() ? it->second : no_preset);
}

void drive_database::push_back(const drive_model & entry, bool custom)
{
  if (custom && m_custom_size < m_entries.size())
    throw std::logic_error("drive_database: custom entry after builtin entries");
  m_entries.push_back(entry);
  if (custom)
    m_custom_size++;
}

/////////////////////////////////////////////////////////////////////////////

// Table to map old to new '-v' option arguments
const char * const map_old_vendor_opts[][2] = {
  {  "9,halfminutes"              , "9,halfmin2hour,Power_On_Half_Minutes"},
  {  "9,minutes"                  , "9,min2hour,Power_On_Minutes"},
  {  "9,seconds"                  , "9,sec2hour,Power_On_Seconds"},
  {  "9,temp"                     , "9,tempminmax,Temperature_Celsius"},
  {"192,emergencyretractcyclect"  , "192,raw48,Emerg_Retract_Cycle_Ct"},
  {"193,loadunload"               , "193,raw24/raw24"},
  {"194,10xCelsius"               , "194,temp10x,Temperature_Celsius_x10"},
  {"194,unknown"                  , "194,raw48,Unknown_Attribute"},
  {"197,increasing"               , "197,raw48,Total_Pending_Sectors"},
  {"198,offlinescanuncsectorct"   , "198,raw48,Offline_Scan_UNC_SectCt"},
  {"198,increasing"               , "198,raw48,Total_Offl_Uncorrectabl"},
  {"200,writeerrorcount"          , "200,raw48,Write_Error_Count"},
  {"201,detectedtacount"          , "201,raw48,Detected_TA_Count"},
  {"220,temp"                     , "220,tempminmax,Temperature_Celsius"},
};

const unsigned num_old_vendor_opts = sizeof(map_old_vendor_opts)/sizeof(map_old_vendor_opts[0]);

bool parse_attribute_def(const char * opt, ata_attr_preset_map & presets,
                         std::string * key /* = nullptr */)
{
  // Map old -> new options
  for (unsigned i = 0; i < num_old_vendor_opts; i++) {
    if (!strcmp(opt, map_old_vendor_opts[i][0])) {
      opt = map_old_vendor_opts[i][1];
      break;
    }
  }

  // Parse "id,format[:byteorder][,name]"
  int len = strlen(opt);
  int id = 0, n1 = -1, n2 = -1;
  char fmtname[32+1], attrname[32+1];
  if (!(   sscanf(opt, "%d,%32[^,]%n,%32[^,]%n", &id, fmtname, &n1, attrname, &n2) >= 2
        && 1 <= id && id <= 255 && (n1 == len || n2 == len)))
    return false;
  if (n1 == len)
    attrname[0] = 0;

  std::string k = strprintf("%d", id);
  ata_attr_conv & conv = presets[k];
  conv.conv = ata_raw_format::parse(fmtname);
  conv.name = attrname;
  if (key)
    *key = k;
  return true;
}

std::string create_vendor_attribute_arg_list()
{
  std::string s = create_raw_format_arg_list();
  for (unsigned i = 0; i < num_old_vendor_opts; i++)
    s += strprintf("\n\t%s", map_old_vendor_opts[i][0]);
  return s;
}

// Firmware bug workarounds accepted in '-F' presets.
// They do not affect attribute decoding.
static bool is_valid_firmwarebug(const char * opt)
{
  static const char * const bugs[] = {
    "none", "nologdir", "samsung", "samsung2", "samsung3", "xerrorlba"
  };
  for (unsigned i = 0; i < sizeof(bugs)/sizeof(bugs[0]); i++) {
    if (!strcmp(opt, bugs[i]))
      return true;
  }
  return false;
}

// Parse drive or USB options in preset string, return false on error.
static bool parse_db_presets(const char * presets, ata_attr_preset_map * defs,
                             std::string * type, const char * location)
{
  for (int i = 0; ; ) {
    i += strspn(presets+i, " \t");
    if (!presets[i])
      break;
    char opt, arg[80+1+13]; int len = -1;
    if (!(sscanf(presets+i, "-%c %80[^ ]%n", &opt, arg, &len) >= 2 && len > 0))
      return false;
    if (opt == 'v' && defs) {
      // Parse "-v N,format[,name]"
      std::string key;
      if (!parse_attribute_def(arg, *defs, &key))
        return false;
      if (!(*defs)[key].conv.is_known())
        lib_printf(LIBMSG_WARNING, "%s: Unknown raw format in \"-v %s\"", location, arg);
    }
    else if (opt == 'F' && defs) {
      if (!is_valid_firmwarebug(arg))
        return false;
    }
    else if (opt == 'd' && type) {
      *type = arg;
    }
    else
      return false;

    i += len;
  }
  return true;
}

bool convert_drive_settings(const drive_settings & src, drive_model & dest,
                            const char * location)
{
  bool ok = true;
  dest = drive_model();
  dest.family = src.modelfamily;
  dest.warning = src.warningmsg;

  if (!*src.modelregexp) {
    lib_printf(LIBMSG_ERROR, "%s: Missing regular expression for drive model", location);
    ok = false;
  }
  else if (!dest.model_regex.compile(src.modelregexp)) {
    lib_printf(LIBMSG_ERROR, "%s: Error in regular expression \"%s\": %s", location,
               src.modelregexp, dest.model_regex.get_errmsg());
    ok = false;
  }

  if (*src.firmwareregexp && !dest.firmware_regex.compile(src.firmwareregexp)) {
    lib_printf(LIBMSG_ERROR, "%s: Error in regular expression \"%s\": %s", location,
               src.firmwareregexp, dest.firmware_regex.get_errmsg());
    ok = false;
  }

  if (*src.presets) {
    if (!is_usb_modelfamily(dest.family)) {
      if (!parse_db_presets(src.presets, &dest.presets, nullptr, location)) {
        lib_printf(LIBMSG_ERROR, "%s: Syntax error in preset option string", location);
        ok = false;
      }
    }
    else {
      if (!parse_db_presets(src.presets, nullptr, &dest.usb_type, location)) {
        lib_printf(LIBMSG_ERROR, "%s: Syntax error in USB type string", location);
        ok = false;
      }
    }
  }

  return ok;
}

/////////////////////////////////////////////////////////////////////////////

// Copy DEFAULT presets which are missing in DEST.
// Presets without name get the DEFAULT name.
static void merge_default_presets(ata_attr_preset_map & dest,
                                  const ata_attr_preset_map & dflt)
{
  for (ata_attr_preset_map::const_iterator it = dflt.begin(); it != dflt.end(); ++it) {
    ata_attr_preset_map::iterator di = dest.find(it->first);
    if (di == dest.end())
      dest.insert(*it);
    else if (di->second.name.empty())
      di->second.name = it->second.name;
  }
}

drive_model lookup_drive(const drive_database & db, const std::string & model,
                         bool * matched /* = nullptr */)
{
  if (matched)
    *matched = false;

  const drive_model * dflt = nullptr;
  for (unsigned i = 0; i < db.size(); i++) {
    const drive_model & entry = db[i];
    // Skip placeholder and USB entries
    if (is_placeholder_modelfamily(entry.family) || is_usb_modelfamily(entry.family))
      continue;

    if (entry.family == DRIVEDB_DEFAULT_FAMILY) {
      dflt = &entry;
      continue;
    }

    if (!entry.match_model(model.c_str()))
      continue;

    // Found
    lib_printf(LIBMSG_DEBUG, "Model \"%s\" matches drive database entry #%u \"%s\"",
               model.c_str(), i, entry.family.c_str());
    drive_model result = entry;
    if (dflt)
      merge_default_presets(result.presets, dflt->presets);
    if (matched)
      *matched = true;
    return result;
  }

  lib_printf(LIBMSG_INFO, "Model \"%s\" not found in drive database%s",
             model.c_str(), (dflt ? ", using DEFAULT presets" : ""));
  if (dflt)
    return *dflt;
  return drive_model();
}

/////////////////////////////////////////////////////////////////////////////

// Parse "USB: [DEVICE] ; [BRIDGE]" string
static void parse_usb_names(const char * names, std::string & device, std::string & bridge)
{
  int n1 = -1, n2 = -1, n3 = -1;
  sscanf(names, "USB: %n%*[^;]%n; %n", &n1, &n2, &n3);
  if (0 < n1 && n1 < n2)
    device.assign(names+n1, n2-n1);
  else
    sscanf(names, "USB: ; %n", &n3);
  if (0 < n3)
    bridge = names+n3;
}

int show_one_preset(report_sink & out, const drive_model & entry)
{
  bool usb = is_usb_modelfamily(entry.family);
  int errcnt = 0;

  // print and check model and firmware regular expressions
  out.print("%-*s %s\n", TABLEPRINTWIDTH, (!usb ? "MODEL REGEXP:" : "USB Vendor:Product:"),
            entry.model_regex.get_pattern());
  if (entry.model_regex.empty()) {
    out.print("%-*s %s\n", TABLEPRINTWIDTH, "", "Error: invalid or missing regular expression");
    errcnt++;
  }

  const char * fwpattern = entry.firmware_regex.get_pattern();
  out.print("%-*s %s\n", TABLEPRINTWIDTH, (!usb ? "FIRMWARE REGEXP:" : "USB bcdDevice:"),
            (*fwpattern ? fwpattern : ".*"));

  if (!usb) {
    out.print("%-*s %s\n", TABLEPRINTWIDTH, "MODEL FAMILY:", entry.family.c_str());

    // show presets ordered by attribute id
    bool first_preset = true;
    for (int id = 1; id <= 255; id++) {
      ata_attr_preset_map::const_iterator it = entry.presets.find(strprintf("%d", id));
      if (it == entry.presets.end())
        continue;
      const ata_attr_conv & conv = it->second;
      const std::string & name = conv.name;
      std::string fmt = conv.conv.str();
      // Use leading zeros instead of spaces so that everything lines up.
      out.print("%-*s %03d %-23s %s\n", TABLEPRINTWIDTH, (first_preset ? "ATTRIBUTE OPTIONS:" : ""),
                id, (!name.empty() ? name.c_str() : "-"), fmt.c_str());
      // Check max name length suitable for attribute table output
      const unsigned maxlen = 23;
      if (name.size() > maxlen) {
        out.print("%*s\n", TABLEPRINTWIDTH+6+maxlen, "Error: Attribute name too long ------^");
        errcnt++;
      }
      if (!conv.conv.is_known()) {
        out.print("%-*s %s\n", TABLEPRINTWIDTH, "", "Error: Unknown raw format ------^");
        errcnt++;
      }
      first_preset = false;
    }
    if (first_preset)
      out.print("%-*s %s\n", TABLEPRINTWIDTH, "ATTRIBUTE OPTIONS:", "None preset; no -v options are required.");
  }
  else {
    // Print USB info
    std::string device, bridge;
    parse_usb_names(entry.family.c_str(), device, bridge);
    out.print("%-*s %s\n", TABLEPRINTWIDTH, "USB Device:",
              (!device.empty() ? device.c_str() : "[unknown]"));
    out.print("%-*s %s\n", TABLEPRINTWIDTH, "USB Bridge:",
              (!bridge.empty() ? bridge.c_str() : "[unknown]"));
    out.print("%-*s %s\n", TABLEPRINTWIDTH, "USB Type",
              (!entry.usb_type.empty() ? entry.usb_type.c_str() : "[unsupported]"));
  }

  // Print any special warnings
  if (!entry.warning.empty())
    out.print("%-*s %s\n", TABLEPRINTWIDTH, "WARNINGS:", entry.warning.c_str());
  return errcnt;
}

int show_all_presets(report_sink & out, const drive_database & db)
{
  // loop over all entries in the database, printing them
  // out in a nice format
  int errcnt = 0;
  for (unsigned i = 0; i < db.size(); i++) {
    errcnt += show_one_preset(out, db[i]);
    out.puts("\n");
  }

  out.print("Total number of entries  :%5u\n"
            "Entries read from file(s):%5u\n\n",
            db.size(), db.custom_size());

  if (errcnt > 0)
    out.print("Found %d syntax error(s) in database.\n", errcnt);
  return errcnt;
}

int show_matching_presets(report_sink & out, const drive_database & db,
                          const std::string & model)
{
  int cnt = 0;
  for (unsigned i = 0; i < db.size(); i++) {
    const drive_model & entry = db[i];
    // Skip placeholder, USB and DEFAULT entries, as lookup_drive() does
    if (   is_placeholder_modelfamily(entry.family) || is_usb_modelfamily(entry.family)
        || entry.family == DRIVEDB_DEFAULT_FAMILY)
      continue;
    if (!entry.match_model(model.c_str()))
      continue;
    // Found
    if (++cnt == 1)
      out.print("Drive found in drive database.  Drive identity string:\n"
                "%-*s %s\n"
                "match drive database entry:\n",
                TABLEPRINTWIDTH, "MODEL:", model.c_str());
    else if (cnt == 2)
      out.puts("and match these additional entries:\n");
    show_one_preset(out, entry);
    out.puts("\n");
  }
  if (cnt == 0)
    out.print("No presets are defined for this drive.  Its identity string:\n"
              "MODEL:    %s\n"
              "does not match any of the known regular expressions.\n"
              "Use -P showall to list all known regular expressions.\n",
              model.c_str());
  return cnt;
}

/////////////////////////////////////////////////////////////////////////////
// Parser for drive database files

// Abstract pointer to read file input.
// Operations supported: c = *p; c = p[1]; ++p;
class stdin_iterator
{
public:
  explicit stdin_iterator(FILE * f)
    : m_f(f), m_c(0), m_next(0) { get(); get(); }

  stdin_iterator & operator++()
    { get(); return *this; }

  char operator*() const
    { return m_c; }

  char operator[](int i) const
    {
      if (i != 1)
        fail();
      return m_next;
    }

private:
  FILE * m_f;
  char m_c, m_next;
  void get();
  void fail() const;
};

void stdin_iterator::get()
{
  m_c = m_next;
  int ch = getc(m_f);
  m_next = (ch != EOF ? ch : 0);
}

void stdin_iterator::fail() const
{
  throw std::logic_error("stdin_iterator: wrong usage");
}

// Use above as parser input 'pointer'.
typedef stdin_iterator parse_ptr;

// Skip whitespace and comments.
static parse_ptr skip_white(parse_ptr src, const char * path, int & line)
{
  for ( ; ; ++src) switch (*src) {
    case ' ': case '\t': case '\r':
      continue;

    case '\n':
      ++line;
      continue;

    case '/':
      switch (src[1]) {
        case '/':
          // skip '// comment'
          ++src; ++src;
          while (*src && *src != '\n')
            ++src;
          if (*src)
            ++line;
          break;
        case '*':
          // skip '/* comment */'
          ++src; ++src;
          for (;;) {
            if (!*src) {
              lib_printf(LIBMSG_ERROR, "%s(%d): Missing '*/'", path, line);
              return src;
            }
            char c = *src; ++src;
            if (c == '\n')
              ++line;
            else if (c == '*' && *src == '/')
              break;
          }
          break;
        default:
          return src;
      }
      continue;

    default:
      return src;
  }
}

// Info about a token.
struct token_info
{
  char type;
  int line;
  std::string value;

  token_info() : type(0), line(0) { }
};

// Get next token.
static parse_ptr get_token(parse_ptr src, token_info & token, const char * path, int & line)
{
  src = skip_white(src, path, line);
  switch (*src) {
    case '{': case '}': case ',':
      // Simple token
      token.type = *src; token.line = line;
      ++src;
      break;

    case '"':
      // String constant
      token.type = '"'; token.line = line;
      token.value = "";
      do {
        for (++src; *src != '"'; ++src) {
          char c = *src;
          if (!c || c == '\n' || (c == '\\' && !src[1])) {
            lib_printf(LIBMSG_ERROR, "%s(%d): Missing terminating '\"'", path, line);
            token.type = '?'; token.line = line;
            return src;
          }
          if (c == '\\') {
            c = *++src;
            switch (c) {
              case 'n' : c = '\n'; break;
              case '\n': ++line; break;
              case '\\': case '"': break;
              default:
                lib_printf(LIBMSG_ERROR, "%s(%d): Unknown escape sequence '\\%c'", path, line, c);
                token.type = '?'; token.line = line;
                continue;
            }
          }
          token.value += c;
        }
        // Lookahead to detect string constant concatentation
        src = skip_white(++src, path, line);
      } while (*src == '"');
      break;

    case 0:
      // EOF
      token.type = 0; token.line = line;
      break;

    default:
      lib_printf(LIBMSG_ERROR, "%s(%d): Syntax error, invalid char '%c'", path, line, *src);
      token.type = '?'; token.line = line;
      while (*src && *src != '\n')
        ++src;
      break;
  }

  return src;
}

// Parse drive database from abstract input pointer.
static bool parse_drive_database(parse_ptr src, drive_database & db, const char * path)
{
  int state = 0, field = 0;
  std::string values[5];
  bool ok = true;

  token_info token; int line = 1, entry_line = 1;
  src = get_token(src, token, path, line);
  for (;;) {
    // EOF is ok after '}', trailing ',' is also allowed.
    if (!token.type && (state == 0 || state == 4))
      break;

    // Check expected token
    const char expect[] = "{\",},";
    if (token.type != expect[state]) {
      if (token.type != '?')
        lib_printf(LIBMSG_ERROR, "%s(%d): Syntax error, '%c' expected", path, token.line, expect[state]);
      ok = false;
      // Skip to next entry
      while (token.type && token.type != '{')
        src = get_token(src, token, path, line);
      state = 0;
      if (token.type)
        continue;
      break;
    }

    // Interpret parser state
    switch (state) {
      case 0: // ... ^{...}
        state = 1; field = 0; entry_line = token.line;
        break;
      case 1: // {... ^"..." ...}
        values[field] = token.value;
        state = (++field < 5 ? 2 : 3);
        break;
      case 2: // {... "..."^, ...}
        state = 1;
        break;
      case 3: // {...^}, ...
        {
          drive_settings entry;
          entry.modelfamily    = values[0].c_str();
          entry.modelregexp    = values[1].c_str();
          entry.firmwareregexp = values[2].c_str();
          entry.warningmsg     = values[3].c_str();
          entry.presets        = values[4].c_str();
          drive_model model;
          std::string location = strprintf("%s(%d)", path, entry_line);
          if (convert_drive_settings(entry, model, location.c_str()))
            db.push_back(model, true);
          else
            ok = false;
        }
        state = 4;
        break;
      case 4: // {...}^, ...
        state = 0;
        break;
      default:
        throw std::logic_error(strprintf("parse_drive_database: bad state %d", state));
    }
    src = get_token(src, token, path, line);
  }
  return ok;
}

bool read_drive_database(const char * path, drive_database & db)
{
  stdio_file f(path, "r");
  if (!f) {
    lib_printf(LIBMSG_ERROR, "%s: cannot open drive database file", path);
    return false;
  }

  unsigned oldsize = db.size();
  bool ok = parse_drive_database(parse_ptr(f), db, path);
  lib_printf(LIBMSG_INFO, "%s: %u entries read%s", path, db.size() - oldsize,
             (ok ? "" : " (with errors)"));
  return ok;
}

void add_builtin_drive_database(drive_database & db)
{
  const unsigned n = sizeof(builtin_knowndrives)/sizeof(builtin_knowndrives[0]);
  for (unsigned i = 0; i < n; i++) {
    drive_model model;
    std::string location = strprintf("drivedb.h(builtin #%u)", i);
    if (!convert_drive_settings(builtin_knowndrives[i], model, location.c_str()))
      throw std::logic_error("Internal error in builtin drive database: " + location);
    db.push_back(model, false);
  }
}

// Get path for default database file
const char * get_drivedb_path_default()
{
  return SMARTATTR_DRIVEDBDIR "/drivedb.h";
}

bool init_drive_database(drive_database & db, const char * path)
{
  if (!path) {
    // Read file from package: /usr/{,local/}share/smartattr/drivedb.h
    const char * dbpath = get_drivedb_path_default();
    if (!access(dbpath, 0))
      return read_drive_database(dbpath, db);
    add_builtin_drive_database(db);
    return true;
  }

  bool add = (*path == '+');
  if (add)
    path++;
  if (!read_drive_database(path, db))
    return false;
  if (add)
    add_builtin_drive_database(db);
  return true;
}

} // namespace smartattr
