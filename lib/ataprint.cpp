/*
 * ataprint.cpp
 *
 * Home page of code is: https://www.smartmontools.org
 *
 * Copyright (C) 2002-11 Bruce Allen
 * Copyright (C) 2008-25 Christian Franke
 * Copyright (C) 1999-2000 Michael Cornwell <cornwell@acm.org>
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <smartattr/ataprint.h>
#include <smartattr/atasmart.h>
#include <smartattr/attrconv.h>
#include <smartattr/utility.h>

#include <string.h>

namespace smartattr {

void report_sink::puts(const char * str)
{
  write(str, strlen(str));
}

void report_sink::print(const char * fmt, ...)
{
  va_list ap; va_start(ap, fmt);
  std::string s = vstrprintf(fmt, ap);
  va_end(ap);
  write(s.data(), s.size());
}

void stdio_report_sink::write(const char * str, size_t len)
{
  fwrite(str, 1, len, m_file);
}

/////////////////////////////////////////////////////////////////////////////

static const char * infofound(const char * output)
{
  return (*output ? output : "[No Information Found]");
}

void ata_print_drive_info(report_sink & out, const ata_identify_device * id,
                          const std::string & model, const drive_model & dbentry,
                          bool matched)
{
  // Print model family if known
  if (matched && !dbentry.family.empty())
    out.print("Model Family:     %s\n", dbentry.family.c_str());

  if (id) {
    // format drive information (with byte swapping as needed)
    char idmodel[40+1], serial[20+1], firmware[8+1];
    ata_format_id_string(idmodel, id->model, sizeof(idmodel)-1);
    ata_format_id_string(serial, id->serial_no, sizeof(serial)-1);
    ata_format_id_string(firmware, id->fw_rev, sizeof(firmware)-1);

    out.print("Device Model:     %s\n", infofound(idmodel));
    out.print("Serial Number:    %s\n", infofound(serial));
    out.print("Firmware Version: %s\n", infofound(firmware));
  }
  else
    out.print("Device Model:     %s\n", infofound(model.c_str()));

  // See if drive is recognized
  out.print("Device is:        %s\n", (!matched ?
            "Not in drive database [for details use: -P showall]" :
            "In drive database [for details use: -P show]"));

  // Print ATA version
  if (id) {
    std::string ataver = ata_format_version(*id);
    out.print("ATA Version is:   %s\n", infofound(ataver.c_str()));
  }

  // Print warning message, if there is one in database
  if (matched && !dbentry.warning.empty())
    out.print("\n==> WARNING: %s\n\n", dbentry.warning.c_str());
}

/////////////////////////////////////////////////////////////////////////////

int ata_print_smart_attributes(report_sink & out, const ata_smart_values & values,
                               const drive_model & dbentry, unsigned char format)
{
  bool brief  = !!(format & ATA_PRINT_BRIEF);
  bool hexid  = !!(format & ATA_PRINT_HEX_ID);
  bool hexval = !!(format & ATA_PRINT_HEX_VAL);
  int lines = 0;

  // step through all vendor attributes, table ends at first zero id
  int numattr = ata_count_smart_attributes(values);
  for (int i = 0; i < numattr; i++) {
    const ata_smart_attribute & attr = values.vendor_attributes[i];

    // print header only if needed
    if (!lines) {
      out.print("SMART Attributes Data Structure revision number: %d\n", (int)values.revnumber);
      out.puts("Vendor Specific SMART Attributes:\n");
      if (!brief)
        out.print("ID#%s ATTRIBUTE_NAME          FLAG     VALUE WORST RSRVD  TYPE      UPDATED  RAW_VALUE\n",
                  (!hexid ? "" : " "));
      else
        out.print("ID#%s ATTRIBUTE_NAME          FLAGS    VALUE WORST RSRVD  RAW_VALUE\n",
                  (!hexid ? "" : " "));
    }

    const ata_attr_conv & preset = dbentry.get_preset(attr.id);
    unsigned attrflags = preset.conv.get_flags();

    // Format value, worst, reserved
    std::string valstr, worstr, resstr;
    if (!(attrflags & ATTRFLAG_NO_NORMVAL))
      valstr = (!hexval ? strprintf("%.3d",   attr.current)
                        : strprintf("0x%02x", attr.current));
    else
      valstr = (!hexval ? "---" : "----");
    if (!(attrflags & ATTRFLAG_NO_WORSTVAL))
      worstr = (!hexval ? strprintf("%.3d",   attr.worst)
                        : strprintf("0x%02x", attr.worst));
    else
      worstr = (!hexval ? "---" : "----");
    resstr = (!hexval ? strprintf("%.3d",   attr.reserv)
                      : strprintf("0x%02x", attr.reserv));

    // Print line for each valid attribute
    std::string idstr = (!hexid ? strprintf("%3d",    attr.id)
                                : strprintf("0x%02x", attr.id));
    // Name is empty if not preset
    const std::string & attrname = preset.name;
    std::string rawstr = ata_format_attr_raw_value(attr, preset.conv);

    if (!brief)
      out.print("%s %-24s0x%04x   %-4s  %-4s  %-4s   %-10s%-9s%s\n",
                idstr.c_str(), attrname.c_str(), attr.flags,
                valstr.c_str(), worstr.c_str(), resstr.c_str(),
                (ATTRIBUTE_FLAGS_PREFAILURE(attr.flags) ? "Pre-fail" : "Old_age"),
                (ATTRIBUTE_FLAGS_ONLINE(attr.flags)     ? "Always"   : "Offline"),
                rawstr.c_str());
    else
      out.print("%s %-24s%c%c%c%c%c%c%c  %-4s  %-4s  %-4s   %s\n",
                idstr.c_str(), attrname.c_str(),
                (ATTRIBUTE_FLAGS_PREFAILURE(attr.flags)     ? 'P' : '-'),
                (ATTRIBUTE_FLAGS_ONLINE(attr.flags)         ? 'O' : '-'),
                (ATTRIBUTE_FLAGS_PERFORMANCE(attr.flags)    ? 'S' : '-'),
                (ATTRIBUTE_FLAGS_ERRORRATE(attr.flags)      ? 'R' : '-'),
                (ATTRIBUTE_FLAGS_EVENTCOUNT(attr.flags)     ? 'C' : '-'),
                (ATTRIBUTE_FLAGS_SELFPRESERVING(attr.flags) ? 'K' : '-'),
                (ATTRIBUTE_FLAGS_OTHER(attr.flags)          ? '+' : ' '),
                valstr.c_str(), worstr.c_str(), resstr.c_str(),
                rawstr.c_str());
    lines++;
  }

  if (lines) {
    if (brief) {
      int n = (!hexid ? 28 : 29);
      out.print("%*s||||||_ K auto-keep\n"
                "%*s|||||__ C event count\n"
                "%*s||||___ R error rate\n"
                "%*s|||____ S speed/performance\n"
                "%*s||_____ O updated online\n"
                "%*s|______ P prefailure warning\n",
                n, "", n, "", n, "", n, "", n, "", n, "");
    }
    out.puts("\n");
  }
  return lines;
}

} // namespace smartattr
