/*
 * attrprint.cpp - print SMART attributes from data files (libsmartattr example program)
 *
 * Home page of code is: https://www.smartmontools.org
 *
 * Copyright (C) 2025 Christian Franke
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <smartattr/ataprint.h>
#include <smartattr/atasmart.h>
#include <smartattr/knowndrives.h>
#include <smartattr/nvmeprint.h>
#include <smartattr/utility.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

static int usage(const char * prog, int status)
{
  std::printf("%s\n"
    "Print SMART attributes from SMART READ DATA page files\n\n"
    "Usage: %s [-B [+]FILE] [-i IDENTIFY_FILE | -m MODEL] [-v ID,FORMAT[,NAME]]...\n"
    "          [-f brief|hex] [-e le|be] [-P show|showall] [-r LEVEL] SMART_DATA_FILE\n"
    "       %s -d nvme [-a] [-r LEVEL] NVME_LOG_FILE\n\n"
    "    -B [+]FILE Read drive database from FILE ('+': add to builtin database)\n"
    "    -i FILE    Read drive model from IDENTIFY DEVICE page FILE\n"
    "    -m MODEL   Specify drive model\n"
    "    -v ID,FORMAT[:BYTEORDER][,NAME]\n"
    "               Set display name and raw format of attribute ID\n"
    "    -f FORMAT  Attribute table format: brief, hex\n"
    "    -e ORDER   Byte order of SMART data file: le, be (default: host)\n"
    "    -P TYPE    Show drive database presets: show, showall\n"
    "    -d nvme    Print NVMe SMART/Health Information log page\n"
    "    -a         Print all NVMe log fields\n"
    "    -r LEVEL   Specify debug level\n"
    "    -h         Print this help\n"
    "    -V         Print version information\n",
    smartattr::format_version_info("attrprint").c_str(), prog, prog);
    return status;
}

// Read up to MAXSIZE bytes of file NAME.
static bool read_data_file(const char * name, std::vector<unsigned char> & data,
                           size_t maxsize)
{
  smartattr::stdio_file f(name, "rb");
  if (!f) {
    std::fprintf(stderr, "%s: %s\n", name, std::strerror(errno));
    return false;
  }
  data.resize(maxsize);
  size_t n = std::fread(data.data(), 1, maxsize, f);
  if (std::ferror(f)) {
    std::fprintf(stderr, "%s: read error\n", name);
    return false;
  }
  data.resize(n);
  return true;
}

static int print_nvme_log(const char * name, bool show_all)
{
  std::vector<unsigned char> data;
  if (!read_data_file(name, data, sizeof(smartattr::nvme_smart_log)))
    return 1;
  smartattr::nvme_smart_log smart_log;
  if (!smartattr::nvme_read_smart_log(data.data(), data.size(), smart_log))
    return 1;
  smartattr::stdio_report_sink out(stdout);
  smartattr::nvme_print_smart_log(out, smart_log, show_all);
  return 0;
}

int main(int argc, char **argv)
{
  try {
    smartattr::check_config();

    const char * dbpath = nullptr, * idfile = nullptr, * model_arg = nullptr;
    const char * show = nullptr;
    std::vector<std::string> attr_defs;
    unsigned char format = 0;
    smartattr::byte_order order = smartattr::host_byte_order();
    bool nvme = false, show_all = false;

    int ai;
    for (ai = 1; ai < argc && argv[ai][0] == '-'; ai++) {
      if (!std::strcmp(argv[ai], "-B") && ai + 1 < argc) {
        dbpath = argv[++ai];
      }
      else if (!std::strcmp(argv[ai], "-i") && ai + 1 < argc && !model_arg) {
        idfile = argv[++ai];
      }
      else if (!std::strcmp(argv[ai], "-m") && ai + 1 < argc && !idfile) {
        model_arg = argv[++ai];
      }
      else if (!std::strcmp(argv[ai], "-v") && ai + 1 < argc) {
        const char * def = argv[++ai];
        if (!std::strcmp(def, "help")) {
          std::printf("Valid arguments to '-v':\n"
            "%s\n", smartattr::create_vendor_attribute_arg_list().c_str());
          return 0;
        }
        attr_defs.push_back(def);
      }
      else if (!std::strcmp(argv[ai], "-f") && ai + 1 < argc) {
        const char * fmt = argv[++ai];
        if (!std::strcmp(fmt, "brief"))
          format |= smartattr::ATA_PRINT_BRIEF;
        else if (!std::strcmp(fmt, "hex"))
          format |= smartattr::ATA_PRINT_HEX_ID | smartattr::ATA_PRINT_HEX_VAL;
        else
          return usage(argv[0], 1);
      }
      else if (!std::strcmp(argv[ai], "-e") && ai + 1 < argc) {
        const char * arg = argv[++ai];
        if (!std::strcmp(arg, "le"))
          order = smartattr::BYTEORDER_LE;
        else if (!std::strcmp(arg, "be"))
          order = smartattr::BYTEORDER_BE;
        else
          return usage(argv[0], 1);
      }
      else if (!std::strcmp(argv[ai], "-P") && ai + 1 < argc) {
        show = argv[++ai];
        if (std::strcmp(show, "show") && std::strcmp(show, "showall"))
          return usage(argv[0], 1);
      }
      else if (!std::strcmp(argv[ai], "-d") && ai + 1 < argc) {
        if (std::strcmp(argv[++ai], "nvme"))
          return usage(argv[0], 1);
        nvme = true;
      }
      else if (!std::strcmp(argv[ai], "-a")) {
        show_all = true;
      }
      else if (!std::strcmp(argv[ai], "-r") && ai + 1 < argc) {
        smartattr::lib_debugmode = std::atoi(argv[++ai]);
      }
      else if (!std::strcmp(argv[ai], "-h")) {
        return usage(argv[0], 0);
      }
      else if (!std::strcmp(argv[ai], "-V")) {
        std::fputs(smartattr::format_version_info("attrprint", true).c_str(), stdout);
        return 0;
      }
      else {
        return usage(argv[0], 1);
      }
    }

    if (nvme) {
      if (ai + 1 != argc)
        return usage(argv[0], 1);
      return print_nvme_log(argv[ai], show_all);
    }

    // Check user attribute definitions before reading any data
    smartattr::ata_attr_preset_map user_presets;
    for (unsigned i = 0; i < attr_defs.size(); i++) {
      std::string key;
      if (!smartattr::parse_attribute_def(attr_defs[i].c_str(), user_presets, &key)) {
        std::fprintf(stderr, "-v %s: invalid argument, use '-v help' for a list\n",
                     attr_defs[i].c_str());
        return 1;
      }
      if (!user_presets[key].conv.is_known()) {
        std::fprintf(stderr, "-v %s: unknown raw format\n", attr_defs[i].c_str());
        return 1;
      }
    }

    smartattr::drive_database db;
    if (!smartattr::init_drive_database(db, dbpath))
      return 2;

    smartattr::stdio_report_sink out(stdout);
    if (show && !std::strcmp(show, "showall"))
      return (smartattr::show_all_presets(out, db) ? 2 : 0);

    // Get drive model
    std::string model;
    smartattr::ata_identify_device id;
    bool have_id = false;
    if (idfile) {
      std::vector<unsigned char> data;
      if (!read_data_file(idfile, data, sizeof(id)))
        return 1;
      if (!smartattr::ata_read_identity(data.data(), data.size(), id))
        return 1;
      // Regex is matched against the untrimmed string
      model = smartattr::ata_get_id_string(id.model, sizeof(id.model), false);
      have_id = true;
    }
    else if (model_arg)
      model = model_arg;

    if (show) {
      if (!idfile && !model_arg)
        return usage(argv[0], 1);
      smartattr::show_matching_presets(out, db, model);
      return 0;
    }

    if (ai + 1 != argc)
      return usage(argv[0], 1);

    std::vector<unsigned char> data;
    if (!read_data_file(argv[ai], data, sizeof(smartattr::ata_smart_values)))
      return 1;
    smartattr::ata_smart_values values;
    if (!smartattr::ata_read_smart_values(data.data(), data.size(), values, order))
      return 1;

    bool matched = false;
    smartattr::drive_model dbentry = smartattr::lookup_drive(db, model, &matched);

    // User definitions override database presets, keep database name if none given
    for (smartattr::ata_attr_preset_map::const_iterator it = user_presets.begin();
         it != user_presets.end(); ++it) {
      smartattr::ata_attr_conv & preset = dbentry.presets[it->first];
      preset.conv = it->second.conv;
      if (!it->second.name.empty())
        preset.name = it->second.name;
    }

    if (have_id || model_arg) {
      smartattr::ata_print_drive_info(out, (have_id ? &id : nullptr), model, dbentry, matched);
      out.puts("\n");
    }
    smartattr::ata_print_smart_attributes(out, values, dbentry, format);
    return 0;
  }
  catch (std::exception & ex) {
    std::fprintf(stderr, "Exception: %s\n", ex.what());
    return 1;
  }
}
