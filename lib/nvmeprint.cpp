/*
 * nvmeprint.cpp
 *
 * Home page of code is: https://www.smartmontools.org
 *
 * Copyright (C) 2016-25 Christian Franke
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <smartattr/nvmeprint.h>
#include <smartattr/ataprint.h> // report_sink
#include <smartattr/utility.h>

#include <stdio.h>
#include <string.h>

namespace smartattr {

bool nvme_read_smart_log(const void * buf, size_t size, nvme_smart_log & smart_log)
{
  if (size < sizeof(smart_log)) {
    lib_printf(LIBMSG_ERROR, "NVMe SMART/Health log: %u bytes, at least %u bytes required",
               (unsigned)size, (unsigned)sizeof(smart_log));
    return false;
  }
  memcpy(&smart_log, buf, sizeof(smart_log));
  return true;
}

// Format 128 bit integer for printing.
// Add value with SI prefixes if BYTES_PER_UNIT is specified.
static const char * le128_to_str(char (& str)[64], uint64_t hi, uint64_t lo, unsigned bytes_per_unit)
{
  if (!hi) {
    // Up to 64-bit, print exact value
    format_with_thousands_sep(str, sizeof(str)-16, lo);

    if (lo && bytes_per_unit && lo < 0xffffffffffffffffULL / bytes_per_unit) {
      int i = strlen(str);
      str[i++] = ' '; str[i++] = '[';
      format_capacity(str+i, (int)sizeof(str)-i-1, lo * bytes_per_unit);
      i = strlen(str);
      str[i++] = ']'; str[i] = 0;
    }
  }
  else {
    // More than 64-bit, prepend '~' flag on low precision
    int i = 0;
    if (uint128_to_str_precision_bits() < 128)
      str[i++] = '~';
    uint128_hilo_to_str(str + i, (int)sizeof(str) - i, hi, lo);
  }

  return str;
}

// Format 128 bit LE integer for printing.
static const char * le128_to_str(char (& str)[64], const uint8_t (& val)[16],
  unsigned bytes_per_unit = 0)
{
  return le128_to_str(str, get_uint64_le(val + 8), get_uint64_le(val), bytes_per_unit);
}

// Format a Kelvin temperature value in Celsius.
static const char * kelvin_to_str(char (& str)[64], int k)
{
  if (!k) // unsupported?
    str[0] = '-', str[1] = 0;
  else
    snprintf(str, sizeof(str), "%d Celsius", k - 273);
  return str;
}

void nvme_print_smart_log(report_sink & out, const nvme_smart_log & smart_log,
                          bool show_all)
{
  char buf[64];
  out.puts("SMART/Health Information (NVMe Log 0x02)\n");
  out.print("Critical Warning:                   0x%02x\n", smart_log.critical_warning);

  int k = uile16_to_uint(smart_log.temperature);
  out.print("Temperature:                        %s\n", kelvin_to_str(buf, k));

  out.print("Available Spare:                    %u%%\n", smart_log.avail_spare);
  out.print("Available Spare Threshold:          %u%%\n", smart_log.spare_thresh);
  out.print("Percentage Used:                    %u%%\n", smart_log.percent_used);
  // Data units are thousands of 512 byte units
  out.print("Data Units Read:                    %s\n", le128_to_str(buf, smart_log.data_units_read, 1000*512));
  out.print("Data Units Written:                 %s\n", le128_to_str(buf, smart_log.data_units_written, 1000*512));
  out.print("Host Read Commands:                 %s\n", le128_to_str(buf, smart_log.host_reads));
  out.print("Host Write Commands:                %s\n", le128_to_str(buf, smart_log.host_writes));
  out.print("Controller Busy Time:               %s\n", le128_to_str(buf, smart_log.ctrl_busy_time));
  out.print("Power Cycles:                       %s\n", le128_to_str(buf, smart_log.power_cycles));
  out.print("Power On Hours:                     %s\n", le128_to_str(buf, smart_log.power_on_hours));
  out.print("Unsafe Shutdowns:                   %s\n", le128_to_str(buf, smart_log.unsafe_shutdowns));
  out.print("Media and Data Integrity Errors:    %s\n", le128_to_str(buf, smart_log.media_errors));
  out.print("Error Information Log Entries:      %s\n", le128_to_str(buf, smart_log.num_err_log_entries));

  // Temperature thresholds are optional
  unsigned warning_temp_time = uile32_to_uint(smart_log.warning_temp_time);
  if (show_all || warning_temp_time)
    out.print("Warning  Comp. Temperature Time:    %u\n", warning_temp_time);
  unsigned critical_comp_time = uile32_to_uint(smart_log.critical_comp_time);
  if (show_all || critical_comp_time)
    out.print("Critical Comp. Temperature Time:    %u\n", critical_comp_time);

  // Temperature sensors are optional
  for (int i = 0; i < 8; i++) {
    int ks = uile16_to_uint(smart_log.temp_sensor[i]);
    if (show_all || ks)
      out.print("Temperature Sensor %d:               %s\n", i + 1,
                kelvin_to_str(buf, ks));
  }

  unsigned trans1 = uile32_to_uint(smart_log.thm_temp1_trans_count);
  if (show_all || trans1)
    out.print("Thermal Temp. 1 Transition Count:   %u\n", trans1);
  unsigned trans2 = uile32_to_uint(smart_log.thm_temp2_trans_count);
  if (show_all || trans2)
    out.print("Thermal Temp. 2 Transition Count:   %u\n", trans2);
  unsigned total1 = uile32_to_uint(smart_log.thm_temp1_total_time);
  if (show_all || total1)
    out.print("Thermal Temp. 1 Total Time:         %u\n", total1);
  unsigned total2 = uile32_to_uint(smart_log.thm_temp2_total_time);
  if (show_all || total2)
    out.print("Thermal Temp. 2 Total Time:         %u\n", total2);
  out.puts("\n");
}

} // namespace smartattr
