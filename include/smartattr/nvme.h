/*
 * nvme.h
 *
 * Home page of code is: https://www.smartmontools.org
 *
 * Copyright (C) 2016-25 Christian Franke
 *
 * Original code from <linux/nvme.h>:
 *   Copyright (C) 2011-2014 Intel Corporation
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SMARTATTR_NVME_H
#define SMARTATTR_NVME_H

#include <smartattr/byteorder.h>

#include <stddef.h>
#include <stdint.h>

namespace smartattr {

// NVMe log page id of SMART / Health Information
#define NVME_LOG_SMART_HEALTH 0x02

// Critical warning bits
enum {
  NVME_CRIT_WARN_SPARE       = 0x01, // Available spare below threshold
  NVME_CRIT_WARN_TEMPERATURE = 0x02, // Temperature above or below threshold
  NVME_CRIT_WARN_RELIABILITY = 0x04, // Reliability degraded
  NVME_CRIT_WARN_READ_ONLY   = 0x08, // Media placed in read only mode
  NVME_CRIT_WARN_VOLATILE    = 0x10, // Volatile memory backup failed
  NVME_CRIT_WARN_PMR_RO      = 0x20, // Persistent memory region read only
};

// SMART / Health Information (Log Identifier 02h).
// Multi-byte fields are little endian and may be unaligned.
struct nvme_smart_log {
  uint8_t  critical_warning;
  uile16_t temperature;
  uint8_t  avail_spare;
  uint8_t  spare_thresh;
  uint8_t  percent_used;
  uint8_t  endu_grp_crit_warn_sumry;
  uint8_t  rsvd7[25];
  uint8_t  data_units_read[16];
  uint8_t  data_units_written[16];
  uint8_t  host_reads[16];
  uint8_t  host_writes[16];
  uint8_t  ctrl_busy_time[16];
  uint8_t  power_cycles[16];
  uint8_t  power_on_hours[16];
  uint8_t  unsafe_shutdowns[16];
  uint8_t  media_errors[16];
  uint8_t  num_err_log_entries[16];
  uile32_t warning_temp_time;
  uile32_t critical_comp_time;
  uile16_t temp_sensor[8];
  uile32_t thm_temp1_trans_count;
  uile32_t thm_temp2_trans_count;
  uile32_t thm_temp1_total_time;
  uile32_t thm_temp2_total_time;
  uint8_t  rsvd232[280];
};
SMARTATTR_ASSERT_SIZEOF(nvme_smart_log, 512);

} // namespace smartattr

#endif // SMARTATTR_NVME_H
