/*
 * nvmeprint.h
 *
 * Home page of code is: https://www.smartmontools.org
 *
 * Copyright (C) 2016-25 Christian Franke
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SMARTATTR_NVMEPRINT_H
#define SMARTATTR_NVMEPRINT_H

#include <smartattr/nvme.h>

#include <stddef.h>

namespace smartattr {

class report_sink;

// Decode a SMART / Health Information log page.
// Returns false if less than 512 bytes are provided.
bool nvme_read_smart_log(const void * buf, size_t size, nvme_smart_log & smart_log);

// Print SMART / Health Information log.
// Optional fields are printed if nonzero or if SHOW_ALL is set.
void nvme_print_smart_log(report_sink & out, const nvme_smart_log & smart_log,
                          bool show_all);

} // namespace smartattr

#endif // SMARTATTR_NVMEPRINT_H
