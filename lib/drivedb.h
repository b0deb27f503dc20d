/*
 * drivedb.h - smartattr drive database file
 *
 * Home page of code is: https://www.smartmontools.org
 *
 * Copyright (C) 2003-11 Philip Williams, Bruce Allen
 * Copyright (C) 2008-25 Christian Franke
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

/*
 * Structure used to store drive database entries:
 *
 * struct drive_settings {
 *   const char * modelfamily;
 *   const char * modelregexp;
 *   const char * firmwareregexp;
 *   const char * warningmsg;
 *   const char * presets;
 * };
 *
 * The elements are used in the following ways:
 *
 *  modelfamily     Informal string about the model family/series of a
 *                  device.  The entry is ignored if this string starts with
 *                  a dollar sign.  The entry named "DEFAULT" holds the
 *                  baseline presets which are merged into every match.
 *                  Must not start with "USB:", see below.
 *  modelregexp     POSIX extended regular expression to match the model of
 *                  a device.  This should never be "".
 *  firmwareregexp  POSIX extended regular expression to match a devices's
 *                  firmware.  Kept for reference, not used during lookup.
 *  warningmsg      A message that may be displayed for matching drives.
 *  presets         String with vendor-specific attribute ('-v') and firmware
 *                  bug fix ('-F') options.  Same syntax as in attrprint
 *                  command line.  The user's own settings override these.
 *
 * The regular expressions are searched within the untrimmed model string.
 * Use "^FULLSTRING$" if a full match is desired.
 *
 * The table will be searched from the start to end or until the first match,
 * so the order in the table is important for distinct entries that could match
 * the same drive.  A "DEFAULT" entry must precede the entries it applies to.
 *
 *
 * Format for USB ID entries:
 *
 *  modelfamily     String with format "USB: DEVICE; BRIDGE" where
 *                  DEVICE is the name of the device and BRIDGE is
 *                  the name of the USB bridge.  Both may be empty
 *                  if no info known.
 *  modelregexp     POSIX extended regular expression to match the USB
 *                  vendor:product ID in hex notation ("0x1234:0xabcd").
 *  firmwareregexp  POSIX extended regular expression to match the USB
 *                  bcdDevice info.
 *  warningmsg      Not used yet.
 *  presets         String with one device type ('-d') option.
 *
 * USB entries are listed by '-P showall' but never used for model lookup.
 */

/*
const drive_settings builtin_knowndrives[] = {
 */
  { "$Id$",
    "-", "-",
    "This is a dummy entry to hold the SVN-Id of drivedb.h",
    ""
  },
  { "DEFAULT",
    "-", "-",
    "Default settings",
    "-v 1,raw48,Raw_Read_Error_Rate "
    "-v 2,raw48,Throughput_Performance "
    "-v 3,raw16(avg16),Spin_Up_Time "
    "-v 4,raw48,Start_Stop_Count "
    "-v 5,raw16(raw16),Reallocated_Sector_Ct "
    "-v 6,raw48,Read_Channel_Margin "
    "-v 7,raw48,Seek_Error_Rate "
    "-v 8,raw48,Seek_Time_Performance "
    "-v 9,raw24(raw8),Power_On_Hours "
    "-v 10,raw48,Spin_Retry_Count "
    "-v 11,raw48,Calibration_Retry_Count "
    "-v 12,raw48,Power_Cycle_Count "
    "-v 13,raw48,Read_Soft_Error_Rate "
    "-v 175,raw48,Program_Fail_Count_Chip "
    "-v 176,raw48,Erase_Fail_Count_Chip "
    "-v 177,raw48,Wear_Leveling_Count "
    "-v 178,raw48,Used_Rsvd_Blk_Cnt_Chip "
    "-v 179,raw48,Used_Rsvd_Blk_Cnt_Tot "
    "-v 180,raw48,Unused_Rsvd_Blk_Cnt_Tot "
    "-v 181,raw48,Program_Fail_Cnt_Total "
    "-v 182,raw48,Erase_Fail_Count_Total "
    "-v 183,raw48,Runtime_Bad_Block "
    "-v 184,raw48,End-to-End_Error "
    "-v 187,raw48,Reported_Uncorrect "
    "-v 188,raw48,Command_Timeout "
    "-v 189,raw48,High_Fly_Writes "
    "-v 190,tempminmax,Airflow_Temperature_Cel "
    "-v 191,raw48,G-Sense_Error_Rate "
    "-v 192,raw48,Power-Off_Retract_Count "
    "-v 193,raw48,Load_Cycle_Count "
    "-v 194,tempminmax,Temperature_Celsius "
    "-v 195,raw48,Hardware_ECC_Recovered "
    "-v 196,raw16(raw16),Reallocated_Event_Count "
    "-v 197,raw48,Current_Pending_Sector "
    "-v 198,raw48,Offline_Uncorrectable "
    "-v 199,raw48,UDMA_CRC_Error_Count "
    "-v 200,raw48,Multi_Zone_Error_Rate "
    "-v 201,raw48,Soft_Read_Error_Rate "
    "-v 202,raw48,Data_Address_Mark_Errs "
    "-v 203,raw48,Run_Out_Cancel "
    "-v 204,raw48,Soft_ECC_Correction "
    "-v 205,raw48,Thermal_Asperity_Rate "
    "-v 206,raw48,Flying_Height "
    "-v 207,raw48,Spin_High_Current "
    "-v 208,raw48,Spin_Buzz "
    "-v 209,raw48,Offline_Seek_Performnce "
    "-v 220,raw48,Disk_Shift "
    "-v 221,raw48,G-Sense_Error_Rate "
    "-v 222,raw48,Loaded_Hours "
    "-v 223,raw48,Load_Retry_Count "
    "-v 224,raw48,Load_Friction "
    "-v 225,raw48,Load_Cycle_Count "
    "-v 226,raw48,Load-in_Time "
    "-v 227,raw48,Torq-amp_Count "
    "-v 228,raw48,Power-off_Retract_Count "
    "-v 230,raw48,Head_Amplitude "
    "-v 231,raw48,Temperature_Celsius "
    "-v 232,raw48,Available_Reservd_Space "
    "-v 233,raw48,Media_Wearout_Indicator "
    "-v 240,raw24(raw8),Head_Flying_Hours "
    "-v 241,raw48,Total_LBAs_Written "
    "-v 242,raw48,Total_LBAs_Read "
    "-v 250,raw48,Read_Error_Retry_Rate "
    "-v 254,raw48,Free_Fall_Sensor "
  },
  {
    "StorFly CFast SATA 6Gbps SSDs",
    // tested with StorFly VSFCS2CC060G-100/0409-000
    "StorFly VSFCS2C[CI](016|030|060|120|240)G-...",
    // C - commercial, I industrial
    "", "",
    "-v 192,raw48,Unsafe_Shutdown_Count "
    "-v 160,raw48,Uncorrectable_Error_Cnt "
    "-v 161,raw48,Spares_Remaining "
    "-v 241,raw48,Host_Writes_32MiB "
    "-v 242,raw48,Host_Reads_32MiB "
    "-v 169,raw48,Lifetime_Remaining% "
    "-v 248,raw48,Lifetime_Remaining% " //  later then 0409 FW.
    "-v 249,raw48,Spares_Remaining_Perc " //  later then 0409 FW.
  },
  {
    "StorFly SATA 6Gbps SSDs",
    // tested with Virtium StorFly VSFB25CC050G-JUN/0202-000
    "StorFly VSFBM8C[CI](060|120|240)G-...|"
    "StorFly VSFBM8C[CI](050|100|200)G-...",
    "0202-000", "",
    "-v 1,raw24/raw32,Raw_Read_Error_Rate "
    "-v 5,raw48,Reallocated_Sector_Ct "
    "-v 160,raw48,Uncorrectable_Count "
    "-v 161,raw48,Spares_Remaining "
    "-v 164,raw48,Total_Erase_Count "
    "-v 165,raw48,Maximum_Erase_Count "
    "-v 167,raw48,Average_Erase_Count "
    "-v 168,raw48,NAND_Endurance "
    "-v 194,raw48,Temperature "
    "-v 199,raw48,CRC_Error_Count "
    "-v 248,raw48,Remaining_Life_Left "
    "-v 249,raw48,Spare_Blocks_Remaining "
  },
  {
    "SandForce Driven SSDs",
    "^(OCZ[ -](AGILITY3|SOLID3|VERTEX3)|"
    "Corsair CSSD-F(40|60|80|120)GBP?2.*)$",
    "", "",
    "-v 1,raw24/raw32,Raw_Read_Error_Rate "
    "-v 5,raw48,Retired_Block_Count "
    "-v 9,msec24hour32,Power_On_Hours_and_Msec "
    "-v 13,raw24/raw32,Soft_Read_Error_Rate "
    "-v 100,raw48,Gigabytes_Erased "
    "-v 170,raw48,Reserve_Block_Count "
    "-v 171,raw48,Program_Fail_Count "
    "-v 172,raw48,Erase_Fail_Count "
    "-v 174,raw48,Unexpect_Power_Loss_Ct "
    "-v 181,raw48,Program_Fail_Count "
    "-v 182,raw48,Erase_Fail_Count "
    "-v 194,tempminmax,Temperature_Celsius "
    "-v 195,raw24/raw32,ECC_Uncorr_Error_Count "
    "-v 201,raw24/raw32,Unc_Soft_Read_Err_Rate "
    "-v 204,raw24/raw32,Soft_ECC_Correct_Rate "
    "-v 230,raw48,Life_Curve_Status "
    "-v 231,raw48,SSD_Life_Left "
    "-v 233,raw48,SandForce_Internal "
    "-v 234,raw48,SandForce_Internal "
    "-v 241,raw48,Lifetime_Writes_GiB "
    "-v 242,raw48,Lifetime_Reads_GiB "
  },
  {
    "Intel 320 Series SSDs",
    "^INTEL SSDSA[12]CW(040|080|120|160|300|600)G3",
    "", "",
    "-F nologdir "
    "-v 3,raw16(avg16),Spin_Up_Time "
    "-v 4,raw48,Start_Stop_Count "
    "-v 170,raw48,Reserve_Block_Count "
    "-v 171,raw48,Program_Fail_Count "
    "-v 172,raw48,Erase_Fail_Count "
    "-v 183,raw48,SATA_Downshift_Count "
    "-v 184,raw48,End-to-End_Error "
    "-v 192,raw48,Unsafe_Shutdown_Count "
    "-v 225,raw48,Host_Writes_32MiB "
    "-v 226,raw48,Workld_Media_Wear_Indic "
    "-v 227,raw48,Workld_Host_Reads_Perc "
    "-v 228,raw48,Workload_Minutes "
    "-v 232,raw48,Available_Reservd_Space "
    "-v 233,raw48,Media_Wearout_Indicator "
    "-v 241,raw48,Host_Writes_32MiB "
    "-v 242,raw48,Host_Reads_32MiB "
  },
  {
    "Samsung based SSDs",
    "^SAMSUNG MZ7(PA|PC|PD|WD)",
    "", "",
    "-v 9,raw24(raw8),Power_On_Hours "
    "-v 170,raw48,Unused_Rsvd_Blk_Ct_Chip "
    "-v 171,raw48,Program_Fail_Count_Chip "
    "-v 172,raw48,Erase_Fail_Count_Chip "
    "-v 173,raw48,Wear_Leveling_Count "
    "-v 174,raw48,Unexpect_Power_Loss_Ct "
    "-v 177,raw48,Wear_Leveling_Count "
    "-v 178,raw48,Used_Rsvd_Blk_Cnt_Chip "
    "-v 180,raw48,Unused_Rsvd_Blk_Cnt_Tot "
    "-v 190,hex48,Airflow_Temperature_Cel "
    "-v 195,raw48:r543210,ECC_Error_Rate "
    "-v 235,raw48,POR_Recovery_Count "
    "-v 241,raw48,Total_LBAs_Written "
  },
  {
    "Fujitsu MHR2020AT",
    "^FUJITSU MHR2020AT",
    "", "",
    "-v 9,sec2hour,Power_On_Seconds "
  },
  {
    "Maxtor DiamondMax Plus D740X",
    "^MAXTOR 6L0(20[JL]1|40[JL]2|60[JL]3|80[JL]4)$",
    "", "",
    "-v 9,minutes"
  },
  {
    "Maxtor MaXLine Plus II",
    "^Maxtor 7Y250[PM]0$",
    "",
    "A firmware update for this drive may be available",
    "-v 9,minutes"
  },
  {
    "Hitachi Deskstar 7K80",
    "^(Hitachi )?HDS7280([48]0PLAT20|(40)?PLA320|80PLA380)$",
    "", "",
    "-v 9,halfmin2hour,Power_On_Half_Minutes "
    "-v 194,temp10x,Temperature_Celsius_x10 "
  },
  {
    "Seagate Barracuda 7200.14 (AF)",
    "^ST(1000|1500|2000|2500|3000)DM00[0-3]-.*$",
    "", "",
    "-v 188,raw16 "
    "-v 240,msec24hour32 "
  },
  {
    "Western Digital Blue",
    "^WDC WD((25|32|50)00AAKS|(16|25|32|50)00AAJS)-.*$",
    "", "",
    "-v 9,raw24(raw8) "
    "-v 193,raw48,Load_Cycle_Count "
    "-v 240,raw56,Head_Flying_Hours "
    "-v 241,hex56,Total_LBAs_Written "
  },
  { "USB: ; JMicron JMS539",
    "0x152d:0x2339",
    "",
    "",
    "-d sat"
  },
  { "USB: Seagate Expansion Portable; ",
    "0x0bc2:0x2300",
    "",
    "",
    "-d sat"
  },
/*
};
 */
