/**
 * @file ataprint_test.cpp
 * @brief Unit tests for the attribute table and drive info report
 */

#include <smartattr/ataprint.h>

#include "test_util.h"

#include <gtest/gtest.h>

#include <algorithm>

using namespace smartattr;
using smartattr_test::make_attr;

class AttributeReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        memset(&values, 0, sizeof(values));
        values.revnumber = 16;
        ata_attr_preset_map & p = dbentry.presets;
        parse_attribute_def("5,raw48,Reallocated_Sector_Ct", p);
        parse_attribute_def("9,raw64,Power_On_Hours", p);
        parse_attribute_def("194,tempminmax,Temperature_Celsius", p);
    }

    static int count_lines(const std::string & s) {
        return (int)std::count(s.begin(), s.end(), '\n');
    }

    ata_smart_values values;
    drive_model dbentry;
    string_report_sink out;
};

// ========== ata_print_smart_attributes Tests ==========

TEST_F(AttributeReportTest, EmptyTable_PrintsNothing) {
    EXPECT_EQ(ata_print_smart_attributes(out, values, dbentry), 0);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(AttributeReportTest, OneAttribute_ExactLine) {
    values.vendor_attributes[0] = make_attr(5, 0x0033, 100, 100, {3});
    EXPECT_EQ(ata_print_smart_attributes(out, values, dbentry), 1);

    const std::string & s = out.str();
    EXPECT_EQ(s.find("SMART Attributes Data Structure revision number: 16\n"), 0u);
    EXPECT_NE(s.find("ID# ATTRIBUTE_NAME          FLAG     VALUE WORST RSRVD  TYPE      UPDATED  RAW_VALUE\n"),
              std::string::npos);
    EXPECT_NE(s.find("  5 Reallocated_Sector_Ct   0x0033   100   100   000    Pre-fail  Always   3\n"),
              std::string::npos);
}

TEST_F(AttributeReportTest, StopsAtFirstZeroId) {
    values.vendor_attributes[0] = make_attr(5, 0x0033, 100, 100, {0});
    values.vendor_attributes[1] = make_attr(194, 0x0022, 63, 45, {37});
    values.vendor_attributes[3] = make_attr(9, 0x0032, 99, 99, {1});
    EXPECT_EQ(ata_print_smart_attributes(out, values, dbentry), 2);
    // 3 header lines, 2 attribute lines, empty line
    EXPECT_EQ(count_lines(out.str()), 6);
    EXPECT_EQ(out.str().find("Power_On_Hours"), std::string::npos);
}

TEST_F(AttributeReportTest, FullTable_ThirtyLines) {
    for (int i = 0; i < NUMBER_ATA_SMART_ATTRIBUTES; i++)
        values.vendor_attributes[i] = make_attr((unsigned char)(i + 1), 0x0032, 100, 100, {1});
    EXPECT_EQ(ata_print_smart_attributes(out, values, dbentry), NUMBER_ATA_SMART_ATTRIBUTES);
}

TEST_F(AttributeReportTest, Raw64_HidesNormalizedValues) {
    values.vendor_attributes[0] = make_attr(9, 0x0032, 0xd2, 0x04, {0x12, 0x34, 0, 0, 0, 0});
    ata_print_smart_attributes(out, values, dbentry);
    // raw64 appends worst and value to the raw bytes
    EXPECT_NE(out.str().find("  9 Power_On_Hours          0x0032   ---   ---   000    Old_age   Always   "),
              std::string::npos);
    EXPECT_NE(out.str().find("   873596114\n"), std::string::npos); // 0x341204d2
}

TEST_F(AttributeReportTest, TemperatureAttribute_UsesTempMinMax) {
    values.vendor_attributes[0] = make_attr(194, 0x0022, 63, 45, {37, 0, 20, 0, 45, 0});
    ata_print_smart_attributes(out, values, dbentry);
    EXPECT_NE(out.str().find("194 Temperature_Celsius     0x0022   063   045   000    Old_age   Always   37 (Min/Max 20/45)\n"),
              std::string::npos);
}

TEST_F(AttributeReportTest, NoPreset_EmptyNameAndUnknownRaw) {
    values.vendor_attributes[0] = make_attr(170, 0x0003, 100, 100, {1});
    ata_print_smart_attributes(out, values, dbentry);
    EXPECT_NE(out.str().find("170                         0x0003   100   100   000    Pre-fail  Always   ?\n"),
              std::string::npos);
}

TEST_F(AttributeReportTest, EmptyDriveModel_EmptyNames) {
    values.vendor_attributes[0] = make_attr(9, 0x0032, 100, 100, {1});
    drive_model empty;
    EXPECT_EQ(ata_print_smart_attributes(out, values, empty), 1);
    EXPECT_NE(out.str().find("  9                         0x0032   100   100   000    Old_age   Always   ?\n"),
              std::string::npos);
}

TEST_F(AttributeReportTest, UnknownRule_RendersQuestionMark) {
    parse_attribute_def("5,bogus,Reallocated_Sector_Ct", dbentry.presets);
    values.vendor_attributes[0] = make_attr(5, 0x0033, 100, 100, {3});
    EXPECT_EQ(ata_print_smart_attributes(out, values, dbentry), 1);
    EXPECT_NE(out.str().find("Always   ?\n"), std::string::npos);
}

TEST_F(AttributeReportTest, OfflineAttribute_Classified) {
    values.vendor_attributes[0] = make_attr(5, 0x0010, 100, 100, {3}, 7);
    ata_print_smart_attributes(out, values, dbentry);
    EXPECT_NE(out.str().find("0x0010   100   100   007    Old_age   Offline  3\n"), std::string::npos);
}

TEST_F(AttributeReportTest, BriefFormat_PrintsFlagLetters) {
    values.vendor_attributes[0] = make_attr(5, 0x0033, 100, 100, {3});
    ata_print_smart_attributes(out, values, dbentry, ATA_PRINT_BRIEF);
    const std::string & s = out.str();
    EXPECT_NE(s.find("ID# ATTRIBUTE_NAME          FLAGS    VALUE WORST RSRVD  RAW_VALUE\n"),
              std::string::npos);
    EXPECT_NE(s.find("  5 Reallocated_Sector_Ct   PO--CK   100   100   000    3\n"), std::string::npos);
    EXPECT_NE(s.find("                            ||||||_ K auto-keep\n"), std::string::npos);
    EXPECT_NE(s.find("|______ P prefailure warning\n"), std::string::npos);
}

TEST_F(AttributeReportTest, HexFormat_IdAndValues) {
    values.vendor_attributes[0] = make_attr(5, 0x0033, 100, 100, {3});
    ata_print_smart_attributes(out, values, dbentry, ATA_PRINT_HEX_ID | ATA_PRINT_HEX_VAL);
    EXPECT_NE(out.str().find("0x05 Reallocated_Sector_Ct   0x0033   0x64  0x64  0x00   Pre-fail  Always   3\n"),
              std::string::npos);
}

// ========== ata_print_drive_info Tests ==========

TEST(DriveInfoTest, MatchedWithWarning) {
    drive_model dbentry;
    dbentry.family = "Foo family";
    dbentry.warning = "Update firmware";

    string_report_sink out;
    ata_print_drive_info(out, nullptr, "FOO-1000", dbentry, true);
    EXPECT_EQ(out.str(),
              "Model Family:     Foo family\n"
              "Device Model:     FOO-1000\n"
              "Device is:        In drive database [for details use: -P show]\n"
              "\n==> WARNING: Update firmware\n\n");
}

TEST(DriveInfoTest, NotMatched_NoFamilyNoWarning) {
    drive_model dbentry;
    dbentry.family = "DEFAULT";
    dbentry.warning = "Default settings";

    string_report_sink out;
    ata_print_drive_info(out, nullptr, "", dbentry, false);
    EXPECT_EQ(out.str(),
              "Device Model:     [No Information Found]\n"
              "Device is:        Not in drive database [for details use: -P showall]\n");
}

TEST(DriveInfoTest, IdentifyData_PrintsSerialAndFirmware) {
    ata_identify_device id;
    memset(&id, ' ', sizeof(id));
    const char model[] = "OF-O0100"; // byte swapped "FOO-1000"
    memcpy(id.model, model, 8);
    const char fw[] = "1V"; // "V1"
    memcpy(id.fw_rev, fw, 2);

    drive_model dbentry;
    string_report_sink out;
    ata_print_drive_info(out, &id, "", dbentry, false);
    EXPECT_NE(out.str().find("Device Model:     FOO-1000\n"), std::string::npos);
    EXPECT_NE(out.str().find("Serial Number:    [No Information Found]\n"), std::string::npos);
    EXPECT_NE(out.str().find("Firmware Version: V1\n"), std::string::npos);
}

TEST(DriveInfoTest, IdentifyData_PrintsAtaVersion) {
    ata_identify_device id;
    memset(&id, 0, sizeof(id));
    id.major_rev_num = 0x01f0; // ATA/ATAPI-4 .. ATA8-ACS
    id.minor_rev_num = 0x0029;

    drive_model dbentry;
    string_report_sink out;
    ata_print_drive_info(out, &id, "", dbentry, false);
    EXPECT_NE(out.str().find("Device is:        Not in drive database [for details use: -P showall]\n"
                             "ATA Version is:   ATA8-ACS T13/1699-D revision 4\n"),
              std::string::npos);
}

TEST(DriveInfoTest, IdentifyData_NoVersionIndicated) {
    ata_identify_device id;
    memset(&id, 0, sizeof(id));
    drive_model dbentry;
    string_report_sink out;
    ata_print_drive_info(out, &id, "", dbentry, false);
    EXPECT_NE(out.str().find("ATA Version is:   [No Information Found]\n"), std::string::npos);
}

TEST(DriveInfoTest, NoIdentifyData_NoAtaVersion) {
    drive_model dbentry;
    string_report_sink out;
    ata_print_drive_info(out, nullptr, "FOO-1000", dbentry, false);
    EXPECT_EQ(out.str().find("ATA Version is:"), std::string::npos);
}

// ========== report_sink Tests ==========

TEST(ReportSinkTest, PrintFormatsLongStrings) {
    string_report_sink out;
    std::string longstr(1000, 'x');
    out.print("[%s] %d", longstr.c_str(), 42);
    EXPECT_EQ(out.str(), "[" + longstr + "] 42");
    out.clear();
    out.puts("abc");
    EXPECT_EQ(out.str(), "abc");
}
