/**
 * @file nvmeprint_test.cpp
 * @brief Unit tests for the NVMe SMART/Health log decoder and report
 */

#include <smartattr/nvmeprint.h>
#include <smartattr/ataprint.h>

#include "test_util.h"

#include <gtest/gtest.h>

using namespace smartattr;
using smartattr_test::message_recorder;

class NvmeSmartLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        memset(buf, 0, sizeof(buf));
    }

    // Store little endian VALUE of N bytes at OFFS.
    void put_le(int offs, uint64_t value, int n) {
        for (int i = 0; i < n; i++)
            buf[offs + i] = (i < 8 ? (unsigned char)(value >> (8 * i)) : 0);
    }

    std::string print(bool show_all = false) {
        nvme_smart_log log;
        EXPECT_TRUE(nvme_read_smart_log(buf, sizeof(buf), log));
        string_report_sink out;
        nvme_print_smart_log(out, log, show_all);
        return out.str();
    }

    static bool contains(const std::string & s, const char * text) {
        return s.find(text) != std::string::npos;
    }

    unsigned char buf[512];
};

TEST_F(NvmeSmartLogTest, ShortBuffer_ReturnsFalse) {
    message_recorder rec;
    nvme_smart_log log;
    EXPECT_FALSE(nvme_read_smart_log(buf, 511, log));
    EXPECT_TRUE(rec.contains(LIBMSG_ERROR, "511 bytes, at least 512 bytes required"));
}

TEST_F(NvmeSmartLogTest, FieldOffsets) {
    buf[0] = NVME_CRIT_WARN_SPARE | NVME_CRIT_WARN_READ_ONLY;
    put_le(1, 310, 2);
    buf[3] = 98; buf[4] = 10; buf[5] = 3;
    put_le(128, 1234, 16); // power on hours
    put_le(200, 320, 2);   // sensor 1

    nvme_smart_log log;
    ASSERT_TRUE(nvme_read_smart_log(buf, sizeof(buf), log));
    EXPECT_EQ(log.critical_warning, 0x09);
    EXPECT_EQ(uile16_to_uint(log.temperature), 310u);
    EXPECT_EQ(log.avail_spare, 98);
    EXPECT_EQ(get_uint64_le(log.power_on_hours), 1234u);
    EXPECT_EQ(uile16_to_uint(log.temp_sensor[0]), 320u);
}

TEST_F(NvmeSmartLogTest, Print_TemperatureInCelsius) {
    buf[0] = 0x02;
    put_le(1, 310, 2);
    std::string s = print();
    EXPECT_TRUE(contains(s, "Critical Warning:                   0x02\n"));
    EXPECT_TRUE(contains(s, "Temperature:                        37 Celsius\n"));
}

TEST_F(NvmeSmartLogTest, Print_ZeroTemperature_Unsupported) {
    std::string s = print();
    EXPECT_TRUE(contains(s, "Temperature:                        -\n"));
}

TEST_F(NvmeSmartLogTest, Print_DataUnitsWithCapacity) {
    put_le(32, 123456789, 16);
    buf[3] = 100; buf[4] = 10; buf[5] = 1;
    std::string s = print();
    EXPECT_TRUE(contains(s, "Data Units Read:                    123,456,789 [63.2 TB]\n"));
    EXPECT_TRUE(contains(s, "Data Units Written:                 0\n"));
    EXPECT_TRUE(contains(s, "Available Spare:                    100%\n"));
    EXPECT_TRUE(contains(s, "Available Spare Threshold:          10%\n"));
    EXPECT_TRUE(contains(s, "Percentage Used:                    1%\n"));
}

TEST_F(NvmeSmartLogTest, Print_CounterAbove64Bit) {
    put_le(144 + 8, 1, 8); // unsafe shutdowns = 2^64
    std::string s = print();
    EXPECT_TRUE(contains(s, "Unsafe Shutdowns:                   "));
    EXPECT_TRUE(contains(s, "18446744073709551616\n"));
}

TEST_F(NvmeSmartLogTest, Print_OptionalFieldsHiddenIfZero) {
    put_le(202, 305, 2); // sensor 2
    std::string s = print();
    EXPECT_FALSE(contains(s, "Warning  Comp. Temperature Time:"));
    EXPECT_FALSE(contains(s, "Temperature Sensor 1:"));
    EXPECT_TRUE(contains(s, "Temperature Sensor 2:               32 Celsius\n"));
    EXPECT_FALSE(contains(s, "Thermal Temp. 1 Transition Count:"));
}

TEST_F(NvmeSmartLogTest, Print_ShowAll_PrintsOptionalFields) {
    put_le(192, 7, 4); // warning temp time
    std::string s = print(true);
    EXPECT_TRUE(contains(s, "Warning  Comp. Temperature Time:    7\n"));
    EXPECT_TRUE(contains(s, "Critical Comp. Temperature Time:    0\n"));
    EXPECT_TRUE(contains(s, "Temperature Sensor 8:               -\n"));
    EXPECT_TRUE(contains(s, "Thermal Temp. 2 Total Time:         0\n"));
}
