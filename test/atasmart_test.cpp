/**
 * @file atasmart_test.cpp
 * @brief Unit tests for the SMART READ DATA and IDENTIFY decoders
 */

#include <smartattr/atasmart.h>

#include "test_util.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace smartattr;
using smartattr_test::message_recorder;
using ::testing::StrEq;

namespace {

class MockAtaHook : public lib_ata_hook {
public:
    MOCK_METHOD(void, on_checksum_error, (const char * datatype), (override));
};

// Encode 16-bit VALUE at P in byte order ORDER.
void put_uint16(unsigned char * p, unsigned value, byte_order order) {
    if (order == BYTEORDER_LE) {
        p[0] = (unsigned char)value; p[1] = (unsigned char)(value >> 8);
    }
    else {
        p[0] = (unsigned char)(value >> 8); p[1] = (unsigned char)value;
    }
}

} // namespace

class AtaSmartTest : public ::testing::Test {
protected:
    void SetUp() override {
        memset(buf, 0, sizeof(buf));
        lib_ata_hook::set(hook);
    }

    void TearDown() override {
        lib_ata_hook::reset();
    }

    // Set attribute record I in buffer.
    void set_record(int i, unsigned char id, unsigned flags, byte_order order = host_byte_order()) {
        unsigned char * r = buf + 2 + 12 * i;
        r[0] = id;
        put_uint16(r + 1, flags, order);
        r[3] = 100; r[4] = 100;
    }

    // Make checksum of full buffer valid.
    void fix_checksum() {
        buf[511] = 0;
        buf[511] = (unsigned char)(0x100 - ata_smart_checksum(buf));
    }

    unsigned char buf[512];
    ::testing::StrictMock<MockAtaHook> hook;
};

// ========== ata_read_smart_values Tests ==========

TEST_F(AtaSmartTest, ReadValues_ShortBuffer_ReturnsFalse) {
    message_recorder rec;
    ata_smart_values values;
    EXPECT_FALSE(ata_read_smart_values(buf, ATA_SMART_VALUES_MIN_SIZE - 1, values));
    EXPECT_EQ(rec.count(LIBMSG_ERROR), 1);
    EXPECT_TRUE(rec.contains(LIBMSG_ERROR, "too short"));
}

TEST_F(AtaSmartTest, ReadValues_MinimumSize_ZeroFillsTail) {
    set_record(0, 5, 0x0033);
    memset(buf + ATA_SMART_VALUES_MIN_SIZE, 0xff, sizeof(buf) - ATA_SMART_VALUES_MIN_SIZE);
    ata_smart_values values;
    // No checksum check on partial data
    ASSERT_TRUE(ata_read_smart_values(buf, ATA_SMART_VALUES_MIN_SIZE, values));
    EXPECT_EQ(values.vendor_attributes[0].id, 5);
    EXPECT_EQ(values.offline_data_collection_status, 0);
    EXPECT_EQ(values.chksum, 0);
}

TEST_F(AtaSmartTest, ReadValues_GoodChecksum_NoHookCall) {
    set_record(0, 1, 0x000f);
    fix_checksum();
    ata_smart_values values;
    EXPECT_TRUE(ata_read_smart_values(buf, sizeof(buf), values));
}

TEST_F(AtaSmartTest, ReadValues_BadChecksum_CallsHookAndContinues) {
    set_record(0, 1, 0x000f);
    fix_checksum();
    buf[511] ^= 0x01;
    EXPECT_CALL(hook, on_checksum_error(StrEq("SMART Attribute Data Structure"))).Times(1);
    ata_smart_values values;
    EXPECT_TRUE(ata_read_smart_values(buf, sizeof(buf), values));
    EXPECT_EQ(values.vendor_attributes[0].id, 1);
}

TEST_F(AtaSmartTest, ReadValues_BigEndianBuffer_ConvertsFields) {
    put_uint16(buf, 16, BYTEORDER_BE);
    set_record(0, 9, 0x0032, BYTEORDER_BE);
    set_record(1, 194, 0x1022, BYTEORDER_BE);
    fix_checksum();
    ata_smart_values values;
    ASSERT_TRUE(ata_read_smart_values(buf, sizeof(buf), values, BYTEORDER_BE));
    EXPECT_EQ((unsigned)values.revnumber, 16u);
    EXPECT_EQ((unsigned)values.vendor_attributes[0].flags, 0x0032u);
    EXPECT_EQ((unsigned)values.vendor_attributes[1].flags, 0x1022u);
}

TEST_F(AtaSmartTest, ReadValues_LittleEndianBuffer_ConvertsFields) {
    put_uint16(buf, 16, BYTEORDER_LE);
    set_record(0, 9, 0x0032, BYTEORDER_LE);
    fix_checksum();
    ata_smart_values values;
    ASSERT_TRUE(ata_read_smart_values(buf, sizeof(buf), values, BYTEORDER_LE));
    EXPECT_EQ((unsigned)values.revnumber, 16u);
    EXPECT_EQ((unsigned)values.vendor_attributes[0].flags, 0x0032u);
}

TEST_F(AtaSmartTest, Checksum_SumOfSector) {
    buf[0] = 0x10; buf[100] = 0x20; buf[511] = 0xd0;
    EXPECT_EQ(ata_smart_checksum(buf), 0);
    buf[511] = 0;
    EXPECT_EQ(ata_smart_checksum(buf), 0x30);
}

// ========== Attribute count Tests ==========

TEST_F(AtaSmartTest, CountAttributes_StopsAtFirstZeroId) {
    set_record(0, 1, 0x000f);
    set_record(1, 5, 0x0033);
    set_record(3, 9, 0x0032); // after zero id, ignored
    ata_smart_values values;
    ASSERT_TRUE(ata_read_smart_values(buf, ATA_SMART_VALUES_MIN_SIZE, values));
    EXPECT_EQ(ata_count_smart_attributes(values), 2);
}

TEST_F(AtaSmartTest, CountAttributes_FullTable) {
    for (int i = 0; i < NUMBER_ATA_SMART_ATTRIBUTES; i++)
        set_record(i, (unsigned char)(i + 1), 0x0032);
    ata_smart_values values;
    ASSERT_TRUE(ata_read_smart_values(buf, ATA_SMART_VALUES_MIN_SIZE, values));
    EXPECT_EQ(ata_count_smart_attributes(values), NUMBER_ATA_SMART_ATTRIBUTES);
}

TEST_F(AtaSmartTest, CountAttributes_EmptyTable) {
    ata_smart_values values;
    ASSERT_TRUE(ata_read_smart_values(buf, ATA_SMART_VALUES_MIN_SIZE, values));
    EXPECT_EQ(ata_count_smart_attributes(values), 0);
}

// ========== IDENTIFY Tests ==========

class AtaIdentifyTest : public ::testing::Test {
protected:
    void SetUp() override {
        memset(buf, 0, sizeof(buf));
    }

    // Store STR byte swapped at byte offset OFFS, padded with blanks to N bytes.
    void set_id_string(int offs, int n, const char * str) {
        std::string s(str);
        s.resize(n, ' ');
        for (int i = 0; i + 1 < n; i += 2) {
            buf[offs + i] = s[i + 1];
            buf[offs + i + 1] = s[i];
        }
    }

    unsigned char buf[512];
};

TEST_F(AtaIdentifyTest, ReadIdentity_ShortBuffer_ReturnsFalse) {
    message_recorder rec;
    ata_identify_device id;
    EXPECT_FALSE(ata_read_identity(buf, 256, id));
    EXPECT_EQ(rec.count(LIBMSG_ERROR), 1);
}

TEST_F(AtaIdentifyTest, GetIdString_SwapsBytes) {
    set_id_string(54, 40, "ST2000DM001-1CH164");
    set_id_string(20, 20, "  Z1E0ABCD");
    set_id_string(46, 8, "CC26");
    ata_identify_device id;
    ASSERT_TRUE(ata_read_identity(buf, sizeof(buf), id));

    std::string raw = ata_get_id_string(id.model, sizeof(id.model), false);
    EXPECT_EQ(raw.size(), 40u);
    EXPECT_EQ(raw.substr(0, 18), "ST2000DM001-1CH164");
    EXPECT_EQ(ata_get_id_string(id.model, sizeof(id.model), true), "ST2000DM001-1CH164");
    EXPECT_EQ(ata_get_id_string(id.serial_no, sizeof(id.serial_no), true), "Z1E0ABCD");

    char fw[8 + 1];
    ata_format_id_string(fw, id.fw_rev, sizeof(fw) - 1);
    EXPECT_STREQ(fw, "CC26");
}

TEST_F(AtaIdentifyTest, GetIdString_NulTerminates) {
    const unsigned char in[8] = {'B', 'A', 0, 'C', 'E', 'D', 'G', 'F'};
    EXPECT_EQ(ata_get_id_string(in, sizeof(in), false), "ABC");
}

// ========== ATA version Tests ==========

TEST_F(AtaIdentifyTest, ReadIdentity_VersionWordsLittleEndian) {
    buf[160] = 0xf0; buf[161] = 0x01; // word 80
    buf[162] = 0x1f; buf[163] = 0x00; // word 81
    ata_identify_device id;
    ASSERT_TRUE(ata_read_identity(buf, sizeof(buf), id));
    EXPECT_EQ((unsigned)id.major_rev_num, 0x01f0u);
    EXPECT_EQ((unsigned)id.minor_rev_num, 0x001fu);
}

TEST_F(AtaIdentifyTest, FormatVersion_MinorStringOnly) {
    ata_identify_device id;
    ASSERT_TRUE(ata_read_identity(buf, sizeof(buf), id));
    id.major_rev_num = 0x00fe; // bits 1-7: ATA/ATAPI-7
    id.minor_rev_num = 0x0021;
    EXPECT_EQ(ata_format_version(id), "ATA/ATAPI-7 T13/1532D revision 4a");
}

TEST_F(AtaIdentifyTest, FormatVersion_MajorAndMinorDiffer) {
    ata_identify_device id;
    ASSERT_TRUE(ata_read_identity(buf, sizeof(buf), id));
    id.major_rev_num = 0x0ff0; // ACS-4
    id.minor_rev_num = 0x011b;
    EXPECT_EQ(ata_format_version(id), "ACS-4, ACS-3 T13/2161-D revision 4");
}

TEST_F(AtaIdentifyTest, FormatVersion_UnknownCodes) {
    ata_identify_device id;
    ASSERT_TRUE(ata_read_identity(buf, sizeof(buf), id));
    id.major_rev_num = 0x01f0;
    id.minor_rev_num = 0x1234;
    EXPECT_EQ(ata_format_version(id), "ATA8-ACS (unknown minor revision code: 0x1234)");
    id.minor_rev_num = 0xffff;
    EXPECT_EQ(ata_format_version(id), "ATA8-ACS (minor revision not indicated)");
    id.major_rev_num = 0x8000;
    id.minor_rev_num = 0x0000;
    EXPECT_EQ(ata_format_version(id), "Unknown(0x8000) (minor revision not indicated)");
}

TEST_F(AtaIdentifyTest, FormatVersion_NotIndicated) {
    ata_identify_device id;
    ASSERT_TRUE(ata_read_identity(buf, sizeof(buf), id));
    EXPECT_EQ(ata_format_version(id), "");
    id.major_rev_num = 0xffff;
    id.minor_rev_num = 0xffff;
    EXPECT_EQ(ata_format_version(id), "");
}
