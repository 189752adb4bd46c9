/**
 * test_protocol.cpp - Broadcast decoder tests
 *
 * Packets are written out byte by byte as a hub sends them:
 *   [len][0xFF][0x97 0x03][channel][value...]
 *
 * THE BUG THESE TESTS PREVENT:
 * Reading the channel as a 16-bit field swallowed the first value byte, so
 * channel 255 came out as values like 42751 (0xA6FF).
 */

#include <unity.h>
#include <stdint.h>
#include <vector>

#include "core/Protocol.h"

using namespace PBScan;

static DecodeResult result;

static DecodeStatus decodeBytes(const std::vector<uint8_t> &bytes)
{
    return Protocol::decode(bytes.data(), bytes.size(), result);
}

void setUp(void)
{
    result = DecodeResult();
}

void tearDown(void) {}

// ============================================================================
// SCALARS
// ============================================================================

/** TEST: channel byte 0xFF is channel 255 and the value is intact */
void test_channel_255_is_uint8(void)
{
    std::vector<uint8_t> packet = {0x07, 0xFF, 0x97, 0x03, 0xFF, 0x00, 0x61, 0x05};

    TEST_ASSERT_EQUAL(DecodeStatus::DECODED, decodeBytes(packet));
    TEST_ASSERT_EQUAL_UINT8(255, result.channel);
    TEST_ASSERT_EQUAL(ValueType::INT, result.value.type);
    TEST_ASSERT_EQUAL_INT32(5, result.value.intVal);
}

/** TEST: int widths 1/2/4 are signed little-endian */
void test_int_widths_are_signed_le(void)
{
    std::vector<uint8_t> int8 = {0x07, 0xFF, 0x97, 0x03, 0x01, 0x00, 0x61, 0xFE};
    TEST_ASSERT_EQUAL(DecodeStatus::DECODED, decodeBytes(int8));
    TEST_ASSERT_EQUAL_INT32(-2, result.value.intVal);

    std::vector<uint8_t> int16 = {0x08, 0xFF, 0x97, 0x03, 0x01, 0x00, 0x62, 0x18, 0xFC};
    TEST_ASSERT_EQUAL(DecodeStatus::DECODED, decodeBytes(int16));
    TEST_ASSERT_EQUAL_INT32(-1000, result.value.intVal);

    std::vector<uint8_t> int32 = {0x0A, 0xFF, 0x97, 0x03, 0x01, 0x00,
                                  0x64, 0xA0, 0x86, 0x01, 0x00};
    TEST_ASSERT_EQUAL(DecodeStatus::DECODED, decodeBytes(int32));
    TEST_ASSERT_EQUAL_INT32(100000, result.value.intVal);
}

/** TEST: float, bool, str and bytes payloads */
void test_other_scalars(void)
{
    std::vector<uint8_t> f = {0x0A, 0xFF, 0x97, 0x03, 0x02, 0x00,
                              0x84, 0x00, 0x00, 0xC0, 0x3F};
    TEST_ASSERT_EQUAL(DecodeStatus::DECODED, decodeBytes(f));
    TEST_ASSERT_EQUAL(ValueType::FLOAT, result.value.type);
    TEST_ASSERT_EQUAL_FLOAT(1.5f, result.value.floatVal);
    TEST_ASSERT_EQUAL_STRING("1.5", result.value.toString().c_str());

    std::vector<uint8_t> t = {0x06, 0xFF, 0x97, 0x03, 0x02, 0x00, 0x20};
    TEST_ASSERT_EQUAL(DecodeStatus::DECODED, decodeBytes(t));
    TEST_ASSERT_EQUAL(ValueType::BOOL, result.value.type);
    TEST_ASSERT_TRUE(result.value.boolVal);
    TEST_ASSERT_EQUAL_STRING("True", result.value.toString().c_str());

    std::vector<uint8_t> s = {0x08, 0xFF, 0x97, 0x03, 0x02, 0x00, 0xA2, 'h', 'i'};
    TEST_ASSERT_EQUAL(DecodeStatus::DECODED, decodeBytes(s));
    TEST_ASSERT_EQUAL(ValueType::STR, result.value.type);
    TEST_ASSERT_EQUAL_STRING("hi", result.value.toString().c_str());

    std::vector<uint8_t> b = {0x08, 0xFF, 0x97, 0x03, 0x02, 0x00, 0xC2, 0xDE, 0xAD};
    TEST_ASSERT_EQUAL(DecodeStatus::DECODED, decodeBytes(b));
    TEST_ASSERT_EQUAL(ValueType::BYTES, result.value.type);
    TEST_ASSERT_EQUAL_STRING("dead", result.value.toString().c_str());
}

// ============================================================================
// CONTAINERS
// ============================================================================

/** TEST: values without the single-object marker form a tuple */
void test_top_level_tuple(void)
{
    std::vector<uint8_t> packet = {0x09, 0xFF, 0x97, 0x03, 0x03,
                                   0x61, 0x01, 0xA1, 'x', 0x40};

    TEST_ASSERT_EQUAL(DecodeStatus::DECODED, decodeBytes(packet));
    TEST_ASSERT_EQUAL(ValueType::TUPLE, result.value.type);
    TEST_ASSERT_EQUAL_UINT32(3, result.value.items.size());
    TEST_ASSERT_EQUAL_STRING("(1, 'x', False)", result.value.toString().c_str());
}

/** TEST: list header carries the byte length of its items */
void test_list_value(void)
{
    std::vector<uint8_t> packet = {0x0C, 0xFF, 0x97, 0x03, 0x04, 0x00, 0xE6,
                                   0x61, 0x01, 0x61, 0x02, 0x61, 0x03};

    TEST_ASSERT_EQUAL(DecodeStatus::DECODED, decodeBytes(packet));
    TEST_ASSERT_EQUAL(ValueType::LIST, result.value.type);
    TEST_ASSERT_EQUAL_STRING("[1, 2, 3]", result.value.toString().c_str());
}

/** TEST: nested containers survive an encode/decode pass */
void test_nested_value_encodes_and_decodes(void)
{
    Value value = Value::makeList({
        Value::makeTuple({Value::makeInt(-300), Value::makeStr("arm")}),
        Value::makeList({Value::makeBool(true), Value::makeFloat(2.5f)}),
        Value::makeBytes({0x01, 0x02}),
    });

    std::vector<uint8_t> packet = Protocol::buildAdvertisement(7, value);
    TEST_ASSERT_TRUE(packet.size() > 0);

    TEST_ASSERT_EQUAL(DecodeStatus::DECODED, decodeBytes(packet));
    TEST_ASSERT_EQUAL_UINT8(7, result.channel);
    TEST_ASSERT_TRUE(result.value == value);
    TEST_ASSERT_EQUAL_STRING("[(-300, 'arm'), [True, 2.5], 0102]",
                             result.value.toString().c_str());
}

/** TEST: a value that does not fit one AD unit is not encoded */
void test_oversized_value_not_encoded(void)
{
    Value value = Value::makeStr("0123456789012345678901234567890");
    TEST_ASSERT_EQUAL_UINT32(0, Protocol::buildAdvertisement(1, value).size());
}

// ============================================================================
// REJECTION
// ============================================================================

/** TEST: broken packets are MALFORMED, never decoded */
void test_malformed_packets(void)
{
    // Element length runs past the payload
    std::vector<uint8_t> truncated = {0x0A, 0xFF, 0x97, 0x03, 0x01, 0x00, 0x61};
    TEST_ASSERT_EQUAL(DecodeStatus::MALFORMED, decodeBytes(truncated));

    // Int width 3 does not exist
    std::vector<uint8_t> badWidth = {0x07, 0xFF, 0x97, 0x03, 0x01, 0x00, 0x63, 0x05};
    TEST_ASSERT_EQUAL(DecodeStatus::MALFORMED, decodeBytes(badWidth));

    // Bytes left after a single object
    std::vector<uint8_t> trailing = {0x09, 0xFF, 0x97, 0x03, 0x01, 0x00,
                                     0x61, 0x05, 0x61, 0x06};
    TEST_ASSERT_EQUAL(DecodeStatus::MALFORMED, decodeBytes(trailing));

    // 0xC3 0x28 is not UTF-8
    std::vector<uint8_t> badUtf8 = {0x08, 0xFF, 0x97, 0x03, 0x01, 0x00, 0xA2, 0xC3, 0x28};
    TEST_ASSERT_EQUAL(DecodeStatus::MALFORMED, decodeBytes(badUtf8));

    // List claims 6 bytes, only 2 follow
    std::vector<uint8_t> overrun = {0x08, 0xFF, 0x97, 0x03, 0x01, 0x00, 0xE6, 0x61, 0x01};
    TEST_ASSERT_EQUAL(DecodeStatus::MALFORMED, decodeBytes(overrun));

    // Marker with nothing behind it
    std::vector<uint8_t> bareMarker = {0x05, 0xFF, 0x97, 0x03, 0x01, 0x00};
    TEST_ASSERT_EQUAL(DecodeStatus::MALFORMED, decodeBytes(bareMarker));
}

/** TEST: other manufacturers and empty bodies are FOREIGN */
void test_foreign_packets(void)
{
    std::vector<uint8_t> apple = {0x07, 0xFF, 0x4C, 0x00, 0x01, 0x00, 0x61, 0x05};
    TEST_ASSERT_EQUAL(DecodeStatus::FOREIGN, decodeBytes(apple));

    std::vector<uint8_t> channelOnly = {0x04, 0xFF, 0x97, 0x03, 0x01};
    TEST_ASSERT_EQUAL(DecodeStatus::FOREIGN, decodeBytes(channelOnly));

    std::vector<uint8_t> flagsOnly = {0x02, 0x01, 0x06};
    TEST_ASSERT_EQUAL(DecodeStatus::FOREIGN, decodeBytes(flagsOnly));
}

// ============================================================================
// NAMES
// ============================================================================

/** TEST: complete name wins over shortened, in any order */
void test_complete_name_preferred(void)
{
    std::vector<uint8_t> packet = {0x03, 0x08, 'a', 'b',
                                   0x04, 0x09, 'h', 'u', 'b'};

    TEST_ASSERT_EQUAL(DecodeStatus::FOREIGN, decodeBytes(packet));
    TEST_ASSERT_TRUE(result.hasName);
    TEST_ASSERT_TRUE(result.nameComplete);
    TEST_ASSERT_EQUAL_STRING("hub", result.name.c_str());
}

/** TEST: a name next to the broadcast element is returned with the value */
void test_name_with_broadcast(void)
{
    std::vector<uint8_t> packet =
        Protocol::buildAdvertisement(3, Value::makeInt(9), "City");

    TEST_ASSERT_EQUAL(DecodeStatus::DECODED, decodeBytes(packet));
    TEST_ASSERT_TRUE(result.hasName);
    TEST_ASSERT_EQUAL_STRING("City", result.name.c_str());
    TEST_ASSERT_EQUAL_INT32(9, result.value.intVal);
}

/** TEST: pre-filter finds the company id anywhere in the payload */
void test_contains_company_id(void)
{
    const uint8_t hit[] = {0x02, 0x01, 0x06, 0x05, 0xFF, 0x97, 0x03, 0x00, 0x20};
    const uint8_t miss[] = {0x02, 0x01, 0x06, 0x97};

    TEST_ASSERT_TRUE(Protocol::containsCompanyId(hit, sizeof(hit)));
    TEST_ASSERT_FALSE(Protocol::containsCompanyId(miss, sizeof(miss)));
    TEST_ASSERT_FALSE(Protocol::containsCompanyId(hit, 0));
}

int main(int argc, char **argv)
{
    (void)argc;
    (void)argv;
    UNITY_BEGIN();

    RUN_TEST(test_channel_255_is_uint8);
    RUN_TEST(test_int_widths_are_signed_le);
    RUN_TEST(test_other_scalars);
    RUN_TEST(test_top_level_tuple);
    RUN_TEST(test_list_value);
    RUN_TEST(test_nested_value_encodes_and_decodes);
    RUN_TEST(test_oversized_value_not_encoded);
    RUN_TEST(test_malformed_packets);
    RUN_TEST(test_foreign_packets);
    RUN_TEST(test_complete_name_preferred);
    RUN_TEST(test_name_with_broadcast);
    RUN_TEST(test_contains_company_id);

    return UNITY_END();
}
