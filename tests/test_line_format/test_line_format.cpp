/**
 * test_line_format.cpp - Output line layout tests
 *
 * Signal labels have different lengths ("Far" vs "Very close"); the
 * columns after them must stay put.
 */

#include <unity.h>
#include <stdint.h>
#include <string>

#include "core/LineFormat.h"

using namespace PBScan;

static ChangeEvent event;

void setUp(void)
{
    event = ChangeEvent();
    event.elapsedSeconds = 12;
    event.addressText = "90:84:2B:00:00:01";
    event.tag = 'A';
    event.channel = 1;
    event.signalLabel = "Far";
    event.smoothedRssi = -75.4f;
    event.value = Value::makeInt(5);
}

void tearDown(void) {}

/** TEST: plain line, short label padded to the label column width */
void test_change_line_layout(void)
{
    std::string line = formatChangeLine(event, "", "");
    TEST_ASSERT_EQUAL_STRING(
        "      12s 90:84:2B:00:00:01 [A]               1 Far         -75dBm 5\n",
        line.c_str());
}

/** TEST: colors, name and the widest label */
void test_change_line_with_name_and_color(void)
{
    event.elapsedSeconds = 3;
    event.addressText = "90:84:2B:00:00:02";
    event.tag = 'B';
    event.name = "City Hub";
    event.channel = 255;
    event.signalLabel = "Very close";
    event.smoothedRssi = -48.0f;
    event.value = Value::makeList({Value::makeInt(1), Value::makeInt(2)});

    std::string line = formatChangeLine(event, "\x1b[31m", "\x1b[0m");
    TEST_ASSERT_EQUAL_STRING(
        "       3s \x1b[31m90:84:2B:00:00:02\x1b[0m [B] City Hub    255 Very close  -48dBm [1, 2]\n",
        line.c_str());
}

/** TEST: the dBm column is at the same offset for every label */
void test_signal_column_aligned(void)
{
    const char *labels[] = {"Very close", "Nearby", "Far", "Weak"};
    size_t expected = formatChangeLine(event, "", "").find("dBm");

    for (const char *label : labels)
    {
        event.signalLabel = label;
        TEST_ASSERT_EQUAL_UINT32(expected, formatChangeLine(event, "", "").find("dBm"));
    }
}

/** TEST: header Signal column spans label plus reading */
void test_header_columns(void)
{
    std::string header = formatHeaderLine();
    std::string line = formatChangeLine(event, "", "");

    TEST_ASSERT_EQUAL_UINT32(header.find("Value"), line.find("dBm") + 4);
}

int main(int argc, char **argv)
{
    (void)argc;
    (void)argv;
    UNITY_BEGIN();

    RUN_TEST(test_change_line_layout);
    RUN_TEST(test_change_line_with_name_and_color);
    RUN_TEST(test_signal_column_aligned);
    RUN_TEST(test_header_columns);

    return UNITY_END();
}
