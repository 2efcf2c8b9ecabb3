#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "Core/ErrorCodes.h"
#include "Core/HexText.h"

TEST(HexText, ParsesHexAndDecimalAddresses)
{
    uint16_t v = 0;
    EXPECT_TRUE(HexText::parseU16("0x3b", v));
    EXPECT_EQ(v, 0x3B);
    EXPECT_TRUE(HexText::parseU16("0XF6FB", v));
    EXPECT_EQ(v, 0xF6FB);
    EXPECT_TRUE(HexText::parseU16("59", v));
    EXPECT_EQ(v, 59);
    EXPECT_TRUE(HexText::parseU16("65535", v));
    EXPECT_EQ(v, 0xFFFF);
}

TEST(HexText, RejectsMalformedAddresses)
{
    uint16_t v = 7;
    EXPECT_FALSE(HexText::parseU16(nullptr, v));
    EXPECT_FALSE(HexText::parseU16("", v));
    EXPECT_FALSE(HexText::parseU16("0x", v));
    EXPECT_FALSE(HexText::parseU16("0x1G", v));
    EXPECT_FALSE(HexText::parseU16("12a", v));
    EXPECT_FALSE(HexText::parseU16("-1", v));
    EXPECT_FALSE(HexText::parseU16("65536", v));
    EXPECT_FALSE(HexText::parseU16("0x10000", v));
    EXPECT_EQ(v, 7);
}

TEST(HexText, ParsesContiguousHexBytes)
{
    std::vector<uint8_t> out;
    ASSERT_TRUE(HexText::parseHexBytes("01020aFF", out));
    EXPECT_EQ(out, (std::vector<uint8_t>{0x01, 0x02, 0x0A, 0xFF}));

    ASSERT_TRUE(HexText::parseHexBytes("0x0008", out));
    EXPECT_EQ(out, (std::vector<uint8_t>{0x00, 0x08}));

    ASSERT_TRUE(HexText::parseHexBytes("abc", out));
    EXPECT_EQ(out, (std::vector<uint8_t>{0xAB}));

    ASSERT_TRUE(HexText::parseHexBytes("", out));
    EXPECT_TRUE(out.empty());

    EXPECT_FALSE(HexText::parseHexBytes("01zz", out));
    EXPECT_TRUE(out.empty());
    EXPECT_FALSE(HexText::parseHexBytes(nullptr, out));
}

TEST(HexText, FormatsBytes)
{
    const uint8_t data[] = {0x01, 0xAB, 0x00};
    EXPECT_EQ(HexText::toHexBytes(data, sizeof(data)), "01ab00");
    EXPECT_EQ(HexText::toByteList(data, sizeof(data)), "[0x01, 0xab, 0x00]");
    EXPECT_EQ(HexText::toByteList(data, 0), "[]");
    EXPECT_EQ(HexText::toAddr(0x3B), "0x003b");
    EXPECT_EQ(HexText::toAddr(0xF6FB), "0xf6fb");
}

TEST(HexText, ParsesByteLists)
{
    std::vector<uint8_t> out;
    ASSERT_TRUE(HexText::parseByteList("[0x01, 0x02, 0x0c]", out));
    EXPECT_EQ(out, (std::vector<uint8_t>{0x01, 0x02, 0x0C}));
    ASSERT_TRUE(HexText::parseByteList("[ff,0]", out));
    EXPECT_EQ(out, (std::vector<uint8_t>{0xFF, 0x00}));
    ASSERT_TRUE(HexText::parseByteList("[]", out));
    EXPECT_TRUE(out.empty());

    EXPECT_FALSE(HexText::parseByteList("[0x100]", out));
    EXPECT_FALSE(HexText::parseByteList("[0x01;0x02]", out));
    EXPECT_FALSE(HexText::parseByteList("[0x01, , 0x02]", out));
}

TEST(ErrorCodes, NamesAreStable)
{
    EXPECT_STREQ(errorCodeStr(ErrorCode::InvalidOpcode), "invalid_opcode");
    EXPECT_STREQ(errorCodeStr(ErrorCode::BackendFailure), "backend_failure");
    EXPECT_STREQ(errorCodeStr(ErrorCode::NotReady), "not_ready");
}

TEST(ErrorCodes, ErrorJsonIsSanitized)
{
    char out[128];
    ASSERT_TRUE(writeErrorJson(out, sizeof(out), ErrorCode::BadRequest, "bad \"addr\"\n"));
    EXPECT_STREQ(out, "{\"error\":\"bad  addr  \",\"code\":\"bad_request\"}");

    char tiny[8];
    EXPECT_FALSE(writeErrorJson(tiny, sizeof(tiny), ErrorCode::BadRequest, "x"));
}
