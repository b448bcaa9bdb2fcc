/**
 * @file test_register_codec.cpp
 * @brief Tests for register word decoding and encoding
 * @author RegBridge Test Team
 * @date 2025-09-06
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../cpp/include/register_codec.hpp"
#include "../cpp/include/exceptions.hpp"
#include <cmath>
#include <limits>
#include <vector>

using namespace regBridge;
using namespace testing;

class RegisterCodecTest : public ::testing::Test {
protected:
    const std::vector<ByteOrder> wide_orders_ = {
        ByteOrder::ABCD, ByteOrder::CDAB, ByteOrder::BADC, ByteOrder::DCBA
    };

    static int64_t asInt(const ParameterValue& value) {
        return std::get<int64_t>(value);
    }

    static double asDouble(const ParameterValue& value) {
        return std::get<double>(value);
    }

    Parameter makeParameter(const std::string& name, DataType type, ByteOrder order,
                            uint16_t offset = 0) {
        Parameter parameter;
        parameter.name = name;
        parameter.data_type = type;
        parameter.byte_order = order;
        parameter.register_offset = offset;
        parameter.word_count = word_width(type);
        return parameter;
    }
};

// ============================================================================
// Byte Order Tests
// ============================================================================

TEST_F(RegisterCodecTest, Decode_Uint32WordOrders_GiveDistinctValues) {
    std::vector<RegisterValue> words = {0x0042, 0x1234};

    EXPECT_EQ(asInt(RegisterCodec::decode(words, 0, DataType::UINT32, ByteOrder::ABCD)), 0x00421234);
    EXPECT_EQ(asInt(RegisterCodec::decode(words, 0, DataType::UINT32, ByteOrder::CDAB)), 0x12340042);
    EXPECT_EQ(asInt(RegisterCodec::decode(words, 0, DataType::UINT32, ByteOrder::BADC)), 0x42003412);
    EXPECT_EQ(asInt(RegisterCodec::decode(words, 0, DataType::UINT32, ByteOrder::DCBA)), 0x34124200);
}

TEST_F(RegisterCodecTest, DecodeThenEncode_SameOrder_ReturnsOriginalWords) {
    std::vector<RegisterValue> words = {0x0042, 0x1234};

    for (ByteOrder order : wide_orders_) {
        ParameterValue value = RegisterCodec::decode(words, 0, DataType::UINT32, order);
        EXPECT_EQ(RegisterCodec::encode(value, DataType::UINT32, order), words)
            << "order " << to_string(order);
    }
}

TEST_F(RegisterCodecTest, Encode_Float32One_ArrangesBytesPerOrder) {
    // 1.0f is 0x3F800000
    EXPECT_THAT(RegisterCodec::encode(1.0, DataType::FLOAT32, ByteOrder::ABCD), ElementsAre(0x3F80, 0x0000));
    EXPECT_THAT(RegisterCodec::encode(1.0, DataType::FLOAT32, ByteOrder::CDAB), ElementsAre(0x0000, 0x3F80));
    EXPECT_THAT(RegisterCodec::encode(1.0, DataType::FLOAT32, ByteOrder::BADC), ElementsAre(0x803F, 0x0000));
    EXPECT_THAT(RegisterCodec::encode(1.0, DataType::FLOAT32, ByteOrder::DCBA), ElementsAre(0x0000, 0x803F));
}

TEST_F(RegisterCodecTest, Reorder_Float64Cdab_SwapsThirtyTwoBitHalves) {
    std::vector<RegisterValue> words = {0x1111, 0x2222, 0x3333, 0x4444};
    EXPECT_THAT(RegisterCodec::reorder(words, ByteOrder::CDAB), ElementsAre(0x3333, 0x4444, 0x1111, 0x2222));
    EXPECT_THAT(RegisterCodec::reorder(words, ByteOrder::DCBA), ElementsAre(0x4444, 0x3333, 0x2222, 0x1111));
}

TEST_F(RegisterCodecTest, Decode_SixteenBitBa_SwapsBytes) {
    EXPECT_EQ(asInt(RegisterCodec::decode({0x1234}, 0, DataType::UINT16, ByteOrder::BA)), 0x3412);
    EXPECT_EQ(asInt(RegisterCodec::decode({0x1234}, 0, DataType::UINT16, ByteOrder::AB)), 0x1234);
}

TEST_F(RegisterCodecTest, Decode_OrderNotMatchingWidth_ThrowsInvalidByteOrder) {
    EXPECT_THROW(RegisterCodec::decode({0x0001}, 0, DataType::UINT16, ByteOrder::ABCD),
                 InvalidByteOrderException);
    EXPECT_THROW(RegisterCodec::decode({0x0001, 0x0002}, 0, DataType::INT32, ByteOrder::AB),
                 InvalidByteOrderException);
    EXPECT_THROW(RegisterCodec::encode(1.5, DataType::FLOAT64, ByteOrder::BA),
                 InvalidByteOrderException);

    try {
        RegisterCodec::decode({0x0001}, 0, DataType::INT16, ByteOrder::CDAB);
        FAIL() << "Expected InvalidByteOrderException";
    } catch (const RegBridgeException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_BYTE_ORDER);
    }
}

// ============================================================================
// Round Trip Tests
// ============================================================================

TEST_F(RegisterCodecTest, RoundTrip_WideTypesInEveryOrder_PreservesValue) {
    for (ByteOrder order : wide_orders_) {
        SCOPED_TRACE(to_string(order));

        auto int32_words = RegisterCodec::encode(int64_t{-123456789}, DataType::INT32, order);
        EXPECT_EQ(asInt(RegisterCodec::decode(int32_words, 0, DataType::INT32, order)), -123456789);

        auto uint32_words = RegisterCodec::encode(int64_t{4000000000}, DataType::UINT32, order);
        EXPECT_EQ(asInt(RegisterCodec::decode(uint32_words, 0, DataType::UINT32, order)), 4000000000);

        auto float_words = RegisterCodec::encode(-12.375, DataType::FLOAT32, order);
        EXPECT_EQ(asDouble(RegisterCodec::decode(float_words, 0, DataType::FLOAT32, order)), -12.375);

        auto double_words = RegisterCodec::encode(3.141592653589793, DataType::FLOAT64, order);
        ASSERT_EQ(double_words.size(), 4u);
        EXPECT_EQ(asDouble(RegisterCodec::decode(double_words, 0, DataType::FLOAT64, order)),
                  3.141592653589793);
    }
}

TEST_F(RegisterCodecTest, RoundTrip_SixteenBitTypes_PreservesValue) {
    for (ByteOrder order : {ByteOrder::AB, ByteOrder::BA}) {
        SCOPED_TRACE(to_string(order));

        auto words = RegisterCodec::encode(int64_t{-1}, DataType::INT16, order);
        EXPECT_THAT(words, ElementsAre(0xFFFF));
        EXPECT_EQ(asInt(RegisterCodec::decode(words, 0, DataType::INT16, order)), -1);

        words = RegisterCodec::encode(int64_t{513}, DataType::UINT16, order);
        EXPECT_EQ(asInt(RegisterCodec::decode(words, 0, DataType::UINT16, order)), 513);

        words = RegisterCodec::encode(true, DataType::BOOL, order);
        EXPECT_TRUE(std::get<bool>(RegisterCodec::decode(words, 0, DataType::BOOL, order)));
    }
}

TEST_F(RegisterCodecTest, RoundTrip_ScaledInteger_EqualAfterScale) {
    auto words = RegisterCodec::encode(23.4, DataType::UINT16, ByteOrder::AB, 0.1);
    EXPECT_THAT(words, ElementsAre(234));
    EXPECT_NEAR(asDouble(RegisterCodec::decode(words, 0, DataType::UINT16, ByteOrder::AB, 0.1)), 23.4, 1e-9);

    words = RegisterCodec::encode(-1.5, DataType::INT32, ByteOrder::CDAB, 0.001);
    EXPECT_NEAR(asDouble(RegisterCodec::decode(words, 0, DataType::INT32, ByteOrder::CDAB, 0.001)), -1.5, 1e-9);
}

TEST_F(RegisterCodecTest, RoundTrip_String_HighByteFirst) {
    auto words = RegisterCodec::encode(std::string("AB12"), DataType::STRING, ByteOrder::AB, std::nullopt, std::nullopt, 4);
    EXPECT_THAT(words, ElementsAre(0x4142, 0x3132));

    auto text = RegisterCodec::decode(words, 0, DataType::STRING, ByteOrder::AB, std::nullopt, std::nullopt, 4);
    EXPECT_EQ(std::get<std::string>(text), "AB12");
}

TEST_F(RegisterCodecTest, Decode_StringWithPadding_StopsAtNul) {
    auto words = RegisterCodec::encode(std::string("AB"), DataType::STRING, ByteOrder::AB, std::nullopt, std::nullopt, 6);
    EXPECT_THAT(words, ElementsAre(0x4142, 0x0000, 0x0000));

    auto text = RegisterCodec::decode(words, 0, DataType::STRING, ByteOrder::AB, std::nullopt, std::nullopt, 6);
    EXPECT_EQ(std::get<std::string>(text), "AB");
}

// ============================================================================
// Range Tests
// ============================================================================

TEST_F(RegisterCodecTest, Encode_IntegerBoundaries_AcceptsLimits) {
    EXPECT_NO_THROW(RegisterCodec::encode(int64_t{-32768}, DataType::INT16, ByteOrder::AB));
    EXPECT_NO_THROW(RegisterCodec::encode(int64_t{32767}, DataType::INT16, ByteOrder::AB));
    EXPECT_NO_THROW(RegisterCodec::encode(int64_t{0}, DataType::UINT16, ByteOrder::AB));
    EXPECT_NO_THROW(RegisterCodec::encode(int64_t{65535}, DataType::UINT16, ByteOrder::AB));
    EXPECT_NO_THROW(RegisterCodec::encode(int64_t{-2147483648LL}, DataType::INT32, ByteOrder::ABCD));
    EXPECT_NO_THROW(RegisterCodec::encode(int64_t{2147483647LL}, DataType::INT32, ByteOrder::ABCD));
    EXPECT_NO_THROW(RegisterCodec::encode(int64_t{0}, DataType::UINT32, ByteOrder::ABCD));
    EXPECT_NO_THROW(RegisterCodec::encode(int64_t{4294967295LL}, DataType::UINT32, ByteOrder::ABCD));
}

TEST_F(RegisterCodecTest, Encode_IntegerBoundariesPlusMinusOne_ThrowsValueOutOfRange) {
    EXPECT_THROW(RegisterCodec::encode(int64_t{-32769}, DataType::INT16, ByteOrder::AB), ValueOutOfRangeException);
    EXPECT_THROW(RegisterCodec::encode(int64_t{32768}, DataType::INT16, ByteOrder::AB), ValueOutOfRangeException);
    EXPECT_THROW(RegisterCodec::encode(int64_t{-1}, DataType::UINT16, ByteOrder::AB), ValueOutOfRangeException);
    EXPECT_THROW(RegisterCodec::encode(int64_t{65536}, DataType::UINT16, ByteOrder::AB), ValueOutOfRangeException);
    EXPECT_THROW(RegisterCodec::encode(int64_t{-2147483649LL}, DataType::INT32, ByteOrder::ABCD), ValueOutOfRangeException);
    EXPECT_THROW(RegisterCodec::encode(int64_t{2147483648LL}, DataType::INT32, ByteOrder::ABCD), ValueOutOfRangeException);
    EXPECT_THROW(RegisterCodec::encode(int64_t{-1}, DataType::UINT32, ByteOrder::ABCD), ValueOutOfRangeException);
    EXPECT_THROW(RegisterCodec::encode(int64_t{4294967296LL}, DataType::UINT32, ByteOrder::ABCD), ValueOutOfRangeException);
}

TEST_F(RegisterCodecTest, Encode_ScaledValueOutsideRawRange_ThrowsValueOutOfRange) {
    // 6553.6 / 0.1 = 65536 raw
    EXPECT_THROW(RegisterCodec::encode(6553.6, DataType::UINT16, ByteOrder::AB, 0.1), ValueOutOfRangeException);
    EXPECT_NO_THROW(RegisterCodec::encode(6553.5, DataType::UINT16, ByteOrder::AB, 0.1));
}

TEST_F(RegisterCodecTest, Encode_NonFiniteFloat_ThrowsValueOutOfRange) {
    EXPECT_THROW(RegisterCodec::encode(std::numeric_limits<double>::quiet_NaN(), DataType::FLOAT32, ByteOrder::ABCD),
                 ValueOutOfRangeException);
    EXPECT_THROW(RegisterCodec::encode(std::numeric_limits<double>::infinity(), DataType::FLOAT64, ByteOrder::ABCD),
                 ValueOutOfRangeException);
    EXPECT_THROW(RegisterCodec::encode(1e39, DataType::FLOAT32, ByteOrder::ABCD), ValueOutOfRangeException);
}

TEST_F(RegisterCodecTest, Encode_WrongValueKind_ThrowsValueOutOfRange) {
    EXPECT_THROW(RegisterCodec::encode(std::string("12"), DataType::UINT16, ByteOrder::AB), ValueOutOfRangeException);
    EXPECT_THROW(RegisterCodec::encode(int64_t{12}, DataType::STRING, ByteOrder::AB), ValueOutOfRangeException);
    EXPECT_THROW(RegisterCodec::encode(std::monostate{}, DataType::FLOAT32, ByteOrder::ABCD), ValueOutOfRangeException);
}

TEST_F(RegisterCodecTest, Encode_StringLongerThanDeclared_ThrowsValueOutOfRange) {
    EXPECT_THROW(RegisterCodec::encode(std::string("ABCDE"), DataType::STRING, ByteOrder::AB, std::nullopt, 4),
                 ValueOutOfRangeException);
}

TEST_F(RegisterCodecTest, Encode_ZeroScale_ThrowsValueOutOfRange) {
    EXPECT_THROW(RegisterCodec::encode(1.0, DataType::UINT16, ByteOrder::AB, 0.0), ValueOutOfRangeException);
}

// ============================================================================
// Decode Edge Cases
// ============================================================================

TEST_F(RegisterCodecTest, Decode_NotEnoughWords_ThrowsValidation) {
    EXPECT_THROW(RegisterCodec::decode({0x0001}, 0, DataType::UINT32, ByteOrder::ABCD), ValidationException);
    EXPECT_THROW(RegisterCodec::decode({0x0001, 0x0002}, 1, DataType::FLOAT32, ByteOrder::ABCD), ValidationException);
    EXPECT_THROW(RegisterCodec::decode({0x4142}, 0, DataType::STRING, ByteOrder::AB, std::nullopt, std::nullopt, 4),
                 ValidationException);
}

TEST_F(RegisterCodecTest, Decode_SignedOverride_ChangesInterpretation) {
    EXPECT_EQ(asInt(RegisterCodec::decode({0xFFFF}, 0, DataType::UINT16, ByteOrder::AB, std::nullopt, true)), -1);
    EXPECT_EQ(asInt(RegisterCodec::decode({0xFFFF}, 0, DataType::INT16, ByteOrder::AB, std::nullopt, false)), 65535);
    EXPECT_EQ(asInt(RegisterCodec::decode({0xFFFF}, 0, DataType::INT16, ByteOrder::AB)), -1);
}

TEST_F(RegisterCodecTest, EncodeParameter_SignedOverride_AcceptsWhatDecodeReturns) {
    Parameter as_signed = makeParameter("offset", DataType::UINT16, ByteOrder::AB);
    as_signed.is_signed = true;
    ParameterValue minus_one = RegisterCodec::decodeParameter({0xFFFF}, as_signed);
    EXPECT_EQ(asInt(minus_one), -1);
    EXPECT_THAT(RegisterCodec::encodeParameter(minus_one, as_signed), ElementsAre(0xFFFF));
    EXPECT_THROW(RegisterCodec::encodeParameter(int64_t{40000}, as_signed), ValueOutOfRangeException);

    Parameter as_unsigned = makeParameter("setpoint", DataType::INT16, ByteOrder::AB);
    as_unsigned.is_signed = false;
    ParameterValue large = RegisterCodec::decodeParameter({0x9C40}, as_unsigned);
    EXPECT_EQ(asInt(large), 40000);
    EXPECT_THAT(RegisterCodec::encodeParameter(large, as_unsigned), ElementsAre(0x9C40));
    EXPECT_THROW(RegisterCodec::encodeParameter(int64_t{-1}, as_unsigned), ValueOutOfRangeException);
}

TEST_F(RegisterCodecTest, Encode_UnsignedInt32Override_UsesFullRange) {
    auto words = RegisterCodec::encode(int64_t{4000000000}, DataType::INT32, ByteOrder::ABCD,
                                       std::nullopt, false);
    EXPECT_EQ(asInt(RegisterCodec::decode(words, 0, DataType::INT32, ByteOrder::ABCD, std::nullopt, false)),
              4000000000);
}

TEST_F(RegisterCodecTest, Decode_OffsetIntoBlock_ReadsThatWord) {
    std::vector<RegisterValue> words = {0x0001, 0x0002, 0x0003};
    EXPECT_EQ(asInt(RegisterCodec::decode(words, 2, DataType::UINT16, ByteOrder::AB)), 3);
}

TEST_F(RegisterCodecTest, DecodeParameter_WithDecimals_RoundsValue) {
    Parameter parameter = makeParameter("frequency", DataType::FLOAT32, ByteOrder::ABCD);
    parameter.decimals = 2;

    auto words = RegisterCodec::encode(1.23456, DataType::FLOAT32, ByteOrder::ABCD);
    EXPECT_DOUBLE_EQ(asDouble(RegisterCodec::decodeParameter(words, parameter)), 1.23);
}

TEST_F(RegisterCodecTest, DecodeParameter_StringWithoutLength_UsesWordCount) {
    Parameter parameter = makeParameter("serial", DataType::STRING, ByteOrder::AB, 1);
    parameter.word_count = 2;

    std::vector<RegisterValue> words = {0x0000, 0x5247, 0x3031, 0x5A5A};
    EXPECT_EQ(std::get<std::string>(RegisterCodec::decodeParameter(words, parameter)), "RG01");
}

TEST_F(RegisterCodecTest, RoundToDecimals_HalfAwayFromZero) {
    EXPECT_DOUBLE_EQ(RegisterCodec::roundToDecimals(2.5, 0), 3.0);
    EXPECT_DOUBLE_EQ(RegisterCodec::roundToDecimals(-2.5, 0), -3.0);
    EXPECT_DOUBLE_EQ(RegisterCodec::roundToDecimals(1.25, 1), 1.3);
}

TEST_F(RegisterCodecTest, ParameterWidth_FollowsTypeOrStringLength) {
    EXPECT_EQ(RegisterCodec::parameterWidth(makeParameter("a", DataType::FLOAT64, ByteOrder::ABCD)), 4);
    EXPECT_EQ(RegisterCodec::parameterWidth(makeParameter("b", DataType::BOOL, ByteOrder::AB)), 1);

    Parameter text = makeParameter("c", DataType::STRING, ByteOrder::AB);
    text.string_length = 5;
    EXPECT_EQ(RegisterCodec::parameterWidth(text), 3);
}
