/**
 * @file register_codec.hpp
 * @brief Conversion between Modbus register words and typed values
 * @author RegBridge Team
 * @date 2025-09-03
 */

#pragma once

#include "types.hpp"
#include "exceptions.hpp"
#include <vector>
#include <string>
#include <cstdint>
#include <optional>

namespace regBridge {

/**
 * @brief Stateless register word codec
 *
 * Multi-word values are arranged by the byte order before reinterpretation:
 * ABCD keeps the words, CDAB swaps the 32-bit halves (FLOAT64: the two
 * 32-bit groups), BADC swaps the bytes inside every word and DCBA reverses
 * the whole byte sequence. Floats are reinterpreted bit for bit, never
 * converted numerically.
 */
class RegisterCodec {
public:
    /**
     * @brief Decode a value from register words
     * @param words Register words as read from the device
     * @param offset Index of the first word of the value
     * @param type Data type to decode
     * @param order Byte order of the value
     * @param scale Optional multiplier applied to numeric values
     * @param is_signed Optional override of the type's signedness (integers only)
     * @param string_length Byte length of STRING values (default: all remaining words)
     * @return Decoded value (int64_t for unscaled integers, double for floats and scaled integers)
     * @throws InvalidByteOrderException if the order does not fit the type width
     * @throws ValidationException if the words do not cover the value
     */
    static ParameterValue decode(const std::vector<RegisterValue>& words,
                                 size_t offset,
                                 DataType type,
                                 ByteOrder order,
                                 std::optional<double> scale = std::nullopt,
                                 std::optional<bool> is_signed = std::nullopt,
                                 std::optional<uint16_t> string_length = std::nullopt);

    /**
     * @brief Encode a value into register words
     * @param value Value to encode
     * @param type Target data type
     * @param order Target byte order
     * @param scale Optional multiplier; the raw value is round(value / scale)
     * @param is_signed Optional override of the type's signedness; selects the accepted integer range
     * @param string_length Byte length of STRING values
     * @return Register words in device order
     * @throws InvalidByteOrderException if the order does not fit the type width
     * @throws ValueOutOfRangeException if the value cannot be represented
     */
    static std::vector<RegisterValue> encode(const ParameterValue& value,
                                             DataType type,
                                             ByteOrder order,
                                             std::optional<double> scale = std::nullopt,
                                             std::optional<bool> is_signed = std::nullopt,
                                             std::optional<uint16_t> string_length = std::nullopt);

    /**
     * @brief Decode a parameter at its offset and apply its decimal precision
     */
    static ParameterValue decodeParameter(const std::vector<RegisterValue>& words,
                                          const Parameter& parameter);

    /**
     * @brief Encode a value for a parameter
     */
    static std::vector<RegisterValue> encodeParameter(const ParameterValue& value,
                                                      const Parameter& parameter);

    /**
     * @brief Check that a byte order fits the data type width
     */
    static bool isValidByteOrder(DataType type, ByteOrder order);

    /**
     * @brief Throwing variant of isValidByteOrder
     * @throws InvalidByteOrderException
     */
    static void validateByteOrder(DataType type, ByteOrder order);

    /**
     * @brief Number of words a parameter occupies
     */
    static uint16_t parameterWidth(const Parameter& parameter);

    /**
     * @brief Round to a number of decimals, half away from zero
     */
    static double roundToDecimals(double value, int decimals);

    /**
     * @brief Apply a byte order to words in native (ABCD) arrangement
     *
     * Every ordering is its own inverse, so the same call converts device
     * words to native arrangement and back.
     */
    static std::vector<RegisterValue> reorder(const std::vector<RegisterValue>& words,
                                              ByteOrder order);

    static RegisterValue swapBytes(RegisterValue word) {
        return static_cast<RegisterValue>(((word & 0x00FF) << 8) | ((word & 0xFF00) >> 8));
    }

private:
    static uint64_t assembleWords(const std::vector<RegisterValue>& words);
    static std::vector<RegisterValue> splitWords(uint64_t raw, size_t count);
    static bool defaultSigned(DataType type);
    static std::string decodeString(const std::vector<RegisterValue>& words,
                                    size_t offset, size_t byte_length);
    static std::vector<RegisterValue> encodeString(const std::string& text, size_t byte_length);
    static double numericValue(const ParameterValue& value, DataType type);
};

} // namespace regBridge
