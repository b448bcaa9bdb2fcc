/**
 * @file register_codec.cpp
 * @brief Implementation of the register word codec
 * @author RegBridge Team
 * @date 2025-09-03
 */

#include "register_codec.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

namespace regBridge {

namespace {

struct IntegerLimits {
    double min;
    double max;
};

IntegerLimits integerLimits(size_t width, bool is_signed) {
    if (width == 1) {
        return is_signed
            ? IntegerLimits{static_cast<double>(std::numeric_limits<int16_t>::min()),
                            static_cast<double>(std::numeric_limits<int16_t>::max())}
            : IntegerLimits{0.0, static_cast<double>(std::numeric_limits<uint16_t>::max())};
    }
    return is_signed
        ? IntegerLimits{static_cast<double>(std::numeric_limits<int32_t>::min()),
                        static_cast<double>(std::numeric_limits<int32_t>::max())}
        : IntegerLimits{0.0, static_cast<double>(std::numeric_limits<uint32_t>::max())};
}

bool isScaled(const std::optional<double>& scale) {
    return scale.has_value() && *scale != 1.0;
}

} // namespace

bool RegisterCodec::isValidByteOrder(DataType type, ByteOrder order) {
    if (type == DataType::STRING) {
        return true;
    }
    bool sixteen_bit_order = order == ByteOrder::AB || order == ByteOrder::BA;
    return word_width(type) == 1 ? sixteen_bit_order : !sixteen_bit_order;
}

void RegisterCodec::validateByteOrder(DataType type, ByteOrder order) {
    if (!isValidByteOrder(type, order)) {
        throw InvalidByteOrderException(order, type);
    }
}

uint16_t RegisterCodec::parameterWidth(const Parameter& parameter) {
    if (parameter.data_type == DataType::STRING) {
        if (parameter.string_length) {
            return static_cast<uint16_t>((*parameter.string_length + 1) / 2);
        }
        return parameter.word_count;
    }
    return word_width(parameter.data_type);
}

double RegisterCodec::roundToDecimals(double value, int decimals) {
    if (decimals < 0 || !std::isfinite(value)) {
        return value;
    }
    double factor = std::pow(10.0, std::min(decimals, 15));
    return std::round(value * factor) / factor;
}

std::vector<RegisterValue> RegisterCodec::reorder(const std::vector<RegisterValue>& words,
                                                  ByteOrder order) {
    std::vector<RegisterValue> result(words);

    switch (order) {
        case ByteOrder::AB:
        case ByteOrder::ABCD:
            break;

        case ByteOrder::BA:
        case ByteOrder::BADC:
            std::transform(result.begin(), result.end(), result.begin(), swapBytes);
            break;

        case ByteOrder::CDAB: {
            // Swap the two halves: [w1, w0] for 32-bit, [w2, w3, w0, w1] for 64-bit
            size_t half = result.size() / 2;
            std::rotate(result.begin(), result.begin() + static_cast<long>(half), result.end());
            break;
        }

        case ByteOrder::DCBA:
            std::reverse(result.begin(), result.end());
            std::transform(result.begin(), result.end(), result.begin(), swapBytes);
            break;
    }

    return result;
}

ParameterValue RegisterCodec::decode(const std::vector<RegisterValue>& words,
                                     size_t offset,
                                     DataType type,
                                     ByteOrder order,
                                     std::optional<double> scale,
                                     std::optional<bool> is_signed,
                                     std::optional<uint16_t> string_length) {
    validateByteOrder(type, order);

    if (offset > words.size()) {
        throw ValidationException("Offset " + std::to_string(offset) +
                                  " is beyond " + std::to_string(words.size()) + " words");
    }

    if (type == DataType::STRING) {
        size_t byte_length = string_length ? *string_length : (words.size() - offset) * 2;
        size_t needed = (byte_length + 1) / 2;
        if (offset + needed > words.size()) {
            throw ValidationException("STRING of " + std::to_string(byte_length) +
                                      " bytes at offset " + std::to_string(offset) +
                                      " exceeds " + std::to_string(words.size()) + " words");
        }
        return decodeString(words, offset, byte_length);
    }

    size_t width = word_width(type);
    if (offset + width > words.size()) {
        throw ValidationException(to_string(type) + " at offset " + std::to_string(offset) +
                                  " needs " + std::to_string(width) + " words, only " +
                                  std::to_string(words.size() - offset) + " available");
    }

    std::vector<RegisterValue> slice(words.begin() + static_cast<long>(offset),
                                     words.begin() + static_cast<long>(offset + width));
    uint64_t raw = assembleWords(reorder(slice, order));

    switch (type) {
        case DataType::BOOL:
            return raw != 0;

        case DataType::INT16:
        case DataType::UINT16:
        case DataType::INT32:
        case DataType::UINT32: {
            unsigned bits = static_cast<unsigned>(width * 16);
            int64_t value = static_cast<int64_t>(raw);
            if (is_signed.value_or(defaultSigned(type)) && (raw & (uint64_t{1} << (bits - 1)))) {
                value -= static_cast<int64_t>(uint64_t{1} << bits);
            }
            if (isScaled(scale)) {
                return static_cast<double>(value) * *scale;
            }
            return value;
        }

        case DataType::FLOAT32: {
            uint32_t bits = static_cast<uint32_t>(raw);
            float f;
            std::memcpy(&f, &bits, sizeof(f));
            double value = static_cast<double>(f);
            return isScaled(scale) ? value * *scale : value;
        }

        case DataType::FLOAT64: {
            double value;
            std::memcpy(&value, &raw, sizeof(value));
            return isScaled(scale) ? value * *scale : value;
        }

        default:
            throw ValidationException("Unsupported data type " + to_string(type));
    }
}

std::vector<RegisterValue> RegisterCodec::encode(const ParameterValue& value,
                                                 DataType type,
                                                 ByteOrder order,
                                                 std::optional<double> scale,
                                                 std::optional<bool> is_signed,
                                                 std::optional<uint16_t> string_length) {
    validateByteOrder(type, order);

    if (type == DataType::STRING) {
        if (!std::holds_alternative<std::string>(value)) {
            throw ValueOutOfRangeException("STRING requires a text value, got " + to_string(value));
        }
        const auto& text = std::get<std::string>(value);
        size_t byte_length = string_length ? *string_length : text.size() + (text.size() % 2);
        return encodeString(text, byte_length);
    }

    size_t width = word_width(type);
    double numeric = numericValue(value, type);
    if (isScaled(scale)) {
        if (*scale == 0.0) {
            throw ValueOutOfRangeException("Scale factor of 0 cannot be inverted");
        }
        numeric /= *scale;
    }

    uint64_t raw = 0;
    switch (type) {
        case DataType::BOOL:
            raw = numeric != 0.0 ? 1 : 0;
            break;

        case DataType::INT16:
        case DataType::UINT16:
        case DataType::INT32:
        case DataType::UINT32: {
            if (!std::isfinite(numeric)) {
                throw ValueOutOfRangeException(to_string(value) + " is not a finite number");
            }
            double rounded = std::round(numeric);
            bool effective_signed = is_signed.value_or(defaultSigned(type));
            IntegerLimits limits = integerLimits(width, effective_signed);
            if (rounded < limits.min || rounded > limits.max) {
                throw ValueOutOfRangeException(to_string(value) + " does not fit " +
                                               (effective_signed ? "signed " : "unsigned ") +
                                               to_string(type));
            }
            uint64_t mask = (uint64_t{1} << (width * 16)) - 1;
            raw = static_cast<uint64_t>(static_cast<int64_t>(rounded)) & mask;
            break;
        }

        case DataType::FLOAT32: {
            if (!std::isfinite(numeric) ||
                std::fabs(numeric) > static_cast<double>(std::numeric_limits<float>::max())) {
                throw ValueOutOfRangeException(to_string(value) + " does not fit FLOAT32");
            }
            float f = static_cast<float>(numeric);
            uint32_t bits;
            std::memcpy(&bits, &f, sizeof(bits));
            raw = bits;
            break;
        }

        case DataType::FLOAT64: {
            if (!std::isfinite(numeric)) {
                throw ValueOutOfRangeException(to_string(value) + " is not a finite number");
            }
            std::memcpy(&raw, &numeric, sizeof(raw));
            break;
        }

        default:
            throw ValidationException("Unsupported data type " + to_string(type));
    }

    return reorder(splitWords(raw, width), order);
}

ParameterValue RegisterCodec::decodeParameter(const std::vector<RegisterValue>& words,
                                              const Parameter& parameter) {
    std::optional<uint16_t> string_length = parameter.string_length;
    if (parameter.data_type == DataType::STRING && !string_length) {
        string_length = static_cast<uint16_t>(parameter.word_count * 2);
    }

    ParameterValue value = decode(words, parameter.register_offset, parameter.data_type,
                                  parameter.byte_order, parameter.scale, parameter.is_signed,
                                  string_length);

    if (parameter.decimals && std::holds_alternative<double>(value)) {
        value = roundToDecimals(std::get<double>(value), *parameter.decimals);
    }
    return value;
}

std::vector<RegisterValue> RegisterCodec::encodeParameter(const ParameterValue& value,
                                                          const Parameter& parameter) {
    std::optional<uint16_t> string_length = parameter.string_length;
    if (parameter.data_type == DataType::STRING && !string_length) {
        string_length = static_cast<uint16_t>(parameter.word_count * 2);
    }
    return encode(value, parameter.data_type, parameter.byte_order, parameter.scale,
                  parameter.is_signed, string_length);
}

uint64_t RegisterCodec::assembleWords(const std::vector<RegisterValue>& words) {
    uint64_t raw = 0;
    for (RegisterValue word : words) {
        raw = (raw << 16) | word;
    }
    return raw;
}

std::vector<RegisterValue> RegisterCodec::splitWords(uint64_t raw, size_t count) {
    std::vector<RegisterValue> words(count);
    for (size_t i = 0; i < count; ++i) {
        words[count - 1 - i] = static_cast<RegisterValue>(raw & 0xFFFF);
        raw >>= 16;
    }
    return words;
}

bool RegisterCodec::defaultSigned(DataType type) {
    return type == DataType::INT16 || type == DataType::INT32;
}

std::string RegisterCodec::decodeString(const std::vector<RegisterValue>& words,
                                        size_t offset, size_t byte_length) {
    std::string text;
    text.reserve(byte_length);
    for (size_t i = 0; i < byte_length; ++i) {
        RegisterValue word = words[offset + i / 2];
        char c = static_cast<char>(i % 2 == 0 ? (word >> 8) & 0xFF : word & 0xFF);
        if (c == '\0') {
            break;
        }
        text.push_back(c);
    }
    return text;
}

std::vector<RegisterValue> RegisterCodec::encodeString(const std::string& text, size_t byte_length) {
    if (text.size() > byte_length) {
        throw ValueOutOfRangeException("String of " + std::to_string(text.size()) +
                                       " bytes exceeds declared length " + std::to_string(byte_length));
    }

    std::vector<RegisterValue> words((byte_length + 1) / 2, 0);
    for (size_t i = 0; i < text.size(); ++i) {
        auto byte = static_cast<RegisterValue>(static_cast<unsigned char>(text[i]));
        words[i / 2] |= (i % 2 == 0) ? static_cast<RegisterValue>(byte << 8) : byte;
    }
    return words;
}

double RegisterCodec::numericValue(const ParameterValue& value, DataType type) {
    if (std::holds_alternative<bool>(value)) {
        return std::get<bool>(value) ? 1.0 : 0.0;
    }
    if (std::holds_alternative<int64_t>(value)) {
        return static_cast<double>(std::get<int64_t>(value));
    }
    if (std::holds_alternative<double>(value)) {
        return std::get<double>(value);
    }
    throw ValueOutOfRangeException(to_string(type) + " requires a numeric value, got '" +
                                   to_string(value) + "'");
}

} // namespace regBridge
