/*
 * ByteOrder.h - Little-endian field access on in-memory byte buffers
 * This file is part of LapCut.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef BYTEORDER_H
#define BYTEORDER_H

// No direct includes - all includes should be in lapcut.h

namespace LapCut {
namespace Core {
namespace Utility {

/**
 * @brief Read a little-endian integer at a fixed offset
 *
 * Every read is a pure function of (buffer, offset); there is no cursor.
 * Callers must have bounds-checked the offset; this throws std::out_of_range
 * only as a last line of defence.
 */
template<typename T>
T readLE(const uint8_t* data, size_t size, size_t offset) {
    static_assert(std::is_integral<T>::value, "readLE requires an integral type");
    if (offset > size || size - offset < sizeof(T)) {
        throw std::out_of_range("readLE past end of buffer at offset " + std::to_string(offset));
    }
    using U = typename std::make_unsigned<T>::type;
    U value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<U>(static_cast<U>(data[offset + i]) << (i * 8));
    }
    return static_cast<T>(value);
}

template<typename T>
T readLE(const std::vector<uint8_t>& data, size_t offset) {
    return readLE<T>(data.data(), data.size(), offset);
}

/**
 * @brief Overwrite a little-endian integer at a fixed offset
 */
template<typename T>
void writeLE(std::vector<uint8_t>& data, size_t offset, T value) {
    static_assert(std::is_integral<T>::value, "writeLE requires an integral type");
    if (offset > data.size() || data.size() - offset < sizeof(T)) {
        throw std::out_of_range("writeLE past end of buffer at offset " + std::to_string(offset));
    }
    using U = typename std::make_unsigned<T>::type;
    U bits = static_cast<U>(value);
    for (size_t i = 0; i < sizeof(T); ++i) {
        data[offset + i] = static_cast<uint8_t>((bits >> (i * 8)) & 0xFF);
    }
}

/**
 * @brief Append a little-endian integer
 */
template<typename T>
void appendLE(std::vector<uint8_t>& data, T value) {
    size_t offset = data.size();
    data.resize(offset + sizeof(T));
    writeLE<T>(data, offset, value);
}

inline float floatFromBits(uint32_t bits) {
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

inline uint32_t floatToBits(float value) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return bits;
}

/**
 * @brief Decode an IEEE 754 binary16 value
 */
inline float halfToFloat(uint16_t half) {
    uint32_t sign = static_cast<uint32_t>(half & 0x8000) << 16;
    uint32_t exponent = (half >> 10) & 0x1F;
    uint32_t mantissa = half & 0x3FF;

    if (exponent == 0) {
        if (mantissa == 0) {
            return floatFromBits(sign);
        }
        // Subnormal: value = mantissa * 2^-24
        float value = std::ldexp(static_cast<float>(mantissa), -24);
        return sign ? -value : value;
    }
    if (exponent == 0x1F) {
        return floatFromBits(sign | 0x7F800000u | (mantissa << 13));
    }
    return floatFromBits(sign | ((exponent + 112) << 23) | (mantissa << 13));
}

/**
 * @brief Read a fixed-width NUL padded string field
 *
 * Decodes up to the first NUL or the field width, whichever comes first.
 */
inline std::string readFixedString(const std::vector<uint8_t>& data, size_t offset, size_t width) {
    if (offset > data.size() || data.size() - offset < width) {
        throw std::out_of_range("readFixedString past end of buffer at offset " + std::to_string(offset));
    }
    const char* begin = reinterpret_cast<const char*>(data.data() + offset);
    size_t length = 0;
    while (length < width && begin[length] != '\0') {
        ++length;
    }
    return std::string(begin, length);
}

/**
 * @brief Write a fixed-width string field, truncating and NUL padding
 */
inline void writeFixedString(std::vector<uint8_t>& data, size_t offset, size_t width, const std::string& value) {
    if (offset > data.size() || data.size() - offset < width) {
        throw std::out_of_range("writeFixedString past end of buffer at offset " + std::to_string(offset));
    }
    size_t count = std::min(width, value.size());
    std::memcpy(data.data() + offset, value.data(), count);
    std::memset(data.data() + offset + count, 0, width - count);
}

} // namespace Utility
} // namespace Core
} // namespace LapCut

#endif // BYTEORDER_H
