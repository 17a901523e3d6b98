/*
 * Channel.cpp - Channel catalog records and typed sample buffers
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "lapcut.h"

namespace LapCut {
namespace Telemetry {

using namespace LDFormat;
using Core::TelemetryError;
using Core::TelemetryException;
using Core::Utility::readLE;
using Core::Utility::writeLE;
using Core::Utility::readFixedString;
using Core::Utility::writeFixedString;
using Core::Utility::floatFromBits;
using Core::Utility::floatToBits;

const char* sampleTypeName(SampleType type) {
    switch (type) {
        case SampleType::INT16:   return "int16";
        case SampleType::INT32:   return "int32";
        case SampleType::FLOAT16: return "float16";
        case SampleType::FLOAT32: return "float32";
    }
    return "unknown";
}

size_t sampleWidth(SampleType type) {
    switch (type) {
        case SampleType::INT16:
        case SampleType::FLOAT16:
            return 2;
        case SampleType::INT32:
        case SampleType::FLOAT32:
            return 4;
    }
    return 0;
}

SampleType sampleTypeFromCode(uint16_t type_class, uint16_t width, uint64_t record_offset) {
    if (type_class == TYPE_CLASS_FLOAT) {
        if (width == 2) return SampleType::FLOAT16;
        if (width == 4) return SampleType::FLOAT32;
    } else if (type_class == TYPE_CLASS_INT_0 || type_class == TYPE_CLASS_INT_3 ||
               type_class == TYPE_CLASS_INT_5) {
        if (width == 2) return SampleType::INT16;
        if (width == 4) return SampleType::INT32;
    }

    std::ostringstream code;
    code << "class 0x" << std::hex << type_class << std::dec << " width " << width;
    throw TelemetryException(TelemetryError::UNKNOWN_DATA_TYPE, "unsupported channel data type")
        .at(record_offset + CH_TYPE_CLASS)
        .expected("float16, float32, int16 or int32")
        .actual(code.str());
}

// ========== ChannelDescriptor ==========

ChannelDescriptor::ChannelDescriptor(std::vector<uint8_t> raw, uint64_t record_offset)
    : m_raw(std::move(raw)), m_type(SampleType::INT16) {
    if (m_raw.size() != CHANNEL_RECORD_SIZE) {
        throw std::invalid_argument("Channel record must be " + std::to_string(CHANNEL_RECORD_SIZE) +
                                    " bytes, got " + std::to_string(m_raw.size()));
    }
    m_type = sampleTypeFromCode(typeClass(), width(), record_offset);
}

ChannelDescriptor ChannelDescriptor::create(const std::string& name, const std::string& short_name,
                                            const std::string& unit, SampleType type,
                                            uint16_t frequency, int16_t shift, int16_t mul,
                                            int16_t scale, int16_t dec) {
    std::vector<uint8_t> raw(CHANNEL_RECORD_SIZE, 0);
    bool is_float = (type == SampleType::FLOAT16 || type == SampleType::FLOAT32);
    writeLE<uint16_t>(raw, CH_TYPE_CLASS, is_float ? TYPE_CLASS_FLOAT : TYPE_CLASS_INT_3);
    writeLE<uint16_t>(raw, CH_WIDTH, static_cast<uint16_t>(sampleWidth(type)));
    writeLE<uint16_t>(raw, CH_FREQUENCY, frequency);
    writeLE<int16_t>(raw, CH_SHIFT, shift);
    writeLE<int16_t>(raw, CH_MUL, mul);
    writeLE<int16_t>(raw, CH_SCALE, scale);
    writeLE<int16_t>(raw, CH_DEC, dec);
    writeFixedString(raw, CH_NAME, CH_NAME_WIDTH, name);
    writeFixedString(raw, CH_SHORT_NAME, CH_SHORT_NAME_WIDTH, short_name);
    writeFixedString(raw, CH_UNIT, CH_UNIT_WIDTH, unit);
    return ChannelDescriptor(std::move(raw));
}

uint32_t ChannelDescriptor::prevPtr() const { return readLE<uint32_t>(m_raw, CH_PREV_PTR); }
uint32_t ChannelDescriptor::nextPtr() const { return readLE<uint32_t>(m_raw, CH_NEXT_PTR); }
uint32_t ChannelDescriptor::dataPtr() const { return readLE<uint32_t>(m_raw, CH_DATA_PTR); }
uint32_t ChannelDescriptor::sampleCount() const { return readLE<uint32_t>(m_raw, CH_SAMPLE_COUNT); }
uint16_t ChannelDescriptor::counter() const { return readLE<uint16_t>(m_raw, CH_COUNTER); }
uint16_t ChannelDescriptor::typeClass() const { return readLE<uint16_t>(m_raw, CH_TYPE_CLASS); }
uint16_t ChannelDescriptor::width() const { return readLE<uint16_t>(m_raw, CH_WIDTH); }
uint16_t ChannelDescriptor::frequency() const { return readLE<uint16_t>(m_raw, CH_FREQUENCY); }
int16_t ChannelDescriptor::shift() const { return readLE<int16_t>(m_raw, CH_SHIFT); }
int16_t ChannelDescriptor::mul() const { return readLE<int16_t>(m_raw, CH_MUL); }
int16_t ChannelDescriptor::scale() const { return readLE<int16_t>(m_raw, CH_SCALE); }
int16_t ChannelDescriptor::dec() const { return readLE<int16_t>(m_raw, CH_DEC); }

std::string ChannelDescriptor::name() const { return readFixedString(m_raw, CH_NAME, CH_NAME_WIDTH); }
std::string ChannelDescriptor::shortName() const {
    return readFixedString(m_raw, CH_SHORT_NAME, CH_SHORT_NAME_WIDTH);
}
std::string ChannelDescriptor::unit() const { return readFixedString(m_raw, CH_UNIT, CH_UNIT_WIDTH); }

double ChannelDescriptor::toPhysical(double raw_value) const {
    double divisor = scale() == 0 ? 1.0 : static_cast<double>(scale());
    return (raw_value / divisor * std::pow(10.0, -dec()) + shift()) * mul();
}

void ChannelDescriptor::setLinks(uint32_t prev_ptr, uint32_t next_ptr) {
    writeLE<uint32_t>(m_raw, CH_PREV_PTR, prev_ptr);
    writeLE<uint32_t>(m_raw, CH_NEXT_PTR, next_ptr);
}

void ChannelDescriptor::setDataPtr(uint32_t ptr) { writeLE<uint32_t>(m_raw, CH_DATA_PTR, ptr); }
void ChannelDescriptor::setSampleCount(uint32_t count) { writeLE<uint32_t>(m_raw, CH_SAMPLE_COUNT, count); }

// ========== ChannelBuffer ==========

ChannelBuffer::ChannelBuffer() : m_storage(std::vector<int16_t>()) {
}

ChannelBuffer::ChannelBuffer(std::vector<int16_t> samples) : m_storage(std::move(samples)) {
}

ChannelBuffer::ChannelBuffer(std::vector<int32_t> samples) : m_storage(std::move(samples)) {
}

ChannelBuffer::ChannelBuffer(std::vector<Half> samples) : m_storage(std::move(samples)) {
}

ChannelBuffer::ChannelBuffer(std::vector<float> samples) : m_storage(std::move(samples)) {
}

ChannelBuffer ChannelBuffer::decode(SampleType type, const uint8_t* data, size_t count) {
    size_t size = count * sampleWidth(type);

    switch (type) {
        case SampleType::INT16: {
            std::vector<int16_t> samples(count);
            for (size_t i = 0; i < count; ++i) {
                samples[i] = readLE<int16_t>(data, size, i * 2);
            }
            return ChannelBuffer(std::move(samples));
        }
        case SampleType::INT32: {
            std::vector<int32_t> samples(count);
            for (size_t i = 0; i < count; ++i) {
                samples[i] = readLE<int32_t>(data, size, i * 4);
            }
            return ChannelBuffer(std::move(samples));
        }
        case SampleType::FLOAT16: {
            std::vector<Half> samples(count);
            for (size_t i = 0; i < count; ++i) {
                samples[i].bits = readLE<uint16_t>(data, size, i * 2);
            }
            return ChannelBuffer(std::move(samples));
        }
        case SampleType::FLOAT32: {
            std::vector<float> samples(count);
            for (size_t i = 0; i < count; ++i) {
                samples[i] = floatFromBits(readLE<uint32_t>(data, size, i * 4));
            }
            return ChannelBuffer(std::move(samples));
        }
    }
    throw std::invalid_argument("Unknown sample type");
}

void ChannelBuffer::encode(std::vector<uint8_t>& out) const {
    out.reserve(out.size() + byteLength());

    if (auto* ints16 = std::get_if<std::vector<int16_t>>(&m_storage)) {
        for (int16_t v : *ints16) Core::Utility::appendLE<int16_t>(out, v);
    } else if (auto* ints32 = std::get_if<std::vector<int32_t>>(&m_storage)) {
        for (int32_t v : *ints32) Core::Utility::appendLE<int32_t>(out, v);
    } else if (auto* halves = std::get_if<std::vector<Half>>(&m_storage)) {
        for (const Half& v : *halves) Core::Utility::appendLE<uint16_t>(out, v.bits);
    } else {
        for (float v : std::get<std::vector<float>>(m_storage)) {
            Core::Utility::appendLE<uint32_t>(out, floatToBits(v));
        }
    }
}

SampleType ChannelBuffer::type() const {
    switch (m_storage.index()) {
        case 0: return SampleType::INT16;
        case 1: return SampleType::INT32;
        case 2: return SampleType::FLOAT16;
        default: return SampleType::FLOAT32;
    }
}

size_t ChannelBuffer::size() const {
    return std::visit([](const auto& samples) { return samples.size(); }, m_storage);
}

double ChannelBuffer::value(size_t i) const {
    if (i >= size()) {
        throw std::out_of_range("Sample index " + std::to_string(i) + " out of range (size " +
                                std::to_string(size()) + ")");
    }

    return std::visit([i](const auto& samples) -> double {
        using T = typename std::decay_t<decltype(samples)>::value_type;
        if constexpr (std::is_same<T, Half>::value) {
            return samples[i].toFloat();
        } else {
            return static_cast<double>(samples[i]);
        }
    }, m_storage);
}

ChannelBuffer ChannelBuffer::slice(size_t begin, size_t end) const {
    if (begin > end || end > size()) {
        throw std::out_of_range("Slice [" + std::to_string(begin) + ", " + std::to_string(end) +
                                ") out of range (size " + std::to_string(size()) + ")");
    }

    ChannelBuffer result;
    std::visit([&](const auto& samples) {
        using Vec = std::decay_t<decltype(samples)>;
        result.m_storage = Vec(samples.begin() + begin, samples.begin() + end);
    }, m_storage);
    return result;
}

// ========== Channel ==========

Channel::Channel(ChannelDescriptor descriptor, ChannelBuffer buffer)
    : m_descriptor(std::move(descriptor)), m_buffer(std::move(buffer)) {
    if (m_buffer.type() != m_descriptor.sampleType()) {
        throw std::invalid_argument(std::string("Channel ") + m_descriptor.name() + " declares " +
                                    sampleTypeName(m_descriptor.sampleType()) + " but buffer holds " +
                                    sampleTypeName(m_buffer.type()));
    }
    m_descriptor.setSampleCount(static_cast<uint32_t>(m_buffer.size()));
}

double Channel::duration() const {
    if (frequency() == 0) {
        return 0.0;
    }
    return static_cast<double>(sampleCount()) / frequency();
}

} // namespace Telemetry
} // namespace LapCut
