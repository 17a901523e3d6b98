/*
 * Channel.h - Channel catalog records and typed sample buffers
 * This file is part of LapCut.
 * Copyright © 2026 Kirn Gill <segin2005@gmail.com>
 *
 * LapCut is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef CHANNEL_H
#define CHANNEL_H

// No direct includes - all includes should be in lapcut.h

namespace LapCut {
namespace Telemetry {

/**
 * @brief Storage type of a channel's samples
 */
enum class SampleType {
    INT16,
    INT32,
    FLOAT16,
    FLOAT32
};

const char* sampleTypeName(SampleType type);
size_t sampleWidth(SampleType type);

/**
 * @brief Map a catalog (type class, width) pair onto a SampleType
 * @param record_offset File offset of the record, for error context
 * @throws Core::TelemetryException UNKNOWN_DATA_TYPE for any other pair
 */
SampleType sampleTypeFromCode(uint16_t type_class, uint16_t width, uint64_t record_offset = 0);

/**
 * @brief IEEE 754 binary16 sample, kept as its bit pattern
 */
struct Half {
    uint16_t bits;

    float toFloat() const { return Core::Utility::halfToFloat(bits); }
    bool operator==(const Half& other) const { return bits == other.bits; }
};

/**
 * @brief One 124-byte channel catalog record
 *
 * Like Header, the descriptor keeps its raw record image so counter and
 * opaque trailing bytes are written back exactly as they were read. The
 * link, data pointer and sample count fields are layout state that
 * ContainerWriter overwrites on every write.
 */
class ChannelDescriptor {
public:
    /**
     * @brief Wrap a raw catalog record
     * @param record_offset File offset the record was read from (error context only)
     * @throws Core::TelemetryException UNKNOWN_DATA_TYPE
     * @throws std::invalid_argument if raw is not CHANNEL_RECORD_SIZE bytes
     */
    explicit ChannelDescriptor(std::vector<uint8_t> raw, uint64_t record_offset = 0);

    /**
     * @brief Build a fresh descriptor with the given conversion parameters
     */
    static ChannelDescriptor create(const std::string& name, const std::string& short_name,
                                    const std::string& unit, SampleType type,
                                    uint16_t frequency, int16_t shift = 0, int16_t mul = 1,
                                    int16_t scale = 1, int16_t dec = 0);

    const std::vector<uint8_t>& raw() const { return m_raw; }

    uint32_t prevPtr() const;
    uint32_t nextPtr() const;
    uint32_t dataPtr() const;
    uint32_t sampleCount() const;
    uint16_t counter() const;
    uint16_t typeClass() const;
    uint16_t width() const;
    SampleType sampleType() const { return m_type; }
    uint16_t frequency() const;
    int16_t shift() const;
    int16_t mul() const;
    int16_t scale() const;
    int16_t dec() const;
    std::string name() const;
    std::string shortName() const;
    std::string unit() const;

    uint64_t dataByteLength() const { return static_cast<uint64_t>(sampleCount()) * width(); }

    /**
     * @brief Convert a stored value to physical units
     *
     * (raw / scale * 10^-dec + shift) * mul, with a zero scale read as 1.
     */
    double toPhysical(double raw_value) const;

    void setLinks(uint32_t prev_ptr, uint32_t next_ptr);
    void setDataPtr(uint32_t ptr);
    void setSampleCount(uint32_t count);

private:
    std::vector<uint8_t> m_raw;
    SampleType m_type;
};

/**
 * @brief Ordered samples of one channel in their stored representation
 *
 * Samples are held in the exact type the file uses, so decoding and
 * re-encoding reproduces the source bytes bit for bit (NaN payloads and
 * negative zero included).
 */
class ChannelBuffer {
public:
    using Storage = std::variant<std::vector<int16_t>,
                                 std::vector<int32_t>,
                                 std::vector<Half>,
                                 std::vector<float>>;

    ChannelBuffer();
    explicit ChannelBuffer(std::vector<int16_t> samples);
    explicit ChannelBuffer(std::vector<int32_t> samples);
    explicit ChannelBuffer(std::vector<Half> samples);
    explicit ChannelBuffer(std::vector<float> samples);

    /**
     * @brief Decode count little-endian samples starting at data
     */
    static ChannelBuffer decode(SampleType type, const uint8_t* data, size_t count);

    /**
     * @brief Append the little-endian encoding of every sample to out
     */
    void encode(std::vector<uint8_t>& out) const;

    SampleType type() const;
    size_t size() const;
    bool isEmpty() const { return size() == 0; }
    size_t byteLength() const { return size() * sampleWidth(type()); }

    /**
     * @brief Stored value at index i, widened to double
     * @throws std::out_of_range
     */
    double value(size_t i) const;

    /**
     * @brief Copy of samples [begin, end)
     * @throws std::out_of_range if end > size() or begin > end
     */
    ChannelBuffer slice(size_t begin, size_t end) const;

    bool operator==(const ChannelBuffer& other) const { return m_storage == other.m_storage; }

private:
    Storage m_storage;
};

/**
 * @brief A descriptor and the samples it describes
 */
class Channel {
public:
    /**
     * @throws std::invalid_argument if the buffer's type differs from the descriptor's
     */
    Channel(ChannelDescriptor descriptor, ChannelBuffer buffer);

    const ChannelDescriptor& descriptor() const { return m_descriptor; }
    ChannelDescriptor& descriptor() { return m_descriptor; }
    const ChannelBuffer& buffer() const { return m_buffer; }

    std::string name() const { return m_descriptor.name(); }
    uint16_t frequency() const { return m_descriptor.frequency(); }
    size_t sampleCount() const { return m_buffer.size(); }

    /**
     * @brief Sample i converted to physical units
     */
    double physical(size_t i) const { return m_descriptor.toPhysical(m_buffer.value(i)); }

    /**
     * @brief Length of the recording in seconds (0 for a 0 Hz channel)
     */
    double duration() const;

private:
    ChannelDescriptor m_descriptor;
    ChannelBuffer m_buffer;
};

} // namespace Telemetry
} // namespace LapCut

#endif // CHANNEL_H
