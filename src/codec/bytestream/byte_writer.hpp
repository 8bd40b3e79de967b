#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

// Little-endian, unpadded.
class ByteWriter {
public:
    ByteWriter();

    void write_i32_le(int32_t value);
    void write_f64_le(double value);
    void reserve(size_t bytes);
    const std::vector<uint8_t>& get_buffer() const;

private:
    std::vector<uint8_t> buffer;

    void write_u32_le(uint32_t value);
    void write_u64_le(uint64_t value);
};
