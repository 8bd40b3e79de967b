#include "byte_writer.hpp"
#include <cstring>

ByteWriter::ByteWriter() {}

void ByteWriter::write_u32_le(uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        this->buffer.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

void ByteWriter::write_u64_le(uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        this->buffer.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

void ByteWriter::write_i32_le(int32_t value) {
    this->write_u32_le(static_cast<uint32_t>(value));
}

void ByteWriter::write_f64_le(double value) {
    static_assert(sizeof(double) == sizeof(uint64_t), "IEEE-754 binary64 expected");
    uint64_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    this->write_u64_le(bits);
}

void ByteWriter::reserve(size_t bytes) {
    this->buffer.reserve(bytes);
}

const std::vector<uint8_t>& ByteWriter::get_buffer() const {
    return this->buffer;
}
