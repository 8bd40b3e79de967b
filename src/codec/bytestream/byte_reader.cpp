#include "byte_reader.hpp"
#include <cstring>

ByteReader::ByteReader(const uint8_t* data, size_t size) : data(data), size(size), byte_pos(0), error(false) {}

ByteReader::ByteReader(const std::vector<uint8_t>& buf) : data(buf.data()), size(buf.size()), byte_pos(0), error(false) {}

void ByteReader::mark_error() {
    this->error = true;
    this->byte_pos = this->size;
}

bool ByteReader::take(size_t count) {
    if (this->error || this->size - this->byte_pos < count) {
        this->mark_error();
        return false;
    }
    return true;
}

int32_t ByteReader::read_i32_le() {
    if (!this->take(4)) return 0;
    const uint8_t* p = this->data + this->byte_pos;
    uint32_t value = static_cast<uint32_t>(p[0]) |
                     (static_cast<uint32_t>(p[1]) << 8) |
                     (static_cast<uint32_t>(p[2]) << 16) |
                     (static_cast<uint32_t>(p[3]) << 24);
    this->byte_pos += 4;
    return static_cast<int32_t>(value);
}

double ByteReader::read_f64_le() {
    if (!this->take(8)) return 0.0;
    const uint8_t* p = this->data + this->byte_pos;
    uint64_t bits = 0;
    for (int i = 7; i >= 0; --i) {
        bits = (bits << 8) | static_cast<uint64_t>(p[i]);
    }
    this->byte_pos += 8;
    double value = 0.0;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

bool ByteReader::eof() const {
    return this->byte_pos >= this->size;
}

bool ByteReader::has_error() const {
    return this->error;
}

size_t ByteReader::bytes_remaining() const {
    return this->size - this->byte_pos;
}
