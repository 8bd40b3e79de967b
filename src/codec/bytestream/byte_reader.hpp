#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size);
    ByteReader(const std::vector<uint8_t>& buf);

    int32_t read_i32_le();
    double read_f64_le();

    bool eof() const;
    bool has_error() const;
    size_t bytes_remaining() const;

private:
    const uint8_t* data;
    size_t size;
    size_t byte_pos;
    bool error;

    bool take(size_t count);
    void mark_error();
};
