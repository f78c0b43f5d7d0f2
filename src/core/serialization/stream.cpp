/**
 * @file stream.cpp
 * @brief Реализация потока записи
 */

#include "stream.hpp"
#include "../byte_order.hpp"

#include <format>
#include <limits>

namespace sealchain::core::serialization {

WriteStream::WriteStream(std::size_t reserve_size) {
    data_.reserve(reserve_size);
}

void WriteStream::write_u8(uint8_t value) {
    data_.push_back(value);
}

void WriteStream::write_u16_le(uint16_t value) {
    uint8_t buf[2];
    write_le16(buf, value);
    data_.insert(data_.end(), buf, buf + sizeof(buf));
}

void WriteStream::write_u64_le(uint64_t value) {
    uint8_t buf[8];
    write_le64(buf, value);
    data_.insert(data_.end(), buf, buf + sizeof(buf));
}

void WriteStream::write_i64_le(int64_t value) {
    write_u64_le(static_cast<uint64_t>(value));
}

void WriteStream::write_bytes(ByteSpan data) {
    data_.insert(data_.end(), data.begin(), data.end());
}

void WriteStream::write_hash256(const Hash256& hash) {
    data_.insert(data_.end(), hash.begin(), hash.end());
}

void WriteStream::write_string_u16(std::string_view str) {
    if (str.size() > std::numeric_limits<uint16_t>::max()) {
        throw StreamError(std::format(
            "Строка слишком длинная для префикса u16: {} байт", str.size()));
    }
    write_u16_le(static_cast<uint16_t>(str.size()));
    data_.insert(data_.end(), str.begin(), str.end());
}

const Bytes& WriteStream::data() const noexcept {
    return data_;
}

Bytes WriteStream::take_data() noexcept {
    return std::move(data_);
}

std::size_t WriteStream::size() const noexcept {
    return data_.size();
}

} // namespace sealchain::core::serialization
