/**
 * @file byte_reader.hpp
 * @brief Read cursor over a received byte buffer
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace hid
{
namespace link
{

/**
 * @brief Big-endian read cursor
 *
 * Does not own the buffer. Every read either consumes the requested number
 * of bytes or fails and leaves the position unchanged.
 */
class ByteReader
{
 public:
  ByteReader() : data_(nullptr), len_(0), pos_(0) {}

  /**
   * @param data Buffer to read (can be nullptr if len == 0)
   * @param len  Buffer length in bytes
   */
  ByteReader(const uint8_t* data, size_t len) : data_(data), len_(len), pos_(0) {}

  bool read_u8(uint8_t& value);
  bool read_u16(uint16_t& value);
  bool read_u32(uint32_t& value);

  /**
   * @brief Copy the next len bytes to out
   * @return false if fewer than len bytes remain
   */
  bool read_bytes(uint8_t* out, size_t len);

  /**
   * @brief Advance past len bytes without reading them
   */
  bool skip(size_t len);

  /**
   * @brief Move the cursor back to an earlier position
   */
  void seek(size_t pos)
  {
    pos_ = pos > len_ ? len_ : pos;
  }

  size_t position() const
  {
    return pos_;
  }

  size_t remaining() const
  {
    return len_ - pos_;
  }

  /**
   * @brief Pointer to the next unread byte
   */
  const uint8_t* current() const
  {
    return data_ + pos_;
  }

 private:
  const uint8_t* data_;
  size_t len_;
  size_t pos_;
};

}  // namespace link
}  // namespace hid
