/**
 * @file byte_reader.cpp
 * @brief Read cursor implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "hidlink/byte_reader.hpp"

#include <cstring>

namespace hid
{
namespace link
{

bool ByteReader::read_u8(uint8_t& value)
{
  if (remaining() < 1)
  {
    return false;
  }

  value = data_[pos_++];
  return true;
}

bool ByteReader::read_u16(uint16_t& value)
{
  if (remaining() < 2)
  {
    return false;
  }

  const uint8_t* p = data_ + pos_;
  value = static_cast<uint16_t>((p[0] << 8) | p[1]);
  pos_ += 2;
  return true;
}

bool ByteReader::read_u32(uint32_t& value)
{
  if (remaining() < 4)
  {
    return false;
  }

  const uint8_t* p = data_ + pos_;
  value = (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
          (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
  pos_ += 4;
  return true;
}

bool ByteReader::read_bytes(uint8_t* out, size_t len)
{
  if (remaining() < len)
  {
    return false;
  }

  if (len > 0)
  {
    std::memcpy(out, data_ + pos_, len);
  }
  pos_ += len;
  return true;
}

bool ByteReader::skip(size_t len)
{
  if (remaining() < len)
  {
    return false;
  }

  pos_ += len;
  return true;
}

}  // namespace link
}  // namespace hid
