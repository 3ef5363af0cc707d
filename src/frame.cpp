/**
 * @file frame.cpp
 * @brief Frame encoding/decoding implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "frame.hpp"

#include <algorithm>
#include <limits>

namespace hid
{
namespace link
{
namespace internal
{

ErrorCode encode_long(uint16_t type_id, const uint8_t* data, size_t len, bool include_sentinel,
                      std::vector<uint8_t>& out)
{
  // LEN is a 32-bit field
  if (len > std::numeric_limits<uint32_t>::max())
  {
    return ErrorCode::PAYLOAD_TOO_LARGE;
  }

  const size_t header_size = include_sentinel ? STREAM_HEADER_SIZE : BARE_HEADER_SIZE;
  const uint32_t len32 = static_cast<uint32_t>(len);
  out.clear();
  out.reserve(header_size + len);

  if (include_sentinel)
  {
    out.push_back(MESSAGE_HEADER_BYTE);
    out.push_back(MESSAGE_HEADER_BYTE);
  }

  // TYPE, big-endian
  out.push_back(static_cast<uint8_t>((type_id >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(type_id & 0xFF));

  // LEN, big-endian
  out.push_back(static_cast<uint8_t>((len32 >> 24) & 0xFF));
  out.push_back(static_cast<uint8_t>((len32 >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((len32 >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(len32 & 0xFF));

  // Payload
  if (len > 0 && data != nullptr)
  {
    out.insert(out.end(), data, data + len);
  }

  return ErrorCode::OK;
}

size_t chunk_count(size_t len)
{
  if (len == 0)
  {
    return 0;
  }

  return (len - 1) / BUFFER_SIZE + 1;
}

void split_into_chunks(const uint8_t* data, size_t len, std::vector<Chunk>& out)
{
  const size_t count = chunk_count(len);
  out.clear();
  out.reserve(count);

  for (size_t i = 0; i < count; ++i)
  {
    const size_t begin = i * BUFFER_SIZE;
    const size_t end = std::min(begin + BUFFER_SIZE, len);

    Chunk chunk;
    chunk.fill(0);
    std::copy(data + begin, data + end, chunk.begin());
    out.push_back(chunk);
  }
}

ErrorCode parse_bare_header(ByteReader& reader, FrameHeader& header)
{
  if (reader.remaining() < BARE_HEADER_SIZE)
  {
    return ErrorCode::BUFFER_UNDERFLOW;
  }

  FrameHeader parsed;
  reader.read_u16(parsed.type_id);
  reader.read_u32(parsed.length);

  header = parsed;
  return ErrorCode::OK;
}

ErrorCode parse_stream_header(ByteReader& reader, FrameHeader& header)
{
  if (reader.remaining() < STREAM_HEADER_SIZE)
  {
    return ErrorCode::BUFFER_UNDERFLOW;
  }

  const size_t start = reader.position();
  uint8_t sharp1 = 0;
  uint8_t sharp2 = 0;
  reader.read_u8(sharp1);
  reader.read_u8(sharp2);

  if (sharp1 != MESSAGE_HEADER_BYTE || sharp2 != MESSAGE_HEADER_BYTE)
  {
    reader.seek(start);
    return ErrorCode::PROTOCOL_MISMATCH;
  }

  return parse_bare_header(reader, header);
}

}  // namespace internal
}  // namespace link
}  // namespace hid
