/**
 * @file link_c_api.cpp
 * @brief hidlink C API implementation
 *
 * C wrapper for the C++ frame codec.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <algorithm>
#include <vector>

#include "frame.hpp"
#include "hidlink/link.h"
#include "hidlink/protocol.hpp"

using namespace hid::link;

static_assert(HIDLINK_BUFFER_SIZE == BUFFER_SIZE, "chunk size mismatch");
static_assert(HIDLINK_STREAM_HEADER_SIZE == STREAM_HEADER_SIZE, "header size mismatch");
static_assert(HIDLINK_BARE_HEADER_SIZE == BARE_HEADER_SIZE, "header size mismatch");

/* ========================================================================= */
/* Error message strings                                                     */
/* ========================================================================= */

const char* hidlink_strerror(hidlink_error_t err)
{
  switch (err)
  {
#define ERR(name, val, msg)  \
  case HIDLINK_ERR_##name:   \
    return msg;
#include "hidlink/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

/* ========================================================================= */
/* Encoding                                                                  */
/* ========================================================================= */

size_t hidlink_chunk_count(size_t len)
{
  return internal::chunk_count(len);
}

hidlink_error_t hidlink_encode(uint16_t type_id, const uint8_t* payload, size_t payload_len,
                               int include_sentinel, uint8_t* out, size_t out_cap,
                               size_t* out_len)
{
  if ((payload == nullptr && payload_len > 0) || out == nullptr || out_len == nullptr)
  {
    return HIDLINK_ERR_INVALID_ARGUMENT;
  }

  std::vector<uint8_t> encoded;
  const ErrorCode err =
      internal::encode_long(type_id, payload, payload_len, include_sentinel != 0, encoded);
  if (err != ErrorCode::OK)
  {
    return static_cast<hidlink_error_t>(err);
  }

  if (encoded.size() > out_cap)
  {
    return HIDLINK_ERR_INVALID_ARGUMENT;
  }

  std::copy(encoded.begin(), encoded.end(), out);
  *out_len = encoded.size();
  return HIDLINK_ERR_OK;
}

hidlink_error_t hidlink_split(const uint8_t* data, size_t len, uint8_t* out, size_t out_cap,
                              size_t* count)
{
  if ((data == nullptr && len > 0) || count == nullptr)
  {
    return HIDLINK_ERR_INVALID_ARGUMENT;
  }

  const size_t needed = internal::chunk_count(len) * BUFFER_SIZE;
  if (needed > 0 && (out == nullptr || out_cap < needed))
  {
    return HIDLINK_ERR_INVALID_ARGUMENT;
  }

  std::vector<Chunk> chunks;
  internal::split_into_chunks(data, len, chunks);

  for (size_t i = 0; i < chunks.size(); ++i)
  {
    std::copy(chunks[i].begin(), chunks[i].end(), out + i * BUFFER_SIZE);
  }

  *count = chunks.size();
  return HIDLINK_ERR_OK;
}

/* ========================================================================= */
/* Decoding                                                                  */
/* ========================================================================= */

hidlink_error_t hidlink_parse_stream_header(const uint8_t* data, size_t len, uint16_t* type_id,
                                            uint32_t* length)
{
  if ((data == nullptr && len > 0) || type_id == nullptr || length == nullptr)
  {
    return HIDLINK_ERR_INVALID_ARGUMENT;
  }

  ByteReader reader(data, len);
  FrameHeader header;
  const ErrorCode err = internal::parse_stream_header(reader, header);
  if (err != ErrorCode::OK)
  {
    return static_cast<hidlink_error_t>(err);
  }

  *type_id = header.type_id;
  *length = header.length;
  return HIDLINK_ERR_OK;
}

hidlink_error_t hidlink_parse_bare_header(const uint8_t* data, size_t len, uint16_t* type_id,
                                          uint32_t* length)
{
  if ((data == nullptr && len > 0) || type_id == nullptr || length == nullptr)
  {
    return HIDLINK_ERR_INVALID_ARGUMENT;
  }

  ByteReader reader(data, len);
  FrameHeader header;
  const ErrorCode err = internal::parse_bare_header(reader, header);
  if (err != ErrorCode::OK)
  {
    return static_cast<hidlink_error_t>(err);
  }

  *type_id = header.type_id;
  *length = header.length;
  return HIDLINK_ERR_OK;
}
