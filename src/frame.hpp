/**
 * @file frame.hpp
 * @brief Frame encoding/decoding utilities (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "hidlink/byte_reader.hpp"
#include "hidlink/protocol.hpp"

namespace hid
{
namespace link
{
namespace internal
{

/**
 * @brief Encode a message header and payload into one buffer
 *
 * Long form:  ['#']['#'][TYPE(2)][LEN(4)][DATA...]
 * Short form: [TYPE(2)][LEN(4)][DATA...]
 *
 * LEN is always taken from len, so the header matches the payload.
 *
 * @param type_id          Message type id
 * @param data             Payload data (can be nullptr if len == 0)
 * @param len              Payload length in bytes
 * @param include_sentinel true for the long form
 * @param out              Output buffer for the encoded message
 * @return ErrorCode::OK, or PAYLOAD_TOO_LARGE if len does not fit LEN
 */
ErrorCode encode_long(uint16_t type_id, const uint8_t* data, size_t len, bool include_sentinel,
                      std::vector<uint8_t>& out);

/**
 * @brief Number of chunks needed for len bytes
 *
 * Zero bytes need zero chunks.
 */
size_t chunk_count(size_t len);

/**
 * @brief Split encoded bytes into zero-padded BUFFER_SIZE chunks
 *
 * @param data Encoded message (can be nullptr if len == 0)
 * @param len  Length in bytes
 * @param out  Output chunks, in transmission order
 */
void split_into_chunks(const uint8_t* data, size_t len, std::vector<Chunk>& out);

/**
 * @brief Read a bare header (TYPE, LEN)
 *
 * LEN is not checked against the bytes left in the reader.
 *
 * @return ErrorCode::OK, or BUFFER_UNDERFLOW if fewer than
 *         BARE_HEADER_SIZE bytes remain (reader and header unchanged)
 */
ErrorCode parse_bare_header(ByteReader& reader, FrameHeader& header);

/**
 * @brief Read a stream header ('#', '#', TYPE, LEN)
 *
 * @return ErrorCode::OK, BUFFER_UNDERFLOW if fewer than STREAM_HEADER_SIZE
 *         bytes remain, or PROTOCOL_MISMATCH if a signature byte is wrong.
 *         On failure reader and header are unchanged.
 */
ErrorCode parse_stream_header(ByteReader& reader, FrameHeader& header);

}  // namespace internal
}  // namespace link
}  // namespace hid
