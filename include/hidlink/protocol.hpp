/**
 * @file protocol.hpp
 * @brief hidlink protocol definitions
 *
 * Framing protocol for typed messages carried over a transport that moves
 * fixed-size reports (USB HID class devices).
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace hid
{
namespace link
{

/* ========================================================================= */
/* Frame format constants                                                    */
/* ========================================================================= */

/**
 * @brief Message header signature byte
 *
 * A stream header starts with two of these. Used to detect a misaligned
 * stream or a peer speaking another protocol.
 */
constexpr uint8_t MESSAGE_HEADER_BYTE = 0x23;

/**
 * @brief Physical chunk size in bytes
 *
 * Every report handed to the transport is exactly this long.
 */
constexpr size_t BUFFER_SIZE = 63;

/**
 * @brief Stream header size: '#' '#' TYPE(2) LEN(4)
 */
constexpr size_t STREAM_HEADER_SIZE = 1 + 1 + 2 + 4;

/**
 * @brief Bare header size: TYPE(2) LEN(4)
 */
constexpr size_t BARE_HEADER_SIZE = STREAM_HEADER_SIZE - 2;

/**
 * @brief Default maximum payload accepted by the receiver
 *
 * Limits the reassembly buffer of a Link.
 * Can be adjusted based on the largest message the device sends.
 */
constexpr size_t MAX_MESSAGE_SIZE = 64 * 1024;

/* ========================================================================= */
/* Frame structure                                                           */
/* ========================================================================= */

/**
 * Long form (sent to the device):
 *
 * ['#']['#'][TYPE_H][TYPE_L][LEN_3][LEN_2][LEN_1][LEN_0][DATA...]
 *
 * - '#':  1 byte each (0x23, header signature)
 * - TYPE: 2 bytes (message type id, big-endian)
 * - LEN:  4 bytes (payload length, big-endian)
 * - DATA: LEN bytes (serialized message)
 *
 * Short form omits the two signature bytes:
 *
 * [TYPE_H][TYPE_L][LEN_3][LEN_2][LEN_1][LEN_0][DATA...]
 *
 * The long form is cut into BUFFER_SIZE chunks. The last chunk is padded
 * with zeros. Chunks carry no header of their own and have no sequence
 * number, so they must be sent and received in order.
 *
 * Example: type 0x0002 with a 100 byte payload is 108 bytes long and travels
 * in 2 chunks (126 bytes, the last 18 are padding).
 */

/**
 * @brief One physical chunk
 */
using Chunk = std::array<uint8_t, BUFFER_SIZE>;

/**
 * @brief Logical message header
 */
struct FrameHeader
{
  uint16_t type_id = 0;  ///< Message type id
  uint32_t length = 0;   ///< Payload length in bytes
};

/* ========================================================================= */
/* Error codes                                                               */
/* ========================================================================= */

/**
 * @brief Error codes
 *
 * Defined via errors.def so the C API shares the same values.
 */
enum class ErrorCode : uint8_t
{
#define ERR(name, val, msg) name = val,
#include "hidlink/errors.def"
#undef ERR
};

/**
 * @brief Get error message string
 * @param err Error code
 * @return Error message (static string)
 */
const char* strerror(ErrorCode err);

}  // namespace link
}  // namespace hid
