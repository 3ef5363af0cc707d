/**
 * @file link.h
 * @brief hidlink C API
 *
 * C-compatible interface for the hidlink frame codec.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Protocol constants                                                        */
  /* ========================================================================= */

  /** @brief Message header signature byte */
#define HIDLINK_MESSAGE_HEADER_BYTE 0x23

  /** @brief Physical chunk size */
#define HIDLINK_BUFFER_SIZE 63

  /** @brief Stream header size ('#', '#', TYPE, LEN) */
#define HIDLINK_STREAM_HEADER_SIZE 8

  /** @brief Bare header size (TYPE, LEN) */
#define HIDLINK_BARE_HEADER_SIZE 6

  /* ========================================================================= */
  /* Error codes                                                               */
  /* ========================================================================= */

  typedef enum
  {
#define ERR(name, val, msg) HIDLINK_ERR_##name = val,
#include "hidlink/errors.def"
#undef ERR
  } hidlink_error_t;

  /**
   * @brief Get error message string
   * @param err Error code
   * @return Error message (static string)
   */
  const char* hidlink_strerror(hidlink_error_t err);

  /* ========================================================================= */
  /* Encoding                                                                  */
  /* ========================================================================= */

  /**
   * @brief Number of chunks needed for len encoded bytes
   */
  size_t hidlink_chunk_count(size_t len);

  /**
   * @brief Encode header and payload
   *
   * @param type_id          Message type id
   * @param payload          Payload data (can be NULL if payload_len == 0)
   * @param payload_len      Payload length in bytes
   * @param include_sentinel Non-zero for the long form ('#', '#' prefix)
   * @param out              Output buffer
   * @param out_cap          Output buffer capacity
   * @param out_len          Number of bytes written
   * @return HIDLINK_ERR_OK, or HIDLINK_ERR_INVALID_ARGUMENT if out is too small
   */
  hidlink_error_t hidlink_encode(uint16_t type_id, const uint8_t* payload, size_t payload_len,
                                 int include_sentinel, uint8_t* out, size_t out_cap,
                                 size_t* out_len);

  /**
   * @brief Split encoded bytes into zero-padded HIDLINK_BUFFER_SIZE chunks
   *
   * Chunks are written back to back into out.
   *
   * @param data    Encoded message
   * @param len     Encoded length in bytes
   * @param out     Output buffer, at least
   *                hidlink_chunk_count(len) * HIDLINK_BUFFER_SIZE bytes
   * @param out_cap Output buffer capacity
   * @param count   Number of chunks written
   */
  hidlink_error_t hidlink_split(const uint8_t* data, size_t len, uint8_t* out, size_t out_cap,
                                size_t* count);

  /* ========================================================================= */
  /* Decoding                                                                  */
  /* ========================================================================= */

  /**
   * @brief Parse a stream header
   *
   * @return HIDLINK_ERR_OK, HIDLINK_ERR_BUFFER_UNDERFLOW or
   *         HIDLINK_ERR_PROTOCOL_MISMATCH
   */
  hidlink_error_t hidlink_parse_stream_header(const uint8_t* data, size_t len, uint16_t* type_id,
                                              uint32_t* length);

  /**
   * @brief Parse a bare header
   *
   * @return HIDLINK_ERR_OK or HIDLINK_ERR_BUFFER_UNDERFLOW
   */
  hidlink_error_t hidlink_parse_bare_header(const uint8_t* data, size_t len, uint16_t* type_id,
                                            uint32_t* length);

#ifdef __cplusplus
} /* extern "C" */
#endif
