/**
 * @file link.hpp
 * @brief hidlink main API
 *
 * Message framing for devices reached through fixed-size reports.
 * Builds the chunks to send and reassembles the chunks received.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "hidlink/byte_reader.hpp"
#include "hidlink/protocol.hpp"
#include "hidlink/registry.hpp"

namespace hid
{
namespace link
{

/* ========================================================================= */
/* Decoding                                                                  */
/* ========================================================================= */

/**
 * @brief Result of decode()
 *
 * buffer points at the caller's buffer, header included.
 */
struct DecodedMessage
{
  uint16_t type_id = 0;
  const uint8_t* buffer = nullptr;
  size_t buffer_len = 0;
};

/**
 * @brief Result of decode_chunked()
 */
struct ChunkedHeader
{
  uint32_t length = 0;  ///< Declared payload length of the whole message
  uint16_t type_id = 0;
  ByteReader rest;      ///< Positioned at the first payload byte
};

/**
 * @brief Read the type id of a reassembled short form message
 *
 * The buffer is returned unchanged, header included, so it can be routed by
 * type without copying. Skip BARE_HEADER_SIZE bytes to reach the payload.
 *
 * @return ErrorCode::OK or BUFFER_UNDERFLOW
 */
ErrorCode decode(const uint8_t* data, size_t len, DecodedMessage& out);

/**
 * @brief Parse the first chunk received from the device
 *
 * @return ErrorCode::OK, BUFFER_UNDERFLOW, or PROTOCOL_MISMATCH if the
 *         header signature is missing. Nothing past the header may be
 *         interpreted after a mismatch.
 */
ErrorCode decode_chunked(const uint8_t* data, size_t len, ChunkedHeader& out);

/* ========================================================================= */
/* Encoding and sending                                                      */
/* ========================================================================= */

/**
 * @brief Transport send callback
 *
 * Called once per chunk, in order. Must return only after the transport
 * accepted the chunk.
 *
 * @return true if the chunk was sent
 */
using SendFn = std::function<bool(const uint8_t* data, size_t len)>;

/**
 * @brief Build the chunks that carry one message
 *
 * @return ErrorCode::OK or a registry/encoding error
 */
ErrorCode build_buffers(const MessageRegistry& registry, const std::string& name,
                        const Message& data, std::vector<Chunk>& out);

/**
 * @brief Build one short form buffer, without signature or chunking
 */
ErrorCode build_one(const MessageRegistry& registry, const std::string& name, const Message& data,
                    std::vector<uint8_t>& out);

/**
 * @brief Send chunks in order
 *
 * Stops at the first failed send. A partially sent message can't be
 * completed, so the whole message has to be sent again.
 *
 * @return ErrorCode::OK or TRANSPORT_ERROR
 */
ErrorCode send_buffers(const SendFn& send, const std::vector<Chunk>& chunks);

/**
 * @brief build_buffers() followed by send_buffers()
 */
ErrorCode build_and_send(const MessageRegistry& registry, const SendFn& send,
                         const std::string& name, const Message& data);

/* ========================================================================= */
/* Link                                                                      */
/* ========================================================================= */

/**
 * @brief Log levels reported through Link::LogFn
 */
enum class LogLevel : uint8_t
{
  Debug,
  Info,
  Warn,
  Error,
};

/**
 * @brief Message channel to one device
 *
 * Sends messages through the transport callback and reassembles chunks fed
 * from the transport into complete messages.
 *
 * Example usage:
 * @code
 * Link link(registry, [&](const uint8_t* data, size_t len) {
 *   return hid_write(dev, data, len) == static_cast<int>(len);
 * });
 *
 * link.set_message_handler([&](uint16_t type_id, const uint8_t* buf, size_t len) {
 *   std::unique_ptr<Message> msg;
 *   registry.decode_message(buf, len, msg);
 * });
 *
 * link.send("Initialize", Initialize());
 *
 * uint8_t report[BUFFER_SIZE];
 * while (hid_read(dev, report, sizeof(report)) > 0) {
 *   link.feed_chunk(report, sizeof(report));
 * }
 * @endcode
 */
class Link
{
 public:
  /**
   * @brief Complete message callback
   *
   * @param type_id Message type id
   * @param buffer  Short form message (bare header + payload), valid only
   *                during the call
   * @param len     Buffer length in bytes
   */
  using MessageFn = std::function<void(uint16_t type_id, const uint8_t* buffer, size_t len)>;

  /**
   * @brief Log callback
   */
  using LogFn = std::function<void(LogLevel level, const std::string& message)>;

  /**
   * @brief Construct Link instance
   *
   * @param registry     Message catalogue (must outlive the Link)
   * @param send         Transport send callback
   * @param buffer_size  Largest payload accepted (default: MAX_MESSAGE_SIZE)
   */
  Link(const MessageRegistry& registry, SendFn send, size_t buffer_size = MAX_MESSAGE_SIZE);

  void set_message_handler(MessageFn handler)
  {
    on_message_ = std::move(handler);
  }

  void set_log_handler(LogFn handler)
  {
    log_ = std::move(handler);
  }

  /**
   * @brief Encode a message and send its chunks
   *
   * @return ErrorCode::OK, a registry/encoding error or TRANSPORT_ERROR
   */
  ErrorCode send(const std::string& name, const Message& data);

  /**
   * @brief Process one chunk received from the device
   *
   * The first chunk of a message must start with a stream header. Padding
   * after the declared length is ignored.
   *
   * @return ErrorCode::OK (message in progress or delivered),
   *         PROTOCOL_MISMATCH, BUFFER_UNDERFLOW or BUFFER_FULL. After an
   *         error the partial message is dropped and the next chunk is
   *         expected to start a new message.
   */
  ErrorCode feed_chunk(const uint8_t* data, size_t len);

  /**
   * @brief Drop any partially received message
   */
  void reset();

  /**
   * @brief True while a message is partially received
   */
  bool receiving() const
  {
    return state_ == State::WAIT_PAYLOAD;
  }

  /**
   * @brief Get current buffer capacity
   *
   * @return Largest payload accepted in bytes
   */
  size_t buffer_capacity() const
  {
    return buffer_size_;
  }

 private:
  /**
   * @brief Reassembly state machine
   */
  enum class State
  {
    WAIT_HEADER,   // Next chunk starts a message
    WAIT_PAYLOAD,  // Collecting payload bytes
  };

  /**
   * @brief Append payload bytes, deliver the message once complete
   */
  void collect(const uint8_t* data, size_t len);

  void log(LogLevel level, const std::string& message) const;

  const MessageRegistry& registry_;
  SendFn send_;                  ///< Transport send callback
  MessageFn on_message_;         ///< Complete message callback
  LogFn log_;                    ///< Log callback (optional)
  size_t buffer_size_;           ///< Largest payload accepted
  std::vector<uint8_t> buffer_;  ///< Reassembly buffer (bare header + payload)

  State state_;       ///< State machine state
  uint32_t expected_; ///< Declared payload length
  uint16_t type_id_;  ///< Type id of the message in progress
};

}  // namespace link
}  // namespace hid
