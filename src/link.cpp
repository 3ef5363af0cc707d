/**
 * @file link.cpp
 * @brief hidlink main implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "hidlink/link.hpp"

#include <algorithm>
#include <string>

#include "frame.hpp"

namespace hid
{
namespace link
{

const char* strerror(ErrorCode err)
{
  switch (err)
  {
#define ERR(name, val, msg) \
  case ErrorCode::name:     \
    return msg;
#include "hidlink/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

/* ========================================================================= */
/* Free functions                                                            */
/* ========================================================================= */

ErrorCode decode(const uint8_t* data, size_t len, DecodedMessage& out)
{
  ByteReader reader(data, len);
  FrameHeader header;
  const ErrorCode err = internal::parse_bare_header(reader, header);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  out.type_id = header.type_id;
  out.buffer = data;
  out.buffer_len = len;
  return ErrorCode::OK;
}

ErrorCode decode_chunked(const uint8_t* data, size_t len, ChunkedHeader& out)
{
  ByteReader reader(data, len);
  FrameHeader header;
  const ErrorCode err = internal::parse_stream_header(reader, header);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  out.length = header.length;
  out.type_id = header.type_id;
  out.rest = reader;
  return ErrorCode::OK;
}

ErrorCode build_buffers(const MessageRegistry& registry, const std::string& name,
                        const Message& data, std::vector<Chunk>& out)
{
  uint16_t type_id = 0;
  std::vector<uint8_t> payload;
  ErrorCode err = registry.resolve(name, data, type_id, payload);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  std::vector<uint8_t> encoded;
  err = internal::encode_long(type_id, payload.data(), payload.size(), true, encoded);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  internal::split_into_chunks(encoded.data(), encoded.size(), out);
  return ErrorCode::OK;
}

ErrorCode build_one(const MessageRegistry& registry, const std::string& name, const Message& data,
                    std::vector<uint8_t>& out)
{
  uint16_t type_id = 0;
  std::vector<uint8_t> payload;
  const ErrorCode err = registry.resolve(name, data, type_id, payload);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return internal::encode_long(type_id, payload.data(), payload.size(), false, out);
}

ErrorCode send_buffers(const SendFn& send, const std::vector<Chunk>& chunks)
{
  if (!send)
  {
    return ErrorCode::INVALID_ARGUMENT;
  }

  for (const Chunk& chunk : chunks)
  {
    if (!send(chunk.data(), chunk.size()))
    {
      return ErrorCode::TRANSPORT_ERROR;
    }
  }

  return ErrorCode::OK;
}

ErrorCode build_and_send(const MessageRegistry& registry, const SendFn& send,
                         const std::string& name, const Message& data)
{
  std::vector<Chunk> chunks;
  const ErrorCode err = build_buffers(registry, name, data, chunks);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return send_buffers(send, chunks);
}

/* ========================================================================= */
/* Link                                                                      */
/* ========================================================================= */

Link::Link(const MessageRegistry& registry, SendFn send, size_t buffer_size)
    : registry_(registry),
      send_(std::move(send)),
      on_message_(),
      log_(),
      buffer_size_(buffer_size),
      buffer_(),
      state_(State::WAIT_HEADER),
      expected_(0),
      type_id_(0)
{
  buffer_.reserve(BARE_HEADER_SIZE + BUFFER_SIZE);
}

ErrorCode Link::send(const std::string& name, const Message& data)
{
  std::vector<Chunk> chunks;
  ErrorCode err = build_buffers(registry_, name, data, chunks);
  if (err != ErrorCode::OK)
  {
    log(LogLevel::Error, "cannot build " + name + ": " + strerror(err));
    return err;
  }

  err = send_buffers(send_, chunks);
  if (err != ErrorCode::OK)
  {
    log(LogLevel::Error, "sending " + name + " failed: " + strerror(err));
    return err;
  }

  log(LogLevel::Debug, "sent " + name + " in " + std::to_string(chunks.size()) + " chunk(s)");
  return ErrorCode::OK;
}

ErrorCode Link::feed_chunk(const uint8_t* data, size_t len)
{
  if (data == nullptr && len > 0)
  {
    return ErrorCode::INVALID_ARGUMENT;
  }

  if (state_ == State::WAIT_PAYLOAD)
  {
    collect(data, len);
    return ErrorCode::OK;
  }

  ChunkedHeader header;
  const ErrorCode err = decode_chunked(data, len, header);
  if (err != ErrorCode::OK)
  {
    log(LogLevel::Warn, std::string("dropping chunk: ") + strerror(err));
    return err;
  }

  if (header.length > buffer_size_)
  {
    log(LogLevel::Warn, "message type " + std::to_string(header.type_id) + " declares " +
                            std::to_string(header.length) + " bytes, capacity is " +
                            std::to_string(buffer_size_));
    return ErrorCode::BUFFER_FULL;
  }

  type_id_ = header.type_id;
  expected_ = header.length;

  // Keep TYPE and LEN as the short form header of the reassembled message
  buffer_.assign(data + 2, data + STREAM_HEADER_SIZE);
  state_ = State::WAIT_PAYLOAD;

  collect(header.rest.current(), header.rest.remaining());
  return ErrorCode::OK;
}

void Link::collect(const uint8_t* data, size_t len)
{
  const size_t received = buffer_.size() - BARE_HEADER_SIZE;
  const size_t take = std::min(static_cast<size_t>(expected_) - received, len);

  if (take > 0)
  {
    buffer_.insert(buffer_.end(), data, data + take);
  }

  if (buffer_.size() - BARE_HEADER_SIZE < expected_)
  {
    return;
  }

  state_ = State::WAIT_HEADER;

  DecodedMessage message;
  if (decode(buffer_.data(), buffer_.size(), message) == ErrorCode::OK)
  {
    log(LogLevel::Debug, "received message type " + std::to_string(message.type_id) + ", " +
                             std::to_string(expected_) + " bytes");

    if (on_message_)
    {
      on_message_(message.type_id, message.buffer, message.buffer_len);
    }
  }

  buffer_.clear();
}

void Link::reset()
{
  if (state_ == State::WAIT_PAYLOAD)
  {
    log(LogLevel::Info, "dropping partial message type " + std::to_string(type_id_));
  }

  buffer_.clear();
  state_ = State::WAIT_HEADER;
  expected_ = 0;
  type_id_ = 0;
}

void Link::log(LogLevel level, const std::string& message) const
{
  if (log_)
  {
    log_(level, message);
  }
}

}  // namespace link
}  // namespace hid
