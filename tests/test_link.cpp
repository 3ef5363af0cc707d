/**
 * @file test_link.cpp
 * @brief hidlink unit tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "frame.hpp"
#include "hidlink/link.hpp"
#include "hidlink/protocol.hpp"
#include "test_messages.hpp"

using namespace hid::link;

namespace
{

struct Received
{
  uint16_t type_id;
  std::vector<uint8_t> buffer;
};

std::vector<uint8_t> payload_of(const std::vector<uint8_t>& short_form)
{
  return std::vector<uint8_t>(short_form.begin() + BARE_HEADER_SIZE, short_form.end());
}

}  // namespace

/* ========================================================================= */
/* Decoding Tests                                                            */
/* ========================================================================= */

TEST_CASE("decode returns the original buffer")
{
  const uint8_t payload[] = {0x01, 0x02, 0x03};
  std::vector<uint8_t> buffer;
  REQUIRE(internal::encode_long(0x0102, payload, 3, false, buffer) == ErrorCode::OK);

  DecodedMessage message;
  REQUIRE(decode(buffer.data(), buffer.size(), message) == ErrorCode::OK);
  CHECK(message.type_id == 0x0102);
  CHECK(message.buffer == buffer.data());
  CHECK(message.buffer_len == buffer.size());
  CHECK(message.buffer[BARE_HEADER_SIZE] == 0x01);

  SUBCASE("Too short")
  {
    DecodedMessage short_message;
    CHECK(decode(buffer.data(), 5, short_message) == ErrorCode::BUFFER_UNDERFLOW);
    CHECK(short_message.buffer == nullptr);
  }
}

TEST_CASE("decode_chunked")
{
  SUBCASE("First chunk of a long message")
  {
    const std::vector<uint8_t> payload(100, 0xAA);
    std::vector<uint8_t> encoded;
    REQUIRE(internal::encode_long(0x0002, payload.data(), payload.size(), true, encoded) ==
            ErrorCode::OK);
    std::vector<Chunk> chunks;
    internal::split_into_chunks(encoded.data(), encoded.size(), chunks);

    ChunkedHeader header;
    REQUIRE(decode_chunked(chunks[0].data(), chunks[0].size(), header) == ErrorCode::OK);
    CHECK(header.type_id == 0x0002);
    CHECK(header.length == 100);
    CHECK(header.rest.position() == STREAM_HEADER_SIZE);
    CHECK(header.rest.remaining() == BUFFER_SIZE - STREAM_HEADER_SIZE);
    CHECK(*header.rest.current() == 0xAA);
  }

  SUBCASE("Missing signature")
  {
    const uint8_t data[] = {0x23, 0x24, 0x00, 0x01, 0x00, 0x00, 0x00, 0x05, 0x00};
    ChunkedHeader header;
    CHECK(decode_chunked(data, sizeof(data), header) == ErrorCode::PROTOCOL_MISMATCH);
    CHECK(header.length == 0);
  }

  SUBCASE("Too short")
  {
    const uint8_t data[] = {0x23, 0x23, 0x00};
    ChunkedHeader header;
    CHECK(decode_chunked(data, sizeof(data), header) == ErrorCode::BUFFER_UNDERFLOW);
  }
}

/* ========================================================================= */
/* Building and Sending Tests                                                */
/* ========================================================================= */

TEST_CASE("Building messages")
{
  MessageRegistry registry;
  test::fill_registry(registry);

  SUBCASE("build_buffers produces padded chunks with a stream header")
  {
    test::RawMessage features(std::vector<uint8_t>(100, 0xAA));
    std::vector<Chunk> chunks;
    REQUIRE(build_buffers(registry, "Features", features, chunks) == ErrorCode::OK);

    REQUIRE(chunks.size() == 2);
    const uint8_t expected_header[] = {0x23, 0x23, 0x00, 0x11, 0x00, 0x00, 0x00, 0x64};
    CHECK(std::memcmp(chunks[0].data(), expected_header, sizeof(expected_header)) == 0);
    CHECK(std::all_of(chunks[1].begin() + 45, chunks[1].end(),
                      [](uint8_t b) { return b == 0x00; }));
  }

  SUBCASE("build_buffers uses the explicit wire type")
  {
    test::RawMessage input(std::vector<uint8_t>{0x01});
    std::vector<Chunk> chunks;
    REQUIRE(build_buffers(registry, "TxAckInput", input, chunks) == ErrorCode::OK);
    REQUIRE(chunks.size() == 1);
    CHECK(chunks[0][2] == 0x00);
    CHECK(chunks[0][3] == 22);
  }

  SUBCASE("Empty message still fills one chunk")
  {
    test::RawMessage initialize;
    std::vector<Chunk> chunks;
    REQUIRE(build_buffers(registry, "Initialize", initialize, chunks) == ErrorCode::OK);
    REQUIRE(chunks.size() == 1);
    CHECK(chunks[0][0] == MESSAGE_HEADER_BYTE);
    CHECK(chunks[0][1] == MESSAGE_HEADER_BYTE);
    CHECK(std::all_of(chunks[0].begin() + 2, chunks[0].end(),
                      [](uint8_t b) { return b == 0x00; }));
  }

  SUBCASE("build_one produces the short form")
  {
    test::RawMessage ping(std::vector<uint8_t>{0x0A, 0x02, 'h', 'i'});
    std::vector<uint8_t> buffer;
    REQUIRE(build_one(registry, "Ping", ping, buffer) == ErrorCode::OK);

    const std::vector<uint8_t> expected = {0x00, 0x01, 0x00, 0x00, 0x00, 0x04,
                                           0x0A, 0x02, 'h',  'i'};
    CHECK(buffer == expected);

    DecodedMessage message;
    REQUIRE(decode(buffer.data(), buffer.size(), message) == ErrorCode::OK);
    CHECK(message.type_id == 1);
  }

  SUBCASE("Registry errors are passed through")
  {
    test::RawMessage msg;
    std::vector<Chunk> chunks;
    std::vector<uint8_t> buffer;
    CHECK(build_buffers(registry, "Nope", msg, chunks) == ErrorCode::UNKNOWN_MESSAGE);
    CHECK(build_one(registry, "Broken", msg, buffer) == ErrorCode::CONFIGURATION_ERROR);
    CHECK(chunks.empty());
    CHECK(buffer.empty());
  }
}

TEST_CASE("Sending chunks")
{
  MessageRegistry registry;
  test::fill_registry(registry);

  std::vector<std::vector<uint8_t>> sent;
  size_t fail_at = SIZE_MAX;
  SendFn send = [&](const uint8_t* data, size_t len)
  {
    if (sent.size() == fail_at)
    {
      return false;
    }
    sent.emplace_back(data, data + len);
    return true;
  };

  test::RawMessage big(std::vector<uint8_t>(200, 0x42));

  SUBCASE("All chunks in order")
  {
    std::vector<Chunk> chunks;
    REQUIRE(build_buffers(registry, "Features", big, chunks) == ErrorCode::OK);
    REQUIRE(chunks.size() == 4);  // 208 bytes

    REQUIRE(send_buffers(send, chunks) == ErrorCode::OK);
    REQUIRE(sent.size() == chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i)
    {
      CHECK(sent[i].size() == BUFFER_SIZE);
      CHECK(std::equal(sent[i].begin(), sent[i].end(), chunks[i].begin()));
    }
  }

  SUBCASE("First failure stops the sequence")
  {
    fail_at = 1;
    CHECK(build_and_send(registry, send, "Features", big) == ErrorCode::TRANSPORT_ERROR);
    CHECK(sent.size() == 1);
  }

  SUBCASE("Nothing is sent when the message can't be built")
  {
    CHECK(build_and_send(registry, send, "Nope", big) == ErrorCode::UNKNOWN_MESSAGE);
    CHECK(sent.empty());
  }

  SUBCASE("Missing send callback")
  {
    std::vector<Chunk> chunks(1);
    CHECK(send_buffers(SendFn(), chunks) == ErrorCode::INVALID_ARGUMENT);
  }
}

/* ========================================================================= */
/* Link Class Tests                                                          */
/* ========================================================================= */

TEST_CASE("Link basic functionality")
{
  MessageRegistry registry;
  test::fill_registry(registry);

  // Track transport output
  std::vector<Chunk> wire;
  auto send = [&wire](const uint8_t* data, size_t len)
  {
    CHECK(len == BUFFER_SIZE);
    Chunk chunk;
    std::copy(data, data + len, chunk.begin());
    wire.push_back(chunk);
    return true;
  };

  std::vector<Received> received;
  std::vector<std::string> logs;

  Link link(registry, send);
  link.set_message_handler(
      [&received](uint16_t type_id, const uint8_t* buffer, size_t len)
      { received.push_back(Received{type_id, std::vector<uint8_t>(buffer, buffer + len)}); });
  link.set_log_handler([&logs](LogLevel, const std::string& message) { logs.push_back(message); });

  CHECK(link.buffer_capacity() == MAX_MESSAGE_SIZE);

  SUBCASE("Send then receive the same chunks")
  {
    std::vector<uint8_t> payload(150);
    for (size_t i = 0; i < payload.size(); ++i)
    {
      payload[i] = static_cast<uint8_t>(i);
    }

    REQUIRE(link.send("Features", test::RawMessage(payload)) == ErrorCode::OK);
    REQUIRE(wire.size() == 3);  // 158 bytes

    for (size_t i = 0; i < wire.size(); ++i)
    {
      CHECK(received.empty());
      REQUIRE(link.feed_chunk(wire[i].data(), wire[i].size()) == ErrorCode::OK);
    }

    REQUIRE(received.size() == 1);
    CHECK(received[0].type_id == 17);
    CHECK(received[0].buffer.size() == BARE_HEADER_SIZE + payload.size());
    CHECK(payload_of(received[0].buffer) == payload);
    CHECK_FALSE(link.receiving());

    std::unique_ptr<Message> message;
    REQUIRE(registry.decode_message(received[0].buffer.data(), received[0].buffer.size(),
                                    message) == ErrorCode::OK);
    const auto* raw = dynamic_cast<const test::RawMessage*>(message.get());
    REQUIRE(raw != nullptr);
    CHECK(raw->bytes == payload);
  }

  SUBCASE("Message that fits the first chunk")
  {
    REQUIRE(link.send("Ping", test::RawMessage(std::vector<uint8_t>{0x01, 0x02})) ==
            ErrorCode::OK);
    REQUIRE(wire.size() == 1);

    REQUIRE(link.feed_chunk(wire[0].data(), wire[0].size()) == ErrorCode::OK);
    REQUIRE(received.size() == 1);
    CHECK(received[0].type_id == 1);
    CHECK(payload_of(received[0].buffer) == std::vector<uint8_t>({0x01, 0x02}));
  }

  SUBCASE("Empty message")
  {
    REQUIRE(link.send("Initialize", test::RawMessage()) == ErrorCode::OK);
    REQUIRE(link.feed_chunk(wire[0].data(), wire[0].size()) == ErrorCode::OK);
    REQUIRE(received.size() == 1);
    CHECK(received[0].type_id == 0);
    CHECK(received[0].buffer.size() == BARE_HEADER_SIZE);
  }

  SUBCASE("Back to back messages")
  {
    REQUIRE(link.send("Ping", test::RawMessage(std::vector<uint8_t>(70, 0x01))) ==
            ErrorCode::OK);
    REQUIRE(link.send("Features", test::RawMessage(std::vector<uint8_t>(3, 0x02))) ==
            ErrorCode::OK);
    REQUIRE(wire.size() == 3);

    for (const Chunk& chunk : wire)
    {
      REQUIRE(link.feed_chunk(chunk.data(), chunk.size()) == ErrorCode::OK);
    }

    REQUIRE(received.size() == 2);
    CHECK(received[0].type_id == 1);
    CHECK(received[0].buffer.size() == BARE_HEADER_SIZE + 70);
    CHECK(received[1].type_id == 17);
    CHECK(payload_of(received[1].buffer) == std::vector<uint8_t>(3, 0x02));
  }

  SUBCASE("Send failures are reported")
  {
    Link failing(registry, [](const uint8_t*, size_t) { return false; });
    CHECK(failing.send("Ping", test::RawMessage()) == ErrorCode::TRANSPORT_ERROR);
    CHECK(failing.send("Nope", test::RawMessage()) == ErrorCode::UNKNOWN_MESSAGE);
  }

  SUBCASE("Misaligned chunk")
  {
    Chunk chunk;
    chunk.fill(0);
    chunk[0] = 0x23;
    chunk[1] = 0x24;

    CHECK(link.feed_chunk(chunk.data(), chunk.size()) == ErrorCode::PROTOCOL_MISMATCH);
    CHECK(received.empty());
    CHECK_FALSE(link.receiving());
    CHECK_FALSE(logs.empty());
  }

  SUBCASE("Continuation chunk without a message in progress")
  {
    REQUIRE(link.send("Ping", test::RawMessage(std::vector<uint8_t>(100, 0x55))) ==
            ErrorCode::OK);
    REQUIRE(wire.size() == 2);

    CHECK(link.feed_chunk(wire[1].data(), wire[1].size()) == ErrorCode::PROTOCOL_MISMATCH);
    CHECK(received.empty());
  }

  SUBCASE("Reset drops a partial message")
  {
    REQUIRE(link.send("Ping", test::RawMessage(std::vector<uint8_t>(100, 0x55))) ==
            ErrorCode::OK);
    REQUIRE(link.feed_chunk(wire[0].data(), wire[0].size()) == ErrorCode::OK);
    CHECK(link.receiving());

    link.reset();
    CHECK_FALSE(link.receiving());

    // The continuation is now a misaligned start
    CHECK(link.feed_chunk(wire[1].data(), wire[1].size()) == ErrorCode::PROTOCOL_MISMATCH);
    CHECK(received.empty());
  }

  SUBCASE("Short chunk")
  {
    const uint8_t data[] = {0x23, 0x23, 0x00};
    CHECK(link.feed_chunk(data, sizeof(data)) == ErrorCode::BUFFER_UNDERFLOW);
    CHECK(link.feed_chunk(nullptr, 5) == ErrorCode::INVALID_ARGUMENT);
  }
}

TEST_CASE("Link buffer overflow protection")
{
  MessageRegistry registry;
  test::fill_registry(registry);

  std::vector<Chunk> wire;
  auto send = [&wire](const uint8_t* data, size_t len)
  {
    Chunk chunk;
    std::copy(data, data + len, chunk.begin());
    wire.push_back(chunk);
    return true;
  };

  size_t delivered = 0;
  Link link(registry, send, 64);
  link.set_message_handler([&delivered](uint16_t, const uint8_t*, size_t) { ++delivered; });

  CHECK(link.buffer_capacity() == 64);

  REQUIRE(link.send("Ping", test::RawMessage(std::vector<uint8_t>(65, 0x01))) == ErrorCode::OK);
  REQUIRE(link.send("Ping", test::RawMessage(std::vector<uint8_t>(64, 0x02))) == ErrorCode::OK);
  REQUIRE(wire.size() == 4);

  // Oversized message is rejected at its first chunk
  CHECK(link.feed_chunk(wire[0].data(), wire[0].size()) == ErrorCode::BUFFER_FULL);
  CHECK_FALSE(link.receiving());

  // Its continuation can't be taken for a new message
  CHECK(link.feed_chunk(wire[1].data(), wire[1].size()) == ErrorCode::PROTOCOL_MISMATCH);

  // A message at the limit still goes through
  CHECK(link.feed_chunk(wire[2].data(), wire[2].size()) == ErrorCode::OK);
  CHECK(link.feed_chunk(wire[3].data(), wire[3].size()) == ErrorCode::OK);
  CHECK(delivered == 1);
}
