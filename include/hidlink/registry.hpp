/**
 * @file registry.hpp
 * @brief Message registry
 *
 * Maps message names to type ids and to the code that serializes them.
 * The message catalogue itself is supplied by the application.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "hidlink/protocol.hpp"

namespace hid
{
namespace link
{

/**
 * @brief Serializable message
 *
 * Implemented by the application for every message it exchanges with the
 * device.
 */
class Message
{
 public:
  virtual ~Message() = default;

  /**
   * @brief Serialize the message payload
   * @param out Output buffer (appended to)
   * @return true on success
   */
  virtual bool encode(std::vector<uint8_t>& out) const = 0;

  /**
   * @brief Parse the message payload
   * @param data Payload data (can be nullptr if len == 0)
   * @param len  Payload length in bytes
   * @return true on success
   */
  virtual bool decode(const uint8_t* data, size_t len) = 0;
};

/**
 * @brief Message catalogue
 *
 * Type ids are resolved in two steps:
 * 1. an explicit wire type given to add(), used by messages that share a
 *    type id with another message;
 * 2. the "MessageType_<name>" entry set with set_message_type().
 *
 * Example:
 * @code
 * MessageRegistry registry;
 * registry.add("Ping", [] { return std::unique_ptr<Message>(new Ping()); });
 * registry.set_message_type("MessageType_Ping", 1);
 * @endcode
 */
class MessageRegistry
{
 public:
  /**
   * @brief Creates an empty message of one kind
   */
  using Factory = std::function<std::unique_ptr<Message>()>;

  /**
   * @brief Register a message resolved through the MessageType_ table
   */
  void add(const std::string& name, Factory factory);

  /**
   * @brief Register a message with an explicit wire type
   */
  void add(const std::string& name, uint16_t wire_type, Factory factory);

  /**
   * @brief Set an entry of the name based type table
   *
   * @param key     "MessageType_" followed by the message name
   * @param type_id Type id sent on the wire
   */
  void set_message_type(const std::string& key, uint16_t type_id);

  /**
   * @brief Resolve the type id of a registered message
   *
   * @return ErrorCode::OK, UNKNOWN_MESSAGE if name is not registered, or
   *         CONFIGURATION_ERROR if neither a wire type nor a MessageType_
   *         entry exists
   */
  ErrorCode type_id(const std::string& name, uint16_t& out) const;

  /**
   * @brief Resolve a message to its type id and serialized payload
   *
   * @param name    Message name
   * @param data    Message to serialize
   * @param type_id Resolved type id
   * @param payload Serialized payload
   * @return ErrorCode::OK, UNKNOWN_MESSAGE, CONFIGURATION_ERROR or
   *         ENCODE_FAILED. Outputs are untouched on failure.
   */
  ErrorCode resolve(const std::string& name, const Message& data, uint16_t& type_id,
                    std::vector<uint8_t>& payload) const;

  /**
   * @brief Create an empty message for a received type id
   *
   * Only MessageType_ entries are searched; explicit wire types are used
   * for sending only.
   *
   * @return ErrorCode::OK or UNKNOWN_MESSAGE
   */
  ErrorCode create(uint16_t type_id, std::unique_ptr<Message>& out) const;

  /**
   * @brief Name registered for a received type id
   *
   * @return ErrorCode::OK or UNKNOWN_MESSAGE
   */
  ErrorCode name_of(uint16_t type_id, std::string& out) const;

  /**
   * @brief Decode a reassembled short form buffer
   *
   * @param buffer Bare header followed by the payload
   * @param len    Buffer length in bytes
   * @param out    Decoded message
   * @return ErrorCode::OK, BUFFER_UNDERFLOW if the buffer is shorter than its
   *         header declares, UNKNOWN_MESSAGE or DECODE_FAILED
   */
  ErrorCode decode_message(const uint8_t* buffer, size_t len, std::unique_ptr<Message>& out) const;

  size_t size() const
  {
    return entries_.size();
  }

 private:
  struct Entry
  {
    bool has_wire_type;
    uint16_t wire_type;
    Factory factory;
  };

  std::map<std::string, Entry> entries_;             ///< Registered messages by name
  std::map<std::string, uint16_t> message_types_;  ///< "MessageType_<name>" table
};

}  // namespace link
}  // namespace hid
