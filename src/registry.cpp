/**
 * @file registry.cpp
 * @brief Message registry implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "hidlink/registry.hpp"

#include <utility>

#include "frame.hpp"

namespace hid
{
namespace link
{

namespace
{

const char MESSAGE_TYPE_PREFIX[] = "MessageType_";
constexpr size_t MESSAGE_TYPE_PREFIX_LEN = sizeof(MESSAGE_TYPE_PREFIX) - 1;

}  // namespace

void MessageRegistry::add(const std::string& name, Factory factory)
{
  entries_[name] = Entry{false, 0, std::move(factory)};
}

void MessageRegistry::add(const std::string& name, uint16_t wire_type, Factory factory)
{
  entries_[name] = Entry{true, wire_type, std::move(factory)};
}

void MessageRegistry::set_message_type(const std::string& key, uint16_t type_id)
{
  message_types_[key] = type_id;
}

ErrorCode MessageRegistry::type_id(const std::string& name, uint16_t& out) const
{
  const auto entry = entries_.find(name);
  if (entry == entries_.end())
  {
    return ErrorCode::UNKNOWN_MESSAGE;
  }

  if (entry->second.has_wire_type)
  {
    out = entry->second.wire_type;
    return ErrorCode::OK;
  }

  const auto type = message_types_.find(MESSAGE_TYPE_PREFIX + name);
  if (type == message_types_.end())
  {
    return ErrorCode::CONFIGURATION_ERROR;
  }

  out = type->second;
  return ErrorCode::OK;
}

ErrorCode MessageRegistry::resolve(const std::string& name, const Message& data, uint16_t& type_id,
                                   std::vector<uint8_t>& payload) const
{
  uint16_t resolved = 0;
  const ErrorCode err = this->type_id(name, resolved);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  std::vector<uint8_t> bytes;
  if (!data.encode(bytes))
  {
    return ErrorCode::ENCODE_FAILED;
  }

  type_id = resolved;
  payload = std::move(bytes);
  return ErrorCode::OK;
}

ErrorCode MessageRegistry::name_of(uint16_t type_id, std::string& out) const
{
  for (const auto& type : message_types_)
  {
    if (type.second != type_id)
    {
      continue;
    }

    // Skip table entries that don't follow the MessageType_ convention
    if (type.first.compare(0, MESSAGE_TYPE_PREFIX_LEN, MESSAGE_TYPE_PREFIX) != 0)
    {
      continue;
    }

    std::string name = type.first.substr(MESSAGE_TYPE_PREFIX_LEN);
    if (entries_.count(name) == 0)
    {
      continue;
    }

    out = std::move(name);
    return ErrorCode::OK;
  }

  return ErrorCode::UNKNOWN_MESSAGE;
}

ErrorCode MessageRegistry::create(uint16_t type_id, std::unique_ptr<Message>& out) const
{
  std::string name;
  const ErrorCode err = name_of(type_id, name);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  const Entry& entry = entries_.at(name);
  std::unique_ptr<Message> message = entry.factory ? entry.factory() : nullptr;
  if (!message)
  {
    return ErrorCode::CONFIGURATION_ERROR;
  }

  out = std::move(message);
  return ErrorCode::OK;
}

ErrorCode MessageRegistry::decode_message(const uint8_t* buffer, size_t len,
                                          std::unique_ptr<Message>& out) const
{
  ByteReader reader(buffer, len);
  FrameHeader header;
  ErrorCode err = internal::parse_bare_header(reader, header);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (reader.remaining() < header.length)
  {
    return ErrorCode::BUFFER_UNDERFLOW;
  }

  std::unique_ptr<Message> message;
  err = create(header.type_id, message);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (!message->decode(reader.current(), header.length))
  {
    return ErrorCode::DECODE_FAILED;
  }

  out = std::move(message);
  return ErrorCode::OK;
}

}  // namespace link
}  // namespace hid
