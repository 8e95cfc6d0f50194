#pragma once

#include <nlohmann/json.hpp>

#include "redline/core/error.hpp"
#include "redline/schema/message.hpp"

namespace redline::schema {

using json = nlohmann::json;

/// Object keyed by field name. Absent and derived fields are omitted; nested
/// messages become nested objects.
[[nodiscard]] auto message_to_json(const Message& message) -> json;

/// Decode an object into a message of `type`. Unknown fields, derived
/// fields and kind mismatches are SerializationError; `null` means absent.
[[nodiscard]] auto message_from_json(const MessageType& type, const json& j) -> Result<MessagePtr>;

} // namespace redline::schema
