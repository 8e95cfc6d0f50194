#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include "redline/core/error.hpp"
#include "redline/schema/message.hpp"

namespace redline::redact {

using json = nlohmann::json;

class Redactor;

/// A message-typed field whose type needs redaction, paired with the plan
/// for that type.
struct NestedField {
    const schema::FieldDescriptor* field;
    const Redactor* redactor;
};

/// Immutable redaction plan for one message type.
///
/// Plans are normally built by RedactorRegistry and shared read-only
/// between every caller and every parent plan, so `redact` may run
/// concurrently. A type with nothing to redact maps to the shared no-op
/// plan, which returns its input unchanged.
class Redactor {
public:
    /// Plan clearing `redacted_fields` and redacting `message_fields` of
    /// `type`. RedactorRegistry derives these lists from the schema; a plan
    /// assembled by hand is only checked against messages in `redact`.
    Redactor(const schema::MessageType& type,
             std::vector<const schema::FieldDescriptor*> redacted_fields,
             std::vector<NestedField> message_fields);

    Redactor(const Redactor&) = delete;
    Redactor& operator=(const Redactor&) = delete;

    /// The process-wide no-op plan.
    [[nodiscard]] static auto noop() -> const Redactor&;

    [[nodiscard]] auto is_noop() const noexcept -> bool { return type_ == nullptr; }

    /// Type this plan applies to; nullptr for the no-op plan.
    [[nodiscard]] auto type() const noexcept -> const schema::MessageType* { return type_; }

    [[nodiscard]] auto redacted_fields() const noexcept
        -> const std::vector<const schema::FieldDescriptor*>& { return redacted_fields_; }

    [[nodiscard]] auto message_fields() const noexcept
        -> const std::vector<NestedField>& { return message_fields_; }

    /// Returns `message` with every redacted field cleared and every nested
    /// message redacted by its own plan. A null message yields null.
    ///
    /// Fails with ExecutionInconsistency if the message is not of this
    /// plan's type or the builder rejects an operation; no partially
    /// redacted message is ever returned.
    [[nodiscard]] auto redact(const schema::MessagePtr& message) const
        -> Result<schema::MessagePtr>;

    /// Plan summary: type, cleared fields and nested fields (recursively).
    [[nodiscard]] auto describe() const -> json;

private:
    Redactor() = default;

    const schema::MessageType* type_ = nullptr;
    std::vector<const schema::FieldDescriptor*> redacted_fields_;
    std::vector<NestedField> message_fields_;
};

} // namespace redline::redact
