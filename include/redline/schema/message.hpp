#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "redline/core/error.hpp"
#include "redline/schema/field.hpp"
#include "redline/schema/message_type.hpp"

namespace redline::schema {

class Builder;

/// Immutable instance of a MessageType. Only a Builder creates messages;
/// they are shared through MessagePtr.
class Message {
public:
    /// Constructor tag; only a Builder creates messages.
    class Key {
        friend class Builder;
        Key() = default;
    };

    Message(Key, const MessageType& type, std::vector<FieldValue> values)
        : type_(&type), values_(std::move(values)) {}

    Message(const Message&) = delete;
    Message& operator=(const Message&) = delete;

    [[nodiscard]] auto type() const noexcept -> const MessageType& { return *type_; }

    /// Value of a field of this message's type. Returns nullptr if the
    /// descriptor belongs to another type.
    [[nodiscard]] auto get(const FieldDescriptor& field) const -> const FieldValue*;

    /// Value by field name. Returns nullptr if the type has no such field.
    [[nodiscard]] auto get(std::string_view name) const -> const FieldValue*;

    /// True if the named field exists and is set.
    [[nodiscard]] auto has(std::string_view name) const -> bool;

    /// Nested message by field name; nullptr if absent or not a message.
    [[nodiscard]] auto get_message(std::string_view name) const -> MessagePtr;

    /// Debug form, e.g. `Redacted{b=b, c=c}`. Absent fields are omitted and
    /// fields marked redacted are never printed.
    [[nodiscard]] auto to_string() const -> std::string;

    friend auto operator==(const Message& a, const Message& b) -> bool;

private:
    friend class Builder;

    const MessageType* type_;
    std::vector<FieldValue> values_;
};

/// Mutable staging object for constructing a Message.
class Builder {
public:
    explicit Builder(const MessageType& type);

    /// Builder pre-populated with every field of `message`.
    [[nodiscard]] static auto from(const Message& message) -> Builder;

    [[nodiscard]] auto type() const noexcept -> const MessageType& { return *type_; }

    [[nodiscard]] auto get(const FieldDescriptor& field) const -> Result<FieldValue>;

    /// Set a field. The value must match the declared kind; int32 values are
    /// widened for int64 fields. Setting std::monostate clears the field.
    auto set(const FieldDescriptor& field, FieldValue value) -> VoidResult;
    auto set(std::string_view name, FieldValue value) -> VoidResult;

    auto clear(const FieldDescriptor& field) -> VoidResult;
    auto clear(std::string_view name) -> VoidResult;

    /// Finalize into a new immutable message. Fails if a required field is
    /// absent.
    [[nodiscard]] auto build() const -> Result<MessagePtr>;

private:
    auto check_field(const FieldDescriptor& field) const -> VoidResult;
    auto lookup(std::string_view name) const -> Result<const FieldDescriptor*>;

    const MessageType* type_;
    std::vector<FieldValue> values_;
};

} // namespace redline::schema
