#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace redline::schema {

class Message;
class MessageType;
class SchemaPool;

using MessagePtr = std::shared_ptr<const Message>;

enum class FieldKind {
    Scalar,
    Message,
};

enum class ScalarType {
    Bool,
    Int32,
    Int64,
    Double,
    String,
    Bytes,
};

enum class Label {
    Optional,
    Required,
};

/// Value slot of a single field. `std::monostate` means absent; a message
/// field may also hold a null MessagePtr, which is treated as absent.
using FieldValue = std::variant<std::monostate, bool, int32_t, int64_t, double,
                                std::string, MessagePtr>;

/// Parses a declared scalar type name ("bool", "int32", ...).
auto parse_scalar_type(std::string_view name) -> std::optional<ScalarType>;
auto scalar_type_name(ScalarType type) -> std::string_view;

/// True if the value is absent.
[[nodiscard]] auto is_absent(const FieldValue& value) -> bool;

/// Deep equality: nested messages are compared by value, not by pointer.
[[nodiscard]] auto values_equal(const FieldValue& a, const FieldValue& b) -> bool;

/// Describes one declared field of a message type. Owned by its MessageType.
class FieldDescriptor {
public:
    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto tag() const noexcept -> int32_t { return tag_; }

    /// Position of the field within its containing type.
    [[nodiscard]] auto index() const noexcept -> size_t { return index_; }

    [[nodiscard]] auto kind() const noexcept -> FieldKind { return kind_; }
    [[nodiscard]] auto is_message() const noexcept -> bool { return kind_ == FieldKind::Message; }

    /// Only meaningful when kind() == FieldKind::Scalar.
    [[nodiscard]] auto scalar_type() const noexcept -> ScalarType { return scalar_type_; }

    /// Fully qualified name of the referenced message type, or the scalar
    /// type name for scalar fields.
    [[nodiscard]] auto type_name() const noexcept -> const std::string& { return type_name_; }

    [[nodiscard]] auto label() const noexcept -> Label { return label_; }
    [[nodiscard]] auto is_required() const noexcept -> bool { return label_ == Label::Required; }

    /// Marked sensitive in the schema.
    [[nodiscard]] auto is_redacted() const noexcept -> bool { return redacted_; }

    /// Computed/static metadata that carries no instance data.
    [[nodiscard]] auto is_derived() const noexcept -> bool { return derived_; }

    [[nodiscard]] auto containing_type() const noexcept -> const MessageType* { return containing_type_; }

    /// Resolves the referenced message type through the owning pool.
    /// Returns nullptr for scalar fields and for unresolved references.
    [[nodiscard]] auto message_type() const -> const MessageType*;

    /// "<containing type>.<field>"
    [[nodiscard]] auto full_name() const -> std::string;

private:
    friend class SchemaPool;

    std::string name_;
    int32_t tag_ = 0;
    size_t index_ = 0;
    FieldKind kind_ = FieldKind::Scalar;
    ScalarType scalar_type_ = ScalarType::String;
    std::string type_name_;
    Label label_ = Label::Optional;
    bool redacted_ = false;
    bool derived_ = false;
    const MessageType* containing_type_ = nullptr;
    const SchemaPool* pool_ = nullptr;
};

} // namespace redline::schema
