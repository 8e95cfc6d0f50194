#include "redline/schema/message.hpp"

#include <sstream>

namespace redline::schema {

namespace {

void append_value(std::ostringstream& out, const FieldValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) {
        out << (*b ? "true" : "false");
    } else if (const auto* i32 = std::get_if<int32_t>(&value)) {
        out << *i32;
    } else if (const auto* i64 = std::get_if<int64_t>(&value)) {
        out << *i64;
    } else if (const auto* d = std::get_if<double>(&value)) {
        out << *d;
    } else if (const auto* s = std::get_if<std::string>(&value)) {
        out << *s;
    } else if (const auto* m = std::get_if<MessagePtr>(&value)) {
        out << (*m ? (*m)->to_string() : "null");
    }
}

auto value_matches(const FieldDescriptor& field, const FieldValue& value) -> bool {
    if (field.is_message()) {
        return std::holds_alternative<MessagePtr>(value);
    }
    switch (field.scalar_type()) {
        case ScalarType::Bool: return std::holds_alternative<bool>(value);
        case ScalarType::Int32: return std::holds_alternative<int32_t>(value);
        case ScalarType::Int64: return std::holds_alternative<int64_t>(value);
        case ScalarType::Double: return std::holds_alternative<double>(value);
        case ScalarType::String:
        case ScalarType::Bytes: return std::holds_alternative<std::string>(value);
    }
    return false;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Message
// ---------------------------------------------------------------------------

auto Message::get(const FieldDescriptor& field) const -> const FieldValue* {
    if (field.containing_type() != type_ || field.index() >= values_.size()) {
        return nullptr;
    }
    return &values_[field.index()];
}

auto Message::get(std::string_view name) const -> const FieldValue* {
    const auto* field = type_->find_field(name);
    if (!field) return nullptr;
    return &values_[field->index()];
}

auto Message::has(std::string_view name) const -> bool {
    const auto* value = get(name);
    return value != nullptr && !is_absent(*value);
}

auto Message::get_message(std::string_view name) const -> MessagePtr {
    const auto* value = get(name);
    if (!value) return nullptr;
    if (const auto* msg = std::get_if<MessagePtr>(value)) return *msg;
    return nullptr;
}

auto Message::to_string() const -> std::string {
    std::ostringstream out;
    out << type_->name() << "{";

    bool first = true;
    for (const auto& field : type_->fields()) {
        const auto& value = values_[field.index()];
        if (field.is_redacted() || is_absent(value)) continue;
        if (!first) out << ", ";
        first = false;
        out << field.name() << "=";
        append_value(out, value);
    }

    out << "}";
    return out.str();
}

auto operator==(const Message& a, const Message& b) -> bool {
    if (&a == &b) return true;
    if (a.type_ != b.type_ || a.values_.size() != b.values_.size()) return false;
    for (size_t i = 0; i < a.values_.size(); ++i) {
        if (!values_equal(a.values_[i], b.values_[i])) return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Builder
// ---------------------------------------------------------------------------

Builder::Builder(const MessageType& type)
    : type_(&type), values_(type.field_count()) {}

auto Builder::from(const Message& message) -> Builder {
    Builder builder(message.type());
    builder.values_ = message.values_;
    return builder;
}

auto Builder::check_field(const FieldDescriptor& field) const -> VoidResult {
    if (field.containing_type() != type_ || field.index() >= values_.size() ||
        &type_->field(field.index()) != &field) {
        return std::unexpected(make_error(
            ErrorCode::TypeMismatch, "Field does not belong to message type",
            field.full_name() + " on " + type_->full_name()));
    }
    if (field.is_derived()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "Derived field has no instance storage",
            field.full_name()));
    }
    return {};
}

auto Builder::lookup(std::string_view name) const -> Result<const FieldDescriptor*> {
    const auto* field = type_->find_field(name);
    if (!field) {
        return std::unexpected(make_error(
            ErrorCode::NotFound, "Unknown field",
            type_->full_name() + "." + std::string(name)));
    }
    return field;
}

auto Builder::get(const FieldDescriptor& field) const -> Result<FieldValue> {
    if (auto ok = check_field(field); !ok) {
        return std::unexpected(ok.error());
    }
    return values_[field.index()];
}

auto Builder::set(const FieldDescriptor& field, FieldValue value) -> VoidResult {
    if (auto ok = check_field(field); !ok) {
        return ok;
    }

    if (is_absent(value)) {
        values_[field.index()] = std::monostate{};
        return {};
    }

    if (field.is_message()) {
        const auto* expected = field.message_type();
        if (!expected) {
            return std::unexpected(make_error(
                ErrorCode::SchemaError, "Unresolved message type",
                field.full_name() + " -> " + field.type_name()));
        }
        const auto* msg = std::get_if<MessagePtr>(&value);
        if (!msg || &(*msg)->type() != expected) {
            return std::unexpected(make_error(
                ErrorCode::TypeMismatch, "Value is not a " + field.type_name(),
                field.full_name()));
        }
    } else {
        if (field.scalar_type() == ScalarType::Int64) {
            if (const auto* narrow = std::get_if<int32_t>(&value)) {
                value = static_cast<int64_t>(*narrow);
            }
        }
        if (!value_matches(field, value)) {
            return std::unexpected(make_error(
                ErrorCode::TypeMismatch,
                "Value does not match declared type " + field.type_name(),
                field.full_name()));
        }
    }

    values_[field.index()] = std::move(value);
    return {};
}

auto Builder::set(std::string_view name, FieldValue value) -> VoidResult {
    auto field = lookup(name);
    if (!field) {
        return std::unexpected(field.error());
    }
    return set(**field, std::move(value));
}

auto Builder::clear(const FieldDescriptor& field) -> VoidResult {
    return set(field, std::monostate{});
}

auto Builder::clear(std::string_view name) -> VoidResult {
    return set(name, std::monostate{});
}

auto Builder::build() const -> Result<MessagePtr> {
    for (const auto& field : type_->fields()) {
        if (field.is_required() && is_absent(values_[field.index()])) {
            return std::unexpected(make_error(
                ErrorCode::MissingRequiredField, "Required field is not set",
                field.full_name()));
        }
    }
    return std::make_shared<const Message>(Message::Key{}, *type_, values_);
}

} // namespace redline::schema
