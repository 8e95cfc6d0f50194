#include "redline/schema/field.hpp"
#include "redline/schema/message.hpp"
#include "redline/schema/schema_pool.hpp"

namespace redline::schema {

auto parse_scalar_type(std::string_view name) -> std::optional<ScalarType> {
    if (name == "bool") return ScalarType::Bool;
    if (name == "int32") return ScalarType::Int32;
    if (name == "int64") return ScalarType::Int64;
    if (name == "double") return ScalarType::Double;
    if (name == "string") return ScalarType::String;
    if (name == "bytes") return ScalarType::Bytes;
    return std::nullopt;
}

auto scalar_type_name(ScalarType type) -> std::string_view {
    switch (type) {
        case ScalarType::Bool: return "bool";
        case ScalarType::Int32: return "int32";
        case ScalarType::Int64: return "int64";
        case ScalarType::Double: return "double";
        case ScalarType::String: return "string";
        case ScalarType::Bytes: return "bytes";
    }
    return "unknown";
}

auto is_absent(const FieldValue& value) -> bool {
    if (std::holds_alternative<std::monostate>(value)) return true;
    if (const auto* msg = std::get_if<MessagePtr>(&value)) return *msg == nullptr;
    return false;
}

auto values_equal(const FieldValue& a, const FieldValue& b) -> bool {
    if (is_absent(a) || is_absent(b)) {
        return is_absent(a) && is_absent(b);
    }
    if (a.index() != b.index()) return false;

    if (const auto* pa = std::get_if<MessagePtr>(&a)) {
        const auto& pb = std::get<MessagePtr>(b);
        if (*pa == pb) return true;
        return **pa == *pb;
    }
    return a == b;
}

auto FieldDescriptor::message_type() const -> const MessageType* {
    if (kind_ != FieldKind::Message || pool_ == nullptr) {
        return nullptr;
    }
    return pool_->find(type_name_);
}

auto FieldDescriptor::full_name() const -> std::string {
    if (containing_type_ == nullptr) return name_;
    return containing_type_->full_name() + "." + name_;
}

} // namespace redline::schema
