#include "redline/schema/json_codec.hpp"

#include <limits>

namespace redline::schema {

namespace {

auto value_to_json(const FieldValue& value) -> json {
    if (const auto* b = std::get_if<bool>(&value)) return *b;
    if (const auto* i32 = std::get_if<int32_t>(&value)) return *i32;
    if (const auto* i64 = std::get_if<int64_t>(&value)) return *i64;
    if (const auto* d = std::get_if<double>(&value)) return *d;
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    if (const auto* m = std::get_if<MessagePtr>(&value)) {
        if (*m) return message_to_json(**m);
    }
    return nullptr;
}

auto decode_error(const FieldDescriptor& field, std::string message) -> Error {
    return make_error(ErrorCode::SerializationError, std::move(message), field.full_name());
}

auto scalar_from_json(const FieldDescriptor& field, const json& j) -> Result<FieldValue> {
    switch (field.scalar_type()) {
        case ScalarType::Bool:
            if (!j.is_boolean()) break;
            return FieldValue{j.get<bool>()};
        case ScalarType::Int32: {
            if (!j.is_number_integer()) break;
            constexpr auto max32 = std::numeric_limits<int32_t>::max();
            constexpr auto min32 = std::numeric_limits<int32_t>::min();
            if (j.is_number_unsigned()) {
                auto u = j.get<uint64_t>();
                if (u > static_cast<uint64_t>(max32)) {
                    return std::unexpected(decode_error(field, "Value out of range for int32"));
                }
                return FieldValue{static_cast<int32_t>(u)};
            }
            auto v = j.get<int64_t>();
            if (v < min32 || v > max32) {
                return std::unexpected(decode_error(field, "Value out of range for int32"));
            }
            return FieldValue{static_cast<int32_t>(v)};
        }
        case ScalarType::Int64:
            if (!j.is_number_integer()) break;
            if (j.is_number_unsigned() &&
                j.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return std::unexpected(decode_error(field, "Value out of range for int64"));
            }
            return FieldValue{j.get<int64_t>()};
        case ScalarType::Double:
            if (!j.is_number()) break;
            return FieldValue{j.get<double>()};
        case ScalarType::String:
        case ScalarType::Bytes:
            if (!j.is_string()) break;
            return FieldValue{j.get<std::string>()};
    }
    return std::unexpected(decode_error(
        field, "Expected " + std::string(scalar_type_name(field.scalar_type())) +
               ", got " + j.type_name()));
}

} // anonymous namespace

auto message_to_json(const Message& message) -> json {
    json j = json::object();
    for (const auto& field : message.type().fields()) {
        if (field.is_derived()) continue;
        const auto* value = message.get(field);
        if (!value || is_absent(*value)) continue;
        j[field.name()] = value_to_json(*value);
    }
    return j;
}

auto message_from_json(const MessageType& type, const json& j) -> Result<MessagePtr> {
    if (!j.is_object()) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError,
            "Expected JSON object for " + type.full_name(),
            std::string("got ") + j.type_name()));
    }

    Builder builder(type);
    for (const auto& [key, value] : j.items()) {
        const auto* field = type.find_field(key);
        if (!field) {
            return std::unexpected(make_error(
                ErrorCode::SerializationError, "Unknown field",
                type.full_name() + "." + key));
        }
        if (field->is_derived()) {
            return std::unexpected(decode_error(*field, "Derived field cannot be decoded"));
        }
        if (value.is_null()) continue;

        FieldValue decoded;
        if (field->is_message()) {
            const auto* nested_type = field->message_type();
            if (!nested_type) {
                return std::unexpected(decode_error(
                    *field, "Unresolved message type " + field->type_name()));
            }
            auto nested = message_from_json(*nested_type, value);
            if (!nested) {
                return std::unexpected(nested.error());
            }
            decoded = std::move(*nested);
        } else {
            auto scalar = scalar_from_json(*field, value);
            if (!scalar) {
                return std::unexpected(scalar.error());
            }
            decoded = std::move(*scalar);
        }

        if (auto set = builder.set(*field, std::move(decoded)); !set) {
            return std::unexpected(wrap_error(
                ErrorCode::SerializationError, "Cannot decode " + field->full_name(), set.error()));
        }
    }

    auto built = builder.build();
    if (!built) {
        return std::unexpected(wrap_error(
            ErrorCode::SerializationError, "Incomplete " + type.full_name(), built.error()));
    }
    return built;
}

} // namespace redline::schema
