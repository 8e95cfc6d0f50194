#include "redline/schema/message_type.hpp"

namespace redline::schema {

auto MessageType::find_field(std::string_view name) const -> const FieldDescriptor* {
    for (const auto& field : fields_) {
        if (field.name() == name) return &field;
    }
    return nullptr;
}

auto MessageType::find_field_by_tag(int32_t tag) const -> const FieldDescriptor* {
    for (const auto& field : fields_) {
        if (field.tag() == tag) return &field;
    }
    return nullptr;
}

} // namespace redline::schema
