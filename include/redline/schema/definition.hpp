#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace redline::schema {

struct FieldDefinition {
    std::string name;
    int32_t tag = 0;             // 0 = position + 1
    std::string type;            // scalar name or message type name
    std::string label = "optional";  // "optional", "required"
    bool redacted = false;
    bool derived = false;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(FieldDefinition, name, tag, type, label, redacted, derived)

struct MessageDefinition {
    std::string name;
    std::vector<FieldDefinition> fields;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(MessageDefinition, name, fields)

struct SchemaFile {
    std::string package;
    std::vector<MessageDefinition> messages;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SchemaFile, package, messages)

} // namespace redline::schema
