#pragma once

#include <memory>
#include <string>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "redline/schema/message.hpp"
#include "redline/schema/schema_pool.hpp"

namespace redline::testing {

/// Schema used across the redaction tests:
///   NotRedacted   { a, b }
///   Redacted      { a (redacted), b, c }
///   RedactedChild { a, b: Redacted, c: NotRedacted }
inline constexpr const char* kRedactedSchema = R"({
    "package": "example.redacted",
    "messages": [
        { "name": "NotRedacted", "fields": [
            { "name": "a", "tag": 1, "type": "string" },
            { "name": "b", "tag": 2, "type": "string" }
        ]},
        { "name": "Redacted", "fields": [
            { "name": "a", "tag": 1, "type": "string", "redacted": true },
            { "name": "b", "tag": 2, "type": "string" },
            { "name": "c", "tag": 3, "type": "string" }
        ]},
        { "name": "RedactedChild", "fields": [
            { "name": "a", "tag": 1, "type": "string" },
            { "name": "b", "tag": 2, "type": "Redacted" },
            { "name": "c", "tag": 3, "type": "NotRedacted" }
        ]}
    ]
})";

inline auto make_redacted_pool() -> std::unique_ptr<schema::SchemaPool> {
    auto pool = std::make_unique<schema::SchemaPool>();
    auto loaded = pool->load_json(nlohmann::json::parse(kRedactedSchema));
    REQUIRE(loaded.has_value());
    return pool;
}

inline auto require_type(const schema::SchemaPool& pool, const std::string& name)
    -> const schema::MessageType& {
    const auto* type = pool.find(name);
    REQUIRE(type != nullptr);
    return *type;
}

inline auto build(const schema::Builder& builder) -> schema::MessagePtr {
    auto built = builder.build();
    REQUIRE(built.has_value());
    return *built;
}

inline auto make_redacted(const schema::SchemaPool& pool) -> schema::MessagePtr {
    schema::Builder b(require_type(pool, "example.redacted.Redacted"));
    REQUIRE(b.set("a", std::string("a")).has_value());
    REQUIRE(b.set("b", std::string("b")).has_value());
    REQUIRE(b.set("c", std::string("c")).has_value());
    return build(b);
}

inline auto make_not_redacted(const schema::SchemaPool& pool) -> schema::MessagePtr {
    schema::Builder b(require_type(pool, "example.redacted.NotRedacted"));
    REQUIRE(b.set("a", std::string("a")).has_value());
    REQUIRE(b.set("b", std::string("b")).has_value());
    return build(b);
}

inline auto make_redacted_child(const schema::SchemaPool& pool) -> schema::MessagePtr {
    schema::Builder b(require_type(pool, "example.redacted.RedactedChild"));
    REQUIRE(b.set("a", std::string("a")).has_value());
    REQUIRE(b.set("b", make_redacted(pool)).has_value());
    REQUIRE(b.set("c", make_not_redacted(pool)).has_value());
    return build(b);
}

} // namespace redline::testing
