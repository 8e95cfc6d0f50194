#include <catch2/catch_test_macros.hpp>

#include <string>

#include "fixtures/redacted_schema.hpp"
#include "redline/redact/registry.hpp"

using namespace redline;
using namespace redline::redact;
using namespace redline::schema;

namespace {

auto require_plan(RedactorRegistry& registry, const MessageType& type) -> const Redactor& {
    auto plan = registry.get(type);
    REQUIRE(plan.has_value());
    REQUIRE(*plan != nullptr);
    return **plan;
}

auto require_redact(const Redactor& plan, const MessagePtr& message) -> MessagePtr {
    auto redacted = plan.redact(message);
    REQUIRE(redacted.has_value());
    return *redacted;
}

} // anonymous namespace

TEST_CASE("Redactor clears redacted fields", "[redact][redactor]") {
    auto pool = testing::make_redacted_pool();
    RedactorRegistry registry;
    const auto& type = testing::require_type(*pool, "example.redacted.Redacted");
    const auto& plan = require_plan(registry, type);

    auto message = testing::make_redacted(*pool);
    auto redacted = require_redact(plan, message);

    auto expected_builder = Builder::from(*message);
    REQUIRE(expected_builder.clear("a").has_value());
    auto expected = testing::build(expected_builder);

    CHECK(*redacted == *expected);
    CHECK_FALSE(redacted->has("a"));
    CHECK(std::get<std::string>(*redacted->get("b")) == "b");
    CHECK(std::get<std::string>(*redacted->get("c")) == "c");

    // The input is untouched.
    CHECK(std::get<std::string>(*message->get("a")) == "a");
}

TEST_CASE("Redactor leaves messages without redactions alone", "[redact][redactor]") {
    auto pool = testing::make_redacted_pool();
    RedactorRegistry registry;
    const auto& plan = require_plan(
        registry, testing::require_type(*pool, "example.redacted.NotRedacted"));

    CHECK(plan.is_noop());
    CHECK(&plan == &Redactor::noop());

    auto message = testing::make_not_redacted(*pool);
    auto redacted = require_redact(plan, message);

    CHECK(redacted == message);
    CHECK(*redacted == *message);
}

TEST_CASE("Redactor recurses into nested messages", "[redact][redactor]") {
    auto pool = testing::make_redacted_pool();
    RedactorRegistry registry;
    const auto& plan = require_plan(
        registry, testing::require_type(*pool, "example.redacted.RedactedChild"));

    CHECK_FALSE(plan.is_noop());
    CHECK(plan.redacted_fields().empty());
    REQUIRE(plan.message_fields().size() == 1);
    CHECK(plan.message_fields()[0].field->name() == "b");

    auto message = testing::make_redacted_child(*pool);
    auto redacted = require_redact(plan, message);

    // Expected: b.a cleared, everything else kept.
    auto nested_builder = Builder::from(*message->get_message("b"));
    REQUIRE(nested_builder.clear("a").has_value());
    auto expected_builder = Builder::from(*message);
    REQUIRE(expected_builder.set("b", testing::build(nested_builder)).has_value());
    CHECK(*redacted == *testing::build(expected_builder));

    SECTION("redaction commutes with nested field access") {
        const auto& nested_plan = require_plan(
            registry, testing::require_type(*pool, "example.redacted.Redacted"));
        auto direct = require_redact(nested_plan, message->get_message("b"));
        CHECK(*redacted->get_message("b") == *direct);
    }

    SECTION("nested fields without redactions pass through by reference") {
        CHECK(redacted->get_message("c") == message->get_message("c"));
    }

    SECTION("plain fields are kept") {
        CHECK(std::get<std::string>(*redacted->get("a")) == "a");
    }
}

TEST_CASE("Redactor is idempotent", "[redact][redactor]") {
    auto pool = testing::make_redacted_pool();
    RedactorRegistry registry;

    for (const auto* name : {"example.redacted.Redacted",
                             "example.redacted.NotRedacted",
                             "example.redacted.RedactedChild"}) {
        const auto& type = testing::require_type(*pool, name);
        const auto& plan = require_plan(registry, type);

        MessagePtr message;
        if (type.name() == "Redacted") message = testing::make_redacted(*pool);
        else if (type.name() == "NotRedacted") message = testing::make_not_redacted(*pool);
        else message = testing::make_redacted_child(*pool);

        auto once = require_redact(plan, message);
        auto twice = require_redact(plan, once);
        CHECK(*twice == *once);
    }
}

TEST_CASE("Redactor propagates absence", "[redact][redactor]") {
    auto pool = testing::make_redacted_pool();
    RedactorRegistry registry;

    SECTION("null input") {
        const auto& plan = require_plan(
            registry, testing::require_type(*pool, "example.redacted.Redacted"));
        auto redacted = plan.redact(nullptr);
        REQUIRE(redacted.has_value());
        CHECK(*redacted == nullptr);
        CHECK(Redactor::noop().redact(nullptr).value() == nullptr);
    }

    SECTION("absent nested message stays absent") {
        const auto& type = testing::require_type(*pool, "example.redacted.RedactedChild");
        Builder b(type);
        REQUIRE(b.set("a", std::string("a")).has_value());
        auto message = testing::build(b);

        auto redacted = require_redact(require_plan(registry, type), message);
        CHECK_FALSE(redacted->has("b"));
        CHECK_FALSE(redacted->has("c"));
        CHECK(*redacted == *message);
    }

    SECTION("registry redact accepts null") {
        auto redacted = registry.redact(nullptr);
        REQUIRE(redacted.has_value());
        CHECK(*redacted == nullptr);
    }
}

TEST_CASE("Redactor clears redacted message fields without recursing", "[redact][redactor]") {
    SchemaPool pool;
    REQUIRE(pool.load_json(nlohmann::json::parse(R"({
        "package": "example.secret",
        "messages": [
            { "name": "Card", "fields": [
                { "name": "number", "type": "string", "redacted": true },
                { "name": "brand",  "type": "string" }
            ]},
            { "name": "Wallet", "fields": [
                { "name": "owner",   "type": "string" },
                { "name": "primary", "type": "Card", "redacted": true },
                { "name": "backup",  "type": "Card" },
                { "name": "checksum", "type": "string", "derived": true, "redacted": true }
            ]}
        ]
    })")).has_value());

    RedactorRegistry registry;
    const auto& wallet = testing::require_type(pool, "example.secret.Wallet");
    const auto& card = testing::require_type(pool, "example.secret.Card");
    const auto& plan = require_plan(registry, wallet);

    REQUIRE(plan.redacted_fields().size() == 1);
    CHECK(plan.redacted_fields()[0]->name() == "primary");
    REQUIRE(plan.message_fields().size() == 1);
    CHECK(plan.message_fields()[0].field->name() == "backup");

    Builder card_builder(card);
    REQUIRE(card_builder.set("number", std::string("4111")).has_value());
    REQUIRE(card_builder.set("brand", std::string("visa")).has_value());
    auto a_card = testing::build(card_builder);

    Builder b(wallet);
    REQUIRE(b.set("owner", std::string("ann")).has_value());
    REQUIRE(b.set("primary", a_card).has_value());
    REQUIRE(b.set("backup", a_card).has_value());

    auto redacted = require_redact(plan, testing::build(b));
    CHECK_FALSE(redacted->has("primary"));
    REQUIRE(redacted->has("backup"));
    CHECK_FALSE(redacted->get_message("backup")->has("number"));
    CHECK(std::get<std::string>(*redacted->get_message("backup")->get("brand")) == "visa");
    CHECK(std::get<std::string>(*redacted->get("owner")) == "ann");
}

TEST_CASE("Redactor rejects messages of another type", "[redact][redactor]") {
    auto pool = testing::make_redacted_pool();
    RedactorRegistry registry;
    const auto& plan = require_plan(
        registry, testing::require_type(*pool, "example.redacted.Redacted"));

    auto r = plan.redact(testing::make_redacted_child(*pool));
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code() == ErrorCode::ExecutionInconsistency);
}

TEST_CASE("Redactor describe summarizes the plan", "[redact][redactor]") {
    auto pool = testing::make_redacted_pool();
    RedactorRegistry registry;
    const auto& plan = require_plan(
        registry, testing::require_type(*pool, "example.redacted.RedactedChild"));

    auto j = plan.describe();
    CHECK(j["type"] == "example.redacted.RedactedChild");
    CHECK(j["noop"] == false);
    CHECK(j["redacted"].empty());
    REQUIRE(j["nested"].size() == 1);
    CHECK(j["nested"][0]["field"] == "b");
    CHECK(j["nested"][0]["type"] == "example.redacted.Redacted");
    CHECK(j["nested"][0]["plan"]["redacted"] == nlohmann::json::array({"a"}));

    CHECK(Redactor::noop().describe() == nlohmann::json{{"noop", true}});
}

TEST_CASE("Redactor reports plans that do not fit the message", "[redact][redactor]") {
    auto pool = testing::make_redacted_pool();
    const auto& redacted_type = testing::require_type(*pool, "example.redacted.Redacted");
    const auto& not_redacted_type = testing::require_type(*pool, "example.redacted.NotRedacted");
    const auto& child_type = testing::require_type(*pool, "example.redacted.RedactedChild");

    SECTION("redacted field of another type") {
        Redactor plan(redacted_type, {not_redacted_type.find_field("a")}, {});

        auto r = plan.redact(testing::make_redacted(*pool));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::ExecutionInconsistency);
        CHECK(r.error().detail().find("Field does not belong to message type") != std::string::npos);
    }

    SECTION("nested field of another type") {
        Redactor plan(child_type, {},
                      {NestedField{redacted_type.find_field("b"), &Redactor::noop()}});

        auto r = plan.redact(testing::make_redacted_child(*pool));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::ExecutionInconsistency);
    }

    SECTION("nested field holding a scalar") {
        Redactor nested(redacted_type, {redacted_type.find_field("a")}, {});
        Redactor plan(child_type, {}, {NestedField{child_type.find_field("a"), &nested}});

        auto r = plan.redact(testing::make_redacted_child(*pool));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::ExecutionInconsistency);
        CHECK(r.error().message() == "Nested field does not hold a message");
    }

    SECTION("nested plan for another type") {
        Redactor nested(not_redacted_type, {}, {});
        Redactor plan(child_type, {}, {NestedField{child_type.find_field("b"), &nested}});

        auto r = plan.redact(testing::make_redacted_child(*pool));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::ExecutionInconsistency);
    }

    SECTION("cleared field is required") {
        SchemaPool accounts;
        REQUIRE(accounts.load_json(nlohmann::json::parse(R"({
            "package": "example.bank",
            "messages": [ { "name": "Account", "fields": [
                { "name": "id", "type": "string", "label": "required" },
                { "name": "owner", "type": "string" }
            ]} ]
        })")).has_value());
        const auto& account = testing::require_type(accounts, "example.bank.Account");

        Builder b(account);
        REQUIRE(b.set("id", std::string("acc-1")).has_value());
        auto message = testing::build(b);

        Redactor plan(account, {account.find_field("id")}, {});
        auto r = plan.redact(message);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::ExecutionInconsistency);
        CHECK(r.error().detail().find("Required field is not set") != std::string::npos);
    }
}
