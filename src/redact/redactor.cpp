#include "redline/redact/redactor.hpp"
#include "redline/core/logger.hpp"

namespace redline::redact {

namespace {

auto inconsistency(const schema::FieldDescriptor& field, const Error& cause) -> Error {
    return wrap_error(ErrorCode::ExecutionInconsistency,
                      "Redaction plan does not match message at " + field.full_name(), cause);
}

} // anonymous namespace

Redactor::Redactor(const schema::MessageType& type,
                   std::vector<const schema::FieldDescriptor*> redacted_fields,
                   std::vector<NestedField> message_fields)
    : type_(&type),
      redacted_fields_(std::move(redacted_fields)),
      message_fields_(std::move(message_fields)) {}

auto Redactor::noop() -> const Redactor& {
    static const Redactor instance{};
    return instance;
}

auto Redactor::redact(const schema::MessagePtr& message) const -> Result<schema::MessagePtr> {
    if (!message || is_noop()) {
        return message;
    }

    if (&message->type() != type_) {
        auto err = make_error(ErrorCode::ExecutionInconsistency,
                              "Message type does not match redaction plan",
                              message->type().full_name() + " given to plan for " +
                                  type_->full_name());
        LOG_ERROR("{}", err.what());
        return std::unexpected(std::move(err));
    }

    auto builder = schema::Builder::from(*message);

    for (const auto* field : redacted_fields_) {
        if (auto cleared = builder.clear(*field); !cleared) {
            auto err = inconsistency(*field, cleared.error());
            LOG_ERROR("{}", err.what());
            return std::unexpected(std::move(err));
        }
    }

    for (const auto& [field, redactor] : message_fields_) {
        auto current = builder.get(*field);
        if (!current) {
            auto err = inconsistency(*field, current.error());
            LOG_ERROR("{}", err.what());
            return std::unexpected(std::move(err));
        }
        if (schema::is_absent(*current)) continue;

        const auto* nested = std::get_if<schema::MessagePtr>(&*current);
        if (!nested) {
            auto err = make_error(ErrorCode::ExecutionInconsistency,
                                  "Nested field does not hold a message", field->full_name());
            LOG_ERROR("{}", err.what());
            return std::unexpected(std::move(err));
        }

        auto redacted = redactor->redact(*nested);
        if (!redacted) {
            return std::unexpected(redacted.error());
        }

        if (auto stored = builder.set(*field, std::move(*redacted)); !stored) {
            auto err = inconsistency(*field, stored.error());
            LOG_ERROR("{}", err.what());
            return std::unexpected(std::move(err));
        }
    }

    auto built = builder.build();
    if (!built) {
        auto err = wrap_error(ErrorCode::ExecutionInconsistency,
                              "Cannot finalize redacted " + type_->full_name(), built.error());
        LOG_ERROR("{}", err.what());
        return std::unexpected(std::move(err));
    }
    return built;
}

auto Redactor::describe() const -> json {
    if (is_noop()) {
        return json{{"noop", true}};
    }

    json redacted = json::array();
    for (const auto* field : redacted_fields_) {
        redacted.push_back(field->name());
    }

    json nested = json::array();
    for (const auto& [field, redactor] : message_fields_) {
        nested.push_back({
            {"field", field->name()},
            {"type", field->type_name()},
            {"plan", redactor->describe()},
        });
    }

    return json{
        {"type", type_->full_name()},
        {"noop", false},
        {"redacted", std::move(redacted)},
        {"nested", std::move(nested)},
    };
}

} // namespace redline::redact
