#include "redline/redact/registry.hpp"
#include "redline/core/logger.hpp"

namespace redline::redact {

auto RedactorRegistry::global() -> RedactorRegistry& {
    static RedactorRegistry registry;
    return registry;
}

auto RedactorRegistry::get(const schema::MessageType& type) -> Result<const Redactor*> {
    std::lock_guard lock(mutex_);
    auto plan = get_locked(type);
    if (!plan) {
        LOG_ERROR("Cannot build redactor for {}: {}", type.full_name(), plan.error().what());
    }
    return plan;
}

auto RedactorRegistry::redact(const schema::MessagePtr& message) -> Result<schema::MessagePtr> {
    if (!message) {
        return message;
    }
    auto plan = get(message->type());
    if (!plan) {
        return std::unexpected(plan.error());
    }
    return (*plan)->redact(message);
}

auto RedactorRegistry::contains(const schema::MessageType& type) const -> bool {
    std::lock_guard lock(mutex_);
    return plans_.contains(type.id());
}

auto RedactorRegistry::size() const -> size_t {
    std::lock_guard lock(mutex_);
    return plans_.size();
}

auto RedactorRegistry::get_locked(const schema::MessageType& type) -> Result<const Redactor*> {
    if (auto it = plans_.find(type.id()); it != plans_.end()) {
        return it->second;
    }

    if (in_progress_.contains(type.id())) {
        return std::unexpected(make_error(
            ErrorCode::ConfigurationError, "Cyclic message type", type.full_name()));
    }

    in_progress_.insert(type.id());
    auto plan = build_locked(type);
    in_progress_.erase(type.id());

    if (plan) {
        plans_.emplace(type.id(), *plan);
    }
    return plan;
}

auto RedactorRegistry::build_locked(const schema::MessageType& type) -> Result<const Redactor*> {
    std::vector<const schema::FieldDescriptor*> redacted_fields;
    std::vector<NestedField> message_fields;

    for (const auto& field : type.fields()) {
        if (field.is_derived()) {
            continue;
        }

        if (field.is_redacted()) {
            if (field.is_required()) {
                return std::unexpected(make_error(
                    ErrorCode::ConfigurationError,
                    "Required field cannot be redacted", field.full_name()));
            }
            redacted_fields.push_back(&field);
        } else if (field.is_message()) {
            const auto* nested_type = field.message_type();
            if (!nested_type) {
                return std::unexpected(make_error(
                    ErrorCode::ConfigurationError, "Unresolved message type",
                    field.full_name() + " -> " + field.type_name()));
            }

            auto nested = get_locked(*nested_type);
            if (!nested) {
                return std::unexpected(wrap_error(
                    ErrorCode::ConfigurationError,
                    "Cannot build redactor for " + field.full_name(), nested.error()));
            }

            if ((*nested)->is_noop()) continue;
            message_fields.push_back(NestedField{&field, *nested});
        }
    }

    if (redacted_fields.empty() && message_fields.empty()) {
        LOG_DEBUG("Redactor for {}: no-op", type.full_name());
        return &Redactor::noop();
    }

    LOG_DEBUG("Redactor for {}: {} redacted, {} nested", type.full_name(),
              redacted_fields.size(), message_fields.size());

    auto plan = std::make_unique<Redactor>(
        type, std::move(redacted_fields), std::move(message_fields));
    const Redactor* ptr = plan.get();
    owned_.push_back(std::move(plan));
    return ptr;
}

} // namespace redline::redact
