#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "redline/core/error.hpp"
#include "redline/redact/redactor.hpp"
#include "redline/schema/message_type.hpp"

namespace redline::redact {

/// Builds and caches one Redactor per message type.
///
/// Plan construction is serialized by an internal mutex, so concurrent
/// first requests for a type build its plan exactly once. Returned plans
/// stay valid for the lifetime of the registry. Plans are keyed by
/// MessageType::id(), so a type registered in a new SchemaPool never picks
/// up a plan built for a type of a destroyed pool.
class RedactorRegistry {
public:
    RedactorRegistry() = default;
    ~RedactorRegistry() = default;

    RedactorRegistry(const RedactorRegistry&) = delete;
    RedactorRegistry& operator=(const RedactorRegistry&) = delete;

    /// Registry shared by the whole process.
    [[nodiscard]] static auto global() -> RedactorRegistry&;

    /// Plan for `type`, built on first request together with the plans of
    /// every nested message type it reaches.
    ///
    /// Fails with ConfigurationError when a nested type reference cannot be
    /// resolved, a required field is marked redacted, or the type graph
    /// loops back into a type whose plan is still being built. Failures are
    /// not cached.
    [[nodiscard]] auto get(const schema::MessageType& type) -> Result<const Redactor*>;

    /// Looks up the plan for the message's own type and applies it.
    [[nodiscard]] auto redact(const schema::MessagePtr& message) -> Result<schema::MessagePtr>;

    [[nodiscard]] auto contains(const schema::MessageType& type) const -> bool;

    /// Number of types with a cached plan, no-op types included.
    [[nodiscard]] auto size() const -> size_t;

private:
    auto get_locked(const schema::MessageType& type) -> Result<const Redactor*>;
    auto build_locked(const schema::MessageType& type) -> Result<const Redactor*>;

    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, const Redactor*> plans_;
    std::vector<std::unique_ptr<Redactor>> owned_;
    std::unordered_set<uint64_t> in_progress_;
};

} // namespace redline::redact
