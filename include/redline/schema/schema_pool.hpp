#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "redline/core/error.hpp"
#include "redline/schema/definition.hpp"
#include "redline/schema/message_type.hpp"

namespace redline::schema {

using json = nlohmann::json;

/// Owns every registered MessageType.
///
/// Types are immutable once added and keep a stable address for the
/// lifetime of the pool. Message-typed fields refer to their type by name
/// and are resolved on lookup, so definitions may be added in any order.
class SchemaPool {
public:
    SchemaPool() = default;
    ~SchemaPool() = default;

    SchemaPool(const SchemaPool&) = delete;
    SchemaPool& operator=(const SchemaPool&) = delete;

    /// Register a single message type under `package`.
    auto add(const MessageDefinition& def, std::string_view package = "")
        -> Result<const MessageType*>;

    /// Register every message of a schema file. Either all of them are
    /// added or none is.
    auto add_file(const SchemaFile& file) -> VoidResult;

    /// Parse a schema document (see SchemaFile) and register it.
    auto load_json(const json& j) -> VoidResult;

    /// Read and register a schema document from disk.
    auto load_file(const std::filesystem::path& path) -> VoidResult;

    /// Look up a type by fully qualified name. Returns nullptr if not found.
    [[nodiscard]] auto find(std::string_view full_name) const -> const MessageType*;

    [[nodiscard]] auto contains(std::string_view full_name) const -> bool;

    /// Fully qualified names of all registered types, sorted.
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    [[nodiscard]] auto size() const -> size_t;

private:
    auto make_type(const MessageDefinition& def, std::string_view package) const
        -> Result<std::unique_ptr<MessageType>>;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<MessageType>> types_;
};

} // namespace redline::schema
