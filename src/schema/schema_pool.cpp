#include "redline/schema/schema_pool.hpp"
#include "redline/core/logger.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <unordered_set>

namespace redline::schema {

namespace {

auto is_valid_identifier(std::string_view name) -> bool {
    if (name.empty()) return false;
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_';
        if (!ok) return false;
    }
    return !(name.front() >= '0' && name.front() <= '9');
}

auto qualify(std::string_view package, std::string_view name) -> std::string {
    if (package.empty()) return std::string(name);
    return std::string(package) + "." + std::string(name);
}

/// Message references without a dot are relative to the declaring package.
auto resolve_type_name(std::string_view package, std::string_view type) -> std::string {
    if (type.find('.') != std::string_view::npos) return std::string(type);
    return qualify(package, type);
}

/// Type ids start at 1 and are shared by every pool in the process.
auto next_type_id() -> uint64_t {
    static std::atomic<uint64_t> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

} // anonymous namespace

auto SchemaPool::make_type(const MessageDefinition& def, std::string_view package) const
    -> Result<std::unique_ptr<MessageType>> {

    if (!is_valid_identifier(def.name)) {
        return std::unexpected(make_error(
            ErrorCode::SchemaError, "Invalid message name", "'" + def.name + "'"));
    }

    auto type = std::make_unique<MessageType>(MessageType::Key{});
    type->id_ = next_type_id();
    type->name_ = def.name;
    type->package_ = std::string(package);
    type->full_name_ = qualify(package, def.name);
    type->pool_ = this;
    type->fields_.reserve(def.fields.size());

    std::unordered_set<std::string> seen_names;
    std::unordered_set<int32_t> seen_tags;

    for (size_t i = 0; i < def.fields.size(); ++i) {
        const auto& fd = def.fields[i];
        auto where = type->full_name_ + "." + fd.name;

        if (!is_valid_identifier(fd.name)) {
            return std::unexpected(make_error(
                ErrorCode::SchemaError, "Invalid field name",
                type->full_name_ + ".'" + fd.name + "'"));
        }
        if (!seen_names.insert(fd.name).second) {
            return std::unexpected(make_error(
                ErrorCode::SchemaError, "Duplicate field name", where));
        }

        FieldDescriptor field;
        field.name_ = fd.name;
        field.index_ = i;
        field.tag_ = fd.tag == 0 ? static_cast<int32_t>(i + 1) : fd.tag;
        if (field.tag_ < 0) {
            return std::unexpected(make_error(
                ErrorCode::SchemaError, "Negative field tag", where));
        }
        if (!seen_tags.insert(field.tag_).second) {
            return std::unexpected(make_error(
                ErrorCode::SchemaError, "Duplicate field tag",
                where + " (tag " + std::to_string(field.tag_) + ")"));
        }

        if (fd.label == "optional") {
            field.label_ = Label::Optional;
        } else if (fd.label == "required") {
            field.label_ = Label::Required;
        } else {
            return std::unexpected(make_error(
                ErrorCode::SchemaError, "Unknown field label", where + ": '" + fd.label + "'"));
        }

        if (fd.type.empty()) {
            return std::unexpected(make_error(
                ErrorCode::SchemaError, "Missing field type", where));
        }
        if (auto scalar = parse_scalar_type(fd.type)) {
            field.kind_ = FieldKind::Scalar;
            field.scalar_type_ = *scalar;
            field.type_name_ = fd.type;
        } else {
            field.kind_ = FieldKind::Message;
            field.type_name_ = resolve_type_name(package, fd.type);
        }

        if (fd.derived && field.label_ == Label::Required) {
            return std::unexpected(make_error(
                ErrorCode::SchemaError, "Derived field cannot be required", where));
        }

        field.redacted_ = fd.redacted;
        field.derived_ = fd.derived;
        field.containing_type_ = type.get();
        field.pool_ = this;
        type->fields_.push_back(std::move(field));
    }

    return type;
}

auto SchemaPool::add(const MessageDefinition& def, std::string_view package)
    -> Result<const MessageType*> {

    auto type = make_type(def, package);
    if (!type) {
        return std::unexpected(type.error());
    }

    std::lock_guard lock(mutex_);
    const auto& full_name = (*type)->full_name();
    if (types_.contains(full_name)) {
        return std::unexpected(make_error(
            ErrorCode::AlreadyExists, "Message type already registered", full_name));
    }

    const MessageType* ptr = type->get();
    LOG_DEBUG("Registered message type {} ({} fields)", full_name, ptr->field_count());
    types_.emplace(full_name, std::move(*type));
    return ptr;
}

auto SchemaPool::add_file(const SchemaFile& file) -> VoidResult {
    if (!file.package.empty()) {
        size_t start = 0;
        while (start <= file.package.size()) {
            auto end = file.package.find('.', start);
            if (end == std::string::npos) end = file.package.size();
            if (!is_valid_identifier(std::string_view(file.package).substr(start, end - start))) {
                return std::unexpected(make_error(
                    ErrorCode::SchemaError, "Invalid package name", "'" + file.package + "'"));
            }
            start = end + 1;
        }
    }

    std::vector<std::unique_ptr<MessageType>> pending;
    pending.reserve(file.messages.size());
    std::unordered_set<std::string> in_file;

    for (const auto& def : file.messages) {
        auto type = make_type(def, file.package);
        if (!type) {
            return std::unexpected(type.error());
        }
        if (!in_file.insert((*type)->full_name()).second) {
            return std::unexpected(make_error(
                ErrorCode::AlreadyExists, "Message type declared twice", (*type)->full_name()));
        }
        pending.push_back(std::move(*type));
    }

    std::lock_guard lock(mutex_);
    for (const auto& type : pending) {
        if (types_.contains(type->full_name())) {
            return std::unexpected(make_error(
                ErrorCode::AlreadyExists, "Message type already registered", type->full_name()));
        }
    }
    for (auto& type : pending) {
        auto name = type->full_name();
        types_.emplace(std::move(name), std::move(type));
    }

    LOG_INFO("Registered {} message type(s) from package '{}'", pending.size(), file.package);
    return {};
}

auto SchemaPool::load_json(const json& j) -> VoidResult {
    if (!j.is_object()) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Schema document must be a JSON object"));
    }

    SchemaFile file;
    try {
        file = j.get<SchemaFile>();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Malformed schema document", e.what()));
    }
    return add_file(file);
}

auto SchemaPool::load_file(const std::filesystem::path& path) -> VoidResult {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Cannot open schema file", path.string()));
    }

    json j;
    try {
        j = json::parse(in);
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Invalid JSON in schema file",
            path.string() + ": " + e.what()));
    }

    auto result = load_json(j);
    if (!result) {
        LOG_ERROR("Failed to load schema {}: {}", path.string(), result.error().what());
        return result;
    }
    LOG_DEBUG("Loaded schema file {}", path.string());
    return {};
}

auto SchemaPool::find(std::string_view full_name) const -> const MessageType* {
    std::lock_guard lock(mutex_);
    auto it = types_.find(std::string(full_name));
    if (it == types_.end()) {
        return nullptr;
    }
    return it->second.get();
}

auto SchemaPool::contains(std::string_view full_name) const -> bool {
    return find(full_name) != nullptr;
}

auto SchemaPool::names() const -> std::vector<std::string> {
    std::lock_guard lock(mutex_);
    std::vector<std::string> result;
    result.reserve(types_.size());
    for (const auto& [name, _] : types_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

auto SchemaPool::size() const -> size_t {
    std::lock_guard lock(mutex_);
    return types_.size();
}

} // namespace redline::schema
