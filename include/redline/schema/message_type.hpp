#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "redline/schema/field.hpp"

namespace redline::schema {

/// Schema-level descriptor for one message kind. Created and owned by a
/// SchemaPool; immutable and address-stable once registered.
class MessageType {
public:
    /// Constructor tag; only a SchemaPool can create types.
    class Key {
        friend class SchemaPool;
        Key() = default;
    };

    explicit MessageType(Key) {}

    MessageType(const MessageType&) = delete;
    MessageType& operator=(const MessageType&) = delete;

    /// Process-unique identity. Never reused, even after the owning pool
    /// is destroyed and another type takes the same address.
    [[nodiscard]] auto id() const noexcept -> uint64_t { return id_; }

    [[nodiscard]] auto full_name() const noexcept -> const std::string& { return full_name_; }
    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto package() const noexcept -> const std::string& { return package_; }

    /// Declared fields in declaration order.
    [[nodiscard]] auto fields() const noexcept -> const std::vector<FieldDescriptor>& { return fields_; }
    [[nodiscard]] auto field_count() const noexcept -> size_t { return fields_.size(); }
    [[nodiscard]] auto field(size_t index) const -> const FieldDescriptor& { return fields_.at(index); }

    /// Returns nullptr if no field has the given name.
    [[nodiscard]] auto find_field(std::string_view name) const -> const FieldDescriptor*;

    /// Returns nullptr if no field has the given tag.
    [[nodiscard]] auto find_field_by_tag(int32_t tag) const -> const FieldDescriptor*;

    [[nodiscard]] auto pool() const noexcept -> const SchemaPool* { return pool_; }

private:
    friend class SchemaPool;

    uint64_t id_ = 0;
    std::string full_name_;
    std::string name_;
    std::string package_;
    std::vector<FieldDescriptor> fields_;
    const SchemaPool* pool_ = nullptr;
};

} // namespace redline::schema
