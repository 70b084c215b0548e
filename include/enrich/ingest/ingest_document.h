#pragma once

#include <enrich/core/types.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace enrich::ingest {

// Resolve a dotted path ("a.b.0.c") against a JSON value. Object members are addressed by
// name, array elements by decimal index. Returns nullptr when any segment does not resolve.
const nlohmann::json* findField(const nlohmann::json& root, std::string_view path);

// Human readable JSON type name used in error messages ("string", "number", ...).
std::string jsonTypeName(const nlohmann::json& value);

/**
 * @brief Document flowing through an ingest pipeline.
 *
 * Wraps the document source as a JSON object and provides read, write and existence checks
 * by dotted field path. Processors mutate the document in place.
 */
class IngestDocument {
public:
    IngestDocument() : source_(nlohmann::json::object()) {}
    explicit IngestDocument(nlohmann::json source);

    // Parse a JSON text whose top level must be an object.
    static Result<IngestDocument> parse(std::string_view text);

    /**
     * @brief Read the value at @p path as type T.
     *
     * A missing field yields std::nullopt when @p ignoreMissing is set and a FieldNotFound
     * error otherwise. An explicit null is reported as std::nullopt. A value that does not
     * hold a T yields FieldTypeMismatch.
     */
    template <typename T>
    Result<std::optional<T>> getFieldValue(std::string_view path,
                                           bool ignoreMissing = false) const {
        auto node = lookup(path, ignoreMissing);
        if (!node) {
            return node.error();
        }
        const nlohmann::json* value = node.value();
        if (value == nullptr || value->is_null()) {
            return std::optional<T>{};
        }
        if (!holds<T>(*value)) {
            return Error{ErrorCode::FieldTypeMismatch,
                         "field [" + std::string(path) + "] of type [" + jsonTypeName(*value) +
                             "] cannot be read as the requested type"};
        }
        return std::optional<T>{value->get<T>()};
    }

    bool hasField(std::string_view path) const;

    Result<void> setFieldValue(std::string_view path, nlohmann::json value);

    Result<void> removeField(std::string_view path);

    const nlohmann::json& source() const { return source_; }

    bool operator==(const IngestDocument& other) const { return source_ == other.source_; }

private:
    // Returns nullptr for a missing field when ignoreMissing is set.
    Result<const nlohmann::json*> lookup(std::string_view path, bool ignoreMissing) const;

    template <typename T> static bool holds(const nlohmann::json& value) {
        if constexpr (std::is_same_v<T, std::string>) {
            return value.is_string();
        } else if constexpr (std::is_same_v<T, bool>) {
            return value.is_boolean();
        } else if constexpr (std::is_integral_v<T>) {
            return value.is_number_integer();
        } else if constexpr (std::is_floating_point_v<T>) {
            return value.is_number();
        } else {
            return true;
        }
    }

    nlohmann::json source_;
};

} // namespace enrich::ingest
