#include <enrich/ingest/ingest_document.h>

#include <charconv>
#include <vector>

namespace enrich::ingest {

namespace {

std::vector<std::string_view> splitPath(std::string_view path) {
    std::vector<std::string_view> segments;
    size_t start = 0;
    while (true) {
        size_t dot = path.find('.', start);
        if (dot == std::string_view::npos) {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return segments;
}

bool validPath(const std::vector<std::string_view>& segments) {
    for (auto seg : segments) {
        if (seg.empty()) {
            return false;
        }
    }
    return true;
}

std::optional<size_t> parseIndex(std::string_view segment) {
    size_t index = 0;
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), index);
    if (ec != std::errc{} || ptr != segment.data() + segment.size()) {
        return std::nullopt;
    }
    return index;
}

// Step one segment into an object or array. Returns nullptr when the segment does not resolve.
template <typename Json> Json* child(Json& node, std::string_view segment) {
    if (node.is_object()) {
        auto it = node.find(std::string(segment));
        return it == node.end() ? nullptr : &*it;
    }
    if (node.is_array()) {
        auto index = parseIndex(segment);
        if (!index || *index >= node.size()) {
            return nullptr;
        }
        return &node[*index];
    }
    return nullptr;
}

Error invalidPath(std::string_view path) {
    return Error{ErrorCode::InvalidArgument, "path [" + std::string(path) + "] is not valid"};
}

} // namespace

const nlohmann::json* findField(const nlohmann::json& root, std::string_view path) {
    if (path.empty()) {
        return nullptr;
    }
    auto segments = splitPath(path);
    if (!validPath(segments)) {
        return nullptr;
    }
    const nlohmann::json* current = &root;
    for (auto seg : segments) {
        current = child(*current, seg);
        if (current == nullptr) {
            return nullptr;
        }
    }
    return current;
}

std::string jsonTypeName(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return "integer";
    }
    if (value.is_number_float()) {
        return "float";
    }
    return value.type_name();
}

IngestDocument::IngestDocument(nlohmann::json source) : source_(std::move(source)) {}

Result<IngestDocument> IngestDocument::parse(std::string_view text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return Error{ErrorCode::InvalidData, "document is not valid JSON"};
    }
    if (!parsed.is_object()) {
        return Error{ErrorCode::InvalidData,
                     "document must be a JSON object, got [" + jsonTypeName(parsed) + "]"};
    }
    return IngestDocument(std::move(parsed));
}

Result<const nlohmann::json*> IngestDocument::lookup(std::string_view path,
                                                     bool ignoreMissing) const {
    if (path.empty()) {
        return Error{ErrorCode::InvalidArgument, "path cannot be null nor empty"};
    }
    if (!validPath(splitPath(path))) {
        return invalidPath(path);
    }
    const nlohmann::json* node = findField(source_, path);
    if (node == nullptr) {
        if (ignoreMissing) {
            return static_cast<const nlohmann::json*>(nullptr);
        }
        return Error{ErrorCode::FieldNotFound, "field [" + std::string(path) + "] not present"};
    }
    return node;
}

bool IngestDocument::hasField(std::string_view path) const {
    return findField(source_, path) != nullptr;
}

Result<void> IngestDocument::setFieldValue(std::string_view path, nlohmann::json value) {
    if (path.empty()) {
        return Error{ErrorCode::InvalidArgument, "path cannot be null nor empty"};
    }
    auto segments = splitPath(path);
    if (!validPath(segments)) {
        return invalidPath(path);
    }

    nlohmann::json* current = &source_;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        const std::string key(segments[i]);
        if (current->is_object()) {
            auto it = current->find(key);
            if (it == current->end()) {
                current = &((*current)[key] = nlohmann::json::object());
                continue;
            }
            if (it->is_null()) {
                return Error{ErrorCode::InvalidArgument,
                             "cannot set [" + key + "] with null parent as part of path [" +
                                 std::string(path) + "]"};
            }
            current = &*it;
        } else if (current->is_array()) {
            auto index = parseIndex(key);
            if (!index || *index >= current->size()) {
                return Error{ErrorCode::InvalidArgument,
                             "[" + key + "] is not a valid index for list of size [" +
                                 std::to_string(current->size()) + "] as part of path [" +
                                 std::string(path) + "]"};
            }
            current = &(*current)[*index];
        } else {
            return Error{ErrorCode::InvalidArgument,
                         "cannot set [" + key + "] with parent object of type [" +
                             jsonTypeName(*current) + "] as part of path [" + std::string(path) +
                             "]"};
        }
    }

    const std::string leaf(segments.back());
    if (current->is_object()) {
        (*current)[leaf] = std::move(value);
        return {};
    }
    if (current->is_array()) {
        auto index = parseIndex(leaf);
        if (!index || *index >= current->size()) {
            return Error{ErrorCode::InvalidArgument,
                         "[" + leaf + "] is not a valid index for list of size [" +
                             std::to_string(current->size()) + "] as part of path [" +
                             std::string(path) + "]"};
        }
        (*current)[*index] = std::move(value);
        return {};
    }
    return Error{ErrorCode::InvalidArgument, "cannot set [" + leaf +
                                                 "] with parent object of type [" +
                                                 jsonTypeName(*current) + "] as part of path [" +
                                                 std::string(path) + "]"};
}

Result<void> IngestDocument::removeField(std::string_view path) {
    if (path.empty()) {
        return Error{ErrorCode::InvalidArgument, "path cannot be null nor empty"};
    }
    auto segments = splitPath(path);
    if (!validPath(segments)) {
        return invalidPath(path);
    }

    nlohmann::json* parent = &source_;
    for (size_t i = 0; i + 1 < segments.size() && parent != nullptr; ++i) {
        parent = child(*parent, segments[i]);
    }
    const std::string leaf(segments.back());
    if (parent != nullptr) {
        if (parent->is_object() && parent->erase(leaf) > 0) {
            return {};
        }
        if (parent->is_array()) {
            auto index = parseIndex(leaf);
            if (index && *index < parent->size()) {
                parent->erase(*index);
                return {};
            }
        }
    }
    return Error{ErrorCode::FieldNotFound, "field [" + std::string(path) + "] not present"};
}

} // namespace enrich::ingest
