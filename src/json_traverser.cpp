#include "jsonexplorer++/json_traverser.h"
#include <algorithm> // For std::sort, std::min, std::max
#include <deque>

namespace jsonexplorer {

// Resolves a slice bound against `len`: negative counts from the end, result clamped to [0, len].
static size_t resolve_bound(long long bound, size_t len) {
    long long signed_len = static_cast<long long>(len);
    if (bound < 0) {
        return static_cast<size_t>(std::max(signed_len + bound, 0LL));
    }
    return static_cast<size_t>(std::min(bound, signed_len));
}

TraversalResult JSONTraverser::traverse(const json& root,
                                        const std::vector<PathElement>& path_elements) const {
    TraversalResult result;
    if (path_elements.empty()) {
        result.value = root;
        return result;
    }

    const json* current = &root;
    const json* parent = nullptr;
    size_t depth = 0;
    // Arrays produced by filters; deque keeps earlier elements at stable addresses.
    std::deque<json> materialized;

    auto fail = [&]() {
        TraversalResult failed;
        failed.parent = *current;
        failed.depth = depth;
        return failed;
    };

    for (const auto& el : path_elements) {
        switch (el.type) {
            case PathElement::Type::KEY: {
                if (!current->is_object()) {
                    return fail();
                }
                auto it = current->find(el.key_name);
                if (it == current->end()) {
                    return fail();
                }
                parent = current;
                current = &(*it);
                ++depth;
                break;
            }
            case PathElement::Type::INDEX: {
                if (!current->is_array()) {
                    return fail();
                }
                long long actual_index = el.index;
                if (actual_index < 0) {
                    actual_index += static_cast<long long>(current->size());
                }
                if (actual_index < 0 || static_cast<size_t>(actual_index) >= current->size()) {
                    return fail();
                }
                parent = current;
                current = &(*current)[static_cast<size_t>(actual_index)];
                ++depth;
                break;
            }
            case PathElement::Type::SLICE: {
                if (!current->is_array()) {
                    return fail();
                }
                size_t len = current->size();
                size_t start = el.start ? resolve_bound(*el.start, len) : 0;
                size_t end = el.end ? resolve_bound(*el.end, len) : len;

                json sliced = json::array();
                for (size_t i = start; i < end; ++i) {
                    sliced.push_back((*current)[i]);
                }
                result.value = std::move(sliced);
                result.parent = *current;
                result.depth = depth + 1;
                return result;
            }
            case PathElement::Type::WILDCARD: {
                if (current->is_object()) {
                    json values = json::array();
                    for (const auto& item : current->items()) {
                        values.push_back(item.value());
                    }
                    result.value = std::move(values);
                    result.parent = *current;
                    result.depth = depth + 1;
                    return result;
                }
                if (current->is_array()) {
                    result.value = *current;
                    if (parent != nullptr) {
                        result.parent = *parent;
                    }
                    result.depth = depth + 1;
                    return result;
                }
                return fail();
            }
            case PathElement::Type::FILTER: {
                if (!current->is_array()) {
                    return fail();
                }
                json filtered = json::array();
                for (const auto& item : *current) {
                    if (eval_predicate(item, el.filter)) {
                        filtered.push_back(item);
                    }
                }
                parent = current;
                materialized.push_back(std::move(filtered));
                current = &materialized.back();
                ++depth;
                break;
            }
        }
    }

    result.value = *current;
    if (parent != nullptr) {
        result.parent = *parent;
    }
    result.depth = depth;
    return result;
}

std::vector<std::string> JSONTraverser::available_keys(const json& value, size_t limit) {
    std::vector<std::string> keys;
    switch (value.type()) {
        case json::value_t::object:
            for (const auto& item : value.items()) {
                keys.push_back(item.key());
            }
            std::sort(keys.begin(), keys.end());
            break;
        case json::value_t::array:
            for (size_t i = 0; i < value.size(); ++i) {
                keys.push_back("[" + std::to_string(i) + "]");
            }
            break;
        case json::value_t::null:
        case json::value_t::boolean:
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
        case json::value_t::string:
        case json::value_t::binary:
        case json::value_t::discarded:
            break;
    }
    if (limit > 0 && keys.size() > limit) {
        keys.resize(limit);
    }
    return keys;
}

std::string pretty_print(const json& value, int indent) {
    return value.dump(indent);
}

std::string compact_print(const json& value) {
    return value.dump();
}

std::string describe_value(const std::optional<json>& value) {
    if (!value) {
        return "no match";
    }
    switch (value->type()) {
        case json::value_t::object:
            return std::to_string(value->size()) + " keys";
        case json::value_t::array:
            return std::to_string(value->size()) + " items";
        case json::value_t::string:
            return std::to_string(value->get_ref<const std::string&>().size()) + " chars";
        case json::value_t::null:
        case json::value_t::boolean:
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
        case json::value_t::binary:
        case json::value_t::discarded:
            return value->dump();
    }
    return value->dump();
}

} // namespace jsonexplorer
