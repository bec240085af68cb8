#include <lineq/core/json.hpp>

#include <cstdint>
#include <limits>

namespace lineq {

auto from_json(const Json& json) -> Value {
    switch (json.type()) {
        case Json::value_t::null:
            return None{};
        case Json::value_t::boolean:
            return json.get<bool>();
        case Json::value_t::number_integer:
            return json.get<std::int64_t>();
        case Json::value_t::number_unsigned: {
            auto value = json.get<std::uint64_t>();
            if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return static_cast<double>(value);
            }
            return static_cast<std::int64_t>(value);
        }
        case Json::value_t::number_float:
            return json.get<double>();
        case Json::value_t::string:
            return json.get<std::string>();
        case Json::value_t::array: {
            List list;
            list.items.reserve(json.size());
            for (const auto& item : json) {
                list.items.push_back(from_json(item));
            }
            return list;
        }
        case Json::value_t::object: {
            Object object;
            object.fields.reserve(json.size());
            for (const auto& [key, item] : json.items()) {
                object.fields.emplace_back(key, from_json(item));
            }
            return object;
        }
        default:
            return None{};
    }
}

auto to_json(const Value& value) -> Json {
    switch (value.kind()) {
        case ValueKind::None:
            return nullptr;
        case ValueKind::Bool:
            return *value.get_if<bool>();
        case ValueKind::Int:
            return *value.get_if<std::int64_t>();
        case ValueKind::Float:
            return *value.get_if<double>();
        case ValueKind::String:
            return *value.get_if<std::string>();
        case ValueKind::Tuple:
        case ValueKind::List: {
            Json array = Json::array();
            for (const auto& item : *sequence_items(value)) {
                array.push_back(to_json(item));
            }
            return array;
        }
        case ValueKind::Object: {
            Json object = Json::object();
            for (const auto& [key, item] : value.get_if<Object>()->fields) {
                object[key] = to_json(item);
            }
            return object;
        }
    }
    return nullptr;
}

auto parse_json_object(std::string_view text) -> std::optional<Object> {
    Json json = Json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    Value value = from_json(json);
    return std::move(*value.get_if<Object>());
}

auto dump_json(const Value& value, bool compact) -> std::string {
    // Replace invalid UTF-8 instead of throwing from dump().
    return to_json(value).dump(compact ? -1 : 2, ' ', false, Json::error_handler_t::replace);
}

}  // namespace lineq
