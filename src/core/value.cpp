#include <lineq/core/value.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <limits>

namespace lineq {

namespace {

auto is_continuation(char ch) noexcept -> bool {
    return (static_cast<unsigned char>(ch) & 0xC0U) == 0x80U;
}

// Byte offset of code point `index`, or text.size() past the end.
auto code_point_offset(std::string_view text, std::int64_t index) noexcept -> std::size_t {
    std::size_t offset = 0;
    for (std::int64_t seen = 0; offset < text.size(); ++offset) {
        if (!is_continuation(text[offset])) {
            if (seen == index) {
                return offset;
            }
            seen += 1;
        }
    }
    return text.size();
}

auto hash_combine(std::size_t seed, std::size_t value) -> std::size_t {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

// Ints and integral Floats must hash alike because they compare equal.
auto hash_number(const Value& value) -> std::size_t {
    if (const auto* i = value.get_if<std::int64_t>()) {
        return std::hash<std::int64_t>{}(*i);
    }
    if (const auto* b = value.get_if<bool>()) {
        return std::hash<std::int64_t>{}(*b ? 1 : 0);
    }
    double d = *value.get_if<double>();
    if (std::isfinite(d) && std::trunc(d) == d &&
        d >= static_cast<double>(std::numeric_limits<std::int64_t>::min()) &&
        d < static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
        return std::hash<std::int64_t>{}(static_cast<std::int64_t>(d));
    }
    return std::hash<double>{}(d);
}

auto numbers_equal(const Value& lhs, const Value& rhs) -> bool {
    const auto* li = lhs.get_if<std::int64_t>();
    const auto* ri = rhs.get_if<std::int64_t>();
    if (li != nullptr && ri != nullptr) {
        return *li == *ri;
    }
    return as_double(lhs) == as_double(rhs);
}

auto compare_numbers(const Value& lhs, const Value& rhs) -> int {
    if (!lhs.is<double>() && !rhs.is<double>()) {
        auto to_int = [](const Value& v) -> std::int64_t {
            if (const auto* b = v.get_if<bool>()) {
                return *b ? 1 : 0;
            }
            return *v.get_if<std::int64_t>();
        };
        std::int64_t l = to_int(lhs);
        std::int64_t r = to_int(rhs);
        return l < r ? -1 : (l > r ? 1 : 0);
    }
    double l = as_double(lhs);
    double r = as_double(rhs);
    return l < r ? -1 : (l > r ? 1 : 0);
}

auto format_float(double value) -> std::string {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    std::string text = fmt::format("{}", value);
    if (text.find_first_of(".e") == std::string::npos) {
        text.append(".0");
    }
    return text;
}

auto quote_string(const std::string& text) -> std::string {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('\'');
    for (char ch : text) {
        switch (ch) {
            case '\'':
                out.append("\\'");
                break;
            case '\\':
                out.append("\\\\");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\r':
                out.append("\\r");
                break;
            case '\t':
                out.append("\\t");
                break;
            default:
                out.push_back(ch);
                break;
        }
    }
    out.push_back('\'');
    return out;
}

auto join_repr(const std::vector<Value>& items) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(to_repr(items[i]));
    }
    return out;
}

auto kind_rank(const Value& value) -> int {
    switch (value.kind()) {
        case ValueKind::None:
            return 0;
        case ValueKind::Bool:
        case ValueKind::Int:
        case ValueKind::Float:
            return 1;
        case ValueKind::String:
            return 2;
        case ValueKind::Tuple:
            return 3;
        case ValueKind::List:
            return 4;
        case ValueKind::Object:
            return 5;
    }
    return 6;
}

auto compare_sequences(const std::vector<Value>& lhs, const std::vector<Value>& rhs)
    -> Result<int> {
    const std::size_t common = std::min(lhs.size(), rhs.size());
    for (std::size_t i = 0; i < common; ++i) {
        if (lhs[i] == rhs[i]) {
            continue;
        }
        return compare(lhs[i], rhs[i]);
    }
    if (lhs.size() == rhs.size()) {
        return 0;
    }
    return lhs.size() < rhs.size() ? -1 : 1;
}

}  // namespace

auto Object::find(std::string_view key) const -> const Value* {
    for (const auto& [name, value] : fields) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

void Object::set(std::string key, Value value) {
    for (auto& [name, existing] : fields) {
        if (name == key) {
            existing = std::move(value);
            return;
        }
    }
    fields.emplace_back(std::move(key), std::move(value));
}

auto make_tuple(std::initializer_list<Value> items) -> Value {
    return Tuple{.items = std::vector<Value>(items)};
}

auto make_list(std::initializer_list<Value> items) -> Value {
    return List{.items = std::vector<Value>(items)};
}

auto type_name(const Value& value) -> std::string_view {
    switch (value.kind()) {
        case ValueKind::None:
            return "NoneType";
        case ValueKind::Bool:
            return "bool";
        case ValueKind::Int:
            return "int";
        case ValueKind::Float:
            return "float";
        case ValueKind::String:
            return "str";
        case ValueKind::Tuple:
            return "tuple";
        case ValueKind::List:
            return "list";
        case ValueKind::Object:
            return "dict";
    }
    return "unknown";
}

auto is_numeric(const Value& value) noexcept -> bool {
    return value.is<std::int64_t>() || value.is<double>() || value.is<bool>();
}

auto as_double(const Value& value) noexcept -> double {
    if (const auto* i = value.get_if<std::int64_t>()) {
        return static_cast<double>(*i);
    }
    if (const auto* d = value.get_if<double>()) {
        return *d;
    }
    if (const auto* b = value.get_if<bool>()) {
        return *b ? 1.0 : 0.0;
    }
    return std::numeric_limits<double>::quiet_NaN();
}

auto is_truthy(const Value& value) noexcept -> bool {
    switch (value.kind()) {
        case ValueKind::None:
            return false;
        case ValueKind::Bool:
            return *value.get_if<bool>();
        case ValueKind::Int:
            return *value.get_if<std::int64_t>() != 0;
        case ValueKind::Float:
            return *value.get_if<double>() != 0.0;
        case ValueKind::String:
            return !value.get_if<std::string>()->empty();
        case ValueKind::Tuple:
            return !value.get_if<Tuple>()->items.empty();
        case ValueKind::List:
            return !value.get_if<List>()->items.empty();
        case ValueKind::Object:
            return !value.get_if<Object>()->empty();
    }
    return false;
}

auto sequence_items(const Value& value) noexcept -> const std::vector<Value>* {
    if (const auto* tuple = value.get_if<Tuple>()) {
        return &tuple->items;
    }
    if (const auto* list = value.get_if<List>()) {
        return &list->items;
    }
    return nullptr;
}

auto operator==(const Value& lhs, const Value& rhs) -> bool {
    if (is_numeric(lhs) && is_numeric(rhs)) {
        return numbers_equal(lhs, rhs);
    }
    if (lhs.kind() != rhs.kind()) {
        return false;
    }
    switch (lhs.kind()) {
        case ValueKind::None:
            return true;
        case ValueKind::String:
            return *lhs.get_if<std::string>() == *rhs.get_if<std::string>();
        case ValueKind::Tuple:
            return lhs.get_if<Tuple>()->items == rhs.get_if<Tuple>()->items;
        case ValueKind::List:
            return lhs.get_if<List>()->items == rhs.get_if<List>()->items;
        case ValueKind::Object: {
            const auto& l = *lhs.get_if<Object>();
            const auto& r = *rhs.get_if<Object>();
            if (l.size() != r.size()) {
                return false;
            }
            return std::all_of(l.fields.begin(), l.fields.end(), [&](const auto& field) {
                const Value* other = r.find(field.first);
                return other != nullptr && *other == field.second;
            });
        }
        default:
            return false;
    }
}

auto compare(const Value& lhs, const Value& rhs) -> Result<int> {
    if (is_numeric(lhs) && is_numeric(rhs)) {
        return compare_numbers(lhs, rhs);
    }
    if (lhs.is<std::string>() && rhs.is<std::string>()) {
        int c = lhs.get_if<std::string>()->compare(*rhs.get_if<std::string>());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (lhs.is<Tuple>() && rhs.is<Tuple>()) {
        return compare_sequences(lhs.get_if<Tuple>()->items, rhs.get_if<Tuple>()->items);
    }
    if (lhs.is<List>() && rhs.is<List>()) {
        return compare_sequences(lhs.get_if<List>()->items, rhs.get_if<List>()->items);
    }
    return make_error(ErrorKind::Evaluation,
                      fmt::format("'<' not supported between instances of '{}' and '{}'",
                                  type_name(lhs), type_name(rhs)));
}

auto total_less(const Value& lhs, const Value& rhs) -> bool {
    int lrank = kind_rank(lhs);
    int rrank = kind_rank(rhs);
    if (lrank != rrank) {
        return lrank < rrank;
    }
    switch (lhs.kind()) {
        case ValueKind::None:
            return false;
        case ValueKind::Object: {
            const auto& l = lhs.get_if<Object>()->fields;
            const auto& r = rhs.get_if<Object>()->fields;
            return std::lexicographical_compare(
                l.begin(), l.end(), r.begin(), r.end(), [](const auto& a, const auto& b) {
                    if (a.first != b.first) {
                        return a.first < b.first;
                    }
                    return total_less(a.second, b.second);
                });
        }
        case ValueKind::Tuple:
        case ValueKind::List: {
            const auto& l = *sequence_items(lhs);
            const auto& r = *sequence_items(rhs);
            return std::lexicographical_compare(l.begin(), l.end(), r.begin(), r.end(),
                                                total_less);
        }
        default: {
            if (is_numeric(lhs)) {
                const bool lnan = std::isnan(as_double(lhs));
                const bool rnan = std::isnan(as_double(rhs));
                if (lnan || rnan) {
                    return !lnan;
                }
            }
            auto ordered = compare(lhs, rhs);
            return ordered.has_value() && *ordered < 0;
        }
    }
}

auto code_point_count(std::string_view text) noexcept -> std::int64_t {
    return std::count_if(text.begin(), text.end(), [](char ch) { return !is_continuation(ch); });
}

auto code_point_substr(std::string_view text, std::int64_t from, std::int64_t to)
    -> std::string {
    const std::size_t begin = code_point_offset(text, from);
    const std::size_t end = code_point_offset(text, to);
    return std::string(text.substr(begin, end - begin));
}

auto item_at(const Value& container, std::int64_t index) -> Result<Value> {
    std::int64_t size = 0;
    if (const auto* items = sequence_items(container)) {
        size = static_cast<std::int64_t>(items->size());
    } else if (const auto* text = container.get_if<std::string>()) {
        size = code_point_count(*text);
    } else {
        return make_error(ErrorKind::Evaluation,
                          fmt::format("'{}' object is not subscriptable", type_name(container)));
    }
    std::int64_t position = index < 0 ? index + size : index;
    if (position < 0 || position >= size) {
        return make_error(ErrorKind::Index, fmt::format("{} index {} out of range (size {})",
                                                        type_name(container), index, size));
    }
    if (const auto* items = sequence_items(container)) {
        return (*items)[static_cast<std::size_t>(position)];
    }
    return code_point_substr(*container.get_if<std::string>(), position, position + 1);
}

auto to_str(const Value& value) -> std::string {
    if (const auto* text = value.get_if<std::string>()) {
        return *text;
    }
    return to_repr(value);
}

auto to_repr(const Value& value) -> std::string {
    switch (value.kind()) {
        case ValueKind::None:
            return "None";
        case ValueKind::Bool:
            return *value.get_if<bool>() ? "True" : "False";
        case ValueKind::Int:
            return fmt::format("{}", *value.get_if<std::int64_t>());
        case ValueKind::Float:
            return format_float(*value.get_if<double>());
        case ValueKind::String:
            return quote_string(*value.get_if<std::string>());
        case ValueKind::Tuple: {
            const auto& items = value.get_if<Tuple>()->items;
            if (items.size() == 1) {
                return fmt::format("({},)", to_repr(items.front()));
            }
            return fmt::format("({})", join_repr(items));
        }
        case ValueKind::List:
            return fmt::format("[{}]", join_repr(value.get_if<List>()->items));
        case ValueKind::Object: {
            std::string out = "{";
            const auto& fields = value.get_if<Object>()->fields;
            for (std::size_t i = 0; i < fields.size(); ++i) {
                if (i > 0) {
                    out.append(", ");
                }
                out.append(quote_string(fields[i].first));
                out.append(": ");
                out.append(to_repr(fields[i].second));
            }
            out.push_back('}');
            return out;
        }
    }
    return {};
}

auto sanitize_key(std::string_view key) -> std::string {
    const auto is_word = [](unsigned char ch) -> bool {
        return std::isalnum(ch) != 0 || ch == '_';
    };
    std::string out;
    out.reserve(key.size() + 1);
    if (!key.empty() && std::isdigit(static_cast<unsigned char>(key.front())) != 0) {
        out.push_back('_');
    }
    bool in_run = false;
    for (char ch : key) {
        if (is_word(static_cast<unsigned char>(ch))) {
            out.push_back(ch);
            in_run = false;
            continue;
        }
        if (!in_run) {
            out.push_back('_');
            in_run = true;
        }
    }
    if (out.empty()) {
        out.push_back('_');
    }
    return out;
}

auto ValueHash::operator()(const Value& value) const -> std::size_t {
    if (is_numeric(value)) {
        return hash_number(value);
    }
    std::size_t seed = std::hash<std::size_t>{}(static_cast<std::size_t>(value.kind()));
    switch (value.kind()) {
        case ValueKind::String:
            return hash_combine(seed, std::hash<std::string>{}(*value.get_if<std::string>()));
        case ValueKind::Tuple:
        case ValueKind::List:
            for (const auto& item : *sequence_items(value)) {
                seed = hash_combine(seed, (*this)(item));
            }
            return seed;
        case ValueKind::Object: {
            // Key order does not take part in equality, so combine commutatively.
            std::size_t fields = 0;
            for (const auto& [name, field] : value.get_if<Object>()->fields) {
                fields += hash_combine(std::hash<std::string>{}(name), (*this)(field));
            }
            return hash_combine(seed, fields);
        }
        default:
            return seed;
    }
}

}  // namespace lineq
