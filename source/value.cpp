// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <deepdiff/value.h>

#include <boost/container_hash/hash.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace deepdiff {

namespace {

std::string format_number(double d)
{
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d < 0 ? "-Infinity" : "Infinity";
    if (d == 0.0) return "0";
    return std::format("{}", d);
}

std::string quote(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

std::string format_bytes(std::span<const std::uint8_t> bytes)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto b : bytes) {
        oss << std::setw(2) << static_cast<unsigned>(b);
    }
    return oss.str();
}

/// Parse a string the way a numeric comparison would: surrounding whitespace
/// ignored, empty means 0, anything unparsable is NaN
double string_to_number(std::string_view s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    if (s.empty()) return 0.0;
    if (s == "Infinity" || s == "+Infinity") return std::numeric_limits<double>::infinity();
    if (s == "-Infinity") return -std::numeric_limits<double>::infinity();
    if (s.front() == '+') s.remove_prefix(1);

    double result = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return result;
}

/// Integer payload of a BigInt compared against a number
bool big_int_equals_number(std::int64_t big, double num)
{
    if (std::isnan(num) || std::isinf(num)) return false;
    if (std::trunc(num) != num) return false;
    return static_cast<double>(big) == num && static_cast<std::int64_t>(num) == big;
}

class StringWriter {
public:
    std::string write(const Value& val)
    {
        std::string out;
        append(out, val);
        return out;
    }

private:
    void append(std::string& out, const Value& val)
    {
        const void* id = val.is_container() ? val.identity() : nullptr;
        if (id) {
            if (std::find(ancestors_.begin(), ancestors_.end(), id) != ancestors_.end()) {
                out += "[Circular]";
                return;
            }
            ancestors_.push_back(id);
        }

        std::visit([&](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, Undefined>) {
                out += "undefined";
            } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
                out += "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                out += arg ? "true" : "false";
            } else if constexpr (std::is_same_v<T, double>) {
                out += format_number(arg);
            } else if constexpr (std::is_same_v<T, std::string>) {
                out += quote(arg);
            } else if constexpr (std::is_same_v<T, Symbol>) {
                out += "Symbol(" + arg.description() + ")";
            } else if constexpr (std::is_same_v<T, BigInt>) {
                out += std::to_string(arg.value) + "n";
            } else if constexpr (std::is_same_v<T, SequencePtr>) {
                out += '[';
                for (std::size_t i = 0; i < arg->size(); ++i) {
                    if (i > 0) out += ',';
                    append(out, (*arg)[i]);
                }
                out += ']';
            } else if constexpr (std::is_same_v<T, SetPtr>) {
                out += "Set{";
                bool first = true;
                for (const auto& item : arg->items()) {
                    if (!first) out += ',';
                    first = false;
                    append(out, item);
                }
                out += '}';
            } else if constexpr (std::is_same_v<T, MapPtr>) {
                out += "Map{";
                bool first = true;
                for (const auto& entry : arg->entries()) {
                    if (!first) out += ',';
                    first = false;
                    append(out, entry.key);
                    out += "=>";
                    append(out, entry.value);
                }
                out += '}';
            } else if constexpr (std::is_same_v<T, RecordPtr>) {
                out += arg->type_name();
                out += '{';
                bool first = true;
                for (const auto& field : arg->fields()) {
                    if (!field.enumerable) continue;
                    if (!first) out += ',';
                    first = false;
                    out += quote(field.key);
                    out += ':';
                    append(out, field.value);
                }
                out += '}';
            } else if constexpr (std::is_same_v<T, TimestampPtr>) {
                out += "Date(" + boost::posix_time::to_iso_extended_string(*arg) + ")";
            } else if constexpr (std::is_same_v<T, PatternPtr>) {
                out += arg->to_string();
            } else if constexpr (std::is_same_v<T, ViewPtr>) {
                out += "View<" + format_bytes(arg->bytes()) + ">";
            } else if constexpr (std::is_same_v<T, BufferPtr>) {
                out += "Buffer<" + format_bytes(*arg) + ">";
            }
        }, val.data);

        if (id) ancestors_.pop_back();
    }

    std::vector<const void*> ancestors_;
};

} // anonymous namespace

std::string_view kind_name(Kind kind) noexcept
{
    switch (kind) {
    case Kind::Undefined:    return "undefined";
    case Kind::Null:         return "null";
    case Kind::Boolean:      return "boolean";
    case Kind::Number:       return "number";
    case Kind::String:       return "string";
    case Kind::Sequence:     return "sequence";
    case Kind::Set:          return "set";
    case Kind::Map:          return "map";
    case Kind::Record:       return "record";
    case Kind::Timestamp:    return "timestamp";
    case Kind::Pattern:      return "pattern";
    case Kind::BinaryView:   return "binary-view";
    case Kind::BinaryBuffer: return "binary-buffer";
    case Kind::Other:        return "other";
    }
    return "unknown";
}

// ============================================================
// Pattern
// ============================================================

Pattern::Pattern(std::string source, std::string flags)
    : source_(std::move(source))
    , flags_(std::move(flags))
    , regex_(source_, flags_.find('i') != std::string::npos
                          ? std::regex::ECMAScript | std::regex::icase
                          : std::regex::ECMAScript)
{
}

std::string Pattern::to_string() const
{
    return "/" + source_ + "/" + flags_;
}

bool Pattern::matches(std::string_view text) const
{
    return std::regex_search(text.begin(), text.end(), regex_);
}

// ============================================================
// Value factories
// ============================================================

Value Value::sequence(std::initializer_list<Value> init)
{
    return Value{std::make_shared<Sequence>(init)};
}

Value Value::set(std::initializer_list<Value> init)
{
    auto s = std::make_shared<ValueSet>();
    for (const auto& v : init) {
        s->insert(v);
    }
    return Value{std::move(s)};
}

Value Value::map(std::initializer_list<std::pair<Value, Value>> init)
{
    auto m = std::make_shared<ValueMap>();
    for (const auto& [k, v] : init) {
        m->set(k, v);
    }
    return Value{std::move(m)};
}

Value Value::record(std::initializer_list<std::pair<std::string, Value>> init, std::string type_name)
{
    auto r = std::make_shared<Record>(std::move(type_name));
    for (const auto& [k, v] : init) {
        r->set(k, v);
    }
    return Value{std::move(r)};
}

Value Value::timestamp(Timestamp instant)
{
    return Value{std::make_shared<Timestamp>(instant)};
}

Value Value::timestamp_ms(std::int64_t millis)
{
    static const Timestamp epoch{boost::gregorian::date{1970, 1, 1}};
    return timestamp(epoch + boost::posix_time::milliseconds{millis});
}

Value Value::pattern(std::string source, std::string flags)
{
    return Value{std::make_shared<Pattern>(std::move(source), std::move(flags))};
}

Value Value::buffer(ByteBuffer bytes)
{
    return Value{std::make_shared<ByteBuffer>(std::move(bytes))};
}

Value Value::view(BufferPtr buffer, std::size_t offset, std::size_t length)
{
    if (!buffer) {
        detail::usage_error("Value::view", "null buffer");
    }
    if (offset > buffer->size() || length > buffer->size() - offset) {
        detail::usage_error("Value::view", "window exceeds buffer");
    }
    return Value{std::make_shared<BinaryView>(BinaryView{std::move(buffer), offset, length})};
}

// ============================================================
// Value inspection
// ============================================================

Kind Value::kind() const noexcept
{
    return std::visit([](const auto& arg) -> Kind {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, Undefined>) return Kind::Undefined;
        else if constexpr (std::is_same_v<T, std::nullptr_t>) return Kind::Null;
        else if constexpr (std::is_same_v<T, bool>) return Kind::Boolean;
        else if constexpr (std::is_same_v<T, double>) return Kind::Number;
        else if constexpr (std::is_same_v<T, std::string>) return Kind::String;
        else if constexpr (std::is_same_v<T, SequencePtr>) return Kind::Sequence;
        else if constexpr (std::is_same_v<T, SetPtr>) return Kind::Set;
        else if constexpr (std::is_same_v<T, MapPtr>) return Kind::Map;
        else if constexpr (std::is_same_v<T, RecordPtr>) return Kind::Record;
        else if constexpr (std::is_same_v<T, TimestampPtr>) return Kind::Timestamp;
        else if constexpr (std::is_same_v<T, PatternPtr>) return Kind::Pattern;
        else if constexpr (std::is_same_v<T, ViewPtr>) return Kind::BinaryView;
        else if constexpr (std::is_same_v<T, BufferPtr>) return Kind::BinaryBuffer;
        else return Kind::Other;
    }, data);
}

namespace {

template <typename Ptr>
auto& deref_or_throw(const Value& v, const char* func)
{
    auto* p = v.get_if<Ptr>();
    if (!p || !*p) {
        detail::usage_error(func, "payload type mismatch");
    }
    return **p;
}

} // anonymous namespace

Sequence& Value::as_sequence() const { return deref_or_throw<SequencePtr>(*this, "Value::as_sequence"); }
ValueSet& Value::as_set() const { return deref_or_throw<SetPtr>(*this, "Value::as_set"); }
ValueMap& Value::as_map() const { return deref_or_throw<MapPtr>(*this, "Value::as_map"); }
Record& Value::as_record() const { return deref_or_throw<RecordPtr>(*this, "Value::as_record"); }
Timestamp& Value::as_timestamp() const { return deref_or_throw<TimestampPtr>(*this, "Value::as_timestamp"); }
Pattern& Value::as_pattern() const { return deref_or_throw<PatternPtr>(*this, "Value::as_pattern"); }
BinaryView& Value::as_view() const { return deref_or_throw<ViewPtr>(*this, "Value::as_view"); }
ByteBuffer& Value::as_buffer() const { return deref_or_throw<BufferPtr>(*this, "Value::as_buffer"); }

const void* Value::identity() const noexcept
{
    return std::visit([](const auto& arg) -> const void* {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, Symbol>) {
            return arg.identity();
        } else if constexpr (std::is_same_v<T, SequencePtr> || std::is_same_v<T, SetPtr> ||
                             std::is_same_v<T, MapPtr> || std::is_same_v<T, RecordPtr> ||
                             std::is_same_v<T, TimestampPtr> || std::is_same_v<T, PatternPtr> ||
                             std::is_same_v<T, ViewPtr> || std::is_same_v<T, BufferPtr>) {
            return arg.get();
        } else {
            return nullptr;
        }
    }, data);
}

std::size_t Value::size() const noexcept
{
    switch (kind()) {
    case Kind::Sequence: return std::get<SequencePtr>(data)->size();
    case Kind::Set:      return std::get<SetPtr>(data)->size();
    case Kind::Map:      return std::get<MapPtr>(data)->size();
    case Kind::Record:   return std::get<RecordPtr>(data)->size();
    default:             return 0;
    }
}

// ============================================================
// Equality helpers
// ============================================================

std::size_t SameValueZeroHash::operator()(const Value& v) const noexcept
{
    std::size_t seed = v.data.index();
    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, Undefined> || std::is_same_v<T, std::nullptr_t>) {
            // tag only
        } else if constexpr (std::is_same_v<T, bool>) {
            boost::hash_combine(seed, arg);
        } else if constexpr (std::is_same_v<T, double>) {
            // NaN and -0 collapse onto one bucket each
            if (std::isnan(arg)) boost::hash_combine(seed, 0x7ff8u);
            else boost::hash_combine(seed, arg == 0.0 ? 0.0 : arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            boost::hash_combine(seed, arg);
        } else if constexpr (std::is_same_v<T, BigInt>) {
            boost::hash_combine(seed, arg.value);
        } else {
            boost::hash_combine(seed, v.identity());
        }
    }, v.data);
    return seed;
}

bool SameValueZeroEqual::operator()(const Value& a, const Value& b) const noexcept
{
    return same_value_zero(a, b);
}

bool same_value(const Value& a, const Value& b) noexcept
{
    if (a.data.index() != b.data.index()) return false;
    if (auto* x = a.get_if<double>()) {
        double y = *b.get_if<double>();
        if (std::isnan(*x) && std::isnan(y)) return true;
        return *x == y && std::signbit(*x) == std::signbit(y);
    }
    return same_value_zero(a, b);
}

bool same_value_zero(const Value& a, const Value& b) noexcept
{
    if (a.data.index() != b.data.index()) return false;
    return std::visit([&](const auto& x) -> bool {
        using T = std::decay_t<decltype(x)>;
        const auto& y = std::get<T>(b.data);
        if constexpr (std::is_same_v<T, Undefined> || std::is_same_v<T, std::nullptr_t>) {
            return true;
        } else if constexpr (std::is_same_v<T, double>) {
            return (std::isnan(x) && std::isnan(y)) || x == y;
        } else {
            return x == y;
        }
    }, a.data);
}

bool loosely_equal(const Value& a, const Value& b)
{
    const Kind ka = a.kind();
    const Kind kb = b.kind();

    auto nullish = [](Kind k) { return k == Kind::Null || k == Kind::Undefined; };
    if (nullish(ka) || nullish(kb)) {
        return nullish(ka) && nullish(kb);
    }

    if (a.data.index() == b.data.index()) {
        if (ka == Kind::Number) return a.as<double>() == b.as<double>();
        return same_value_zero(a, b);
    }

    if (ka == Kind::Boolean) return loosely_equal(Value{a.as<bool>() ? 1.0 : 0.0}, b);
    if (kb == Kind::Boolean) return loosely_equal(a, Value{b.as<bool>() ? 1.0 : 0.0});

    if (ka == Kind::Number && kb == Kind::String) return a.as<double>() == string_to_number(b.as<std::string>());
    if (ka == Kind::String && kb == Kind::Number) return string_to_number(a.as<std::string>()) == b.as<double>();

    auto* big_a = a.get_if<BigInt>();
    auto* big_b = b.get_if<BigInt>();
    if (big_a && kb == Kind::Number) return big_int_equals_number(big_a->value, b.as<double>());
    if (big_b && ka == Kind::Number) return big_int_equals_number(big_b->value, a.as<double>());
    if (big_a && kb == Kind::String) return big_int_equals_number(big_a->value, string_to_number(b.as<std::string>()));
    if (big_b && ka == Kind::String) return big_int_equals_number(big_b->value, string_to_number(a.as<std::string>()));

    return false;
}

// ============================================================
// Utility functions
// ============================================================

std::string value_to_string(const Value& val)
{
    return StringWriter{}.write(val);
}

namespace {

void print_impl(const Value& val, const std::string& prefix, std::size_t depth,
                std::vector<const void*>& ancestors)
{
    const std::string indent(depth * 2, ' ');

    const void* id = val.is_container() ? val.identity() : nullptr;
    if (id) {
        if (std::find(ancestors.begin(), ancestors.end(), id) != ancestors.end()) {
            std::cout << indent << prefix << "[Circular]\n";
            return;
        }
        ancestors.push_back(id);
    }

    std::visit(
        [&](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, SequencePtr>) {
                std::cout << indent << prefix << "[" << arg->size() << "]\n";
                for (std::size_t i = 0; i < arg->size(); ++i) {
                    print_impl((*arg)[i], "[" + std::to_string(i) + "]: ", depth + 1, ancestors);
                }
            } else if constexpr (std::is_same_v<T, SetPtr>) {
                std::cout << indent << prefix << "Set(" << arg->size() << ")\n";
                for (const auto& item : arg->items()) {
                    print_impl(item, "- ", depth + 1, ancestors);
                }
            } else if constexpr (std::is_same_v<T, MapPtr>) {
                std::cout << indent << prefix << "Map(" << arg->size() << ")\n";
                for (const auto& entry : arg->entries()) {
                    print_impl(entry.value, "{" + value_to_string(entry.key) + "}: ", depth + 1, ancestors);
                }
            } else if constexpr (std::is_same_v<T, RecordPtr>) {
                std::cout << indent << prefix << (arg->type_name().empty() ? "Record" : arg->type_name()) << "\n";
                for (const auto& field : arg->fields()) {
                    print_impl(field.value, field.key + ": ", depth + 1, ancestors);
                }
            } else {
                std::cout << indent << prefix << value_to_string(val) << "\n";
            }
        },
        val.data);

    if (id) ancestors.pop_back();
}

} // anonymous namespace

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    std::vector<const void*> ancestors;
    print_impl(val, prefix, depth, ancestors);
}

} // namespace deepdiff
