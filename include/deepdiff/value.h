// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Dynamic value graph compared, diffed and cloned by deepdiff.
///
/// A Value represents one of:
/// - Scalars: undefined, null, boolean, number (double), string
/// - Other scalars: Symbol (identity token) and BigInt (64-bit integer)
/// - Containers: Sequence, ValueSet, ValueMap, Record
/// - Opaque mutable leaves: Timestamp, Pattern, BinaryView, ByteBuffer
///
/// Containers and mutable leaves are held through std::shared_ptr, so copying
/// a Value shares them the way an object reference would. This gives every
/// heap kind an identity (used by Object.is style comparison, circular
/// reference guards and clone tracking) and makes cyclic graphs possible.
///
/// @warning Cycles are not collected by shared ownership. Whoever builds a
///          cyclic graph must break one of its edges before dropping it.

#pragma once

#include <deepdiff/api.h>
#include <deepdiff/deepdiff_config.h>
#include <deepdiff/diagnostics.h>
#include <deepdiff/value_fwd.h>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <tsl/robin_map.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace deepdiff {

// ============================================================
// Kind - classified structural type of a value
// ============================================================

enum class Kind : std::uint8_t {
    Undefined,
    Null,
    Boolean,
    Number,
    String,
    Sequence,
    Set,
    Map,
    Record,
    Timestamp,
    Pattern,
    BinaryView,
    BinaryBuffer,
    Other
};

/// Kinds with children: record, map, set, sequence
[[nodiscard]] constexpr bool is_container(Kind kind) noexcept {
    return kind == Kind::Sequence || kind == Kind::Set || kind == Kind::Map || kind == Kind::Record;
}

[[nodiscard]] DEEPDIFF_API std::string_view kind_name(Kind kind) noexcept;

// ============================================================
// Scalar payload types
// ============================================================

/// Payload of a default constructed Value (absent / undefined)
struct Undefined {
    bool operator==(const Undefined&) const = default;
};

/// 64-bit integer scalar, kept apart from Number so that 1 and 1n differ
struct BigInt {
    std::int64_t value = 0;
    bool operator==(const BigInt&) const = default;
};

/// Identity token with a human readable description.
/// Two symbols are the same only if they were created by the same make() call.
class DEEPDIFF_API Symbol {
public:
    explicit Symbol(std::string description)
        : description_(std::make_shared<const std::string>(std::move(description))) {}

    [[nodiscard]] const std::string& description() const noexcept { return *description_; }
    [[nodiscard]] const void* identity() const noexcept { return description_.get(); }

    bool operator==(const Symbol& other) const noexcept { return description_ == other.description_; }

private:
    std::shared_ptr<const std::string> description_;
};

using Timestamp    = boost::posix_time::ptime;
using TimestampPtr = std::shared_ptr<Timestamp>;

/// Pattern matcher (ECMAScript regular expression with flags).
/// Compared by its canonical "/source/flags" form.
class DEEPDIFF_API Pattern {
public:
    explicit Pattern(std::string source, std::string flags = {});

    [[nodiscard]] const std::string& source() const noexcept { return source_; }
    [[nodiscard]] const std::string& flags() const noexcept { return flags_; }

    /// Canonical form, e.g. "/a+b/i"
    [[nodiscard]] std::string to_string() const;

    /// True if the pattern matches anywhere in text
    [[nodiscard]] bool matches(std::string_view text) const;

private:
    std::string source_;
    std::string flags_;
    std::regex regex_;
};

/// A window onto a shared byte buffer
struct BinaryView {
    BufferPtr buffer;
    std::size_t offset = 0;
    std::size_t length = 0;

    [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept {
        if (!buffer) return {};
        return std::span<const std::uint8_t>{*buffer}.subspan(offset, length);
    }
};

// ============================================================
// Value
// ============================================================

template <typename T>
concept NumberLike = std::is_arithmetic_v<T> && !std::is_same_v<std::decay_t<T>, bool>;

struct DEEPDIFF_API Value {
    using DataVariant = std::variant<Undefined,
                                     std::nullptr_t,
                                     bool,
                                     double,
                                     std::string,
                                     Symbol,
                                     BigInt,
                                     SequencePtr,
                                     SetPtr,
                                     MapPtr,
                                     RecordPtr,
                                     TimestampPtr,
                                     PatternPtr,
                                     ViewPtr,
                                     BufferPtr>;

    DataVariant data;

    Value() noexcept : data(Undefined{}) {}
    Value(Undefined) noexcept : data(Undefined{}) {}
    Value(std::nullptr_t) noexcept : data(nullptr) {}
    Value(bool v) noexcept : data(v) {}

    /// Every arithmetic type is stored as a Number (double); use BigInt for integers
    template <NumberLike T>
    Value(T v) noexcept : data(static_cast<double>(v)) {}

    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(std::string v) noexcept : data(std::move(v)) {}
    Value(Symbol v) noexcept : data(std::move(v)) {}
    Value(BigInt v) noexcept : data(v) {}
    Value(SequencePtr v) noexcept : data(std::move(v)) {}
    Value(SetPtr v) noexcept : data(std::move(v)) {}
    Value(MapPtr v) noexcept : data(std::move(v)) {}
    Value(RecordPtr v) noexcept : data(std::move(v)) {}
    Value(TimestampPtr v) noexcept : data(std::move(v)) {}
    Value(PatternPtr v) noexcept : data(std::move(v)) {}
    Value(ViewPtr v) noexcept : data(std::move(v)) {}
    Value(BufferPtr v) noexcept : data(std::move(v)) {}

    // ------------------------------------------------------------
    // Factories
    // ------------------------------------------------------------

    static Value null() noexcept { return Value{nullptr}; }
    static Value undefined() noexcept { return Value{}; }
    static Value big_int(std::int64_t v) noexcept { return Value{BigInt{v}}; }
    static Value symbol(std::string description) { return Value{Symbol{std::move(description)}}; }

    static Value sequence(std::initializer_list<Value> init = {});
    static Value set(std::initializer_list<Value> init = {});
    static Value map(std::initializer_list<std::pair<Value, Value>> init = {});
    static Value record(std::initializer_list<std::pair<std::string, Value>> init = {},
                        std::string type_name = {});

    static Value timestamp(Timestamp instant);
    /// Timestamp from milliseconds since the Unix epoch
    static Value timestamp_ms(std::int64_t millis);
    static Value pattern(std::string source, std::string flags = {});
    static Value buffer(ByteBuffer bytes);
    static Value view(BufferPtr buffer, std::size_t offset, std::size_t length);

    // ------------------------------------------------------------
    // Inspection
    // ------------------------------------------------------------

    [[nodiscard]] Kind kind() const noexcept;

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(data); }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] T* get_if() noexcept { return std::get_if<T>(&data); }

    /// Access the payload, throws UsageError on a kind mismatch
    template <typename T>
    [[nodiscard]] const T& as() const {
        if (auto* p = std::get_if<T>(&data)) return *p;
        detail::usage_error("Value::as", "payload type mismatch");
    }

    [[nodiscard]] bool is_undefined() const noexcept { return is<Undefined>(); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::nullptr_t>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_container() const noexcept { return deepdiff::is_container(kind()); }

    [[nodiscard]] double as_number(double default_val = 0.0) const noexcept {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const noexcept {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    /// Container and mutable-leaf accessors, throw UsageError on a kind mismatch
    [[nodiscard]] Sequence& as_sequence() const;
    [[nodiscard]] ValueSet& as_set() const;
    [[nodiscard]] ValueMap& as_map() const;
    [[nodiscard]] Record& as_record() const;
    [[nodiscard]] Timestamp& as_timestamp() const;
    [[nodiscard]] Pattern& as_pattern() const;
    [[nodiscard]] BinaryView& as_view() const;
    [[nodiscard]] ByteBuffer& as_buffer() const;

    /// Address identifying a heap value (containers, mutable leaves, symbols).
    /// nullptr for values compared by content.
    [[nodiscard]] const void* identity() const noexcept;

    /// Number of children for containers, 0 otherwise
    [[nodiscard]] std::size_t size() const noexcept;
};

/// Kind of a value (same as Value::kind())
[[nodiscard]] inline Kind classify(const Value& value) noexcept { return value.kind(); }

// ============================================================
// Key semantics for ValueMap / ValueSet
//
// SameValueZero: scalars by content (NaN equals NaN, +0 equals -0),
// heap kinds by identity.
// ============================================================

struct DEEPDIFF_API SameValueZeroHash {
    [[nodiscard]] std::size_t operator()(const Value& v) const noexcept;
};

struct DEEPDIFF_API SameValueZeroEqual {
    [[nodiscard]] bool operator()(const Value& a, const Value& b) const noexcept;
};

/// Transparent hash functor for string keys (heterogeneous robin_map lookup)
struct StringHash {
    using is_transparent = void;

    [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }

    [[nodiscard]] std::size_t operator()(const std::string& s) const noexcept {
        return std::hash<std::string_view>{}(s);
    }

    [[nodiscard]] std::size_t operator()(const char* s) const noexcept { return std::hash<std::string_view>{}(s); }
};

/// Transparent equality comparator for string keys
struct StringEqual {
    using is_transparent = void;

    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

// ============================================================
// Record - named fields in insertion order
// ============================================================

class DEEPDIFF_API Record {
public:
    struct Field {
        std::string key;
        Value value;
        bool enumerable = true;
    };

    Record() = default;
    explicit Record(std::string type_name) : type_name_(std::move(type_name)) {}

    /// Shape of the record; clones keep it
    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }

    [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }
    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }
    [[nodiscard]] const std::vector<Field>& fields() const noexcept { return fields_; }

    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] Value* find(std::string_view key);
    [[nodiscard]] const Value* find(std::string_view key) const;
    [[nodiscard]] const Field* field(std::string_view key) const;
    [[nodiscard]] std::optional<std::size_t> index_of(std::string_view key) const;

    /// Set a field; an existing field keeps its position and enumerable flag
    void set(std::string key, Value value);
    void set(std::string key, Value value, bool enumerable);

    /// Insert a field at pos (clamped to size); replaces an existing field of the same key
    void insert_at(std::size_t pos, Field field);

    bool erase(std::string_view key);

private:
    void reindex_from(std::size_t pos);

    std::string type_name_;
    std::vector<Field> fields_;
    tsl::robin_map<std::string, std::size_t, StringHash, StringEqual> index_;
};

// ============================================================
// ValueMap - keyed mapping in insertion order
// ============================================================

class DEEPDIFF_API ValueMap {
public:
    struct Entry {
        Value key;
        Value value;
    };

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return entries_; }

    [[nodiscard]] bool contains(const Value& key) const;
    [[nodiscard]] Value* find(const Value& key);
    [[nodiscard]] const Value* find(const Value& key) const;
    [[nodiscard]] std::optional<std::size_t> index_of(const Value& key) const;

    void set(Value key, Value value);
    void insert_at(std::size_t pos, Entry entry);
    bool erase(const Value& key);

private:
    void reindex_from(std::size_t pos);

    std::vector<Entry> entries_;
    tsl::robin_map<Value, std::size_t, SameValueZeroHash, SameValueZeroEqual> index_;
};

// ============================================================
// ValueSet - unique values in insertion order
// ============================================================

class DEEPDIFF_API ValueSet {
public:
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
    [[nodiscard]] const std::vector<Value>& items() const noexcept { return items_; }
    [[nodiscard]] const Value& at(std::size_t pos) const { return items_.at(pos); }

    [[nodiscard]] bool contains(const Value& v) const;
    [[nodiscard]] std::optional<std::size_t> index_of(const Value& v) const;

    /// Append v unless already present; returns false if it was present
    bool insert(Value v);
    /// Insert v at pos (clamped to size) unless already present
    bool insert_at(std::size_t pos, Value v);
    /// Replace the member at pos, keeping its position
    void replace_at(std::size_t pos, Value v);
    bool erase(const Value& v);

private:
    void reindex_from(std::size_t pos);

    std::vector<Value> items_;
    tsl::robin_map<Value, std::size_t, SameValueZeroHash, SameValueZeroEqual> index_;
};

// ============================================================
// Value comparison helpers
// ============================================================

/// Identity test with Object.is semantics (NaN is NaN, +0 is not -0)
[[nodiscard]] DEEPDIFF_API bool same_value(const Value& a, const Value& b) noexcept;

/// Key equality used by ValueMap and ValueSet
[[nodiscard]] DEEPDIFF_API bool same_value_zero(const Value& a, const Value& b) noexcept;

/// Relaxed cross-kind equality: null ~ undefined, numeric strings and
/// booleans ~ numbers, BigInt ~ number; heap kinds only by identity
[[nodiscard]] DEEPDIFF_API bool loosely_equal(const Value& a, const Value& b);

// ============================================================
// Utility functions
// ============================================================

/// Convert Value to a human-readable string (cycle safe)
[[nodiscard]] DEEPDIFF_API std::string value_to_string(const Value& val);

/// Print Value with indentation
DEEPDIFF_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

} // namespace deepdiff
