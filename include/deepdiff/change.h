// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file change.h
/// @brief Reversible, path-addressed edit operations.
///
/// A Change is one of:
/// - Add:    put `value` at `path`. A sequence segment carrying an insert
///           marker splices; an index past the end appends.
/// - Remove: delete whatever is at `path`.
/// - Edit:   replace the value at `path` with `value`.
///
/// apply() resolves the whole path and validates the terminal operation
/// before touching the target, so a failing Change throws PatchError and
/// leaves the target as it was. The returned UndoToken remembers the exact
/// container, position and displaced value; undo() puts them back and hands
/// out a RedoToken that re-applies the Change.
///
/// @code
///   auto changes = deepdiff::diff(a, b);
///   auto tokens  = deepdiff::apply_changes(changes, a);   // a now equals b
///   auto redo    = deepdiff::revert_changes(tokens);      // a restored
/// @endcode
///
/// @warning Tokens keep a pointer to the target Value passed to apply();
///          the target must outlive them.

#pragma once

#include <deepdiff/api.h>
#include <deepdiff/diagnostics.h>
#include <deepdiff/path.h>
#include <deepdiff/value.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace deepdiff {

/// A Change path does not resolve against the target
class DEEPDIFF_API PatchError : public std::runtime_error {
public:
    PatchError(const std::string& message, Path path, std::size_t segment)
        : std::runtime_error(message), path_(std::move(path)), segment_(segment) {}

    /// Path of the failing Change
    [[nodiscard]] const Path& path() const noexcept { return path_; }

    /// Index of the segment that failed to resolve
    [[nodiscard]] std::size_t segment() const noexcept { return segment_; }

private:
    Path path_;
    std::size_t segment_;
};

class UndoToken;
class RedoToken;

class DEEPDIFF_API Change {
public:
    enum class Type : std::uint8_t { Add, Remove, Edit };

    static Change add(Path path, Value value) { return Change{Type::Add, std::move(path), std::move(value)}; }
    static Change remove(Path path) { return Change{Type::Remove, std::move(path), Value{}}; }
    static Change edit(Path path, Value value) { return Change{Type::Edit, std::move(path), std::move(value)}; }

    [[nodiscard]] Type type() const noexcept { return type_; }
    [[nodiscard]] const Path& path() const noexcept { return path_; }

    /// Added or replacement value; undefined for Remove
    [[nodiscard]] const Value& value() const noexcept { return value_; }

    /// Apply to `target`.
    /// @param materialize deep-clone the inserted value and the captured prior
    ///        value, so target and token share nothing with the Change
    /// @throws PatchError if the path does not resolve; target untouched
    UndoToken apply(Value& target, bool materialize = false) const;

    /// e.g. `edit .users[0].name = "Bob"`
    [[nodiscard]] std::string to_string() const;

    /// Print one change per line to stdout
    static void print_changes(const std::vector<Change>& changes);

private:
    Change(Type type, Path path, Value value)
        : type_(type), path_(std::move(path)), value_(std::move(value)) {}

    Type type_;
    Path path_;
    Value value_;
};

[[nodiscard]] DEEPDIFF_API std::string_view change_type_name(Change::Type type) noexcept;

namespace detail {

/// Where an applied Change landed and what it displaced
struct AppliedChange {
    enum class Effect : std::uint8_t {
        Root,      ///< the whole target was replaced
        Replaced,  ///< an existing slot got a new value
        Inserted,  ///< a new slot was created at `position`
        Erased,    ///< the slot at `position` was removed
        Unchanged  ///< nothing to do (set member already present)
    };

    Effect effect = Effect::Unchanged;
    Value container;                ///< parent container (shared with the target)
    SegmentKey key;                 ///< resolved terminal key
    std::size_t position = 0;
    Value prior;                    ///< displaced value
    bool prior_enumerable = true;   ///< record fields only
    Value placed;                   ///< value put into the container
};

} // namespace detail

/// Reverts one applied Change
class DEEPDIFF_API UndoToken {
public:
    UndoToken(UndoToken&&) noexcept = default;
    UndoToken& operator=(UndoToken&&) noexcept = default;
    UndoToken(const UndoToken&) = delete;
    UndoToken& operator=(const UndoToken&) = delete;

    [[nodiscard]] const Change& change() const noexcept { return change_; }

    /// True if the Change displaced a value (Remove, Edit, overwriting Add)
    [[nodiscard]] bool has_prior() const noexcept;

    /// The displaced value (a clone when applied with materialize)
    [[nodiscard]] const Value& prior_value() const noexcept { return applied_.prior; }

    [[nodiscard]] bool used() const noexcept { return used_; }

    /// Restore the target; a token can be used once
    /// @throws PatchError if the target changed incompatibly since apply()
    RedoToken undo();

private:
    friend class Change;

    UndoToken(Change change, Value* target, bool materialize, detail::AppliedChange applied)
        : change_(std::move(change)), target_(target), materialize_(materialize), applied_(std::move(applied)) {}

    Change change_;
    Value* target_;
    bool materialize_;
    detail::AppliedChange applied_;
    bool used_ = false;
};

/// Re-applies one undone Change
class DEEPDIFF_API RedoToken {
public:
    RedoToken(RedoToken&&) noexcept = default;
    RedoToken& operator=(RedoToken&&) noexcept = default;
    RedoToken(const RedoToken&) = delete;
    RedoToken& operator=(const RedoToken&) = delete;

    [[nodiscard]] const Change& change() const noexcept { return change_; }
    [[nodiscard]] bool used() const noexcept { return used_; }

    /// Apply the Change again; a token can be used once
    UndoToken redo();

private:
    friend class UndoToken;

    RedoToken(Change change, Value* target, bool materialize)
        : change_(std::move(change)), target_(target), materialize_(materialize) {}

    Change change_;
    Value* target_;
    bool materialize_;
    bool used_ = false;
};

/// Apply `changes` in order. If one fails, the ones already applied are
/// undone (last first) and the PatchError is rethrown.
/// @return one token per change, in change order
DEEPDIFF_API std::vector<UndoToken> apply_changes(const std::vector<Change>& changes, Value& target,
                                                  bool materialize = false);

/// Undo `tokens` last to first. If one fails, the ones already undone are
/// redone, their fresh undo tokens replace the spent ones in `tokens`, and the
/// PatchError is rethrown.
/// @return redo tokens in the original change order
DEEPDIFF_API std::vector<RedoToken> revert_changes(std::vector<UndoToken>& tokens);

/// Redo `tokens` first to last, rolling back the same way on PatchError.
/// @return undo tokens in change order
DEEPDIFF_API std::vector<UndoToken> reapply_changes(std::vector<RedoToken>& tokens);

} // namespace deepdiff
