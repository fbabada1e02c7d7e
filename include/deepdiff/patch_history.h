// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch_history.h
/// @brief Undo/redo history of change batches applied to one target.
///
/// Each apply() is one step. Undo reverts the step against the CURRENT
/// target through its UndoTokens, so edits made to the target outside the
/// history survive as long as they do not touch the same slots.
///
/// @code
///   deepdiff::PatchHistory history{doc};
///   history.apply(deepdiff::diff(doc, edited), "rename user");
///   history.undo();   // doc restored
///   history.redo();   // doc equals edited again
/// @endcode

#pragma once

#include <deepdiff/deepdiff_config.h>
#include <deepdiff/api.h>
#include <deepdiff/change.h>

#include <immer/flex_vector.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace deepdiff {

class DEEPDIFF_API PatchHistory {
public:
    static constexpr std::size_t default_max_history = 100;

    /// @param target       value the history mutates; must outlive the history
    /// @param max_history  oldest undo steps beyond this are forgotten
    /// @param materialize  apply changes with materialize (see Change::apply)
    explicit PatchHistory(Value& target, std::size_t max_history = default_max_history,
                          bool materialize = false);

    /// Apply a batch as one undoable step and clear the redo stack.
    /// An empty batch records nothing.
    /// @throws PatchError if a change fails; the batch is rolled back
    void apply(const std::vector<Change>& changes, std::string description = {});

    /// @return false if there was nothing to undo
    /// @throws PatchError if the target no longer accepts the step; the target
    ///         and the step are left as they were, so undo() can be retried
    bool undo();

    /// @return false if there was nothing to redo
    /// @throws PatchError as undo()
    bool redo();

    [[nodiscard]] bool can_undo() const noexcept { return !undo_stack_.empty(); }
    [[nodiscard]] bool can_redo() const noexcept { return !redo_stack_.empty(); }
    [[nodiscard]] std::size_t undo_count() const noexcept { return undo_stack_.size(); }
    [[nodiscard]] std::size_t redo_count() const noexcept { return redo_stack_.size(); }

    /// Description of the step undo() would revert; empty if none
    [[nodiscard]] std::string undo_description() const;
    [[nodiscard]] std::string redo_description() const;

    void clear();

private:
    struct UndoStep {
        std::string description;
        std::shared_ptr<std::vector<UndoToken>> tokens;
    };

    struct RedoStep {
        std::string description;
        std::shared_ptr<std::vector<RedoToken>> tokens;
    };

    void push_undo(UndoStep step);

    Value* target_;
    std::size_t max_history_;
    bool materialize_;
    immer::flex_vector<UndoStep> undo_stack_;
    immer::flex_vector<RedoStep> redo_stack_;
};

} // namespace deepdiff
