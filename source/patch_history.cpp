// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <deepdiff/patch_history.h>

namespace deepdiff {

PatchHistory::PatchHistory(Value& target, std::size_t max_history, bool materialize)
    : target_(&target)
    , max_history_(max_history)
    , materialize_(materialize)
{
}

void PatchHistory::apply(const std::vector<Change>& changes, std::string description)
{
    if (changes.empty()) return;

    auto tokens = std::make_shared<std::vector<UndoToken>>(apply_changes(changes, *target_, materialize_));
    push_undo(UndoStep{std::move(description), std::move(tokens)});
    redo_stack_ = immer::flex_vector<RedoStep>{};
}

bool PatchHistory::undo()
{
    if (undo_stack_.empty()) return false;

    auto step = undo_stack_.back();
    auto tokens = std::make_shared<std::vector<RedoToken>>(revert_changes(*step.tokens));
    undo_stack_ = undo_stack_.take(undo_stack_.size() - 1);
    redo_stack_ = redo_stack_.push_back(RedoStep{std::move(step.description), std::move(tokens)});
    return true;
}

bool PatchHistory::redo()
{
    if (redo_stack_.empty()) return false;

    auto step = redo_stack_.back();
    auto tokens = std::make_shared<std::vector<UndoToken>>(reapply_changes(*step.tokens));
    redo_stack_ = redo_stack_.take(redo_stack_.size() - 1);
    push_undo(UndoStep{std::move(step.description), std::move(tokens)});
    return true;
}

std::string PatchHistory::undo_description() const
{
    return undo_stack_.empty() ? std::string{} : undo_stack_.back().description;
}

std::string PatchHistory::redo_description() const
{
    return redo_stack_.empty() ? std::string{} : redo_stack_.back().description;
}

void PatchHistory::clear()
{
    undo_stack_ = immer::flex_vector<UndoStep>{};
    redo_stack_ = immer::flex_vector<RedoStep>{};
}

void PatchHistory::push_undo(UndoStep step)
{
    auto new_undo = undo_stack_.push_back(std::move(step));
    if (new_undo.size() > max_history_) {
        new_undo = new_undo.drop(1);
    }
    undo_stack_ = std::move(new_undo);
}

} // namespace deepdiff
