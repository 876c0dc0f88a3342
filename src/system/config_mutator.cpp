// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config_mutator.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace qdeck {

static bool in_bounds(const Page& page, const CellAddress& cell) {
    return cell.row >= 0 && cell.col >= 0 && cell.row < page.rows && cell.col < page.cols;
}

static std::vector<ActionButtonRecord>::iterator find_at(std::vector<ActionButtonRecord>& buttons,
                                                         const CellAddress& cell) {
    return std::find_if(buttons.begin(), buttons.end(),
                        [&cell](const ActionButtonRecord& b) { return b.position == cell; });
}

ActionButtonRecord ConfigMutator::to_record(const ButtonPlacement& placement) {
    ActionButtonRecord record;
    record.position = placement.position;
    record.action_type = placement.action_type;
    record.label = placement.label;
    record.icon = placement.icon;
    record.config = placement.config.is_object() ? placement.config : nlohmann::json::object();
    record.style = placement.style;
    return record;
}

MutationResult ConfigMutator::apply(const std::vector<ButtonPlacement>& placements,
                                    const Page& page) {
    MutationResult result;

    std::set<CellAddress> seen;
    for (const auto& p : placements) {
        if (!in_bounds(page, p.position)) {
            result.conflicts.push_back(p.position);
            result.error = "placement outside page bounds";
        } else if (!seen.insert(p.position).second) {
            result.conflicts.push_back(p.position);
            result.error = "duplicate placement position";
        }
    }
    if (!result.conflicts.empty()) {
        spdlog::error("[ConfigMutator] Rejecting batch of {} on page '{}': {} ({} conflict(s), "
                      "first at ({},{}))",
                      placements.size(), page.name, result.error, result.conflicts.size(),
                      result.conflicts.front().row, result.conflicts.front().col);
        return result;
    }

    Page updated = page;
    for (const auto& p : placements) {
        auto it = find_at(updated.buttons, p.position);
        if (it != updated.buttons.end()) {
            spdlog::info("[ConfigMutator] Replacing '{}' at ({},{})", it->label, p.position.row,
                         p.position.col);
            *it = to_record(p);
        } else {
            updated.buttons.push_back(to_record(p));
        }
    }

    spdlog::debug("[ConfigMutator] Applied {} placement(s) to page '{}' ({} buttons)",
                  placements.size(), page.name, updated.buttons.size());
    result.page = std::move(updated);
    return result;
}

std::optional<Page> ConfigMutator::move_button(const Page& page, const CellAddress& from,
                                               const CellAddress& to) {
    if (from == to) {
        return std::nullopt;
    }
    if (!in_bounds(page, from) || !in_bounds(page, to)) {
        spdlog::debug("[ConfigMutator] move ({},{}) -> ({},{}) out of bounds", from.row, from.col,
                      to.row, to.col);
        return std::nullopt;
    }

    Page updated = page;
    auto src = find_at(updated.buttons, from);
    auto dst = find_at(updated.buttons, to);

    if (src == updated.buttons.end() && dst == updated.buttons.end()) {
        return std::nullopt;
    }
    if (src != updated.buttons.end()) {
        src->position = to;
    }
    if (dst != updated.buttons.end()) {
        dst->position = from;
    }

    spdlog::debug("[ConfigMutator] Moved ({},{}) <-> ({},{})", from.row, from.col, to.row, to.col);
    return updated;
}

std::optional<Page> ConfigMutator::remove_button(const Page& page, const CellAddress& cell) {
    Page updated = page;
    auto it = find_at(updated.buttons, cell);
    if (it == updated.buttons.end()) {
        return std::nullopt;
    }
    spdlog::debug("[ConfigMutator] Removed '{}' at ({},{})", it->label, cell.row, cell.col);
    updated.buttons.erase(it);
    return updated;
}

// ---------------------------------------------------------------------------
// DropUndoHistory
// ---------------------------------------------------------------------------

DropUndoHistory::DropUndoHistory(size_t max_depth) : max_depth_(std::max<size_t>(max_depth, 1)) {}

void DropUndoHistory::record(const Page& before, const std::vector<ButtonPlacement>& placements) {
    if (placements.empty()) {
        return;
    }
    Entry entry;
    for (const auto& p : placements) {
        entry.positions.push_back(p.position);
        const ActionButtonRecord* prev = before.find_button(p.position);
        entry.previous.push_back(prev ? std::optional<ActionButtonRecord>(*prev) : std::nullopt);
    }
    entries_.push_back(std::move(entry));
    while (entries_.size() > max_depth_) {
        entries_.pop_front();
    }
    spdlog::debug("[DropUndoHistory] Recorded batch of {} (history {}/{})", placements.size(),
                  entries_.size(), max_depth_);
}

std::optional<Page> DropUndoHistory::undo_last(const Page& current) {
    if (entries_.empty()) {
        return std::nullopt;
    }
    Entry entry = std::move(entries_.back());
    entries_.pop_back();

    Page updated = current;
    for (size_t i = 0; i < entry.positions.size(); ++i) {
        const CellAddress& pos = entry.positions[i];
        auto it = find_at(updated.buttons, pos);
        if (it != updated.buttons.end()) {
            updated.buttons.erase(it);
        }
        if (entry.previous[i]) {
            updated.buttons.push_back(*entry.previous[i]);
        }
    }
    spdlog::info("[DropUndoHistory] Undid batch of {} on page '{}'", entry.positions.size(),
                 current.name);
    return updated;
}

} // namespace qdeck
