// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "file_ingestion_pipeline.h"
#include "launcher_config.h"

#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace qdeck {

struct MutationResult {
    std::optional<Page> page;          ///< the new page on success
    std::string error;                 ///< set on failure
    std::vector<CellAddress> conflicts; ///< offending positions on failure

    bool ok() const {
        return page.has_value();
    }
};

/**
 * @brief Copy-on-write edits of a Page
 *
 * Every operation returns a new Page and leaves its input untouched; the
 * caller commits the result through PageStore.
 */
class ConfigMutator {
  public:
    /**
     * @brief Apply a placement batch
     *
     * Each placement becomes an ActionButtonRecord, replacing whatever was at
     * its position. Two placements on one position, or a placement outside
     * the page, mean cell assignment was bypassed upstream: the whole batch is
     * rejected and nothing is applied.
     */
    static MutationResult apply(const std::vector<ButtonPlacement>& placements, const Page& page);

    /// Move the button at `from` to `to`, swapping if `to` is occupied.
    /// std::nullopt when nothing would change or a cell is out of bounds.
    static std::optional<Page> move_button(const Page& page, const CellAddress& from,
                                           const CellAddress& to);

    /// std::nullopt when `cell` is empty
    static std::optional<Page> remove_button(const Page& page, const CellAddress& cell);

    static ActionButtonRecord to_record(const ButtonPlacement& placement);
};

/**
 * @brief Bounded history of applied drop batches
 *
 * Each entry remembers what the affected positions held before the batch.
 * Undo restores exactly those positions and leaves the rest of the page alone.
 */
class DropUndoHistory {
  public:
    static constexpr size_t DEFAULT_DEPTH = 50;

    explicit DropUndoHistory(size_t max_depth = DEFAULT_DEPTH);

    /// Remember the state of `before` at every placement position
    void record(const Page& before, const std::vector<ButtonPlacement>& placements);

    /// Revert the most recent batch on `current`. std::nullopt when empty.
    std::optional<Page> undo_last(const Page& current);

    size_t size() const {
        return entries_.size();
    }
    size_t max_depth() const {
        return max_depth_;
    }
    void clear() {
        entries_.clear();
    }

  private:
    struct Entry {
        std::vector<CellAddress> positions;
        std::vector<std::optional<ActionButtonRecord>> previous;
    };

    size_t max_depth_;
    std::deque<Entry> entries_;
};

} // namespace qdeck
