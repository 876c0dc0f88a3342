// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "drag_state_tracker.h"
#include "grid_layout.h"
#include "icon_extractor.h"
#include "launcher_config.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qdeck {

/// A file delivered by the native drop event
struct FileRef {
    std::string path;
};

/// A resolved file -> cell assignment waiting to be applied
struct ButtonPlacement {
    CellAddress position{0, 0};
    std::string action_type;
    std::string label;
    std::string icon;
    nlohmann::json config = nlohmann::json::object();
    nlohmann::json style;
};

enum class PlacementStatus {
    Placed,          ///< got the cell under the pointer
    Relocated,       ///< cell contested or unresolved, placed at the next free cell
    SkippedGridFull, ///< no free cell left
};

const char* placement_status_name(PlacementStatus status);

struct FileOutcome {
    std::string path;
    PlacementStatus status = PlacementStatus::Placed;
    std::optional<CellAddress> cell;
    bool icon_extracted = false;
};

struct IngestResult {
    uint64_t batch_id = 0;
    std::vector<ButtonPlacement> placements; ///< drop order, placed files only
    std::vector<FileOutcome> outcomes;       ///< drop order, one per file

    size_t skipped_count() const;
};

struct CellAssignment {
    std::optional<CellAddress> cell;
    PlacementStatus status = PlacementStatus::Placed;
};

/**
 * @brief Turns a batch of dropped files into button placements
 *
 * Cells for the whole batch are assigned up front, in file order, so the
 * result never depends on icon extraction latency. Executable-like files then
 * race the icon extractor against their type-derived default icon; each file
 * settles independently and a failed extraction only costs the file its
 * extracted icon. Once every file has settled the batch is delivered to the
 * completion callback in one piece.
 *
 * Extractor callbacks are marshalled through ui::queue_update(); batch state
 * is only touched on the main thread. cancel() and destruction discard every
 * batch in flight: late results are dropped and their completion callbacks
 * never run.
 */
class FileIngestionPipeline {
  public:
    using CompletionCallback = std::function<void(const IngestResult&)>;

    /// `extractor` is not owned and may be null (default icons only)
    explicit FileIngestionPipeline(IconExtractor* extractor);
    ~FileIngestionPipeline();

    FileIngestionPipeline(const FileIngestionPipeline&) = delete;
    FileIngestionPipeline& operator=(const FileIngestionPipeline&) = delete;

    /**
     * @brief Assign target cells for `file_count` files
     *
     * Per file: the hovered cell if not yet claimed by this batch, else the
     * cell under the last pointer if unclaimed, else the next free cell in
     * row-major order after the contested cell (from (0,0) when nothing
     * resolved). A free cell holds no button and no claim. The hovered cell
     * itself may hold a button: the drop replaces it.
     *
     * @param existing Occupancy of the target page (rows/cols taken from `layout`)
     */
    static std::vector<CellAssignment> assign_cells(size_t file_count,
                                                    const DropSnapshot& snapshot,
                                                    const GridLayout& layout,
                                                    const GridOccupancy& existing);

    /**
     * @brief Start ingesting a drop batch
     *
     * `on_complete` runs exactly once unless the batch is cancelled. It runs
     * synchronously, before ingest() returns, when no file needs extraction.
     *
     * @return batch id
     */
    uint64_t ingest(const std::vector<FileRef>& files, const DropSnapshot& snapshot,
                    const GridLayout& layout, const Page& page, CompletionCallback on_complete);

    /// Discard every batch in flight
    void cancel();

    /// Batches still waiting for extractions
    size_t in_flight() const {
        return batches_.size();
    }

  private:
    struct Batch {
        uint64_t id = 0;
        uint64_t generation = 0;
        std::vector<std::optional<ButtonPlacement>> slots;
        std::vector<FileOutcome> outcomes;
        size_t pending = 0;
        CompletionCallback on_complete;
    };

    void request_icon(const std::shared_ptr<Batch>& batch, size_t slot, const std::string& path);
    void settle_icon(uint64_t batch_id, uint64_t generation, size_t slot,
                     const std::optional<IconInfo>& icon, const std::string& error);
    void finish(const std::shared_ptr<Batch>& batch);

    IconExtractor* extractor_;
    uint64_t generation_ = 0;
    uint64_t next_batch_id_ = 1;
    std::map<uint64_t, std::shared_ptr<Batch>> batches_;

    // Async callback safety guard
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace qdeck
