// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "file_ingestion_pipeline.h"

#include "dropped_file.h"
#include "ui_update_queue.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace qdeck {

const char* placement_status_name(PlacementStatus status) {
    switch (status) {
    case PlacementStatus::Placed:
        return "placed";
    case PlacementStatus::Relocated:
        return "relocated";
    case PlacementStatus::SkippedGridFull:
        return "skipped (grid full)";
    }
    return "?";
}

size_t IngestResult::skipped_count() const {
    return static_cast<size_t>(
        std::count_if(outcomes.begin(), outcomes.end(), [](const FileOutcome& o) {
            return o.status == PlacementStatus::SkippedGridFull;
        }));
}

FileIngestionPipeline::FileIngestionPipeline(IconExtractor* extractor) : extractor_(extractor) {}

FileIngestionPipeline::~FileIngestionPipeline() {
    if (alive_) {
        *alive_ = false;
    }
    alive_.reset();
    batches_.clear();
}

// ---------------------------------------------------------------------------
// Cell assignment
// ---------------------------------------------------------------------------

std::vector<CellAssignment> FileIngestionPipeline::assign_cells(size_t file_count,
                                                                const DropSnapshot& snapshot,
                                                                const GridLayout& layout,
                                                                const GridOccupancy& existing) {
    std::vector<CellAssignment> result;
    result.reserve(file_count);

    // Cells holding a button or already claimed by this batch
    GridOccupancy taken(layout.rows, layout.cols);
    for (int r = 0; r < layout.rows; ++r) {
        for (int c = 0; c < layout.cols; ++c) {
            if (existing.is_occupied({r, c})) {
                taken.occupy({r, c});
            }
        }
    }
    std::set<CellAddress> claimed;

    std::optional<CellAddress> hover;
    if (snapshot.hover_cell && layout.contains(*snapshot.hover_cell)) {
        hover = snapshot.hover_cell;
    }
    std::optional<CellAddress> pointer_cell;
    if (snapshot.last_pointer) {
        pointer_cell = resolve_cell(*snapshot.last_pointer, layout);
    }

    for (size_t i = 0; i < file_count; ++i) {
        CellAssignment assignment;

        if (hover && claimed.count(*hover) == 0) {
            assignment.cell = hover;
        } else if (pointer_cell && claimed.count(*pointer_cell) == 0) {
            assignment.cell = pointer_cell;
        } else {
            std::optional<CellAddress> contested = hover ? hover : pointer_cell;
            assignment.cell =
                contested ? taken.find_available_after(*contested) : taken.find_available();
            assignment.status = assignment.cell ? PlacementStatus::Relocated
                                                : PlacementStatus::SkippedGridFull;
        }

        if (assignment.cell) {
            claimed.insert(*assignment.cell);
            taken.occupy(*assignment.cell);
        }
        result.push_back(assignment);
    }
    return result;
}

// ---------------------------------------------------------------------------
// Batch lifecycle
// ---------------------------------------------------------------------------

uint64_t FileIngestionPipeline::ingest(const std::vector<FileRef>& files,
                                       const DropSnapshot& snapshot, const GridLayout& layout,
                                       const Page& page, CompletionCallback on_complete) {
    auto batch = std::make_shared<Batch>();
    batch->id = next_batch_id_++;
    batch->generation = generation_;
    batch->on_complete = std::move(on_complete);
    batch->slots.resize(files.size());
    batch->outcomes.resize(files.size());

    spdlog::info("[FileIngestion] Batch {}: {} file(s) dropped", batch->id, files.size());

    GridOccupancy existing(layout.rows, layout.cols);
    for (const auto& b : page.buttons) {
        existing.occupy(b.position);
    }
    auto assignments = assign_cells(files.size(), snapshot, layout, existing);

    // Every cell is fixed before the first extraction starts
    std::vector<std::pair<size_t, std::string>> extractions;
    for (size_t i = 0; i < files.size(); ++i) {
        FileOutcome& outcome = batch->outcomes[i];
        outcome.path = files[i].path;
        outcome.status = assignments[i].status;
        outcome.cell = assignments[i].cell;

        if (!assignments[i].cell) {
            spdlog::warn("[FileIngestion] No free cell for '{}'", files[i].path);
            continue;
        }

        DroppedFile file = analyze_dropped_file(files[i].path);
        ButtonPlacement placement;
        placement.position = *assignments[i].cell;
        placement.action_type = action_type_for(file.type);
        placement.label = make_button_label(file.name);
        placement.icon = default_icon_for(file);
        placement.config = make_action_config(file);
        placement.style = default_style_for(file.type);
        batch->slots[i] = std::move(placement);

        spdlog::debug("[FileIngestion] '{}' ({}) -> ({},{}) {}", file.name,
                      dropped_file_type_name(file.type), assignments[i].cell->row,
                      assignments[i].cell->col, placement_status_name(assignments[i].status));

        if (extractor_ && wants_extracted_icon(file.type)) {
            extractions.emplace_back(i, file.path);
        }
    }

    batch->pending = extractions.size();
    if (batch->pending == 0) {
        finish(batch);
        return batch->id;
    }

    batches_[batch->id] = batch;
    for (const auto& [slot, path] : extractions) {
        request_icon(batch, slot, path);
    }
    return batch->id;
}

void FileIngestionPipeline::request_icon(const std::shared_ptr<Batch>& batch, size_t slot,
                                         const std::string& path) {
    std::weak_ptr<bool> weak_alive = alive_;
    uint64_t batch_id = batch->id;
    uint64_t generation = batch->generation;

    extractor_->extract_icon(
        path,
        [this, weak_alive, batch_id, generation, slot](const IconInfo& info) {
            ui::queue_update([this, weak_alive, batch_id, generation, slot, info]() {
                auto alive = weak_alive.lock();
                if (!alive || !*alive)
                    return;
                settle_icon(batch_id, generation, slot, info, {});
            });
        },
        [this, weak_alive, batch_id, generation, slot](const std::string& error) {
            ui::queue_update([this, weak_alive, batch_id, generation, slot, error]() {
                auto alive = weak_alive.lock();
                if (!alive || !*alive)
                    return;
                settle_icon(batch_id, generation, slot, std::nullopt, error);
            });
        });
}

void FileIngestionPipeline::settle_icon(uint64_t batch_id, uint64_t generation, size_t slot,
                                        const std::optional<IconInfo>& icon,
                                        const std::string& error) {
    if (generation != generation_) {
        spdlog::debug("[FileIngestion] Discarding icon for cancelled batch {}", batch_id);
        return;
    }
    auto it = batches_.find(batch_id);
    if (it == batches_.end()) {
        return;
    }
    auto batch = it->second;
    if (slot >= batch->slots.size() || !batch->slots[slot]) {
        return;
    }

    auto& placement = *batch->slots[slot];
    if (icon && !icon->icon_ref.empty()) {
        placement.icon = icon->icon_ref;
        batch->outcomes[slot].icon_extracted = true;
        spdlog::debug("[FileIngestion] Icon for '{}' from {}", placement.label,
                      icon_source_kind_name(icon->source_kind));
    } else {
        spdlog::warn("[FileIngestion] Icon extraction failed for '{}', using default: {}",
                     batch->outcomes[slot].path, icon ? "empty icon reference" : error);
    }

    if (batch->pending > 0) {
        --batch->pending;
    }
    if (batch->pending == 0) {
        batches_.erase(it);
        finish(batch);
    }
}

void FileIngestionPipeline::finish(const std::shared_ptr<Batch>& batch) {
    IngestResult result;
    result.batch_id = batch->id;
    result.outcomes = std::move(batch->outcomes);
    for (auto& slot : batch->slots) {
        if (slot) {
            result.placements.push_back(std::move(*slot));
        }
    }

    size_t skipped = result.skipped_count();
    if (skipped > 0) {
        spdlog::warn("[FileIngestion] Batch {}: {} placed, {} skipped (grid full)", result.batch_id,
                     result.placements.size(), skipped);
    } else {
        spdlog::info("[FileIngestion] Batch {}: {} placed", result.batch_id,
                     result.placements.size());
    }

    if (batch->on_complete) {
        auto cb = std::move(batch->on_complete);
        cb(result);
    }
}

void FileIngestionPipeline::cancel() {
    ++generation_;
    if (!batches_.empty()) {
        spdlog::info("[FileIngestion] Cancelled {} batch(es) in flight", batches_.size());
    }
    batches_.clear();
}

} // namespace qdeck
