// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "icon_extractor.h"

namespace qdeck {

const char* icon_source_kind_name(IconSourceKind kind) {
    switch (kind) {
    case IconSourceKind::Extracted:
        return "extracted";
    case IconSourceKind::Theme:
        return "theme";
    case IconSourceKind::File:
        return "file";
    case IconSourceKind::Emoji:
        return "emoji";
    }
    return "?";
}

} // namespace qdeck
