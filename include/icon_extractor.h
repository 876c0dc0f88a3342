// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <functional>
#include <string>

namespace qdeck {

enum class IconSourceKind {
    Extracted, ///< pulled out of the file itself
    Theme,     ///< looked up in an icon theme
    File,      ///< the file is an image
    Emoji,     ///< symbolic fallback
};

const char* icon_source_kind_name(IconSourceKind kind);

struct IconInfo {
    std::string icon_ref; ///< image path or symbolic reference
    IconSourceKind source_kind = IconSourceKind::Extracted;
};

/**
 * @brief Resolves a representative icon for a file on disk
 *
 * Exactly one of the callbacks is invoked per request, from any thread
 * (possibly synchronously from inside extract_icon()). Callers marshal to the
 * main thread themselves. A timeout enforced by an implementation is reported
 * through on_error like any other failure.
 */
class IconExtractor {
  public:
    using SuccessCallback = std::function<void(const IconInfo&)>;
    using ErrorCallback = std::function<void(const std::string&)>;

    virtual ~IconExtractor() = default;

    virtual void extract_icon(const std::string& file_path, SuccessCallback on_success,
                              ErrorCallback on_error) = 0;
};

} // namespace qdeck
