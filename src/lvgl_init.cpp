// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_init.h"

#include "logging_init.h"

#include <spdlog/spdlog.h>

namespace qdeck {

bool init_lvgl(int width, int height, LvglContext& ctx) {
    lv_init();
    logging::register_lvgl_log_handler();

    ctx.display = lv_sdl_window_create(width, height);
    if (!ctx.display) {
        spdlog::error("[LVGL] Failed to create SDL window ({}x{})", width, height);
        lv_deinit();
        return false;
    }
    lv_sdl_window_set_title(ctx.display, "QDeck");

    ctx.window = lv_sdl_window_get_window(ctx.display);
    if (!ctx.window) {
        spdlog::error("[LVGL] SDL display has no window");
        deinit_lvgl(ctx);
        return false;
    }

    ctx.pointer = lv_sdl_mouse_create();
    if (!ctx.pointer) {
        // Drops still work without a pointer device; button moves do not
        spdlog::warn("[LVGL] No pointer input device created - mouse disabled");
    }

    ctx.keyboard = lv_sdl_keyboard_create();
    if (ctx.keyboard) {
        lv_group_t* input_group = lv_group_create();
        lv_group_set_default(input_group);
        lv_indev_set_group(ctx.keyboard, input_group);
        spdlog::debug("[LVGL] Keyboard input enabled");
    }

    spdlog::debug("[LVGL] Initialized: {}x{}", width, height);
    return true;
}

void deinit_lvgl(LvglContext& ctx) {
    ctx.display = nullptr;
    ctx.pointer = nullptr;
    ctx.keyboard = nullptr;
    ctx.window = nullptr;
    lv_deinit();
}

} // namespace qdeck
