// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <SDL.h>
#include <lvgl.h>

namespace qdeck {

struct LvglContext {
    lv_display_t* display = nullptr;
    lv_indev_t* pointer = nullptr;
    lv_indev_t* keyboard = nullptr;
    SDL_Window* window = nullptr;
};

/// Initialize LVGL with the SDL2 window, mouse and keyboard drivers.
/// On failure LVGL is deinitialized again and false is returned.
bool init_lvgl(int width, int height, LvglContext& ctx);

void deinit_lvgl(LvglContext& ctx);

} // namespace qdeck
