// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"
#include "desktop_icon_extractor.h"
#include "logging_init.h"
#include "lvgl_init.h"
#include "page_store.h"
#include "ui_file_drop_controller.h"
#include "ui_launcher_grid.h"
#include "ui_update_queue.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr const char* DEFAULT_CONFIG_PATH = "qdeckconfig.json";
constexpr uint32_t UPDATE_QUEUE_DRAIN_MS = 5;

std::atomic<bool> g_quit_requested{false};

struct CliOptions {
    std::string config_path;
    std::optional<int> width;
    std::optional<int> height;
    int verbosity = 0;
};

void print_usage(const char* argv0) {
    std::printf("Usage: %s [options]\n"
                "  --config <path>   configuration file (default %s)\n"
                "  --width <px>      window width\n"
                "  --height <px>     window height\n"
                "  -v, -vv, -vvv     more verbose logging\n"
                "  -h, --help        show this help\n",
                argv0, DEFAULT_CONFIG_PATH);
}

std::optional<int> parse_int(const char* text) {
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || value <= 0 || value > 16384) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

/// Returns false when the program should exit (help or bad arguments)
bool parse_args(int argc, char** argv, CliOptions& opts, int& exit_code) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            exit_code = 0;
            return false;
        } else if (std::strcmp(arg, "--config") == 0 && has_value) {
            opts.config_path = argv[++i];
        } else if ((std::strcmp(arg, "--width") == 0 || std::strcmp(arg, "--height") == 0) &&
                   has_value) {
            auto value = parse_int(argv[++i]);
            if (!value) {
                std::fprintf(stderr, "Invalid value for %s: %s\n", arg, argv[i]);
                exit_code = 2;
                return false;
            }
            if (std::strcmp(arg, "--width") == 0) {
                opts.width = value;
            } else {
                opts.height = value;
            }
        } else if (arg[0] == '-' && arg[1] == 'v' &&
                   std::strspn(arg + 1, "v") == std::strlen(arg + 1)) {
            opts.verbosity += static_cast<int>(std::strlen(arg + 1));
        } else {
            std::fprintf(stderr, "Unknown argument: %s\n", arg);
            print_usage(argv[0]);
            exit_code = 2;
            return false;
        }
    }

    if (opts.config_path.empty()) {
        const char* env = std::getenv("QDECK_CONFIG");
        opts.config_path = (env && *env) ? env : DEFAULT_CONFIG_PATH;
    }
    return true;
}

spdlog::level::level_enum level_for(const std::string& configured, int verbosity) {
    if (verbosity >= 3)
        return spdlog::level::trace;
    if (verbosity == 2)
        return spdlog::level::debug;
    if (verbosity == 1)
        return spdlog::level::info;
    return qdeck::logging::parse_level(configured).value_or(spdlog::level::info);
}

int quit_watch(void* /*userdata*/, SDL_Event* event) {
    if (event->type == SDL_QUIT ||
        (event->type == SDL_WINDOWEVENT && event->window.event == SDL_WINDOWEVENT_CLOSE)) {
        g_quit_requested.store(true);
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    int exit_code = 0;
    if (!parse_args(argc, argv, opts, exit_code)) {
        return exit_code;
    }

    // Console-only until the config tells us more
    qdeck::logging::init_logging({});

    qdeck::Config* cfg = qdeck::Config::get_instance();
    if (!cfg->init(opts.config_path)) {
        spdlog::warn("[Main] Running with unsaved default configuration");
    }

    qdeck::logging::LogConfig log_config;
    log_config.level = level_for(cfg->get<std::string>("/log/level", "info"), opts.verbosity);
    log_config.file_path = cfg->get<std::string>("/log/file", "");
    qdeck::logging::init_logging(log_config);

    int width = opts.width.value_or(cfg->get<int>("/window/width_px", 800));
    int height = opts.height.value_or(cfg->get<int>("/window/height_px", 480));
    int cell_size = std::max(16, cfg->get<int>("/window/cell_size_px", 96));
    int gap = std::max(0, cfg->get<int>("/window/gap_px", 8));

    qdeck::PageStore store(*cfg);
    store.load();

    qdeck::LvglContext ctx;
    if (!qdeck::init_lvgl(width, height, ctx)) {
        return 1;
    }
    SDL_AddEventWatch(quit_watch, nullptr);

    qdeck::IconSearchConfig icon_search;
    icon_search.search_roots =
        cfg->get<std::vector<std::string>>("/icons/search_paths", std::vector<std::string>{});
    icon_search.theme = cfg->get<std::string>("/icons/theme", "hicolor");
    qdeck::DesktopIconExtractor extractor(icon_search);
    extractor.start();

    lv_timer_t* drain_timer = lv_timer_create(
        [](lv_timer_t*) { qdeck::ui::UpdateQueue::instance().drain(); }, UPDATE_QUEUE_DRAIN_MS,
        nullptr);

    {
        qdeck::ui::LauncherGridView view(lv_screen_active(), cell_size, gap);
        int observer = store.add_observer(
            [&view](const std::shared_ptr<const qdeck::Page>& page) { view.render(page); });
        view.render(store.current_page());

        qdeck::ui::DropSettings drop_settings;
        drop_settings.pointer_poll_ms =
            static_cast<uint32_t>(std::max(1, cfg->get<int>("/drop/pointer_poll_ms", 16)));
        drop_settings.undo_depth =
            static_cast<size_t>(std::max(1, cfg->get<int>("/drop/undo_depth", 50)));

        qdeck::ui::FileDropController controller(view, store, &extractor, drop_settings);
        controller.attach(ctx.window);

        spdlog::info("[Main] QDeck running ({}x{}, page '{}')", width, height,
                     store.current_page() ? store.current_page()->name : "?");

        while (!g_quit_requested.load()) {
            uint32_t idle_ms = lv_timer_handler();
            SDL_Delay(std::min<uint32_t>(idle_ms, UPDATE_QUEUE_DRAIN_MS));
        }

        spdlog::info("[Main] Shutting down");
        controller.detach();
        store.remove_observer(observer);
    }

    // Outstanding extractions fail on stop(); nobody is left to receive them
    {
        auto freeze = qdeck::ui::UpdateQueue::instance().scoped_freeze();
        extractor.stop();
        qdeck::ui::UpdateQueue::instance().drain();
    }
    lv_timer_delete(drain_timer);

    SDL_DelEventWatch(quit_watch, nullptr);
    qdeck::deinit_lvgl(ctx);
    spdlog::shutdown();
    return 0;
}
