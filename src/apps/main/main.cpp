// Badge sheet viewer: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include <badge_layout/layout_engine.hpp>
#include <badge_loaders/json_loader.hpp>
#include <badge_loaders/json_writer.hpp>
#include <badge_model/settings.hpp>
#include <canvas/canvas.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <optional>
#include <string>

namespace {

struct Options {
    std::string settings_path;
    std::string export_path;
    bool self_check = false;
};

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opt;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--self-check") {
            opt.self_check = true;
        } else if ((arg == "--settings" || arg == "--export-layout") && i + 1 < argc) {
            (arg == "--settings" ? opt.settings_path : opt.export_path) = argv[++i];
        } else {
            (void)fprintf(stderr,
                "usage: %s [--settings file.json] [--export-layout out.json] [--self-check]\n"
                "example: %s --settings data/example_settings.json --export-layout layout.json\n",
                argv[0], argv[0]);
            return std::nullopt;
        }
    }
    return opt;
}

// Headless path: compute, write the manifest, exit.
int export_layout(const badge_model::LayoutSettings& settings, const std::string& path) {
    const badge_model::GeometryConfig geometry = badge_model::make_geometry(settings);
    const badge_layout::LayoutEngine engine;
    const auto result = engine.layout(settings.item_count, settings.mode,
        settings.spacing_mm, settings.margin_mm, geometry);
    if (!result) {
        spdlog::error("export: {} items requested but nothing fits on a {} sheet",
            settings.item_count, settings.paper.name);
        return 2;
    }
    if (!badge_loaders::write_layout_json_file(path, *result, geometry)) return 1;
    spdlog::info("export: {} -> {} ({} pages)", badge_layout::describe_layout(result->sheet), path, result->total_pages);
    return 0;
}

bool slider_mm(const char* label, double& value, double lo, double hi) {
    float v = static_cast<float>(value);
    if (!ImGui::SliderFloat(label, &v, static_cast<float>(lo), static_cast<float>(hi), "%.1f mm")) return false;
    value = v;
    return true;
}

void draw_controls(canvas::SheetCanvas& sheet_canvas) {
    badge_model::LayoutSettings s = sheet_canvas.settings();

    ImGui::SeparatorText("Badge");
    for (const auto& preset : badge_model::badge_presets()) {
        if (ImGui::Button(preset.name.c_str())) s = badge_model::apply_preset(s, preset);
        ImGui::SameLine();
    }
    ImGui::NewLine();
    slider_mm("Size", s.badge_size_mm, badge_model::limits::min_badge_size_mm, badge_model::limits::max_badge_size_mm);
    slider_mm("Bleed", s.bleed_mm, 0.0, badge_model::limits::max_bleed_mm);
    ImGui::Text("Diameter: %.1f mm (%d px)", s.badge_diameter_mm(), sheet_canvas.geometry().item_diameter_px);

    ImGui::SeparatorText("Layout");
    int mode = s.mode == badge_model::LayoutMode::Grid ? 0 : 1;
    ImGui::RadioButton("Grid", &mode, 0);
    ImGui::SameLine();
    ImGui::RadioButton("Compact", &mode, 1);
    s.mode = mode == 0 ? badge_model::LayoutMode::Grid : badge_model::LayoutMode::Compact;
    slider_mm("Spacing", s.spacing_mm, 0.0, badge_model::limits::max_spacing_mm);
    slider_mm("Margin", s.margin_mm, 0.0, badge_model::limits::max_margin_mm);
    if (s.margin_mm < badge_model::limits::recommended_min_margin_mm)
        ImGui::TextColored(ImVec4(0.95f, 0.7f, 0.3f, 1.0f), "Most printers cannot print this close to the edge");

    if (ImGui::BeginCombo("Paper", s.paper.name.c_str())) {
        for (const auto& paper : badge_model::paper_sizes()) {
            if (ImGui::Selectable(paper.name.c_str(), paper == s.paper)) s.paper = paper;
        }
        ImGui::EndCombo();
    }
    ImGui::InputInt("Badges", &s.item_count);

    sheet_canvas.set_settings(s);

    ImGui::SeparatorText("Pages");
    const auto& layout = sheet_canvas.layout();
    int page = sheet_canvas.current_page();
    if (ImGui::ArrowButton("##prev", ImGuiDir_Left)) sheet_canvas.set_current_page(page - 1);
    ImGui::SameLine();
    ImGui::Text("Page %d / %d", sheet_canvas.current_page() + 1, sheet_canvas.page_count());
    ImGui::SameLine();
    if (ImGui::ArrowButton("##next", ImGuiDir_Right)) sheet_canvas.set_current_page(page + 1);

    ImGui::Text("Per sheet: %d", static_cast<int>(sheet_canvas.sheet().capacity()));
    if (layout) {
        const auto& current = layout->pages[static_cast<std::size_t>(sheet_canvas.current_page())];
        ImGui::Text("On this page: %d", current.items_on_page);
    }
    ImGui::SeparatorText("View");
    if (ImGui::Button("Fit")) sheet_canvas.request_fit();
    ImGui::SameLine();
    if (ImGui::Button("-")) sheet_canvas.zoom_at_center(1.0f / 1.2f);
    ImGui::SameLine();
    if (ImGui::Button("+")) sheet_canvas.zoom_at_center(1.2f);
    ImGui::SameLine();
    ImGui::Text("%.0f%%", sheet_canvas.zoom() * 100.0f);

    ImGui::TextWrapped("%s", sheet_canvas.summary().c_str());
    if (sheet_canvas.violation_count() > 0)
        ImGui::TextColored(ImVec4(0.9f, 0.3f, 0.3f, 1.0f), "%zu layout violations (see logs)", sheet_canvas.violation_count());
}

} // namespace

int main(int argc, char* argv[])
{
    const auto options = parse_args(argc, argv);
    if (!options) return 1;

    badge_model::LayoutSettings settings;
    if (!options->settings_path.empty()) {
        auto loaded = badge_loaders::load_layout_settings_from_json_file(options->settings_path);
        if (!loaded) {
            (void)fprintf(stderr, "Cannot load settings from %s\n", options->settings_path.c_str());
            return 1;
        }
        settings = *loaded;
    }

    if (!options->export_path.empty())
        return export_layout(settings, options->export_path);

    SDL_SetMainReady();
    // SDL3: SDL_Init returns true on success, false on failure
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        (void)fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    // Default fallback if display bounds are unavailable.
    int window_width = 1280;
    int window_height = 800;
    {
        SDL_Rect bounds{};
        if (SDL_GetDisplayUsableBounds(SDL_GetPrimaryDisplay(), &bounds)) {
            window_width = bounds.w * 2 / 3;
            window_height = bounds.h * 2 / 3;
        }
    }
    const SDL_WindowFlags window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
        | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    SDL_Window* window = SDL_CreateWindow("Badge Sheet", window_width, window_height, window_flags);
    if (!window) {
        (void)fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        (void)fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleFonts;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleViewports;

    ImGui::StyleColorsDark();

    ImFontConfig font_cfg;
    font_cfg.OversampleH = 2;
    font_cfg.OversampleV = 2;
    font_cfg.PixelSnapH = true;
    const float font_size_px = 17.0f;
#ifdef _WIN32
    const char* font_paths[] = {
        "C:\\Windows\\Fonts\\segoeui.ttf",
        "C:\\Windows\\Fonts\\arial.ttf",
    };
#else
    const char* font_paths[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
    };
#endif
    for (const char* path : font_paths) {
        if (io.Fonts->AddFontFromFileTTF(path, font_size_px, &font_cfg) != nullptr)
            break;
    }

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    canvas::SheetCanvas sheet_canvas;
    sheet_canvas.set_settings(settings);

    const float panel_width = 340.0f;
    bool running = true;
    int frame = 0;
    int exit_code = 0;

    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT)
                running = false;
            if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED &&
                event.window.windowID == SDL_GetWindowID(window))
                running = false;
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(ImVec2(panel_width, io.DisplaySize.y));
        ImGui::Begin("Controls", nullptr,
            ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoCollapse);
        draw_controls(sheet_canvas);
        ImGui::End();

        ImGui::SetNextWindowPos(ImVec2(panel_width, 0));
        ImGui::SetNextWindowSize(ImVec2(io.DisplaySize.x - panel_width, io.DisplaySize.y));
        ImGui::Begin("Sheet", nullptr,
            ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
            | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);
        ImVec2 canvas_size = ImGui::GetContentRegionAvail();
        if (canvas_size.x > 0 && canvas_size.y > 0) {
            ImGui::BeginChild("canvas", canvas_size, false, ImGuiWindowFlags_NoScrollbar);
            sheet_canvas.update_and_draw(canvas_size.x, canvas_size.y);
            ImGui::EndChild();
        }
        ImGui::End();

        // A couple of frames so the canvas has drawn once before judging it.
        if (options->self_check && frame >= 2) {
            const std::size_t violations = sheet_canvas.violation_count();
            (void)fprintf(stderr, "[self-check] %s violations=%zu\n",
                sheet_canvas.summary().c_str(), violations);
            exit_code = violations == 0 ? 0 : 2;
            running = false;
        }

        ImGui::Render();
        SDL_GL_MakeCurrent(window, gl_context);
        // HiDPI: use framebuffer size in pixels, not logical DisplaySize
        const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
        const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
        glViewport(0, 0, fb_w, fb_h);
        glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
        ++frame;
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return exit_code;
}
