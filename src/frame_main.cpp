#include <cmath>

#include "common.hpp"

// Frame duration for the clock. The clock requires finite non-negative values.
static float frame_dt() {
    const float dt = ImGui::GetIO().DeltaTime;
    if (!std::isfinite(dt) || dt < 0) {
        return 0;
    }
    return dt;
}

static void locate_pattern(const lattice::worldT& world, lattice::cameraT& camera) {
    if (const auto box = world.grid().bounding_box()) {
        camera.look_at(*box);
    } else {
        messenger::set_msg("Nothing to center on.");
    }
}

static void control_bar(lattice::worldT& world, lattice::cameraT& camera) {
    ImGui::AlignTextToFramePadding();
    imgui_StrTooltip("(...)", "Keyboard:\n"
                              "Run/Pause: Space    +1: N (repeatable)    Center: C\n"
                              "Move: W/A/S/D\n\n"
                              "Mouse (in the space):\n"
                              "- Left-click and hold to set cells to alive (green).\n"
                              "- Right-click and hold to set cells to dead (red).\n"
                              "- Drag with middle button, or 'Shift' and drag with left button, to move.\n"
                              "- Scroll to zoom in/out.");

    ImGui::SameLine();
    bool pause = !world.running();
    if (ImGui::Checkbox("Pause", &pause) || shortcuts::test(ImGuiKey_Space)) {
        world.toggle_running();
    }

    ImGui::SameLine();
    ImGui::PushItemFlag(ImGuiItemFlags_ButtonRepeat, true);
    if (ImGui::Button("+1") || shortcuts::test(ImGuiKey_N, true)) {
        world.step_once();
    }
    ImGui::PopItemFlag();
    imgui_ItemTooltip("Advance by one generation (whether paused or not).");

    ImGui::SameLine();
    if (ImGui::Button("Clear")) {
        world.clear();
        messenger::set_msg("Cleared.");
    }

    ImGui::SameLine();
    if (ImGui::Button("Center") || shortcuts::test(ImGuiKey_C)) {
        locate_pattern(world, camera);
    }
    imgui_ItemTooltip("Center the view on the live cells.");

    const float wide_spacing = ImGui::CalcTextSize(" ").x * 3;
    ImGui::SameLine(0, wide_spacing);
    if (world.running()) {
        imgui_StrColored(ImVec4(0, 1, 0, 1), "Simulating");
    } else {
        imgui_Str("Paused");
    }

    ImGui::SameLine(0, wide_spacing);
    ImGui::Text("Generation:%lld", (long long)world.generation());
    ImGui::SameLine(0, wide_spacing);
    ImGui::Text("Population:%zu", world.grid().population());
    ImGui::SameLine(0, wide_spacing);
    ImGui::Text("Zoom:%.0fx", camera.scale());
    ImGui::SameLine(0, wide_spacing);
    ImGui::Text("(%d FPS)", (int)round(ImGui::GetIO().Framerate));
}

static void space_canvas(lattice::worldT& world, lattice::cameraT& camera, const float dt) {
    // (Values of GetContentRegionAvail() can be negative...)
    ImGui::InvisibleButton("Canvas", ImMax(ImVec2(60, 60), ImGui::GetContentRegionAvail()),
                           ImGuiButtonFlags_MouseButtonLeft | ImGuiButtonFlags_MouseButtonRight |
                               ImGuiButtonFlags_MouseButtonMiddle);
    const ImVec2 canvas_min = ImGui::GetItemRectMin();
    const ImVec2 canvas_max = ImGui::GetItemRectMax();
    const ImVec2 canvas_size = ImGui::GetItemRectSize();
    const bool active = ImGui::IsItemActive();
    const bool hovered = ImGui::IsItemHovered();

    const ImGuiIO& io = ImGui::GetIO();
    {
        ImVec2 dir{0, 0};
        dir.y += shortcuts::global_flag(ImGuiKey_W);
        dir.y -= shortcuts::global_flag(ImGuiKey_S);
        dir.x -= shortcuts::global_flag(ImGuiKey_A);
        dir.x += shortcuts::global_flag(ImGuiKey_D);
        camera.move(dir, dt);
    }

    if (hovered && imgui_MouseScrolling()) {
        camera.zoom(io.MouseWheel);
    }

    const bool l_down = ImGui::IsMouseDown(ImGuiMouseButton_Left);
    const bool r_down = ImGui::IsMouseDown(ImGuiMouseButton_Right);
    const bool m_down = ImGui::IsMouseDown(ImGuiMouseButton_Middle);
    const bool shift = io.KeyShift;
    if (active && (m_down || (l_down && shift))) {
        camera.drag(io.MouseDelta);
    } else if ((hovered || active) && ImGui::IsMousePosValid()) {
        const ImVec2 mouse_pos = io.MousePos - canvas_min;
        if (ImRect(ImVec2(0, 0), canvas_size).Contains(mouse_pos)) {
            const lattice::posT cell = camera.to_cell(mouse_pos, canvas_size);
            if (l_down && !shift) {
                world.set_alive(cell);
            } else if (r_down) {
                world.set_dead(cell);
            }
        }
    }

    ImDrawList* const drawlist = ImGui::GetWindowDrawList();
    drawlist->PushClipRect(canvas_min, canvas_max, true);
    drawlist->AddRectFilled(canvas_min, canvas_max, canvas_bg_col);
    const lattice::rangeT visible = camera.visible_cells(canvas_size);
    for (int64_t y = visible.begin.y; y < visible.end.y; ++y) {
        for (int64_t x = visible.begin.x; x < visible.end.x; ++x) {
            const lattice::posT cell{x, y};
            const auto [min, max] = camera.cell_rect(cell, canvas_size);
            drawlist->AddRectFilled(canvas_min + min, canvas_min + max,
                                    world.grid().is_alive(cell) ? alive_col : dead_col);
        }
    }
    drawlist->PopClipRect();
    imgui_ItemRect(ImGui::GetColorU32(ImGuiCol_TableBorderStrong));
}

void frame_main(lattice::worldT& world, lattice::cameraT& camera) {
    shortcuts::begin_frame();
    messenger::display();

    const float dt = frame_dt();

    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                   ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_NoSavedSettings;
    const ImGuiViewport* viewport = ImGui::GetMainViewport();

    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    if (auto window = imgui_Window("Main", nullptr, flags)) {
        control_bar(world, camera);
        ImGui::Separator();

        // Edits in this frame are seen by the generation below.
        space_canvas(world, camera, dt);
    }

    // Unlike editing, the simulation goes on when the window is not visible (e.g. minimized).
    world.advance(dt);
}
