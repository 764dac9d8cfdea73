#pragma once

#include <chrono>
#include <string>
#include <utility>

#include "dear_imgui.hpp"
#include "view.hpp"
#include "world.hpp"

/* Not inline */ static const bool check_version = IMGUI_CHECKVERSION();

struct no_create {
    no_create() = delete;
};

// Managed by `main`.
// The world and the camera are owned by `main` and live as long as the program.
void frame_main(lattice::worldT& world, lattice::cameraT& camera);

// TODO: should finally be configurable in the program (e.g. the colors).
inline const char* const window_title = "Lattice";
inline const int init_window_w = 1280, init_window_h = 720;
inline const int max_fps = 100;
inline const ImU32 alive_col = IM_COL32(0, 255, 0, 255);
inline const ImU32 dead_col = IM_COL32(255, 0, 0, 255);
inline const ImU32 canvas_bg_col = IM_COL32_BLACK;

class shortcuts : no_create {
public:
    // For held keys (e.g. movement); only blocked by text input.
    static bool global_flag(ImGuiKey key) { //
        return !ImGui::GetIO().WantTextInput && ImGui::IsKeyDown(key);
    }

    static bool keys_avail() { //
        return !ImGui::GetIO().WantCaptureKeyboard && !ImGui::IsAnyItemActive();
    }

private:
    friend void frame_main(lattice::worldT&, lattice::cameraT&);

    inline static ImGuiKey occupied = ImGuiKey_None;
    static void begin_frame() { occupied = ImGuiKey_None; }

    // Resolve shortcut competition when multiple keys are pressed.
    static bool filter(ImGuiKey key) {
        assert(key != ImGuiKey_None);
        if (occupied == ImGuiKey_None) {
            if (ImGui::IsKeyDown(key)) {
                occupied = key;
            }
            return true;
        }
        return occupied == key;
    }

public:
    static bool test(ImGuiKey key, bool repeat = false) { //
        return keys_avail() && filter(key) && ImGui::IsKeyPressed(key, repeat);
    }
};

// Transient notice near the mouse, like "Cleared.".
class messenger : no_create {
    using clockT = std::chrono::steady_clock;

    inline static std::string m_str{};
    inline static ImVec2 m_min{};
    inline static clockT::time_point m_until{};

public:
    static void set_msg(std::string str) {
        m_str = std::move(str);
        m_until = clockT::now() + std::chrono::milliseconds(800);
        m_min = ImGui::IsMousePosValid() ? ImGui::GetMousePos() + ImVec2(16, 16) : ImVec2(8, 8);
    }

    // Managed by `frame_main`.
    static void display() {
        if (m_str.empty()) {
            return;
        } else if (clockT::now() > m_until) {
            m_str.clear();
            return;
        }

        const char *const text_beg = m_str.c_str(), *const text_end = m_str.c_str() + m_str.size();
        const ImVec2 padding = ImGui::GetStyle().WindowPadding;
        const ImVec2 window_min = m_min;
        const ImVec2 window_max = window_min + ImGui::CalcTextSize(text_beg, text_end) + padding * 2;
        ImDrawList* const drawlist = ImGui::GetForegroundDrawList();
        drawlist->AddRectFilled(window_min, window_max, ImGui::GetColorU32(ImGuiCol_PopupBg));
        drawlist->AddRect(window_min, window_max, ImGui::GetColorU32(ImGuiCol_Border));
        drawlist->AddText(window_min + padding, ImGui::GetColorU32(ImGuiCol_Text), text_beg, text_end);
    }
};
