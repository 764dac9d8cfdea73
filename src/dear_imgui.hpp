#pragma once

#include <string_view>

#include "imgui.h"
#include "imgui_internal.h"

// Follows `IM_COL32_XX`.
consteval ImU32 IM_COL32_GREY(ImU8 v, ImU8 alpha) { return IM_COL32(v, v, v, alpha); }

inline void imgui_ItemRect(ImU32 col) {
    const auto [pos_min, pos_max] = GImGui->LastItemData.Rect;
    ImGui::GetWindowDrawList()->AddRect(pos_min, pos_max, col);
}

// Unlike ImGui::Text(Colored/...), these functions take unformatted string as the argument.
inline void imgui_Str(std::string_view str) { //
    ImGui::TextUnformatted(str.data(), str.data() + str.size());
}

inline void imgui_StrColored(const ImVec4& col, std::string_view str) {
    ImGui::PushStyleColor(ImGuiCol_Text, col);
    imgui_Str(str);
    ImGui::PopStyleColor();
}

inline void imgui_StrDisabled(std::string_view str) {
    imgui_StrColored(ImGui::GetStyleColorVec4(ImGuiCol_TextDisabled), str);
}

inline bool imgui_ItemTooltip(std::string_view desc) {
    if (ImGui::IsItemHovered(ImGuiHoveredFlags_ForTooltip) && ImGui::BeginTooltip()) {
        // The same as the one in `HelpMarker` in "imgui_demo.cpp".
        ImGui::PushTextWrapPos(ImGui::GetFontSize() * 35.0f);
        imgui_Str(desc);
        ImGui::PopTextWrapPos();
        ImGui::EndTooltip();
        return true;
    }
    return false;
}

// Similar to `HelpMarker` in "imgui_demo.cpp".
inline bool imgui_StrTooltip(std::string_view str, std::string_view desc) {
    imgui_StrDisabled(str);
    return imgui_ItemTooltip(desc);
}

struct [[nodiscard]] imgui_Window {
    imgui_Window(const imgui_Window&) = delete;
    imgui_Window& operator=(const imgui_Window&) = delete;

    const bool visible;
    explicit imgui_Window(const char* name, bool* p_open = nullptr, ImGuiWindowFlags flags = {})
        : visible(ImGui::Begin(name, p_open, flags)) {}
    ~imgui_Window() {
        ImGui::End(); // Unconditional.
    }
    explicit operator bool() const { return visible; }
};

inline bool imgui_MouseScrolling() { return ImGui::GetIO().MouseWheel != 0; }
