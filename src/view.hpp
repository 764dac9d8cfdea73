#pragma once

#include <algorithm>
#include <cmath>
#include <utility>

#include "imgui.h"

#include "grid.hpp"

namespace lattice {
    // Maps between the canvas (pixels, y pointing down, relative to the canvas's top-left corner) and the
    // world (y pointing up, `cell_pitch` units per cell).
    // world-pos == center + (canvas-pos - canvas-size / 2) * scale, with y flipped.
    class cameraT {
    public:
        static constexpr float cell_pitch = 30;
        static constexpr float cell_size = 20; // Drawn size; the rest of the pitch is the gap.
        static constexpr float min_scale = 1, max_scale = 5;
        static constexpr float move_speed = 500; // World units per second.

    private:
        ImVec2 m_center{0, 0};
        float m_scale = 1; // World units per pixel.

    public:
        ImVec2 center() const { return m_center; }
        float scale() const { return m_scale; }

        ImVec2 to_world(const ImVec2 canvas_pos, const ImVec2 canvas_size) const {
            return ImVec2(m_center.x + (canvas_pos.x - 0.5f * canvas_size.x) * m_scale,
                          m_center.y - (canvas_pos.y - 0.5f * canvas_size.y) * m_scale);
        }

        ImVec2 to_canvas(const ImVec2 world_pos, const ImVec2 canvas_size) const {
            return ImVec2((world_pos.x - m_center.x) / m_scale + 0.5f * canvas_size.x,
                          0.5f * canvas_size.y - (world_pos.y - m_center.y) / m_scale);
        }

        static posT cell_at(const ImVec2 world_pos) {
            return {.x = int64_t(std::floor(world_pos.x / cell_pitch)),
                    .y = int64_t(std::floor(world_pos.y / cell_pitch))};
        }

        posT to_cell(const ImVec2 canvas_pos, const ImVec2 canvas_size) const {
            return cell_at(to_world(canvas_pos, canvas_size));
        }

        // The square drawn for `cell`, as {min, max} in canvas coordinates.
        std::pair<ImVec2, ImVec2> cell_rect(const posT& cell, const ImVec2 canvas_size) const {
            const float gap = (cell_pitch - cell_size) / 2;
            const float x = cell.x * cell_pitch, y = cell.y * cell_pitch;
            // The top-left corner in canvas coordinates is the top-left corner in the world (max y).
            const ImVec2 min = to_canvas(ImVec2(x + gap, y + cell_pitch - gap), canvas_size);
            const float len = cell_size / m_scale;
            return {min, ImVec2(min.x + len, min.y + len)};
        }

        // Cells that can be seen on the canvas, with one cell of margin on each side.
        rangeT visible_cells(const ImVec2 canvas_size) const {
            const float half_w = 0.5f * canvas_size.x * m_scale;
            const float half_h = 0.5f * canvas_size.y * m_scale;
            const auto floor_div = [](float v) { return int64_t(std::floor(v / cell_pitch)); };
            return {.begin{.x = floor_div(m_center.x - half_w - cell_pitch),
                           .y = floor_div(m_center.y - half_h - cell_pitch)},
                    .end{.x = floor_div(m_center.x + half_w + cell_pitch),
                         .y = floor_div(m_center.y + half_h + cell_pitch)}};
        }

        void look_at(const ImVec2 world_pos) { m_center = world_pos; }

        void look_at(const rangeT& cells) {
            assert(!cells.empty());
            m_center = ImVec2(0.5f * float(cells.begin.x + cells.end.x) * cell_pitch,
                              0.5f * float(cells.begin.y + cells.end.y) * cell_pitch);
        }

        // `dir` is not required to be normalized.
        void move(const ImVec2 dir, const float dt) {
            const float len = std::sqrt(dir.x * dir.x + dir.y * dir.y);
            if (len > 0) {
                m_center.x += dir.x / len * move_speed * dt;
                m_center.y += dir.y / len * move_speed * dt;
            }
        }

        // `mouse_delta` is in pixels (y pointing down); the world follows the mouse.
        void drag(const ImVec2 mouse_delta) {
            m_center.x -= mouse_delta.x * m_scale;
            m_center.y += mouse_delta.y * m_scale;
        }

        // Scrolling up zooms in.
        void zoom(const float wheel) { m_scale = std::clamp(m_scale - wheel, min_scale, max_scale); }
    };

#ifdef ENABLE_TESTS
    namespace _tests {
        inline const testT test_camera_mapping = [] {
            const ImVec2 size(800, 600);
            cameraT camera;
            assert((camera.to_cell({400, 300}, size) == posT{0, 0}));
            assert((camera.to_cell({399, 300}, size) == posT{-1, 0}));
            assert((camera.to_cell({400, 301}, size) == posT{0, -1}));
            assert((camera.to_cell({430, 270}, size) == posT{1, 1}));
            assert((camera.to_cell({429, 271}, size) == posT{0, 0}));

            camera.zoom(-1);
            assert(camera.scale() == 2);
            assert((camera.to_cell({415, 300}, size) == posT{1, 0}));
            assert((camera.to_cell({414, 300}, size) == posT{0, 0}));

            camera.look_at(ImVec2(-3000, 1500));
            assert((camera.to_cell({400, 300}, size) == posT{-100, 50}));
        };

        inline const testT test_camera_cell_rect = [] {
            const ImVec2 size(1280, 720);
            cameraT camera;
            for (int round = 0; round < 3; ++round) {
                const float x = float(int(testT::rand() % 4001) - 2000);
                const float y = float(int(testT::rand() % 4001) - 2000);
                camera.look_at(ImVec2(x, y));
                for (int i = 0; i < 50; ++i) {
                    const posT cell{int64_t(testT::rand() % 41) - 20, int64_t(testT::rand() % 41) - 20};
                    const auto [min, max] = camera.cell_rect(cell, size);
                    assert(std::abs((max.x - min.x) - cameraT::cell_size / camera.scale()) < 0.001f);
                    const ImVec2 mid(0.5f * (min.x + max.x), 0.5f * (min.y + max.y));
                    assert(camera.to_cell(mid, size) == cell);
                }
                camera.zoom(-1);
            }
        };

        inline const testT test_camera_visible = [] {
            const ImVec2 size(640, 480);
            cameraT camera;
            camera.look_at(ImVec2(123, -456));
            camera.zoom(-2);
            const rangeT range = camera.visible_cells(size);
            for (const ImVec2 corner : {ImVec2(0, 0), ImVec2(639, 0), ImVec2(0, 479), ImVec2(639, 479)}) {
                assert(range.contains(camera.to_cell(corner, size)));
            }
            assert(range.width() <= int64_t(size.x * camera.scale() / cameraT::cell_pitch) + 4);
        };

        inline const testT test_camera_controls = [] {
            cameraT camera;
            camera.zoom(-100);
            assert(camera.scale() == cameraT::max_scale);
            camera.zoom(100);
            assert(camera.scale() == cameraT::min_scale);
            camera.zoom(0.5f);
            assert(camera.scale() == cameraT::min_scale);

            camera.zoom(-1); // 2.
            camera.drag(ImVec2(10, 10));
            assert(camera.center().x == -20 && camera.center().y == 20);

            camera.look_at(ImVec2(0, 0));
            camera.move(ImVec2(0, 0), 1);
            assert(camera.center().x == 0 && camera.center().y == 0);
            camera.move(ImVec2(0, -3), 0.5f);
            assert(camera.center().x == 0 && camera.center().y == -250);
            camera.move(ImVec2(1, 1), 1);
            assert(std::abs(camera.center().x - 353.553f) < 0.01f);

            camera.look_at(rangeT{.begin{.x = 0, .y = 0}, .end{.x = 4, .y = 2}});
            assert(camera.center().x == 60 && camera.center().y == 30);
        };
    }  // namespace _tests
#endif // ENABLE_TESTS

} // namespace lattice
