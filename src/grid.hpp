#pragma once

#include <algorithm>
#include <array>
#include <cassert>
#include <compare>
#include <cstdint>
#include <ctime>
#include <initializer_list>
#include <optional>
#include <random>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#if !defined(NDEBUG) && !defined(ENABLE_TESTS)
#define ENABLE_TESTS
#endif

namespace lattice {

#ifdef ENABLE_TESTS
    namespace _tests {
        struct testT {
            inline static std::mt19937 rand{(uint32_t)time(0)};
            inline static int count = 0;
            testT(const auto& fn) noexcept {
                fn();
                ++count;
            }
        };
    }  // namespace _tests
#endif // ENABLE_TESTS

    // A cell on the unbounded plane. The y axis points up (see `cameraT`).
    // (64-bit so that no reachable pattern can overflow.)
    struct posT {
        int64_t x, y;

        friend bool operator==(const posT&, const posT&) = default;
        friend auto operator<=>(const posT&, const posT&) = default; // Ordered by x, then y.
        friend posT operator+(const posT& a, const posT& b) { return {.x = a.x + b.x, .y = a.y + b.y}; }
        friend posT operator-(const posT& a, const posT& b) { return {.x = a.x - b.x, .y = a.y - b.y}; }

        [[nodiscard]] posT plus(int64_t dx, int64_t dy) const { return {.x = x + dx, .y = y + dy}; }
    };

    struct rangeT {
        posT begin, end; // [)

        bool contains(const posT& p) const { //
            return p.x >= begin.x && p.y >= begin.y && p.x < end.x && p.y < end.y;
        }
        bool empty() const { return begin.x >= end.x || begin.y >= end.y; }
        int64_t width() const { return end.x - begin.x; }
        int64_t height() const { return end.y - begin.y; }
    };

    namespace _misc {
        struct pos_hash {
            size_t operator()(const posT& p) const {
                uint64_t h = uint64_t(p.x) * 0x9E3779B97F4A7C15ull;
                h ^= uint64_t(p.y) + 0x7F4A7C159E3779B9ull + (h << 6) + (h >> 2);
                // splitmix64 finalizer.
                h ^= h >> 30;
                h *= 0xBF58476D1CE4E5B9ull;
                h ^= h >> 27;
                h *= 0x94D049BB133111EBull;
                h ^= h >> 31;
                return size_t(h);
            }
        };
    } // namespace _misc

    using pos_set = std::unordered_set<posT, _misc::pos_hash>;

    // The Moore neighborhood.
    // clang-format off
    inline constexpr std::array<posT, 8> neighbor_offsets{{
        {-1,  1}, {0,  1}, {1,  1},
        {-1,  0},          {1,  0},
        {-1, -1}, {0, -1}, {1, -1},
    }};
    // clang-format on

    // "Conway's Game of Life" (B3/S23).
    // `s` is the current state of the cell, `count` the number of live neighbors.
    constexpr bool game_of_life(bool s, int count) {
        if (count == 2) { // Survive only.
            return s;
        } else if (count == 3) { // Born or survive.
            return true;
        } else {
            return false;
        }
    }

    static_assert(game_of_life(false, 3) && !game_of_life(false, 2) && !game_of_life(false, 4));
    static_assert(game_of_life(true, 2) && game_of_life(true, 3));
    static_assert(!game_of_life(true, 0) && !game_of_life(true, 1) && !game_of_life(true, 4));

    // Sparse store of live cells. A coordinate that is not stored is dead; dead cells are never stored.
    class gridT {
        pos_set m_cells{};

    public:
        gridT() = default;
        gridT(std::initializer_list<posT> cells) : m_cells(cells) {}

        void set_alive(const posT& pos) { m_cells.insert(pos); }
        void set_dead(const posT& pos) { m_cells.erase(pos); }
        bool is_alive(const posT& pos) const { return m_cells.contains(pos); }

        // (Invalidated by any mutation, including `step`.)
        const pos_set& live_cells() const { return m_cells; }

        size_t population() const { return m_cells.size(); }
        bool empty() const { return m_cells.empty(); }
        void clear() { m_cells.clear(); }

        std::vector<posT> sorted_cells() const {
            std::vector<posT> cells(m_cells.begin(), m_cells.end());
            std::ranges::sort(cells);
            return cells;
        }

        std::optional<rangeT> bounding_box() const {
            if (m_cells.empty()) {
                return std::nullopt;
            }
            const posT& first = *m_cells.begin();
            int64_t min_x = first.x, max_x = first.x;
            int64_t min_y = first.y, max_y = first.y;
            for (const posT& p : m_cells) {
                min_x = std::min(min_x, p.x);
                max_x = std::max(max_x, p.x);
                min_y = std::min(min_y, p.y);
                max_y = std::max(max_y, p.y);
            }
            return rangeT{.begin{.x = min_x, .y = min_y}, .end{.x = max_x + 1, .y = max_y + 1}};
        }

        // Advance by exactly one generation.
        // Only cells within distance 1 of a live cell are visited, so the cost is proportional to the
        // population instead of the extent of the plane.
        void step() {
            // Live-neighbor count for every cell that is alive or next to a live cell.
            std::unordered_map<posT, int, _misc::pos_hash> scores;
            scores.reserve(m_cells.size() * 9);
            for (const posT& pos : m_cells) {
                for (const posT& off : neighbor_offsets) {
                    ++scores[pos + off];
                }
                // An isolated live cell must still be visited (to die).
                scores.try_emplace(pos, 0);
            }

            // The new generation is built aside, so that no score above is read against a half-updated set.
            pos_set next;
            next.reserve(m_cells.size());
            for (const auto& [pos, count] : scores) {
                assert(count >= 0 && count <= 8);
                if (game_of_life(m_cells.contains(pos), count)) {
                    next.insert(pos);
                }
            }
            m_cells.swap(next);
        }

        friend bool operator==(const gridT& a, const gridT& b) { return a.m_cells == b.m_cells; }
    };

#ifdef ENABLE_TESTS
    namespace _tests {
        // Reference generation, computed by scanning every cell around the bounding box.
        inline gridT step_by_scan(const gridT& grid) {
            gridT next;
            if (const auto box = grid.bounding_box()) {
                for (int64_t y = box->begin.y - 1; y < box->end.y + 1; ++y) {
                    for (int64_t x = box->begin.x - 1; x < box->end.x + 1; ++x) {
                        const posT pos{x, y};
                        int count = 0;
                        for (const posT& off : neighbor_offsets) {
                            count += grid.is_alive(pos + off);
                        }
                        if (game_of_life(grid.is_alive(pos), count)) {
                            next.set_alive(pos);
                        }
                    }
                }
            }
            return next;
        }

        inline gridT random_grid(const rangeT& range, int density_percent) {
            gridT grid;
            for (int64_t y = range.begin.y; y < range.end.y; ++y) {
                for (int64_t x = range.begin.x; x < range.end.x; ++x) {
                    if (int(testT::rand() % 100) < density_percent) {
                        grid.set_alive({x, y});
                    }
                }
            }
            return grid;
        }

        inline const testT test_posT = [] {
            const posT a{3, -7}, b{3, -7}, c{-7, 3};
            assert(a == b && a != c);
            assert(_misc::pos_hash{}(a) == _misc::pos_hash{}(b));
            assert(c < a && a.plus(0, 1) > a);
            assert((a - c == posT{10, -10}) && c + (a - c) == a);

            // Large coordinates are as good as small ones.
            const posT far{INT64_MAX - 1, INT64_MIN + 1};
            assert((far.plus(1, -1) == posT{INT64_MAX, INT64_MIN}));
        };

        inline const testT test_edit = [] {
            gridT grid;
            assert(grid.empty() && !grid.is_alive({0, 0}));

            grid.set_alive({1, 2});
            grid.set_alive({1, 2});
            const gridT single{{1, 2}};
            assert(grid.population() == 1 && grid.is_alive({1, 2}));
            assert(grid == single);

            grid.set_dead({5, 5}); // Already dead.
            assert(grid.population() == 1);

            grid.set_dead({1, 2});
            grid.set_dead({1, 2});
            assert(grid.empty() && !grid.is_alive({1, 2}));

            // Far away from the origin.
            const posT far{int64_t(1) << 40, -(int64_t(1) << 40)};
            grid.set_alive(far);
            assert(grid.is_alive(far) && !grid.is_alive(far.plus(1, 0)));
            grid.clear();
            assert(grid.empty() && !grid.bounding_box());
        };

        // The last operation on a cell decides whether it is stored.
        inline const testT test_edit_sequence = [] {
            gridT grid;
            std::unordered_map<posT, bool, _misc::pos_hash> last;
            for (int i = 0; i < 2000; ++i) {
                const posT pos{int64_t(testT::rand() % 16) - 8, int64_t(testT::rand() % 16) - 8};
                const bool alive = testT::rand() & 1;
                alive ? grid.set_alive(pos) : grid.set_dead(pos);
                last[pos] = alive;
            }
            size_t alive_count = 0;
            for (const auto& [pos, alive] : last) {
                assert(grid.is_alive(pos) == alive);
                alive_count += alive;
            }
            assert(grid.population() == alive_count);
            for (const posT& pos : grid.live_cells()) {
                assert(last.contains(pos) && last[pos]);
            }
        };

        inline const testT test_bounding_box = [] {
            const gridT grid{{-3, 4}, {2, -1}, {0, 0}};
            const auto box = grid.bounding_box();
            assert(box && (box->begin == posT{-3, -1}) && (box->end == posT{3, 5}));
            assert(box->width() == 6 && box->height() == 6);
            for (const posT& pos : grid.live_cells()) {
                assert(box->contains(pos));
            }

            const std::vector<posT> sorted = grid.sorted_cells();
            assert(sorted == std::vector<posT>({{-3, 4}, {0, 0}, {2, -1}}));
        };

        inline const testT test_empty_step = [] {
            gridT grid;
            grid.step();
            assert(grid.empty());
        };

        inline const testT test_block = [] {
            const gridT block{{0, 0}, {1, 0}, {0, 1}, {1, 1}};
            gridT grid = block;
            for (int i = 0; i < 5; ++i) {
                grid.step();
                assert(grid == block);
            }
        };

        inline const testT test_blinker = [] {
            const gridT horizontal{{0, 0}, {1, 0}, {2, 0}};
            const gridT vertical{{1, -1}, {1, 0}, {1, 1}};
            gridT grid = horizontal;
            grid.step();
            assert(grid == vertical);
            grid.step();
            assert(grid == horizontal);
        };

        inline const testT test_birth = [] {
            // (0, 0) starts dead in every case.
            const auto next_at_origin = [](std::initializer_list<posT> cells) {
                gridT grid(cells);
                assert(!grid.is_alive({0, 0}));
                grid.step();
                return grid.is_alive({0, 0});
            };
            assert(next_at_origin({{-1, 1}, {1, 1}, {0, -1}}));
            assert(!next_at_origin({{-1, 1}, {1, -1}}));
            assert(!next_at_origin({{-1, 1}, {1, 1}, {-1, -1}, {1, -1}}));
        };

        inline const testT test_death = [] {
            const auto next_at_origin = [](std::initializer_list<posT> neighbors) {
                gridT grid(neighbors);
                grid.set_alive({0, 0});
                grid.step();
                return grid.is_alive({0, 0});
            };
            assert(!next_at_origin({}));                                    // 0 neighbors.
            assert(!next_at_origin({{1, 1}}));                              // 1.
            assert(next_at_origin({{-1, 1}, {1, -1}}));                     // 2.
            assert(next_at_origin({{-1, 1}, {1, 1}, {0, -1}}));             // 3.
            assert(!next_at_origin({{-1, 1}, {1, 1}, {-1, -1}, {1, -1}}));  // 4.
            assert(!next_at_origin({{-1, 1}, {0, 1}, {1, 1}, {-1, 0}, {1, 0}, {-1, -1}, {0, -1}, {1, -1}}));
        };

        inline const testT test_glider = [] {
            // Travels towards +x, -y (with the y axis pointing up).
            const gridT glider{{1, 0}, {2, -1}, {0, -2}, {1, -2}, {2, -2}};
            gridT grid = glider;
            for (int gen = 1; gen <= 40; ++gen) {
                grid.step();
                assert(grid.population() == 5);
                if (gen % 4 == 0) {
                    gridT moved;
                    for (const posT& pos : glider.live_cells()) {
                        moved.set_alive(pos.plus(gen / 4, -gen / 4));
                    }
                    assert(grid == moved);
                }
            }
        };

        inline const testT test_step_against_scan = [] {
            for (int round = 0; round < 8; ++round) {
                const posT origin{int64_t(testT::rand() % 2001) - 1000, int64_t(testT::rand() % 2001) - 1000};
                gridT grid = random_grid({origin, origin.plus(24, 18)}, 35);
                for (int gen = 0; gen < 12; ++gen) {
                    const gridT expected = step_by_scan(grid);
                    gridT copy = grid;
                    grid.step();
                    copy.step();
                    assert(grid == expected);
                    assert(copy == grid); // Deterministic.
                }
            }
        };
    }  // namespace _tests
#endif // ENABLE_TESTS

} // namespace lattice
