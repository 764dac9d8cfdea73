#pragma once

#include "clock.hpp"
#include "grid.hpp"

namespace lattice {
    // Owns the grid and the clock that drives it.
    // Constructed by `main` and passed to the frame; there is no other instance.
    class worldT {
        gridT m_grid{};
        clockT m_clock{};
        int64_t m_gen = 0;

    public:
        const gridT& grid() const { return m_grid; }
        const clockT& clock() const { return m_clock; }
        int64_t generation() const { return m_gen; }
        bool running() const { return m_clock.running(); }

        void set_alive(const posT& pos) { m_grid.set_alive(pos); }
        void set_dead(const posT& pos) { m_grid.set_dead(pos); }
        void clear() {
            m_grid.clear();
            m_gen = 0;
        }

        void toggle_running() { m_clock.toggle(); }

        // Called once per frame. Returns whether a generation was run.
        bool advance(float dt) {
            if (m_clock.advance(dt)) {
                step_once();
                return true;
            }
            return false;
        }

        // Regardless of the clock (which is left untouched).
        void step_once() {
            m_grid.step();
            ++m_gen;
        }
    };

#ifdef ENABLE_TESTS
    namespace _tests {
        inline const testT test_world_blinker = [] {
            worldT world;
            world.set_alive({0, 0});
            world.set_alive({1, 0});
            world.set_alive({2, 0});
            const gridT horizontal = world.grid();
            const gridT vertical{{1, -1}, {1, 0}, {1, 1}};

            // Paused: nothing happens however long it waits.
            for (int i = 0; i < 50; ++i) {
                assert(!world.advance(0.25f));
            }
            assert(world.generation() == 0 && world.grid() == horizontal);

            world.toggle_running();
            assert(world.running());
            assert(!world.advance(0.06f));
            assert(world.advance(0.06f));
            assert(world.generation() == 1 && world.grid() == vertical);

            assert(world.advance(3.0f)); // A single generation.
            assert(world.generation() == 2 && world.grid() == horizontal);

            world.toggle_running();
            world.step_once();
            assert(!world.running() && world.generation() == 3 && world.grid() == vertical);
            assert(world.clock().elapsed() == 0);
        };

        inline const testT test_world_edit = [] {
            worldT world;
            world.set_alive({4, 4});
            world.set_dead({4, 4});
            world.set_dead({4, 4});
            assert(world.grid().empty());

            world.set_alive({0, 0});
            world.step_once();
            assert(world.grid().empty() && world.generation() == 1);

            // An edit between generations is seen by the next one.
            world.set_alive({0, 0});
            world.set_alive({1, 0});
            world.set_alive({0, 1});
            world.step_once();
            assert(world.grid().population() == 4 && world.grid().is_alive({1, 1}));

            world.clear();
            assert(world.grid().empty() && world.generation() == 0);
        };
    }  // namespace _tests
#endif // ENABLE_TESTS

} // namespace lattice
