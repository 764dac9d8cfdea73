#pragma once

#include <cmath>

#include "grid.hpp"

namespace lattice {
    // Decides when the next generation is due.
    // While paused, the accumulated time is frozen (not reset), so resuming never causes a step at once.
    class clockT {
    public:
        static constexpr float tick_interval = 0.1f; // Seconds.

    private:
        bool m_running = false;
        float m_elapsed = 0; // Since the last tick.

    public:
        bool running() const { return m_running; }
        float elapsed() const { return m_elapsed; }

        void toggle() { m_running = !m_running; }

        // `dt` is the duration of the last frame in seconds, and should be finite and non-negative.
        // Returns whether a generation is due. At most one is reported per call; lagging frames are
        // not caught up.
        [[nodiscard]] bool advance(float dt) {
            assert(std::isfinite(dt) && dt >= 0);
            if (!m_running) {
                return false;
            }

            m_elapsed += dt;
            if (m_elapsed > tick_interval) {
                m_elapsed = 0;
                return true;
            }
            return false;
        }
    };

#ifdef ENABLE_TESTS
    namespace _tests {
        inline const testT test_clock_initial = [] {
            const clockT clock;
            assert(!clock.running() && clock.elapsed() == 0);
        };

        inline const testT test_clock_gating = [] {
            clockT clock;
            clock.toggle();
            assert(clock.running());

            int ticks = 0;
            for (int i = 0; i < 9; ++i) { // 0.09s in total.
                ticks += clock.advance(0.01f);
            }
            assert(ticks == 0 && clock.elapsed() > 0.08f && clock.elapsed() < 0.1f);

            ticks += clock.advance(0.02f); // 0.11s.
            assert(ticks == 1 && clock.elapsed() == 0);

            // One long frame is still a single tick.
            assert(clock.advance(0.5f));
            assert(clock.elapsed() == 0);
            assert(!clock.advance(0.05f));
            assert(clock.advance(0.06f));

            // Reaching the interval exactly is not enough.
            assert(!clock.advance(clockT::tick_interval));
            assert(clock.advance(0.001f));
        };

        inline const testT test_clock_zero_dt = [] {
            clockT clock;
            clock.toggle();
            for (int i = 0; i < 1000; ++i) {
                assert(!clock.advance(0));
            }
            assert(clock.elapsed() == 0);
        };

        inline const testT test_clock_pause = [] {
            clockT clock;
            for (int i = 0; i < 100; ++i) {
                assert(!clock.advance(1.0f));
            }
            assert(clock.elapsed() == 0);

            clock.toggle();
            assert(!clock.advance(0.07f));
            clock.toggle();
            assert(!clock.running());
            for (int i = 0; i < 100; ++i) {
                assert(!clock.advance(0.5f));
            }
            assert(clock.elapsed() == 0.07f); // Frozen.

            clock.toggle();
            assert(!clock.advance(0)); // No catch-up on resume.
            assert(!clock.advance(0.02f));
            assert(clock.advance(0.02f)); // 0.11s.
        };
    }  // namespace _tests
#endif // ENABLE_TESTS

} // namespace lattice
