// The tests live in the headers and run during static initialization (any failure aborts before `main`).
// This file only makes sure they are all compiled into one program.

#include <SDL.h>

#include "view.hpp"
#include "world.hpp"

#ifndef ENABLE_TESTS
#error "ENABLE_TESTS should be defined for this target."
#endif

int main(int, char**) {
    SDL_Log("lattice: %d tests passed.", lattice::_tests::testT::count);
    return 0;
}
