#pragma once

// Centralized SDL include for the CLI (the core library never includes SDL).
// SDL_MAIN_HANDLED keeps SDL from renaming main() to SDL_main, so no
// SDLmain library is needed.
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <SDL.h>
