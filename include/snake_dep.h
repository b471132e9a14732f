#pragma once

// Platform umbrella: OpenGL loader + SDL2, then the game types.
// Only the SDL front end includes this; the game core stays headless.

#include <glad/gl.h>
#ifdef __APPLE__
#include <SDL.h>
#else
#include <SDL2/SDL.h>
#endif

#include "snake_types.h"
