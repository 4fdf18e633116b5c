#pragma once

// The one place the frontend includes SDL from.
// main() stays ours (no SDL_main / SDLmain link); main.cpp calls SDL_SetMainReady() before SDL_Init().
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <SDL.h>
