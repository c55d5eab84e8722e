#pragma once

// GLFW plus the fixed-function OpenGL headers used by the desktop backend.
// Everything under viewer/ includes GL through this header only.

#include <GLFW/glfw3.h>

#ifdef __APPLE__
#include <OpenGL/gl.h>
#else
#include <GL/gl.h>
#endif

// OpenGL 1.3 token; some gl.h versions stop at 1.1
#ifndef GL_MULTISAMPLE
#define GL_MULTISAMPLE 0x809D
#endif
