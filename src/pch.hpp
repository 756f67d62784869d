///// Otter: GL-Include-Reihenfolge zentral; erst GLEW, dann GLFW.
///// Schneefuchs: Keine impliziten GL-Includes; deterministisch; ASCII-only.
///// Maus: Nur GL-/GLFW-TUs ziehen diesen Header; der Kern bleibt GL-frei.
///// Datei: src/pch.hpp

#pragma once

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#ifdef _WIN32
  #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
  #endif
  #ifndef NOMINMAX
    #define NOMINMAX
  #endif
  #include <windows.h>
#endif

// Verhindert, dass GLFW eigene GL-Header nachlaedt:
#ifndef GLFW_INCLUDE_NONE
  #define GLFW_INCLUDE_NONE
#endif
// GLEW ohne GLU/Imaging (wird nicht benoetigt):
#ifndef GLEW_NO_GLU
  #define GLEW_NO_GLU
#endif

#include <GL/glew.h>
#include <GLFW/glfw3.h>
