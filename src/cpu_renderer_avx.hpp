#pragma once

#include "complex.hpp"

struct EscapeParams;

// AVX escape-time kernel — implementation in cpu_renderer_avx.cpp, which is
// built only when SLEEF is available (HAVE_SLEEF).
// Evaluates 4 consecutive field points and writes their color values to out4,
// with the same semantics as evaluate() followed by color_value().
void avx_color_values_4(const Complex* samples, const EscapeParams& ep,
                        bool escape_coloring, double* out4);
