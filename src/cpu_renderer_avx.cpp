// Compiled with -mavx only — do NOT include from other translation units.

#include "cpu_renderer_avx.hpp"
#include "fractal.hpp"

#include <immintrin.h>
#include <sleef.h>
#include <cmath>

// -----------------------------------------------------------------------
// 4 lanes of z <- z*z + c, tested with |z|^2 < R^2 before every step, as in
// escape_kernel(). Arithmetic is ordered exactly like multiply()/add() so
// iteration counts and final z match the scalar path bit for bit.
// -----------------------------------------------------------------------
template<bool IsParameterized>
static void avx_kernel(const Complex* s, const EscapeParams& ep,
                       bool escape_coloring, double* out4)
{
    const __m256d sr = _mm256_set_pd(s[3].re, s[2].re, s[1].re, s[0].re);
    const __m256d si = _mm256_set_pd(s[3].im, s[2].im, s[1].im, s[0].im);

    __m256d cr, ci;
    if constexpr (IsParameterized) {
        cr = _mm256_set1_pd(ep.constant.re);
        ci = _mm256_set1_pd(ep.constant.im);
    } else {
        cr = sr;
        ci = si;
    }
    __m256d zr = sr;
    __m256d zi = si;

    const __m256d radius_sq = _mm256_set1_pd(ep.radius_sq);
    const __m256d one       = _mm256_set1_pd(1.0);

    // active: all bits set for lanes still iterating
    __m256d active  = _mm256_castsi256_pd(_mm256_set1_epi64x(-1LL));
    __m256d iters_d = _mm256_setzero_pd();
    __m256d mag2    = _mm256_add_pd(_mm256_mul_pd(zr, zr), _mm256_mul_pd(zi, zi));

    for (int i = 0; i < ep.max_iter; ++i) {
        active = _mm256_and_pd(active, _mm256_cmp_pd(mag2, radius_sq, _CMP_LT_OQ));
        if (_mm256_movemask_pd(active) == 0) break;

        const __m256d new_zr = _mm256_add_pd(
            _mm256_sub_pd(_mm256_mul_pd(zr, zr), _mm256_mul_pd(zi, zi)), cr);
        const __m256d new_zi = _mm256_add_pd(
            _mm256_add_pd(_mm256_mul_pd(zr, zi), _mm256_mul_pd(zi, zr)), ci);

        // Freeze lanes that have already stopped
        zr      = _mm256_blendv_pd(zr, new_zr, active);
        zi      = _mm256_blendv_pd(zi, new_zi, active);
        iters_d = _mm256_add_pd(iters_d, _mm256_and_pd(active, one));
        mag2    = _mm256_add_pd(_mm256_mul_pd(zr, zr), _mm256_mul_pd(zi, zi));
    }

    // value = iters - log2(log|z|), log|z| = 0.5 * log(|z|^2)
    const __m256d half     = _mm256_set1_pd(0.5);
    const __m256d zero_v   = _mm256_setzero_pd();
    const __m256d inv_log2 = _mm256_set1_pd(1.0 / std::log(2.0));

    const __m256d log_zn = _mm256_mul_pd(Sleef_logd4_u35(mag2), half);
    const __m256d nu     = _mm256_mul_pd(Sleef_logd4_u35(log_zn), inv_log2);
    __m256d value        = _mm256_sub_pd(iters_d, nu);

    // log|z| <= 0, infinite or NaN: log-log undefined, fall back to 0
    const __m256d defined = _mm256_and_pd(
        _mm256_cmp_pd(log_zn, zero_v, _CMP_GT_OQ),
        _mm256_cmp_pd(log_zn, _mm256_set1_pd(HUGE_VAL), _CMP_LT_OQ));
    value = _mm256_blendv_pd(zero_v, value, defined);

    if (escape_coloring) {
        const __m256d at_max = _mm256_cmp_pd(
            iters_d, _mm256_set1_pd(static_cast<double>(ep.max_iter)), _CMP_EQ_OQ);
        value = _mm256_blendv_pd(value, zero_v, at_max);
    }
    _mm256_storeu_pd(out4, value);
}

// -----------------------------------------------------------------------
// Public entry point
// -----------------------------------------------------------------------
void avx_color_values_4(const Complex* samples, const EscapeParams& ep,
                        bool escape_coloring, double* out4)
{
    switch (ep.kind) {
        case VariantKind::Parameterized:
            avx_kernel<true>(samples, ep, escape_coloring, out4);
            return;
        case VariantKind::Standard:
            break;
    }
    avx_kernel<false>(samples, ep, escape_coloring, out4);
}
