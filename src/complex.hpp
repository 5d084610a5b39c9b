#pragma once

#include <cmath>

// Plain complex value. Operations return new values; nothing mutates in place.
struct Complex {
    double re = 0.0;
    double im = 0.0;
};

inline Complex add(Complex a, Complex b)
{
    return {a.re + b.re, a.im + b.im};
}

// (ac - bd) + (ad + bc)i
inline Complex multiply(Complex a, Complex b)
{
    return {a.re * b.re - a.im * b.im,
            a.re * b.im + a.im * b.re};
}

inline double modulus_squared(Complex a)
{
    return a.re * a.re + a.im * a.im;
}

inline double modulus(Complex a)
{
    return std::sqrt(modulus_squared(a));
}

inline Complex operator+(Complex a, Complex b) { return add(a, b); }
inline Complex operator*(Complex a, Complex b) { return multiply(a, b); }

inline bool operator==(Complex a, Complex b) { return a.re == b.re && a.im == b.im; }
inline bool operator!=(Complex a, Complex b) { return !(a == b); }
