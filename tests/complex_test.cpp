#include "complex.hpp"

#include <gtest/gtest.h>

TEST(Complex, AddIsComponentWise)
{
    const Complex r = add({1.5, -2.0}, {0.25, 4.0});
    EXPECT_EQ(r.re, 1.75);
    EXPECT_EQ(r.im, 2.0);
}

TEST(Complex, MultiplyFollowsComplexAlgebra)
{
    // (1 + 2i)(3 + 4i) = -5 + 10i
    const Complex r = multiply({1.0, 2.0}, {3.0, 4.0});
    EXPECT_EQ(r.re, -5.0);
    EXPECT_EQ(r.im, 10.0);

    // i * i = -1
    const Complex ii = Complex{0.0, 1.0} * Complex{0.0, 1.0};
    EXPECT_EQ(ii.re, -1.0);
    EXPECT_EQ(ii.im, 0.0);
}

TEST(Complex, ModulusSquaredAvoidsRoot)
{
    EXPECT_EQ(modulus_squared({3.0, 4.0}), 25.0);
    EXPECT_EQ(modulus({3.0, 4.0}), 5.0);
    EXPECT_EQ(modulus_squared({10.0, 10.0}), 200.0);
}

TEST(Complex, OperatorsMatchNamedFunctions)
{
    const Complex a{0.3, -1.7}, b{2.2, 0.9};
    EXPECT_EQ(a + b, add(a, b));
    EXPECT_EQ(a * b, multiply(a, b));
    EXPECT_NE(a, b);
}
