#pragma once
#ifndef HGSPIN_ARRAY_HPP
#define HGSPIN_ARRAY_HPP

#include <array>
#include <vector>
using namespace std;

//! Returns the square norm of a vector.
double norm_sqr(const array<double, 3>& a);

//! Returns the norm of a vector.
double norm(const array<double, 3>& a);

//! Returns true if the norm of a vector is approximately 1.
bool normalized(const array<double, 3>& a);

//! Normalizes a vector.
array<double, 3> normalize(const array<double, 3>& a);

//! Elementwise adds the second vector to the first vector.
array<double, 3> operator+(const array<double, 3>& a, const array<double, 3>& b);

//! Elementwise subtracts the second vector from the first vector.
array<double, 3> operator-(const array<double, 3>& a, const array<double, 3>& b);

//! Elementwise adds the second vector to the first vector.
void operator+=(array<double, 3>& a, const array<double, 3>& b);

//! Elementwise subtracts the second vector from the first vector.
void operator-=(array<double, 3>& a, const array<double, 3>& b);

//! Multiplies a scalar to a vector.
array<double, 3> operator*(const double s, const array<double, 3>& a);

//! Returns the dot product of two vectors.
double dot_product(const array<double, 3>& a, const array<double, 3>& b);

//! Returns the cross product of two vectors.
array<double, 3> cross_product(const array<double, 3>& a, const array<double, 3>& b);

//! Returns the square Euclidean distance between two vectors.
double distance_sqr(const array<double, 3>& a, const array<double, 3>& b);

//! Constructs a 3x3 rotation matrix of a given angle in radians about an arbitrary axis, which need not be normalized.
array<double, 9> axis_angle_to_mat3(const array<double, 3>& axis, const double angle);

//! Transforms a vector by a 3x3 matrix.
array<double, 3> operator*(const array<double, 9>& m, const array<double, 3>& v);

#endif
