#define BOOST_TEST_MODULE array
#include <cmath>
#include <boost/test/unit_test.hpp>
#include "array.hpp"

BOOST_AUTO_TEST_CASE(norm_and_normalize)
{
	const array<double, 3> a = { 3, 4, 0 };
	BOOST_CHECK_EQUAL(norm_sqr(a), 25);
	BOOST_CHECK_EQUAL(norm(a), 5);
	BOOST_CHECK(!normalized(a));

	const array<double, 3> n = normalize(a);
	BOOST_CHECK(normalized(n));
	BOOST_CHECK_CLOSE(n[0], 0.6, 1e-10);
	BOOST_CHECK_CLOSE(n[1], 0.8, 1e-10);
	BOOST_CHECK_EQUAL(n[2], 0);
}

BOOST_AUTO_TEST_CASE(arithmetic)
{
	array<double, 3> a = { 1, 2, 3 };
	const array<double, 3> b = { 4, 5, 6 };
	const array<double, 3> sum = a + b;
	BOOST_CHECK_EQUAL(sum[0], 5);
	BOOST_CHECK_EQUAL(sum[1], 7);
	BOOST_CHECK_EQUAL(sum[2], 9);

	const array<double, 3> diff = b - a;
	BOOST_CHECK_EQUAL(diff[0], 3);
	BOOST_CHECK_EQUAL(diff[1], 3);
	BOOST_CHECK_EQUAL(diff[2], 3);

	a += b;
	BOOST_CHECK_EQUAL(a[2], 9);
	a -= b;
	BOOST_CHECK_EQUAL(a[2], 3);

	const array<double, 3> scaled = 2.0 * b;
	BOOST_CHECK_EQUAL(scaled[0], 8);
	BOOST_CHECK_EQUAL(scaled[2], 12);

	BOOST_CHECK_EQUAL(dot_product(a, b), 32);
	BOOST_CHECK_EQUAL(distance_sqr(a, b), 27);
}

BOOST_AUTO_TEST_CASE(cross_product_is_right_handed)
{
	const array<double, 3> x = { 1, 0, 0 };
	const array<double, 3> y = { 0, 1, 0 };
	const array<double, 3> z = cross_product(x, y);
	BOOST_CHECK_EQUAL(z[0], 0);
	BOOST_CHECK_EQUAL(z[1], 0);
	BOOST_CHECK_EQUAL(z[2], 1);
}

BOOST_AUTO_TEST_CASE(axis_angle_rotation)
{
	// A quarter turn about an unnormalized z axis maps x onto y.
	const array<double, 9> r = axis_angle_to_mat3({ 0, 0, 2 }, acos(-1.0) / 2);
	const array<double, 3> v = r * array<double, 3>{ 1, 0, 0 };
	BOOST_CHECK_SMALL(v[0], 1e-12);
	BOOST_CHECK_CLOSE(v[1], 1, 1e-10);
	BOOST_CHECK_SMALL(v[2], 1e-12);

	// Rotations preserve lengths.
	const array<double, 9> q = axis_angle_to_mat3({ 0.3, 0.7, 0.2 }, 2.5);
	const array<double, 3> w = { 1.5, -2, 0.25 };
	BOOST_CHECK_CLOSE(norm(q * w), norm(w), 1e-10);

	// Points on the axis are fixed.
	const array<double, 3> p = q * array<double, 3>{ 0.6, 1.4, 0.4 };
	BOOST_CHECK_CLOSE(p[0], 0.6, 1e-10);
	BOOST_CHECK_CLOSE(p[1], 1.4, 1e-10);
	BOOST_CHECK_CLOSE(p[2], 0.4, 1e-10);
}
