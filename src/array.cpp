#include <cmath>
#include <boost/assert.hpp>
#include "array.hpp"

double norm_sqr(const array<double, 3>& a)
{
	return a[0] * a[0] + a[1] * a[1] + a[2] * a[2];
}

double norm(const array<double, 3>& a)
{
	return sqrt(norm_sqr(a));
}

bool normalized(const array<double, 3>& a)
{
	return fabs(norm_sqr(a) - 1.0) < 1e-5;
}

array<double, 3> normalize(const array<double, 3>& a)
{
	const double norm_inv = 1.0 / norm(a);
	return
	{
		a[0] * norm_inv,
		a[1] * norm_inv,
		a[2] * norm_inv,
	};
}

array<double, 3> operator+(const array<double, 3>& a, const array<double, 3>& b)
{
	return
	{
		a[0] + b[0],
		a[1] + b[1],
		a[2] + b[2],
	};
}

array<double, 3> operator-(const array<double, 3>& a, const array<double, 3>& b)
{
	return
	{
		a[0] - b[0],
		a[1] - b[1],
		a[2] - b[2],
	};
}

void operator+=(array<double, 3>& a, const array<double, 3>& b)
{
	a[0] += b[0];
	a[1] += b[1];
	a[2] += b[2];
}

void operator-=(array<double, 3>& a, const array<double, 3>& b)
{
	a[0] -= b[0];
	a[1] -= b[1];
	a[2] -= b[2];
}

array<double, 3> operator*(const double s, const array<double, 3>& a)
{
	return
	{
		s * a[0],
		s * a[1],
		s * a[2],
	};
}

double dot_product(const array<double, 3>& a, const array<double, 3>& b)
{
	return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
}

array<double, 3> cross_product(const array<double, 3>& a, const array<double, 3>& b)
{
	return
	{
		a[1]*b[2] - a[2]*b[1],
		a[2]*b[0] - a[0]*b[2],
		a[0]*b[1] - a[1]*b[0],
	};
}

double distance_sqr(const array<double, 3>& a, const array<double, 3>& b)
{
	const double d0 = a[0] - b[0];
	const double d1 = a[1] - b[1];
	const double d2 = a[2] - b[2];
	return d0 * d0 + d1 * d1 + d2 * d2;
}

array<double, 9> axis_angle_to_mat3(const array<double, 3>& axis, const double angle)
{
	const array<double, 3> k = normalize(axis);
	BOOST_ASSERT(normalized(k));
	const double c = cos(angle);
	const double s = sin(angle);
	const double t = 1 - c;

	// Rodrigues' rotation formula, R = cI + s[k]x + t(k k^T).
	// http://en.wikipedia.org/wiki/Rodrigues%27_rotation_formula
	return
	{
		t*k[0]*k[0] + c     , t*k[0]*k[1] - s*k[2], t*k[0]*k[2] + s*k[1],
		t*k[0]*k[1] + s*k[2], t*k[1]*k[1] + c     , t*k[1]*k[2] - s*k[0],
		t*k[0]*k[2] - s*k[1], t*k[1]*k[2] + s*k[0], t*k[2]*k[2] + c     ,
	};
}

array<double, 3> operator*(const array<double, 9>& m, const array<double, 3>& v)
{
	return
	{
		m[0] * v[0] + m[1] * v[1] + m[2] * v[2],
		m[3] * v[0] + m[4] * v[1] + m[5] * v[2],
		m[6] * v[0] + m[7] * v[1] + m[8] * v[2],
	};
}
