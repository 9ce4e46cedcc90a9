#include <cmath>
#include <boost/assert.hpp>
#include "array.hpp"
#include "potential.hpp"

//! Returns the 12-6 term (sigma / distance)^12 - (sigma / distance)^6.
static inline double lj(const double distance, const double sigma)
{
	const double sr = sigma / distance;
	const double sr3 = sr * sr * sr;
	const double sr6 = sr3 * sr3;
	return sr6 * sr6 - sr6;
}

spd_potential::spd_potential(const double nonbond_epsilon) : nonbond_epsilon(nonbond_epsilon) {}

double spd_potential::nonbond_potential(const double distance, const double sigma) const
{
	return nonbond_epsilon * lj(distance, sigma);
}

double spd_potential::compute_nonbonded_potential(const vector<molecule>& components, const vector<vector<double>>& radii) const
{
	BOOST_ASSERT(components.size() == radii.size());
	const size_t num_components = components.size();
	double e = 0;
	for (size_t k1 = 0; k1 < num_components; ++k1)
	{
		const position_matrix& m1 = components[k1].get_position_matrix();
		const vector<double>& r1 = radii[k1];
		BOOST_ASSERT(m1.size() == r1.size());
		for (size_t k2 = k1 + 1; k2 < num_components; ++k2)
		{
			const position_matrix& m2 = components[k2].get_position_matrix();
			const vector<double>& r2 = radii[k2];
			BOOST_ASSERT(m2.size() == r2.size());
			for (size_t i = 0; i < m1.size(); ++i)
			for (size_t j = 0; j < m2.size(); ++j)
			{
				// Combine radii by the Lorentz-Berthelot rule.
				e += nonbond_potential(sqrt(distance_sqr(m1[i], m2[j])), (r1[i] + r2[j]) * 0.5);
			}
		}
	}
	return e;
}

vector<vector<double>> spd_potential::get_component_radii(const supramolecule& s)
{
	vector<vector<double>> radii;
	radii.reserve(s.get_num_components());
	for (const molecule& c : s.get_components())
	{
		vector<double> r;
		r.reserve(c.get_num_atoms());
		for (const atom& a : c.get_atoms())
		{
			r.push_back(a.radius);
		}
		radii.push_back(move(r));
	}
	return radii;
}

double spd_potential::compute_potential(const supramolecule& s) const
{
	return compute_nonbonded_potential(s.get_components(), get_component_radii(s));
}

double spd_potential::get_nonbond_epsilon() const
{
	return nonbond_epsilon;
}

double varying_epsilon_potential::nonbond_potential(const double distance, const double sigma, const double epsilon)
{
	return epsilon * lj(distance, sigma);
}

double varying_epsilon_potential::compute_potential(const supramolecule& s) const
{
	const vector<molecule>& components = s.get_components();
	const size_t num_components = components.size();
	double e = 0;
	for (size_t k1 = 0; k1 < num_components; ++k1)
	{
		const position_matrix& m1 = components[k1].get_position_matrix();
		const vector<atom>& a1 = components[k1].get_atoms();
		for (size_t k2 = k1 + 1; k2 < num_components; ++k2)
		{
			const position_matrix& m2 = components[k2].get_position_matrix();
			const vector<atom>& a2 = components[k2].get_atoms();
			for (size_t i = 0; i < m1.size(); ++i)
			for (size_t j = 0; j < m2.size(); ++j)
			{
				const double sigma = (a1[i].sigma + a2[j].sigma) * 0.5;
				const double epsilon = sqrt(a1[i].epsilon * a2[j].epsilon);
				e += nonbond_potential(sqrt(distance_sqr(m1[i], m2[j])), sigma, epsilon);
			}
		}
	}
	return e;
}
