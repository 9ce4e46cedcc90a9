#include <cmath>
#include <chrono>
#include <iostream>
#include <algorithm>
#include <stdexcept>
#include <boost/assert.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include "array.hpp"
#include "spinner.hpp"

spinner::spinner(const double step_size, const double rotation_step_size, const size_t num_conformers, const size_t max_attempts, const shared_ptr<const potential>& potential_function, const double beta, const boost::optional<size_t>& seed) : step_size(step_size), rotation_step_size(rotation_step_size), num_conformers(num_conformers), max_attempts(max_attempts), potential_function(potential_function), beta(beta), rng(make_shared<mt19937eng>()), u01(0, 1)
{
	if (!this->potential_function)
	{
		this->potential_function = make_shared<spd_potential>(5);
	}
	rng->seed(seed ? *seed : static_cast<size_t>(chrono::system_clock::now().time_since_epoch().count()));
}

double spinner::compute_potential(const supramolecule& s) const
{
	return potential_function->compute_potential(s);
}

supramolecule spinner::run_step(const supramolecule& s, const boost::optional<vector<size_t>>& movable_components, double& e)
{
	vector<molecule> components(s.get_components());
	const size_t num_components = components.size();
	if (num_components == 0) throw invalid_argument("Cannot move a supramolecule without components.");

	// Determine the movable components.
	// Unless given, the largest component is treated as the stationary host, provided that component sizes differ.
	vector<size_t> candidates;
	if (movable_components)
	{
		candidates = *movable_components;
		for (const size_t k : candidates)
		{
			if (k >= num_components) throw invalid_argument("Movable component " + to_string(k) + " is out of range of the " + to_string(num_components) + " components.");
		}
	}
	else
	{
		size_t min_size = components.front().get_num_atoms();
		size_t max_size = min_size;
		for (const molecule& c : components)
		{
			min_size = min(min_size, c.get_num_atoms());
			max_size = max(max_size, c.get_num_atoms());
		}
		for (size_t k = 0; k < num_components; ++k)
		{
			if (min_size == max_size || components[k].get_num_atoms() != max_size)
			{
				candidates.push_back(k);
			}
		}
	}
	if (candidates.empty()) throw invalid_argument("No movable component is given.");

	// Select a movable component randomly.
	boost::random::uniform_int_distribution<size_t> uc(0, candidates.size() - 1);
	const size_t target = candidates[uc(*rng)];
	molecule& c = components[target];

	// Translate the component along a random direction by a random fraction of step_size.
	const array<double, 3> direction = normalize(array<double, 3>{ u01(*rng), u01(*rng), u01(*rng) });
	const double translation_scalar = (u01(*rng) - 0.5) * 2;
	c = c.with_displacement((step_size * translation_scalar) * direction);

	// Rotate the component about its centroid around a random axis by a random fraction of rotation_step_size.
	const array<double, 3> axis = { u01(*rng), u01(*rng), u01(*rng) };
	const double rotation_scalar = (u01(*rng) - 0.5) * 2;
	c = c.with_rotation(rotation_step_size * rotation_scalar, axis, c.get_centroid());

	const supramolecule moved = supramolecule::init_from_components(components);
	e = compute_potential(moved);
	return moved;
}

bool spinner::test_move(const double e0, const double e1)
{
	// Downhill moves are always accepted.
	if (e1 < e0) return true;

	// Uphill moves are accepted with probability exp(-beta * (e1 - e0)). Non-finite potentials are always rejected.
	const double exp_term = exp(-beta * (e1 - e0));
	return exp_term > u01(*rng);
}

conformer_sequence spinner::get_conformers(const supramolecule& s, const boost::optional<vector<size_t>>& movable_components, const bool verbose)
{
	return conformer_sequence(*this, s, movable_components, verbose);
}

supramolecule spinner::get_final_conformer(const supramolecule& s, const boost::optional<vector<size_t>>& movable_components)
{
	conformer_sequence conformers = get_conformers(s, movable_components);
	boost::optional<supramolecule> last = conformers.next();
	BOOST_ASSERT(last);
	while (boost::optional<supramolecule> conformer = conformers.next())
	{
		last = conformer;
	}
	return *last;
}

double spinner::get_step_size() const
{
	return step_size;
}

double spinner::get_rotation_step_size() const
{
	return rotation_step_size;
}

size_t spinner::get_num_conformers() const
{
	return num_conformers;
}

size_t spinner::get_max_attempts() const
{
	return max_attempts;
}

double spinner::get_beta() const
{
	return beta;
}

conformer_sequence::conformer_sequence(const spinner& s, const supramolecule& start, const boost::optional<vector<size_t>>& movable_components, const bool verbose) : sp(s), current(start), e(0), movable_components(movable_components), verbose(verbose), cid(0), num_accepted(0), num_attempts(0), started(false), finished(false) {}

boost::optional<supramolecule> conformer_sequence::next()
{
	// The starting supramolecule is yielded unconditionally.
	if (!started)
	{
		started = true;
		e = sp.compute_potential(current);
		current = supramolecule::init_from_components(current.get_components(), cid, e);
		return current;
	}

	while (!finished && num_accepted < sp.num_conformers && num_attempts + 1 < sp.max_attempts)
	{
		++num_attempts;
		double e1;
		const supramolecule moved = sp.run_step(current, movable_components, e1);
		if (sp.test_move(e, e1))
		{
			++num_accepted;
			e = e1;
			current = supramolecule::init_from_components(moved.get_components(), ++cid, e);
			return current;
		}
	}

	if (!finished)
	{
		finished = true;
		if (verbose)
		{
			cout << num_accepted << " conformers generated in " << num_attempts << " steps." << endl;
		}
	}
	return boost::none;
}

size_t conformer_sequence::get_num_accepted() const
{
	return num_accepted;
}

size_t conformer_sequence::get_num_attempts() const
{
	return num_attempts;
}
