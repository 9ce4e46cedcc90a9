#pragma once
#ifndef HGSPIN_SPINNER_HPP
#define HGSPIN_SPINNER_HPP

#include <memory>
#include <boost/optional.hpp>
#include <boost/random/uniform_real_distribution.hpp>
#include "common.hpp"
#include "potential.hpp"

class conformer_sequence;

//! Generates conformers of a supramolecule by a Metropolis Monte Carlo walk of rigid translations and rotations of its components.
//! A spinner owns its random number generator, so chains driven by different spinners are independent and reproducible.
//! Copies of a spinner, including those held by conformer sequences, share the generator and continue its stream.
class spinner
{
public:
	//! Constructs a spinner.
	//! @param step_size Scale of a translation step in Angstrom.
	//! @param rotation_step_size Scale of a rotation step in radians.
	//! @param num_conformers Number of accepted moves after which the walk stops.
	//! @param max_attempts Number of steps, including the initial one, after which the walk stops.
	//! @param potential_function Potential to minimize. The default is spd_potential(5).
	//! @param beta Inverse temperature of the Metropolis criterion.
	//! @param seed Random seed. boost::none selects a seed from the system clock.
	explicit spinner(const double step_size, const double rotation_step_size, const size_t num_conformers, const size_t max_attempts = 1000, const shared_ptr<const potential>& potential_function = shared_ptr<const potential>(), const double beta = 2, const boost::optional<size_t>& seed = static_cast<size_t>(1000));

	//! Returns the potential energy of a supramolecule under the configured potential.
	double compute_potential(const supramolecule& s) const;

	//! Returns a lazy sequence of conformers. The starting supramolecule is always yielded first as conformer 0.
	//! @param movable_components Indexes of the components allowed to move. By default every component but the largest is movable, unless all components have the same size.
	//! @param verbose Print the number of conformers and steps once the sequence is exhausted.
	conformer_sequence get_conformers(const supramolecule& s, const boost::optional<vector<size_t>>& movable_components = boost::none, const bool verbose = false);

	//! Runs the walk to completion and returns the last accepted conformer.
	supramolecule get_final_conformer(const supramolecule& s, const boost::optional<vector<size_t>>& movable_components = boost::none);

	double get_step_size() const;
	double get_rotation_step_size() const;
	size_t get_num_conformers() const;
	size_t get_max_attempts() const;
	double get_beta() const;
private:
	friend class conformer_sequence;

	//! Moves a randomly chosen movable component and returns the resulting supramolecule along with its potential.
	supramolecule run_step(const supramolecule& s, const boost::optional<vector<size_t>>& movable_components, double& e);

	//! Returns true if a move from potential e0 to potential e1 passes the Metropolis criterion.
	bool test_move(const double e0, const double e1);

	const double step_size;
	const double rotation_step_size;
	const size_t num_conformers;
	const size_t max_attempts;
	shared_ptr<const potential> potential_function;
	const double beta;
	shared_ptr<mt19937eng> rng;
	boost::random::uniform_real_distribution<double> u01;
};

//! Represents the lazy, finite sequence of conformers produced by one Markov chain.
//! Consumers that want to stop early simply stop calling next().
class conformer_sequence
{
public:
	//! Returns the next accepted conformer, or boost::none once the conformer or attempt budget is exhausted.
	boost::optional<supramolecule> next();

	//! Returns the number of accepted moves so far.
	size_t get_num_accepted() const;

	//! Returns the number of moves attempted so far.
	size_t get_num_attempts() const;
private:
	friend class spinner;

	explicit conformer_sequence(const spinner& s, const supramolecule& start, const boost::optional<vector<size_t>>& movable_components, const bool verbose);

	spinner sp; //!< Copy of the generating spinner, sharing its generator.
	supramolecule current; //!< Last accepted conformer.
	double e; //!< Potential of the last accepted conformer.
	boost::optional<vector<size_t>> movable_components;
	const bool verbose;
	size_t cid;
	size_t num_accepted;
	size_t num_attempts;
	bool started;
	bool finished;
};

#endif
