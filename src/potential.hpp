#pragma once
#ifndef HGSPIN_POTENTIAL_HPP
#define HGSPIN_POTENTIAL_HPP

#include "supramolecule.hpp"

//! Represents a potential energy function of a supramolecule.
class potential
{
public:
	virtual ~potential() {}

	//! Returns the potential energy of a supramolecule.
	virtual double compute_potential(const supramolecule& s) const = 0;
};

//! Represents the default nonbonded potential.
//! A Lennard-Jones shaped term is summed over every atom pair between every unordered pair of components.
//! It has no relation to an empirical forcefield.
class spd_potential : public potential
{
public:
	//! Constructs a potential of a given strength.
	explicit spd_potential(const double nonbond_epsilon = 5);

	virtual double compute_potential(const supramolecule& s) const;

	//! Returns epsilon * ((sigma / distance)^12 - (sigma / distance)^6).
	//! A zero distance yields a non-finite value.
	double nonbond_potential(const double distance, const double sigma) const;

	//! Returns the nonbonded potential of components whose atoms have the given radii.
	//! Sigmas of atom pairs are arithmetic means of their radii.
	double compute_nonbonded_potential(const vector<molecule>& components, const vector<vector<double>>& radii) const;

	//! Returns the radii of the atoms of every component.
	static vector<vector<double>> get_component_radii(const supramolecule& s);

	double get_nonbond_epsilon() const;
protected:
	const double nonbond_epsilon; //!< Strength of the nonbonded potential.
};

//! Represents a nonbonded potential whose sigma and epsilon vary per atom.
//! Sigmas of atom pairs are arithmetic means and epsilons are geometric means.
class varying_epsilon_potential : public potential
{
public:
	virtual double compute_potential(const supramolecule& s) const;

	//! Returns epsilon * ((sigma / distance)^12 - (sigma / distance)^6).
	static double nonbond_potential(const double distance, const double sigma, const double epsilon);
};

#endif
