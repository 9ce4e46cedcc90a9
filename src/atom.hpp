#pragma once
#ifndef HGSPIN_ATOM_HPP
#define HGSPIN_ATOM_HPP

#include <array>
#include <string>
using namespace std;

//! Represents an atom by its id, element symbol and nonbonded size parameters.
class atom
{
private:
	static const size_t n = 34; //!< Number of supported elements.
	static const array<string, n> elements; //!< Element symbols, e.g. H, C, N, Cl.
	static const array<double, n> covalent_radii; //!< Covalent radii of the elements.
	static const array<double, n> vdw_sigmas; //!< Van der Waals sigmas of the elements.
	static const array<double, n> well_depths; //!< Van der Waals well depths of the elements.
public:
	size_t id; //!< Atom id, unique within a molecule.
	string element; //!< Element symbol.
	double radius; //!< Radius used by the default nonbonded potential.
	double sigma; //!< Sigma used by the varying epsilon potential.
	double epsilon; //!< Epsilon used by the varying epsilon potential.

	//! Constructs an atom whose size parameters are looked up from its element symbol.
	//! @exception domain_error The element symbol is not supported.
	explicit atom(const size_t id, const string& element);

	//! Constructs an atom with explicit size parameters.
	explicit atom(const size_t id, const string& element, const double radius, const double sigma, const double epsilon);

	//! Returns true if the element symbol is supported.
	static bool supported(const string& element);

	//! Returns the index of an element symbol in the element table, or n if unsupported.
	static size_t element_index(const string& element);
};

#endif
