#pragma once
#ifndef HGSPIN_BOND_HPP
#define HGSPIN_BOND_HPP

#include <cstddef>
using namespace std;

//! Represents a covalent bond between two atoms referenced by their ids.
class bond
{
public:
	size_t id; //!< Bond id.
	size_t atom1_id; //!< Id of the first atom.
	size_t atom2_id; //!< Id of the second atom.

	//! Constructs a bond between two atoms.
	explicit bond(const size_t id, const size_t atom1_id, const size_t atom2_id) : id(id), atom1_id(atom1_id), atom2_id(atom2_id) {}
};

#endif
