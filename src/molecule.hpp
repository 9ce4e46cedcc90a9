#pragma once
#ifndef HGSPIN_MOLECULE_HPP
#define HGSPIN_MOLECULE_HPP

#include <memory>
#include <boost/filesystem/path.hpp>
#include "common.hpp"
#include "atom.hpp"
#include "bond.hpp"
using namespace boost::filesystem;

//! Represents an immutable molecule of atoms, bonds and a position matrix.
//! Row i of the position matrix holds the coordinate of the i-th atom in stored order.
//! Every transformation returns a new molecule that shares the atoms and bonds of the current one.
class molecule
{
public:
	//! Constructs a molecule by parsing a file in XYZ format. Atoms are numbered from 0 and no bonds are defined.
	//! @exception domain_error The declared atom count differs from the number of atom lines, or a line cannot be parsed.
	explicit molecule(const path& p);

	//! Constructs a molecule from atoms, bonds and a position matrix with one row per atom.
	//! @exception invalid_argument The number of rows differs from the number of atoms.
	explicit molecule(vector<atom> atoms, vector<bond> bonds, position_matrix positions);

	virtual ~molecule() {}

	//! Returns the position matrix.
	const position_matrix& get_position_matrix() const;

	//! Returns a clone with a new position matrix.
	//! @exception invalid_argument The number of rows differs from the number of atoms.
	molecule with_position_matrix(position_matrix positions) const;

	//! Returns a clone with every atom displaced by a vector.
	molecule with_displacement(const array<double, 3>& displacement) const;

	//! Returns a clone translated so that its centroid is at a given position.
	molecule with_centroid(const array<double, 3>& position) const;

	//! Returns a clone rotated by an angle in radians about an axis passing through an origin.
	molecule with_rotation(const double angle, const array<double, 3>& axis, const array<double, 3>& origin) const;

	//! Returns the centroid of all the atoms.
	array<double, 3> get_centroid() const;

	//! Returns the centroid of the atoms with the given ids.
	//! @exception invalid_argument atom_ids is empty or contains an unknown id.
	array<double, 3> get_centroid(const vector<size_t>& atom_ids) const;

	//! Returns the atoms in stored order.
	const vector<atom>& get_atoms() const;

	//! Returns the bonds in stored order.
	const vector<bond>& get_bonds() const;

	size_t get_num_atoms() const;
	size_t get_num_bonds() const;

	//! Returns the row of the position matrix that holds the atom with a given id.
	//! @exception invalid_argument No atom has the given id.
	size_t get_row(const size_t atom_id) const;

	//! Returns the content of the molecule in XYZ format.
	string get_xyz_content() const;

	//! Writes the molecule to a file in XYZ format. Connectivity is not preserved.
	void write_xyz(const path& p) const;
protected:
	//! Constructs a molecule sharing atoms and bonds.
	explicit molecule(const shared_ptr<const vector<atom>>& atoms, const shared_ptr<const vector<bond>>& bonds, position_matrix positions);

	//! Returns the comment line of XYZ output.
	virtual string get_xyz_comment() const;

	shared_ptr<const vector<atom>> atoms; //!< Atoms, shared among clones.
	shared_ptr<const vector<bond>> bonds; //!< Bonds, shared among clones.
	position_matrix positions; //!< Atom coordinates, owned by each clone.
};

#endif
