#pragma once
#ifndef HGSPIN_SUPRAMOLECULE_HPP
#define HGSPIN_SUPRAMOLECULE_HPP

#include <boost/optional.hpp>
#include "molecule.hpp"

//! Represents a supramolecule, i.e. a molecule whose disconnected components are treated as rigid bodies.
//! The component partition is structural. It is discovered from the bond graph on construction and kept across coordinate updates.
class supramolecule : public molecule
{
public:
	//! Constructs a supramolecule from atoms, bonds and a position matrix, and decomposes it into connected components.
	//! @exception invalid_argument The number of rows differs from the number of atoms, or a bond references an unknown atom.
	explicit supramolecule(vector<atom> atoms, vector<bond> bonds, position_matrix positions, const boost::optional<size_t>& cid = boost::none, const boost::optional<double>& potential = boost::none);

	//! Constructs a supramolecule by concatenating already disjoint components.
	//! Atoms and bonds are renumbered into a contiguous id space in component order, and the components are kept verbatim as the partition.
	static supramolecule init_from_components(const vector<molecule>& components, const boost::optional<size_t>& cid = boost::none, const boost::optional<double>& potential = boost::none);

	//! Returns a clone with a new position matrix. The components are not resliced from the new matrix.
	//! @exception invalid_argument The number of rows differs from the number of atoms.
	supramolecule with_position_matrix(position_matrix positions) const;

	//! Returns a clone with every atom, and every component, displaced by a vector.
	supramolecule with_displacement(const array<double, 3>& displacement) const;

	//! Returns the components.
	const vector<molecule>& get_components() const;

	size_t get_num_components() const;

	//! Returns the conformer id, if assigned.
	const boost::optional<size_t>& get_cid() const;

	//! Returns the potential energy, if computed.
	const boost::optional<double>& get_potential() const;
protected:
	virtual string get_xyz_comment() const;
private:
	explicit supramolecule(const shared_ptr<const vector<atom>>& atoms, const shared_ptr<const vector<bond>>& bonds, position_matrix positions, const shared_ptr<const vector<molecule>>& components, const boost::optional<size_t>& cid, const boost::optional<double>& potential);

	//! Decomposes the supramolecule into connected components of its bond graph.
	void define_components();

	shared_ptr<const vector<molecule>> components; //!< Disconnected components.
	boost::optional<size_t> cid; //!< Conformer id.
	boost::optional<double> potential; //!< Potential energy.
};

#endif
