#pragma once
#ifndef HGSPIN_UTILITY_HPP
#define HGSPIN_UTILITY_HPP

#include "supramolecule.hpp"

//! Returns the Euclidean distance between two rows of a position matrix.
//! @exception invalid_argument Either row is out of range.
double get_atom_distance(const position_matrix& positions, const size_t atom1_id, const size_t atom2_id);

//! Returns the minimum distance between atoms of different components, or 1e24 if there are fewer than two components.
double calculate_min_atom_distance(const supramolecule& s);

//! Returns the distance between the centroids of the two components of a 1:1 complex.
//! @exception invalid_argument The supramolecule does not consist of exactly two components.
double calculate_centroid_distance(const supramolecule& s);

#endif
