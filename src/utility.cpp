#include <cmath>
#include <algorithm>
#include <stdexcept>
#include "array.hpp"
#include "utility.hpp"

double get_atom_distance(const position_matrix& positions, const size_t atom1_id, const size_t atom2_id)
{
	if (atom1_id >= positions.size() || atom2_id >= positions.size()) throw invalid_argument("Atom id out of range of the position matrix.");
	return sqrt(distance_sqr(positions[atom1_id], positions[atom2_id]));
}

double calculate_min_atom_distance(const supramolecule& s)
{
	const vector<molecule>& components = s.get_components();
	double min_distance_sqr = 1e48;
	for (size_t k1 = 0; k1 < components.size(); ++k1)
	{
		const position_matrix& m1 = components[k1].get_position_matrix();
		for (size_t k2 = k1 + 1; k2 < components.size(); ++k2)
		{
			const position_matrix& m2 = components[k2].get_position_matrix();
			for (const auto& p1 : m1)
			for (const auto& p2 : m2)
			{
				min_distance_sqr = min(min_distance_sqr, distance_sqr(p1, p2));
			}
		}
	}
	return sqrt(min_distance_sqr);
}

double calculate_centroid_distance(const supramolecule& s)
{
	const vector<molecule>& components = s.get_components();
	if (components.size() != 2) throw invalid_argument("Centroid distance requires exactly 2 components, but " + to_string(components.size()) + " were found.");
	return sqrt(distance_sqr(components[0].get_centroid(), components[1].get_centroid()));
}
