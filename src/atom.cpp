#include <stdexcept>
#include "atom.hpp"

//! Element symbols.
const array<string, atom::n> atom::elements =
{
	"H" , //  0
	"Li", //  1
	"B" , //  2
	"C" , //  3
	"N" , //  4
	"O" , //  5
	"F" , //  6
	"Na", //  7
	"Mg", //  8
	"Si", //  9
	"P" , // 10
	"S" , // 11
	"Cl", // 12
	"K" , // 13
	"Ca", // 14
	"Mn", // 15
	"Fe", // 16
	"Co", // 17
	"Ni", // 18
	"Cu", // 19
	"Zn", // 20
	"Se", // 21
	"Br", // 22
	"Ru", // 23
	"Rh", // 24
	"Pd", // 25
	"Ag", // 26
	"Cd", // 27
	"I" , // 28
	"Ir", // 29
	"Pt", // 30
	"Au", // 31
	"Hg", // 32
	"Pb", // 33
};

//! Covalent radii in Angstrom. http://en.wikipedia.org/wiki/Covalent_radius
const array<double, atom::n> atom::covalent_radii =
{
	0.31, //  0 = H
	1.28, //  1 = Li
	0.84, //  2 = B
	0.76, //  3 = C
	0.71, //  4 = N
	0.66, //  5 = O
	0.57, //  6 = F
	1.66, //  7 = Na
	1.41, //  8 = Mg
	1.11, //  9 = Si
	1.07, // 10 = P
	1.05, // 11 = S
	1.02, // 12 = Cl
	2.03, // 13 = K
	1.76, // 14 = Ca
	1.39, // 15 = Mn
	1.32, // 16 = Fe
	1.26, // 17 = Co
	1.24, // 18 = Ni
	1.32, // 19 = Cu
	1.22, // 20 = Zn
	1.20, // 21 = Se
	1.20, // 22 = Br
	1.46, // 23 = Ru
	1.42, // 24 = Rh
	1.39, // 25 = Pd
	1.45, // 26 = Ag
	1.44, // 27 = Cd
	1.39, // 28 = I
	1.41, // 29 = Ir
	1.36, // 30 = Pt
	1.36, // 31 = Au
	1.32, // 32 = Hg
	1.46, // 33 = Pb
};

//! Van der Waals sigmas in Angstrom, half of the UFF nonbond distances.
const array<double, atom::n> atom::vdw_sigmas =
{
	1.443, //  0 = H , 1.443 = 2.886 / 2
	1.226, //  1 = Li, 1.226 = 2.451 / 2
	2.042, //  2 = B , 2.042 = 4.083 / 2
	1.926, //  3 = C , 1.926 = 3.851 / 2
	1.830, //  4 = N , 1.830 = 3.660 / 2
	1.750, //  5 = O , 1.750 = 3.500 / 2
	1.682, //  6 = F , 1.682 = 3.364 / 2
	1.492, //  7 = Na, 1.492 = 2.983 / 2
	1.511, //  8 = Mg, 1.511 = 3.021 / 2
	2.148, //  9 = Si, 2.148 = 4.295 / 2
	2.074, // 10 = P , 2.074 = 4.147 / 2
	2.018, // 11 = S , 2.018 = 4.035 / 2
	1.974, // 12 = Cl, 1.974 = 3.947 / 2
	1.906, // 13 = K , 1.906 = 3.812 / 2
	1.700, // 14 = Ca, 1.700 = 3.399 / 2
	1.481, // 15 = Mn, 1.481 = 2.961 / 2
	1.456, // 16 = Fe, 1.456 = 2.912 / 2
	1.436, // 17 = Co, 1.436 = 2.872 / 2
	1.417, // 18 = Ni, 1.417 = 2.834 / 2
	1.748, // 19 = Cu, 1.748 = 3.495 / 2
	1.382, // 20 = Zn, 1.382 = 2.763 / 2
	2.103, // 21 = Se, 2.103 = 4.205 / 2
	2.095, // 22 = Br, 2.095 = 4.189 / 2
	1.482, // 23 = Ru, 1.482 = 2.963 / 2
	1.465, // 24 = Rh, 1.465 = 2.929 / 2
	1.450, // 25 = Pd, 1.450 = 2.899 / 2
	1.574, // 26 = Ag, 1.574 = 3.148 / 2
	1.424, // 27 = Cd, 1.424 = 2.848 / 2
	2.250, // 28 = I , 2.250 = 4.500 / 2
	1.265, // 29 = Ir, 1.265 = 2.530 / 2
	1.377, // 30 = Pt, 1.377 = 2.754 / 2
	1.647, // 31 = Au, 1.647 = 3.293 / 2
	1.353, // 32 = Hg, 1.353 = 2.705 / 2
	2.149, // 33 = Pb, 2.149 = 4.297 / 2
};

//! Van der Waals well depths in kcal/mol, taken from UFF.
const array<double, atom::n> atom::well_depths =
{
	0.044, //  0 = H
	0.025, //  1 = Li
	0.180, //  2 = B
	0.105, //  3 = C
	0.069, //  4 = N
	0.060, //  5 = O
	0.050, //  6 = F
	0.030, //  7 = Na
	0.111, //  8 = Mg
	0.402, //  9 = Si
	0.305, // 10 = P
	0.274, // 11 = S
	0.227, // 12 = Cl
	0.035, // 13 = K
	0.238, // 14 = Ca
	0.013, // 15 = Mn
	0.013, // 16 = Fe
	0.014, // 17 = Co
	0.015, // 18 = Ni
	0.005, // 19 = Cu
	0.124, // 20 = Zn
	0.291, // 21 = Se
	0.251, // 22 = Br
	0.056, // 23 = Ru
	0.053, // 24 = Rh
	0.048, // 25 = Pd
	0.036, // 26 = Ag
	0.228, // 27 = Cd
	0.339, // 28 = I
	0.073, // 29 = Ir
	0.080, // 30 = Pt
	0.039, // 31 = Au
	0.385, // 32 = Hg
	0.663, // 33 = Pb
};

size_t atom::element_index(const string& element)
{
	size_t i = 0;
	while (i < n && elements[i] != element) ++i;
	return i;
}

bool atom::supported(const string& element)
{
	return element_index(element) < n;
}

atom::atom(const size_t id, const string& element) : id(id), element(element)
{
	const size_t i = element_index(element);
	if (i == n) throw domain_error("Unsupported element " + element + " of atom " + to_string(id));
	radius = covalent_radii[i];
	sigma = vdw_sigmas[i];
	epsilon = well_depths[i];
}

atom::atom(const size_t id, const string& element, const double radius, const double sigma, const double epsilon) : id(id), element(element), radius(radius), sigma(sigma), epsilon(epsilon) {}
