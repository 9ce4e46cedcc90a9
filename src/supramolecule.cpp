#include <map>
#include <sstream>
#include <stdexcept>
#include <boost/assert.hpp>
#include <boost/graph/adjacency_list.hpp>
#include <boost/graph/connected_components.hpp>
#include "array.hpp"
#include "supramolecule.hpp"

supramolecule::supramolecule(vector<atom> atoms_, vector<bond> bonds_, position_matrix positions_, const boost::optional<size_t>& cid, const boost::optional<double>& potential) : molecule(move(atoms_), move(bonds_), move(positions_)), cid(cid), potential(potential)
{
	define_components();
}

supramolecule::supramolecule(const shared_ptr<const vector<atom>>& atoms, const shared_ptr<const vector<bond>>& bonds, position_matrix positions_, const shared_ptr<const vector<molecule>>& components, const boost::optional<size_t>& cid, const boost::optional<double>& potential) : molecule(atoms, bonds, move(positions_)), components(components), cid(cid), potential(potential)
{
}

void supramolecule::define_components()
{
	typedef boost::adjacency_list<boost::vecS, boost::vecS, boost::undirectedS> graph;
	const size_t num_atoms = atoms->size();
	auto c = make_shared<vector<molecule>>();
	if (num_atoms == 0)
	{
		components = c;
		return;
	}

	// Build a graph whose vertices are rows and whose edges are bonds.
	graph g(num_atoms);
	for (const bond& b : *bonds)
	{
		boost::add_edge(get_row(b.atom1_id), get_row(b.atom2_id), g);
	}

	// Label every row with the index of its connected component.
	// Components are numbered in the order of their smallest row.
	vector<size_t> component_map(num_atoms);
	const size_t num_components = boost::connected_components(g, &component_map[0]);

	// Collect the atoms, the bonds fully contained and the position rows of every component.
	vector<vector<atom>> component_atoms(num_components);
	vector<vector<bond>> component_bonds(num_components);
	vector<position_matrix> component_positions(num_components);
	for (size_t i = 0; i < num_atoms; ++i)
	{
		const size_t k = component_map[i];
		component_atoms[k].push_back((*atoms)[i]);
		component_positions[k].push_back(positions[i]);
	}
	for (const bond& b : *bonds)
	{
		const size_t k = component_map[get_row(b.atom1_id)];
		BOOST_ASSERT(k == component_map[get_row(b.atom2_id)]);
		component_bonds[k].push_back(b);
	}

	c->reserve(num_components);
	for (size_t k = 0; k < num_components; ++k)
	{
		c->push_back(molecule(move(component_atoms[k]), move(component_bonds[k]), move(component_positions[k])));
	}
	components = c;
}

supramolecule supramolecule::init_from_components(const vector<molecule>& components, const boost::optional<size_t>& cid, const boost::optional<double>& potential)
{
	auto a = make_shared<vector<atom>>();
	auto b = make_shared<vector<bond>>();
	position_matrix m;
	size_t next_atom_id = 0;
	size_t next_bond_id = 0;
	for (const molecule& comp : components)
	{
		// Map the atom ids of the current component to new contiguous ids.
		map<size_t, size_t> atom_id_map;
		for (const atom& x : comp.get_atoms())
		{
			atom_id_map[x.id] = next_atom_id;
			a->push_back(atom(next_atom_id++, x.element, x.radius, x.sigma, x.epsilon));
		}
		for (const bond& y : comp.get_bonds())
		{
			const auto i1 = atom_id_map.find(y.atom1_id);
			const auto i2 = atom_id_map.find(y.atom2_id);
			if (i1 == atom_id_map.end() || i2 == atom_id_map.end()) throw invalid_argument("Bond " + to_string(y.id) + " of a component references an atom outside the component.");
			b->push_back(bond(next_bond_id++, i1->second, i2->second));
		}
		const position_matrix& p = comp.get_position_matrix();
		m.insert(m.end(), p.begin(), p.end());
	}
	return supramolecule(a, b, move(m), make_shared<vector<molecule>>(components), cid, potential);
}

supramolecule supramolecule::with_position_matrix(position_matrix m) const
{
	return supramolecule(atoms, bonds, move(m), components, cid, potential);
}

supramolecule supramolecule::with_displacement(const array<double, 3>& displacement) const
{
	position_matrix m(positions);
	for (auto& p : m)
	{
		p += displacement;
	}
	auto c = make_shared<vector<molecule>>();
	c->reserve(components->size());
	for (const molecule& comp : *components)
	{
		c->push_back(comp.with_displacement(displacement));
	}
	return supramolecule(atoms, bonds, move(m), c, cid, potential);
}

const vector<molecule>& supramolecule::get_components() const
{
	return *components;
}

size_t supramolecule::get_num_components() const
{
	return components->size();
}

const boost::optional<size_t>& supramolecule::get_cid() const
{
	return cid;
}

const boost::optional<double>& supramolecule::get_potential() const
{
	return potential;
}

string supramolecule::get_xyz_comment() const
{
	ostringstream oss;
	if (cid) oss << "cid:" << *cid;
	if (cid && potential) oss << ", ";
	if (potential) oss << "pot:" << *potential;
	return oss.str();
}
