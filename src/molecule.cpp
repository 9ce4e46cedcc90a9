#include <cctype>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <boost/lexical_cast.hpp>
#include <boost/filesystem/fstream.hpp>
#include "array.hpp"
#include "molecule.hpp"

//! Returns an element symbol in title case, e.g. CL => Cl.
static string title(const string& s)
{
	string t(s);
	for (size_t i = 0; i < t.size(); ++i)
	{
		const unsigned char c = static_cast<unsigned char>(t[i]);
		t[i] = static_cast<char>(i ? tolower(c) : toupper(c));
	}
	return t;
}

molecule::molecule(const path& p)
{
	vector<atom> a;
	position_matrix m;
	size_t num_atoms = 0;
	string line;
	size_t num_lines = 0;
	for (boost::filesystem::ifstream ifs(p); getline(ifs, line); ++num_lines)
	{
		// The first line is the atom count, and the second line is a free-form comment.
		if (num_lines == 0)
		{
			istringstream iss(line);
			if (!(iss >> num_atoms)) throw domain_error("Error parsing " + p.filename().string() + ": the first line must be the number of atoms.");
			continue;
		}
		if (num_lines == 1) continue;

		// Skip blank lines, e.g. the trailing one.
		if (line.find_first_not_of(" \t\r") == string::npos) continue;

		// Parse "<element> <x> <y> <z>".
		istringstream iss(line);
		string element, x, y, z;
		if (!(iss >> element >> x >> y >> z)) throw domain_error("Error parsing " + p.filename().string() + ": invalid atom line " + line);
		array<double, 3> coordinate;
		try
		{
			coordinate[0] = boost::lexical_cast<double>(x);
			coordinate[1] = boost::lexical_cast<double>(y);
			coordinate[2] = boost::lexical_cast<double>(z);
		}
		catch (const boost::bad_lexical_cast&)
		{
			throw domain_error("Error parsing " + p.filename().string() + ": invalid coordinate in line " + line);
		}
		a.push_back(atom(a.size(), title(element)));
		m.push_back(coordinate);
	}
	if (num_lines == 0) throw domain_error("Error parsing " + p.filename().string() + ": the file is empty or cannot be read.");

	// Check that the correct number of atom lines was present in the file.
	if (a.size() != num_atoms) throw domain_error("Error parsing " + p.filename().string() + ": the number of atom lines, " + to_string(a.size()) + ", does not match the number of atoms in the header, " + to_string(num_atoms) + ".");

	atoms = make_shared<vector<atom>>(move(a));
	bonds = make_shared<vector<bond>>();
	positions = move(m);
}

molecule::molecule(vector<atom> atoms_, vector<bond> bonds_, position_matrix positions_) : atoms(make_shared<vector<atom>>(move(atoms_))), bonds(make_shared<vector<bond>>(move(bonds_))), positions(move(positions_))
{
	if (positions.size() != atoms->size()) throw invalid_argument("The position matrix has " + to_string(positions.size()) + " rows but the molecule has " + to_string(atoms->size()) + " atoms.");
}

molecule::molecule(const shared_ptr<const vector<atom>>& atoms, const shared_ptr<const vector<bond>>& bonds, position_matrix positions_) : atoms(atoms), bonds(bonds), positions(move(positions_))
{
	if (positions.size() != atoms->size()) throw invalid_argument("The position matrix has " + to_string(positions.size()) + " rows but the molecule has " + to_string(atoms->size()) + " atoms.");
}

const position_matrix& molecule::get_position_matrix() const
{
	return positions;
}

molecule molecule::with_position_matrix(position_matrix m) const
{
	return molecule(atoms, bonds, move(m));
}

molecule molecule::with_displacement(const array<double, 3>& displacement) const
{
	position_matrix m(positions);
	for (auto& p : m)
	{
		p += displacement;
	}
	return molecule(atoms, bonds, move(m));
}

molecule molecule::with_centroid(const array<double, 3>& position) const
{
	return with_displacement(position - get_centroid());
}

molecule molecule::with_rotation(const double angle, const array<double, 3>& axis, const array<double, 3>& origin) const
{
	const array<double, 9> r = axis_angle_to_mat3(axis, angle);
	position_matrix m(positions);
	for (auto& p : m)
	{
		p = r * (p - origin) + origin;
	}
	return molecule(atoms, bonds, move(m));
}

array<double, 3> molecule::get_centroid() const
{
	if (positions.empty()) throw invalid_argument("Cannot compute the centroid of a molecule without atoms.");
	array<double, 3> sum = { 0, 0, 0 };
	for (const auto& p : positions)
	{
		sum += p;
	}
	return (1.0 / positions.size()) * sum;
}

array<double, 3> molecule::get_centroid(const vector<size_t>& atom_ids) const
{
	if (atom_ids.empty()) throw invalid_argument("atom_ids was of length 0.");
	array<double, 3> sum = { 0, 0, 0 };
	for (const size_t id : atom_ids)
	{
		sum += positions[get_row(id)];
	}
	return (1.0 / atom_ids.size()) * sum;
}

const vector<atom>& molecule::get_atoms() const
{
	return *atoms;
}

const vector<bond>& molecule::get_bonds() const
{
	return *bonds;
}

size_t molecule::get_num_atoms() const
{
	return atoms->size();
}

size_t molecule::get_num_bonds() const
{
	return bonds->size();
}

size_t molecule::get_row(const size_t atom_id) const
{
	const vector<atom>& a = *atoms;

	// Atom ids usually coincide with rows.
	if (atom_id < a.size() && a[atom_id].id == atom_id) return atom_id;
	for (size_t i = 0; i < a.size(); ++i)
	{
		if (a[i].id == atom_id) return i;
	}
	throw invalid_argument("No atom has id " + to_string(atom_id) + ".");
}

string molecule::get_xyz_comment() const
{
	return string();
}

string molecule::get_xyz_content() const
{
	ostringstream oss;
	oss << atoms->size() << '\n' << get_xyz_comment() << '\n';
	oss.setf(ios::fixed, ios::floatfield);
	oss << setprecision(6);
	for (size_t i = 0; i < atoms->size(); ++i)
	{
		const array<double, 3>& p = positions[i];
		oss << (*atoms)[i].element << ' ' << p[0] << ' ' << p[1] << ' ' << p[2] << '\n';
	}
	return oss.str();
}

void molecule::write_xyz(const path& p) const
{
	boost::filesystem::ofstream ofs(p);
	if (!ofs) throw runtime_error("Failed to open " + p.string() + " for writing.");
	ofs << get_xyz_content();
}
