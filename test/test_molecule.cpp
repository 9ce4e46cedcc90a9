#define BOOST_TEST_MODULE molecule
#include <stdexcept>
#include <boost/test/unit_test.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/fstream.hpp>
#include "array.hpp"
#include "molecule.hpp"

namespace
{
	molecule make_ring()
	{
		vector<atom> atoms;
		for (size_t i = 0; i < 6; ++i)
		{
			atoms.push_back(atom(i, "C"));
		}
		vector<bond> bonds;
		for (size_t i = 0; i < 6; ++i)
		{
			bonds.push_back(bond(i, i, (i + 1) % 6));
		}
		position_matrix positions = { { 0, 1, 0 }, { 1, 1, 0 }, { -1, 1, 0 }, { 0, 10, 0 }, { 1, 10, 0 }, { -1, 10, 0 } };
		return molecule(atoms, bonds, positions);
	}

	//! Returns a unique path in the temporary directory, removed on destruction.
	struct temporary_file
	{
		const path p;
		temporary_file() : p(temp_directory_path() / unique_path("hgspin-%%%%-%%%%-%%%%.xyz")) {}
		~temporary_file()
		{
			boost::system::error_code ec;
			boost::filesystem::remove(p, ec);
		}
		void write(const string& content) const
		{
			boost::filesystem::ofstream ofs(p);
			ofs << content;
		}
	};
}

BOOST_AUTO_TEST_CASE(centroid)
{
	const molecule m = make_ring();
	const array<double, 3> c = m.get_centroid();
	BOOST_CHECK_SMALL(c[0], 1e-12);
	BOOST_CHECK_CLOSE(c[1], 5.5, 1e-10);
	BOOST_CHECK_SMALL(c[2], 1e-12);

	const array<double, 3> d = m.get_centroid(vector<size_t>{ 1, 4 });
	BOOST_CHECK_CLOSE(d[0], 1, 1e-10);
	BOOST_CHECK_CLOSE(d[1], 5.5, 1e-10);

	BOOST_CHECK_THROW(m.get_centroid(vector<size_t>()), invalid_argument);
	BOOST_CHECK_THROW(m.get_centroid(vector<size_t>{ 6 }), invalid_argument);
}

BOOST_AUTO_TEST_CASE(counts_and_rows)
{
	const molecule m = make_ring();
	BOOST_CHECK_EQUAL(m.get_num_atoms(), 6);
	BOOST_CHECK_EQUAL(m.get_num_bonds(), 6);
	BOOST_CHECK_EQUAL(m.get_row(4), 4);
	BOOST_CHECK_THROW(m.get_row(6), invalid_argument);

	// Ids need not coincide with rows.
	const molecule n({ atom(5, "H"), atom(2, "O") }, {}, position_matrix{ { 0, 0, 0 }, { 1, 0, 0 } });
	BOOST_CHECK_EQUAL(n.get_row(5), 0);
	BOOST_CHECK_EQUAL(n.get_row(2), 1);
}

BOOST_AUTO_TEST_CASE(shape_mismatch)
{
	const molecule m = make_ring();
	BOOST_CHECK_THROW(m.with_position_matrix(position_matrix(5)), invalid_argument);
	BOOST_CHECK_THROW(molecule({ atom(0, "C") }, {}, position_matrix(2)), invalid_argument);
}

BOOST_AUTO_TEST_CASE(clones_leave_the_original_unchanged)
{
	const molecule m = make_ring();
	const molecule d = m.with_displacement({ 1, -1, 2 });
	BOOST_CHECK_EQUAL(m.get_position_matrix()[0][0], 0);
	BOOST_CHECK_EQUAL(d.get_position_matrix()[0][0], 1);
	BOOST_CHECK_EQUAL(d.get_position_matrix()[0][1], 0);
	BOOST_CHECK_EQUAL(d.get_position_matrix()[0][2], 2);
	BOOST_CHECK_EQUAL(&d.get_atoms(), &m.get_atoms());

	const molecule c = m.with_centroid({ 3, 3, 3 });
	const array<double, 3> centroid = c.get_centroid();
	BOOST_CHECK_CLOSE(centroid[0], 3, 1e-10);
	BOOST_CHECK_CLOSE(centroid[1], 3, 1e-10);
	BOOST_CHECK_CLOSE(centroid[2], 3, 1e-10);
}

BOOST_AUTO_TEST_CASE(rotation_about_centroid_is_rigid)
{
	const molecule m = make_ring();
	const molecule r = m.with_rotation(1.1, { 0.2, 0.5, 0.9 }, m.get_centroid());
	const array<double, 3> c0 = m.get_centroid();
	const array<double, 3> c1 = r.get_centroid();
	for (size_t k = 0; k < 3; ++k)
	{
		BOOST_CHECK_SMALL(c1[k] - c0[k], 1e-10);
	}
	const position_matrix& p = m.get_position_matrix();
	const position_matrix& q = r.get_position_matrix();
	for (size_t i = 0; i < p.size(); ++i)
	for (size_t j = i + 1; j < p.size(); ++j)
	{
		BOOST_CHECK_CLOSE(distance_sqr(p[i], p[j]), distance_sqr(q[i], q[j]), 1e-8);
	}
}

BOOST_AUTO_TEST_CASE(xyz_round_trip)
{
	const molecule m = make_ring();
	const temporary_file f;
	m.write_xyz(f.p);

	const molecule n(f.p);
	BOOST_REQUIRE_EQUAL(n.get_num_atoms(), 6);
	BOOST_CHECK_EQUAL(n.get_num_bonds(), 0);
	for (size_t i = 0; i < 6; ++i)
	{
		BOOST_CHECK_EQUAL(n.get_atoms()[i].id, i);
		BOOST_CHECK_EQUAL(n.get_atoms()[i].element, "C");
		for (size_t k = 0; k < 3; ++k)
		{
			BOOST_CHECK_CLOSE(n.get_position_matrix()[i][k] + 1, m.get_position_matrix()[i][k] + 1, 1e-6);
		}
	}
}

BOOST_AUTO_TEST_CASE(xyz_content)
{
	const molecule m({ atom(0, "N"), atom(1, "H") }, {}, position_matrix{ { 0, 0, 0 }, { 1.5, -0.25, 2 } });
	BOOST_CHECK_EQUAL(m.get_xyz_content(), "2\n\nN 0.000000 0.000000 0.000000\nH 1.500000 -0.250000 2.000000\n");
}

BOOST_AUTO_TEST_CASE(xyz_parsing)
{
	const temporary_file f;
	f.write("2\ncomment\ncl 0 0 0\nBR 1 2 3\n\n");
	const molecule m(f.p);
	BOOST_CHECK_EQUAL(m.get_atoms()[0].element, "Cl");
	BOOST_CHECK_EQUAL(m.get_atoms()[1].element, "Br");
	BOOST_CHECK_EQUAL(m.get_position_matrix()[1][2], 3);
}

BOOST_AUTO_TEST_CASE(xyz_errors)
{
	const temporary_file f;
	f.write("3\n\nC 0 0 0\nC 1 0 0\n");
	BOOST_CHECK_THROW(molecule m(f.p), domain_error);

	f.write("1\n\nC 0 zero 0\n");
	BOOST_CHECK_THROW(molecule m(f.p), domain_error);

	f.write("1\n\nXx 0 0 0\n");
	BOOST_CHECK_THROW(molecule m(f.p), domain_error);

	f.write("1\n\n\xc3\xa9 0 0 0\n");
	BOOST_CHECK_THROW(molecule m(f.p), domain_error);

	f.write("");
	BOOST_CHECK_THROW(molecule m(f.p), domain_error);
}
