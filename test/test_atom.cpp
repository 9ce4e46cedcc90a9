#define BOOST_TEST_MODULE atom
#include <stdexcept>
#include <boost/test/unit_test.hpp>
#include "atom.hpp"

BOOST_AUTO_TEST_CASE(element_parameters)
{
	const atom c(3, "C");
	BOOST_CHECK_EQUAL(c.id, 3);
	BOOST_CHECK_EQUAL(c.element, "C");
	BOOST_CHECK_CLOSE(c.radius, 0.76, 1e-10);
	BOOST_CHECK_CLOSE(c.sigma, 1.926, 1e-10);
	BOOST_CHECK_CLOSE(c.epsilon, 0.105, 1e-10);

	const atom cl(0, "Cl");
	BOOST_CHECK_CLOSE(cl.radius, 1.02, 1e-10);
}

BOOST_AUTO_TEST_CASE(explicit_parameters)
{
	const atom a(7, "Pd", 1.5, 2.5, 0.25);
	BOOST_CHECK_EQUAL(a.id, 7);
	BOOST_CHECK_EQUAL(a.radius, 1.5);
	BOOST_CHECK_EQUAL(a.sigma, 2.5);
	BOOST_CHECK_EQUAL(a.epsilon, 0.25);
}

BOOST_AUTO_TEST_CASE(unsupported_elements)
{
	BOOST_CHECK(atom::supported("H"));
	BOOST_CHECK(atom::supported("Pb"));
	BOOST_CHECK(!atom::supported("CL"));
	BOOST_CHECK(!atom::supported("Xx"));
	BOOST_CHECK_THROW(atom(0, "Xx"), domain_error);
}
