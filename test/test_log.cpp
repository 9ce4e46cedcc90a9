#define BOOST_TEST_MODULE log
#include <boost/test/unit_test.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/fstream.hpp>
#include "log.hpp"

BOOST_AUTO_TEST_CASE(records_sort_by_potential)
{
	log_engine log;
	log.push_back(new log_record(0, 0, 1.25));
	log.push_back(new log_record(0, 1, -3.5));
	log.push_back(new log_record(1, 0, 0));
	log.sort();
	BOOST_CHECK_EQUAL(log[0].potential, -3.5);
	BOOST_CHECK_EQUAL(log[1].potential, 0);
	BOOST_CHECK_EQUAL(log[2].potential, 1.25);
}

BOOST_AUTO_TEST_CASE(csv_output)
{
	log_engine log;
	log.push_back(new log_record(2, 7, -1.5));
	log.push_back(new log_record(0, 0, 0.125));
	const path log_path = temp_directory_path() / unique_path("hgspin-%%%%-%%%%-%%%%.csv");
	log.write(log_path);

	boost::filesystem::ifstream ifs(log_path);
	string line;
	BOOST_REQUIRE(getline(ifs, line));
	BOOST_CHECK_EQUAL(line, "Chain,Conformer,Potential");
	BOOST_REQUIRE(getline(ifs, line));
	BOOST_CHECK_EQUAL(line, "2,7,-1.500000");
	BOOST_REQUIRE(getline(ifs, line));
	BOOST_CHECK_EQUAL(line, "0,0,0.125000");
	BOOST_CHECK(!getline(ifs, line));
	ifs.close();
	boost::filesystem::remove(log_path);
}

BOOST_AUTO_TEST_CASE(unwritable_log)
{
	log_engine log;
	BOOST_CHECK_THROW(log.write(temp_directory_path() / unique_path("hgspin-%%%%-%%%%") / "log.csv"), runtime_error);
}
