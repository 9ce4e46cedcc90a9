#pragma once
#ifndef HGSPIN_LOG_HPP
#define HGSPIN_LOG_HPP

#include <boost/ptr_container/ptr_vector.hpp>
#include <boost/filesystem/path.hpp>
using namespace std;
using namespace boost::filesystem;

//! Represents a log record of a conformer produced by a Markov chain.
class log_record
{
public:
	const size_t chain; //!< Index of the chain.
	const size_t cid; //!< Conformer id within the chain.
	const double potential; //!< Potential energy of the conformer.

	explicit log_record(const size_t chain, const size_t cid, const double potential) : chain(chain), cid(cid), potential(potential) {}
};

//! Compares two log records by their potential energies.
inline bool operator<(const log_record& r0, const log_record& r1)
{
	return r0.potential < r1.potential;
}

//! Represents a vector of log records.
class log_engine : public boost::ptr_vector<log_record>
{
public:
	//! Write conformer log records to the log file.
	//! @exception runtime_error The log file cannot be opened.
	void write(const path& log_path) const;
};

#endif
