#include <iomanip>
#include <stdexcept>
#include <boost/filesystem/fstream.hpp>
#include "log.hpp"

void log_engine::write(const path& log_path) const
{
	boost::filesystem::ofstream log(log_path);
	if (!log) throw runtime_error("Failed to open log file " + log_path.string());
	log << "Chain,Conformer,Potential\n" << fixed << setprecision(6);
	for (const auto& r : *this)
	{
		log << r.chain << ',' << r.cid << ',' << r.potential << '\n';
	}
}
