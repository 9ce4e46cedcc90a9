#include <chrono>
#include <thread>
#include <limits>
#include <iostream>
#include <iomanip>
#include <boost/program_options.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/fstream.hpp>
#include "io_service_pool.hpp"
#include "safe_class.hpp"
#include "spinner.hpp"
#include "utility.hpp"
#include "log.hpp"

int main(int argc, char* argv[])
{
	path host_path, output_folder_path, log_path;
	vector<path> guest_paths;
	string potential_name;
	size_t seed, num_threads, num_chains, num_conformers, max_attempts;
	double step_size, rotation_step_size, beta, nonbond_epsilon;
	bool verbose;

	// Process program options.
	try
	{
		// Initialize the default values of optional arguments.
		const path default_output_folder_path = "output";
		const path default_log_path = "log.csv";
		const string default_potential_name = "spd";
		const size_t default_seed = std::chrono::system_clock::now().time_since_epoch().count();
		const size_t default_num_threads = thread::hardware_concurrency();
		const size_t default_num_chains = 1;
		const size_t default_num_conformers = 200;
		const size_t default_max_attempts = 1000;
		const double default_step_size = 1.5;
		const double default_rotation_step_size = 5;
		const double default_beta = 2;
		const double default_nonbond_epsilon = 5;

		// Set up options description.
		using namespace boost::program_options;
		options_description input_options("input (required)");
		input_options.add_options()
			("host", value<path>(&host_path)->required(), "host in XYZ format")
			("guest", value<vector<path>>(&guest_paths)->required(), "guest in XYZ format, can be repeated")
			;
		options_description output_options("output (optional)");
		output_options.add_options()
			("output_folder", value<path>(&output_folder_path)->default_value(default_output_folder_path), "folder of final conformers in XYZ format")
			("log", value<path>(&log_path)->default_value(default_log_path), "log file")
			;
		options_description miscellaneous_options("options (optional)");
		miscellaneous_options.add_options()
			("step_size", value<double>(&step_size)->default_value(default_step_size), "maximum translation per step in Angstrom")
			("rotation_step_size", value<double>(&rotation_step_size)->default_value(default_rotation_step_size), "maximum rotation per step in radians")
			("conformers", value<size_t>(&num_conformers)->default_value(default_num_conformers), "number of accepted moves after which a chain stops")
			("attempts", value<size_t>(&max_attempts)->default_value(default_max_attempts), "number of steps after which a chain stops")
			("beta", value<double>(&beta)->default_value(default_beta), "inverse temperature of the Metropolis criterion")
			("potential", value<string>(&potential_name)->default_value(default_potential_name), "potential function, spd or varying")
			("epsilon", value<double>(&nonbond_epsilon)->default_value(default_nonbond_epsilon), "strength of the spd potential")
			("seed", value<size_t>(&seed)->default_value(default_seed), "explicit non-negative random seed")
			("chains", value<size_t>(&num_chains)->default_value(default_num_chains), "number of independent Markov chains")
			("threads", value<size_t>(&num_threads)->default_value(default_num_threads), "number of worker threads to use")
			("verbose", bool_switch(&verbose), "print the number of conformers and steps of every chain")
			("help", "help information")
			("version", "version information")
			("config", value<path>(), "options can be loaded from a configuration file")
			;
		options_description all_options;
		all_options.add(input_options).add(output_options).add(miscellaneous_options);

		// Parse command line arguments.
		variables_map vm;
		store(parse_command_line(argc, argv, all_options), vm);

		// If no command line argument is supplied or help is requested, print the usage and exit.
		if (argc == 1 || vm.count("help"))
		{
			cout << all_options;
			return 0;
		}

		// If version is requested, print the version and exit.
		if (vm.count("version"))
		{
			cout << "1.0" << endl;
			return 0;
		}

		// If a configuration file is presented, parse it.
		if (vm.count("config"))
		{
			boost::filesystem::ifstream config_file(vm["config"].as<path>());
			store(parse_config_file(config_file, all_options), vm);
		}

		// Notify the user of parsing errors, if any.
		vm.notify();

		// Validate host and guests.
		if (!exists(host_path))
		{
			cerr << "Host " << host_path << " does not exist" << endl;
			return 1;
		}
		if (!is_regular_file(host_path))
		{
			cerr << "Host " << host_path << " is not a regular file" << endl;
			return 1;
		}
		for (const path& guest_path : guest_paths)
		{
			if (!exists(guest_path))
			{
				cerr << "Guest " << guest_path << " does not exist" << endl;
				return 1;
			}
			if (!is_regular_file(guest_path))
			{
				cerr << "Guest " << guest_path << " is not a regular file" << endl;
				return 1;
			}
		}

		// Validate output_folder.
		if (exists(output_folder_path))
		{
			if (!is_directory(output_folder_path))
			{
				cerr << "Output folder " << output_folder_path << " is not a directory" << endl;
				return 1;
			}
		}
		else
		{
			if (!create_directories(output_folder_path))
			{
				cerr << "Failed to create output folder " << output_folder_path << endl;
				return 1;
			}
		}

		// Validate log_path.
		if (is_directory(log_path))
		{
			cerr << "Option log " << log_path << " is a directory" << endl;
			return 1;
		}

		// Validate miscellaneous options.
		if (potential_name != "spd" && potential_name != "varying")
		{
			cerr << "Option potential must be spd or varying" << endl;
			return 1;
		}
		if (step_size < 0)
		{
			cerr << "Option step_size must be non-negative" << endl;
			return 1;
		}
		if (rotation_step_size < 0)
		{
			cerr << "Option rotation_step_size must be non-negative" << endl;
			return 1;
		}
		if (!max_attempts)
		{
			cerr << "Option attempts must be 1 or greater" << endl;
			return 1;
		}
		if (beta <= 0)
		{
			cerr << "Option beta must be positive" << endl;
			return 1;
		}
		if (!num_chains)
		{
			cerr << "Option chains must be 1 or greater" << endl;
			return 1;
		}
		if (!num_threads)
		{
			cerr << "Option threads must be 1 or greater" << endl;
			return 1;
		}
		if (num_threads > numeric_limits<unsigned>::max())
		{
			cerr << "Option threads must be " << numeric_limits<unsigned>::max() << " or less" << endl;
			return 1;
		}
	}
	catch (const exception& e)
	{
		cerr << e.what() << endl;
		return 1;
	}

	// Parse the host and the guests. Every file is treated as one rigid component.
	vector<molecule> components;
	components.reserve(1 + guest_paths.size());
	try
	{
		cout << "Parsing host " << host_path << endl;
		components.emplace_back(host_path);
		for (const path& guest_path : guest_paths)
		{
			cout << "Parsing guest " << guest_path << endl;
			components.emplace_back(guest_path);
		}
	}
	catch (const exception& e)
	{
		cerr << e.what() << endl;
		return 1;
	}
	const supramolecule complex = supramolecule::init_from_components(components);

	// Initialize the potential function.
	shared_ptr<const potential> potential_function;
	if (potential_name == "spd")
	{
		potential_function = make_shared<spd_potential>(nonbond_epsilon);
	}
	else
	{
		potential_function = make_shared<varying_epsilon_potential>();
	}

	// Initialize a Mersenne Twister random number generator.
	cout << "Using random seed " << seed << endl;
	mt19937eng rng(seed);

	// Initialize an io service pool and create worker threads for later use.
	cout << "Creating an io service pool of " << num_threads << " worker thread" << (num_threads == 1 ? "" : "s") << endl;
	io_service_pool io(static_cast<unsigned>(num_threads));
	safe_counter<size_t> cnt;

	// Reserve storage for per chain results. ptr_vector<T> is used for fast sorting.
	boost::ptr_vector<boost::ptr_vector<log_record>> record_containers;
	record_containers.resize(num_chains);
	vector<boost::optional<supramolecule>> final_conformers(num_chains);
	vector<size_t> num_attempts(num_chains);
	vector<string> errors(num_chains);

	// Run the Markov chains in parallel.
	cout << "Running " << num_chains << " Markov chain" << (num_chains == 1 ? "" : "s") << endl;
	cnt.init(num_chains);
	for (size_t i = 0; i < num_chains; ++i)
	{
		const size_t s = rng();
		io.post([&, i, s]()
		{
			try
			{
				spinner sp(step_size, rotation_step_size, num_conformers, max_attempts, potential_function, beta, s);
				conformer_sequence conformers = sp.get_conformers(complex, boost::none, verbose);
				while (boost::optional<supramolecule> conformer = conformers.next())
				{
					record_containers[i].push_back(new log_record(i, *conformer->get_cid(), *conformer->get_potential()));
					final_conformers[i] = conformer;
				}
				num_attempts[i] = conformers.get_num_attempts();
				final_conformers[i]->write_xyz(output_folder_path / ("conformer_" + to_string(i) + ".xyz"));
			}
			catch (const exception& e)
			{
				errors[i] = e.what();
			}
			cnt.increment();
		});
	}
	cnt.wait();
	io.wait();

	// Display the final potential of every chain.
	cout << "   Chain  Conformers      Steps    Potential  Min distance" << endl << setprecision(4);
	cout.setf(ios::fixed, ios::floatfield);
	bool failed = false;
	log_engine log;
	for (size_t i = 0; i < num_chains; ++i)
	{
		if (!errors[i].empty())
		{
			cerr << "Chain " << i << " failed: " << errors[i] << endl;
			failed = true;
			continue;
		}
		cout << setw(8) << i << setw(12) << record_containers[i].size() << setw(11) << num_attempts[i] << setw(13) << *final_conformers[i]->get_potential() << setw(14) << calculate_min_atom_distance(*final_conformers[i]) << endl;
		log.transfer(log.end(), record_containers[i]);
	}

	// Sort and write conformer log records to the log file.
	if (log.empty()) return 1;
	cout << "Writing log records of " << log.size() << " conformers to " << log_path << endl;
	log.sort();
	try
	{
		log.write(log_path);
	}
	catch (const exception& e)
	{
		cerr << e.what() << endl;
		return 1;
	}
	return failed ? 1 : 0;
}
