#include <algorithm>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <vector>

#include <boost/property_tree/ptree.hpp>

#include "config/config.hpp"
#include "domain/domain.hpp"
#include "planner/planner.hpp"
#include "state/state.hpp"
#include "utils/config_utils.hpp"
#include "utils/planning_error.hpp"
#include "outputgenerator/outputgenerator.hpp"
#include "outputgenerator/fileoutputgeneratorfactory.hpp"

using namespace std;

const string verbose_command = "-v";
const string very_verbose_command = "-vv";
const string debug_verbose_command = "-vvv";
const string pretty_print_command = "-p";

int verbose = 0;
bool pretty_print = false;

int main(int argc, char** argv) {
	cin.sync_with_stdio(false);
	cout.sync_with_stdio(false);
	int configfile = -1;
	vector<int> options;

	for(int i = 1; i < argc; i++) {
		string arg(argv[i]);

		if(arg.size() > 0 && arg[0] == '-') {
			options.push_back(i);
		} else if(configfile == -1) {
			configfile = i;
		} else {
			cout << "Unexpected argument [" << arg << "]" << endl;
			return 1;
		}
	}

	bool option_not_found = false;
	for(int option : options) {
		string opt(argv[option]);

		if(opt == verbose_command) {
			verbose = std::max(verbose, 1);
		} else if(opt == very_verbose_command) {
			verbose = std::max(verbose, 2);
		} else if(opt == debug_verbose_command) {
			verbose = std::max(verbose, 3);
		} else if(opt == pretty_print_command) {
			pretty_print = true;
		} else {
			if(!option_not_found) {
				std::cout << std::endl;
			}
			std::cout << "Unknown option [" + opt + "]" << std::endl;
			option_not_found = true;
		}
	}

	if(option_not_found) {
		std::cout << std::endl;
	}

	if(configfile == -1) {
		cout << "Usage: htnplanner <configuration file> [-v|-vv|-vvv] [-p]" << endl;
		return 1;
	}

	ifstream config_file(argv[configfile]);
	if(!config_file.is_open()) {
		cout << "I can't open " << argv[configfile] << "!" << endl;
		return 2;
	}
	config_file.close();

	map<string, config_value> cfg;
	shared_ptr<Domain> domain;
	PlannerOptions planner_options;
	State initial_state;
	vector<Todo> todos;

	try {
		ConfigManager cfg_manager;
		cfg = cfg_manager.parse_configuration_file(argv[configfile]);

		string domain_name = std::get<map<string,string>>(cfg[domain_config_key])[name_key];
		domain = DomainFactory::create_domain(domain_name);

		if(cfg.find(planner_config_key) != cfg.end()) {
			planner_options = parse_planner_options(std::get<map<string,string>>(cfg[planner_config_key]));
		}
		planner_options.verbose = std::max(planner_options.verbose, verbose);

		if(cfg.find(state_config_key) != cfg.end()) {
			initial_state = std::get<State>(cfg[state_config_key]);
		} else {
			initial_state = DomainFactory::create_initial_state(domain_name);
		}

		todos = std::get<vector<Todo>>(cfg[todos_config_key]);
	} catch(const std::runtime_error& e) {
		cout << "Configuration error: " << e.what() << endl;
		return 4;
	}

	if(planner_options.verbose > 1) {
		print_state(initial_state);
	}

	shared_ptr<Plan> p;
	try {
		Planner planner(*domain, planner_options);
		p = std::make_shared<Plan>(planner.plan(initial_state, todos));
	} catch(const PlanningError& e) {
		cout << "Planning failed (" << planning_error_type_name(e.get_error_type()) << "): " << e.what() << endl;
		return 3;
	} catch(const std::runtime_error& e) {
		cout << "Planning failed: " << e.what() << endl;
		return 3;
	}

	print_plan(*p);

	if(planner_options.verbose > 0) {
		print_state(p->final_state);
	}

	if(cfg.find(output_config_key) != cfg.end()) {
		vector<string> output = std::get<vector<string>>(cfg[output_config_key]);

		if(output.at(0) == "FILE") {
			FileOutputGeneratorFactory output_gen_factory;

			pair<string,string> file_output_data = std::make_pair(output.at(1),output.at(2));
			try {
				std::shared_ptr<FileOutputGenerator> output_generator_ptr = output_gen_factory.create_file_output_generator(p, file_output_data, planner_options.verbose > 0, pretty_print);

				output_generator_ptr->generate_plan_output();
			} catch(const std::runtime_error& e) {
				cout << "Could not write output file: " << e.what() << endl;
				return 2;
			}
		}
	}

	return 0;
}
