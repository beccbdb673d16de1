#include "config.hpp"

#include <iostream>
#include <algorithm>

#include <boost/property_tree/xml_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/foreach.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/optional/optional.hpp>

using namespace std;

set<string> accepted_output_file_types = {"XML", "JSON"};

map<string, config_value> ConfigManager::parse_configuration_file(string filename) {
    config_info.clear();

    string cfg_filetype = "XML";
	if(filename.rfind(".") != std::string::npos) {
		string aux = filename.substr(filename.rfind(".")+1);
		std::transform(aux.begin(), aux.end(), aux.begin(), ::toupper);

		if(accepted_file_types.find(aux) != accepted_file_types.end()) {
			cfg_filetype = aux;
		}
	}

	if(cfg_filetype == "XML") {
		parse_xml_configuration_file(filename);
	} else if(cfg_filetype == "JSON") {
		parse_json_configuration_file(filename);
	}

    return config_info;
}

void ConfigManager::parse_xml_configuration_file(string filename) {
    pt::ptree config_root;
    pt::read_xml(filename, config_root, pt::xml_parser::trim_whitespace);

    parse_configuration_tree(config_root);
}

void ConfigManager::parse_json_configuration_file(string filename) {
    pt::ptree config_root;
    pt::read_json(filename, config_root);

    parse_configuration_tree(config_root);
}

/*
    Function: parse_configuration_tree
    Objective: Fill the configuration map from an already parsed property tree

    @ Input: The property tree root, which must contain the configuration node
    @ Output: Void. The configuration map is filled

    NOTE: XML attributes and comments are ignored
*/
void ConfigManager::parse_configuration_tree(const pt::ptree& config_root) {
    boost::optional<const pt::ptree&> configuration = config_root.get_child_optional(configuration_root_key);
    if(!configuration) {
        string missing_root_error = "Configuration file has no [" + configuration_root_key + "] node";

        throw std::runtime_error(missing_root_error);
    }

    BOOST_FOREACH(const pt::ptree::value_type& config, configuration.get()) {
        if(config.first.size() > 0 && config.first[0] == '<') {
            continue;
        }

        /*
            Read domain name
        */
        if(config.first == domain_config_key) {
            string domain_name = boost::trim_copy(config.second.get_value<string>());
            if(domain_name == "") {
                domain_name = config.second.get<string>(name_key, "");
            }

            if(domain_name == "") {
                throw std::runtime_error("Domain name was not defined");
            }

            map<string,string> domain_info;
            domain_info[name_key] = domain_name;

            config_info[domain_config_key] = domain_info;
        }

        /*
            Read planner options
        */
        else if(config.first == planner_config_key) {
            map<string,string> planner_info;

            vector<string> planner_options {max_depth_key, verbose_key, goal_policy_key};
            for(string option : planner_options) {
                boost::optional<string> option_value = config.second.get_optional<string>(option);

                if(option_value) {
                    planner_info[option] = boost::trim_copy(option_value.get());
                }
            }

            config_info[planner_config_key] = planner_info;
        }

        /*
            Read initial state
        */
        else if(config.first == state_config_key) {
            config_info[state_config_key] = parse_state(config.second);
        }

        /*
            Read todo list
        */
        else if(config.first == todos_config_key) {
            config_info[todos_config_key] = parse_todos(config.second);
        }

        /*
            Read output file path and type
        */
        else if(config.first == output_config_key) {
            vector<string> output_info;

            string output_type = get_mandatory_attr(config.second, output_type_key, "output");
            std::transform(output_type.begin(),output_type.end(),output_type.begin(),::toupper);
            output_info.push_back(output_type);

            if(output_type == "FILE") {
                string file_type = get_mandatory_attr(config.second, output_file_type_key, "output");
                std::transform(file_type.begin(),file_type.end(),file_type.begin(),::toupper);

                if(accepted_output_file_types.find(file_type) == accepted_output_file_types.end()) {
                    string unsupported_file_type_error = "File type [" + file_type + "] is not supported";

                    throw std::runtime_error(unsupported_file_type_error);
                }

                string output_path = get_mandatory_attr(config.second, output_file_path_key, "output");

                output_info.push_back(output_path);
                output_info.push_back(file_type);
            } else {
                string unsupported_output_type_error = "Output type [" + output_type + "] is not supported";

                throw std::runtime_error(unsupported_output_type_error);
            }

            config_info[output_config_key] = output_info;
        }
    }

    vector<string> mandatory_entries {domain_config_key, todos_config_key};
    for(string entry : mandatory_entries) {
        if(config_info.find(entry) == config_info.end()) {
            string missing_entry_error = "Configuration entry [" + entry + "] was not defined";

            throw std::runtime_error(missing_entry_error);
        }
    }
}
