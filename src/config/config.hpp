#ifndef __CONFIG
#define __CONFIG

#include <map>
#include <variant>
#include <string>
#include <set>

#include <boost/property_tree/ptree.hpp>

#include "../utils/config_utils.hpp"

namespace pt = boost::property_tree;

const std::set<std::string> accepted_file_types = {"XML", "JSON"};

/*
    Configuration entries:
        - domain: map with the domain name
        - planner: map with the planner options, converted by parse_planner_options
        - state: the initial State. Absent when the domain's default initial state is used
        - todos: the todo list given to the planner
        - output: vector {output_type, file_path, file_type}. Absent when no output file is requested
*/
class ConfigManager {
    public:
        std::map<std::string, config_value> parse_configuration_file(std::string filename);

        void parse_xml_configuration_file(std::string filename);
        void parse_json_configuration_file(std::string filename);

    private:
        void parse_configuration_tree(const pt::ptree& config_root);

        std::map<std::string, config_value> config_info;
};

#endif
