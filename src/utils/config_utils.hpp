#ifndef __CONFIG_UTILS
#define __CONFIG_UTILS

#include <string>
#include <map>
#include <variant>

#include <boost/property_tree/ptree.hpp>

#include "todo.hpp"
#include "../state/state.hpp"
#include "../planner/planner.hpp"

namespace pt = boost::property_tree;

//################################### CONSTANTS DECLARATION ###############################################
const std::string configuration_root_key = "configuration";

const std::string domain_config_key = "domain";

const std::string planner_config_key = "planner";
const std::string max_depth_key = "max_depth";
const std::string verbose_key = "verbose";
const std::string goal_policy_key = "goal_policy";

const std::string state_config_key = "state";
const std::string subject_key = "subject";
const std::string predicate_key = "predicate";
const std::string value_key = "value";
const std::string value_type_key = "value_type";

const std::string todos_config_key = "todos";
const std::string todo_type_key = "type";
const std::string name_key = "name";
const std::string args_key = "args";
const std::string goals_key = "goals";

const std::string output_config_key = "output";
const std::string output_type_key = "output_type";
const std::string output_file_path_key = "file_path";
const std::string output_file_type_key = "file_type";

// Accepted values
const std::string task_todo_type = "task";
const std::string goal_todo_type = "goal";
const std::string multigoal_todo_type = "multigoal";
const std::string permissive_goal_policy = "permissive";
const std::string strict_goal_policy = "strict";
//##########################################################################################################

typedef std::variant<std::map<std::string,std::string>, std::vector<std::string>, std::vector<Todo>, State> config_value;

State parse_state(const pt::ptree& state_node);
Goal parse_goal(const pt::ptree& goal_node);
Todo parse_todo(const pt::ptree& todo_node);
std::vector<Todo> parse_todos(const pt::ptree& todos_node);

PlannerOptions parse_planner_options(std::map<std::string,std::string> planner_cfg);

std::string get_mandatory_attr(const pt::ptree& node, const std::string& attr, const std::string& owner);

#endif
