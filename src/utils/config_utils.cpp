#include "config_utils.hpp"

#include <algorithm>
#include <stdexcept>

#include <boost/foreach.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/optional/optional.hpp>
#include <boost/lexical_cast.hpp>

using namespace std;

static bool is_xml_metadata(const string& key) {
    return key.size() > 0 && key[0] == '<';
}

string get_mandatory_attr(const pt::ptree& node, const string& attr, const string& owner) {
    boost::optional<string> attr_value = node.get_optional<string>(attr);

    if(!attr_value) {
        string missing_attr_error = "Missing attribute [" + attr + "] in " + owner + " definition";

        throw std::runtime_error(missing_attr_error);
    }

    return boost::trim_copy(attr_value.get());
}

/*
    Function: parse_state
    Objective: Build a State from the facts declared in a configuration file

    @ Input: The state node. Each child declares subject, predicate, value and, optionally, value_type
    @ Output: The parsed state
*/
State parse_state(const pt::ptree& state_node) {
    State state;

    BOOST_FOREACH(const pt::ptree::value_type& fact, state_node) {
        if(is_xml_metadata(fact.first)) {
            continue;
        }

        string subject = get_mandatory_attr(fact.second, subject_key, "fact");
        string predicate = get_mandatory_attr(fact.second, predicate_key, "fact");
        string value = get_mandatory_attr(fact.second, value_key, "fact");
        string value_type = fact.second.get<string>(value_type_key, "");

        state.set_fact(subject, predicate, parse_fact_value(value, value_type));
    }

    return state;
}

Goal parse_goal(const pt::ptree& goal_node) {
    Goal g;

    g.predicate = get_mandatory_attr(goal_node, predicate_key, "goal");
    g.subject = get_mandatory_attr(goal_node, subject_key, "goal");

    string value = get_mandatory_attr(goal_node, value_key, "goal");
    string value_type = goal_node.get<string>(value_type_key, "");
    g.value = parse_fact_value(value, value_type);

    return g;
}

/*
    Function: parse_todo
    Objective: Parse a single todo item

    @ Input: The todo node, whose type attribute is task, goal or multigoal
    @ Output: The parsed todo

    NOTE: Task arguments have their types inferred (int, float, otherwise string)
*/
Todo parse_todo(const pt::ptree& todo_node) {
    string todo_type = get_mandatory_attr(todo_node, todo_type_key, "todo");
    std::transform(todo_type.begin(),todo_type.end(),todo_type.begin(),::tolower);

    if(todo_type == task_todo_type) {
        Task t;
        t.name = get_mandatory_attr(todo_node, name_key, "task");

        boost::optional<const pt::ptree&> args_node = todo_node.get_child_optional(args_key);
        if(args_node) {
            BOOST_FOREACH(const pt::ptree::value_type& arg, args_node.get()) {
                if(is_xml_metadata(arg.first)) {
                    continue;
                }

                t.args.push_back(parse_fact_value(boost::trim_copy(arg.second.data()), ""));
            }
        }

        return t;
    } else if(todo_type == goal_todo_type) {
        return parse_goal(todo_node);
    } else if(todo_type == multigoal_todo_type) {
        Multigoal mg;

        boost::optional<const pt::ptree&> goals_node = todo_node.get_child_optional(goals_key);
        if(!goals_node) {
            throw std::runtime_error("Missing attribute [" + goals_key + "] in multigoal definition");
        }

        BOOST_FOREACH(const pt::ptree::value_type& goal, goals_node.get()) {
            if(is_xml_metadata(goal.first)) {
                continue;
            }

            mg.goals.push_back(parse_goal(goal.second));
        }

        return mg;
    }

    string unsupported_todo_type_error = "Todo type [" + todo_type + "] is not supported";

    throw std::runtime_error(unsupported_todo_type_error);
}

vector<Todo> parse_todos(const pt::ptree& todos_node) {
    vector<Todo> todos;

    BOOST_FOREACH(const pt::ptree::value_type& todo, todos_node) {
        if(is_xml_metadata(todo.first)) {
            continue;
        }

        todos.push_back(parse_todo(todo.second));
    }

    return todos;
}

PlannerOptions parse_planner_options(map<string,string> planner_cfg) {
    PlannerOptions options;

    if(planner_cfg.find(max_depth_key) != planner_cfg.end()) {
        try {
            options.max_depth = boost::lexical_cast<int>(planner_cfg[max_depth_key]);
        } catch(const boost::bad_lexical_cast& e) {
            throw std::runtime_error("Invalid value [" + planner_cfg[max_depth_key] + "] for [" + max_depth_key + "]");
        }

        if(options.max_depth < 0) {
            throw std::runtime_error("[" + max_depth_key + "] cannot be negative");
        }
    }

    if(planner_cfg.find(verbose_key) != planner_cfg.end()) {
        try {
            options.verbose = boost::lexical_cast<int>(planner_cfg[verbose_key]);
        } catch(const boost::bad_lexical_cast& e) {
            throw std::runtime_error("Invalid value [" + planner_cfg[verbose_key] + "] for [" + verbose_key + "]");
        }
    }

    if(planner_cfg.find(goal_policy_key) != planner_cfg.end()) {
        string policy = planner_cfg[goal_policy_key];
        std::transform(policy.begin(),policy.end(),policy.begin(),::tolower);

        if(policy == permissive_goal_policy) {
            options.goal_policy = PERMISSIVEGOALS;
        } else if(policy == strict_goal_policy) {
            options.goal_policy = STRICTGOALS;
        } else {
            throw std::runtime_error("Goal policy [" + policy + "] is not supported");
        }
    }

    return options;
}
