#include "domain.hpp"

#include <stdexcept>

#include "../domains/simpletravel.hpp"
#include "../domains/blocksworld.hpp"

using namespace std;

template<typename M>
static void check_method_redeclaration(const vector<pair<string,M>>& candidates, const string& method_id, const string& owner) {
    for(const pair<string,M>& candidate : candidates) {
        if(candidate.first == method_id) {
            string method_redeclaration_error = "Method [" + method_id + "] was already declared for [" + owner + "]";

            throw std::runtime_error(method_redeclaration_error);
        }
    }
}

Domain::Domain(string name) {
    this->name = name;
}

void Domain::add_task_method(string task_name, string method_id, method_fn method) {
    check_method_redeclaration(methods[task_name], method_id, task_name);

    methods[task_name].push_back(make_pair(method_id,method));
}

void Domain::add_unigoal_method(string predicate, string method_id, method_fn method) {
    check_method_redeclaration(unigoal_method_map[predicate], method_id, predicate);

    unigoal_method_map[predicate].push_back(make_pair(method_id,method));
}

void Domain::add_multigoal_method(string method_id, multigoal_method_fn method) {
    check_method_redeclaration(multigoal_method_vector, method_id, "multigoal");

    multigoal_method_vector.push_back(make_pair(method_id,method));
}

void Domain::add_action(string action_name, action_fn action) {
    if(actions.find(action_name) != actions.end()) {
        string action_redeclaration_error = "Action [" + action_name + "] was already declared in domain [" + name + "]";

        throw std::runtime_error(action_redeclaration_error);
    }

    actions[action_name] = action;
}

method_list Domain::task_methods(const string& task_name) const {
    map<string,method_list>::const_iterator methods_it = methods.find(task_name);

    if(methods_it == methods.end()) {
        return method_list();
    }

    return methods_it->second;
}

method_list Domain::unigoal_methods(const string& predicate) const {
    map<string,method_list>::const_iterator methods_it = unigoal_method_map.find(predicate);

    if(methods_it == unigoal_method_map.end()) {
        return method_list();
    }

    return methods_it->second;
}

multigoal_method_list Domain::multigoal_methods() const {
    return multigoal_method_vector;
}

boost::optional<action_fn> Domain::action(const string& action_name) const {
    map<string,action_fn>::const_iterator action_it = actions.find(action_name);

    if(action_it == actions.end()) {
        return boost::none;
    }

    return action_it->second;
}

bool Domain::has_action(const string& action_name) const {
    return actions.find(action_name) != actions.end();
}

vector<string> Domain::list_task_names() const {
    vector<string> task_names;
    for(const auto& task_methods : methods) {
        task_names.push_back(task_methods.first);
    }

    return task_names;
}

vector<string> Domain::list_unigoal_predicates() const {
    vector<string> predicates;
    for(const auto& predicate_methods : unigoal_method_map) {
        predicates.push_back(predicate_methods.first);
    }

    return predicates;
}

vector<string> Domain::list_actions() const {
    vector<string> action_names;
    for(const auto& a : actions) {
        action_names.push_back(a.first);
    }

    return action_names;
}

string Domain::get_name() const {
    return name;
}

shared_ptr<Domain> DomainFactory::create_domain(string domain_name) {
    if(domain_name == simple_travel_domain_name) {
        return create_simple_travel_domain();
    } else if(domain_name == blocks_world_domain_name) {
        return create_blocks_world_domain();
    } else {
        string unknown_domain_error = "Domain [" + domain_name + "] is not supported";

        throw std::runtime_error(unknown_domain_error);
    }
}

State DomainFactory::create_initial_state(string domain_name) {
    if(domain_name == simple_travel_domain_name) {
        return simple_travel_initial_state();
    } else if(domain_name == blocks_world_domain_name) {
        return blocks_world_initial_state();
    } else {
        string unknown_domain_error = "Domain [" + domain_name + "] is not supported";

        throw std::runtime_error(unknown_domain_error);
    }
}
