#include "jsonoutputgenerator.hpp"

#include <boost/property_tree/json_parser.hpp>

using namespace std;

static pt::ptree string_array(const vector<string>& values) {
    pt::ptree array_node;

    for(const string& v : values) {
        pt::ptree value_node;
        value_node.put("", v);

        array_node.push_back(std::make_pair("", value_node));
    }

    return array_node;
}

void JSONOutputGenerator::output_metadata(pt::ptree& output_file) {
    output_file.put("status", plan_status_name(plan->status));

    pt::ptree metadata_node;
    metadata_node.put("created_at", plan->metadata.created_at);
    metadata_node.put("domain", plan->metadata.domain_name);
    metadata_node.put("planning_depth", plan->metadata.planning_depth);
    metadata_node.put("iterations", plan->metadata.iterations);
    metadata_node.put("cost", plan->solution_tree.plan_cost());

    TreeStats stats = plan->solution_tree.get_stats();
    metadata_node.put("stats.total_nodes", stats.total_nodes);
    metadata_node.put("stats.expanded_nodes", stats.expanded_nodes);
    metadata_node.put("stats.primitive_actions", stats.primitive_actions);
    metadata_node.put("stats.max_depth", stats.max_depth);

    output_file.add_child("metadata", metadata_node);
}

void JSONOutputGenerator::output_actions(pt::ptree& output_file, vector<PrimitiveTask> actions) {
    pt::ptree actions_node;

    for(const PrimitiveTask& action : actions) {
        pt::ptree action_node;
        action_node.put("name", action.name);

        pt::ptree arguments_node;
        for(const fact_value& arg : action.args) {
            pt::ptree arg_node;
            arg_node.put("value", fact_value_to_string(arg));
            arg_node.put("value_type", fact_value_type_name(arg));

            arguments_node.push_back(std::make_pair("", arg_node));
        }
        action_node.add_child("args", arguments_node);

        actions_node.push_back(std::make_pair("", action_node));
    }

    output_file.add_child("actions", actions_node);
}

/*
    Function: output_tree
    Objective: Insert every solution tree node, in id order, into the JSON output

    @ Input 1: A reference to the output file ptree object
    @ Input 2: The solution tree
    @ Output: Void. The output file ptree object is filled
*/
void JSONOutputGenerator::output_tree(pt::ptree& output_file, const SolutionTree& solution_tree) {
    pt::ptree nodes_node;

    for(int id = 0;id < solution_tree.size();id++) {
        const SolutionNode& n = solution_tree.get_node(id);

        pt::ptree node;
        node.put("id", n.id);
        node.put("parent", n.parent);
        node.put("label", n.label);
        node.put("type", todo_type_name(get_todo_type(n.task)));
        node.put("name", todo_name(n.task));
        node.add_child("args", string_array(todo_arguments(n.task)));
        node.put("status", node_status_name(n));

        if(n.method_tried) {
            node.put("method", n.method_tried.get());
        }

        vector<string> children;
        for(int child : n.children) {
            children.push_back(to_string(child));
        }
        node.add_child("children", string_array(children));

        nodes_node.push_back(std::make_pair("", node));
    }

    output_file.put("tree.root", solution_tree.get_root());
    output_file.add_child("tree.nodes", nodes_node);
}

void JSONOutputGenerator::output_state(pt::ptree& output_file, const State& state) {
    pt::ptree state_node;

    for(const fact_triple& fact : state.get_triples()) {
        pt::ptree fact_node;
        fact_node.put("subject", std::get<0>(fact));
        fact_node.put("predicate", std::get<1>(fact));
        fact_node.put("value", fact_value_to_string(std::get<2>(fact)));
        fact_node.put("value_type", fact_value_type_name(std::get<2>(fact)));

        state_node.push_back(std::make_pair("", fact_node));
    }

    output_file.add_child("final_state", state_node);
}

void JSONOutputGenerator::write_output_file(const pt::ptree& output_file) {
    pt::write_json(output.first, output_file, std::locale(), pretty_print);
}
