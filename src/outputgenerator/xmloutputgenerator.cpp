#include "xmloutputgenerator.hpp"

#include <boost/property_tree/xml_parser.hpp>

using namespace std;

void XMLOutputGenerator::output_metadata(pt::ptree& output_file) {
    output_file.put("plan.<xmlattr>.status", plan_status_name(plan->status));

    output_file.put("plan.metadata.created_at", plan->metadata.created_at);
    output_file.put("plan.metadata.domain", plan->metadata.domain_name);
    output_file.put("plan.metadata.planning_depth", plan->metadata.planning_depth);
    output_file.put("plan.metadata.iterations", plan->metadata.iterations);
    output_file.put("plan.metadata.cost", plan->solution_tree.plan_cost());

    TreeStats stats = plan->solution_tree.get_stats();
    output_file.put("plan.metadata.stats.<xmlattr>.total_nodes", stats.total_nodes);
    output_file.put("plan.metadata.stats.<xmlattr>.expanded_nodes", stats.expanded_nodes);
    output_file.put("plan.metadata.stats.<xmlattr>.primitive_actions", stats.primitive_actions);
    output_file.put("plan.metadata.stats.<xmlattr>.max_depth", stats.max_depth);
}

/*
    Function: output_actions
    Objective: Insert the ordered primitive actions into the XML Output file

    @ Input 1: A reference to the output file ptree object
    @ Input 2: The actions, in execution order
    @ Output: Void. The output file ptree oject is filled

    NOTES: -> Fields:
            - Name
            - Arguments
*/
void XMLOutputGenerator::output_actions(pt::ptree& output_file, vector<PrimitiveTask> actions) {
    output_file.put("plan.actions","");
    output_file.put("plan.actions.<xmlattr>.number",actions.size());

    int actions_counter = 0;
    for(const PrimitiveTask& action : actions) {
        string action_name = "plan.actions.action" + to_string(actions_counter);
        output_file.add(action_name,"");

        output_file.put(action_name + ".name",action.name);

        int arg_counter = 0;
        for(const fact_value& arg : action.args) {
            string arg_attr = action_name + ".args.arg" + to_string(arg_counter);
            output_file.put(arg_attr,fact_value_to_string(arg));
            output_file.put(arg_attr + ".<xmlattr>.value_type",fact_value_type_name(arg));

            arg_counter++;
        }

        actions_counter++;
    }
}

/*
    Function: output_tree
    Objective: Insert the solution tree nodes into the XML Output file

    @ Input 1: A reference to the output file ptree object
    @ Input 2: The solution tree
    @ Output: Void. The output file ptree oject is filled

    NOTES: -> Fields:
            - ID, Parent, Label, Type and Status (as attributes)
            - Name
            - Arguments
            - Method that decomposed the node, if any
            - Children IDs
*/
void XMLOutputGenerator::output_tree(pt::ptree& output_file, const SolutionTree& solution_tree) {
    output_file.put("plan.tree.<xmlattr>.root",solution_tree.get_root());

    for(int id = 0;id < solution_tree.size();id++) {
        const SolutionNode& n = solution_tree.get_node(id);

        string node_name = "plan.tree.node" + to_string(id);
        output_file.add(node_name,"");

        output_file.put(node_name + ".<xmlattr>.id",n.id);
        output_file.put(node_name + ".<xmlattr>.parent",n.parent);
        output_file.put(node_name + ".<xmlattr>.label",n.label);
        output_file.put(node_name + ".<xmlattr>.type",todo_type_name(get_todo_type(n.task)));
        output_file.put(node_name + ".<xmlattr>.status",node_status_name(n));

        output_file.put(node_name + ".name",todo_name(n.task));

        int arg_counter = 0;
        for(const string& arg : todo_arguments(n.task)) {
            output_file.put(node_name + ".args.arg" + to_string(arg_counter),arg);
            arg_counter++;
        }

        if(n.method_tried) {
            output_file.put(node_name + ".method",n.method_tried.get());
        }

        int child_counter = 0;
        for(int child : n.children) {
            output_file.put(node_name + ".children.child" + to_string(child_counter),child);
            child_counter++;
        }
    }
}

void XMLOutputGenerator::output_state(pt::ptree& output_file, const State& state) {
    output_file.put("plan.final_state","");

    int fact_counter = 0;
    for(const fact_triple& fact : state.get_triples()) {
        string fact_name = "plan.final_state.fact" + to_string(fact_counter);

        output_file.put(fact_name + ".<xmlattr>.subject",std::get<0>(fact));
        output_file.put(fact_name + ".<xmlattr>.predicate",std::get<1>(fact));
        output_file.put(fact_name + ".<xmlattr>.value_type",fact_value_type_name(std::get<2>(fact)));
        output_file.put(fact_name,fact_value_to_string(std::get<2>(fact)));

        fact_counter++;
    }
}

void XMLOutputGenerator::write_output_file(const pt::ptree& output_file) {
    if(pretty_print) {
        pt::xml_writer_settings<string> settings(' ',4);
        pt::write_xml(output.first, output_file, std::locale(), settings);
    } else {
        pt::write_xml(output.first, output_file);
    }
}
