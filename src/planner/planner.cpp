#include "planner.hpp"

#include <iostream>

#include <boost/date_time/posix_time/posix_time.hpp>

using namespace std;

Planner::Planner(const Domain& domain, PlannerOptions options) : domain(domain), options(options), expander(domain, options.goal_policy, options.verbose) {}

/*
    Function: plan
    Objective: Build the solution tree for the todo list, interleaving decomposition with the execution
    of primitive actions against the planning-time state

    @ Input 1: The initial planning-time state
    @ Input 2: The todo list
    @ Output: The plan, either complete or bounded by max_depth

    NOTE: Each iteration expands the first unexpanded, non-primitive node found in the tree's natural
    order (preorder from the root). The root expansion is the first iteration. Fatal conditions are
    raised as PlanningError and the tree built so far is discarded
*/
Plan Planner::plan(const State& initial_state, vector<Todo> todos) {
    if(options.verbose > 1) {
        cout << "HTN planning: starting with " << todos.size() << " todos, max_depth " << options.max_depth << endl;
    }

    SolutionTree solution_tree(todos, initial_state);
    State planning_state = initial_state;

    int iterations = 0;
    boost::optional<int> next_node = solution_tree.find_next_unexpanded();

    while(next_node && iterations < options.max_depth) {
        if(options.verbose > 2) {
            cout << "Expanding node [" << solution_tree.get_node(next_node.get()).label << "] (iteration " << iterations << ")" << endl;
        }

        planning_state = expander.expand(solution_tree, next_node.get(), planning_state);
        iterations++;

        next_node = solution_tree.find_next_unexpanded();
    }

    plan_status status = PLANCOMPLETE;
    if(next_node) {
        status = PLANBOUNDED;

        if(options.verbose > 0) {
            cout << "HTN planning: reached maximum depth " << options.max_depth << " with unexpanded nodes" << endl;
        }
    } else if(options.verbose > 1) {
        cout << "HTN planning: no more unexpanded nodes, planning complete" << endl;
    }

    PlanMetadata metadata;
    metadata.created_at = boost::posix_time::to_iso_extended_string(boost::posix_time::second_clock::universal_time()) + "Z";
    metadata.domain_name = domain.get_name();
    metadata.domain = &domain;
    metadata.final_state = planning_state;
    metadata.planning_depth = options.max_depth;
    metadata.iterations = iterations;

    Plan p = {status, solution_tree, planning_state, metadata};

    return p;
}

/*
    Function: expand_node
    Objective: Run a single expansion step on a given node. This allows a caller to re-submit a node
    after changing its blacklist

    NOTE: The node must still be unexpanded. Expanding a node that already has children (or was executed)
          throws MALFORMEDTASK, since the tree is append-only. Re-submission therefore applies to a node
          that was left open, e.g. by a bounded plan
    @ Input 1: The solution tree
    @ Input 2: The node id
    @ Input 3: The current planning-time state
    @ Output: The planning-time state after the expansion
*/
State Planner::expand_node(SolutionTree& solution_tree, int node_id, const State& state) {
    return expander.expand(solution_tree, node_id, state);
}

int Planner::get_method_invocations() const {
    return expander.get_method_invocations();
}

string plan_status_name(plan_status status) {
    if(status == PLANCOMPLETE) {
        return "complete";
    }

    return "bounded";
}

void print_plan(const Plan& p) {
    vector<PrimitiveTask> actions = p.solution_tree.extract_primitive_actions();

    cout << "Plan (" << plan_status_name(p.status) << ") for domain [" << p.metadata.domain_name << "]: " << actions.size() << " actions" << endl;

    int index = 1;
    for(const PrimitiveTask& action : actions) {
        cout << "    " << index << ": " << action.name << args_to_string(action.args) << endl;
        index++;
    }
}
