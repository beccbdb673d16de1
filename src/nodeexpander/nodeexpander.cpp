#include "nodeexpander.hpp"

#include <iostream>
#include <type_traits>

using namespace std;

template<class> struct always_false : std::false_type {};

NodeExpander::NodeExpander(const Domain& domain, goal_failure_policy policy, int verbose) : domain(domain), resolver(verbose), executor(domain, verbose) {
    this->goal_policy = policy;
    this->verbose = verbose;
}

/*
    Function: expand
    Objective: Expand a single unexpanded node according to its task variant

    @ Input 1: The solution tree, which is changed in place
    @ Input 2: The id of the node to expand
    @ Input 3: The current planning-time state
    @ Output: The planning-time state after the expansion. Only the execution of a primitive action
    changes it

    NOTE: Expanding a node twice is a programming error and is reported as MALFORMEDTASK
*/
State NodeExpander::expand(SolutionTree& solution_tree, int node_id, const State& state) {
    const SolutionNode& n = solution_tree.get_node(node_id);

    if(n.expanded || n.is_primitive) {
        string already_expanded_error = "Node [" + n.label + "] holding " + todo_to_string(n.task) + " was already expanded";

        throw PlanningError(MALFORMEDTASK, already_expanded_error);
    }

    Todo task = n.task;

    return std::visit([&](const auto& t) -> State {
        typedef std::decay_t<decltype(t)> T;

        if constexpr(std::is_same_v<T, RootTask>) {
            return expand_root(solution_tree, node_id, t, state);
        } else if constexpr(std::is_same_v<T, Task>) {
            return expand_task(solution_tree, node_id, t, state);
        } else if constexpr(std::is_same_v<T, Goal>) {
            return expand_goal(solution_tree, node_id, t, state);
        } else if constexpr(std::is_same_v<T, Multigoal>) {
            return expand_multigoal(solution_tree, node_id, t, state);
        } else if constexpr(std::is_same_v<T, PrimitiveTask>) {
            string primitive_todo_error = "Primitive todo " + todo_to_string(task) + " cannot be expanded";

            throw PlanningError(MALFORMEDTASK, primitive_todo_error);
        } else {
            static_assert(always_false<T>::value, "Non-exhaustive todo dispatch");
        }
    }, task.content);
}

int NodeExpander::get_method_invocations() const {
    return resolver.get_invocations();
}

State NodeExpander::expand_root(SolutionTree& solution_tree, int node_id, const RootTask& r, const State& state) {
    if(node_id != solution_tree.get_root()) {
        string nested_root_error = "Root todo found at non-root node [" + solution_tree.get_node(node_id).label + "]";

        throw PlanningError(MALFORMEDTASK, nested_root_error);
    }

    if(verbose > 1) {
        cout << "Expanding root node with " << r.todos.size() << " todos" << endl;
    }

    if(r.todos.empty()) {
        solution_tree.mark_completed(node_id);
    } else {
        solution_tree.insert_children(node_id, r.todos, root_expansion_label, state);
    }

    return state;
}

/*
    Function: expand_task
    Objective: Decompose a task with its task methods. When no method applies, the task is executed
    as a primitive action

    @ Input 1: The solution tree
    @ Input 2: The node id
    @ Input 3: The task
    @ Input 4: The current planning-time state
    @ Output: The resulting planning-time state
*/
State NodeExpander::expand_task(SolutionTree& solution_tree, int node_id, const Task& t, const State& state) {
    if(t.name == "") {
        throw PlanningError(MALFORMEDTASK, "Task with an empty name found at node [" + solution_tree.get_node(node_id).label + "]");
    }

    method_list candidates = domain.task_methods(t.name);

    MethodResolution resolution = resolver.resolve(candidates, solution_tree.get_node(node_id).blacklisted_methods, state, t.args);

    if(resolution.type == COMPLETED) {
        if(verbose > 2) {
            cout << "Task " << t.name << args_to_string(t.args) << " completed by method [" << resolution.method_id << "]" << endl;
        }

        solution_tree.mark_completed(node_id);

        return state;
    } else if(resolution.type == DECOMPOSED) {
        if(verbose > 2) {
            cout << "Task " << t.name << args_to_string(t.args) << " expanded to " << resolution.subtasks.size() << " subtasks by method [" << resolution.method_id << "]" << endl;
        }

        solution_tree.insert_children(node_id, resolution.subtasks, task_method_label, state);

        return state;
    }

    if(!candidates.empty() && !domain.has_action(t.name)) {
        if(verbose > 0) {
            cout << "No applicable method for task " << t.name << args_to_string(t.args) << endl;
        }

        string no_method_error = "No applicable method for task [" + t.name + args_to_string(t.args) + "]" + failures_to_string(resolution);

        throw PlanningError(NOAPPLICABLEMETHOD, no_method_error);
    }

    if(verbose > 2) {
        cout << "No methods for task " << t.name << ", executing it as a primitive action" << endl;
    }

    State new_state = executor.execute(t.name, t.args, state, solution_tree.get_blacklisted_commands());

    solution_tree.mark_primitive(node_id);

    return new_state;
}

/*
    Function: expand_goal
    Objective: Achieve a single goal. A goal that already holds is completed without calling any method

    @ Input 1: The solution tree
    @ Input 2: The node id
    @ Input 3: The goal
    @ Input 4: The current planning-time state
    @ Output: The planning-time state, which is never changed here
*/
State NodeExpander::expand_goal(SolutionTree& solution_tree, int node_id, const Goal& g, const State& state) {
    if(g.predicate == "") {
        throw PlanningError(MALFORMEDTASK, "Goal with an empty predicate found at node [" + solution_tree.get_node(node_id).label + "]");
    }

    if(verbose > 1) {
        cout << "Expanding goal " << goal_to_string(g) << endl;
    }

    if(state.matches(g.predicate, g.subject, g.value)) {
        if(verbose > 2) {
            cout << "Goal " << goal_to_string(g) << " already satisfied" << endl;
        }

        solution_tree.mark_completed(node_id);

        return state;
    }

    vector<fact_value> goal_args;
    goal_args.push_back(g.subject);
    goal_args.push_back(g.value);

    MethodResolution resolution = resolver.resolve(domain.unigoal_methods(g.predicate), solution_tree.get_node(node_id).blacklisted_methods, state, goal_args);

    if(resolution.type == COMPLETED) {
        solution_tree.mark_completed(node_id);
    } else if(resolution.type == DECOMPOSED) {
        if(verbose > 1) {
            cout << "Unigoal method [" << resolution.method_id << "] returned " << resolution.subtasks.size() << " subtasks" << endl;
        }

        solution_tree.insert_children(node_id, resolution.subtasks, unigoal_method_label, state);
    } else if(goal_policy == STRICTGOALS) {
        if(verbose > 0) {
            cout << "No applicable unigoal method for goal " << goal_to_string(g) << endl;
        }

        string no_method_error = "No applicable unigoal method for goal [" + goal_to_string(g) + "]" + failures_to_string(resolution);

        throw PlanningError(NOAPPLICABLEMETHOD, no_method_error);
    } else {
        if(verbose > 1) {
            cout << "No applicable unigoal method for goal " << goal_to_string(g) << ", marking it as primitive" << endl;
        }

        solution_tree.mark_primitive(node_id);
    }

    return state;
}

/*
    Function: expand_multigoal
    Objective: Achieve a set of goals. Domain multigoal methods receive the whole multigoal and are tried
    first, the default method (one goal subtask per unsatisfied goal) comes last

    @ Input 1: The solution tree
    @ Input 2: The node id
    @ Input 3: The multigoal
    @ Input 4: The current planning-time state
    @ Output: The planning-time state, which is never changed here
*/
State NodeExpander::expand_multigoal(SolutionTree& solution_tree, int node_id, const Multigoal& mg, const State& state) {
    if(verbose > 1) {
        cout << "Expanding multigoal with " << mg.goals.size() << " goals" << endl;
    }

    if(multigoal_satisfied(state, mg)) {
        solution_tree.mark_completed(node_id);

        return state;
    }

    multigoal_method_list candidates = domain.multigoal_methods();
    candidates.push_back(make_pair(default_multigoal_method_label, multigoal_method_fn(default_multigoal_method)));

    MethodResolution resolution = resolver.resolve(candidates, solution_tree.get_node(node_id).blacklisted_methods, state, mg);

    if(resolution.type == COMPLETED) {
        solution_tree.mark_completed(node_id);
    } else if(resolution.type == DECOMPOSED) {
        string label = multigoal_method_label;
        if(resolution.method_id == default_multigoal_method_label) {
            label = default_multigoal_method_label;
        }

        solution_tree.insert_children(node_id, resolution.subtasks, label, state);
    } else {
        if(verbose > 1) {
            cout << "No applicable multigoal method, marking multigoal as primitive" << endl;
        }

        solution_tree.mark_primitive(node_id);
    }

    return state;
}

string NodeExpander::failures_to_string(const MethodResolution& resolution) const {
    string result;

    for(const pair<string,string>& failure : resolution.failures) {
        result += "\n    [" + failure.first + "]: " + failure.second;
    }

    return result;
}

bool multigoal_satisfied(const State& state, const Multigoal& mg) {
    for(const Goal& g : mg.goals) {
        if(!state.matches(g.predicate, g.subject, g.value)) {
            return false;
        }
    }

    return true;
}

method_result default_multigoal_method(const State& state, const Multigoal& mg) {
    vector<Todo> subtasks;

    for(const Goal& g : mg.goals) {
        if(!state.matches(g.predicate, g.subject, g.value)) {
            subtasks.push_back(g);
        }
    }

    return subtasks;
}
