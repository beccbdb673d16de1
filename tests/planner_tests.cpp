/*
Planner driver tests: end to end planning, depth bound and result metadata.
*/
#include <stdio.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "test_fixtures.hpp"
#include "../src/planner/planner.hpp"

static PlannerOptions options_with_depth(int max_depth)
{
    PlannerOptions options;
    options.max_depth = max_depth;

    return options;
}

static int test_single_move()
{
    std::shared_ptr<Domain> domain = make_move_domain();
    Planner planner(*domain, PlannerOptions());

    State state0 = make_move_state();
    Plan p = planner.plan(state0, {make_task("move", {std::string("a"), std::string("b")})});

    EXPECT(p.status == PLANCOMPLETE, "plan complete");
    EXPECT(p.solution_tree.is_complete(), "tree complete");

    std::vector<PrimitiveTask> actions = p.solution_tree.extract_primitive_actions();
    EXPECT(actions.size() == 1, "one action");
    EXPECT(actions[0].name == "move", "move action");
    EXPECT(actions[0].args.size() == 2, "two arguments");
    EXPECT(std::get<std::string>(actions[0].args[0]) == "a" && std::get<std::string>(actions[0].args[1]) == "b", "move arguments");

    EXPECT(p.final_state.matches("location", "a", std::string("empty")), "a is empty");
    EXPECT(p.final_state.matches("location", "b", std::string("occupied")), "b is occupied");
    EXPECT(state0.matches("location", "a", std::string("occupied")), "initial state untouched");
    return 0;
}

static int test_two_moves_in_order()
{
    std::shared_ptr<Domain> domain = make_move_domain();
    Planner planner(*domain, PlannerOptions());

    std::vector<Todo> todos = {make_task("move", {std::string("a"), std::string("b")}), make_task("move", {std::string("b"), std::string("c")})};
    Plan p = planner.plan(make_move_state(), todos);

    const SolutionNode& root = p.solution_tree.get_node(p.solution_tree.get_root());
    EXPECT(root.children.size() == 2, "two root children");

    std::vector<PrimitiveTask> actions = p.solution_tree.extract_primitive_actions();
    EXPECT(actions.size() == 2, "two actions");
    EXPECT(std::get<std::string>(actions[0].args[0]) == "a" && std::get<std::string>(actions[0].args[1]) == "b", "first move");
    EXPECT(std::get<std::string>(actions[1].args[0]) == "b" && std::get<std::string>(actions[1].args[1]) == "c", "second move");
    EXPECT(p.final_state.matches("location", "c", std::string("occupied")), "c is occupied");
    EXPECT(p.metadata.iterations == 3, "root and two tasks expanded");
    return 0;
}

static int test_nested_tasks_thread_state()
{
    std::shared_ptr<Domain> domain = make_move_domain();
    domain->add_task_method("relay", "relay_through", [](const State&, const std::vector<fact_value>& args) -> method_result {
        std::string from = string_arg(args, 0, "relay");
        std::string via = string_arg(args, 1, "relay");
        std::string to = string_arg(args, 2, "relay");

        return std::vector<Todo>{make_task("move", {from, via}), make_task("move", {via, to})};
    });

    Planner planner(*domain, PlannerOptions());
    std::vector<Todo> todos = {make_task("relay", {std::string("a"), std::string("b"), std::string("c")}), make_task("move", {std::string("c"), std::string("a")})};
    Plan p = planner.plan(make_move_state(), todos);

    std::vector<PrimitiveTask> actions = p.solution_tree.extract_primitive_actions();
    EXPECT(actions.size() == 3, "three actions");
    EXPECT(std::get<std::string>(actions[2].args[0]) == "c", "sibling after the decomposed subtree");
    EXPECT(p.final_state.matches("location", "a", std::string("occupied")), "state threaded through the subtree");
    return 0;
}

static int test_max_depth_zero()
{
    std::shared_ptr<Domain> domain = make_move_domain();
    Planner planner(*domain, options_with_depth(0));

    State state0 = make_move_state();
    Plan p = planner.plan(state0, {make_task("move", {std::string("a"), std::string("b")})});

    EXPECT(p.status == PLANBOUNDED, "bounded, not an error");
    EXPECT(p.solution_tree.size() == 1, "tree unchanged");
    EXPECT(!p.solution_tree.get_node(p.solution_tree.get_root()).expanded, "root unexpanded");
    EXPECT(p.final_state == state0, "initial state returned");
    EXPECT(p.metadata.iterations == 0, "no iterations");
    EXPECT(p.metadata.planning_depth == 0, "depth recorded");
    return 0;
}

static int test_partial_depth()
{
    std::shared_ptr<Domain> domain = make_move_domain();
    Planner planner(*domain, options_with_depth(2));

    std::vector<Todo> todos = {make_task("move", {std::string("a"), std::string("b")}), make_task("move", {std::string("b"), std::string("c")})};
    Plan p = planner.plan(make_move_state(), todos);

    EXPECT(p.status == PLANBOUNDED, "bounded");
    EXPECT(p.solution_tree.extract_primitive_actions().size() == 1, "only the first move");
    EXPECT(p.final_state.matches("location", "b", std::string("occupied")), "partial state");
    EXPECT(!p.solution_tree.is_complete(), "tree not complete");
    return 0;
}

static int test_empty_todo_list()
{
    std::shared_ptr<Domain> domain = make_move_domain();
    Planner planner(*domain, PlannerOptions());

    Plan p = planner.plan(make_move_state(), std::vector<Todo>());

    EXPECT(p.status == PLANCOMPLETE, "nothing to do");
    EXPECT(p.solution_tree.extract_primitive_actions().empty(), "no actions");
    EXPECT(p.solution_tree.is_complete(), "root only tree is complete");
    return 0;
}

static int test_fatal_error_propagates()
{
    std::shared_ptr<Domain> domain = make_move_domain();
    Planner planner(*domain, PlannerOptions());

    bool thrown = false;
    try {
        planner.plan(make_move_state(), {make_task("move", {std::string("b"), std::string("c")})});
    } catch(const PlanningError& e) {
        thrown = e.get_error_type() == ACTIONFAILED;
    }
    EXPECT(thrown, "action failure aborts planning");
    return 0;
}

static int test_metadata()
{
    std::shared_ptr<Domain> domain = make_move_domain();
    Planner planner(*domain, PlannerOptions());

    Plan p = planner.plan(make_move_state(), {make_task("move", {std::string("a"), std::string("b")})});

    EXPECT(p.metadata.domain_name == "move_domain", "domain name");
    EXPECT(p.metadata.domain == domain.get(), "domain reference");
    EXPECT(p.metadata.planning_depth == default_max_depth, "default depth");
    EXPECT(p.metadata.final_state == p.final_state, "final state in metadata");
    EXPECT(p.metadata.created_at.size() == 20 && p.metadata.created_at[10] == 'T' && p.metadata.created_at.back() == 'Z', "ISO 8601 UTC timestamp");
    EXPECT(plan_status_name(p.status) == "complete", "status name");
    EXPECT(plan_status_name(PLANBOUNDED) == "bounded", "bounded name");
    return 0;
}

static int test_expand_node_resubmission()
{
    std::shared_ptr<Domain> domain = make_move_domain();
    domain->add_task_method("go", "go_direct", [](const State&, const std::vector<fact_value>&) -> method_result {
        return std::vector<Todo>{make_task("move", {std::string("a"), std::string("c")})};
    });
    domain->add_task_method("go", "go_relay", [](const State&, const std::vector<fact_value>&) -> method_result {
        return std::vector<Todo>{make_task("move", {std::string("a"), std::string("b")}), make_task("move", {std::string("b"), std::string("c")})};
    });

    Planner planner(*domain, PlannerOptions());

    State state = make_move_state();
    SolutionTree tree({make_task("go", {})}, state);

    state = planner.expand_node(tree, tree.get_root(), state);
    int go_id = tree.get_node(tree.get_root()).children.at(0);

    tree.blacklist_method(go_id, "go_direct");
    state = planner.expand_node(tree, go_id, state);

    EXPECT(tree.get_node(go_id).children.size() == 2, "relay method chosen");
    EXPECT(planner.get_method_invocations() == 1, "blacklisted method never invoked");

    bool thrown = false;
    try {
        planner.expand_node(tree, go_id, state);
    } catch(const PlanningError& e) {
        thrown = (e.get_error_type() == MALFORMEDTASK);
    }
    EXPECT(thrown, "expanded node cannot be submitted again");
    EXPECT(tree.get_node(go_id).children.size() == 2, "tree untouched by rejected expansion");
    return 0;
}

int main(void)
{
    if (test_single_move() != 0) return 1;
    if (test_two_moves_in_order() != 0) return 1;
    if (test_nested_tasks_thread_state() != 0) return 1;
    if (test_max_depth_zero() != 0) return 1;
    if (test_partial_depth() != 0) return 1;
    if (test_empty_todo_list() != 0) return 1;
    if (test_fatal_error_propagates() != 0) return 1;
    if (test_metadata() != 0) return 1;
    if (test_expand_node_resubmission() != 0) return 1;
    return 0;
}
