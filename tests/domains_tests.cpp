/*
Domain registry and sample domain tests, planned end to end.
*/
#include <stdio.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_fixtures.hpp"
#include "../src/planner/planner.hpp"
#include "../src/domains/simpletravel.hpp"
#include "../src/domains/blocksworld.hpp"

static bool action_is(const PrimitiveTask& action, const std::string& name, const std::vector<std::string>& args)
{
    if(action.name != name || action.args.size() != args.size()) {
        return false;
    }

    for(unsigned int i = 0; i < args.size(); i++) {
        if(!fact_values_equal(action.args[i], fact_value(args[i]))) {
            return false;
        }
    }

    return true;
}

static int test_domain_registry()
{
    Domain domain("registry");
    domain.add_task_method("t", "m1", [](const State&, const std::vector<fact_value>&) -> method_result {
        return std::vector<Todo>();
    });
    domain.add_task_method("t", "m2", [](const State&, const std::vector<fact_value>&) -> method_result {
        return std::vector<Todo>();
    });
    domain.add_action("act", [](const State& state, const std::vector<fact_value>&) -> action_result {
        return state;
    });

    EXPECT(domain.get_name() == "registry", "domain name");
    EXPECT(domain.task_methods("t").size() == 2, "two methods");
    EXPECT(domain.task_methods("t")[0].first == "m1", "declaration order kept");
    EXPECT(domain.task_methods("unknown").empty(), "unknown task has no methods");
    EXPECT(domain.unigoal_methods("pos").empty(), "no unigoal methods");
    EXPECT(domain.multigoal_methods().empty(), "no multigoal methods");
    EXPECT(domain.has_action("act") && !domain.has_action("t"), "actions");
    EXPECT(domain.action("act") && !domain.action("missing"), "action lookup");
    EXPECT(domain.list_task_names().size() == 1, "task names");
    EXPECT(domain.list_actions().size() == 1, "action names");

    bool thrown = false;
    try {
        domain.add_task_method("t", "m1", [](const State&, const std::vector<fact_value>&) -> method_result {
            return std::vector<Todo>();
        });
    } catch(const std::runtime_error& e) {
        thrown = true;
    }
    EXPECT(thrown, "duplicate method refused");

    thrown = false;
    try {
        domain.add_action("act", [](const State& state, const std::vector<fact_value>&) -> action_result {
            return state;
        });
    } catch(const std::runtime_error& e) {
        thrown = true;
    }
    EXPECT(thrown, "duplicate action refused");
    return 0;
}

static int test_domain_factory()
{
    std::shared_ptr<Domain> travel = DomainFactory::create_domain(simple_travel_domain_name);
    EXPECT(travel->get_name() == simple_travel_domain_name, "simple travel domain");
    EXPECT(travel->unigoal_methods("location").size() == 2, "two travel methods");

    std::shared_ptr<Domain> blocks = DomainFactory::create_domain(blocks_world_domain_name);
    EXPECT(blocks->multigoal_methods().size() == 1, "blocks multigoal method");

    EXPECT(DomainFactory::create_initial_state(blocks_world_domain_name).matches("pos", "c", std::string("a")), "blocks initial state");

    bool thrown = false;
    try {
        DomainFactory::create_domain("logistics");
    } catch(const std::runtime_error& e) {
        thrown = true;
    }
    EXPECT(thrown, "unknown domain refused");
    return 0;
}

static int test_travel_by_taxi()
{
    std::shared_ptr<Domain> domain = create_simple_travel_domain();
    Planner planner(*domain, PlannerOptions());

    Plan p = planner.plan(simple_travel_initial_state(), {make_task("travel", {std::string("alice"), std::string("park")})});

    std::vector<PrimitiveTask> actions = p.solution_tree.extract_primitive_actions();
    EXPECT(p.status == PLANCOMPLETE, "complete");
    EXPECT(p.solution_tree.is_complete(), "tree complete");
    EXPECT(actions.size() == 3, "three taxi actions");
    EXPECT(action_is(actions[0], "call_taxi", {"alice", "home_a"}), "call taxi");
    EXPECT(action_is(actions[1], "ride_taxi", {"alice", "park"}), "ride taxi");
    EXPECT(action_is(actions[2], "pay_driver", {"alice", "park"}), "pay driver");

    EXPECT(p.final_state.matches("location", "alice", std::string("park")), "alice at the park");
    EXPECT(p.final_state.matches("cash", "alice", 14.5f), "fare paid");
    EXPECT(p.final_state.matches("location", "taxi1", std::string("park")), "taxi at the park");
    EXPECT(taxi_rate(8.0f) == 5.5f, "taxi rate");
    return 0;
}

static int test_travel_by_foot()
{
    std::shared_ptr<Domain> domain = create_simple_travel_domain();
    Planner planner(*domain, PlannerOptions());

    Plan p = planner.plan(simple_travel_initial_state(), {make_task("travel", {std::string("bob"), std::string("park")})});

    std::vector<PrimitiveTask> actions = p.solution_tree.extract_primitive_actions();
    EXPECT(actions.size() == 1, "one walk");
    EXPECT(action_is(actions[0], "walk", {"bob", "home_b", "park"}), "walk");
    EXPECT(p.final_state.matches("cash", "bob", 15.0f), "walking is free");

    boost::optional<float> dist = travel_distance(simple_travel_initial_state(), "park", "home_b");
    EXPECT(dist && dist.get() == 2.0f, "distance in both directions");
    return 0;
}

static int test_travel_goal_already_met()
{
    std::shared_ptr<Domain> domain = create_simple_travel_domain();
    Planner planner(*domain, PlannerOptions());

    Plan p = planner.plan(simple_travel_initial_state(), {make_goal("location", "alice", std::string("home_a"))});

    EXPECT(p.status == PLANCOMPLETE, "complete");
    EXPECT(p.solution_tree.extract_primitive_actions().empty(), "nothing to do");
    EXPECT(planner.get_method_invocations() == 0, "no methods tried");
    return 0;
}

static int test_sussman_anomaly()
{
    std::shared_ptr<Domain> domain = create_blocks_world_domain();
    Planner planner(*domain, PlannerOptions());

    Multigoal mg;
    mg.goals.push_back(make_goal("pos", "a", std::string("b")));
    mg.goals.push_back(make_goal("pos", "b", std::string("c")));

    State state0 = blocks_world_initial_state();
    EXPECT(block_status(state0, "c", mg) == "move-to-table", "c must go to the table");
    EXPECT(block_status(state0, "a", mg) == "inaccessible", "a is covered");
    EXPECT(block_status(state0, "b", mg) == "waiting", "b waits for c");

    Plan p = planner.plan(state0, {mg});

    std::vector<PrimitiveTask> actions = p.solution_tree.extract_primitive_actions();
    EXPECT(p.status == PLANCOMPLETE, "complete");
    EXPECT(actions.size() == 6, "six actions");
    EXPECT(action_is(actions[0], "unstack", {"c", "a"}), "unstack c");
    EXPECT(action_is(actions[1], "putdown", {"c"}), "putdown c");
    EXPECT(action_is(actions[2], "pickup", {"b"}), "pickup b");
    EXPECT(action_is(actions[3], "stack", {"b", "c"}), "stack b on c");
    EXPECT(action_is(actions[4], "pickup", {"a"}), "pickup a");
    EXPECT(action_is(actions[5], "stack", {"a", "b"}), "stack a on b");

    EXPECT(p.final_state.matches("pos", "a", std::string("b")), "a on b");
    EXPECT(p.final_state.matches("pos", "b", std::string("c")), "b on c");
    EXPECT(p.final_state.matches("pos", "c", std::string("table")), "c on the table");

    const SolutionNode& mg_node = p.solution_tree.get_node(p.solution_tree.get_node(p.solution_tree.get_root()).children.at(0));
    EXPECT(mg_node.method_tried && mg_node.method_tried.get() == multigoal_method_label, "domain multigoal method tagged");
    return 0;
}

static int test_blocks_unigoal()
{
    std::shared_ptr<Domain> domain = create_blocks_world_domain();
    Planner planner(*domain, PlannerOptions());

    Plan p = planner.plan(blocks_world_initial_state(), {make_goal("pos", "c", std::string("table"))});

    std::vector<PrimitiveTask> actions = p.solution_tree.extract_primitive_actions();
    EXPECT(actions.size() == 2, "two actions");
    EXPECT(action_is(actions[0], "unstack", {"c", "a"}), "unstack c");
    EXPECT(action_is(actions[1], "putdown", {"c"}), "putdown c");
    EXPECT(p.final_state.matches("clear", "a", std::string("true")), "a is clear");

    const SolutionNode& goal_node = p.solution_tree.get_node(p.solution_tree.get_node(p.solution_tree.get_root()).children.at(0));
    EXPECT(goal_node.method_tried && goal_node.method_tried.get() == unigoal_method_label, "goal decomposition tagged");
    return 0;
}

static int test_blocks_mixed_multigoal()
{
    std::shared_ptr<Domain> domain = create_blocks_world_domain();
    Planner planner(*domain, PlannerOptions());

    Multigoal mg;
    mg.goals.push_back(make_goal("pos", "c", std::string("table")));
    mg.goals.push_back(make_goal("clear", "a", std::string("true")));

    Plan p = planner.plan(blocks_world_initial_state(), {mg});

    const SolutionNode& mg_node = p.solution_tree.get_node(p.solution_tree.get_node(p.solution_tree.get_root()).children.at(0));
    EXPECT(mg_node.method_tried.get() == default_multigoal_method_label, "non pos goals fall back to the default method");
    EXPECT(p.final_state.matches("pos", "c", std::string("table")), "pos goal achieved");
    return 0;
}

int main(void)
{
    if (test_domain_registry() != 0) return 1;
    if (test_domain_factory() != 0) return 1;
    if (test_travel_by_taxi() != 0) return 1;
    if (test_travel_by_foot() != 0) return 1;
    if (test_travel_goal_already_met() != 0) return 1;
    if (test_sussman_anomaly() != 0) return 1;
    if (test_blocks_unigoal() != 0) return 1;
    if (test_blocks_mixed_multigoal() != 0) return 1;
    return 0;
}
