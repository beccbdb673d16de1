#ifndef __PLANNER
#define __PLANNER

#include <string>
#include <vector>

#include "../state/state.hpp"
#include "../domain/domain.hpp"
#include "../solutiontree/solutiontree.hpp"
#include "../nodeexpander/nodeexpander.hpp"
#include "../utils/todo.hpp"
#include "../utils/planning_error.hpp"

const int default_max_depth = 100;

struct PlannerOptions {
    int max_depth = default_max_depth;
    int verbose = 0;
    goal_failure_policy goal_policy = PERMISSIVEGOALS;
};

/*
    PLANBOUNDED means that max_depth expansions were made and the tree still has unexpanded nodes.
    It is not an error: the partial tree and state are returned
*/
enum plan_status {PLANCOMPLETE, PLANBOUNDED};

struct PlanMetadata {
    std::string created_at;
    std::string domain_name;
    const Domain* domain;
    State final_state;
    int planning_depth;
    int iterations;
};

struct Plan {
    plan_status status;
    SolutionTree solution_tree;
    State final_state;
    PlanMetadata metadata;
};

class Planner {
    public:
        Planner(const Domain& domain, PlannerOptions options);

        Plan plan(const State& initial_state, std::vector<Todo> todos);

        State expand_node(SolutionTree& solution_tree, int node_id, const State& state);

        int get_method_invocations() const;

    private:
        const Domain& domain;
        PlannerOptions options;
        NodeExpander expander;
};

std::string plan_status_name(plan_status status);

void print_plan(const Plan& p);

#endif
