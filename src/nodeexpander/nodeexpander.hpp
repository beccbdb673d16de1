#ifndef __NODEEXPANDER
#define __NODEEXPANDER

#include <string>
#include <vector>

#include "../state/state.hpp"
#include "../domain/domain.hpp"
#include "../solutiontree/solutiontree.hpp"
#include "../methodresolver/methodresolver.hpp"
#include "../primitiveexecutor/primitiveexecutor.hpp"
#include "../utils/todo.hpp"
#include "../utils/planning_error.hpp"

/*
    What happens to a Goal node when no unigoal method applies:
        - PERMISSIVEGOALS: the node is marked primitive and planning goes on
        - STRICTGOALS: planning fails with NOAPPLICABLEMETHOD
*/
enum goal_failure_policy {PERMISSIVEGOALS, STRICTGOALS};

class NodeExpander {
    public:
        NodeExpander(const Domain& domain, goal_failure_policy policy, int verbose);

        State expand(SolutionTree& solution_tree, int node_id, const State& state);

        int get_method_invocations() const;

    private:
        State expand_root(SolutionTree& solution_tree, int node_id, const RootTask& r, const State& state);
        State expand_task(SolutionTree& solution_tree, int node_id, const Task& t, const State& state);
        State expand_goal(SolutionTree& solution_tree, int node_id, const Goal& g, const State& state);
        State expand_multigoal(SolutionTree& solution_tree, int node_id, const Multigoal& mg, const State& state);

        std::string failures_to_string(const MethodResolution& resolution) const;

        const Domain& domain;
        goal_failure_policy goal_policy;
        int verbose;
        MethodResolver resolver;
        PrimitiveExecutor executor;
};

bool multigoal_satisfied(const State& state, const Multigoal& mg);

method_result default_multigoal_method(const State& state, const Multigoal& mg);

#endif
