#ifndef __PRIMITIVEEXECUTOR
#define __PRIMITIVEEXECUTOR

#include <set>
#include <string>
#include <vector>

#include "../state/state.hpp"
#include "../domain/domain.hpp"
#include "../utils/todo.hpp"
#include "../utils/planning_error.hpp"

/*
    Runs the single action registered for a task name against the planning-time state. Every
    failure is fatal and is raised as a PlanningError
*/
class PrimitiveExecutor {
    public:
        PrimitiveExecutor(const Domain& domain, int verbose);

        State execute(const std::string& action_name, const std::vector<fact_value>& args, const State& state, const std::set<std::string>& blacklisted_commands) const;

    private:
        const Domain& domain;
        int verbose;
};

#endif
