#include "primitiveexecutor.hpp"

#include <iostream>
#include <exception>

using namespace std;

PrimitiveExecutor::PrimitiveExecutor(const Domain& domain, int verbose) : domain(domain) {
    this->verbose = verbose;
}

/*
    Function: execute
    Objective: Execute an action during planning in order to discover its effects

    @ Input 1: The action name
    @ Input 2: The action arguments
    @ Input 3: The current planning-time state
    @ Input 4: The action names that are globally blacklisted in the solution tree
    @ Output: The state after the action

    NOTE: Both a bare State and an ActionSuccess are accepted as success
*/
State PrimitiveExecutor::execute(const string& action_name, const vector<fact_value>& args, const State& state, const set<string>& blacklisted_commands) const {
    string action_str = action_name + args_to_string(args);

    boost::optional<action_fn> action = domain.action(action_name);
    if(!action) {
        if(verbose > 1) {
            cout << "Action [" << action_name << "] not found in domain [" << domain.get_name() << "]" << endl;
        }

        string action_not_found_error = "Action [" + action_name + "] not found in domain [" + domain.get_name() + "]";

        throw PlanningError(ACTIONNOTFOUND, action_not_found_error);
    }

    if(blacklisted_commands.find(action_name) != blacklisted_commands.end()) {
        string blacklisted_action_error = "Action [" + action_str + "] failed: action is blacklisted";

        throw PlanningError(ACTIONFAILED, blacklisted_action_error);
    }

    if(verbose > 2) {
        cout << "Executing primitive action " << action_str << endl;
    }

    action_result result;
    try {
        result = action.get()(state, args);
    } catch(const std::exception& e) {
        if(verbose > 1) {
            cout << "Action " << action_str << " raised exception: " << e.what() << endl;
        }

        string action_exception_error = "Action [" + action_str + "] raised exception: " + e.what();

        throw PlanningError(ACTIONFAILED, action_exception_error);
    } catch(...) {
        string action_exception_error = "Action [" + action_str + "] raised unknown exception";

        throw PlanningError(ACTIONFAILED, action_exception_error);
    }

    if(holds_alternative<ActionFailure>(result)) {
        string reason = std::get<ActionFailure>(result).reason;

        if(verbose > 1) {
            cout << "Action " << action_str << " failed: " << reason << endl;
        }

        string action_failed_error = "Action [" + action_str + "] failed: " + reason;

        throw PlanningError(ACTIONFAILED, action_failed_error);
    } else if(holds_alternative<ActionSuccess>(result)) {
        return std::get<ActionSuccess>(result).state;
    } else if(holds_alternative<State>(result)) {
        return std::get<State>(result);
    }

    string unexpected_result_error = "Action [" + action_str + "] returned an unexpected result";

    throw PlanningError(ACTIONFAILED, unexpected_result_error);
}
