#include "blocksworld.hpp"

#include "../utils/domain_utils.hpp"

using namespace std;

const string table = "table";
const string hand = "hand";
const string nothing = "nothing";

static bool is_clear(const State& state, const string& b) {
    return fact_is(state, b, "clear", "true");
}

static bool hand_empty(const State& state) {
    return fact_is(state, hand, "holding", nothing);
}

static action_result pickup(const State& state, const vector<fact_value>& args) {
    string b = string_arg(args, 0, "pickup");

    if(!fact_is(state, b, "pos", table) || !is_clear(state, b) || !hand_empty(state)) {
        return ActionFailure{"Cannot pick up " + b};
    }

    State new_state = state;
    new_state.set_fact(b, "pos", hand);
    new_state.set_fact(b, "clear", "false");
    new_state.set_fact(hand, "holding", b);

    return ActionSuccess{new_state};
}

static action_result unstack(const State& state, const vector<fact_value>& args) {
    string b = string_arg(args, 0, "unstack");
    string c = string_arg(args, 1, "unstack");

    if(c == table || !fact_is(state, b, "pos", c) || !is_clear(state, b) || !hand_empty(state)) {
        return ActionFailure{"Cannot unstack " + b + " from " + c};
    }

    State new_state = state;
    new_state.set_fact(b, "pos", hand);
    new_state.set_fact(b, "clear", "false");
    new_state.set_fact(hand, "holding", b);
    new_state.set_fact(c, "clear", "true");

    return ActionSuccess{new_state};
}

static action_result putdown(const State& state, const vector<fact_value>& args) {
    string b = string_arg(args, 0, "putdown");

    if(!fact_is(state, b, "pos", hand)) {
        return ActionFailure{b + " is not being held"};
    }

    State new_state = state;
    new_state.set_fact(b, "pos", table);
    new_state.set_fact(b, "clear", "true");
    new_state.set_fact(hand, "holding", nothing);

    return new_state;
}

static action_result stack_block(const State& state, const vector<fact_value>& args) {
    string b = string_arg(args, 0, "stack");
    string c = string_arg(args, 1, "stack");

    if(!fact_is(state, b, "pos", hand) || !is_clear(state, c)) {
        return ActionFailure{"Cannot stack " + b + " on " + c};
    }

    State new_state = state;
    new_state.set_fact(b, "pos", c);
    new_state.set_fact(b, "clear", "true");
    new_state.set_fact(hand, "holding", nothing);
    new_state.set_fact(c, "clear", "false");

    return new_state;
}

static method_result take(const State& state, const vector<fact_value>& args) {
    string b = string_arg(args, 0, "take");

    if(!is_clear(state, b) || !hand_empty(state)) {
        return MethodFailure{b + " cannot be taken"};
    }

    string pos = string_fact(state, b, "pos");
    if(pos == table) {
        return vector<Todo>{Task{"pickup", {b}}};
    }

    return vector<Todo>{Task{"unstack", {b, pos}}};
}

static method_result put(const State& state, const vector<fact_value>& args) {
    string b = string_arg(args, 0, "put");
    string c = string_arg(args, 1, "put");

    if(!fact_is(state, b, "pos", hand)) {
        return MethodFailure{b + " is not being held"};
    }

    if(c == table) {
        return vector<Todo>{Task{"putdown", {b}}};
    }

    return vector<Todo>{Task{"stack", {b, c}}};
}

static method_result move_one_block(const State& state, const vector<fact_value>& args) {
    string b = string_arg(args, 0, "move_one_block");
    string c = string_arg(args, 1, "move_one_block");

    if(!is_clear(state, b) || !hand_empty(state)) {
        return MethodFailure{b + " cannot be moved now"};
    }
    if(c != table && !is_clear(state, c)) {
        return MethodFailure{c + " is not clear"};
    }

    return vector<Todo>{Task{"take", {b}}, Task{"put", {b, c}}};
}

static boost::optional<string> goal_position(const string& block, const Multigoal& mg) {
    for(const Goal& g : mg.goals) {
        if(g.predicate == "pos" && g.subject == block && holds_alternative<string>(g.value)) {
            return std::get<string>(g.value);
        }
    }

    return boost::none;
}

static bool is_done(const State& state, const string& block, const Multigoal& mg) {
    if(block == table) {
        return true;
    }

    string pos = string_fact(state, block, "pos");

    boost::optional<string> goal = goal_position(block, mg);
    if(goal && goal.get() != pos) {
        return false;
    }
    if(pos == table) {
        return true;
    }
    if(pos == hand || pos == "") {
        return false;
    }

    return is_done(state, pos, mg);
}

/*
    Function: block_status
    Objective: Classify a block with respect to the multigoal

    @ Input 1: The current state
    @ Input 2: The block
    @ Input 3: The multigoal
    @ Output: One of done, inaccessible, move-to-table, move-to-block or waiting
*/
string block_status(const State& state, const string& block, const Multigoal& mg) {
    if(is_done(state, block, mg)) {
        return "done";
    } else if(!is_clear(state, block)) {
        return "inaccessible";
    }

    boost::optional<string> goal = goal_position(block, mg);
    if(!goal || goal.get() == table) {
        return "move-to-table";
    } else if(is_done(state, goal.get(), mg) && is_clear(state, goal.get())) {
        return "move-to-block";
    }

    return "waiting";
}

static method_result move_blocks(const State& state, const Multigoal& mg) {
    for(const Goal& g : mg.goals) {
        if(g.predicate != "pos") {
            return MethodFailure{"move_blocks only handles pos goals"};
        }
    }

    vector<string> blocks = state.get_subjects_with_predicate("pos");

    for(string b : blocks) {
        string status = block_status(state, b, mg);

        if(status == "move-to-table") {
            return vector<Todo>{Task{"take", {b}}, Task{"put", {b, table}}, mg};
        } else if(status == "move-to-block") {
            return vector<Todo>{Task{"take", {b}}, Task{"put", {b, goal_position(b, mg).get()}}, mg};
        }
    }

    for(string b : blocks) {
        if(block_status(state, b, mg) == "waiting") {
            return vector<Todo>{Task{"take", {b}}, Task{"put", {b, table}}, mg};
        }
    }

    return vector<Todo>();
}

shared_ptr<Domain> create_blocks_world_domain() {
    shared_ptr<Domain> domain = std::make_shared<Domain>(blocks_world_domain_name);

    domain->add_action("pickup", pickup);
    domain->add_action("unstack", unstack);
    domain->add_action("putdown", putdown);
    domain->add_action("stack", stack_block);

    domain->add_task_method("take", "take_block", take);
    domain->add_task_method("put", "put_block", put);

    domain->add_unigoal_method("pos", "move_one_block", move_one_block);

    domain->add_multigoal_method("move_blocks", move_blocks);

    return domain;
}

State blocks_world_initial_state() {
    State state;

    state.set_fact("a", "pos", table);
    state.set_fact("b", "pos", table);
    state.set_fact("c", "pos", "a");

    state.set_fact("a", "clear", "false");
    state.set_fact("b", "clear", "true");
    state.set_fact("c", "clear", "true");

    state.set_fact(hand, "holding", nothing);

    return state;
}
