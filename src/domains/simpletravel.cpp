#include "simpletravel.hpp"

#include "../utils/domain_utils.hpp"
#include "../utils/math_utils.hpp"

using namespace std;

const float max_walking_distance = 2.0f;

float taxi_rate(float distance) {
    return 1.5f + 0.5f * distance;
}

boost::optional<float> travel_distance(const State& state, const string& x, const string& y) {
    if(state.has_predicate(x + "-" + y, "distance")) {
        return numeric_fact(state, x + "-" + y, "distance");
    } else if(state.has_predicate(y + "-" + x, "distance")) {
        return numeric_fact(state, y + "-" + x, "distance");
    }

    return boost::none;
}

static bool is_a(const State& state, const string& x, const string& type) {
    return fact_is(state, x, "type", type);
}

static action_result walk(const State& state, const vector<fact_value>& args) {
    string p = string_arg(args, 0, "walk");
    string x = string_arg(args, 1, "walk");
    string y = string_arg(args, 2, "walk");

    if(!is_a(state, p, "person")) {
        return ActionFailure{p + " is not a person"};
    }
    if(!is_a(state, x, "location") || !is_a(state, y, "location")) {
        return ActionFailure{"walk needs two locations"};
    }
    if(x == y) {
        return ActionFailure{"Cannot walk from " + x + " to itself"};
    }
    if(!fact_is(state, p, "location", x)) {
        return ActionFailure{p + " is not at " + x};
    }

    State new_state = state;
    new_state.set_fact(p, "location", y);

    return ActionSuccess{new_state};
}

static action_result call_taxi(const State& state, const vector<fact_value>& args) {
    string p = string_arg(args, 0, "call_taxi");
    string x = string_arg(args, 1, "call_taxi");

    if(!is_a(state, p, "person")) {
        return ActionFailure{p + " is not a person"};
    }
    if(!is_a(state, x, "location")) {
        return ActionFailure{x + " is not a location"};
    }

    State new_state = state;
    new_state.set_fact("taxi1", "location", x);
    new_state.set_fact(p, "location", "taxi1");

    return ActionSuccess{new_state};
}

static action_result ride_taxi(const State& state, const vector<fact_value>& args) {
    string p = string_arg(args, 0, "ride_taxi");
    string y = string_arg(args, 1, "ride_taxi");

    if(!is_a(state, p, "person")) {
        return ActionFailure{p + " is not a person"};
    }
    if(!is_a(state, y, "location")) {
        return ActionFailure{y + " is not a location"};
    }

    string taxi = string_fact(state, p, "location");
    if(!is_a(state, taxi, "taxi")) {
        return ActionFailure{p + " is not in a taxi"};
    }

    string x = string_fact(state, taxi, "location");
    if(!is_a(state, x, "location")) {
        return ActionFailure{"Taxi is not at a valid location"};
    }
    if(x == y) {
        return ActionFailure{"Already at destination " + y};
    }

    boost::optional<float> dist = travel_distance(state, x, y);
    if(!dist) {
        return ActionFailure{"No route from " + x + " to " + y};
    }

    State new_state = state;
    new_state.set_fact(taxi, "location", y);
    new_state.set_fact(p, "owe", taxi_rate(dist.get()));

    return ActionSuccess{new_state};
}

static action_result pay_driver(const State& state, const vector<fact_value>& args) {
    string p = string_arg(args, 0, "pay_driver");
    string y = string_arg(args, 1, "pay_driver");

    if(!is_a(state, p, "person")) {
        return ActionFailure{p + " is not a person"};
    }

    float cash = numeric_fact(state, p, "cash");
    float owe = numeric_fact(state, p, "owe");
    if(greater_than_floats(owe, cash)) {
        return ActionFailure{p + " does not have enough cash"};
    }

    State new_state = state;
    new_state.set_fact(p, "cash", cash - owe);
    new_state.set_fact(p, "owe", 0.0f);
    new_state.set_fact(p, "location", y);

    return ActionSuccess{new_state};
}

static method_result travel_by_foot(const State& state, const vector<fact_value>& args) {
    string p = string_arg(args, 0, "travel_by_foot");
    string y = string_arg(args, 1, "travel_by_foot");

    if(!is_a(state, p, "person") || !is_a(state, y, "location")) {
        return MethodFailure{"travel_by_foot needs a person and a location"};
    }

    string x = string_fact(state, p, "location");
    if(x == y) {
        return MethodFailure{p + " is already at " + y};
    }

    boost::optional<float> dist = travel_distance(state, x, y);
    if(!dist || greater_than_floats(dist.get(), max_walking_distance)) {
        return MethodFailure{"Distance too far for walking"};
    }

    return vector<Todo>{Task{"walk", {p, x, y}}};
}

static method_result travel_by_taxi(const State& state, const vector<fact_value>& args) {
    string p = string_arg(args, 0, "travel_by_taxi");
    string y = string_arg(args, 1, "travel_by_taxi");

    if(!is_a(state, p, "person") || !is_a(state, y, "location")) {
        return MethodFailure{"travel_by_taxi needs a person and a location"};
    }

    string x = string_fact(state, p, "location");
    if(x == y) {
        return MethodFailure{p + " is already at " + y};
    }

    boost::optional<float> dist = travel_distance(state, x, y);
    if(!dist) {
        return MethodFailure{"No route from " + x + " to " + y};
    }

    if(greater_than_floats(taxi_rate(dist.get()), numeric_fact(state, p, "cash"))) {
        return MethodFailure{"Not enough cash for taxi"};
    }

    return vector<Todo>{Task{"call_taxi", {p, x}}, Task{"ride_taxi", {p, y}}, Task{"pay_driver", {p, y}}};
}

static method_result travel(const State& state, const vector<fact_value>& args) {
    string p = string_arg(args, 0, "travel");
    string y = string_arg(args, 1, "travel");

    return vector<Todo>{Goal{"location", p, y}};
}

shared_ptr<Domain> create_simple_travel_domain() {
    shared_ptr<Domain> domain = std::make_shared<Domain>(simple_travel_domain_name);

    domain->add_action("walk", walk);
    domain->add_action("call_taxi", call_taxi);
    domain->add_action("ride_taxi", ride_taxi);
    domain->add_action("pay_driver", pay_driver);

    domain->add_unigoal_method("location", "travel_by_foot", travel_by_foot);
    domain->add_unigoal_method("location", "travel_by_taxi", travel_by_taxi);

    domain->add_task_method("travel", "travel_to_location", travel);

    return domain;
}

State simple_travel_initial_state() {
    State state;

    state.set_fact("alice", "type", "person");
    state.set_fact("bob", "type", "person");
    state.set_fact("taxi1", "type", "taxi");

    vector<string> locations = {"home_a", "home_b", "park", "taxi_lot"};
    for(string l : locations) {
        state.set_fact(l, "type", "location");
    }

    state.set_fact("alice", "location", "home_a");
    state.set_fact("bob", "location", "home_b");
    state.set_fact("taxi1", "location", "taxi_lot");

    state.set_fact("alice", "cash", 20.0f);
    state.set_fact("bob", "cash", 15.0f);
    state.set_fact("alice", "owe", 0.0f);
    state.set_fact("bob", "owe", 0.0f);

    state.set_fact("home_a-park", "distance", 8.0f);
    state.set_fact("home_b-park", "distance", 2.0f);
    state.set_fact("home_a-home_b", "distance", 6.0f);
    state.set_fact("taxi_lot-home_a", "distance", 3.0f);
    state.set_fact("taxi_lot-home_b", "distance", 4.0f);
    state.set_fact("taxi_lot-park", "distance", 5.0f);

    return state;
}
