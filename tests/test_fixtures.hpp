#ifndef __TEST_FIXTURES
#define __TEST_FIXTURES

#include <stdio.h>

#include <memory>
#include <string>
#include <vector>

#include "../src/domain/domain.hpp"
#include "../src/state/state.hpp"
#include "../src/utils/todo.hpp"
#include "../src/utils/domain_utils.hpp"

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL: %s\n", msg); \
        return 1; \
    } \
} while (0)

/*
    Single action domain: move(from, to) needs location(from) = occupied and leaves
    location(from) = empty, location(to) = occupied
*/
inline std::shared_ptr<Domain> make_move_domain() {
    std::shared_ptr<Domain> domain = std::make_shared<Domain>("move_domain");

    domain->add_action("move", [](const State& state, const std::vector<fact_value>& args) -> action_result {
        std::string from = string_arg(args, 0, "move");
        std::string to = string_arg(args, 1, "move");

        if(!fact_is(state, from, "location", "occupied")) {
            return ActionFailure{from + " is not occupied"};
        }

        State new_state = state;
        new_state.set_fact(from, "location", std::string("empty"));
        new_state.set_fact(to, "location", std::string("occupied"));

        return ActionSuccess{new_state};
    });

    return domain;
}

inline State make_move_state() {
    State state;

    state.set_fact("a", "location", std::string("occupied"));
    state.set_fact("b", "location", std::string("empty"));
    state.set_fact("c", "location", std::string("empty"));

    return state;
}

inline Task make_task(std::string name, std::vector<fact_value> args) {
    Task t;
    t.name = name;
    t.args = args;

    return t;
}

inline Goal make_goal(std::string predicate, std::string subject, fact_value value) {
    Goal g;
    g.predicate = predicate;
    g.subject = subject;
    g.value = value;

    return g;
}

#endif
