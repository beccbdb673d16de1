#ifndef __SIMPLETRAVEL
#define __SIMPLETRAVEL

#include <string>
#include <memory>

#include "../domain/domain.hpp"
#include "../state/state.hpp"

const std::string simple_travel_domain_name = "simple_travel";

/*
    People move between locations by foot (distance up to 2) or by taxi, paying a fare of
    1.5 + 0.5 * distance

    Facts:
        - type(x): person, location or taxi
        - location(x): where a person or taxi is. A person inside a taxi is located at the taxi
        - cash(p), owe(p): money of a person and the pending taxi fare
        - distance(x-y): distance between two locations, declared in any direction
*/
std::shared_ptr<Domain> create_simple_travel_domain();

State simple_travel_initial_state();

float taxi_rate(float distance);

boost::optional<float> travel_distance(const State& state, const std::string& x, const std::string& y);

#endif
