#include "state.hpp"

#include <iostream>

using namespace std;

void State::set_fact(string subject, string predicate, fact_value value) {
    facts[make_pair(subject,predicate)] = value;
}

void State::remove_fact(const string& subject, const string& predicate) {
    facts.erase(make_pair(subject,predicate));
}

boost::optional<fact_value> State::get_fact(const string& subject, const string& predicate) const {
    map<pair<string,string>,fact_value>::const_iterator fact_it = facts.find(make_pair(subject,predicate));

    if(fact_it == facts.end()) {
        return boost::none;
    }

    return fact_it->second;
}

bool State::has_predicate(const string& subject, const string& predicate) const {
    return facts.find(make_pair(subject,predicate)) != facts.end();
}

/*
    Function: matches
    Objective: Check if predicate(subject) holds the given value. A missing fact never matches

    @ Input 1: The predicate
    @ Input 2: The subject
    @ Input 3: The expected value
    @ Output: A boolean indicating if the fact holds
*/
bool State::matches(const string& predicate, const string& subject, const fact_value& value) const {
    boost::optional<fact_value> current = get_fact(subject, predicate);

    if(!current) {
        return false;
    }

    return fact_values_equal(current.get(), value);
}

vector<string> State::get_subjects_with_fact(const string& predicate, const fact_value& value) const {
    vector<string> subjects;

    for(const auto& fact : facts) {
        if(fact.first.second == predicate && fact_values_equal(fact.second, value)) {
            subjects.push_back(fact.first.first);
        }
    }

    return subjects;
}

vector<string> State::get_subjects_with_predicate(const string& predicate) const {
    vector<string> subjects;

    for(const auto& fact : facts) {
        if(fact.first.second == predicate) {
            subjects.push_back(fact.first.first);
        }
    }

    return subjects;
}

vector<fact_triple> State::get_triples() const {
    vector<fact_triple> triples;

    for(const auto& fact : facts) {
        triples.push_back(make_tuple(fact.first.first, fact.first.second, fact.second));
    }

    return triples;
}

int State::size() const {
    return facts.size();
}

bool State::operator==(const State& other) const {
    if(facts.size() != other.facts.size()) {
        return false;
    }

    map<pair<string,string>,fact_value>::const_iterator it1 = facts.begin(), it2 = other.facts.begin();
    for(;it1 != facts.end();++it1, ++it2) {
        if(it1->first != it2->first || !fact_values_equal(it1->second, it2->second)) {
            return false;
        }
    }

    return true;
}

bool State::operator!=(const State& other) const {
    return !(*this == other);
}

void print_state(const State& state) {
    std::cout << "State [" << state.size() << " facts]" << std::endl;
    for(const fact_triple& fact : state.get_triples()) {
        std::cout << "    " << std::get<1>(fact) << "(" << std::get<0>(fact) << ") = " << fact_value_to_string(std::get<2>(fact)) << std::endl;
    }
}
