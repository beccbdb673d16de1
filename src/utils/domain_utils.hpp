#ifndef __DOMAIN_UTILS
#define __DOMAIN_UTILS

#include <string>
#include <vector>

#include "todo.hpp"
#include "../state/state.hpp"

std::string string_arg(const std::vector<fact_value>& args, unsigned int index, const std::string& owner);

std::string string_fact(const State& state, const std::string& subject, const std::string& predicate);
float numeric_fact(const State& state, const std::string& subject, const std::string& predicate);

bool fact_is(const State& state, const std::string& subject, const std::string& predicate, const std::string& value);

#endif
