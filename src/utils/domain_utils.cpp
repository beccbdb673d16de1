#include "domain_utils.hpp"

#include <stdexcept>

using namespace std;

string string_arg(const vector<fact_value>& args, unsigned int index, const string& owner) {
    if(index >= args.size()) {
        string missing_arg_error = "[" + owner + "] expects at least " + to_string(index+1) + " arguments, got " + to_string(args.size());

        throw std::runtime_error(missing_arg_error);
    }

    if(!holds_alternative<string>(args.at(index))) {
        string wrong_arg_type_error = "Argument " + to_string(index+1) + " of [" + owner + "] must be a string, got " + fact_value_type_name(args.at(index));

        throw std::runtime_error(wrong_arg_type_error);
    }

    return std::get<string>(args.at(index));
}

string string_fact(const State& state, const string& subject, const string& predicate) {
    boost::optional<fact_value> value = state.get_fact(subject, predicate);

    if(!value || !holds_alternative<string>(value.get())) {
        return "";
    }

    return std::get<string>(value.get());
}

float numeric_fact(const State& state, const string& subject, const string& predicate) {
    boost::optional<fact_value> value = state.get_fact(subject, predicate);

    if(!value) {
        string missing_fact_error = "Fact " + predicate + "(" + subject + ") is not defined";

        throw std::runtime_error(missing_fact_error);
    }

    if(holds_alternative<int>(value.get())) {
        return std::get<int>(value.get());
    } else if(holds_alternative<float>(value.get())) {
        return std::get<float>(value.get());
    }

    string non_numeric_fact_error = "Fact " + predicate + "(" + subject + ") is not numeric";

    throw std::runtime_error(non_numeric_fact_error);
}

bool fact_is(const State& state, const string& subject, const string& predicate, const string& value) {
    return state.matches(predicate, subject, value);
}
