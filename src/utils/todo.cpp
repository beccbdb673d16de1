#include "todo.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "math_utils.hpp"

using namespace std;

todo_type get_todo_type(const Todo& t) {
    if(holds_alternative<RootTask>(t.content)) {
        return ROOTTODO;
    } else if(holds_alternative<Task>(t.content)) {
        return TASKTODO;
    } else if(holds_alternative<Goal>(t.content)) {
        return GOALTODO;
    } else if(holds_alternative<Multigoal>(t.content)) {
        return MULTIGOALTODO;
    }

    return PRIMITIVETODO;
}

bool fact_values_equal(const fact_value& v1, const fact_value& v2) {
    if(holds_alternative<string>(v1) || holds_alternative<string>(v2)) {
        if(holds_alternative<string>(v1) && holds_alternative<string>(v2)) {
            return std::get<string>(v1) == std::get<string>(v2);
        }

        return false;
    }

    if(holds_alternative<int>(v1) && holds_alternative<int>(v2)) {
        return std::get<int>(v1) == std::get<int>(v2);
    } else if(holds_alternative<float>(v1) && holds_alternative<float>(v2)) {
        return compare_floats(std::get<float>(v1), std::get<float>(v2));
    } else if(holds_alternative<int>(v1)) {
        return compare_int_and_float(std::get<int>(v1), std::get<float>(v2));
    }

    return compare_int_and_float(std::get<int>(v2), std::get<float>(v1));
}

bool goals_equal(const Goal& g1, const Goal& g2) {
    return g1.predicate == g2.predicate && g1.subject == g2.subject && fact_values_equal(g1.value, g2.value);
}

string fact_value_to_string(const fact_value& v) {
    if(holds_alternative<string>(v)) {
        return std::get<string>(v);
    } else if(holds_alternative<int>(v)) {
        return to_string(std::get<int>(v));
    }

    ostringstream ss;
    ss << std::get<float>(v);

    return ss.str();
}

string fact_value_type_name(const fact_value& v) {
    if(holds_alternative<string>(v)) {
        return "string";
    } else if(holds_alternative<int>(v)) {
        return "int";
    }

    return "float";
}

string args_to_string(const vector<fact_value>& args) {
    string result = "(";

    unsigned int index = 1;
    for(const fact_value& arg : args) {
        result += fact_value_to_string(arg);
        if(index < args.size()) {
            result += ",";
        }
        index++;
    }
    result += ")";

    return result;
}

string goal_to_string(const Goal& g) {
    return g.predicate + "(" + g.subject + ") = " + fact_value_to_string(g.value);
}

string todo_to_string(const Todo& t) {
    if(holds_alternative<RootTask>(t.content)) {
        const RootTask& r = std::get<RootTask>(t.content);

        return "root[" + to_string(r.todos.size()) + " todos]";
    } else if(holds_alternative<Task>(t.content)) {
        const Task& task = std::get<Task>(t.content);

        return task.name + args_to_string(task.args);
    } else if(holds_alternative<Goal>(t.content)) {
        return "goal " + goal_to_string(std::get<Goal>(t.content));
    } else if(holds_alternative<Multigoal>(t.content)) {
        const Multigoal& mg = std::get<Multigoal>(t.content);

        string result = "multigoal {";
        unsigned int index = 1;
        for(const Goal& g : mg.goals) {
            result += goal_to_string(g);
            if(index < mg.goals.size()) {
                result += "; ";
            }
            index++;
        }
        result += "}";

        return result;
    }

    const PrimitiveTask& p = std::get<PrimitiveTask>(t.content);

    return "!" + p.name + args_to_string(p.args);
}

/*
    Function: parse_fact_value
    Objective: Convert a textual value coming from a configuration file into a typed fact value

    @ Input 1: The value text
    @ Input 2: The declared type (int, float or string). An empty type means that the type is
    inferred, trying int first and float second
    @ Output: The typed fact value
*/
fact_value parse_fact_value(string text, string type) {
    std::transform(type.begin(),type.end(),type.begin(),::tolower);
    boost::trim(type);

    if(type == "string") {
        return text;
    } else if(type == "int") {
        try {
            return boost::lexical_cast<int>(boost::trim_copy(text));
        } catch(const boost::bad_lexical_cast& e) {
            string invalid_int_error = "Value [" + text + "] is not a valid int";

            throw std::runtime_error(invalid_int_error);
        }
    } else if(type == "float") {
        try {
            return boost::lexical_cast<float>(boost::trim_copy(text));
        } catch(const boost::bad_lexical_cast& e) {
            string invalid_float_error = "Value [" + text + "] is not a valid float";

            throw std::runtime_error(invalid_float_error);
        }
    } else if(type != "") {
        string unsupported_type_error = "Value type [" + type + "] is not supported";

        throw std::runtime_error(unsupported_type_error);
    }

    int int_value;
    if(boost::conversion::try_lexical_convert<int>(text, int_value)) {
        return int_value;
    }

    float float_value;
    if(boost::conversion::try_lexical_convert<float>(text, float_value)) {
        return float_value;
    }

    return text;
}
