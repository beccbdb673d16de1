#include "outputgeneratorutils.hpp"

using namespace std;

string todo_type_name(todo_type t) {
    if(t == ROOTTODO) {
        return "root";
    } else if(t == TASKTODO) {
        return "task";
    } else if(t == GOALTODO) {
        return "goal";
    } else if(t == MULTIGOALTODO) {
        return "multigoal";
    }

    return "primitive";
}

/*
    Function: node_status_name
    Objective: Classify a node for output purposes

    @ Input: The solution tree node
    @ Output: One of open, decomposed, completed or action

    NOTE: A completed node is expanded without children and is not a primitive action
*/
string node_status_name(const SolutionNode& n) {
    if(!n.expanded) {
        return "open";
    }

    if(n.is_primitive) {
        todo_type t = get_todo_type(n.task);
        if(t == PRIMITIVETODO || t == TASKTODO) {
            return "action";
        }
    }

    if(n.children.size() > 0) {
        return "decomposed";
    }

    return "completed";
}

string todo_name(const Todo& t) {
    todo_type type = get_todo_type(t);

    if(type == TASKTODO) {
        return std::get<Task>(t.content).name;
    } else if(type == PRIMITIVETODO) {
        return std::get<PrimitiveTask>(t.content).name;
    } else if(type == GOALTODO) {
        return std::get<Goal>(t.content).predicate;
    } else if(type == MULTIGOALTODO) {
        return "multigoal";
    }

    return "root";
}

vector<string> todo_arguments(const Todo& t) {
    vector<string> arguments;

    todo_type type = get_todo_type(t);
    if(type == TASKTODO) {
        for(const fact_value& arg : std::get<Task>(t.content).args) {
            arguments.push_back(fact_value_to_string(arg));
        }
    } else if(type == PRIMITIVETODO) {
        for(const fact_value& arg : std::get<PrimitiveTask>(t.content).args) {
            arguments.push_back(fact_value_to_string(arg));
        }
    } else if(type == GOALTODO) {
        Goal g = std::get<Goal>(t.content);

        arguments.push_back(g.subject);
        arguments.push_back(fact_value_to_string(g.value));
    } else if(type == MULTIGOALTODO) {
        for(const Goal& g : std::get<Multigoal>(t.content).goals) {
            arguments.push_back(goal_to_string(g));
        }
    }

    return arguments;
}
