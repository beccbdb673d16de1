#ifndef __TODO
#define __TODO

#include <string>
#include <vector>
#include <variant>

/*
    Fact values and task arguments. Numeric values are compared with an epsilon
    when an int meets a float (see fact_values_equal)
*/
typedef std::variant<std::string,int,float> fact_value;

struct Todo;

struct RootTask {
    std::vector<Todo> todos;
};

struct Task {
    std::string name;
    std::vector<fact_value> args;
};

struct Goal {
    std::string predicate;
    std::string subject;
    fact_value value;
};

struct Multigoal {
    std::vector<Goal> goals;
};

// Produced only by the planner, once a Task has been executed as an action
struct PrimitiveTask {
    std::string name;
    std::vector<fact_value> args;
};

enum todo_type {ROOTTODO, TASKTODO, GOALTODO, MULTIGOALTODO, PRIMITIVETODO};

struct Todo {
    Todo() : content(Task()) {}
    Todo(RootTask r) : content(r) {}
    Todo(Task t) : content(t) {}
    Todo(Goal g) : content(g) {}
    Todo(Multigoal mg) : content(mg) {}
    Todo(PrimitiveTask p) : content(p) {}

    std::variant<RootTask,Task,Goal,Multigoal,PrimitiveTask> content;
};

todo_type get_todo_type(const Todo& t);

bool fact_values_equal(const fact_value& v1, const fact_value& v2);
bool goals_equal(const Goal& g1, const Goal& g2);

std::string fact_value_to_string(const fact_value& v);
std::string fact_value_type_name(const fact_value& v);
std::string args_to_string(const std::vector<fact_value>& args);
std::string goal_to_string(const Goal& g);
std::string todo_to_string(const Todo& t);

fact_value parse_fact_value(std::string text, std::string type);

#endif
