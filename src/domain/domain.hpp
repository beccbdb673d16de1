#ifndef __DOMAIN_REGISTRY
#define __DOMAIN_REGISTRY

#include <map>
#include <set>
#include <string>
#include <vector>
#include <variant>
#include <functional>
#include <memory>

#include <boost/optional/optional.hpp>

#include "../state/state.hpp"
#include "../utils/todo.hpp"

struct MethodFailure {
    std::string reason;
};

/*
    An empty subtask list means that the method considers its task done. MethodFailure means
    that the method is not applicable and the next candidate must be tried
*/
typedef std::variant<std::vector<Todo>,MethodFailure> method_result;

typedef std::function<method_result(const State&, const std::vector<fact_value>&)> method_fn;
typedef std::function<method_result(const State&, const Multigoal&)> multigoal_method_fn;

struct ActionSuccess {
    State state;
};

struct ActionFailure {
    std::string reason;
};

typedef std::variant<State,ActionSuccess,ActionFailure> action_result;

typedef std::function<action_result(const State&, const std::vector<fact_value>&)> action_fn;

typedef std::vector<std::pair<std::string,method_fn>> method_list;
typedef std::vector<std::pair<std::string,multigoal_method_fn>> multigoal_method_list;

class Domain {
    public:
        Domain(std::string name);

        void add_task_method(std::string task_name, std::string method_id, method_fn method);
        void add_unigoal_method(std::string predicate, std::string method_id, method_fn method);
        void add_multigoal_method(std::string method_id, multigoal_method_fn method);
        void add_action(std::string action_name, action_fn action);

        method_list task_methods(const std::string& task_name) const;
        method_list unigoal_methods(const std::string& predicate) const;
        multigoal_method_list multigoal_methods() const;
        boost::optional<action_fn> action(const std::string& action_name) const;

        bool has_action(const std::string& action_name) const;

        std::vector<std::string> list_task_names() const;
        std::vector<std::string> list_unigoal_predicates() const;
        std::vector<std::string> list_actions() const;

        std::string get_name() const;

    private:
        std::string name;
        std::map<std::string,method_list> methods;
        std::map<std::string,method_list> unigoal_method_map;
        multigoal_method_list multigoal_method_vector;
        std::map<std::string,action_fn> actions;
};

class DomainFactory {
    public:
        static std::shared_ptr<Domain> create_domain(std::string domain_name);
        static State create_initial_state(std::string domain_name);
};

#endif
