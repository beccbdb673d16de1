#ifndef __STATE
#define __STATE

#include <map>
#include <string>
#include <tuple>
#include <vector>

#include <boost/optional/optional.hpp>

#include "../utils/todo.hpp"

typedef std::tuple<std::string,std::string,fact_value> fact_triple;

/*
    Planning-time world state: a set of facts keyed by (subject, predicate)
*/
class State {
    public:
        void set_fact(std::string subject, std::string predicate, fact_value value);
        void remove_fact(const std::string& subject, const std::string& predicate);

        boost::optional<fact_value> get_fact(const std::string& subject, const std::string& predicate) const;

        bool has_predicate(const std::string& subject, const std::string& predicate) const;
        bool matches(const std::string& predicate, const std::string& subject, const fact_value& value) const;

        std::vector<std::string> get_subjects_with_fact(const std::string& predicate, const fact_value& value) const;
        std::vector<std::string> get_subjects_with_predicate(const std::string& predicate) const;
        std::vector<fact_triple> get_triples() const;

        int size() const;

        bool operator==(const State& other) const;
        bool operator!=(const State& other) const;

    private:
        std::map<std::pair<std::string,std::string>,fact_value> facts;
};

void print_state(const State& state);

#endif
