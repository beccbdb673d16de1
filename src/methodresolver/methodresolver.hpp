#ifndef __METHODRESOLVER
#define __METHODRESOLVER

#include <iostream>
#include <set>
#include <string>
#include <vector>
#include <variant>
#include <functional>
#include <exception>

#include "../state/state.hpp"
#include "../domain/domain.hpp"
#include "../utils/todo.hpp"

enum resolution_type {DECOMPOSED, COMPLETED, NOMETHOD};

struct MethodResolution {
    resolution_type type;
    std::string method_id;
    std::vector<Todo> subtasks;
    int candidates_tried;
    std::vector<std::pair<std::string,std::string>> failures;
};

/*
    Tries method candidates in the order they were declared, skipping blacklisted ones. A candidate
    that fails, either with a MethodFailure or with an exception, is discarded and the next one is
    tried. NOMETHOD is only returned when every candidate was discarded
*/
class MethodResolver {
    public:
        MethodResolver(int verbose);

        template<typename Input>
        MethodResolution resolve(const std::vector<std::pair<std::string,std::function<method_result(const State&, const Input&)>>>& candidates,
                                    const std::set<std::string>& blacklist, const State& state, const Input& input);

        int get_invocations() const;
        void reset_invocations();

    private:
        void log_failure(const std::string& method_id, const std::string& reason) const;

        int verbose;
        int invocations;
};

template<typename Input>
MethodResolution MethodResolver::resolve(const std::vector<std::pair<std::string,std::function<method_result(const State&, const Input&)>>>& candidates,
                                            const std::set<std::string>& blacklist, const State& state, const Input& input) {
    MethodResolution resolution;
    resolution.type = NOMETHOD;
    resolution.candidates_tried = 0;

    for(const auto& candidate : candidates) {
        if(blacklist.find(candidate.first) != blacklist.end()) {
            if(verbose > 2) {
                std::cout << "Skipping blacklisted method [" << candidate.first << "]" << std::endl;
            }

            continue;
        }

        if(verbose > 2) {
            std::cout << "Trying method [" << candidate.first << "]" << std::endl;
        }

        resolution.candidates_tried++;
        invocations++;

        method_result result;
        try {
            result = candidate.second(state, input);
        } catch(const std::exception& e) {
            std::string exception_reason = std::string("raised exception: ") + e.what();

            log_failure(candidate.first, exception_reason);
            resolution.failures.push_back(std::make_pair(candidate.first, exception_reason));

            continue;
        } catch(...) {
            std::string exception_reason = "raised unknown exception";

            log_failure(candidate.first, exception_reason);
            resolution.failures.push_back(std::make_pair(candidate.first, exception_reason));

            continue;
        }

        if(std::holds_alternative<MethodFailure>(result)) {
            std::string failure_reason = std::get<MethodFailure>(result).reason;

            log_failure(candidate.first, failure_reason);
            resolution.failures.push_back(std::make_pair(candidate.first, failure_reason));

            continue;
        }

        resolution.method_id = candidate.first;
        resolution.subtasks = std::get<std::vector<Todo>>(result);

        if(resolution.subtasks.empty()) {
            resolution.type = COMPLETED;
        } else {
            resolution.type = DECOMPOSED;
        }

        return resolution;
    }

    return resolution;
}

#endif
