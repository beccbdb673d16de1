#ifndef __PLANNING_ERROR
#define __PLANNING_ERROR

#include <string>
#include <stdexcept>

enum planning_error_type {NOAPPLICABLEMETHOD, ACTIONNOTFOUND, ACTIONFAILED, MALFORMEDTASK};

/*
    Fatal planning condition. Raising it aborts the whole plan() call
*/
class PlanningError : public std::runtime_error {
    public:
        PlanningError(planning_error_type type, const std::string& what_arg) : std::runtime_error(what_arg), error_type(type) {}

        planning_error_type get_error_type() const {
            return error_type;
        }

    private:
        planning_error_type error_type;
};

inline std::string planning_error_type_name(planning_error_type type) {
    switch(type) {
        case NOAPPLICABLEMETHOD:
            return "NoApplicableMethod";
        case ACTIONNOTFOUND:
            return "ActionNotFound";
        case ACTIONFAILED:
            return "ActionFailed";
        case MALFORMEDTASK:
            return "MalformedTask";
    }

    return "Unknown";
}

#endif
