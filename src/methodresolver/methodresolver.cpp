#include "methodresolver.hpp"

using namespace std;

MethodResolver::MethodResolver(int verbose) {
    this->verbose = verbose;
    invocations = 0;
}

int MethodResolver::get_invocations() const {
    return invocations;
}

void MethodResolver::reset_invocations() {
    invocations = 0;
}

void MethodResolver::log_failure(const string& method_id, const string& reason) const {
    if(verbose > 2) {
        cout << "Method [" << method_id << "] failed: " << reason << endl;
    }
}
