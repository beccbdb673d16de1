#ifndef __XMLOUTPUTGENERATOR
#define __XMLOUTPUTGENERATOR

#include <vector>
#include <string>

#include "outputgenerator.hpp"

class XMLOutputGenerator : public FileOutputGenerator {
    public:
        void output_metadata(pt::ptree& output_file);
        void output_actions(pt::ptree& output_file, std::vector<PrimitiveTask> actions);
        void output_tree(pt::ptree& output_file, const SolutionTree& solution_tree);
        void output_state(pt::ptree& output_file, const State& state);
        void write_output_file(const pt::ptree& output_file);
};

#endif
