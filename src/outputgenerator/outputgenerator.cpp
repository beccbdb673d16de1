#include "outputgenerator.hpp"

#include <iostream>
#include <stdexcept>

using namespace std;

void OutputGenerator::set_plan(shared_ptr<const Plan> p) {
    plan = p;
}

void OutputGenerator::set_verbose(bool verb) {
    verbose = verb;
}

void OutputGenerator::set_pretty_print(bool pretty) {
    pretty_print = pretty;
}

/*
    Function: generate_plan_output
    Objective: Generate the output file with the plan status, its metadata, the ordered actions, the
    solution tree nodes and the final planning-time state

    @ Output: Void. The output file is generated in the given path
*/
void FileOutputGenerator::generate_plan_output() {
    if(!plan) {
        throw std::runtime_error("Cannot generate output without a plan");
    }

    pt::ptree output_file;

    output_metadata(output_file);
    output_actions(output_file, plan->solution_tree.extract_primitive_actions());
    output_tree(output_file, plan->solution_tree);
    output_state(output_file, plan->final_state);

    write_output_file(output_file);

    if(verbose) {
        cout << "Plan output written to [" << output.first << "]" << endl;
    }
}

void FileOutputGenerator::set_file_output_generator_type(file_output_generator_type fogt) {
    fog_type = fogt;
}

file_output_generator_type FileOutputGenerator::get_file_output_generator_type() {
    return fog_type;
}

void FileOutputGenerator::set_output(pair<string,string> out) {
    output = out;
}
