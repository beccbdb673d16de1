#include "fileoutputgeneratorfactory.hpp"

#include <stdexcept>

using namespace std;

shared_ptr<FileOutputGenerator> FileOutputGeneratorFactory::create_file_output_generator(shared_ptr<const Plan> plan, pair<string,string> output, bool verbose, bool pretty_print) {
    shared_ptr<FileOutputGenerator> file_output_gen;

    if(output.second == "XML") {
        file_output_gen = std::make_shared<XMLOutputGenerator>();
        file_output_gen->set_file_output_generator_type(XMLFILEOUTGEN);
    } else if(output.second == "JSON") {
        file_output_gen = std::make_shared<JSONOutputGenerator>();
        file_output_gen->set_file_output_generator_type(JSONFILEOUTGEN);
    } else {
        string unsupported_file_type_error = "File type [" + output.second + "] is not supported";

        throw std::runtime_error(unsupported_file_type_error);
    }

    file_output_gen->set_plan(plan);
    file_output_gen->set_output(output);
    file_output_gen->set_verbose(verbose);
    file_output_gen->set_pretty_print(pretty_print);

    return file_output_gen;
}
