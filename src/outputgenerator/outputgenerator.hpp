#ifndef __OUTPUTGENERATOR
#define __OUTPUTGENERATOR

#include <vector>
#include <map>
#include <string>
#include <memory>

#include <boost/property_tree/ptree.hpp>

#include "../planner/planner.hpp"
#include "../utils/outputgeneratorutils.hpp"

namespace pt = boost::property_tree;

class OutputGenerator {
    public:
        virtual ~OutputGenerator() {}

        virtual void generate_plan_output() = 0;

        void set_plan(std::shared_ptr<const Plan> p);
        void set_verbose(bool verb);
        void set_pretty_print(bool pretty);

    protected:
        bool verbose = false;
        bool pretty_print = false;
        std::shared_ptr<const Plan> plan;
};

enum file_output_generator_type {XMLFILEOUTGEN, JSONFILEOUTGEN};

class FileOutputGenerator : public OutputGenerator {
    public:
        void generate_plan_output();

        virtual void output_metadata(pt::ptree& output_file) = 0;
        virtual void output_actions(pt::ptree& output_file, std::vector<PrimitiveTask> actions) = 0;
        virtual void output_tree(pt::ptree& output_file, const SolutionTree& solution_tree) = 0;
        virtual void output_state(pt::ptree& output_file, const State& state) = 0;
        virtual void write_output_file(const pt::ptree& output_file) = 0;

        void set_file_output_generator_type(file_output_generator_type fogt);

        file_output_generator_type get_file_output_generator_type();

        void set_output(std::pair<std::string,std::string> out);

    protected:
        std::pair<std::string,std::string> output;

    private:
        file_output_generator_type fog_type;
};

#endif
