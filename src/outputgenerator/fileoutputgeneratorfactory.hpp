#ifndef __FILEOUTPUTGENERATORFACTORY
#define __FILEOUTPUTGENERATORFACTORY

#include <memory>
#include <string>

#include "xmloutputgenerator.hpp"
#include "jsonoutputgenerator.hpp"
#include "outputgenerator.hpp"

class FileOutputGeneratorFactory {
    public:
        std::shared_ptr<FileOutputGenerator> create_file_output_generator(std::shared_ptr<const Plan> plan, std::pair<std::string,std::string> output, bool verbose, bool pretty_print);
};

#endif
