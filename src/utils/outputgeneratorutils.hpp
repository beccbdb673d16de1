#ifndef __OUTPUT_GENERATOR_UTILS
#define __OUTPUT_GENERATOR_UTILS

#include <string>
#include <vector>

#include "todo.hpp"
#include "../solutiontree/solutiontree.hpp"

std::string todo_type_name(todo_type t);
std::string node_status_name(const SolutionNode& n);

std::vector<std::string> todo_arguments(const Todo& t);
std::string todo_name(const Todo& t);

#endif
