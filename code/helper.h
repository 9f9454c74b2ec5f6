/*
 * helper.h
 *
 * This file contains functions that can be used everywhere
 * in the program.
 * They might make things more easy.
 */

#ifndef __HELPER_H_
#define __HELPER_H_

#include <string>
#include <vector>


/*
 * Splits a string at every occurrence of the delimiter.
 * Empty fields are kept, i.e. "a,,b" results in {"a", "", "b"}.
 */
std::vector<std::string> split_string(const std::string& input, char delimiter);

/**
 * Removes leading and trailing white spaces (including '\r')
 */
std::string trim_string(const std::string& input);

/**
 * Parses a comma separated list of numbers, e.g. "0,500,1000".
 * Throws a std::invalid_argument if one element is not a number.
 */
std::vector<double> parse_double_list(const std::string& input);


#endif

