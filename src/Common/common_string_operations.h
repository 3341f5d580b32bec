#ifndef ROCKETPROPS_COMMON_STRING_OPERATIONS_H
#define ROCKETPROPS_COMMON_STRING_OPERATIONS_H

#include <string>
#include <vector>


namespace rocketprops {
namespace common {

std::vector<double> Tokenize(const std::string& stringIn, const char *delimiters);
std::vector<std::string> splitString(const std::string& str, char delimiter = ',');

// \brief: strip leading/trailing white space
std::string trim(const std::string& str);
// \brief: upper case, with blanks, '-', '_' and '.' removed ("MON-3" -> "MON3")
std::string normalizeName(const std::string& str);
// \brief: remove every blank character
std::string removeBlanks(const std::string& str);

} // end namespace common
} // end namespace rocketprops

#endif // ROCKETPROPS_COMMON_STRING_OPERATIONS_H
