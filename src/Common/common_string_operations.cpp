#include "common_string_operations.h"

#include <cctype>
#include <cstdlib> // for strtod
#include <stdexcept>
#include <sstream> // for istringstream

namespace rocketprops {
namespace common {

std::vector<double> Tokenize(const std::string& stringIn,
    const char *delimiters) {
  std::vector<double> outputVector;

  // Tokenize string read from file (spaces, commas or new lines are allowed)
  std::string::size_type start = stringIn.find_first_not_of(delimiters);
  while (start != std::string::npos) {
    std::string::size_type end = stringIn.find_first_of(delimiters, start);
    const std::string token = stringIn.substr(start, end == std::string::npos ? std::string::npos : end - start);
    char* parse_end = nullptr;
    const double value = std::strtod(token.c_str(), &parse_end);
    if (parse_end == token.c_str() || *parse_end != '\0') {
      throw std::invalid_argument("common::Tokenize: '" + token + "' is not a number");
    }
    outputVector.push_back(value);
    start = stringIn.find_first_not_of(delimiters, end);
  }

  return outputVector;
} // end Tokenize

std::vector<std::string> splitString(const std::string& str, char delimiter) {
  std::vector<std::string> tokens;
  std::string token;
  std::istringstream tokenStream(str);
  while (std::getline(tokenStream, token, delimiter)) {
    tokens.push_back(token);
  }
  return tokens;
} // end splitString

std::string trim(const std::string& str) {
  const char* ws = " \t\n\r";
  std::string::size_type first = str.find_first_not_of(ws);
  if (first == std::string::npos) return "";
  std::string::size_type last = str.find_last_not_of(ws);
  return str.substr(first, last - first + 1);
} // end trim

std::string normalizeName(const std::string& str) {
  std::string out;
  out.reserve(str.size());
  for (char c : str) {
    if (std::isspace(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.') continue;
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return out;
} // end normalizeName

std::string removeBlanks(const std::string& str) {
  std::string out;
  out.reserve(str.size());
  for (char c : str) {
    if (!std::isspace(static_cast<unsigned char>(c))) out.push_back(c);
  }
  return out;
} // end removeBlanks

} // end namespace common
} // end namespace rocketprops
