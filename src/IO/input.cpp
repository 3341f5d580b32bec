#include "input.h"

#include "Common/errors.h"

#include <vector>
#include <string>
#include <iostream>
#include <sstream>

namespace rocketprops {
namespace IO {

Input::Input() : filename("<defaults>") {}

Input::Input(const std::string filename) : filename(filename) {
  try {
    this->config = toml::parse_file(filename); // create the toml table
  } catch (const toml::parse_error& e) {
    std::ostringstream msg;
    msg << "Input: cannot parse " << filename << ": " << e.description()
        << " (line " << e.source().begin.line << ")";
    throw DataError(msg.str());
  }
}

Input Input::parse_string(const std::string& toml_text) {
  Input input;
  input.filename = "<string>";
  try {
    input.config = toml::parse(toml_text);
  } catch (const toml::parse_error& e) {
    std::ostringstream msg;
    msg << "Input: cannot parse configuration: " << e.description()
        << " (line " << e.source().begin.line << ")";
    throw DataError(msg.str());
  }
  return input;
}

bool Input::hasParam(const std::string& param_name) const {
  return static_cast<bool>(this->config.at_path(param_name));
}

std::vector<std::string> Input::getStringArrayParam(const std::string& param_name) const {
  std::vector<std::string> result;
  if (!this->hasParam(param_name)) return result;

  auto arr = this->config.at_path(param_name).as_array();
  if (arr) {
    for (const auto& item : *arr) {
      if (item.is_string()) {
        result.push_back(item.value_or(std::string()));
      } else {
        std::cerr << "Warning: Non-string item found in array for parameter '" << param_name << "'" << std::endl;
      }
    }
  } else {
    std::cerr << "Warning: Parameter '" << param_name << "' is not an array." << std::endl;
  }
  return result;
}

std::string Input::getStringParam(const std::string& param_name) const {
  auto node = this->config.at_path(param_name);
  if (node && !node.is_string()) {
    std::cerr << "Warning: Parameter '" << param_name << "' is not a string." << std::endl;
  }
  return node.value_or(std::string());
}

std::string Input::getStringParam(const std::string& param_name, const std::string& default_value) const {
  return this->config.at_path(param_name).value_or(default_value);
}

double Input::getDoubleParam(const std::string& param_name) const {
  auto node = this->config.at_path(param_name);
  if (node && !node.is_number()) {
    std::cerr << "Warning: Parameter '" << param_name << "' is not a number." << std::endl;
  }
  return node.value_or(0.0);
}

double Input::getDoubleParam(const std::string& param_name, double default_value) const {
  return this->config.at_path(param_name).value_or(default_value);
}

int Input::getIntParam(const std::string& param_name) const {
  auto node = this->config.at_path(param_name);
  if (node && !node.is_integer()) {
    std::cerr << "Warning: Parameter '" << param_name << "' is not an integer." << std::endl;
  }
  return node.value_or(0);
}

int Input::getIntParam(const std::string& param_name, int default_value) const {
  return this->config.at_path(param_name).value_or(default_value);
}

bool Input::getBoolParam(const std::string& param_name, bool default_value) const {
  return this->config.at_path(param_name).value_or(default_value);
}

} // namespace IO
} // namespace rocketprops
