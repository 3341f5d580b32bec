#ifndef ROCKETPROPS_INPUT_H
#define ROCKETPROPS_INPUT_H

#include <string>
#include <vector>
#include <toml++/toml.h>  // Ensure toml++ headers are in your include path

namespace rocketprops {
namespace IO {

// Parameter names are toml paths, "output.hdf5_file" reads hdf5_file of [output].
class Input {
  public:
    Input(); // empty configuration, every parameter takes its default
    Input(const std::string filename);
    static Input parse_string(const std::string& toml_text);

    const std::string& getFilename() const { return this->filename; }
    bool hasParam(const std::string& paramName) const;

    std::string getStringParam(const std::string& paramName) const;
    std::string getStringParam(const std::string& paramName, const std::string& defaultValue) const;

    std::vector<std::string> getStringArrayParam(const std::string& paramName) const;

    double getDoubleParam(const std::string& paramName) const;
    double getDoubleParam(const std::string& paramName, double defaultValue) const;

    int getIntParam(const std::string& paramName) const;
    int getIntParam(const std::string& paramName, int defaultValue) const;

    bool getBoolParam(const std::string& paramName, bool defaultValue) const;
  private:
    toml::table config;
    std::string filename;
};

} // namespace IO
} // namespace rocketprops

#endif // ROCKETPROPS_INPUT_H
