#include "dat_writer.h"

#include "Common/common.h"

#include <fstream>
#include <iomanip>
#include <iostream>

namespace rocketprops {
namespace IO {

void write_dat(const std::string& filename, const std::vector<std::vector<double>>& data,
    const std::vector<std::string>& var_names) {
  if (data.empty() || data.size() != var_names.size()) {
    throw RocketPropsError("write_dat: " + filename + ": need one name per column");
  }
  std::ofstream file(filename);
  if (!file) throw RocketPropsError("write_dat: cannot open " + filename);
  int N = data[0].size();
  int num_vars = data.size();

  // Write header
  for (int v = 0; v < num_vars; ++v) {
    file << var_names[v];
    if (v < num_vars - 1) file << "\t";
  }
  file << "\n";

  // Write data
  for (int i = 0; i < N; ++i) {
    for (int v = 0; v < num_vars; ++v) {
      file << std::setprecision(8) << data[v][i];
      if (v < num_vars - 1) file << "\t";
    }
    file << "\n";
  }

  file.close();
}

void write_saturation_table_dat(const std::string& filename, const SaturationTable& table) {
  std::vector<std::string> names;
  LOOP_i_N(table.columns.size()) {
    names.push_back(table.units[i].empty() ? table.columns[i] : table.columns[i] + "[" + table.units[i] + "]");
  }
  write_dat(filename, table.data, names);
  std::cout << "Wrote " << table.num_points() << " saturation points of " << table.name
            << " to " << filename << std::endl;
}

} // namespace IO
} // namespace rocketprops
