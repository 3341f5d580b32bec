#ifndef ROCKETPROPS_DAT_WRITER_H
#define ROCKETPROPS_DAT_WRITER_H

#include "Physics/saturation_table.h"

#include <string>
#include <vector>

namespace rocketprops {
namespace IO {

// tab separated columns with a one line header, data[var][point]
void write_dat(const std::string& filename, const std::vector<std::vector<double>>& data,
    const std::vector<std::string>& var_names);

// header labels carry the unit, "Pvap[psia]"
void write_saturation_table_dat(const std::string& filename, const SaturationTable& table);

} // namespace IO
} // namespace rocketprops

#endif // ROCKETPROPS_DAT_WRITER_H
