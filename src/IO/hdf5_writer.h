#ifndef ROCKETPROPS_HDF5_WRITER_H
#define ROCKETPROPS_HDF5_WRITER_H

#include "Physics/saturation_table.h"

#include <H5Cpp.h>

#include <string>

namespace rocketprops {
namespace IO {

  void create_hdf5_file(const std::string& filename);

  // \brief: group /<substance> with one 1-D dataset per column and a "unit" attribute
  //         an existing group of the same name is replaced
  void write_saturation_table_hdf5(const std::string& filename, const SaturationTable& table);

  void write_saturation_table_hdf5(const std::string& filename, const Propellant& prop, int npts);

} // namespace IO
} // namespace rocketprops

#endif // ROCKETPROPS_HDF5_WRITER_H
