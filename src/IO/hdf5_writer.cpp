#include "hdf5_writer.h"

#include "Common/common.h"

#include <fstream>
#include <iostream>

using namespace H5;

namespace rocketprops {
namespace IO {

  void create_hdf5_file(const std::string& filename) {
    // Create a new file using the default property lists.
    try {
      H5File file(filename, H5F_ACC_TRUNC);
      file.close();
    } catch (const H5::Exception& e) {
      throw RocketPropsError("create_hdf5_file: " + filename + ": " + e.getDetailMsg());
    }
  }

  void write_saturation_table_hdf5(const std::string& filename, const SaturationTable& table) {
    if (!std::ifstream(filename).good()) create_hdf5_file(filename);

    try {
      H5File file(filename, H5F_ACC_RDWR);
      const std::string grpname = "/" + table.name;
      if (file.nameExists(grpname)) file.unlink(grpname);
      Group group = file.createGroup(grpname);

      // Data dimensions
      hsize_t dims[1] = {static_cast<hsize_t>(table.num_points())};
      DataSpace space(1, dims);
      StrType str_type(PredType::C_S1, H5T_VARIABLE);
      DataSpace scalar(H5S_SCALAR);

      LOOP_i_N(table.columns.size()) {
        DataSet dset = group.createDataSet(table.columns[i], PredType::NATIVE_DOUBLE, space);
        dset.write(table.data[i].data(), PredType::NATIVE_DOUBLE);
        Attribute unit = dset.createAttribute("unit", str_type, scalar);
        unit.write(str_type, table.units[i]);
      }
    } catch (const H5::Exception& e) {
      throw RocketPropsError("write_saturation_table_hdf5: " + filename + ": " + e.getDetailMsg());
    }
    std::cout << "Wrote " << table.num_points() << " saturation points of " << table.name
              << " to " << filename << std::endl;
  } // end of write_saturation_table_hdf5

  void write_saturation_table_hdf5(const std::string& filename, const Propellant& prop, int npts) {
    write_saturation_table_hdf5(filename, build_saturation_table(prop, npts));
  }

} // namespace IO
} // namespace rocketprops
