#include <iostream>
#include <fstream>
#include <vector>
#include <omp.h>
#include <string>

#include "Common/errors.h"
#include "IO/config.h"
#include "IO/dat_writer.h"
#include "IO/hdf5_writer.h"
#include "IO/input.h"
#include "Physics/property_library.h"
#include "Physics/saturation_table.h"

// usage: rocketprops [-c config.toml] [substance ...]
int main(int argc, char* argv[]) {
    std::string filename = "rocketprops.toml";
    std::vector<std::string> names;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            filename = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            std::cout << "usage: " << argv[0] << " [-c config.toml] [substance ...]" << std::endl;
            return 0;
        } else {
            names.push_back(arg);
        }
    }

    try {
        // run without a configuration file when none is present
        rocketprops::IO::Input input;
        if (std::ifstream(filename).good()) {
            input = rocketprops::IO::Input(filename);
            std::cout << "Configuration: " << filename << std::endl;
        }

        rocketprops::PropertyLibrary library;
        library.set_input_file(&input);
        library.initialize();

        const rocketprops::IO::RocketPropsConfig& config = library.config();
        if (names.empty()) names = config.substances;
        if (names.empty()) names = library.registry().names();

        if (!config.hdf5_file.empty()) {
            rocketprops::IO::create_hdf5_file(config.hdf5_file);
            std::cout << "Saturation tables on " << omp_get_max_threads() << " threads" << std::endl;
        }

        for (const auto& name : names) {
            rocketprops::Propellant prop = library.get_prop(name);
            std::cout << prop.summary(config.display_units) << std::endl;

            if (!config.hdf5_file.empty() || !config.dat_file.empty()) {
                const rocketprops::SaturationTable table =
                    rocketprops::build_saturation_table(prop, config.num_saturation_points);
                if (!config.hdf5_file.empty()) {
                    rocketprops::IO::write_saturation_table_hdf5(config.hdf5_file, table);
                }
                if (!config.dat_file.empty()) {
                    rocketprops::IO::write_saturation_table_dat(prop.name() + "_" + config.dat_file, table);
                }
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return -1;
    }
    return 0;
}
