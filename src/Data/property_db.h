#ifndef ROCKETPROPS_PROPERTY_DB_H
#define ROCKETPROPS_PROPERTY_DB_H

#include "Data/substance.h"

#include <map>
#include <string>
#include <vector>

namespace rocketprops {

// \brief: freezing temperature [degR] of a binary blend vs. composition [%]
struct FreezeCurve {
  std::string name;
  std::vector<double> x;
  std::vector<double> T;

  // linear interpolation, throws RocketPropsError outside the tabulated range
  double Tfreeze(double x_in) const;
};

struct PropertyDatabase {
  int version = 0;
  std::string path;
  std::vector<Substance> substances;
  std::map<std::string, FreezeCurve> freeze_curves;
};

// \brief: read the XML reference database; throws DataError on any defect
PropertyDatabase read_property_database(const std::string& path);
PropertyDatabase parse_property_database(const std::string& xml_text);

// \brief: <ROCKETPROPS_DATA_DIR>/propellants.xml
std::string default_database_path();

} // namespace rocketprops

#endif // ROCKETPROPS_PROPERTY_DB_H
