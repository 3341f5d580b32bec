#include <gtest/gtest.h>

#include "Common/errors.h"
#include "Data/property_db.h"
#include "Data/registry.h"
#include "Physics/propellant.h"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace rocketprops;

class PropellantTest : public ::testing::Test {
  protected:
    static void SetUpTestSuite() {
      registry = std::make_shared<SubstanceRegistry>(SubstanceRegistry::from_xml(default_database_path()));
    }
    static void TearDownTestSuite() { registry.reset(); }

    Propellant prop(const std::string& name) const { return Propellant(registry->resolve(name), evaluator); }

    static std::shared_ptr<SubstanceRegistry> registry;
    PropertyEvaluator evaluator;
};

std::shared_ptr<SubstanceRegistry> PropellantTest::registry;

TEST_F(PropellantTest, DefaultState) {
  Propellant n2o4 = prop("MON-3");
  EXPECT_EQ(n2o4.name(), "N2O4");
  EXPECT_DOUBLE_EQ(n2o4.T(), 527.67);
  EXPECT_DOUBLE_EQ(n2o4.P(), 14.6959);
  EXPECT_DOUBLE_EQ(n2o4.Tc(), 776.47);
  EXPECT_DOUBLE_EQ(n2o4.MolWt(), 92.011);
  EXPECT_DOUBLE_EQ(n2o4.get_property("SG").value, 1.44144);
  EXPECT_DOUBLE_EQ(n2o4.get_property(Property::VaporPressure).value, 13.8837);

  Propellant warm = n2o4.at_state(540.0, 100.0);
  EXPECT_DOUBLE_EQ(warm.T(), 540.0);
  EXPECT_LT(warm.get_property(Property::LiquidSG).value, 1.44144);
  EXPECT_EQ(warm.substance_ptr(), n2o4.substance_ptr());
  EXPECT_THROW(Propellant(nullptr, evaluator), RocketPropsError);
}

TEST_F(PropellantTest, SaturatedCurvesMoveTheRightWay) {
  Propellant mmh = prop("MMH");
  const double T1 = 500.0, T2 = 600.0;
  EXPECT_LT(mmh.PvapAtTdegR(T1), mmh.PvapAtTdegR(T2));
  EXPECT_GT(mmh.SGLiqAtTdegR(T1), mmh.SGLiqAtTdegR(T2));
  EXPECT_LT(mmh.SGVapAtTdegR(T1), mmh.SGVapAtTdegR(T2));
  EXPECT_GT(mmh.ViscAtTdegR(T1), mmh.ViscAtTdegR(T2));
  EXPECT_GT(mmh.CondAtTdegR(T1), mmh.CondAtTdegR(T2));
  EXPECT_LT(mmh.CpAtTdegR(T1), mmh.CpAtTdegR(T2));
  EXPECT_GT(mmh.HvapAtTdegR(T1), mmh.HvapAtTdegR(T2));
  EXPECT_GT(mmh.SurfAtTdegR(T1), mmh.SurfAtTdegR(T2));
  EXPECT_NEAR(mmh.PvapAtTdegR(530.0), 1.05073, 1e-5);
}

TEST_F(PropellantTest, SaturationTemperatureRoundTrip) {
  for (const std::string name : {"N2O4", "N2H4", "MMH", "Ethanol", "LOX", "Water"}) {
    Propellant p = prop(name);
    const double Psat = 100.0;
    const double T = p.TdegRAtPsat(Psat);
    EXPECT_GT(T, p.Tfreeze()) << name;
    EXPECT_LT(T, p.Tc()) << name;
    EXPECT_NEAR(p.PvapAtTdegR(T), Psat, 1e-6) << name;
  }
}

TEST_F(PropellantTest, CompressedLiquidIsDenser) {
  Propellant n2h4 = prop("Hydrazine");
  const double T = 560.0;
  EXPECT_DOUBLE_EQ(n2h4.SG_compressed(T, 0.1), n2h4.SGLiqAtTdegR(T));
  EXPECT_GT(n2h4.SG_compressed(T, 1000.0), n2h4.SGLiqAtTdegR(T));
  EXPECT_GT(n2h4.SG_compressed(T, 3000.0), n2h4.SG_compressed(T, 1000.0));
}

TEST_F(PropellantTest, SummaryOrder) {
  const std::vector<PropertyResult> results = prop("N2O4").summary_results();
  ASSERT_EQ(results.size(), 15u);
  const std::vector<std::string> labels = {
    "T", "P", "Pvap", "Pc", "Tc", "SGliq", "SGvap", "visc", "cond",
    "Tnbp", "Tfreeze", "Cp", "MolWt", "Hvap", "surf"
  };
  for (std::size_t i = 0; i < labels.size(); ++i) {
    EXPECT_EQ(property_label(results[i].property), labels[i]);
  }
}

TEST_F(PropellantTest, SummaryText) {
  const std::string text = prop("N2O4").summary();
  std::istringstream in(text);
  std::string line;
  std::vector<std::string> lines;
  while (std::getline(in, line)) lines.push_back(line);

  ASSERT_EQ(lines.size(), 16u);
  EXPECT_EQ(lines[0], "    Name = N2O4 (NTO, MON-3, MON3, Nitrogen Tetroxide)");
  EXPECT_EQ(lines[1], "       T =       527.67 degR");
  EXPECT_EQ(lines[2], "       P =      14.6959 psia");
  EXPECT_EQ(lines[3], "    Pvap =      13.8837 psia");
  EXPECT_EQ(lines[6], "   SGliq =      1.44144 SG");
  EXPECT_EQ(lines[14], "    Hvap =        178.2 BTU/lbm");

  std::ostringstream os;
  os << prop("N2O4");
  EXPECT_EQ(os.str(), text);
}

TEST_F(PropellantTest, SummaryDisplayUnits) {
  DisplayUnits display;
  display[units::Quantity::Temperature] = "degC";
  display[units::Quantity::Pressure] = "bar";
  const std::string text = prop("N2O4").summary(display);
  EXPECT_NE(text.find("       T =           20 degC"), std::string::npos);
  EXPECT_NE(text.find("      Tc =      158.222 degC"), std::string::npos);
  EXPECT_NE(text.find(" bar\n"), std::string::npos);
  EXPECT_EQ(text.find("psia"), std::string::npos);

  display[units::Quantity::Density] = "psia";
  EXPECT_THROW(prop("N2O4").summary(display), IncompatibleUnitError);
}

TEST_F(PropellantTest, SummaryFailsAsAWhole) {
  // T above Tc, every liquid property is out of range
  EXPECT_THROW(prop("LOX").at_state(300.0, 14.7).summary(), PhaseRangeError);
}
