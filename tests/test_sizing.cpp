#include <gtest/gtest.h>

#include "Common/common.h"
#include "Data/property_db.h"
#include "Data/registry.h"
#include "Sizing/line_sizing.h"
#include "Sizing/tank_volume.h"

#include <memory>
#include <sstream>

using namespace rocketprops;

class SizingTest : public ::testing::Test {
  protected:
    static void SetUpTestSuite() {
      registry = std::make_shared<SubstanceRegistry>(SubstanceRegistry::from_xml(default_database_path()));
    }
    static void TearDownTestSuite() { registry.reset(); }

    Propellant hydrazine() const { return Propellant(registry->resolve("N2H4"), PropertyEvaluator()); }

    static std::shared_ptr<SubstanceRegistry> registry;
};

std::shared_ptr<SubstanceRegistry> SizingTest::registry;

TEST_F(SizingTest, HydrazineTank) {
  const TankVolume tank = calc_tank_volume(hydrazine(), 50.0, 50.0, 98.0, 3.0);
  EXPECT_NEAR(tank.TmaxR, 581.67, 1e-9);
  EXPECT_NEAR(tank.kg_loaded, 51.0526, 1e-4);
  EXPECT_NEAR(tank.kg_residual, 1.05263, 1e-5);
  EXPECT_NEAR(tank.cc_Total, 53510.4, 0.5);
  EXPECT_NEAR(tank.kg_loaded - tank.kg_residual, 50.0, 1e-10);

  std::ostringstream os;
  os << tank;
  EXPECT_NE(os.str().find("kg_loaded = 51.0526 kg"), std::string::npos);
}

TEST_F(SizingTest, TankDefaultsAndErrors) {
  const TankVolume tank = calc_tank_volume(hydrazine(), 10.0, 20.0);
  EXPECT_NEAR(tank.kg_loaded, 10.0 * 97.0 / 95.0, 1e-10);
  EXPECT_THROW(calc_tank_volume(hydrazine(), 0.0, 20.0), RocketPropsError);
  EXPECT_THROW(calc_tank_volume(hydrazine(), 10.0, 20.0, 3.0, 3.0), RocketPropsError);
  EXPECT_THROW(calc_tank_volume(hydrazine(), 10.0, 20.0, 101.0, 3.0), RocketPropsError);
  EXPECT_THROW(calc_tank_volume(hydrazine(), 10.0, 20.0, 98.0, -1.0), RocketPropsError);
  // hotter than the critical point
  EXPECT_THROW(calc_tank_volume(hydrazine(), 10.0, 500.0), PhaseRangeError);
}

TEST_F(SizingTest, HydrazineLine) {
  const LineSize line = calc_line_id_dp(hydrazine(), 530.0, 240.0, 0.5, 13.0, 5.0e-6, 5.0, 50.0);
  EXPECT_NEAR(line.IDinches, 0.334523, 1e-5);
  EXPECT_NEAR(line.deltaPpsia, 9.66264, 1e-3);
  EXPECT_DOUBLE_EQ(line.velFPS, 13.0);
  EXPECT_GT(line.Re, RE_LAMINAR);
}

TEST_F(SizingTest, DiameterAndVelocityAgree) {
  const LineSize sized = calc_line_id_dp(hydrazine(), 530.0, 240.0, 0.5, 13.0, 5.0e-6, 5.0, 50.0);
  const LineSize check = calc_line_vel_dp(hydrazine(), 530.0, 240.0, 0.5, sized.IDinches, 5.0e-6, 5.0, 50.0);
  EXPECT_NEAR(check.velFPS, 13.0, 1e-9);
  EXPECT_NEAR(check.deltaPpsia, sized.deltaPpsia, 1e-9);
  EXPECT_NEAR(check.Re, sized.Re, 1e-6);
}

TEST_F(SizingTest, LineErrors) {
  EXPECT_THROW(calc_line_id_dp(hydrazine(), 530.0, 240.0, 0.0, 13.0, 5.0e-6, 5.0, 50.0), RocketPropsError);
  EXPECT_THROW(calc_line_id_dp(hydrazine(), 530.0, 240.0, 0.5, 0.0, 5.0e-6, 5.0, 50.0), RocketPropsError);
  EXPECT_THROW(calc_line_id_dp(hydrazine(), 530.0, 240.0, 0.5, 13.0, -1.0, 5.0, 50.0), RocketPropsError);
  EXPECT_THROW(calc_line_vel_dp(hydrazine(), 530.0, 240.0, 0.5, 0.0, 5.0e-6, 5.0, 50.0), RocketPropsError);
  EXPECT_THROW(calc_line_vel_dp(hydrazine(), 400.0, 240.0, 0.5, 0.5, 5.0e-6, 5.0, 50.0), PhaseRangeError);
}

TEST(FrictionFactor, LaminarAndTurbulent) {
  EXPECT_DOUBLE_EQ(colebrook_friction(1000.0, 0.0), 0.064);
  EXPECT_DOUBLE_EQ(colebrook_friction(2000.0, 1.0e-3), 0.032);
  EXPECT_NEAR(colebrook_friction(1.0e5, 0.0), 0.0179897731, 1e-8);
  EXPECT_NEAR(colebrook_friction(1.0e6, 1.0e-3), 0.0199434658, 1e-8);
  EXPECT_GT(colebrook_friction(1.0e5, 1.0e-2), colebrook_friction(1.0e5, 1.0e-4));
  EXPECT_THROW(colebrook_friction(0.0, 0.0), RocketPropsError);
}
