#include <gtest/gtest.h>

#include "Common/errors.h"
#include "Data/property_db.h"
#include "Data/registry.h"
#include "Physics/propellant.h"
#include "Physics/property_evaluator.h"
#include "Units/unit_conv.h"

#include <cmath>
#include <memory>
#include <string>

using namespace rocketprops;

class EvaluatorTest : public ::testing::Test {
  protected:
    static void SetUpTestSuite() {
      registry = std::make_shared<SubstanceRegistry>(SubstanceRegistry::from_xml(default_database_path()));
    }
    static void TearDownTestSuite() { registry.reset(); }

    const Substance& substance(const std::string& name) const { return *registry->resolve(name); }

    static std::shared_ptr<SubstanceRegistry> registry;
    PropertyEvaluator evaluator;
};

std::shared_ptr<SubstanceRegistry> EvaluatorTest::registry;

TEST_F(EvaluatorTest, ReferenceStateReturnsAnchors) {
  const Substance& n2o4 = substance("N2O4");
  PropertyResult sg = evaluator.get_property(n2o4, Property::LiquidSG, 527.67, 14.6959);
  EXPECT_DOUBLE_EQ(sg.value, 1.44144);
  EXPECT_TRUE(sg.from_anchor);
  EXPECT_FALSE(sg.clamped);
  EXPECT_EQ(sg.fit_name, "anchor");
  EXPECT_EQ(sg.unit, "SG");

  PropertyResult cp = evaluator.get_property(n2o4, Property::SpecificHeat);
  EXPECT_DOUBLE_EQ(cp.value, 0.374677);
  EXPECT_EQ(cp.unit, "BTU/lbm-delF");

  EXPECT_DOUBLE_EQ(evaluator.value(n2o4, Property::VaporPressure, 527.67), 13.8837);
}

TEST_F(EvaluatorTest, ConstantsAndState) {
  const Substance& n2o4 = substance("NTO");
  PropertyResult tc = evaluator.get_property(n2o4, Property::CriticalTemperature, 900.0, 14.7);
  EXPECT_DOUBLE_EQ(tc.value, 776.47);
  EXPECT_EQ(tc.fit_name, "constant");
  EXPECT_DOUBLE_EQ(evaluator.value(n2o4, Property::MolecularWeight, 500.0), 92.011);
  EXPECT_DOUBLE_EQ(evaluator.value(n2o4, Property::Pressure, 500.0, 123.0), 123.0);
  EXPECT_NEAR(evaluator.get_property(n2o4, Property::Temperature, 527.67, 14.7, "degC").value, 20.0, 1e-9);
}

TEST_F(EvaluatorTest, LiquidPropertiesOutsideSaturationRange) {
  const Substance& n2o4 = substance("N2O4");
  EXPECT_THROW(evaluator.get_property(n2o4, Property::LiquidSG, 800.0, 14.7), PhaseRangeError);
  EXPECT_THROW(evaluator.get_property(n2o4, Property::VaporPressure, 400.0, 14.7), PhaseRangeError);
  EXPECT_THROW(evaluator.get_property(n2o4, Property::CompressedLiquidSG, 800.0, 500.0), PhaseRangeError);
  EXPECT_NO_THROW(evaluator.get_property(n2o4, Property::LiquidSG, 776.47, 14.7));
  EXPECT_NO_THROW(evaluator.get_property(n2o4, Property::BoilingPoint, 800.0, 14.7));
}

TEST_F(EvaluatorTest, RequestedUnits) {
  const Substance& n2o4 = substance("N2O4");
  PropertyResult pvap = evaluator.get_property(n2o4, Property::VaporPressure, 527.67, 14.6959, "bar");
  EXPECT_NEAR(pvap.value, 0.9572474183, 1e-9);
  EXPECT_EQ(pvap.unit, "bar");
  EXPECT_NEAR(evaluator.get_property(n2o4, "SG", 527.67, 14.6959, "lbm/ft**3").value,
      units::convert(1.44144, "SG", "lbm/ft**3"), 1e-9);
  EXPECT_THROW(evaluator.get_property(n2o4, Property::LiquidSG, 527.67, 14.6959, "psia"),
      IncompatibleUnitError);
  EXPECT_THROW(evaluator.get_property(n2o4, Property::LiquidSG, 527.67, 14.6959, "furlong"),
      UnknownUnitError);
  EXPECT_THROW(evaluator.get_property(n2o4, "colour", 527.67, 14.6959), RocketPropsError);
}

TEST_F(EvaluatorTest, EqualDistanceAnchorsPreferLowerRank) {
  const Substance& ethanol = substance("Ethanol");
  PropertyResult sg = evaluator.get_property(ethanol, Property::LiquidSG, 527.67, 14.6959);
  EXPECT_DOUBLE_EQ(sg.value, 0.7893);
  EXPECT_EQ(sg.anchor_source, "RocketProps");
  EXPECT_TRUE(sg.from_anchor);
}

TEST_F(EvaluatorTest, ExactAnchorOfAnotherSource) {
  PropertyResult sg = evaluator.get_property(substance("Ethanol"), Property::LiquidSG, 536.67, 14.6959);
  EXPECT_DOUBLE_EQ(sg.value, 0.78509);
  EXPECT_EQ(sg.anchor_source, "NIST RefProp");
}

TEST_F(EvaluatorTest, FitThroughClosestAnchor) {
  PropertyResult sg = evaluator.get_property(substance("Ethanol"), Property::LiquidSG, 530.0, 14.6959);
  EXPECT_NEAR(sg.value, 0.788217097, 1e-8);
  EXPECT_FALSE(sg.from_anchor);
  EXPECT_EQ(sg.fit_name, "Rackett");
  EXPECT_EQ(sg.anchor_source, "RocketProps");

  const AnchorPoint* anchor = evaluator.select_anchor(substance("Ethanol").model(Property::LiquidSG), 534.0);
  ASSERT_NE(anchor, nullptr);
  EXPECT_EQ(anchor->source, "NIST RefProp");
  EXPECT_EQ(evaluator.select_anchor(substance("Ethanol").model(Property::VaporSG), 534.0), nullptr);
}

TEST_F(EvaluatorTest, VaporDensityUsesVaporPressure) {
  const Substance& n2o4 = substance("N2O4");
  PropertyResult sgvap = evaluator.get_property(n2o4, Property::VaporSG, 527.67, 14.6959);
  EXPECT_EQ(sgvap.fit_name, "PitzerVirial");
  EXPECT_GT(sgvap.value, 0.0);
  EXPECT_LT(sgvap.value, 0.01);
  EXPECT_GT(evaluator.value(n2o4, Property::VaporSG, 600.0), sgvap.value);
}

TEST_F(EvaluatorTest, CompressedLiquid) {
  const Substance& n2o4 = substance("N2O4");
  PropertyResult below = evaluator.get_property(n2o4, Property::CompressedLiquidSG, 527.67, 10.0);
  EXPECT_DOUBLE_EQ(below.value, 1.44144);
  EXPECT_EQ(below.fit_name, "anchor");

  PropertyResult above = evaluator.get_property(n2o4, Property::CompressedLiquidSG, 527.67, 3000.0);
  EXPECT_GT(above.value, 1.44144);
  EXPECT_LT(above.value, 1.44144 * 1.05);
  EXPECT_EQ(above.fit_name, "anchor+COSTALD");
}

TEST_F(EvaluatorTest, ReferenceStateReproducesAnchors) {
  for (const std::string& name : registry->names()) {
    std::shared_ptr<const Substance> sub = registry->resolve(name);
    int checked = 0;
    for (const auto& entry : sub->models) {
      // most authoritative anchor sitting exactly on the reference temperature
      const AnchorPoint* ref_anchor = nullptr;
      for (const auto& anchor : entry.second.anchors) {
        if (anchor.T != sub->Tref) continue;
        if (ref_anchor == nullptr || anchor.rank < ref_anchor->rank) ref_anchor = &anchor;
      }
      if (ref_anchor == nullptr) continue;

      PropertyResult result = evaluator.get_property(*sub, entry.first, sub->Tref, sub->Pref);
      EXPECT_DOUBLE_EQ(result.value, ref_anchor->value) << name << " " << property_label(entry.first);
      EXPECT_EQ(result.fit_name, "anchor") << name << " " << property_label(entry.first);
      EXPECT_EQ(result.anchor_source, ref_anchor->source) << name << " " << property_label(entry.first);
      ++checked;
    }
    EXPECT_GT(checked, 0) << name;

    Propellant prop(sub, evaluator);
    EXPECT_NO_THROW(prop.summary()) << name;
  }
}

TEST_F(EvaluatorTest, CompressedLiquidNearCritical) {
  const Substance& n2h4 = substance("N2H4");
  const double Tc = n2h4.crit.Tc;

  const double T90 = 0.90 * Tc;
  const double Psat90 = evaluator.value(n2h4, Property::VaporPressure, T90);
  const double sg90 = evaluator.value(n2h4, Property::CompressedLiquidSG, T90, Psat90 + 500.0);
  EXPECT_TRUE(std::isfinite(sg90));
  EXPECT_GT(sg90, evaluator.value(n2h4, Property::LiquidSG, T90));

  PropertyEvaluator clamp = evaluator.with_policy(DomainPolicy::Clamp);
  for (double Tr : {0.96, 0.97, 0.98, 0.99}) {
    const double T = Tr * Tc;
    const double Psat = evaluator.value(n2h4, Property::VaporPressure, T);
    EXPECT_THROW(evaluator.get_property(n2h4, Property::CompressedLiquidSG, T, Psat + 500.0), DomainError)
        << "Tr=" << Tr;

    PropertyResult sg = clamp.get_property(n2h4, Property::CompressedLiquidSG, T, Psat + 500.0);
    EXPECT_TRUE(sg.clamped);
    EXPECT_DOUBLE_EQ(sg.value, clamp.value(n2h4, Property::LiquidSG, T));
  }
}

TEST_F(EvaluatorTest, CandidateCurves) {
  const Substance& ethanol = substance("Ethanol");
  PropertyResult andrade = evaluator.evaluate_fit(ethanol, Property::Viscosity, "Andrade", 527.67);
  EXPECT_NEAR(andrade.value, 0.0119991861, 1e-9);
  EXPECT_EQ(andrade.fit_name, "Andrade");
  EXPECT_NEAR(evaluator.evaluate_fit(ethanol, Property::Viscosity, "Nicola", 527.67, "cP").value,
      1.19991861, 1e-7);

  EXPECT_THROW(evaluator.evaluate_fit(ethanol, Property::Viscosity, "Andrade", 700.0), DomainError);
  PropertyResult clamped = evaluator.with_policy(DomainPolicy::Clamp)
    .evaluate_fit(ethanol, Property::Viscosity, "Andrade", 700.0);
  EXPECT_TRUE(clamped.clamped);
  EXPECT_NEAR(clamped.value, 0.0029878987, 1e-9);

  EXPECT_THROW(evaluator.evaluate_fit(ethanol, Property::Viscosity, "Arrhenius", 527.67), DataError);
  EXPECT_THROW(evaluator.evaluate_fit(ethanol, Property::Viscosity, "Andrade", 200.0), PhaseRangeError);

  // the candidates of one property agree to a few percent
  const double wagner = evaluator.value(ethanol, Property::VaporPressure, 600.0);
  const double lee_kesler = evaluator.evaluate_fit(ethanol, Property::VaporPressure, "LeeKesler", 600.0).value;
  EXPECT_NEAR(lee_kesler / wagner, 1.0, 0.1);
}

TEST_F(EvaluatorTest, SaturationTemperature) {
  const Substance& n2o4 = substance("N2O4");
  EXPECT_NEAR(evaluator.saturation_temperature(n2o4, 14.6959), 529.74, 0.01);
  const double T = evaluator.saturation_temperature(substance("Ethanol"), 50.0);
  EXPECT_NEAR(evaluator.value(substance("Ethanol"), Property::VaporPressure, T), 50.0, 1e-6);
  EXPECT_THROW(evaluator.saturation_temperature(n2o4, 5000.0), PhaseRangeError);
}

TEST_F(EvaluatorTest, DomainPolicyNames) {
  EXPECT_EQ(parse_domain_policy("strict"), DomainPolicy::Strict);
  EXPECT_EQ(parse_domain_policy("Clamp"), DomainPolicy::Clamp);
  EXPECT_THROW(parse_domain_policy("extrapolate"), RocketPropsError);
  EXPECT_EQ(evaluator.options().domain_policy, DomainPolicy::Strict);
  EXPECT_EQ(evaluator.with_policy(DomainPolicy::Clamp).options().domain_policy, DomainPolicy::Clamp);
}

//----------------------------------------------------------------------------
// small made-up substance: Tc = Pc = 1000, Pvap curve valid up to Tr 0.6

class NarrowFitTest : public ::testing::Test {
  protected:
    void SetUp() override {
      const std::string xml =
        "<rocketprops version=\"1\">"
        "<substance name=\"Testium\">"
        "  <critical Tc=\"1000\" Pc=\"1000\" SGc=\"0.3\" Zc=\"0.27\" Zra=\"0.27\" Tnbp=\"700\""
        "            Tfreeze=\"350\" omega=\"0.3\" MolWt=\"50\"/>"
        "  <property name=\"Pvap\">"
        "    <anchor source=\"lab\" rank=\"0\" T=\"599.8\" value=\"10.0\"/>"
        "    <fit kind=\"ClausiusClapeyron\" selected=\"true\" Trmax=\"0.6\"/>"
        "    <fit kind=\"LeeKesler\"/>"
        "  </property>"
        "  <property name=\"SGliq\">"
        "    <anchor source=\"lab\" rank=\"0\" T=\"500\" value=\"0.8\"/>"
        "    <fit kind=\"Rackett\" selected=\"true\"/>"
        "  </property>"
        "</substance>"
        "</rocketprops>";
      registry = std::make_shared<SubstanceRegistry>(SubstanceRegistry::from_database(parse_property_database(xml)));
    }

    const Substance& testium() const { return *registry->resolve("testium"); }

    std::shared_ptr<SubstanceRegistry> registry;
    PropertyEvaluator evaluator;
};

TEST_F(NarrowFitTest, NearbyAnchorWhenFitDoesNotBracket) {
  PropertyResult result = evaluator.get_property(testium(), Property::VaporPressure, 600.1, 14.7);
  EXPECT_TRUE(result.from_anchor);
  EXPECT_DOUBLE_EQ(result.value, 10.0);
}

TEST_F(NarrowFitTest, FitWhenAnchorIsBeyondTolerance) {
  PropertyResult result = evaluator.get_property(testium(), Property::VaporPressure, 599.0, 14.7);
  EXPECT_FALSE(result.from_anchor);
  EXPECT_EQ(result.fit_name, "ClausiusClapeyron");
  EXPECT_EQ(result.anchor_source, "lab");
  EXPECT_NEAR(result.value, 9.84749, 1e-4);
  EXPECT_NEAR(evaluator.value(testium(), Property::VaporPressure, 500.0), 1.00577, 1e-4);
}

TEST_F(NarrowFitTest, FitWhenItBracketsTheState) {
  PropertyResult result = evaluator.get_property(testium(), Property::LiquidSG, 500.3, 14.7);
  EXPECT_FALSE(result.from_anchor);
  EXPECT_NEAR(result.value, 0.799852678, 1e-8);
  EXPECT_DOUBLE_EQ(evaluator.value(testium(), Property::LiquidSG, 500.0), 0.8);
}

TEST_F(NarrowFitTest, StrictAndClampPolicies) {
  EXPECT_THROW(evaluator.get_property(testium(), Property::VaporPressure, 650.0, 14.7), DomainError);
  try {
    evaluator.get_property(testium(), Property::VaporPressure, 650.0, 14.7);
  } catch (const DomainError& e) {
    EXPECT_DOUBLE_EQ(e.Tr, 0.65);
    EXPECT_DOUBLE_EQ(e.Tr_max, 0.6);
  }

  PropertyResult result = evaluator.with_policy(DomainPolicy::Clamp)
    .get_property(testium(), Property::VaporPressure, 650.0, 14.7);
  EXPECT_TRUE(result.clamped);
  EXPECT_NEAR(result.value, 10.03843, 1e-4);
}

TEST_F(NarrowFitTest, MissingPropertyData) {
  EXPECT_THROW(evaluator.get_property(testium(), Property::Viscosity, 500.0, 14.7), DataError);
  EXPECT_EQ(evaluator.get_property(testium(), Property::VaporPressure, 500.0, 14.7).to_string().find("Pvap = "), 0u);
}
