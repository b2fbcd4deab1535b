#include <gtest/gtest.h>

#include <limits>
#include <map>
#include <string>

#include "sigmar/errors.hpp"
#include "sigmar/options.hpp"

using namespace sigmar;

class OptionsTest : public ::testing::Test {
protected:
  void SetUp() override {
    kv_ = {
      {"zmin", "0.0"},
      {"zmax", "3.0"},
      {"dz", "0.1"},
      {"rmin", "0.1"},
      {"rmax", "50"},
      {"dr", " 0.5 "}
    };
  }

  std::map<std::string, std::string> kv_;
};

TEST_F(OptionsTest, RequiredKeysAndDefaults) {
  const SigmaROptions opt = options_from_map(kv_);
  EXPECT_DOUBLE_EQ(opt.zmin, 0.0);
  EXPECT_DOUBLE_EQ(opt.zmax, 3.0);
  EXPECT_DOUBLE_EQ(opt.dz, 0.1);
  EXPECT_DOUBLE_EQ(opt.rmin, 0.1);
  EXPECT_DOUBLE_EQ(opt.rmax, 50.0);
  EXPECT_DOUBLE_EQ(opt.dr, 0.5);
  EXPECT_EQ(opt.matter_power, MatterPower::LINEAR);
  EXPECT_TRUE(opt.crop_klim);
  EXPECT_EQ(opt.nk_integration, default_nk_integration);
}

TEST_F(OptionsTest, OptionalKeys) {
  kv_["matter_power"] = "matter_power_nl";
  kv_["crop_klim"] = "F";
  kv_["nk_integration"] = "511";
  const SigmaROptions opt = options_from_map(kv_);
  EXPECT_EQ(opt.matter_power, MatterPower::NONLINEAR);
  EXPECT_FALSE(opt.crop_klim);
  EXPECT_EQ(opt.nk_integration, 512); // rounded up to even
}

TEST_F(OptionsTest, MissingRequiredKeyThrows) {
  for (const char* key : {"zmin", "zmax", "dz", "rmin", "rmax", "dr"}) {
    auto kv = kv_;
    kv.erase(key);
    EXPECT_THROW(options_from_map(kv), InvalidOptionError) << key;
  }
}

TEST_F(OptionsTest, MalformedValuesThrow) {
  auto kv = kv_;
  kv["dz"] = "a tenth";
  EXPECT_THROW(options_from_map(kv), InvalidOptionError);

  kv = kv_;
  kv["nk_integration"] = "1e3";
  EXPECT_THROW(options_from_map(kv), InvalidOptionError);

  kv = kv_;
  kv["matter_power"] = "matter_power_gg";
  EXPECT_THROW(options_from_map(kv), InvalidOptionError);

  kv = kv_;
  kv["crop_klim"] = "maybe";
  EXPECT_THROW(options_from_map(kv), InvalidOptionError);
}

TEST_F(OptionsTest, InconsistentValuesThrow) {
  auto kv = kv_;
  kv["zmax"] = "-1";
  EXPECT_THROW(options_from_map(kv), InvalidOptionError);

  kv = kv_;
  kv["rmin"] = "0";
  EXPECT_THROW(options_from_map(kv), InvalidOptionError);

  kv = kv_;
  kv["dr"] = "-0.5";
  EXPECT_THROW(options_from_map(kv), InvalidOptionError);

  kv = kv_;
  kv["nk_integration"] = "0";
  EXPECT_THROW(options_from_map(kv), InvalidOptionError);
}

TEST_F(OptionsTest, MeshSizeIsBounded) {
  kv_["nk_integration"] = std::to_string(std::numeric_limits<int>::max());
  EXPECT_THROW(options_from_map(kv_), InvalidOptionError);

  kv_["nk_integration"] = std::to_string(max_nk_integration + 1);
  EXPECT_THROW(options_from_map(kv_), InvalidOptionError);

  kv_["nk_integration"] = std::to_string(max_nk_integration - 1);
  EXPECT_EQ(options_from_map(kv_).nk_integration, max_nk_integration);

  SigmaROptions opt = options_from_map(kv_);
  opt.nk_integration = std::numeric_limits<int>::max();
  EXPECT_THROW(validate_options(opt), InvalidOptionError);
}

TEST_F(OptionsTest, UnknownKeyIsIgnored) {
  kv_["verbosity"] = "2";
  EXPECT_NO_THROW(options_from_map(kv_));
}

TEST(ParseBoolTest, AcceptedSpellings) {
  for (const char* s : {"true", "True", "T", "t", "1", "yes", " TRUE "}) {
    EXPECT_TRUE(parse_bool(s)) << s;
  }
  for (const char* s : {"false", "False", "F", "f", "0", "no"}) {
    EXPECT_FALSE(parse_bool(s)) << s;
  }
  EXPECT_THROW(parse_bool(""), InvalidOptionError);
  EXPECT_THROW(parse_bool("2"), InvalidOptionError);
}

TEST(MatterPowerTest, SectionNames) {
  EXPECT_EQ(matter_power_section(MatterPower::LINEAR), "matter_power_lin");
  EXPECT_EQ(matter_power_section(MatterPower::NONLINEAR), "matter_power_nl");
  EXPECT_EQ(parse_matter_power("Matter_Power_Lin"), MatterPower::LINEAR);
  EXPECT_EQ(parse_matter_power(matter_power_section(MatterPower::NONLINEAR)),
            MatterPower::NONLINEAR);
}
