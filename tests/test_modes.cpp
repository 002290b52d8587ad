#include <gtest/gtest.h>

#include "modes.hpp"

using namespace amdopt;

static std::vector<std::pair<Attribute, std::string>> flatten(const std::vector<Step>& steps) {
    std::vector<std::pair<Attribute, std::string>> out;
    for (const auto& s : steps) out.emplace_back(s.attribute, s.value);
    return out;
}

TEST(Modes, GamingSetsLevelBeforeProfile) {
    auto steps = flatten(expand(GpuMode::Gaming));
    ASSERT_EQ(steps.size(), 2u);
    EXPECT_EQ(steps[0], std::make_pair(Attribute::PerformanceLevel, std::string("high")));
    EXPECT_EQ(steps[1], std::make_pair(Attribute::PowerProfile, std::string("1")));
}

TEST(Modes, ComputeAndPowerSave) {
    auto c = flatten(expand(GpuMode::Compute));
    ASSERT_EQ(c.size(), 2u);
    EXPECT_EQ(c[0].second, "high");
    EXPECT_EQ(c[1].second, "5");

    auto p = flatten(expand(GpuMode::PowerSave));
    ASSERT_EQ(p.size(), 2u);
    EXPECT_EQ(p[0].second, "low");
    EXPECT_EQ(p[1].second, "2");
}

TEST(Modes, SingleStepGpuModes) {
    EXPECT_EQ(expand(GpuMode::High)[0].value, "high");
    EXPECT_EQ(expand(GpuMode::Low)[0].value, "low");
    EXPECT_EQ(expand(GpuMode::Auto)[0].value, "auto");
    EXPECT_EQ(expand(GpuMode::Manual)[0].value, "manual");
    EXPECT_EQ(expand(GpuMode::Reset)[0].value, "auto");
    EXPECT_EQ(expand(GpuMode::Manual).size(), 1u);
}

TEST(Modes, CpuModes) {
    auto perf = expand(CpuMode::Performance);
    ASSERT_EQ(perf.size(), 1u);
    EXPECT_EQ(perf[0].attribute, Attribute::Governor);
    EXPECT_EQ(perf[0].value, "performance");
    EXPECT_EQ(expand(CpuMode::Powersave)[0].value, "powersave");
    EXPECT_EQ(expand(CpuMode::BoostOn)[0].value, "1");
    EXPECT_EQ(expand(CpuMode::BoostOff)[0].value, "0");
    EXPECT_EQ(expand(CpuMode::BoostOff)[0].attribute, Attribute::Boost);
}

TEST(Modes, VerbLookup) {
    EXPECT_EQ(gpu_mode_from_verb("power-save"), GpuMode::PowerSave);
    EXPECT_FALSE(gpu_mode_from_verb("status").has_value());
    EXPECT_FALSE(gpu_mode_from_verb("performance").has_value());
    EXPECT_EQ(cpu_mode_from_verb("boost-on"), CpuMode::BoostOn);
    EXPECT_FALSE(cpu_mode_from_verb("high").has_value());
}

TEST(Modes, ProfileIndexRange) {
    EXPECT_EQ(parse_profile_index("0"), 0);
    EXPECT_EQ(parse_profile_index("6"), 6);
    EXPECT_FALSE(parse_profile_index("7").has_value());
    EXPECT_FALSE(parse_profile_index("-1").has_value());
    EXPECT_FALSE(parse_profile_index("abc").has_value());
    EXPECT_FALSE(parse_profile_index("").has_value());
    EXPECT_FALSE(parse_profile_index("1.5").has_value());
}

TEST(Modes, DescribeValue) {
    EXPECT_EQ(describe_value({Attribute::PowerProfile, "1"}), "1 (3D Full Screen)");
    EXPECT_EQ(describe_value({Attribute::Boost, "0"}), "disabled");
    EXPECT_EQ(describe_value({Attribute::Governor, "powersave"}), "powersave");
    EXPECT_EQ(profile_name(5), "Compute");
}
