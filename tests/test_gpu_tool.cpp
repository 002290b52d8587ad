#include <gtest/gtest.h>

#include <sstream>

#include "console.hpp"
#include "gpu_tool.hpp"
#include "test_support.hpp"

using namespace amdopt;
using namespace amdopt::testing;

class GpuToolTest : public ::testing::Test {
protected:
    GpuToolTest() : console(out, err, false), ctx{t.root(), console, shell, recorder, true, "sudo"} {}

    int run(const std::string& verb, std::vector<std::string> args = {}) {
        Options opts;
        opts.verb = verb;
        opts.args = std::move(args);
        opts.root = t.root();
        return run_gpu_tool(opts, ctx);
    }

    std::string dev(int card, const std::string& file) const {
        return t.path("/sys/class/drm/card" + std::to_string(card) + "/device/" + file);
    }

    std::vector<std::string> written_values() const {
        std::vector<std::string> v;
        for (const auto& w : recorder.writes) v.push_back(w.second);
        return v;
    }

    TempTree t;
    std::ostringstream out, err;
    Console console;
    FakeShell shell;
    RecordingWriter recorder;
    Context ctx;
};

TEST_F(GpuToolTest, NoAmdGpuFailsWithoutWrites) {
    add_gpu(t, 0, "0x10de");
    for (const char* verb : {"high", "low", "auto", "manual", "gaming", "compute", "power-save",
                             "clocks", "status", "reset", "install", "enable-oc"}) {
        EXPECT_EQ(run(verb), 1) << verb;
    }
    EXPECT_EQ(run("profile", {"1"}), 1);
    EXPECT_TRUE(recorder.writes.empty());
    EXPECT_TRUE(shell.runs.empty());
    EXPECT_NE(err.str().find("No AMD graphics cards detected."), std::string::npos);
}

TEST_F(GpuToolTest, GamingSetsLevelThenProfilePerCard) {
    add_gpu(t, 0);
    add_gpu(t, 1);
    EXPECT_EQ(run("gaming"), 0);
    ASSERT_EQ(recorder.writes.size(), 4u);
    EXPECT_EQ(recorder.writes[0].first, dev(0, "power_dpm_force_performance_level"));
    EXPECT_EQ(recorder.writes[0].second, "high");
    EXPECT_EQ(recorder.writes[1].first, dev(0, "pp_power_profile_mode"));
    EXPECT_EQ(recorder.writes[1].second, "1");
    EXPECT_EQ(recorder.writes[2].first, dev(1, "power_dpm_force_performance_level"));
    EXPECT_EQ(recorder.writes[3].second, "1");
    EXPECT_NE(out.str().find("Performance Level: high"), std::string::npos);
}

TEST_F(GpuToolTest, ModeWriteSequences) {
    add_gpu(t, 0);
    const std::vector<std::pair<std::string, std::vector<std::string>>> cases = {
        {"high", {"high"}},
        {"low", {"low"}},
        {"auto", {"auto"}},
        {"manual", {"manual"}},
        {"reset", {"auto"}},
        {"compute", {"high", "5"}},
        {"power-save", {"low", "2"}},
    };
    for (const auto& c : cases) {
        recorder.writes.clear();
        EXPECT_EQ(run(c.first), 0) << c.first;
        EXPECT_EQ(written_values(), c.second) << c.first;
    }
}

TEST_F(GpuToolTest, ProfileWritesIndex) {
    add_gpu(t, 0);
    EXPECT_EQ(run("profile", {"4"}), 0);
    ASSERT_EQ(recorder.writes.size(), 1u);
    EXPECT_EQ(recorder.writes[0].first, dev(0, "pp_power_profile_mode"));
    EXPECT_EQ(recorder.writes[0].second, "4");
    EXPECT_NE(out.str().find("power profile set to 4 (VR)"), std::string::npos);
}

TEST_F(GpuToolTest, ProfileOutOfRangeReportsErrorAndStatus) {
    add_gpu(t, 0);
    EXPECT_EQ(run("profile", {"9"}), 0);
    EXPECT_TRUE(recorder.writes.empty());
    EXPECT_NE(out.str().find("[✗] Invalid profile: 9 (expected 0-6)"), std::string::npos);
    EXPECT_NE(out.str().find("Detected AMD GPU(s):"), std::string::npos);
    EXPECT_NE(out.str().find("Performance Level: auto"), std::string::npos);
    EXPECT_EQ(err.str(), "");

    EXPECT_EQ(run("profile", {"7"}), 0);
    EXPECT_EQ(run("profile", {"-1"}), 0);
    EXPECT_EQ(run("profile", {"vr"}), 0);
    EXPECT_TRUE(recorder.writes.empty());
}

TEST_F(GpuToolTest, InvalidProfileWithoutAmdGpuStillFails) {
    add_gpu(t, 0, "0x8086");
    EXPECT_EQ(run("profile", {"9"}), 1);
    EXPECT_TRUE(recorder.writes.empty());
    EXPECT_NE(err.str().find("No AMD graphics cards detected."), std::string::npos);
}

TEST_F(GpuToolTest, ProfileMissingArgumentPrintsUsage) {
    add_gpu(t, 0);
    EXPECT_EQ(run("profile"), 1);
    EXPECT_TRUE(recorder.writes.empty());
    EXPECT_NE(err.str().find("Profile number required (0-6)"), std::string::npos);
    EXPECT_NE(err.str().find("Usage: amd_gpu_optimize"), std::string::npos);
}

TEST_F(GpuToolTest, StatusAndClocksNeverWrite) {
    add_gpu(t, 0);
    EXPECT_EQ(run("status"), 0);
    EXPECT_EQ(run("clocks"), 0);
    EXPECT_TRUE(recorder.writes.empty());
    EXPECT_NE(out.str().find("Current GPU Clock: 1800Mhz"), std::string::npos);
    EXPECT_NE(out.str().find("card0 Available Settings:"), std::string::npos);
}

TEST_F(GpuToolTest, UnknownVerbExitsNonZero) {
    add_gpu(t, 0);
    EXPECT_EQ(run("overdrive"), 1);
    EXPECT_NE(err.str().find("Unknown option: overdrive"), std::string::npos);
    EXPECT_TRUE(recorder.writes.empty());
}

TEST_F(GpuToolTest, HelpExitsZero) {
    EXPECT_EQ(run("--help"), 0);
    EXPECT_NE(out.str().find("profile <0-6>"), std::string::npos);
    EXPECT_NE(out.str().find("AMD GPU Optimizer v" AMDOPT_VERSION), std::string::npos);
}

TEST_F(GpuToolTest, SecondCardFailureKeepsFirstAndExitsZero) {
    add_gpu(t, 0);
    add_gpu(t, 1);
    recorder.fail_paths.insert(dev(1, "power_dpm_force_performance_level"));
    EXPECT_EQ(run("high"), 0);
    ASSERT_EQ(recorder.writes.size(), 2u);
    EXPECT_EQ(t.read("/sys/class/drm/card0/device/power_dpm_force_performance_level"), "high\n");
    EXPECT_NE(out.str().find("[✓] card0: performance level set to high"), std::string::npos);
    EXPECT_NE(out.str().find("[✗] card1: failed to set performance level"), std::string::npos);
}

TEST_F(GpuToolTest, GamingPartialFailureReported) {
    add_gpu(t, 0);
    std::filesystem::remove(dev(0, "pp_power_profile_mode"));
    EXPECT_EQ(run("gaming"), 0);
    ASSERT_EQ(recorder.writes.size(), 1u);
    EXPECT_NE(out.str().find("card0: power profile control not available"), std::string::npos);
    EXPECT_NE(out.str().find("card0: partially applied (1 of 2 settings)"), std::string::npos);
}

TEST_F(GpuToolTest, EnableOverclockingCreatesModprobeConfig) {
    add_gpu(t, 0);
    t.put("/proc/cmdline", "BOOT_IMAGE=/vmlinuz root=/dev/sda1 quiet\n");
    t.mkdir("/etc/modprobe.d");
    EXPECT_EQ(run("enable-oc"), 0);
    ASSERT_EQ(recorder.writes.size(), 1u);
    EXPECT_EQ(recorder.writes[0].first, t.path("/etc/modprobe.d/amdgpu.conf"));
    EXPECT_EQ(recorder.writes[0].second, "options amdgpu ppfeaturemask=0xffffffff");
    EXPECT_NE(out.str().find("GPU overclocking not enabled in kernel parameters"), std::string::npos);

    recorder.writes.clear();
    t.put("/proc/cmdline", "quiet amdgpu.ppfeaturemask=0xffffffff\n");
    EXPECT_EQ(run("enable-oc"), 0);
    EXPECT_TRUE(recorder.writes.empty());
    EXPECT_NE(out.str().find("already enabled in kernel parameters"), std::string::npos);
    EXPECT_NE(out.str().find("modprobe configuration already exists"), std::string::npos);
}

TEST_F(GpuToolTest, InstallPrefersPacman) {
    add_gpu(t, 0);
    shell.commands = {"pacman", "apt"};
    EXPECT_EQ(run("install"), 0);
    ASSERT_EQ(shell.runs.size(), 1u);
    EXPECT_EQ(shell.runs[0], "pacman -S --noconfirm mesa vulkan-radeon lib32-mesa lib32-vulkan-radeon radeontop");
}
