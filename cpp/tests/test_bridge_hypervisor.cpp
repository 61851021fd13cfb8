/**
 * @file test_bridge_hypervisor.cpp
 * @brief Unit tests for the bridge hypervisor process and control protocol
 *
 * The bridge executable is replaced by small shell scripts.
 */

#include "test_helpers.hpp"
#include "emucore/bridge_hypervisor.hpp"
#include "emucore/errors.hpp"
#include "emucore/utilities.hpp"

#include <chrono>
#include <filesystem>

using namespace emucore;
using namespace emucore::test;
namespace fs = std::filesystem;

class BridgeHypervisorTest : public DeviceFixture {
protected:
    fs::path script(const std::string& name, const std::string& body) {
        fs::path path = test_dir_ / "bin" / name;
        utilities::write_file(path.string(), "#!/bin/sh\n" + body);
        fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                        fs::perm_options::replace);
        return path;
    }

    std::unique_ptr<BridgeHypervisor> make_bridge(const fs::path& executable) {
        return std::make_unique<BridgeHypervisor>(project_, *allocator_, executable,
                                                  test_dir_ / "bridge", "127.0.0.1");
    }
};

// ============================================================================
// Version Tests
// ============================================================================

TEST_F(BridgeHypervisorTest, ParseVersion) {
    EXPECT_EQ(BridgeHypervisor::parse_version("ubridge version 0.9.18 running with libpcap 1.10"),
              std::optional<std::string>("0.9.18"));
    EXPECT_EQ(BridgeHypervisor::parse_version("ubridge version 0.9.14a\n"),
              std::optional<std::string>("0.9.14a"));
    EXPECT_FALSE(BridgeHypervisor::parse_version("command not found").has_value());
}

TEST_F(BridgeHypervisorTest, CheckVersionAccepted) {
    auto bridge = make_bridge(script("ubridge", "echo 'ubridge version 0.9.18 running with libpcap'\n"));
    EXPECT_EQ(bridge->check_version(), "0.9.18");
    EXPECT_EQ(bridge->version(), "0.9.18");
}

TEST_F(BridgeHypervisorTest, CheckVersionTooOld) {
    auto bridge = make_bridge(script("ubridge", "echo 'ubridge version 0.9.10'\n"));
    EXPECT_THROW(bridge->check_version(), BridgeError);
}

TEST_F(BridgeHypervisorTest, CheckVersionWithoutOutput) {
    auto bridge = make_bridge(script("ubridge", "exit 0\n"));
    EXPECT_THROW(bridge->check_version(), BridgeError);
}

TEST_F(BridgeHypervisorTest, CheckVersionMissingExecutable) {
    auto bridge = make_bridge(test_dir_ / "bin" / "missing");
    EXPECT_THROW(bridge->check_version(), BridgeError);
}

// ============================================================================
// Process Lifecycle Tests
// ============================================================================

TEST_F(BridgeHypervisorTest, StartAndStopReleasesPort) {
    auto bridge = make_bridge(script("ubridge",
        "if [ \"$1\" = \"-v\" ]; then echo 'ubridge version 0.9.18'; exit 0; fi\n"
        "exec sleep 30\n"));

    bridge->start();
    uint16_t port = bridge->port();
    EXPECT_NE(port, 0);
    EXPECT_TRUE(allocator_->is_tcp_port_used(port));
    EXPECT_TRUE(bridge->is_running());
    EXPECT_TRUE(fs::exists(test_dir_ / "bridge" / "ubridge.log"));

    bridge->stop();
    EXPECT_FALSE(bridge->is_running());
    EXPECT_FALSE(allocator_->is_tcp_port_used(port));
    EXPECT_EQ(bridge->port(), 0);
    EXPECT_FALSE(fs::exists(test_dir_ / "bridge" / "ubridge.log"));
}

TEST_F(BridgeHypervisorTest, StartFailsOnOldVersion) {
    auto bridge = make_bridge(script("ubridge", "echo 'ubridge version 0.9.1'\n"));
    EXPECT_THROW(bridge->start(), BridgeError);
    EXPECT_FALSE(bridge->is_running());
    EXPECT_TRUE(allocator_->tcp_ports().empty());
}

TEST_F(BridgeHypervisorTest, ConnectTimesOut) {
    auto bridge = make_bridge(test_dir_ / "bin" / "missing");
    EXPECT_THROW(bridge->connect(std::chrono::milliseconds(300)), BridgeError);
    EXPECT_THROW(bridge->send("hypervisor version"), BridgeError);
}

// ============================================================================
// Control Protocol Tests
// ============================================================================

TEST_F(BridgeHypervisorTest, ParseCompleteReply) {
    std::vector<std::string> lines;
    EXPECT_TRUE(BridgeHypervisor::parse_reply("101 bridge0\r\n101 bridge1\r\n100-OK\r\n", lines));
    EXPECT_EQ(lines, (std::vector<std::string>{"bridge0", "bridge1"}));

    EXPECT_TRUE(BridgeHypervisor::parse_reply("100-0.9.18\r\n", lines));
    EXPECT_EQ(lines, (std::vector<std::string>{"0.9.18"}));

    EXPECT_TRUE(BridgeHypervisor::parse_reply("100-OK\r\n", lines));
    EXPECT_TRUE(lines.empty());
}

TEST_F(BridgeHypervisorTest, ParseIncompleteReply) {
    std::vector<std::string> lines;
    EXPECT_FALSE(BridgeHypervisor::parse_reply("", lines));
    EXPECT_FALSE(BridgeHypervisor::parse_reply("100-OK", lines));
    EXPECT_FALSE(BridgeHypervisor::parse_reply("101 bridge0\r\n", lines));
}

TEST_F(BridgeHypervisorTest, ParseErrorReply) {
    std::vector<std::string> lines;
    try {
        BridgeHypervisor::parse_reply("209-Cannot compile filter 'tcp[': syntax error\r\n", lines);
        FAIL() << "Expected BridgeError";
    } catch (const BridgeError& ex) {
        EXPECT_STREQ(ex.what(), "Cannot compile filter 'tcp[': syntax error");
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
