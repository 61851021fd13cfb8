/**
 * @file test_port_allocator.cpp
 * @brief Unit tests for PortAllocator
 *
 * Tests port allocation including:
 * - Console and tunnel allocation, reservation and release
 * - Banned ports and ignore sets
 * - Boundary behavior at the end of a range
 * - Host selection for remote consoles
 * - Thread safety
 */

#include <gtest/gtest.h>
#include "emucore/errors.hpp"
#include "emucore/port_allocator.hpp"
#include "emucore/project.hpp"

#include <asio.hpp>

#include <filesystem>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>
#include <vector>

using namespace emucore;
namespace fs = std::filesystem;

namespace {
    const std::string PROJECT_ID = "3f1a8c52-9b4e-4d6a-8e2f-1c7b5d9a0e31";

    // Probe that fails for the ports in busy and records every call
    struct FakeProbe {
        std::set<uint16_t> busy;
        std::vector<std::pair<std::string, uint16_t>> calls;
        std::mutex mutex;

        PortProbe probe() {
            return [this](const std::string& host, uint16_t port, PortProtocol) {
                std::lock_guard<std::mutex> lock(mutex);
                calls.emplace_back(host, port);
                if (busy.count(port) > 0) {
                    throw std::system_error(std::make_error_code(std::errc::address_in_use), "bind");
                }
            };
        }
    };
}

// Test fixture for port allocator tests
class PortAllocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "emucore_port_allocator_test";
        fs::remove_all(test_dir_);
        project_ = std::make_shared<Project>("ports", PROJECT_ID, test_dir_ / "project");
    }

    void TearDown() override {
        project_.reset();
        fs::remove_all(test_dir_);
    }

    std::unique_ptr<PortAllocator> make_allocator(uint16_t start, uint16_t end) {
        config::ServerConfig cfg;
        cfg.console_start_port_range = start;
        cfg.console_end_port_range = end;
        cfg.udp_start_port_range = 20000;
        cfg.udp_end_port_range = 20010;
        return std::make_unique<PortAllocator>(cfg, probe_.probe());
    }

    fs::path test_dir_;
    std::shared_ptr<Project> project_;
    FakeProbe probe_;
};

// ============================================================================
// Console Port Tests
// ============================================================================

TEST_F(PortAllocatorTest, SequentialAllocationFromRangeStart) {
    auto allocator = make_allocator(5000, 5002);

    EXPECT_EQ(allocator->get_free_tcp_port(*project_), 5000);
    EXPECT_EQ(allocator->get_free_tcp_port(*project_), 5001);

    EXPECT_TRUE(allocator->is_tcp_port_used(5000));
    EXPECT_TRUE(allocator->is_tcp_port_used(5001));
    EXPECT_EQ(project_->tcp_ports(), (std::set<uint16_t>{5000, 5001}));
}

TEST_F(PortAllocatorTest, ExhaustionNamesRangeAndHost) {
    auto allocator = make_allocator(5000, 5001);

    allocator->get_free_tcp_port(*project_);
    allocator->get_free_tcp_port(*project_);

    try {
        allocator->get_free_tcp_port(*project_);
        FAIL() << "Expected PortExhaustedError";
    } catch (const PortExhaustedError& ex) {
        EXPECT_EQ(ex.start(), 5000);
        EXPECT_EQ(ex.end(), 5001);
        EXPECT_EQ(ex.host(), "0.0.0.0");
        std::string message = ex.what();
        EXPECT_NE(message.find("between 5000 and 5001"), std::string::npos);
        EXPECT_NE(message.find("0.0.0.0"), std::string::npos);
    }
}

TEST_F(PortAllocatorTest, FailureBeforeLastPortEndsSearch) {
    // 5001 fails its probe; since 5001 + 1 == 5002 the last port is never tried
    auto allocator = make_allocator(5000, 5002);
    probe_.busy = {5001};

    EXPECT_EQ(allocator->get_free_tcp_port(*project_), 5000);
    EXPECT_THROW(allocator->get_free_tcp_port(*project_), PortExhaustedError);
    EXPECT_FALSE(allocator->is_tcp_port_used(5002));
}

// With every port bindable the third call from [5000, 5002] returns 5002
// rather than failing. The end-of-range check only stops the scan after a
// failed probe on the next-to-last port (see FailureBeforeLastPortEndsSearch).
TEST_F(PortAllocatorTest, LastPortReachableWhenPrecedingPortsIgnored) {
    auto allocator = make_allocator(5000, 5002);

    allocator->get_free_tcp_port(*project_);
    allocator->get_free_tcp_port(*project_);
    EXPECT_EQ(allocator->get_free_tcp_port(*project_), 5002);
}

TEST_F(PortAllocatorTest, ExhaustionCarriesLastBindError) {
    auto allocator = make_allocator(5000, 5000);
    probe_.busy = {5000};

    try {
        allocator->get_free_tcp_port(*project_);
        FAIL() << "Expected PortExhaustedError";
    } catch (const PortExhaustedError& ex) {
        EXPECT_EQ(ex.last_error(), std::make_error_code(std::errc::address_in_use));
    }
}

TEST_F(PortAllocatorTest, BannedPortsAreSkipped) {
    auto allocator = make_allocator(4044, 4047);

    // 4045 is the NFS lock daemon port
    EXPECT_EQ(allocator->get_free_tcp_port(*project_), 4044);
    EXPECT_EQ(allocator->get_free_tcp_port(*project_), 4046);
    for (const auto& call : probe_.calls) {
        EXPECT_NE(call.second, 4045);
    }
}

TEST_F(PortAllocatorTest, ExplicitRangeOverridesDefault) {
    auto allocator = make_allocator(5000, 5010);

    uint16_t port = allocator->get_free_tcp_port(*project_, PortRange{5900, 6000});
    EXPECT_EQ(port, 5900);
}

TEST_F(PortAllocatorTest, SpecificHostAlsoProbesWildcard) {
    config::ServerConfig cfg;
    cfg.console_host = "127.0.0.1";
    PortAllocator allocator(cfg, probe_.probe());

    allocator.get_free_tcp_port(*project_);

    ASSERT_EQ(probe_.calls.size(), 2u);
    EXPECT_EQ(probe_.calls[0].first, "127.0.0.1");
    EXPECT_EQ(probe_.calls[1].first, "0.0.0.0");
}

TEST_F(PortAllocatorTest, FindUnusedPortRejectsInvertedRange) {
    EXPECT_THROW(PortAllocator::find_unused_port(5002, 5000, "0.0.0.0", PortProtocol::TCP, {}, probe_.probe()),
                 PortRangeInvalidError);
}

TEST_F(PortAllocatorTest, ConstructorRejectsInvertedRange) {
    config::ServerConfig cfg;
    cfg.console_start_port_range = 6000;
    cfg.console_end_port_range = 5000;
    EXPECT_THROW(PortAllocator allocator(cfg, probe_.probe()), PortRangeInvalidError);
}

TEST_F(PortAllocatorTest, FindUnusedPortHandlesTopOfPortSpace) {
    std::set<uint16_t> ignore = {65534};
    EXPECT_EQ(PortAllocator::find_unused_port(65534, 65535, "0.0.0.0", PortProtocol::UDP, ignore, probe_.probe()),
              65535);
}

// ============================================================================
// Reservation Tests
// ============================================================================

TEST_F(PortAllocatorTest, ReserveFreePortKeepsIt) {
    auto allocator = make_allocator(5000, 5010);

    EXPECT_EQ(allocator->reserve_tcp_port(5005, *project_), 5005);
    EXPECT_TRUE(allocator->is_tcp_port_used(5005));
}

TEST_F(PortAllocatorTest, ReserveUsedPortSubstitutes) {
    auto allocator = make_allocator(5000, 5010);
    allocator->reserve_tcp_port(5005, *project_);

    uint16_t replacement = allocator->reserve_tcp_port(5005, *project_);
    EXPECT_NE(replacement, 5005);
    EXPECT_EQ(replacement, 5000);
}

TEST_F(PortAllocatorTest, ReserveOutOfRangeSubstitutes) {
    auto allocator = make_allocator(5000, 5010);

    EXPECT_EQ(allocator->reserve_tcp_port(7000, *project_), 5000);
    EXPECT_FALSE(allocator->is_tcp_port_used(7000));
}

TEST_F(PortAllocatorTest, ReserveUnbindablePortSubstitutes) {
    auto allocator = make_allocator(5000, 5010);
    probe_.busy = {5003};

    EXPECT_EQ(allocator->reserve_tcp_port(5003, *project_), 5000);
}

TEST_F(PortAllocatorTest, StrictReservationThrowsOnConflict) {
    auto allocator = make_allocator(5000, 5010);
    allocator->reserve_tcp_port_strict(5004, *project_);

    EXPECT_THROW(allocator->reserve_tcp_port_strict(5004, *project_), PortConflictError);
    EXPECT_THROW(allocator->reserve_tcp_port_strict(7000, *project_), PortConflictError);
}

TEST_F(PortAllocatorTest, ReleaseReturnsPortToPool) {
    auto allocator = make_allocator(5000, 5010);
    uint16_t port = allocator->get_free_tcp_port(*project_);

    allocator->release_tcp_port(port, *project_);

    EXPECT_FALSE(allocator->is_tcp_port_used(port));
    EXPECT_TRUE(project_->tcp_ports().empty());
    EXPECT_EQ(allocator->get_free_tcp_port(*project_), port);
}

TEST_F(PortAllocatorTest, ReleaseUntrackedPortIsNoOp) {
    auto allocator = make_allocator(5000, 5010);
    EXPECT_NO_THROW(allocator->release_tcp_port(5007, *project_));
    EXPECT_NO_THROW(allocator->release_udp_port(20005, *project_));
}

// ============================================================================
// UDP Port Tests
// ============================================================================

TEST_F(PortAllocatorTest, UdpAllocationAndRelease) {
    auto allocator = make_allocator(5000, 5010);

    uint16_t first = allocator->get_free_udp_port(*project_);
    uint16_t second = allocator->get_free_udp_port(*project_);
    EXPECT_EQ(first, 20000);
    EXPECT_EQ(second, 20001);
    EXPECT_EQ(project_->udp_ports(), (std::set<uint16_t>{20000, 20001}));

    allocator->release_udp_port(first, *project_);
    EXPECT_FALSE(allocator->is_udp_port_used(first));
    EXPECT_TRUE(allocator->is_udp_port_used(second));
}

TEST_F(PortAllocatorTest, UdpReservationConflictThrows) {
    auto allocator = make_allocator(5000, 5010);

    EXPECT_EQ(allocator->reserve_udp_port(20003, *project_), 20003);
    EXPECT_THROW(allocator->reserve_udp_port(20003, *project_), PortConflictError);
    EXPECT_THROW(allocator->reserve_udp_port(30000, *project_), PortConflictError);
}

TEST_F(PortAllocatorTest, TcpAndUdpPoolsAreIndependent) {
    config::ServerConfig cfg;
    cfg.console_start_port_range = 20000;
    cfg.console_end_port_range = 20010;
    cfg.udp_start_port_range = 20000;
    cfg.udp_end_port_range = 20010;
    PortAllocator allocator(cfg, probe_.probe());

    EXPECT_EQ(allocator.get_free_tcp_port(*project_), 20000);
    EXPECT_EQ(allocator.get_free_udp_port(*project_), 20000);
}

// ============================================================================
// Host Tests
// ============================================================================

TEST_F(PortAllocatorTest, RemoteConsoleUsesWildcard) {
    config::ServerConfig cfg;
    cfg.console_host = "192.168.1.10";
    cfg.allow_remote_console = true;
    PortAllocator allocator(cfg, probe_.probe());

    EXPECT_EQ(allocator.console_host(), "0.0.0.0");
}

TEST_F(PortAllocatorTest, RemoteConsoleUsesIpv6WildcardForIpv6Host) {
    config::ServerConfig cfg;
    cfg.console_host = "fe80::1";
    cfg.allow_remote_console = true;
    PortAllocator allocator(cfg, probe_.probe());

    EXPECT_EQ(allocator.console_host(), "::");
}

TEST_F(PortAllocatorTest, LocalConsoleKeepsConfiguredHost) {
    config::ServerConfig cfg;
    cfg.console_host = "127.0.0.1";
    PortAllocator allocator(cfg, probe_.probe());

    EXPECT_EQ(allocator.console_host(), "127.0.0.1");
    EXPECT_EQ(allocator.udp_host(), "0.0.0.0");
}

// ============================================================================
// Live Probe Tests
// ============================================================================

TEST_F(PortAllocatorTest, CheckPortFailsOnListeningSocket) {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    uint16_t port = acceptor.local_endpoint().port();

    EXPECT_THROW(PortAllocator::check_port("127.0.0.1", port, PortProtocol::TCP), std::system_error);
}

TEST_F(PortAllocatorTest, CheckPortSucceedsOnReleasedPort) {
    uint16_t port = 0;
    {
        asio::io_context io;
        asio::ip::udp::socket socket(io, asio::ip::udp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        port = socket.local_endpoint().port();
    }

    EXPECT_NO_THROW(PortAllocator::check_port("127.0.0.1", port, PortProtocol::UDP));
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(PortAllocatorTest, ConcurrentAllocationsAreDistinct) {
    auto allocator = make_allocator(5000, 5100);
    const int num_threads = 8;
    const int per_thread = 10;

    std::vector<std::thread> threads;
    std::vector<std::vector<uint16_t>> results(num_threads);

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < per_thread; ++i) {
                results[t].push_back(allocator->get_free_tcp_port(*project_));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<uint16_t> unique;
    for (const auto& ports : results) {
        unique.insert(ports.begin(), ports.end());
    }
    EXPECT_EQ(unique.size(), static_cast<size_t>(num_threads * per_thread));
    EXPECT_EQ(allocator->tcp_ports(), unique);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
