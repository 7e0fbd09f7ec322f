// cppcheck-suppress-file missingIncludeSystem
#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "command_runner.hpp"
#include "command_runner_test_hooks.hpp"
#include "network_monitor.hpp"
#include "test_support.hpp"
#include "utils.hpp"

namespace hostscope {
namespace {

using testing_support::contains;
using testing_support::make_executable;
using testing_support::ScopedEnvVar;
using testing_support::write_text;

constexpr const char* kTcpTable =
    "  sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode\n"
    "   0: 0100007F:0CEA 00000000:0000 0A 00000000:00000000 00:00000000 00000000  1000        0 12345 1 "
    "0000000000000000 100 0 0 10 0\n"
    "   1: 0F02000A:C350 2E1C0A0A:01BB 01 00000000:00000000 02:000A7E4C 00000000     0        0 67890 2 "
    "0000000000000000 20 4 30 10 -1\n"
    "   2: truncated line\n";

constexpr const char* kTcp6Table =
    "  sl  local_address                         remote_address                        st tx_queue rx_queue tr "
    "tm->when retrnsmt   uid  timeout inode\n"
    "   0: 00000000000000000000000001000000:0016 00000000000000000000000000000000:0000 0A 00000000:00000000 "
    "00:00000000 00000000     0        0 555 1 0000000000000000 100 0 0 10 0\n";

TEST(Ipv4DecodeTest, ReversesLittleEndianBytes)
{
    auto ip = decode_ipv4_hex("0100007F");
    ASSERT_TRUE(ip);
    EXPECT_EQ(*ip, "127.0.0.1");

    auto any = decode_ipv4_hex("00000000");
    ASSERT_TRUE(any);
    EXPECT_EQ(*any, "0.0.0.0");
}

TEST(Ipv4DecodeTest, RejectsMalformedInput)
{
    EXPECT_FALSE(decode_ipv4_hex("0100007"));
    EXPECT_FALSE(decode_ipv4_hex("ZZ00007F"));
}

struct Ipv6Case {
    const char* hex;
    const char* expected;
};

class Ipv6DecodeTest : public ::testing::TestWithParam<Ipv6Case> {};

TEST_P(Ipv6DecodeTest, FormatsCompressedAddress)
{
    const auto& param = GetParam();
    auto ip = decode_ipv6_hex(param.hex);
    ASSERT_TRUE(ip) << param.hex;
    EXPECT_EQ(*ip, param.expected);
}

INSTANTIATE_TEST_SUITE_P(
    KernelTables, Ipv6DecodeTest,
    ::testing::Values(Ipv6Case{"00000000000000000000000000000000", "::"},
                      Ipv6Case{"00000000000000000000000001000000", "::1"},
                      Ipv6Case{"0000000000000000FFFF00000100007F", "::ffff:7f00:1"},
                      Ipv6Case{"000080FE000000000000000001000000", "fe80::1"},
                      // two equal zero runs: the leftmost one is collapsed
                      Ipv6Case{"00000100010000000000000001000100", "1::1:0:0:1:1"}));

TEST(Ipv6DecodeTest, RejectsWrongLength)
{
    EXPECT_FALSE(decode_ipv6_hex("0000"));
}

TEST(TcpStateTest, NamesKnownStates)
{
    EXPECT_STREQ(tcp_state_name("0A"), "LISTEN");
    EXPECT_STREQ(tcp_state_name("01"), "ESTABLISHED");
    EXPECT_STREQ(tcp_state_name("06"), "TIME_WAIT");
    EXPECT_STREQ(tcp_state_name("FF"), "UNKNOWN");
}

TEST(SocketTableTest, ParsesIpv4RowsAndSkipsShortLines)
{
    const auto sockets = parse_socket_table(kTcpTable, false);
    ASSERT_EQ(sockets.size(), 2u);

    EXPECT_EQ(sockets[0].local_ip, "127.0.0.1");
    EXPECT_EQ(sockets[0].local_port, 3306u);
    EXPECT_EQ(sockets[0].remote_ip, "0.0.0.0");
    EXPECT_EQ(sockets[0].remote_port, 0u);
    EXPECT_EQ(sockets[0].state, "0A");
    EXPECT_EQ(sockets[0].state_name, "LISTEN");
    EXPECT_EQ(sockets[0].uid, "1000");
    EXPECT_EQ(sockets[0].inode, "12345");

    EXPECT_EQ(sockets[1].local_ip, "10.0.2.15");
    EXPECT_EQ(sockets[1].local_port, 50000u);
    EXPECT_EQ(sockets[1].remote_ip, "10.10.28.46");
    EXPECT_EQ(sockets[1].remote_port, 443u);
    EXPECT_EQ(sockets[1].state_name, "ESTABLISHED");
}

TEST(SocketTableTest, ParsesIpv6Rows)
{
    const auto sockets = parse_socket_table(kTcp6Table, true);
    ASSERT_EQ(sockets.size(), 1u);
    EXPECT_EQ(sockets[0].local_ip, "::1");
    EXPECT_EQ(sockets[0].local_port, 22u);
    EXPECT_EQ(sockets[0].remote_ip, "::");
}

TEST(SocketTableTest, HeaderOnlyYieldsNothing)
{
    EXPECT_TRUE(parse_socket_table("  sl  local_address rem_address st\n", false).empty());
}

TEST(ArpTableTest, SkipsShortLines)
{
    const auto entries = parse_arp_table("IP address       HW type     Flags       HW address            Mask     Device\n"
                                         "192.168.1.1      0x1         0x2         aa:bb:cc:dd:ee:ff     *        eth0\n"
                                         "192.168.1.9      0x1\n");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].ip_address, "192.168.1.1");
    EXPECT_EQ(entries[0].mac_address, "aa:bb:cc:dd:ee:ff");
    EXPECT_EQ(entries[0].device, "eth0");
}

TEST(UnixSocketTest, KeepsPathWithSpacesAndAllowsMissingPath)
{
    const auto sockets =
        parse_unix_sockets("Num       RefCount Protocol Flags    Type St Inode Path\n"
                           "0000000000000000: 00000002 00000000 00010000 0001 01 23456 /run/my socket\n"
                           "0000000000000000: 00000003 00000000 00000000 0001 03 23457\n");
    ASSERT_EQ(sockets.size(), 2u);
    ASSERT_EQ(sockets[0].columns.size(), 8u);
    EXPECT_EQ(sockets[0].columns[7], "/run/my socket");
    EXPECT_EQ(sockets[1].columns.size(), 7u);
}

TEST(IptablesSaveTest, ParsesChainsPoliciesAndRules)
{
    const auto chains = parse_iptables_save("# Generated by iptables-save\n"
                                            "*filter\n"
                                            ":INPUT DROP [0:0]\n"
                                            ":FORWARD ACCEPT [0:0]\n"
                                            ":OUTPUT ACCEPT [0:0]\n"
                                            ":DOCKER - [0:0]\n"
                                            "-A INPUT -s 10.0.0.0/8 -p tcp -m tcp --dport 22 -j ACCEPT\n"
                                            "-A INPUT ! -i lo -j DROP\n"
                                            "-A FORWARD -o docker0 -j DOCKER\n"
                                            "COMMIT\n");
    ASSERT_EQ(chains.size(), 4u);
    EXPECT_EQ(chains[0].name, "INPUT");
    EXPECT_EQ(chains[0].policy, "DROP");
    EXPECT_EQ(chains[3].name, "DOCKER");
    EXPECT_TRUE(chains[3].policy.empty());

    ASSERT_EQ(chains[0].rules.size(), 2u);
    const auto& ssh = chains[0].rules[0];
    EXPECT_EQ(ssh.src, "10.0.0.0/8");
    EXPECT_EQ(ssh.dst, "0.0.0.0/0");
    EXPECT_EQ(ssh.protocol, "tcp");
    EXPECT_EQ(ssh.target, "ACCEPT");
    ASSERT_EQ(ssh.matches.size(), 1u);
    EXPECT_EQ(ssh.matches[0], "tcp");

    EXPECT_EQ(chains[0].rules[1].in_interface, "!lo");
    EXPECT_EQ(chains[0].rules[1].protocol, "all");
    ASSERT_EQ(chains[1].rules.size(), 1u);
    EXPECT_EQ(chains[1].rules[0].out_interface, "docker0");
}

class NetworkSnapshotTest : public ::testing::Test {
  protected:
    void SetUp() override { root_ = testing_support::make_test_dir("net"); }
    void TearDown() override { std::filesystem::remove_all(root_); }

    std::filesystem::path root_;
};

TEST_F(NetworkSnapshotTest, TcpSnapshotReadsRemappedProc)
{
    write_text(root_ / "proc/net/tcp", kTcpTable);
    ScopedEnvVar proc("HOSTSCOPE_PROC_ROOT", root_.string());

    const Envelope env = snapshot_tcp_sockets();
    ASSERT_TRUE(env.ok()) << env.error_message;
    EXPECT_EQ(env.subtype, "TCP_SOCKETS_V4");
    uint64_t total = 0;
    ASSERT_TRUE(extract_json_uint64(env.data_json, "total", total));
    EXPECT_EQ(total, 2u);
    EXPECT_TRUE(contains(env.data_json, "\"local_ip\":\"127.0.0.1\""));
}

TEST_F(NetworkSnapshotTest, MissingTableIsIoFailure)
{
    ScopedEnvVar proc("HOSTSCOPE_PROC_ROOT", root_.string());
    const Envelope env = snapshot_udp6_sockets();
    EXPECT_FALSE(env.ok());
    EXPECT_EQ(env.subtype, "UDP_SOCKETS_V6");
    EXPECT_EQ(env.error_code, ErrorCode::IoFailure);
}

TEST_F(NetworkSnapshotTest, InterfacesReportNullCountersWhenUnreadable)
{
    write_text(root_ / "sys/class/net/eth0/statistics/rx_bytes", "1024\n");
    write_text(root_ / "sys/class/net/eth0/statistics/tx_bytes", "2048\n");
    write_text(root_ / "sys/class/net/eth0/operstate", "up\n");
    write_text(root_ / "sys/class/net/eth0/mtu", "1500\n");
    std::filesystem::create_directories(root_ / "sys/class/net/lo");
    ScopedEnvVar sys("HOSTSCOPE_SYS_ROOT", root_.string());

    const Envelope env = snapshot_network_interfaces();
    ASSERT_TRUE(env.ok()) << env.error_message;
    uint64_t total = 0;
    ASSERT_TRUE(extract_json_uint64(env.data_json, "total_interfaces", total));
    EXPECT_EQ(total, 2u);
    EXPECT_TRUE(contains(env.data_json, "{\"name\":\"eth0\",\"rx_bytes\":1024,\"tx_bytes\":2048,\"mtu\":1500"));
    EXPECT_TRUE(contains(env.data_json, "{\"name\":\"lo\",\"rx_bytes\":null,\"tx_bytes\":null"));
}

TEST_F(NetworkSnapshotTest, ArpAndUnixSnapshots)
{
    write_text(root_ / "proc/net/arp", "IP address HW type Flags HW address Mask Device\n"
                                       "10.0.0.1 0x1 0x2 00:11:22:33:44:55 * eth0\n");
    write_text(root_ / "proc/net/unix", "Num RefCount Protocol Flags Type St Inode Path\n"
                                        "0000: 00000002 00000000 00010000 0001 01 100\n");
    ScopedEnvVar proc("HOSTSCOPE_PROC_ROOT", root_.string());

    const Envelope arp = snapshot_arp_table();
    ASSERT_TRUE(arp.ok());
    EXPECT_TRUE(contains(arp.data_json, "\"mac_address\":\"00:11:22:33:44:55\""));

    const Envelope unix_env = snapshot_unix_sockets();
    ASSERT_TRUE(unix_env.ok());
    EXPECT_TRUE(contains(unix_env.data_json, "\"inode\":\"100\",\"path\":null"));
}

uid_t fake_root_uid()
{
    return 0;
}

uid_t fake_user_uid()
{
    return 1000;
}

class IptablesSnapshotTest : public NetworkSnapshotTest {
  protected:
    void TearDown() override
    {
        reset_command_runner_deps_for_test();
        NetworkSnapshotTest::TearDown();
    }

    void run_as(EffectiveUidFn uid)
    {
        CommandRunnerDeps deps;
        deps.effective_uid = uid;
        set_command_runner_deps_for_test(deps);
    }

    std::string fake_iptables_save(const std::string& body)
    {
        const auto path = root_ / "bin/iptables-save";
        write_text(path, "#!/bin/sh\n" + body);
        make_executable(path);
        return path.string();
    }
};

TEST_F(IptablesSnapshotTest, NonRootIsPermissionDeniedWithoutRunningTheTool)
{
    run_as(fake_user_uid);
    const auto marker = root_ / "ran";
    ScopedEnvVar tool("HOSTSCOPE_IPTABLES_SAVE", fake_iptables_save("touch '" + marker.string() + "'\n"));

    const Envelope env = snapshot_iptables_filter();
    EXPECT_FALSE(env.ok());
    EXPECT_EQ(env.subtype, "IPTABLES_FILTER");
    EXPECT_EQ(env.error_code, ErrorCode::IoFailure);
    EXPECT_TRUE(contains(env.error_message, "Permission denied"));
    EXPECT_FALSE(std::filesystem::exists(marker));
}

TEST_F(IptablesSnapshotTest, MissingToolIsToolNotAvailable)
{
    run_as(fake_root_uid);
    ScopedEnvVar tool("HOSTSCOPE_IPTABLES_SAVE", (root_ / "no-such-iptables-save").string());
    const Envelope env = snapshot_iptables_filter();
    EXPECT_FALSE(env.ok());
    EXPECT_EQ(env.error_code, ErrorCode::ToolNotAvailable);
}

TEST_F(IptablesSnapshotTest, RootReadsFilterTable)
{
    run_as(fake_root_uid);
    ScopedEnvVar tool("HOSTSCOPE_IPTABLES_SAVE", fake_iptables_save("cat <<'EOF'\n"
                                                                    "*filter\n"
                                                                    ":INPUT DROP [0:0]\n"
                                                                    ":OUTPUT ACCEPT [0:0]\n"
                                                                    "-A INPUT -p tcp -m tcp --dport 22 -j ACCEPT\n"
                                                                    "COMMIT\n"
                                                                    "EOF\n"));
    const Envelope env = snapshot_iptables_filter();
    ASSERT_TRUE(env.ok()) << env.error_message;
    EXPECT_TRUE(contains(env.data_json, "\"table\":\"filter\""));
    EXPECT_TRUE(contains(env.data_json, "\"name\":\"INPUT\",\"policy\":\"DROP\""));
    EXPECT_TRUE(contains(env.data_json, "\"target\":\"ACCEPT\""));
}

TEST_F(IptablesSnapshotTest, ToolFailureIsExecutionFailure)
{
    run_as(fake_root_uid);
    ScopedEnvVar tool("HOSTSCOPE_IPTABLES_SAVE", fake_iptables_save("exit 4\n"));
    const Envelope env = snapshot_iptables_filter();
    EXPECT_FALSE(env.ok());
    EXPECT_EQ(env.error_code, ErrorCode::ExecutionFailure);
    EXPECT_TRUE(contains(env.error_message, "status 4"));
}

} // namespace
} // namespace hostscope
