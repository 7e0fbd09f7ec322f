// cppcheck-suppress-file missingIncludeSystem
#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>

#include "kallsyms_monitor.hpp"
#include "test_support.hpp"
#include "utils.hpp"

namespace hostscope {
namespace {

using testing_support::contains;
using testing_support::ScopedEnvVar;
using testing_support::write_text;

constexpr const char* kKallsyms = "ffffffff81000000 T _stext\n"
                                  "ffffffff81000010 T startup_64\n"
                                  "ffffffff81200000 t tcp_v4_connect\n"
                                  "ffffffff81200100 T tcp_sendmsg\n"
                                  "ffffffffc0a00000 t ext4_fill_super\t[ext4]\n"
                                  "ffffffffc0a00100 T ext4_sync_fs\t[ext4]\n"
                                  "ffffffffc0b00000 t nf_tcp_pkt\t[nf_conntrack]\n"
                                  "garbage\n";

TEST(KallsymsParseTest, CoreSymbolHasNoModule)
{
    auto sym = parse_kallsyms_line("ffffffff81000000 T _stext");
    ASSERT_TRUE(sym.has_value());
    EXPECT_EQ(sym->address, "ffffffff81000000");
    EXPECT_EQ(sym->type, "T");
    EXPECT_EQ(sym->name, "_stext");
    EXPECT_FALSE(sym->module.has_value());
}

TEST(KallsymsParseTest, TrailingBracketIsModule)
{
    auto sym = parse_kallsyms_line("ffffffffc0a00000 t ext4_fill_super\t[ext4]");
    ASSERT_TRUE(sym.has_value());
    EXPECT_EQ(sym->name, "ext4_fill_super");
    ASSERT_TRUE(sym->module.has_value());
    EXPECT_EQ(*sym->module, "ext4");
}

TEST(KallsymsParseTest, ShortLineIsRejected)
{
    EXPECT_FALSE(parse_kallsyms_line("ffffffff81000000 T").has_value());
    EXPECT_FALSE(parse_kallsyms_line("").has_value());
}

TEST(KallsymsScanTest, NoFiltersKeepsEverySymbol)
{
    KallsymsOptions options;
    options.max_symbols = 0;
    auto query = compile_symbol_query(options);
    ASSERT_TRUE(query);

    std::istringstream in(kKallsyms);
    const SymbolScan scan = scan_kallsyms(in, *query);
    EXPECT_EQ(scan.total_symbols, 7u);
    EXPECT_EQ(scan.symbols.size(), 7u);
}

TEST(KallsymsScanTest, NameFilterUsesSearchSemantics)
{
    KallsymsOptions options;
    options.name_regex = "tcp";
    auto query = compile_symbol_query(options);
    ASSERT_TRUE(query);

    std::istringstream in(kKallsyms);
    const SymbolScan scan = scan_kallsyms(in, *query);
    ASSERT_EQ(scan.total_symbols, 3u);
    EXPECT_EQ(scan.symbols[0].name, "tcp_v4_connect");
    EXPECT_EQ(scan.symbols[1].name, "tcp_sendmsg");
    EXPECT_EQ(scan.symbols[2].name, "nf_tcp_pkt");
}

TEST(KallsymsScanTest, ModuleFilterExcludesCoreSymbols)
{
    KallsymsOptions options;
    options.module_regex = "^ext4$";
    auto query = compile_symbol_query(options);
    ASSERT_TRUE(query);

    std::istringstream in(kKallsyms);
    const SymbolScan scan = scan_kallsyms(in, *query);
    EXPECT_EQ(scan.total_symbols, 2u);
    for (const auto& sym : scan.symbols) {
        EXPECT_EQ(sym.module.value_or(""), "ext4");
    }
}

TEST(KallsymsScanTest, FilterMatchingNothingIsEmpty)
{
    KallsymsOptions options;
    options.name_regex = "^does_not_exist$";
    auto query = compile_symbol_query(options);
    ASSERT_TRUE(query);

    std::istringstream in(kKallsyms);
    const SymbolScan scan = scan_kallsyms(in, *query);
    EXPECT_EQ(scan.total_symbols, 0u);
    EXPECT_TRUE(scan.symbols.empty());
}

TEST(KallsymsScanTest, CapLimitsListButNotTotal)
{
    KallsymsOptions options;
    options.max_symbols = 2;
    auto query = compile_symbol_query(options);
    ASSERT_TRUE(query);

    std::istringstream in(kKallsyms);
    const SymbolScan scan = scan_kallsyms(in, *query);
    EXPECT_EQ(scan.total_symbols, 7u);
    ASSERT_EQ(scan.symbols.size(), 2u);
    EXPECT_EQ(scan.symbols[0].name, "_stext");
}

TEST(KallsymsScanTest, InvalidRegexIsInvalidArguments)
{
    KallsymsOptions options;
    options.name_regex = "([unclosed";
    auto query = compile_symbol_query(options);
    ASSERT_FALSE(query);
    EXPECT_EQ(query.error().code(), ErrorCode::InvalidArguments);
}

class KallsymsSnapshotTest : public ::testing::Test {
  protected:
    void SetUp() override { root_ = testing_support::make_test_dir("kallsyms"); }
    void TearDown() override { std::filesystem::remove_all(root_); }

    std::filesystem::path root_;
};

TEST_F(KallsymsSnapshotTest, ReportsCountsAndModules)
{
    write_text(root_ / "proc/kallsyms", kKallsyms);
    write_text(root_ / "proc/sys/kernel/kptr_restrict", "1\n");
    ScopedEnvVar proc("HOSTSCOPE_PROC_ROOT", root_.string());

    KallsymsOptions options;
    options.name_regex = "ext4";
    options.max_symbols = 1;
    const Envelope env = snapshot_kallsyms(options);
    ASSERT_TRUE(env.ok()) << env.error_message;
    EXPECT_EQ(env.subtype, "KALLSYMS");

    uint64_t total = 0;
    uint64_t returned = 0;
    uint64_t kptr = 0;
    ASSERT_TRUE(extract_json_uint64(env.data_json, "total_symbols", total));
    ASSERT_TRUE(extract_json_uint64(env.data_json, "returned_symbols", returned));
    ASSERT_TRUE(extract_json_uint64(env.data_json, "kptr_restrict", kptr));
    EXPECT_EQ(total, 2u);
    EXPECT_EQ(returned, 1u);
    EXPECT_EQ(kptr, 1u);
    EXPECT_TRUE(contains(env.data_json, "\"name\":\"ext4_fill_super\",\"module\":\"ext4\""));
    EXPECT_TRUE(contains(env.data_json, "\"addresses_redacted\":false"));
}

TEST_F(KallsymsSnapshotTest, ZeroedAddressesAreFlaggedAsRedacted)
{
    write_text(root_ / "proc/kallsyms", "0000000000000000 T _stext\n0000000000000000 T _etext\n");
    ScopedEnvVar proc("HOSTSCOPE_PROC_ROOT", root_.string());

    const Envelope env = snapshot_kallsyms(KallsymsOptions{});
    ASSERT_TRUE(env.ok()) << env.error_message;
    EXPECT_TRUE(contains(env.data_json, "\"kptr_restrict\":null"));
    EXPECT_TRUE(contains(env.data_json, "\"addresses_redacted\":true"));
    EXPECT_TRUE(contains(env.data_json, "\"module\":null"));
}

TEST_F(KallsymsSnapshotTest, MissingFileIsIoFailure)
{
    ScopedEnvVar proc("HOSTSCOPE_PROC_ROOT", root_.string());
    const Envelope env = snapshot_kallsyms(KallsymsOptions{});
    EXPECT_FALSE(env.ok());
    EXPECT_EQ(env.error_code, ErrorCode::IoFailure);
}

TEST_F(KallsymsSnapshotTest, InvalidRegexFailsBeforeReading)
{
    ScopedEnvVar proc("HOSTSCOPE_PROC_ROOT", root_.string());
    KallsymsOptions options;
    options.module_regex = "*bad";
    const Envelope env = snapshot_kallsyms(options);
    EXPECT_FALSE(env.ok());
    EXPECT_EQ(env.error_code, ErrorCode::InvalidArguments);
}

} // namespace
} // namespace hostscope
