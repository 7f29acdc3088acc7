// tests/test_cli.cpp
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

#include "store/draft_store.hpp"

namespace fs = std::filesystem;

namespace test_cli
{
static fs::path work_dir()
{
    fs::path dir = fs::temp_directory_path() / ("gapcast-cli-" + std::to_string(::getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir / "out");
    return dir;
}

static std::vector<std::uint8_t> make_file(const fs::path &p, std::size_t n)
{
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>((i * 29 + 1) & 0xFF);
    std::ofstream out(p, std::ios::binary);
    out.write(reinterpret_cast<const char *>(v.data()), static_cast<std::streamsize>(v.size()));
    return v;
}

static std::vector<std::uint8_t> read_all(const fs::path &p)
{
    std::ifstream in(p, std::ios::binary);
    return std::vector<std::uint8_t>((std::istreambuf_iterator<char>(in)),
                                     std::istreambuf_iterator<char>());
}

static std::string env_prefix(const fs::path &out)
{
    return "GAPCAST_OUTPUT_DIR='" + out.string() +
           "' GAPCAST_CHUNK_SIZE=256 GAPCAST_STALL_TIMEOUT_MS=500 "
           "GAPCAST_DISPLAY_INTERVAL_MS=1 GAPCAST_LOG_LEVEL=error ";
}

static int run_sh(const std::string &cmd)
{
    int rc = std::system(cmd.c_str());
    if (rc == -1)
        return -1;
    return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}

static std::string send_bin()
{
    return std::string(GAPCAST_BIN_DIR) + "/gapcast-send";
}

static std::string recv_bin()
{
    return std::string(GAPCAST_BIN_DIR) + "/gapcast-recv";
}
}  // namespace test_cli

TEST(CLI, PipeSendToReceive)
{
    using namespace test_cli;
    const fs::path dir  = work_dir();
    const auto     data = make_file(dir / "data.bin", 2000);
    const auto     env  = env_prefix(dir / "out");

    const std::string cmd = env + send_bin() + " '" + (dir / "data.bin").string() +
                            "' 2>/dev/null | " + env + recv_bin() + " 2>/dev/null";
    EXPECT_EQ(run_sh(cmd), 0);
    EXPECT_EQ(read_all(dir / "out" / "RESTORED_data.bin"), data);
    EXPECT_FALSE(fs::exists(dir / "out" / "DRAFT_data.bin"));
    fs::remove_all(dir);
}

TEST(CLI, LostLineThenRemediate)
{
    using namespace test_cli;
    const fs::path dir  = work_dir();
    const auto     data = make_file(dir / "data.bin", 2000);
    const auto     env  = env_prefix(dir / "out");
    const auto     src  = "'" + (dir / "data.bin").string() + "'";
    const auto     man  = dir / "out" / "missing_parts.json";

    // drop the third symbol on the way
    const std::string lossy = env + send_bin() + " " + src + " 2>/dev/null | sed '3d' | " + env +
                              recv_bin() + " 2>/dev/null";
    EXPECT_EQ(run_sh(lossy), 4);

    auto m = store::read_manifest(man.string());
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->file_name, "data.bin");
    EXPECT_EQ(m->total_parts, 8u);
    EXPECT_EQ(m->missing, (std::vector<std::uint32_t>{3}));
    EXPECT_TRUE(fs::exists(dir / "out" / "DRAFT_data.bin"));

    const std::string fix = env + send_bin() + " " + src + " --remediate '" + man.string() +
                            "' 2>/dev/null | " + env + recv_bin() + " 2>/dev/null";
    EXPECT_EQ(run_sh(fix), 0);
    EXPECT_EQ(read_all(dir / "out" / "RESTORED_data.bin"), data);
    EXPECT_FALSE(fs::exists(man));
    fs::remove_all(dir);
}

TEST(CLI, SenderRejectsBadInput)
{
    using namespace test_cli;
    const fs::path dir = work_dir();

    EXPECT_EQ(run_sh(send_bin() + " 2>/dev/null"), 2);
    EXPECT_EQ(run_sh(send_bin() + " --bogus x 2>/dev/null"), 2);
    EXPECT_EQ(run_sh(send_bin() + " '" + (dir / "absent.bin").string() +
                     "' >/dev/null 2>&1"),
              3);

    make_file(dir / "data.bin", 10);
    std::ofstream(dir / "bad.json") << "{\"missing\": []}";
    EXPECT_EQ(run_sh(send_bin() + " '" + (dir / "data.bin").string() + "' --remediate '" +
                     (dir / "bad.json").string() + "' >/dev/null 2>&1"),
              3);
    fs::remove_all(dir);
}

TEST(CLI, ReceiverExitsWhenInputEndsEmpty)
{
    using namespace test_cli;
    const fs::path dir = work_dir();
    const auto     env = env_prefix(dir / "out");

    // no part ever arrives: stdin closing ends the scan
    EXPECT_EQ(run_sh(env + recv_bin() + " </dev/null 2>/dev/null"), 5);
    EXPECT_EQ(run_sh(env + send_bin() + " '" + (dir / "absent.bin").string() +
                     "' 2>/dev/null | " + env + recv_bin() + " 2>/dev/null"),
              5);
    EXPECT_TRUE(fs::is_empty(dir / "out"));
    fs::remove_all(dir);
}
