#include "utils.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>

TEST(MeshConfigTest, ParsesBothSections)
{
    MeshConfig config = parseMeshConfigText(
        "# mesh settings\n"
        "[mesh]\n"
        "k_hops = 2\n"
        "update_interval_ms = 2000\n"
        "cost_model = unit\n"
        "verbose = yes\n"
        "\n"
        "[topology]\n"
        "nodes = SAT-1, SAT-2, SAT-3\n"
        "links = SAT-1:SAT-2, SAT-2:SAT-3:0.5\n"
        "link_duration_s = 600\n");

    EXPECT_EQ(config.kHops, 2);
    EXPECT_EQ(config.updateInterval, Millis(2000));
    EXPECT_EQ(config.costModel, "unit");
    EXPECT_TRUE(config.verbose);

    ASSERT_EQ(config.nodes.size(), 3u);
    EXPECT_EQ(config.nodes[2], "SAT-3");
    ASSERT_EQ(config.links.size(), 2u);
    EXPECT_EQ(config.links[0].a, "SAT-1");
    EXPECT_EQ(config.links[0].b, "SAT-2");
    EXPECT_DOUBLE_EQ(config.links[0].quality, 1.0);
    EXPECT_DOUBLE_EQ(config.links[1].quality, 0.5);
    EXPECT_EQ(config.linkDuration, std::chrono::seconds(600));
}

TEST(MeshConfigTest, RouteAgeFollowsUpdateInterval)
{
    MeshConfig derived = parseMeshConfigText("[mesh]\nupdate_interval_ms = 400\n");
    EXPECT_EQ(derived.maxRouteAge, Millis(1200));

    MeshConfig explicitAge = parseMeshConfigText("[mesh]\nupdate_interval_ms = 400\nmax_route_age_ms = 900\n");
    EXPECT_EQ(explicitAge.maxRouteAge, Millis(900));
}

TEST(MeshConfigTest, EmptyTextGivesDefaults)
{
    MeshConfig config = parseMeshConfigText("");
    EXPECT_EQ(config.kHops, 3);
    EXPECT_EQ(config.updateInterval, Millis(5000));
    EXPECT_EQ(config.maxRouteAge, Millis(15000));
    EXPECT_EQ(config.costModel, "composite");
    EXPECT_TRUE(config.nodes.empty());
}

TEST(MeshConfigTest, RejectsUnknownNames)
{
    EXPECT_THROW(parseMeshConfigText("[routing]\nk_hops = 2\n"), ConfigError);
    EXPECT_THROW(parseMeshConfigText("[mesh]\nhops = 2\n"), ConfigError);
    EXPECT_THROW(parseMeshConfigText("k_hops = 2\n"), ConfigError);
    EXPECT_THROW(parseMeshConfigText("[mesh]\ncost_model = euclid\n"), ConfigError);
}

TEST(MeshConfigTest, RejectsBadValues)
{
    EXPECT_THROW(parseMeshConfigText("[mesh]\nk_hops = 0\n"), ConfigError);
    EXPECT_THROW(parseMeshConfigText("[mesh]\nk_hops = two\n"), ConfigError);
    EXPECT_THROW(parseMeshConfigText("[mesh]\nupdate_interval_ms = 10ms\n"), ConfigError);
    EXPECT_THROW(parseMeshConfigText("[mesh]\njitter_min_ms = 400\njitter_max_ms = 100\n"), ConfigError);
    EXPECT_THROW(parseMeshConfigText("[mesh]\nverbose = maybe\n"), ConfigError);
    EXPECT_THROW(parseMeshConfigText("[mesh]\njust some words\n"), ConfigError);
}

TEST(MeshConfigTest, RejectsBadLinks)
{
    EXPECT_THROW(parseMeshConfigText("[topology]\nlinks = SAT-1\n"), ConfigError);
    EXPECT_THROW(parseMeshConfigText("[topology]\nlinks = SAT-1:SAT-1\n"), ConfigError);
    EXPECT_THROW(parseMeshConfigText("[topology]\nlinks = A:B:1.5\n"), ConfigError);
}

TEST(MeshConfigTest, ReadsFile)
{
    const std::string path = ::testing::TempDir() + "satmesh_config_test.conf";
    {
        std::ofstream out(path);
        out << "[mesh]\nk_hops = 4\n";
    }
    EXPECT_EQ(parseMeshConfig(path).kHops, 4);
    std::remove(path.c_str());

    EXPECT_THROW(parseMeshConfig(path), ConfigError);
}

TEST(UtilsTest, SplitAndTrim)
{
    auto parts = split("a,b,,c", ',');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[2], "");
    EXPECT_EQ(trim("  x y \t\n"), "x y");
    EXPECT_EQ(trim("   "), "");
}

TEST(UtilsTest, HmacIsStableHex)
{
    std::string first = toHex(computeHMAC("payload", "key"));
    EXPECT_EQ(first.size(), 64u);
    EXPECT_EQ(first, toHex(computeHMAC("payload", "key")));
    EXPECT_NE(first, toHex(computeHMAC("payload!", "key")));
}
