#include <gtest/gtest.h>
#include "test_helpers.hpp"

using namespace calgrid;

TEST(GeneratorConfigTest, Defaults) {
    constexpr auto config = GeneratorConfig::defaults();
    EXPECT_EQ(config.grouping(), Grouping::per_day);
    EXPECT_EQ(config.offset_west_secs(), 0);
    EXPECT_EQ(config.precision(), Duration::from_milliseconds(1));
    EXPECT_TRUE(config.extend_begin());
    EXPECT_TRUE(config.extend_end());
    EXPECT_EQ(config, new_generator());
    EXPECT_EQ(config, GeneratorConfig{});
}

TEST(GeneratorConfigTest, BuildersReturnModifiedCopies) {
    const auto base = GeneratorConfig::defaults();
    const auto monthly = base.with_grouping(Grouping::per_month);

    EXPECT_EQ(monthly.grouping(), Grouping::per_month);
    EXPECT_EQ(base.grouping(), Grouping::per_day);
    EXPECT_NE(base, monthly);
}

TEST(GeneratorConfigTest, Chaining) {
    const auto config = new_generator()
                            .with_grouping(Grouping::per_week)
                            .with_offset_west_secs(-3600)
                            .with_precision(Duration::from_microseconds(1))
                            .without_extended_end();
    EXPECT_EQ(config.grouping(), Grouping::per_week);
    EXPECT_EQ(config.offset_west_secs(), -3600);
    EXPECT_EQ(config.precision(), Duration::from_microseconds(1));
    EXPECT_TRUE(config.extend_begin());
    EXPECT_FALSE(config.extend_end());
}

TEST(GeneratorConfigTest, ExtensionToggles) {
    const auto base = GeneratorConfig::defaults();

    EXPECT_FALSE(base.without_extended_begin().extend_begin());
    EXPECT_TRUE(base.without_extended_begin().extend_end());

    EXPECT_TRUE(base.without_extended_end().extend_begin());
    EXPECT_FALSE(base.without_extended_end().extend_end());

    const auto neither = base.without_extension();
    EXPECT_FALSE(neither.extend_begin());
    EXPECT_FALSE(neither.extend_end());
    EXPECT_EQ(neither, base.without_extended_end().without_extended_begin());
}

TEST(GeneratorConfigTest, LaterSettingWins) {
    const auto config = GeneratorConfig::defaults()
                            .with_offset_west_secs(7200)
                            .with_offset_west_secs(25200)
                            .with_grouping(Grouping::per_year)
                            .with_grouping(Grouping::per_hour);
    EXPECT_EQ(config.offset_west_secs(), 25200);
    EXPECT_EQ(config.grouping(), Grouping::per_hour);
}

TEST(GeneratorConfigTest, UsableAtCompileTime) {
    constexpr auto config = GeneratorConfig::defaults().with_grouping(Grouping::per_quarter);
    static_assert(config.grouping() == Grouping::per_quarter);
    static_assert(!config.without_extension().extend_begin());
    SUCCEED();
}
