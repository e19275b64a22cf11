#include "Core/DnsMng/LastSelection.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <optional>
#include <stdexcept>

namespace
{
    LastSelection MakeStore(const std::string &path)
    {
        LastSelection::Params p;
        p.path = path;
        return LastSelection(p);
    }
}

TEST(LastSelectionTest, SaveThenLoadReturnsSameName)
{
    TestUtil::TempDir dir;
    const LastSelection store = MakeStore(dir.File("last_dns"));

    for (const std::string name : {"cloudflare", "local", "my profile", "q9-ecs.v2"})
    {
        store.Save(name);
        auto loaded = store.Load();
        ASSERT_TRUE(loaded.has_value());
        EXPECT_EQ(*loaded, name);
    }
}

TEST(LastSelectionTest, SaveWritesRawNameWithoutDelimiter)
{
    TestUtil::TempDir dir;
    const std::string path = dir.File("last_dns");

    MakeStore(path).Save("cloudflare");

    EXPECT_EQ(TestUtil::ReadAll(path), "cloudflare");
}

TEST(LastSelectionTest, SaveCreatesParentDirectories)
{
    TestUtil::TempDir dir;
    const std::string path = dir.File("var/lib/dnsmng/last_dns");

    MakeStore(path).Save("google");

    const auto parent = std::filesystem::path(path).parent_path();
    ASSERT_TRUE(std::filesystem::is_directory(parent));
    const auto perms = std::filesystem::status(parent).permissions();
    EXPECT_EQ(perms & std::filesystem::perms::others_write, std::filesystem::perms::none);
    EXPECT_EQ(TestUtil::ReadAll(path), "google");
}

TEST(LastSelectionTest, LoadMissingIsNullopt)
{
    TestUtil::TempDir dir;
    EXPECT_FALSE(MakeStore(dir.File("last_dns")).Load().has_value());
}

TEST(LastSelectionTest, LoadReturnsContentVerbatim)
{
    TestUtil::TempDir dir;
    const std::string path = dir.File("last_dns");

    TestUtil::WriteAll(path, "");
    auto empty = MakeStore(path).Load();
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());

    TestUtil::WriteAll(path, "cloudflare\n");
    auto raw = MakeStore(path).Load();
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(*raw, "cloudflare\n");
}

TEST(LastSelectionTest, SaveFailsWhenParentIsAFile)
{
    TestUtil::TempDir dir;
    TestUtil::WriteAll(dir.File("blocker"), "x");

    EXPECT_THROW(MakeStore(dir.File("blocker/last_dns")).Save("local"), std::runtime_error);
}

TEST(LastSelectionTest, LoadUnreadableRecordIsNullopt)
{
    TestUtil::TempDir dir;
    const std::string path = dir.File("last_dns");
    std::filesystem::create_directory(path);

    std::optional<std::string> loaded;
    EXPECT_NO_THROW(loaded = MakeStore(path).Load());
    EXPECT_FALSE(loaded.has_value());
}
