#include "Core/Config.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(ConfigTest, ReadFileReturnsContent)
{
    TestUtil::TempDir dir;
    const std::string path = dir.File("c.json");
    TestUtil::WriteAll(path, "{\"a\": 1}");

    EXPECT_EQ(Config::ReadFile(path), "{\"a\": 1}");
}

TEST(ConfigTest, ReadFileMissingNamesPath)
{
    TestUtil::TempDir dir;
    const std::string path = dir.File("absent.json");
    try
    {
        Config::ReadFile(path);
        FAIL() << "expected std::runtime_error";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_NE(std::string(e.what()).find(path), std::string::npos);
    }
}

TEST(ConfigTest, ParseSyntaxErrorNamesOrigin)
{
    try
    {
        Config::Parse("{ \"dns\": ", "/etc/dnsmng/config.json");
        FAIL() << "expected std::runtime_error";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_NE(std::string(e.what()).find("/etc/dnsmng/config.json"), std::string::npos);
    }
}

TEST(ConfigTest, RequireObject)
{
    const boost::json::value jv = Config::Parse(R"({"dns": {}, "n": 3})", "t");
    const boost::json::object &o = jv.as_object();

    EXPECT_TRUE(Config::RequireObject(o, "dns").empty());
    EXPECT_THROW(Config::RequireObject(o, "n"), std::runtime_error);
    EXPECT_THROW(Config::RequireObject(o, "missing"), std::runtime_error);
}

TEST(ConfigTest, RequireStringArrayKeepsOrder)
{
    const boost::json::value ok  = Config::Parse(R"(["b", "a", "c"])", "t");
    const boost::json::value mix = Config::Parse(R"(["a", 1])", "t");
    const boost::json::value str = Config::Parse(R"("a")", "t");

    EXPECT_EQ(Config::RequireStringArray(ok, "x"), (std::vector<std::string>{"b", "a", "c"}));
    EXPECT_THROW(Config::RequireStringArray(mix, "x"), std::runtime_error);
    EXPECT_THROW(Config::RequireStringArray(str, "x"), std::runtime_error);
}
