#include <gtest/gtest.h>
#include "test_base.hpp"
#include "core/tool_locator.hpp"
#include <cstdlib>

class ToolLocatorTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        const char *path = std::getenv("PATH");
        saved_path_ = path ? path : "";
    }

    void TearDown() override
    {
        setenv("PATH", saved_path_.c_str(), 1);
        TestBase::TearDown();
    }

    std::string saved_path_;
};

TEST_F(ToolLocatorTest, ResolvesExplicitPath)
{
    std::string tool = createScript("ffmpeg", "exit 0");
    EXPECT_EQ(ToolLocator::resolve(tool), tool);
    EXPECT_EQ(ToolLocator::resolve(pathFor("missing/ffmpeg")), "");
}

TEST_F(ToolLocatorTest, NonExecutableFileIsNotFound)
{
    std::string plain = createDummyFile("ffprobe", "not executable");
    EXPECT_EQ(ToolLocator::resolve(plain), "");
}

TEST_F(ToolLocatorTest, SearchesPath)
{
    std::string tool = createScript("bin/recover_mp4", "exit 0");
    std::string path_value = pathFor("empty") + ":" + pathFor("bin");
    setenv("PATH", path_value.c_str(), 1);

    EXPECT_EQ(ToolLocator::resolve("recover_mp4"), tool);
    EXPECT_EQ(ToolLocator::resolve("ffmpeg"), "");
}

TEST_F(ToolLocatorTest, DependencyCheckMarksRequiredTools)
{
    ToolPaths tools;
    tools.ffmpeg = createScript("ffmpeg", "exit 0");
    tools.ffprobe = pathFor("no_ffprobe");
    tools.recover_mp4 = pathFor("no_recover_mp4");

    auto statuses = ToolLocator::checkDependencies(tools, true);
    ASSERT_EQ(statuses.size(), 3u);
    EXPECT_TRUE(statuses[0].found());
    EXPECT_FALSE(statuses[1].found());
    EXPECT_TRUE(statuses[1].required);
    EXPECT_FALSE(statuses[2].required);
    EXPECT_FALSE(ToolLocator::allRequiredFound(statuses));

    // ffprobe is not needed with the in-process probe backend
    auto in_process = ToolLocator::checkDependencies(tools, false);
    EXPECT_TRUE(ToolLocator::allRequiredFound(in_process));
}

TEST_F(ToolLocatorTest, ResolveAllKeepsUnresolvedNames)
{
    ToolPaths tools;
    tools.ffmpeg = createScript("bin/ffmpeg", "exit 0");
    tools.ffprobe = "definitely-not-installed-ffprobe";
    ToolPaths resolved = ToolLocator::resolveAll(tools);
    EXPECT_EQ(resolved.ffmpeg, tools.ffmpeg);
    EXPECT_EQ(resolved.ffprobe, "definitely-not-installed-ffprobe");
}
