#include <gtest/gtest.h>
#include "test_base.hpp"
#include "core/external_process.hpp"
#include <chrono>
#include <thread>

class ExternalProcessTest : public TestBase
{
protected:
    ToolInvocation script(const std::string &name, const std::string &body)
    {
        ToolInvocation invocation;
        invocation.program = createScript(name, body);
        return invocation;
    }
};

TEST_F(ExternalProcessTest, CollectsStdoutLines)
{
    ExternalProcess process(script("lines.sh", "echo first\necho second\necho third"), ExternalProcess::Capture::StdOut);
    std::vector<std::string> lines;
    ProcessResult result = process.runCollect(lines);

    EXPECT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(lines, (std::vector<std::string>{"first", "second", "third"}));
    EXPECT_EQ(result.lines_read, 3u);
}

TEST_F(ExternalProcessTest, CapturesOnlyStderrWhenAsked)
{
    ExternalProcess process(script("stderr.sh", "echo to-stdout\necho to-stderr >&2"), ExternalProcess::Capture::StdErr);
    std::vector<std::string> lines;
    ProcessResult result = process.runCollect(lines);

    EXPECT_TRUE(result.success);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "to-stderr");
}

TEST_F(ExternalProcessTest, PassesArgumentsUnmodified)
{
    ToolInvocation invocation = script("args.sh", "for a in \"$@\"; do echo \"[$a]\"; done");
    invocation.args = {"-i", "file with spaces.mp4", "-f", "null", "-"};

    ExternalProcess process(invocation, ExternalProcess::Capture::StdOut);
    std::vector<std::string> lines;
    process.runCollect(lines);
    EXPECT_EQ(lines, (std::vector<std::string>{"[-i]", "[file with spaces.mp4]", "[-f]", "[null]", "[-]"}));
}

TEST_F(ExternalProcessTest, ReportsNonZeroExit)
{
    ExternalProcess process(script("fail.sh", "echo broken >&2\nexit 3"), ExternalProcess::Capture::StdErr);
    std::vector<std::string> lines;
    ProcessResult result = process.runCollect(lines);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_NE(result.error_message.find("status 3"), std::string::npos);
    EXPECT_EQ(lines.size(), 1u);
}

TEST_F(ExternalProcessTest, LaunchFailureIsReported)
{
    ToolInvocation invocation;
    invocation.program = pathFor("no_such_tool");
    ExternalProcess process(invocation, ExternalProcess::Capture::StdOut);
    std::vector<std::string> lines;
    ProcessResult result = process.runCollect(lines);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(lines.empty());
}

TEST_F(ExternalProcessTest, TimeoutKillsChild)
{
    ExternalProcess process(script("slow.sh", "echo started\nexec sleep 30"), ExternalProcess::Capture::StdOut);
    process.setTimeout(std::chrono::seconds(1));

    auto start = std::chrono::steady_clock::now();
    std::vector<std::string> lines;
    ProcessResult result = process.runCollect(lines);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.success);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
    EXPECT_EQ(lines, std::vector<std::string>{"started"});
}

TEST_F(ExternalProcessTest, HandlerCanStopEarly)
{
    ExternalProcess process(script("chatty.sh", "i=0\nwhile [ $i -lt 200000 ]; do echo \"line $i\"; i=$((i+1)); done"),
                            ExternalProcess::Capture::StdOut);

    size_t delivered = 0;
    ProcessResult result = process.run([&delivered](const std::string &line)
                                       {
        delivered++;
        return line != "line 4"; });

    EXPECT_TRUE(result.stopped_early);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(delivered, 5u);
}

TEST_F(ExternalProcessTest, CancellationKillsChild)
{
    CancellationToken token;
    ExternalProcess process(script("wait.sh", "exec sleep 30"), ExternalProcess::Capture::StdOut);
    process.setCancellationToken(token);

    std::thread canceller([token]() mutable
                          {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        token.cancel(); });

    auto start = std::chrono::steady_clock::now();
    std::vector<std::string> lines;
    ProcessResult result = process.runCollect(lines);
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.success);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST_F(ExternalProcessTest, ChildExitingOnSameInterruptIsCancelled)
{
    CancellationToken token;
    ExternalProcess process(script("interrupted.sh", "echo done\nexit 255"), ExternalProcess::Capture::StdOut);
    process.setCancellationToken(token);

    // The token flips while the child is already on its way out
    ProcessResult result = process.run([token](const std::string &) mutable
                                       {
        token.cancel();
        return true; });

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 255);
    EXPECT_NE(result.error_message.find("cancelled"), std::string::npos);
}

TEST(ToolInvocationTest, RendersQuotedArguments)
{
    ToolInvocation invocation;
    invocation.program = "ffmpeg";
    invocation.args = {"-i", "my clip.mp4", "-f", "null", "-"};
    EXPECT_EQ(invocation.toString(), "ffmpeg -i \"my clip.mp4\" -f null -");
}
