#pragma once

#include "core/cancellation_token.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

/**
 * @brief A single external tool call: program, arguments, working directory
 */
struct ToolInvocation
{
    std::string program;
    std::vector<std::string> args;
    std::string working_directory; // empty: inherit

    // Shell-like rendering for logs and reports
    std::string toString() const;
};

/**
 * @brief Outcome of running an external process
 */
struct ProcessResult
{
    bool success = false;       // launched and exited with status 0
    std::string error_message;  // launch failure or termination reason
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    bool stopped_early = false; // the line handler asked to stop
    size_t lines_read = 0;
};

/**
 * @brief Runs a child process and streams one of its outputs line by line.
 *
 * The captured stream is drained completely before the process is waited
 * for. A watchdog kills the child when the timeout expires or the
 * cancellation token flips; the line handler can also stop the child early
 * by returning false.
 */
class ExternalProcess
{
public:
    enum class Capture
    {
        StdOut,
        StdErr,
        Both // merged into one stream
    };

    // Return false to stop reading and terminate the child
    using LineHandler = std::function<bool(const std::string &)>;

    ExternalProcess(ToolInvocation invocation, Capture capture);

    void setTimeout(std::chrono::seconds timeout) { timeout_ = timeout; }
    void setCancellationToken(const CancellationToken &token) { token_ = token; }

    ProcessResult run(const LineHandler &on_line);

    // Run and collect every line of the captured stream
    ProcessResult runCollect(std::vector<std::string> &lines);

private:
    ToolInvocation invocation_;
    Capture capture_;
    std::chrono::seconds timeout_{0}; // zero: unbounded
    CancellationToken token_;
};
