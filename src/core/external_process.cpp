#include "core/external_process.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <Poco/Pipe.h>
#include <Poco/PipeStream.h>
#include <Poco/Process.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

std::string ToolInvocation::toString() const
{
    std::string rendered = program;
    for (const auto &arg : args)
    {
        rendered += " ";
        if (arg.empty() || arg.find_first_of(" \t'\"") != std::string::npos)
            rendered += "\"" + arg + "\"";
        else
            rendered += arg;
    }
    return rendered;
}

ExternalProcess::ExternalProcess(ToolInvocation invocation, Capture capture)
    : invocation_(std::move(invocation)), capture_(capture)
{
}

ProcessResult ExternalProcess::run(const LineHandler &on_line)
{
    ProcessResult result;
    Logger::debug("Launching: " + invocation_.toString());

    Poco::Pipe pipe;
    Poco::Pipe *out_pipe = (capture_ == Capture::StdErr) ? nullptr : &pipe;
    Poco::Pipe *err_pipe = (capture_ == Capture::StdOut) ? nullptr : &pipe;

    auto launch = [&]()
    {
        if (invocation_.working_directory.empty())
            return Poco::Process::launch(invocation_.program, invocation_.args, nullptr, out_pipe, err_pipe);
        return Poco::Process::launch(invocation_.program, invocation_.args, invocation_.working_directory,
                                     nullptr, out_pipe, err_pipe);
    };

    std::unique_ptr<Poco::ProcessHandle> handle;
    try
    {
        handle = std::make_unique<Poco::ProcessHandle>(launch());
    }
    catch (const Poco::Exception &e)
    {
        result.error_message = "Failed to launch " + invocation_.program + ": " + e.displayText();
        Logger::error(result.error_message);
        return result;
    }

    const Poco::Process::PID pid = handle->id();
    std::mutex mutex;
    std::condition_variable cv;
    bool finished = false;
    bool killed = false;

    // Caller holds the mutex
    auto killChild = [&](const std::string &reason)
    {
        if (killed)
            return;
        killed = true;
        try
        {
            Poco::Process::kill(pid);
            Logger::debug("Terminated " + invocation_.program + " (pid " + std::to_string(pid) + "): " + reason);
        }
        catch (const Poco::Exception &e)
        {
            Logger::debug("Kill of pid " + std::to_string(pid) + " failed: " + e.displayText());
        }
    };

    std::thread watchdog([&]()
                         {
        const auto deadline = std::chrono::steady_clock::now() + timeout_;
        std::unique_lock<std::mutex> lock(mutex);
        while (!finished)
        {
            if (token_.isCancelled())
            {
                result.cancelled = true;
                killChild("cancelled");
                break;
            }
            if (timeout_.count() > 0 && std::chrono::steady_clock::now() >= deadline)
            {
                result.timed_out = true;
                killChild("timeout after " + std::to_string(timeout_.count()) + "s");
                break;
            }
            cv.wait_for(lock, std::chrono::milliseconds(100));
        } });

    auto finish = [&]()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            finished = true;
        }
        cv.notify_all();
        if (watchdog.joinable())
            watchdog.join();
    };

    try
    {
        Poco::PipeInputStream istr(pipe);
        std::string line;
        bool forwarding = true;
        // Keep draining after an early stop so the child never blocks on a full pipe
        while (std::getline(istr, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            result.lines_read++;
            if (forwarding && on_line && !on_line(line))
            {
                forwarding = false;
                result.stopped_early = true;
                std::lock_guard<std::mutex> lock(mutex);
                killChild("output watermark reached");
            }
        }
    }
    catch (...)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            killChild("line handler failed");
        }
        finish();
        handle->wait();
        throw;
    }

    finish();
    result.exit_code = handle->wait();

    // The child can die from the same interrupt before the watchdog polls
    if (!result.timed_out && !result.cancelled && token_.isCancelled())
    {
        result.cancelled = true;
    }

    if (result.timed_out)
    {
        result.error_message = invocation_.program + " timed out after " + std::to_string(timeout_.count()) + "s";
    }
    else if (result.cancelled)
    {
        result.error_message = invocation_.program + " cancelled";
    }
    else if (!result.stopped_early && result.exit_code != 0)
    {
        result.error_message = invocation_.program + " exited with status " + std::to_string(result.exit_code);
    }
    result.success = !result.timed_out && !result.cancelled && (result.stopped_early || result.exit_code == 0);

    Logger::debug(invocation_.program + " finished: exit " + std::to_string(result.exit_code) +
                  ", lines " + std::to_string(result.lines_read));
    return result;
}

ProcessResult ExternalProcess::runCollect(std::vector<std::string> &lines)
{
    return run([&lines](const std::string &line)
               {
        lines.push_back(line);
        return true; });
}
