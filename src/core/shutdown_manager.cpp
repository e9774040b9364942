#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <atomic>
#include <csignal>
#include <unistd.h>

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;
std::atomic<bool> *ShutdownManager::signal_tokens_[ShutdownManager::kMaxSignalTokens] = {};
std::atomic<size_t> ShutdownManager::signal_token_count_{0};

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopWatcher();
}

void ShutdownManager::installSignalHandlers()
{
    signal(SIGINT, &ShutdownManager::handleSignal);
    signal(SIGTERM, &ShutdownManager::handleSignal);

    startWatcher();
    Logger::debug("ShutdownManager: signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    // A second interrupt while the job winds down ends the program
    if (signal_flag_)
    {
        _exit(128 + sig);
    }
    signal_num_ = sig;
    signal_flag_ = 1;

    // Children share the terminal's process group and may exit on the same
    // interrupt, so the tokens must read cancelled before their exit is seen
    const size_t count = signal_token_count_.load(std::memory_order_acquire);
    for (size_t i = 0; i < count; ++i)
    {
        signal_tokens_[i]->store(true);
    }
}

void ShutdownManager::cancelOnShutdown(const CancellationToken &token)
{
    std::lock_guard<std::mutex> lk(mutex_);
    tokens_.push_back(token);
    const size_t slot = signal_token_count_.load(std::memory_order_relaxed);
    if (slot < kMaxSignalTokens)
    {
        signal_tokens_[slot] = tokens_.back().flag();
        signal_token_count_.store(slot + 1, std::memory_order_release);
    }
    if (shutdown_requested_.load())
    {
        tokens_.back().cancel();
    }
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
    {
        return;
    }
    watcher_ = std::thread([this]()
                           {
        for (;;)
        {
            if (!watcher_running_.load())
            {
                break;
            }

            if (signal_flag_)
            {
                int sig = signal_num_;
                last_signal_.store(sig);
                requestShutdown("Signal received", sig);
            }

            if (shutdown_requested_.load())
            {
                break;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } });
}

void ShutdownManager::stopWatcher()
{
    if (!watcher_running_.exchange(false))
    {
        return;
    }
    if (watcher_.joinable())
    {
        watcher_.join();
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    if (shutdown_in_progress_.exchange(true))
    {
        return;
    }

    last_signal_.store(signal_number);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_ = reason;
        shutdown_requested_.store(true);
        for (auto &token : tokens_)
        {
            token.cancel();
        }
    }
    cv_.notify_all();

    // Hint: Stop watcher loop so it can exit
    watcher_running_.store(false);

    if (signal_number != 0)
    {
        Logger::warn("Interrupted by signal " + std::to_string(signal_number) + ", cancelling the running job");
    }
    else
    {
        Logger::info("ShutdownManager: shutdown requested - " + reason);
    }
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    // Stop any existing watcher
    stopWatcher();

    // Reset all state
    shutdown_requested_.store(false);
    shutdown_in_progress_.store(false);
    last_signal_.store(0);
    watcher_running_.store(false);

    // Clear static signal flags
    signal_flag_ = 0;
    signal_num_ = 0;

    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_.clear();
        signal_token_count_.store(0, std::memory_order_release);
        tokens_.clear();
    }
}
