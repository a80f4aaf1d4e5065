#pragma once

#include "curl_engine.hpp"
#include "curl_error.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace curlmux {

class Easy;

struct MultiConfig {
    long max_connections = 0;        // 0 keeps libcurl's default
    long max_host_connections = 0;
    long max_total_connections = 0;
    bool pipelining = false;         // HTTP/2 multiplexing
    std::chrono::milliseconds poll_timeout{10};
};

struct TransferResult {
    CURLcode code = CURLE_OK;
};

using TransferOutcome = std::expected<TransferResult, CurlErrorInfo>;
using CompletionHandler = std::function<void(TransferOutcome)>;

// Runs many Easy transfers concurrently on one libcurl multi handle.
//
// A single worker thread owns the poll loop. Every call into the multi
// handle is made under mutex_; callers on other threads first wake the
// worker out of its bounded wait with multi_wakeup, then take the lock.
// Each submitted transfer is resolved exactly once: completed, failed,
// cancelled, or failed by close(). A Multi may be destroyed from inside one
// of its own completion handlers; the worker then exits without touching it.
class Multi {
    struct Token {
        explicit Token() = default;
    };

public:
    static std::expected<std::unique_ptr<Multi>, CurlErrorInfo> create(
        const MultiConfig& config = {}, ICurlEngine& engine = default_engine());

    Multi(Token, ICurlEngine& engine, CURLM* multi, const MultiConfig& config);
    ~Multi();

    Multi(const Multi&) = delete;
    Multi& operator=(const Multi&) = delete;

    // The returned future is already resolved if the submission was refused.
    std::future<TransferOutcome> submit(Easy& easy);

    // on_done runs on the worker thread for completions and on the calling
    // thread for cancel()/close(). It is not called when submission fails.
    std::expected<void, CurlErrorInfo> submit(Easy& easy, CompletionHandler on_done);

    // Returns false if the handle has no pending transfer here.
    bool cancel(Easy& easy);

    // Idempotent. Fails all pending transfers with SchedulerClosed and frees
    // the multi handle. Safe while transfers are in flight.
    void close();

    size_t active_count() const { return active_.load(); }
    bool is_closed() const { return closed_.load(); }
    bool is_polling() const { return polling_.load(); }

private:
    struct PendingTransfer {
        Easy* easy;
        CURL* handle;
        CompletionHandler on_done;
    };

    struct Delivery {
        CompletionHandler on_done;
        TransferOutcome outcome;
    };

    static std::uintptr_t key_of(CURL* handle) { return reinterpret_cast<std::uintptr_t>(handle); }

    std::unique_lock<std::mutex> lock_context(bool closing = false);
    void unlock_context(std::unique_lock<std::mutex>& lock);

    void run_worker(std::shared_ptr<std::atomic<bool>> alive);
    std::vector<Delivery> poll_once();
    void drain_completions(std::vector<Delivery>& ready);
    void fail_all_pending(const CurlErrorInfo& error, std::vector<Delivery>& ready);
    void remove_from_context(CURL* handle);
    void release_context();
    static void deliver(std::vector<Delivery>& ready);

    ICurlEngine& engine_;
    CURLM* multi_;
    MultiConfig config_;

    std::unordered_map<std::uintptr_t, PendingTransfer> pending_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> closed_ = false;
    std::atomic<int> waiters_ = 0;
    std::atomic<size_t> active_ = 0;
    std::atomic<bool> polling_ = false;
    bool stop_worker_ = false;
    // Shared with the worker; cleared when the Multi dies on its own worker.
    std::shared_ptr<std::atomic<bool>> alive_ = std::make_shared<std::atomic<bool>>(true);
    std::jthread worker_;
};

// Lazily created scheduler shared by simple callers (100 connections total,
// 6 per host, HTTP/2 multiplexing). Re-created if it was closed.
std::expected<std::shared_ptr<Multi>, CurlErrorInfo> shared_multi();
void close_shared_multi();

} // namespace curlmux
