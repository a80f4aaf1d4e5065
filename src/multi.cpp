#include "multi.hpp"
#include "compact_log.hpp"
#include "easy.hpp"
#include <exception>
#include <format>

namespace curlmux {

namespace {

CurlErrorInfo already_closed() {
    return CurlErrorInfo{CurlError::AlreadyClosed, "Multi has been closed"};
}

} // namespace

Multi::Multi(Token, ICurlEngine& engine, CURLM* multi, const MultiConfig& config)
    : engine_(engine), multi_(multi), config_(config) {}

std::expected<std::unique_ptr<Multi>, CurlErrorInfo> Multi::create(const MultiConfig& config, ICurlEngine& engine) {
    CURLM* multi = engine.multi_init();
    if (!multi) return std::unexpected(configuration_error("curl_multi_init failed"));

    auto apply = [&](CURLMoption option, long value, std::string_view name) -> std::expected<void, CurlErrorInfo> {
        CURLMcode rc = engine.multi_setopt_long(multi, option, value);
        if (rc == CURLM_OK) return {};
        return std::unexpected(CurlErrorInfo{
            CurlError::Configuration,
            std::format("curl_multi_setopt({}) failed: {}", name, engine.multi_strerror(rc)),
            static_cast<int>(rc)
        });
    };

    std::expected<void, CurlErrorInfo> ok;
    if (ok && config.max_connections > 0) ok = apply(CURLMOPT_MAXCONNECTS, config.max_connections, "MAXCONNECTS");
    if (ok && config.max_host_connections > 0) ok = apply(CURLMOPT_MAX_HOST_CONNECTIONS, config.max_host_connections, "MAX_HOST_CONNECTIONS");
    if (ok && config.max_total_connections > 0) ok = apply(CURLMOPT_MAX_TOTAL_CONNECTIONS, config.max_total_connections, "MAX_TOTAL_CONNECTIONS");
    if (ok && config.pipelining) ok = apply(CURLMOPT_PIPELINING, CURLPIPE_MULTIPLEX, "PIPELINING");
    if (!ok) {
        engine.multi_cleanup(multi);
        return std::unexpected(ok.error());
    }

    auto instance = std::make_unique<Multi>(Token{}, engine, multi, config);
    instance->worker_ = std::jthread([raw = instance.get(), alive = instance->alive_] { raw->run_worker(alive); });
    return instance;
}

Multi::~Multi() {
    close();
    if (worker_.joinable() && worker_.get_id() == std::this_thread::get_id()) {
        alive_->store(false);
        worker_.detach();
    }
}

// Wakes the worker out of multi_poll and takes the context lock. Returns an
// unowned lock once the scheduler is closed (unless we are the closer).
std::unique_lock<std::mutex> Multi::lock_context(bool closing) {
    waiters_.fetch_add(1);
    if (!closing && closed_.load()) {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            waiters_.fetch_sub(1);
        }
        cv_.notify_all();
        return {};
    }

    CURLMcode rc = engine_.multi_wakeup(multi_);
    if (rc != CURLM_OK) {
        compact::Writer::debug(std::format("[multi] curl_multi_wakeup failed: {}\n", engine_.multi_strerror(rc)));
    }

    std::unique_lock<std::mutex> lock(mutex_);
    waiters_.fetch_sub(1);
    if (!closing && stop_worker_) {
        lock.unlock();
        cv_.notify_all();
        return {};
    }
    return lock;
}

void Multi::unlock_context(std::unique_lock<std::mutex>& lock) {
    if (lock.owns_lock()) lock.unlock();
    cv_.notify_all();
}

std::future<TransferOutcome> Multi::submit(Easy& easy) {
    auto promise = std::make_shared<std::promise<TransferOutcome>>();
    auto future = promise->get_future();
    auto submitted = submit(easy, [promise](TransferOutcome outcome) {
        promise->set_value(std::move(outcome));
    });
    if (!submitted) promise->set_value(std::unexpected(std::move(submitted.error())));
    return future;
}

std::expected<void, CurlErrorInfo> Multi::submit(Easy& easy, CompletionHandler on_done) {
    CURL* handle = easy.native();
    if (!handle) return std::unexpected(configuration_error("Curl handle has been released"));

    auto lock = lock_context();
    if (!lock.owns_lock()) return std::unexpected(already_closed());

    auto key = key_of(handle);
    if (pending_.contains(key)) {
        unlock_context(lock);
        return std::unexpected(CurlErrorInfo{CurlError::DuplicateHandle, "Handle already has a pending transfer"});
    }

    CURLMcode rc = engine_.multi_add_handle(multi_, handle);
    if (rc != CURLM_OK) {
        unlock_context(lock);
        if (rc == CURLM_ADDED_ALREADY) {
            return std::unexpected(CurlErrorInfo{CurlError::DuplicateHandle, "Handle is already added to a multi handle", static_cast<int>(rc)});
        }
        return std::unexpected(engine_fault(rc, "curl_multi_add_handle", engine_));
    }

    pending_.emplace(key, PendingTransfer{&easy, handle, std::move(on_done)});
    active_.store(pending_.size());
    unlock_context(lock);
    return {};
}

bool Multi::cancel(Easy& easy) {
    CURL* handle = easy.native();
    if (!handle) return false;

    auto lock = lock_context();
    if (!lock.owns_lock()) return false;

    auto it = pending_.find(key_of(handle));
    if (it == pending_.end() || it->second.easy != &easy) {
        unlock_context(lock);
        return false;
    }

    PendingTransfer record = std::move(it->second);
    pending_.erase(it);
    active_.store(pending_.size());
    remove_from_context(record.handle);
    unlock_context(lock);

    std::vector<Delivery> ready;
    ready.push_back(Delivery{std::move(record.on_done), std::unexpected(CurlErrorInfo{CurlError::Cancelled, "Transfer cancelled"})});
    deliver(ready);
    return true;
}

void Multi::close() {
    if (closed_.exchange(true)) return;

    std::vector<Delivery> failed;
    auto lock = lock_context(true);
    fail_all_pending(CurlErrorInfo{CurlError::SchedulerClosed, "Multi closed"}, failed);
    stop_worker_ = true;
    polling_ = false;
    unlock_context(lock);

    deliver(failed);

    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
    release_context();
}

void Multi::release_context() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return waiters_.load() == 0; });
    if (!multi_) return;
    CURLMcode rc = engine_.multi_cleanup(multi_);
    multi_ = nullptr;
    if (rc != CURLM_OK) {
        compact::Writer::error(std::format("[multi] curl_multi_cleanup failed: {}\n", engine_.multi_strerror(rc)));
    }
}

void Multi::run_worker(std::shared_ptr<std::atomic<bool>> alive) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        // Step aside while another thread is waiting for the context.
        cv_.wait(lock, [this] {
            return stop_worker_ || (!pending_.empty() && waiters_.load() == 0);
        });
        if (stop_worker_) break;

        polling_ = true;
        auto ready = poll_once();
        if (pending_.empty()) polling_ = false;

        if (!ready.empty()) {
            lock.unlock();
            deliver(ready);
            // A handler may have destroyed this Multi.
            if (!alive->load()) return;
            lock.lock();
        }
    }
    polling_ = false;
}

std::vector<Multi::Delivery> Multi::poll_once() {
    std::vector<Delivery> ready;

    int running = 0;
    CURLMcode rc = engine_.multi_perform(multi_, running);
    if (rc != CURLM_OK && rc != CURLM_CALL_MULTI_PERFORM) {
        fail_all_pending(engine_fault(rc, "curl_multi_perform", engine_), ready);
        return ready;
    }

    drain_completions(ready);

    if (!pending_.empty()) {
        rc = engine_.multi_poll(multi_, static_cast<int>(config_.poll_timeout.count()));
        if (rc != CURLM_OK) {
            fail_all_pending(engine_fault(rc, "curl_multi_poll", engine_), ready);
        }
    }
    return ready;
}

void Multi::drain_completions(std::vector<Delivery>& ready) {
    while (auto msg = engine_.multi_info_read(multi_)) {
        auto it = pending_.find(key_of(msg->easy));
        if (it == pending_.end()) continue;

        PendingTransfer record = std::move(it->second);
        pending_.erase(it);
        active_.store(pending_.size());
        remove_from_context(record.handle);

        if (msg->result == CURLE_OK) {
            ready.push_back(Delivery{std::move(record.on_done), TransferResult{msg->result}});
        } else {
            ready.push_back(Delivery{std::move(record.on_done), std::unexpected(transfer_error(msg->result, engine_))});
        }
    }
}

// A faulted multi handle cannot say which transfer broke it, so everyone
// pending gets the same error.
void Multi::fail_all_pending(const CurlErrorInfo& error, std::vector<Delivery>& ready) {
    for (auto& [key, record] : pending_) {
        remove_from_context(record.handle);
        ready.push_back(Delivery{std::move(record.on_done), std::unexpected(error)});
    }
    pending_.clear();
    active_.store(0);
}

void Multi::remove_from_context(CURL* handle) {
    CURLMcode rc = engine_.multi_remove_handle(multi_, handle);
    if (rc != CURLM_OK) {
        compact::Writer::error(std::format("[multi] curl_multi_remove_handle failed: {}\n", engine_.multi_strerror(rc)));
    }
}

void Multi::deliver(std::vector<Delivery>& ready) {
    for (auto& d : ready) {
        // Moved out so the handler's captures are released before the caller resumes.
        CompletionHandler on_done = std::move(d.on_done);
        if (!on_done) continue;
        try {
            on_done(std::move(d.outcome));
        } catch (const std::exception& e) {
            compact::Writer::error(std::format("[multi] completion handler threw: {}\n", e.what()));
        }
    }
}

namespace {

std::mutex& shared_mutex() {
    static std::mutex m;
    return m;
}

std::shared_ptr<Multi>& shared_slot() {
    static std::shared_ptr<Multi> slot;
    return slot;
}

} // namespace

std::expected<std::shared_ptr<Multi>, CurlErrorInfo> shared_multi() {
    // The engine must outlive the shared instance during static destruction.
    ICurlEngine& engine = default_engine();
    std::lock_guard<std::mutex> lock(shared_mutex());
    auto& slot = shared_slot();
    if (!slot || slot->is_closed()) {
        MultiConfig config;
        config.max_total_connections = 100;
        config.max_host_connections = 6;
        config.pipelining = true;
        auto created = Multi::create(config, engine);
        if (!created) return std::unexpected(created.error());
        slot = std::move(*created);
    }
    return slot;
}

void close_shared_multi() {
    std::shared_ptr<Multi> instance;
    {
        std::lock_guard<std::mutex> lock(shared_mutex());
        instance = std::move(shared_slot());
    }
    if (instance) instance->close();
}

} // namespace curlmux
