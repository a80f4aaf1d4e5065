#undef NDEBUG
#include "easy.hpp"
#include "fake_engine.hpp"
#include "multi.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace curlmux;
using namespace std::chrono_literals;

namespace {

bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds limit = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(1ms);
    }
    return pred();
}

// Collects outcomes from completion handlers running on any thread.
struct Recorder {
    std::mutex m;
    std::vector<std::pair<std::string, TransferOutcome>> outcomes;

    CompletionHandler handler(std::string name) {
        return [this, name](TransferOutcome outcome) {
            std::lock_guard<std::mutex> lock(m);
            outcomes.emplace_back(name, std::move(outcome));
        };
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(m);
        return outcomes.size();
    }

    std::vector<std::pair<std::string, TransferOutcome>> snapshot() {
        std::lock_guard<std::mutex> lock(m);
        return outcomes;
    }
};

std::unique_ptr<Easy> make_easy(FakeEngine& engine) {
    auto easy = Easy::create(engine);
    assert(easy);
    return std::move(*easy);
}

std::unique_ptr<Multi> make_multi(FakeEngine& engine, MultiConfig config = {}) {
    auto multi = Multi::create(config, engine);
    assert(multi);
    return std::move(*multi);
}

} // namespace

void test_create_options() {
    FakeEngine engine;
    MultiConfig config;
    config.max_total_connections = 100;
    config.max_host_connections = 6;
    config.pipelining = true;
    auto multi = make_multi(engine, config);
    assert(engine.multi_option(CURLMOPT_MAX_TOTAL_CONNECTIONS) == 100L);
    assert(engine.multi_option(CURLMOPT_MAX_HOST_CONNECTIONS) == 6L);
    assert(engine.multi_option(CURLMOPT_PIPELINING) == static_cast<long>(CURLPIPE_MULTIPLEX));
    assert(!engine.multi_option(CURLMOPT_MAXCONNECTS));
    assert(!multi->is_closed());
    assert(multi->active_count() == 0);
    std::cout << "✓ Connection limits reach the multi handle\n";
}

void test_future_success() {
    FakeEngine engine;
    auto multi = make_multi(engine);
    auto easy = make_easy(engine);

    auto future = multi->submit(*easy);
    assert(multi->active_count() == 1);
    engine.complete(easy->native(), CURLE_OK);
    assert(future.wait_for(2s) == std::future_status::ready);
    auto outcome = future.get();
    assert(outcome);
    assert(outcome->code == CURLE_OK);
    assert(wait_until([&] { return multi->active_count() == 0; }));
    assert(engine.added_count() == 0);
    assert(!easy->released());
    std::cout << "✓ Submitted transfer resolves its future\n";
}

void test_duplicate_handle() {
    FakeEngine engine;
    auto multi = make_multi(engine);
    auto easy = make_easy(engine);
    Recorder rec;

    assert(multi->submit(*easy, rec.handler("first")));
    auto second = multi->submit(*easy, rec.handler("second"));
    assert(!second);
    assert(second.error().error == CurlError::DuplicateHandle);

    auto third = multi->submit(*easy);
    assert(third.wait_for(0s) == std::future_status::ready);
    assert(third.get().error().error == CurlError::DuplicateHandle);
    assert(multi->active_count() == 1);

    engine.complete(easy->native(), CURLE_OK);
    assert(wait_until([&] { return rec.size() == 1; }));
    assert(rec.snapshot()[0].first == "first");

    // Free again once the first transfer is done.
    assert(multi->submit(*easy, rec.handler("again")));
    engine.complete(easy->native(), CURLE_OK);
    assert(wait_until([&] { return rec.size() == 2; }));
    std::cout << "✓ Same handle cannot be pending twice\n";
}

void test_add_failure() {
    FakeEngine engine;
    auto multi = make_multi(engine);
    auto easy = make_easy(engine);

    engine.fail_next_add(CURLM_OUT_OF_MEMORY);
    auto r = multi->submit(*easy, [](TransferOutcome) { assert(false && "handler must not run"); });
    assert(!r);
    assert(r.error().error == CurlError::EngineFault);
    assert(multi->active_count() == 0);

    engine.fail_next_add(CURLM_ADDED_ALREADY);
    r = multi->submit(*easy, [](TransferOutcome) {});
    assert(!r);
    assert(r.error().error == CurlError::DuplicateHandle);
    std::cout << "✓ Refused registrations do not leave records behind\n";
}

void test_completion_order() {
    FakeEngine engine;
    auto multi = make_multi(engine);
    auto a = make_easy(engine);
    auto b = make_easy(engine);
    auto c = make_easy(engine);
    Recorder rec;

    assert(multi->submit(*a, rec.handler("A")));
    assert(multi->submit(*b, rec.handler("B")));
    assert(multi->submit(*c, rec.handler("C")));
    assert(multi->active_count() == 3);

    engine.complete(b->native(), CURLE_OK);
    assert(wait_until([&] { return rec.size() == 1; }));
    assert(multi->active_count() == 2);

    engine.complete(a->native(), CURLE_COULDNT_CONNECT);
    assert(wait_until([&] { return rec.size() == 2; }));
    assert(multi->active_count() == 1);

    engine.complete(c->native(), CURLE_OK);
    assert(wait_until([&] { return rec.size() == 3; }));
    assert(multi->active_count() == 0);

    auto out = rec.snapshot();
    assert(out[0].first == "B" && out[0].second);
    assert(out[1].first == "A" && !out[1].second);
    assert(out[1].second.error().error == CurlError::Transfer);
    assert(out[1].second.error().code == CURLE_COULDNT_CONNECT);
    assert(out[2].first == "C" && out[2].second);
    assert(engine.added_count() == 0);
    std::cout << "✓ B, A, C complete in engine order with A failing alone\n";
}

void test_batch_order() {
    FakeEngine engine;
    auto multi = make_multi(engine);
    auto a = make_easy(engine);
    auto b = make_easy(engine);
    auto c = make_easy(engine);
    Recorder rec;

    assert(multi->submit(*a, rec.handler("A")));
    assert(multi->submit(*b, rec.handler("B")));
    assert(multi->submit(*c, rec.handler("C")));

    engine.complete_batch({
        {b->native(), CURLE_OK},
        {a->native(), CURLE_COULDNT_CONNECT},
        {c->native(), CURLE_OK},
    });
    assert(wait_until([&] { return rec.size() == 3; }));
    auto out = rec.snapshot();
    assert(out[0].first == "B");
    assert(out[1].first == "A");
    assert(out[2].first == "C");

    // Drain is exhaustive: nothing left queued or registered.
    assert(engine.queued_completions() == 0);
    assert(engine.added_count() == 0);
    assert(multi->active_count() == 0);
    std::cout << "✓ One drain delivers a whole batch in queue order\n";
}

void test_broadcast_on_perform_fault() {
    FakeEngine engine;
    auto multi = make_multi(engine);
    auto a = make_easy(engine);
    auto b = make_easy(engine);
    auto c = make_easy(engine);
    Recorder rec;

    assert(multi->submit(*a, rec.handler("A")));
    assert(multi->submit(*b, rec.handler("B")));
    assert(multi->submit(*c, rec.handler("C")));
    engine.fail_next_perform(CURLM_OUT_OF_MEMORY);

    assert(wait_until([&] { return rec.size() == 3; }));
    auto out = rec.snapshot();
    for (auto& [name, outcome] : out) {
        assert(!outcome);
        assert(outcome.error().error == CurlError::EngineFault);
        assert(outcome.error().code == CURLM_OUT_OF_MEMORY);
        assert(outcome.error().message == out[0].second.error().message);
    }
    assert(multi->active_count() == 0);
    assert(engine.added_count() == 0);

    // The scheduler keeps working after a faulted step.
    auto d = make_easy(engine);
    auto future = multi->submit(*d);
    engine.complete(d->native(), CURLE_OK);
    assert(future.wait_for(2s) == std::future_status::ready);
    assert(future.get());
    std::cout << "✓ Perform fault fails every pending transfer with one error\n";
}

void test_broadcast_on_poll_fault() {
    FakeEngine engine;
    auto multi = make_multi(engine);
    auto a = make_easy(engine);
    auto b = make_easy(engine);
    Recorder rec;

    assert(multi->submit(*a, rec.handler("A")));
    assert(multi->submit(*b, rec.handler("B")));
    engine.fail_next_poll(CURLM_INTERNAL_ERROR);

    assert(wait_until([&] { return rec.size() == 2; }));
    auto out = rec.snapshot();
    for (auto& [name, outcome] : out) {
        assert(!outcome);
        assert(outcome.error().error == CurlError::EngineFault);
        assert(outcome.error().code == CURLM_INTERNAL_ERROR);
    }
    assert(multi->active_count() == 0);
    assert(engine.added_count() == 0);
    std::cout << "✓ Wait fault fails every pending transfer\n";
}

void test_cancel() {
    FakeEngine engine;
    auto multi = make_multi(engine);
    auto easy = make_easy(engine);
    auto stranger = make_easy(engine);
    Recorder rec;

    assert(!multi->cancel(*stranger));
    assert(rec.size() == 0);

    assert(multi->submit(*easy, rec.handler("A")));
    assert(multi->cancel(*easy));
    assert(rec.size() == 1);
    auto out = rec.snapshot();
    assert(!out[0].second);
    assert(out[0].second.error().error == CurlError::Cancelled);
    assert(multi->active_count() == 0);
    assert(engine.added_count() == 0);

    assert(!multi->cancel(*easy));

    // A late completion for the cancelled handle is ignored.
    engine.complete(easy->native(), CURLE_OK);
    std::this_thread::sleep_for(50ms);
    assert(rec.size() == 1);
    std::cout << "✓ Cancel is idempotent and resolves exactly once\n";
}

void test_cancel_racing_completion() {
    FakeEngine engine;
    auto multi = make_multi(engine);
    std::atomic<int> resolved = 0;

    for (int i = 0; i < 50; ++i) {
        auto easy = make_easy(engine);
        std::atomic<int> calls = 0;
        assert(multi->submit(*easy, [&](TransferOutcome) { resolved++; calls++; }));
        engine.complete(easy->native(), CURLE_OK);
        multi->cancel(*easy);
        assert(wait_until([&] { return calls.load() == 1; }));
        std::this_thread::sleep_for(1ms);
        assert(calls.load() == 1);
        assert(wait_until([&] { return multi->active_count() == 0; }));
    }
    assert(resolved.load() == 50);
    std::cout << "✓ Cancel racing completion resolves once\n";
}

void test_close() {
    FakeEngine engine;
    auto multi = make_multi(engine);
    auto a = make_easy(engine);
    auto b = make_easy(engine);
    Recorder rec;

    assert(multi->submit(*a, rec.handler("A")));
    auto future = multi->submit(*b);

    multi->close();
    assert(multi->is_closed());
    assert(rec.size() == 1);
    assert(rec.snapshot()[0].second.error().error == CurlError::SchedulerClosed);
    assert(future.wait_for(0s) == std::future_status::ready);
    assert(future.get().error().error == CurlError::SchedulerClosed);
    assert(engine.multi_cleanups() == 1);
    assert(engine.added_count() == 0);
    assert(!multi->is_polling());

    auto late = multi->submit(*a, rec.handler("late"));
    assert(!late);
    assert(late.error().error == CurlError::AlreadyClosed);
    assert(!multi->cancel(*a));

    multi->close();
    assert(engine.multi_cleanups() == 1);
    assert(rec.size() == 1);
    std::cout << "✓ Close fails pending work and is idempotent\n";
}

void test_close_from_handler() {
    FakeEngine engine;
    auto multi = make_multi(engine);
    auto a = make_easy(engine);
    auto b = make_easy(engine);
    Recorder rec;

    assert(multi->submit(*a, [&](TransferOutcome outcome) {
        rec.handler("A")(std::move(outcome));
        multi->close();
    }));
    assert(multi->submit(*b, rec.handler("B")));

    engine.complete(a->native(), CURLE_OK);
    assert(wait_until([&] { return rec.size() == 2; }));
    auto out = rec.snapshot();
    assert(out[0].first == "A" && out[0].second);
    assert(out[1].first == "B" && out[1].second.error().error == CurlError::SchedulerClosed);
    assert(wait_until([&] { return engine.multi_cleanups() == 1; }));
    multi.reset();
    std::cout << "✓ Close from inside a completion handler\n";
}

void test_destroy_from_handler() {
    FakeEngine engine;
    auto a = make_easy(engine);
    auto b = make_easy(engine);
    std::shared_ptr<Multi> owner = make_multi(engine);
    std::weak_ptr<Multi> watch = owner;
    Recorder rec;
    std::atomic<bool> destroyed = false;

    assert(owner->submit(*a, [&](TransferOutcome outcome) {
        rec.handler("A")(std::move(outcome));
        owner.reset();
        destroyed = watch.expired();
    }));
    assert(owner->submit(*b, rec.handler("B")));

    engine.complete(a->native(), CURLE_OK);
    assert(wait_until([&] { return rec.size() == 2; }));
    assert(wait_until([&] { return destroyed.load(); }));
    auto out = rec.snapshot();
    assert(out[0].first == "A" && out[0].second);
    assert(out[1].first == "B" && out[1].second.error().error == CurlError::SchedulerClosed);
    assert(engine.multi_cleanups() == 1);
    // The detached worker must not touch the freed scheduler.
    std::this_thread::sleep_for(50ms);
    std::cout << "✓ Destroying the scheduler from its own completion handler\n";
}

void test_concurrent_submitters() {
    FakeEngine engine;
    auto multi = make_multi(engine);
    std::atomic<int> done = 0;
    std::vector<std::unique_ptr<Easy>> handles;
    for (int i = 0; i < 40; ++i) handles.push_back(make_easy(engine));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = t; i < 40; i += 4) {
                auto r = multi->submit(*handles[i], [&](TransferOutcome outcome) {
                    assert(outcome);
                    done++;
                });
                assert(r);
                engine.complete(handles[i]->native(), CURLE_OK);
            }
        });
    }
    for (auto& th : threads) th.join();

    assert(wait_until([&] { return done.load() == 40; }));
    assert(multi->active_count() == 0);
    assert(engine.added_count() == 0);
    std::cout << "✓ Submissions from several threads all complete\n";
}

void test_released_handle() {
    FakeEngine engine;
    auto multi = make_multi(engine);
    auto easy = make_easy(engine);
    easy->release();
    auto r = multi->submit(*easy, [](TransferOutcome) {});
    assert(!r);
    assert(r.error().error == CurlError::Configuration);
    assert(!multi->cancel(*easy));
    std::cout << "✓ Released handles cannot be submitted\n";
}

void test_throwing_handler() {
    FakeEngine engine;
    auto multi = make_multi(engine);
    auto a = make_easy(engine);
    auto b = make_easy(engine);
    Recorder rec;

    assert(multi->submit(*a, [](TransferOutcome) { throw std::runtime_error("handler bug"); }));
    assert(multi->submit(*b, rec.handler("B")));
    engine.complete_batch({{a->native(), CURLE_OK}, {b->native(), CURLE_OK}});
    assert(wait_until([&] { return rec.size() == 1; }));
    assert(multi->active_count() == 0);
    std::cout << "✓ A throwing handler does not stop the worker\n";
}

void test_shared_multi() {
    auto first = shared_multi();
    assert(first);
    auto second = shared_multi();
    assert(second);
    assert(first->get() == second->get());

    close_shared_multi();
    assert((*first)->is_closed());

    auto third = shared_multi();
    assert(third);
    assert(third->get() != first->get());
    assert(!(*third)->is_closed());
    close_shared_multi();
    std::cout << "✓ Shared scheduler is reused and re-created after close\n";
}

void test_close_shared_from_handler() {
    auto path = std::filesystem::temp_directory_path() / "curlmux_test_shared.txt";
    {
        std::ofstream out(path);
        out << "curlmux\n";
    }

    auto shared = shared_multi();
    assert(shared);
    std::weak_ptr<Multi> watch = *shared;
    Multi* raw = shared->get();
    shared->reset();

    auto created = Easy::create();
    assert(created);
    auto easy = std::move(*created);
    std::string body;
    assert(easy->set_option(CURLOPT_URL, "file://" + path.string()));
    assert(easy->set_write_function([&](std::string chunk) -> std::optional<size_t> {
        body += chunk;
        return std::nullopt;
    }));

    std::atomic<bool> handled = false;
    std::atomic<bool> succeeded = false;
    assert(raw->submit(*easy, [&](TransferOutcome outcome) {
        succeeded = outcome.has_value();
        close_shared_multi();
        handled = true;
    }));
    assert(wait_until([&] { return handled.load(); }, 5000ms));
    assert(succeeded.load());
    assert(body == "curlmux\n");
    assert(watch.expired());
    std::this_thread::sleep_for(50ms);

    auto next = shared_multi();
    assert(next);
    assert(!(*next)->is_closed());
    close_shared_multi();
    std::filesystem::remove(path);
    std::cout << "✓ Closing the shared scheduler from its own completion handler\n";
}

int main() {
    std::cout << "Multi scheduler tests\n";
    test_create_options();
    test_future_success();
    test_duplicate_handle();
    test_add_failure();
    test_completion_order();
    test_batch_order();
    test_broadcast_on_perform_fault();
    test_broadcast_on_poll_fault();
    test_cancel();
    test_cancel_racing_completion();
    test_close();
    test_close_from_handler();
    test_destroy_from_handler();
    test_concurrent_submitters();
    test_released_handle();
    test_throwing_handler();
    test_shared_multi();
    test_close_shared_from_handler();
    std::cout << "\n✓ All multi scheduler tests passed\n";
    return 0;
}
