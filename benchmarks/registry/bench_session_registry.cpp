// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file bench_session_registry.cpp
 * @brief Benchmarks for session lookup and delivery report dispatch
 */

#include <benchmark/benchmark.h>

#include <kcenon/ims_session/adapters/worker_pool.h>
#include <kcenon/ims_session/core/logging.h>
#include <kcenon/ims_session/delivery/delivery_report_dispatcher.h>
#include <kcenon/ims_session/session/file_sharing_session.h>
#include <kcenon/ims_session/session/session_registry.h>

#include "utils/benchmark_helpers.h"

#include <memory>
#include <vector>

namespace kcenon::ims_session::benchmark {

namespace {

class null_sender : public delivery_status_sender {
public:
    auto send_delivery_status_immediately(const std::string&,
                                          const std::string&,
                                          delivery_status,
                                          const std::string&,
                                          std::chrono::system_clock::time_point)
        -> result<void> override {
        return {};
    }
};

auto make_context(const std::shared_ptr<session_registry>& registry,
                  const std::filesystem::path& dir) -> session_context {
    session_context ctx;
    ctx.registry = registry;
    ctx.http = std::make_shared<memory_http_adapter>(std::vector<std::byte>{}, sizes::http_slice);
    ctx.workers = std::make_shared<adapters::thread_per_task_pool>();
    ctx.settings = std::make_shared<memory_settings_provider>(dir, false);
    return ctx;
}

auto make_invitation(int64_t n) -> file_transfer_invitation {
    file_transfer_invitation invitation;
    invitation.identity.session_id = "session-" + std::to_string(n);
    invitation.identity.file_transfer_id = "ft-" + std::to_string(n);
    invitation.identity.remote_contact = "tel:+3361234" + std::to_string(n);
    invitation.download_uri = "https://ftcontent.example.com/files/" + std::to_string(n);
    invitation.file.name = "file.bin";
    invitation.file.size = 1024;
    return invitation;
}

auto populate(session_registry& registry,
              const session_context& ctx,
              int64_t count) -> bool {
    for (int64_t i = 0; i < count; ++i) {
        auto created = file_sharing_session::create(make_invitation(i), ctx);
        if (!created || !registry.add_file_sharing_session(created.value())) {
            return false;
        }
    }
    return true;
}

}  // namespace

/**
 * @brief Lookup by session id in a populated registry
 */
static void BM_SessionRegistry_Find(::benchmark::State& state) {
    const auto count = state.range(0);
    get_logger().set_level(log_level::error);

    temp_directory dir;
    auto registry = std::make_shared<session_registry>();
    if (!populate(*registry, make_context(registry, dir.path()), count)) {
        state.SkipWithError("cannot populate registry");
        return;
    }

    int64_t n = 0;
    for (auto _ : state) {
        auto session = registry->find_file_sharing_session("session-" + std::to_string(n));
        ::benchmark::DoNotOptimize(session);
        n = (n + 1) % count;
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SessionRegistry_Find)->Arg(16)->Arg(256)->Arg(4096);

/**
 * @brief Concurrent lookups under the shared lock
 */
static void BM_SessionRegistry_FindConcurrent(::benchmark::State& state) {
    static std::shared_ptr<session_registry> registry;
    static std::unique_ptr<temp_directory> dir;
    constexpr int64_t count = 256;

    if (state.thread_index() == 0) {
        get_logger().set_level(log_level::error);
        dir = std::make_unique<temp_directory>();
        registry = std::make_shared<session_registry>();
        if (!populate(*registry, make_context(registry, dir->path()), count)) {
            state.SkipWithError("cannot populate registry");
        }
    }

    int64_t n = state.thread_index();
    for (auto _ : state) {
        auto session = registry->find_file_sharing_session("session-" + std::to_string(n));
        ::benchmark::DoNotOptimize(session);
        n = (n + 1) % count;
    }

    if (state.thread_index() == 0) {
        registry.reset();
        dir.reset();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SessionRegistry_FindConcurrent)->Threads(1)->Threads(4)->Threads(8);

/**
 * @brief Register and deregister one session
 */
static void BM_SessionRegistry_AddRemove(::benchmark::State& state) {
    get_logger().set_level(log_level::error);

    temp_directory dir;
    auto registry = std::make_shared<session_registry>();
    auto created = file_sharing_session::create(make_invitation(0),
                                                make_context(registry, dir.path()));
    if (!created) {
        state.SkipWithError(created.error().message.c_str());
        return;
    }
    auto session = created.value();

    for (auto _ : state) {
        auto added = registry->add_file_sharing_session(session);
        ::benchmark::DoNotOptimize(added);
        ::benchmark::DoNotOptimize(registry->remove_file_sharing_session("session-0"));
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SessionRegistry_AddRemove);

/**
 * @brief Out-of-band delivery report with de-duplication bookkeeping
 */
static void BM_DeliveryReportDispatcher_Report(::benchmark::State& state) {
    get_logger().set_level(log_level::error);

    auto registry = std::make_shared<session_registry>();
    delivery_report_dispatcher dispatcher(registry, std::make_shared<null_sender>());

    delivery_request request;
    request.contact = "tel:+33612345678";
    request.status = delivery_status::displayed;

    int64_t n = 0;
    for (auto _ : state) {
        request.message_id = "msg-" + std::to_string(n++);
        auto r = dispatcher.report(request);
        ::benchmark::DoNotOptimize(r);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_DeliveryReportDispatcher_Report);

}  // namespace kcenon::ims_session::benchmark
