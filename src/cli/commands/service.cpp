#include "job_helpers.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <reaper/stuck_job_reaper.hpp>
#include <worker/dispatcher.hpp>
#include <worker/unit_registry.hpp>
#include <worker/worker_pool.hpp>
#include <worker/worker_runtime.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <fmt/format.h>

static std::atomic<bool> g_stop_requested{false};

static void handle_stop_signal(int) {
    g_stop_requested = true;
}

// ── serve ───────────────────────────────────────────────────

static int do_serve(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_store()) return 1;
    const Config& config = cli.config.value();
    const WorkerConfig& wc = config.worker();

    int threads = wc.threads;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--threads" && i + 1 < args.size()) {
            threads = safe_stoi(args[++i], 0);
            if (threads < 1) {
                std::cout << theme::fail("--threads must be at least 1");
                return 1;
            }
        }
    }

    JobCoordinator& coordinator = *cli.coordinator;
    WorkerRuntime runtime(coordinator, wc.node, wc.on_failure);
    UnitRegistry registry;
    register_builtin_units(registry);

    WorkerPool pool(threads);
    pool.start([&](const std::string& job_id, int worker_index) {
        auto job = coordinator.get(job_id);
        if (job.is_err()) {
            coord_log(fmt::format("serve: worker {} skipped {}: {}", worker_index, job_id, job.error));
            return;
        }
        if (job.value.status != JobStatus::Pending) return;

        auto report = runtime.run(job_id, registry.resolve(job.value.model_type));
        if (report.outcome != RunOutcome::NotClaimed) {
            coord_log(fmt::format("serve: {} {} by {}{}", job_id, to_string(report.outcome),
                                  report.worker_ref,
                                  report.detail.empty() ? "" : " (" + report.detail + ")"));
        }
    });

    Dispatcher dispatcher(coordinator.store(), pool, wc.poll_interval);

    std::unique_ptr<StuckJobReaper> reaper;
    if (config.reaper().configured()) {
        reaper = std::make_unique<StuckJobReaper>(
            coordinator, *config.reaper().interval, *config.reaper().deadline,
            [&cli](const ReapReport& report) { cli.metrics.add_reaped(report.reaped); });
    }

    std::cout << theme::banner();
    std::cout << theme::kv("node", runtime.worker_node());
    std::cout << theme::kv("store", config.store().backend == StoreBackend::Memory
                                        ? std::string("memory")
                                        : config.store().path);
    std::cout << theme::kv("threads", std::to_string(threads));
    std::cout << theme::kv("poll", format_duration(wc.poll_interval));
    std::cout << theme::kv("units", join_args(registry.names(), 0));
    if (reaper) {
        std::cout << theme::kv("reaper", fmt::format("every {}, deadline {}",
                                                     format_duration(reaper->interval()),
                                                     format_duration(reaper->deadline())));
    } else {
        std::cout << theme::warn("Reaper disabled: set reaper.interval and reaper.deadline");
    }
    std::cout << theme::kv("log", log_path().string());
    std::cout << "\n" << theme::dim("  Ctrl+C to stop") << "\n\n";

    g_stop_requested = false;
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    dispatcher.start();
    if (reaper) reaper->start();

    while (!g_stop_requested) {
        platform::sleep_ms(SHUTDOWN_SLICE_MS);
    }

    std::cout << "\n" << theme::step("Stopping...");
    dispatcher.stop();
    if (reaper) reaper->stop();
    pool.stop();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    std::cout << theme::ok(cli.metrics.summary());
    return 0;
}

// ── reap ────────────────────────────────────────────────────

static int do_reap(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_store()) return 1;
    const ReaperConfig& rc = cli.config->reaper();

    std::optional<std::chrono::seconds> deadline = rc.deadline;
    if (!args.empty()) {
        deadline = parse_duration(args[0]);
        if (!deadline) {
            std::cout << theme::fail("Invalid deadline: " + args[0]);
            return 1;
        }
    }
    if (!deadline) {
        std::cout << theme::fail("No deadline: set reaper.deadline or pass one (e.g. 'reap 2h')");
        return 1;
    }

    StuckJobReaper reaper(*cli.coordinator, rc.interval.value_or(*deadline), *deadline);
    auto report = reaper.sweep_once();

    std::cout << theme::kv("deadline", format_duration(*deadline));
    std::cout << theme::kv("stale", std::to_string(report.scanned));
    std::cout << theme::kv("reaped", std::to_string(report.reaped));
    std::cout << theme::kv("lost races", std::to_string(report.lost_races));
    if (report.errors > 0) {
        std::cout << theme::fail(fmt::format("{} job(s) could not be reaped; see {}",
                                             report.errors, log_path().string()));
        return 1;
    }
    return 0;
}

// ── stats ───────────────────────────────────────────────────

static int do_stats(BaseCLI& cli, const std::vector<std::string>&) {
    if (!cli.require_store()) return 1;

    auto health = cli.store->ping();
    if (health.is_err()) {
        std::cout << theme::fail("Store unreachable: " + health.error);
        return 1;
    }

    auto counts = cli.store->count_by_status();
    if (counts.is_err()) {
        std::cout << theme::fail(counts.error);
        return 1;
    }
    std::cout << theme::section("Jobs");
    for (const auto& [status, count] : counts.value) {
        std::cout << theme::kv(to_string(status), std::to_string(count));
    }

    // Running jobs past the configured deadline are reaper candidates
    const ReaperConfig& rc = cli.config->reaper();
    if (rc.deadline) {
        auto stale = cli.store->find_stale_running(cli.coordinator->now() - *rc.deadline);
        if (stale.is_err()) {
            std::cout << theme::fail(stale.error);
            return 1;
        }
        std::cout << theme::kv("stale", std::to_string(stale.value.size()));
    }
    std::cout << "\n";
    return 0;
}

void register_service_commands(BaseCLI& cli) {
    cli.add_command("serve", do_serve, "[--threads N]", "Run dispatcher, workers and reaper");
    cli.add_command("reap", do_reap, "[deadline]", "Fail running jobs past the deadline once");
    cli.add_command("stats", do_stats, "", "Job counts per status and store health");
}
