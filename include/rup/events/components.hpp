/**
 * @file components.hpp
 * @brief Event-driven observers of the upload lifecycle
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Both react to every upload event emitted on the bus until destroyed
 */

#pragma once

#include "rup/events/event_bus.hpp"
#include "rup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <vector>

namespace rup::events {

/**
 * @brief Logger component - logs all upload lifecycle events
 *
 * Chunk-level events go to debug so a busy server stays readable at info.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        subscriptions_.push_back(bus_.scoped_subscribe<UploadCreatedEvent>([this](const UploadCreatedEvent& e) {
            on_upload_created(e);
        }));

        subscriptions_.push_back(bus_.scoped_subscribe<ChunkAppliedEvent>([this](const ChunkAppliedEvent& e) {
            on_chunk_applied(e);
        }));

        subscriptions_.push_back(bus_.scoped_subscribe<ChunkRejectedEvent>([this](const ChunkRejectedEvent& e) {
            on_chunk_rejected(e);
        }));

        subscriptions_.push_back(bus_.scoped_subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            on_upload_completed(e);
        }));

        subscriptions_.push_back(bus_.scoped_subscribe<UploadTerminatedEvent>([this](const UploadTerminatedEvent& e) {
            on_upload_terminated(e);
        }));

        subscriptions_.push_back(bus_.scoped_subscribe<UploadExpiredEvent>([this](const UploadExpiredEvent& e) {
            on_upload_expired(e);
        }));

        subscriptions_.push_back(bus_.scoped_subscribe<SweepFinishedEvent>([this](const SweepFinishedEvent& e) {
            on_sweep_finished(e);
        }));

        subscriptions_.push_back(bus_.scoped_subscribe<ServerStartedEvent>([this](const ServerStartedEvent& e) {
            on_server_started(e);
        }));

        subscriptions_.push_back(bus_.scoped_subscribe<ServerShuttingDownEvent>([this](const ServerShuttingDownEvent& e) {
            on_server_shutdown(e);
        }));
    }

private:
    void on_upload_created(const UploadCreatedEvent& e) {
        spdlog::info("[UploadCreated] session={} owner={} target={} bytes={}",
                     e.session_id, e.owner_id, e.target_ref, e.total_size);
    }

    void on_chunk_applied(const ChunkAppliedEvent& e) {
        spdlog::debug("[ChunkApplied] session={} part={} bytes={} offset={}/{}",
                      e.session_id, e.part_index, e.bytes, e.new_offset, e.total_size);
    }

    void on_chunk_rejected(const ChunkRejectedEvent& e) {
        spdlog::warn("[ChunkRejected] session={} reason={} offset={}",
                     e.session_id, e.reason, e.current_offset);
    }

    void on_upload_completed(const UploadCompletedEvent& e) {
        spdlog::info("[UploadCompleted] session={} target={} ref={} bytes={} duration={}ms",
                     e.session_id, e.target_ref, e.final_ref, e.total_size, e.duration.count());
    }

    void on_upload_terminated(const UploadTerminatedEvent& e) {
        spdlog::info("[UploadTerminated] session={} owner={} source={}", e.session_id, e.owner_id, e.source);
    }

    void on_upload_expired(const UploadExpiredEvent& e) {
        spdlog::info("[UploadExpired] session={} offset={}/{}", e.session_id, e.offset, e.total_size);
    }

    void on_sweep_finished(const SweepFinishedEvent& e) {
        if (e.reaped > 0 || e.failed > 0) {
            spdlog::info("[Sweep] examined={} reaped={} failed={}", e.examined, e.reaped, e.failed);
        }
    }

    void on_server_started(const ServerStartedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Upload server started on port {}", e.port);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_server_shutdown(const ServerShuttingDownEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Server shutting down: {}", e.reason);
        spdlog::info("════════════════════════════════════════════");
    }

    EventBus& bus_;
    std::vector<Subscription> subscriptions_;
};

/**
 * @brief Metrics component - upload counters
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> uploads_created{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_terminated{0};
        std::atomic<uint64_t> uploads_expired{0};
        std::atomic<uint64_t> chunks_applied{0};
        std::atomic<uint64_t> bytes_received{0};
        std::atomic<uint64_t> offset_conflicts{0};
        std::atomic<uint64_t> checksum_failures{0};
        std::atomic<uint64_t> sweep_failures{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        subscriptions_.push_back(bus_.scoped_subscribe<UploadCreatedEvent>([this](const UploadCreatedEvent&) {
            stats_.uploads_created++;
        }));

        subscriptions_.push_back(bus_.scoped_subscribe<ChunkAppliedEvent>([this](const ChunkAppliedEvent& e) {
            stats_.chunks_applied++;
            stats_.bytes_received += e.bytes;
        }));

        subscriptions_.push_back(bus_.scoped_subscribe<ChunkRejectedEvent>([this](const ChunkRejectedEvent& e) {
            on_chunk_rejected(e);
        }));

        subscriptions_.push_back(bus_.scoped_subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent&) {
            stats_.uploads_completed++;
        }));

        subscriptions_.push_back(bus_.scoped_subscribe<UploadTerminatedEvent>([this](const UploadTerminatedEvent&) {
            stats_.uploads_terminated++;
        }));

        subscriptions_.push_back(bus_.scoped_subscribe<UploadExpiredEvent>([this](const UploadExpiredEvent&) {
            stats_.uploads_expired++;
        }));

        subscriptions_.push_back(bus_.scoped_subscribe<SweepFinishedEvent>([this](const SweepFinishedEvent& e) {
            stats_.sweep_failures += e.failed;
        }));
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Created:           {}", stats_.uploads_created.load());
        spdlog::info("  Completed:         {}", stats_.uploads_completed.load());
        spdlog::info("  Terminated:        {}", stats_.uploads_terminated.load());
        spdlog::info("  Expired:           {}", stats_.uploads_expired.load());
        spdlog::info("  Chunks applied:    {}", stats_.chunks_applied.load());
        spdlog::info("  Bytes received:    {}", stats_.bytes_received.load());
        spdlog::info("  Offset conflicts:  {}", stats_.offset_conflicts.load());
        spdlog::info("  Checksum failures: {}", stats_.checksum_failures.load());
        spdlog::info("  Sweep failures:    {}", stats_.sweep_failures.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_chunk_rejected(const ChunkRejectedEvent& e) {
        if (e.reason == "OffsetConflict") {
            stats_.offset_conflicts++;
        } else if (e.reason == "ChecksumMismatch") {
            stats_.checksum_failures++;
        }
    }

    EventBus& bus_;
    Stats stats_;
    std::vector<Subscription> subscriptions_;  // Last: unsubscribed before stats_ goes away
};

} // namespace rup::events
