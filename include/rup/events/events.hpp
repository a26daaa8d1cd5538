/**
 * @file events.hpp
 * @brief Upload lifecycle event definitions
 *
 * WHY THIS FILE EXISTS:
 * The session manager and the expiry sweeper describe every state change of
 * an upload session as an event. Logging, metrics and the downstream media
 * pipeline handoff are subscribers; none of them are known to the emitter.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: UploadCreatedEvent, ChunkAppliedEvent
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace rup::events {

// ════════════════════════════════════════════════════════
// Upload Session Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted after a session record and its multipart handle exist
 *
 * WHO EMITS: SessionManager::create_session
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct UploadCreatedEvent {
    std::string session_id;
    std::string owner_id;
    std::string target_ref;
    std::uint64_t total_size = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted after a chunk was durably recorded and the offset advanced
 */
struct ChunkAppliedEvent {
    std::string session_id;
    std::uint32_t part_index = 0;
    std::uint64_t bytes = 0;
    std::uint64_t new_offset = 0;
    std::uint64_t total_size = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a chunk was refused without changing the session
 *
 * reason is the ErrorCode name (OffsetConflict, ChecksumMismatch, ...).
 */
struct ChunkRejectedEvent {
    std::string session_id;
    std::string reason;
    std::uint64_t current_offset = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted exactly once per session, when the multipart object is finalized
 *
 * WHO EMITS: SessionManager::complete
 * WHO SUBSCRIBES:
 * - Logger, Metrics
 * - The media processing handoff (consumes final_ref + target_ref)
 */
struct UploadCompletedEvent {
    std::string session_id;
    std::string owner_id;
    std::string target_ref;
    std::string final_ref;
    std::uint64_t total_size = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a session was aborted and its record removed
 *
 * source is "client" for explicit termination and "sweeper" for expiry.
 */
struct UploadTerminatedEvent {
    std::string session_id;
    std::string owner_id;
    std::string source;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Sweeper Events
// ════════════════════════════════════════════════════════

struct UploadExpiredEvent {
    std::string session_id;
    std::uint64_t offset = 0;
    std::uint64_t total_size = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SweepFinishedEvent {
    std::size_t examined = 0;
    std::size_t reaped = 0;
    std::size_t failed = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when server starts
 *
 * WHO EMITS: main() startup
 */
struct ServerStartedEvent {
    uint16_t port;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerStartedEvent(uint16_t p)
        : port(p),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted when server is shutting down
 */
struct ServerShuttingDownEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string r = "normal")
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

} // namespace rup::events
