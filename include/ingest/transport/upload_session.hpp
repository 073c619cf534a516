#pragma once

#include "ingest/core/result.hpp"
#include "ingest/transport/upload_manifest.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace ingest::transport {

enum class SessionState {
    Initialized,
    Transferring,
    AwaitingFinalization,
    Completed,
    Failed
};

const char* to_string(SessionState state);

/**
 * @brief Server-side upload session of one Job, as seen by the client
 *
 * Owned by the transport for the duration of upload_directory(); never
 * persisted. Failed and Completed are terminal.
 */
class UploadSession {
public:
    static constexpr std::size_t kDefaultChunkSize = 8 * 1024 * 1024;

    UploadSession(std::string session_id, std::string order_id, UploadManifest manifest);

    [[nodiscard]] const std::string& session_id() const noexcept { return session_id_; }
    [[nodiscard]] const std::string& order_id() const noexcept { return order_id_; }
    [[nodiscard]] const std::string& tenant_id() const noexcept { return tenant_id_; }
    [[nodiscard]] const UploadManifest& manifest() const noexcept { return manifest_; }
    [[nodiscard]] std::size_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] SessionState state() const noexcept { return state_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }
    [[nodiscard]] bool is_terminal() const noexcept {
        return state_ == SessionState::Completed || state_ == SessionState::Failed;
    }

    void set_tenant_id(std::string tenant_id) { tenant_id_ = std::move(tenant_id); }

    /// 0 selects kDefaultChunkSize
    void set_chunk_size(std::size_t chunk_size);

    ingest::Result<void> transition_to(SessionState next_state);
    ingest::Result<void> mark_failed(std::string error_message);

    [[nodiscard]] std::chrono::steady_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;

    std::string session_id_;
    std::string order_id_;
    std::string tenant_id_;
    UploadManifest manifest_;
    std::size_t chunk_size_ = kDefaultChunkSize;
    SessionState state_ = SessionState::Initialized;
    std::string last_error_;
    std::chrono::steady_clock::time_point last_transition_{};
};

} // namespace ingest::transport
