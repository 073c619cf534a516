#include "ingest/transport/upload_session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace ingest::transport {
namespace {

bool is_progressive(SessionState current, SessionState target) {
    static const std::unordered_map<SessionState, std::vector<SessionState>> transitions {
        {SessionState::Initialized, {SessionState::Transferring}},
        {SessionState::Transferring, {SessionState::AwaitingFinalization}},
        {SessionState::AwaitingFinalization, {SessionState::Completed}},
    };

    if (target == SessionState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Initialized: return "Initialized";
        case SessionState::Transferring: return "Transferring";
        case SessionState::AwaitingFinalization: return "AwaitingFinalization";
        case SessionState::Completed: return "Completed";
        case SessionState::Failed: return "Failed";
    }
    return "Unknown";
}

UploadSession::UploadSession(std::string session_id, std::string order_id, UploadManifest manifest)
    : session_id_(std::move(session_id))
    , order_id_(std::move(order_id))
    , manifest_(std::move(manifest))
    , last_transition_(std::chrono::steady_clock::now()) {
}

void UploadSession::set_chunk_size(std::size_t chunk_size) {
    chunk_size_ = chunk_size == 0 ? kDefaultChunkSize : chunk_size;
}

ingest::Result<void> UploadSession::transition_to(SessionState next_state) {
    if (state_ == next_state) {
        return ingest::Ok();
    }

    if (!can_transition(next_state)) {
        return ingest::Err<void>(ErrorCode::InvalidArgument,
                                 std::string("Illegal session transition ") + to_string(state_) +
                                 " -> " + to_string(next_state));
    }

    state_ = next_state;
    last_transition_ = std::chrono::steady_clock::now();
    if (next_state != SessionState::Failed) {
        last_error_.clear();
    }
    return ingest::Ok();
}

ingest::Result<void> UploadSession::mark_failed(std::string error_message) {
    const bool already_failed = state_ == SessionState::Failed;
    auto moved = transition_to(SessionState::Failed);
    if (moved.is_ok() && !already_failed) {
        last_error_ = std::move(error_message);
    }
    return moved;
}

bool UploadSession::can_transition(SessionState target) const noexcept {
    if (state_ == target) {
        return true;
    }

    if (state_ == SessionState::Failed || state_ == SessionState::Completed) {
        return false;
    }

    return is_progressive(state_, target);
}

} // namespace ingest::transport
