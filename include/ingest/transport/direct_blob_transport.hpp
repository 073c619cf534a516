#pragma once

#include "ingest/transport/api_transport.hpp"
#include "ingest/transport/upload_session.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace ingest::transport {

struct DirectBlobOptions {
    std::size_t max_parallel = 3;
    std::chrono::milliseconds status_poll_interval{2000};
    std::chrono::milliseconds status_timeout{120000};
};

/**
 * @brief Files go straight to blob storage through presigned URLs
 *
 * Protocol:
 * 1. POST {api}/upload/direct-init  -> {session_id, order_id, tenant_id}
 * 2. per file, on a bounded thread pool:
 *    a. POST {api}/upload/presigned-url -> {upload_url, blob_path, client_token?}
 *    b. PUT upload_url (file bytes)
 *    c. POST {api}/upload/register
 * 3. GET {api}/upload/status/{session_id} until "completed"
 *
 * FAILURE HANDLING:
 * The first failing file cancels the rest: queued files never start and
 * running ones stop before their next request. A register failure after a
 * successful PUT is a RegistrationOrphan: the blob exists but the server
 * does not know about it.
 */
class DirectBlobTransport : public ApiTransport {
public:
    DirectBlobTransport(ApiCredentials credentials,
                        events::EventBus& bus,
                        std::unique_ptr<LinkShortener> shortener,
                        DirectBlobOptions options = {});

    const char* name() const override { return "direct_blob"; }

    Result<void> upload_directory(const std::filesystem::path& local_directory,
                                  const std::string& remote_target,
                                  const std::optional<pipeline::Customer>& customer,
                                  pipeline::ProgressReporter& progress) override;

    /// The customer_url of the final session status
    Result<std::string> shareable_link(const std::string& remote_target) override;

private:
    /**
     * @brief State shared by the pool workers of one upload
     */
    struct TransferState {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;                       // Guards the fields below and both progress emissions
        std::uint64_t uploaded = 0;
        std::optional<Error> first_error;
    };

    Result<UploadSession> open_session(UploadManifest manifest,
                                       const std::string& remote_target,
                                       const std::optional<pipeline::Customer>& customer);

    Result<void> transfer_files(UploadSession& session, pipeline::ProgressReporter& progress);

    Result<void> upload_file(const UploadSession& session,
                             const ManifestEntry& entry,
                             TransferState& state,
                             pipeline::ProgressReporter& progress);

    Result<std::string> await_completion(const UploadSession& session);

    DirectBlobOptions options_;
    std::mutex links_mutex_;
    std::unordered_map<std::string, std::string> links_;
};

} // namespace ingest::transport
