#pragma once

#include "ingest/transport/api_transport.hpp"
#include "ingest/transport/upload_session.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ingest::transport {

/**
 * @brief Session-based upload in fixed-size chunks
 *
 * Protocol:
 * 1. POST {api}/upload/init      {target, files, customer?} -> {session_id, order_id, chunk_size}
 * 2. POST {api}/upload/chunk     multipart, one request per chunk, files in manifest order
 * 3. POST {api}/upload/complete  {session_id} -> {customer_url}
 *
 * Progress is published after every acknowledged chunk.
 */
class ChunkedSessionTransport : public ApiTransport {
public:
    ChunkedSessionTransport(ApiCredentials credentials,
                            events::EventBus& bus,
                            std::unique_ptr<LinkShortener> shortener,
                            std::size_t chunk_size_override = 0);

    const char* name() const override { return "chunked_session"; }

    Result<void> upload_directory(const std::filesystem::path& local_directory,
                                  const std::string& remote_target,
                                  const std::optional<pipeline::Customer>& customer,
                                  pipeline::ProgressReporter& progress) override;

    /// The customer_url returned by upload/complete
    Result<std::string> shareable_link(const std::string& remote_target) override;

private:
    Result<UploadSession> open_session(UploadManifest manifest,
                                       const std::string& remote_target,
                                       const std::optional<pipeline::Customer>& customer);

    Result<void> transfer_files(UploadSession& session, pipeline::ProgressReporter& progress);

    Result<void> send_chunk(const UploadSession& session, const ManifestEntry& entry, FileChunk&& chunk);

    Result<std::string> complete_session(const UploadSession& session);

    std::size_t chunk_size_override_;
    std::mutex links_mutex_;
    std::unordered_map<std::string, std::string> links_;
};

} // namespace ingest::transport
