#include "ingest/transport/chunked_session_transport.hpp"

#include "ingest/network/multipart.hpp"

#include <spdlog/spdlog.h>

namespace ingest::transport {
using json = nlohmann::json;

ChunkedSessionTransport::ChunkedSessionTransport(ApiCredentials credentials,
                                                 events::EventBus& bus,
                                                 std::unique_ptr<LinkShortener> shortener,
                                                 std::size_t chunk_size_override)
    : ApiTransport(std::move(credentials), bus, std::move(shortener))
    , chunk_size_override_(chunk_size_override) {
}

Result<void> ChunkedSessionTransport::upload_directory(const std::filesystem::path& local_directory,
                                                       const std::string& remote_target,
                                                       const std::optional<pipeline::Customer>& customer,
                                                       pipeline::ProgressReporter& progress) {
    if (auto connected = ensure_connected(); connected.is_error()) {
        return Err<void>(connected.error().rewrap(ErrorCode::TransferFailed, "Not connected"));
    }

    auto manifest = build_manifest(local_directory);
    if (manifest.is_error()) {
        return Err<void>(manifest.error());
    }
    progress.begin(manifest.value().total_bytes());

    auto opened = open_session(std::move(manifest.value()), remote_target, customer);
    if (opened.is_error()) {
        return Err<void>(opened.error());
    }
    UploadSession& session = opened.value();
    spdlog::info("[{}] Session {} (order {}) for {}: {} file(s), {} bytes, chunk size {}",
                 name(), session.session_id(), session.order_id(), remote_target,
                 session.manifest().files.size(), session.manifest().total_bytes(), session.chunk_size());

    if (auto transferred = transfer_files(session, progress); transferred.is_error()) {
        session.mark_failed(transferred.error().message);
        return transferred;
    }

    if (auto finalizing = session.transition_to(SessionState::AwaitingFinalization); finalizing.is_error()) {
        return finalizing;
    }
    auto link = complete_session(session);
    if (link.is_error()) {
        session.mark_failed(link.error().message);
        return Err<void>(link.error());
    }
    if (auto completed = session.transition_to(SessionState::Completed); completed.is_error()) {
        return completed;
    }

    {
        std::lock_guard lock(links_mutex_);
        links_[remote_target] = link.value();
    }
    spdlog::info("[{}] Session {} completed, customer URL {}", name(), session.session_id(), link.value());
    return Ok();
}

Result<std::string> ChunkedSessionTransport::shareable_link(const std::string& remote_target) {
    std::string link;
    {
        std::lock_guard lock(links_mutex_);
        const auto it = links_.find(remote_target);
        if (it != links_.end()) {
            link = std::move(it->second);
            links_.erase(it);
        }
    }
    if (link.empty()) {
        return Err<std::string>(ErrorCode::LinkResolutionFailed, "No customer URL known for " + remote_target);
    }
    return Ok(shorten(link));
}

Result<UploadSession> ChunkedSessionTransport::open_session(UploadManifest manifest,
                                                            const std::string& remote_target,
                                                            const std::optional<pipeline::Customer>& customer) {
    json request{{"target", remote_target}, {"files", files_json(manifest)}};
    if (customer) {
        request["customer"] = customer_json(*customer);
    }

    auto response = post_json("upload/init", request, network::timeouts::kControl);
    if (response.is_error()) {
        return Err<UploadSession>(response.error());
    }
    const json& body = response.value();
    const std::string session_id = id_field(body, "session_id");
    if (session_id.empty()) {
        return Err<UploadSession>(ErrorCode::TransferFailed, "upload/init returned no session_id");
    }

    UploadSession session(session_id, id_field(body, "order_id"), std::move(manifest));
    std::size_t chunk_size = 0;
    if (const auto it = body.find("chunk_size"); it != body.end() && it->is_number_integer() &&
                                                 it->get<std::int64_t>() > 0) {
        chunk_size = it->get<std::size_t>();
    }
    session.set_chunk_size(chunk_size_override_ > 0 ? chunk_size_override_ : chunk_size);
    return Ok(std::move(session));
}

Result<void> ChunkedSessionTransport::transfer_files(UploadSession& session, pipeline::ProgressReporter& progress) {
    if (auto started = session.transition_to(SessionState::Transferring); started.is_error()) {
        return started;
    }

    std::uint64_t uploaded = 0;
    for (const auto& entry : session.manifest().files) {
        progress.file_progress(entry.name, 0, entry.size);

        std::uint64_t sent = 0;
        auto result = for_each_chunk(entry.absolute_path, session.chunk_size(),
            [&](FileChunk&& chunk) -> Result<void> {
                const std::size_t length = chunk.data.size();
                if (auto ack = send_chunk(session, entry, std::move(chunk)); ack.is_error()) {
                    return ack;
                }
                sent += length;
                uploaded += length;
                progress.file_progress(entry.name, sent, entry.size);
                progress.directory_progress(uploaded);
                return Ok();
            });
        if (result.is_error()) {
            spdlog::error("[{}] {} failed: {}", name(), entry.name, result.error().message);
            return Err<void>(result.error().code == ErrorCode::TransferFailed
                                 ? result.error()
                                 : result.error().rewrap(ErrorCode::TransferFailed, entry.name));
        }

        if (entry.size == 0) {
            // Nothing was sent; still report the file as done
            progress.file_progress(entry.name, 0, 0);
        }
        spdlog::debug("[{}] {} uploaded ({} bytes)", name(), entry.name, entry.size);
    }
    return Ok();
}

Result<void> ChunkedSessionTransport::send_chunk(const UploadSession& session,
                                                 const ManifestEntry& entry,
                                                 FileChunk&& chunk) {
    network::MultipartForm form;
    form.add_field("session_id", session.session_id());
    form.add_field("file_name", entry.name);
    form.add_field("chunk_index", std::to_string(chunk.index));
    form.add_field("total_chunks", std::to_string(chunk.total));
    form.add_file("chunk", entry.name, "application/octet-stream", chunk.data);

    auto response = http().post(endpoint("upload/chunk"), form.body(), form.content_type(),
                                auth_headers(), network::timeouts::kBulk);
    if (response.is_error()) {
        return Err<void>(response.error().rewrap(ErrorCode::TransferFailed,
            "Chunk " + std::to_string(chunk.index + 1) + "/" + std::to_string(chunk.total) + " of " + entry.name));
    }
    if (response.value().status_code != 200) {
        return Err<void>(http_error(response.value()));
    }
    return Ok();
}

Result<std::string> ChunkedSessionTransport::complete_session(const UploadSession& session) {
    auto response = post_json("upload/complete", json{{"session_id", session.session_id()}},
                              network::timeouts::kControl);
    if (response.is_error()) {
        return Err<std::string>(response.error());
    }
    return Ok(text_field(response.value(), "customer_url"));
}

} // namespace ingest::transport
