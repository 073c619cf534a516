#include "ingest/transport/direct_blob_transport.hpp"

#include "ingest/network/url.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <thread>

namespace ingest::transport {
using json = nlohmann::json;

DirectBlobTransport::DirectBlobTransport(ApiCredentials credentials,
                                         events::EventBus& bus,
                                         std::unique_ptr<LinkShortener> shortener,
                                         DirectBlobOptions options)
    : ApiTransport(std::move(credentials), bus, std::move(shortener))
    , options_(options) {
    options_.max_parallel = std::max<std::size_t>(options_.max_parallel, 1);
}

Result<void> DirectBlobTransport::upload_directory(const std::filesystem::path& local_directory,
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
    spdlog::info("[{}] Session {} (order {}, tenant {}) for {}: {} file(s), {} parallel",
                 name(), session.session_id(), session.order_id(), session.tenant_id(), remote_target,
                 session.manifest().files.size(), options_.max_parallel);

    if (auto transferred = transfer_files(session, progress); transferred.is_error()) {
        session.mark_failed(transferred.error().message);
        return transferred;
    }

    if (auto finalizing = session.transition_to(SessionState::AwaitingFinalization); finalizing.is_error()) {
        return finalizing;
    }
    auto link = await_completion(session);
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

Result<std::string> DirectBlobTransport::shareable_link(const std::string& remote_target) {
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

Result<UploadSession> DirectBlobTransport::open_session(UploadManifest manifest,
                                                        const std::string& remote_target,
                                                        const std::optional<pipeline::Customer>& customer) {
    json request{{"target", remote_target}, {"files", files_json(manifest)}};
    if (customer) {
        request["customer"] = customer_json(*customer);
    }

    auto response = post_json("upload/direct-init", request, network::timeouts::kControl);
    if (response.is_error()) {
        return Err<UploadSession>(response.error());
    }
    const json& body = response.value();
    const std::string session_id = id_field(body, "session_id");
    if (session_id.empty()) {
        return Err<UploadSession>(ErrorCode::TransferFailed, "upload/direct-init returned no session_id");
    }

    UploadSession session(session_id, id_field(body, "order_id"), std::move(manifest));
    session.set_tenant_id(id_field(body, "tenant_id"));
    return Ok(std::move(session));
}

Result<void> DirectBlobTransport::transfer_files(UploadSession& session, pipeline::ProgressReporter& progress) {
    if (auto started = session.transition_to(SessionState::Transferring); started.is_error()) {
        return started;
    }

    TransferState state;
    {
        boost::asio::thread_pool pool(options_.max_parallel);
        for (const auto& entry : session.manifest().files) {
            boost::asio::post(pool, [this, &session, &entry, &state, &progress]() {
                if (state.cancelled) {
                    return;
                }
                Result<void> result = Ok();
                try {
                    result = upload_file(session, entry, state, progress);
                } catch (const std::exception& e) {
                    // An exception leaving a pool handler terminates the process
                    result = Err<void>(ErrorCode::TransferFailed, "Upload of " + entry.name + " aborted: " + e.what());
                }
                if (result.is_error()) {
                    std::lock_guard lock(state.mutex);
                    if (!state.first_error) {
                        state.first_error = result.error();
                    }
                    state.cancelled = true;
                }
            });
        }
        pool.join();
    }

    if (state.first_error) {
        return Err<void>(*state.first_error);
    }
    return Ok();
}

Result<void> DirectBlobTransport::upload_file(const UploadSession& session,
                                              const ManifestEntry& entry,
                                              TransferState& state,
                                              pipeline::ProgressReporter& progress) {
    const auto cancelled = [&entry]() {
        return Err<void>(ErrorCode::TransferFailed, "Cancelled before " + entry.name + " completed");
    };

    // a. Presigned upload URL
    auto presigned = post_json("upload/presigned-url",
                               json{{"session_id", session.session_id()},
                                    {"file_name", entry.name},
                                    {"size", entry.size},
                                    {"type", entry.mime_type}},
                               network::timeouts::kControl);
    if (presigned.is_error()) {
        return Err<void>(presigned.error().rewrap(ErrorCode::TransferFailed, "Presigned URL for " + entry.name));
    }
    std::string upload_url = text_field(presigned.value(), "upload_url");
    const std::string blob_path = text_field(presigned.value(), "blob_path");
    const std::string client_token = text_field(presigned.value(), "client_token");
    if (upload_url.empty()) {
        return Err<void>(ErrorCode::TransferFailed, "No upload_url for " + entry.name);
    }
    if (upload_url.find("://") == std::string::npos) {
        upload_url = endpoint(upload_url);
    }
    if (state.cancelled) {
        return cancelled();
    }

    // b. Blob PUT, streamed from disk
    network::HttpHeaders headers{{"x-ms-blob-type", "BlockBlob"}};
    if (!client_token.empty()) {
        headers["Authorization"] = "Bearer " + client_token;
    }
    auto put = http().put_file(upload_url, entry.absolute_path, entry.mime_type, headers, network::timeouts::kBulk);
    if (put.is_error()) {
        return Err<void>(put.error().rewrap(ErrorCode::TransferFailed, "Blob upload of " + entry.name));
    }
    if (put.value().status_code != 200 && put.value().status_code != 201) {
        return Err<void>(http_error(put.value()).rewrap(ErrorCode::TransferFailed, "Blob upload of " + entry.name));
    }
    if (state.cancelled) {
        return cancelled();
    }

    // c. Registration
    auto registered = post_json("upload/register",
                                json{{"session_id", session.session_id()},
                                     {"file_name", entry.name},
                                     {"blob_path", blob_path},
                                     {"size", entry.size},
                                     {"type", entry.mime_type}},
                                network::timeouts::kControl);
    if (registered.is_error()) {
        spdlog::critical("[{}] {} stored as blob '{}' but registration failed: {}",
                         name(), entry.name, blob_path, registered.error().message);
        return Err<void>(registered.error().rewrap(ErrorCode::RegistrationOrphan,
                                                   "Registration of " + entry.name + " (blob " + blob_path + ")"));
    }

    {
        std::lock_guard lock(state.mutex);
        state.uploaded += entry.size;
        progress.file_progress(entry.name, entry.size, entry.size);
        progress.directory_progress(state.uploaded);
    }
    spdlog::debug("[{}] {} registered ({} bytes)", name(), entry.name, entry.size);
    return Ok();
}

Result<std::string> DirectBlobTransport::await_completion(const UploadSession& session) {
    const std::string path = "upload/status/" + network::encode_path_segment(session.session_id());
    const auto deadline = std::chrono::steady_clock::now() + options_.status_timeout;

    for (bool final_read = false;; ) {
        auto status = get_json(path, network::timeouts::kLink);
        if (status.is_ok()) {
            const std::string value = text_field(status.value(), "status");
            if (value == "completed") {
                return Ok(text_field(status.value(), "customer_url"));
            }
            if (value == "failed") {
                std::string detail = text_field(status.value(), "error");
                return Err<std::string>(ErrorCode::TransferFailed,
                                        "Server reports session " + session.session_id() + " failed" +
                                        (detail.empty() ? "" : ": " + detail));
            }
            spdlog::debug("[{}] Session {} status '{}'", name(), session.session_id(), value);
        } else {
            spdlog::warn("[{}] Status poll failed: {}", name(), status.error().message);
        }

        if (final_read) {
            if (status.is_error()) {
                return Err<std::string>(status.error());
            }
            return Err<std::string>(ErrorCode::Timeout,
                                    "Session " + session.session_id() + " not completed after " +
                                    std::to_string(options_.status_timeout.count()) + "ms");
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            final_read = true;
            continue;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            options_.status_poll_interval, deadline - now));
    }
}

} // namespace ingest::transport
