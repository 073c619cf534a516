#include "ingest/transport/simple_multipart_transport.hpp"

#include "ingest/network/multipart.hpp"
#include "ingest/network/url.hpp"
#include "ingest/transport/upload_manifest.hpp"

#include <spdlog/spdlog.h>

namespace ingest::transport {

std::string SimpleMultipartTransport::site_root(const std::string& api_url) {
    std::string root = api_url;
    while (!root.empty() && root.back() == '/') {
        root.pop_back();
    }
    const std::string suffix = "/api";
    if (root.size() >= suffix.size() && root.compare(root.size() - suffix.size(), suffix.size(), suffix) == 0) {
        root.erase(root.size() - suffix.size());
    }
    return root;
}

Result<void> SimpleMultipartTransport::upload_directory(const std::filesystem::path& local_directory,
                                                        const std::string& remote_target,
                                                        const std::optional<pipeline::Customer>&,
                                                        pipeline::ProgressReporter& progress) {
    if (auto connected = ensure_connected(); connected.is_error()) {
        return Err<void>(connected.error().rewrap(ErrorCode::TransferFailed, "Not connected"));
    }

    auto manifest = build_manifest(local_directory);
    if (manifest.is_error()) {
        return Err<void>(manifest.error());
    }
    const auto& files = manifest.value().files;
    progress.begin(manifest.value().total_bytes());
    spdlog::info("[{}] Uploading {} file(s) of {}", name(), files.size(), remote_target);

    network::MultipartForm form;
    for (std::size_t i = 0; i < files.size(); ++i) {
        const auto& entry = files[i];
        auto data = read_file(entry.absolute_path);
        if (data.is_error()) {
            return Err<void>(data.error().rewrap(ErrorCode::TransferFailed, "Preparing upload"));
        }
        const std::string qualified = manifest.value().qualified_name(entry);
        spdlog::debug("[{}] Prepared ({}/{}) {}", name(), i + 1, files.size(), qualified);
        form.add_file("files", qualified, entry.mime_type, data.value());
    }

    auto response = http().post(endpoint("upload"), form.body(), form.content_type(),
                                auth_headers(), network::timeouts::kBulk);
    if (response.is_error()) {
        return Err<void>(response.error().rewrap(ErrorCode::TransferFailed, "Upload request"));
    }

    const auto& res = response.value();
    if (res.status_code != 200 && res.status_code != 201) {
        std::string detail = res.body_as_string();
        auto decoded = decode_json(res);
        if (decoded.is_ok() && !text_field(decoded.value(), "error").empty()) {
            detail = text_field(decoded.value(), "error");
        }
        spdlog::error("[{}] Upload failed: HTTP {} - {}", name(), res.status_code, detail);
        return Err<void>(ErrorCode::TransferFailed, "HTTP " + std::to_string(res.status_code) + ": " + detail);
    }

    auto body = decode_json(res);
    if (body.is_error()) {
        return Err<void>(body.error().rewrap(ErrorCode::TransferFailed, "Upload response"));
    }
    const std::string order_id = id_field(body.value(), "order_id");
    {
        std::lock_guard lock(orders_mutex_);
        order_ids_[remote_target] = order_id;
    }

    for (const auto& entry : files) {
        progress.file_progress(entry.name, entry.size, entry.size);
    }
    progress.complete();

    spdlog::info("[{}] Upload complete: order {} session {} customer URL {}", name(), order_id,
                 id_field(body.value(), "session_id"), text_field(body.value(), "customer_url"));
    return Ok();
}

Result<std::string> SimpleMultipartTransport::shareable_link(const std::string& remote_target) {
    std::string order_id;
    {
        std::lock_guard lock(orders_mutex_);
        const auto it = order_ids_.find(remote_target);
        if (it != order_ids_.end()) {
            order_id = std::move(it->second);
            order_ids_.erase(it);
        }
    }
    if (order_id.empty()) {
        return Err<std::string>(ErrorCode::LinkResolutionFailed, "No order id known for " + remote_target);
    }

    const std::string fallback = site_root(credentials().base_url) + "/content/" + order_id;

    spdlog::info("[{}] Fetching share link for order {}", name(), order_id);
    auto response = http().get(endpoint("get-share-link/" + network::encode_path_segment(order_id)),
                               auth_headers(), network::timeouts::kLink);
    if (response.is_error()) {
        spdlog::error("[{}] Share link request failed: {}; using {}", name(), response.error().message, fallback);
        return Ok(fallback);
    }
    const auto& res = response.value();
    if (res.status_code != 200 && res.status_code != 201) {
        spdlog::error("[{}] Share link request answered HTTP {}; using {}", name(), res.status_code, fallback);
        return Ok(fallback);
    }

    auto body = decode_json(res);
    if (body.is_error()) {
        return Err<std::string>(body.error().rewrap(ErrorCode::LinkResolutionFailed, "Share link response"));
    }
    std::string link;
    for (const char* key : {"share_url", "customer_url", "url"}) {
        link = text_field(body.value(), key);
        if (!link.empty()) {
            break;
        }
    }
    if (link.empty()) {
        return Err<std::string>(ErrorCode::LinkResolutionFailed, "Share link response contains no link");
    }
    spdlog::info("[{}] Share link: {}", name(), link);
    return Ok(shorten(link));
}

} // namespace ingest::transport
