#include "ingest/transport/transport_factory.hpp"

#include "ingest/transport/chunked_session_transport.hpp"
#include "ingest/transport/direct_blob_transport.hpp"
#include "ingest/transport/simple_multipart_transport.hpp"

#include <spdlog/spdlog.h>

namespace ingest::transport {

std::shared_ptr<RemoteTransport> make_transport(const config::Settings& settings, events::EventBus& bus) {
    ApiCredentials credentials{settings.api_url, settings.api_bearer_token};

    std::unique_ptr<LinkShortener> shortener;
    if (!settings.shortener_url.empty()) {
        shortener = std::make_unique<HttpLinkShortener>(settings.shortener_url, settings.shortener_api_key);
    }

    spdlog::info("Using transport '{}' against {}", config::to_string(settings.selected_transport),
                 settings.api_url.empty() ? "<no API URL>" : settings.api_url);

    switch (settings.selected_transport) {
        case config::TransportKind::ChunkedSession:
            return std::make_shared<ChunkedSessionTransport>(
                std::move(credentials), bus, std::move(shortener), settings.chunk_size_override);

        case config::TransportKind::DirectBlob: {
            DirectBlobOptions options;
            options.max_parallel = settings.direct_blob_max_parallel;
            options.status_poll_interval = settings.status_poll_interval;
            options.status_timeout = settings.status_timeout;
            return std::make_shared<DirectBlobTransport>(
                std::move(credentials), bus, std::move(shortener), options);
        }

        case config::TransportKind::SimpleMultipart:
            break;
    }
    return std::make_shared<SimpleMultipartTransport>(std::move(credentials), bus, std::move(shortener));
}

} // namespace ingest::transport
