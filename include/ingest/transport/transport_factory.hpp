#pragma once

#include "ingest/config/settings.hpp"
#include "ingest/events/event_bus.hpp"
#include "ingest/transport/remote_transport.hpp"

#include <memory>

namespace ingest::transport {

/**
 * @brief Build the transport selected in `settings`
 *
 * The instance is not connected yet. A link shortener is attached when
 * a shortener URL is configured.
 */
std::shared_ptr<RemoteTransport> make_transport(const config::Settings& settings, events::EventBus& bus);

} // namespace ingest::transport
