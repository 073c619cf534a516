/**
 * @file remote_transport.hpp
 * @brief The capability set every upload backend provides
 *
 * WHY THIS FILE EXISTS:
 * The upload worker is written against this interface only. Which wire
 * protocol is behind it (single multipart POST, chunked session, direct
 * blob upload) is decided once per configuration by make_transport().
 *
 * THREAD SAFETY:
 * - upload_directory() and shareable_link() are called from the worker
 *   thread, one Job at a time
 * - connect(), disconnect() and status() may be called from any thread
 */

#pragma once

#include "ingest/core/result.hpp"
#include "ingest/pipeline/job.hpp"
#include "ingest/pipeline/progress.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace ingest::transport {

struct ConnectionStatus {
    bool connected = false;
    std::string text = "not connected";
};

class RemoteTransport {
public:
    virtual ~RemoteTransport() = default;

    /// Short protocol name for logs ("chunked_session", ...)
    virtual const char* name() const = 0;

    /**
     * @brief Validate credentials and reachability
     *
     * Publishes ConnectionStatusChangedEvent either way.
     */
    virtual Result<void> connect() = 0;

    virtual void disconnect() = 0;

    virtual ConnectionStatus status() const = 0;

    /**
     * @brief Upload every file below `local_directory` except the markers
     *
     * @param remote_target Stable slug naming the upload on the remote side
     * @param customer Forwarded as upload metadata where the protocol has it
     * @param progress Receives file and directory progress
     */
    virtual Result<void> upload_directory(const std::filesystem::path& local_directory,
                                          const std::string& remote_target,
                                          const std::optional<pipeline::Customer>& customer,
                                          pipeline::ProgressReporter& progress) = 0;

    /**
     * @brief Link the customer can open to download the upload of `remote_target`
     *
     * Only valid after a successful upload_directory() for the same target.
     * The remembered entry is consumed, so a second call for the same upload
     * fails with LinkResolutionFailed.
     */
    virtual Result<std::string> shareable_link(const std::string& remote_target) = 0;
};

} // namespace ingest::transport
