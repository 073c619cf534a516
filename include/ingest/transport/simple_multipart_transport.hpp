#pragma once

#include "ingest/transport/api_transport.hpp"

#include <mutex>
#include <string>
#include <unordered_map>

namespace ingest::transport {

/**
 * @brief Whole directory in one multipart POST
 *
 * POST {api}/upload with one "files" part per file, named by its path
 * relative to the job directory's parent. The returned order id is kept
 * per remote target for shareable_link().
 */
class SimpleMultipartTransport : public ApiTransport {
public:
    using ApiTransport::ApiTransport;

    const char* name() const override { return "simple_multipart"; }

    Result<void> upload_directory(const std::filesystem::path& local_directory,
                                  const std::string& remote_target,
                                  const std::optional<pipeline::Customer>& customer,
                                  pipeline::ProgressReporter& progress) override;

    /**
     * @brief GET {api}/get-share-link/{order_id}
     *
     * Falls back to {site}/content/{order_id} when the endpoint fails.
     */
    Result<std::string> shareable_link(const std::string& remote_target) override;

    /// {api} without a trailing "/api" segment
    static std::string site_root(const std::string& api_url);

private:
    std::mutex orders_mutex_;
    std::unordered_map<std::string, std::string> order_ids_;
};

} // namespace ingest::transport
