#pragma once

#include "ingest/config/settings.hpp"
#include "ingest/core/result.hpp"
#include "ingest/pipeline/job.hpp"

#include <string>

namespace ingest::pipeline {

/**
 * @brief A rendered message, ready for a delivery channel
 */
struct Notification {
    std::string recipient;
    std::string subject;    ///< Empty for SMS
    std::string body;
};

/// Success mail to the customer, or to the fallback address without one
Notification compose_success_email(const std::string& directory_name,
                                   const std::string& share_link,
                                   const Customer& customer,
                                   const std::string& fallback_recipient);

/// Failure mail, always to the fallback address
Notification compose_failure_email(const std::string& directory_name,
                                   const std::string& error_text,
                                   const std::string& fallback_recipient);

Notification compose_success_sms(const std::string& share_link, const Customer& customer);

/**
 * @brief Delivery channel for job outcomes (email, SMS)
 *
 * Implementations return NotificationFailed instead of throwing; the
 * worker logs and absorbs these errors.
 */
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual const char* channel() const = 0;

    virtual Result<void> send_success(const std::string& directory_name,
                                      const std::string& share_link,
                                      const Customer& customer) = 0;

    virtual Result<void> send_failure(const std::string& directory_name,
                                      const std::string& error_text) = 0;
};

/**
 * @brief Renders notifications and writes them to the activity log
 *
 * Stands in for the SMTP and SMS gateways in the daemon: the worker's
 * notification contract is exercised end to end, and an operator can see
 * in activity.log what would have been delivered.
 */
class LoggingNotifier : public Notifier {
public:
    enum class Channel {
        Email,
        Sms
    };

    LoggingNotifier(Channel channel, const config::SettingsStore& settings);

    const char* channel() const override;

    Result<void> send_success(const std::string& directory_name,
                              const std::string& share_link,
                              const Customer& customer) override;

    Result<void> send_failure(const std::string& directory_name,
                              const std::string& error_text) override;

private:
    Result<void> deliver(const Notification& notification);

    Channel channel_;
    const config::SettingsStore& settings_;
};

} // namespace ingest::pipeline
