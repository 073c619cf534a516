#include "ingest/pipeline/notifier.hpp"

#include "ingest/logging/log_setup.hpp"

namespace ingest::pipeline {

Notification compose_success_email(const std::string& directory_name,
                                   const std::string& share_link,
                                   const Customer& customer,
                                   const std::string& fallback_recipient) {
    Notification mail;
    mail.recipient = customer.has_email() ? customer.email : fallback_recipient;
    mail.subject = "Upload complete: " + directory_name;

    const std::string greeting = customer.first_name.empty() ? "Hello," : "Hello " + customer.first_name + ",";
    mail.body = greeting + "\n\n"
                "thank you for your visit. Your media have been uploaded and are ready.\n"
                "Download them here:\n\n" +
                share_link + "\n\n"
                "The link stays active for about 14 days.\n";
    return mail;
}

Notification compose_failure_email(const std::string& directory_name,
                                   const std::string& error_text,
                                   const std::string& fallback_recipient) {
    Notification mail;
    mail.recipient = fallback_recipient;
    mail.subject = "Upload FAILED: " + directory_name;
    mail.body = "The directory '" + directory_name + "' could NOT be uploaded.\n\n"
                "Error details:\n" + error_text + "\n\n"
                "The directory was moved to the failure folder (if one is configured).\n";
    return mail;
}

Notification compose_success_sms(const std::string& share_link, const Customer& customer) {
    Notification sms;
    sms.recipient = customer.phone;
    sms.body = "Hello " + customer.first_name + ",\n"
               "your media download is ready.\n"
               "Link (valid 14 days): " + share_link + "\n";
    return sms;
}

LoggingNotifier::LoggingNotifier(Channel channel, const config::SettingsStore& settings)
    : channel_(channel)
    , settings_(settings) {
}

const char* LoggingNotifier::channel() const {
    return channel_ == Channel::Email ? "email" : "sms";
}

Result<void> LoggingNotifier::send_success(const std::string& directory_name,
                                           const std::string& share_link,
                                           const Customer& customer) {
    if (channel_ == Channel::Sms) {
        return deliver(compose_success_sms(share_link, customer));
    }
    return deliver(compose_success_email(directory_name, share_link, customer,
                                         settings_.snapshot().fallback_recipient));
}

Result<void> LoggingNotifier::send_failure(const std::string& directory_name,
                                           const std::string& error_text) {
    if (channel_ == Channel::Sms) {
        return Err<void>(ErrorCode::NotificationFailed, "SMS channel does not send failure notices");
    }
    return deliver(compose_failure_email(directory_name, error_text,
                                         settings_.snapshot().fallback_recipient));
}

Result<void> LoggingNotifier::deliver(const Notification& notification) {
    if (notification.recipient.empty()) {
        return Err<void>(ErrorCode::NotificationFailed,
                         std::string("No recipient for ") + channel() + " notification");
    }
    if (notification.subject.empty()) {
        logging::activity()->info("[{}] to {}: {}", channel(), notification.recipient, notification.body);
    } else {
        logging::activity()->info("[{}] to {} \"{}\": {}", channel(), notification.recipient,
                                  notification.subject, notification.body);
    }
    return Ok();
}

} // namespace ingest::pipeline
