#pragma once

#include "backup/backup_config.hpp"
#include "monitoring/monitoring_service.hpp"
#include <string>

// Plain-text notification mails over SMTP. Start notifications are not mailed.
class MailService : public MonitoringService {
public:
    explicit MailService(const MailConfig& config);

    std::string getName() const override { return "mail"; }

    void notifyStart(const MonitorKey& key) override;
    void notifySuccess(const MonitorKey& key, const JobStats& stats) override;
    void notifyFailure(const MonitorKey& key, const JobStats& stats) override;

    static std::string subject(bool success, const MonitorKey& key);
    static std::string body(bool success, const MonitorKey& key, const JobStats& stats);

    // RFC 5322 message including headers
    std::string composeMessage(const std::string& subject, const std::string& body) const;

private:
    void send(const std::string& subject, const std::string& body);

    MailConfig config_;
};
