#include "monitoring/mail_service.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cstring>
#include <ctime>
#include <memory>

namespace {

struct UploadState {
    const std::string* payload;
    size_t offset;
};

size_t readCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* state = static_cast<UploadState*>(userp);
    size_t room = size * nitems;
    size_t remaining = state->payload->size() - state->offset;
    size_t n = std::min(room, remaining);
    std::memcpy(buffer, state->payload->data() + state->offset, n);
    state->offset += n;
    return n;
}

std::string rfc2822Date() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S +0000", &tm);
    return buffer;
}

} // namespace

MailService::MailService(const MailConfig& config)
    : config_(config) {}

std::string MailService::subject(bool success, const MonitorKey& key) {
    return std::string(success ? "Success" : "Failure") + ": Backup Job '" + key.jobName +
           "' on host '" + key.hostname + "'";
}

std::string MailService::body(bool success, const MonitorKey& key, const JobStats& stats) {
    return "Backup Job '" + key.jobName + "' on host '" + key.hostname + "' " +
           (success ? "succeeded." : "has failed.") + "\n\nStats: " + stats.toJson().dump(2) + "\n";
}

std::string MailService::composeMessage(const std::string& subject, const std::string& body) const {
    std::string message;
    message += "Date: " + rfc2822Date() + "\r\n";
    message += "From: " + config_.smtpFrom + "\r\n";
    message += "To: " + utils::join(config_.smtpTo, ", ") + "\r\n";
    message += "Subject: " + subject + "\r\n";
    message += "Content-Type: text/plain; charset=utf-8\r\n";
    message += "\r\n";

    // SMTP wants CRLF line endings in the body as well
    for (char c : body) {
        if (c == '\n') {
            message += "\r\n";
        } else {
            message += c;
        }
    }
    return message;
}

void MailService::send(const std::string& subject, const std::string& body) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw MonitoringError("Failed to initialize CURL");
    }

    std::string scheme = config_.smtpPort == 465 ? "smtps://" : "smtp://";
    std::string url = scheme + config_.smtpServer + ":" + std::to_string(config_.smtpPort);

    struct curl_slist* recipients = nullptr;
    for (const auto& to : config_.smtpTo) {
        recipients = curl_slist_append(recipients, ("<" + to + ">").c_str());
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> recipientGuard(recipients, curl_slist_free_all);

    std::string payload = composeMessage(subject, body);
    UploadState state{&payload, 0};
    std::string from = "<" + config_.smtpFrom + ">";

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    if (!config_.smtpUser.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_USERNAME, config_.smtpUser.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, config_.smtpPassword.c_str());
    }
    curl_easy_setopt(curl.get(), CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_TRY));
    curl_easy_setopt(curl.get(), CURLOPT_MAIL_FROM, from.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MAIL_RCPT, recipients);
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, readCallback);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, &state);
    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 60L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw MonitoringError("Failed to send email: " + std::string(curl_easy_strerror(res)));
    }
    Logger::debug("Sent mail '" + subject + "'");
}

void MailService::notifyStart(const MonitorKey&) {
}

void MailService::notifySuccess(const MonitorKey& key, const JobStats& stats) {
    send(subject(true, key), body(true, key, stats));
}

void MailService::notifyFailure(const MonitorKey& key, const JobStats& stats) {
    send(subject(false, key), body(false, key, stats));
}
