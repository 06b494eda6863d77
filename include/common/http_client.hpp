#pragma once

#include <string>
#include <vector>

struct HttpResponse {
    long status{0};
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Throws MonitoringError on transport failure; HTTP error statuses are returned
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<std::string>& headers) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(long timeoutSeconds = 30);

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<std::string>& headers) override;

private:
    long timeoutSeconds_;
};
