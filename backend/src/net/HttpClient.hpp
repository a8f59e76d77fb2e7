#pragma once
#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

class HttpError : public std::runtime_error {
public:
    HttpError(const std::string& what, bool timed_out)
        : std::runtime_error(what), timeout(timed_out) {}

    bool isTimeout() const { return timeout; }

private:
    bool timeout;
};

// Process-wide libcurl setup. Keep one alive in main() before any request.
class HttpGlobal {
public:
    HttpGlobal();
    ~HttpGlobal();
    HttpGlobal(const HttpGlobal&) = delete;
    HttpGlobal& operator=(const HttpGlobal&) = delete;
};

/*
  Blocking HTTP POST over libcurl. Transport failures throw HttpError
  (isTimeout() for CURLE_OPERATION_TIMEDOUT or a passed deadline); HTTP
  status codes are returned as-is for the caller to judge.

  Every request gets the configured timeout, cut down to whatever is left
  before the deadline when one is set.
*/
class HttpClient {
public:
    using Clock = std::chrono::steady_clock;

    explicit HttpClient(long timeout_ms = 30000);
    virtual ~HttpClient() = default;

    virtual HttpResponse postJson(const std::string& url, const std::string& body) const;
    virtual HttpResponse postForm(const std::string& url, const std::map<std::string, std::string>& fields,
        const std::string& accept) const;

    void setDeadline(Clock::time_point when) { deadline = when; }
    void clearDeadline() { deadline.reset(); }

    // Curl timeout for the next request; <= 0 once the deadline has passed.
    long effectiveTimeout() const;

private:
    long timeout_ms;
    std::optional<Clock::time_point> deadline;

    HttpResponse post(const std::string& url, const std::string& body, const std::string& content_type,
        const std::string& accept) const;
};
