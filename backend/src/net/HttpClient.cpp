#include "HttpClient.hpp"
#include <algorithm>
#include <memory>
#include <curl/curl.h>
#include <spdlog/spdlog.h>

HttpGlobal::HttpGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed");
    }
}

HttpGlobal::~HttpGlobal() {
    curl_global_cleanup();
}

static size_t writeBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpClient::HttpClient(long timeout)
    : timeout_ms(timeout)
{
}

long HttpClient::effectiveTimeout() const {
    if (!deadline) return timeout_ms;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()).count();
    return std::min(timeout_ms, static_cast<long>(left));
}

HttpResponse HttpClient::postJson(const std::string& url, const std::string& body) const {
    return post(url, body, "application/json", "application/json");
}

HttpResponse HttpClient::postForm(const std::string& url, const std::map<std::string, std::string>& fields,
    const std::string& accept) const
{
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> enc(curl_easy_init(), &curl_easy_cleanup);
    if (!enc) throw HttpError("curl_easy_init failed", false);

    std::string body;
    for (const auto& f : fields) {
        char* value = curl_easy_escape(enc.get(), f.second.c_str(), static_cast<int>(f.second.size()));
        if (!value) throw HttpError("failed to url-encode form field '" + f.first + "'", false);
        if (!body.empty()) body += "&";
        body += f.first + "=" + value;
        curl_free(value);
    }
    return post(url, body, "application/x-www-form-urlencoded", accept);
}

HttpResponse HttpClient::post(const std::string& url, const std::string& body, const std::string& content_type,
    const std::string& accept) const
{
    // CURLOPT_TIMEOUT_MS of 0 means no limit at all.
    long request_timeout = effectiveTimeout();
    if (request_timeout <= 0) {
        throw HttpError("POST " + url + ": deadline exceeded before the request was sent", true);
    }

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) throw HttpError("curl_easy_init failed", false);

    HttpResponse res;
    std::string ct_header = "Content-Type: " + content_type;
    std::string accept_header = "Accept: " + accept;

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, ct_header.c_str());
    headers = curl_slist_append(headers, accept_header.c_str());
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_guard(headers, &curl_slist_free_all);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, request_timeout);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeBody);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &res.body);

    spdlog::debug("POST {} ({} bytes, timeout {} ms)", url, body.size(), request_timeout);
    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        bool timed_out = (rc == CURLE_OPERATION_TIMEDOUT);
        throw HttpError(std::string("POST ") + url + ": " + curl_easy_strerror(rc), timed_out);
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &res.status);

    spdlog::debug("POST {} -> {} ({} bytes)", url, res.status, res.body.size());
    return res;
}
