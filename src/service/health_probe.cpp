#include "memboot/health.hpp"

#include <algorithm>
#include <thread>

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace memboot {

// ============================================================================
// Body Evaluation
// ============================================================================

HealthCheckResult evaluate_health_body(const std::string& body) {
    HealthCheckResult result;
    result.reachable = true;

    try {
        auto j = nlohmann::json::parse(body);
        if (!j.is_object()) {
            result.error = "health response is not a JSON object";
            return result;
        }
        if (!j.contains("status") || !j["status"].is_string()) {
            result.error = "health response has no status field";
            return result;
        }
        result.status = j["status"].get<std::string>();
    } catch (const nlohmann::json::parse_error&) {
        result.error = "health response is not JSON";
        return result;
    }

    if (result.status != "ok") {
        result.error = "health status is \"" + result.status + "\"";
        return result;
    }

    result.ok = true;
    return result;
}

// ============================================================================
// HTTP Probe with libcurl
// ============================================================================

namespace {

size_t curl_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    buffer->append(ptr, total);
    return total;
}

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

} // namespace

HttpHealthProbe::HttpHealthProbe(std::string url, std::chrono::milliseconds timeout)
    : url_(std::move(url)), timeout_(timeout) {}

HealthCheckResult HttpHealthProbe::check() {
    HealthCheckResult result;

    get_curl_init();

    CurlHandle curl;
    if (!curl) {
        result.error = "failed to initialize CURL";
        return result;
    }

    std::string body;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROXY, "*");
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "memboot-health/1.0");

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        result.error = std::string("health request failed: ") +
                       (error_buffer[0] ? error_buffer : curl_easy_strerror(res));
        return result;
    }

    long http_status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);

    if (http_status < 200 || http_status >= 300) {
        result.reachable = true;
        result.http_status = http_status;
        result.error = "HTTP " + std::to_string(http_status);
        return result;
    }

    result = evaluate_health_body(body);
    result.http_status = http_status;
    return result;
}

// ============================================================================
// Polling
// ============================================================================

RetryPolicy RetryPolicy::from_config(const InstallConfig& config) {
    RetryPolicy policy;
    policy.initial_delay = config.service.initial_delay;
    policy.interval = config.service.interval;
    policy.max_interval = config.service.max_interval;
    policy.backoff = config.service.backoff;
    policy.deadline = config.service.deadline;
    return policy;
}

WaitResult wait_for_healthy(HealthProbe& probe, const RetryPolicy& policy) {
    using clock = std::chrono::steady_clock;
    using std::chrono::milliseconds;

    WaitResult result;
    auto start = clock::now();
    auto deadline = start + policy.deadline;

    auto elapsed = [&] { return std::chrono::duration_cast<milliseconds>(clock::now() - start); };

    std::this_thread::sleep_for(std::min(policy.initial_delay, policy.deadline));

    milliseconds interval = policy.interval;
    while (true) {
        ++result.attempts;
        auto check = probe.check();
        if (check.ok) {
            result.healthy = true;
            result.elapsed = elapsed();
            return result;
        }
        result.last_error = check.error;
        spdlog::debug("health probe attempt {} failed: {}", result.attempts, check.error);

        auto now = clock::now();
        if (now >= deadline) break;

        auto remaining = std::chrono::duration_cast<milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(interval, remaining));

        auto next = milliseconds(static_cast<long long>(static_cast<double>(interval.count()) * policy.backoff));
        interval = std::min(std::max(next, milliseconds(1)), std::max(policy.max_interval, policy.interval));
    }

    result.elapsed = elapsed();
    return result;
}

} // namespace memboot
