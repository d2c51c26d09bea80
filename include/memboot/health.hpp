#pragma once

#include "memboot/config.hpp"

#include <chrono>
#include <string>

namespace memboot {

// ============================================================================
// Health Evaluation
// ============================================================================

struct HealthCheckResult {
    bool ok = false;         // endpoint reported status "ok"
    bool reachable = false;  // an HTTP response was received
    long http_status = 0;
    std::string status;      // value of the "status" field, if any
    std::string error;
};

// A body is healthy iff it is a JSON object whose "status" is the string "ok"
HealthCheckResult evaluate_health_body(const std::string& body);

// ============================================================================
// Probes
// ============================================================================

class HealthProbe {
public:
    virtual ~HealthProbe() = default;
    virtual HealthCheckResult check() = 0;
};

// HTTP GET against a local endpoint using libcurl. Proxies are bypassed.
class HttpHealthProbe : public HealthProbe {
public:
    HttpHealthProbe(std::string url, std::chrono::milliseconds timeout);

    HealthCheckResult check() override;

    const std::string& url() const { return url_; }

private:
    std::string url_;
    std::chrono::milliseconds timeout_;
};

// ============================================================================
// Polling
// ============================================================================

struct RetryPolicy {
    std::chrono::milliseconds initial_delay{500};
    std::chrono::milliseconds interval{500};
    std::chrono::milliseconds max_interval{2000};
    double backoff = 1.5;
    std::chrono::milliseconds deadline{15000};

    static RetryPolicy from_config(const InstallConfig& config);
};

struct WaitResult {
    bool healthy = false;
    int attempts = 0;
    std::string last_error;
    std::chrono::milliseconds elapsed{0};
};

// Probe after `initial_delay`, then again after each interval (multiplied
// by `backoff` up to `max_interval`) until the probe succeeds or the
// deadline passes. At least one probe always runs.
WaitResult wait_for_healthy(HealthProbe& probe, const RetryPolicy& policy);

} // namespace memboot
