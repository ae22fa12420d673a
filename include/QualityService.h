#pragma once

#include "QualityConfig.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Per-dataset manual target overrides shared by all request threads.
class TargetOverrideStore {
public:
    void set(const std::string& dataset, const std::string& column);
    std::optional<std::string> get(const std::string& dataset) const;
    bool clear(const std::string& dataset);
    size_t size() const;

private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::string> overrides;
};

struct MonitoringSnapshot {
    uint64_t totalRequests = 0;
    uint64_t qualityRequests = 0;
    uint64_t errorRequests = 0;
    double averageLatencyMs = 0.0;
};

class RequestMonitor {
public:
    void recordSuccess(const std::string& endpoint, double latencyMs);
    void recordError(const std::string& endpoint, double latencyMs);
    MonitoringSnapshot snapshot() const;

private:
    void record(const std::string& endpoint, double latencyMs);

    std::atomic<uint64_t> totalRequests{0};
    std::atomic<uint64_t> qualityRequests{0};
    std::atomic<uint64_t> errorRequests{0};
    std::atomic<uint64_t> totalLatencyMicros{0};
};

struct EndpointResponse {
    int status = 200;
    std::string body;
};

/**
 * @brief Transport-independent handlers behind the HTTP routes.
 * @details Load and parameter failures become 400 responses with an {"error": ...} body.
 *          Dataset and profile paths are resolved against the configured upload root;
 *          relative paths are taken below it and anything that escapes it is rejected.
 */
class QualityEndpoints {
public:
    QualityEndpoints(QualityConfig baseConfig, TargetOverrideStore& overrides);

    // An explicit target wins over the stored override for the dataset. A stored
    // override that names no column of the dataset is dropped from the store.
    EndpointResponse quality(const std::string& dataset,
                             const std::string& name,
                             const std::string& target,
                             const std::string& profile,
                             const std::string& filter) const;
    EndpointResponse setTarget(const std::string& dataset, const std::string& targetColumn);
    EndpointResponse clearTarget(const std::string& dataset);
    EndpointResponse health() const;

    // Canonical form of `requested` when it lies below `root`, otherwise nullopt.
    static std::optional<std::string> resolveBelow(const std::filesystem::path& root, const std::string& requested);

private:
    QualityConfig baseConfig;
    TargetOverrideStore& overrides;
    std::filesystem::path root;
};

class QualityService {
public:
    struct Config {
        std::string host = "127.0.0.1";
        int port = 8090;
        size_t threadCount = 4;
    };

    QualityService(QualityEndpoints& endpoints, RequestMonitor& monitor);
    int start(const Config& config);

private:
    QualityEndpoints& endpoints;
    RequestMonitor& monitor;
};
