#include "QualityService.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>

#include <httplib.h>

namespace {
using Clock = std::chrono::steady_clock;

void setJsonResponse(httplib::Response& response, const EndpointResponse& result) {
    response.status = result.status;
    response.set_content(result.body, "application/json");
}

std::string param(const httplib::Request& request, const char* key) {
    return request.has_param(key) ? request.get_param_value(key) : std::string();
}

double elapsedMs(Clock::time_point started) {
    return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
}

void logMonitoringLine(const std::string& endpoint, int status, double latencyMs, const MonitoringSnapshot& snapshot) {
    std::ostringstream line;
    line << "[VeritasService][Monitor] endpoint=" << endpoint
         << " status=" << status
         << " total_requests=" << snapshot.totalRequests
         << " errors=" << snapshot.errorRequests
         << " latency_ms=" << latencyMs
         << " avg_latency_ms=" << snapshot.averageLatencyMs;
    std::cout << line.str() << "\n";
}
} // namespace

QualityService::QualityService(QualityEndpoints& endpointsRef, RequestMonitor& monitorRef)
    : endpoints(endpointsRef), monitor(monitorRef) {}

int QualityService::start(const Config& config) {
    httplib::Server server;
    server.new_task_queue = [threadCount = std::max<size_t>(1, config.threadCount)] {
        return new httplib::ThreadPool(static_cast<int>(threadCount));
    };

    auto respond = [this](const std::string& endpoint, Clock::time_point started, httplib::Response& response,
                          const EndpointResponse& result) {
        const double latencyMs = elapsedMs(started);
        if (result.status >= 400) {
            monitor.recordError(endpoint, latencyMs);
        } else {
            monitor.recordSuccess(endpoint, latencyMs);
        }
        setJsonResponse(response, result);
        logMonitoringLine(endpoint, result.status, latencyMs, monitor.snapshot());
    };

    server.Get("/quality", [this, respond](const httplib::Request& request, httplib::Response& response) {
        const auto started = Clock::now();
        respond("/quality", started, response,
                endpoints.quality(param(request, "dataset"),
                                  param(request, "name"),
                                  param(request, "target"),
                                  param(request, "profile"),
                                  param(request, "filter")));
    });

    server.Post("/target", [this, respond](const httplib::Request& request, httplib::Response& response) {
        const auto started = Clock::now();
        respond("/target", started, response,
                endpoints.setTarget(param(request, "dataset"), param(request, "target_col")));
    });

    server.Delete("/target", [this, respond](const httplib::Request& request, httplib::Response& response) {
        const auto started = Clock::now();
        respond("/target", started, response, endpoints.clearTarget(param(request, "dataset")));
    });

    server.Get("/health", [this](const httplib::Request&, httplib::Response& response) {
        setJsonResponse(response, endpoints.health());
    });

    std::cout << "[VeritasService] host=" << config.host
              << " port=" << config.port
              << " threads=" << std::max<size_t>(1, config.threadCount)
              << "\n";

    if (!server.listen(config.host.c_str(), config.port)) {
        std::cerr << "[VeritasService] failed_to_bind host=" << config.host << " port=" << config.port << "\n";
        return 1;
    }
    return 0;
}
