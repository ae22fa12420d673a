#include "QualityService.h"

#include "DatasetLoader.h"
#include "QualityPipeline.h"
#include "ReportJson.h"
#include "VeritasExceptions.h"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace {
long long toLatencyMicros(double latencyMs) {
    if (!std::isfinite(latencyMs) || latencyMs <= 0.0) return 0;
    return static_cast<long long>(std::llround(latencyMs * 1000.0));
}

EndpointResponse errorResponse(const std::string& message) {
    return {400, ReportJson::errorJson(message)};
}

std::filesystem::path canonicalRoot(const std::string& configured) {
    std::error_code ec;
    std::filesystem::path root = std::filesystem::absolute(configured, ec);
    if (ec) root = configured;
    root = std::filesystem::weakly_canonical(root, ec);
    if (ec) root = std::filesystem::path(configured).lexically_normal();
    // "/srv/uploads/" iterates with a trailing empty element.
    if (root.filename().empty() && root.has_relative_path()) root = root.parent_path();
    return root;
}
} // namespace

void TargetOverrideStore::set(const std::string& dataset, const std::string& column) {
    std::lock_guard<std::mutex> lock(mutex);
    overrides[dataset] = column;
}

std::optional<std::string> TargetOverrideStore::get(const std::string& dataset) const {
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = overrides.find(dataset);
    if (it == overrides.end()) return std::nullopt;
    return it->second;
}

bool TargetOverrideStore::clear(const std::string& dataset) {
    std::lock_guard<std::mutex> lock(mutex);
    return overrides.erase(dataset) > 0;
}

size_t TargetOverrideStore::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return overrides.size();
}

void RequestMonitor::record(const std::string& endpoint, double latencyMs) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    if (endpoint == "/quality") {
        qualityRequests.fetch_add(1, std::memory_order_relaxed);
    }
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(std::max<long long>(0, toLatencyMicros(latencyMs))),
                                 std::memory_order_relaxed);
}

void RequestMonitor::recordSuccess(const std::string& endpoint, double latencyMs) {
    record(endpoint, latencyMs);
}

void RequestMonitor::recordError(const std::string& endpoint, double latencyMs) {
    errorRequests.fetch_add(1, std::memory_order_relaxed);
    record(endpoint, latencyMs);
}

MonitoringSnapshot RequestMonitor::snapshot() const {
    MonitoringSnapshot out;
    out.totalRequests = totalRequests.load(std::memory_order_relaxed);
    out.qualityRequests = qualityRequests.load(std::memory_order_relaxed);
    out.errorRequests = errorRequests.load(std::memory_order_relaxed);
    const uint64_t latencyMicros = totalLatencyMicros.load(std::memory_order_relaxed);
    if (out.totalRequests > 0) {
        out.averageLatencyMs = static_cast<double>(latencyMicros) / static_cast<double>(out.totalRequests) / 1000.0;
    }
    return out;
}

QualityEndpoints::QualityEndpoints(QualityConfig baseConfigValue, TargetOverrideStore& overridesRef)
    : baseConfig(std::move(baseConfigValue)), overrides(overridesRef), root(canonicalRoot(baseConfig.uploadRoot)) {}

std::optional<std::string> QualityEndpoints::resolveBelow(const std::filesystem::path& root, const std::string& requested) {
    std::filesystem::path candidate(requested);
    if (candidate.is_relative()) candidate = root / candidate;

    std::error_code ec;
    candidate = std::filesystem::weakly_canonical(candidate, ec);
    if (ec) return std::nullopt;

    auto c = candidate.begin();
    for (auto r = root.begin(); r != root.end(); ++r, ++c) {
        if (c == candidate.end() || *c != *r) return std::nullopt;
    }
    // The root itself is not a file.
    if (c == candidate.end()) return std::nullopt;
    return candidate.string();
}

EndpointResponse QualityEndpoints::quality(const std::string& dataset,
                                           const std::string& name,
                                           const std::string& target,
                                           const std::string& profile,
                                           const std::string& filter) const {
    if (dataset.empty()) return errorResponse("dataset parameter is required");

    const std::optional<std::string> datasetPath = resolveBelow(root, dataset);
    if (!datasetPath) {
        std::cerr << "[VeritasService][Quality] rejected dataset outside upload root: " << dataset << "\n";
        return errorResponse("dataset path is outside the upload directory");
    }
    std::optional<std::string> profilePath;
    if (!profile.empty()) {
        profilePath = resolveBelow(root, profile);
        if (!profilePath) {
            std::cerr << "[VeritasService][Quality] rejected profile outside upload root: " << profile << "\n";
            return errorResponse("profile path is outside the upload directory");
        }
    }

    std::shared_ptr<const TypedDataset> data;
    try {
        data = DatasetLoader::load(*datasetPath, name, baseConfig.loadOptions());
    } catch (const Veritas::VeritasException& e) {
        std::cerr << "[VeritasService][Quality] load failed dataset=" << dataset << " error=" << e.what() << "\n";
        return errorResponse(e.what());
    }

    QualityRequest request;
    request.datasetName = name.empty() ? dataset : name;
    bool storedOverride = false;
    if (!target.empty()) {
        request.manualTarget = target;
    } else {
        request.manualTarget = overrides.get(dataset);
        storedOverride = request.manualTarget.has_value();
    }
    request.profilePath = profilePath;

    const QualityPipeline pipeline(baseConfig);
    const QualityReport report = pipeline.run(data, request);
    if (storedOverride && report.target.overrideRejected) {
        overrides.clear(dataset);
        std::cerr << "[VeritasService][Target] dropped stored override '" << report.target.rejectedOverride
                  << "' for dataset=" << dataset << "\n";
    }
    return {200, ReportJson::toJson(report, parseOutlierFilter(filter.empty() ? baseConfig.outlierFilter : filter))};
}

EndpointResponse QualityEndpoints::setTarget(const std::string& dataset, const std::string& targetColumn) {
    if (dataset.empty() || targetColumn.empty()) {
        return errorResponse("dataset and target_col are required");
    }
    overrides.set(dataset, targetColumn);
    return {200,
            "{\"dataset\": \"" + ReportJson::escapeJsonString(dataset) + "\", \"target_column\": \"" +
                ReportJson::escapeJsonString(targetColumn) + "\"}"};
}

EndpointResponse QualityEndpoints::clearTarget(const std::string& dataset) {
    if (dataset.empty()) return errorResponse("dataset parameter is required");
    const bool removed = overrides.clear(dataset);
    return {200,
            "{\"dataset\": \"" + ReportJson::escapeJsonString(dataset) + "\", \"cleared\": " +
                (removed ? "true" : "false") + "}"};
}

EndpointResponse QualityEndpoints::health() const {
    return {200, "{\"status\": \"ok\", \"target_overrides\": " + std::to_string(overrides.size()) + "}"};
}
