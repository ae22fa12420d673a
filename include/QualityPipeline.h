#pragma once

#include "QualityConfig.h"
#include "QualityTypes.h"
#include "TypedDataset.h"

#include <memory>
#include <optional>
#include <string>

struct QualityRequest {
    // Name shown in the report; defaults to the dataset's filename.
    std::optional<std::string> datasetName;
    std::optional<std::string> manualTarget;
    std::optional<std::string> profilePath;
};

class QualityPipeline final {
public:
    explicit QualityPipeline(QualityConfig config);

    /**
     * @brief Runs every analyzer over one immutable dataset and assembles the report.
     * @details With parallel_analyzers the independent analyzers run as async tasks; the
     *          label-issue step waits for target resolution. Semantic scoring and label-issue
     *          training can be bounded by analysis_timeout_ms, in which case a TIMED_OUT
     *          result is reported and the abandoned worker is cancelled.
     *          Detector failures are reported in the result, never thrown.
     */
    QualityReport run(std::shared_ptr<const TypedDataset> data, const QualityRequest& request) const;

    const QualityConfig& config() const noexcept { return config_; }

private:
    QualityConfig config_;
};
