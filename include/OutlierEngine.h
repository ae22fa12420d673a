#pragma once
#include "Cancellation.h"
#include "QualityConfig.h"
#include "QualityTypes.h"
#include "TypedDataset.h"

#include <cstdint>
#include <functional>
#include <vector>

class OutlierEngine {
public:
    /**
     * @brief Rows that violate the dataset's own inferred schema.
     * @details A row is flagged when it has an unparseable cell, a field count that differs
     *          from the header, a token whose kind (numeric/datetime/text) disagrees with a
     *          strongly dominant kind in a categorical column, or far fewer populated fields
     *          than the median row.
     */
    static DetectorOutcome detectStructural(const TypedDataset& data, const QualityTuningConfig& tuning);

    /**
     * @brief Union over numeric columns of rows outside the Tukey IQR fence.
     */
    static DetectorOutcome detectStatistical(const TypedDataset& data, const QualityTuningConfig& tuning);

    /**
     * @brief Isolation Forest over all usable columns jointly.
     * @details Deterministic for a fixed seed. Returns NOT_APPLICABLE when there are too few
     *          rows or no column with spread. Throws Veritas::CancelledException when
     *          `cancel` is raised while the forest is being grown.
     */
    static DetectorOutcome detectSemantic(const TypedDataset& data,
                                          const QualityTuningConfig& tuning,
                                          uint32_t seed,
                                          const CancellationFlag& cancel = CancellationFlag());

    /**
     * @brief Positions of values outside [Q1 - m*IQR, Q3 + m*IQR].
     * @details Returns nothing for fewer than four values or a degenerate IQR.
     */
    static std::vector<size_t> iqrOutlierPositions(const std::vector<double>& values, double iqrMultiplier, double epsilon);

    // Runs one detector; an exception becomes an empty FAILED outcome named after the detector.
    static DetectorOutcome guarded(const char* name, const std::function<DetectorOutcome()>& detector);

    /**
     * @brief Runs the three detectors; a detector that throws yields an empty FAILED outcome.
     */
    static OutlierIndexSets analyze(const TypedDataset& data, const QualityConfig& config);
};
