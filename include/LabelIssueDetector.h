#pragma once
#include "Cancellation.h"
#include "QualityConfig.h"
#include "QualityTypes.h"
#include "TypedDataset.h"

#include <cstdint>
#include <string>
#include <vector>

class LabelIssueDetector {
public:
    using Matrix = std::vector<std::vector<double>>;

    static constexpr const char* kTargetNotFound = "target column not found";
    static constexpr const char* kTargetNotCategorical = "label-issue detection requires a categorical target";
    static constexpr const char* kInsufficientData = "insufficient data for label-issue detection";
    static constexpr const char* kNoFeatures = "no usable feature columns for label-issue detection";

    struct Options {
        size_t kfold = 5;
        size_t minRows = 5;
        size_t maxClasses = 20;
        // Targets with more distinct labels per labelled row than this are identifiers.
        double maxUniqueRatio = 0.5;
        size_t maxLevels = 10;
        size_t epochs = 300;
        double learningRate = 0.5;
        double l2 = 1e-3;
        double margin = 0.1;
        uint32_t seed = 1337;
        size_t previewRows = 10;
        // Checked once per training epoch; raising it aborts with Veritas::CancelledException.
        CancellationFlag cancel;
    };

    static Options optionsFrom(const QualityConfig& config);

    /**
     * @brief Flags rows whose recorded target disagrees with out-of-fold model predictions.
     * @details Never throws for inapplicable inputs: a missing, non-categorical or too small
     *          target yields a zero count with an explanatory note.
     */
    static LabelIssueReport detect(const TypedDataset& data, const std::string& targetColumn, const Options& options);

    /**
     * @brief Stratified K-fold out-of-fold class probabilities from multinomial logistic regression.
     * @details Feature cells holding NaN are imputed with the training-fold mean.
     */
    static Matrix outOfFoldProbabilities(const Matrix& features,
                                         const std::vector<int>& labels,
                                         size_t classCount,
                                         const Options& options);

    /**
     * @brief Confident-learning style selection over predicted probabilities.
     * @details Per-class threshold t_k is the mean probability of class k over rows labelled k.
     *          Row i labelled g is an issue when its argmax class s differs from g,
     *          p(s) >= t_s, p(g) < t_g and p(s) - p(g) >= margin.
     */
    static std::vector<size_t> findIssues(const Matrix& probabilities,
                                          const std::vector<int>& labels,
                                          size_t classCount,
                                          double margin);
};
