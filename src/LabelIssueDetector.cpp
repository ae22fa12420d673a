#include "LabelIssueDetector.h"
#include "CommonUtils.h"
#include "VeritasExceptions.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>
#include <random>
#include <unordered_map>

namespace {
using Matrix = LabelIssueDetector::Matrix;

struct FeatureScaler {
    std::vector<double> mean;
    std::vector<double> stddev;
};

// Means over non-NaN cells; NaN cells are replaced by the mean before scaling.
FeatureScaler fitFeatureScaler(const Matrix& X, const std::vector<size_t>& rows) {
    FeatureScaler scaler;
    if (X.empty() || rows.empty()) return scaler;

    const size_t p = X[0].size();
    scaler.mean.assign(p, 0.0);
    scaler.stddev.assign(p, 0.0);
    std::vector<size_t> counts(p, 0);

    for (size_t r : rows) {
        for (size_t j = 0; j < p; ++j) {
            if (std::isnan(X[r][j])) continue;
            scaler.mean[j] += X[r][j];
            ++counts[j];
        }
    }
    for (size_t j = 0; j < p; ++j) {
        scaler.mean[j] = counts[j] > 0 ? scaler.mean[j] / static_cast<double>(counts[j]) : 0.0;
    }

    for (size_t r : rows) {
        for (size_t j = 0; j < p; ++j) {
            const double v = std::isnan(X[r][j]) ? scaler.mean[j] : X[r][j];
            const double d = v - scaler.mean[j];
            scaler.stddev[j] += d * d;
        }
    }
    for (size_t j = 0; j < p; ++j) {
        scaler.stddev[j] = std::sqrt(scaler.stddev[j] / static_cast<double>(std::max<size_t>(1, rows.size() - 1)));
        if (scaler.stddev[j] < 1e-12) scaler.stddev[j] = 1.0;
    }
    return scaler;
}

std::vector<double> applyFeatureScaler(const std::vector<double>& row, const FeatureScaler& scaler) {
    std::vector<double> out(row.size(), 0.0);
    for (size_t j = 0; j < row.size(); ++j) {
        const double v = std::isnan(row[j]) ? scaler.mean[j] : row[j];
        out[j] = (v - scaler.mean[j]) / scaler.stddev[j];
    }
    return out;
}

void softmaxInPlace(std::vector<double>& logits) {
    const double mx = *std::max_element(logits.begin(), logits.end());
    double sum = 0.0;
    for (double& z : logits) {
        z = std::exp(z - mx);
        sum += z;
    }
    for (double& z : logits) z /= sum;
}

class SoftmaxRegression {
public:
    SoftmaxRegression(size_t features, size_t classes)
        : features_(features), classes_(classes), weights_(classes, std::vector<double>(features + 1, 0.0)) {}

    void fit(const Matrix& X,
             const std::vector<int>& y,
             size_t epochs,
             double learningRate,
             double l2,
             const CancellationFlag& cancel) {
        if (X.empty()) return;
        const double n = static_cast<double>(X.size());
        Matrix grad(classes_, std::vector<double>(features_ + 1, 0.0));
        std::vector<double> probs(classes_, 0.0);

        for (size_t epoch = 0; epoch < epochs; ++epoch) {
            if (cancellationRequested(cancel)) throw Veritas::CancelledException("label model training");
            for (auto& g : grad) std::fill(g.begin(), g.end(), 0.0);

            for (size_t i = 0; i < X.size(); ++i) {
                predictInto(X[i], probs);
                for (size_t k = 0; k < classes_; ++k) {
                    const double err = probs[k] - (static_cast<size_t>(y[i]) == k ? 1.0 : 0.0);
                    for (size_t j = 0; j < features_; ++j) grad[k][j] += err * X[i][j];
                    grad[k][features_] += err;
                }
            }

            for (size_t k = 0; k < classes_; ++k) {
                for (size_t j = 0; j < features_; ++j) {
                    weights_[k][j] -= learningRate * (grad[k][j] / n + l2 * weights_[k][j]);
                }
                weights_[k][features_] -= learningRate * grad[k][features_] / n;
            }
        }
    }

    void predictInto(const std::vector<double>& x, std::vector<double>& out) const {
        out.assign(classes_, 0.0);
        for (size_t k = 0; k < classes_; ++k) {
            double z = weights_[k][features_];
            for (size_t j = 0; j < features_; ++j) z += weights_[k][j] * x[j];
            out[k] = z;
        }
        softmaxInPlace(out);
    }

private:
    size_t features_;
    size_t classes_;
    Matrix weights_;
};

struct EncodedTarget {
    std::vector<size_t> rows;
    std::vector<int> labels;
    std::vector<std::string> classes;
};

bool isCategoricalTarget(const TypedColumn& col) {
    if (col.type == ColumnType::CATEGORICAL || col.type == ColumnType::BOOLEAN) return true;
    if (col.type != ColumnType::NUMERIC) return false;
    const auto& values = std::get<std::vector<double>>(col.values);
    for (size_t r = 0; r < values.size(); ++r) {
        if (col.missing[r]) continue;
        if (std::floor(values[r]) != values[r]) return false;
    }
    return true;
}

EncodedTarget encodeTarget(const TypedDataset& data, size_t targetIdx) {
    const TypedColumn& col = data.column(targetIdx);
    EncodedTarget out;

    if (col.type == ColumnType::NUMERIC) {
        const auto& values = std::get<std::vector<double>>(col.values);
        std::map<double, int> order;
        for (size_t r = 0; r < data.rowCount(); ++r) {
            if (!col.missing[r]) order.emplace(values[r], 0);
        }
        int next = 0;
        for (auto& [value, id] : order) {
            id = next++;
            out.classes.push_back(CommonUtils::formatDouble(value));
        }
        for (size_t r = 0; r < data.rowCount(); ++r) {
            if (col.missing[r]) continue;
            out.rows.push_back(r);
            out.labels.push_back(order.at(values[r]));
        }
        return out;
    }

    std::map<std::string, int> order;
    for (size_t r = 0; r < data.rowCount(); ++r) {
        if (!col.missing[r]) order.emplace(data.cellText(targetIdx, r), 0);
    }
    int next = 0;
    for (auto& [label, id] : order) {
        id = next++;
        out.classes.push_back(label);
    }
    for (size_t r = 0; r < data.rowCount(); ++r) {
        if (col.missing[r]) continue;
        out.rows.push_back(r);
        out.labels.push_back(order.at(data.cellText(targetIdx, r)));
    }
    return out;
}

// Row-major feature matrix over the labelled rows. Numeric-like columns map to one
// feature (NaN where missing); categorical columns map to one-hot over frequent levels.
Matrix encodeFeatures(const TypedDataset& data,
                      size_t targetIdx,
                      const std::vector<size_t>& rows,
                      size_t maxLevels) {
    std::vector<std::vector<double>> columns;

    for (size_t c = 0; c < data.colCount(); ++c) {
        if (c == targetIdx) continue;
        const TypedColumn& col = data.column(c);

        if (col.type == ColumnType::CATEGORICAL) {
            const auto& values = std::get<std::vector<std::string>>(col.values);
            std::unordered_map<std::string, size_t> freq;
            size_t nonNull = 0;
            for (size_t r : rows) {
                if (col.missing[r]) continue;
                ++freq[values[r]];
                ++nonNull;
            }
            if (freq.size() < 2) continue;
            // Identifier-like columns carry no signal.
            if (freq.size() > maxLevels && freq.size() * 10 > nonNull * 9) continue;

            std::vector<std::pair<std::string, size_t>> levels(freq.begin(), freq.end());
            std::sort(levels.begin(), levels.end(), [](const auto& a, const auto& b) {
                if (a.second != b.second) return a.second > b.second;
                return a.first < b.first;
            });
            if (levels.size() > maxLevels) levels.resize(maxLevels);

            for (const auto& level : levels) {
                std::vector<double> feature(rows.size(), 0.0);
                for (size_t i = 0; i < rows.size(); ++i) {
                    if (!col.missing[rows[i]] && values[rows[i]] == level.first) feature[i] = 1.0;
                }
                columns.push_back(std::move(feature));
            }
            continue;
        }

        std::vector<double> feature(rows.size(), std::numeric_limits<double>::quiet_NaN());
        double mn = std::numeric_limits<double>::infinity();
        double mx = -std::numeric_limits<double>::infinity();
        for (size_t i = 0; i < rows.size(); ++i) {
            const size_t r = rows[i];
            if (col.missing[r]) continue;
            double v = 0.0;
            if (col.type == ColumnType::NUMERIC) {
                v = std::get<std::vector<double>>(col.values)[r];
            } else if (col.type == ColumnType::DATETIME) {
                v = static_cast<double>(std::get<std::vector<int64_t>>(col.values)[r]);
            } else {
                v = std::get<std::vector<uint8_t>>(col.values)[r] ? 1.0 : 0.0;
            }
            if (!std::isfinite(v)) continue;
            feature[i] = v;
            mn = std::min(mn, v);
            mx = std::max(mx, v);
        }
        if (!(mx > mn)) continue;
        columns.push_back(std::move(feature));
    }

    Matrix out(rows.size(), std::vector<double>(columns.size(), 0.0));
    for (size_t j = 0; j < columns.size(); ++j) {
        for (size_t i = 0; i < rows.size(); ++i) out[i][j] = columns[j][i];
    }
    return out;
}
} // namespace

LabelIssueDetector::Options LabelIssueDetector::optionsFrom(const QualityConfig& config) {
    Options options;
    options.kfold = config.tuning.labelKfold;
    options.minRows = config.tuning.labelMinRows;
    options.maxClasses = config.tuning.targetMaxClasses;
    options.maxUniqueRatio = config.tuning.targetMaxUniqueRatio;
    options.maxLevels = config.tuning.labelMaxLevels;
    options.epochs = config.tuning.labelEpochs;
    options.learningRate = config.tuning.labelLearningRate;
    options.l2 = config.tuning.labelL2;
    options.margin = config.tuning.labelMargin;
    options.seed = config.labelSeed;
    options.previewRows = config.labelPreviewRows;
    return options;
}

Matrix LabelIssueDetector::outOfFoldProbabilities(const Matrix& features,
                                                  const std::vector<int>& labels,
                                                  size_t classCount,
                                                  const Options& options) {
    const size_t n = features.size();
    Matrix oof(n, std::vector<double>(classCount, 0.0));
    if (n == 0 || classCount == 0) return oof;

    const size_t folds = std::max<size_t>(2, std::min(options.kfold, n));
    std::vector<size_t> foldOf(n, 0);
    std::mt19937 rng(options.seed);
    size_t cursor = 0;
    for (size_t k = 0; k < classCount; ++k) {
        std::vector<size_t> members;
        for (size_t i = 0; i < n; ++i) {
            if (static_cast<size_t>(labels[i]) == k) members.push_back(i);
        }
        std::shuffle(members.begin(), members.end(), rng);
        for (size_t i : members) foldOf[i] = cursor++ % folds;
    }

    const size_t p = features.empty() ? 0 : features[0].size();
    for (size_t f = 0; f < folds; ++f) {
        std::vector<size_t> trainRows;
        std::vector<size_t> testRows;
        for (size_t i = 0; i < n; ++i) {
            (foldOf[i] == f ? testRows : trainRows).push_back(i);
        }
        if (testRows.empty() || trainRows.empty()) continue;

        const FeatureScaler scaler = fitFeatureScaler(features, trainRows);
        Matrix Xtr;
        std::vector<int> ytr;
        Xtr.reserve(trainRows.size());
        ytr.reserve(trainRows.size());
        for (size_t i : trainRows) {
            Xtr.push_back(applyFeatureScaler(features[i], scaler));
            ytr.push_back(labels[i]);
        }

        SoftmaxRegression model(p, classCount);
        model.fit(Xtr, ytr, options.epochs, options.learningRate, options.l2, options.cancel);
        for (size_t i : testRows) {
            model.predictInto(applyFeatureScaler(features[i], scaler), oof[i]);
        }
    }
    return oof;
}

std::vector<size_t> LabelIssueDetector::findIssues(const Matrix& probabilities,
                                                   const std::vector<int>& labels,
                                                   size_t classCount,
                                                   double margin) {
    std::vector<double> threshold(classCount, 0.0);
    std::vector<size_t> support(classCount, 0);
    for (size_t i = 0; i < probabilities.size(); ++i) {
        const size_t g = static_cast<size_t>(labels[i]);
        threshold[g] += probabilities[i][g];
        ++support[g];
    }
    for (size_t k = 0; k < classCount; ++k) {
        threshold[k] = support[k] > 0 ? threshold[k] / static_cast<double>(support[k]) : 1.0;
    }

    std::vector<size_t> issues;
    for (size_t i = 0; i < probabilities.size(); ++i) {
        const auto& p = probabilities[i];
        const size_t g = static_cast<size_t>(labels[i]);
        const size_t s = static_cast<size_t>(std::distance(p.begin(), std::max_element(p.begin(), p.end())));
        if (s == g) continue;
        if (p[s] >= threshold[s] && p[g] < threshold[g] && p[s] - p[g] >= margin) {
            issues.push_back(i);
        }
    }
    return issues;
}

LabelIssueReport LabelIssueDetector::detect(const TypedDataset& data, const std::string& targetColumn, const Options& options) {
    const int targetIdx = targetColumn.empty() ? -1 : data.findColumnIndex(targetColumn);
    if (targetIdx < 0) {
        return LabelIssueReport::degraded(AnalysisStatus::NOT_APPLICABLE, kTargetNotFound);
    }
    const TypedColumn& target = data.column(static_cast<size_t>(targetIdx));
    if (!isCategoricalTarget(target)) {
        return LabelIssueReport::degraded(AnalysisStatus::NOT_APPLICABLE, kTargetNotCategorical);
    }

    EncodedTarget encoded = encodeTarget(data, static_cast<size_t>(targetIdx));
    if (encoded.classes.size() > options.maxClasses) {
        return LabelIssueReport::degraded(AnalysisStatus::NOT_APPLICABLE, kTargetNotCategorical);
    }
    if (encoded.rows.size() < options.minRows || encoded.classes.size() < 2) {
        return LabelIssueReport::degraded(AnalysisStatus::NOT_APPLICABLE, kInsufficientData);
    }
    const double uniqueRatio = static_cast<double>(encoded.classes.size()) / static_cast<double>(encoded.rows.size());
    if (uniqueRatio > options.maxUniqueRatio) {
        return LabelIssueReport::degraded(AnalysisStatus::NOT_APPLICABLE, kTargetNotCategorical);
    }

    const Matrix features = encodeFeatures(data, static_cast<size_t>(targetIdx), encoded.rows, options.maxLevels);
    if (features.empty() || features[0].empty()) {
        return LabelIssueReport::degraded(AnalysisStatus::NOT_APPLICABLE, kNoFeatures);
    }

    const Matrix probabilities = outOfFoldProbabilities(features, encoded.labels, encoded.classes.size(), options);
    const std::vector<size_t> issues = findIssues(probabilities, encoded.labels, encoded.classes.size(), options.margin);

    LabelIssueReport report;
    report.targetColumn = targetColumn;
    report.classes = encoded.classes;
    report.issueCount = issues.size();

    std::vector<LabelIssue> all;
    all.reserve(issues.size());
    for (size_t i : issues) {
        const auto& p = probabilities[i];
        const size_t g = static_cast<size_t>(encoded.labels[i]);
        const size_t s = static_cast<size_t>(std::distance(p.begin(), std::max_element(p.begin(), p.end())));
        LabelIssue issue;
        issue.rowIndex = encoded.rows[i];
        issue.givenLabel = encoded.classes[g];
        issue.suggestedLabel = encoded.classes[s];
        issue.givenConfidence = CommonUtils::roundTo(p[g], 4);
        issue.suggestedConfidence = CommonUtils::roundTo(p[s], 4);
        all.push_back(std::move(issue));
    }
    std::stable_sort(all.begin(), all.end(), [](const LabelIssue& a, const LabelIssue& b) {
        return a.givenConfidence < b.givenConfidence;
    });
    if (all.size() > options.previewRows) all.resize(options.previewRows);
    report.preview = std::move(all);
    return report;
}
