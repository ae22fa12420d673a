#include "QualityPipeline.h"
#include "DuplicateAnalyzer.h"
#include "LabelIssueDetector.h"
#include "MissingAnalyzer.h"
#include "OutlierEngine.h"
#include "ProfileOverviewExtractor.h"
#include "ReportAggregator.h"
#include "TargetInference.h"

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <iostream>
#include <thread>

namespace {
template <typename Fn>
auto launch(bool parallel, Fn&& fn) {
    return std::async(parallel ? std::launch::async : std::launch::deferred, std::forward<Fn>(fn));
}

// Runs fn(cancel) on its own thread and gives up after timeoutMs; 0 runs inline.
// On timeout the flag is raised so the abandoned worker stops at its next check.
template <typename Result, typename Fn, typename OnTimeout>
Result runBounded(Fn fn, size_t timeoutMs, OnTimeout onTimeout) {
    if (timeoutMs == 0) return fn(CancellationFlag());
    auto cancel = std::make_shared<std::atomic<bool>>(false);
    auto task = std::make_shared<std::packaged_task<Result()>>([fn, cancel]() { return fn(cancel); });
    std::future<Result> future = task->get_future();
    std::thread([task]() { (*task)(); }).detach();
    if (future.wait_for(std::chrono::milliseconds(timeoutMs)) == std::future_status::ready) {
        return future.get();
    }
    cancel->store(true, std::memory_order_relaxed);
    return onTimeout();
}

} // namespace

QualityPipeline::QualityPipeline(QualityConfig config) : config_(std::move(config)) {
    config_.validate();
}

QualityReport QualityPipeline::run(std::shared_ptr<const TypedDataset> data, const QualityRequest& request) const {
    const QualityConfig cfg = config_;
    const bool parallel = cfg.parallelAnalyzers;
    const bool verbose = cfg.verbose;

    if (verbose) {
        std::cout << "[Veritas][Pipeline] Dataset: " << data->rowCount() << " rows x " << data->colCount() << " columns"
                  << (parallel ? " (parallel analyzers)" : "") << "\n";
        if (data->transcodedFromLatin1()) {
            std::cout << "[Veritas][Loader] Input was not valid UTF-8; decoded as Latin-1\n";
        }
    }

    auto missingTask = launch(parallel, [data]() {
        return std::make_shared<const MissingReport>(MissingAnalyzer::analyze(*data));
    });
    auto duplicateTask = launch(parallel, [data, cfg]() {
        return std::make_shared<const DuplicateReport>(DuplicateAnalyzer::analyze(*data, cfg.duplicatePreviewRows));
    });
    auto structuralTask = launch(parallel, [data, cfg]() {
        return OutlierEngine::guarded("Structural", [&]() { return OutlierEngine::detectStructural(*data, cfg.tuning); });
    });
    auto statisticalTask = launch(parallel, [data, cfg]() {
        return OutlierEngine::guarded("Statistical", [&]() { return OutlierEngine::detectStatistical(*data, cfg.tuning); });
    });
    auto semanticTask = launch(parallel, [data, cfg]() {
        return OutlierEngine::guarded("Semantic", [&]() {
            return runBounded<DetectorOutcome>(
                [data, cfg](const CancellationFlag& cancel) {
                    return OutlierEngine::detectSemantic(*data, cfg.tuning, cfg.semanticSeed, cancel);
                },
                cfg.analysisTimeoutMs,
                []() {
                    std::cerr << "[Veritas][Semantic] timed out; reporting no semantic outliers\n";
                    return DetectorOutcome::degraded(AnalysisStatus::TIMED_OUT, "semantic detection timed out");
                });
        });
    });
    const std::optional<std::string> profilePath = request.profilePath;
    auto profileTask = launch(parallel, [profilePath]() {
        return std::make_shared<const ExternalProfileStats>(ProfileOverviewExtractor::extract(profilePath));
    });

    TargetSelection target = TargetInference::resolve(*data, request.manualTarget, cfg.tuning);
    if (target.overrideRejected) {
        std::cerr << "[Veritas][Target] Ignoring target override '" << target.rejectedOverride
                  << "': no such column\n";
    }
    if (verbose) {
        std::cout << "[Veritas][Target] " << (target.column ? *target.column : std::string("<none>"))
                  << " (" << targetSourceName(target.source) << ")\n";
    }

    const std::string targetColumn = target.column.value_or(std::string());
    auto labelTask = launch(parallel, [data, cfg, targetColumn]() {
        const LabelIssueDetector::Options options = LabelIssueDetector::optionsFrom(cfg);
        try {
            return runBounded<LabelIssueReport>(
                [data, options, targetColumn](const CancellationFlag& cancel) {
                    LabelIssueDetector::Options bounded = options;
                    bounded.cancel = cancel;
                    return LabelIssueDetector::detect(*data, targetColumn, bounded);
                },
                cfg.analysisTimeoutMs,
                []() {
                    std::cerr << "[Veritas][LabelIssues] timed out; reporting no label issues\n";
                    return LabelIssueReport::degraded(AnalysisStatus::TIMED_OUT, "label-issue detection timed out");
                });
        } catch (const std::exception& ex) {
            std::cerr << "[Veritas][LabelIssues] detector failed: " << ex.what() << "\n";
            return LabelIssueReport::degraded(AnalysisStatus::FAILED, std::string("label-issue detection failed: ") + ex.what());
        }
    });

    auto outliers = std::make_shared<OutlierIndexSets>();
    outliers->structural = structuralTask.get();
    outliers->statistical = statisticalTask.get();
    outliers->semantic = semanticTask.get();

    ReportAggregator::Parts parts;
    parts.target = std::move(target);
    parts.missing = missingTask.get();
    parts.duplicates = duplicateTask.get();
    parts.outliers = outliers;
    parts.labelIssues = std::make_shared<const LabelIssueReport>(labelTask.get());
    parts.profile = profileTask.get();

    QualityReport report = ReportAggregator::assemble(*data, std::move(parts));
    if (request.datasetName && !request.datasetName->empty()) report.dataset = *request.datasetName;
    if (verbose) {
        std::cout << "[Veritas][Missing] " << report.missing->totalMissing << " missing cells in "
                  << report.missing->flagged().size() << " columns\n";
        std::cout << "[Veritas][Duplicates] " << report.duplicates->duplicateCount << " duplicate rows ("
                  << report.duplicates->duplicatePercent << "%)\n";
        std::cout << "[Veritas][Outliers] structural=" << report.outlierView->structuralCount
                  << " statistical=" << report.outlierView->statisticalCount
                  << " semantic=" << report.outlierView->semanticCount
                  << " unique=" << report.outlierView->totalUniqueOutliers << "\n";
        std::cout << "[Veritas][LabelIssues] " << report.labelIssues->issueCount << " suspected label issues"
                  << (report.labelIssues->note.empty() ? std::string() : " (" + report.labelIssues->note + ")") << "\n";
    }
    return report;
}
