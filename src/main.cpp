#include "DatasetLoader.h"
#include "QualityConfig.h"
#include "QualityPipeline.h"
#include "ReportJson.h"
#include "TerminalUI.h"
#include "VeritasExceptions.h"

#include <iostream>
#include <memory>
#include <string>

int main(int argc, char* argv[]) {
    if (argc >= 2) {
        const std::string first = argv[1];
        if (first == "--help" || first == "-h") {
            std::cout << QualityConfig::usage() << "\n";
            return 0;
        }
    }

    QualityConfig config;
    try {
        config = QualityConfig::fromArgs(argc, argv);
    } catch (const Veritas::VeritasException& e) {
        std::cerr << "[Veritas][Error] " << e.what() << "\n";
        return 1;
    }

    std::shared_ptr<const TypedDataset> dataset;
    try {
        dataset = DatasetLoader::load(config.datasetPath, config.originalName, config.loadOptions());
    } catch (const Veritas::VeritasException& e) {
        std::cerr << "[Veritas][Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Veritas][Exception] " << e.what() << "\n";
        return 1;
    }

    QualityRequest request;
    request.datasetName = config.originalName.empty() ? config.datasetPath : config.originalName;
    if (!config.targetColumn.empty()) request.manualTarget = config.targetColumn;
    if (!config.profilePath.empty()) request.profilePath = config.profilePath;
    const OutlierFilter filter = parseOutlierFilter(config.outlierFilter);

    const QualityPipeline pipeline(config);
    const QualityReport report = pipeline.run(dataset, request);

    if (config.outputPath.empty()) {
        TerminalUI::printQualitySummary(std::cout, report, filter);
        return 0;
    }

    try {
        ReportJson::writeFile(config.outputPath, ReportJson::toJson(report, filter));
    } catch (const Veritas::VeritasException& e) {
        std::cerr << "[Veritas][Error] " << e.what() << "\n";
        return 1;
    }
    if (config.verbose) std::cout << "[Veritas] Report written to: " << config.outputPath << "\n";
    return 0;
}
