#include "QualityConfig.h"
#include "QualityService.h"
#include "VeritasExceptions.h"

#include <iostream>

int main(int argc, char* argv[]) {
    QualityConfig config;
    try {
        config = QualityConfig::fromArgs(argc, argv, false);
    } catch (const Veritas::VeritasException& e) {
        std::cerr << "[VeritasService][Error] " << e.what() << "\n";
        return 1;
    }

    TargetOverrideStore overrides;
    RequestMonitor monitor;
    QualityEndpoints endpoints(config, overrides);
    QualityService service(endpoints, monitor);

    QualityService::Config serviceConfig;
    serviceConfig.host = config.serviceHost;
    serviceConfig.port = config.servicePort;
    return service.start(serviceConfig);
}
