#include "lmbridge/service/inference_service.h"
#include "lmbridge/common/errors.h"
#include "lmbridge/service/service_proxy.h"

namespace lmbridge {

std::unique_ptr<InferenceService> createLocalService(const ServiceFactory& factory) {
    std::unique_ptr<InferenceService> service = factory();
    if (!service) {
        throw BridgeError("service factory returned no instance");
    }
    return service;
}

std::unique_ptr<InferenceService> createIsolatedService(ServiceFactory factory,
                                                        const BridgeConfig& config) {
    return std::unique_ptr<InferenceService>(new ServiceProxy(std::move(factory), config));
}

} // namespace lmbridge
