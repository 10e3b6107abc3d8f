#include "infra/http/TransportRegistry.hpp"

#include <stdexcept>
#include <utility>

#include "common/Log.hpp"
#include "infra/http/BeastTransport.hpp"
#include "infra/http/CurlTransport.hpp"

namespace infra::http {

TransportRegistry::TransportRegistry() {
    factories_.emplace(kDefaultId, [] { return std::make_shared<BeastTransport>(); });
    factories_.emplace("curl", [] { return std::make_shared<CurlTransport>(); });
}

void TransportRegistry::registerFactory(const std::string& id, Factory factory) {
    if (id.empty()) {
        throw std::invalid_argument("Transport id must not be empty");
    }
    if (!factory) {
        throw std::invalid_argument("Transport factory for '" + id + "' is empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    factories_[id] = std::move(factory);
}

bool TransportRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(id) > 0;
}

std::vector<std::string> TransportRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& entry : factories_) {
        result.push_back(entry.first);
    }
    return result;
}

std::shared_ptr<ITransport> TransportRegistry::create(const std::string& id) const {
    Factory factory;
    Factory fallback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = factories_.find(id); it != factories_.end()) {
            factory = it->second;
        }
        fallback = factories_.at(kDefaultId);
    }

    if (!factory) {
        LOG_WARN("Transport '" << id << "' is not registered, using '" << kDefaultId << "'");
        return fallback();
    }

    std::shared_ptr<ITransport> transport;
    try {
        transport = factory();
    } catch (const std::exception& ex) {
        LOG_WARN("Transport '" << id << "' unavailable (" << ex.what() << "), using '" << kDefaultId << "'");
    }
    if (!transport) {
        return fallback();
    }
    return transport;
}

}  // namespace infra::http
