#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "infra/http/Transport.hpp"

namespace infra::http {

// Resolves transport adapters by identifier. An unknown identifier, or a
// factory that fails, resolves to the Beast adapter, which is always built in.
class TransportRegistry {
public:
    using Factory = std::function<std::shared_ptr<ITransport>()>;

    static constexpr const char* kDefaultId = "beast";

    // Registers "beast" and "curl".
    TransportRegistry();

    void registerFactory(const std::string& id, Factory factory);
    bool contains(const std::string& id) const;
    std::vector<std::string> ids() const;

    std::shared_ptr<ITransport> create(const std::string& id) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Factory> factories_;
};

}  // namespace infra::http
