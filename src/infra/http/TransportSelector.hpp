#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "infra/http/Transport.hpp"

namespace infra::http {

enum class SelectionStrategy { Single, Failover, RoundRobin, Random };

const char* selectionStrategyLabel(SelectionStrategy strategy) noexcept;
std::optional<SelectionStrategy> selectionStrategyFromLabel(std::string_view label);

// Presents several transports as one. The rotation cursor and random engine
// belong to the instance, so two orchestrators never influence each other's
// selection.
class TransportSelector final : public ITransport {
public:
    TransportSelector(std::vector<std::shared_ptr<ITransport>> transports,
                      SelectionStrategy strategy,
                      std::uint64_t seed = std::random_device{}());

    const std::string& id() const noexcept override { return id_; }
    void open() override;
    void close() override;
    HttpResponse request(const HttpRequest& request) override;

    SelectionStrategy strategy() const noexcept { return strategy_; }
    std::size_t size() const noexcept { return transports_.size(); }

private:
    HttpResponse requestFailover(const HttpRequest& request);

    std::vector<std::shared_ptr<ITransport>> transports_;
    SelectionStrategy strategy_;
    std::string id_;
    std::atomic<std::size_t> cursor_{0};
    std::mutex rngMutex_;
    std::mt19937_64 rng_;
};

}  // namespace infra::http
