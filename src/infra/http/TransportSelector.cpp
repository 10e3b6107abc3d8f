#include "infra/http/TransportSelector.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include "common/Errors.hpp"
#include "common/Log.hpp"

namespace infra::http {

const char* selectionStrategyLabel(SelectionStrategy strategy) noexcept {
    switch (strategy) {
    case SelectionStrategy::Single:
        return "single";
    case SelectionStrategy::Failover:
        return "failover";
    case SelectionStrategy::RoundRobin:
        return "round_robin";
    case SelectionStrategy::Random:
        return "random";
    }
    return "single";
}

std::optional<SelectionStrategy> selectionStrategyFromLabel(std::string_view label) {
    std::string lower{label};
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(c == '-' ? '_' : std::tolower(c));
    });
    if (lower == "single") {
        return SelectionStrategy::Single;
    }
    if (lower == "failover") {
        return SelectionStrategy::Failover;
    }
    if (lower == "round_robin" || lower == "roundrobin") {
        return SelectionStrategy::RoundRobin;
    }
    if (lower == "random") {
        return SelectionStrategy::Random;
    }
    return std::nullopt;
}

TransportSelector::TransportSelector(std::vector<std::shared_ptr<ITransport>> transports,
                                     SelectionStrategy strategy,
                                     std::uint64_t seed)
    : transports_(std::move(transports)), strategy_(strategy), rng_(seed) {
    if (transports_.empty()) {
        throw std::invalid_argument("TransportSelector requires at least one transport");
    }
    if (std::any_of(transports_.begin(), transports_.end(), [](const auto& t) { return !t; })) {
        throw std::invalid_argument("TransportSelector received a null transport");
    }
    if (strategy_ == SelectionStrategy::Single && transports_.size() > 1) {
        LOG_WARN("Transport strategy 'single' uses only '" << transports_.front()->id() << "'; "
                                                           << transports_.size() - 1 << " ignored");
        transports_.resize(1);
    }

    id_ = selectionStrategyLabel(strategy_);
    id_ += '(';
    for (std::size_t i = 0; i < transports_.size(); ++i) {
        if (i > 0) {
            id_ += ',';
        }
        id_ += transports_[i]->id();
    }
    id_ += ')';
}

void TransportSelector::open() {
    for (auto& transport : transports_) {
        transport->open();
    }
}

void TransportSelector::close() {
    for (auto& transport : transports_) {
        transport->close();
    }
}

HttpResponse TransportSelector::request(const HttpRequest& request) {
    switch (strategy_) {
    case SelectionStrategy::Single:
        return transports_.front()->request(request);
    case SelectionStrategy::Failover:
        return requestFailover(request);
    case SelectionStrategy::RoundRobin: {
        const auto index = cursor_.fetch_add(1U, std::memory_order_relaxed) % transports_.size();
        return transports_[index]->request(request);
    }
    case SelectionStrategy::Random: {
        std::size_t index = 0;
        {
            std::lock_guard<std::mutex> lock(rngMutex_);
            std::uniform_int_distribution<std::size_t> pick(0, transports_.size() - 1);
            index = pick(rng_);
        }
        return transports_[index]->request(request);
    }
    }
    return transports_.front()->request(request);
}

HttpResponse TransportSelector::requestFailover(const HttpRequest& request) {
    for (std::size_t i = 0;; ++i) {
        try {
            return transports_[i]->request(request);
        } catch (const kvault::common::TransportError& ex) {
            if (i + 1 == transports_.size()) {
                throw;
            }
            LOG_WARN("Transport '" << transports_[i]->id() << "' failed (" << ex.what() << "), trying '"
                                   << transports_[i + 1]->id() << "'");
        }
    }
}

}  // namespace infra::http
