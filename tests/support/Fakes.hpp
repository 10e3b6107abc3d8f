#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/Errors.hpp"
#include "core/Clock.hpp"
#include "domain/Types.h"
#include "domain/exchange/IKlineSource.hpp"
#include "infra/http/Transport.hpp"

namespace testsupport {

#define EXPECT_TRUE(cond)                                                                 \
    do {                                                                                  \
        if (!(cond)) {                                                                    \
            std::cerr << __FILE__ << ':' << __LINE__ << ": expected " #cond << std::endl; \
            ++::testsupport::failures();                                                  \
        }                                                                                 \
    } while (false)

#define EXPECT_EQ(a, b)                                                                         \
    do {                                                                                        \
        if (!((a) == (b))) {                                                                    \
            std::cerr << __FILE__ << ':' << __LINE__ << ": expected " #a " == " #b << std::endl; \
            ++::testsupport::failures();                                                        \
        }                                                                                       \
    } while (false)

#define EXPECT_THROWS(stmt, ExceptionType)                                                            \
    do {                                                                                              \
        bool thrown_ = false;                                                                         \
        try {                                                                                         \
            stmt;                                                                                     \
        } catch (const ExceptionType&) {                                                              \
            thrown_ = true;                                                                           \
        }                                                                                             \
        if (!thrown_) {                                                                               \
            std::cerr << __FILE__ << ':' << __LINE__ << ": expected " #ExceptionType " from " #stmt << std::endl; \
            ++::testsupport::failures();                                                              \
        }                                                                                             \
    } while (false)

inline int& failures() {
    static int count = 0;
    return count;
}

// Runs one named case; an escaping exception counts as a failure.
inline void run(const char* name, const std::function<void()>& body) {
    const int before = failures();
    try {
        body();
    } catch (const std::exception& ex) {
        std::cerr << name << ": unexpected exception: " << ex.what() << std::endl;
        ++failures();
    }
    if (failures() != before) {
        std::cerr << "FAILED " << name << std::endl;
    }
}

inline int finish(const char* suite) {
    if (failures() != 0) {
        std::cerr << suite << ": " << failures() << " failure(s)" << std::endl;
        return 1;
    }
    std::cerr << suite << ": OK" << std::endl;
    return 0;
}

// Time moves only when sleepFor or advance is called.
class ManualClock final : public core::Clock {
public:
    explicit ManualClock(domain::TimestampMs start) : now_(start) {}

    domain::TimestampMs nowMs() const override { return now_.load(); }
    void sleepFor(std::chrono::milliseconds duration) override {
        if (duration.count() > 0) {
            now_ += duration.count();
            slept_ += duration.count();
        }
    }

    void set(domain::TimestampMs value) { now_ = value; }
    void advance(std::chrono::milliseconds duration) { now_ += duration.count(); }
    domain::TimestampMs sleptMs() const { return slept_.load(); }

private:
    std::atomic<domain::TimestampMs> now_;
    std::atomic<domain::TimestampMs> slept_{0};
};

// Answers requests from a queue of canned responses or errors; once the
// queue is drained the fallback handler, if any, answers.
class ScriptedTransport final : public infra::http::ITransport {
public:
    using Handler = std::function<infra::http::HttpResponse(const infra::http::HttpRequest&)>;

    explicit ScriptedTransport(std::string id = "scripted") : id_(std::move(id)) {}

    const std::string& id() const noexcept override { return id_; }
    void open() override { ++opens_; }
    void close() override { ++closes_; }

    infra::http::HttpResponse request(const infra::http::HttpRequest& request) override {
        Handler next;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            if (!script_.empty()) {
                next = std::move(script_.front());
                script_.pop_front();
            } else {
                next = fallback_;
            }
        }
        if (!next) {
            throw kvault::common::TransportError(kvault::common::ErrorKind::ConnectionFailed, "script exhausted", id_);
        }
        return next(request);
    }

    void respond(unsigned status, std::string body, infra::http::HeaderList headers = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back([status, body = std::move(body), headers = std::move(headers)](const auto&) {
            infra::http::HttpResponse response;
            response.status = status;
            response.body = body;
            response.headers = headers;
            return response;
        });
    }

    void fail(kvault::common::ErrorKind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto id = id_;
        script_.push_back([kind, id](const auto&) -> infra::http::HttpResponse {
            throw kvault::common::TransportError(kind, "scripted failure", id);
        });
    }

    void setFallback(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        fallback_ = std::move(handler);
    }

    std::vector<infra::http::HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }
    int opens() const { return opens_.load(); }
    int closes() const { return closes_.load(); }

private:
    std::string id_;
    mutable std::mutex mutex_;
    std::deque<Handler> script_;
    Handler fallback_;
    std::vector<infra::http::HttpRequest> requests_;
    std::atomic<int> opens_{0};
    std::atomic<int> closes_{0};
};

// Bars for [start, end) on the interval grid; prices derive from openTime.
inline domain::BarSequence makeBars(domain::TimestampMs start, domain::TimestampMs end, domain::Interval interval) {
    domain::BarSequence bars;
    for (auto t = domain::align_up_ms(start, interval.ms); t < end; t += interval.ms) {
        domain::Bar bar;
        bar.openTime = t;
        bar.open = 100.0 + static_cast<double>((t / interval.ms) % 50);
        bar.high = bar.open + 2.0;
        bar.low = bar.open - 1.0;
        bar.close = bar.open + 0.5;
        bar.volume = 10.0;
        bar.closeTime = t + interval.ms - 1;
        bar.quoteVolume = bar.volume * bar.close;
        bar.trades = 7;
        bar.takerBuyBaseVolume = 4.0;
        bar.takerBuyQuoteVolume = 4.0 * bar.close;
        bars.push_back(bar);
    }
    return bars;
}

// Archive backend driven by callbacks. Without a handler it serves makeBars
// for [startTime, endTime], both edges inclusive.
class ScriptedKlineSource final : public domain::IArchiveSource {
public:
    using Handler = std::function<domain::BarSequence(domain::TimestampMs, domain::TimestampMs)>;

    explicit ScriptedKlineSource(std::string id) : id_(std::move(id)) {}

    const std::string& id() const noexcept override { return id_; }

    bool supportsInterval(domain::Interval interval) const noexcept override {
        return supported_ ? supported_(interval) : interval.dividesDay();
    }

    domain::BarSequence fetchKlines(const std::string&,
                                    domain::Interval interval,
                                    domain::TimestampMs startTime,
                                    domain::TimestampMs endTime,
                                    const core::Deadline&) override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++calls_;
            if (!supportsInterval(interval)) {
                throw std::invalid_argument(id_ + ": unsupported interval");
            }
            lastStart_ = startTime;
            lastEnd_ = endTime;
            if (!errors_.empty()) {
                const auto kind = errors_.front();
                errors_.pop_front();
                throwFor(kind);
            }
            if (alwaysFail_) {
                throwFor(*alwaysFail_);
            }
            handler = handler_;
        }
        if (beforeReturn_) {
            beforeReturn_();
        }
        if (handler) {
            return handler(startTime, endTime);
        }
        return makeBars(startTime, endTime + 1, interval);
    }

    domain::BarSequence fetchMonth(const std::string&,
                                   domain::Interval interval,
                                   int year,
                                   int month,
                                   const core::Deadline&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++monthCalls_;
        if (monthHandler_) {
            return monthHandler_(year, month);
        }
        (void)interval;
        return {};
    }

    void failNext(kvault::common::ErrorKind kind, int times = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (int i = 0; i < times; ++i) {
            errors_.push_back(kind);
        }
    }
    void failAlways(kvault::common::ErrorKind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        alwaysFail_ = kind;
    }
    void recover() {
        std::lock_guard<std::mutex> lock(mutex_);
        alwaysFail_.reset();
        errors_.clear();
    }
    void setHandler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }
    void setMonthHandler(std::function<domain::BarSequence(int, int)> handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        monthHandler_ = std::move(handler);
    }
    // Set before the source is shared with other threads.
    void setSupported(std::function<bool(domain::Interval)> supported) { supported_ = std::move(supported); }
    // Runs outside the lock before a successful fetch returns.
    void setBeforeReturn(std::function<void()> hook) { beforeReturn_ = std::move(hook); }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }
    int monthCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return monthCalls_;
    }
    domain::TimestampMs lastStart() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastStart_;
    }
    domain::TimestampMs lastEnd() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastEnd_;
    }

private:
    void throwFor(kvault::common::ErrorKind kind) const {
        using kvault::common::ErrorKind;
        switch (kind) {
        case ErrorKind::ServerError:
            throw kvault::common::ResponseError(503, "scripted server error", id_);
        case ErrorKind::RateLimited:
            throw kvault::common::ResponseError(429, "scripted rate limit", id_);
        case ErrorKind::ClientError:
            throw kvault::common::ResponseError(400, "scripted client error", id_);
        case ErrorKind::BoundaryMismatch:
        case ErrorKind::SchemaInvalid:
        case ErrorKind::IntegrityCheckFailed:
            throw kvault::common::ValidationError(kind, "scripted validation failure", id_);
        default:
            throw kvault::common::TransportError(kind, "scripted transport failure", id_);
        }
    }

    std::string id_;
    mutable std::mutex mutex_;
    std::deque<kvault::common::ErrorKind> errors_;
    std::optional<kvault::common::ErrorKind> alwaysFail_;
    Handler handler_;
    std::function<domain::BarSequence(int, int)> monthHandler_;
    std::function<void()> beforeReturn_;
    std::function<bool(domain::Interval)> supported_;
    int calls_{0};
    int monthCalls_{0};
    domain::TimestampMs lastStart_{0};
    domain::TimestampMs lastEnd_{0};
};

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() / (prefix + "-" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

}  // namespace testsupport
