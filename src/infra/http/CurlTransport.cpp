#include "infra/http/CurlTransport.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <utility>

#include "common/Errors.hpp"
#include "common/Log.hpp"

namespace infra::http {
namespace {

using kvault::common::ErrorKind;
using kvault::common::TransportError;

std::once_flag g_curlInitFlag;

void ensureCurlGlobalInit() {
    // curl_global_cleanup is never called: other components of the process may
    // still hold handles at static destruction time.
    std::call_once(g_curlInitFlag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct ResponseSink {
    std::string body;
    HeaderList headers;
};

std::size_t onBody(char* data, std::size_t size, std::size_t count, void* user) {
    auto* sink = static_cast<ResponseSink*>(user);
    sink->body.append(data, size * count);
    return size * count;
}

std::string trim(std::string value) {
    auto notSpace = [](unsigned char c) { return std::isspace(c) == 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    return value;
}

std::size_t onHeader(char* data, std::size_t size, std::size_t count, void* user) {
    auto* sink = static_cast<ResponseSink*>(user);
    const std::string line(data, size * count);
    // A new status line starts the headers of the next response in a redirect chain.
    if (line.rfind("HTTP/", 0) == 0) {
        sink->headers.clear();
        return size * count;
    }
    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        sink->headers.emplace_back(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
    }
    return size * count;
}

ErrorKind kindFor(CURLcode code) {
    switch (code) {
    case CURLE_OPERATION_TIMEDOUT:
        return ErrorKind::Timeout;
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_CONNECT:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_PARTIAL_FILE:
        return ErrorKind::ConnectionFailed;
    default:
        return ErrorKind::ProtocolError;
    }
}

struct HeaderListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}  // namespace

CurlTransport::CurlTransport() : CurlTransport(Config{}) {}

CurlTransport::CurlTransport(Config config) : config_(std::move(config)) {
    ensureCurlGlobalInit();
}

CurlTransport::~CurlTransport() {
    close();
}

void CurlTransport::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = true;
}

void CurlTransport::close() {
    std::vector<CURL*> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
        drained.swap(idleHandles_);
    }
    for (CURL* handle : drained) {
        curl_easy_cleanup(handle);
    }
}

CURL* CurlTransport::acquireHandle() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            throw TransportError(ErrorKind::ProtocolError, "transport is closed", config_.id);
        }
        if (!idleHandles_.empty()) {
            CURL* handle = idleHandles_.back();
            idleHandles_.pop_back();
            return handle;
        }
    }
    CURL* handle = curl_easy_init();
    if (handle == nullptr) {
        throw TransportError(ErrorKind::ConnectionFailed, "curl_easy_init failed", config_.id);
    }
    return handle;
}

void CurlTransport::releaseHandle(CURL* handle) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_ && idleHandles_.size() < config_.maxIdleHandles) {
            idleHandles_.push_back(handle);
            return;
        }
    }
    curl_easy_cleanup(handle);
}

HttpResponse CurlTransport::request(const HttpRequest& request) {
    if (request.timeout.count() <= 0) {
        throw TransportError(ErrorKind::Timeout, "request timeout must be positive", config_.id);
    }

    const std::string url = composeUrl(request.url, request.params);
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
        throw TransportError(ErrorKind::ProtocolError, "unsupported URL: " + url, config_.id);
    }

    CURL* handle = acquireHandle();
    // Handles keep options between calls; start every request from a clean slate.
    curl_easy_reset(handle);

    std::unique_ptr<curl_slist, HeaderListDeleter> headerList;
    for (const auto& [name, value] : request.headers) {
        const std::string line = name + ": " + value;
        headerList.reset(curl_slist_append(headerList.release(), line.c_str()));
    }

    ResponseSink sink;
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_USERAGENT, config_.userAgent.c_str());
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, config_.maxRedirects);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, config_.verifyPeer ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, config_.verifyPeer ? 2L : 0L);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, onBody);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, onHeader);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &sink);
    if (request.method == Method::Head) {
        curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    }
    if (headerList) {
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headerList.get());
    }

    const CURLcode code = curl_easy_perform(handle);
    if (code != CURLE_OK) {
        curl_easy_cleanup(handle);
        std::ostringstream oss;
        oss << methodName(request.method) << ' ' << request.url << " failed: " << curl_easy_strerror(code);
        throw TransportError(kindFor(code), oss.str(), config_.id);
    }

    long status = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
    releaseHandle(handle);

    HttpResponse response;
    response.status = static_cast<unsigned>(status);
    response.headers = std::move(sink.headers);
    response.body = std::move(sink.body);
    LOG_DEBUG("[" << config_.id << "] " << methodName(request.method) << ' ' << request.url << " -> "
                  << response.status << " (" << response.body.size() << " bytes)");
    return response;
}

}  // namespace infra::http
