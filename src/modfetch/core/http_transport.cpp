// Copyright (c) 2026 changcheng967. All rights reserved.

#include <modfetch/core/http_transport.hpp>
#include <modfetch/core/config.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <exception>

namespace modfetch::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct HeaderList {
    curl_slist* ptr = nullptr;

    HeaderList() = default;
    ~HeaderList() { if (ptr) curl_slist_free_all(ptr); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    [[nodiscard]] bool append(const std::string& line) noexcept {
        auto* next = curl_slist_append(ptr, line.c_str());
        if (!next) return false;
        ptr = next;
        return true;
    }
};

// State shared with the libcurl callbacks of one transfer
struct Transfer {
    const HttpRequest* request{nullptr};
    const ResponseHandler* handler{nullptr};
    HttpResponse response;
    bool headers_delivered{false};
    std::error_code callback_error;
};

// Status line of each response in a redirect chain resets the header map
void parse_status_line(std::string_view line, HttpResponse& response) {
    response.headers.clear();
    response.status_code = 0;

    auto space = line.find(' ');
    if (space == std::string_view::npos) return;
    auto code = line.substr(space + 1, 3);

    std::int32_t status = 0;
    auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), status);
    if (ec == std::errc{}) {
        response.status_code = status;
    }
}

std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* transfer = static_cast<Transfer*>(userdata);
    if (!transfer) return total;

    std::string_view header(buffer, total);
    if (header.starts_with("HTTP/")) {
        parse_status_line(header, transfer->response);
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    try {
        transfer->response.headers[to_lower(name)] = std::string(value);
    } catch (const std::bad_alloc&) {
        return 0;
    }
    return total;
}

// False once the handler asked to stop
bool deliver_headers(Transfer& transfer) {
    if (transfer.headers_delivered) return true;
    transfer.headers_delivered = true;
    if (transfer.handler->on_headers && !transfer.handler->on_headers(transfer.response)) {
        transfer.response.stopped_early = true;
        return false;
    }
    return true;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* transfer = static_cast<Transfer*>(userdata);
    const std::size_t total = size * nmemb;
    if (!transfer) return 0;

    try {
        if (!deliver_headers(*transfer)) {
            return 0;
        }

        std::span<const std::byte> data(reinterpret_cast<const std::byte*>(ptr), total);
        const std::size_t piece_size = transfer->request->buffer_size > 0
            ? transfer->request->buffer_size
            : total;

        while (!data.empty()) {
            auto piece = data.first(std::min(piece_size, data.size()));
            transfer->response.body_bytes += piece.size();
            if (transfer->handler->on_body && !transfer->handler->on_body(piece)) {
                transfer->response.stopped_early = true;
                return 0;
            }
            data = data.subspan(piece.size());
        }
        return total;
    } catch (const std::exception& e) {
        spdlog::error("http: response handler threw: {}", e.what());
        transfer->callback_error = make_error_code(DownloadErrc::network_error);
        return 0;
    }
}

// Aborts the transfer once the request's stop token trips
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* transfer = static_cast<Transfer*>(userdata);
    return transfer->request->stop.stop_requested() ? 1 : 0;
}

std::error_code map_curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(DownloadErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(DownloadErrc::dns_error);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(DownloadErrc::ssl_error);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
            return make_error_code(DownloadErrc::connection_lost);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(DownloadErrc::cancelled);
        case CURLE_URL_MALFORMAT:
            return make_error_code(DownloadErrc::invalid_url);
        default:
            return make_error_code(DownloadErrc::network_error);
    }
}

} // namespace

//=============================================================================
// CurlTransport
//=============================================================================

std::expected<HttpResponse, std::error_code>
CurlTransport::perform(const HttpRequest& request, const ResponseHandler& handler) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HeaderList header_list;
    for (const auto& [name, value] : request.headers) {
        if (auto ec = validate_header(name, value)) {
            return std::unexpected(ec);
        }
        // "name;" is how libcurl sends a header with an empty value
        std::string line = value.empty() ? name + ";" : name + ": " + value;
        if (!header_list.append(line)) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_header));
        }
    }

    Transfer transfer;
    transfer.request = &request;
    transfer.handler = &handler;

    curl_easy_setopt(curl.ptr, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);

    if (!request.user_agent.empty()) {
        curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, request.user_agent.c_str());
    }
    if (header_list.ptr) {
        curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, header_list.ptr);
    }

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }

    // Timeouts: connect bound plus a stall window, so long bodies are not cut off
    const auto timeout = request.timeout.count() > 0 ? request.timeout : IO_TIMEOUT;
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(std::min(timeout, CONNECTION_TIMEOUT).count()));
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(timeout.count()));

    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.ptr, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);

    if (request.buffer_size > 0) {
        const auto buffer = std::clamp<std::size_t>(request.buffer_size, 1024, CURL_MAX_READ_SIZE);
        curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(buffer));
    }

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &transfer);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (transfer.callback_error) {
        return std::unexpected(transfer.callback_error);
    }

    // A handler stopping the transfer surfaces as a write error
    if (result == CURLE_WRITE_ERROR && transfer.response.stopped_early) {
        return transfer.response;
    }

    if (result != CURLE_OK) {
        spdlog::debug("http: GET {} failed: {}", request.url, curl_easy_strerror(result));
        return std::unexpected(map_curl_error(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    transfer.response.status_code = static_cast<std::int32_t>(http_code);

    // Bodiless response: headers still have to reach the handler
    try {
        (void)deliver_headers(transfer);
    } catch (const std::exception& e) {
        spdlog::error("http: response handler threw: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    return transfer.response;
}

void CurlTransport::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlTransport::global_cleanup() noexcept {
    curl_global_cleanup();
}

std::unique_ptr<HttpTransport> make_curl_transport() {
    return std::make_unique<CurlTransport>();
}

} // namespace modfetch::core
