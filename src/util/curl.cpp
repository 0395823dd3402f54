#include <chrono>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <curl/curl.h>
#include <curl/easy.h>
#include <spdlog/spdlog.h>

#include <util/curl.h>
#include <util/defer.h>
#include <util/expected.h>
#include <util/strings.h>

namespace util {

namespace curl {

using header_map = std::unordered_map<std::string, std::string>;

#define CURL_EASY(CMD)                                                         \
    if (auto rval__ = CMD; rval__ != CURLE_OK) {                               \
        return util::unexpected(                                               \
            error{rval__, errbuf[0] ? std::string(errbuf)                      \
                                    : std::string(curl_easy_strerror(rval__))}); \
    }

std::optional<std::string> response::header(std::string_view name) const {
    if (auto it = headers.find(util::to_lower(name)); it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

size_t memory_callback(void* source, size_t size, size_t n, void* target) {
    const size_t realsize = size * n;
    spdlog::trace("curl::get memory callback {} bytes", realsize);
    auto& result = *static_cast<std::string*>(target);
    result.append(static_cast<char*>(source), realsize);

    return realsize;
}

size_t header_callback(char* source, size_t size, size_t n, void* target) {
    const size_t realsize = size * n;
    auto& headers = *static_cast<header_map*>(target);
    std::string_view line(source, realsize);

    // a status line starts the headers of a new response, e.g. after a
    // redirect, so discard the headers that were collected so far
    if (line.starts_with("HTTP/")) {
        headers.clear();
        return realsize;
    }
    if (auto pos = line.find(':'); pos != std::string_view::npos) {
        headers[util::to_lower(util::strip(line.substr(0, pos)))] =
            util::strip(line.substr(pos + 1));
    }

    return realsize;
}

void global_init() {
    static std::once_flag flag;
    std::call_once(flag, []() {
        if (auto rval = curl_global_init(CURL_GLOBAL_DEFAULT); rval != CURLE_OK) {
            spdlog::error("curl_global_init failed: {}",
                          curl_easy_strerror(rval));
        }
    });
}

expected<response, error> get(const request& req) {
    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = 0;

    global_init();

    auto h = curl_easy_init();
    if (!h) {
        return unexpected{
            error{CURLE_FAILED_INIT, "unable to initialise curl"}};
    }
    auto _ = defer([h]() { curl_easy_cleanup(h); });

    CURL_EASY(curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf));

    CURL_EASY(curl_easy_setopt(h, CURLOPT_URL, req.url.c_str()));
    spdlog::trace("curl::get set url {}", req.url);

    // worker threads must not be interrupted by the alarm signals that curl
    // uses for DNS timeouts
    CURL_EASY(curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L));

    // blobs are often served from a redirect to external storage
    CURL_EASY(curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L));
    CURL_EASY(curl_easy_setopt(h, CURLOPT_MAXREDIRS, 10L));

    response result;

    CURL_EASY(curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, memory_callback));
    CURL_EASY(curl_easy_setopt(h, CURLOPT_WRITEDATA, (void*)&result.body));
    CURL_EASY(curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_callback));
    CURL_EASY(curl_easy_setopt(h, CURLOPT_HEADERDATA, (void*)&result.headers));
    spdlog::trace("curl::get set memory callbacks");

    struct curl_slist* headers = nullptr;
    auto _headers = defer([&headers]() { curl_slist_free_all(headers); });
    for (auto& line : req.headers) {
        headers = curl_slist_append(headers, line.c_str());
    }
    if (headers) {
        CURL_EASY(curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers));
    }

    if (req.username) {
        CURL_EASY(curl_easy_setopt(h, CURLOPT_USERNAME, req.username->c_str()));
        CURL_EASY(curl_easy_setopt(h, CURLOPT_PASSWORD,
                                   req.password.value_or("").c_str()));
        spdlog::trace("curl::get set credentials for {}", *req.username);
    }

    // some servers do not like requests that are made without a user-agent
    // field, so we provide one
    CURL_EASY(curl_easy_setopt(h, CURLOPT_USERAGENT, "rex/" REX_VERSION));

    CURL_EASY(curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                               static_cast<long>(req.connect_timeout.count())));
    CURL_EASY(curl_easy_setopt(h, CURLOPT_TIMEOUT_MS,
                               static_cast<long>(req.timeout.count())));
    spdlog::trace("curl::get set timeout {}", req.timeout.count());

    CURL_EASY(curl_easy_perform(h));

    CURL_EASY(curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &result.status));

    spdlog::debug("curl::get {} status {} ({} bytes)", req.url, result.status,
                  result.body.size());

    return result;
}

std::optional<std::chrono::system_clock::time_point>
parse_http_date(const std::string& date) {
    const auto t = curl_getdate(date.c_str(), nullptr);
    if (t < 0) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

} // namespace curl
} // namespace util
