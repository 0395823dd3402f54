#include <algorithm>
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <util/curl.h>
#include <util/expected.h>
#include <util/strings.h>

#include <rex/client.h>
#include <rex/error.h>
#include <rex/oci.h>

namespace rex {

using json = nlohmann::json;

std::string normalize_url(std::string_view url) {
    auto result = util::strip(url);
    if (result.find("://") == std::string::npos) {
        result = "http://" + result;
    }
    while (result.ends_with('/')) {
        result.pop_back();
    }
    return result;
}

namespace {
bool is_absolute(std::string_view target) {
    return target.starts_with("http://") || target.starts_with("https://");
}
} // namespace

std::string url_origin(std::string_view url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return util::to_lower(url);
    }
    const auto scheme = util::to_lower(url.substr(0, scheme_end));
    auto authority = url.substr(scheme_end + 3);
    authority = authority.substr(0, authority.find_first_of("/?#"));
    // user information is not part of the origin
    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }
    auto host = util::to_lower(authority);
    if ((scheme == "http" && host.ends_with(":80")) ||
        (scheme == "https" && host.ends_with(":443"))) {
        host = host.substr(0, host.rfind(':'));
    }
    return fmt::format("{}://{}", scheme, host);
}

bool sends_credentials(std::string_view registry, std::string_view target) {
    return !is_absolute(target) || url_origin(target) == url_origin(registry);
}

std::optional<std::string> parse_link_next(std::string_view header) {
    std::size_t pos = 0;
    while ((pos = header.find('<', pos)) != std::string_view::npos) {
        const auto end = header.find('>', pos);
        if (end == std::string_view::npos) {
            return std::nullopt;
        }
        const auto target = header.substr(pos + 1, end - pos - 1);

        // the parameters run until the next link
        const auto next = header.find('<', end);
        const auto params = header.substr(end + 1, next == std::string_view::npos
                                                       ? std::string_view::npos
                                                       : next - end - 1);
        for (auto& param : util::split(params, ';', true)) {
            auto eq = param.find('=');
            if (eq == std::string::npos) {
                continue;
            }
            if (util::to_lower(util::strip(param.substr(0, eq))) != "rel") {
                continue;
            }
            auto value = util::strip(param.substr(eq + 1));
            // drop a trailing comma that separates this link from the next
            if (value.ends_with(',')) {
                value = util::strip(value.substr(0, value.size() - 1));
            }
            if (value.size() >= 2 && value.front() == '"' &&
                value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            // rel can hold a space separated list of relation types
            for (auto& rel : util::split(value, ' ', true)) {
                if (util::to_lower(rel) == "next") {
                    return std::string(target);
                }
            }
        }
        pos = end + 1;
    }
    return std::nullopt;
}

std::optional<std::chrono::seconds> parse_retry_after(std::string_view value,
                                                      timestamp now) {
    const auto v = util::strip(value);
    if (v.empty()) {
        return std::nullopt;
    }
    if (std::all_of(v.begin(), v.end(),
                    [](char c) { return c >= '0' && c <= '9'; })) {
        if (v.size() > 9) {
            return std::nullopt;
        }
        return std::chrono::seconds(std::stol(v));
    }
    if (auto date = util::curl::parse_http_date(v)) {
        auto delay =
            std::chrono::duration_cast<std::chrono::seconds>(*date - now);
        return std::max(delay, std::chrono::seconds(0));
    }
    return std::nullopt;
}

error classify_response(const util::curl::response& response,
                        std::string_view target) {
    const auto status = response.status;
    error e{error_kind::protocol, ""};
    if (status == 401 || status == 403) {
        e.kind = error_kind::unauthorized;
        e.message = fmt::format("{} returned {}: access denied", target, status);
        if (auto challenge = response.header("www-authenticate")) {
            e.message += fmt::format(" ({})", *challenge);
        }
    } else if (status == 404) {
        e.kind = error_kind::not_found;
        e.message = fmt::format("{} not found", target);
    } else if (status == 429) {
        e.kind = error_kind::rate_limited;
        e.message = fmt::format("{} returned 429: too many requests", target);
        if (auto value = response.header("retry-after")) {
            e.retry_after =
                parse_retry_after(*value, std::chrono::system_clock::now());
        }
    } else if (status >= 500) {
        e.kind = error_kind::transport;
        e.message = fmt::format("{} returned server error {}", target, status);
    } else {
        e.message = fmt::format("{} returned unexpected status {}", target, status);
    }
    e.status = status;
    return e;
}

http_client::http_client(const std::string& url, client_options options)
    : url_(normalize_url(url)), options_(std::move(options)) {
}

util::expected<util::curl::response, error>
http_client::get(const std::string& target,
                 std::vector<std::string> headers) const {
    util::curl::request req{
        .url = is_absolute(target) ? target : url_ + target,
        .headers = std::move(headers),
        .username = std::nullopt,
        .password = std::nullopt,
        .connect_timeout = options_.connect_timeout,
        .timeout = options_.timeout,
    };
    // a Link header can point at another host, which must not see the
    // credentials of this registry
    const bool trusted = sends_credentials(url_, target);
    if (!trusted && options_.credentials) {
        spdlog::warn("http_client: {} is not on {}, sending no credentials",
                     target, url_);
    }
    if (options_.credentials && trusted) {
        if (auto b = std::get_if<basic_credentials>(&*options_.credentials)) {
            req.username = b->username;
            req.password = b->password;
        } else {
            req.headers.push_back(fmt::format(
                "Authorization: Bearer {}",
                std::get<bearer_token>(*options_.credentials).token));
        }
    }

    spdlog::debug("http_client: GET {}", req.url);
    auto response = util::curl::get(req);
    if (!response) {
        return util::unexpected(make_error(error_kind::transport, "GET {}: {}",
                                           req.url, response.error()));
    }
    spdlog::trace("http_client: GET {} -> {} ({} bytes)", req.url,
                  response->status, response->body.size());
    if (response->status < 200 || response->status >= 300) {
        return util::unexpected(classify_response(*response, req.url));
    }
    return std::move(*response);
}

util::expected<std::vector<std::string>, error>
http_client::paginate(const std::string& first, const char* field,
                      const std::optional<std::string>& expected_name) const {
    std::vector<std::string> result;
    std::set<std::string> visited;
    std::string target = first;
    if (options_.page_size) {
        target += fmt::format("?n={}", *options_.page_size);
    }

    while (!target.empty()) {
        // a registry that links back to a page it already returned would
        // otherwise loop forever
        if (!visited.insert(target).second) {
            spdlog::warn("http_client: pagination loop at {}", target);
            break;
        }
        auto response = get(target);
        if (!response) {
            return util::unexpected(response.error());
        }

        try {
            auto page = json::parse(response->body);
            if (!page.is_object()) {
                return util::unexpected(make_error(
                    error_kind::protocol, "{}: response is not an object", target));
            }
            if (expected_name) {
                if (!page.contains("name") || !page["name"].is_string() ||
                    page["name"].get<std::string>() != *expected_name) {
                    return util::unexpected(make_error(
                        error_kind::protocol,
                        "{}: response does not name repository {}", target,
                        *expected_name));
                }
            }
            // registries return null for an empty list
            if (page.contains(field) && !page[field].is_null()) {
                if (!page[field].is_array()) {
                    return util::unexpected(make_error(
                        error_kind::protocol, "{}: {} is not an array", target,
                        field));
                }
                for (auto& item : page[field]) {
                    result.push_back(item.get<std::string>());
                }
            }
        } catch (json::exception& e) {
            return util::unexpected(make_error(
                error_kind::protocol, "{}: invalid response: {}", target, e.what()));
        }

        auto link = response->header("link");
        target = link ? parse_link_next(*link).value_or("") : "";
    }

    return result;
}

util::expected<std::string, error> http_client::ping() const {
    auto response = get("/v2/");
    if (!response) {
        return util::unexpected(response.error());
    }
    return response->header("docker-distribution-api-version").value_or("");
}

util::expected<std::vector<std::string>, error> http_client::catalog() const {
    return paginate("/v2/_catalog", "repositories", std::nullopt);
}

util::expected<std::vector<std::string>, error>
http_client::tags(const std::string& repository) const {
    return paginate(fmt::format("/v2/{}/tags/list", repository), "tags",
                    repository);
}

util::expected<manifest_response, error>
http_client::manifest(const std::string& repository,
                      const std::string& ref) const {
    auto response =
        get(fmt::format("/v2/{}/manifests/{}", repository, ref),
            {fmt::format("Accept: {}", media_type::manifest_accept)});
    if (!response) {
        return util::unexpected(response.error());
    }
    auto content_type = response->header("content-type").value_or("");
    // drop parameters such as "; charset=utf-8"
    if (auto pos = content_type.find(';'); pos != std::string::npos) {
        content_type = util::strip(content_type.substr(0, pos));
    }
    return manifest_response{
        .body = std::move(response->body),
        .media_type = std::move(content_type),
        .digest = response->header("docker-content-digest"),
    };
}

util::expected<std::string, error>
http_client::blob(const std::string& repository, const rex::digest& d) const {
    auto response = get(fmt::format("/v2/{}/blobs/{}", repository, d.string()));
    if (!response) {
        return util::unexpected(response.error());
    }
    if (!d.verify(response->body)) {
        return util::unexpected(make_error(
            error_kind::validation, "blob {}/{} does not match its digest",
            repository, d));
    }
    return std::move(response->body);
}

} // namespace rex
