#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <util/curl.h>
#include <util/expected.h>

#include <rex/digest.h>
#include <rex/error.h>
#include <rex/oci.h>

namespace rex {

struct basic_credentials {
    std::string username;
    std::string password;
};

struct bearer_token {
    std::string token;
};

// credentials are provided by the caller and passed through to the registry
// unchanged: they are never refreshed.
using credentials = std::variant<basic_credentials, bearer_token>;

struct manifest_response {
    std::string body;
    // the Content-Type of the response
    std::string media_type;
    // the Docker-Content-Digest header, if the registry provided one
    std::optional<std::string> digest;
};

// Concept for registry client implementations.
// Any type T that implements these operations can be used as a client: the
// fetchers call them concurrently from worker threads.
template <typename T>
concept ClientImpl = requires(const T client, const std::string& repository,
                              const std::string& ref, const rex::digest& d) {
    {
        client.ping()
    } -> std::convertible_to<util::expected<std::string, error>>;
    {
        client.catalog()
    } -> std::convertible_to<util::expected<std::vector<std::string>, error>>;
    {
        client.tags(repository)
    } -> std::convertible_to<util::expected<std::vector<std::string>, error>>;
    {
        client.manifest(repository, ref)
    } -> std::convertible_to<util::expected<manifest_response, error>>;
    {
        client.blob(repository, d)
    } -> std::convertible_to<util::expected<std::string, error>>;
    { client.url() } -> std::convertible_to<std::string>;
};

// Type-erased registry client with value semantics
class registry_client {
  public:
    template <ClientImpl T>
    registry_client(T impl) : impl_(std::make_unique<wrap<T>>(std::move(impl))) {
    }

    registry_client(registry_client&& other) = default;

    registry_client(const registry_client& other) : impl_(other.impl_->clone()) {
    }

    registry_client& operator=(registry_client&& other) = default;
    registry_client& operator=(const registry_client& other) {
        return *this = registry_client(other);
    }

    // GET /v2/: returns the Docker-Distribution-API-Version header
    util::expected<std::string, error> ping() const {
        return impl_->ping();
    }

    // the full list of repositories in the registry
    util::expected<std::vector<std::string>, error> catalog() const {
        return impl_->catalog();
    }

    // the full list of tags in a repository
    util::expected<std::vector<std::string>, error>
    tags(const std::string& repository) const {
        return impl_->tags(repository);
    }

    // ref is a tag or a digest
    util::expected<manifest_response, error>
    manifest(const std::string& repository, const std::string& ref) const {
        return impl_->manifest(repository, ref);
    }

    // the blob is verified against its digest
    util::expected<std::string, error> blob(const std::string& repository,
                                            const rex::digest& d) const {
        return impl_->blob(repository, d);
    }

    std::string url() const {
        return impl_->url();
    }

  private:
    struct interface {
        virtual ~interface() = default;
        virtual std::unique_ptr<interface> clone() = 0;
        virtual util::expected<std::string, error> ping() const = 0;
        virtual util::expected<std::vector<std::string>, error>
        catalog() const = 0;
        virtual util::expected<std::vector<std::string>, error>
        tags(const std::string&) const = 0;
        virtual util::expected<manifest_response, error>
        manifest(const std::string&, const std::string&) const = 0;
        virtual util::expected<std::string, error>
        blob(const std::string&, const rex::digest&) const = 0;
        virtual std::string url() const = 0;
    };

    std::unique_ptr<interface> impl_;

    template <ClientImpl T> struct wrap : interface {
        explicit wrap(const T& impl) : wrapped(impl) {
        }
        explicit wrap(T&& impl) : wrapped(std::move(impl)) {
        }

        virtual std::unique_ptr<interface> clone() override {
            return std::make_unique<wrap<T>>(wrapped);
        }
        virtual util::expected<std::string, error> ping() const override {
            return wrapped.ping();
        }
        virtual util::expected<std::vector<std::string>, error>
        catalog() const override {
            return wrapped.catalog();
        }
        virtual util::expected<std::vector<std::string>, error>
        tags(const std::string& repository) const override {
            return wrapped.tags(repository);
        }
        virtual util::expected<manifest_response, error>
        manifest(const std::string& repository,
                 const std::string& ref) const override {
            return wrapped.manifest(repository, ref);
        }
        virtual util::expected<std::string, error>
        blob(const std::string& repository,
             const rex::digest& d) const override {
            return wrapped.blob(repository, d);
        }
        virtual std::string url() const override {
            return wrapped.url();
        }

        T wrapped;
    };
};

struct client_options {
    std::optional<rex::credentials> credentials;
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds connect_timeout{10000};
    // the page size requested from paginated endpoints (the n= parameter)
    std::optional<unsigned> page_size;
};

// a client for the OCI distribution API over HTTP, using libcurl.
// the client does not retry: errors are classified and returned.
class http_client {
  public:
    http_client(const std::string& url, client_options options = {});

    util::expected<std::string, error> ping() const;
    util::expected<std::vector<std::string>, error> catalog() const;
    util::expected<std::vector<std::string>, error>
    tags(const std::string& repository) const;
    util::expected<manifest_response, error>
    manifest(const std::string& repository, const std::string& ref) const;
    util::expected<std::string, error> blob(const std::string& repository,
                                            const rex::digest& d) const;
    std::string url() const {
        return url_;
    }

  private:
    // GET a path relative to the registry, or an absolute URL
    util::expected<util::curl::response, error>
    get(const std::string& target, std::vector<std::string> headers = {}) const;

    // follow Link headers until the last page, collecting the string array
    // field of each page
    util::expected<std::vector<std::string>, error>
    paginate(const std::string& first, const char* field,
             const std::optional<std::string>& expected_name) const;

    std::string url_;
    client_options options_;
};

// add a scheme (http) if none is present and remove trailing '/'
std::string normalize_url(std::string_view url);

// scheme, host and port of an absolute URL, in lower case and without a
// default port, e.g. "https://Registry.io:443/v2/" -> "https://registry.io"
std::string url_origin(std::string_view url);

// true if the credentials for registry may be sent with a request for target:
// target is a path on the registry, or an absolute URL with the same origin
bool sends_credentials(std::string_view registry, std::string_view target);

// the target of the rel="next" link in a Link header, if any
std::optional<std::string> parse_link_next(std::string_view header);

// parse a Retry-After header: a delay in seconds or an HTTP date
std::optional<std::chrono::seconds> parse_retry_after(std::string_view value,
                                                      timestamp now);

// the error that corresponds to a non-2xx response
error classify_response(const util::curl::response& response,
                        std::string_view target);

} // namespace rex

#include <fmt/core.h>

template <> class fmt::formatter<rex::credentials> {
  public:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // secrets are never printed
    template <typename FmtContext>
    auto format(rex::credentials const& c, FmtContext& ctx) const {
        if (auto b = std::get_if<rex::basic_credentials>(&c)) {
            return fmt::format_to(ctx.out(), "basic({}:{})", b->username,
                                  std::string(b->password.size(), 'X'));
        }
        return fmt::format_to(ctx.out(), "bearer(XXXX)");
    }
};
