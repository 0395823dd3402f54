#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <util/expected.h>

#include <rex/cache.h>
#include <rex/client.h>
#include <rex/digest.h>
#include <rex/error.h>
#include <rex/manifest.h>
#include <rex/oci.h>
#include <rex/pool.h>
#include <rex/reference.h>

namespace rex {

// requests that are rate limited are retried with exponential backoff
struct retry_policy {
    // the total number of attempts, including the first
    unsigned max_attempts = 3;
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_delay{30000};

    // the delay before retry number attempt+1: base_delay*2^attempt, or the
    // delay requested by the registry, capped at max_delay
    std::chrono::milliseconds
    delay(unsigned attempt,
          std::optional<std::chrono::seconds> retry_after = std::nullopt) const;
};

struct fetch_settings {
    std::string registry_url;
    std::filesystem::path cache_dir;
    std::optional<rex::credentials> credentials;
    // the maximum number of simultaneous registry requests
    unsigned concurrency = 8;
    cache_policy cache;
    retry_policy retry;
    std::chrono::milliseconds timeout{30000};
    // used to pick a child manifest of an index
    std::optional<rex::platform> platform;
    // add library/ to single component repository names
    bool dockerhub_compat = false;
    std::optional<unsigned> page_size;
};

struct tag_info {
    std::string name;
    std::optional<rex::digest> digest;
    std::optional<std::uint64_t> size;
    std::optional<timestamp> last_modified;
    std::vector<std::string> platforms;
};

struct repository_item {
    std::string name;
    std::optional<std::size_t> tag_count;
    std::optional<std::uint64_t> size;
    std::optional<timestamp> last_updated;
};

struct fetch_failure {
    // the tag or repository that could not be fetched
    std::string item;
    rex::error error;
};

// the outcome of a batch: successes and failures, each in input order
template <typename T> struct fetch_result {
    std::vector<T> items;
    std::vector<fetch_failure> failures;
    bool cancelled = false;
};

struct fetched_manifest {
    // the digest of document
    rex::digest digest;
    std::string media_type;
    manifest_document document;
    // set when the manifest was selected from an index for a platform
    std::optional<rex::digest> index;
};

// the tag names of a repository
struct repository_tags {
    std::string name;
    std::vector<std::string> tags;
};

struct sync_options {
    // also fetch the manifest and configuration of every tag
    bool manifests = false;
    progress_fn tag_progress;
    progress_fn manifest_progress;
};

struct sync_stats {
    std::size_t repositories = 0;
    std::size_t tags = 0;
    // the number of tags whose manifest and configuration were fetched
    std::size_t manifests = 0;
    std::vector<fetch_failure> failures;
    bool cancelled = false;
};

// the outcome of a registry version check
struct registry_status {
    std::string url;
    // the registry answered, possibly by denying access
    bool online = false;
    bool auth_required = false;
    // credentials were provided
    bool authenticated = false;
    std::optional<std::string> api_version;
    std::optional<rex::error> error;
};

// Every fetch takes a cancel_token for the duration of the call: cancelling
// it stops new tasks from starting and interrupts backoff sleeps. A token
// only affects the calls it is passed to, so a fetcher can be used again
// after a batch has been cancelled.
class metadata_fetcher {
  public:
    // connect to settings.registry_url with an http_client
    explicit metadata_fetcher(fetch_settings settings);
    // use the provided client
    metadata_fetcher(fetch_settings settings, registry_client client);

    metadata_fetcher(const metadata_fetcher&) = delete;
    metadata_fetcher& operator=(const metadata_fetcher&) = delete;

    // list the tags of repository, with the digest, size, creation date and
    // platforms of each tag.
    // an error is returned if the tag list itself can not be obtained.
    util::expected<fetch_result<tag_info>, error>
    fetch_tags(const std::string& repository, const cancel_token& cancel = {});

    // list the repositories in the registry, with the number of tags and the
    // size and date of the most recent tag of each.
    util::expected<fetch_result<repository_item>, error>
    fetch_repositories(const progress_fn& progress = {},
                       const cancel_token& cancel = {});

    // the names of the repositories in the registry
    util::expected<std::vector<std::string>, error>
    fetch_catalog(const cancel_token& cancel = {});

    // the tag names of each repository, without their manifests
    util::expected<fetch_result<repository_tags>, error>
    fetch_tag_lists(const std::vector<std::string>& repositories,
                    const progress_fn& progress = {},
                    const cancel_token& cancel = {});

    // the manifest that ref refers to. if the manifest is an index and a
    // platform is provided (or configured), the matching child is returned.
    util::expected<fetched_manifest, error>
    fetch_manifest(const reference& ref,
                   const std::optional<rex::platform>& platform = std::nullopt,
                   const cancel_token& cancel = {});

    // the raw config blob of an image
    util::expected<std::string, error>
    fetch_config(const std::string& repository, const rex::digest& d,
                 const cancel_token& cancel = {});

    // fill the cache with the catalog and the tag lists of every repository,
    // and optionally with the manifests and configurations of every tag.
    // an error is returned if the catalog can not be obtained.
    util::expected<sync_stats, error> sync(const sync_options& options,
                                           const cancel_token& cancel = {});

    // check that the registry implements the distribution API
    registry_status check() const;

    const fetch_settings& settings() const {
        return settings_;
    }

    // the repository name used for API requests
    std::string qualify(const std::string& repository) const;

  private:
    // a manifest or blob payload with its verified digest
    struct content {
        std::string body;
        std::string media_type;
        rex::digest digest;
    };
    using content_result = util::expected<content, error>;

    util::expected<std::vector<std::string>, error>
    list_tags(const std::string& repository, const cancel_token& cancel);
    util::expected<std::vector<std::string>, error>
    list_repositories(const cancel_token& cancel);

    util::expected<tag_info, error> resolve_tag(const std::string& repository,
                                                const std::string& tag,
                                                const cancel_token& cancel);
    content_result manifest_by_tag(const std::string& repository,
                                   const std::string& tag,
                                   const cancel_token& cancel);
    content_result manifest_by_digest(const std::string& repository,
                                      const rex::digest& d,
                                      const cancel_token& cancel);
    content_result config_blob(const std::string& repository,
                               const rex::digest& d,
                               const cancel_token& cancel);
    std::optional<timestamp> index_created(const std::string& repository,
                                           const image_index& index,
                                           const cancel_token& cancel);

    // read a listing from the cache: errors are logged and treated as a miss
    std::optional<std::vector<std::string>> cached_list(const cache_key& key);
    void store_list(const cache_key& key, const std::vector<std::string>& list);
    std::optional<content> cached_content(const cache_key& key);
    // cache_integrity is returned, other cache errors are logged
    util::expected<void, error> store(const cache_entry& entry);

    // call f until it returns something other than a rate_limited error, or
    // the retry policy is exhausted
    template <typename F>
    auto with_retry(F&& f, std::string_view what, const cancel_token& cancel);

    // concurrent calls with the same key share the result of one call to f
    template <typename F>
    content_result single_flight(const std::string& key, F&& f,
                                 const cancel_token& cancel);

    fetch_settings settings_;
    registry_client client_;
    std::optional<cache_store> cache_;
    std::string registry_;

    std::mutex inflight_mutex_;
    std::unordered_map<std::string, std::shared_future<content_result>>
        inflight_;
};

} // namespace rex
