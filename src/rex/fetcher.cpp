#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <util/expected.h>

#include <rex/cache.h>
#include <rex/client.h>
#include <rex/error.h>
#include <rex/fetcher.h>
#include <rex/manifest.h>
#include <rex/parse.h>
#include <rex/pool.h>

namespace rex {

using json = nlohmann::json;

std::chrono::milliseconds
retry_policy::delay(unsigned attempt,
                    std::optional<std::chrono::seconds> retry_after) const {
    using std::chrono::milliseconds;
    milliseconds d;
    if (retry_after) {
        d = std::chrono::duration_cast<milliseconds>(*retry_after);
    } else {
        // avoid overflow: the cap is reached long before 2^20
        d = base_delay * (1ll << std::min(attempt, 20u));
    }
    return std::min(d, max_delay);
}

namespace {

registry_client make_client(const fetch_settings& settings) {
    return http_client(settings.registry_url,
                       {.credentials = settings.credentials,
                        .timeout = settings.timeout,
                        .connect_timeout = std::min(
                            settings.timeout, std::chrono::milliseconds(10000)),
                        .page_size = settings.page_size});
}

// collect the outcomes of a batch into successes and failures
template <typename T>
fetch_result<T> aggregate(std::vector<util::expected<T, error>> outcomes,
                          const std::vector<std::string>& names,
                          const cancel_token& cancel) {
    fetch_result<T> result;
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        if (outcomes[i]) {
            result.items.push_back(std::move(*outcomes[i]));
        } else {
            if (outcomes[i].error().kind == error_kind::cancelled) {
                result.cancelled = true;
            }
            result.failures.push_back({names[i], std::move(outcomes[i].error())});
        }
    }
    result.cancelled = result.cancelled || cancel.cancelled();
    return result;
}

std::string to_json(const std::vector<std::string>& list) {
    return json(list).dump();
}

} // namespace

metadata_fetcher::metadata_fetcher(fetch_settings settings)
    : metadata_fetcher(settings, make_client(settings)) {
}

metadata_fetcher::metadata_fetcher(fetch_settings settings,
                                   registry_client client)
    : settings_(std::move(settings)), client_(std::move(client)),
      registry_(client_.url()) {
    settings_.concurrency = std::max(settings_.concurrency, 1u);
    settings_.retry.max_attempts = std::max(settings_.retry.max_attempts, 1u);

    // the fetcher works without a cache, every request goes to the registry
    if (auto c = cache_store::open(settings_.cache_dir, settings_.cache)) {
        cache_.emplace(std::move(*c));
    } else {
        spdlog::warn("metadata_fetcher: unable to use the cache {}: {}",
                     settings_.cache_dir.string(), c.error());
    }
    spdlog::debug("metadata_fetcher: registry {} concurrency {}", registry_,
                  settings_.concurrency);
}

std::string metadata_fetcher::qualify(const std::string& repository) const {
    if (settings_.dockerhub_compat &&
        repository.find('/') == std::string::npos) {
        return "library/" + repository;
    }
    return repository;
}

template <typename F>
auto metadata_fetcher::with_retry(F&& f, std::string_view what,
                                  const cancel_token& cancel) {
    using result_type = std::invoke_result_t<F&>;
    for (unsigned attempt = 0;; ++attempt) {
        result_type r = f();
        if (r || r.error().kind != error_kind::rate_limited ||
            attempt + 1 >= settings_.retry.max_attempts) {
            return r;
        }
        const auto d = settings_.retry.delay(attempt, r.error().retry_after);
        spdlog::warn("{}: rate limited, retrying in {}ms (attempt {} of {})",
                     what, d.count(), attempt + 2, settings_.retry.max_attempts);
        if (!cancel.sleep_for(d)) {
            return result_type(util::unexpected(make_error(
                error_kind::cancelled, "{}: cancelled while waiting to retry",
                what)));
        }
    }
}

template <typename F>
metadata_fetcher::content_result
metadata_fetcher::single_flight(const std::string& key, F&& f,
                                const cancel_token& cancel) {
    while (true) {
        std::promise<content_result> promise;
        std::shared_future<content_result> future;
        {
            std::lock_guard<std::mutex> _(inflight_mutex_);
            if (auto it = inflight_.find(key); it != inflight_.end()) {
                future = it->second;
            } else {
                future = promise.get_future().share();
                inflight_.emplace(key, future);
                // this caller is the leader: run the request outside the lock
                future = {};
            }
        }
        if (future.valid()) {
            spdlog::trace("single_flight: waiting for request {}", key);
            auto result = future.get();
            // the leader belonged to a batch that was cancelled: this caller
            // was not, so it makes the request itself
            if (!result && result.error().kind == error_kind::cancelled &&
                !cancel.cancelled()) {
                continue;
            }
            return result;
        }

        content_result result = util::unexpected(
            error{error_kind::protocol, "the request produced no result"});
        try {
            result = f();
        } catch (std::exception& e) {
            result = util::unexpected(make_error(
                error_kind::protocol, "internal error: {}", e.what()));
        }
        promise.set_value(result);
        {
            std::lock_guard<std::mutex> _(inflight_mutex_);
            inflight_.erase(key);
        }
        return result;
    }
}

std::optional<std::vector<std::string>>
metadata_fetcher::cached_list(const cache_key& key) {
    if (!cache_) {
        return std::nullopt;
    }
    auto entry = cache_->get(key);
    if (!entry) {
        spdlog::warn("cache read {} failed: {}", key, entry.error());
        return std::nullopt;
    }
    if (!*entry) {
        return std::nullopt;
    }
    try {
        return json::parse((*entry)->payload).get<std::vector<std::string>>();
    } catch (json::exception& e) {
        spdlog::warn("cache entry {} is not a list: {}", key, e.what());
        if (auto r = cache_->invalidate(key); !r) {
            spdlog::warn("unable to invalidate {}: {}", key, r.error());
        }
        return std::nullopt;
    }
}

void metadata_fetcher::store_list(const cache_key& key,
                                  const std::vector<std::string>& list) {
    if (auto r = store({key, to_json(list), std::nullopt, {}}); !r) {
        spdlog::warn("cache write {} failed: {}", key, r.error());
    }
}

std::optional<metadata_fetcher::content>
metadata_fetcher::cached_content(const cache_key& key) {
    if (!cache_) {
        return std::nullopt;
    }
    auto entry = cache_->get(key);
    if (!entry) {
        spdlog::warn("cache read {} failed: {}", key, entry.error());
        return std::nullopt;
    }
    if (!*entry) {
        return std::nullopt;
    }
    return content{std::move((*entry)->payload),
                   std::move((*entry)->media_type), *key.digest};
}

util::expected<void, error> metadata_fetcher::store(const cache_entry& entry) {
    if (!cache_) {
        return {};
    }
    cache_entry e = entry;
    e.fetched_at = cache_->now();
    auto r = cache_->put(e);
    if (!r) {
        if (r.error().kind == error_kind::cache_integrity) {
            return r;
        }
        spdlog::warn("cache write {} failed: {}", entry.key, r.error());
    }
    return {};
}

util::expected<std::vector<std::string>, error>
metadata_fetcher::list_tags(const std::string& repository,
                            const cancel_token& cancel) {
    const auto key = cache_key::tag_list(registry_, repository);
    if (auto hit = cached_list(key)) {
        spdlog::debug("fetch: tag list of {} from cache", repository);
        return *hit;
    }
    auto tags = with_retry([&]() { return client_.tags(repository); },
                           fmt::format("tags of {}", repository), cancel);
    if (!tags) {
        return util::unexpected(tags.error());
    }
    store_list(key, *tags);
    return *tags;
}

util::expected<std::vector<std::string>, error>
metadata_fetcher::list_repositories(const cancel_token& cancel) {
    const auto key = cache_key::catalog(registry_);
    if (auto hit = cached_list(key)) {
        spdlog::debug("fetch: catalog from cache");
        return *hit;
    }
    auto repos =
        with_retry([&]() { return client_.catalog(); }, "catalog", cancel);
    if (!repos) {
        return util::unexpected(repos.error());
    }
    store_list(key, *repos);
    return *repos;
}

metadata_fetcher::content_result
metadata_fetcher::manifest_by_digest(const std::string& repository,
                                     const rex::digest& d,
                                     const cancel_token& cancel) {
    const auto key = cache_key::manifest(d);
    if (auto hit = cached_content(key)) {
        return *hit;
    }
    return single_flight(
        key.string(),
        [&]() -> content_result {
            auto response = with_retry(
                [&]() { return client_.manifest(repository, d.string()); },
                fmt::format("manifest {}@{}", repository, d), cancel);
            if (!response) {
                return util::unexpected(response.error());
            }
            if (!d.verify(response->body)) {
                return util::unexpected(make_error(
                    error_kind::validation,
                    "manifest {}@{} does not match its digest", repository, d));
            }
            if (auto r = store({key, response->body, d, {},
                                response->media_type});
                !r) {
                return util::unexpected(r.error());
            }
            return content{std::move(response->body),
                           std::move(response->media_type), d};
        },
        cancel);
}

metadata_fetcher::content_result
metadata_fetcher::manifest_by_tag(const std::string& repository,
                                  const std::string& tag,
                                  const cancel_token& cancel) {
    const auto digest_key = cache_key::tag_digest(registry_, repository, tag);
    if (auto hit = cached_list(digest_key); hit && hit->size() == 1) {
        if (auto d = rex::digest::parse(hit->front())) {
            return manifest_by_digest(repository, *d, cancel);
        }
        spdlog::warn("cache entry {} holds an invalid digest", digest_key);
    }

    return single_flight(
        fmt::format("tag:{}/{}:{}", registry_, repository, tag),
        [&]() -> content_result {
            auto response = with_retry(
                [&]() { return client_.manifest(repository, tag); },
                fmt::format("manifest {}:{}", repository, tag), cancel);
            if (!response) {
                return util::unexpected(response.error());
            }

            // the digest reported by the registry must be valid and match
            // the payload
            auto computed = rex::digest::compute(response->body);
            if (!computed) {
                return util::unexpected(computed.error());
            }
            auto d = *computed;
            if (response->digest) {
                auto reported = rex::digest::parse(*response->digest);
                if (!reported) {
                    return util::unexpected(make_error(
                        error_kind::validation,
                        "manifest {}:{} has an invalid digest header: {}",
                        repository, tag, reported.error().message()));
                }
                if (!reported->verify(response->body)) {
                    return util::unexpected(make_error(
                        error_kind::validation,
                        "manifest {}:{} does not match its digest {}",
                        repository, tag, *reported));
                }
                d = *reported;
            }

            if (auto r = store({cache_key::manifest(d), response->body, d, {},
                                response->media_type});
                !r) {
                return util::unexpected(r.error());
            }
            store_list(digest_key, {d.string()});
            return content{std::move(response->body),
                           std::move(response->media_type), d};
        },
        cancel);
}

metadata_fetcher::content_result
metadata_fetcher::config_blob(const std::string& repository,
                              const rex::digest& d,
                              const cancel_token& cancel) {
    const auto key = cache_key::config(d);
    if (auto hit = cached_content(key)) {
        return *hit;
    }
    return single_flight(
        key.string(),
        [&]() -> content_result {
            auto blob =
                with_retry([&]() { return client_.blob(repository, d); },
                           fmt::format("blob {}@{}", repository, d), cancel);
            if (!blob) {
                return util::unexpected(blob.error());
            }
            const auto type = std::string(media_type::oci_config);
            if (auto r = store({key, *blob, d, {}, type}); !r) {
                return util::unexpected(r.error());
            }
            return content{std::move(*blob), type, d};
        },
        cancel);
}

std::optional<timestamp>
metadata_fetcher::index_created(const std::string& repository,
                                const image_index& index,
                                const cancel_token& cancel) {
    // the date of an index is the date of the child for the configured
    // platform, or of the first child that is not an attestation
    std::optional<descriptor> child;
    if (settings_.platform) {
        if (auto c = select_platform(index, *settings_.platform)) {
            child = *c;
        }
    } else {
        for (auto& m : index.manifests) {
            if (m.platform && m.platform->os != "unknown") {
                child = m;
                break;
            }
        }
    }
    if (!child) {
        return std::nullopt;
    }

    auto m = manifest_by_digest(repository, child->digest, cancel);
    if (!m) {
        spdlog::warn("fetch: child manifest {} of {}: {}", child->digest,
                     repository, m.error());
        return std::nullopt;
    }
    auto doc = parse_manifest(m->body, m->media_type);
    if (!doc || !std::holds_alternative<image_manifest>(*doc)) {
        return std::nullopt;
    }
    auto blob = config_blob(
        repository, std::get<image_manifest>(*doc).config.digest, cancel);
    if (!blob) {
        spdlog::warn("fetch: config of {}@{}: {}", repository, child->digest,
                     blob.error());
        return std::nullopt;
    }
    if (auto config = parse_image_config(blob->body)) {
        return config->created;
    }
    return std::nullopt;
}

util::expected<tag_info, error>
metadata_fetcher::resolve_tag(const std::string& repository,
                              const std::string& tag,
                              const cancel_token& cancel) {
    auto m = manifest_by_tag(repository, tag, cancel);
    if (!m) {
        return util::unexpected(m.error());
    }
    auto doc = parse_manifest(m->body, m->media_type);
    if (!doc) {
        return util::unexpected(doc.error());
    }

    tag_info info{.name = tag,
                  .digest = m->digest,
                  .size = std::nullopt,
                  .last_modified = std::nullopt,
                  .platforms = {}};
    if (auto idx = std::get_if<image_index>(&*doc)) {
        info.size = idx->size();
        for (auto& p : idx->platforms()) {
            info.platforms.push_back(p.string());
        }
        info.last_modified = index_created(repository, *idx, cancel);
        return info;
    }

    auto& image = std::get<image_manifest>(*doc);
    info.size = image.size();
    auto blob = config_blob(repository, image.config.digest, cancel);
    if (!blob) {
        return util::unexpected(blob.error());
    }
    auto config = parse_image_config(blob->body);
    if (!config) {
        return util::unexpected(config.error());
    }
    info.last_modified = config->created;
    info.platforms.push_back(config->platform().string());
    return info;
}

util::expected<fetch_result<tag_info>, error>
metadata_fetcher::fetch_tags(const std::string& repository,
                             const cancel_token& cancel) {
    const auto repo = qualify(repository);
    auto tags = list_tags(repo, cancel);
    if (!tags) {
        return util::unexpected(tags.error());
    }
    spdlog::info("fetch: {} tags in {}", tags->size(), repo);

    const auto& names = *tags;
    auto outcomes = parallel_map<tag_info>(
        names.size(), settings_.concurrency,
        [&](std::size_t i) { return resolve_tag(repo, names[i], cancel); },
        cancel, [&repo](std::size_t) { return repo; });

    return aggregate(std::move(outcomes), names, cancel);
}

util::expected<fetch_result<repository_item>, error>
metadata_fetcher::fetch_repositories(const progress_fn& progress,
                                     const cancel_token& cancel) {
    auto repos = list_repositories(cancel);
    if (!repos) {
        return util::unexpected(repos.error());
    }
    spdlog::info("fetch: {} repositories in {}", repos->size(), registry_);

    const auto& names = *repos;
    auto task = [&](std::size_t i) -> util::expected<repository_item, error> {
        const auto& name = names[i];
        auto tags = list_tags(name, cancel);
        if (!tags) {
            return util::unexpected(tags.error());
        }
        repository_item item{.name = name,
                             .tag_count = tags->size(),
                             .size = std::nullopt,
                             .last_updated = std::nullopt};
        if (tags->empty()) {
            return item;
        }
        // the size and date of a repository are those of its last tag
        auto info = resolve_tag(name, tags->back(), cancel);
        if (!info) {
            return util::unexpected(info.error());
        }
        item.size = info->size;
        item.last_updated = info->last_modified;
        return item;
    };
    auto outcomes = parallel_map<repository_item>(
        names.size(), settings_.concurrency, task, cancel,
        [&names](std::size_t i) { return names[i]; }, progress);

    return aggregate(std::move(outcomes), names, cancel);
}

util::expected<std::vector<std::string>, error>
metadata_fetcher::fetch_catalog(const cancel_token& cancel) {
    return list_repositories(cancel);
}

util::expected<fetch_result<repository_tags>, error>
metadata_fetcher::fetch_tag_lists(const std::vector<std::string>& repositories,
                                  const progress_fn& progress,
                                  const cancel_token& cancel) {
    auto task = [&](std::size_t i) -> util::expected<repository_tags, error> {
        auto tags = list_tags(repositories[i], cancel);
        if (!tags) {
            return util::unexpected(tags.error());
        }
        return repository_tags{repositories[i], std::move(*tags)};
    };
    auto outcomes = parallel_map<repository_tags>(
        repositories.size(), settings_.concurrency, task, cancel,
        [&repositories](std::size_t i) { return repositories[i]; }, progress);

    return aggregate(std::move(outcomes), repositories, cancel);
}

util::expected<fetched_manifest, error>
metadata_fetcher::fetch_manifest(const reference& ref,
                                 const std::optional<rex::platform>& platform,
                                 const cancel_token& cancel) {
    if (ref.has_registry()) {
        spdlog::info("fetch: {} names registry {}, using {}", ref,
                     ref.registry(), registry_);
    }
    const auto repo = qualify(ref.repository());

    auto m = ref.digest()
                 ? manifest_by_digest(repo, *ref.digest(), cancel)
                 : manifest_by_tag(repo, ref.tag().value_or("latest"), cancel);
    if (!m) {
        return util::unexpected(m.error());
    }
    auto doc = parse_manifest(m->body, m->media_type);
    if (!doc) {
        return util::unexpected(doc.error());
    }

    // the type declared by the document itself, for registries that do not
    // report a content type
    auto type_of = [](const manifest_document& d, const std::string& reported) {
        if (!reported.empty()) {
            return reported;
        }
        return std::visit([](auto& x) { return x.media_type; }, d);
    };

    const auto selector = platform ? platform : settings_.platform;
    auto idx = std::get_if<image_index>(&*doc);
    if (!idx || !selector) {
        auto type = type_of(*doc, m->media_type);
        return fetched_manifest{.digest = m->digest,
                                .media_type = std::move(type),
                                .document = std::move(*doc),
                                .index = std::nullopt};
    }

    auto child = select_platform(*idx, *selector);
    if (!child) {
        return util::unexpected(child.error());
    }
    spdlog::debug("fetch: {} resolved to {} for {}", ref, child->digest,
                  *selector);
    auto cm = manifest_by_digest(repo, child->digest, cancel);
    if (!cm) {
        return util::unexpected(cm.error());
    }
    auto child_doc = parse_manifest(
        cm->body, child->media_type.empty() ? cm->media_type : child->media_type);
    if (!child_doc) {
        return util::unexpected(child_doc.error());
    }
    auto type = type_of(*child_doc, child->media_type.empty()
                                        ? cm->media_type
                                        : child->media_type);
    return fetched_manifest{.digest = cm->digest,
                            .media_type = std::move(type),
                            .document = std::move(*child_doc),
                            .index = m->digest};
}

util::expected<std::string, error>
metadata_fetcher::fetch_config(const std::string& repository,
                               const rex::digest& d,
                               const cancel_token& cancel) {
    auto blob = config_blob(qualify(repository), d, cancel);
    if (!blob) {
        return util::unexpected(blob.error());
    }
    return std::move(blob->body);
}

util::expected<sync_stats, error>
metadata_fetcher::sync(const sync_options& options, const cancel_token& cancel) {
    auto repos = list_repositories(cancel);
    if (!repos) {
        return util::unexpected(repos.error());
    }
    spdlog::info("sync: {} repositories in {}", repos->size(), registry_);

    sync_stats stats;
    stats.repositories = repos->size();

    auto lists = fetch_tag_lists(*repos, options.tag_progress, cancel);
    if (!lists) {
        return util::unexpected(lists.error());
    }
    stats.failures = std::move(lists->failures);
    stats.cancelled = lists->cancelled;
    for (auto& r : lists->items) {
        stats.tags += r.tags.size();
    }
    if (!options.manifests || stats.cancelled) {
        return stats;
    }

    // one task per tag, across every repository
    std::vector<std::pair<std::string, std::string>> tags;
    std::vector<std::string> names;
    for (auto& r : lists->items) {
        for (auto& t : r.tags) {
            tags.emplace_back(r.name, t);
            names.push_back(fmt::format("{}:{}", r.name, t));
        }
    }
    auto outcomes = parallel_map<tag_info>(
        tags.size(), settings_.concurrency,
        [&](std::size_t i) {
            return resolve_tag(tags[i].first, tags[i].second, cancel);
        },
        cancel, [&tags](std::size_t i) { return tags[i].first; },
        options.manifest_progress);

    auto resolved = aggregate(std::move(outcomes), names, cancel);
    stats.manifests = resolved.items.size();
    stats.cancelled = resolved.cancelled;
    for (auto& f : resolved.failures) {
        stats.failures.push_back(std::move(f));
    }
    return stats;
}

registry_status metadata_fetcher::check() const {
    registry_status status{.url = registry_,
                           .online = false,
                           .auth_required = false,
                           .authenticated = settings_.credentials.has_value(),
                           .api_version = std::nullopt,
                           .error = std::nullopt};
    auto version = client_.ping();
    if (version) {
        status.online = true;
        if (!version->empty()) {
            status.api_version = *version;
        }
        return status;
    }
    spdlog::debug("check: {} failed: {}", registry_, version.error());
    status.auth_required = version.error().kind == error_kind::unauthorized;
    status.online = status.auth_required;
    status.error = version.error();
    return status;
}

} // namespace rex
