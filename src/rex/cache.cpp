#include <chrono>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <fmt/core.h>
#include <fmt/std.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <util/expected.h>
#include <util/fs.h>
#include <util/strings.h>

#include <rex/cache.h>
#include <rex/error.h>
#include <rex/parse.h>

namespace rex {

namespace fs = std::filesystem;
using json = nlohmann::json;

// the version of the on disk entry format
constexpr int cache_format = 1;

bool is_content(entry_kind kind) {
    return kind == entry_kind::manifest || kind == entry_kind::config;
}

cache_key cache_key::catalog(std::string registry) {
    return {.kind = entry_kind::catalog,
            .registry = std::move(registry),
            .repository = {},
            .name = {},
            .digest = std::nullopt};
}

cache_key cache_key::tag_list(std::string registry, std::string repository) {
    return {.kind = entry_kind::tag_list,
            .registry = std::move(registry),
            .repository = std::move(repository),
            .name = {},
            .digest = std::nullopt};
}

cache_key cache_key::tag_digest(std::string registry, std::string repository,
                                std::string tag) {
    return {.kind = entry_kind::tag_digest,
            .registry = std::move(registry),
            .repository = std::move(repository),
            .name = std::move(tag),
            .digest = std::nullopt};
}

cache_key cache_key::manifest(rex::digest digest) {
    return {.kind = entry_kind::manifest,
            .registry = {},
            .repository = {},
            .name = {},
            .digest = std::move(digest)};
}

cache_key cache_key::config(rex::digest digest) {
    return {.kind = entry_kind::config,
            .registry = {},
            .repository = {},
            .name = {},
            .digest = std::move(digest)};
}

std::string cache_key::string() const {
    switch (kind) {
    case entry_kind::catalog:
        return fmt::format("{}:{}", kind, registry);
    case entry_kind::tag_list:
        return fmt::format("{}:{}/{}", kind, registry, repository);
    case entry_kind::tag_digest:
        return fmt::format("{}:{}/{}:{}", kind, registry, repository, name);
    case entry_kind::manifest:
    case entry_kind::config:
        return fmt::format("{}:{}", kind,
                           digest ? digest->string() : std::string("none"));
    }
    return "unknown";
}

std::chrono::seconds cache_policy::ttl(entry_kind kind) const {
    switch (kind) {
    case entry_kind::catalog:
        return catalog_ttl;
    case entry_kind::tag_list:
        return tag_list_ttl;
    case entry_kind::tag_digest:
        return tag_digest_ttl;
    case entry_kind::manifest:
    case entry_kind::config:
        break;
    }
    // content never expires
    return std::chrono::hours{24 * 365 * 100};
}

// content entries that were read or written recently.
// entries are evicted in insertion order once the capacity is reached.
struct cache_store::memory_cache {
    std::mutex mutex;
    std::unordered_map<std::string, cache_entry> entries;
    std::deque<std::string> order;
    std::size_t capacity;

    explicit memory_cache(std::size_t capacity) : capacity(capacity) {
    }

    std::optional<cache_entry> get(const std::string& key) {
        std::lock_guard<std::mutex> _(mutex);
        if (auto it = entries.find(key); it != entries.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    void insert(const cache_entry& entry) {
        if (capacity == 0) {
            return;
        }
        std::lock_guard<std::mutex> _(mutex);
        const auto key = entry.key.string();
        if (entries.contains(key)) {
            return;
        }
        while (entries.size() >= capacity && !order.empty()) {
            entries.erase(order.front());
            order.pop_front();
        }
        entries.emplace(key, entry);
        order.push_back(key);
    }

    void erase(const std::string& key) {
        std::lock_guard<std::mutex> _(mutex);
        if (entries.erase(key)) {
            std::erase(order, key);
        }
    }

    void clear() {
        std::lock_guard<std::mutex> _(mutex);
        entries.clear();
        order.clear();
    }

    std::size_t size() {
        std::lock_guard<std::mutex> _(mutex);
        return entries.size();
    }
};

namespace {

std::int64_t to_millis(timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               t.time_since_epoch())
        .count();
}

timestamp from_millis(std::int64_t ms) {
    return timestamp{std::chrono::duration_cast<timestamp::duration>(
        std::chrono::milliseconds{ms})};
}

bool is_temporary(const fs::path& p) {
    return p.filename().string().starts_with(".tmp-");
}

// an entry is stored as a single line JSON header, followed by the payload
std::string encode(const cache_entry& entry) {
    json header{
        {"format", cache_format},
        {"key", entry.key.string()},
        {"kind", fmt::format("{}", entry.key.kind)},
        {"fetched_at", to_millis(entry.fetched_at)},
        {"size", entry.payload.size()},
    };
    if (!entry.media_type.empty()) {
        header["media_type"] = entry.media_type;
    }
    if (entry.digest) {
        header["digest"] = entry.digest->string();
    } else {
        header["digest"] = nullptr;
    }
    return header.dump() + "\n" + entry.payload;
}

util::expected<cache_entry, error> decode(const std::string& raw,
                                          const cache_key& key) {
    const auto eol = raw.find('\n');
    if (eol == std::string::npos) {
        return util::unexpected(
            error{error_kind::cache_corrupt, "missing entry header"});
    }
    try {
        const auto header = json::parse(raw.substr(0, eol));
        if (header.at("format").get<int>() != cache_format) {
            return util::unexpected(make_error(
                error_kind::cache_corrupt, "unsupported entry format {}",
                header.at("format").dump()));
        }
        if (header.at("key").get<std::string>() != key.string()) {
            return util::unexpected(make_error(
                error_kind::cache_corrupt, "entry key {} does not match {}",
                header.at("key").get<std::string>(), key.string()));
        }
        cache_entry entry{
            .key = key,
            .payload = raw.substr(eol + 1),
            .digest = std::nullopt,
            .fetched_at = from_millis(header.at("fetched_at").get<std::int64_t>()),
        };
        if (header.at("size").get<std::size_t>() != entry.payload.size()) {
            return util::unexpected(make_error(
                error_kind::cache_corrupt,
                "entry is truncated: expected {} bytes, found {}",
                header.at("size").get<std::size_t>(), entry.payload.size()));
        }
        if (auto& d = header.at("digest"); d.is_string()) {
            auto parsed = parse_digest(d.get<std::string>());
            if (!parsed) {
                return util::unexpected(make_error(error_kind::cache_corrupt,
                                                   "invalid entry digest: {}",
                                                   parsed.error().message()));
            }
            entry.digest = *parsed;
        }
        // entries written before the content type was recorded have none
        if (auto it = header.find("media_type");
            it != header.end() && it->is_string()) {
            entry.media_type = it->get<std::string>();
        }
        return entry;
    } catch (json::exception& e) {
        return util::unexpected(make_error(
            error_kind::cache_corrupt, "invalid entry header: {}", e.what()));
    }
}

error io_error(const fs::path& p, const std::string& what) {
    return make_error(error_kind::cache_io, "{}: {}", p, what);
}

// the reason that the content file p can not be used, if any.
// p is content/<algorithm>/<hex>, and raw is the contents of the file.
std::optional<error> verify_content(const fs::path& p, const std::string& raw) {
    auto d = parse_digest(fmt::format("{}:{}", p.parent_path().filename().string(),
                                      p.filename().string()));
    if (!d) {
        return make_error(error_kind::cache_corrupt,
                          "the file name is not a digest: {}",
                          d.error().message());
    }

    // the kind is needed to rebuild the key that the header must match
    std::string kind;
    try {
        kind = json::parse(raw.substr(0, raw.find('\n')))
                   .at("kind")
                   .get<std::string>();
    } catch (json::exception& e) {
        return make_error(error_kind::cache_corrupt, "invalid entry header: {}",
                          e.what());
    }
    std::optional<cache_key> key;
    if (kind == "manifest") {
        key = cache_key::manifest(*d);
    } else if (kind == "config") {
        key = cache_key::config(*d);
    } else {
        return make_error(error_kind::cache_corrupt,
                          "unexpected entry kind '{}'", kind);
    }

    auto entry = decode(raw, *key);
    if (!entry) {
        return entry.error();
    }
    if (entry->digest != *d || !d->verify(entry->payload)) {
        return make_error(error_kind::cache_corrupt,
                          "content does not match its digest");
    }
    return std::nullopt;
}

} // namespace

cache_store::cache_store(fs::path root, cache_policy policy, clock_fn clock)
    : root_(std::move(root)), policy_(policy), clock_(std::move(clock)),
      memory_(std::make_unique<memory_cache>(policy.memory_entries)) {
    if (!clock_) {
        clock_ = []() { return std::chrono::system_clock::now(); };
    }
}

cache_store::cache_store(cache_store&&) = default;
cache_store& cache_store::operator=(cache_store&&) = default;
cache_store::~cache_store() = default;

util::expected<cache_store, error>
cache_store::open(const fs::path& root, cache_policy policy, clock_fn clock) {
    std::error_code ec;
    for (auto sub : {"content", "listing"}) {
        fs::create_directories(root / sub, ec);
        if (ec) {
            return util::unexpected(io_error(
                root / sub, fmt::format("unable to create cache directory: {}",
                                        ec.message())));
        }
    }
    if (util::file_access_level(root) != util::file_level::readwrite) {
        return util::unexpected(io_error(root, "cache is not writable"));
    }
    spdlog::debug("cache_store::open {}", root);
    return cache_store(root, policy, std::move(clock));
}

fs::path cache_store::path(const cache_key& key) const {
    if (is_content(key.kind) && key.digest) {
        return root_ / "content" / key.digest->algorithm() / key.digest->hex();
    }
    return root_ / "listing" / util::percent_encode(key.string());
}

util::expected<std::optional<cache_entry>, error>
cache_store::get(const cache_key& key) const {
    if (is_content(key.kind) && !key.digest) {
        return util::unexpected(make_error(error_kind::validation,
                                           "content key {} has no digest",
                                           key.string()));
    }
    const auto key_string = key.string();

    if (is_content(key.kind)) {
        if (auto hit = memory_->get(key_string)) {
            spdlog::trace("cache_store::get {} memory hit", key_string);
            return hit;
        }
    }

    const auto p = path(key);
    std::error_code ec;
    if (!fs::exists(p, ec)) {
        if (ec) {
            return util::unexpected(io_error(p, ec.message()));
        }
        spdlog::trace("cache_store::get {} miss", key_string);
        return std::nullopt;
    }

    auto raw = util::read_file(p);
    if (!raw) {
        return util::unexpected(io_error(p, raw.error()));
    }

    auto evict = [&p](error e) -> util::expected<std::optional<cache_entry>, error> {
        spdlog::warn("cache_store: removing corrupt entry {}: {}", p,
                     e.message);
        std::error_code ec;
        fs::remove(p, ec);
        return util::unexpected(std::move(e));
    };

    auto entry = decode(*raw, key);
    if (!entry) {
        return evict(std::move(entry.error()));
    }

    if (is_content(key.kind)) {
        if (!entry->digest || *entry->digest != *key.digest ||
            !key.digest->verify(entry->payload)) {
            return evict(make_error(error_kind::cache_corrupt,
                                    "content of {} does not match its digest",
                                    key_string));
        }
        memory_->insert(*entry);
        spdlog::trace("cache_store::get {} disk hit", key_string);
        return std::optional<cache_entry>(std::move(*entry));
    }

    const auto age = now() - entry->fetched_at;
    if (age > policy_.ttl(key.kind)) {
        spdlog::debug("cache_store::get {} expired ({}s old)", key_string,
                      std::chrono::duration_cast<std::chrono::seconds>(age)
                          .count());
        return std::nullopt;
    }

    spdlog::trace("cache_store::get {} hit", key_string);
    return std::optional<cache_entry>(std::move(*entry));
}

util::expected<void, error> cache_store::put(const cache_entry& entry) {
    const auto& key = entry.key;
    const auto key_string = key.string();

    if (is_content(key.kind)) {
        if (!key.digest || !entry.digest || *entry.digest != *key.digest) {
            return util::unexpected(make_error(
                error_kind::cache_integrity,
                "content entry {} must carry the digest of its key",
                key_string));
        }
        if (!entry.digest->verify(entry.payload)) {
            return util::unexpected(make_error(
                error_kind::cache_integrity,
                "payload of {} does not match its digest", key_string));
        }
    }

    const auto p = path(key);
    std::error_code ec;

    // content is immutable: the first writer wins
    if (is_content(key.kind) && fs::exists(p, ec)) {
        spdlog::trace("cache_store::put {} already present", key_string);
        memory_->insert(entry);
        return {};
    }

    fs::create_directories(p.parent_path(), ec);
    if (ec) {
        return util::unexpected(io_error(p.parent_path(), ec.message()));
    }
    if (auto r = util::write_file_atomic(p, encode(entry)); !r) {
        return util::unexpected(io_error(p, r.error()));
    }

    if (is_content(key.kind)) {
        memory_->insert(entry);
    }
    spdlog::debug("cache_store::put {} ({} bytes)", key_string,
                  entry.payload.size());
    return {};
}

util::expected<void, error> cache_store::invalidate(const cache_key& key) {
    memory_->erase(key.string());
    const auto p = path(key);
    std::error_code ec;
    fs::remove(p, ec);
    if (ec) {
        return util::unexpected(io_error(p, ec.message()));
    }
    spdlog::debug("cache_store::invalidate {}", key.string());
    return {};
}

util::expected<cache_stats, error> cache_store::stats() const {
    cache_stats result;
    result.memory_entries = memory_->size();

    std::error_code ec;
    for (auto sub : {"content", "listing"}) {
        const auto dir = root_ / sub;
        if (!fs::is_directory(dir, ec)) {
            continue;
        }
        for (auto it = fs::recursive_directory_iterator(dir, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (!it->is_regular_file(ec) || is_temporary(it->path())) {
                continue;
            }
            auto size = it->file_size(ec);
            if (ec) {
                break;
            }
            result.bytes += size;
            if (std::string_view(sub) == "content") {
                ++result.content_entries;
            } else {
                ++result.listing_entries;
            }
        }
        if (ec) {
            return util::unexpected(io_error(dir, ec.message()));
        }
    }
    return result;
}

util::expected<std::size_t, error> cache_store::prune() {
    using namespace std::chrono_literals;

    std::size_t removed = 0;
    std::error_code ec;

    auto remove = [&removed](const fs::path& p, std::string_view why) {
        spdlog::info("cache_store::prune removing {}: {}", p, why);
        std::error_code ec;
        if (fs::remove(p, ec)) {
            ++removed;
        }
    };

    std::vector<fs::path> files;
    for (auto it = fs::recursive_directory_iterator(root_, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return util::unexpected(io_error(root_, ec.message()));
    }

    for (auto& p : files) {
        // temporary files left behind by interrupted writes
        if (is_temporary(p)) {
            auto age = fs::file_time_type::clock::now() -
                       fs::last_write_time(p, ec);
            if (!ec && age > 1h) {
                remove(p, "stale temporary file");
            }
            continue;
        }

        auto raw = util::read_file(p);
        if (!raw) {
            remove(p, raw.error());
            continue;
        }

        // content is decoded in full and checked against the digest that
        // its path names
        if (p.parent_path().parent_path() == root_ / "content") {
            if (auto e = verify_content(p, *raw)) {
                remove(p, e->message);
            }
            continue;
        }

        const auto eol = raw->find('\n');
        try {
            const auto header = json::parse(raw->substr(0, eol));
            const auto kind = header.at("kind").get<std::string>();
            const auto fetched_at =
                from_millis(header.at("fetched_at").get<std::int64_t>());
            const auto age = now() - fetched_at;
            if ((kind == "catalog" && age > policy_.catalog_ttl) ||
                (kind == "tag-list" && age > policy_.tag_list_ttl) ||
                (kind == "tag-digest" && age > policy_.tag_digest_ttl)) {
                remove(p, "expired");
            }
        } catch (json::exception& e) {
            remove(p, e.what());
        }
    }

    memory_->clear();
    return removed;
}

util::expected<void, error> cache_store::clear() {
    memory_->clear();
    std::error_code ec;
    for (auto sub : {"content", "listing"}) {
        fs::remove_all(root_ / sub, ec);
        if (ec) {
            return util::unexpected(io_error(root_ / sub, ec.message()));
        }
        fs::create_directories(root_ / sub, ec);
        if (ec) {
            return util::unexpected(io_error(root_ / sub, ec.message()));
        }
    }
    spdlog::info("cache_store::clear removed all entries from {}", root_);
    return {};
}

} // namespace rex
