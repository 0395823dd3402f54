#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <util/expected.h>

#include <rex/digest.h>
#include <rex/error.h>
#include <rex/oci.h>

namespace rex {

// manifests and configs are content addressed: they are immutable and keyed
// by their digest.
// catalogs, tag lists and tag digests are listings: they are keyed by
// registry and repository, and expire.
enum class entry_kind { catalog, tag_list, tag_digest, manifest, config };

bool is_content(entry_kind kind);

struct cache_key {
    entry_kind kind;
    // listing entries
    std::string registry;
    std::string repository;
    std::string name;
    // content entries
    std::optional<rex::digest> digest;

    static cache_key catalog(std::string registry);
    static cache_key tag_list(std::string registry, std::string repository);
    // the digest of the manifest that a tag referred to when it was listed
    static cache_key tag_digest(std::string registry, std::string repository,
                                std::string tag);
    static cache_key manifest(rex::digest digest);
    static cache_key config(rex::digest digest);

    // a unique string representation of the key
    std::string string() const;

    bool operator==(const cache_key&) const = default;
};

struct cache_entry {
    cache_key key;
    std::string payload;
    std::optional<rex::digest> digest;
    timestamp fetched_at;
    // the content type that the registry reported for the payload
    std::string media_type = {};
};

struct cache_policy {
    std::chrono::seconds catalog_ttl{3600};
    std::chrono::seconds tag_list_ttl{1800};
    std::chrono::seconds tag_digest_ttl{1800};
    // the number of content entries held in memory
    std::size_t memory_entries = 1000;

    // the staleness threshold of listing entries of kind
    std::chrono::seconds ttl(entry_kind kind) const;
};

struct cache_stats {
    std::size_t content_entries = 0;
    std::size_t listing_entries = 0;
    std::uint64_t bytes = 0;
    std::size_t memory_entries = 0;
};

using clock_fn = std::function<timestamp()>;

class cache_store {
  public:
    // open the cache rooted at root, creating it if required.
    // clock is used to timestamp and expire listing entries: it defaults to
    // the system clock.
    static util::expected<cache_store, error>
    open(const std::filesystem::path& root, cache_policy policy = {},
         clock_fn clock = {});

    cache_store(cache_store&&);
    cache_store& operator=(cache_store&&);
    ~cache_store();

    // returns nullopt on a miss or an expired listing entry.
    // entries that can not be decoded are removed and reported as
    // cache_corrupt.
    util::expected<std::optional<cache_entry>, error>
    get(const cache_key& key) const;

    // content entries are verified against their digest before they are
    // stored, and writing an entry that is already present is a no-op.
    util::expected<void, error> put(const cache_entry& entry);

    util::expected<void, error> invalidate(const cache_key& key);

    util::expected<cache_stats, error> stats() const;

    // remove expired listing entries and entries that can not be decoded.
    // returns the number of files that were removed.
    util::expected<std::size_t, error> prune();

    util::expected<void, error> clear();

    const std::filesystem::path& root() const {
        return root_;
    }

    const cache_policy& policy() const {
        return policy_;
    }

    timestamp now() const {
        return clock_();
    }

  private:
    struct memory_cache;

    cache_store(std::filesystem::path root, cache_policy policy,
                clock_fn clock);

    std::filesystem::path path(const cache_key& key) const;

    std::filesystem::path root_;
    cache_policy policy_;
    clock_fn clock_;
    std::unique_ptr<memory_cache> memory_;
};

} // namespace rex

#include <fmt/core.h>

template <> class fmt::formatter<rex::entry_kind> {
  public:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    template <typename FmtContext>
    constexpr auto format(rex::entry_kind k, FmtContext& ctx) const {
        using enum rex::entry_kind;
        switch (k) {
        case catalog:
            return fmt::format_to(ctx.out(), "catalog");
        case tag_list:
            return fmt::format_to(ctx.out(), "tag-list");
        case tag_digest:
            return fmt::format_to(ctx.out(), "tag-digest");
        case manifest:
            return fmt::format_to(ctx.out(), "manifest");
        case config:
            return fmt::format_to(ctx.out(), "config");
        }
        return fmt::format_to(ctx.out(), "unknown");
    }
};

template <> class fmt::formatter<rex::cache_key> {
  public:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    template <typename FmtContext>
    constexpr auto format(rex::cache_key const& k, FmtContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", k.string());
    }
};
