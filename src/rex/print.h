#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <util/expected.h>

#include <rex/cache.h>
#include <rex/fetcher.h>
#include <rex/manifest.h>
#include <rex/oci.h>
#include <rex/search.h>

namespace rex {

enum class output_format { table, table_no_header, json };

// a helper for determining the output format based on CLI flags:
// --no-header and --json
util::expected<output_format, std::string> get_output_format(bool no_header,
                                                             bool json);

// a byte count in binary units, e.g. "512 B", "5 KiB", "1.5 MiB"
std::string format_size(std::uint64_t bytes);

// a time relative to now, e.g. "just now", "a day ago", "3 hours ago"
std::string format_relative_time(timestamp t, timestamp now);

// an RFC 3339 UTC time, e.g. "2024-01-15T10:30:00Z"
std::string format_timestamp(timestamp t);

std::string format_tags_table(const std::vector<tag_info>& tags, timestamp now,
                              bool no_header = false);
std::string format_tags_json(const std::vector<tag_info>& tags);

std::string format_repositories_table(
    const std::vector<repository_item>& repositories, timestamp now,
    bool no_header = false);
std::string
format_repositories_json(const std::vector<repository_item>& repositories);

// the manifest, and the config of an image manifest if available
std::string format_manifest(const fetched_manifest& manifest,
                            const std::optional<image_config>& config,
                            timestamp now);
std::string format_manifest_json(const fetched_manifest& manifest,
                                 const std::optional<image_config>& config);

// one line per failure
std::string format_failures(const std::vector<fetch_failure>& failures);

std::string format_cache_stats(const cache_stats& stats);

// the results of a search: matching repositories, and matching image
// references of the form repository:tag
std::string format_search(const std::vector<search_result>& repositories,
                          const std::vector<search_result>& images);
std::string format_search_json(std::string_view query,
                               const std::vector<search_result>& repositories,
                               const std::vector<search_result>& images);

std::string format_registry_status(const registry_status& status);
std::string format_registry_status_json(const registry_status& status);

std::string format_sync_stats(const sync_stats& stats);
std::string format_sync_stats_json(const sync_stats& stats,
                                   const cache_stats& cache);

} // namespace rex
