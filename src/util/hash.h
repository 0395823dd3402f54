#pragma once

#include <string>
#include <string_view>

#include <util/expected.h>

namespace util {

enum class hash_algorithm { sha256, sha512 };

// return the lowercase hex encoded hash of payload
util::expected<std::string, std::string> hex_hash(std::string_view payload,
                                                  hash_algorithm algorithm);

} // namespace util
