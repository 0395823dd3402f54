#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <util/expected.h>
#include <util/hash.h>

namespace util {

namespace {
struct evp_md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, evp_md_ctx_deleter>;
} // namespace

util::expected<std::string, std::string> hex_hash(std::string_view payload,
                                                  hash_algorithm algorithm) {
    const EVP_MD* md =
        algorithm == hash_algorithm::sha256 ? EVP_sha256() : EVP_sha512();

    evp_md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return util::unexpected("unable to allocate an openssl digest context");
    }
    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        return util::unexpected("unable to initialise openssl digest");
    }
    if (EVP_DigestUpdate(ctx.get(), payload.data(), payload.size()) != 1) {
        return util::unexpected("unable to update openssl digest");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return util::unexpected("unable to finalise openssl digest");
    }

    std::string result;
    result.reserve(2 * hash_len);
    for (unsigned i = 0; i < hash_len; ++i) {
        result += fmt::format("{:02x}", hash[i]);
    }
    spdlog::trace("hex_hash: {} bytes -> {}", payload.size(), result);

    return result;
}

} // namespace util
