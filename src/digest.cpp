#include <libfwpkg/digest.hpp>

#include <boost/algorithm/hex.hpp>

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include <iterator>
#include <memory>
#include <stdexcept>
#include <utility>

namespace fwpkg {

namespace {

using MdContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using Mac = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using MacContext = std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;

} // <anonymous>

Digest Sha1DigestProvider::compute (const std::vector<boost::asio::const_buffer>& pieces) const {
    auto ctx = MdContext{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1) {
        throw DigestError{"SHA-1 initialization failed"};
    }
    for (auto&& piece : pieces) {
        if (EVP_DigestUpdate(ctx.get(), piece.data(), piece.size()) != 1) {
            throw DigestError{"SHA-1 update failed"};
        }
    }
    auto digest = Digest{};
    auto n = 0u;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &n) != 1 || n != digest.size()) {
        throw DigestError{"SHA-1 finalization failed"};
    }
    return digest;
}

HmacSha1DigestProvider::HmacSha1DigestProvider (DigestKey key)
    : mKey(std::move(key))
{
    if (mKey.empty()) {
        throw std::invalid_argument{"HMAC-SHA1 requires a non-empty key"};
    }
}

Digest HmacSha1DigestProvider::compute (const std::vector<boost::asio::const_buffer>& pieces) const {
    auto mac = Mac{EVP_MAC_fetch(nullptr, OSSL_MAC_NAME_HMAC, nullptr), &EVP_MAC_free};
    if (!mac) {
        throw DigestError{"HMAC is unavailable"};
    }
    auto ctx = MacContext{EVP_MAC_CTX_new(mac.get()), &EVP_MAC_CTX_free};

    char sha1 [] = "SHA1";
    OSSL_PARAM params [] = {
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, sha1, 0),
        OSSL_PARAM_construct_end()
    };
    if (!ctx || EVP_MAC_init(ctx.get(), mKey.data(), mKey.size(), params) != 1) {
        throw DigestError{"HMAC-SHA1 initialization failed"};
    }
    for (auto&& piece : pieces) {
        if (EVP_MAC_update(ctx.get(),
                static_cast<const unsigned char*>(piece.data()), piece.size()) != 1) {
            throw DigestError{"HMAC-SHA1 update failed"};
        }
    }
    auto digest = Digest{};
    auto n = std::size_t(0);
    if (EVP_MAC_final(ctx.get(), digest.data(), &n, digest.size()) != 1 || n != digest.size()) {
        throw DigestError{"HMAC-SHA1 finalization failed"};
    }
    return digest;
}

DigestKey parseDigestKey (const std::string& hex) {
    auto key = DigestKey{};
    try {
        boost::algorithm::unhex(hex, std::back_inserter(key));
    }
    catch (boost::algorithm::hex_decode_error&) {
        throw std::invalid_argument{"digest key is not a valid hex string"};
    }
    return key;
}

std::string toHex (const Digest& digest) {
    auto s = std::string{};
    boost::algorithm::hex_lower(digest.begin(), digest.end(), std::back_inserter(s));
    return s;
}

} // namespace fwpkg
