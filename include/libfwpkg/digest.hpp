#ifndef LIBFWPKG_DIGEST_HPP
#define LIBFWPKG_DIGEST_HPP

#include <libfwpkg/layout.hpp>

#include <boost/asio/buffer.hpp>

#include <array>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

#include <cstdint>

namespace fwpkg {

using Digest = std::array<uint8_t, kDigestSize>;
using DigestKey = Bytes;

// Computes fixed-width digests over byte ranges. Implementations are expected
// to be stateless between calls, so one provider may serve concurrent
// readers.
class DigestProvider {
public:
    virtual ~DigestProvider () = default;

    Digest digest (boost::asio::const_buffer data) const {
        return compute({ data });
    }

    // Digest of the concatenation of `pieces`.
    Digest digest (std::initializer_list<boost::asio::const_buffer> pieces) const {
        return compute(std::vector<boost::asio::const_buffer>(pieces));
    }

protected:
    virtual Digest compute (const std::vector<boost::asio::const_buffer>& pieces) const = 0;
};

// Plain SHA-1, for packages distributed without a shared secret.
class Sha1DigestProvider : public DigestProvider {
protected:
    Digest compute (const std::vector<boost::asio::const_buffer>& pieces) const override;
};

// HMAC-SHA1 keyed with caller-supplied key material.
class HmacSha1DigestProvider : public DigestProvider {
public:
    // Throws std::invalid_argument if `key` is empty.
    explicit HmacSha1DigestProvider (DigestKey key);

protected:
    Digest compute (const std::vector<boost::asio::const_buffer>& pieces) const override;

private:
    DigestKey mKey;
};

// Decode a hexadecimal key string, e.g. from a configuration file or the
// command line. Throws std::invalid_argument on odd length or non-hex input.
DigestKey parseDigestKey (const std::string& hex);

std::string toHex (const Digest& digest);

struct DigestError : std::runtime_error {
    DigestError (std::string w) : std::runtime_error(w) {}
};

} // namespace fwpkg

#endif
