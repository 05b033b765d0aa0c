#ifndef QUORUM_KEYS_PRIMITIVES
#define QUORUM_KEYS_PRIMITIVES

#include <gigamonkey/schema/hd.hpp>
#include <gigamonkey/p2p/checksum.hpp>
#include <Quorum/error.hpp>

// The cryptography that Quorum needs, all of which comes from Gigamonkey.
namespace Quorum::primitives {

    // Particl extended public keys (PPAR, ppar) are rewritten with the
    // BIP 32 version (xpub, tpub) for the same network. Anything else is
    // returned unchanged.
    std::string normalize_xpub (const std::string &);

    // Bitcoin and Particl extended public keys are both accepted.
    bool valid_xpub (const std::string &);

    // throws validation_failure if the key is not a valid extended public key.
    HD::BIP_32::pubkey read_xpub (const std::string &field, const std::string &xpub);

    // compressed secp256k1 public key at the end of the path.
    // throws precondition_violation if the path contains a hardened index.
    bytes derive_child_pubkey (const HD::BIP_32::pubkey &, const HD::BIP_32::path &);

    bytes SHA2_256 (const bytes &);
    bytes Hash160 (const bytes &);
    bytes Hash256 (const bytes &);

    std::string base58_check (byte version, const bytes &payload);

    // SHA2_256 of the string, written in lower case hex.
    std::string SHA2_256_hex (const std::string &);

    // copy a digest into a byte string.
    template <typename digest> bytes inline to_bytes (const digest &d) {
        bytes b;
        b.resize (d.size ());
        std::copy (d.begin (), d.end (), b.begin ());
        return b;
    }

}

#endif
