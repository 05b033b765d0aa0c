#include <Quorum/keys/primitives.hpp>
#include <data/encoding/hex.hpp>

namespace Quorum::primitives {

    namespace base58 = Gigamonkey::base58;

    namespace {
        constexpr uint32 ParticlMainnetPubkey = 0x696e82d1;
        constexpr uint32 ParticlTestnetPubkey = 0xe1427800;
        constexpr uint32 MainnetPubkey = 0x0488b21e;
        constexpr uint32 TestnetPubkey = 0x043587cf;

        // the version takes the first byte of a base58check string and three bytes of the payload.
        constexpr size_t ExtendedKeyPayloadSize = 77;
    }

    std::string normalize_xpub (const std::string &x) {
        base58::check decoded = base58::check::decode (x);
        if (!decoded.valid ()) return x;

        bytes payload = decoded.payload ();
        if (payload.size () != ExtendedKeyPayloadSize) return x;

        uint32 version = (uint32 (decoded.version ()) << 24) |
            (uint32 (payload[0]) << 16) | (uint32 (payload[1]) << 8) | uint32 (payload[2]);

        uint32 replacement;
        if (version == ParticlMainnetPubkey) replacement = MainnetPubkey;
        else if (version == ParticlTestnetPubkey) replacement = TestnetPubkey;
        else return x;

        payload[0] = static_cast<byte> (replacement >> 16);
        payload[1] = static_cast<byte> (replacement >> 8);
        payload[2] = static_cast<byte> (replacement);
        return base58_check (static_cast<byte> (replacement >> 24), payload);
    }

    bool valid_xpub (const std::string &x) {
        return HD::BIP_32::pubkey {normalize_xpub (x)}.valid ();
    }

    HD::BIP_32::pubkey read_xpub (const std::string &field, const std::string &x) {
        HD::BIP_32::pubkey pk {normalize_xpub (x)};
        if (!pk.valid ()) throw validation_failure {field, "must be an extended public key"};
        return pk;
    }

    bytes derive_child_pubkey (const HD::BIP_32::pubkey &pk, const HD::BIP_32::path &p) {
        for (uint32 i : p) if (HD::BIP_32::hardened (i))
            throw precondition_violation {"path", "hardened derivation requires a private key"};

        secp256k1::pubkey child = pk.derive (p).Pubkey;
        if (!child.valid ()) throw precondition_violation {"path", "derivation produced an invalid key"};

        return bytes (child);
    }

    bytes SHA2_256 (const bytes &b) {
        return to_bytes (Gigamonkey::SHA2_256 (b));
    }

    bytes Hash160 (const bytes &b) {
        return to_bytes (crypto::Bitcoin_160 (b));
    }

    bytes Hash256 (const bytes &b) {
        return to_bytes (crypto::Bitcoin_256 (b));
    }

    std::string base58_check (byte version, const bytes &payload) {
        return std::string (base58::check (version, payload));
    }

    std::string SHA2_256_hex (const std::string &x) {
        bytes b;
        b.resize (x.size ());
        std::copy (x.begin (), x.end (), b.begin ());
        return data::to_lower (encoding::hex::write (SHA2_256 (b)));
    }

}
