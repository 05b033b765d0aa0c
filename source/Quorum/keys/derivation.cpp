#include <Quorum/keys/derivation.hpp>
#include <Quorum/keys/primitives.hpp>
#include <Quorum/keys/bech32.hpp>
#include <data/encoding/hex.hpp>
#include <algorithm>

namespace Quorum {

    public_key_ring_entry::public_key_ring_entry (const JSON &j) :
        XPubKey {std::string (read_field (j, "xPubKey"))},
        RequestPubKey {j.contains ("requestPubKey") ? read_maybe_string (j["requestPubKey"]) : maybe<std::string> {}} {}

    public_key_ring_entry::operator JSON () const {
        JSON::object_t x;
        x["xPubKey"] = XPubKey;
        x["requestPubKey"] = write (RequestPubKey);
        return x;
    }

    address::address (const JSON &j) : address {} {
        WalletID = std::string (read_field (j, "walletId"));
        Coin = read_coin (std::string (read_field (j, "coin")));
        Network = read_network (std::string (read_field (j, "network")));
        Type = read_script_type (std::string (read_field (j, "type")));
        Path = read_path (std::string (read_field (j, "path")));
        Address = std::string (read_field (j, "address"));
        IsChange = bool (read_field (j, "isChange"));
        IsColdStaking = j.contains ("isColdStaking") && bool (j["isColdStaking"]);
        for (const JSON &k : read_field (j, "publicKeys")) PublicKeys <<= std::string (k);
    }

    address::operator JSON () const {
        JSON::array_t keys;
        for (const std::string &k : PublicKeys) keys.push_back (k);

        JSON::object_t x;
        x["walletId"] = WalletID;
        x["coin"] = write (Coin);
        x["network"] = write (Network);
        x["type"] = write (Type);
        x["path"] = write_path (Path);
        x["address"] = Address;
        x["isChange"] = IsChange;
        x["isColdStaking"] = IsColdStaking;
        x["publicKeys"] = keys;
        return x;
    }

    std::ostream &operator << (std::ostream &o, const address &a) {
        return o << "address {" << a.Address << ", " << a.Type << ", " << write_path (a.Path) << "}";
    }

    namespace {
        constexpr byte OP_0 = 0x50;
        constexpr byte OP_CHECKMULTISIG = 0xae;
        constexpr byte CompressedPubkeySize = 33;

        byte push_number (uint32 x) {
            return static_cast<byte> (OP_0 + x);
        }
    }

    bytes redeem_script (uint32 m, list<bytes> keys) {
        uint32 n = keys.size ();
        require (n > 0 && n <= wallet_options::MaxCopayers, "publicKeys", "must have between 1 and 15 keys");
        require (m > 0 && m <= n, "m", "must be between 1 and the number of keys");

        std::vector<bytes> sorted;
        for (const bytes &k : keys) {
            if (k.size () != CompressedPubkeySize) throw precondition_violation {"publicKeys", "keys must be compressed"};
            sorted.push_back (k);
        }

        std::sort (sorted.begin (), sorted.end ());

        bytes script;
        script.push_back (push_number (m));
        for (const bytes &k : sorted) {
            script.push_back (CompressedPubkeySize);
            for (byte b : k) script.push_back (b);
        }
        script.push_back (push_number (n));
        script.push_back (OP_CHECKMULTISIG);
        return script;
    }

    namespace {
        std::string encode_script_hash (const bytes &script, const coin_policy &pol, network net, bool secondary) {
            const network_parameters &params = pol[net];
            if (!secondary) return primitives::base58_check (params.ScriptVersion, primitives::Hash160 (script));
            return primitives::base58_check (*params.Script256Version, primitives::SHA2_256 (script));
        }

        std::string encode_pubkey_hash (const bytes &pubkey, const coin_policy &pol, network net, bool secondary) {
            const network_parameters &params = pol[net];
            if (!secondary) return primitives::base58_check (params.PubkeyVersion, primitives::Hash160 (pubkey));
            return primitives::base58_check (*params.Pubkey256Version, primitives::Hash256 (pubkey));
        }
    }

    address derive (
        const std::string &wallet_id,
        script_type type,
        const public_key_ring &ring,
        const HD::BIP_32::path &path,
        uint32 m,
        coin c, network net,
        bool is_change,
        bool secondary,
        bool is_cold_staking) {

        const coin_policy &pol = policy (c);
        require (check_network (net));

        if (secondary && !pol.SupportsSecondaryEncoding)
            throw precondition_violation {"secondaryEncoding", data::string::write ("not supported for ", c)};

        uint32 n = ring.size ();
        require (n > 0, "publicKeyRing", "must not be empty");

        DATA_LOG (debug) << "deriving address " << write_path (path);

        list<bytes> keys;
        list<std::string> hex_keys;
        for (const public_key_ring_entry &e : ring) {
            bytes k = primitives::derive_child_pubkey (primitives::read_xpub ("xPubKey", e.XPubKey), path);
            keys <<= k;
            hex_keys <<= data::to_lower (encoding::hex::write (k));
        }

        address a {};
        a.WalletID = wallet_id;
        a.Coin = c;
        a.Network = net;
        a.Type = type;
        a.Path = path;
        a.IsChange = is_change;
        a.IsColdStaking = is_cold_staking;
        a.PublicKeys = hex_keys;

        switch (type) {
            case script_type::P2PKH: {
                require (n == 1, "publicKeyRing", "P2PKH addresses have exactly one key");
                a.Address = encode_pubkey_hash (keys.first (), pol, net, secondary);
            } break;
            case script_type::P2SH: {
                a.Address = encode_script_hash (redeem_script (m, keys), pol, net, secondary);
            } break;
            case script_type::P2WSH: {
                if (!pol.supports_witness (net))
                    throw precondition_violation {"addressType", data::string::write ("witness addresses not supported for ", c)};
                if (secondary) throw precondition_violation {"secondaryEncoding", "not supported for P2WSH"};
                a.Address = bech32::encode_witness (pol[net].WitnessPrefix, 0, primitives::SHA2_256 (redeem_script (m, keys)));
            } break;
            default: throw precondition_violation {"addressType", "must be one of P2SH, P2WSH, P2PKH"};
        }

        return a;
    }

    std::string derive_public_key_hash_address (const std::string &xpub, uint32 index, coin c, network net) {
        const coin_policy &pol = policy (c);
        bytes k = primitives::derive_child_pubkey (primitives::read_xpub ("staking_key", xpub), HD::BIP_32::path {index});
        return encode_pubkey_hash (k, pol, net, false);
    }

}
