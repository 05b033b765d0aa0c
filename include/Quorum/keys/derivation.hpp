#ifndef QUORUM_KEYS_DERIVATION
#define QUORUM_KEYS_DERIVATION

#include <Quorum/options.hpp>
#include <Quorum/write.hpp>

namespace Quorum {

    // what every copayer contributes to address derivation.
    struct public_key_ring_entry {
        std::string XPubKey;
        maybe<std::string> RequestPubKey;

        public_key_ring_entry () : XPubKey {}, RequestPubKey {} {}
        public_key_ring_entry (const std::string &x, const maybe<std::string> &r) : XPubKey {x}, RequestPubKey {r} {}

        bool operator == (const public_key_ring_entry &x) const {
            return XPubKey == x.XPubKey && RequestPubKey == x.RequestPubKey;
        }

        explicit public_key_ring_entry (const JSON &);
        explicit operator JSON () const;
    };

    using public_key_ring = list<public_key_ring_entry>;

    struct address {
        std::string WalletID;
        Quorum::coin Coin;
        Quorum::network Network;
        script_type Type;
        HD::BIP_32::path Path;

        // the encoded address.
        std::string Address;

        bool IsChange;
        bool IsColdStaking;

        // hex child keys in ring order.
        list<std::string> PublicKeys;

        address () : WalletID {}, Coin {coin::invalid}, Network {network::invalid}, Type {script_type::invalid},
            Path {}, Address {}, IsChange {false}, IsColdStaking {false}, PublicKeys {} {}

        bool valid () const {
            return Address != "";
        }

        bool operator == (const address &x) const {
            return WalletID == x.WalletID && Coin == x.Coin && Network == x.Network && Type == x.Type &&
                Path == x.Path && Address == x.Address && IsChange == x.IsChange &&
                IsColdStaking == x.IsColdStaking && PublicKeys == x.PublicKeys;
        }

        explicit address (const JSON &);
        explicit operator JSON () const;
    };

    std::ostream &operator << (std::ostream &, const address &);

    // m-of-n OP_CHECKMULTISIG script. The keys are sorted
    // lexicographically first, as in BIP 67.
    bytes redeem_script (uint32 m, list<bytes> keys);

    // derive the address at the given path for every key in the ring.
    address derive (
        const std::string &wallet_id,
        script_type,
        const public_key_ring &,
        const HD::BIP_32::path &,
        uint32 m,
        coin, network,
        bool is_change,
        bool secondary_encoding = false,
        bool is_cold_staking = false);

    // the public key hash address of xpub/index.
    std::string derive_public_key_hash_address (const std::string &xpub, uint32 index, coin, network);

}

#endif
