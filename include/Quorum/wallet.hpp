#ifndef QUORUM_WALLET
#define QUORUM_WALLET

#include <Quorum/address_manager.hpp>
#include <Quorum/copayer.hpp>

namespace Quorum {

    enum class wallet_status : byte {
        invalid = 0,
        pending = 1,
        complete = 2
    };

    std::ostream &operator << (std::ostream &, wallet_status);
    wallet_status read_wallet_status (const std::string &);

    struct cold_staking_setup {
        // either a cold staking address or an xpub.
        std::string StakingKey;

        // cached once it has been created.
        maybe<std::string> SpendAddress;

        // next index to derive from StakingKey if it is an xpub.
        uint32 AddressIndex;

        cold_staking_setup () : StakingKey {}, SpendAddress {}, AddressIndex {0} {}
        cold_staking_setup (const std::string &key, const maybe<std::string> &spend = {}, uint32 index = 0) :
            StakingKey {key}, SpendAddress {spend}, AddressIndex {index} {}

        bool operator == (const cold_staking_setup &x) const {
            return StakingKey == x.StakingKey && SpendAddress == x.SpendAddress && AddressIndex == x.AddressIndex;
        }

        explicit cold_staking_setup (const JSON &);
        explicit operator JSON () const;
    };

    // A wallet shared by n copayers, m of whom must sign.
    // Every method that is not const must be called while holding the wallet's lock.
    struct wallet {
        std::string Version;
        uint32 CreatedOn;
        std::string ID;
        std::string Name;
        uint32 M;
        uint32 N;
        bool SingleAddress;
        wallet_status Status;

        // in the order that they joined.
        list<copayer> Copayers;

        // the xpubs and request keys of the copayers, in the same order.
        public_key_ring PublicKeyRing;

        maybe<std::string> PubKey;
        Quorum::coin Coin;
        Quorum::network Network;
        derivation_strategy DerivationStrategy;
        script_type AddressType;
        address_manager AddressManager;

        // opaque. null if there has never been a scan.
        JSON ScanStatus;

        maybe<cold_staking_setup> ColdStakingSetup;

        wallet ();

        struct parameters {
            maybe<std::string> ID {};
            std::string Name {};
            uint32 M {1};
            uint32 N {1};
            bool SingleAddress {false};
            maybe<std::string> PubKey {};
            Quorum::coin Coin {coin::btc};
            Quorum::network Network {network::livenet};

            // defaults are taken from wallet_options.
            maybe<derivation_strategy> DerivationStrategy {};
            maybe<script_type> AddressType {};
        };

        static wallet create (const parameters &, const wallet_options & = {});

        static check check_copayer_limits (uint32 m, uint32 n);

        // throws precondition_violation if the limits are not satisfied.
        static void verify_copayer_limits (uint32 m, uint32 n) {
            require (check_copayer_limits (m, n));
        }

        // requires that the wallet be pending, that the copayer have the
        // same coin as the wallet, and that the copayer not be a member already.
        void add_copayer (const copayer &);

        // requires that the wallet be complete.
        void add_copayer_request_key (
            const std::string &copayer_id,
            const std::string &key,
            const std::string &signature,
            const JSON &restrictions = JSON (nullptr),
            const maybe<std::string> &name = {});

        // nullptr if there is no such copayer.
        const copayer *get_copayer (const std::string &id) const;

        bool complete () const {
            return Status == wallet_status::complete;
        }

        bool shared () const {
            return N > 1;
        }

        bool scanning () const;

        // consume one path and derive an address.
        address create_address (bool change, bool secondary = false);

        // consume one path. Derive the primary address and, if the coin
        // supports it, the secondary encoding of the same script.
        list<address> create_addresses (bool change);

        // derive the address at a path that was already issued. Does not change the wallet.
        address derive_address (const HD::BIP_32::path &, bool change, bool secondary = false) const;

        void update_cold_staking_setup (const maybe<cold_staking_setup> &);

        const maybe<cold_staking_setup> &get_cold_staking_setup () const {
            return ColdStakingSetup;
        }

        // throws state_consistency_violation if an invariant is broken.
        void check_consistency () const;

        bool operator == (const wallet &) const;

        // throws state_consistency_violation if the document is inconsistent.
        explicit wallet (const JSON &);
        explicit operator JSON () const;

    private:
        public_key_ring project_ring () const;
        void require_complete (const std::string &operation) const;
    };

    std::ostream &operator << (std::ostream &, const wallet &);

}

#endif
