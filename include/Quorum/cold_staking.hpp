#ifndef QUORUM_COLD_STAKING
#define QUORUM_COLD_STAKING

#include <Quorum/wallet.hpp>

namespace Quorum {

    enum class staking_key_form : byte {
        invalid = 0,
        staking_address = 1,
        extended_pubkey = 2
    };

    std::ostream &operator << (std::ostream &, staking_key_form);

    // A staking address must have the staking prefix for the network. If strict is
    // true, the bech32 checksum is checked as well.
    staking_key_form classify_staking_key (const std::string &key, const coin_policy &, network, bool strict);

    struct cold_staking_addresses {
        std::string StakingAddress;
        std::string SpendAddress;

        bool operator == (const cold_staking_addresses &x) const {
            return StakingAddress == x.StakingAddress && SpendAddress == x.SpendAddress;
        }

        explicit operator JSON () const;
    };

    // Pairs a staking key with a spend address for one wallet.
    // The caller must hold the wallet's lock.
    struct cold_staking_coordinator {
        wallet &Wallet;
        bool Strict;

        cold_staking_coordinator (wallet &w, const wallet_options &o = {}) : Wallet {w}, Strict {o.StrictStakingValidation} {}

        bool supported () const;

        // empty unless the coin supports cold staking and a setup is present.
        maybe<cold_staking_addresses> get_addresses (const maybe<std::string> &spend_address = {});

        // a cold staking address is returned unchanged. For an xpub, the next
        // cold staking path of the address manager is derived from the
        // wallet's public key ring. The wallet must be complete.
        std::string create_address (const std::string &xpub_or_staking_address);

        // validate and store a new setup. The wallet is unchanged if validation fails.
        void setup (const std::string &staking_key, const maybe<std::string> &spend_address = {});

    private:
        staking_key_form classify (const std::string &, const std::string &field) const;
    };

    maybe<cold_staking_addresses> inline get_cold_staking_addresses (
        wallet &w, const maybe<std::string> &spend_address = {}, const wallet_options &o = {}) {
        return cold_staking_coordinator {w, o}.get_addresses (spend_address);
    }

    std::string inline create_cold_staking_address (wallet &w, const std::string &input, const wallet_options &o = {}) {
        return cold_staking_coordinator {w, o}.create_address (input);
    }

}

#endif
