#ifndef QUORUM_COIN
#define QUORUM_COIN

#include <Quorum/error.hpp>

namespace Quorum {

    enum class network : byte {
        invalid = 0,
        livenet = 1,
        testnet = 2
    };

    enum class coin : byte {
        invalid = 0,
        btc = 1,
        bch = 2,
        part = 3
    };

    enum class script_type : byte {
        invalid = 0,
        P2SH = 1,
        P2WSH = 2,
        P2PKH = 3
    };

    enum class derivation_strategy : byte {
        invalid = 0,
        BIP44 = 1,
        BIP45 = 2
    };

    std::ostream &operator << (std::ostream &, network);
    std::ostream &operator << (std::ostream &, coin);
    std::ostream &operator << (std::ostream &, script_type);
    std::ostream &operator << (std::ostream &, derivation_strategy);

    // these return invalid if the string is not recognized.
    network read_network (const std::string &);
    coin read_coin (const std::string &);
    script_type read_script_type (const std::string &);
    derivation_strategy read_derivation_strategy (const std::string &);

    template <typename X> std::string write (X x) {
        std::stringstream ss;
        ss << x;
        return ss.str ();
    }

    // address encoding parameters for a coin on one network.
    struct network_parameters {
        byte PubkeyVersion;
        byte ScriptVersion;

        // versions for addresses with 256-bit hashes.
        maybe<byte> Pubkey256Version;
        maybe<byte> Script256Version;

        // bech32 prefix of witness addresses. Empty if witness addresses are not supported.
        std::string WitnessPrefix;

        // bech32 prefix of cold staking addresses. Empty if cold staking is not supported.
        std::string StakingPrefix;
    };

    // what a coin is able to do. Selected once when the wallet is configured.
    struct coin_policy {
        coin Coin;

        // the coin supports an alternate encoding of the same script or pubkey.
        bool SupportsSecondaryEncoding;
        bool SupportsColdStaking;

        network_parameters Livenet;
        network_parameters Testnet;

        const network_parameters &operator [] (network) const;

        bool supports_witness (network n) const {
            return (*this)[n].WitnessPrefix != "";
        }
    };

    check check_coin (coin);
    check check_network (network);

    // throws precondition_violation if the coin is not supported.
    const coin_policy &policy (coin);

    bool inline supported (coin c) {
        return !bool (check_coin (c));
    }

    bool inline supported (network n) {
        return !bool (check_network (n));
    }

    check inline check_coin (coin c) {
        if (c == coin::btc || c == coin::bch || c == coin::part) return pass ();
        return fail ("coin", "must be one of btc, bch, part");
    }

    check inline check_network (network n) {
        if (n == network::livenet || n == network::testnet) return pass ();
        return fail ("network", "must be one of livenet, testnet");
    }

    const network_parameters inline &coin_policy::operator [] (network n) const {
        require (check_network (n));
        return n == network::livenet ? Livenet : Testnet;
    }
}

#endif
