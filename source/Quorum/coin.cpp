#include <Quorum/coin.hpp>

namespace Quorum {

    std::ostream &operator << (std::ostream &o, network n) {
        switch (n) {
            case network::livenet: return o << "livenet";
            case network::testnet: return o << "testnet";
            default: return o << "invalid";
        }
    }

    std::ostream &operator << (std::ostream &o, coin c) {
        switch (c) {
            case coin::btc: return o << "btc";
            case coin::bch: return o << "bch";
            case coin::part: return o << "part";
            default: return o << "invalid";
        }
    }

    std::ostream &operator << (std::ostream &o, script_type t) {
        switch (t) {
            case script_type::P2SH: return o << "P2SH";
            case script_type::P2WSH: return o << "P2WSH";
            case script_type::P2PKH: return o << "P2PKH";
            default: return o << "invalid";
        }
    }

    std::ostream &operator << (std::ostream &o, derivation_strategy d) {
        switch (d) {
            case derivation_strategy::BIP44: return o << "BIP44";
            case derivation_strategy::BIP45: return o << "BIP45";
            default: return o << "invalid";
        }
    }

    network read_network (const std::string &x) {
        std::string n = data::to_lower (x);
        if (n == "livenet" || n == "mainnet" || n == "main") return network::livenet;
        if (n == "testnet" || n == "test") return network::testnet;
        return network::invalid;
    }

    coin read_coin (const std::string &x) {
        std::string c = data::to_lower (x);
        if (c == "btc") return coin::btc;
        if (c == "bch") return coin::bch;
        if (c == "part") return coin::part;
        return coin::invalid;
    }

    script_type read_script_type (const std::string &x) {
        std::string t = data::to_lower (x);
        if (t == "p2sh") return script_type::P2SH;
        if (t == "p2wsh") return script_type::P2WSH;
        if (t == "p2pkh") return script_type::P2PKH;
        return script_type::invalid;
    }

    derivation_strategy read_derivation_strategy (const std::string &x) {
        std::string d = data::to_lower (x);
        if (d == "bip44") return derivation_strategy::BIP44;
        if (d == "bip45") return derivation_strategy::BIP45;
        return derivation_strategy::invalid;
    }

    const coin_policy &policy (coin c) {
        static const coin_policy BTC {coin::btc, false, false,
            {0x00, 0x05, {}, {}, "bc", ""},
            {0x6f, 0xc4, {}, {}, "tb", ""}};

        static const coin_policy BCH {coin::bch, false, false,
            {0x00, 0x05, {}, {}, "", ""},
            {0x6f, 0xc4, {}, {}, "", ""}};

        static const coin_policy PART {coin::part, true, true,
            {0x38, 0x3c, byte {0x39}, byte {0x3d}, "pw", "pcs"},
            {0x76, 0x7a, byte {0x77}, byte {0x7b}, "tpw", "tpcs"}};

        switch (c) {
            case coin::btc: return BTC;
            case coin::bch: return BCH;
            case coin::part: return PART;
            default: throw *check_coin (c);
        }
    }

}
