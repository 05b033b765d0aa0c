#include <Quorum/cold_staking.hpp>
#include <Quorum/keys/primitives.hpp>
#include <Quorum/keys/bech32.hpp>

namespace Quorum {

    std::ostream &operator << (std::ostream &o, staking_key_form f) {
        switch (f) {
            case staking_key_form::staking_address: return o << "staking address";
            case staking_key_form::extended_pubkey: return o << "extended pubkey";
            default: return o << "invalid";
        }
    }

    staking_key_form classify_staking_key (const std::string &key, const coin_policy &pol, network net, bool strict) {
        if (!pol.SupportsColdStaking) return staking_key_form::invalid;

        const std::string &prefix = pol[net].StakingPrefix;
        if (prefix != "" && key.size () > prefix.size () && key.compare (0, prefix.size (), prefix) == 0) {
            bech32::decoded d = bech32::decode (key);
            if (d.valid () && d.Prefix == prefix) return staking_key_form::staking_address;
            if (strict) return staking_key_form::invalid;

            DATA_LOG (warning) << "accepting staking address " << key << " without a valid bech32 checksum";
            return staking_key_form::staking_address;
        }

        if (primitives::valid_xpub (key)) return staking_key_form::extended_pubkey;

        return staking_key_form::invalid;
    }

    cold_staking_addresses::operator JSON () const {
        JSON::object_t x;
        x["staking_address"] = StakingAddress;
        x["spend_address"] = SpendAddress;
        return x;
    }

    bool cold_staking_coordinator::supported () const {
        return Quorum::supported (Wallet.Coin) && policy (Wallet.Coin).SupportsColdStaking;
    }

    staking_key_form cold_staking_coordinator::classify (const std::string &key, const std::string &field) const {
        staking_key_form form = classify_staking_key (key, policy (Wallet.Coin), Wallet.Network, Strict);
        if (form == staking_key_form::invalid) throw validation_failure {field,
            data::string::write ("must be an extended public key or a cold staking address beginning with ",
                policy (Wallet.Coin)[Wallet.Network].StakingPrefix)};
        return form;
    }

    maybe<cold_staking_addresses> cold_staking_coordinator::get_addresses (const maybe<std::string> &spend_address) {
        if (!supported () || !bool (Wallet.ColdStakingSetup)) return {};

        cold_staking_setup setup = *Wallet.ColdStakingSetup;
        cold_staking_addresses addresses {};

        if (classify (setup.StakingKey, "staking_key") == staking_key_form::staking_address) {
            if (!bool (setup.SpendAddress))
                setup.SpendAddress = bool (spend_address) ? *spend_address : Wallet.create_address (true, true).Address;

            addresses.StakingAddress = setup.StakingKey;
            addresses.SpendAddress = *setup.SpendAddress;
        } else {
            if (HD::BIP_32::hardened (setup.AddressIndex))
                throw precondition_violation {"address_index", "no more non-hardened indices for the staking key"};

            addresses.StakingAddress = derive_public_key_hash_address (setup.StakingKey, setup.AddressIndex, Wallet.Coin, Wallet.Network);
            setup.AddressIndex++;

            addresses.SpendAddress = bool (spend_address) ? *spend_address : Wallet.create_address (true, true).Address;
        }

        Wallet.update_cold_staking_setup (setup);
        return addresses;
    }

    std::string cold_staking_coordinator::create_address (const std::string &input) {
        if (!supported ()) throw precondition_violation {"coin", data::string::write ("cold staking is not supported for ", Wallet.Coin)};

        if (classify (input, "staking_key") == staking_key_form::staking_address) return input;

        if (!Wallet.complete ()) throw precondition_violation {"status", "cold staking addresses require a complete wallet"};

        HD::BIP_32::path p = Wallet.AddressManager.new_cold_staking_address_path ();
        return derive (Wallet.ID, Wallet.AddressType, Wallet.PublicKeyRing, p,
            Wallet.M, Wallet.Coin, Wallet.Network, false, false, true).Address;
    }

    void cold_staking_coordinator::setup (const std::string &staking_key, const maybe<std::string> &spend_address) {
        if (!supported ()) throw precondition_violation {"coin", data::string::write ("cold staking is not supported for ", Wallet.Coin)};

        classify (staking_key, "staking_key");
        Wallet.update_cold_staking_setup (cold_staking_setup {staking_key, spend_address, 0});
    }

}
