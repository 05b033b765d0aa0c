#ifndef QUORUM_OPTIONS
#define QUORUM_OPTIONS

#include <Quorum/coin.hpp>

namespace Quorum {

    struct wallet_options {
        constexpr static const char *WalletVersion {"1.0.0"};
        constexpr static const char *CopayerVersion {"2"};

        // limit imposed by the size of a standard multisig redeem script.
        constexpr static uint32 MaxCopayers {15};

        // BIP 45 cosigner index that every copayer shares.
        constexpr static uint32 BIP45SharedIndex {0x7fffffff};

        constexpr static uint32 ReceiveBranch {0};
        constexpr static uint32 ChangeBranch {1};
        constexpr static uint32 ColdStakingBranch {2};

        constexpr static derivation_strategy DefaultDerivationStrategy {derivation_strategy::BIP45};
        constexpr static script_type DefaultSharedAddressType {script_type::P2SH};
        constexpr static script_type DefaultSingleAddressType {script_type::P2PKH};

        // when false, a cold staking address is accepted if it has
        // the right prefix for the network. Otherwise the bech32
        // checksum is verified as well.
        constexpr static bool DefaultStrictStakingValidation {false};

        derivation_strategy DerivationStrategy {DefaultDerivationStrategy};

        bool StrictStakingValidation {DefaultStrictStakingValidation};

        script_type default_address_type (uint32 n) const {
            return n == 1 ? DefaultSingleAddressType : DefaultSharedAddressType;
        }

        wallet_options () {}

        // missing fields take default values.
        explicit wallet_options (const JSON &);
        explicit operator JSON () const;
    };

    // read options from a JSON file. If the file does not exist,
    // default options are returned.
    wallet_options read_options_from_file (const filepath &);
}

#endif
