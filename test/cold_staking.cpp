#include <Quorum/cold_staking.hpp>
#include "vectors.hpp"
#include "gtest/gtest.h"

namespace Quorum {

    const std::string StakingAddress {"pcs1nnypkcfrvu3e9dhzeggpn4kh622l4cq7e9ztm5"};
    const std::string TestnetStakingAddress {"tpcs1nnypkcfrvu3e9dhzeggpn4kh622l4cq7hst0m9"};

    // last character changed, so the checksum is wrong.
    const std::string BadChecksumStakingAddress {"pcs1nnypkcfrvu3e9dhzeggpn4kh622l4cq7e9ztm6"};

    TEST (ColdStaking, Classify) {
        const coin_policy &part = policy (coin::part);
        const coin_policy &btc = policy (coin::btc);

        EXPECT_EQ (classify_staking_key (StakingAddress, part, network::livenet, false), staking_key_form::staking_address);
        EXPECT_EQ (classify_staking_key (StakingAddress, part, network::livenet, true), staking_key_form::staking_address);
        EXPECT_EQ (classify_staking_key (TestnetStakingAddress, part, network::testnet, true), staking_key_form::staking_address);

        // the prefix must match the network.
        EXPECT_EQ (classify_staking_key (TestnetStakingAddress, part, network::livenet, false), staking_key_form::invalid);
        EXPECT_EQ (classify_staking_key (StakingAddress, part, network::testnet, false), staking_key_form::invalid);

        // without strict validation, the checksum is not checked.
        EXPECT_EQ (classify_staking_key (BadChecksumStakingAddress, part, network::livenet, false), staking_key_form::staking_address);
        EXPECT_EQ (classify_staking_key (BadChecksumStakingAddress, part, network::livenet, true), staking_key_form::invalid);

        EXPECT_EQ (classify_staking_key (test::XPub1, part, network::livenet, true), staking_key_form::extended_pubkey);
        EXPECT_EQ (classify_staking_key (test::ParticlXPub1, part, network::livenet, true), staking_key_form::extended_pubkey);
        EXPECT_EQ (classify_staking_key (test::ParticlTestnetXPub1, part, network::testnet, false), staking_key_form::extended_pubkey);
        EXPECT_EQ (classify_staking_key ("pcs", part, network::livenet, false), staking_key_form::invalid);
        EXPECT_EQ (classify_staking_key ("garbage", part, network::livenet, false), staking_key_form::invalid);

        // btc does not do cold staking.
        EXPECT_EQ (classify_staking_key (test::XPub1, btc, network::livenet, false), staking_key_form::invalid);
    }

    TEST (ColdStaking, NotSupported) {
        wallet w = test::make_wallet (2, 3, coin::btc, network::livenet);
        w.update_cold_staking_setup (cold_staking_setup {test::XPub1});

        EXPECT_FALSE (bool (get_cold_staking_addresses (w)));
        EXPECT_THROW (create_cold_staking_address (w, test::XPub1), precondition_violation);
        EXPECT_THROW (cold_staking_coordinator {w}.setup (test::XPub1), precondition_violation);

        // no setup.
        wallet part = test::make_wallet (2, 3, coin::part, network::livenet);
        EXPECT_FALSE (bool (get_cold_staking_addresses (part)));
        EXPECT_EQ (part.AddressManager.indices ().Change, 0);
    }

    TEST (ColdStaking, StakingAddress) {
        wallet w = test::make_wallet (2, 3, coin::part, network::livenet);
        cold_staking_coordinator {w}.setup (StakingAddress);

        maybe<cold_staking_addresses> first = get_cold_staking_addresses (w);
        ASSERT_TRUE (bool (first));
        EXPECT_EQ (first->StakingAddress, StakingAddress);

        // the secondary encoding of the first change address.
        EXPECT_EQ (first->SpendAddress, "34N9H4PKC3XVAW51bPg46ffvRMHxTNRpL7v7VC54JZhZDm9Midd");
        EXPECT_EQ (w.AddressManager.indices ().Change, 1);
        EXPECT_EQ (w.ColdStakingSetup->SpendAddress, maybe<std::string> {first->SpendAddress});

        // the spend address is cached.
        maybe<cold_staking_addresses> second = get_cold_staking_addresses (w);
        ASSERT_TRUE (bool (second));
        EXPECT_EQ (*second, *first);
        EXPECT_EQ (w.AddressManager.indices ().Change, 1);

        // a spend address from the caller is ignored once one is cached.
        EXPECT_EQ (get_cold_staking_addresses (w, std::string {"other"})->SpendAddress, first->SpendAddress);
    }

    TEST (ColdStaking, StakingAddressWithSpendAddress) {
        wallet w = test::make_wallet (2, 3, coin::part, network::livenet);
        cold_staking_coordinator {w}.setup (StakingAddress);

        maybe<cold_staking_addresses> x = get_cold_staking_addresses (w, std::string {"spend here"});
        ASSERT_TRUE (bool (x));
        EXPECT_EQ (x->SpendAddress, "spend here");
        EXPECT_EQ (w.AddressManager.indices ().Change, 0);
        EXPECT_EQ (get_cold_staking_addresses (w)->SpendAddress, "spend here");
    }

    TEST (ColdStaking, ExtendedPubkey) {
        wallet w = test::make_wallet (2, 3, coin::part, network::livenet);
        cold_staking_coordinator {w}.setup (test::XPub1);

        maybe<cold_staking_addresses> first = get_cold_staking_addresses (w, std::string {"spend"});
        ASSERT_TRUE (bool (first));
        EXPECT_EQ (first->StakingAddress, "PnDmGgWMzBnYMRLZ3Ee1kDT13L2GnyRyB5");
        EXPECT_EQ (first->SpendAddress, "spend");
        EXPECT_EQ (w.ColdStakingSetup->AddressIndex, 1);

        maybe<cold_staking_addresses> second = get_cold_staking_addresses (w);
        ASSERT_TRUE (bool (second));
        EXPECT_EQ (second->StakingAddress, "Pq4BMSi2spARPaZjyLBEbsQu79oZYdsLbh");
        EXPECT_EQ (second->SpendAddress, "34N9H4PKC3XVAW51bPg46ffvRMHxTNRpL7v7VC54JZhZDm9Midd");
        EXPECT_EQ (w.ColdStakingSetup->AddressIndex, 2);

        // the spend address is not cached for an xpub.
        EXPECT_FALSE (bool (w.ColdStakingSetup->SpendAddress));
        maybe<cold_staking_addresses> third = get_cold_staking_addresses (w);
        EXPECT_NE (third->SpendAddress, second->SpendAddress);
        EXPECT_EQ (w.AddressManager.indices ().Change, 2);

        // the address manager's cold staking index is separate.
        EXPECT_EQ (w.AddressManager.indices ().ColdStaking, 0);
        EXPECT_EQ (w.AddressManager.indices ().Receive, 0);
    }

    TEST (ColdStaking, Testnet) {
        wallet w = test::make_wallet (1, 1, coin::part, network::testnet);
        cold_staking_coordinator {w}.setup (test::XPub1, std::string {"spend"});

        maybe<cold_staking_addresses> x = get_cold_staking_addresses (w, std::string {"spend"});
        ASSERT_TRUE (bool (x));
        EXPECT_EQ (x->StakingAddress, "pjBAKQzE1NWs4HyvZFHmozKn4bzkst3AMe");

        EXPECT_EQ (create_cold_staking_address (w, TestnetStakingAddress), TestnetStakingAddress);
        EXPECT_THROW (create_cold_staking_address (w, StakingAddress), validation_failure);
    }

    TEST (ColdStaking, CreateAddress) {
        wallet w = test::make_wallet (2, 3, coin::part, network::livenet, derivation_strategy::BIP44);

        // a staking address is returned unchanged and nothing is consumed.
        EXPECT_EQ (create_cold_staking_address (w, StakingAddress), StakingAddress);
        EXPECT_EQ (w.AddressManager.indices ().ColdStaking, 0);

        // an xpub selects derivation from the copayers' ring along m/2/i.
        EXPECT_EQ (create_cold_staking_address (w, test::XPub1), "RCm7dT5suABycDiS4Xb7nEHF1SYsJikozb");
        EXPECT_EQ (create_cold_staking_address (w, test::ParticlXPub1), "RPTyLrdGzkRM3yABonXmGx6dcbkAH6KBnR");
        EXPECT_EQ (w.AddressManager.indices ().ColdStaking, 2);

        // receive and change indices are not touched.
        EXPECT_EQ (w.AddressManager.indices ().Receive, 0);
        EXPECT_EQ (w.AddressManager.indices ().Change, 0);

        wallet bip45 = test::make_wallet (2, 3, coin::part, network::livenet);
        EXPECT_EQ (create_cold_staking_address (bip45, test::XPub2), "RKtCfsoayv3KrJNtV1QrpcGtbFv1csw5G2");

        wallet single = test::make_wallet (1, 1, coin::part, network::livenet, derivation_strategy::BIP44);
        EXPECT_EQ (create_cold_staking_address (single, test::XPub1), "PiXT6NStg5DHePZtNFRkQuMykYAHhQKyzs");

        wallet testnet = test::make_wallet (1, 1, coin::part, network::testnet);
        EXPECT_EQ (create_cold_staking_address (testnet, test::ParticlTestnetXPub1), "pjYR3EUHHJhLUaMpazoYoJ9r1PVK5kGRRp");
    }

    TEST (ColdStaking, CreateAddressPending) {
        wallet w = test::make_pending_wallet (2, 3, coin::part, network::livenet);
        w.add_copayer (test::make_copayer (test::XPub1, coin::part));

        EXPECT_THROW (create_cold_staking_address (w, test::XPub1), precondition_violation);
        EXPECT_EQ (w.AddressManager.indices ().ColdStaking, 0);

        // a staking address needs no ring.
        EXPECT_EQ (create_cold_staking_address (w, StakingAddress), StakingAddress);
    }

    TEST (ColdStaking, ParticlExtendedPubkey) {
        wallet w = test::make_wallet (2, 3, coin::part, network::livenet);
        cold_staking_coordinator {w}.setup (test::ParticlXPub1);
        EXPECT_EQ (w.ColdStakingSetup->StakingKey, test::ParticlXPub1);

        maybe<cold_staking_addresses> x = get_cold_staking_addresses (w, std::string {"spend"});
        ASSERT_TRUE (bool (x));
        EXPECT_EQ (x->StakingAddress, "PnDmGgWMzBnYMRLZ3Ee1kDT13L2GnyRyB5");
        EXPECT_EQ (w.ColdStakingSetup->AddressIndex, 1);
    }

    TEST (ColdStaking, InvalidInput) {
        wallet w = test::make_wallet (2, 3, coin::part, network::livenet);
        cold_staking_coordinator {w}.setup (test::XPub1);
        wallet before = w;

        EXPECT_THROW (create_cold_staking_address (w, "garbage"), validation_failure);
        EXPECT_THROW (create_cold_staking_address (w, TestnetStakingAddress), validation_failure);
        EXPECT_THROW (cold_staking_coordinator {w}.setup ("garbage"), validation_failure);
        EXPECT_EQ (w, before);

        // a setup that became invalid is reported and nothing changes.
        w.update_cold_staking_setup (cold_staking_setup {std::string {"garbage"}});
        before = w;
        EXPECT_THROW (get_cold_staking_addresses (w), validation_failure);
        EXPECT_EQ (w, before);
    }

    TEST (ColdStaking, Strict) {
        wallet_options strict {};
        strict.StrictStakingValidation = true;

        wallet w = test::make_wallet (2, 3, coin::part, network::livenet);
        wallet before = w;
        EXPECT_THROW (create_cold_staking_address (w, BadChecksumStakingAddress, strict), validation_failure);
        EXPECT_THROW ((cold_staking_coordinator {w, strict}.setup (BadChecksumStakingAddress)), validation_failure);
        EXPECT_EQ (w, before);

        EXPECT_EQ (create_cold_staking_address (w, BadChecksumStakingAddress), BadChecksumStakingAddress);
        EXPECT_EQ (create_cold_staking_address (w, StakingAddress, strict), StakingAddress);
    }

}
