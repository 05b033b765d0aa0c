#include <Quorum/copayer.hpp>
#include "vectors.hpp"
#include "gtest/gtest.h"

namespace Quorum {

    TEST (Copayer, ID) {
        EXPECT_EQ (copayer_id (coin::btc, test::XPub1), "ec71164a05b609c13b85dc898cff717b30b992ed1dfb35e0d2827626d23272ee");
        EXPECT_EQ (copayer_id (coin::part, test::XPub1), "11f1f2f5b74891d08e642713d63b90a52187f98967417e8ce75641e2bfebb74f");
        EXPECT_NE (copayer_id (coin::bch, test::XPub1), copayer_id (coin::btc, test::XPub1));
        EXPECT_THROW (copayer_id (coin::invalid, test::XPub1), precondition_violation);
    }

    TEST (Copayer, Create) {
        copayer c = test::make_copayer (test::XPub1, coin::btc, "alice");

        EXPECT_TRUE (c.valid ());
        EXPECT_EQ (c.ID, "ec71164a05b609c13b85dc898cff717b30b992ed1dfb35e0d2827626d23272ee");
        EXPECT_EQ (c.Version, wallet_options::CopayerVersion);
        EXPECT_EQ (c.Name, "alice");

        // the join request key is the first request key.
        ASSERT_EQ (c.RequestPubKeys.size (), 1);
        EXPECT_EQ (c.RequestPubKeys.first ().Key, "request key of alice");
        EXPECT_EQ (c.RequestPubKeys.first ().Signature, "signature of alice");
        EXPECT_TRUE (c.RequestPubKeys.first ().SelfSigned);

        EXPECT_EQ (c.ring_entry (), (public_key_ring_entry {test::XPub1, std::string {"request key of alice"}}));

        copayer::parameters p {};
        p.Coin = coin::btc;
        p.XPubKey = "not an xpub";
        EXPECT_THROW (copayer::create (p), validation_failure);

        p.XPubKey = test::XPub1;
        p.Coin = coin::invalid;
        EXPECT_THROW (copayer::create (p), precondition_violation);
    }

    TEST (Copayer, ParticlKey) {
        copayer c = test::make_copayer (test::ParticlXPub1, coin::part, "particl");
        EXPECT_TRUE (c.valid ());
        EXPECT_EQ (c.XPubKey, test::ParticlXPub1);
        EXPECT_EQ (c.ID, "22e7fe4ee58d5253fb9f7669d0335726fb90a1be0322f088907fb9d3d29ab0bf");
    }

    TEST (Copayer, RequestKeys) {
        copayer c = test::make_copayer (test::XPub2, coin::part, "bob");

        c.add_request_key (request_key {"key 2", "sig 2", JSON (nullptr), {}});
        c.add_request_key (request_key {"key 3", "sig 3", JSON::parse (R"({"readOnly": true})"), std::string {"phone"}});

        ASSERT_EQ (c.RequestPubKeys.size (), 3);

        std::vector<request_key> keys;
        for (const request_key &k : c.RequestPubKeys) keys.push_back (k);
        EXPECT_EQ (keys[0].Key, "key 3");
        EXPECT_EQ (keys[1].Key, "key 2");
        EXPECT_EQ (keys[2].Key, "request key of bob");

        EXPECT_EQ (keys[0].Name, maybe<std::string> {std::string {"phone"}});
        EXPECT_EQ (keys[0].Restrictions["readOnly"], true);

        // missing restrictions become an empty object.
        EXPECT_EQ (keys[1].Restrictions, JSON (JSON::object_t {}));
        EXPECT_FALSE (bool (keys[1].Name));

        EXPECT_THROW ((request_key {"", "sig", JSON (nullptr), {}}), precondition_violation);
    }

    TEST (Copayer, JSON) {
        copayer c = test::make_copayer (test::XPub3, coin::part, "carol");
        c.CustomData = JSON::parse (R"({"walletPrivKey": "abc"})");
        c.add_request_key (request_key {"key 2", "sig 2", JSON (nullptr), std::string {"laptop"}});

        JSON j = JSON (c);
        EXPECT_EQ (j["id"], c.ID);
        EXPECT_EQ (j["coin"], "part");
        EXPECT_EQ (j["requestPubKeys"].size (), 2);
        EXPECT_EQ (j["requestPubKeys"][0]["key"], "key 2");

        EXPECT_EQ (copayer {j}, c);

        j["coin"] = "doge";
        EXPECT_THROW (copayer {j}, validation_failure);
    }

}
