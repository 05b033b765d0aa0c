#include <Quorum/store.hpp>
#include "vectors.hpp"
#include "gtest/gtest.h"

namespace Quorum {

    TEST (Store, Lock) {
        memory_wallet_lock l {};

        wallet_lock::handle a = l.acquire ("a");
        EXPECT_TRUE (l.locked ("a"));
        EXPECT_THROW (l.acquire ("a"), lock_contention);

        // other wallets are independent.
        wallet_lock::handle b = l.acquire ("b");

        l.release (a);
        EXPECT_FALSE (l.locked ("a"));
        EXPECT_TRUE (l.locked ("b"));

        // a stale handle does not release a lock that someone else holds.
        wallet_lock::handle c = l.acquire ("a");
        l.release (a);
        EXPECT_TRUE (l.locked ("a"));

        l.release (b);
        l.release (c);
        EXPECT_FALSE (l.locked ("a"));
        EXPECT_FALSE (l.locked ("b"));
    }

    TEST (Store, Update) {
        memory_wallet_store s {};
        memory_wallet_lock l {};

        wallet w = test::make_wallet (2, 3, coin::btc, network::livenet);
        insert_wallet (s, l, w);
        EXPECT_THROW (insert_wallet (s, l, w), precondition_violation);
        EXPECT_FALSE (l.locked (w.ID));

        std::string a = update<std::string> (s, l, w.ID, [] (wallet &x) -> std::string {
            return x.create_address (false).Address;
        });

        EXPECT_EQ (a, "3CcL5jUnXHG73762G7RNnazH1futs5TorP");
        EXPECT_FALSE (l.locked (w.ID));

        maybe<wallet> saved = load_wallet (s, w.ID);
        ASSERT_TRUE (bool (saved));
        EXPECT_EQ (saved->AddressManager.indices ().Receive, 1);

        // if the function throws, nothing is saved and the lock is released.
        EXPECT_THROW (update<void> (s, l, w.ID, [] (wallet &x) {
            x.create_address (false);
            throw exception {} << "fail";
        }), exception);

        EXPECT_FALSE (l.locked (w.ID));
        EXPECT_EQ (load_wallet (s, w.ID)->AddressManager.indices ().Receive, 1);

        EXPECT_THROW (update<void> (s, l, "nobody", [] (wallet &) {}), precondition_violation);

        // a held lock blocks updates.
        {
            held_lock h {l, w.ID};
            EXPECT_THROW (update<void> (s, l, w.ID, [] (wallet &x) {
                x.create_address (false);
            }), lock_contention);
        }

        EXPECT_FALSE (l.locked (w.ID));
        EXPECT_EQ (load_wallet (s, w.ID)->AddressManager.indices ().Receive, 1);
    }

    TEST (Store, Join) {
        memory_wallet_store s {};
        memory_wallet_lock l {};

        wallet w = test::make_pending_wallet (2, 2, coin::part, network::livenet);
        insert_wallet (s, l, w);

        for (const std::string &xpub : {test::XPub1, test::XPub2})
            update<void> (s, l, w.ID, [&xpub] (wallet &x) {
                x.add_copayer (test::make_copayer (xpub, coin::part));
            });

        EXPECT_TRUE (load_wallet (s, w.ID)->complete ());
        EXPECT_EQ (s.wallets ().size (), 1);
    }

    TEST (Store, File) {
        filepath dir = std::filesystem::temp_directory_path () / ("quorum_store_test_" + test::make_pending_wallet (1, 1, coin::btc, network::livenet).ID);

        {
            file_wallet_store s {dir};
            memory_wallet_lock l {};

            wallet w = test::make_wallet (1, 1, coin::btc, network::livenet);
            insert_wallet (s, l, w);

            update<void> (s, l, w.ID, [] (wallet &x) {
                x.create_address (true);
            });

            file_wallet_store again {dir};
            maybe<wallet> loaded = load_wallet (again, w.ID);
            ASSERT_TRUE (bool (loaded));
            EXPECT_EQ (loaded->AddressManager.indices ().Change, 1);
            EXPECT_EQ (loaded->ID, w.ID);
            EXPECT_EQ (again.wallets ().size (), 1);

            EXPECT_FALSE (bool (load_wallet (again, "missing")));
            EXPECT_THROW (again.load ("../escape"), validation_failure);
        }

        std::filesystem::remove_all (dir);
    }

    TEST (Store, FileLock) {
        filepath dir = std::filesystem::temp_directory_path () / ("quorum_lock_test_" + test::make_pending_wallet (1, 1, coin::btc, network::livenet).ID);

        {
            // two locks on one directory stand for two processes.
            file_wallet_lock first {dir};
            file_wallet_lock second {dir};

            wallet_lock::handle a = first.acquire ("a");
            EXPECT_TRUE (first.locked ("a"));
            EXPECT_TRUE (second.locked ("a"));
            EXPECT_THROW (first.acquire ("a"), lock_contention);
            EXPECT_THROW (second.acquire ("a"), lock_contention);

            // other wallets are independent.
            wallet_lock::handle b = second.acquire ("b");
            EXPECT_TRUE (first.locked ("b"));

            first.release (a);
            EXPECT_FALSE (second.locked ("a"));
            wallet_lock::handle c = second.acquire ("a");

            // a handle from another lock releases nothing.
            first.release (c);
            EXPECT_TRUE (first.locked ("a"));

            second.release (b);
            second.release (c);
            EXPECT_FALSE (first.locked ("a"));
            EXPECT_FALSE (first.locked ("b"));

            EXPECT_THROW (first.acquire ("../escape"), validation_failure);

            // an update through one lock is refused while the other holds the wallet.
            file_wallet_store s {dir};
            wallet w = test::make_wallet (2, 3, coin::btc, network::livenet);
            insert_wallet (s, first, w);
            EXPECT_EQ (s.wallets ().size (), 1);

            {
                held_lock h {second, w.ID};
                EXPECT_THROW (update<void> (s, first, w.ID, [] (wallet &x) {
                    x.create_address (false);
                }), lock_contention);
            }

            EXPECT_EQ (update<std::string> (s, first, w.ID, [] (wallet &x) -> std::string {
                return x.create_address (false).Address;
            }), "3CcL5jUnXHG73762G7RNnazH1futs5TorP");

            EXPECT_FALSE (second.locked (w.ID));
            EXPECT_EQ (load_wallet (s, w.ID)->AddressManager.indices ().Receive, 1);
        }

        std::filesystem::remove_all (dir);
    }

    TEST (Store, WriteFailure) {
        if (!std::filesystem::exists ("/dev/full")) GTEST_SKIP ();
        EXPECT_THROW (write_to_file (JSON::parse (R"({"id": "x"})"), "/dev/full"), exception);
    }

}
