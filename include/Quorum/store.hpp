#ifndef QUORUM_STORE
#define QUORUM_STORE

#include <Quorum/wallet.hpp>
#include <mutex>
#include <type_traits>
#include <set>
#include <map>
#include <utility>

namespace Quorum {

    // the lock for a wallet could not be acquired. The caller may retry.
    struct lock_contention : std::runtime_error {
        std::string WalletID;
        lock_contention (const std::string &id) :
            std::runtime_error {data::string::write ("wallet ", id, " is locked")}, WalletID {id} {}
    };

    // persisted wallet documents keyed by wallet id.
    struct wallet_store {
        virtual maybe<JSON> load (const std::string &wallet_id) const = 0;
        virtual void save (const std::string &wallet_id, const JSON &) = 0;
        virtual list<std::string> wallets () const = 0;
        virtual ~wallet_store () {}
    };

    // exclusive lock per wallet id. Only one mutation
    // of a given wallet may be in progress at a time.
    struct wallet_lock {
        struct handle {
            std::string WalletID;
            uint64 Token;
        };

        // throws lock_contention if the lock is held. Never blocks.
        virtual handle acquire (const std::string &wallet_id) = 0;
        virtual void release (const handle &) = 0;
        virtual ~wallet_lock () {}
    };

    // releases the lock on every exit path.
    struct held_lock {
        wallet_lock &Lock;
        wallet_lock::handle Handle;

        held_lock (wallet_lock &l, const std::string &wallet_id) : Lock {l}, Handle {l.acquire (wallet_id)} {}
        ~held_lock () {
            Lock.release (Handle);
        }

        held_lock (const held_lock &) = delete;
        held_lock &operator = (const held_lock &) = delete;
    };

    // read a wallet without taking the lock.
    maybe<wallet> load_wallet (const wallet_store &, const std::string &wallet_id);

    // save a new wallet. Throws precondition_violation if a wallet with the same id exists.
    void insert_wallet (wallet_store &, wallet_lock &, const wallet &);

    // acquire the lock, load the wallet, apply f, save the wallet and release the lock.
    // if f throws, nothing is saved. Throws precondition_violation if there is no such wallet.
    template <typename X> X update (wallet_store &, wallet_lock &, const std::string &wallet_id, function<X (wallet &)> f);

    struct memory_wallet_store final : wallet_store {
        maybe<JSON> load (const std::string &wallet_id) const final override;
        void save (const std::string &wallet_id, const JSON &) final override;
        list<std::string> wallets () const final override;

    private:
        std::map<std::string, JSON> Wallets {};
    };

    // one file <id>.json per wallet in a directory.
    struct file_wallet_store final : wallet_store {
        filepath Directory;

        // the directory is created if it does not exist.
        file_wallet_store (const filepath &dir);

        maybe<JSON> load (const std::string &wallet_id) const final override;
        void save (const std::string &wallet_id, const JSON &) final override;
        list<std::string> wallets () const final override;

    private:
        filepath path (const std::string &wallet_id) const;
    };

    // one lock file <id>.lock per wallet in a directory. The lock is an
    // exclusive flock on the file, so it excludes other processes as well
    // as other handles in this one. It is dropped if the process dies.
    struct file_wallet_lock final : wallet_lock {
        filepath Directory;

        // the directory is created if it does not exist.
        file_wallet_lock (const filepath &dir);
        ~file_wallet_lock ();

        handle acquire (const std::string &wallet_id) final override;
        void release (const handle &) final override;

        bool locked (const std::string &wallet_id) const;

        file_wallet_lock (const file_wallet_lock &) = delete;
        file_wallet_lock &operator = (const file_wallet_lock &) = delete;

    private:
        filepath path (const std::string &wallet_id) const;

        std::mutex Mutex {};
        // wallet id and file descriptor by token.
        std::map<uint64, std::pair<std::string, int>> Held {};
        uint64 Next {1};
    };

    // lock for wallets in a single process.
    struct memory_wallet_lock final : wallet_lock {
        handle acquire (const std::string &wallet_id) final override;
        void release (const handle &) final override;

        bool locked (const std::string &wallet_id) const;

    private:
        mutable std::mutex Mutex {};
        std::map<std::string, uint64> Held {};
        uint64 Next {1};
    };

    template <typename X> X update (wallet_store &s, wallet_lock &l, const std::string &wallet_id, function<X (wallet &)> f) {
        held_lock h {l, wallet_id};

        maybe<wallet> w = load_wallet (s, wallet_id);
        if (!bool (w)) throw precondition_violation {"walletId", data::string::write ("no wallet ", wallet_id)};

        if constexpr (std::is_void_v<X>) {
            f (*w);
            w->check_consistency ();
            s.save (wallet_id, JSON (*w));
        } else {
            X x = f (*w);
            w->check_consistency ();
            s.save (wallet_id, JSON (*w));
            return x;
        }
    }

}

#endif
