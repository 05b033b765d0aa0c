#ifndef QUORUM_COPAYER
#define QUORUM_COPAYER

#include <Quorum/keys/derivation.hpp>

namespace Quorum {

    // a key that a copayer uses to authenticate requests.
    struct request_key {
        std::string Key;
        std::string Signature;
        bool SelfSigned;

        // opaque to us.
        JSON Restrictions;
        maybe<std::string> Name;

        request_key () : Key {}, Signature {}, SelfSigned {true}, Restrictions (JSON::object_t {}), Name {} {}
        request_key (const std::string &k, const std::string &sig, const JSON &restrictions, const maybe<std::string> &name);

        bool operator == (const request_key &x) const {
            return Key == x.Key && Signature == x.Signature && SelfSigned == x.SelfSigned &&
                Restrictions == x.Restrictions && Name == x.Name;
        }

        explicit request_key (const JSON &);
        explicit operator JSON () const;
    };

    // one of the signers of a wallet.
    struct copayer {
        std::string Version;
        uint32 CreatedOn;

        // derived from the coin and the xpub. See copayer_id.
        std::string ID;

        std::string Name;
        Quorum::coin Coin;
        std::string XPubKey;

        // request key that the copayer joined with.
        maybe<std::string> RequestPubKey;
        maybe<std::string> Signature;

        // newest first. Keys are never removed.
        list<request_key> RequestPubKeys;

        JSON CustomData;

        copayer () : Version {}, CreatedOn {0}, ID {}, Name {}, Coin {coin::invalid}, XPubKey {},
            RequestPubKey {}, Signature {}, RequestPubKeys {}, CustomData (nullptr) {}

        struct parameters {
            std::string Name;
            Quorum::coin Coin {coin::btc};
            std::string XPubKey;
            maybe<std::string> RequestPubKey {};
            maybe<std::string> Signature {};
            JSON CustomData = JSON (nullptr);
        };

        // throws validation_failure if the xpub is invalid and
        // precondition_violation if the coin is not supported.
        static copayer create (const parameters &);

        public_key_ring_entry ring_entry () const {
            return public_key_ring_entry {XPubKey, RequestPubKey};
        }

        // push a new request key to the front of the list.
        void add_request_key (const request_key &);

        bool valid () const {
            return ID != "" && XPubKey != "" && supported (Coin);
        }

        bool operator == (const copayer &x) const {
            return Version == x.Version && CreatedOn == x.CreatedOn && ID == x.ID && Name == x.Name &&
                Coin == x.Coin && XPubKey == x.XPubKey && RequestPubKey == x.RequestPubKey &&
                Signature == x.Signature && RequestPubKeys == x.RequestPubKeys && CustomData == x.CustomData;
        }

        explicit copayer (const JSON &);
        explicit operator JSON () const;
    };

    // hex sha256 of the xpub. For coins other than btc, the name of the coin is prepended.
    std::string copayer_id (coin, const std::string &xpub);

    std::ostream &operator << (std::ostream &, const copayer &);

}

#endif
