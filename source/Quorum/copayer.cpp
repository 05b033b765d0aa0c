#include <Quorum/copayer.hpp>
#include <Quorum/keys/primitives.hpp>
#include <gigamonkey/timestamp.hpp>

namespace Quorum {

    std::string copayer_id (coin c, const std::string &xpub) {
        require (check_coin (c));
        return primitives::SHA2_256_hex (c == coin::btc ? xpub : write (c) + xpub);
    }

    request_key::request_key (const std::string &k, const std::string &sig, const JSON &restrictions, const maybe<std::string> &name) :
        Key {k}, Signature {sig}, SelfSigned {true},
        Restrictions (restrictions.is_null () ? JSON (JSON::object_t {}) : restrictions), Name {name} {
        require (k != "", "requestPubKey", "must not be empty");
    }

    request_key::request_key (const JSON &j) :
        Key {std::string (read_field (j, "key"))},
        Signature {std::string (read_field (j, "signature"))},
        SelfSigned {j.contains ("selfSigned") ? bool (j["selfSigned"]) : true},
        Restrictions (j.contains ("restrictions") ? j["restrictions"] : JSON (JSON::object_t {})),
        Name {j.contains ("name") ? read_maybe_string (j["name"]) : maybe<std::string> {}} {}

    request_key::operator JSON () const {
        JSON::object_t x;
        x["key"] = Key;
        x["signature"] = Signature;
        x["selfSigned"] = SelfSigned;
        x["restrictions"] = Restrictions;
        x["name"] = write (Name);
        return x;
    }

    copayer copayer::create (const parameters &p) {
        require (check_coin (p.Coin));
        primitives::read_xpub ("xPubKey", p.XPubKey);

        copayer c {};
        c.Version = wallet_options::CopayerVersion;
        c.CreatedOn = uint32 (Bitcoin::timestamp::now ());
        c.ID = copayer_id (p.Coin, p.XPubKey);
        c.Name = p.Name;
        c.Coin = p.Coin;
        c.XPubKey = p.XPubKey;
        c.RequestPubKey = p.RequestPubKey;
        c.Signature = p.Signature;
        c.CustomData = p.CustomData;

        if (bool (p.RequestPubKey))
            c.RequestPubKeys <<= request_key {*p.RequestPubKey, bool (p.Signature) ? *p.Signature : std::string {}, JSON (nullptr), {}};

        return c;
    }

    void copayer::add_request_key (const request_key &k) {
        list<request_key> keys;
        keys <<= k;
        for (const request_key &r : RequestPubKeys) keys <<= r;
        RequestPubKeys = keys;
    }

    copayer::copayer (const JSON &j) : copayer {} {
        Version = j.contains ("version") ? std::string (j["version"]) : std::string {wallet_options::CopayerVersion};
        CreatedOn = j.contains ("createdOn") ? uint32 (j["createdOn"]) : 0;
        ID = std::string (read_field (j, "id"));
        Name = j.contains ("name") && j["name"].is_string () ? std::string (j["name"]) : std::string {};
        Coin = read_coin (std::string (read_field (j, "coin")));
        if (!supported (Coin)) throw validation_failure {"copayer.coin", "must be one of btc, bch, part"};
        XPubKey = std::string (read_field (j, "xPubKey"));
        RequestPubKey = j.contains ("requestPubKey") ? read_maybe_string (j["requestPubKey"]) : maybe<std::string> {};
        Signature = j.contains ("signature") ? read_maybe_string (j["signature"]) : maybe<std::string> {};
        if (j.contains ("requestPubKeys")) for (const JSON &k : j["requestPubKeys"]) RequestPubKeys <<= request_key {k};
        CustomData = j.contains ("customData") ? j["customData"] : JSON (nullptr);
    }

    copayer::operator JSON () const {
        JSON::array_t keys;
        for (const request_key &k : RequestPubKeys) keys.push_back (JSON (k));

        JSON::object_t x;
        x["version"] = Version;
        x["createdOn"] = CreatedOn;
        x["id"] = ID;
        x["name"] = Name;
        x["coin"] = write (Coin);
        x["xPubKey"] = XPubKey;
        x["requestPubKey"] = write (RequestPubKey);
        x["signature"] = write (Signature);
        x["requestPubKeys"] = keys;
        x["customData"] = CustomData;
        return x;
    }

    std::ostream &operator << (std::ostream &o, const copayer &c) {
        return o << "copayer {" << c.ID << ", " << c.Name << ", " << c.Coin << "}";
    }

}
