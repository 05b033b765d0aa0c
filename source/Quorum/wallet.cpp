#include <Quorum/wallet.hpp>
#include <gigamonkey/timestamp.hpp>
#include <data/crypto/random.hpp>
#include <iomanip>
#include <set>

namespace Quorum {

    std::ostream &operator << (std::ostream &o, wallet_status s) {
        switch (s) {
            case wallet_status::pending: return o << "pending";
            case wallet_status::complete: return o << "complete";
            default: return o << "invalid";
        }
    }

    wallet_status read_wallet_status (const std::string &x) {
        std::string sanitized = data::to_lower (x);
        if (sanitized == "pending") return wallet_status::pending;
        if (sanitized == "complete") return wallet_status::complete;
        return wallet_status::invalid;
    }

    cold_staking_setup::cold_staking_setup (const JSON &j) : cold_staking_setup {} {
        const JSON &key = read_field (j, "staking_key");
        if (!key.is_string ()) throw validation_failure {"staking_key", "must be a string"};
        StakingKey = std::string (key);
        SpendAddress = j.contains ("spend_address") ? read_maybe_string (j["spend_address"]) : maybe<std::string> {};
        AddressIndex = j.contains ("address_index") && !j["address_index"].is_null () ? uint32 (j["address_index"]) : 0;
    }

    cold_staking_setup::operator JSON () const {
        JSON::object_t x;
        x["staking_key"] = StakingKey;
        x["spend_address"] = write (SpendAddress);
        x["address_index"] = AddressIndex;
        return x;
    }

    namespace {
        // random UUID version 4.
        std::string new_wallet_id () {
            data::crypto::random::OS_entropy entropy {};

            bytes b;
            b.resize (16);
            entropy >> b;

            b[6] = (b[6] & 0x0f) | 0x40;
            b[8] = (b[8] & 0x3f) | 0x80;

            std::stringstream ss;
            ss << std::hex << std::setfill ('0');
            for (int i = 0; i < 16; i++) {
                if (i == 4 || i == 6 || i == 8 || i == 10) ss << "-";
                ss << std::setw (2) << uint32 (b[i]);
            }
            return ss.str ();
        }
    }

    wallet::wallet () : Version {}, CreatedOn {0}, ID {}, Name {}, M {0}, N {0}, SingleAddress {false},
        Status {wallet_status::invalid}, Copayers {}, PublicKeyRing {}, PubKey {}, Coin {coin::invalid},
        Network {network::invalid}, DerivationStrategy {derivation_strategy::invalid},
        AddressType {script_type::invalid}, AddressManager {}, ScanStatus (nullptr), ColdStakingSetup {} {}

    check wallet::check_copayer_limits (uint32 m, uint32 n) {
        if (n < 1 || n > wallet_options::MaxCopayers) return fail ("n", "must be between 1 and 15");
        if (m < 1 || m > n) return fail ("m", "must be between 1 and n");
        return pass ();
    }

    wallet wallet::create (const parameters &p, const wallet_options &o) {
        verify_copayer_limits (p.M, p.N);
        require (check_coin (p.Coin));
        require (check_network (p.Network));

        wallet w {};
        w.Version = wallet_options::WalletVersion;
        w.CreatedOn = uint32 (Bitcoin::timestamp::now ());
        w.ID = bool (p.ID) ? *p.ID : new_wallet_id ();
        w.Name = p.Name;
        w.M = p.M;
        w.N = p.N;
        w.SingleAddress = p.SingleAddress;
        w.Status = wallet_status::pending;
        w.PubKey = p.PubKey;
        w.Coin = p.Coin;
        w.Network = p.Network;
        w.DerivationStrategy = bool (p.DerivationStrategy) ? *p.DerivationStrategy : o.DerivationStrategy;
        w.AddressType = bool (p.AddressType) ? *p.AddressType : o.default_address_type (p.N);

        require (w.ID != "", "id", "must not be empty");
        require (w.AddressType != script_type::invalid, "addressType", "must be one of P2SH, P2WSH, P2PKH");
        require (w.AddressType != script_type::P2PKH || w.N == 1, "addressType", "P2PKH requires n = 1");
        require (w.AddressType != script_type::P2WSH || policy (w.Coin).supports_witness (w.Network),
            "addressType", data::string::write ("witness addresses not supported for ", w.Coin));
        require (w.AddressType != script_type::P2WSH || !policy (w.Coin).SupportsSecondaryEncoding,
            "addressType", data::string::write ("P2WSH has no secondary encoding, which ", w.Coin, " requires"));

        w.AddressManager = address_manager::create (w.DerivationStrategy);

        DATA_LOG (debug) << "created wallet " << w.ID << " " << w.M << " of " << w.N << " " << w.Coin << " " << w.Network;
        return w;
    }

    public_key_ring wallet::project_ring () const {
        public_key_ring ring;
        for (const copayer &c : Copayers) ring <<= c.ring_entry ();
        return ring;
    }

    void wallet::add_copayer (const copayer &c) {
        require (Status == wallet_status::pending, "status", "wallet is already complete");
        require (c.valid (), "copayer", "invalid copayer");
        require (c.Coin == Coin, "copayer.coin", data::string::write ("must be ", Coin));
        require (get_copayer (c.ID) == nullptr, "copayer.id", "copayer is already in the wallet");

        Copayers <<= c;
        PublicKeyRing = project_ring ();

        DATA_LOG (debug) << "wallet " << ID << ": copayer " << c.ID << " joined (" << Copayers.size () << " of " << N << ")";

        if (Copayers.size () == N) {
            Status = wallet_status::complete;
            DATA_LOG (info) << "wallet " << ID << " is complete";
        }

        check_consistency ();
    }

    void wallet::add_copayer_request_key (
        const std::string &copayer_id,
        const std::string &key,
        const std::string &signature,
        const JSON &restrictions,
        const maybe<std::string> &name) {

        require_complete ("add_copayer_request_key");
        require (get_copayer (copayer_id) != nullptr, "copayerId", "no such copayer");

        request_key k {key, signature, restrictions, name};

        list<copayer> updated;
        for (const copayer &c : Copayers) {
            if (c.ID != copayer_id) updated <<= c;
            else {
                copayer x = c;
                x.add_request_key (k);
                updated <<= x;
            }
        }

        Copayers = updated;
    }

    const copayer *wallet::get_copayer (const std::string &id) const {
        for (const copayer &c : Copayers) if (c.ID == id) return &c;
        return nullptr;
    }

    bool wallet::scanning () const {
        return ScanStatus.is_string () && std::string (ScanStatus) == "running";
    }

    void wallet::require_complete (const std::string &operation) const {
        if (!complete ()) throw precondition_violation {"status", data::string::write (operation, " requires a complete wallet")};
    }

    address wallet::derive_address (const HD::BIP_32::path &p, bool change, bool secondary) const {
        require_complete ("derive_address");
        return derive (ID, AddressType, PublicKeyRing, p, M, Coin, Network, change, secondary);
    }

    address wallet::create_address (bool change, bool secondary) {
        require_complete ("create_address");
        if (secondary && !policy (Coin).SupportsSecondaryEncoding)
            throw precondition_violation {"secondaryEncoding", data::string::write ("not supported for ", Coin)};

        return derive_address (AddressManager.new_address_path (change), change, secondary);
    }

    list<address> wallet::create_addresses (bool change) {
        require_complete ("create_addresses");

        HD::BIP_32::path p = AddressManager.new_address_path (change);

        list<address> addresses;
        addresses <<= derive_address (p, change);
        if (policy (Coin).SupportsSecondaryEncoding) addresses <<= derive_address (p, change, true);
        return addresses;
    }

    void wallet::update_cold_staking_setup (const maybe<cold_staking_setup> &x) {
        ColdStakingSetup = x;
    }

    void wallet::check_consistency () const {
        if (bool (check_copayer_limits (M, N)))
            inconsistent (data::string::write ("wallet ", ID, ": m = ", M, ", n = ", N));

        if (PublicKeyRing.size () != Copayers.size ())
            inconsistent (data::string::write ("wallet ", ID, ": public key ring has ", PublicKeyRing.size (),
                " entries but there are ", Copayers.size (), " copayers"));

        if (PublicKeyRing != project_ring ())
            inconsistent (data::string::write ("wallet ", ID, ": public key ring does not match copayers"));

        if (Copayers.size () > N)
            inconsistent (data::string::write ("wallet ", ID, ": too many copayers"));

        if ((Status == wallet_status::complete) != (Copayers.size () == N))
            inconsistent (data::string::write ("wallet ", ID, ": status ", Status, " with ", Copayers.size (), " of ", N, " copayers"));

        std::set<std::string> ids;
        for (const copayer &c : Copayers) {
            if (c.Coin != Coin) inconsistent (data::string::write ("wallet ", ID, ": copayer ", c.ID, " has coin ", c.Coin));
            if (!ids.insert (c.ID).second) inconsistent (data::string::write ("wallet ", ID, ": duplicate copayer ", c.ID));
        }

        if (!AddressManager.valid () || AddressManager.Strategy != DerivationStrategy)
            inconsistent (data::string::write ("wallet ", ID, ": address manager does not match derivation strategy"));
    }

    bool wallet::operator == (const wallet &w) const {
        return Version == w.Version && CreatedOn == w.CreatedOn && ID == w.ID && Name == w.Name &&
            M == w.M && N == w.N && SingleAddress == w.SingleAddress && Status == w.Status &&
            Copayers == w.Copayers && PublicKeyRing == w.PublicKeyRing && PubKey == w.PubKey &&
            Coin == w.Coin && Network == w.Network && DerivationStrategy == w.DerivationStrategy &&
            AddressType == w.AddressType && AddressManager == w.AddressManager &&
            ScanStatus == w.ScanStatus && ColdStakingSetup == w.ColdStakingSetup;
    }

    wallet::wallet (const JSON &j) : wallet {} {
        if (!j.is_object ()) throw validation_failure {"wallet", "must be a JSON object"};

        Version = std::string (read_field (j, "version"));
        CreatedOn = uint32 (read_field (j, "createdOn"));
        ID = std::string (read_field (j, "id"));
        Name = j.contains ("name") && j["name"].is_string () ? std::string (j["name"]) : std::string {};

        const JSON &m = read_field (j, "m");
        const JSON &n = read_field (j, "n");
        if (!m.is_number_unsigned () || !n.is_number_unsigned ()) throw validation_failure {"m, n", "must be numbers"};
        M = uint32 (m);
        N = uint32 (n);

        SingleAddress = j.contains ("singleAddress") && bool (j["singleAddress"]);

        Status = read_wallet_status (std::string (read_field (j, "status")));
        if (Status == wallet_status::invalid) throw validation_failure {"status", "must be pending or complete"};

        for (const JSON &c : read_field (j, "copayers")) Copayers <<= copayer {c};
        for (const JSON &e : read_field (j, "publicKeyRing")) PublicKeyRing <<= public_key_ring_entry {e};

        PubKey = j.contains ("pubKey") ? read_maybe_string (j["pubKey"]) : maybe<std::string> {};

        Coin = j.contains ("coin") ? read_coin (std::string (j["coin"])) : coin::btc;
        Network = read_network (std::string (read_field (j, "network")));
        if (!supported (Coin) || !supported (Network)) throw validation_failure {"coin, network", "unsupported"};

        DerivationStrategy = j.contains ("derivationStrategy") ?
            read_derivation_strategy (std::string (j["derivationStrategy"])) : wallet_options::DefaultDerivationStrategy;
        AddressType = j.contains ("addressType") ?
            read_script_type (std::string (j["addressType"])) : wallet_options::DefaultSharedAddressType;
        if (DerivationStrategy == derivation_strategy::invalid || AddressType == script_type::invalid)
            throw validation_failure {"derivationStrategy, addressType", "unrecognized"};
        if (AddressType == script_type::P2WSH && policy (Coin).SupportsSecondaryEncoding)
            throw validation_failure {"addressType", data::string::write ("P2WSH is not available for ", Coin)};

        AddressManager = address_manager {read_field (j, "addressManager")};
        ScanStatus = j.contains ("scanStatus") ? j["scanStatus"] : JSON (nullptr);

        // an empty object means no setup.
        if (j.contains ("coldStakingSetup") && !j["coldStakingSetup"].is_null () && !j["coldStakingSetup"].empty ())
            ColdStakingSetup = cold_staking_setup {j["coldStakingSetup"]};

        check_consistency ();
    }

    wallet::operator JSON () const {
        JSON::array_t copayers;
        for (const copayer &c : Copayers) copayers.push_back (JSON (c));

        JSON::array_t ring;
        for (const public_key_ring_entry &e : PublicKeyRing) ring.push_back (JSON (e));

        JSON::object_t x;
        x["version"] = Version;
        x["createdOn"] = CreatedOn;
        x["id"] = ID;
        x["name"] = Name;
        x["m"] = M;
        x["n"] = N;
        x["singleAddress"] = SingleAddress;
        x["status"] = write (Status);
        x["publicKeyRing"] = ring;
        x["copayers"] = copayers;
        x["pubKey"] = write (PubKey);
        x["coin"] = write (Coin);
        x["network"] = write (Network);
        x["derivationStrategy"] = write (DerivationStrategy);
        x["addressType"] = write (AddressType);
        x["addressManager"] = JSON (AddressManager);
        x["scanStatus"] = ScanStatus;
        x["coldStakingSetup"] = bool (ColdStakingSetup) ? JSON (*ColdStakingSetup) : JSON (nullptr);
        x["isShared"] = shared ();
        return x;
    }

    std::ostream &operator << (std::ostream &o, const wallet &w) {
        return o << "wallet {" << w.ID << ", " << w.M << " of " << w.N << ", " << w.Coin << ", " << w.Network <<
            ", " << w.Status << ", " << w.Copayers.size () << " copayers, " << w.AddressManager << "}";
    }

}
