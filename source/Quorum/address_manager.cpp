#include <Quorum/address_manager.hpp>

namespace Quorum {

    address_indices::address_indices (const JSON &j) :
        Receive {uint32 (read_field (j, "receiveIndex"))},
        Change {uint32 (read_field (j, "changeIndex"))},
        ColdStaking {j.contains ("coldStakingIndex") ? uint32 (j["coldStakingIndex"]) : uint32 {0}} {}

    address_indices::operator JSON () const {
        JSON::object_t x;
        x["receiveIndex"] = Receive;
        x["changeIndex"] = Change;
        x["coldStakingIndex"] = ColdStaking;
        return x;
    }

    address_manager address_manager::create (derivation_strategy d) {
        if (d == derivation_strategy::invalid)
            throw precondition_violation {"derivationStrategy", "must be one of BIP44, BIP45"};

        address_manager m {};
        m.Strategy = d;
        m.Indices[d] = address_indices {};
        return m;
    }

    const address_indices &address_manager::indices () const {
        if (!valid ()) throw precondition_violation {"addressManager", "address manager was not created"};
        return Indices.find (Strategy)->second;
    }

    HD::BIP_32::path address_manager::path (uint32 branch, uint32 index) const {
        if (Strategy == derivation_strategy::BIP45)
            return HD::BIP_32::path {wallet_options::BIP45SharedIndex, branch, index};
        return HD::BIP_32::path {branch, index};
    }

    uint32 &address_manager::next (uint32 &index) {
        if (HD::BIP_32::hardened (index))
            throw precondition_violation {"addressManager", "no more non-hardened indices on this branch"};
        return ++index;
    }

    HD::BIP_32::path address_manager::current_address_path (bool change) const {
        const address_indices &x = indices ();
        return change ?
            path (wallet_options::ChangeBranch, x.Change) :
            path (wallet_options::ReceiveBranch, x.Receive);
    }

    HD::BIP_32::path address_manager::new_address_path (bool change) {
        HD::BIP_32::path p = current_address_path (change);
        address_indices &x = Indices[Strategy];
        next (change ? x.Change : x.Receive);
        return p;
    }

    HD::BIP_32::path address_manager::new_cold_staking_address_path () {
        const address_indices &current = indices ();
        HD::BIP_32::path p = path (wallet_options::ColdStakingBranch, current.ColdStaking);
        next (Indices[Strategy].ColdStaking);
        return p;
    }

    address_manager::address_manager (const JSON &j) : address_manager {} {
        if (j == JSON (nullptr)) return;

        if (!j.is_object ()) throw validation_failure {"addressManager", "must be a JSON object"};

        Strategy = read_derivation_strategy (std::string (read_field (j, "strategy")));
        if (Strategy == derivation_strategy::invalid)
            throw validation_failure {"addressManager.strategy", "must be one of BIP44, BIP45"};

        for (const auto &[key, value] : read_field (j, "indices").items ()) {
            derivation_strategy d = read_derivation_strategy (key);
            if (d == derivation_strategy::invalid)
                throw validation_failure {"addressManager.indices", data::string::write ("unknown strategy ", key)};
            Indices[d] = address_indices {value};
        }

        if (!valid ()) throw validation_failure {"addressManager.indices", "no indices for active strategy"};
    }

    address_manager::operator JSON () const {
        if (!valid ()) return JSON (nullptr);

        JSON::object_t x;
        for (const auto &[key, value] : Indices)
            x[write (key)] = JSON (value);

        JSON::object_t j;
        j["strategy"] = write (Strategy);
        j["indices"] = x;
        return j;
    }

    std::ostream &operator << (std::ostream &o, const address_manager &m) {
        if (!m.valid ()) return o << "address_manager {}";
        const address_indices &x = m.indices ();
        return o << "address_manager {" << m.Strategy << ", receive: " << x.Receive <<
            ", change: " << x.Change << ", cold staking: " << x.ColdStaking << "}";
    }

}
