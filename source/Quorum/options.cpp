#include <Quorum/options.hpp>
#include <Quorum/write.hpp>

namespace Quorum {

    wallet_options::wallet_options (const JSON &j) {
        if (j == JSON (nullptr)) return;

        if (!j.is_object ()) throw validation_failure {"options", "must be a JSON object"};

        if (j.contains ("derivation_strategy")) {
            if (!j["derivation_strategy"].is_string ())
                throw validation_failure {"derivation_strategy", "must be a string"};

            DerivationStrategy = read_derivation_strategy (std::string (j["derivation_strategy"]));
            if (DerivationStrategy == derivation_strategy::invalid)
                throw validation_failure {"derivation_strategy", "must be one of BIP44, BIP45"};
        }

        if (j.contains ("strict_staking_validation")) {
            if (!j["strict_staking_validation"].is_boolean ())
                throw validation_failure {"strict_staking_validation", "must be a boolean"};

            StrictStakingValidation = bool (j["strict_staking_validation"]);
        }
    }

    wallet_options::operator JSON () const {
        JSON::object_t o;
        o["derivation_strategy"] = write (DerivationStrategy);
        o["strict_staking_validation"] = StrictStakingValidation;
        return o;
    }

    wallet_options read_options_from_file (const filepath &p) {
        return wallet_options {read_from_file (p)};
    }

}
