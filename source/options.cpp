#include "Quorum.hpp"

filepath options::store () const {
    maybe<std::string> dir;
    this->get ("store", dir);
    if (bool (dir)) return filepath {*dir};

    const char *val = std::getenv ("QUORUM_STORE");
    if (bool (val)) return filepath {val};

    throw data::exception {} << "No wallet directory provided. Use --store or set QUORUM_STORE";
}

Quorum::wallet_options options::wallet_options () const {
    maybe<std::string> config;
    this->get ("config", config);
    if (!bool (config)) {
        const char *val = std::getenv ("QUORUM_CONFIG");
        if (bool (val)) config = std::string {val};
    }

    if (!bool (config)) return Quorum::wallet_options {};

    DATA_LOG (debug) << "reading options from " << *config;
    return Quorum::read_options_from_file (filepath {*config});
}

std::string options::wallet_id () const {
    maybe<std::string> id;
    this->get (2, "wallet", id);
    if (!bool (id)) throw data::exception {} << "No wallet id provided";
    return *id;
}
