#include "Quorum.hpp"

#include <data/io/exception.hpp>

int main (int arg_count, char **arg_values) {

    auto err = run (options {arg_parser {arg_count, arg_values}});

    if (err.Message) std::cout << "Error: " << static_cast<std::string> (*err.Message) << std::endl;
    else if (err.Code) std::cout << "Error: unknown." << std::endl;

    return err.Code;
}

Quorum::error run (const options &p) {

    try {

        if (p.has ("version")) version ();

        else if (p.has ("help")) help ();

        else {

            meth cmd = read_method (p);

            switch (cmd) {
                case meth::VERSION: {
                    version ();
                    break;
                }

                case meth::HELP: {
                    help (read_method (p, 2));
                    break;
                }

                case meth::CREATE: {
                    command_create (p);
                    break;
                }

                case meth::JOIN: {
                    command_join (p);
                    break;
                }

                case meth::REQUEST_KEY: {
                    command_request_key (p);
                    break;
                }

                case meth::ADDRESS: {
                    command_address (p);
                    break;
                }

                case meth::DERIVE: {
                    command_derive (p);
                    break;
                }

                case meth::COLD_STAKING: {
                    command_cold_staking (p);
                    break;
                }

                case meth::SHOW: {
                    command_show (p);
                    break;
                }

                default: {
                    std::cout << "Error: could not read user's command." << std::endl;
                    help ();
                }
            }
        }

    } catch (const Quorum::precondition_violation &x) {
        return Quorum::error {2, std::string {x.what ()}};
    } catch (const Quorum::validation_failure &x) {
        return Quorum::error {3, std::string {x.what ()}};
    } catch (const Quorum::lock_contention &x) {
        return Quorum::error {4, std::string {x.what ()}};
    } catch (const data::exception &x) {
        return Quorum::error {x.Code, std::string {x.what ()}};
    } catch (const Quorum::state_consistency_violation &) {
        throw;
    } catch (const std::exception &x) {
        return Quorum::error {1, std::string {x.what ()}};
    }

    return {};
}

meth read_method (const arg_parser &p, uint32 index) {
    maybe<std::string> m;
    p.get (index, m);
    if (!bool (m)) return meth::UNSET;

    std::string sanitized = data::to_lower (*m);

    if (sanitized == "help") return meth::HELP;
    if (sanitized == "version") return meth::VERSION;
    if (sanitized == "create") return meth::CREATE;
    if (sanitized == "join") return meth::JOIN;
    if (sanitized == "request_key") return meth::REQUEST_KEY;
    if (sanitized == "address") return meth::ADDRESS;
    if (sanitized == "derive") return meth::DERIVE;
    if (sanitized == "cold_staking") return meth::COLD_STAKING;
    if (sanitized == "show") return meth::SHOW;

    return meth::UNSET;
}

void help (meth m) {
    switch (m) {
        default : {
            version ();
            std::cout << "input should be <method> <args>... where method is "
                "\n\tcreate       -- create a new shared wallet."
                "\n\tjoin         -- add a copayer to a pending wallet."
                "\n\trequest_key  -- add a request key to a copayer of a complete wallet."
                "\n\taddress      -- create a new receive or change address."
                "\n\tderive       -- show the address at a path that was already issued."
                "\n\tcold_staking -- set up cold staking or get cold staking addresses."
                "\n\tshow         -- print a wallet."
                "\nevery method takes (--store=<directory>) or reads QUORUM_STORE, and (--config=<file>) or QUORUM_CONFIG."
                "\nuse help \"method\" for information on a specific method" << std::endl;
        } break;
        case meth::CREATE : {
            std::cout << "Create a new pending wallet. The wallet id is printed."
                "\narguments for method create:"
                "\n\t--m=<uint32> (number of signatures required)"
                "\n\t--n=<uint32> (number of copayers, at most 15)"
                "\n\t(--name=<wallet name>)"
                "\n\t(--coin=\"btc\"|\"bch\"|\"part\") (= \"btc\")"
                "\n\t(--network=\"livenet\"|\"testnet\") (= \"livenet\")"
                "\n\t(--id=<uuid>)"
                "\n\t(--single_address)"
                "\n\t(--pubkey=<hex>)"
                "\n\t(--derivation_strategy=\"BIP44\"|\"BIP45\")"
                "\n\t(--address_type=\"P2SH\"|\"P2WSH\"|\"P2PKH\")" << std::endl;
        } break;
        case meth::JOIN : {
            std::cout << "Add a copayer to a pending wallet. The copayer id is printed."
                "\narguments for method join:"
                "\n\t(--wallet=)<wallet id>"
                "\n\t--xpub=<extended public key>"
                "\n\t(--name=<copayer name>)"
                "\n\t(--request_key=<hex pubkey>)"
                "\n\t(--signature=<hex>)" << std::endl;
        } break;
        case meth::REQUEST_KEY : {
            std::cout << "arguments for method request_key:"
                "\n\t(--wallet=)<wallet id>"
                "\n\t--copayer=<copayer id>"
                "\n\t--key=<hex pubkey>"
                "\n\t--signature=<hex>"
                "\n\t(--name=<key name>)" << std::endl;
        } break;
        case meth::ADDRESS : {
            std::cout << "arguments for method address:"
                "\n\t(--wallet=)<wallet id>"
                "\n\t(--change)"
                "\n\t(--secondary) (use the secondary encoding)"
                "\n\t(--all) (both encodings of the same path)" << std::endl;
        } break;
        case meth::DERIVE : {
            std::cout << "arguments for method derive:"
                "\n\t(--wallet=)<wallet id>"
                "\n\t--path=<path, as in m/0/3>"
                "\n\t(--change)"
                "\n\t(--secondary)" << std::endl;
        } break;
        case meth::COLD_STAKING : {
            std::cout << "With --setup, store a new cold staking setup. With --create, return a staking address "
                "for a staking address or xpub. Otherwise, print the cold staking addresses of the wallet."
                "\narguments for method cold_staking:"
                "\n\t(--wallet=)<wallet id>"
                "\n\t(--setup=<staking address | xpub>)"
                "\n\t(--create=<staking address | xpub>)"
                "\n\t(--spend=<address>)" << std::endl;
        } break;
        case meth::SHOW : {
            std::cout << "Print a wallet as JSON."
                "\narguments for method show:"
                "\n\t(--wallet=)<wallet id>" << std::endl;
        } break;
    }
}

void version () {
    std::cout << "Quorum multisig wallet coordinator version 0.1.0" << std::endl;
}

namespace {

    template <typename X> maybe<X> read_option (const options &p, const std::string &name, X (*reader) (const std::string &)) {
        maybe<std::string> x;
        p.get (name, x);
        if (!bool (x)) return {};
        X result = reader (*x);
        if (result == X::invalid) throw Quorum::validation_failure {name, data::string::write ("could not read ", *x)};
        return result;
    }

}

void command_create (const options &p) {
    Quorum::file_wallet_store store {p.store ()};
    Quorum::file_wallet_lock lock {p.store ()};

    Quorum::wallet::parameters params {};

    maybe<uint32> m;
    maybe<uint32> n;
    p.get ("m", m);
    p.get ("n", n);
    if (!bool (m) || !bool (n)) throw data::exception {} << "parameters m and n are required";
    params.M = *m;
    params.N = *n;

    maybe<std::string> name;
    p.get ("name", name);
    if (bool (name)) params.Name = *name;

    p.get ("id", params.ID);
    p.get ("pubkey", params.PubKey);
    params.SingleAddress = p.has ("single_address");

    if (auto c = read_option (p, "coin", &Quorum::read_coin); bool (c)) params.Coin = *c;
    if (auto net = read_option (p, "network", &Quorum::read_network); bool (net)) params.Network = *net;
    params.DerivationStrategy = read_option (p, "derivation_strategy", &Quorum::read_derivation_strategy);
    params.AddressType = read_option (p, "address_type", &Quorum::read_script_type);

    Quorum::wallet w = Quorum::wallet::create (params, p.wallet_options ());
    Quorum::insert_wallet (store, lock, w);

    std::cout << w.ID << std::endl;
}

void command_join (const options &p) {
    Quorum::file_wallet_store store {p.store ()};
    Quorum::file_wallet_lock lock {p.store ()};
    std::string wallet_id = p.wallet_id ();

    Quorum::copayer::parameters params {};

    maybe<std::string> xpub;
    p.get ("xpub", xpub);
    if (!bool (xpub)) throw data::exception {} << "parameter xpub is required";
    params.XPubKey = *xpub;

    maybe<std::string> name;
    p.get ("name", name);
    if (bool (name)) params.Name = *name;

    p.get ("request_key", params.RequestPubKey);
    p.get ("signature", params.Signature);

    std::string copayer_id = Quorum::update<std::string> (store, lock, wallet_id,
        [&params] (Quorum::wallet &w) -> std::string {
            params.Coin = w.Coin;
            Quorum::copayer c = Quorum::copayer::create (params);
            w.add_copayer (c);
            return c.ID;
        });

    std::cout << copayer_id << std::endl;
}

void command_request_key (const options &p) {
    Quorum::file_wallet_store store {p.store ()};
    Quorum::file_wallet_lock lock {p.store ()};
    std::string wallet_id = p.wallet_id ();

    maybe<std::string> copayer_id;
    maybe<std::string> key;
    maybe<std::string> signature;
    maybe<std::string> name;
    p.get ("copayer", copayer_id);
    p.get ("key", key);
    p.get ("signature", signature);
    p.get ("name", name);

    if (!bool (copayer_id) || !bool (key) || !bool (signature))
        throw data::exception {} << "parameters copayer, key, and signature are required";

    Quorum::update<void> (store, lock, wallet_id, [&] (Quorum::wallet &w) {
        w.add_copayer_request_key (*copayer_id, *key, *signature, JSON (nullptr), name);
    });
}

void command_address (const options &p) {
    Quorum::file_wallet_store store {p.store ()};
    Quorum::file_wallet_lock lock {p.store ()};
    std::string wallet_id = p.wallet_id ();

    bool change = p.has ("change");
    bool secondary = p.has ("secondary");
    bool all = p.has ("all");

    JSON result = Quorum::update<JSON> (store, lock, wallet_id, [change, secondary, all] (Quorum::wallet &w) -> JSON {
        if (!all) return JSON (w.create_address (change, secondary));

        JSON::array_t addresses;
        for (const Quorum::address &a : w.create_addresses (change)) addresses.push_back (JSON (a));
        return addresses;
    });

    std::cout << result.dump (2) << std::endl;
}

void command_derive (const options &p) {
    Quorum::file_wallet_store store {p.store ()};
    std::string wallet_id = p.wallet_id ();

    maybe<std::string> path;
    p.get ("path", path);
    if (!bool (path)) throw data::exception {} << "parameter path is required";

    maybe<Quorum::wallet> w = Quorum::load_wallet (store, wallet_id);
    if (!bool (w)) throw data::exception {} << "no wallet " << wallet_id;

    std::cout << JSON (w->derive_address (Quorum::read_path (*path), p.has ("change"), p.has ("secondary"))).dump (2) << std::endl;
}

void command_cold_staking (const options &p) {
    Quorum::file_wallet_store store {p.store ()};
    Quorum::file_wallet_lock lock {p.store ()};
    std::string wallet_id = p.wallet_id ();
    Quorum::wallet_options o = p.wallet_options ();

    maybe<std::string> setup;
    maybe<std::string> create;
    maybe<std::string> spend;
    p.get ("setup", setup);
    p.get ("create", create);
    p.get ("spend", spend);

    if (bool (setup) && bool (create)) throw data::exception {} << "use only one of setup and create";

    JSON result = Quorum::update<JSON> (store, lock, wallet_id, [&] (Quorum::wallet &w) -> JSON {
        Quorum::cold_staking_coordinator coordinator {w, o};

        if (bool (setup)) {
            coordinator.setup (*setup, spend);
            return JSON (*w.get_cold_staking_setup ());
        }

        if (bool (create)) return JSON (coordinator.create_address (*create));

        maybe<Quorum::cold_staking_addresses> addresses = coordinator.get_addresses (spend);
        if (!bool (addresses)) return JSON (nullptr);
        return JSON (*addresses);
    });

    std::cout << result.dump (2) << std::endl;
}

void command_show (const options &p) {
    Quorum::file_wallet_store store {p.store ()};
    std::string wallet_id = p.wallet_id ();

    maybe<Quorum::wallet> w = Quorum::load_wallet (store, wallet_id);
    if (!bool (w)) throw data::exception {} << "no wallet " << wallet_id;

    std::cout << JSON (*w).dump (2) << std::endl;
}
