#ifndef QUORUM_COMMAND
#define QUORUM_COMMAND

#include <data/io/arg_parser.hpp>
#include <Quorum/store.hpp>
#include <Quorum/cold_staking.hpp>

using namespace data;

using arg_parser = io::arg_parser;
using filepath = Quorum::filepath;

enum class meth {
    UNSET,
    HELP,         // print help messages
    VERSION,      // print a version message
    CREATE,       // create a pending wallet
    JOIN,         // add a copayer to a wallet
    REQUEST_KEY,  // add a request key to a copayer
    ADDRESS,      // create a new address
    DERIVE,       // derive the address at a path that was already issued
    COLD_STAKING, // cold staking setup and addresses
    SHOW          // print a wallet
};

meth read_method (const arg_parser &, uint32 index = 1);

namespace Quorum {
    struct error {
        int Code;
        maybe<std::string> Message;
        error () : Code {0}, Message {} {}
        error (int code) : Code {code}, Message {} {}
        error (int code, const std::string &err): Code {code}, Message {err} {}
        error (const std::string &err): Code {1}, Message {err} {}
    };
}

struct options : arg_parser {
    options (const arg_parser &ap) : arg_parser {ap} {}

    // directory of wallet files. --store or QUORUM_STORE.
    filepath store () const;

    // --config or QUORUM_CONFIG. Defaults are used if neither is given.
    Quorum::wallet_options wallet_options () const;

    // the wallet id, either the second positional argument or --wallet.
    std::string wallet_id () const;
};

Quorum::error run (const options &);

void version ();

void help (meth m = meth::UNSET);

void command_create (const options &);
void command_join (const options &);
void command_request_key (const options &);
void command_address (const options &);
void command_derive (const options &);
void command_cold_staking (const options &);
void command_show (const options &);

#endif
