#ifndef QUORUM_WRITE
#define QUORUM_WRITE

#include <gigamonkey/schema/hd.hpp>
#include <Quorum/error.hpp>

// provide standard ways of converting certain types into strings and back.
namespace Quorum {

    // paths are written as in "m/2147483647/0/12".
    std::string write_path (const HD::BIP_32::path &);
    HD::BIP_32::path read_path (const std::string &);

    JSON write (const maybe<std::string> &);
    maybe<std::string> read_maybe_string (const JSON &);

    // returns JSON null if the file does not exist.
    JSON read_from_file (const filepath &);
    void write_to_file (const JSON &, const filepath &);

    // read a required field from a JSON object.
    const JSON &read_field (const JSON &, const std::string &name);

    JSON inline write (const maybe<std::string> &x) {
        return bool (x) ? JSON (*x) : JSON (nullptr);
    }

    maybe<std::string> inline read_maybe_string (const JSON &j) {
        if (j.is_null ()) return {};
        if (!j.is_string ()) throw validation_failure {"JSON", "expected string or null"};
        return std::string (j);
    }
}

#endif
