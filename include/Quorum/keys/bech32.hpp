#ifndef QUORUM_KEYS_BECH32
#define QUORUM_KEYS_BECH32

#include <Quorum/types.hpp>

// BIP 173 bech32 strings. Used for witness addresses and cold staking addresses.
namespace Quorum::bech32 {

    // values must be 5-bit numbers.
    std::string encode (const std::string &prefix, const bytes &values);

    struct decoded {
        std::string Prefix;
        // 5-bit values with the checksum removed.
        bytes Values;

        bool valid () const {
            return Prefix != "";
        }
    };

    // returns an invalid decoded if the string is not valid bech32.
    decoded decode (const std::string &);

    // regroup bits. Used to go from bytes to 5-bit values and back.
    maybe<bytes> convert_bits (const bytes &, int from, int to, bool pad);

    std::string encode_witness (const std::string &prefix, byte version, const bytes &program);

}

#endif
