#include <Quorum/keys/bech32.hpp>
#include <cctype>

namespace Quorum::bech32 {

    namespace {
        const char *Charset = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

        int charset_index (char c) {
            for (int i = 0; i < 32; i++) if (Charset[i] == c) return i;
            return -1;
        }

        uint32 polymod (const bytes &values) {
            uint32 chk = 1;
            for (byte v : values) {
                byte top = chk >> 25;
                chk = (chk & 0x1ffffff) << 5 ^ v;
                if (top & 0x01) chk ^= 0x3b6a57b2;
                if (top & 0x02) chk ^= 0x26508e6d;
                if (top & 0x04) chk ^= 0x1ea119fa;
                if (top & 0x08) chk ^= 0x3d4233dd;
                if (top & 0x10) chk ^= 0x2a1462b3;
            }
            return chk;
        }

        bytes expand_prefix (const std::string &prefix) {
            bytes x;
            for (char c : prefix) x.push_back (static_cast<byte> (c) >> 5);
            x.push_back (0);
            for (char c : prefix) x.push_back (static_cast<byte> (c) & 0x1f);
            return x;
        }

        bool valid_prefix (const std::string &prefix) {
            if (prefix.size () < 1 || prefix.size () > 83) return false;
            for (char c : prefix) if (c < 33 || c > 126) return false;
            return true;
        }
    }

    std::string encode (const std::string &prefix, const bytes &values) {
        if (!valid_prefix (prefix)) throw exception {} << "invalid bech32 prefix " << prefix;

        bytes checked = expand_prefix (prefix);
        for (byte v : values) {
            if (v > 31) throw exception {} << "bech32 values must be 5 bits";
            checked.push_back (v);
        }
        for (int i = 0; i < 6; i++) checked.push_back (0);

        uint32 mod = polymod (checked) ^ 1;

        std::string x = prefix + "1";
        for (byte v : values) x += Charset[v];
        for (int i = 0; i < 6; i++) x += Charset[(mod >> (5 * (5 - i))) & 31];
        return x;
    }

    decoded decode (const std::string &x) {
        if (x.size () < 8 || x.size () > 90) return {};

        bool lower = false;
        bool upper = false;
        for (char c : x) {
            if (std::islower (static_cast<unsigned char> (c))) lower = true;
            if (std::isupper (static_cast<unsigned char> (c))) upper = true;
        }

        if (lower && upper) return {};

        std::string s = data::to_lower (x);

        size_t separator = s.rfind ('1');
        if (separator == std::string::npos || separator == 0 || separator + 7 > s.size ()) return {};

        std::string prefix = s.substr (0, separator);
        if (!valid_prefix (prefix)) return {};

        bytes values;
        for (char c : s.substr (separator + 1)) {
            int v = charset_index (c);
            if (v < 0) return {};
            values.push_back (static_cast<byte> (v));
        }

        bytes checked = expand_prefix (prefix);
        for (byte v : values) checked.push_back (v);
        if (polymod (checked) != 1) return {};

        values.resize (values.size () - 6);
        return decoded {prefix, values};
    }

    maybe<bytes> convert_bits (const bytes &in, int from, int to, bool pad) {
        uint32 acc = 0;
        int bits = 0;
        const uint32 max = (1 << to) - 1;
        bytes out;
        for (byte v : in) {
            if (v >> from) return {};
            acc = (acc << from) | v;
            bits += from;
            while (bits >= to) {
                bits -= to;
                out.push_back (static_cast<byte> ((acc >> bits) & max));
            }
        }

        if (pad) {
            if (bits) out.push_back (static_cast<byte> ((acc << (to - bits)) & max));
        } else if (bits >= from || ((acc << (to - bits)) & max)) return {};

        return out;
    }

    std::string encode_witness (const std::string &prefix, byte version, const bytes &program) {
        if (version > 16) throw exception {} << "invalid witness version " << int (version);
        if (program.size () < 2 || program.size () > 40) throw exception {} << "invalid witness program size " << program.size ();

        bytes values;
        values.push_back (version);
        for (byte v : *convert_bits (program, 8, 5, true)) values.push_back (v);
        return encode (prefix, values);
    }

}
