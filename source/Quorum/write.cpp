#include <Quorum/write.hpp>
#include <charconv>
#include <fstream>

namespace Quorum {

    std::string write_path (const HD::BIP_32::path &p) {
        std::stringstream ss;
        ss << "m";
        for (const uint32 &u : p) ss << "/" << u;
        return ss.str ();
    }

    HD::BIP_32::path read_path (const std::string &x) {
        if (x.size () == 0 || x[0] != 'm') throw validation_failure {"path", "must begin with 'm'"};

        HD::BIP_32::path p;
        size_t begin = 1;
        while (begin < x.size ()) {
            if (x[begin] != '/') throw validation_failure {"path", "steps must be separated by '/'"};
            begin++;

            size_t end = x.find ('/', begin);
            if (end == std::string::npos) end = x.size ();

            uint32 step;
            auto [ptr, ec] = std::from_chars (x.data () + begin, x.data () + end, step);
            if (ec != std::errc () || ptr != x.data () + end)
                throw validation_failure {"path", data::string::write ("could not read step in ", x)};

            p <<= step;
            begin = end;
        }

        return p;
    }

    JSON read_from_file (const filepath &p) {
        if (!std::filesystem::exists (p)) return JSON (nullptr);
        std::ifstream file;
        file.open (p, std::ios::in);
        if (!file) throw exception {} << "could not open file " << p;
        return JSON::parse (file);
    }

    void write_to_file (const JSON &j, const filepath &p) {
        std::fstream file;
        file.open (p, std::ios::out);
        if (!file) throw exception {} << "could not open file " << p;
        file << j.dump (2, ' ');
        file.close ();
        if (file.fail ()) throw exception {} << "could not write file " << p;
    }

    const JSON &read_field (const JSON &j, const std::string &name) {
        if (!j.is_object () || !j.contains (name))
            throw validation_failure {name, "missing required field"};
        return j[name];
    }

}
