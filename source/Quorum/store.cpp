#include <Quorum/store.hpp>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <cerrno>

namespace Quorum {

    maybe<wallet> load_wallet (const wallet_store &s, const std::string &wallet_id) {
        maybe<JSON> j = s.load (wallet_id);
        if (!bool (j)) return {};

        wallet w {*j};
        if (w.ID != wallet_id) inconsistent (data::string::write ("wallet ", wallet_id, " is stored with id ", w.ID));
        return w;
    }

    void insert_wallet (wallet_store &s, wallet_lock &l, const wallet &w) {
        held_lock h {l, w.ID};
        if (bool (s.load (w.ID))) throw precondition_violation {"id", data::string::write ("wallet ", w.ID, " already exists")};
        w.check_consistency ();
        s.save (w.ID, JSON (w));
    }

    maybe<JSON> memory_wallet_store::load (const std::string &wallet_id) const {
        auto x = Wallets.find (wallet_id);
        if (x == Wallets.end ()) return {};
        return x->second;
    }

    void memory_wallet_store::save (const std::string &wallet_id, const JSON &j) {
        Wallets[wallet_id] = j;
    }

    list<std::string> memory_wallet_store::wallets () const {
        list<std::string> ids;
        for (const auto &[id, _] : Wallets) ids <<= id;
        return ids;
    }

    namespace {
        void ensure_directory (const filepath &dir) {
            if (!std::filesystem::exists (dir) && !std::filesystem::create_directories (dir))
                throw exception {} << "could not create directory " << dir;
        }

        filepath wallet_file (const filepath &dir, const std::string &wallet_id, const std::string &extension) {
            if (wallet_id == "" || wallet_id.find_first_of ("/\\.") != std::string::npos)
                throw validation_failure {"walletId", "invalid characters"};
            return dir / (wallet_id + extension);
        }
    }

    file_wallet_store::file_wallet_store (const filepath &dir) : Directory {dir} {
        ensure_directory (Directory);
    }

    filepath file_wallet_store::path (const std::string &wallet_id) const {
        return wallet_file (Directory, wallet_id, ".json");
    }

    maybe<JSON> file_wallet_store::load (const std::string &wallet_id) const {
        JSON j = read_from_file (path (wallet_id));
        if (j.is_null ()) return {};
        return j;
    }

    void file_wallet_store::save (const std::string &wallet_id, const JSON &j) {
        filepath p = path (wallet_id);
        filepath tmp = p;
        tmp += ".tmp";
        write_to_file (j, tmp);
        std::filesystem::rename (tmp, p);
    }

    list<std::string> file_wallet_store::wallets () const {
        list<std::string> ids;
        for (const auto &entry : std::filesystem::directory_iterator {Directory})
            if (entry.is_regular_file () && entry.path ().extension () == ".json")
                ids <<= entry.path ().stem ().string ();
        return ids;
    }

    file_wallet_lock::file_wallet_lock (const filepath &dir) : Directory {dir} {
        ensure_directory (Directory);
    }

    file_wallet_lock::~file_wallet_lock () {
        for (const auto &[token, held] : Held) {
            ::flock (held.second, LOCK_UN);
            ::close (held.second);
        }
    }

    filepath file_wallet_lock::path (const std::string &wallet_id) const {
        return wallet_file (Directory, wallet_id, ".lock");
    }

    wallet_lock::handle file_wallet_lock::acquire (const std::string &wallet_id) {
        filepath p = path (wallet_id);

        int fd = ::open (p.c_str (), O_CREAT | O_RDWR, 0644);
        if (fd < 0) throw exception {} << "could not open lock file " << p;

        if (::flock (fd, LOCK_EX | LOCK_NB) < 0) {
            int err = errno;
            ::close (fd);
            if (err == EWOULDBLOCK) throw lock_contention {wallet_id};
            throw exception {} << "could not lock file " << p;
        }

        std::lock_guard<std::mutex> lock {Mutex};
        uint64 token = Next++;
        Held[token] = {wallet_id, fd};
        return handle {wallet_id, token};
    }

    void file_wallet_lock::release (const handle &h) {
        std::lock_guard<std::mutex> lock {Mutex};
        auto x = Held.find (h.Token);
        if (x == Held.end () || x->second.first != h.WalletID) {
            DATA_LOG (warning) << "release of lock on wallet " << h.WalletID << " that is not held";
            return;
        }

        ::flock (x->second.second, LOCK_UN);
        ::close (x->second.second);
        Held.erase (x);
    }

    bool file_wallet_lock::locked (const std::string &wallet_id) const {
        filepath p = path (wallet_id);
        int fd = ::open (p.c_str (), O_RDWR);
        if (fd < 0) return false;

        bool held = ::flock (fd, LOCK_EX | LOCK_NB) < 0;
        if (!held) ::flock (fd, LOCK_UN);
        ::close (fd);
        return held;
    }

    wallet_lock::handle memory_wallet_lock::acquire (const std::string &wallet_id) {
        std::lock_guard<std::mutex> lock {Mutex};
        if (Held.find (wallet_id) != Held.end ()) throw lock_contention {wallet_id};
        uint64 token = Next++;
        Held[wallet_id] = token;
        return handle {wallet_id, token};
    }

    void memory_wallet_lock::release (const handle &h) {
        std::lock_guard<std::mutex> lock {Mutex};
        auto x = Held.find (h.WalletID);
        if (x == Held.end () || x->second != h.Token) {
            DATA_LOG (warning) << "release of lock on wallet " << h.WalletID << " that is not held";
            return;
        }
        Held.erase (x);
    }

    bool memory_wallet_lock::locked (const std::string &wallet_id) const {
        std::lock_guard<std::mutex> lock {Mutex};
        return Held.find (wallet_id) != Held.end ();
    }

}
