#ifndef QUORUM_ADDRESS_MANAGER
#define QUORUM_ADDRESS_MANAGER

#include <Quorum/options.hpp>
#include <Quorum/write.hpp>
#include <map>

namespace Quorum {

    // next unused index on each branch.
    struct address_indices {
        uint32 Receive;
        uint32 Change;
        uint32 ColdStaking;

        address_indices () : Receive {0}, Change {0}, ColdStaking {0} {}
        address_indices (uint32 r, uint32 c, uint32 s) : Receive {r}, Change {c}, ColdStaking {s} {}

        bool operator == (const address_indices &x) const {
            return Receive == x.Receive && Change == x.Change && ColdStaking == x.ColdStaking;
        }

        explicit address_indices (const JSON &);
        explicit operator JSON () const;
    };

    // Issues derivation paths for new addresses. Every index is used exactly once.
    // The caller must hold the wallet's lock while it uses a mutable address_manager.
    struct address_manager {
        // the active strategy. invalid if the manager was never created.
        derivation_strategy Strategy;

        std::map<derivation_strategy, address_indices> Indices;

        address_manager () : Strategy {derivation_strategy::invalid}, Indices {} {}

        static address_manager create (derivation_strategy);

        bool valid () const {
            return Strategy != derivation_strategy::invalid && Indices.find (Strategy) != Indices.end ();
        }

        // the path that the next call to new_address_path would return.
        HD::BIP_32::path current_address_path (bool change) const;

        // return the next path on the receive or change branch and increment its index.
        HD::BIP_32::path new_address_path (bool change);

        // the same for the cold staking branch, which has its own index.
        HD::BIP_32::path new_cold_staking_address_path ();

        const address_indices &indices () const;

        explicit address_manager (const JSON &);
        explicit operator JSON () const;

        bool operator == (const address_manager &x) const {
            return Strategy == x.Strategy && Indices == x.Indices;
        }

    private:
        HD::BIP_32::path path (uint32 branch, uint32 index) const;
        uint32 &next (uint32 &index);
    };

    std::ostream &operator << (std::ostream &, const address_manager &);

}

#endif
