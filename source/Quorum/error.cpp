#include <Quorum/error.hpp>

namespace Quorum {

    void inconsistent (const std::string &what) {
        DATA_LOG (error) << "state consistency violation: " << what;
        throw state_consistency_violation {what};
    }

}
