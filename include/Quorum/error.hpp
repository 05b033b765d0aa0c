#ifndef QUORUM_ERROR
#define QUORUM_ERROR

#include <Quorum/types.hpp>
#include <data/io/exception.hpp>
#include <stdexcept>

namespace Quorum {

    // an operation was attempted with invalid arguments or in the wrong state.
    struct precondition_violation : std::logic_error {
        // the field or state that was checked.
        std::string Field;
        // the constraint that was violated.
        std::string Constraint;

        precondition_violation (const std::string &field, const std::string &constraint) :
            std::logic_error {data::string::write (field, ": ", constraint)}, Field {field}, Constraint {constraint} {}
    };

    // input provided by a user could not be read.
    struct validation_failure : std::invalid_argument {
        std::string Field;
        std::string Constraint;

        validation_failure (const std::string &field, const std::string &constraint) :
            std::invalid_argument {data::string::write (field, ": ", constraint)}, Field {field}, Constraint {constraint} {}
    };

    // an internal invariant is broken. Nothing inside Quorum catches this.
    struct state_consistency_violation : std::logic_error {
        state_consistency_violation (const std::string &what) : std::logic_error {what} {}
    };

    // result of a check. Empty means that the check passed.
    using check = maybe<precondition_violation>;

    check inline fail (const std::string &field, const std::string &constraint) {
        return precondition_violation {field, constraint};
    }

    check inline pass () {
        return {};
    }

    void inline require (const check &c) {
        if (bool (c)) throw *c;
    }

    void inline require (bool condition, const std::string &field, const std::string &constraint) {
        if (!condition) throw precondition_violation {field, constraint};
    }

    // log and throw state_consistency_violation.
    [[noreturn]] void inconsistent (const std::string &what);

}

#endif
