////////////////////////////////////////////////////////////////////////////////
// Errors.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Exceptions thrown by the partitioning pipeline. Configuration and I/O
//      problems are reported as plain std::runtime_error.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef VOROSHELL_ERRORS_HH
#define VOROSHELL_ERRORS_HH

#include <stdexcept>
#include <string>

namespace voroshell {

// Tetrahedralization requested on a point set that does not span 3D (fewer
// than 4 affinely independent points, or non-finite coordinates).
struct DegenerateInputError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Seed rejection sampling exhausted its attempt budget without collecting the
// requested number of seeds (e.g., an empty or measure-zero domain).
struct SeedSamplingFailed : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace voroshell

#endif /* end of include guard: VOROSHELL_ERRORS_HH */
