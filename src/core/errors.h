#pragma once

/// @file errors.h
/// @brief Exception types raised by the ADMM engine and its solver ports.
///
/// Taxonomy:
///   - MalformedProblem:  the problem violates a structural assumption of
///                        the decomposition. Raised before iterating.
///   - SolverError:       raised by a QUBO or convex solver port.
///   - SubproblemFailure: raised by the engine when a port call fails; it
///                        records the iteration and the failing block.
/// Reaching the iteration limit is not an error (see AdmmResult).

#include <stdexcept>
#include <string>

namespace mbo {

/// Structural violation of the ProblemModel assumptions.
class MalformedProblem : public std::invalid_argument {
public:
    explicit MalformedProblem(const std::string& what)
        : std::invalid_argument("MalformedProblem: " + what) {}
};

/// Failure categories a solver port may report.
enum class SolverErrorKind {
    kInfeasible,     ///< The subproblem has no feasible point.
    kSolverFailure,  ///< Numerical failure, iteration cap, size limit, ...
    kCancelled,      ///< Cancelled or timed out by the port's owner.
};

/// Error thrown by a solver port.
class SolverError : public std::runtime_error {
public:
    SolverError(SolverErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    SolverErrorKind kind() const noexcept { return kind_; }

private:
    SolverErrorKind kind_;
};

/// Engine block whose subproblem failed.
enum class SubproblemBlock {
    kBinary,      ///< QUBO update of x.
    kContinuous,  ///< Convex update of (z, u).
};

/// A port call failed inside an ADMM iteration; the solve was aborted.
class SubproblemFailure : public std::runtime_error {
public:
    SubproblemFailure(int iteration, SubproblemBlock block,
                      SolverErrorKind kind, const std::string& detail);

    int iteration() const noexcept { return iteration_; }
    SubproblemBlock block() const noexcept { return block_; }
    SolverErrorKind kind() const noexcept { return kind_; }

private:
    int iteration_;
    SubproblemBlock block_;
    SolverErrorKind kind_;
};

const char* to_string(SolverErrorKind kind);
const char* to_string(SubproblemBlock block);

}  // namespace mbo
