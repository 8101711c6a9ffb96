//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/DebugError.hpp
// Purpose: Typed error reported by every debugger operation.
// Key invariants: Fatal kinds end the current solve (session enters Failed);
//                 the remaining kinds reject a single command and leave all
//                 state untouched.
// Ownership/Lifetime: Value type.
// Links: Session.hpp, circuit/Solver.hpp, ucvm/Vm.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "circuit/Solver.hpp"
#include "debug/OpcodeAddress.hpp"
#include "support/expected.hpp"
#include "ucvm/Vm.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace strata::debug
{

/// @brief Classification of debugger failures.
enum class ErrorKind : uint8_t
{
    // Fatal to the current solve.
    UnsatisfiedConstraint,
    MissingInput,
    InvalidRegisterIndex,
    InvalidMemoryIndex,
    OutOfBoundsJump,
    DivisionByZero,
    InnerTrap,
    BlockOutputMismatch,
    StepLimitExceeded,
    // Rejected command; session state unchanged.
    UnknownBreakpointAddress,
    NotExecutingInnerVm,
    NotYetAvailable,
    UnknownWitness,
    InvalidCommandForState
};

/// @brief Convert an error kind to its canonical name.
constexpr std::string_view toString(ErrorKind kind) noexcept
{
    switch (kind)
    {
        case ErrorKind::UnsatisfiedConstraint:
            return "UnsatisfiedConstraint";
        case ErrorKind::MissingInput:
            return "MissingInput";
        case ErrorKind::InvalidRegisterIndex:
            return "InvalidRegisterIndex";
        case ErrorKind::InvalidMemoryIndex:
            return "InvalidMemoryIndex";
        case ErrorKind::OutOfBoundsJump:
            return "OutOfBoundsJump";
        case ErrorKind::DivisionByZero:
            return "DivisionByZero";
        case ErrorKind::InnerTrap:
            return "InnerTrap";
        case ErrorKind::BlockOutputMismatch:
            return "BlockOutputMismatch";
        case ErrorKind::StepLimitExceeded:
            return "StepLimitExceeded";
        case ErrorKind::UnknownBreakpointAddress:
            return "UnknownBreakpointAddress";
        case ErrorKind::NotExecutingInnerVm:
            return "NotExecutingInnerVm";
        case ErrorKind::NotYetAvailable:
            return "NotYetAvailable";
        case ErrorKind::UnknownWitness:
            return "UnknownWitness";
        case ErrorKind::InvalidCommandForState:
            return "InvalidCommandForState";
    }
    return "InnerTrap";
}

/// @brief True for kinds that terminate the current solve.
constexpr bool isFatal(ErrorKind kind) noexcept
{
    return kind <= ErrorKind::StepLimitExceeded;
}

/// @brief Error payload returned by debugger operations.
struct DebugError
{
    ErrorKind kind = ErrorKind::InvalidCommandForState;
    std::string message;
    std::optional<OpcodeAddress> address; ///< Where the failure was observed, if known.
};

/// @brief Value-or-DebugError result of a debugger operation.
template <class T> using Expected = support::Expected<T, DebugError>;

/// @brief Build an error of @p kind.
DebugError makeError(ErrorKind kind,
                     std::string message,
                     std::optional<OpcodeAddress> address = std::nullopt);

/// @brief Translate a VM fault raised at @p address.
DebugError fromFault(const ucvm::Fault &fault, const OpcodeAddress &address);

/// @brief Translate a solver failure raised at @p address.
DebugError fromSolveError(const circuit::SolveError &error, const OpcodeAddress &address);

/// @brief Render "<Kind> at <addr>: <message>".
std::string toString(const DebugError &error);

std::ostream &operator<<(std::ostream &os, const DebugError &error);

} // namespace strata::debug
