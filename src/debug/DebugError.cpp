//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Mapping of solver and VM failures onto debugger error kinds.
//
//===----------------------------------------------------------------------===//

#include "debug/DebugError.hpp"

#include <utility>

namespace strata::debug
{

DebugError makeError(ErrorKind kind, std::string message, std::optional<OpcodeAddress> address)
{
    return DebugError{kind, std::move(message), address};
}

DebugError fromFault(const ucvm::Fault &fault, const OpcodeAddress &address)
{
    ErrorKind kind = ErrorKind::InnerTrap;
    switch (fault.kind)
    {
        case ucvm::FaultKind::InvalidRegisterIndex:
            kind = ErrorKind::InvalidRegisterIndex;
            break;
        case ucvm::FaultKind::InvalidMemoryIndex:
            kind = ErrorKind::InvalidMemoryIndex;
            break;
        case ucvm::FaultKind::OutOfBoundsJump:
            kind = ErrorKind::OutOfBoundsJump;
            break;
        case ucvm::FaultKind::DivisionByZero:
            kind = ErrorKind::DivisionByZero;
            break;
        case ucvm::FaultKind::Trap:
        case ucvm::FaultKind::StackOverflow:
            kind = ErrorKind::InnerTrap;
            break;
    }
    return DebugError{kind, fault.message, address};
}

DebugError fromSolveError(const circuit::SolveError &error, const OpcodeAddress &address)
{
    using circuit::SolveErrorKind;
    switch (error.kind)
    {
        case SolveErrorKind::UnsatisfiedConstraint:
            return DebugError{ErrorKind::UnsatisfiedConstraint, error.message, address};
        case SolveErrorKind::MissingInput:
            return DebugError{ErrorKind::MissingInput, error.message, address};
        case SolveErrorKind::BlockOutputMismatch:
            return DebugError{ErrorKind::BlockOutputMismatch, error.message, address};
        case SolveErrorKind::BlockFault:
            if (error.fault)
                return fromFault(*error.fault, address);
            break;
        case SolveErrorKind::UnknownBlock:
            break;
    }
    return DebugError{ErrorKind::InnerTrap, error.message, address};
}

std::string toString(const DebugError &error)
{
    std::string text(toString(error.kind));
    if (error.address)
        text += " at " + error.address->toString();
    if (!error.message.empty())
        text += ": " + error.message;
    return text;
}

std::ostream &operator<<(std::ostream &os, const DebugError &error)
{
    return os << toString(error);
}

} // namespace strata::debug
