//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/Session.cpp
// Purpose: Implement the debug session state machine on top of the solve
//          driver, the breakpoint registry and the location map.
// Key invariants: Breakpoints are checked before the unit at a candidate
//                 address executes; continue and next never stop on the
//                 breakpoint at the address they start from.  Finished and
//                 Failed accept only restart and inspection.
// Ownership/Lifetime: Session::Impl owns the program; the driver borrows it, so
//                     the Impl is never moved once constructed.
// Links: include/strata/debug/Session.hpp
//
//===----------------------------------------------------------------------===//

#include "strata/debug/Session.hpp"

#include "debug/Breakpoints.hpp"
#include "debug/LocationMap.hpp"
#include "debug/SolveDriver.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace strata::debug
{

/// @brief Private implementation owning program, solver and debugger state.
/// @details The façade keeps the public @ref Session header free of driver
///          and VM details.  The Impl is heap allocated so the driver's
///          reference to @c program stays valid when a Session is moved.
class Session::Impl
{
  public:
    /// @brief Call-depth policy of a source-level step.
    enum class NextMode
    {
        Into, ///< Stop at the first new location, entering calls.
        Over, ///< Do not stop inside calls made from the starting frame.
        Out   ///< Stop only after the starting frame has finished.
    };

    Impl(circuit::Program prog, DebugSymbols syms, circuit::WitnessMap initial, SessionConfig cfg)
        : program(std::move(prog)), symbols(std::move(syms)), config(cfg),
          locations(LocationMap::build(symbols, program)), driver(program, std::move(initial)),
          trace(cfg.trace)
    {
        uint64_t limit = config.maxSteps;
        if (limit == 0)
        {
            if (const char *envLimit = std::getenv("STRATA_MAX_STEPS"))
            {
                char *end = nullptr;
                unsigned long long n = std::strtoull(envLimit, &end, 10);
                if (end && *end == '\0')
                    limit = static_cast<uint64_t>(n);
            }
        }
        driver.setStepLimit(limit);
    }

    bool paused() const
    {
        return state == SessionState::PausedAtBreakpoint || state == SessionState::PausedAfterStep;
    }

    DebugError wrongState(std::string_view command) const
    {
        return makeError(ErrorKind::InvalidCommandForState,
                         std::string(command) + " is not allowed while " +
                             std::string(toString(state)));
    }

    /// @brief Render the unit at @p addr for trace output.
    std::string describe(const OpcodeAddress &addr) const
    {
        if (addr.isInner())
        {
            const ucvm::Block *block = program.blockAt(addr.outer);
            if (block && *addr.inner < block->code.size())
                return ucvm::toString(block->code[*addr.inner]);
            return "<end of block>";
        }
        if (addr.outer < program.opcodes.size())
            return circuit::toString(program.opcodes[addr.outer], program);
        return "<end of program>";
    }

    /// @brief Record a fatal error and move to Failed.
    DebugError fail(DebugError err)
    {
        state = SessionState::Failed;
        lastError = err;
        std::cerr << "[FAIL] " << err << "\n";
        return err;
    }

    /// @brief Pause before the breakpoint at the driver's current address.
    void pauseAtBreakpoint()
    {
        state = SessionState::PausedAtBreakpoint;
        const OpcodeAddress addr = driver.address();
        std::cerr << "[BREAK] addr=" << addr;
        if (auto loc = locations.primaryLocation(addr))
            std::cerr << " src=" << locations.format(*loc);
        std::cerr << "\n";
    }

    /// @brief Execute one unit; on failure the session fails.
    Expected<UnitResult> execute()
    {
        auto r = driver.stepOne();
        if (!r)
        {
            if (isFatal(r.error().kind))
                return fail(r.error());
            return r.error();
        }
        traceUnit(r.value());
        return r;
    }

    void traceUnit(const UnitResult &unit)
    {
        trace.onStep(unit.executed, describe(unit.executed), locations);
    }

    /// @brief A command stopped on a non-fatal error; pause where it stopped.
    DebugError interrupted(DebugError err)
    {
        if (state == SessionState::Running)
            state = SessionState::PausedAfterStep;
        return err;
    }

    /// @brief Settle into Finished or a paused state after a unit ran.
    /// @return True when the scan should stop.
    bool settle(bool checkBreakpoints)
    {
        if (driver.finished())
        {
            state = SessionState::Finished;
            return true;
        }
        if (checkBreakpoints && breakpoints.contains(driver.address()))
        {
            pauseAtBreakpoint();
            return true;
        }
        return false;
    }

    /// @brief Nesting at the current address: 0 at the outer tier, 1 in a
    ///        block's top frame, plus one per active nested call.
    size_t callDepth() const
    {
        if (!driver.inner().active())
            return 0;
        auto stack = driver.inner().callStack();
        return 1 + (stack ? stack.value().size() : 0);
    }

    Expected<SessionState> start()
    {
        if (state != SessionState::NotStarted)
            return wrongState("start");
        state = SessionState::Running;
        lastError.reset();
        if (driver.finished())
        {
            state = SessionState::Finished;
            return state;
        }
        if (breakpoints.contains(driver.address()))
        {
            pauseAtBreakpoint();
            return state;
        }
        if (config.stopOnEntry)
        {
            state = SessionState::PausedAfterStep;
            return state;
        }
        return runToBreakpoint();
    }

    Expected<SessionState> step()
    {
        if (!paused())
            return wrongState("step");
        state = SessionState::Running;
        auto r = execute();
        if (!r)
            return interrupted(r.error());
        if (!settle(false))
            state = SessionState::PausedAfterStep;
        return state;
    }

    Expected<SessionState> stepOverBlock()
    {
        if (!paused())
            return wrongState("step-over-block");
        state = SessionState::Running;
        auto r = driver.stepOverBlock([this](const UnitResult &unit) { traceUnit(unit); });
        if (!r)
        {
            if (isFatal(r.error().kind))
                return fail(r.error());
            return interrupted(r.error());
        }
        if (!settle(false))
            state = SessionState::PausedAfterStep;
        return state;
    }

    Expected<SessionState> cont()
    {
        if (!paused())
            return wrongState("continue");
        state = SessionState::Running;
        return runToBreakpoint();
    }

    Expected<SessionState> runToBreakpoint()
    {
        while (true)
        {
            auto r = execute();
            if (!r)
                return interrupted(r.error());
            if (settle(true))
                return state;
        }
    }

    /// @brief Run until the primary source location changes.
    /// @details Over ignores location changes inside calls made from the
    ///          starting frame; Out also ignores them until that frame is done.
    ///          Breakpoints stop every mode.
    Expected<SessionState> nextLocation(std::string_view command, NextMode mode)
    {
        if (!paused())
            return wrongState(command);
        state = SessionState::Running;
        const auto origin = locations.primaryLocation(driver.address());
        const size_t depth = callDepth();
        while (true)
        {
            auto r = execute();
            if (!r)
                return interrupted(r.error());
            if (settle(true))
                return state;
            if (mode == NextMode::Over && callDepth() > depth)
                continue;
            if (mode == NextMode::Out && callDepth() >= depth)
                continue;
            auto loc = locations.primaryLocation(driver.address());
            if (loc && (!origin || *loc != *origin))
            {
                state = SessionState::PausedAfterStep;
                return state;
            }
        }
    }

    Expected<SessionState> restart()
    {
        driver.restart();
        state = SessionState::NotStarted;
        lastError.reset();
        std::cerr << "[DEBUG] restart\n";
        return start();
    }

    Expected<SessionState> runScript(DebugScript &script)
    {
        if (state == SessionState::NotStarted)
        {
            auto started = start();
            if (!started)
                return started.error();
        }
        while (!script.empty())
        {
            if (!paused())
            {
                if (script.peek().kind != DebugActionKind::Restart)
                {
                    std::cerr << "[DEBUG] script stopped: session " << toString(state) << "\n";
                    return state;
                }
                script.nextAction();
                auto r = restart();
                if (!r)
                    return r.error();
                continue;
            }

            DebugAction act = script.nextAction();
            Expected<SessionState> r = state;
            switch (act.kind)
            {
                case DebugActionKind::Step:
                    for (uint64_t i = 0; i < act.count && paused(); ++i)
                    {
                        r = step();
                        if (!r)
                            break;
                    }
                    break;
                case DebugActionKind::StepOver:
                    r = stepOverBlock();
                    break;
                case DebugActionKind::Next:
                    r = nextLocation("next", NextMode::Into);
                    break;
                case DebugActionKind::NextOver:
                    r = nextLocation("next-over", NextMode::Over);
                    break;
                case DebugActionKind::NextOut:
                    r = nextLocation("next-out", NextMode::Out);
                    break;
                case DebugActionKind::Continue:
                    r = cont();
                    break;
                case DebugActionKind::Restart:
                    r = restart();
                    break;
            }
            if (!r)
                return r.error();
        }
        return state;
    }

    Expected<void> requireValid(const OpcodeAddress &addr) const
    {
        if (!locations.contains(addr))
            return makeError(ErrorKind::UnknownBreakpointAddress,
                             "no opcode at address " + addr.toString(),
                             addr);
        return {};
    }

    std::optional<OpcodeAddress> currentAddress() const
    {
        if (state == SessionState::NotStarted || state == SessionState::Finished)
            return std::nullopt;
        return driver.address();
    }

    circuit::Program program;
    DebugSymbols symbols;
    SessionConfig config;
    LocationMap locations;
    SolveDriver driver;
    Breakpoints breakpoints;
    TraceSink trace;
    SessionState state = SessionState::NotStarted;
    std::optional<DebugError> lastError;
};

Session::Session(circuit::Program program,
                 DebugSymbols symbols,
                 circuit::WitnessMap initial,
                 SessionConfig config)
    : impl_(std::make_unique<Impl>(
          std::move(program), std::move(symbols), std::move(initial), std::move(config)))
{
}

Session::~Session() = default;

Session::Session(Session &&) noexcept = default;

Session &Session::operator=(Session &&) noexcept = default;

SessionState Session::state() const
{
    return impl_->state;
}

Expected<SessionState> Session::start()
{
    return impl_->start();
}

Expected<SessionState> Session::step()
{
    return impl_->step();
}

Expected<SessionState> Session::stepOverBlock()
{
    return impl_->stepOverBlock();
}

Expected<SessionState> Session::next()
{
    return impl_->nextLocation("next", Impl::NextMode::Into);
}

Expected<SessionState> Session::nextOver()
{
    return impl_->nextLocation("next-over", Impl::NextMode::Over);
}

Expected<SessionState> Session::nextOut()
{
    return impl_->nextLocation("next-out", Impl::NextMode::Out);
}

Expected<SessionState> Session::cont()
{
    return impl_->cont();
}

Expected<SessionState> Session::restart()
{
    return impl_->restart();
}

Expected<SessionState> Session::runScript(DebugScript &script)
{
    return impl_->runScript(script);
}

Expected<bool> Session::addBreakpoint(const OpcodeAddress &addr)
{
    auto valid = impl_->requireValid(addr);
    if (!valid)
        return valid.error();
    return impl_->breakpoints.add(addr);
}

Expected<bool> Session::removeBreakpoint(const OpcodeAddress &addr)
{
    auto valid = impl_->requireValid(addr);
    if (!valid)
        return valid.error();
    return impl_->breakpoints.remove(addr);
}

Expected<OpcodeAddress> Session::addBreakpointAtLine(std::string_view file, uint32_t line)
{
    auto addr = impl_->locations.firstAddressAt(file, line);
    if (!addr)
        return makeError(ErrorKind::UnknownBreakpointAddress,
                         "no opcode at " + std::string(file) + ":" + std::to_string(line));
    impl_->breakpoints.add(*addr);
    return *addr;
}

std::vector<OpcodeAddress> Session::breakpoints() const
{
    return impl_->breakpoints.all();
}

void Session::clearBreakpoints()
{
    impl_->breakpoints.clear();
}

Expected<support::FieldElement> Session::readWitness(circuit::WitnessId id) const
{
    return impl_->driver.readWitness(id);
}

Expected<std::optional<support::FieldElement>> Session::writeWitness(circuit::WitnessId id,
                                                                     support::FieldElement value)
{
    const SessionState st = impl_->state;
    if (st == SessionState::Finished || st == SessionState::Failed)
        return impl_->wrongState("witness override");
    std::optional<support::FieldElement> previous = impl_->driver.writeWitness(id, std::move(value));
    return previous;
}

const circuit::WitnessMap &Session::witnessMap() const
{
    return impl_->driver.witnesses();
}

Expected<support::FieldElement> Session::readRegister(ucvm::RegIndex index) const
{
    return impl_->driver.inner().readRegister(index);
}

Expected<void> Session::writeRegister(ucvm::RegIndex index, support::FieldElement value)
{
    if (!impl_->paused())
        return impl_->wrongState("register write");
    return impl_->driver.inner().writeRegister(index, std::move(value));
}

Expected<support::FieldElement> Session::readMemory(ucvm::MemIndex index) const
{
    return impl_->driver.inner().readMemory(index);
}

Expected<void> Session::writeMemory(ucvm::MemIndex index, support::FieldElement value)
{
    if (!impl_->paused())
        return impl_->wrongState("memory write");
    return impl_->driver.inner().writeMemory(index, std::move(value));
}

Expected<std::vector<std::optional<support::FieldElement>>> Session::registers() const
{
    return impl_->driver.inner().registers();
}

Expected<std::vector<support::FieldElement>> Session::memory() const
{
    return impl_->driver.inner().memory();
}

std::vector<OpcodeRow> Session::listOpcodes() const
{
    return debug::listOpcodes(impl_->program, impl_->currentAddress(), impl_->breakpoints);
}

std::vector<VarsFrame> Session::vars() const
{
    auto addr = impl_->currentAddress();
    if (!addr)
        return {};
    return collectVars(
        impl_->symbols.scopes, *addr, impl_->driver.witnesses(), impl_->driver.inner());
}

std::vector<StackFrame> Session::stacktrace() const
{
    auto addr = impl_->currentAddress();
    if (!addr)
        return {};
    return collectStackTrace(*addr, impl_->driver.inner(), impl_->locations);
}

std::optional<OpcodeAddress> Session::currentAddress() const
{
    return impl_->currentAddress();
}

const std::vector<support::SourceLoc> &Session::sourceLocations(const OpcodeAddress &addr) const
{
    return impl_->locations.locationsFor(addr);
}

std::string Session::formatLocation(const support::SourceLoc &loc) const
{
    return impl_->locations.format(loc);
}

const LocationMap &Session::locationMap() const
{
    return impl_->locations;
}

const circuit::Program &Session::program() const
{
    return impl_->program;
}

Expected<circuit::WitnessMap> Session::finalWitness() const
{
    if (impl_->state != SessionState::Finished)
        return impl_->wrongState("final witness");
    return impl_->driver.witnesses();
}

const std::optional<DebugError> &Session::lastError() const
{
    return impl_->lastError;
}

uint64_t Session::unitsExecuted() const
{
    return impl_->driver.unitsExecuted();
}

} // namespace strata::debug
