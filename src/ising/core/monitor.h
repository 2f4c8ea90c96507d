// monitor.h                                                           -*-C++-*-

#ifndef ISING_CORE_MONITOR_H
#define ISING_CORE_MONITOR_H

///
/// @purpose
///     Defines the interface for monitor classes to implement
///
/// @classes
///   Monitor: virtual class for monitors which are observers of the simulation
///
/// @description
///     This class defines the interface of a monitor which is a
///     passive observer of the simulation. Monitors analyse the lattice
///     and are told to update at intervals by the solver. They only ever see
///     the lattice through a const reference.
///
/// Usage
/// -----
///
/// @example
/// @code{.cpp}
///
///     class MyMonitor : public Monitor {
///     public:
///         explicit MyMonitor(const libconfig::Setting &settings);
///
///         ~MyMonitor() override = default;
///
///         void update(const Solver& solver) override;
///         void post_process() override {};
///     };
///
/// @endcode

#include <libconfig.h++>

#include "ising/core/base.h"

namespace ising {

class Solver;

//==============================================================================
// class Monitor
//==============================================================================

class Monitor : public Base {
public:
    ///
    /// Construct the monitor using any config values provided in `settings`.
    ///
    explicit Monitor(const libconfig::Setting &settings);

    virtual ~Monitor() = default;

    ///
    /// Request the monitor to update.
    ///
    /// Called by the solver after a step when is_updating() is true.
    ///
    virtual void update(const Solver& solver) = 0;

    ///
    /// Runs any post processing once the solver has finished.
    ///
    virtual void post_process() = 0;

    bool is_updating(const int &iteration) const;

    inline int output_step_freq() const { return output_step_freq_; }

    ///
    /// Factory which creates different Monitors which are derived from
    /// this class. The `module` setting selects the class and the `settings`
    /// are forwarded to the constructor of that class.
    ///
    static Monitor *create(const libconfig::Setting &settings);

protected:
    int output_step_freq_;
    int output_precision_;
};

} // namespace ising

#endif  // ISING_CORE_MONITOR_H
// ----------------------------- END-OF-FILE ----------------------------------
