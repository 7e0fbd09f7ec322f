// cppcheck-suppress-file missingIncludeSystem
#pragma once

namespace hostscope {

using MonotonicSecondsFn = double (*)();
using SleepSecondsFn = void (*)(double);

/**
 * Dependency injection struct for run_poll_loop().
 *
 * All fields default to the real steady clock and sleep.
 * Tests override individual fields to drive the loop with a fake clock.
 */
struct SchedulerDeps {
    MonotonicSecondsFn now = nullptr;
    SleepSecondsFn sleep = nullptr;
};

/// Get the current scheduler dependency set (initialized with production defaults).
SchedulerDeps& scheduler_deps();

/// Override dependencies for testing. Null fields retain the production defaults.
void set_scheduler_deps_for_test(const SchedulerDeps& deps);

/// Reset all dependencies to production defaults.
void reset_scheduler_deps_for_test();

} // namespace hostscope
