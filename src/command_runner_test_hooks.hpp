// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <sys/types.h>

namespace hostscope {

using EffectiveUidFn = uid_t (*)();

/**
 * Dependency injection struct for privilege checks made before running tools.
 *
 * Defaults to ::geteuid. Tests override it to exercise both the privileged
 * and unprivileged paths from a single environment.
 */
struct CommandRunnerDeps {
    EffectiveUidFn effective_uid = nullptr;
};

/// Override dependencies for testing. Null fields retain the production defaults.
void set_command_runner_deps_for_test(const CommandRunnerDeps& deps);

/// Reset all dependencies to production defaults.
void reset_command_runner_deps_for_test();

} // namespace hostscope
