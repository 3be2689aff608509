#ifndef RUNBOX_EXECUTOR_H_
#define RUNBOX_EXECUTOR_H_

#include <chrono>
#include <string>
#include <vector>

#include <runbox/engine.h>
#include <runbox/execution.h>
#include <runbox/languages.h>
#include "container.h"

// Run the profile's command (compile first for two-phase languages) inside a
// running container. One wall-clock deadline covers both phases; if it expires,
// the container is released immediately and the outcome is TIMED_OUT with the
// output captured so far.
// Kills every process left in the container and hands the workspace contents
// to all users, so that the host can delete what root wrote into the bind mount.
// Run by RunInContainer before it returns or releases the container.
const std::vector<std::string>& ScrubCommand();

ExecutionOutcome RunInContainer(
    ContainerEngine&, ContainerHandle&, const LanguageProfile&,
    std::chrono::milliseconds timeout, size_t max_output);

#endif  // RUNBOX_EXECUTOR_H_
