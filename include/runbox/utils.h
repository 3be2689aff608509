#ifndef INCLUDE_RUNBOX_UTILS_H_
#define INCLUDE_RUNBOX_UTILS_H_

#include <string>

#include "execution.h"

const char* CompletionKindName(CompletionKind);
const char* ExecutionErrorName(ExecutionError);

// "STDOUT:\n...\nSTDERR:\n...\n", or "No output" if both streams are empty
std::string FormatOutput(const ExecutionOutcome&);

#endif  // INCLUDE_RUNBOX_UTILS_H_
