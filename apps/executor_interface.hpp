#pragma once
#include "taskgate/executor.hpp"

// Entry points an executor plugin exports for taskgate_runner --executor-lib.
// argv holds the runner arguments that follow "--".

#ifdef __cplusplus
extern "C" {
#endif

taskgate::Executor* taskgate_create_executor(int argc, char** argv);
void taskgate_destroy_executor(taskgate::Executor* executor);

#ifdef __cplusplus
}
#endif
