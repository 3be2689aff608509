#ifndef INCLUDE_RUNBOX_LOGGER_H_
#define INCLUDE_RUNBOX_LOGGER_H_

// Route the default logger to stderr (stdout belongs to the executed program)
// 0 = warn, 1 = info, 2+ = debug
void InitLogger(int verbosity = 0);

#endif  // INCLUDE_RUNBOX_LOGGER_H_
