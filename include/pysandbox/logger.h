#ifndef INCLUDE_PYSANDBOX_LOGGER_H_
#define INCLUDE_PYSANDBOX_LOGGER_H_

// Keep console sink mutexes consistent across fork(); call once at startup.
void InitLogger();

#endif  // INCLUDE_PYSANDBOX_LOGGER_H_
