#ifndef CRASH_HANDLING_H
#define CRASH_HANDLING_H

void register_crash_handlers(void);

#endif // CRASH_HANDLING_H
