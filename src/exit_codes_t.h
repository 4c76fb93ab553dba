#ifndef EXIT_CODES_T
#define EXIT_CODES_T

constexpr int ExitSuccess = 0;
constexpr int ExitError   = 1;

#endif
