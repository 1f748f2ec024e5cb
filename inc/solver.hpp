#ifndef SOLVER_H
#define SOLVER_H

#include <cstdint>

extern "C"
{
  int sudoset_solver_count(const char *in81);

  int sudoset_solver_all(const char *in81, char *out, uint32_t maxSolutions);
} // extern "C"

#endif // SOLVER_H
