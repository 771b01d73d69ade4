#include <stdio.h>

// A runner that reports a diagnostic and fails.
int main() {
  fprintf(stderr, "runner exploded\n");
  return 3;
}
