#include <stdlib.h>
#include <ctime>
#include <vector>

// Burns CPU for argv[1] seconds, or forever if argv[1] is negative.
int main(int argc, char** argv) {
  const constexpr int sz = 10240;
  const double seconds = argc > 1 ? atof(argv[1]) : -1;
  std::clock_t startcputime = std::clock();
  std::vector<int> v;
  v.resize(sz, 0);
  int i = 0;
  while (seconds < 0 ||
         (std::clock() - startcputime) < seconds * CLOCKS_PER_SEC) {
    for (int j = 0; j < i; j++) {
      v[j] += i;
    }
    i = (i + 1) % sz;
  }
  return v[0] == 42;
}
