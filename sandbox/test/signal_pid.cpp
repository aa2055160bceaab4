#include <signal.h>
#include <stdlib.h>

// Exits with 0 if signal 0 can be sent to the pid in argv[1], 1 otherwise.
int main(int argc, char** argv) {
  return kill(atoi(argv[1]), 0) == 0 ? 0 : 1;
}
