#include <stdio.h>

// Copies argv[1] to stdout. Exits with 1 if it cannot be opened.
int main(int argc, char** argv) {
  FILE* in = fopen(argv[1], "r");
  if (in == nullptr) return 1;
  char buf[4096];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), in)) > 0) fwrite(buf, 1, n, stdout);
  fclose(in);
  return 0;
}
