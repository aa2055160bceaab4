#include <fcntl.h>
#include <unistd.h>

// Exits with 0 if argv[1] can be created, 1 otherwise.
int main(int argc, char** argv) {
  int fd = open(argv[1], O_WRONLY | O_CREAT | O_TRUNC, 0600);
  if (fd == -1) return 1;
  close(fd);
  return 0;
}
