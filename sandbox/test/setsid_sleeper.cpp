#include <fcntl.h>
#include <unistd.h>

// Starts a child in a new session that creates argv[1] after half a second,
// then exits.
int main(int argc, char** argv) {
  int pid = fork();
  if (pid == -1) return 1;
  if (pid == 0) {
    setsid();
    usleep(500 * 1000);
    int fd = open(argv[1], O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd != -1) close(fd);
    return 0;
  }
  return 0;
}
