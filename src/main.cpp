#include "view/cli.hpp"

int main(int argc, char **argv) {
  CLI cli;
  return cli.run(argc, argv);
}
