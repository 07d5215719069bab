#include "cli/CliMain.hpp"

int main(int argc, char** argv)
{
  return stopgrid::StopGridCliMain(argc, argv);
}
