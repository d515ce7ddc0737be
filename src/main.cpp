#include <iostream>

#include "anchorfit/common/log.hpp"
#include "anchorfit/pipeline/Cli.hpp"

int main(int argc, char** argv) {
  anchorfit::common::StderrLogger logger;
  return anchorfit::pipeline::runCli(argc, argv, logger, std::cout);
}
