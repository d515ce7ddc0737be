#pragma once

#include <ostream>

#include "anchorfit/common/log.hpp"

namespace anchorfit::pipeline {

/**
 * @brief Run the anchorfit command line
 *
 * Results (anchors, per-level listing, usage) go to @p out; progress and
 * errors go to @p logger, whose level follows --log-level / the config file.
 *
 * @return 0 on success, 1 on a failed run, 2 on bad arguments
 */
int runCli(int argc, const char* const* argv, common::StderrLogger& logger, std::ostream& out);

} // namespace anchorfit::pipeline
