#ifndef GRAFT_LIBRARY_H
#define GRAFT_LIBRARY_H

#include "../src/common/error.hpp"
#include "../src/config/cli.hpp"
#include "../src/config/config.hpp"
#include "../src/checkpoint/checkpoint.hpp"
#include "../src/data/initializer.hpp"
#include "../src/distributed/context.hpp"
#include "../src/distributed/parallel.hpp"
#include "../src/distributed/partition.hpp"
#include "../src/driver/bootstrap.hpp"
#include "../src/driver/run.hpp"
#include "../src/lrscheduler/lrscheduler.hpp"
#include "../src/model/builder.hpp"
#include "../src/optimizer/binder.hpp"
#include "../src/optimizer/optimizer.hpp"
#include "../src/training/coordinator.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Everything lives in header-only modules under src/; this header re-exports
//    the pieces a launcher needs (configuration, driver, coordinator) together
//    with the building blocks they are assembled from.

#endif // GRAFT_LIBRARY_H
