#ifndef REFLUO_LIBRARY_H
#define REFLUO_LIBRARY_H

#include "../src/core.hpp"
#include "../src/layer/layer.hpp"
#include "../src/mask/mask.hpp"
#include "../src/network/network.hpp"
#include "../src/prior/prior.hpp"

#include "../src/architecture/architecture.hpp"
#include "../src/data/data.hpp"
#include "../src/lrscheduler/lrscheduler.hpp"
#include "../src/optimizer/optimizer.hpp"
#include "../src/training/training.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Header-only: every component lives under src/ and is pulled in here.
//  - Flow is the entry point; layers, approximators and architectures are
//    descriptors that Flow::add materialises.
//  - Training, data loading and export sit on top and are optional.

#endif // REFLUO_LIBRARY_H
