#pragma once

#include <Eigen/Dense>
#include <EigenRand/EigenRand>

namespace segdist {

/// Random engine shared by every sampler in the library.
using Rng = Eigen::Rand::Vmt19937_64;

} // namespace segdist
