#pragma once

#include <cstddef>

/// @file

/// @brief Real number @f$ \mathbb{R} @f$ (C++ Core Guidelines P.1)
using Real = double;
/// @brief Energy in MeV unless a Measurement says otherwise
using Energy = Real;
/// @brief Time in seconds
using Seconds = Real;
/// @brief Number of protons @f$ Z @f$ or neutrons @f$ N @f$ in a nucleus.
/// @details Signed so that neighbors like @f$ N - 2 @f$ can be formed and
///          rejected without wrapping around.
using NucleonCount = int;
