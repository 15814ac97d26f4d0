#pragma once

#include "Severity.hpp"

namespace chatguard {

// The one mapping from severity to handling, shared by input and output:
// safe/low allow, medium warns, high blocks, critical escalates.
Action ActionFor(Severity severity);

}  // namespace chatguard
