#include "coup/Random.hh"

namespace Coup {

Rng& getRng()
{
    // Each game is driven by one thread at a time, but independent games may
    // be driven by different threads
    thread_local Rng randomEngine {std::random_device()()};
    return randomEngine;
}

}
