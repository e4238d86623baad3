#include "Time.h"

#include <chrono>

namespace Cadence {

TimeMs steadyNowMs() {
    using namespace std::chrono;
    static const auto epoch = steady_clock::now();
    return duration_cast<milliseconds>(steady_clock::now() - epoch).count();
}

}  // namespace Cadence
