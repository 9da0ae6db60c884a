// Repository: Cadence
// Component: Time Source Interface
// Purpose: Monotonic millisecond clock seam: SteadyTimeSource in production,
//          a manually advanced source in tests.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_TIMING_ITIME_SOURCE_HPP_
#define CADENCE_TIMING_ITIME_SOURCE_HPP_

#include <chrono>
#include <cstdint>

namespace cadence::timing {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowMs() const = 0;
};

class SteadyTimeSource : public ITimeSource {
 public:
  int64_t NowMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()).count();
  }
};

}  // namespace cadence::timing

#endif  // CADENCE_TIMING_ITIME_SOURCE_HPP_
