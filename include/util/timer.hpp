#pragma once

#include <chrono>

namespace vb
{
template<class Precision = float>
class Timer
{
public:
  Timer() : t(std::chrono::steady_clock::now())
  {}

  // seconds unless another period is given
  template<class Period = std::ratio<1, 1>>
  Precision restart()
  {
    Precision elapsed_time = elapsed<Period>();
    t = std::chrono::steady_clock::now();
    return elapsed_time;
  }

  template<class Period = std::ratio<1, 1>>
  Precision elapsed() const
  {
    return std::chrono::duration<Precision, Period>(std::chrono::steady_clock::now() - t).count();
  }

private:
  std::chrono::time_point<std::chrono::steady_clock> t;
};

using ms = std::milli;
} // namespace vb
