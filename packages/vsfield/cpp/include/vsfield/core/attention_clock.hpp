#ifndef PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_CORE_ATTENTION_CLOCK_HPP_
#define PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_CORE_ATTENTION_CLOCK_HPP_

#include <stdexcept>
#include <string>

#include "core/errors.hpp"
#include "core/types.hpp"

namespace vsfield {

// The single logical counter that serialises every timed operation on the fields of one agent.
// Owned by the caller; fields only borrow it.
class AttentionClock {
public:
  explicit AttentionClock(Tick start_time = 0) : _time(start_time) {}

  Tick time() const {
    return _time;
  }

  bool is_free_at(Tick requested_time) const {
    return requested_time >= _time;
  }

  void check_free_at(Tick requested_time) const {
    if (!is_free_at(requested_time)) {
      throw AttentionBusyError(requested_time, _time);
    }
  }

  void advance_to(Tick finish_time) {
    if (finish_time < _time) {
      throw std::logic_error("Attention clock cannot move back from " + std::to_string(_time) + " to " +
                             std::to_string(finish_time));
    }
    _time = finish_time;
  }

private:
  Tick _time;
};

}  // namespace vsfield

#endif  // PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_CORE_ATTENTION_CLOCK_HPP_
