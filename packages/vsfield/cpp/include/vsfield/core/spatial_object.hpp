#ifndef PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_CORE_SPATIAL_OBJECT_HPP_
#define PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_CORE_SPATIAL_OBJECT_HPP_

#include <optional>
#include <stdexcept>
#include <string>

#include "core/types.hpp"

namespace vsfield {

// One timestamped item occupying one cell of a visual-spatial field. Objects are never deleted;
// they stop being visible once their terminus is reached.
class SpatialObject {
public:
  SpatialObject(const std::string& identifier,
                const std::string& object_class,
                Tick time_created,
                std::optional<Tick> terminus,
                bool recognised,
                bool ghost)
      : _identifier(identifier),
        _object_class(object_class),
        _time_created(time_created),
        _terminus(terminus),
        _recognised(recognised),
        _ghost(ghost) {}

  static SpatialObject blind(Tick time_created) {
    return SpatialObject(kBlindSquareToken, kBlindSquareToken, time_created, std::nullopt, false, false);
  }

  static SpatialObject empty(const std::string& identifier, Tick time_created, Tick terminus) {
    return SpatialObject(identifier, kEmptySquareToken, time_created, terminus, false, false);
  }

  const std::string& identifier() const {
    return _identifier;
  }

  const std::string& object_class() const {
    return _object_class;
  }

  Tick time_created() const {
    return _time_created;
  }

  std::optional<Tick> terminus() const {
    return _terminus;
  }

  bool is_ghost() const {
    return _ghost;
  }

  bool is_blind() const {
    return _object_class == kBlindSquareToken;
  }

  bool is_empty() const {
    return _object_class == kEmptySquareToken;
  }

  bool is_creator() const {
    return _object_class == kCreatorToken;
  }

  bool is_placeholder() const {
    return is_blind() || is_empty();
  }

  // True once the object exists, if it was introduced through chunk recognition.
  bool recognised(Tick time) const {
    return _recognised && time >= _time_created;
  }

  bool alive(Tick time) const {
    return _time_created <= time && (!_terminus.has_value() || *_terminus > time);
  }

  void set_terminus(Tick terminus) {
    if (is_creator()) {
      throw std::logic_error("The terminus of the scene creator cannot be changed");
    }
    _terminus = terminus;
  }

  // Never shortens the terminus; an object without a terminus keeps none.
  void extend_terminus(Tick terminus) {
    if (is_creator()) {
      throw std::logic_error("The terminus of the scene creator cannot be changed");
    }
    if (_terminus.has_value() && *_terminus < terminus) {
      _terminus = terminus;
    }
  }

private:
  std::string _identifier;
  std::string _object_class;
  Tick _time_created;
  std::optional<Tick> _terminus;
  bool _recognised;
  bool _ghost;
};

}  // namespace vsfield

#endif  // PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_CORE_SPATIAL_OBJECT_HPP_
