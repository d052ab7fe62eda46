#ifndef PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_CONFIG_FIELD_CONFIG_HPP_
#define PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_CONFIG_FIELD_CONFIG_HPP_

#include <string>

#include "core/errors.hpp"
#include "core/types.hpp"

namespace vsfield {

struct FieldConfig {
  // Time costs, in ticks
  Tick object_encoding_time = 0;
  Tick empty_square_encoding_time = 0;
  Tick access_time = 0;
  Tick object_movement_time = 0;

  // How long an object stays alive after it is (re)encoded
  Tick recognised_object_lifespan = 0;
  Tick unrecognised_object_lifespan = 0;

  unsigned int number_fixations = 0;
  // Chebyshev radius of the neighbourhood handed to recognition at each fixation
  unsigned int field_of_view = 1;

  bool encode_scene_creator = false;
  bool encode_ghost_objects = false;

  void validate() const {
    check_non_negative("object_encoding_time", object_encoding_time);
    check_non_negative("empty_square_encoding_time", empty_square_encoding_time);
    check_non_negative("access_time", access_time);
    check_non_negative("object_movement_time", object_movement_time);
    check_non_negative("recognised_object_lifespan", recognised_object_lifespan);
    check_non_negative("unrecognised_object_lifespan", unrecognised_object_lifespan);
  }

private:
  static void check_non_negative(const std::string& name, Tick value) {
    if (value < 0) {
      throw ConstructionError(name + " must be non-negative, got " + std::to_string(value));
    }
  }
};

}  // namespace vsfield

#endif  // PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_CONFIG_FIELD_CONFIG_HPP_
