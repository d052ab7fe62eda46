#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <optional>
#include <string>
#include <vector>

#include "config/field_config.hpp"
#include "core/attention_clock.hpp"
#include "core/errors.hpp"
#include "core/spatial_object.hpp"
#include "env/environment.hpp"
#include "field/move_engine.hpp"
#include "field/visual_spatial_field.hpp"
#include "recognition/chunk.hpp"
#include "recognition/fixation_pattern.hpp"
#include "recognition/oracles.hpp"
#include "recognition/salient_square_fixations.hpp"
#include "systems/stats_tracker.hpp"
#include "util/log.hpp"

namespace py = pybind11;

using namespace vsfield;

namespace {

// Trampolines so the oracles can be written in Python.
class PyRecognitionSource : public RecognitionSource {
public:
  using RecognitionSource::RecognitionSource;

  std::optional<Chunk> recognise(const ListPattern& pattern, Tick time) override {
    PYBIND11_OVERRIDE_PURE(std::optional<Chunk>, RecognitionSource, recognise, pattern, time);
  }
};

class PyFixationSource : public FixationSource {
public:
  using FixationSource::FixationSource;

  std::optional<Square> next_fixation(const Environment& environment, unsigned int fixation_index) override {
    PYBIND11_OVERRIDE_PURE(std::optional<Square>, FixationSource, next_fixation, environment, fixation_index);
  }
};

class PyShortTermMemory : public ShortTermMemory {
public:
  using ShortTermMemory::ShortTermMemory;

  void push(const Chunk& chunk, Tick time) override {
    PYBIND11_OVERRIDE_PURE(void, ShortTermMemory, push, chunk, time);
  }
};

void bind_errors(py::module& m) {
  // Base first: translators registered later are tried first.
  auto& field_error = py::register_exception<FieldError>(m, "FieldError", PyExc_RuntimeError);
  py::register_exception<AttentionBusyError>(m, "AttentionBusyError", field_error.ptr());
  py::register_exception<DuplicateObjectError>(m, "DuplicateObjectError", field_error.ptr());
  py::register_exception<IllegalMoveError>(m, "IllegalMoveError", field_error.ptr());
  py::register_exception<ConstructionError>(m, "ConstructionError", field_error.ptr());
}

void bind_environment(py::module& m) {
  py::class_<Square>(m, "Square")
      .def(py::init<GridCoord, GridCoord>(), py::arg("col"), py::arg("row"))
      .def_readwrite("col", &Square::col)
      .def_readwrite("row", &Square::row)
      .def("__eq__", &Square::operator==);

  py::class_<SceneObject>(m, "SceneObject")
      .def_readonly("identifier", &SceneObject::identifier)
      .def_readonly("object_class", &SceneObject::object_class);

  py::class_<Environment>(m, "Environment")
      .def(py::init<const std::string&, GridCoord, GridCoord>(), py::arg("name"), py::arg("width"), py::arg("height"))
      .def_property_readonly("name", &Environment::name)
      .def_property_readonly("width", &Environment::width)
      .def_property_readonly("height", &Environment::height)
      .def("add_item_to_square",
           &Environment::add_item_to_square,
           py::arg("col"),
           py::arg("row"),
           py::arg("identifier"),
           py::arg("object_class"))
      .def("add_empty_square", &Environment::add_empty_square, py::arg("col"), py::arg("row"))
      .def("add_creator",
           &Environment::add_creator,
           py::arg("col"),
           py::arg("row"),
           py::arg("identifier") = kCreatorToken)
      .def("square_contents", &Environment::square_contents, py::arg("col"), py::arg("row"))
      .def("is_blind", &Environment::is_blind, py::arg("col"), py::arg("row"))
      .def("is_empty", &Environment::is_empty, py::arg("col"), py::arg("row"))
      .def("is_creator", &Environment::is_creator, py::arg("col"), py::arg("row"))
      .def("is_entirely_blind", &Environment::is_entirely_blind)
      .def("creator_square", &Environment::creator_square)
      .def("__eq__", &Environment::operator==);

  m.attr("BLIND_SQUARE_TOKEN") = kBlindSquareToken;
  m.attr("EMPTY_SQUARE_TOKEN") = kEmptySquareToken;
  m.attr("CREATOR_TOKEN") = kCreatorToken;
  m.attr("GHOST_IDENTIFIER_PREFIX") = kGhostIdentifierPrefix;
}

void bind_recognition(py::module& m) {
  py::class_<ItemSquarePattern>(m, "ItemSquarePattern")
      .def(py::init<>())
      .def(py::init([](const std::string& object_class, int col, int row) {
             return ItemSquarePattern{object_class, col, row};
           }),
           py::arg("object_class"),
           py::arg("col"),
           py::arg("row"))
      .def_readwrite("object_class", &ItemSquarePattern::object_class)
      .def_readwrite("col", &ItemSquarePattern::col)
      .def_readwrite("row", &ItemSquarePattern::row)
      .def("__eq__", &ItemSquarePattern::operator==);

  py::class_<ChunkEntry>(m, "ChunkEntry")
      .def(py::init([](const ItemSquarePattern& item, EntryId entry_id) { return ChunkEntry{item, entry_id}; }),
           py::arg("item"),
           py::arg("entry_id"))
      .def_readwrite("item", &ChunkEntry::item)
      .def_readwrite("entry_id", &ChunkEntry::entry_id);

  py::class_<Chunk>(m, "Chunk")
      .def(py::init([](ChunkId id, const std::vector<ChunkEntry>& image) { return Chunk{id, image}; }),
           py::arg("id"),
           py::arg("image"))
      .def_readwrite("id", &Chunk::id)
      .def_readwrite("image", &Chunk::image);

  py::class_<RecognitionSource, PyRecognitionSource>(m, "RecognitionSource")
      .def(py::init<>())
      .def("recognise", &RecognitionSource::recognise, py::arg("pattern"), py::arg("time"));

  py::class_<FixationSource, PyFixationSource>(m, "FixationSource")
      .def(py::init<>())
      .def("next_fixation", &FixationSource::next_fixation, py::arg("environment"), py::arg("fixation_index"));

  py::class_<SalientSquareFixations, FixationSource>(m, "SalientSquareFixations")
      .def(py::init<unsigned int>(), py::arg("seed"));

  py::class_<ShortTermMemory, PyShortTermMemory>(m, "ShortTermMemory")
      .def(py::init<>())
      .def("push", &ShortTermMemory::push, py::arg("chunk"), py::arg("time"));

  m.def("normalise", &normalise, py::arg("pattern"));
  m.def("fixation_pattern",
        &fixation_pattern,
        py::arg("environment"),
        py::arg("fixation"),
        py::arg("field_of_view"));
}

void bind_field_config(py::module& m) {
  py::class_<FieldConfig>(m, "FieldConfig")
      .def(py::init<>())
      .def_readwrite("object_encoding_time", &FieldConfig::object_encoding_time)
      .def_readwrite("empty_square_encoding_time", &FieldConfig::empty_square_encoding_time)
      .def_readwrite("access_time", &FieldConfig::access_time)
      .def_readwrite("object_movement_time", &FieldConfig::object_movement_time)
      .def_readwrite("recognised_object_lifespan", &FieldConfig::recognised_object_lifespan)
      .def_readwrite("unrecognised_object_lifespan", &FieldConfig::unrecognised_object_lifespan)
      .def_readwrite("number_fixations", &FieldConfig::number_fixations)
      .def_readwrite("field_of_view", &FieldConfig::field_of_view)
      .def_readwrite("encode_scene_creator", &FieldConfig::encode_scene_creator)
      .def_readwrite("encode_ghost_objects", &FieldConfig::encode_ghost_objects)
      .def("validate", &FieldConfig::validate);
}

void bind_field(py::module& m) {
  py::class_<SpatialObject>(m, "SpatialObject")
      .def_property_readonly("identifier", &SpatialObject::identifier)
      .def_property_readonly("object_class", &SpatialObject::object_class)
      .def_property_readonly("time_created", &SpatialObject::time_created)
      .def_property_readonly("terminus", &SpatialObject::terminus)
      .def_property_readonly("is_ghost", &SpatialObject::is_ghost)
      .def("recognised", &SpatialObject::recognised, py::arg("time"))
      .def("alive", &SpatialObject::alive, py::arg("time"));

  py::class_<AttentionClock>(m, "AttentionClock")
      .def(py::init<Tick>(), py::arg("start_time") = 0)
      .def_property_readonly("time", &AttentionClock::time)
      .def("is_free_at", &AttentionClock::is_free_at, py::arg("requested_time"));

  py::class_<MoveStep>(m, "MoveStep")
      .def(py::init([](const std::string& identifier, int col, int row) { return MoveStep{identifier, col, row}; }),
           py::arg("identifier"),
           py::arg("col"),
           py::arg("row"))
      .def_readwrite("identifier", &MoveStep::identifier)
      .def_readwrite("col", &MoveStep::col)
      .def_readwrite("row", &MoveStep::row);

  py::class_<VisualSpatialField>(m, "VisualSpatialField")
      .def(py::init<const Environment&,
                    const FieldConfig&,
                    Tick,
                    AttentionClock*,
                    RecognitionSource&,
                    FixationSource&,
                    ShortTermMemory*>(),
           py::arg("reality"),
           py::arg("config"),
           py::arg("creation_time"),
           py::arg("clock"),
           py::arg("recognition"),
           py::arg("fixations"),
           py::arg("short_term_memory") = nullptr,
           py::keep_alive<1, 5>())
      .def("move_objects", &VisualSpatialField::move_objects, py::arg("moves"), py::arg("requested_time"))
      .def("square_contents",
           &VisualSpatialField::square_contents,
           py::arg("col"),
           py::arg("row"),
           py::return_value_policy::copy)
      .def("square_contents_at",
           &VisualSpatialField::square_contents_at,
           py::arg("col"),
           py::arg("row"),
           py::arg("time"))
      .def("as_scene", &VisualSpatialField::as_scene, py::arg("time"), py::arg("include_ghosts") = false)
      .def_property_readonly("attention_clock", &VisualSpatialField::attention_clock)
      .def_property_readonly("width", &VisualSpatialField::width)
      .def_property_readonly("height", &VisualSpatialField::height)
      .def_property_readonly("creation_time", &VisualSpatialField::creation_time)
      .def_property_readonly("scene_encoded", &VisualSpatialField::scene_encoded)
      .def("stats", [](const VisualSpatialField& field) { return field.stats().to_dict(); });
}

}  // namespace

PYBIND11_MODULE(vsfield_c, m) {
  m.doc() = "Visual-spatial field construction and decay";

  bind_errors(m);
  bind_environment(m);
  bind_recognition(m);
  bind_field_config(m);
  bind_field(m);

  m.def(
      "set_log_level",
      [](const std::string& level) { set_log_level(spdlog::level::from_str(level)); },
      py::arg("level"));
}
