// PyBind11 bindings for the vita core.
// Exposes events, state, feedback, the memory hierarchy and the tick engine.
// JSON-valued results cross the boundary as strings (json.loads on the Python side).

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DVITA_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "environment/event_generator.hpp"
#include "feedback/feedback_tracker.hpp"
#include "memory/hierarchy_manager.hpp"
#include "memory/hierarchy_serializer.hpp"
#include "meaning/meaning_engine.hpp"
#include "runtime/tick_engine.hpp"
#include "state/event.hpp"
#include "state/event_queue.hpp"
#include "state/self_state.hpp"

namespace py = pybind11;

PYBIND11_MODULE(vita_bindings, m) {
    m.doc() = "vita organism runtime bindings";

    py::register_exception<vita::InvalidArgumentError>(m, "InvalidArgumentError", PyExc_ValueError);
    py::register_exception<vita::ConfigurationError>(m, "ConfigurationError", PyExc_RuntimeError);

    py::enum_<vita::ActionPattern>(m, "ActionPattern")
        .value("IGNORE", vita::ActionPattern::IGNORE)
        .value("DAMPEN", vita::ActionPattern::DAMPEN)
        .value("ABSORB", vita::ActionPattern::ABSORB)
        .value("AMPLIFY", vita::ActionPattern::AMPLIFY);

    // ── Configuration ──
    py::class_<vita::VitaConfig>(m, "VitaConfig")
        .def(py::init<>())
        .def_static("from_json", [](const std::string& text) {
            auto config = vita::configFromJson(nlohmann::json::parse(text));
            config.validate();
            return config;
        })
        .def_static("load", &vita::loadConfig)
        .def("to_json", [](const vita::VitaConfig& c) { return vita::configToJson(c).dump(); })
        .def("validate", &vita::VitaConfig::validate);

    m.def("init_logging", [](const std::string& level) {
        vita::LoggingConfig config;
        config.level = level;
        vita::logging::init(config);
    }, py::arg("level") = "info");

    // ── Event ──
    py::class_<vita::Event>(m, "Event")
        .def(py::init<std::string, double, double, vita::Attributes>(),
             py::arg("type"), py::arg("intensity"), py::arg("timestamp"),
             py::arg("metadata") = vita::Attributes{})
        .def_property_readonly("type", &vita::Event::type)
        .def_property_readonly("intensity", &vita::Event::intensity)
        .def_property_readonly("timestamp", &vita::Event::timestamp)
        .def_property_readonly("metadata", &vita::Event::metadata);

    py::class_<vita::EventQueue, std::shared_ptr<vita::EventQueue>>(m, "EventQueue")
        .def(py::init<size_t>(), py::arg("capacity") = 100)
        .def("push", &vita::EventQueue::push)
        .def("size", &vita::EventQueue::size)
        .def("dropped_count", &vita::EventQueue::droppedCount);

    py::class_<vita::EventGenerator>(m, "EventGenerator")
        .def(py::init([](uint32_t seed) { return vita::EventGenerator(seed); }), py::arg("seed"))
        .def("generate", &vita::EventGenerator::generate)
        .def("generate_batch", &vita::EventGenerator::generateBatch)
        .def("set_weight", &vita::EventGenerator::setWeight);

    // ── State ──
    py::class_<vita::StateVitals>(m, "StateVitals")
        .def(py::init<>())
        .def_readwrite("energy", &vita::StateVitals::energy)
        .def_readwrite("stability", &vita::StateVitals::stability)
        .def_readwrite("integrity", &vita::StateVitals::integrity);

    py::class_<vita::SelfState>(m, "SelfState")
        .def(py::init<>())
        .def_readwrite("energy", &vita::SelfState::energy)
        .def_readwrite("stability", &vita::SelfState::stability)
        .def_readwrite("integrity", &vita::SelfState::integrity)
        .def_readonly("ticks", &vita::SelfState::ticks)
        .def_readonly("age", &vita::SelfState::age)
        .def_readonly("pending_actions", &vita::SelfState::pending_actions)
        .def("apply_delta", &vita::SelfState::applyDelta)
        .def("vitals", &vita::SelfState::vitals)
        .def("memory_size", [](const vita::SelfState& s) { return s.memory.count(); })
        .def("to_json", [](const vita::SelfState& s) { return vita::selfStateToJson(s).dump(); });

    // ── Feedback ──
    py::class_<vita::FeedbackRecord>(m, "FeedbackRecord")
        .def_readonly("action_id", &vita::FeedbackRecord::action_id)
        .def_readonly("action_pattern", &vita::FeedbackRecord::action_pattern)
        .def_readonly("state_delta", &vita::FeedbackRecord::state_delta)
        .def_readonly("delay_ticks", &vita::FeedbackRecord::delay_ticks)
        .def_readonly("associated_events", &vita::FeedbackRecord::associated_events);

    py::class_<vita::FeedbackTracker>(m, "FeedbackTracker")
        .def(py::init([](uint32_t seed) { return vita::FeedbackTracker(vita::FeedbackConfig{}, seed); }),
             py::arg("seed"))
        .def("register_action", &vita::FeedbackTracker::registerAction,
             py::arg("action_id"), py::arg("action_pattern"), py::arg("state_before"),
             py::arg("timestamp"), py::arg("context") = vita::Attributes{},
             py::arg("check_after_ticks") = std::nullopt)
        .def("record_event", &vita::FeedbackTracker::recordEvent)
        .def("observe_consequences", &vita::FeedbackTracker::observeConsequences)
        .def("pending_count", &vita::FeedbackTracker::pendingCount)
        .def("is_pending", &vita::FeedbackTracker::isPending);

    // ── Memory hierarchy ──
    py::class_<vita::ConsolidationResult>(m, "ConsolidationResult")
        .def_readonly("sensory_to_episodic_transfers", &vita::ConsolidationResult::sensory_to_episodic_transfers)
        .def_readonly("episodic_to_semantic_transfers", &vita::ConsolidationResult::episodic_to_semantic_transfers)
        .def_readonly("semantic_consolidations", &vita::ConsolidationResult::semantic_consolidations)
        .def_readonly("procedural_optimizations", &vita::ConsolidationResult::procedural_optimizations)
        .def_readonly("success", &vita::ConsolidationResult::success)
        .def_readonly("error_message", &vita::ConsolidationResult::error_message)
        .def_readonly("details", &vita::ConsolidationResult::details);

    py::class_<vita::MemoryHierarchyManager, std::shared_ptr<vita::MemoryHierarchyManager>>(
            m, "MemoryHierarchyManager")
        .def(py::init([](const vita::VitaConfig& config) {
            return std::make_shared<vita::MemoryHierarchyManager>(config);
        }), py::arg("config") = vita::VitaConfig{})
        .def("add_sensory_event", &vita::MemoryHierarchyManager::addSensoryEvent)
        .def("consolidate_memory", &vita::MemoryHierarchyManager::consolidateMemory)
        .def("query_memory", [](const vita::MemoryHierarchyManager& self, const std::string& level,
                                const vita::Attributes& params) {
            auto r = self.queryMemory(level, params);
            if (!r.success) throw vita::ConfigurationError(r.error_message);
            return r.results.dump();
        }, py::arg("level"), py::arg("params") = vita::Attributes{})
        .def("hierarchy_status", [](const vita::MemoryHierarchyManager& self) {
            return self.hierarchyStatus().dump();
        })
        .def("serialize", [](const vita::MemoryHierarchyManager& self) {
            return vita::HierarchySerializer::serialize(self).dump();
        })
        .def("deserialize", [](vita::MemoryHierarchyManager& self, const std::string& text) {
            vita::HierarchySerializer::deserialize(self, nlohmann::json::parse(text));
        })
        .def("reset", &vita::MemoryHierarchyManager::resetHierarchy);

    // ── Tick engine ──
    py::class_<vita::TickEngine>(m, "TickEngine")
        .def(py::init([](const vita::VitaConfig& config, std::shared_ptr<vita::EventQueue> queue,
                         uint32_t seed) {
            return std::make_unique<vita::TickEngine>(
                config, std::move(queue), std::make_shared<vita::DefaultMeaningEngine>(),
                nullptr, nullptr, nullptr, vita::defaultClock(), seed);
        }), py::arg("config"), py::arg("queue"), py::arg("seed") = 42u)
        .def("run_tick", &vita::TickEngine::runTick)
        .def("run_ticks", &vita::TickEngine::runTicks,
             py::call_guard<py::gil_scoped_release>())
        .def("snapshot", &vita::TickEngine::snapshot)
        .def("smoothed_intensity", &vita::TickEngine::smoothedIntensity)
        .def("memory", &vita::TickEngine::memory);
}
