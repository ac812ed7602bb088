#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <string>

#include "ptzgw/camera_model.hpp"
#include "ptzgw/constants.hpp"
#include "ptzgw/control_protocol.hpp"
#include "ptzgw/errors.hpp"
#include "ptzgw/json.hpp"
#include "ptzgw/speed.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_ptzgw_native, m) {
    m.doc() = "PTZ gateway native C++ bindings";

    // Errors
    auto gateway_error = py::register_exception<ptzgw::GatewayError>(m, "GatewayError");
    py::register_exception<ptzgw::ProtocolError>(m, "ProtocolError", gateway_error.ptr());
    py::register_exception<ptzgw::JsonError>(m, "JsonError", gateway_error.ptr());

    // Speed quantization
    py::enum_<ptzgw::Axis>(m, "Axis")
        .value("PAN", ptzgw::Axis::Pan)
        .value("TILT", ptzgw::Axis::Tilt)
        .value("ZOOM", ptzgw::Axis::Zoom);

    py::class_<ptzgw::SpeedTable>(m, "SpeedTable")
        .def(py::init<>())
        .def(py::init([](double high, double medium, double low) {
                 return ptzgw::SpeedTable{high, medium, low};
             }),
             py::arg("high"), py::arg("medium"), py::arg("low"))
        .def_readwrite("high", &ptzgw::SpeedTable::high)
        .def_readwrite("medium", &ptzgw::SpeedTable::medium)
        .def_readwrite("low", &ptzgw::SpeedTable::low);

    py::class_<ptzgw::SpeedQuantizer>(m, "SpeedQuantizer")
        .def(py::init<>())
        .def(py::init<const ptzgw::SpeedTable&, const ptzgw::SpeedTable&,
                      const ptzgw::SpeedTable&>(),
             py::arg("pan"), py::arg("tilt"), py::arg("zoom"))
        .def("quantize", &ptzgw::SpeedQuantizer::quantize,
             py::arg("axis"), py::arg("level"))
        .def("table", &ptzgw::SpeedQuantizer::table, py::arg("axis"));

    m.def("quantize",
          static_cast<double (*)(ptzgw::Axis, int)>(&ptzgw::quantize),
          py::arg("axis"), py::arg("level"),
          "Quantize a -3..+3 speed level with the default tables.");

    // Controller protocol
    py::enum_<ptzgw::ControlCommand::Kind>(m, "CommandKind")
        .value("STOP", ptzgw::ControlCommand::Kind::Stop)
        .value("HOME", ptzgw::ControlCommand::Kind::Home)
        .value("PRESET", ptzgw::ControlCommand::Kind::Preset)
        .value("PTZ", ptzgw::ControlCommand::Kind::Ptz)
        .value("PAN", ptzgw::ControlCommand::Kind::Pan)
        .value("TILT", ptzgw::ControlCommand::Kind::Tilt)
        .value("ZOOM", ptzgw::ControlCommand::Kind::Zoom);

    py::class_<ptzgw::ControlCommand>(m, "ControlCommand")
        .def_readonly("kind", &ptzgw::ControlCommand::kind)
        .def_readonly("token", &ptzgw::ControlCommand::token)
        .def_readonly("pan", &ptzgw::ControlCommand::pan)
        .def_readonly("tilt", &ptzgw::ControlCommand::tilt)
        .def_readonly("zoom", &ptzgw::ControlCommand::zoom)
        .def("__repr__", [](const ptzgw::ControlCommand& c) {
            return std::string("<ControlCommand ") + ptzgw::to_string(c.kind) + ">";
        });

    m.def("parse_command", &ptzgw::parse_command, py::arg("line"),
          "Parse one controller command line; raises ProtocolError.");

    // Camera model - JSON text in, JSON text out
    py::class_<ptzgw::CameraDescriptor>(m, "CameraDescriptor")
        .def_static("from_json",
                    [](const std::string& text) {
                        return ptzgw::CameraDescriptor::from_json(ptzgw::Json::parse(text));
                    },
                    py::arg("text"))
        .def_readonly("uuid", &ptzgw::CameraDescriptor::uuid)
        .def_readonly("name", &ptzgw::CameraDescriptor::name)
        .def_readonly("manufacturer", &ptzgw::CameraDescriptor::manufacturer)
        .def_readonly("model", &ptzgw::CameraDescriptor::model)
        .def_readonly("uri", &ptzgw::CameraDescriptor::uri)
        .def("label", &ptzgw::CameraDescriptor::label);

    py::class_<ptzgw::Preset>(m, "Preset")
        .def(py::init([](const std::string& token, const std::string& name) {
                 return ptzgw::Preset{token, name};
             }),
             py::arg("token"), py::arg("name") = "")
        .def_readwrite("token", &ptzgw::Preset::token)
        .def_readwrite("name", &ptzgw::Preset::name);

    m.def("state_json",
          [](const ptzgw::CameraDescriptor& source, const std::string& info_json,
             bool ptz, const std::vector<ptzgw::Preset>& presets) {
              ptzgw::DeviceInfo info = ptzgw::DeviceInfo::from_json(ptzgw::Json::parse(info_json));
              return ptzgw::CameraState(source, info, ptz, presets).to_json();
          },
          py::arg("source"), py::arg("info_json"), py::arg("ptz"), py::arg("presets"),
          "DTO JSON published to controllers for an initialized camera.");

    m.def("failure_state_json",
          [](const ptzgw::CameraDescriptor& source, const std::string& error) {
              return ptzgw::CameraState::from_failure(source, error).to_json();
          },
          py::arg("source"), py::arg("error"),
          "DTO JSON published to controllers for a camera that failed to initialize.");

    // Constants
    m.attr("DEFAULT_CONTROL_PORT") = ptzgw::DEFAULT_CONTROL_PORT;
    m.attr("DEFAULT_API_URI") = ptzgw::DEFAULT_API_URI;
    m.attr("SOURCE_TOPIC") = ptzgw::SOURCE_TOPIC;
    m.attr("CONTINUOUS_MOVE_TIMEOUT") = ptzgw::CONTINUOUS_MOVE_TIMEOUT;
}
