#include "device_discovery.hpp"
#include "driver_config.hpp"
#include "secret_store.hpp"

#include <pybind11/chrono.h>
#include <pybind11/functional.h>
#include <pybind11/iostream.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <iostream>

#define STRINGIFY(x) #x
#define MACRO_STRINGIFY(x) STRINGIFY(x)


constexpr auto SCAN_DOCSTRING =
  "Probe every host on every port for ONVIF cameras\n"
  "\n"
  "Each reachable camera is queried for its device information using the\n"
  "credentials stored under the default secret path (or under its endpoint\n"
  "reference when the default ones are rejected).\n"
  "Returns a list of DiscoveredDevice objects in no particular order.";

namespace py = pybind11;

/// @brief Wrap python log callback with lambda that will catch exceptions and handle them safely
static onvifcore::log_callback_t wrapLogCallback(py::object py_callback)
{
    if (py_callback.is_none())
    {
        return nullptr;
    }
    auto callback = py_callback.cast<std::function<void(const std::string&, uint32_t)>>();
    return [callback](const std::string& msg, uint32_t level)
    {
        py::gil_scoped_acquire aquire;
        try {
            callback(msg, level);
        } catch(py::error_already_set& e) {
            std::cerr << "uncaught exception from log callback:\n" << e.what() << std::flush;
            #if PYBIND11_VERSION_MAJOR >= 2 && PYBIND11_VERSION_MINOR >= 6
            e.discard_as_unraisable("uncaught exception from log callback");
            #endif
        }
    };
}

static std::vector<onvifcore::DiscoveredDevice> scan(const std::vector<std::string>& hosts,
                                                      std::vector<uint16_t> ports,
                                                      const onvifcore::DriverConfig& config,
                                                      const std::map<std::string, onvifcore::Credentials>& secrets,
                                                      py::object log_callback)
{
    auto store = std::make_shared<onvifcore::JsonSecretStore>();
    for (const auto& [path, credentials] : secrets)
    {
        store->set_credentials(path, credentials);
    }
    const auto logger = wrapLogCallback(log_callback);
    config.validate();
    if (ports.empty())
    {
        ports = config.scan_ports;
    }

    py::gil_scoped_release release;
    auto client = std::make_shared<onvifcore::OnvifDeviceClient>(store, config.request_timeout, logger);
    onvifcore::OnvifProtocolDiscovery discovery { client, config };
    onvifcore::ScanParams params;
    params.timeout = config.probe_timeout;
    params.logger = logger;
    return onvifcore::scan_hosts(discovery, hosts, ports, params, config.max_concurrency);
}


PYBIND11_MODULE(pyonvifcore, m) {
    m.doc() = "Discovery of ONVIF cameras with WS-Discovery unicast probes.";

    py::class_<onvifcore::Credentials>(m, "Credentials")
        .def(py::init<>())
        .def(py::init([](const std::string& username, const std::string& password) {
            return onvifcore::Credentials { username, password };
        }), py::arg("username"), py::arg("password"))
        .def_readwrite("username", &onvifcore::Credentials::username)
        .def_readwrite("password", &onvifcore::Credentials::password);

    py::class_<onvifcore::DriverConfig>(m, "DriverConfig")
        .def(py::init<>())
        .def_static("from_file", &onvifcore::DriverConfig::from_file, py::arg("path"), "Load settings from a JSON file")
        .def_static("from_string", &onvifcore::DriverConfig::from_string, py::arg("content"), "Load settings from a JSON string")
        .def_readwrite("default_auth_mode", &onvifcore::DriverConfig::default_auth_mode)
        .def_readwrite("default_secret_path", &onvifcore::DriverConfig::default_secret_path)
        .def_readwrite("probe_timeout", &onvifcore::DriverConfig::probe_timeout)
        .def_readwrite("request_timeout", &onvifcore::DriverConfig::request_timeout)
        .def_readwrite("scan_ports", &onvifcore::DriverConfig::scan_ports)
        .def_readwrite("max_concurrency", &onvifcore::DriverConfig::max_concurrency)
        .def("validate", &onvifcore::DriverConfig::validate, "Raise ValueError naming the first invalid setting");

    py::class_<onvifcore::DiscoveredDevice>(m, "DiscoveredDevice")
        .def_readonly("name", &onvifcore::DiscoveredDevice::name)
        .def_readonly("protocols", &onvifcore::DiscoveredDevice::protocols)
        .def_readonly("description", &onvifcore::DiscoveredDevice::description)
        .def_readonly("labels", &onvifcore::DiscoveredDevice::labels)
        .def("to_json", [](const onvifcore::DiscoveredDevice& d, int indent) { return onvifcore::to_json(d, indent); },
             py::arg("indent") = -1, "Serialize the device record as a JSON object")
        .def("__repr__", [](const onvifcore::DiscoveredDevice& d) { return "<DiscoveredDevice '" + d.name + "'>"; });

    m.def("scan", &scan, SCAN_DOCSTRING, py::arg("hosts"), py::arg("ports") = std::vector<uint16_t> { },
          py::arg("config") = onvifcore::DriverConfig { },
          py::arg("secrets") = std::map<std::string, onvifcore::Credentials> { },
          py::arg("log_callback") = py::none());

    m.attr("LOG_LVL_ERROR") = onvifcore::LOG_LVL_ERROR;
    m.attr("LOG_LVL_WARN") = onvifcore::LOG_LVL_WARN;
    m.attr("LOG_LVL_INFO") = onvifcore::LOG_LVL_INFO;
    m.attr("LOG_LVL_DEBUG") = onvifcore::LOG_LVL_DEBUG;
    m.attr("LOG_LVL_TRACE") = onvifcore::LOG_LVL_TRACE;
    m.attr("WS_DISCOVERY_PORT") = onvifcore::WS_DISCOVERY_PORT;

#ifdef VERSION_INFO
    m.attr("__version__") = MACRO_STRINGIFY(VERSION_INFO);
#else
    m.attr("__version__") = "dev";
#endif
}
