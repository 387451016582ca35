#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>
#include "format_detector.hpp"
#include "mesh_reader.hpp"
#include "parser_registry.hpp"

namespace py = pybind11;
using namespace meshstream;

namespace {

std::vector<char> to_buffer(const py::bytes& data) {
    std::string raw = data;
    return std::vector<char>(raw.begin(), raw.end());
}

} // namespace

PYBIND11_MODULE(meshstream_cpp, m) {
    m.doc() = "C++ implementation of STL mesh parsing and validation";

    py::register_exception<ParseError>(m, "ParseError");

    py::enum_<WarningKind>(m, "WarningKind")
        .value("DegenerateGeometry", WarningKind::DegenerateGeometry)
        .value("NormalRecomputed", WarningKind::NormalRecomputed)
        .value("TruncatedInput", WarningKind::TruncatedInput);

    py::enum_<TruncationPolicy>(m, "TruncationPolicy")
        .value("Fail", TruncationPolicy::Fail)
        .value("DecodeCompleteRecords", TruncationPolicy::DecodeCompleteRecords);

    py::class_<Warning>(m, "Warning")
        .def_readonly("triangle_index", &Warning::triangle_index)
        .def_readonly("kind", &Warning::kind);

    py::class_<MeshData>(m, "MeshData")
        .def(py::init<>())
        .def_readwrite("vertices", &MeshData::vertices)
        .def_readwrite("faces", &MeshData::faces)
        .def_readwrite("normals", &MeshData::normals);

    py::class_<ParseOptions>(m, "ParseOptions")
        .def(py::init<>())
        .def_readwrite("max_file_size", &ParseOptions::max_file_size)
        .def_readwrite("max_triangles", &ParseOptions::max_triangles)
        .def_readwrite("truncated_binary", &ParseOptions::truncated_binary)
        .def_readwrite("forced_format", &ParseOptions::forced_format);

    py::class_<Mesh>(m, "Mesh")
        .def_property_readonly("name", &Mesh::name)
        .def_property_readonly("format", &Mesh::format)
        .def_property_readonly("triangle_count", &Mesh::triangle_count)
        .def_property_readonly("vertex_count", &Mesh::vertex_count)
        .def_property_readonly("source_size", &Mesh::source_size)
        .def_property_readonly("warnings", &Mesh::warnings)
        .def_property_readonly("has_warnings", &Mesh::has_warnings)
        .def_property_readonly("bounds_min", [](const Mesh& mesh) { return Vector3(mesh.bounds().min); })
        .def_property_readonly("bounds_max", [](const Mesh& mesh) { return Vector3(mesh.bounds().max); })
        .def_property_readonly("bounds_empty", [](const Mesh& mesh) { return mesh.bounds().empty(); })
        .def("center", &Mesh::center)
        .def("size", &Mesh::size)
        .def("max_dimension", &Mesh::max_dimension)
        .def("to_mesh_data", &Mesh::to_mesh_data);

    py::class_<ParserRegistry>(m, "ParserRegistry")
        .def(py::init(&ParserRegistry::create_default))
        .def("formats", [](const ParserRegistry& registry) {
            std::vector<std::string> formats;
            for (const auto& reader : registry.readers()) {
                formats.push_back(reader->format());
            }
            return formats;
        })
        .def("supported_extensions", &ParserRegistry::supported_extensions);

    m.def("detect_format", [](const ParserRegistry& registry, const std::string& path, const py::bytes& data) {
              return detect_format(registry, path, to_buffer(data));
          },
          "Detect the format tag of a file, empty if unsupported",
          py::arg("registry"), py::arg("path"), py::arg("data"));

    m.def("parse_bytes", [](const ParserRegistry& registry, const std::string& path, const py::bytes& data,
                            const ParseOptions& options) {
              std::vector<char> buffer = to_buffer(data);
              py::gil_scoped_release release;
              return parse_mesh(registry, path, buffer, options);
          },
          "Parse mesh file contents already in memory",
          py::arg("registry"), py::arg("path"), py::arg("data"), py::arg("options") = ParseOptions());

    m.def("parse_file", &parse_file,
          "Read and parse a mesh file",
          py::arg("registry"), py::arg("path"), py::arg("options") = ParseOptions(),
          py::call_guard<py::gil_scoped_release>());

    m.def("parse_file_with_timing", &parse_file_with_timing,
          "Parse a mesh file and return (mesh, seconds)",
          py::arg("registry"), py::arg("path"), py::arg("options") = ParseOptions(),
          py::call_guard<py::gil_scoped_release>());
}
