#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <string>
#include <utility>
#include <vector>

#include "vntn_api.hpp"

namespace py = pybind11;

// =============================================================================
// pybind11 模块定义
// =============================================================================

PYBIND11_MODULE(_vntn, m) {
    m.doc() = "Vntn - Vietnamese text normalization Python bindings";

    // =========================================================================
    // NormalizerOptions - 配置结构
    // =========================================================================

    py::class_<Vntn::NormalizerOptions>(m, "NormalizerOptions", "Normalizer configuration")
        .def(py::init<>(), "Create default configuration")

        .def_readwrite("separate_alphanumeric", &Vntn::NormalizerOptions::separate_alphanumeric,
            "Insert spaces between letter and digit runs")
        .def_readwrite("split_separators", &Vntn::NormalizerOptions::split_separators,
            "Replace hyphens and underscores with spaces")
        .def_readwrite("max_grouped_digits", &Vntn::NormalizerOptions::max_grouped_digits,
            "Longer numbers are read digit by digit [1, 18]")
        .def_readwrite("max_integer_digits", &Vntn::NormalizerOptions::max_integer_digits,
            "Longest digit run recognized as an integer [1, 100]")
        .def_readwrite("read_full_groups", &Vntn::NormalizerOptions::read_full_groups,
            "Read 'khong tram' in inner groups below one hundred")
        .def_readwrite("verbose", &Vntn::NormalizerOptions::verbose,
            "Print every replacement")

        // 静态工厂方法
        .def_static("Default", &Vntn::NormalizerOptions::Default,
                    "Create default configuration")
        .def_static("FullGroups", &Vntn::NormalizerOptions::FullGroups,
                    "Create full group reading configuration")

        // Builder 方法（链式调用）
        .def("withFullGroups", &Vntn::NormalizerOptions::withFullGroups,
            py::arg("enable"),
            "Set full group reading (chainable)")
        .def("withVerbose", &Vntn::NormalizerOptions::withVerbose,
            py::arg("enable"),
            "Set verbose output (chainable)")

        .def("__repr__", [](const Vntn::NormalizerOptions& options) {
            return std::string("<NormalizerOptions read_full_groups=") +
                (options.read_full_groups ? "true" : "false") +
                " max_grouped_digits=" + std::to_string(options.max_grouped_digits) +
                " max_integer_digits=" + std::to_string(options.max_integer_digits) + ">";
        });

    // =========================================================================
    // MatchInfo - 匹配信息
    // =========================================================================

    py::class_<Vntn::MatchInfo>(m, "MatchInfo", "One replaced span")
        .def_readonly("type", &Vntn::MatchInfo::type, "Pattern type")
        .def_readonly("start", &Vntn::MatchInfo::start, "Start offset in the scanned text")
        .def_readonly("length", &Vntn::MatchInfo::length, "Length of the matched span")
        .def_readonly("original", &Vntn::MatchInfo::original, "Matched text")
        .def_readonly("normalized", &Vntn::MatchInfo::normalized, "Replacement text")
        .def("__repr__", [](const Vntn::MatchInfo& info) {
            return "<MatchInfo type=" + info.type + " original='" + info.original + "'>";
        });

    // =========================================================================
    // Normalizer - 规范化器
    // =========================================================================

    py::class_<Vntn::Normalizer>(m, "Normalizer", "Vietnamese text normalizer")
        .def(py::init<>(), "Create normalizer with default configuration")
        .def(py::init<const Vntn::NormalizerOptions&>(),
            py::arg("options"),
            "Create normalizer with configuration")

        .def("normalize", [](const Vntn::Normalizer& self, const std::string& text) {
            py::gil_scoped_release release;  // 释放 GIL，允许其他 Python 线程运行
            return self.Normalize(text);
        }, py::arg("text"),
            "Normalize text (releases GIL)")

        .def("normalize_with_trace", [](const Vntn::Normalizer& self, const std::string& text) {
            std::vector<Vntn::MatchInfo> trace;
            std::string result;
            {
                py::gil_scoped_release release;
                result = self.NormalizeWithTrace(text, trace);
            }
            return std::make_pair(result, trace);
        }, py::arg("text"),
            "Normalize text and return (result, [MatchInfo])")

        .def("get_options", &Vntn::Normalizer::GetOptions,
            "Get effective configuration")
        .def("is_valid", &Vntn::Normalizer::IsValid,
            "Check whether the configuration was valid")
        .def("get_last_error", &Vntn::Normalizer::GetLastError,
            "Get configuration error message");

    // =========================================================================
    // 模块级函数
    // =========================================================================

    m.def("normalize", [](const std::string& text) {
        py::gil_scoped_release release;
        return Vntn::Normalize(text);
    }, py::arg("text"), "Normalize text with the default configuration");

    m.attr("__version__") = "1.0.0";
}
