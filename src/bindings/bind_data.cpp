// bindings for SampleGroup
#include "bindings_common.h"
#include <hypsim/data/SampleGroup.h>
#include <string>

void bind_data(py::module_ &m)
{
    py::class_<SampleGroup>(m, "SampleGroup",
                            R"pbdoc(
            Fixed-arity tuple of numeric samples under comparison.

            Args:
                samples: list of groups, each a list of floats
        )pbdoc")
        .def(py::init<std::vector<Sample>>(), py::arg("samples"))
        .def_property_readonly("arity", &SampleGroup::arity, "Number of groups")
        .def_property_readonly("sizes", &SampleGroup::sizes, "Group sizes, in group order")
        .def_property_readonly("total_size", &SampleGroup::totalSize)
        .def("group", &SampleGroup::group, py::arg("index"), "Observations of one group")
        .def("pooled", &SampleGroup::pooled, "Concatenation of all groups")
        .def("__len__", &SampleGroup::arity)
        .def("__getitem__", &SampleGroup::group)
        .def("__eq__", &SampleGroup::operator==)
        .def("__repr__", [](const SampleGroup &g)
             {
                 std::string s = "<SampleGroup sizes=[";
                 for (size_t i = 0; i < g.arity(); ++i)
                     s += (i ? ", " : "") + std::to_string(g[i].size());
                 return s + "]>";
             });
}
