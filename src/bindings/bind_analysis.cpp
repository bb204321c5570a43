// bindings for generators and repeated-testing analyses
#include "bindings_common.h"
#include <hypsim/analysis/GroupGenerator.h>
#include <hypsim/analysis/PowerAnalysis.h>
#include <hypsim/hypothesis/PermutationTests.h>
#include <map>
#include <string>

namespace {

// tagged dispatch: Python picks the test by name
TestFactory factoryByName(const std::string &name)
{
    static const std::map<std::string, TestFactory> factories = {
        {"diff_means", makeTestFactory<DiffMeansPermute>()},
        {"diff_means_one_sided", makeTestFactory<DiffMeansOneSided>()},
        {"diff_std", makeTestFactory<DiffStdPermute>()},
        {"multi_group_means", makeTestFactory<MultiGroupMeansPermute>()},
        {"diff_means_resample", makeTestFactory<DiffMeansResample>()},
        {"correlation", makeTestFactory<CorrelationPermute>()},
    };
    auto it = factories.find(name);
    if (it == factories.end())
        throw py::value_error("unknown test '" + name + "'");
    return it->second;
}

} // namespace

void bind_analysis(py::module_ &m)
{
    py::class_<SampleGroupGenerator>(m, "SampleGroupGenerator")
        .def("generate", [](const SampleGroupGenerator &g, uint64_t seed)
             {
                 PCG32Generator rng(seed);
                 return g.generate(rng);
             },
             py::arg("seed"))
        .def_property_readonly("sizes", &SampleGroupGenerator::sizes);

    py::class_<NormalGroupGenerator, SampleGroupGenerator>(m, "NormalGroupGenerator")
        .def(py::init<std::vector<size_t>, std::vector<double>, std::vector<double>>(),
             py::arg("sizes"), py::arg("means"), py::arg("std_devs"))
        .def_static("null_pair", &NormalGroupGenerator::nullPair,
                    py::arg("n"), py::arg("m"), py::arg("mean") = 0.0, py::arg("std_dev") = 1.0)
        .def_static("shifted_pair", &NormalGroupGenerator::shiftedPair,
                    py::arg("n"), py::arg("m"), py::arg("effect_size"), py::arg("std_dev") = 1.0);

    py::class_<ResamplingGroupGenerator, SampleGroupGenerator>(m, "ResamplingGroupGenerator")
        .def(py::init<SampleGroup>(), py::arg("observed"))
        .def(py::init<SampleGroup, std::vector<size_t>>(), py::arg("observed"), py::arg("sizes"));

    py::class_<PooledResamplingGenerator, SampleGroupGenerator>(m, "PooledResamplingGenerator")
        .def(py::init<const SampleGroup &>(), py::arg("observed"))
        .def(py::init<const SampleGroup &, std::vector<size_t>>(), py::arg("observed"), py::arg("sizes"));

    py::class_<ExperimentOptions>(m, "ExperimentOptions")
        .def(py::init([](size_t numExperiments, size_t iterations, double threshold,
                         std::optional<uint64_t> seed, bool parallel, bool verbose)
                      {
                          ExperimentOptions o;
                          o.numExperiments = numExperiments;
                          o.iterations = iterations;
                          o.significanceThreshold = threshold;
                          o.randomSeed = seed;
                          o.parallel = parallel;
                          o.verbose = verbose;
                          return o;
                      }),
             py::arg("num_experiments") = 1000,
             py::arg("iterations") = 1000,
             py::arg("significance_threshold") = 0.05,
             py::arg("random_seed") = py::none(),
             py::arg("parallel") = false,
             py::arg("verbose") = false)
        .def_readwrite("num_experiments", &ExperimentOptions::numExperiments)
        .def_readwrite("iterations", &ExperimentOptions::iterations)
        .def_readwrite("significance_threshold", &ExperimentOptions::significanceThreshold)
        .def_readwrite("random_seed", &ExperimentOptions::randomSeed)
        .def_readwrite("parallel", &ExperimentOptions::parallel)
        .def_readwrite("verbose", &ExperimentOptions::verbose);

    py::class_<RateEstimate>(m, "RateEstimate")
        .def_readonly("rate", &RateEstimate::rate)
        .def_readonly("num_flagged", &RateEstimate::numFlagged)
        .def_readonly("num_experiments", &RateEstimate::numExperiments)
        .def_readonly("std_error", &RateEstimate::stdError)
        .def_readonly("ci95_lower", &RateEstimate::ci95Lower)
        .def_readonly("ci95_upper", &RateEstimate::ci95Upper)
        .def_readonly("p_values", &RateEstimate::pValues);

    // the GIL is released: experiments may run on OpenMP threads
    m.def("estimate_false_positive_rate",
          [](const SampleGroupGenerator &g, const std::string &test, const ExperimentOptions &opts)
          {
              TestFactory f = factoryByName(test);
              py::gil_scoped_release release;
              return estimateFalsePositiveRate(g, f, opts);
          },
          py::arg("generator"), py::arg("test") = "diff_means", py::arg("options") = ExperimentOptions{});

    m.def("estimate_power",
          [](const SampleGroupGenerator &g, const std::string &test, const ExperimentOptions &opts)
          {
              TestFactory f = factoryByName(test);
              py::gil_scoped_release release;
              return estimatePower(g, f, opts);
          },
          py::arg("generator"), py::arg("test") = "diff_means", py::arg("options") = ExperimentOptions{});

    m.def("estimate_false_negative_rate",
          [](const SampleGroupGenerator &g, const std::string &test, const ExperimentOptions &opts)
          {
              TestFactory f = factoryByName(test);
              py::gil_scoped_release release;
              return estimateFalseNegativeRate(g, f, opts);
          },
          py::arg("generator"), py::arg("test") = "diff_means", py::arg("options") = ExperimentOptions{});
}
