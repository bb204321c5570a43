// pybind11 module entry point
#include "bindings_common.h"

PYBIND11_MODULE(_core, m)
{
    m.doc() = R"pbdoc(
        hypsim Python Bindings
        ----------------------

        Python interface to the hypsim Monte Carlo hypothesis-testing library.
        The core performs no rendering: trial distributions are returned as
        lists for matplotlib / notebook plotting.

        Example:
            import hypsim

            data = hypsim.SampleGroup([firsts, others])
            test = hypsim.DiffMeansPermute(data, seed=17)
            p = test.p_value(1000)
            plt.hist(test.trial_distribution(), bins=50)
            plt.axvline(test.actual)

            gen = hypsim.NormalGroupGenerator.shifted_pair(50, 50, effect_size=0.5)
            power = hypsim.estimate_power(gen, "diff_means",
                                          hypsim.ExperimentOptions(num_experiments=500))
    )pbdoc";

    bind_data(m);
    bind_tests(m);
    bind_analysis(m);

    m.attr("__version__") = "0.1.0";
}
