#define BOOST_TEST_MODULE test module test_density_analysis

#include <cmath>
#include <numeric>
#include <stdexcept>
#include <vector>

#include <boost/test/included/unit_test.hpp>

#include <maps/density.hpp>
#include <maps/density_analysis.hpp>
#include <maps/logistic_map.hpp>
#include <maps/transfer_operator.hpp>

using namespace perron;

BOOST_AUTO_TEST_SUITE(density_analysis_suite)

BOOST_AUTO_TEST_CASE(test_grids) {
    vector_type x = uniform_grid(350);
    BOOST_REQUIRE_EQUAL(x.size(), 350);
    BOOST_CHECK_EQUAL(x[0], 0.);
    BOOST_CHECK_CLOSE(x[349], 1., 1.0e-12);
    BOOST_CHECK_CLOSE(x[1] - x[0], 1. / 349., 1.0e-8);

    vector_type one = uniform_grid(1, 0.3, 0.7);
    BOOST_REQUIRE_EQUAL(one.size(), 1);
    BOOST_CHECK_EQUAL(one[0], 0.3);

    vector_type m = midpoint_grid(4, 0., 2.);
    BOOST_REQUIRE_EQUAL(m.size(), 4);
    BOOST_CHECK_CLOSE(m[0], 0.25, 1.0e-12);
    BOOST_CHECK_CLOSE(m[3], 1.75, 1.0e-12);

    BOOST_CHECK_THROW(uniform_grid(0), std::invalid_argument);
    BOOST_CHECK_THROW(midpoint_grid(0), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_sample) {
    density_ptr rho = make_density<function_density>(
        [](double x) { return 2. * x; });
    vector_type x = uniform_grid(11);
    vector_type v = sample(*rho, x);
    BOOST_REQUIRE_EQUAL(v.size(), x.size());
    for (Eigen::Index i = 0 ; i < x.size() ; ++i) {
        BOOST_CHECK_EQUAL(v[i], 2. * x[i]);
    }
}

BOOST_AUTO_TEST_CASE(test_mass_of_base_densities) {
    BOOST_CHECK_CLOSE(mass(constant_density(1.)), 1., 1.0e-8);
    BOOST_CHECK_CLOSE(mass(constant_density(2.), 0.25, 0.75), 1., 1.0e-8);
    BOOST_CHECK_CLOSE(mass(function_density([](double x) { return x; })), 0.5, 1.0e-8);
    BOOST_CHECK_CLOSE(mass(arcsine_density()), 1., 1.0e-4);

    std::vector<double> values(4);
    values[0] = 0.5; values[1] = 1.5; values[2] = 1.; values[3] = 1.;
    BOOST_CHECK_CLOSE(mass(binned_density(values)), 1., 1.0e-6);

    BOOST_CHECK_EQUAL(mass(constant_density(1.), 0.5, 0.5), 0.);
    BOOST_CHECK_THROW(mass(constant_density(1.), 1., 0.), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_mass_conservation) {
    density_ptr one = make_density<constant_density>(1.);
    const double rs[] = { 1., 2.5, 3.54, 4. };
    for (double r : rs) {
        double err = -1;
        double m = mass(*transfer(r, one), 0., 1., 1.0e-8, &err);
        BOOST_CHECK_CLOSE(m, 1., 1.0e-4);
        BOOST_CHECK(err >= 0);

        BOOST_CHECK_CLOSE(mass(*transfer(r, one, 2)), 1., 1.0e-2);
        BOOST_CHECK_CLOSE(mass(*transfer(r, one, 3)), 1., 1.0e-2);
    }

    density_ptr smooth = make_density<function_density>(
        [](double x) { return 1.5 - x; });
    BOOST_CHECK_CLOSE(mass(*transfer(3.54, smooth)), mass(*smooth), 1.0e-4);
}

BOOST_AUTO_TEST_CASE(test_l1_distance) {
    vector_type a = vector_type::Constant(10, 1.);
    vector_type b = vector_type::Constant(10, 0.5);
    BOOST_CHECK_CLOSE(l1_distance(a, b, 0.1), 0.5, 1.0e-10);
    BOOST_CHECK_EQUAL(l1_distance(a, a, 0.1), 0.);
    BOOST_CHECK_THROW(l1_distance(a, vector_type::Zero(3), 0.1), std::invalid_argument);

    BOOST_CHECK_CLOSE(l1_distance(constant_density(1.), constant_density(0.5), 100),
                      0.5, 1.0e-10);
    BOOST_CHECK_CLOSE(l1_distance(constant_density(1.), constant_density(0.), 10, 0.2, 0.6),
                      0.4, 1.0e-10);
}

BOOST_AUTO_TEST_CASE(test_convergence_history) {
    // the arcsine density is a fixed point of T at r = 4
    transfer_operator T4(4.);
    std::vector<double> d = convergence_history(T4, make_density<arcsine_density>(), 3, 200);
    BOOST_REQUIRE_EQUAL(d.size(), 3u);
    for (size_t i = 0 ; i < d.size() ; ++i) {
        BOOST_CHECK_SMALL(d[i], 1.0e-9);
    }

    transfer_operator T(3.54);
    std::vector<double> h = convergence_history(T, make_density<constant_density>(1.), 4, 350);
    BOOST_REQUIRE_EQUAL(h.size(), 4u);
    for (size_t i = 0 ; i < h.size() ; ++i) {
        BOOST_CHECK(std::isfinite(h[i]));
        BOOST_CHECK(h[i] > 0);
    }

    BOOST_CHECK(convergence_history(T, make_density<constant_density>(1.), 0, 10).empty());
}

BOOST_AUTO_TEST_CASE(test_orbit_histogram) {
    logistic_map f(4.);
    const size_t nbins = 50;
    binned_density hist = orbit_histogram(f, 100, 1000, 5000, nbins, 1);
    BOOST_REQUIRE_EQUAL(hist.size(), nbins);
    BOOST_CHECK_CLOSE(hist.bin_width(), 1. / 50., 1.0e-10);

    const std::vector<double>& h = hist.values();
    BOOST_CHECK_CLOSE(std::accumulate(h.begin(), h.end(), 0.) / nbins, 1., 1.0e-8);

    // bin averages of the invariant density
    arcsine_density arcsine;
    double l1 = 0;
    for (size_t i = 0 ; i < nbins ; ++i) {
        double lo = static_cast<double>(i) / nbins;
        double hi = static_cast<double>(i + 1) / nbins;
        double expected = mass(arcsine, lo, hi) * nbins;
        l1 += std::abs(h[i] - expected) / nbins;
    }
    BOOST_CHECK_SMALL(l1, 0.03);

    // same seed, same histogram
    binned_density again = orbit_histogram(f, 100, 1000, 5000, nbins, 1);
    for (size_t i = 0 ; i < nbins ; ++i) {
        BOOST_CHECK_EQUAL(again.values()[i], h[i]);
    }
}

BOOST_AUTO_TEST_CASE(test_orbit_histogram_errors) {
    logistic_map f(3.54);
    BOOST_CHECK_THROW(orbit_histogram(f, 10, 100, 100, 0), std::invalid_argument);
    BOOST_CHECK_THROW(orbit_histogram(f, 0, 100, 100, 10), std::invalid_argument);
    BOOST_CHECK_THROW(orbit_histogram(f, 10, 100, 0, 10), std::invalid_argument);

    // every orbit leaves [0,1] for r > 4
    logistic_map escape(6.);
    BOOST_CHECK_THROW(orbit_histogram(escape, 10, 100, 100, 10), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
