#ifndef __PERRON_MAPS_DENSITY_ANALYSIS_HPP__
#define __PERRON_MAPS_DENSITY_ANALYSIS_HPP__

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <vector>

#include <boost/math/quadrature/tanh_sinh.hpp>

#include <maps/density.hpp>
#include <maps/logistic_map.hpp>
#include <maps/transfer_operator.hpp>

namespace perron {

// n equispaced points, both ends included
inline vector_type uniform_grid(size_t n, double min = 0, double max = 1) {
    if (n == 0) throw std::invalid_argument("uniform_grid: empty grid");
    if (n == 1) return vector_type::Constant(1, min);
    return vector_type::LinSpaced(static_cast<Eigen::Index>(n), min, max);
}

// centers of n uniform cells
inline vector_type midpoint_grid(size_t n, double min = 0, double max = 1) {
    if (n == 0) throw std::invalid_argument("midpoint_grid: empty grid");
    const double h = (max - min) / static_cast<double>(n);
    vector_type x(static_cast<Eigen::Index>(n));
    for (Eigen::Index i = 0 ; i < x.size() ; ++i) {
        x[i] = min + (static_cast<double>(i) + 0.5) * h;
    }
    return x;
}

inline vector_type sample(const density& rho, const vector_type& x) {
    return rho.evaluate(x);
}

/** Integral of rho over [min, max] by tanh-sinh quadrature.
    The interval is split at the singularities reported by the
    density so that every singular point is an endpoint of a
    subinterval, where tanh-sinh copes with integrable blow-ups.
    If error is not null it receives the sum of the error estimates.
 */
inline double mass(const density& rho, double min = 0, double max = 1,
                   double tolerance = 1.0e-8, double* error = nullptr) {
    if (max < min) throw std::invalid_argument("mass: invalid bounds");

    std::vector<double> knots(1, min);
    std::vector<double> s = rho.singularities();
    std::sort(s.begin(), s.end());
    for (size_t i = 0 ; i < s.size() ; ++i) {
        if (s[i] > knots.back() && s[i] < max) knots.push_back(s[i]);
    }
    knots.push_back(max);

    boost::math::quadrature::tanh_sinh<double> integrator;
    auto f = [&](double x) { return rho(x); };
    double total = 0, total_err = 0;
    for (size_t i = 0 ; i + 1 < knots.size() ; ++i) {
        if (!(knots[i+1] > knots[i])) continue;
        double err = 0;
        total += integrator.integrate(f, knots[i], knots[i+1], tolerance, &err);
        total_err += err;
    }
    if (error != nullptr) *error = total_err;
    return total;
}

// Midpoint-rule L1 distance between two sampled densities.
inline double l1_distance(const vector_type& a, const vector_type& b, double h) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("l1_distance: size mismatch");
    }
    return h * (a - b).cwiseAbs().sum();
}

inline double l1_distance(const density& rho1, const density& rho2,
                          size_t n, double min = 0, double max = 1) {
    vector_type x = midpoint_grid(n, min, max);
    const double h = (max - min) / static_cast<double>(n);
    return l1_distance(rho1.evaluate(x), rho2.evaluate(x), h);
}

// L1 distances between T^k rho and T^(k+1) rho, k = 0..niter-1,
// measured on n cells of [min, max].
inline std::vector<double>
convergence_history(const transfer_operator& T, const density_ptr& rho,
                    unsigned int niter, size_t n,
                    double min = 0, double max = 1) {
    vector_type x = midpoint_grid(n, min, max);
    const double h = (max - min) / static_cast<double>(n);

    std::vector<double> distances;
    distances.reserve(niter);
    density_ptr current = rho;
    vector_type previous = current->evaluate(x);
    for (unsigned int k = 0 ; k < niter ; ++k) {
        current = T(current);
        vector_type values = current->evaluate(x);
        distances.push_back(l1_distance(previous, values, h));
        previous.swap(values);
    }
    return distances;
}

/** orbit_histogram: empirical density of long forward orbits.
    norbits orbits start at uniformly random points of [0,1]; the
    first transient iterates of each orbit are discarded and the next
    length iterates are binned. The histogram is normalized to unit
    mass over [0,1].
 */
inline binned_density
orbit_histogram(const logistic_map& map, size_t norbits, size_t transient,
                size_t length, size_t nbins, unsigned int seed = 1) {
    if (nbins == 0) throw std::invalid_argument("orbit_histogram: no bins");
    if (norbits == 0 || length == 0) {
        throw std::invalid_argument("orbit_histogram: no samples");
    }

    std::mt19937 generator(seed);
    std::uniform_real_distribution<double> uniform(0., 1.);

    std::vector<double> counts(nbins, 0.);
    size_t total = 0;
    for (size_t n = 0 ; n < norbits ; ++n) {
        double x = map.map(uniform(generator), static_cast<unsigned int>(transient));
        for (size_t i = 0 ; i < length ; ++i) {
            x = map(x);
            if (!(x >= 0 && x <= 1)) continue;
            size_t bin = std::min(static_cast<size_t>(x * static_cast<double>(nbins)), nbins - 1);
            counts[bin] += 1;
            ++total;
        }
    }
    if (total == 0) {
        throw std::runtime_error("orbit_histogram: all orbits escaped [0,1]");
    }

    const double scale = static_cast<double>(nbins) / static_cast<double>(total);
    for (size_t i = 0 ; i < nbins ; ++i) {
        counts[i] *= scale;
    }
    return binned_density(counts, 0., 1.);
}

} // namespace perron

#endif // __PERRON_MAPS_DENSITY_ANALYSIS_HPP__
