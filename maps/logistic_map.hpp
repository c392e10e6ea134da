#ifndef __PERRON_MAPS_LOGISTIC_MAP_HPP__
#define __PERRON_MAPS_LOGISTIC_MAP_HPP__

#include <algorithm>
#include <cmath>
#include <vector>

#include <Eigen/Core>

namespace perron {

typedef Eigen::VectorXd vector_type;

// f_r(x) = r x (1-x)
inline double evaluate(double r, double x) {
    return r * x * (1. - x);
}

// f_r'(x) = r (1-2x)
inline double derivative(double r, double x) {
    return r - 2. * r * x;
}

inline vector_type evaluate(double r, const vector_type& x) {
    vector_type y(x.size());
    for (Eigen::Index i = 0 ; i < x.size() ; ++i) {
        y[i] = evaluate(r, x[i]);
    }
    return y;
}

inline vector_type derivative(double r, const vector_type& x) {
    vector_type d(x.size());
    for (Eigen::Index i = 0 ; i < x.size() ; ++i) {
        d[i] = derivative(r, x[i]);
    }
    return d;
}

/** logistic_map: the quadratic family f_r on the unit interval.
    The map is 2-to-1 on [0, r/4) with its fold at the critical
    point x = 1/2. Every member function is defined for all real
    arguments; meaningful results require r in [0,4], x in [0,1].
 */
class logistic_map {
public:
    typedef double      value_type;
    typedef vector_type state_vector;

    explicit logistic_map(double r) : _r(r) {}

    double r() const {
        return _r;
    }

    double critical_point() const {
        return 0.5;
    }

    // largest value attained on [0,1], f_r(1/2)
    double max_value() const {
        return 0.25 * _r;
    }

    double operator()(double x) const {
        return evaluate(_r, x);
    }

    state_vector operator()(const state_vector& x) const {
        return evaluate(_r, x);
    }

    double derivative(double x) const {
        return perron::derivative(_r, x);
    }

    state_vector derivative(const state_vector& x) const {
        return perron::derivative(_r, x);
    }

    // Solves x^2 - x + y/r = 0 for y < r/4, with x1 >= 1/2 >= x2:
    //   x1 = 1/2 + sqrt(1/4 - y/r),  x2 = 1/2 - sqrt(1/4 - y/r)
    // x2 is obtained from x1 x2 = y/r to avoid cancellation near 0.
    // Returns false (and leaves x1, x2 untouched) when no real
    // preimage exists. The discriminant is clamped at zero so that
    // rounding near the fold cannot produce NaN; both roots then
    // collapse onto the critical point.
    bool preimages(double y, double& x1, double& x2) const {
        if (_r == 0 || !(y < max_value())) return false;
        double delta = std::max(0.25 - y / _r, 0.);
        double s = std::sqrt(delta);
        x1 = 0.5 + s;
        x2 = (s > 0) ? (y / _r) / x1 : 0.5;
        return true;
    }

    double map(double x, unsigned int n = 1) const {
        double y = x;
        for (unsigned int i = 0 ; i < n ; ++i) {
            y = evaluate(_r, y);
        }
        return y;
    }

    void map(double x, std::vector<double>& hits, unsigned int n = 1) const {
        hits.resize(n);
        double y = x;
        for (unsigned int i = 0 ; i < n ; ++i) {
            y = evaluate(_r, y);
            hits[i] = y;
        }
    }

private:
    double _r;
};

} // namespace perron

#endif // __PERRON_MAPS_LOGISTIC_MAP_HPP__
