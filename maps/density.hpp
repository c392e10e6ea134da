#ifndef __PERRON_MAPS_DENSITY_HPP__
#define __PERRON_MAPS_DENSITY_HPP__

#include <cmath>
#include <functional>
#include <limits>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/math/constants/constants.hpp>

#include <maps/logistic_map.hpp>

namespace perron {

/** density: a real function on [0,1] representing a distribution
    of states. Scalar and batched evaluation are both first-class;
    the batched version is the one chains of transferred densities
    rely on, so derived classes should override it whenever a
    single pass over the batch is cheaper than repeated calls.
 */
class density {
public:
    virtual ~density() {}

    virtual double operator()(double x) const = 0;

    // out[i] = rho(x[i])
    virtual void evaluate(const vector_type& x, vector_type& out) const {
        out.resize(x.size());
        for (Eigen::Index i = 0 ; i < x.size() ; ++i) {
            out[i] = (*this)(x[i]);
        }
    }

    vector_type evaluate(const vector_type& x) const {
        vector_type out;
        evaluate(x, out);
        return out;
    }

    // Points where the density may be unbounded or discontinuous.
    virtual std::vector<double> singularities() const {
        return std::vector<double>();
    }
};

typedef std::shared_ptr<const density> density_ptr;

template<typename Density_, typename... Args>
inline density_ptr make_density(Args&&... args) {
    return std::make_shared<Density_>(std::forward<Args>(args)...);
}

class constant_density : public density {
public:
    using density::evaluate;

    explicit constant_density(double value = 1.) : _value(value) {}

    double operator()(double) const {
        return _value;
    }

    void evaluate(const vector_type& x, vector_type& out) const {
        out = vector_type::Constant(x.size(), _value);
    }

    double value() const {
        return _value;
    }

private:
    double _value;
};

// Wraps an arbitrary callable double(double).
class function_density : public density {
public:
    typedef std::function<double (double)> function_type;

    explicit function_density(const function_type& f,
                              const std::vector<double>& singular = std::vector<double>())
        : _f(f), _singular(singular) {
        if (!_f) throw std::invalid_argument("function_density: empty function");
    }

    double operator()(double x) const {
        return _f(x);
    }

    std::vector<double> singularities() const {
        return _singular;
    }

private:
    function_type       _f;
    std::vector<double> _singular;
};

// 1/(pi sqrt(x(1-x))): invariant density of the fully chaotic map r=4
class arcsine_density : public density {
public:
    double operator()(double x) const {
        if (x < 0 || x > 1) return 0;
        if (x == 0 || x == 1) return std::numeric_limits<double>::infinity();
        return 1. / (boost::math::constants::pi<double>() * std::sqrt(x * (1. - x)));
    }

    std::vector<double> singularities() const {
        return std::vector<double>{ 0., 1. };
    }
};

// Piecewise constant density over uniform bins of [min, max], zero outside.
class binned_density : public density {
public:
    binned_density(const std::vector<double>& values, double min = 0, double max = 1)
        : _values(values), _min(min), _max(max) {
        if (_values.empty()) {
            throw std::invalid_argument("binned_density: no bins");
        }
        if (!(_max > _min)) {
            throw std::invalid_argument("binned_density: invalid bounds");
        }
        _width = (_max - _min) / static_cast<double>(_values.size());
    }

    double operator()(double x) const {
        if (x < _min || x > _max) return 0;
        size_t i = static_cast<size_t>((x - _min) / _width);
        if (i >= _values.size()) i = _values.size() - 1;
        return _values[i];
    }

    std::vector<double> singularities() const {
        std::vector<double> edges(_values.size() + 1);
        for (size_t i = 0 ; i <= _values.size() ; ++i) {
            edges[i] = _min + static_cast<double>(i) * _width;
        }
        return edges;
    }

    const std::vector<double>& values() const { return _values; }
    size_t size() const { return _values.size(); }
    double min() const { return _min; }
    double max() const { return _max; }
    double bin_width() const { return _width; }

private:
    std::vector<double> _values;
    double _min, _max, _width;
};

} // namespace perron

#endif // __PERRON_MAPS_DENSITY_HPP__
