#ifndef __PERRON_MAPS_TRANSFER_OPERATOR_HPP__
#define __PERRON_MAPS_TRANSFER_OPERATOR_HPP__

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include <maps/density.hpp>
#include <maps/logistic_map.hpp>

namespace perron {

/** transferred_density: pushforward T rho of a density under f_r,

        (T rho)(y) = sum_{f_r(x)=y} rho(x) / |f_r'(x)|

    The result is zero wherever y >= r/4 since no preimage exists
    there. Each instance shares ownership of the density it was
    built from; chains T^n rho are linked lists of such instances
    and cost 2^n evaluations of rho per query point.
 */
class transferred_density : public density {
public:
    using density::evaluate;

    // batches smaller than this are processed serially
    static const Eigen::Index parallel_threshold = 4096;

    transferred_density(double r, const density_ptr& inner)
        : _map(r), _inner(inner) {
        if (!_inner) {
            throw std::invalid_argument("transferred_density: null inner density");
        }
    }

    double r() const {
        return _map.r();
    }

    const logistic_map& map() const {
        return _map;
    }

    const density_ptr& inner() const {
        return _inner;
    }

    double operator()(double y) const {
        double x1, x2;
        if (!_map.preimages(y, x1, x2)) return 0;
        return contribution(x1, (*_inner)(x1)) + contribution(x2, (*_inner)(x2));
    }

    // The preimages of every valid query point are gathered into a
    // single batch so that the inner density is evaluated only once.
    // y and out may be the same vector.
    void evaluate(const vector_type& y, vector_type& out) const {
        const Eigen::Index n = y.size();
        vector_type result = vector_type::Zero(n);

        std::vector<Eigen::Index> valid;
        valid.reserve(n);
        const double ymax = _map.max_value();
        if (_map.r() != 0) {
            for (Eigen::Index i = 0 ; i < n ; ++i) {
                if (y[i] < ymax) valid.push_back(i);
            }
        }
        const Eigen::Index m = static_cast<Eigen::Index>(valid.size());
        if (m == 0) {
            out.swap(result);
            return;
        }

        vector_type x(2 * m);
        for_each_block(m, [&](Eigen::Index begin, Eigen::Index end) {
            for (Eigen::Index k = begin ; k < end ; ++k) {
                // cannot fail: y < r/4 and r != 0
                _map.preimages(y[valid[k]], x[2 * k], x[2 * k + 1]);
            }
        });

        vector_type rho;
        _inner->evaluate(x, rho);

        for_each_block(m, [&](Eigen::Index begin, Eigen::Index end) {
            for (Eigen::Index k = begin ; k < end ; ++k) {
                result[valid[k]] = contribution(x[2 * k], rho[2 * k]) +
                                   contribution(x[2 * k + 1], rho[2 * k + 1]);
            }
        });
        out.swap(result);
    }

    // forward images of the inner singularities, plus the fold value r/4
    std::vector<double> singularities() const {
        std::vector<double> s = _inner->singularities();
        for (size_t i = 0 ; i < s.size() ; ++i) {
            s[i] = _map(s[i]);
        }
        s.push_back(_map.max_value());
        std::sort(s.begin(), s.end());
        s.erase(std::unique(s.begin(), s.end()), s.end());
        return s;
    }

private:
    // rho(x)/|f_r'(x)|, zero where the slope vanishes
    double contribution(double x, double rho) const {
        double slope = std::abs(_map.derivative(x));
        if (!(slope > 0)) return 0;
        return rho / slope;
    }

    template<typename Func_>
    static void for_each_block(Eigen::Index size, const Func_& func) {
        if (size < parallel_threshold) {
            func(0, size);
            return;
        }
        tbb::parallel_for(tbb::blocked_range<Eigen::Index>(0, size, 1024),
                          [&](const tbb::blocked_range<Eigen::Index>& range) {
            func(range.begin(), range.end());
        });
    }

    logistic_map _map;
    density_ptr  _inner;
};

/** transfer_operator: T for a fixed parameter r.
    Applying it never evaluates anything; it wraps the given density
    and evaluation happens lazily at query time.
 */
class transfer_operator {
public:
    explicit transfer_operator(double r) : _map(r) {}

    double r() const {
        return _map.r();
    }

    const logistic_map& map() const {
        return _map;
    }

    density_ptr operator()(const density_ptr& rho) const {
        return std::make_shared<transferred_density>(_map.r(), rho);
    }

    // T^n rho, built by iterative wrapping
    density_ptr operator()(const density_ptr& rho, unsigned int n) const {
        density_ptr current = rho;
        for (unsigned int i = 0 ; i < n ; ++i) {
            current = (*this)(current);
        }
        return current;
    }

private:
    logistic_map _map;
};

inline density_ptr transfer(double r, const density_ptr& rho) {
    return transfer_operator(r)(rho);
}

inline density_ptr transfer(double r, const density_ptr& rho, unsigned int n) {
    return transfer_operator(r)(rho, n);
}

} // namespace perron

#endif // __PERRON_MAPS_TRANSFER_OPERATOR_HPP__
