#include <algorithm>
#include <array>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/format.hpp>

#include <image/nrrd_wrapper.hpp>
#include <maps/density.hpp>
#include <maps/density_analysis.hpp>
#include <maps/logistic_map.hpp>
#include <maps/transfer_operator.hpp>
#include <misc/log_helper.hpp>
#include <misc/option_parse.hpp>
#include <misc/progress.hpp>

using namespace perron;

double r;
unsigned int niter;
size_t res, hist_samples, nbins;
unsigned int seed;
std::array<double, 2> bounds;
std::string out_basename, base_name, log_name;
bool verbose;

bool initialize(int argc, const char* argv[]) {
    namespace xcl = perron::command_line;

    xcl::option_traits
        required(true, false, "Required Options"),
        optional(false, false, "Optional Group");
    xcl::option_parser parser(argv[0],
        "Iterate the transfer operator of the logistic map f(x) = r x (1-x) "
        "on a base density and sample the iterates on a regular grid");

    std::array<double, 2> default_bounds = {{ 0., 1. }};
    try {
        parser.add_value("param,r", r, "Map parameter r", required);
        parser.add_value("output,o", out_basename, "Output basename", required);
        parser.add_value("niter,n", niter, 4, "Nb. of operator applications", optional);
        parser.add_value("res", res, 350, "Nb. of sampling points", optional);
        parser.add_tuple<2>("bounds", bounds, default_bounds, "Sampling interval", optional);
        parser.add_value("base", base_name, std::string("constant"), "Base density (constant, arcsine)", optional);
        parser.add_value("hist", hist_samples, 0, "Nb. of orbit samples for histogram comparison (0: off)", optional);
        parser.add_value("bins", nbins, 100, "Nb. of histogram bins", optional);
        parser.add_value("seed", seed, 1, "Random seed for orbit initial conditions", optional);
        parser.add_value("log", log_name, "Log file name (default: <output>.log)", optional);
        parser.add_flag("verbose,v", verbose, "Toggle verbose output", optional);

        if (!parser.parse(argc, argv)) return false;
    }
    catch(std::runtime_error& e) {
        std::cerr << parser.print_self(false, true, false) << "\n\n";
        throw;
    }

    if (res < 2) {
        throw std::invalid_argument("at least 2 sampling points are required");
    }
    if (!(bounds[1] > bounds[0])) {
        throw std::invalid_argument("sampling bounds must be increasing");
    }
    if (base_name != "constant" && base_name != "arcsine") {
        throw std::invalid_argument("unknown base density: " + base_name);
    }
    if (nbins == 0) {
        throw std::invalid_argument("at least one histogram bin is required");
    }
    if (log_name.empty()) log_name = out_basename + ".log";
    return true;
}

void run(log::dual_ostream& logger) {
    logger(1) << "parameters: r = " << r << ", iterations = " << niter
              << ", resolution = " << res << ", bounds = [" << bounds[0]
              << ", " << bounds[1] << "], base = " << base_name << std::endl;
    if (r < 0 || r > 4) {
        logger(0, "WARNING") << "r = " << r
                             << " lies outside [0,4]: the map does not preserve [0,1]"
                             << std::endl;
    }

    density_ptr base;
    if (base_name == "arcsine") base = make_density<arcsine_density>();
    else base = make_density<constant_density>(1.);

    const transfer_operator T(r);
    const vector_type x = uniform_grid(res, bounds[0], bounds[1]);
    const double h = (bounds[1] - bounds[0]) / static_cast<double>(res - 1);
    // convergence is measured on cell centers, as convergence_history does
    const vector_type xm = midpoint_grid(res, bounds[0], bounds[1]);
    const double hm = (bounds[1] - bounds[0]) / static_cast<double>(res);

    // raster: res samples per iterate, iterates 0..niter
    std::vector<double> raster(res * (niter + 1));
    vector_type previous;

    progress_display progress(!verbose);
    progress.begin(niter + 1, "iterating");
    density_ptr current = base;
    for (unsigned int k = 0 ; k <= niter ; ++k) {
        if (k > 0) current = T(current);
        vector_type values = current->evaluate(x);
        for (Eigen::Index i = 0 ; i < values.size() ; ++i) {
            raster[k * res + static_cast<size_t>(i)] = values[i];
        }

        vector_type centers = current->evaluate(xm);

        double err = 0;
        double m = mass(*current, bounds[0], bounds[1], 1.0e-8, &err);
        if (k == 0) {
            logger(2) << boost::format("iteration %3d: mass = %.8f (+/- %.1e)")
                         % k % m % err << std::endl;
        }
        else {
            double l1 = l1_distance(previous, centers, hm);
            logger(2) << boost::format("iteration %3d: mass = %.8f (+/- %.1e), "
                                       "L1 distance to previous = %.6e")
                         % k % m % err % l1 << std::endl;
        }
        previous.swap(centers);
        progress.update(k);
    }
    progress.end();
    logger(1) << "operator iterations: " << progress << std::endl;

    std::vector<std::string> comments;
    comments.push_back((boost::format("logistic map transfer operator r=%.17g") % r).str());
    comments.push_back("base density: " + base_name);
    comments.push_back((boost::format("iterations: 0..%d") % niter).str());

    std::vector<nrrd_utils::axis_info> axes;
    axes.push_back(nrrd_utils::axis_info(res, bounds[0], h, "x"));
    axes.push_back(nrrd_utils::axis_info(niter + 1, 0, 1, "iteration"));
    const std::string filename = out_basename + ".nrrd";
    nrrd_utils::writeNrrd(&raster.front(), filename, axes, comments);
    logger(1) << "exported " << filename << std::endl;

    if (hist_samples == 0) return;

    const size_t norbits = 100;
    const size_t length = std::max<size_t>(1, hist_samples / norbits);
    binned_density hist = orbit_histogram(T.map(), norbits, 1000, length, nbins, seed);
    double l1 = l1_distance(hist, *current, 10 * nbins);
    logger(1) << boost::format("orbit histogram (%d x %d samples, %d bins): "
                               "L1 distance to iterate %d = %.6e")
                 % norbits % length % nbins % niter % l1 << std::endl;

    std::vector<nrrd_utils::axis_info> hist_axes;
    hist_axes.push_back(nrrd_utils::axis_info(nbins, 0, hist.bin_width(), "x",
                                              nrrdCenterCell));
    const std::string hist_name = out_basename + "-hist.nrrd";
    nrrd_utils::writeNrrd(&hist.values().front(), hist_name, hist_axes, comments);
    logger(1) << "exported " << hist_name << std::endl;
}

int main(int argc, const char* argv[]) {
    try {
        if (!initialize(argc, argv)) return 0;

        log::dual_ostream logger(log_name, std::cout, verbose ? 2 : 1, 2);
        try {
            run(logger);
        }
        catch(std::exception& e) {
            logger(0, "ERROR") << e.what() << std::endl;
            return 1;
        }
    }
    catch(std::exception& e) {
        std::cerr << "ERROR: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
