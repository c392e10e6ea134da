#define BOOST_TEST_MODULE test module test_nrrd_wrapper

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/test/included/unit_test.hpp>

#include <image/nrrd_wrapper.hpp>

using namespace perron;

namespace {

struct nrrd_nuker {
    void operator()(Nrrd* nrrd) const {
        nrrdNuke(nrrd);
    }
};

typedef std::unique_ptr<Nrrd, nrrd_nuker> nrrd_ptr;

nrrd_ptr load(const std::string& filename) {
    nrrd_ptr nin(nrrdNew());
    if (nrrdLoad(nin.get(), filename.c_str(), NULL)) {
        throw std::runtime_error(nrrd_utils::error_msg("load: " + filename));
    }
    return nin;
}

boost::filesystem::path temp_name(const std::string& pattern) {
    return boost::filesystem::temp_directory_path() /
        boost::filesystem::unique_path(pattern);
}

}

BOOST_AUTO_TEST_SUITE(nrrd_wrapper_suite)

// Same layout as the iterate raster: grid fastest, iteration slowest.
BOOST_AUTO_TEST_CASE(test_raster_layout) {
    const size_t res = 5, niter = 3;
    std::vector<double> raster(res * niter);
    for (size_t i = 0 ; i < raster.size() ; ++i) raster[i] = 0.5 * static_cast<double>(i);

    std::vector<nrrd_utils::axis_info> axes;
    axes.push_back(nrrd_utils::axis_info(res, 0.25, 0.125, "x"));
    axes.push_back(nrrd_utils::axis_info(niter, 0, 1, "iteration"));
    std::vector<std::string> comments;
    comments.push_back("logistic map transfer operator r=3.54");
    comments.push_back("base density: constant");

    boost::filesystem::path name = temp_name("perron-%%%%-%%%%.nrrd");
    nrrd_utils::writeNrrd(&raster.front(), name.string(), axes, comments);

    nrrd_ptr nin = load(name.string());
    BOOST_REQUIRE_EQUAL(nin->dim, 2u);
    BOOST_CHECK_EQUAL(nin->type, static_cast<int>(nrrdTypeDouble));
    BOOST_CHECK_EQUAL(nin->axis[0].size, res);
    BOOST_CHECK_EQUAL(nin->axis[1].size, niter);
    BOOST_CHECK_CLOSE(nin->axis[0].min, 0.25, 1.0e-12);
    BOOST_CHECK_CLOSE(nin->axis[0].spacing, 0.125, 1.0e-12);
    BOOST_CHECK_EQUAL(nin->axis[1].min, 0.);
    BOOST_CHECK_CLOSE(nin->axis[1].spacing, 1., 1.0e-12);
    BOOST_CHECK_EQUAL(nin->axis[0].center, static_cast<int>(nrrdCenterNode));
    BOOST_REQUIRE(nin->axis[0].label != NULL);
    BOOST_REQUIRE(nin->axis[1].label != NULL);
    BOOST_CHECK_EQUAL(std::string(nin->axis[0].label), "x");
    BOOST_CHECK_EQUAL(std::string(nin->axis[1].label), "iteration");

    BOOST_REQUIRE_EQUAL(nin->cmtArr->len, 2u);
    BOOST_CHECK_EQUAL(std::string(nin->cmt[0]), comments[0]);
    BOOST_CHECK_EQUAL(std::string(nin->cmt[1]), comments[1]);

    const double* data = static_cast<const double*>(nin->data);
    for (size_t i = 0 ; i < raster.size() ; ++i) {
        BOOST_CHECK_EQUAL(data[i], raster[i]);
    }
    // sample 2 of iteration 1
    BOOST_CHECK_EQUAL(data[1 * res + 2], raster[7]);

    boost::filesystem::remove(name);
}

BOOST_AUTO_TEST_CASE(test_cell_centered_histogram) {
    std::vector<float> hist(4, 1.f);
    hist[0] = 2.f;
    std::vector<nrrd_utils::axis_info> axes;
    axes.push_back(nrrd_utils::axis_info(hist.size(), 0, 0.25, "x", nrrdCenterCell));

    boost::filesystem::path name = temp_name("perron-%%%%-%%%%-hist.nrrd");
    nrrd_utils::writeNrrd(&hist.front(), name.string(), axes);

    nrrd_ptr nin = load(name.string());
    BOOST_REQUIRE_EQUAL(nin->dim, 1u);
    BOOST_CHECK_EQUAL(nin->type, static_cast<int>(nrrdTypeFloat));
    BOOST_CHECK_EQUAL(nin->axis[0].size, 4u);
    BOOST_CHECK_EQUAL(nin->axis[0].center, static_cast<int>(nrrdCenterCell));
    BOOST_CHECK_EQUAL(nin->cmtArr->len, 0u);
    BOOST_CHECK_EQUAL(static_cast<const float*>(nin->data)[0], 2.f);

    boost::filesystem::remove(name);
}

BOOST_AUTO_TEST_CASE(test_write_errors) {
    std::vector<double> data(3, 0.);
    std::vector<nrrd_utils::axis_info> none;
    BOOST_CHECK_THROW(nrrd_utils::writeNrrd(&data.front(), "unused.nrrd", none),
                      std::invalid_argument);

    std::vector<nrrd_utils::axis_info> axes(1, nrrd_utils::axis_info(3));
    BOOST_CHECK_THROW(nrrd_utils::writeNrrd(&data.front(),
                                            "/nonexistent-directory/out.nrrd", axes),
                      std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
