#ifndef __PERRON_IMAGE_NRRD_WRAPPER_HPP__
#define __PERRON_IMAGE_NRRD_WRAPPER_HPP__

#include <teem/nrrd.h>

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace perron { namespace nrrd_utils {

// maps the value types written by perron to their teem type index
template<typename T>
struct nrrd_value_traits_from_type {};

template<>
struct nrrd_value_traits_from_type<float> {
    typedef float data_type;
    static const int index = nrrdTypeFloat;
};

template<>
struct nrrd_value_traits_from_type<double> {
    typedef double data_type;
    static const int index = nrrdTypeDouble;
};

// Collects (and releases) the pending teem error message.
inline std::string error_msg(const std::string& fun_name="", const char* what=NRRD) {
    char* err = biffGetDone(what);
    std::string msg = fun_name + ": " + (err ? err : "unknown teem error");
    free(err);
    return msg;
}

// Deletes the Nrrd structure but not the data it wraps.
struct nrrd_nixer {
    void operator()(Nrrd* nrrd) const {
        nrrdNix(nrrd);
    }
};

/** Per-axis description of a raster to be written. Axes are listed
    fastest first, as in teem.
 */
struct axis_info {
    axis_info(size_t _size = 0, double _min = 0, double _spacing = 1,
              const std::string& _label = "", int _center = nrrdCenterNode)
        : size(_size), min(_min), spacing(_spacing), label(_label), center(_center) {}

    size_t      size;
    double      min;
    double      spacing;
    std::string label;
    int         center;
};

template<typename T>
inline void writeNrrd(const T* data, const std::string& filename,
                      const std::vector<axis_info>& axes,
                      const std::vector<std::string>& comments = std::vector<std::string>()) {
    if (axes.empty()) {
        throw std::invalid_argument("writeNrrd: no axes given for " + filename);
    }
    const size_t dim = axes.size();
    std::vector<size_t>      sizes(dim);
    std::vector<double>      mins(dim), spacings(dim);
    std::vector<int>         centers(dim);
    std::vector<const char*> labels(dim);
    for (size_t i = 0 ; i < dim ; ++i) {
        sizes[i]    = axes[i].size;
        mins[i]     = axes[i].min;
        spacings[i] = axes[i].spacing;
        centers[i]  = axes[i].center;
        labels[i]   = axes[i].label.c_str();
    }

    std::unique_ptr<Nrrd, nrrd_nixer> nout(nrrdNew());
    // teem never writes through the data pointer when saving
    if (nrrdWrap_nva(nout.get(), const_cast<T*>(data),
                     nrrd_value_traits_from_type<T>::index,
                     static_cast<unsigned int>(dim), &sizes.front())) {
        throw std::runtime_error(error_msg("writeNrrd: error while wrapping"));
    }
    nrrdAxisInfoSet_nva(nout.get(), nrrdAxisInfoMin, &mins.front());
    nrrdAxisInfoSet_nva(nout.get(), nrrdAxisInfoSpacing, &spacings.front());
    nrrdAxisInfoSet_nva(nout.get(), nrrdAxisInfoCenter, &centers.front());
    nrrdAxisInfoSet_nva(nout.get(), nrrdAxisInfoLabel, &labels.front());
    for (size_t i = 0 ; i < comments.size() ; ++i) {
        nrrdCommentAdd(nout.get(), comments[i].c_str());
    }
    if (nrrdSave(filename.c_str(), nout.get(), NULL)) {
        throw std::runtime_error(error_msg("writeNrrd: error while saving " + filename));
    }
}

} // nrrd_utils
} // perron

#endif // __PERRON_IMAGE_NRRD_WRAPPER_HPP__
