/**
 * @file datatypes.hh
 * @brief Internal datatypes used throughout the project.
 * @version 0.1
 */
#ifndef datatypes_h
#define datatypes_h

#include <cstdint>
#include <vector>
#include <sys/types.h>

namespace micstat {

// Type of the boolean masks.
typedef uint8_t mask_type;

/**
 * Datatype for an input array.
 * A non-owning, read-only view of a row-major array.
 *
 * It has two entries:
 *
 * - `data` : a `T*` to the data.
 *
 * - `shape` : a vector holding the shape of the data.
 *
 * @tparam T the element type of the array.
 */
template <typename T>
struct input_ndarray {
    // Pointer to the internal data.
    const T *data;
    // The shape of the data.
    const std::vector<ssize_t> shape;

    /**
     * Construct a new input ndarray object.
     *
     * @param arg_data the pointer to the data.
     * @param arg_shape the shape of the data.
     */
    input_ndarray(const T *arg_data, const std::vector<ssize_t> &arg_shape) : data(arg_data), shape(arg_shape) {}

    // Total number of elements.
    int64_t size() const {
        int64_t n = 1;
        for (ssize_t s : shape) n *= s;
        return n;
    }
};

/**
 * Owning, row-major array. Results of the library (z-score fields, masks, simulated images) are returned as `ndarray`s.
 *
 * @tparam T the element type of the array.
 */
template <typename T>
struct ndarray {
    // The elements in C order.
    std::vector<T> data;
    // The shape of the data.
    std::vector<ssize_t> shape;

    ndarray() = default;

    /**
     * Construct a new ndarray with every element set to `fill`.
     *
     * @param arg_shape the shape of the array.
     * @param fill the initial value of every element.
     */
    explicit ndarray(const std::vector<ssize_t> &arg_shape, const T fill = T()) : shape(arg_shape) {
        int64_t n = 1;
        for (ssize_t s : shape) n *= s;
        data.assign(n, fill);
    }

    int64_t size() const { return (int64_t) data.size(); }

    input_ndarray<T> input() const { return input_ndarray<T>(data.data(), shape); }
};

// std::vector<bool> is bit-packed and has no data pointer, so masks are stored as bytes.
template <>
struct ndarray<bool> {
    std::vector<mask_type> data;
    std::vector<ssize_t> shape;

    ndarray() = default;

    explicit ndarray(const std::vector<ssize_t> &arg_shape, const bool fill = false) : shape(arg_shape) {
        int64_t n = 1;
        for (ssize_t s : shape) n *= s;
        data.assign(n, fill ? 1 : 0);
    }

    int64_t size() const { return (int64_t) data.size(); }

    bool operator[](const int64_t i) const { return data[i] != 0; }
};

/**
 * Struct for holding the shape of a 3D array. 2D images are represented with `z == 1`.
 *
 * It has three members:
 *
 * - `z` : the size of the z-axis.
 *
 * - `y` : the size of the y-axis.
 *
 * - `x` : the size of the x-axis.
 */
typedef struct {
    int64_t z, y, x;
} shape_t;

/**
 * Struct for holding a 3D index.
 *
 * It has three members:
 *
 * - `z` : the z coordinate.
 *
 * - `y` : the y coordinate.
 *
 * - `x` : the x coordinate.
 */
typedef struct {
    int64_t z, y, x;
} idx3d;

// Variable that enables debug printing - aka. VERY VERBOSE!
constexpr bool DEBUG = false;

// Variable that enables profiling - aka. internal timing measuring and reporting/printing.
constexpr bool PROFILE = false;

// Default number of histogram bins.
constexpr int64_t DEFAULT_BINS = 256;

// Default significance level for the SACA significance mask.
constexpr double DEFAULT_ALPHA = 0.05;

} // namespace micstat

/**
 * Expands `X(T)` once for every supported pixel type. Used for the explicit template instantiations in the `.cc` files.
 *
 * @param X a macro taking a single type argument.
 */
#define FOR_EACH_PIXEL_TYPE(X) \
    X(uint8_t)  \
    X(uint16_t) \
    X(uint32_t) \
    X(uint64_t) \
    X(int64_t)  \
    X(float)    \
    X(double)

#endif // datatypes_h
