/**
 * @file error.hh
 * @brief Exceptions thrown when the preconditions of a function are violated.
 *
 * Numeric degeneracies (zero variance, all ties, zero weights) are never reported through these. They surface as `0.0` or `NaN` in the results.
 */
#ifndef error_h
#define error_h

#include <cstdint>
#include <stdexcept>
#include <string>
#include <sys/types.h>
#include <vector>

namespace micstat {

    /**
     * Base class of every exception thrown by the library.
     */
    class error : public std::runtime_error {
    public:
        explicit error(const std::string &msg) : std::runtime_error(msg) {}
    };

    /**
     * Two arrays that are expected to correspond element-wise have different lengths.
     */
    class mismatched_lengths : public error {
    public:
        const std::string a_name, b_name;
        const int64_t a_length, b_length;

        /**
         * Construct a new mismatched lengths error.
         *
         * @param a_name The name of the first array.
         * @param a_length The length of the first array.
         * @param b_name The name of the second array.
         * @param b_length The length of the second array.
         */
        mismatched_lengths(const std::string &a_name, const int64_t a_length, const std::string &b_name, const int64_t b_length)
            : error("Mismatched array lengths, \"" + a_name + "\" of length " + std::to_string(a_length) +
                    " and \"" + b_name + "\" of length " + std::to_string(b_length) + " do not match."),
              a_name(a_name), b_name(b_name), a_length(a_length), b_length(b_length) {}
    };

    /**
     * Two arrays that are expected to have the same shape do not.
     */
    class mismatched_shapes : public error {
    public:
        const std::string a_name, b_name;
        const std::vector<ssize_t> a_shape, b_shape;

        /**
         * Construct a new mismatched shapes error.
         *
         * @param a_name The name of the first array.
         * @param a_shape The shape of the first array.
         * @param b_name The name of the second array.
         * @param b_shape The shape of the second array.
         */
        mismatched_shapes(const std::string &a_name, const std::vector<ssize_t> &a_shape, const std::string &b_name, const std::vector<ssize_t> &b_shape)
            : error("Mismatched array shapes, array \"" + a_name + "\" with shape " + shape_string(a_shape) +
                    " and array \"" + b_name + "\" with shape " + shape_string(b_shape) + " do not match."),
              a_name(a_name), b_name(b_name), a_shape(a_shape), b_shape(b_shape) {}

        // Formats a shape like `[10, 12]`.
        static std::string shape_string(const std::vector<ssize_t> &shape) {
            std::string result = "[";
            for (size_t i = 0; i < shape.size(); i++) {
                if (i > 0) result += ", ";
                result += std::to_string(shape[i]);
            }
            return result + "]";
        }
    };

    /**
     * An argument is out of range or otherwise nonsensical, e.g. an empty array or a zero bin count.
     */
    class invalid_parameter : public error {
    public:
        const std::string param_name;

        /**
         * Construct a new invalid parameter error.
         *
         * @param param_name The name of the offending parameter.
         * @param reason Why the value was rejected.
         */
        invalid_parameter(const std::string &param_name, const std::string &reason)
            : error("Invalid parameter \"" + param_name + "\", " + reason + "."), param_name(param_name) {}
    };

    /**
     * Throws `mismatched_lengths` if `a_length != b_length`.
     */
    inline void check_lengths(const std::string &a_name, const int64_t a_length, const std::string &b_name, const int64_t b_length) {
        if (a_length != b_length) {
            throw mismatched_lengths(a_name, a_length, b_name, b_length);
        }
    }

    /**
     * Throws `mismatched_shapes` if `a_shape != b_shape`.
     */
    inline void check_shapes(const std::string &a_name, const std::vector<ssize_t> &a_shape, const std::string &b_name, const std::vector<ssize_t> &b_shape) {
        if (a_shape != b_shape) {
            throw mismatched_shapes(a_name, a_shape, b_name, b_shape);
        }
    }

} // namespace micstat

#endif // error_h
