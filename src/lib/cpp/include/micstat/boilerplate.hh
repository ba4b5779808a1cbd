/**
 * @file boilerplate.hh
 * Boilerplate code for parallelizing array operations.
 *
 * Every loop built with these macros runs through a single code path. The `PARALLEL` argument becomes the OpenMP `if` clause, so a `false` value executes the very same loop on one thread in row-major order.
 * Without OpenMP the pragmas are ignored by the compiler and every loop is sequential.
 */
#ifndef boilerplate_h
#define boilerplate_h

//
// Gaze upon the glory of 3-layered macros for building string literals for _Pragma:
//

/**
 * Stringifies the given argument. This is a helper macro for the `PRAGMA` macro.
 *
 * @param `X` The argument to stringify.
 */
#define STRINGIFY(X) #X
/**
 * Combines the given argument with the `STRINGIFY` macro. This is a helper macro for the `PRAGMA` macro.
 *
 * @param `X` The argument to combine.
 */
#define TOKEN_COMBINER(X) STRINGIFY(X)
/**
 * Generates a pragma string for the given argument. For example, `PRAGMA(omp parallel for)` will generate `#pragma omp parallel for`.
 *
 * @param `X` The tokens to combine into a pragma string.
 */
#define PRAGMA(X) _Pragma(TOKEN_COMBINER(X))

/**
 * The pragma tokens that start a parallel loop.
 */
#define PARALLEL_TERM omp parallel for

/**
 * Sets up a flat traversal of `LENGTH` elements and adds the relevant pragma clauses.
 * It also allows for additional pragma clauses, `EXTRA_PRAGMA_CLAUSE`, to be added to the parallel loop.
 * E.g. `FOR_FLAT_BEGIN(n, parallel, reduction(+:sum))` will generate `#pragma omp parallel for if(parallel) reduction(+:sum)`.
 *
 * Following this call, the following variables will be exposed:
 *
 * - `flat_index`: the current flat index.
 *
 * @param LENGTH The number of elements to traverse.
 * @param PARALLEL Boolean expression choosing between the multi-threaded and the single-threaded execution.
 * @param EXTRA_PRAGMA_CLAUSE Additional pragma clauses to be added to the parallel loop.
 */
#define FOR_FLAT_BEGIN(LENGTH, PARALLEL, EXTRA_PRAGMA_CLAUSE) \
    PRAGMA(PARALLEL_TERM if(PARALLEL) EXTRA_PRAGMA_CLAUSE) \
    for (int64_t flat_index = 0; flat_index < (LENGTH); flat_index++) {

/**
 * Closes the block started by `FOR_FLAT_BEGIN`.
 */
#define FOR_FLAT_END() }

/**
 * Sets up traversal of a 3D array, `ARR` and adds the relevant pragma clauses.
 * The sizes of `ARR` must have been unpacked with `UNPACK_NUMPY` beforehand.
 *
 * Following this call, the following variables will be exposed:
 *
 * - `z`: the current z-index.
 *
 * - `y`: the current y-index.
 *
 * - `x`: the current x-index.
 *
 * - `flat_index`: the row-major index of `z,y,x`.
 *
 * @param ARR The array that will be traversed.
 * @param PARALLEL Boolean expression choosing between the multi-threaded and the single-threaded execution.
 * @param EXTRA_PRAGMA_CLAUSE Additional pragma clauses to be added to the parallel loop.
 */
#define FOR_3D_BEGIN(ARR, PARALLEL, EXTRA_PRAGMA_CLAUSE) \
    PRAGMA(PARALLEL_TERM if(PARALLEL) collapse(3) EXTRA_PRAGMA_CLAUSE) \
    for (int64_t z = 0; z < ARR##_Nz; z++) { \
        for (int64_t y = 0; y < ARR##_Ny; y++) { \
            for (int64_t x = 0; x < ARR##_Nx; x++) { \
                int64_t flat_index = z*ARR##_Ny*ARR##_Nx + y*ARR##_Nx + x;

/**
 * Closes the block started by `FOR_3D_BEGIN`.
 */
#define FOR_3D_END() }}}

/**
 * Unpacks the sizes of the array `ARR` into the variables `ARR_Nz`, `ARR_Ny`, `ARR_Nx` and `ARR_length`.
 * 2D arrays get `ARR_Nz = 1` and 1D arrays additionally get `ARR_Ny = 1`.
 *
 * Following this call, the following variables will be exposed:
 *
 * - `ARR_Nz`: the size of the array in the z-dimension.
 *
 * - `ARR_Ny`: the size of the array in the y-dimension.
 *
 * - `ARR_Nx`: the size of the array in the x-dimension.
 *
 * - `ARR_length`: the total length of the array.
 *
 * @param ARR The array whose sizes will be unpacked.
 */
#define UNPACK_NUMPY(ARR) \
    int64_t \
        __attribute__((unused)) ARR##_Nz = ARR.shape.size() >= 3 ? ARR.shape[ARR.shape.size()-3] : 1, \
        __attribute__((unused)) ARR##_Ny = ARR.shape.size() >= 2 ? ARR.shape[ARR.shape.size()-2] : 1, \
        __attribute__((unused)) ARR##_Nx = ARR.shape.size() >= 1 ? ARR.shape[ARR.shape.size()-1] : 1, \
        __attribute__((unused)) ARR##_length = ARR.size();

#endif // boilerplate_h
