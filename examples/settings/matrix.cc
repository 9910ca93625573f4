// =============================================================================
// Flamingo - Sample Tuning Target
// =============================================================================
//
// Blocked matrix multiply built with the macros of matrix.json. VECTOR_WIDTH
// only exists while VECTORIZE is on and is only read then.
//

#include <cstddef>
#include <cstdio>
#include <vector>

#ifndef BLOCK_SIZE
#define BLOCK_SIZE 32
#endif
#ifndef UNROLL
#define UNROLL 1
#endif

constexpr size_t kN = 512;

int main() {
    std::vector<float> a(kN * kN, 1.0f), b(kN * kN, 2.0f), c(kN * kN, 0.0f);

    for (size_t ii = 0; ii < kN; ii += BLOCK_SIZE) {
        for (size_t kk = 0; kk < kN; kk += BLOCK_SIZE) {
            for (size_t i = ii; i < ii + BLOCK_SIZE; ++i) {
                for (size_t k = kk; k < kk + BLOCK_SIZE; ++k) {
                    const float aik = a[i * kN + k];
                    float* crow = &c[i * kN];
                    const float* brow = &b[k * kN];
#if defined(VECTORIZE_on)
#pragma omp simd simdlen(VECTOR_WIDTH)
#else
#pragma GCC unroll UNROLL
#endif
                    for (size_t j = 0; j < kN; ++j) {
                        crow[j] += aik * brow[j];
                    }
                }
            }
        }
    }

    std::printf("%f\n", static_cast<double>(c[kN + 1]));
    return 0;
}
