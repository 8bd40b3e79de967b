#pragma once
#include <vector>
#include <cstddef>

namespace LPV {

struct LpcResult {
    std::vector<double> coeffs;      // [1, -a1, ..., -a_order]
    std::vector<double> reflection;  // k1..k_order, after clamping
    double error_power = 0.0;
    bool silent = false;
    int clamped = 0;                 // reflection coefficients that hit the cap
};

class LPC {
public:
    explicit LPC(int order);

    int get_order() const;

    // Hamming-windowed autocorrelation method. Throws NumericalError on
    // non-finite input.
    LpcResult analyze(const std::vector<double>& frame) const;

    // e[n] = sum_k c[k] x[n-k], zero history
    static void compute_residual(const std::vector<double>& frame,
                                 const std::vector<double>& coeffs,
                                 std::vector<double>& residual);

    // Step-down recursion. Returns false if any |k| >= 1.
    static bool reflection_from_coefficients(const std::vector<double>& coeffs,
                                             std::vector<double>& k_out);

    static void autocorrelation(const std::vector<double>& frame,
                                int max_lag,
                                std::vector<double>& R);

private:
    int order;

    void levinson_durbin(const std::vector<double>& R, LpcResult& out) const;

    static void apply_hamming(const std::vector<double>& frame, std::vector<double>& out);
};

} // namespace LPV
