// ==============================================================================
// Layer 0: Core Utilities
// filter_design.cpp - IIR Filter Design Implementation
// ==============================================================================

#include "filter_design.h"

#include <algorithm>
#include <cmath>

namespace Primer {
namespace DSP {

using Complex64 = std::complex<double>;

const char* familyName(FilterFamily family) noexcept {
    switch (family) {
        case FilterFamily::Butterworth: return "Butterworth";
        case FilterFamily::Chebyshev:   return "Chebyshev";
        case FilterFamily::Bessel:      return "Bessel";
    }
    return "Unknown";
}

const char* kindName(FilterKind kind) noexcept {
    switch (kind) {
        case FilterKind::Lowpass:  return "Lowpass";
        case FilterKind::Highpass: return "Highpass";
        case FilterKind::Bandpass: return "Bandpass";
        case FilterKind::Notch:    return "Notch";
    }
    return "Unknown";
}

Complex64 evaluate(const PoleZeroLocations& pz, Complex64 x) noexcept {
    Complex64 num(pz.gain, 0.0);
    for (const auto& z : pz.zeros) num *= (x - z);
    Complex64 den(1.0, 0.0);
    for (const auto& p : pz.poles) den *= (x - p);
    return num / den;
}

namespace {

// Product of (-p) over all poles: the gain that gives an all-pole
// prototype unity magnitude at s = 0.
Complex64 negatedPoleProduct(const std::vector<Complex64>& poles) noexcept {
    Complex64 prod(1.0, 0.0);
    for (const auto& p : poles) prod *= -p;
    return prod;
}

// |H(j*omega)|^2 of an all-pole prototype
double magnitudeSquared(const PoleZeroLocations& pz, double omega) noexcept {
    return std::norm(evaluate(pz, Complex64(0.0, omega)));
}

// Frequency where a monotonic all-pole lowpass falls to half power
double halfPowerFrequency(const PoleZeroLocations& pz) {
    const double target = 0.5 * magnitudeSquared(pz, 0.0);
    double lo = 0.0;
    double hi = 1.0;
    while (magnitudeSquared(pz, hi) > target) {
        lo = hi;
        hi *= 2.0;
    }
    for (int i = 0; i < 200; ++i) {
        const double mid = 0.5 * (lo + hi);
        if (magnitudeSquared(pz, mid) > target) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return 0.5 * (lo + hi);
}

PoleZeroLocations scalePoles(const PoleZeroLocations& pz, double factor) {
    PoleZeroLocations out;
    out.poles.reserve(pz.poles.size());
    for (const auto& p : pz.poles) out.poles.push_back(p * factor);
    out.gain = pz.gain;
    return out;
}

// Durand-Kerner iteration for the roots of a monic polynomial given by
// coefficients c[0] + c[1] x + ... + c[n] x^n with c[n] = 1.
std::vector<Complex64> polynomialRoots(const std::vector<double>& c) {
    const size_t n = c.size() - 1;
    std::vector<Complex64> roots(n);
    const Complex64 seed(0.4, 0.9);
    Complex64 start(1.0, 0.0);
    for (size_t i = 0; i < n; ++i) {
        roots[i] = start;
        start *= seed;
    }

    auto poly = [&c](Complex64 x) {
        Complex64 acc(0.0, 0.0);
        for (size_t k = c.size(); k-- > 0;) acc = acc * x + c[k];
        return acc;
    };

    for (int iter = 0; iter < 2000; ++iter) {
        double largestStep = 0.0;
        for (size_t i = 0; i < n; ++i) {
            Complex64 den(1.0, 0.0);
            for (size_t j = 0; j < n; ++j) {
                if (j != i) den *= (roots[i] - roots[j]);
            }
            const Complex64 step = poly(roots[i]) / den;
            roots[i] -= step;
            largestStep = std::max(largestStep, std::abs(step));
        }
        if (largestStep < 1e-15) break;
    }
    return roots;
}

} // namespace

namespace FilterDesign {

// =============================================================================
// Validation
// =============================================================================

void validate(const FilterSpec& spec) {
    if (!std::isfinite(spec.sampleRate) || spec.sampleRate <= 0.0) {
        throw InvalidSpec("sampleRate", spec.sampleRate, "must be finite and > 0");
    }
    if (spec.order < 1 || spec.order > kMaxFilterOrder) {
        throw InvalidSpec("order", spec.order,
                          "must be in [1, " + std::to_string(kMaxFilterOrder) + "]");
    }

    const bool twoEdges = spec.kind == FilterKind::Bandpass || spec.kind == FilterKind::Notch;
    const size_t expected = twoEdges ? 2 : 1;
    if (spec.cutoffs.size() != expected) {
        throw InvalidSpec("cutoffs.size", spec.cutoffs.size(),
                          std::string(kindName(spec.kind)) + " requires "
                              + std::to_string(expected) + " cutoff(s)");
    }

    const double nyquist = spec.sampleRate * 0.5;
    for (double fc : spec.cutoffs) {
        if (!std::isfinite(fc) || fc <= 0.0 || fc >= nyquist) {
            throw InvalidSpec("cutoff", fc,
                              "must be in (0, " + detail::formatValue(nyquist) + ") Hz");
        }
    }
    if (twoEdges && spec.cutoffs[0] >= spec.cutoffs[1]) {
        throw InvalidSpec("cutoffs", detail::formatValue(spec.cutoffs[0]) + " >= "
                                         + detail::formatValue(spec.cutoffs[1]),
                          "lower cutoff must be below upper cutoff");
    }

    if (spec.family == FilterFamily::Chebyshev) {
        if (!std::isfinite(spec.rippleDb) || spec.rippleDb <= 0.0 || spec.rippleDb >= 3.0) {
            throw InvalidSpec("rippleDb", spec.rippleDb, "must be in (0, 3) dB");
        }
    }
}

// =============================================================================
// Frequency Prewarping
// =============================================================================

double prewarpFrequency(double freqHz, double sampleRate) noexcept {
    return 2.0 * sampleRate * std::tan(kPiD * freqHz / sampleRate);
}

// =============================================================================
// Analog Prototypes
// =============================================================================

PoleZeroLocations butterworthPrototype(int order) {
    PoleZeroLocations proto;
    const auto n = static_cast<double>(order);
    for (int k = 0; k < order; ++k) {
        const double theta = kPiD * (2.0 * k + n + 1.0) / (2.0 * n);
        proto.poles.push_back(std::polar(1.0, theta));
    }
    proto.gain = negatedPoleProduct(proto.poles).real();
    return proto;
}

PoleZeroLocations chebyshevPrototype(int order, double rippleDb) {
    const auto n = static_cast<double>(order);
    const double eps = std::sqrt(std::pow(10.0, rippleDb / 10.0) - 1.0);
    const double mu = std::asinh(1.0 / eps) / n;

    PoleZeroLocations proto;
    for (int k = 0; k < order; ++k) {
        const double theta = kPiD * (2.0 * k + 1.0) / (2.0 * n);
        proto.poles.emplace_back(-std::sinh(mu) * std::sin(theta),
                                 std::cosh(mu) * std::cos(theta));
    }

    // Ripple band edge is at 1 rad/s; move the half-power point there instead
    const double omega3 = std::cosh(std::acosh(1.0 / eps) / n);
    proto = scalePoles(proto, 1.0 / omega3);

    const double dcGain = (order % 2 == 0) ? 1.0 / std::sqrt(1.0 + eps * eps) : 1.0;
    proto.gain = negatedPoleProduct(proto.poles).real() * dcGain;
    return proto;
}

PoleZeroLocations besselPrototype(int order) {
    // Reverse Bessel polynomial: a_k = (2n - k)! / (2^(n-k) k! (n-k)!), a_n = 1
    const int n = order;
    std::vector<double> a(static_cast<size_t>(n) + 1);
    for (int k = 0; k <= n; ++k) {
        double value = 1.0;
        // (2n-k)! / (n-k)! = product of (n-k+1 .. 2n-k)
        for (int m = n - k + 1; m <= 2 * n - k; ++m) value *= static_cast<double>(m);
        for (int m = 2; m <= k; ++m) value /= static_cast<double>(m);
        value /= std::pow(2.0, n - k);
        a[static_cast<size_t>(k)] = value;
    }

    // Substitute s = r*u so the roots of the monic polynomial in u sit near
    // the unit circle
    const double r = std::pow(a[0], 1.0 / n);
    std::vector<double> scaled(a.size());
    for (int k = 0; k <= n; ++k) {
        scaled[static_cast<size_t>(k)] = a[static_cast<size_t>(k)] * std::pow(r, k - n);
    }

    PoleZeroLocations proto;
    for (const auto& u : polynomialRoots(scaled)) {
        proto.poles.push_back(u * r);
    }
    proto.gain = negatedPoleProduct(proto.poles).real();

    proto = scalePoles(proto, 1.0 / halfPowerFrequency(proto));
    proto.gain = negatedPoleProduct(proto.poles).real();
    return proto;
}

PoleZeroLocations analogPrototype(FilterFamily family, int order, double rippleDb) {
    switch (family) {
        case FilterFamily::Butterworth: return butterworthPrototype(order);
        case FilterFamily::Chebyshev:   return chebyshevPrototype(order, rippleDb);
        case FilterFamily::Bessel:      return besselPrototype(order);
    }
    return butterworthPrototype(order);
}

// =============================================================================
// Frequency Transforms
// =============================================================================

PoleZeroLocations lowpassToLowpass(const PoleZeroLocations& proto, double wc) {
    PoleZeroLocations out;
    for (const auto& z : proto.zeros) out.zeros.push_back(z * wc);
    for (const auto& p : proto.poles) out.poles.push_back(p * wc);
    const auto excess = static_cast<int>(proto.poles.size() - proto.zeros.size());
    out.gain = proto.gain * std::pow(wc, excess);
    return out;
}

PoleZeroLocations lowpassToHighpass(const PoleZeroLocations& proto, double wc) {
    PoleZeroLocations out;
    Complex64 gainFactor(1.0, 0.0);
    for (const auto& z : proto.zeros) {
        out.zeros.push_back(wc / z);
        gainFactor *= -z;
    }
    for (const auto& p : proto.poles) {
        out.poles.push_back(wc / p);
        gainFactor /= -p;
    }
    // Zeros at infinity map to the origin
    for (size_t i = proto.zeros.size(); i < proto.poles.size(); ++i) {
        out.zeros.emplace_back(0.0, 0.0);
    }
    out.gain = proto.gain * gainFactor.real();
    return out;
}

PoleZeroLocations lowpassToBandpass(const PoleZeroLocations& proto, double w0, double bw) {
    PoleZeroLocations out;
    auto split = [&](const Complex64& root, std::vector<Complex64>& dest) {
        const Complex64 half = root * bw * 0.5;
        const Complex64 disc = std::sqrt(half * half - w0 * w0);
        dest.push_back(half + disc);
        dest.push_back(half - disc);
    };
    for (const auto& z : proto.zeros) split(z, out.zeros);
    for (const auto& p : proto.poles) split(p, out.poles);
    for (size_t i = proto.zeros.size(); i < proto.poles.size(); ++i) {
        out.zeros.emplace_back(0.0, 0.0);
    }
    const auto excess = static_cast<int>(proto.poles.size() - proto.zeros.size());
    out.gain = proto.gain * std::pow(bw, excess);
    return out;
}

PoleZeroLocations lowpassToBandstop(const PoleZeroLocations& proto, double w0, double bw) {
    PoleZeroLocations out;
    Complex64 gainFactor(1.0, 0.0);
    auto split = [&](const Complex64& root, std::vector<Complex64>& dest) {
        const Complex64 half = (bw / root) * 0.5;
        const Complex64 disc = std::sqrt(half * half - w0 * w0);
        dest.push_back(half + disc);
        dest.push_back(half - disc);
    };
    for (const auto& z : proto.zeros) {
        split(z, out.zeros);
        gainFactor *= -z;
    }
    for (const auto& p : proto.poles) {
        split(p, out.poles);
        gainFactor /= -p;
    }
    for (size_t i = proto.zeros.size(); i < proto.poles.size(); ++i) {
        out.zeros.emplace_back(0.0, w0);
        out.zeros.emplace_back(0.0, -w0);
    }
    out.gain = proto.gain * gainFactor.real();
    return out;
}

// =============================================================================
// Bilinear Transform
// =============================================================================

PoleZeroLocations bilinearTransform(const PoleZeroLocations& analog, double sampleRate) {
    const double fs2 = 2.0 * sampleRate;
    auto toDigital = [fs2](const Complex64& s) { return (fs2 + s) / (fs2 - s); };

    PoleZeroLocations digital;
    digital.zeros.reserve(analog.poles.size());
    digital.poles.reserve(analog.poles.size());

    Complex64 gainFactor(1.0, 0.0);
    for (const auto& z : analog.zeros) {
        digital.zeros.push_back(toDigital(z));
        gainFactor *= (fs2 - z);
    }
    for (const auto& p : analog.poles) {
        digital.poles.push_back(toDigital(p));
        gainFactor /= (fs2 - p);
    }
    for (size_t i = analog.zeros.size(); i < analog.poles.size(); ++i) {
        digital.zeros.emplace_back(-1.0, 0.0);
    }
    digital.gain = analog.gain * gainFactor.real();
    return digital;
}

// =============================================================================
// Complete Design
// =============================================================================

PoleZeroLocations designDigital(const FilterSpec& spec) {
    validate(spec);

    const PoleZeroLocations proto = analogPrototype(spec.family, spec.order, spec.rippleDb);
    const double fs = spec.sampleRate;

    PoleZeroLocations analog;
    switch (spec.kind) {
        case FilterKind::Lowpass:
            analog = lowpassToLowpass(proto, prewarpFrequency(spec.cutoffs[0], fs));
            break;
        case FilterKind::Highpass:
            analog = lowpassToHighpass(proto, prewarpFrequency(spec.cutoffs[0], fs));
            break;
        case FilterKind::Bandpass:
        case FilterKind::Notch: {
            const double w1 = prewarpFrequency(spec.cutoffs[0], fs);
            const double w2 = prewarpFrequency(spec.cutoffs[1], fs);
            const double w0 = std::sqrt(w1 * w2);
            const double bw = w2 - w1;
            analog = (spec.kind == FilterKind::Bandpass) ? lowpassToBandpass(proto, w0, bw)
                                                         : lowpassToBandstop(proto, w0, bw);
            break;
        }
    }
    return bilinearTransform(analog, fs);
}

std::complex<double> passbandReference(const FilterSpec& spec) {
    switch (spec.kind) {
        case FilterKind::Lowpass:
        case FilterKind::Notch:
            return {1.0, 0.0};
        case FilterKind::Highpass:
            return {-1.0, 0.0};
        case FilterKind::Bandpass: {
            const double w1 = prewarpFrequency(spec.cutoffs[0], spec.sampleRate);
            const double w2 = prewarpFrequency(spec.cutoffs[1], spec.sampleRate);
            const double w0 = std::sqrt(w1 * w2);
            const double theta = 2.0 * std::atan(w0 / (2.0 * spec.sampleRate));
            return std::polar(1.0, theta);
        }
    }
    return {1.0, 0.0};
}

} // namespace FilterDesign

} // namespace DSP
} // namespace Primer
