// ==============================================================================
// Layer 2: DSP Processor - IIR Filter Implementation
// ==============================================================================

#include "iir_filter.h"

#include <primer/dsp/core/math_constants.h>
#include <primer/dsp/primitives/signal_generator.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace Primer {
namespace DSP {

using Complex64 = std::complex<double>;

namespace {

bool isReal(const Complex64& p) noexcept {
    return std::abs(p.imag()) <= 1e-9 * std::max(1.0, std::abs(p));
}

// Numerator of a section for the given kind, before gain normalization
void assignZeros(BiquadCoefficients& c, FilterKind kind, bool firstOrder,
                 double notchCos) noexcept {
    switch (kind) {
        case FilterKind::Lowpass:
            c.b0 = 1.0;
            c.b1 = firstOrder ? 1.0 : 2.0;
            c.b2 = firstOrder ? 0.0 : 1.0;
            break;
        case FilterKind::Highpass:
            c.b0 = 1.0;
            c.b1 = firstOrder ? -1.0 : -2.0;
            c.b2 = firstOrder ? 0.0 : 1.0;
            break;
        case FilterKind::Bandpass:
            // One zero at DC, one at Nyquist
            c.b0 = 1.0;
            c.b1 = 0.0;
            c.b2 = -1.0;
            break;
        case FilterKind::Notch:
            c.b0 = 1.0;
            c.b1 = -2.0 * notchCos;
            c.b2 = 1.0;
            break;
    }
}

} // namespace

// =============================================================================
// Section Pairing
// =============================================================================

std::vector<BiquadCoefficients> toSections(const PoleZeroLocations& pz,
                                           FilterKind kind,
                                           Complex64 reference) {
    std::vector<Complex64> upper;  // one pole of each conjugate pair
    std::vector<double> reals;
    size_t lower = 0;
    for (const auto& p : pz.poles) {
        if (isReal(p)) {
            reals.push_back(p.real());
        } else if (p.imag() > 0.0) {
            upper.push_back(p);
        } else {
            ++lower;
        }
    }
    if (upper.size() != lower) {
        throw std::logic_error("IirFilter: complex poles do not form conjugate pairs");
    }

    // Sections with poles nearest the unit circle go last
    std::sort(upper.begin(), upper.end(),
              [](const Complex64& a, const Complex64& b) { return std::abs(a) < std::abs(b); });
    std::sort(reals.begin(), reals.end(),
              [](double a, double b) { return std::abs(a) < std::abs(b); });

    double notchCos = 1.0;
    if (kind == FilterKind::Notch && !pz.zeros.empty()) {
        notchCos = std::cos(std::abs(std::arg(pz.zeros.front())));
    }

    std::vector<BiquadCoefficients> sections;
    for (size_t i = 0; i + 1 < reals.size(); i += 2) {
        BiquadCoefficients c;
        c.a1 = -(reals[i] + reals[i + 1]);
        c.a2 = reals[i] * reals[i + 1];
        assignZeros(c, kind, false, notchCos);
        sections.push_back(c);
    }
    if (reals.size() % 2 == 1) {
        BiquadCoefficients c;
        c.a1 = -reals.back();
        c.a2 = 0.0;
        assignZeros(c, kind, true, notchCos);
        sections.insert(sections.begin(), c);
    }
    for (const auto& p : upper) {
        BiquadCoefficients c;
        c.a1 = -2.0 * p.real();
        c.a2 = std::norm(p);
        assignZeros(c, kind, false, notchCos);
        sections.push_back(c);
    }

    for (auto& c : sections) {
        c.scale(1.0 / std::abs(c.evaluate(reference)));
    }
    if (!sections.empty()) {
        sections.front().scale(std::abs(evaluate(pz, reference)));
    }
    return sections;
}

// =============================================================================
// Construction
// =============================================================================

IirFilter::IirFilter(const FilterSpec& spec)
    : sampleRate_(spec.sampleRate) {
    const PoleZeroLocations pz = FilterDesign::designDigital(spec);
    sections_ = toSections(pz, spec.kind, FilterDesign::passbandReference(spec));
    order_ = static_cast<int>(pz.poles.size());
}

IirFilter::IirFilter(std::vector<BiquadCoefficients> sections, int order, double sampleRate)
    : sections_(std::move(sections))
    , order_(order)
    , sampleRate_(sampleRate) {}

IirFilter IirFilter::notch(double centerHz, double q, double sampleRate) {
    const auto c = BiquadCoefficients::notch(centerHz, q, sampleRate);
    return IirFilter({c}, 2, sampleRate);
}

// =============================================================================
// Processing
// =============================================================================

void IirFilter::requireMatchingRate(const Signal& input) const {
    if (input.sampleRate() != sampleRate_) {
        throw InvalidInput("IirFilter", "sampleRate", input.sampleRate(),
                           "must equal the design rate " + detail::formatValue(sampleRate_));
    }
}

Signal IirFilter::process(const Signal& input) const {
    requireMatchingRate(input);
    BiquadCascade cascade(sections_);
    std::vector<float> out(input.size());
    cascade.processBlock(input.data(), out.data(), input.size());
    return Signal(std::move(out), sampleRate_);
}

Signal IirFilter::processZeroPhase(const Signal& input) const {
    requireMatchingRate(input);
    BiquadCascade cascade(sections_);

    std::vector<float> buffer(input.size());
    cascade.processBlock(input.data(), buffer.data(), buffer.size());
    std::reverse(buffer.begin(), buffer.end());

    std::vector<float> out(buffer.size());
    cascade.processBlock(buffer.data(), out.data(), out.size());
    std::reverse(out.begin(), out.end());
    return Signal(std::move(out), sampleRate_);
}

Signal IirFilter::impulseResponse(size_t length) const {
    return process(SignalGenerator::generateImpulse(length, sampleRate_));
}

// =============================================================================
// Analysis
// =============================================================================

Complex64 IirFilter::response(double frequencyHz) const noexcept {
    const double omega = kTwoPiD * frequencyHz / sampleRate_;
    Complex64 h(1.0, 0.0);
    for (const auto& c : sections_) h *= c.response(omega);
    return h;
}

double IirFilter::magnitudeDb(double frequencyHz) const noexcept {
    const double mag = std::abs(response(frequencyHz));
    return 20.0 * std::log10(std::max(mag, 1e-10));
}

std::vector<FrequencyPoint> IirFilter::frequencyResponse(size_t points) const {
    if (points == 0) {
        throw InvalidParameter("IirFilter", "points", points, "must be >= 1");
    }
    std::vector<FrequencyPoint> result(points);
    const double step = sampleRate_ * 0.5 / static_cast<double>(points);
    for (size_t k = 0; k < points; ++k) {
        const double f = static_cast<double>(k) * step;
        const Complex64 h = response(f);
        result[k] = {f, 20.0 * std::log10(std::max(std::abs(h), 1e-10)), std::arg(h)};
    }
    return result;
}

bool IirFilter::isStable() const noexcept {
    return std::all_of(sections_.begin(), sections_.end(),
                       [](const BiquadCoefficients& c) { return c.isStable(); });
}

} // namespace DSP
} // namespace Primer
