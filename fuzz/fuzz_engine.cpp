/**
 * @file  fuzz_engine.cpp
 * @brief libFuzzer target for Engine::calculate across every request mode.
 *
 * Build:
 *   cmake -DIRRKIT_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_engine
 *
 * Run for 60 seconds:
 *   ./fuzz_engine -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. result.value is finite.
 *   3. result.mode matches the request alternative.
 *   4. Growth months run 0, 1, 2, …
 *   5. try_calculate() succeeds only when validate() reports nothing.
 *
 * Input layout:
 *   byte 0        selects the request alternative (mod 6)
 *   bytes 1…      raw IEEE-754 doubles, so NaN / ±Inf / subnormals all occur
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include "irrkit/calendar.hpp"
#include "irrkit/engine.hpp"
#include "irrkit/validation.hpp"

using namespace irrkit;
using namespace irrkit::core;

namespace {

/// Sequential reader of doubles; yields 0.0 once input runs out.
class ByteStream {
public:
    ByteStream(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    double next_double() {
        double v = 0.0;
        if (pos_ + sizeof(double) <= size_) {
            std::memcpy(&v, data_ + pos_, sizeof(double));
            pos_ += sizeof(double);
        }
        return v;
    }

    uint8_t next_byte() {
        return pos_ < size_ ? data_[pos_++] : 0;
    }

private:
    const uint8_t* data_;
    size_t         size_;
    size_t         pos_ = 0;
};

const Date kBase = calendar::make_date(2024, 1, 1);

CalculationRequest make_request(ByteStream& in) {
    switch (in.next_byte() % 6) {
        case 0:
            return IrrRequest{in.next_double(), in.next_double(), in.next_double()};
        case 1:
            return OutcomeRequest{in.next_double(), in.next_double(), in.next_double()};
        case 2:
            return InitialInvestmentRequest{in.next_double(), in.next_double(),
                                            in.next_double()};
        case 3: {
            BlendedIrrRequest r{in.next_double(), in.next_double(),
                                in.next_double(), {}, kBase};
            const int n = in.next_byte() % 8;
            for (int i = 0; i < n; ++i) {
                const uint8_t flags = in.next_byte();
                FollowOnSpec spec{
                    .timing          = RelativeTiming{in.next_double(),
                                                      static_cast<TimeUnit>(flags % 3)},
                    .investment_type = static_cast<InvestmentType>((flags >> 2) % 3),
                    .amount          = in.next_double(),
                    .valuation_mode  = static_cast<ValuationMode>((flags >> 4) & 1),
                    .valuation_type  = static_cast<ValuationType>((flags >> 5) & 1),
                    .valuation       = in.next_double(),
                    .custom_irr      = in.next_double(),
                };
                if (auto event = FollowOnInvestment::make(spec, kBase)) {
                    r.follow_ons.push_back(*event);
                }
            }
            return r;
        }
        case 4:
            return PortfolioUnitRequest{in.next_double(), in.next_double(),
                                        in.next_double(), in.next_double(),
                                        in.next_double(), in.next_double(),
                                        in.next_double()};
        default: {
            PortfolioUnitBlendedRequest r;
            r.initial_batch    = {in.next_double(), in.next_double(), kBase};
            r.years            = in.next_double();
            r.success_rate     = in.next_double();
            r.outcome_per_unit = in.next_double();
            r.investor_share   = in.next_double();
            r.fee_percentage   = in.next_double();
            r.initial_date     = kBase;
            const int n = in.next_byte() % 8;
            for (int i = 0; i < n; ++i) {
                const int days = in.next_byte() * 30;
                r.follow_on_batches.push_back(
                    {in.next_double(), in.next_double(), calendar::add_days(kBase, days)});
            }
            return r;
        }
    }
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    ByteStream in{data, size};
    const CalculationRequest request = make_request(in);

    // Growth is capped at MAX_PROJECTION_MONTHS points, so keep it on.
    const Engine engine;
    const auto result = engine.calculate(request);

    // Invariant 2
    assert(std::isfinite(result.value));

    // Invariant 3
    assert(result.mode == mode_of(request));

    // Invariant 4
    for (std::size_t m = 0; m < result.growth.size(); ++m) {
        assert(result.growth[m].month == static_cast<int>(m));
        (void)m;
    }

    // Invariant 5
    const auto strict = engine.try_calculate(request);
    assert(strict.has_value() == validation::is_valid(request));
    (void)strict;

    return 0;
}
