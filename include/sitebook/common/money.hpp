#pragma once

#include <cmath>
#include <cstdint>
#include <string>

namespace sitebook {

    /// Monetary amount in minor units (1/100 of a currency unit)
    using Money = std::int64_t;

    /// Exchange rates are fixed point with six decimals: 1.0 == kRateScale
    constexpr std::int64_t kRateScale = 1'000'000;

    /// Convert an original-currency amount into base currency at a locked rate,
    /// rounded half away from zero to the nearest minor unit
    inline Money toBase(Money amount, std::int64_t rate) {
        long double scaled = static_cast<long double>(amount) * static_cast<long double>(rate) /
                             static_cast<long double>(kRateScale);
        return static_cast<Money>(std::llround(scaled));
    }

    /// Build a rate from a decimal value, e.g. rateOf(32.5)
    inline std::int64_t rateOf(double value) {
        return static_cast<std::int64_t>(std::llround(value * static_cast<double>(kRateScale)));
    }

    /// Render minor units as "1234.56"
    inline std::string formatMoney(Money amount) {
        std::string sign = amount < 0 ? "-" : "";
        Money abs = amount < 0 ? -amount : amount;
        Money cents = abs % 100;
        return sign + std::to_string(abs / 100) + "." + (cents < 10 ? "0" : "") + std::to_string(cents);
    }

} // namespace sitebook
