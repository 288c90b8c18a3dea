#pragma once

#include <limits>
#include <ve.escrow/ve.escrow.const.hpp>

namespace vefi { namespace safemath {

    inline int128_t to_wide(int64_t a) {
        return static_cast<int128_t>(a);
    }

    //narrowing casts abort instead of truncating
    inline int64_t safe_int64(const int128_t& a) {
        CHECKC( a >= std::numeric_limits<int64_t>::min() && a <= std::numeric_limits<int64_t>::max(),
                err::ARITH_OVERFLOW, "int64 cast overflow" )
        return static_cast<int64_t>(a);
    }

    inline uint64_t safe_uint64(const int128_t& a) {
        CHECKC( a >= 0 && a <= (int128_t)std::numeric_limits<uint64_t>::max(),
                err::ARITH_OVERFLOW, "uint64 cast overflow" )
        return static_cast<uint64_t>(a);
    }

    //WAD-scaled decay rate of an amount locked for MAXTIME
    inline int128_t slope_of(int64_t amount) {
        return to_wide(amount) * WAD / (int128_t)MAXTIME;
    }

    inline int128_t bias_of(const int128_t& slope, uint64_t seconds) {
        return slope * (int128_t)seconds;
    }

    //rounds down, never overstates a balance
    inline int64_t from_wad(const int128_t& bias) {
        if (bias <= 0) return 0;
        return safe_int64(bias / WAD);
    }

    //amount-weighted average of two timestamps
    inline uint64_t weighted_time(int64_t amount_a, uint64_t ts_a, int64_t amount_b, uint64_t ts_b) {
        int128_t total = to_wide(amount_a) + to_wide(amount_b);
        CHECKC( total > 0, err::NOT_POSITIVE, "weighted time over zero amount" )
        int128_t sum   = to_wide(amount_a) * (int128_t)ts_a + to_wide(amount_b) * (int128_t)ts_b;
        return safe_uint64(sum / total);
    }

    //amount * bps * num / (PCT_BOOST * den), rounded down
    inline int64_t ratio_of(int64_t amount, uint64_t bps, uint64_t num, uint64_t den) {
        CHECKC( den > 0, err::PARAM_ERROR, "zero denominator" )
        int128_t tmp = to_wide(amount) * (int128_t)bps * (int128_t)num;
        return safe_int64(tmp / ((int128_t)PCT_BOOST * (int128_t)den));
    }

} } //safemath
