#pragma once

#include <cstdint>
#include <string>
#include <eosio/eosio.hpp>
#include <eosio/name.hpp>
#include <eosio/asset.hpp>

namespace vefi {

using namespace eosio;

static constexpr uint16_t  PCT_BOOST         = 10000;
static constexpr uint64_t  DAY_SECONDS       = 24 * 60 * 60;
static constexpr uint64_t  WEEK              = 7 * DAY_SECONDS;
static constexpr uint64_t  MAXTIME           = 365 * DAY_SECONDS;              //slope denominator, 1 year
static constexpr uint64_t  MAX_REPLAY_WEEKS  = 255;                            //~5 years of weekly replay
static constexpr int128_t  WAD               = 1'000'000'000'000'000'000;      // 10^18

static constexpr uint64_t  DEFAULT_MIN_LOCK_DURATION   = 4 * WEEK;
static constexpr uint16_t  DEFAULT_MAX_PENALTY_BPS     = 5000;                 //50%

static constexpr name      active_perm       = "active"_n;

namespace lock_status {
    static constexpr eosio::name ACTIVE     { "active"_n };
    static constexpr eosio::name PERMANENT  { "permanent"_n };
    static constexpr eosio::name WITHDRAWN  { "withdrawn"_n };
}

namespace deposit_type {
    static constexpr eosio::name DEPOSIT_FOR    { "depositfor"_n };
    static constexpr eosio::name CREATE_LOCK    { "createlock"_n };
    static constexpr eosio::name INCREASE_TIME  { "inctime"_n };
}

enum class err: uint8_t {
   NONE                       = 0,
   RECORD_NOT_FOUND           = 1,
   RECORD_EXISTING            = 2,
   CONTRACT_MISMATCH          = 3,
   SYMBOL_MISMATCH            = 4,
   PARAM_ERROR                = 5,
   MEMO_FORMAT_ERROR          = 6,
   PAUSED                     = 7,
   NO_AUTH                    = 8,
   NOT_POSITIVE               = 9,
   NOT_STARTED                = 10,
   OVERSIZED                  = 11,
   TIME_EXPIRED               = 12,
   TIME_PREMATURE             = 13,
   ACTION_REDUNDANT           = 14,
   ACCOUNT_INVALID            = 15,
   INCORRECT_AMOUNT           = 19,
   LOCK_TOO_SHORT             = 30,
   LOCK_TOO_LONG              = 31,
   DEPOSIT_DURATION_TOO_SHORT = 32,
   ALREADY_PERMANENT          = 33,
   NOT_PERMANENT              = 34,
   ALREADY_WITHDRAWN          = 35,
   AMOUNT_TOO_LARGE           = 36,
   SPLIT_NOT_ALLOWED          = 37,
   SAME_LOCK                  = 38,
   ARITH_OVERFLOW             = 40,
   REPLAY_LIMIT               = 41,
   SYSTEM_ERROR               = 200
};

#ifndef CHECKC
#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, std::string("[[") + std::to_string((int)code) + std::string("]] ") + msg); }
#endif

//week boundary at or before ts
inline uint64_t week_floor(const uint64_t& ts) {
   return (ts / WEEK) * WEEK;
}

} //namespace vefi
