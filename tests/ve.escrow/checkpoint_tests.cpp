#include <eosio/tester.hpp>

#include <cstring>
#include <limits>
#include <vector>

#include <safemath.hpp>
#include <ve.escrow/ve.escrow.checkpoint.hpp>

#include "memory_store.hpp"

using namespace eosio;
using namespace vefi;
using namespace vefi::safemath;

static constexpr uint64_t T0 = 2900 * WEEK;

EOSIO_TEST_BEGIN(week_floor_test)
   CHECK_EQUAL( week_floor(T0), T0 );
   CHECK_EQUAL( week_floor(T0 + 1), T0 );
   CHECK_EQUAL( week_floor(T0 + WEEK - 1), T0 );
   CHECK_EQUAL( week_floor(T0 + WEEK), T0 + WEEK );
   CHECK_EQUAL( week_floor(T0 + MAXTIME), T0 + 52 * WEEK );
EOSIO_TEST_END

EOSIO_TEST_BEGIN(safemath_test)
   int64_t amount = 1000'0000'0000;
   auto slope = slope_of(amount);
   CHECK_EQUAL( (bool)(slope == to_wide(amount) * WAD / (int128_t)MAXTIME), true );
   CHECK_EQUAL( from_wad(bias_of(slope, MAXTIME)) >= amount - 1, true );
   CHECK_EQUAL( from_wad(bias_of(slope, MAXTIME)) <= amount, true );
   CHECK_EQUAL( from_wad(0), 0 );
   CHECK_EQUAL( from_wad(-WAD), 0 );
   CHECK_EQUAL( from_wad(WAD * 7 + 1), 7 );

   CHECK_EQUAL( weighted_time(100, T0, 100, T0 + 10 * WEEK), T0 + 5 * WEEK );
   CHECK_EQUAL( weighted_time(300, T0, 100, T0 + 4 * WEEK), T0 + WEEK );
   CHECK_EQUAL( ratio_of(1000'0000'0000, 5000, 26 * WEEK, 52 * WEEK), 250'0000'0000 );
   CHECK_EQUAL( ratio_of(1000, 10000, 1, 3), 333 );

   CHECK_ASSERT( "[[40]] int64 cast overflow", ([]() {
      safe_int64(to_wide(std::numeric_limits<int64_t>::max()) + 1);
   }) );
   CHECK_ASSERT( "[[40]] uint64 cast overflow", ([]() {
      safe_uint64(-1);
   }) );
   CHECK_ASSERT( "[[9]] weighted time over zero amount", ([]() {
      weighted_time(0, T0, 0, T0);
   }) );
   CHECK_ASSERT( "[[5]] zero denominator", ([]() {
      ratio_of(1000, 5000, 1, 0);
   }) );
EOSIO_TEST_END

EOSIO_TEST_BEGIN(index_at_or_before_test)
   std::vector<uint64_t> ts = { 10, 20, 30, 40, 50 };
   auto ts_of = [&](const uint64_t& i) { return ts[i - 1]; };

   CHECK_EQUAL( index_at_or_before(0, ts_of, 100), 0 );
   CHECK_EQUAL( index_at_or_before(ts.size(), ts_of, 5), 0 );
   CHECK_EQUAL( index_at_or_before(ts.size(), ts_of, 10), 1 );
   CHECK_EQUAL( index_at_or_before(ts.size(), ts_of, 15), 1 );
   CHECK_EQUAL( index_at_or_before(ts.size(), ts_of, 30), 3 );
   CHECK_EQUAL( index_at_or_before(ts.size(), ts_of, 35), 3 );
   CHECK_EQUAL( index_at_or_before(ts.size(), ts_of, 40), 4 );
   CHECK_EQUAL( index_at_or_before(ts.size(), ts_of, 49), 4 );
   CHECK_EQUAL( index_at_or_before(ts.size(), ts_of, 50), 5 );
   CHECK_EQUAL( index_at_or_before(ts.size(), ts_of, 1000), 5 );

   std::vector<uint64_t> single = { 10 };
   auto single_of = [&](const uint64_t& i) { return single[i - 1]; };
   CHECK_EQUAL( index_at_or_before(1, single_of, 9), 0 );
   CHECK_EQUAL( index_at_or_before(1, single_of, 10), 1 );

   //every index of a long history is found at its own timestamp and just after it
   std::vector<uint64_t> history;
   for (uint64_t i = 1; i <= 300; i++)
      history.push_back(T0 + i * 3600);
   auto history_of = [&](const uint64_t& i) { return history[i - 1]; };
   bool all_found = true;
   for (uint64_t i = 1; i <= history.size(); i++) {
      all_found &= index_at_or_before(history.size(), history_of, history[i - 1]) == i;
      all_found &= index_at_or_before(history.size(), history_of, history[i - 1] + 1) == i;
   }
   CHECK_EQUAL( all_found, true );
EOSIO_TEST_END

EOSIO_TEST_BEGIN(balance_of_point_test)
   user_point_st point;
   point.slope       = slope_of(1000'0000'0000);
   point.bias        = bias_of(point.slope, 10 * WEEK);
   point.ts          = T0;

   CHECK_EQUAL( balance_of_point(point, T0), from_wad(point.bias) );
   CHECK_EQUAL( balance_of_point(point, T0 + 10 * WEEK), 0 );
   CHECK_EQUAL( balance_of_point(point, T0 + 20 * WEEK), 0 );
   CHECK_EQUAL( balance_of_point(point, T0 + 5 * WEEK), from_wad(bias_of(point.slope, 5 * WEEK)) );

   user_point_st frozen;
   frozen.permanent  = 500'0000'0000;
   frozen.ts         = T0;
   CHECK_EQUAL( balance_of_point(frozen, T0 + 100 * WEEK), 500'0000'0000 );
EOSIO_TEST_END

EOSIO_TEST_BEGIN(replay_weeks_test)
   memory_store store;
   auto slope = slope_of(100'0000'0000);

   global_point_st point;
   point.slope       = slope;
   point.bias        = bias_of(slope, 2 * WEEK);
   point.ts          = T0;
   store.set_slope_change(T0 + 2 * WEEK, -slope);

   std::vector<uint64_t> weeks;
   auto reached = replay_weeks(store, point, T0 + 3 * WEEK, true, [&](const global_point_st& p) {
      weeks.push_back(p.ts);
   });
   CHECK_EQUAL( reached, true );
   CHECK_EQUAL( weeks.size(), 2 );
   CHECK_EQUAL( weeks[0], T0 + WEEK );
   CHECK_EQUAL( weeks[1], T0 + 2 * WEEK );
   CHECK_EQUAL( point.ts, T0 + 3 * WEEK );
   CHECK_EQUAL( (bool)(point.bias == 0), true );
   CHECK_EQUAL( (bool)(point.slope == 0), true );

   //a change scheduled exactly at the target is left out unless asked for
   global_point_st partial;
   partial.slope     = slope;
   partial.bias      = bias_of(slope, 2 * WEEK);
   partial.ts        = T0 + 3600;
   reached = replay_weeks(store, partial, T0 + 2 * WEEK, false, [](const global_point_st&) {});
   CHECK_EQUAL( reached, true );
   CHECK_EQUAL( (bool)(partial.slope == slope), true );
   CHECK_EQUAL( (bool)(partial.bias == bias_of(slope, 3600)), true );

   global_point_st far;
   far.ts = T0;
   uint64_t steps = 0;
   reached = replay_weeks(store, far, T0 + 300 * WEEK, true, [&](const global_point_st&) { steps++; });
   CHECK_EQUAL( reached, false );
   CHECK_EQUAL( steps, MAX_REPLAY_WEEKS );
   CHECK_EQUAL( far.ts, T0 + MAX_REPLAY_WEEKS * WEEK );
EOSIO_TEST_END

EOSIO_TEST_BEGIN(total_supply_lookback_test)
   memory_store store;
   auto slope = slope_of(100'0000'0000);

   global_point_st point;
   point.slope                   = slope;
   point.bias                    = bias_of(slope, 10 * WEEK);
   point.ts                      = T0;
   point.permanent_lock_balance  = 7'0000'0000;
   store.set_global_point(1, point);
   store.set_slope_change(T0 + 10 * WEEK, -slope);
   store.gstate().epoch = 1;

   CHECK_EQUAL( total_supply_at(store, T0 - 1), 0 );
   CHECK_EQUAL( total_supply_at(store, T0), from_wad(point.bias) + 7'0000'0000 );
   CHECK_EQUAL( total_supply_at(store, T0 + 4 * WEEK + 5), from_wad(bias_of(slope, 6 * WEEK - 5)) + 7'0000'0000 );
   CHECK_EQUAL( total_supply_at(store, T0 + 10 * WEEK), 7'0000'0000 );
   CHECK_EQUAL( total_supply_at(store, T0 + 255 * WEEK), 7'0000'0000 );

   CHECK_ASSERT( "[[41]] supply lookback exceeds 255 weeks", ([&]() {
      total_supply_at(store, T0 + 256 * WEEK);
   }) );
EOSIO_TEST_END

int main(int argc, char** argv) {
   bool verbose = false;
   if( argc >= 2 && std::strcmp( argv[1], "-v" ) == 0 ) {
      verbose = true;
   }
   silence_output(!verbose);

   EOSIO_TEST(week_floor_test);
   EOSIO_TEST(safemath_test);
   EOSIO_TEST(index_at_or_before_test);
   EOSIO_TEST(balance_of_point_test);
   EOSIO_TEST(replay_weeks_test);
   EOSIO_TEST(total_supply_lookback_test);
   return has_failed();
}
