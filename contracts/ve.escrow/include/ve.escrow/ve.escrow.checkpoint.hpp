#pragma once

#include <cstdint>

#include <safemath.hpp>
#include <ve.escrow/ve.escrow.db.hpp>

namespace vefi {

using namespace vefi::safemath;

/**
 * Index of the checkpoint in effect at `ts`: the latest checkpoint whose
 * timestamp is at or before `ts`, or 0 when the history is empty or starts
 * after `ts`. Checkpoints are 1-based, epoch 0 is the implicit empty point.
 *
 * @param epoch_count - number of checkpoints in the history,
 * @param ts_of - accessor returning the timestamp of checkpoint `i`, 1 <= i <= epoch_count,
 * @param ts - the target timestamp.
 */
template<typename TsOf>
uint64_t index_at_or_before(const uint64_t& epoch_count, TsOf&& ts_of, const uint64_t& ts) {
   if (epoch_count == 0)
      return 0;
   if (ts_of(epoch_count) <= ts)
      return epoch_count;
   if (ts_of(1) > ts)
      return 0;

   uint64_t lower = 0;
   uint64_t upper = epoch_count;
   while (upper > lower) {
      uint64_t center = upper - (upper - lower) / 2;    //ceil, no overflow
      uint64_t center_ts = ts_of(center);
      if (center_ts == ts)
         return center;
      else if (center_ts < ts)
         lower = center;
      else
         upper = center - 1;
   }
   return lower;
}

template<typename Store>
uint64_t user_point_index(const Store& store, const uint64_t& id, const uint64_t& ts) {
   lock_t lock(id);
   if (!store.get_lock(lock))
      return 0;
   return index_at_or_before(lock.point_epoch,
            [&](const uint64_t& e) { return store.user_point(id, e).ts; }, ts);
}

template<typename Store>
uint64_t global_point_index(const Store& store, const uint64_t& ts) {
   return index_at_or_before(store.gstate().epoch,
            [&](const uint64_t& e) { return store.global_point(e).ts; }, ts);
}

//balance carried by a single user point at `ts`, ts >= point.ts
inline int64_t balance_of_point(const user_point_st& point, const uint64_t& ts) {
   if (point.permanent != 0)
      return point.permanent;

   int128_t bias = point.bias - point.slope * (int128_t)(ts - point.ts);
   return from_wad(bias);
}

template<typename Store>
int64_t balance_of_at(const Store& store, const uint64_t& id, const uint64_t& ts) {
   auto idx = user_point_index(store, id, ts);
   if (idx == 0)
      return 0;
   return balance_of_point(store.user_point(id, idx), ts);
}

/**
 * Walks a global point forward through the weekly slope-change schedule.
 *
 * Each step crosses one week boundary, decaying bias by the current slope
 * and then applying the slope change scheduled at that boundary. The last
 * step is clamped to `until`. `on_week` receives every intermediate point
 * that lands on a week boundary strictly before `until`.
 *
 * @param apply_final - whether a slope change scheduled exactly at `until` is applied,
 * @return true if `until` was reached within MAX_REPLAY_WEEKS steps.
 */
template<typename Store, typename OnWeek>
bool replay_weeks(const Store& store, global_point_st& point, const uint64_t& until,
                  const bool& apply_final, OnWeek&& on_week) {
   auto last_ts   = point.ts;
   auto t_i       = week_floor(last_ts);
   for (uint64_t i = 0; i < MAX_REPLAY_WEEKS; i++) {
      t_i += WEEK;
      int128_t d_slope = 0;
      if (t_i > until) {
         t_i = until;
      } else {
         d_slope = store.slope_change(t_i);
      }
      point.bias -= point.slope * (int128_t)(t_i - last_ts);
      if (t_i == until && !apply_final) {
         point.ts = t_i;
         return true;
      }

      point.slope += d_slope;
      if (point.bias < 0)  // This can happen
         point.bias = 0;
      if (point.slope < 0)
         point.slope = 0;
      last_ts     = t_i;
      point.ts    = t_i;

      if (t_i == until)
         return true;
      on_week(point);
   }
   return false;
}

//a replay starting at `from` reaches `until` within MAX_REPLAY_WEEKS steps
inline bool replay_reaches(const uint64_t& from, const uint64_t& until) {
   return until <= week_floor(from) + MAX_REPLAY_WEEKS * WEEK;
}

template<typename Store>
int64_t supply_of_point(const Store& store, global_point_st point, const uint64_t& ts) {
   auto reached = replay_weeks(store, point, ts, false, [](const global_point_st&) {});
   CHECKC( reached, err::REPLAY_LIMIT, "supply lookback exceeds " + std::to_string(MAX_REPLAY_WEEKS) + " weeks" )

   return safe_int64(to_wide(from_wad(point.bias)) + to_wide(point.permanent_lock_balance));
}

template<typename Store>
int64_t total_supply_at(const Store& store, const uint64_t& ts) {
   auto idx = global_point_index(store, ts);
   if (idx == 0)
      return 0;
   return supply_of_point(store, store.global_point(idx), ts);
}

} //namespace vefi
