#pragma once

#include <map>
#include <set>
#include <utility>

#include <ve.escrow/ve.escrow.db.hpp>

namespace vefi {

/**
 * Ledger storage on std containers, same interface as `table_store`.
 * Used by the native tests, where multi-index tables are not available.
 */
class memory_store {
   public:
      memory_store() {
         _gstate.treasury  = "ve.treasury"_n;
      }

      global_t& gstate()               { return _gstate; }
      const global_t& gstate() const   { return _gstate; }

      bool get_lock(lock_t& lock) const {
         auto itr = _locks.find(lock.primary_key());
         if (itr == _locks.end()) return false;
         lock = itr->second;
         return true;
      }

      void set_lock(const lock_t& lock) {
         _locks[lock.primary_key()] = lock;
      }

      user_point_st user_point(const uint64_t& id, const uint64_t& epoch) const {
         auto itr = _user_points.find({ id, epoch });
         return itr == _user_points.end() ? user_point_st() : itr->second;
      }

      void set_user_point(const uint64_t& id, const uint64_t& epoch, const user_point_st& point) {
         _user_points[{ id, epoch }] = point;
      }

      global_point_st global_point(const uint64_t& epoch) const {
         auto itr = _global_points.find(epoch);
         return itr == _global_points.end() ? global_point_st() : itr->second;
      }

      void set_global_point(const uint64_t& epoch, const global_point_st& point) {
         _global_points[epoch] = point;
      }

      int128_t slope_change(const uint64_t& ts) const {
         auto itr = _slope_changes.find(ts);
         return itr == _slope_changes.end() ? 0 : itr->second;
      }

      void set_slope_change(const uint64_t& ts, const int128_t& dslope) {
         if (dslope == 0)
            _slope_changes.erase(ts);
         else
            _slope_changes[ts] = dslope;
      }

      bool is_operator(const name& owner, const name& account) const {
         return _operators.count({ owner.value, account.value }) > 0;
      }

      void set_operator(const name& owner, const name& account, const bool& approved) {
         if (approved)
            _operators.insert({ owner.value, account.value });
         else
            _operators.erase({ owner.value, account.value });
      }

      bool can_split(const name& account) const {
         return _splitters.count(account.value) > 0;
      }

      void set_split(const name& account, const bool& allowed) {
         if (allowed)
            _splitters.insert(account.value);
         else
            _splitters.erase(account.value);
      }

      //inspection
      const std::map<uint64_t, lock_t>& locks() const          { return _locks; }
      const std::map<uint64_t, int128_t>& slope_changes() const { return _slope_changes; }

   private:
      global_t                                              _gstate;
      std::map<uint64_t, lock_t>                            _locks;
      std::map<std::pair<uint64_t, uint64_t>, user_point_st> _user_points;
      std::map<uint64_t, global_point_st>                   _global_points;
      std::map<uint64_t, int128_t>                          _slope_changes;
      std::set<std::pair<uint64_t, uint64_t>>               _operators;
      std::set<uint64_t>                                    _splitters;
};

} //namespace vefi
