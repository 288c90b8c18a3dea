#pragma once

#include <ve.escrow/ve.escrow.db.hpp>

namespace vefi {

/**
 * Ledger storage on the contract's multi-index tables.
 * `gstate` is the contract's cached global row, persisted by the contract.
 * New rows are billed to `payer`, the contract itself unless given.
 */
class table_store {
   public:
      table_store(const name& code, global_t& gstate, const name& payer = name())
         : _code(code), _gstate(gstate), _payer(payer == name() ? code : payer) {}

      global_t& gstate()               { return _gstate; }
      const global_t& gstate() const   { return _gstate; }

      bool get_lock(lock_t& lock) const {
         lock_t::tbl_t locks(_code, _code.value);
         auto itr = locks.find(lock.primary_key());
         if (itr == locks.end()) return false;
         lock = *itr;
         return true;
      }

      void set_lock(const lock_t& lock) {
         lock_t::tbl_t locks(_code, _code.value);
         auto itr = locks.find(lock.primary_key());
         if (itr == locks.end()) {
            locks.emplace(_payer, [&](auto& row) { row = lock; });
         } else {
            locks.modify(itr, same_payer, [&](auto& row) { row = lock; });
         }
      }

      user_point_st user_point(const uint64_t& id, const uint64_t& epoch) const {
         user_point_t::tbl_t points(_code, id);
         auto itr = points.find(epoch);
         return itr == points.end() ? user_point_st() : itr->point;
      }

      void set_user_point(const uint64_t& id, const uint64_t& epoch, const user_point_st& point) {
         user_point_t::tbl_t points(_code, id);
         auto itr = points.find(epoch);
         if (itr == points.end()) {
            points.emplace(_payer, [&](auto& row) {
               row.epoch   = epoch;
               row.point   = point;
            });
         } else {
            points.modify(itr, same_payer, [&](auto& row) { row.point = point; });
         }
      }

      global_point_st global_point(const uint64_t& epoch) const {
         global_point_t::tbl_t points(_code, _code.value);
         auto itr = points.find(epoch);
         return itr == points.end() ? global_point_st() : itr->point;
      }

      void set_global_point(const uint64_t& epoch, const global_point_st& point) {
         global_point_t::tbl_t points(_code, _code.value);
         auto itr = points.find(epoch);
         if (itr == points.end()) {
            points.emplace(_payer, [&](auto& row) {
               row.epoch   = epoch;
               row.point   = point;
            });
         } else {
            points.modify(itr, same_payer, [&](auto& row) { row.point = point; });
         }
      }

      int128_t slope_change(const uint64_t& ts) const {
         slope_change_t::tbl_t changes(_code, _code.value);
         auto itr = changes.find(ts);
         return itr == changes.end() ? 0 : itr->dslope;
      }

      //zero deltas are not kept
      void set_slope_change(const uint64_t& ts, const int128_t& dslope) {
         slope_change_t::tbl_t changes(_code, _code.value);
         auto itr = changes.find(ts);
         if (itr == changes.end()) {
            if (dslope == 0) return;
            changes.emplace(_payer, [&](auto& row) {
               row.ts      = ts;
               row.dslope  = dslope;
            });
         } else if (dslope == 0) {
            changes.erase(itr);
         } else {
            changes.modify(itr, same_payer, [&](auto& row) { row.dslope = dslope; });
         }
      }

      bool is_operator(const name& owner, const name& account) const {
         operator_t::tbl_t operators(_code, owner.value);
         return operators.find(account.value) != operators.end();
      }

      void set_operator(const name& owner, const name& account, const bool& approved) {
         operator_t::tbl_t operators(_code, owner.value);
         auto itr = operators.find(account.value);
         if (approved && itr == operators.end()) {
            operators.emplace(_payer, [&](auto& row) { row.account = account; });
         } else if (!approved && itr != operators.end()) {
            operators.erase(itr);
         }
      }

      bool can_split(const name& account) const {
         splitter_t::tbl_t splitters(_code, _code.value);
         return splitters.find(account.value) != splitters.end();
      }

      void set_split(const name& account, const bool& allowed) {
         splitter_t::tbl_t splitters(_code, _code.value);
         auto itr = splitters.find(account.value);
         if (allowed && itr == splitters.end()) {
            splitters.emplace(_payer, [&](auto& row) { row.account = account; });
         } else if (!allowed && itr != splitters.end()) {
            splitters.erase(itr);
         }
      }

   private:
      name           _code;
      global_t&      _gstate;
      name           _payer;
};

} //namespace vefi
