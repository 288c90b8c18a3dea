#pragma once

#include <algorithm>
#include <string>
#include <utility>

#include <safemath.hpp>
#include <ve.escrow/ve.escrow.checkpoint.hpp>

namespace vefi {

using namespace vefi::safemath;

struct withdraw_result_st {
   name     owner;
   asset    payout;                 //to owner
   asset    penalty;                //to treasury
};

/**
 * Lock lifecycle manager.
 *
 * Every mutation removes the position's old (bias, slope) contribution from
 * the global aggregate, applies the new one, appends a user point and a global
 * point and reschedules the position's slope change at its unlock time, all
 * against the same `Store`. Every check, including the global history catch-up,
 * runs before the first write, so a failed call leaves the store untouched.
 *
 * `Store` provides:
 *    global_t& gstate();
 *    bool get_lock(lock_t&) const;               void set_lock(const lock_t&);
 *    user_point_st user_point(id, epoch) const;  void set_user_point(id, epoch, const user_point_st&);
 *    global_point_st global_point(epoch) const;  void set_global_point(epoch, const global_point_st&);
 *    int128_t slope_change(ts) const;            void set_slope_change(ts, const int128_t&);
 *    bool is_operator(owner, account) const;     void set_operator(owner, account, bool);
 *    bool can_split(account) const;              void set_split(account, bool);
 */
template<typename Store>
class ve_ledger {
   public:
      ve_ledger(Store& store, const uint64_t& now, const uint64_t& blk)
         : _store(store), _now(now), _blk(blk) {}

      uint64_t create_lock(const name& owner, const asset& quant, const uint64_t& duration);
      void deposit_for(const uint64_t& id, const asset& quant);
      void increase_unlock_time(const name& sender, const uint64_t& id, const uint64_t& duration);
      void lock_permanent(const name& sender, const uint64_t& id);
      void unlock_permanent(const name& sender, const uint64_t& id);
      void merge(const name& sender, const uint64_t& from, const uint64_t& to);
      std::pair<uint64_t, uint64_t> split(const name& sender, const uint64_t& id, const asset& quant);
      withdraw_result_st withdraw(const name& sender, const uint64_t& id);
      withdraw_result_st early_withdraw(const name& sender, const uint64_t& id);

      void transfer(const name& sender, const uint64_t& id, const name& to);
      void approve(const name& sender, const uint64_t& id, const name& spender);
      void set_approval_for_all(const name& owner, const name& account, const bool& approved);
      void toggle_split(const name& account, const bool& allowed);

      //advances global history without touching a position, returns true once current
      bool checkpoint();

      int64_t balance_of(const uint64_t& id) const           { return balance_of_at(_store, id, _now); }
      int64_t balance_at(const uint64_t& id, const uint64_t& ts) const { return balance_of_at(_store, id, ts); }
      int64_t total_supply() const                           { return total_supply_at(_store, _now); }
      int64_t supply_at(const uint64_t& ts) const            { return total_supply_at(_store, ts); }

      lock_t get_lock(const uint64_t& id) const;
      bool is_approved_or_owner(const name& sender, const lock_t& lock) const;

   private:
      void _check_point(const lock_t& old_locked, lock_t& new_locked);
      void _check_history() const;
      bool _advance_global(global_point_st& last_point, uint64_t& epoch, const bool& partial);
      void _save_global(const global_point_st& last_point, const uint64_t& epoch);

      uint64_t _mint(const name& owner, const asset& quant, const uint64_t& end,
                     const bool& permanent, const uint64_t& effective_start);
      void _burn(const lock_t& lock);
      lock_t _get_live_lock(const uint64_t& id) const;
      void _check_auth(const name& sender, const lock_t& lock) const;
      void _check_symbol(const asset& quant);

      Store&         _store;
      uint64_t       _now;
      uint64_t       _blk;
};

template<typename Store>
lock_t ve_ledger<Store>::get_lock(const uint64_t& id) const {
   lock_t lock(id);
   CHECKC( _store.get_lock(lock), err::RECORD_NOT_FOUND, "lock not found" )
   return lock;
}

template<typename Store>
bool ve_ledger<Store>::is_approved_or_owner(const name& sender, const lock_t& lock) const {
   if (lock.owner == name()) return false;
   if (sender == lock.owner) return true;
   if (lock.approved != name() && sender == lock.approved) return true;
   return _store.is_operator(lock.owner, sender);
}

template<typename Store>
lock_t ve_ledger<Store>::_get_live_lock(const uint64_t& id) const {
   auto lock = get_lock(id);
   CHECKC( !lock.withdrawn(), err::ALREADY_WITHDRAWN, "lock already withdrawn" )
   return lock;
}

template<typename Store>
void ve_ledger<Store>::_check_auth(const name& sender, const lock_t& lock) const {
   CHECKC( is_approved_or_owner(sender, lock), err::NO_AUTH, "not approved or owner" )
}

template<typename Store>
void ve_ledger<Store>::_check_symbol(const asset& quant) {
   CHECKC( quant.symbol == _store.gstate().principal_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch" )
}

template<typename Store>
void ve_ledger<Store>::_check_history() const {
   auto epoch = _store.gstate().epoch;
   if (epoch == 0) return;

   auto last_ts = _store.global_point(epoch).ts;
   CHECKC( last_ts <= _now, err::TIME_PREMATURE, "checkpoint time behind last global point" )
   CHECKC( replay_reaches(last_ts, _now), err::REPLAY_LIMIT, "global history is more than 255 weeks behind, run checkpoint first" )
}

template<typename Store>
bool ve_ledger<Store>::_advance_global(global_point_st& last_point, uint64_t& epoch, const bool& partial) {
   auto& gstate   = _store.gstate();
   epoch          = gstate.epoch;

   last_point     = global_point_st();
   last_point.ts  = _now;
   last_point.blk = _blk;
   if (epoch > 0)
      last_point = _store.global_point(epoch);
   CHECKC( last_point.ts <= _now, err::TIME_PREMATURE, "checkpoint time behind last global point" )
   if (!partial)
      _check_history();

   auto initial_last_point = last_point;
   int128_t block_slope = 0;             // dblock/dt, WAD
   if (_now > initial_last_point.ts && _blk > initial_last_point.blk)
      block_slope = WAD * (int128_t)(_blk - initial_last_point.blk) / (int128_t)(_now - initial_last_point.ts);

   auto reached = replay_weeks(_store, last_point, _now, true, [&](const global_point_st& point) {
      auto week_point   = point;
      week_point.blk    = initial_last_point.blk
                        + safe_uint64(block_slope * (int128_t)(point.ts - initial_last_point.ts) / WAD);
      epoch += 1;
      _store.set_global_point(epoch, week_point);
   });

   if (!reached) {
      CHECKC( partial, err::REPLAY_LIMIT, "global history is more than 255 weeks behind, run checkpoint first" )
      gstate.epoch = epoch;
      return false;
   }
   last_point.blk = _blk;
   epoch += 1;
   return true;
}

template<typename Store>
void ve_ledger<Store>::_save_global(const global_point_st& last_point, const uint64_t& epoch) {
   // a second checkpoint at the same time overwrites the last global point
   if (epoch != 1 && _store.global_point(epoch - 1).ts == _now) {
      _store.set_global_point(epoch - 1, last_point);
   } else {
      _store.gstate().epoch = epoch;
      _store.set_global_point(epoch, last_point);
   }
}

template<typename Store>
void ve_ledger<Store>::_check_point(const lock_t& old_locked, lock_t& new_locked) {
   auto u_old           = user_point_st();
   auto u_new           = user_point_st();
   int128_t old_dslope  = 0;
   int128_t new_dslope  = 0;

   if (new_locked.permanent)
      u_new.permanent = new_locked.amount.amount;

   if (!old_locked.permanent && old_locked.end > _now && old_locked.amount.amount > 0) {
      u_old.slope    = slope_of(old_locked.amount.amount);
      u_old.bias     = bias_of(u_old.slope, old_locked.end - _now);
   }
   if (!new_locked.permanent && new_locked.end > _now && new_locked.amount.amount > 0) {
      u_new.slope    = slope_of(new_locked.amount.amount);
      u_new.bias     = bias_of(u_new.slope, new_locked.end - _now);
   }

   old_dslope = _store.slope_change(old_locked.end);
   if (new_locked.end != 0) {
      if (new_locked.end == old_locked.end)
         new_dslope = old_dslope;
      else
         new_dslope = _store.slope_change(new_locked.end);
   }

   global_point_st last_point;
   uint64_t epoch = 0;
   _advance_global(last_point, epoch, false);

   last_point.slope += (u_new.slope - u_old.slope);
   last_point.bias  += (u_new.bias - u_old.bias);
   if (last_point.slope < 0)
      last_point.slope = 0;
   if (last_point.bias < 0)
      last_point.bias = 0;
   last_point.permanent_lock_balance = _store.gstate().permanent_lock_balance;
   _save_global(last_point, epoch);

   // Schedule the slope changes (slope is going down)
   // We subtract new_user_slope from [new_locked.end]
   // and add old_user_slope to [old_locked.end]
   if (old_locked.end > _now) {
      // old_dslope was <something> - u_old.slope, so we cancel that
      old_dslope += u_old.slope;
      if (new_locked.end == old_locked.end)
         old_dslope -= u_new.slope;  // It was a new deposit, not extension
      _store.set_slope_change(old_locked.end, old_dslope);
   }
   if (new_locked.end > _now && new_locked.end > old_locked.end) {
      new_dslope -= u_new.slope;    // old slope disappeared at this point
      _store.set_slope_change(new_locked.end, new_dslope);
   }

   u_new.ts    = _now;
   u_new.blk   = _blk;
   auto user_epoch = new_locked.point_epoch;
   if (user_epoch != 0 && _store.user_point(new_locked.id, user_epoch).ts == _now) {
      _store.set_user_point(new_locked.id, user_epoch, u_new);
   } else {
      new_locked.point_epoch = ++user_epoch;
      _store.set_user_point(new_locked.id, user_epoch, u_new);
   }
}

template<typename Store>
bool ve_ledger<Store>::checkpoint() {
   global_point_st last_point;
   uint64_t epoch = 0;
   if (!_advance_global(last_point, epoch, true))
      return false;

   last_point.permanent_lock_balance = _store.gstate().permanent_lock_balance;
   _save_global(last_point, epoch);
   return true;
}

template<typename Store>
uint64_t ve_ledger<Store>::_mint(const name& owner, const asset& quant, const uint64_t& end,
                                 const bool& permanent, const uint64_t& effective_start) {
   auto& gstate            = _store.gstate();
   lock_t lock(++gstate.last_lock_id);
   lock.owner              = owner;
   lock.amount             = quant;
   lock.end                = end;
   lock.permanent          = permanent;
   lock.status             = permanent ? lock_status::PERMANENT : lock_status::ACTIVE;
   lock.effective_start    = effective_start;
   lock.created_at         = time_point_sec(_now);

   _check_point(lock_t(), lock);
   _store.set_lock(lock);
   return lock.id;
}

template<typename Store>
void ve_ledger<Store>::_burn(const lock_t& lock) {
   auto burned       = lock;
   burned.owner      = name();
   burned.approved   = name();
   burned.amount     = asset(0, lock.amount.symbol);
   burned.end        = 0;
   burned.permanent  = false;
   burned.status     = lock_status::WITHDRAWN;

   _check_point(lock, burned);
   _store.set_lock(burned);
}

template<typename Store>
uint64_t ve_ledger<Store>::create_lock(const name& owner, const asset& quant, const uint64_t& duration) {
   auto& gstate = _store.gstate();
   CHECKC( owner != name(), err::ACCOUNT_INVALID, "lock owner is empty" )
   _check_symbol(quant);
   CHECKC( quant.amount > 0, err::NOT_POSITIVE, "lock amount must be positive" )
   CHECKC( quant.amount >= gstate.min_lock_amount.amount, err::INCORRECT_AMOUNT, "lock amount below minimum" )
   CHECKC( duration <= gstate.max_lock_duration, err::LOCK_TOO_LONG, "lock duration too long" )

   auto unlock_time = week_floor(_now + duration); // Locktime is rounded down to weeks
   CHECKC( unlock_time > _now && unlock_time - _now >= gstate.min_lock_duration, err::LOCK_TOO_SHORT, "lock duration too short" )
   _check_history();

   auto id = _mint(owner, quant, unlock_time, false, _now);
   gstate.supply += quant;
   return id;
}

template<typename Store>
void ve_ledger<Store>::deposit_for(const uint64_t& id, const asset& quant) {
   auto& gstate = _store.gstate();
   _check_symbol(quant);
   CHECKC( quant.amount > 0, err::NOT_POSITIVE, "deposit amount must be positive" )

   auto old_locked = _get_live_lock(id);
   if (!old_locked.permanent) {
      CHECKC( old_locked.end > _now, err::TIME_EXPIRED, "lock expired" )
      // topping up a nearly expired lock would cheapen a later early withdraw
      CHECKC( old_locked.end - _now >= gstate.min_lock_duration, err::DEPOSIT_DURATION_TOO_SHORT, "remaining lock duration too short" )
   }
   _check_history();

   auto new_locked            = old_locked;
   new_locked.amount         += quant;
   new_locked.effective_start = weighted_time(old_locked.amount.amount, old_locked.effective_start, quant.amount, _now);
   if (new_locked.permanent)
      gstate.permanent_lock_balance = safe_int64(to_wide(gstate.permanent_lock_balance) + quant.amount);
   gstate.supply += quant;

   _check_point(old_locked, new_locked);
   _store.set_lock(new_locked);
}

template<typename Store>
void ve_ledger<Store>::increase_unlock_time(const name& sender, const uint64_t& id, const uint64_t& duration) {
   auto& gstate = _store.gstate();
   auto old_locked = _get_live_lock(id);
   _check_auth(sender, old_locked);
   CHECKC( !old_locked.permanent, err::ALREADY_PERMANENT, "lock is permanent" )
   CHECKC( old_locked.end > _now, err::TIME_EXPIRED, "lock expired" )

   CHECKC( duration <= gstate.max_lock_duration, err::LOCK_TOO_LONG, "lock duration too long" )

   auto unlock_time = week_floor(_now + duration);
   CHECKC( unlock_time > old_locked.end, err::LOCK_TOO_SHORT, "can only increase lock duration" )
   _check_history();

   auto new_locked   = old_locked;
   new_locked.end    = unlock_time;
   _check_point(old_locked, new_locked);
   _store.set_lock(new_locked);
}

template<typename Store>
void ve_ledger<Store>::lock_permanent(const name& sender, const uint64_t& id) {
   auto& gstate = _store.gstate();
   auto old_locked = _get_live_lock(id);
   _check_auth(sender, old_locked);
   CHECKC( !old_locked.permanent, err::ALREADY_PERMANENT, "lock is permanent" )
   CHECKC( old_locked.end > _now, err::TIME_EXPIRED, "lock expired" )
   _check_history();

   gstate.permanent_lock_balance = safe_int64(to_wide(gstate.permanent_lock_balance) + old_locked.amount.amount);

   // unlock time is retained so that unlocking resumes the original decay curve
   auto new_locked         = old_locked;
   new_locked.permanent    = true;
   new_locked.status       = lock_status::PERMANENT;
   _check_point(old_locked, new_locked);
   _store.set_lock(new_locked);
}

template<typename Store>
void ve_ledger<Store>::unlock_permanent(const name& sender, const uint64_t& id) {
   auto& gstate = _store.gstate();
   auto old_locked = _get_live_lock(id);
   _check_auth(sender, old_locked);
   CHECKC( old_locked.permanent, err::NOT_PERMANENT, "lock is not permanent" )
   _check_history();

   gstate.permanent_lock_balance = safe_int64(to_wide(gstate.permanent_lock_balance) - old_locked.amount.amount);

   auto new_locked         = old_locked;
   new_locked.permanent    = false;
   new_locked.status       = lock_status::ACTIVE;
   _check_point(old_locked, new_locked);
   _store.set_lock(new_locked);
}

template<typename Store>
void ve_ledger<Store>::merge(const name& sender, const uint64_t& from, const uint64_t& to) {
   auto& gstate = _store.gstate();
   CHECKC( from != to, err::SAME_LOCK, "cannot merge a lock into itself" )

   auto old_from  = _get_live_lock(from);
   auto old_to    = _get_live_lock(to);
   _check_auth(sender, old_from);
   _check_auth(sender, old_to);
   CHECKC( !old_from.permanent, err::ALREADY_PERMANENT, "cannot merge from a permanent lock" )
   CHECKC( old_to.permanent || old_to.end > _now, err::TIME_EXPIRED, "merge target expired" )
   _check_history();

   auto effective_start = weighted_time(old_from.amount.amount, old_from.effective_start,
                                        old_to.amount.amount, old_to.effective_start);
   _burn(old_from);

   auto new_to             = old_to;
   new_to.amount          += old_from.amount;
   new_to.end              = std::max(old_from.end, old_to.end);
   new_to.effective_start  = effective_start;
   if (new_to.permanent)
      gstate.permanent_lock_balance = safe_int64(to_wide(gstate.permanent_lock_balance) + old_from.amount.amount);

   _check_point(old_to, new_to);
   _store.set_lock(new_to);
}

template<typename Store>
std::pair<uint64_t, uint64_t> ve_ledger<Store>::split(const name& sender, const uint64_t& id, const asset& quant) {
   auto& gstate = _store.gstate();
   auto old_locked = _get_live_lock(id);
   // permission follows the current owner, not whoever granted it
   CHECKC( gstate.split_all || _store.can_split(old_locked.owner), err::SPLIT_NOT_ALLOWED, "split not allowed" )
   _check_auth(sender, old_locked);
   CHECKC( old_locked.permanent || old_locked.end > _now, err::TIME_EXPIRED, "lock expired" )
   _check_symbol(quant);
   CHECKC( quant.amount > 0, err::NOT_POSITIVE, "split amount must be positive" )
   CHECKC( quant.amount < old_locked.amount.amount, err::AMOUNT_TOO_LARGE, "split amount too large" )
   _check_history();

   _burn(old_locked);
   auto id1 = _mint(old_locked.owner, old_locked.amount - quant, old_locked.end,
                    old_locked.permanent, old_locked.effective_start);
   auto id2 = _mint(old_locked.owner, quant, old_locked.end,
                    old_locked.permanent, old_locked.effective_start);
   return { id1, id2 };
}

template<typename Store>
withdraw_result_st ve_ledger<Store>::withdraw(const name& sender, const uint64_t& id) {
   auto& gstate = _store.gstate();
   auto old_locked = _get_live_lock(id);
   _check_auth(sender, old_locked);
   CHECKC( !old_locked.permanent, err::ALREADY_PERMANENT, "lock is permanent" )
   CHECKC( old_locked.end <= _now, err::TIME_PREMATURE, "lock not expired" )
   _check_history();

   withdraw_result_st result { old_locked.owner, old_locked.amount, asset(0, old_locked.amount.symbol) };
   gstate.supply -= old_locked.amount;
   _burn(old_locked);
   return result;
}

template<typename Store>
withdraw_result_st ve_ledger<Store>::early_withdraw(const name& sender, const uint64_t& id) {
   auto& gstate = _store.gstate();
   auto old_locked = _get_live_lock(id);
   _check_auth(sender, old_locked);
   CHECKC( !old_locked.permanent, err::ALREADY_PERMANENT, "lock is permanent" )
   CHECKC( old_locked.end > _now, err::TIME_EXPIRED, "lock expired, use withdraw" )
   CHECKC( gstate.treasury != name(), err::NOT_STARTED, "early withdraw treasury not set" )
   _check_history();

   auto remaining    = old_locked.end - _now;
   auto total        = old_locked.end - old_locked.effective_start;
   auto penalty      = ratio_of(old_locked.amount.amount, gstate.max_penalty_bps, remaining, total);
   auto sym          = old_locked.amount.symbol;

   withdraw_result_st result { old_locked.owner, asset(old_locked.amount.amount - penalty, sym), asset(penalty, sym) };
   gstate.supply -= old_locked.amount;
   _burn(old_locked);
   return result;
}

template<typename Store>
void ve_ledger<Store>::transfer(const name& sender, const uint64_t& id, const name& to) {
   auto lock = _get_live_lock(id);
   _check_auth(sender, lock);
   CHECKC( to != name(), err::ACCOUNT_INVALID, "receiver is empty" )
   CHECKC( to != lock.owner, err::ACCOUNT_INVALID, "cannot transfer to owner" )

   lock.owner     = to;
   lock.approved  = name();
   _store.set_lock(lock);
}

template<typename Store>
void ve_ledger<Store>::approve(const name& sender, const uint64_t& id, const name& spender) {
   auto lock = _get_live_lock(id);
   CHECKC( sender == lock.owner || _store.is_operator(lock.owner, sender), err::NO_AUTH, "not owner or operator" )
   CHECKC( spender != lock.owner, err::ACCOUNT_INVALID, "cannot approve owner" )

   lock.approved = spender;
   _store.set_lock(lock);
}

template<typename Store>
void ve_ledger<Store>::set_approval_for_all(const name& owner, const name& account, const bool& approved) {
   CHECKC( account != name(), err::ACCOUNT_INVALID, "operator is empty" )
   CHECKC( account != owner, err::ACCOUNT_INVALID, "cannot approve self" )
   _store.set_operator(owner, account, approved);
}

template<typename Store>
void ve_ledger<Store>::toggle_split(const name& account, const bool& allowed) {
   if (account == name())
      _store.gstate().split_all = allowed;
   else
      _store.set_split(account, allowed);
}

} //namespace vefi
