#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <string>

#include <ve.escrow/ve.escrow.db.hpp>
#include <ve.escrow/ve.escrow.ledger.hpp>
#include <ve.escrow/ve.escrow.store.hpp>

namespace vefi {

using std::string;
using std::vector;

using namespace eosio;

/**
 * The `ve.escrow` contract locks the principal token into NFT-style positions
 * and tracks their time weighted voting balance.
 *
 * A position's weight starts at `amount * remaining / MAXTIME` and decays
 * linearly to zero at its unlock time, unless the position is converted to a
 * permanent lock, in which case its weight is frozen at `amount`. Every
 * position keeps its own checkpoint history (`userpoints`, scoped by lock id)
 * and the aggregate keeps one global history (`points`) plus a weekly
 * schedule of slope changes (`slopechange`), so the balance of any position
 * and the total supply can be read for any past time.
 *
 * Tokens enter through `transfer` notifications from the principal token
 * contract with one of these memos:
 *    lock:$seconds             - create a lock for the sender,
 *    lockfor:$owner:$seconds   - create a lock owned by $owner,
 *    deposit:$id               - add to an existing lock.
 * Withdrawals are paid out with inline `transfer` actions.
 *
 * Other contracts can read balances directly through `get_balance_at` and
 * `get_supply_at`.
 */
class [[eosio::contract("ve.escrow")]] ve_escrow : public contract {
   public:
      using contract::contract;

   ve_escrow(eosio::name receiver, eosio::name code, datastream<const char*> ds): contract(receiver, code, ds),
        _global(get_self(), get_self().value)
    {
      _gstate = _global.exists() ? _global.get() : global_t{};
    }

    ~ve_escrow() { if (_gchanged) _global.set( _gstate, get_self() ); }

   //admin
   ACTION init(const name& admin, const extended_symbol& principal_token, const name& treasury);
   ACTION setconfig(const asset& min_lock_amount, const uint64_t& min_lock_duration,
                    const uint64_t& max_lock_duration, const uint64_t& max_penalty_bps);
   ACTION settreasury(const name& treasury);
   ACTION setenabled(const bool& enabled);
   ACTION togglesplit(const name& account, const bool& allowed);
   ACTION proposeadmin(const name& admin);
   ACTION acceptadmin(const name& admin);

   [[eosio::on_notify("*::transfer")]]
   void ontransfer(const name& from, const name& to, const asset& quant, const string& memo);

   //USER
   ACTION inctime(const name& sender, const uint64_t& lock_id, const uint64_t& duration);
   ACTION lockperm(const name& sender, const uint64_t& lock_id);
   ACTION unlockperm(const name& sender, const uint64_t& lock_id);
   ACTION merge(const name& sender, const uint64_t& from_id, const uint64_t& to_id);
   ACTION split(const name& sender, const uint64_t& lock_id, const asset& quant);
   ACTION withdraw(const name& sender, const uint64_t& lock_id);
   ACTION earlyexit(const name& sender, const uint64_t& lock_id);
   ACTION transferlock(const name& sender, const uint64_t& lock_id, const name& to);
   ACTION approve(const name& sender, const uint64_t& lock_id, const name& spender);
   ACTION setapproval(const name& owner, const name& account, const bool& approved);
   ACTION checkpoint(const name& payer);

   //read only
   [[eosio::action, eosio::read_only]] asset balanceof(const uint64_t& lock_id);
   [[eosio::action, eosio::read_only]] asset balanceat(const uint64_t& lock_id, const uint64_t& ts);
   [[eosio::action, eosio::read_only]] asset totalsupply();
   [[eosio::action, eosio::read_only]] asset supplyat(const uint64_t& ts);
   [[eosio::action, eosio::read_only]] lock_t lockinfo(const uint64_t& lock_id);

   //receipts, self auth only
   ACTION depositlog(const name& owner, const uint64_t& lock_id, const asset& quant, const asset& locked,
                     const uint64_t& unlock_time, const name& type, const time_point_sec& ts);
   ACTION withdrawlog(const name& owner, const uint64_t& lock_id, const asset& payout,
                      const asset& penalty, const time_point_sec& ts);
   ACTION mergelog(const name& owner, const uint64_t& from_id, const uint64_t& to_id,
                   const asset& locked, const uint64_t& unlock_time, const time_point_sec& ts);
   ACTION splitlog(const name& owner, const uint64_t& from_id, const uint64_t& lock_id1,
                   const uint64_t& lock_id2, const asset& quant1, const asset& quant2, const time_point_sec& ts);
   ACTION permlog(const name& owner, const uint64_t& lock_id, const bool& permanent,
                  const asset& locked, const time_point_sec& ts);
   ACTION supplylog(const asset& prev_supply, const asset& supply, const time_point_sec& ts);

   using depositlog_action    = eosio::action_wrapper<"depositlog"_n,   &ve_escrow::depositlog>;
   using withdrawlog_action   = eosio::action_wrapper<"withdrawlog"_n,  &ve_escrow::withdrawlog>;
   using mergelog_action      = eosio::action_wrapper<"mergelog"_n,     &ve_escrow::mergelog>;
   using splitlog_action      = eosio::action_wrapper<"splitlog"_n,     &ve_escrow::splitlog>;
   using permlog_action       = eosio::action_wrapper<"permlog"_n,      &ve_escrow::permlog>;
   using supplylog_action     = eosio::action_wrapper<"supplylog"_n,    &ve_escrow::supplylog>;

   static int64_t get_balance_at(const name& ve_contract, const uint64_t& lock_id, const uint64_t& ts) {
      global_singleton global(ve_contract, ve_contract.value);
      auto gstate = global.get_or_default();
      table_store store(ve_contract, gstate);
      return balance_of_at(store, lock_id, ts);
   }

   static int64_t get_supply_at(const name& ve_contract, const uint64_t& ts) {
      global_singleton global(ve_contract, ve_contract.value);
      auto gstate = global.get_or_default();
      table_store store(ve_contract, gstate);
      return total_supply_at(store, ts);
   }

   private:
      ve_ledger<table_store> _ledger(table_store& store);
      void _check_enabled();

      void _on_lock(const name& owner, const asset& quant, const uint64_t& duration);
      void _on_deposit(const uint64_t& lock_id, const asset& quant);
      void _payout(const uint64_t& lock_id, const withdraw_result_st& result);
      void _log_supply(const asset& prev_supply);

      global_singleton     _global;
      global_t             _gstate;
      bool                 _gchanged = false;
};
} //namespace vefi
