#include <ve.escrow/ve.escrow.hpp>
#include <ve.token/ve.token.hpp>

#include <eosio/time.hpp>
#include <utils.hpp>

#include <string>

namespace vefi {
using namespace std;

#define NOTIFY_LOG(action_type, ...) \
    {	action_type act{ _self, { {_self, active_perm} } };\
            act.send( __VA_ARGS__ ); }

//namespace scope, inside the contract `split` names the split action
inline static vector<string_view> memo_params(const string& memo) {
   return split(memo, ":");
}

//memo numbers are validated before conversion, a bad memo aborts with MEMO_FORMAT_ERROR
inline static uint64_t memo_number(const string_view& param, const char* title) {
   CHECKC( !param.empty() && param.size() <= 19 && param.find_first_not_of("0123456789") == string_view::npos,
           err::MEMO_FORMAT_ERROR, string(title) + " is not a number" )
   return (uint64_t) std::stoull(string(param));
}

inline static uint64_t now_sec() {
   return current_time_point().sec_since_epoch();
}

//block height reference, one slot per produced block
inline static uint64_t now_block() {
   return block_timestamp(current_time_point()).slot;
}

ve_ledger<table_store> ve_escrow::_ledger(table_store& store) {
   _gchanged = true;
   return ve_ledger<table_store>(store, now_sec(), now_block());
}

void ve_escrow::_check_enabled() {
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
}

void ve_escrow::init(const name& admin, const extended_symbol& principal_token, const name& treasury) {
   require_auth( _self );
   CHECKC( _gstate.last_lock_id == 0, err::RECORD_EXISTING, "already initialized with locks" )
   CHECKC( is_account(admin), err::ACCOUNT_INVALID, "admin account does not exist" )
   CHECKC( treasury == name() || is_account(treasury), err::ACCOUNT_INVALID, "treasury account does not exist" )

   _gstate.admin              = admin;
   _gstate.principal_token    = principal_token;
   _gstate.treasury           = treasury;
   int64_t one_unit = 1;
   for (auto i = 0; i < principal_token.get_symbol().precision(); i++) one_unit *= 10;
   _gstate.min_lock_amount    = asset(one_unit, principal_token.get_symbol());
   _gstate.supply             = asset(0, principal_token.get_symbol());
   _gstate.enabled            = true;
   _gchanged                  = true;
}

void ve_escrow::setconfig(const asset& min_lock_amount, const uint64_t& min_lock_duration,
                          const uint64_t& max_lock_duration, const uint64_t& max_penalty_bps) {
   require_auth( _gstate.admin );
   CHECKC( min_lock_amount.symbol == _gstate.principal_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch" )
   CHECKC( min_lock_amount.amount > 0, err::NOT_POSITIVE, "min lock amount must be positive" )
   CHECKC( min_lock_duration >= WEEK, err::PARAM_ERROR, "min lock duration must be at least one week" )
   CHECKC( min_lock_duration <= max_lock_duration, err::PARAM_ERROR, "min lock duration exceeds max" )
   CHECKC( max_lock_duration <= MAXTIME, err::OVERSIZED, "max lock duration exceeds MAXTIME" )
   CHECKC( max_penalty_bps <= PCT_BOOST, err::OVERSIZED, "penalty must be <= 10000 bps" )

   _gstate.min_lock_amount    = min_lock_amount;
   _gstate.min_lock_duration  = min_lock_duration;
   _gstate.max_lock_duration  = max_lock_duration;
   _gstate.max_penalty_bps    = max_penalty_bps;
   _gchanged                  = true;
}

void ve_escrow::settreasury(const name& treasury) {
   require_auth( _gstate.admin );
   CHECKC( is_account(treasury), err::ACCOUNT_INVALID, "treasury account does not exist" )
   _gstate.treasury           = treasury;
   _gchanged                  = true;
}

void ve_escrow::setenabled(const bool& enabled) {
   require_auth( _gstate.admin );
   _gstate.enabled            = enabled;
   _gchanged                  = true;
}

void ve_escrow::togglesplit(const name& account, const bool& allowed) {
   require_auth( _gstate.admin );
   table_store store(_self, _gstate);
   _ledger(store).toggle_split(account, allowed);
}

void ve_escrow::proposeadmin(const name& admin) {
   require_auth( _gstate.admin );
   CHECKC( is_account(admin), err::ACCOUNT_INVALID, "admin account does not exist" )
   _gstate.pending_admin      = admin;
   _gchanged                  = true;
}

void ve_escrow::acceptadmin(const name& admin) {
   require_auth( admin );
   CHECKC( _gstate.pending_admin != name() && admin == _gstate.pending_admin, err::NO_AUTH, "not the pending admin" )
   _gstate.admin              = admin;
   _gstate.pending_admin      = name();
   _gchanged                  = true;
}

/**
 * @param from
 * @param to
 * @param quant
 * @param memo: three formats:
 *       1) lock:$seconds              - create a lock for `from`
 *       2) lockfor:$owner:$seconds    - create a lock owned by $owner
 *       3) deposit:$lock_id           - top up an existing lock
 */
void ve_escrow::ontransfer(const name& from, const name& to, const asset& quant, const string& memo) {
   if (from == get_self() || to != get_self()) return;

   _check_enabled();
   auto token_bank = get_first_receiver();
   CHECKC( token_bank == _gstate.principal_token.get_contract(), err::CONTRACT_MISMATCH, "unknown token bank" )
   CHECKC( quant.symbol == _gstate.principal_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch" )

   auto params = memo_params(memo);
   if (params.size() == 2 && params[0] == "lock") {
      _on_lock(from, quant, memo_number(params[1], "lock duration"));
      return;
   }
   if (params.size() == 3 && params[0] == "lockfor") {
      auto owner = name(string(params[1]));
      CHECKC( is_account(owner), err::ACCOUNT_INVALID, "lock owner does not exist" )
      _on_lock(owner, quant, memo_number(params[2], "lock duration"));
      return;
   }
   if (params.size() == 2 && params[0] == "deposit") {
      _on_deposit(memo_number(params[1], "lock id"), quant);
      return;
   }
   CHECKC( false, err::MEMO_FORMAT_ERROR, "invalid memo format" )
}

void ve_escrow::_on_lock(const name& owner, const asset& quant, const uint64_t& duration) {
   auto prev_supply  = _gstate.supply;
   table_store store(_self, _gstate);
   auto ledger       = _ledger(store);
   auto lock_id      = ledger.create_lock(owner, quant, duration);
   auto lock         = ledger.get_lock(lock_id);

   NOTIFY_LOG( depositlog_action, owner, lock_id, quant, lock.amount, lock.unlock_time(),
               deposit_type::CREATE_LOCK, time_point_sec(now_sec()) )
   _log_supply(prev_supply);
}

void ve_escrow::_on_deposit(const uint64_t& lock_id, const asset& quant) {
   auto prev_supply  = _gstate.supply;
   table_store store(_self, _gstate);
   auto ledger       = _ledger(store);
   ledger.deposit_for(lock_id, quant);
   auto lock         = ledger.get_lock(lock_id);

   NOTIFY_LOG( depositlog_action, lock.owner, lock_id, quant, lock.amount, lock.unlock_time(),
               deposit_type::DEPOSIT_FOR, time_point_sec(now_sec()) )
   _log_supply(prev_supply);
}

void ve_escrow::inctime(const name& sender, const uint64_t& lock_id, const uint64_t& duration) {
   require_auth( sender );
   _check_enabled();

   table_store store(_self, _gstate);
   auto ledger = _ledger(store);
   ledger.increase_unlock_time(sender, lock_id, duration);
   auto lock   = ledger.get_lock(lock_id);

   NOTIFY_LOG( depositlog_action, lock.owner, lock_id, asset(0, lock.amount.symbol), lock.amount,
               lock.unlock_time(), deposit_type::INCREASE_TIME, time_point_sec(now_sec()) )
}

void ve_escrow::lockperm(const name& sender, const uint64_t& lock_id) {
   require_auth( sender );
   _check_enabled();

   table_store store(_self, _gstate);
   auto ledger = _ledger(store);
   ledger.lock_permanent(sender, lock_id);
   auto lock   = ledger.get_lock(lock_id);

   NOTIFY_LOG( permlog_action, lock.owner, lock_id, true, lock.amount, time_point_sec(now_sec()) )
}

void ve_escrow::unlockperm(const name& sender, const uint64_t& lock_id) {
   require_auth( sender );
   _check_enabled();

   table_store store(_self, _gstate);
   auto ledger = _ledger(store);
   ledger.unlock_permanent(sender, lock_id);
   auto lock   = ledger.get_lock(lock_id);

   NOTIFY_LOG( permlog_action, lock.owner, lock_id, false, lock.amount, time_point_sec(now_sec()) )
}

void ve_escrow::merge(const name& sender, const uint64_t& from_id, const uint64_t& to_id) {
   require_auth( sender );
   _check_enabled();

   table_store store(_self, _gstate);
   auto ledger = _ledger(store);
   ledger.merge(sender, from_id, to_id);
   auto lock   = ledger.get_lock(to_id);

   NOTIFY_LOG( mergelog_action, lock.owner, from_id, to_id, lock.amount, lock.unlock_time(),
               time_point_sec(now_sec()) )
}

void ve_escrow::split(const name& sender, const uint64_t& lock_id, const asset& quant) {
   require_auth( sender );
   _check_enabled();

   table_store store(_self, _gstate);
   auto ledger = _ledger(store);
   auto ids    = ledger.split(sender, lock_id, quant);
   auto lock1  = ledger.get_lock(ids.first);
   auto lock2  = ledger.get_lock(ids.second);

   NOTIFY_LOG( splitlog_action, lock1.owner, lock_id, ids.first, ids.second, lock1.amount, lock2.amount,
               time_point_sec(now_sec()) )
}

void ve_escrow::withdraw(const name& sender, const uint64_t& lock_id) {
   require_auth( sender );

   auto prev_supply  = _gstate.supply;
   table_store store(_self, _gstate);
   auto result       = _ledger(store).withdraw(sender, lock_id);
   _payout(lock_id, result);
   _log_supply(prev_supply);
}

void ve_escrow::earlyexit(const name& sender, const uint64_t& lock_id) {
   require_auth( sender );
   _check_enabled();

   auto prev_supply  = _gstate.supply;
   table_store store(_self, _gstate);
   auto result       = _ledger(store).early_withdraw(sender, lock_id);
   _payout(lock_id, result);
   _log_supply(prev_supply);
}

void ve_escrow::_payout(const uint64_t& lock_id, const withdraw_result_st& result) {
   auto bank = _gstate.principal_token.get_contract();
   if (result.payout.amount > 0)
      TRANSFER( bank, result.owner, result.payout, "withdraw lock:" + to_string(lock_id) )
   if (result.penalty.amount > 0)
      TRANSFER( bank, _gstate.treasury, result.penalty, "early withdraw penalty:" + to_string(lock_id) )

   NOTIFY_LOG( withdrawlog_action, result.owner, lock_id, result.payout, result.penalty, time_point_sec(now_sec()) )
}

void ve_escrow::_log_supply(const asset& prev_supply) {
   NOTIFY_LOG( supplylog_action, prev_supply, _gstate.supply, time_point_sec(now_sec()) )
}

void ve_escrow::transferlock(const name& sender, const uint64_t& lock_id, const name& to) {
   require_auth( sender );
   _check_enabled();
   CHECKC( is_account(to), err::ACCOUNT_INVALID, "receiver account does not exist" )

   table_store store(_self, _gstate);
   _ledger(store).transfer(sender, lock_id, to);
   require_recipient( to );
}

void ve_escrow::approve(const name& sender, const uint64_t& lock_id, const name& spender) {
   require_auth( sender );
   CHECKC( spender == name() || is_account(spender), err::ACCOUNT_INVALID, "spender account does not exist" )

   table_store store(_self, _gstate);
   _ledger(store).approve(sender, lock_id, spender);
}

void ve_escrow::setapproval(const name& owner, const name& account, const bool& approved) {
   require_auth( owner );
   CHECKC( is_account(account), err::ACCOUNT_INVALID, "operator account does not exist" )

   table_store store(_self, _gstate);
   _ledger(store).set_approval_for_all(owner, account, approved);
}

void ve_escrow::checkpoint(const name& payer) {
   require_auth( payer );
   table_store store(_self, _gstate, payer);
   // a history over 255 weeks behind advances by 255 weeks per call
   if (!_ledger(store).checkpoint())
      print("checkpoint partial, epoch: ", _gstate.epoch);
}

asset ve_escrow::balanceof(const uint64_t& lock_id) {
   table_store store(_self, _gstate);
   return asset(balance_of_at(store, lock_id, now_sec()), _gstate.principal_token.get_symbol());
}

asset ve_escrow::balanceat(const uint64_t& lock_id, const uint64_t& ts) {
   table_store store(_self, _gstate);
   return asset(balance_of_at(store, lock_id, ts), _gstate.principal_token.get_symbol());
}

asset ve_escrow::totalsupply() {
   table_store store(_self, _gstate);
   return asset(total_supply_at(store, now_sec()), _gstate.principal_token.get_symbol());
}

asset ve_escrow::supplyat(const uint64_t& ts) {
   table_store store(_self, _gstate);
   return asset(total_supply_at(store, ts), _gstate.principal_token.get_symbol());
}

lock_t ve_escrow::lockinfo(const uint64_t& lock_id) {
   lock_t lock(lock_id);
   table_store store(_self, _gstate);
   CHECKC( store.get_lock(lock), err::RECORD_NOT_FOUND, "lock not found" )
   return lock;
}

void ve_escrow::depositlog(const name& owner, const uint64_t& lock_id, const asset& quant, const asset& locked,
                           const uint64_t& unlock_time, const name& type, const time_point_sec& ts) {
   require_auth( _self );
   require_recipient( owner );
}

void ve_escrow::withdrawlog(const name& owner, const uint64_t& lock_id, const asset& payout,
                            const asset& penalty, const time_point_sec& ts) {
   require_auth( _self );
   require_recipient( owner );
}

void ve_escrow::mergelog(const name& owner, const uint64_t& from_id, const uint64_t& to_id,
                         const asset& locked, const uint64_t& unlock_time, const time_point_sec& ts) {
   require_auth( _self );
   require_recipient( owner );
}

void ve_escrow::splitlog(const name& owner, const uint64_t& from_id, const uint64_t& lock_id1,
                         const uint64_t& lock_id2, const asset& quant1, const asset& quant2, const time_point_sec& ts) {
   require_auth( _self );
   require_recipient( owner );
}

void ve_escrow::permlog(const name& owner, const uint64_t& lock_id, const bool& permanent,
                        const asset& locked, const time_point_sec& ts) {
   require_auth( _self );
   require_recipient( owner );
}

void ve_escrow::supplylog(const asset& prev_supply, const asset& supply, const time_point_sec& ts) {
   require_auth( _self );
}

} //namespace vefi
