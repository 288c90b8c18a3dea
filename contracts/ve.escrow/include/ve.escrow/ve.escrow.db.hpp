#pragma once

#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <string>

#include <ve.escrow/ve.escrow.const.hpp>

namespace vefi {

using namespace std;
using namespace eosio;

static constexpr name       DUST_BANK        = "dust.token"_n;
static constexpr symbol     DUST             = symbol(symbol_code("DUST"), 8);

#define TBL struct [[eosio::table, eosio::contract("ve.escrow")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("ve.escrow")]]

NTBL("global") global_t {
    name                admin                   = "ve.admin"_n;
    name                pending_admin;                                                      //two-step admin hand-over
    name                treasury;                                                           //receives early-withdraw penalties
    extended_symbol     principal_token         = extended_symbol(DUST, DUST_BANK);         //locked token
    asset               min_lock_amount         = asset(1'0000'0000, DUST);                 //1 DUST
    uint64_t            min_lock_duration       = DEFAULT_MIN_LOCK_DURATION;
    uint64_t            max_lock_duration       = MAXTIME;
    uint64_t            max_penalty_bps         = DEFAULT_MAX_PENALTY_BPS;
    bool                split_all               = false;                                    //global split permission
    bool                enabled                 = true;

    uint64_t            last_lock_id            = 0;                                        //ids are never reused
    uint64_t            epoch                   = 0;                                        //global point history epoch
    int64_t             permanent_lock_balance  = 0;
    asset               supply                  = asset(0, DUST);                           //total locked principal

    EOSLIB_SERIALIZE( global_t, (admin)(pending_admin)(treasury)(principal_token)(min_lock_amount)
                                (min_lock_duration)(max_lock_duration)(max_penalty_bps)(split_all)(enabled)
                                (last_lock_id)(epoch)(permanent_lock_balance)(supply) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

struct user_point_st {
    int128_t            bias                    = 0;        //WAD
    int128_t            slope                   = 0;        //WAD per second, 0 while permanent
    uint64_t            ts                      = 0;
    uint64_t            blk                     = 0;
    int64_t             permanent               = 0;        //amount while permanent

    EOSLIB_SERIALIZE( user_point_st, (bias)(slope)(ts)(blk)(permanent) )
};

struct global_point_st {
    int128_t            bias                    = 0;
    int128_t            slope                   = 0;
    uint64_t            ts                      = 0;
    uint64_t            blk                     = 0;
    int64_t             permanent_lock_balance  = 0;

    EOSLIB_SERIALIZE( global_point_st, (bias)(slope)(ts)(blk)(permanent_lock_balance) )
};

//scope: _self
TBL lock_t {
    uint64_t            id                      = 0;        //PK
    name                owner;
    name                approved;                           //single delegate, cleared on transfer
    asset               amount;
    uint64_t            end                     = 0;        //week aligned, retained while permanent
    uint64_t            effective_start         = 0;        //deposit weighted start, early-withdraw only
    bool                permanent               = false;
    name                status                  = lock_status::ACTIVE;
    uint64_t            point_epoch             = 0;        //length of the user point history
    time_point_sec      created_at;

    lock_t() {}
    lock_t(const uint64_t& i): id(i) {}

    uint64_t primary_key() const { return id; }

    uint64_t unlock_time() const { return permanent ? 0 : end; }
    bool withdrawn() const { return status == lock_status::WITHDRAWN; }

    typedef eosio::multi_index< "locks"_n, lock_t > tbl_t;

    EOSLIB_SERIALIZE( lock_t, (id)(owner)(approved)(amount)(end)(effective_start)(permanent)
                              (status)(point_epoch)(created_at) )
};

//Scope: lock id
TBL user_point_t {
    uint64_t            epoch;                              //PK: 1,2,3...
    user_point_st       point;

    user_point_t() {}
    user_point_t(const uint64_t& e): epoch(e) {}
    uint64_t primary_key()const { return epoch; }

    typedef multi_index<"userpoints"_n, user_point_t> tbl_t;

    EOSLIB_SERIALIZE( user_point_t, (epoch)(point) )
};

//Scope: _self
TBL global_point_t {
    uint64_t            epoch;                              //PK: global epoch
    global_point_st     point;

    global_point_t() {}
    global_point_t(const uint64_t& e): epoch(e) {}
    uint64_t primary_key()const { return epoch; }

    typedef multi_index<"points"_n, global_point_t> tbl_t;

    EOSLIB_SERIALIZE( global_point_t, (epoch)(point) )
};

//Scope: _self, week aligned time -> signed slope change
TBL slope_change_t {
    uint64_t            ts;
    int128_t            dslope                  = 0;

    slope_change_t() {}
    slope_change_t(const uint64_t& t): ts(t) {}
    uint64_t primary_key()const { return ts; }

    typedef multi_index<"slopechange"_n, slope_change_t> tbl_t;

    EOSLIB_SERIALIZE( slope_change_t, (ts)(dslope) )
};

//Scope: owner
TBL operator_t {
    name                account;

    operator_t() {}
    operator_t(const name& a): account(a) {}
    uint64_t primary_key()const { return account.value; }

    typedef multi_index<"operators"_n, operator_t> tbl_t;

    EOSLIB_SERIALIZE( operator_t, (account) )
};

//Scope: _self, accounts whose positions may be split
TBL splitter_t {
    name                account;

    splitter_t() {}
    splitter_t(const name& a): account(a) {}
    uint64_t primary_key()const { return account.value; }

    typedef multi_index<"splitters"_n, splitter_t> tbl_t;

    EOSLIB_SERIALIZE( splitter_t, (account) )
};

} //namespace vefi
