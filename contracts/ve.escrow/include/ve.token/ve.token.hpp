#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>

#include <string>

#define TRANSFER(bank, to, quantity, memo) \
    {	ve_token::xtoken::transfer_action act{ bank, { {_self, active_perm} } };\
            act.send( _self, to, quantity , memo );}

namespace ve_token
{

    using std::string;
    using namespace eosio;

    /**
     * Interface of the principal token contract, standard `transfer` only.
     * `ve.escrow` never holds a copy of the token's state, it receives locks
     * through `transfer` notifications and pays out through inline transfers.
     */
    class [[eosio::contract( "ve.token" )]] xtoken : public contract
    {
    public:
        using contract::contract;

        /**
         * Allows `from` account to transfer to `to` account the `quantity` tokens.
         *
         * @param from - the account to transfer from,
         * @param to - the account to be transferred to,
         * @param quantity - the quantity of tokens to be transferred,
         * @param memo - the memo string to accompany the transaction.
         */
        ACTION transfer(const name &from,
                        const name &to,
                        const asset &quantity,
                        const string &memo);

        using transfer_action = eosio::action_wrapper<"transfer"_n, &xtoken::transfer>;
    };
}
