#include "ammr_transfer.hpp"
#include <ammr/model/ammr_collaborators.hpp>

namespace ammr {
namespace router {

using namespace model;


Status pay(TokenLedger &ledger
           , const address_t &self
           , const address_t &token
           , const address_t &payer
           , const address_t &to
           , const balance_t &amount)
{
    if (payer == self)
    {
        return ledger.transfer(token, self, to, amount);
    }
    return ledger.transferFrom(token, self, payer, to, amount);
}


} // namespace router
} // namespace ammr
