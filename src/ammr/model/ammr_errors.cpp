#include "ammr_errors.hpp"

namespace ammr {
namespace model {


const char *rc_describe(ReturnCode_e rc)
{
    switch (rc) {
    case RC_OK:                             return "OK";
    case RC_EXPIRED:                        return "EXPIRED";
    case RC_LOCKED:                         return "LOCKED";
    case RC_INVALID_PATH:                   return "INVALID_PATH";
    case RC_TRADE_NOT_ALLOWED:              return "TRADE_NOT_ALLOWED";
    case RC_INSUFFICIENT_OUTPUT_AMOUNT:     return "INSUFFICIENT_OUTPUT_AMOUNT";
    case RC_EXCESSIVE_INPUT_AMOUNT:         return "EXCESSIVE_INPUT_AMOUNT";
    case RC_INSUFFICIENT_INPUT_AMOUNT:      return "INSUFFICIENT_INPUT_AMOUNT";
    case RC_INSUFFICIENT_LIQUIDITY:         return "INSUFFICIENT_LIQUIDITY";
    case RC_INSUFFICIENT_AMOUNT:            return "INSUFFICIENT_AMOUNT";
    case RC_INSUFFICIENT_A_AMOUNT:          return "INSUFFICIENT_A_AMOUNT";
    case RC_INSUFFICIENT_B_AMOUNT:          return "INSUFFICIENT_B_AMOUNT";
    case RC_IDENTICAL_ADDRESSES:            return "IDENTICAL_ADDRESSES";
    case RC_ZERO_ADDRESS:                   return "ZERO_ADDRESS";
    case RC_PAIR_EXISTS:                    return "PAIR_EXISTS";
    case RC_INVARIANT_VIOLATED:             return "INVARIANT_VIOLATED";
    case RC_INSUFFICIENT_LIQUIDITY_MINTED:  return "INSUFFICIENT_LIQUIDITY_MINTED";
    case RC_INSUFFICIENT_LIQUIDITY_BURNED:  return "INSUFFICIENT_LIQUIDITY_BURNED";
    case RC_INSUFFICIENT_BALANCE:           return "INSUFFICIENT_BALANCE";
    case RC_INSUFFICIENT_ALLOWANCE:         return "INSUFFICIENT_ALLOWANCE";
    case RC_INVALID_SIGNATURE:              return "INVALID_SIGNATURE";
    case RC_INSUFFICIENT_NATIVE_VALUE:      return "INSUFFICIENT_NATIVE_VALUE";
    case RC_ARITHMETIC_OVERFLOW:            return "ARITHMETIC_OVERFLOW";
    }
    return "UNKNOWN";
}


} // namespace model
} // namespace ammr
