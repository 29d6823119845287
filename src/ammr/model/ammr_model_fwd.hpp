#pragma once

namespace ammr {
namespace model {

struct address_t;
struct Status;
struct PoolSettings;
struct Reserves;
struct Pool;
struct Registry;
struct TokenLedger;
struct NativeAssetAdapter;
struct PermitVerifier;

namespace amm {
struct Invariant;
} // namespace amm

} // namespace model
} // namespace ammr
