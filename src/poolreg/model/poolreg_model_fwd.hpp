#pragma once

#include <string>

namespace poolreg {
namespace model {

struct address_t;
struct PoolInputData;
struct PoolData;
struct SwapStorage;
struct GuardedSwapStorage;
struct TokenBalances;
struct RegistryConfig;
struct SwapEngine;
struct DepositWrapper;
struct ContractDirectory;
struct ContractBook;
struct AccessControl;

} // namespace model

namespace registry {

struct PairIndex;
struct PoolLocatorIndex;
struct RegistryListener;
struct PoolRegistry;
struct MasterRegistry;

} // namespace registry
} // namespace poolreg
