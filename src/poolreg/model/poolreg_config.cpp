#include "poolreg_config.hpp"
#include "poolreg_errors.hpp"
#include "../commons/poolreg_log.hpp"

namespace poolreg {
namespace model {


void RegistryConfig::check_consistency() const
{
    require<ConfigError>(max_tokens >= 1 && max_tokens <= MAX_POOL_TOKENS
                         , strfmt("max_tokens must be within [1, %1%], got %2%"
                                  , MAX_POOL_TOKENS, max_tokens));
    require<ConfigError>(max_name_length >= 1
                         , "max_name_length can't be 0");
    require<ConfigError>(pair_key_scheme == PAIR_KEY_ORDERED ||
                         pair_key_scheme == PAIR_KEY_XOR
                         , strfmt("unknown pair key scheme %1%", int(pair_key_scheme)));
}


} // namespace model
} // namespace poolreg
