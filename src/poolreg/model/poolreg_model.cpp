#include "poolreg_model.hpp"

namespace poolreg {
namespace model {


const char *asset_class_name(AssetClass_e c)
{
    switch (c) {
    case ASSET_BTC:   return "BTC";
    case ASSET_ETH:   return "ETH";
    case ASSET_USD:   return "USD";
    case ASSET_OTHER: return "OTHER";
    default:
        break;
    }
    return "?";
}


bool PoolData::operator==(const PoolData &o) const
{
    return poolAddress == o.poolAddress
            && lpToken == o.lpToken
            && assetClass == o.assetClass
            && name == o.name
            && targetAddress == o.targetAddress
            && tokens == o.tokens
            && underlyingTokens == o.underlyingTokens
            && basePoolAddress == o.basePoolAddress
            && depositWrapperAddress == o.depositWrapperAddress
            && externalId == o.externalId
            && isApproved == o.isApproved
            && isRemoved == o.isRemoved;
}


static void m_print_list(std::ostream& stream, const address_list_t &l)
{
    stream << "[";
    for (std::size_t i = 0; i < l.size(); ++i)
    {
        if (i > 0) stream << ", ";
        stream << l[i];
    }
    stream << "]";
}

std::ostream& operator<< (std::ostream& stream, const PoolData& o)
{
    stream << "PoolData(" << o.name
           << ", pool=" << o.poolAddress
           << ", lp=" << o.lpToken
           << ", class=" << asset_class_name(o.assetClass)
           << ", tokens=";
    m_print_list(stream, o.tokens);
    if (o.has_wrapper())
    {
        stream << ", underlying=";
        m_print_list(stream, o.underlyingTokens);
        stream << ", base=" << o.basePoolAddress
               << ", wrapper=" << o.depositWrapperAddress;
    }
    stream << (o.isApproved ? ", approved" : "")
           << (o.isRemoved ? ", removed" : "")
           << ")";
    return stream;
}


SwapStorage GuardedSwapStorage::as_swap_storage() const
{
    SwapStorage res;
    res.initialA = initialA;
    res.futureA = futureA;
    res.initialATime = initialATime;
    res.futureATime = futureATime;
    res.swapFee = swapFee;
    res.adminFee = 0;
    res.lpToken = lpToken;
    return res;
}


} // namespace model
} // namespace poolreg
